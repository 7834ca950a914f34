// resolvers.cpp - last-writer-wins and state resolvers

#include <lager_delta/resolvers.h>

namespace lager_delta {

namespace {

void keep_latest(std::optional<Timestamp>& best, const std::map<std::string, Timestamp>& table,
                 const std::string& key)
{
    auto it = table.find(key);
    if (it != table.end() && (!best || *best < it->second)) {
        best = it->second;
    }
}

void merge_table(std::map<std::string, Timestamp>& into, const std::map<std::string, Timestamp>& from)
{
    for (const auto& [key, ts] : from) {
        auto [it, inserted] = into.emplace(key, ts);
        if (!inserted && it->second < ts) {
            it->second = ts;
        }
    }
}

} // anonymous namespace

std::optional<Timestamp> ReplicaMetadata::time_of(const Path& path) const
{
    std::optional<Timestamp> best;
    Path prefix;
    keep_latest(best, clocks, path_to_pointer(prefix));
    keep_latest(best, tombstones, path_to_pointer(prefix));
    for (const auto& part : path) {
        prefix.push_back(part);
        std::string key = path_to_pointer(prefix);
        keep_latest(best, clocks, key);
        keep_latest(best, tombstones, key);
    }
    return best;
}

void ReplicaMetadata::record(const Path& path, const Timestamp& ts, bool removal)
{
    auto& table = removal ? tombstones : clocks;
    auto [it, inserted] = table.emplace(path_to_pointer(path), ts);
    if (!inserted && it->second < ts) {
        it->second = ts;
    }
}

void ReplicaMetadata::merge_from(const ReplicaMetadata& other)
{
    merge_table(clocks, other.clocks);
    merge_table(tombstones, other.tombstones);
}

// ============================================================
// LastWriterWinsResolver
// ============================================================

LastWriterWinsResolver::LastWriterWinsResolver(ReplicaMetadata& metadata, Timestamp op_time)
    : metadata_(metadata), op_time_(std::move(op_time))
{
}

std::optional<Value> LastWriterWinsResolver::resolve(const ResolveRequest& request)
{
    auto known = metadata_.time_of(request.path);
    if (known && !(*known < op_time_)) {
        ++rejected_;
        return std::nullopt;
    }
    metadata_.record(request.path, op_time_, request.kind == OpKind::Remove);
    ++accepted_;
    return request.proposed.value_or(Value{});
}

// ============================================================
// StateResolver
// ============================================================

StateResolver::StateResolver(const ReplicaMetadata& local, const ReplicaMetadata& remote)
    : local_(local), remote_(remote)
{
}

std::optional<Value> StateResolver::resolve(const ResolveRequest& request)
{
    auto remote_time = remote_.time_of(request.path);
    if (!remote_time) {
        return std::nullopt;
    }
    auto local_time = local_.time_of(request.path);
    if (local_time && !(*local_time < *remote_time)) {
        return std::nullopt;
    }
    return request.proposed.value_or(Value{});
}

} // namespace lager_delta
