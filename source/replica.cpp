// replica.cpp - convergent replicated value

#include <lager_delta/diff.h>
#include <lager_delta/equal.h>
#include <lager_delta/replica.h>

namespace lager_delta {

Replica::Replica(std::string node, Value initial, const TypeRegistry* registry,
                 LogicalClock::WallSource wall_source)
    : node_(node)
    , registry_(registry)
    , clock_(std::move(node), std::move(wall_source))
    , value_(std::move(initial))
{
}

Value Replica::view() const
{
    std::lock_guard lock(mutex_);
    return value_;
}

ReplicaMetadata Replica::metadata() const
{
    std::lock_guard lock(mutex_);
    return metadata_;
}

void Replica::record_locked(const Patch& patch, const Timestamp& ts)
{
    patch.walk([&](const WalkEntry& entry) {
        if (entry.kind == OpKind::Test || entry.kind == OpKind::Log) return;
        metadata_.record(entry.path, ts, entry.kind == OpKind::Remove);
    });
}

Delta Replica::edit(const EditFn& fn)
{
    // fn runs unlocked so it may read or commit to this replica
    Value base = view();
    Value next = fn(base);
    Patch patch = Differ(DiffOptions{registry_}).diff(base, next);
    if (patch.is_empty()) {
        return {};
    }

    std::lock_guard lock(mutex_);
    Timestamp now = clock_.now();
    patch = patch.with_timestamp(now);
    if (deep_equal(value_, base, registry_)) {
        value_ = std::move(next);
    } else {
        // changed under fn: replay the edit on top of the newer value
        std::vector<std::string> errors;
        value_ = patch.apply(value_, &errors);
        for (const auto& error : errors) {
            detail::log_access_error("Replica::edit", error);
        }
    }
    record_locked(patch, now);
    return Delta{std::move(patch), std::move(now)};
}

Delta Replica::commit(const Patch& patch)
{
    if (patch.is_empty()) {
        return {};
    }

    std::lock_guard lock(mutex_);
    Timestamp now = clock_.now();
    Patch stamped = patch.with_timestamp(now);

    std::vector<std::string> errors;
    value_ = stamped.apply(value_, &errors);
    for (const auto& error : errors) {
        detail::log_access_error("Replica::commit", error);
    }
    record_locked(stamped, now);
    return Delta{std::move(stamped), std::move(now)};
}

bool Replica::apply_delta(const Delta& delta)
{
    if (delta.empty()) {
        return false;
    }

    std::lock_guard lock(mutex_);
    clock_.update(delta.timestamp);

    // resolve against a copy; a failed delta must leave no clocks behind
    ReplicaMetadata staged = metadata_;
    LastWriterWinsResolver resolver(staged, delta.timestamp);
    Value next;
    try {
        next = delta.patch.apply_resolved(value_, resolver);
    } catch (const ApplyError& e) {
        detail::log_access_error("Replica::apply_delta", e.what());
        return false;
    }
    value_ = std::move(next);
    metadata_ = std::move(staged);
    return resolver.accepted() > 0;
}

bool Replica::merge(const Replica& other)
{
    if (&other == this) {
        return false;
    }

    std::scoped_lock lock(mutex_, other.mutex_);

    for (const auto& [path, ts] : other.metadata_.clocks) clock_.update(ts);
    for (const auto& [path, ts] : other.metadata_.tombstones) clock_.update(ts);

    Patch patch = Differ(DiffOptions{registry_}).diff(value_, other.value_);
    if (patch.is_empty()) {
        metadata_.merge_from(other.metadata_);
        return false;
    }

    StateResolver resolver(metadata_, other.metadata_);
    try {
        value_ = patch.apply_resolved(value_, resolver);
    } catch (const ApplyError& e) {
        detail::log_access_error("Replica::merge", e.what());
        return false;
    }
    metadata_.merge_from(other.metadata_);
    return true;
}

} // namespace lager_delta
