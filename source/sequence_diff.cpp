// sequence_diff.cpp - edit scripts for dynamic sequences

#include <lager_delta/diff.h>
#include <lager_delta/equal.h>

#include <algorithm>
#include <cstdint>
#include <unordered_map>

namespace lager_delta {

namespace {

/// Key field shared by every element, when the sequence can be aligned by
/// entity key: all elements are records of types declaring the same Key
/// field, and keys are unique on both sides.
std::optional<std::string> common_key_field(const TypeRegistry* registry, const ValueVector& a,
                                            const ValueVector& b)
{
    if (!registry || (a.empty() && b.empty())) {
        return std::nullopt;
    }

    std::optional<std::string> field;
    auto check = [&](const ValueVector& seq) -> bool {
        std::unordered_map<std::string, bool> seen;
        for (const auto& box : seq) {
            const Record* rec = deref(box.get()).get_record();
            if (!rec) return false;
            const TypeDescriptor* desc = registry->find(rec->type);
            if (!desc) return false;
            auto key = desc->key_field();
            if (!key) return false;
            if (field && *field != *key) return false;
            field = key;
            auto value = registry->key_of(box.get());
            if (!value || value->is_null()) return false;
            if (!seen.emplace(key_string(*value), true).second) return false;
        }
        return true;
    };

    if (!check(a) || !check(b)) {
        return std::nullopt;
    }
    return field;
}

/// Indices (into @p seq) of one longest strictly increasing subsequence.
std::vector<std::size_t> longest_increasing_run(const std::vector<std::size_t>& seq)
{
    std::vector<std::size_t> tails;         // index into seq of the smallest tail per length
    std::vector<std::size_t> parent(seq.size(), SIZE_MAX);

    for (std::size_t i = 0; i < seq.size(); ++i) {
        auto it = std::lower_bound(tails.begin(), tails.end(), seq[i],
                                   [&](std::size_t t, std::size_t v) { return seq[t] < v; });
        if (it != tails.begin()) {
            parent[i] = *(it - 1);
        }
        if (it == tails.end()) {
            tails.push_back(i);
        } else {
            *it = i;
        }
    }

    std::vector<std::size_t> run;
    if (tails.empty()) {
        return run;
    }
    for (std::size_t i = tails.back(); i != SIZE_MAX; i = parent[i]) {
        run.push_back(i);
    }
    std::reverse(run.begin(), run.end());
    return run;
}

struct Ordered {
    std::size_t index;
    int group;            // 0 = insert before index, 1 = edit of index
    std::size_t order;
    SequenceEdit edit;
};

std::vector<SequenceEdit> sorted_edits(std::vector<Ordered>& out)
{
    std::stable_sort(out.begin(), out.end(), [](const Ordered& a, const Ordered& b) {
        if (a.index != b.index) return a.index < b.index;
        if (a.group != b.group) return a.group < b.group;
        return a.order < b.order;
    });
    std::vector<SequenceEdit> edits;
    edits.reserve(out.size());
    for (auto& o : out) {
        edits.push_back(std::move(o.edit));
    }
    return edits;
}

} // anonymous namespace

OperationPtr Differ::diff_sequence(State& state, const ValueVector& a, const ValueVector& b,
                                   const Path& path) const
{
    if (auto key_field = common_key_field(options_.registry, a, b)) {
        return diff_keyed(state, a, b, *key_field, path);
    }
    return diff_positional(state, a, b, path);
}

// ============================================================
// Positional alignment
// ============================================================

OperationPtr Differ::diff_positional(State& state, const ValueVector& a, const ValueVector& b,
                                     const Path& path) const
{
    const std::size_t n = a.size();
    const std::size_t m = b.size();

    auto same = [&](std::size_t i, std::size_t j) {
        return &a[i].get() == &b[j].get() || equal(a[i].get(), b[j].get());
    };

    std::size_t prefix = 0;
    while (prefix < n && prefix < m && same(prefix, prefix)) {
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix && same(n - 1 - suffix, m - 1 - suffix)) {
        ++suffix;
    }

    const std::size_t rows = n - prefix - suffix;
    const std::size_t cols = m - prefix - suffix;
    std::vector<SequenceEdit> edits;

    // Pure append or pure truncate of the middle.
    if (rows == 0) {
        for (std::size_t j = 0; j < cols; ++j) {
            SequenceEdit e;
            e.kind = OpKind::Add;
            e.index = prefix;
            e.value = b[prefix + j].get();
            edits.push_back(std::move(e));
        }
        return make_sequence_op(std::move(edits));
    }
    if (cols == 0) {
        for (std::size_t i = 0; i < rows; ++i) {
            SequenceEdit e;
            e.kind = OpKind::Remove;
            e.index = prefix + i;
            e.value = a[prefix + i].get();
            edits.push_back(std::move(e));
        }
        return make_sequence_op(std::move(edits));
    }

    // cost[i][j]: edits turning a[prefix+i..] into b[prefix+j..]
    std::vector<std::vector<std::size_t>> cost(rows + 1, std::vector<std::size_t>(cols + 1, 0));
    for (std::size_t i = 0; i <= rows; ++i) cost[i][cols] = rows - i;
    for (std::size_t j = 0; j <= cols; ++j) cost[rows][j] = cols - j;
    for (std::size_t i = rows; i-- > 0;) {
        for (std::size_t j = cols; j-- > 0;) {
            std::size_t diagonal = cost[i + 1][j + 1] + (same(prefix + i, prefix + j) ? 0 : 1);
            std::size_t del = cost[i + 1][j] + 1;
            std::size_t ins = cost[i][j + 1] + 1;
            cost[i][j] = std::min({diagonal, del, ins});
        }
    }

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < rows || j < cols) {
        const std::size_t ai = prefix + i;
        const std::size_t bj = prefix + j;
        if (i < rows && j < cols &&
            cost[i][j] == cost[i + 1][j + 1] + (same(ai, bj) ? 0 : 1)) {
            if (auto sub = diff_node(state, a[ai].get(), b[bj].get(), child_path(path, ai))) {
                SequenceEdit e;
                e.kind = OpKind::Replace;
                e.index = ai;
                e.sub = std::move(sub);
                edits.push_back(std::move(e));
            }
            ++i;
            ++j;
        } else if (i < rows && cost[i][j] == cost[i + 1][j] + 1) {
            SequenceEdit e;
            e.kind = OpKind::Remove;
            e.index = ai;
            e.value = a[ai].get();
            edits.push_back(std::move(e));
            ++i;
        } else {
            SequenceEdit e;
            e.kind = OpKind::Add;
            e.index = ai;
            e.value = b[bj].get();
            edits.push_back(std::move(e));
            ++j;
        }
    }

    return make_sequence_op(std::move(edits));
}

// ============================================================
// Keyed alignment
// ============================================================

OperationPtr Differ::diff_keyed(State& state, const ValueVector& a, const ValueVector& b,
                                const std::string& key_field, const Path& path) const
{
    const TypeRegistry& registry = *options_.registry;
    const std::size_t n = a.size();
    const std::size_t m = b.size();

    std::vector<Value> keys_a(n), keys_b(m);
    std::unordered_map<std::string, std::size_t> source_of;
    for (std::size_t i = 0; i < n; ++i) {
        keys_a[i] = *registry.key_of(a[i].get());
        source_of.emplace(key_string(keys_a[i]), i);
    }
    for (std::size_t j = 0; j < m; ++j) {
        keys_b[j] = *registry.key_of(b[j].get());
    }

    // Source position of every target element, SIZE_MAX for new entities.
    std::vector<std::size_t> origin(m, SIZE_MAX);
    std::vector<bool> kept(n, false);
    std::vector<std::size_t> shared_targets;
    std::vector<std::size_t> shared_sources;
    for (std::size_t j = 0; j < m; ++j) {
        auto it = source_of.find(key_string(keys_b[j]));
        if (it != source_of.end()) {
            origin[j] = it->second;
            kept[it->second] = true;
            shared_targets.push_back(j);
            shared_sources.push_back(it->second);
        }
    }

    std::vector<bool> stable(m, false);
    for (auto idx : longest_increasing_run(shared_sources)) {
        stable[shared_targets[idx]] = true;
    }

    // Anchor of target position j: the source index of the next stable
    // element in target order, or n.
    std::vector<std::size_t> anchor(m + 1, n);
    for (std::size_t j = m; j-- > 0;) {
        anchor[j] = stable[j] ? origin[j] : anchor[j + 1];
    }

    auto prev_key_of = [&](std::size_t j) { return j == 0 ? Value{} : keys_b[j - 1]; };

    std::vector<Ordered> out;
    for (std::size_t i = 0; i < n; ++i) {
        if (kept[i]) continue;
        SequenceEdit e;
        e.kind = OpKind::Remove;
        e.index = i;
        e.key = keys_a[i];
        e.value = a[i].get();
        out.push_back({i, 1, i, std::move(e)});
    }

    for (std::size_t j = 0; j < m; ++j) {
        SequenceEdit e;
        e.key = keys_b[j];
        if (origin[j] == SIZE_MAX) {
            e.kind = OpKind::Add;
            e.index = anchor[j + 1];
            e.prev_key = prev_key_of(j);
            e.value = b[j].get();
            out.push_back({e.index, 0, j, std::move(e)});
            continue;
        }

        const std::size_t i = origin[j];
        OperationPtr sub;
        if (&a[i].get() != &b[j].get()) {
            sub = diff_node(state, a[i].get(), b[j].get(), child_path(path, i));
        }
        if (stable[j]) {
            if (!sub) continue;
            e.kind = OpKind::Replace;
            e.index = i;
            e.sub = std::move(sub);
            out.push_back({i, 1, j, std::move(e)});
        } else {
            e.kind = OpKind::Move;
            e.index = anchor[j + 1];
            e.from_index = i;
            e.prev_key = prev_key_of(j);
            e.sub = std::move(sub);
            out.push_back({e.index, 0, j, std::move(e)});
        }
    }

    return make_sequence_op(sorted_edits(out), key_field);
}

} // namespace lager_delta
