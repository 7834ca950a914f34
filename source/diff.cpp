// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.cpp
/// @brief Recursive structural comparison producing an operation tree.

#include <lager_delta/diff.h>
#include <lager_delta/equal.h>

#include <immer/algorithm.hpp>

#include <algorithm>

namespace lager_delta {

Differ::Differ(DiffOptions options)
    : options_(std::move(options))
{
}

bool Differ::ignored(const Path& path) const
{
    return std::any_of(options_.ignore_paths.begin(), options_.ignore_paths.end(), [&](const Path& p) {
        return p.size() == path.size() && std::equal(p.begin(), p.end(), path.begin(), parts_equal);
    });
}

bool Differ::equal(const Value& a, const Value& b) const
{
    return deep_equal(a, b, options_.registry);
}

namespace {

/// Every record reachable from @p v, with its location. map_entry is set
/// when the record sits directly in a map reached through keys only.
template <typename Candidate>
void collect_records(const Value& v, Path& path, bool keys_only, bool in_map, std::vector<Candidate>& out)
{
    const Value& d = deref(v);
    if (auto* rec = d.get_record()) {
        out.push_back(Candidate{path, d, keys_only && in_map});
        for (const auto& [name, box] : rec->fields) {
            path.push_back(name);
            collect_records(box.get(), path, keys_only, false, out);
            path.pop_back();
        }
    } else if (auto* m = d.get_if<ValueMap>()) {
        for (const auto& [key, box] : *m) {
            path.push_back(key);
            collect_records(box.get(), path, keys_only, true, out);
            path.pop_back();
        }
    } else if (auto* vec = d.get_if<ValueVector>()) {
        for (std::size_t i = 0; i < vec->size(); ++i) {
            path.push_back(i);
            collect_records((*vec)[i].get(), path, false, false, out);
            path.pop_back();
        }
    } else if (auto* arr = d.get_if<ValueArray>()) {
        for (std::size_t i = 0; i < arr->size(); ++i) {
            path.push_back(i);
            collect_records((*arr)[i].get(), path, false, false, out);
            path.pop_back();
        }
    }
}

bool same_path(const Path& a, const Path& b)
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), parts_equal);
}

/// @p root without the map removal recorded at @p path.
OperationPtr drop_removal(const OperationPtr& root, const Path& path, std::size_t i = 0)
{
    if (!root || i >= path.size()) {
        return root;
    }
    const std::string name = part_to_string(path[i]);
    Operation copy = *root;
    bool last = i + 1 == path.size();

    bool changed = std::visit([&](auto& n) -> bool {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, MapOp>) {
            if (last) {
                auto before = n.removed.size();
                std::erase_if(n.removed, [&](const auto& r) { return r.first == name; });
                return before != n.removed.size();
            }
            for (auto& [key, sub] : n.modified) {
                if (key == name) {
                    sub = drop_removal(sub, path, i + 1);
                    return true;
                }
            }
            return false;
        } else if constexpr (std::is_same_v<T, RecordOp>) {
            for (auto& [field, sub] : n.fields) {
                if (field == name) {
                    sub = drop_removal(sub, path, i + 1);
                    return true;
                }
            }
            return false;
        } else if constexpr (std::is_same_v<T, RefOp>) {
            n.inner = drop_removal(n.inner, path, i);
            return true;
        } else {
            return false;
        }
    }, copy.node);

    if (!changed) {
        return root;
    }

    // Re-run the factories so emptied containers collapse to nullptr.
    OperationPtr rebuilt = std::visit([&](auto& n) -> OperationPtr {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, MapOp>) {
            return make_map_op(std::move(n));
        } else if constexpr (std::is_same_v<T, RecordOp>) {
            return make_record_op(std::move(n.type), std::move(n.fields));
        } else if constexpr (std::is_same_v<T, RefOp>) {
            return make_ref_op(n.kind, std::move(n.inner));
        } else {
            return make_operation(std::move(n));
        }
    }, copy.node);

    return with_guards(rebuilt, root->cond, root->if_cond, root->unless_cond);
}

} // anonymous namespace

// ============================================================
// Entry points
// ============================================================

Patch Differ::diff(const Value& a, const Value& b) const
{
    return Patch(diff_values(a, b));
}

OperationPtr Differ::diff_values(const Value& a, const Value& b) const
{
    State state;
    return run(state, a, b);
}

OperationPtr Differ::run(State& state, const Value& a, const Value& b) const
{
    state.target_root = &b;
    if (options_.detect_moves) {
        Path scratch;
        collect_records(a, scratch, true, false, state.candidates);
    }

    OperationPtr root = diff_node(state, a, b, Path{});

    for (const auto& source : state.claimed_sources) {
        root = drop_removal(root, source);
    }
    return root;
}

Patch diff(const Value& a, const Value& b, const DiffOptions& options)
{
    return Differ(options).diff(a, b);
}

// ============================================================
// Recursive comparison
// ============================================================

OperationPtr Differ::diff_node(State& state, const Value& a, const Value& b, const Path& path,
                               FieldFlags flags) const
{
    if (ignored(path)) {
        return nullptr;
    }
    if (a.is_null() && b.is_null()) {
        return nullptr;
    }
    if (has_flag(flags, FieldFlags::Atomic)) {
        return equal(a, b) ? nullptr : make_value_op(a, b);
    }
    if (equal(a, b)) {
        return nullptr;
    }
    if (a.is_empty() || b.is_empty()) {
        return make_value_op(a, b);
    }
    if (a.data.index() != b.data.index() || a.record_type() != b.record_type()) {
        return make_value_op(a, b);
    }

    const Record* rec_a = a.get_record();
    if (rec_a && options_.registry) {
        if (auto* differ = options_.registry->find_differ(rec_a->type)) {
            try {
                return (*differ)(a, b);
            } catch (const std::exception& e) {
                throw DiffError("custom differ for " + rec_a->type + " failed at " +
                                path_to_string(path) + ": " + e.what());
            }
        }
    }

    if (rec_a) {
        return diff_record(state, *rec_a, *b.get_record(), path);
    }
    if (a.is_array()) {
        return diff_fixed_array(state, a, b, path);
    }
    if (auto* map_a = a.get_if<ValueMap>()) {
        return diff_map(state, *map_a, *b.get_if<ValueMap>(), path);
    }
    if (auto* vec_a = a.get_if<ValueVector>()) {
        return diff_sequence(state, *vec_a, *b.get_if<ValueVector>(), path);
    }
    if (auto* ref_a = a.get_if<ValueRef>()) {
        return diff_ref(state, *ref_a, *b.get_if<ValueRef>(), path);
    }
    return make_value_op(a, b);
}

OperationPtr Differ::diff_record(State& state, const Record& a, const Record& b, const Path& path) const
{
    std::vector<std::string> names = field_order(options_.registry, a);
    for (const auto& name : sorted_keys(b.fields)) {
        if (!a.fields.find(name)) {
            names.push_back(name);
        }
    }

    const Value null_value;
    std::vector<std::pair<std::string, OperationPtr>> fields;
    for (const auto& name : names) {
        FieldFlags flags = options_.registry ? options_.registry->flags(a.type, name) : FieldFlags::None;
        if (has_flag(flags, FieldFlags::Ignore)) {
            continue;
        }
        auto* fa = a.fields.find(name);
        auto* fb = b.fields.find(name);
        if (fa && fb && &fa->get() == &fb->get()) {
            continue;
        }
        OperationPtr sub = diff_node(state, fa ? fa->get() : null_value, fb ? fb->get() : null_value,
                                     child_path(path, name), flags);
        if (sub && has_flag(flags, FieldFlags::ReadOnly)) {
            sub = make_read_only_op(std::move(sub));
        }
        if (sub) {
            fields.emplace_back(name, std::move(sub));
        }
    }
    return make_record_op(a.type, std::move(fields));
}

OperationPtr Differ::diff_fixed_array(State& state, const Value& a, const Value& b, const Path& path) const
{
    const auto& arr_a = *a.get_if<ValueArray>();
    const auto& arr_b = *b.get_if<ValueArray>();
    if (arr_a.size() != arr_b.size()) {
        return make_value_op(a, b);
    }
    std::vector<std::pair<std::size_t, OperationPtr>> indices;
    for (std::size_t i = 0; i < arr_a.size(); ++i) {
        if (&arr_a[i].get() == &arr_b[i].get()) {
            continue;
        }
        if (auto sub = diff_node(state, arr_a[i].get(), arr_b[i].get(), child_path(path, i))) {
            indices.emplace_back(i, std::move(sub));
        }
    }
    return make_fixed_array_op(std::move(indices));
}

OperationPtr Differ::diff_map(State& state, const ValueMap& a, const ValueMap& b, const Path& path) const
{
    MapOp op;

    auto map_differ = immer::make_differ(
        // added
        [&](const std::pair<const std::string, ValueBox>& added) {
            Path at = child_path(path, added.first);
            if (ignored(at)) {
                return;
            }
            if (auto moved = relocation(state, added.second.get(), at)) {
                op.modified.emplace_back(added.first, std::move(moved));
                return;
            }
            op.added.emplace_back(added.first, added.second.get());
        },
        // removed
        [&](const std::pair<const std::string, ValueBox>& removed) {
            if (ignored(child_path(path, removed.first))) {
                return;
            }
            op.removed.emplace_back(removed.first, removed.second.get());
        },
        // retained key
        [&](const std::pair<const std::string, ValueBox>& old_kv,
            const std::pair<const std::string, ValueBox>& new_kv) {
            if (&old_kv.second.get() == &new_kv.second.get()) [[likely]] {
                return;
            }
            if (auto sub = diff_node(state, old_kv.second.get(), new_kv.second.get(),
                                     child_path(path, old_kv.first))) {
                op.modified.emplace_back(old_kv.first, std::move(sub));
            }
        });

    immer::diff(a, b, map_differ);
    return make_map_op(std::move(op));
}

OperationPtr Differ::diff_ref(State& state, const ValueRef& a, const ValueRef& b, const Path& path) const
{
    if (a.kind != b.kind) {
        return make_value_op(Value{a}, Value{b});
    }
    const void* ka = &a.target->get();
    const void* kb = &b.target->get();
    auto [it, inserted] = state.in_progress.emplace(ka, kb);
    if (!inserted) {
        // Revisited pair: treated as already equal.
        return nullptr;
    }
    OperationPtr inner = diff_node(state, a.target->get(), b.target->get(), path);
    state.in_progress.erase(it);
    return make_ref_op(a.kind, std::move(inner));
}

/// A record added at @p path that already existed elsewhere in the source
/// becomes a move (source was a map entry that is gone now) or a copy.
OperationPtr Differ::relocation(State& state, const Value& added, const Path& path) const
{
    if (!options_.detect_moves || !deref(added).is_record()) {
        return nullptr;
    }
    const Value& record = deref(added);
    for (const auto& candidate : state.candidates) {
        if (same_path(candidate.path, path) || !equal(candidate.value, record)) {
            continue;
        }
        bool claimed = std::any_of(state.claimed_sources.begin(), state.claimed_sources.end(),
                                   [&](const Path& p) { return same_path(p, candidate.path); });
        bool gone = !resolve(*state.target_root, candidate.path).has_value();
        if (candidate.map_entry && gone && !claimed && !is_prefix(candidate.path, path)) {
            state.claimed_sources.push_back(candidate.path);
            return make_move_op(candidate.path, added);
        }
        if (!gone) {
            return make_copy_op(candidate.path, added, Value{});
        }
    }
    return nullptr;
}

} // namespace lager_delta
