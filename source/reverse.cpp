// reverse.cpp - deriving the undo patch without re-diffing

#include <lager_delta/equal.h>
#include <lager_delta/patch.h>

#include <algorithm>
#include <map>

namespace lager_delta {

namespace {

using Relocations = std::vector<std::pair<Path, OperationPtr>>;

OperationPtr rebuild(const Operation& original, Operation::Node node)
{
    Operation copy{std::move(node), nullptr, original.if_cond, original.unless_cond};
    return std::make_shared<const Operation>(std::move(copy));
}

/// Replays the forward script over the source indices to learn where every
/// element ends up, then writes the inverse script in target coordinates.
OperationPtr reverse_sequence(const Operation& op, const SequenceOp& n, const Path& at, Relocations& relocated)
{
    std::size_t extent = 0;
    for (const auto& e : n.edits) {
        switch (e.kind) {
            case OpKind::Remove:
            case OpKind::Replace:
                extent = std::max(extent, e.index + 1);
                break;
            case OpKind::Move:
                extent = std::max({extent, e.from_index + 1, e.index});
                break;
            default:
                extent = std::max(extent, e.index);
                break;
        }
    }

    std::vector<std::vector<const SequenceEdit*>> inserts(extent + 1);
    std::map<std::size_t, const SequenceEdit*> removed;
    std::map<std::size_t, const SequenceEdit*> replaced;
    std::map<std::size_t, const SequenceEdit*> moved_from;
    std::map<std::size_t, Value> keys;

    for (const auto& e : n.edits) {
        switch (e.kind) {
            case OpKind::Add:
            case OpKind::Copy:
            case OpKind::Move:
                inserts[e.index].push_back(&e);
                if (e.kind == OpKind::Move) {
                    moved_from[e.from_index] = &e;
                    if (e.key) keys[e.from_index] = *e.key;
                }
                break;
            case OpKind::Remove:
                removed[e.index] = &e;
                if (e.key) keys[e.index] = *e.key;
                break;
            case OpKind::Replace:
                replaced[e.index] = &e;
                if (e.key) keys[e.index] = *e.key;
                break;
            default:
                break;
        }
    }

    struct Ordered {
        std::size_t index;
        int group;            // 0 = insert, 1 = remove/replace
        std::size_t order;
        SequenceEdit edit;
    };
    std::vector<Ordered> out;
    std::map<const SequenceEdit*, std::size_t> landed;   // forward insert -> target position

    auto prev_key_of = [&](std::size_t i) -> std::optional<Value> {
        if (n.key_field.empty()) return std::nullopt;
        if (i == 0) return Value{};
        auto it = keys.find(i - 1);
        if (it == keys.end()) return std::nullopt;
        return it->second;
    };

    std::size_t count = 0;
    std::vector<std::pair<std::size_t, std::size_t>> anchors;   // source index -> target anchor
    for (std::size_t i = 0; i <= extent; ++i) {
        for (const auto* e : inserts[i]) {
            landed[e] = count++;
        }
        if (i == extent) break;
        if (removed.count(i) || moved_from.count(i)) {
            anchors.emplace_back(i, count);
        } else {
            if (auto it = replaced.find(i); it != replaced.end()) {
                const SequenceEdit& fwd = *it->second;
                SequenceEdit rev;
                rev.kind = OpKind::Replace;
                rev.index = count;
                rev.key = fwd.key;
                rev.sub = reverse_operation(fwd.sub, child_path(at, count), relocated);
                if (rev.sub) {
                    out.push_back({count, 1, i, std::move(rev)});
                }
            }
            ++count;
        }
    }

    // Elements the forward script dropped come back in front of the element
    // that followed them, in source order.
    for (const auto& [i, anchor] : anchors) {
        SequenceEdit rev;
        rev.index = anchor;
        rev.prev_key = prev_key_of(i);
        if (auto it = removed.find(i); it != removed.end()) {
            rev.kind = OpKind::Add;
            rev.key = it->second->key;
            rev.value = it->second->value;
        } else {
            const SequenceEdit& fwd = *moved_from.at(i);
            rev.kind = OpKind::Move;
            rev.key = fwd.key;
            rev.from_index = landed.at(&fwd);
            rev.sub = reverse_operation(fwd.sub, child_path(at, rev.from_index), relocated);
        }
        out.push_back({anchor, 0, i, std::move(rev)});
    }

    // Forward inserts that did not come from a source element are removed.
    for (const auto& [fwd, position] : landed) {
        if (fwd->kind == OpKind::Move) continue;
        SequenceEdit rev;
        rev.kind = OpKind::Remove;
        rev.index = position;
        rev.key = fwd->key;
        rev.value = fwd->value;
        out.push_back({position, 1, extent + position, std::move(rev)});
    }

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
    if (edits.empty()) {
        return nullptr;
    }
    return rebuild(op, SequenceOp{std::move(edits), n.key_field});
}

} // anonymous namespace

OperationPtr reverse_operation(const OperationPtr& op, const Path& at, Relocations& relocated)
{
    if (!op) {
        return nullptr;
    }
    return std::visit([&](const auto& n) -> OperationPtr {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, ValueOp>) {
            return rebuild(*op, ValueOp{n.new_value, n.old_value});
        } else if constexpr (std::is_same_v<T, RecordOp>) {
            std::vector<std::pair<std::string, OperationPtr>> fields;
            for (const auto& [name, sub] : n.fields) {
                if (auto r = reverse_operation(sub, child_path(at, name), relocated)) {
                    fields.emplace_back(name, std::move(r));
                }
            }
            if (fields.empty()) return nullptr;
            return rebuild(*op, RecordOp{n.type, std::move(fields)});
        } else if constexpr (std::is_same_v<T, FixedArrayOp>) {
            std::vector<std::pair<std::size_t, OperationPtr>> indices;
            for (const auto& [idx, sub] : n.indices) {
                if (auto r = reverse_operation(sub, child_path(at, idx), relocated)) {
                    indices.emplace_back(idx, std::move(r));
                }
            }
            if (indices.empty()) return nullptr;
            return rebuild(*op, FixedArrayOp{std::move(indices)});
        } else if constexpr (std::is_same_v<T, MapOp>) {
            MapOp rev;
            rev.added = n.removed;
            rev.removed = n.added;
            for (const auto& [key, sub] : n.modified) {
                if (auto* copy = sub->template get_if<CopyOp>(); copy && copy->previous.is_empty()) {
                    rev.removed.emplace_back(key, copy->value);
                    continue;
                }
                if (auto r = reverse_operation(sub, child_path(at, key), relocated)) {
                    rev.modified.emplace_back(key, std::move(r));
                }
            }
            auto built = make_map_op(std::move(rev));
            if (!built) return nullptr;
            return rebuild(*op, built->node);
        } else if constexpr (std::is_same_v<T, SequenceOp>) {
            return reverse_sequence(*op, n, at, relocated);
        } else if constexpr (std::is_same_v<T, RefOp>) {
            auto inner = reverse_operation(n.inner, at, relocated);
            if (!inner) return nullptr;
            return rebuild(*op, RefOp{n.kind, std::move(inner)});
        } else if constexpr (std::is_same_v<T, CopyOp>) {
            return rebuild(*op, ValueOp{n.value, n.previous});
        } else if constexpr (std::is_same_v<T, MoveOp>) {
            relocated.emplace_back(n.from, rebuild(*op, MoveOp{at, n.value}));
            return nullptr;
        } else if constexpr (std::is_same_v<T, ReadOnlyOp>) {
            auto inner = reverse_operation(n.inner, at, relocated);
            if (!inner) return nullptr;
            return rebuild(*op, ReadOnlyOp{std::move(inner)});
        } else {
            // Test and Log are their own reverse.
            return op;
        }
    }, op->node);
}

OperationPtr graft_operation(const OperationPtr& root, const Path& path, OperationPtr op)
{
    if (path.empty()) {
        if (root) {
            detail::log_access_error("graft_operation", "location already holds an operation");
            return root;
        }
        return op;
    }

    const PathElement& head = path.front();
    const Path rest(path.begin() + 1, path.end());
    const std::string name = part_to_string(head);

    if (!root) {
        MapOp m;
        m.modified.emplace_back(name, graft_operation(nullptr, rest, std::move(op)));
        return make_map_op(std::move(m));
    }

    Operation copy = *root;
    bool grafted = std::visit([&](auto& n) -> bool {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, RecordOp>) {
            for (auto& [field, sub] : n.fields) {
                if (field == name) {
                    sub = graft_operation(sub, rest, op);
                    return true;
                }
            }
            n.fields.emplace_back(name, graft_operation(nullptr, rest, op));
            return true;
        } else if constexpr (std::is_same_v<T, MapOp>) {
            for (auto& [key, sub] : n.modified) {
                if (key == name) {
                    sub = graft_operation(sub, rest, op);
                    return true;
                }
            }
            n.modified.emplace_back(name, graft_operation(nullptr, rest, op));
            std::stable_sort(n.modified.begin(), n.modified.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
            return true;
        } else if constexpr (std::is_same_v<T, RefOp>) {
            n.inner = graft_operation(n.inner, path, op);
            return true;
        } else if constexpr (std::is_same_v<T, FixedArrayOp> || std::is_same_v<T, SequenceOp>) {
            const std::size_t* idx = std::get_if<std::size_t>(&head);
            if (!idx) return false;
            if constexpr (std::is_same_v<T, FixedArrayOp>) {
                for (auto& [i, sub] : n.indices) {
                    if (i == *idx) {
                        sub = graft_operation(sub, rest, op);
                        return true;
                    }
                }
                n.indices.emplace_back(*idx, graft_operation(nullptr, rest, op));
                std::stable_sort(n.indices.begin(), n.indices.end(),
                                 [](const auto& a, const auto& b) { return a.first < b.first; });
            } else {
                for (auto& e : n.edits) {
                    if (e.kind == OpKind::Replace && e.index == *idx) {
                        e.sub = graft_operation(e.sub, rest, op);
                        return true;
                    }
                }
                SequenceEdit e;
                e.kind = OpKind::Replace;
                e.index = *idx;
                e.sub = graft_operation(nullptr, rest, op);
                auto pos = std::find_if(n.edits.begin(), n.edits.end(),
                                        [&](const SequenceEdit& x) { return x.index > *idx; });
                n.edits.insert(pos, std::move(e));
            }
            return true;
        } else {
            return false;
        }
    }, copy.node);

    if (!grafted) {
        detail::log_access_error("graft_operation", "cannot place an operation below " + name);
        return root;
    }
    return std::make_shared<const Operation>(std::move(copy));
}

Patch Patch::reverse() const
{
    std::vector<std::pair<Path, OperationPtr>> relocated;
    OperationPtr reversed = reverse_operation(root_, Path{}, relocated);
    for (auto& [path, op] : relocated) {
        reversed = graft_operation(reversed, path, std::move(op));
    }
    return Patch(std::move(reversed), nullptr, strict_, timestamp_);
}

} // namespace lager_delta
