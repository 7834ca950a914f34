// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file apply.cpp
/// @brief The shared operation-tree walk behind apply, apply_checked and
///        apply_resolved.
///
/// The walk is functional: every node receives the value currently at its
/// location (nullopt when absent) and returns the value that should be there
/// afterwards. Parents rebuild themselves from their children's results, so
/// untouched subtrees keep sharing their immer nodes with the input root.

#include <lager_delta/equal.h>
#include <lager_delta/patch.h>
#include <lager_delta/resolvers.h>

#include <algorithm>
#include <functional>
#include <iostream>

namespace lager_delta {

ApplyError::ApplyError(std::vector<std::string> errors)
    : std::runtime_error([&] {
          if (errors.size() == 1) {
              return errors.front();
          }
          std::string msg = std::to_string(errors.size()) + " errors occurred:";
          for (const auto& e : errors) {
              msg += "\n  - " + e;
          }
          return msg;
      }())
    , errors_(std::move(errors))
{
}

namespace {

enum class Mode : uint8_t { Lenient, Checked, Resolved };

using Slot = std::optional<Value>;

std::string where(const Path& path)
{
    return path.empty() ? "/" : path_to_pointer(path);
}

struct ApplyContext {
    Mode mode;
    const Value& start;
    bool strict;
    ConflictResolver* resolver = nullptr;
    std::vector<std::string> errors;
    std::vector<Path> move_sources;

    [[nodiscard]] bool verifying() const noexcept { return mode != Mode::Lenient; }
    [[nodiscard]] bool checking_old_values() const noexcept { return mode == Mode::Checked && strict; }
    [[nodiscard]] bool resolving() const noexcept { return mode == Mode::Resolved; }

    void fail(const Path& path, const std::string& message)
    {
        errors.push_back(where(path) + ": " + message);
    }

    std::optional<Value> submit(Path path, OpKind kind, std::optional<Value> key, std::optional<Value> prev_key,
                                const Slot& current, std::optional<Value> proposed)
    {
        Slot cur = (current && !current->is_empty()) ? current : std::nullopt;
        return resolver->resolve(ResolveRequest{std::move(path), kind, std::move(key), std::move(prev_key),
                                                std::move(cur), std::move(proposed)});
    }
};

Slot apply_node(ApplyContext& ctx, const Operation& op, const Path& path, const Slot& current);

bool same_old_value(const Value& current, const Value& recorded)
{
    if (current.is_empty() && recorded.is_empty()) {
        return true;
    }
    return deep_equal(current, recorded);
}

std::string mismatch(const Value& expected, const Value& found)
{
    return "expected " + value_to_string(expected) + ", found " + value_to_string(found);
}

/// Key of a sequence element: the named field of the (dereferenced) record.
std::optional<Value> element_key(const Value& element, const std::string& key_field)
{
    if (key_field.empty()) {
        return std::nullopt;
    }
    const Value& d = deref(element);
    if (auto* rec = d.get_record()) {
        if (auto* f = rec->fields.find(key_field)) {
            return f->get();
        }
    }
    return std::nullopt;
}

// ============================================================
// Guards
// ============================================================

/// False when the node is to be skipped (or failed verification).
bool check_guards(ApplyContext& ctx, const Operation& op, const Path& path, const Slot& current)
{
    auto eval = [&](const ConditionPtr& c, const Value& against, std::string_view what) -> std::optional<bool> {
        try {
            return evaluate(*c, against);
        } catch (const ConditionError& e) {
            if (ctx.verifying()) {
                ctx.fail(path, std::string(what) + " condition failed: " + e.what());
            }
            return std::nullopt;
        }
    };

    if (op.if_cond) {
        auto r = eval(op.if_cond, ctx.start, "if");
        if (!r || !*r) return false;
    }
    if (op.unless_cond) {
        auto r = eval(op.unless_cond, ctx.start, "unless");
        if (!r || *r) return false;
    }
    if (op.cond && ctx.verifying()) {
        auto r = eval(op.cond, current.value_or(Value{}), "local");
        if (!r) return false;
        if (!*r) {
            ctx.fail(path, "condition not met: " + to_string(*op.cond));
            return false;
        }
    }
    return true;
}

// ============================================================
// Leaves
// ============================================================

Slot apply_value(ApplyContext& ctx, const Operation& op, const ValueOp& n, const Path& path, const Slot& current)
{
    const Value cur = current.value_or(Value{});
    if (ctx.checking_old_values() && !same_old_value(cur, n.old_value)) {
        ctx.fail(path, "value mismatch: " + mismatch(n.old_value, cur));
        return current;
    }
    if (ctx.resolving()) {
        OpKind kind = op.kind();
        std::optional<Value> proposed;
        if (kind != OpKind::Remove) {
            proposed = n.new_value;
        }
        auto accepted = ctx.submit(path, kind, std::nullopt, std::nullopt, current, proposed);
        if (!accepted) {
            return current;
        }
        return kind == OpKind::Remove ? n.new_value : *accepted;
    }
    return n.new_value;
}

Slot apply_copy(ApplyContext& ctx, const Path& from, OpKind kind, const Path& path, const Slot& current)
{
    auto source = resolve(ctx.start, from);
    if (!source) {
        ctx.fail(path, std::string(to_string(kind)) + " source " + where(from) + " not found");
        return current;
    }
    if (ctx.resolving()) {
        auto accepted = ctx.submit(path, kind, std::nullopt, std::nullopt, current, *source);
        if (!accepted) {
            return current;
        }
        source = std::move(accepted);
    }
    if (kind == OpKind::Move) {
        ctx.move_sources.push_back(from);
    }
    return source;
}

// ============================================================
// Containers
// ============================================================

Slot apply_record(ApplyContext& ctx, const RecordOp& n, const Path& path, const Slot& current)
{
    const Value cur = current.value_or(Value{});
    Record out;
    if (auto* rec = cur.get_record()) {
        if (rec->type != n.type) {
            ctx.fail(path, "expected record " + n.type + ", found " + kind_name(cur));
            return current;
        }
        out = *rec;
    } else if (cur.is_empty()) {
        out.type = n.type;
    } else {
        ctx.fail(path, "expected record " + n.type + ", found " + kind_name(cur));
        return current;
    }

    for (const auto& [name, sub] : n.fields) {
        auto* field = out.fields.find(name);
        Slot child = field ? Slot{field->get()} : std::nullopt;
        Slot result = apply_node(ctx, *sub, child_path(path, name), child);
        if (result) {
            out.fields = out.fields.set(name, ValueBox{std::move(*result)});
        } else if (field) {
            out.fields = out.fields.erase(name);
        }
    }
    return Value{std::move(out)};
}

Slot apply_fixed_array(ApplyContext& ctx, const FixedArrayOp& n, const Path& path, const Slot& current)
{
    const Value cur = current.value_or(Value{});
    auto* arr = cur.get_if<ValueArray>();
    if (!arr) {
        ctx.fail(path, "expected array, found " + kind_name(cur));
        return current;
    }
    ValueArray out = *arr;
    for (const auto& [idx, sub] : n.indices) {
        if (idx >= out.size()) {
            ctx.fail(child_path(path, idx), "index out of range (size " + std::to_string(out.size()) + ")");
            continue;
        }
        Slot result = apply_node(ctx, *sub, child_path(path, idx), Slot{out[idx].get()});
        out = out.set(idx, ValueBox{result.value_or(Value{})});
    }
    return Value{std::move(out)};
}

Slot apply_map(ApplyContext& ctx, const MapOp& n, const Path& path, const Slot& current)
{
    const Value cur = current.value_or(Value{});
    ValueMap entries;
    const Record* as_record = cur.get_record();
    if (auto* m = cur.get_if<ValueMap>()) {
        entries = *m;
    } else if (as_record) {
        entries = as_record->fields;
    } else if (!cur.is_empty()) {
        ctx.fail(path, "expected map, found " + kind_name(cur));
        return current;
    }

    for (const auto& [key, old] : n.removed) {
        Path at = child_path(path, key);
        auto* found = entries.find(key);
        if (!found) {
            ctx.fail(at, "key '" + key + "' not found");
            continue;
        }
        if (ctx.checking_old_values() && !same_old_value(found->get(), old)) {
            ctx.fail(at, "remove mismatch: " + mismatch(old, found->get()));
            continue;
        }
        if (ctx.resolving() &&
            !ctx.submit(at, OpKind::Remove, std::nullopt, std::nullopt, Slot{found->get()}, std::nullopt)) {
            continue;
        }
        entries = entries.erase(key);
    }

    for (const auto& [key, value] : n.added) {
        Path at = child_path(path, key);
        auto* found = entries.find(key);
        if (ctx.checking_old_values() && found) {
            ctx.fail(at, "key '" + key + "' already exists");
            continue;
        }
        Value stored = value;
        if (ctx.resolving()) {
            auto accepted = ctx.submit(at, OpKind::Add, std::nullopt, std::nullopt,
                                       found ? Slot{found->get()} : std::nullopt, value);
            if (!accepted) {
                continue;
            }
            stored = std::move(*accepted);
        }
        entries = entries.set(key, ValueBox{std::move(stored)});
    }

    for (const auto& [key, sub] : n.modified) {
        auto* found = entries.find(key);
        Slot child = found ? Slot{found->get()} : std::nullopt;
        Slot result = apply_node(ctx, *sub, child_path(path, key), child);
        if (result) {
            entries = entries.set(key, ValueBox{std::move(*result)});
        } else if (found) {
            entries = entries.erase(key);
        }
    }

    if (as_record) {
        return Value{Record{as_record->type, std::move(entries)}};
    }
    return Value{std::move(entries)};
}

// ============================================================
// Sequences
// ============================================================

/// Positional replay of the edit script (the anchor simulation): walk the
/// source indices, emit the inserts anchored before each one, then the
/// source element itself unless it was removed or moved away.
Slot apply_sequence_positional(ApplyContext& ctx, const SequenceOp& n, const Path& path,
                               const ValueVector& src)
{
    const std::size_t size = src.size();
    std::vector<std::vector<Value>> inserts(size + 1);
    std::vector<bool> dropped(size, false);
    std::vector<const SequenceEdit*> replaced(size, nullptr);

    auto has_key = [&](const Value& key) {
        return std::any_of(src.begin(), src.end(), [&](const ValueBox& b) {
            auto k = element_key(b.get(), n.key_field);
            return k && deep_equal(*k, key);
        });
    };

    for (const auto& e : n.edits) {
        switch (e.kind) {
            case OpKind::Add:
            case OpKind::Copy:
            case OpKind::Move: {
                if (e.index > size) {
                    ctx.fail(child_path(path, e.index),
                             "insert index out of range (size " + std::to_string(size) + ")");
                    continue;
                }
                Path at = child_path(path, e.index);
                Value inserted;
                if (e.kind == OpKind::Add) {
                    if (ctx.checking_old_values() && e.key && has_key(*e.key)) {
                        ctx.fail(at, "element with key " + value_to_string(*e.key) + " already exists");
                        continue;
                    }
                    inserted = e.value.value_or(Value{});
                } else if (e.kind == OpKind::Copy) {
                    auto source = resolve(ctx.start, e.from_path);
                    if (!source) {
                        ctx.fail(at, "copy source " + where(e.from_path) + " not found");
                        continue;
                    }
                    inserted = std::move(*source);
                } else {
                    if (e.from_index >= size) {
                        ctx.fail(at, "move source index " + std::to_string(e.from_index) +
                                         " out of range (size " + std::to_string(size) + ")");
                        continue;
                    }
                    inserted = src[e.from_index].get();
                    if (e.sub) {
                        Slot moved = apply_node(ctx, *e.sub, child_path(path, e.from_index), Slot{inserted});
                        inserted = moved.value_or(Value{});
                    }
                }
                if (ctx.resolving()) {
                    auto accepted = ctx.submit(at, e.kind, e.key, e.prev_key, std::nullopt, inserted);
                    if (!accepted) {
                        continue;
                    }
                    inserted = std::move(*accepted);
                }
                if (e.kind == OpKind::Move) {
                    dropped[e.from_index] = true;
                }
                inserts[e.index].push_back(std::move(inserted));
                break;
            }
            case OpKind::Remove: {
                Path at = child_path(path, e.index);
                if (e.index >= size) {
                    ctx.fail(at, "remove index out of range (size " + std::to_string(size) + ")");
                    continue;
                }
                if (ctx.checking_old_values() && e.value && !same_old_value(src[e.index].get(), *e.value)) {
                    ctx.fail(at, "remove mismatch: " + mismatch(*e.value, src[e.index].get()));
                    continue;
                }
                if (ctx.resolving() &&
                    !ctx.submit(at, OpKind::Remove, e.key, std::nullopt, Slot{src[e.index].get()}, std::nullopt)) {
                    continue;
                }
                dropped[e.index] = true;
                break;
            }
            case OpKind::Replace:
                if (e.index >= size) {
                    ctx.fail(child_path(path, e.index),
                             "replace index out of range (size " + std::to_string(size) + ")");
                    continue;
                }
                replaced[e.index] = &e;
                break;
            default:
                ctx.fail(child_path(path, e.index), "unsupported sequence edit " + std::string(to_string(e.kind)));
                break;
        }
    }

    auto out = ValueVector{}.transient();
    for (std::size_t i = 0; i <= size; ++i) {
        for (auto& v : inserts[i]) {
            out.push_back(ValueBox{std::move(v)});
        }
        if (i == size || dropped[i]) {
            continue;
        }
        if (replaced[i] && replaced[i]->sub) {
            Slot result = apply_node(ctx, *replaced[i]->sub, child_path(path, i), Slot{src[i].get()});
            if (result) {
                out.push_back(ValueBox{std::move(*result)});
            }
            continue;
        }
        out.push_back(src[i]);
    }
    return Value{out.persistent()};
}

/// Entity reconciliation for keyed sequences under a resolver: removes,
/// then replaces and moves, then inserts after their predecessor key.
/// Several inserts after one predecessor are ordered by key string.
Slot apply_sequence_keyed(ApplyContext& ctx, const SequenceOp& n, const Path& path, const ValueVector& src)
{
    struct Entry {
        Value key;
        Value value;
        bool inserted = false;
    };

    std::vector<Entry> entries;
    entries.reserve(src.size());
    for (const auto& box : src) {
        entries.push_back({element_key(box.get(), n.key_field).value_or(Value{}), box.get(), false});
    }

    auto find = [&](const Value& key) -> std::size_t {
        for (std::size_t i = 0; i < entries.size(); ++i) {
            if (deep_equal(entries[i].key, key)) return i;
        }
        return entries.size();
    };
    auto key_for = [&](const SequenceEdit& e) -> std::optional<Value> {
        if (e.key) return e.key;
        if (e.index < src.size()) return element_key(src[e.index].get(), n.key_field);
        return std::nullopt;
    };
    auto prev_for = [&](const SequenceEdit& e) -> Value {
        if (e.prev_key) return *e.prev_key;
        if (e.index > 0 && e.index - 1 < src.size()) {
            return element_key(src[e.index - 1].get(), n.key_field).value_or(Value{});
        }
        return Value{};
    };
    auto insert_after = [&](const Value& prev, Entry entry) {
        std::size_t idx = 0;
        if (!prev.is_null()) {
            std::size_t p = find(prev);
            idx = p == entries.size() ? 0 : p + 1;
        }
        const std::string name = key_string(entry.key);
        while (idx < entries.size() && entries[idx].inserted && key_string(entries[idx].key) < name) {
            ++idx;
        }
        entry.inserted = true;
        entries.insert(entries.begin() + static_cast<std::ptrdiff_t>(idx), std::move(entry));
    };

    for (const auto& e : n.edits) {
        if (e.kind != OpKind::Remove) continue;
        auto key = key_for(e);
        if (!key) continue;
        std::size_t pos = find(*key);
        if (pos == entries.size()) continue;
        if (ctx.submit(child_path(path, key_string(*key)), OpKind::Remove, key, std::nullopt,
                       Slot{entries[pos].value}, std::nullopt)) {
            entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(pos));
        }
    }

    for (const auto& e : n.edits) {
        if (e.kind != OpKind::Replace && e.kind != OpKind::Move) continue;
        std::optional<Value> key = e.kind == OpKind::Move && !e.key && e.from_index < src.size()
                                       ? element_key(src[e.from_index].get(), n.key_field)
                                       : key_for(e);
        if (!key) continue;
        std::size_t pos = find(*key);
        if (pos == entries.size()) continue;

        Path at = child_path(path, key_string(*key));
        Value updated = entries[pos].value;
        if (e.sub) {
            updated = apply_node(ctx, *e.sub, at, Slot{updated}).value_or(Value{});
        }
        entries[pos].value = updated;
        if (e.kind == OpKind::Move) {
            Value prev = prev_for(e);
            if (ctx.submit(at, OpKind::Move, key, prev, Slot{entries[pos].value}, updated)) {
                Entry moved = entries[pos];
                entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(pos));
                insert_after(prev, std::move(moved));
            }
        }
    }

    for (const auto& e : n.edits) {
        if (e.kind != OpKind::Add && e.kind != OpKind::Copy) continue;
        Value value;
        if (e.kind == OpKind::Add) {
            value = e.value.value_or(Value{});
        } else {
            auto source = resolve(ctx.start, e.from_path);
            if (!source) {
                ctx.fail(child_path(path, e.index), "copy source " + where(e.from_path) + " not found");
                continue;
            }
            value = std::move(*source);
        }
        Value key = e.key ? *e.key : element_key(value, n.key_field).value_or(Value{});
        Value prev = prev_for(e);
        auto accepted = ctx.submit(child_path(path, key_string(key)), e.kind, key, prev, std::nullopt, value);
        if (!accepted) continue;

        std::size_t pos = find(key);
        if (pos != entries.size()) {
            entries[pos].value = std::move(*accepted);
        } else {
            insert_after(prev, Entry{key, std::move(*accepted), false});
        }
    }

    auto out = ValueVector{}.transient();
    for (auto& entry : entries) {
        out.push_back(ValueBox{std::move(entry.value)});
    }
    return Value{out.persistent()};
}

Slot apply_sequence(ApplyContext& ctx, const SequenceOp& n, const Path& path, const Slot& current)
{
    const Value cur = current.value_or(Value{});
    ValueVector src;
    if (auto* v = cur.get_if<ValueVector>()) {
        src = *v;
    } else if (!cur.is_empty()) {
        ctx.fail(path, "expected sequence, found " + kind_name(cur));
        return current;
    }
    if (ctx.resolving() && !n.key_field.empty()) {
        return apply_sequence_keyed(ctx, n, path, src);
    }
    return apply_sequence_positional(ctx, n, path, src);
}

Slot apply_ref(ApplyContext& ctx, const RefOp& n, const Path& path, const Slot& current)
{
    const Value cur = current.value_or(Value{});
    auto* ref = cur.get_if<ValueRef>();
    if (!ref && !cur.is_null()) {
        ctx.fail(path, "expected reference, found " + kind_name(cur));
        return current;
    }
    // An empty reference gets a fresh referent.
    Slot target = (ref && ref->target) ? Slot{ref->target->get()} : std::nullopt;
    Slot inner = apply_node(ctx, *n.inner, path, target);
    RefKind kind = ref ? ref->kind : n.kind;
    if (!inner) {
        return Value{ValueRef{kind, std::nullopt}};
    }
    return Value{ValueRef{kind, ValueBox{std::move(*inner)}}};
}

// ============================================================
// Dispatch
// ============================================================

Slot apply_variant(ApplyContext& ctx, const Operation& op, const Path& path, const Slot& current)
{
    return std::visit([&](const auto& n) -> Slot {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, ValueOp>) {
            return apply_value(ctx, op, n, path, current);
        } else if constexpr (std::is_same_v<T, RecordOp>) {
            return apply_record(ctx, n, path, current);
        } else if constexpr (std::is_same_v<T, FixedArrayOp>) {
            return apply_fixed_array(ctx, n, path, current);
        } else if constexpr (std::is_same_v<T, MapOp>) {
            return apply_map(ctx, n, path, current);
        } else if constexpr (std::is_same_v<T, SequenceOp>) {
            return apply_sequence(ctx, n, path, current);
        } else if constexpr (std::is_same_v<T, RefOp>) {
            return apply_ref(ctx, n, path, current);
        } else if constexpr (std::is_same_v<T, TestOp>) {
            const Value cur = current.value_or(Value{});
            if (ctx.verifying() && !same_old_value(cur, n.expected)) {
                ctx.fail(path, "test failed: " + mismatch(n.expected, cur));
            }
            return current;
        } else if constexpr (std::is_same_v<T, CopyOp>) {
            return apply_copy(ctx, n.from, OpKind::Copy, path, current);
        } else if constexpr (std::is_same_v<T, MoveOp>) {
            return apply_copy(ctx, n.from, OpKind::Move, path, current);
        } else if constexpr (std::is_same_v<T, LogOp>) {
            std::cout << "[patch] " << n.message << " (path: " << where(path)
                      << ", value: " << value_to_string(current.value_or(Value{})) << ")\n";
            return current;
        } else {
            if (n.inner && n.inner->template is<LogOp>()) {
                return apply_node(ctx, *n.inner, path, current);
            }
            ctx.fail(path, "field is read-only");
            return current;
        }
    }, op.node);
}

Slot apply_node(ApplyContext& ctx, const Operation& op, const Path& path, const Slot& current)
{
    if (!check_guards(ctx, op, path, current)) {
        return current;
    }
    // Structural ops address the referent of a reference they meet.
    if (current && op.is_container() && !op.is<RefOp>()) {
        if (auto* ref = current->get_if<ValueRef>(); ref && ref->target) {
            Slot inner = apply_variant(ctx, op, path, Slot{ref->target->get()});
            if (!inner) {
                return Value{ValueRef{ref->kind, std::nullopt}};
            }
            return Value{ValueRef{ref->kind, ValueBox{std::move(*inner)}}};
        }
    }
    return apply_variant(ctx, op, path, current);
}

Value erase_move_sources(ApplyContext& ctx, Value root)
{
    // Deepest and right-most first so earlier erasures do not shift later ones.
    std::sort(ctx.move_sources.begin(), ctx.move_sources.end(), std::greater<>{});
    ctx.move_sources.erase(std::unique(ctx.move_sources.begin(), ctx.move_sources.end()),
                           ctx.move_sources.end());
    for (const auto& from : ctx.move_sources) {
        try {
            root = erase_at(root, from);
        } catch (const PathError& e) {
            ctx.fail(from, std::string("move source could not be removed: ") + e.what());
        }
    }
    return root;
}

Value run(ApplyContext& ctx, const OperationPtr& op, const Value& root)
{
    if (!op) {
        return root;
    }
    Slot result = apply_node(ctx, *op, Path{}, Slot{root});
    return erase_move_sources(ctx, result.value_or(Value{}));
}

} // anonymous namespace

// ============================================================
// Patch entry points
// ============================================================

Value Patch::apply(const Value& root, std::vector<std::string>* errors_out) const
{
    ApplyContext ctx{Mode::Lenient, root, strict_};

    if (condition_) {
        try {
            if (!evaluate(*condition_, root)) {
                return root;
            }
        } catch (const ConditionError& e) {
            ctx.errors.push_back(std::string("global condition failed: ") + e.what());
        }
        if (!ctx.errors.empty()) {
            detail::log_access_error("Patch::apply", ctx.errors.front());
            if (errors_out) {
                errors_out->insert(errors_out->end(), ctx.errors.begin(), ctx.errors.end());
            }
            return root;
        }
    }

    Value out = run(ctx, root_, root);
    for (const auto& e : ctx.errors) {
        detail::log_access_error("Patch::apply", e);
    }
    if (errors_out) {
        errors_out->insert(errors_out->end(), ctx.errors.begin(), ctx.errors.end());
    }
    return out;
}

namespace {

void check_global(ApplyContext& ctx, const ConditionPtr& condition, const Value& root)
{
    if (!condition) {
        return;
    }
    try {
        if (!evaluate(*condition, root)) {
            ctx.errors.push_back("global condition not met: " + to_string(*condition));
        }
    } catch (const ConditionError& e) {
        ctx.errors.push_back(std::string("global condition failed: ") + e.what());
    }
}

} // anonymous namespace

Value Patch::apply_checked(const Value& root) const
{
    ApplyContext ctx{Mode::Checked, root, strict_};
    check_global(ctx, condition_, root);
    if (!ctx.errors.empty()) {
        throw ApplyError(std::move(ctx.errors));
    }
    Value out = run(ctx, root_, root);
    if (!ctx.errors.empty()) {
        throw ApplyError(std::move(ctx.errors));
    }
    return out;
}

Value Patch::apply_resolved(const Value& root, ConflictResolver& resolver) const
{
    ApplyContext ctx{Mode::Resolved, root, strict_, &resolver};
    check_global(ctx, condition_, root);
    if (!ctx.errors.empty()) {
        throw ApplyError(std::move(ctx.errors));
    }
    Value out = run(ctx, root_, root);
    if (!ctx.errors.empty()) {
        throw ApplyError(std::move(ctx.errors));
    }
    return out;
}

} // namespace lager_delta
