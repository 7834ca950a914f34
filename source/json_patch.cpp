// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_patch.cpp
/// @brief Patch <-> JSON Patch operation list.

#include <lager_delta/builder.h>
#include <lager_delta/json_patch.h>
#include <lager_delta/serialization.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <set>

namespace lager_delta {

namespace {

constexpr std::size_t inserted = static_cast<std::size_t>(-1);

Value object(std::initializer_list<std::pair<std::string, Value>> init)
{
    return Value::map(init);
}

Value with_entry(const Value& obj, const std::string& key, Value value)
{
    return obj.set(key, std::move(value));
}

Value list(const std::vector<Value>& items)
{
    return Value::vector(items);
}

ConditionPtr all(ConditionPtr a, ConditionPtr b)
{
    if (!a) return b;
    if (!b) return a;
    return cond::all_of({std::move(a), std::move(b)});
}

ConditionPtr any(ConditionPtr a, ConditionPtr b)
{
    if (!a) return b;
    if (!b) return a;
    return cond::any_of({std::move(a), std::move(b)});
}

// ============================================================
// Emission
// ============================================================

class Emitter {
public:
    std::vector<Value> ops;

    void push(std::string_view name, const Path& path, const std::optional<Value>& value,
              const std::optional<Path>& from, const ConditionPtr& if_c, const ConditionPtr& unless_c)
    {
        Value op = object({{"op", std::string(name)}, {"path", path_to_pointer(path)}});
        if (value) op = with_entry(op, "value", *value);
        if (from) op = with_entry(op, "from", path_to_pointer(*from));
        if (if_c) op = with_entry(op, "if", condition_to_predicate(*if_c));
        if (unless_c) op = with_entry(op, "unless", condition_to_predicate(*unless_c));
        ops.push_back(std::move(op));
    }

    void emit(const Operation& op, const Path& path, const ConditionPtr& inherited_if,
              const ConditionPtr& inherited_unless)
    {
        ConditionPtr if_c = all(inherited_if, op.if_cond);
        ConditionPtr unless_c = any(inherited_unless, op.unless_cond);

        if (op.cond) {
            ops.push_back(object({{"op", "test"},
                                  {"path", path_to_pointer(path)},
                                  {"if", condition_to_predicate(*op.cond)}}));
        }

        std::visit([&](const auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, ValueOp>) {
                switch (op.kind()) {
                    case OpKind::Add:
                        push("add", path, n.new_value, std::nullopt, if_c, unless_c);
                        break;
                    case OpKind::Remove:
                        push("remove", path, std::nullopt, std::nullopt, if_c, unless_c);
                        break;
                    default:
                        push("replace", path, n.new_value, std::nullopt, if_c, unless_c);
                        break;
                }
            } else if constexpr (std::is_same_v<T, RecordOp>) {
                for (const auto& [name, sub] : n.fields) {
                    emit(*sub, child_path(path, name), if_c, unless_c);
                }
            } else if constexpr (std::is_same_v<T, FixedArrayOp>) {
                for (const auto& [idx, sub] : n.indices) {
                    emit(*sub, child_path(path, idx), if_c, unless_c);
                }
            } else if constexpr (std::is_same_v<T, MapOp>) {
                for (const auto& [key, v] : n.removed) {
                    push("remove", child_path(path, key), std::nullopt, std::nullopt, if_c, unless_c);
                }
                for (const auto& [key, v] : n.added) {
                    push("add", child_path(path, key), v, std::nullopt, if_c, unless_c);
                }
                for (const auto& [key, sub] : n.modified) {
                    emit(*sub, child_path(path, key), if_c, unless_c);
                }
            } else if constexpr (std::is_same_v<T, SequenceOp>) {
                emit_sequence(n, path, if_c, unless_c);
            } else if constexpr (std::is_same_v<T, RefOp> || std::is_same_v<T, ReadOnlyOp>) {
                emit(*n.inner, path, if_c, unless_c);
            } else if constexpr (std::is_same_v<T, TestOp>) {
                push("test", path, n.expected, std::nullopt, if_c, unless_c);
            } else if constexpr (std::is_same_v<T, CopyOp>) {
                push("copy", path, std::nullopt, n.from, if_c, unless_c);
            } else if constexpr (std::is_same_v<T, MoveOp>) {
                push("move", path, std::nullopt, n.from, if_c, unless_c);
            } else {
                push("log", path, Value{n.message}, std::nullopt, if_c, unless_c);
            }
        }, op.node);
    }

    /// Replays the source-coordinate script as sequential operations:
    /// removals first (shifted by the removals before them), then the
    /// target order is produced left to right with adds and moves.
    void emit_sequence(const SequenceOp& n, const Path& path, const ConditionPtr& if_c,
                       const ConditionPtr& unless_c)
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
        std::set<std::size_t> removed;
        std::set<std::size_t> moved;
        std::map<std::size_t, const SequenceEdit*> replaced;
        for (const auto& e : n.edits) {
            switch (e.kind) {
                case OpKind::Add:
                case OpKind::Copy:
                    inserts[e.index].push_back(&e);
                    break;
                case OpKind::Move:
                    inserts[e.index].push_back(&e);
                    moved.insert(e.from_index);
                    break;
                case OpKind::Remove:
                    removed.insert(e.index);
                    break;
                case OpKind::Replace:
                    replaced[e.index] = &e;
                    break;
                default:
                    break;
            }
        }

        std::size_t shift = 0;
        for (std::size_t i : removed) {
            push("remove", child_path(path, i - shift), std::nullopt, std::nullopt, if_c, unless_c);
            ++shift;
        }

        struct Item {
            std::size_t source;
            const SequenceEdit* edit;
        };
        std::vector<Item> target;
        for (std::size_t i = 0; i <= extent; ++i) {
            for (const auto* e : inserts[i]) {
                target.push_back({e->kind == OpKind::Move ? e->from_index : inserted, e});
            }
            if (i < extent && !removed.count(i) && !moved.count(i)) {
                auto it = replaced.find(i);
                target.push_back({i, it == replaced.end() ? nullptr : it->second});
            }
        }

        std::vector<std::size_t> current;
        for (std::size_t i = 0; i < extent; ++i) {
            if (!removed.count(i)) current.push_back(i);
        }

        for (std::size_t p = 0; p < target.size(); ++p) {
            const Item& item = target[p];
            Path at = child_path(path, p);
            if (item.source == inserted) {
                const SequenceEdit& e = *item.edit;
                if (e.kind == OpKind::Copy) {
                    push("copy", at, std::nullopt, e.from_path, if_c, unless_c);
                } else {
                    push("add", at, e.value.value_or(Value{}), std::nullopt, if_c, unless_c);
                }
                current.insert(current.begin() + static_cast<std::ptrdiff_t>(p), inserted);
                continue;
            }

            auto found = std::find(current.begin() + static_cast<std::ptrdiff_t>(p), current.end(), item.source);
            auto q = static_cast<std::size_t>(found - current.begin());
            if (found != current.end() && q != p) {
                push("move", at, std::nullopt, child_path(path, q), if_c, unless_c);
                current.erase(found);
                current.insert(current.begin() + static_cast<std::ptrdiff_t>(p), item.source);
            }
            if (item.edit && item.edit->sub) {
                emit(*item.edit->sub, at, if_c, unless_c);
            }
        }
    }
};

// ============================================================
// Predicates
// ============================================================

std::string pointer(const Path& path)
{
    return path_to_pointer(path);
}

Value compare_predicate(const Compare& c)
{
    auto leaf = [&](std::string op) {
        return object({{"op", std::move(op)}, {"path", pointer(c.path)}, {"value", c.literal}});
    };
    auto wrap = [&](std::string op, std::vector<Value> apply) {
        return object({{"op", std::move(op)}, {"apply", list(apply)}});
    };
    const std::string test = c.fold ? "test-" : "test";
    switch (c.op) {
        case CompareOp::Eq: return leaf(test);
        case CompareOp::Ne: return wrap("not", {leaf(test)});
        case CompareOp::Lt: return leaf("less");
        case CompareOp::Gt: return leaf("more");
        case CompareOp::Le: return wrap("or", {leaf("less"), leaf(test)});
        case CompareOp::Ge: return wrap("or", {leaf("more"), leaf(test)});
    }
    return leaf(test);
}

CompareOp parse_compare_op(const std::string& text)
{
    if (text == "==") return CompareOp::Eq;
    if (text == "!=") return CompareOp::Ne;
    if (text == "<") return CompareOp::Lt;
    if (text == ">") return CompareOp::Gt;
    if (text == "<=") return CompareOp::Le;
    if (text == ">=") return CompareOp::Ge;
    throw JsonPatchError("unknown comparison operator: " + text);
}

std::optional<Value> member(const Value& obj, const std::string& key)
{
    if (auto* map = obj.get_if<ValueMap>()) {
        if (auto* found = map->find(key)) {
            return found->get();
        }
    }
    return std::nullopt;
}

std::string required_string(const Value& obj, const std::string& key, std::string_view what)
{
    Value v = member(obj, key).value_or(Value{});
    if (!v.is_string()) {
        throw JsonPatchError(std::string(what) + ": missing string member '" + key + "'");
    }
    return v.as_string();
}

} // anonymous namespace

Value condition_to_predicate(const Condition& cond)
{
    return std::visit([&](const auto& n) -> Value {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Compare>) {
            return compare_predicate(n);
        } else if constexpr (std::is_same_v<T, CompareFields>) {
            return object({{"op", "compare"},
                           {"path", pointer(n.path1)},
                           {"from", pointer(n.path2)},
                           {"value", std::string(to_string(n.op))},
                           {"ignoreCase", n.fold}});
        } else if constexpr (std::is_same_v<T, Defined>) {
            return object({{"op", "defined"}, {"path", pointer(n.path)}});
        } else if constexpr (std::is_same_v<T, Undefined>) {
            return object({{"op", "undefined"}, {"path", pointer(n.path)}});
        } else if constexpr (std::is_same_v<T, TypeOf>) {
            return object({{"op", "type"}, {"path", pointer(n.path)}, {"value", n.type}});
        } else if constexpr (std::is_same_v<T, StringPredicate>) {
            if (n.op == StringOp::Matches) {
                return object({{"op", "matches"}, {"path", pointer(n.path)}, {"value", n.needle},
                               {"ignoreCase", n.fold}});
            }
            std::string name(to_string(n.op));
            if (n.fold) name += "-";
            return object({{"op", name}, {"path", pointer(n.path)}, {"value", n.needle}});
        } else if constexpr (std::is_same_v<T, Membership>) {
            return object({{"op", n.fold ? "in-" : "in"}, {"path", pointer(n.path)}, {"value", list(n.literals)}});
        } else if constexpr (std::is_same_v<T, And> || std::is_same_v<T, Or>) {
            std::vector<Value> apply;
            for (const auto& sub : n.subs) {
                apply.push_back(condition_to_predicate(*sub));
            }
            return object({{"op", std::is_same_v<T, And> ? "and" : "or"}, {"apply", list(apply)}});
        } else if constexpr (std::is_same_v<T, Not>) {
            return object({{"op", "not"}, {"apply", list({condition_to_predicate(*n.sub)})}});
        } else {
            return object({{"op", "log"}, {"value", n.message}});
        }
    }, cond.node);
}

ConditionPtr predicate_to_condition(const Value& predicate)
{
    if (!predicate.is_map()) {
        throw JsonPatchError("predicate must be an object, got " + kind_name(predicate));
    }
    const std::string op = required_string(predicate, "op", "predicate");
    auto path = [&] { return parse_json_pointer(required_string(predicate, "path", op)); };
    auto needle = [&] { return required_string(predicate, "value", op); };
    auto subs = [&] {
        Value apply = member(predicate, "apply").value_or(Value{});
        const ValueVector* items = apply.get_if<ValueVector>();
        if (!items) {
            throw JsonPatchError(op + ": missing array member 'apply'");
        }
        std::vector<ConditionPtr> out;
        for (const auto& box : *items) {
            out.push_back(predicate_to_condition(box.get()));
        }
        return out;
    };

    if (op == "test" || op == "test-") {
        return cond::make({Compare{path(), member(predicate, "value").value_or(Value{}), CompareOp::Eq, op == "test-"}});
    }
    if (op == "less" || op == "more") {
        return cond::make({Compare{path(), member(predicate, "value").value_or(Value{}), op == "less" ? CompareOp::Lt : CompareOp::Gt}});
    }
    if (op == "compare") {
        return cond::make({CompareFields{path(), parse_json_pointer(required_string(predicate, "from", op)),
                                         parse_compare_op(needle()), member(predicate, "ignoreCase").value_or(Value{false}).as_bool()}});
    }
    if (op == "defined") return cond::make({Defined{path()}});
    if (op == "undefined") return cond::make({Undefined{path()}});
    if (op == "type") return cond::make({TypeOf{path(), needle()}});
    if (op == "matches") {
        return cond::make({StringPredicate{path(), needle(), StringOp::Matches, member(predicate, "ignoreCase").value_or(Value{false}).as_bool()}});
    }

    static const std::pair<std::string_view, StringOp> string_ops[] = {
        {"contains", StringOp::Contains}, {"starts", StringOp::Starts}, {"ends", StringOp::Ends}};
    for (const auto& [name, sop] : string_ops) {
        if (op == name || op == std::string(name) + "-") {
            return cond::make({StringPredicate{path(), needle(), sop, op.back() == '-'}});
        }
    }

    if (op == "in" || op == "in-") {
        Value values = member(predicate, "value").value_or(Value{});
        const ValueVector* items = values.get_if<ValueVector>();
        if (!items) {
            throw JsonPatchError(op + ": 'value' must be an array");
        }
        std::vector<Value> literals;
        for (const auto& box : *items) {
            literals.push_back(box.get());
        }
        return cond::make({Membership{path(), std::move(literals), op == "in-"}});
    }
    if (op == "and") return cond::all_of(subs());
    if (op == "or") return cond::any_of(subs());
    if (op == "not") {
        auto s = subs();
        if (s.size() == 1) return cond::negate(s.front());
        return cond::negate(cond::any_of(std::move(s)));
    }
    if (op == "log") return cond::log(needle());

    throw JsonPatchError("unknown predicate op: " + op);
}

// ============================================================
// Patch -> wire
// ============================================================

Value to_json_patch_value(const Patch& patch)
{
    Emitter emitter;
    if (patch.condition()) {
        emitter.ops.push_back(object({{"op", "test"},
                                      {"path", ""},
                                      {"if", condition_to_predicate(*patch.condition())}}));
    }
    if (patch.root()) {
        emitter.emit(*patch.root(), Path{}, nullptr, nullptr);
    }
    return list(emitter.ops);
}

std::string to_json_patch(const Patch& patch, bool compact)
{
    return to_json(to_json_patch_value(patch), compact);
}

// ============================================================
// Wire -> Patch
// ============================================================

Value conform_to_shape(const Value& value, const Value& shape)
{
    if (auto* ref = shape.get_if<ValueRef>()) {
        if (value.is_null()) {
            return Value{ValueRef{ref->kind, std::nullopt}};
        }
        Value inner = conform_to_shape(value, ref->target ? ref->target->get() : Value{});
        return Value{ValueRef{ref->kind, ValueBox{std::move(inner)}}};
    }

    if (auto* rec = shape.get_record()) {
        const ValueMap* fields = value.get_if<ValueMap>();
        if (!fields) {
            return value;
        }
        auto t = ValueMap{}.transient();
        for (const auto& [name, box] : *fields) {
            auto* field_shape = rec->fields.find(name);
            t.set(name, ValueBox{conform_to_shape(box.get(), field_shape ? field_shape->get() : Value{})});
        }
        return Value{Record{rec->type, t.persistent()}};
    }

    if (auto* map = shape.get_if<ValueMap>()) {
        const ValueMap* entries = value.get_if<ValueMap>();
        if (!entries || map->empty()) {
            return value;
        }
        const Value& element = map->begin()->second.get();
        auto t = ValueMap{}.transient();
        for (const auto& [key, box] : *entries) {
            auto* own = map->find(key);
            t.set(key, ValueBox{conform_to_shape(box.get(), own ? own->get() : element)});
        }
        return Value{t.persistent()};
    }

    if (auto* vec = shape.get_if<ValueVector>()) {
        const ValueVector* items = value.get_if<ValueVector>();
        if (!items || vec->empty()) {
            return value;
        }
        auto t = ValueVector{}.transient();
        for (std::size_t i = 0; i < items->size(); ++i) {
            const Value& element = i < vec->size() ? (*vec)[i].get() : (*vec)[0].get();
            t.push_back(ValueBox{conform_to_shape((*items)[i].get(), element)});
        }
        return Value{t.persistent()};
    }

    if (auto* arr = shape.get_if<ValueArray>()) {
        const ValueVector* items = value.get_if<ValueVector>();
        if (!items) {
            return value;
        }
        ValueArray out;
        for (std::size_t i = 0; i < items->size(); ++i) {
            const Value element = i < arr->size() ? (*arr)[i].get() : Value{};
            out = std::move(out).push_back(ValueBox{conform_to_shape((*items)[i].get(), element)});
        }
        return Value{std::move(out)};
    }

    if (shape.is_number() && value.is_number() && shape.type_index() != value.type_index()) {
        if (value.is_integer() && !shape.is_integer()) {
            double d = value.as_number();
            return shape.is<float>() ? Value{static_cast<float>(d)} : Value{d};
        }
        if (value.is_integer()) {
            int64_t i = value.is<uint64_t>() ? static_cast<int64_t>(*value.get_if<uint64_t>()) : value.as_int64();
            if (shape.is<int64_t>()) return Value{i};
            if (shape.is<uint64_t>() && i >= 0) return Value{static_cast<uint64_t>(i)};
            if (shape.is<int32_t>() && i >= INT32_MIN && i <= INT32_MAX) return Value{static_cast<int32_t>(i)};
            return value;
        }
        if (shape.is<float>()) {
            return Value{static_cast<float>(value.as_number())};
        }
        if (shape.is<double>()) {
            return Value{value.as_number()};
        }
    }
    return value;
}

namespace {

class Replayer {
public:
    Replayer(const Value& shape, const TypeRegistry* registry)
        : builder_(shape, registry)
    {
    }

    Patch finish()
    {
        if (global_) {
            builder_.condition(global_);
        }
        return builder_.build();
    }

    void replay(const Value& op)
    {
        if (!op.is_map()) {
            throw JsonPatchError("operation must be an object, got " + kind_name(op));
        }
        const std::string name = required_string(op, "op", "operation");
        const Path path = parse_json_pointer(required_string(op, "path", name));
        const auto value_member = member(op, "value");
        const bool has_value = value_member.has_value();
        const Value value = value_member.value_or(Value{});
        auto if_member = member(op, "if");
        auto unless_member = member(op, "unless");
        ConditionPtr if_c = if_member ? predicate_to_condition(*if_member) : nullptr;
        ConditionPtr unless_c = unless_member ? predicate_to_condition(*unless_member) : nullptr;

        auto guard = [&](PatchBuilder::Node node) {
            if (if_c) node.only_if(if_c);
            if (unless_c) node.unless(unless_c);
        };

        if (name == "test") {
            if (!has_value) {
                if (!if_c) {
                    throw JsonPatchError("test without value needs an 'if' predicate");
                }
                if (path.empty()) {
                    global_ = all(global_, if_c);
                } else {
                    builder_.at(path).when(if_c);
                }
                return;
            }
            auto node = builder_.at(path);
            node.test(conform_to_shape(value, node.shape()));
            guard(node);
            return;
        }
        if (name == "log") {
            auto node = builder_.at(path);
            node.log(value.as_string());
            guard(node);
            return;
        }
        if (name == "replace") {
            require_value(name, has_value);
            auto node = builder_.at(path);
            node.put(conform_to_shape(value, node.shape()));
            guard(node);
            return;
        }

        if (path.empty()) {
            if (name == "add") {
                require_value(name, has_value);
                auto node = builder_.root();
                node.put(conform_to_shape(value, node.shape()));
                guard(node);
                return;
            }
            if (name == "remove") {
                auto node = builder_.root();
                node.put(Value{});
                guard(node);
                return;
            }
            if (name == "copy" || name == "move") {
                throw JsonPatchError(name + " cannot target the root");
            }
            throw JsonPatchError("unknown op: " + name);
        }

        const Path parent_path(path.begin(), path.end() - 1);
        const PathElement& last = path.back();
        PatchBuilder::Node parent = container(parent_path);
        const Value& container_shape = parent.shape();

        if (name == "add") {
            require_value(name, has_value);
            if (container_shape.is_vector()) {
                std::size_t at = sequence_position(parent, last, true);
                const auto& vec = *container_shape.get_if<ValueVector>();
                parent.insert(at, vec.empty() ? value : conform_to_shape(value, vec[0].get()));
                guard(parent);
            } else if (auto* map = container_shape.get_if<ValueMap>()) {
                const std::string key = part_to_string(last);
                if (map->find(key) && !removed(parent_path, key)) {
                    auto node = parent.key(key);
                    node.put(conform_to_shape(value, node.shape()));
                    guard(node);
                } else {
                    Value element = map->find(key) ? map->find(key)->get()
                                    : map->empty() ? Value{} : map->begin()->second.get();
                    parent.add_entry(key, conform_to_shape(value, element));
                    guard(parent);
                }
            } else {
                auto node = parent.step(last);
                node.put(conform_to_shape(value, node.shape()));
                guard(node);
            }
            return;
        }

        if (name == "remove") {
            if (container_shape.is_vector()) {
                parent.remove(sequence_position(parent, last, false));
                guard(parent);
            } else if (container_shape.is_map()) {
                const std::string key = part_to_string(last);
                parent.remove_entry(key);
                removed_.emplace_back(parent_path, key);
                guard(parent);
            } else {
                auto node = parent.step(last);
                node.put(Value{});
                guard(node);
            }
            return;
        }

        if (name == "move" || name == "copy") {
            const std::string from_text = required_string(op, "from", name);
            const Path from = parse_json_pointer(from_text);
            if (container_shape.is_vector()) {
                std::size_t at = sequence_position(parent, last, true);
                if (name == "copy") {
                    parent.insert_copy(at, from_text);
                } else {
                    const bool same_parent = from.size() == path.size() &&
                                             std::equal(parent_path.begin(), parent_path.end(), from.begin(),
                                                        parts_equal);
                    if (!same_parent) {
                        throw JsonPatchError("move into a sequence must come from the same sequence: " +
                                             from_text);
                    }
                    parent.move_element(sequence_position(parent, from.back(), false), at);
                }
                guard(parent);
                return;
            }
            auto node = parent.step(last);
            if (name == "copy") {
                node.copy(from_text);
            } else {
                node.move(from_text);
            }
            guard(node);
            return;
        }

        throw JsonPatchError("unknown op: " + name);
    }

private:
    static void require_value(const std::string& name, bool has_value)
    {
        if (!has_value) {
            throw JsonPatchError(name + ": missing member 'value'");
        }
    }

    PatchBuilder::Node container(const Path& path)
    {
        PatchBuilder::Node node = builder_.at(path);
        while (node.shape().is_ref()) {
            node = node.elem();
        }
        return node;
    }

    std::size_t sequence_position(const PatchBuilder::Node& seq, const PathElement& part, bool for_insert)
    {
        if (auto* idx = std::get_if<std::size_t>(&part)) {
            return *idx;
        }
        const auto& text = std::get<std::string>(part);
        if (text == "-" && for_insert) {
            return seq.size();
        }
        throw PathError(path_to_pointer(seq.path()) + ": '" + text + "' is not a sequence position");
    }

    bool removed(const Path& parent, const std::string& key) const
    {
        return std::any_of(removed_.begin(), removed_.end(), [&](const auto& r) {
            return r.second == key && r.first.size() == parent.size() &&
                   std::equal(parent.begin(), parent.end(), r.first.begin(), parts_equal);
        });
    }

    PatchBuilder builder_;
    ConditionPtr global_;
    std::vector<std::pair<Path, std::string>> removed_;
};

} // anonymous namespace

Patch from_json_patch(std::string_view text, const Value& shape, const TypeRegistry* registry)
{
    std::string error;
    Value doc = from_json(std::string(text), &error);
    if (!error.empty()) {
        throw JsonPatchError("invalid JSON: " + error);
    }
    const ValueVector* ops = doc.get_if<ValueVector>();
    if (!ops) {
        throw JsonPatchError("a JSON Patch must be an array, got " + kind_name(doc));
    }

    Replayer replayer(shape, registry);
    for (const auto& box : *ops) {
        replayer.replay(box.get());
    }
    return replayer.finish();
}

} // namespace lager_delta
