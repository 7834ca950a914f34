// operation.cpp - operation tree factories, equality and formatting

#include <lager_delta/equal.h>
#include <lager_delta/operation.h>

#include <algorithm>
#include <sstream>

namespace lager_delta {

std::string_view to_string(OpKind kind) noexcept
{
    switch (kind) {
        case OpKind::Add:     return "add";
        case OpKind::Remove:  return "remove";
        case OpKind::Replace: return "replace";
        case OpKind::Move:    return "move";
        case OpKind::Copy:    return "copy";
        case OpKind::Test:    return "test";
        case OpKind::Log:     return "log";
    }
    return "replace";
}

OpKind Operation::kind() const
{
    return std::visit([](const auto& n) -> OpKind {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, ValueOp>) {
            if (n.old_value.is_empty() && !n.new_value.is_empty()) return OpKind::Add;
            if (!n.old_value.is_empty() && n.new_value.is_empty()) return OpKind::Remove;
            return OpKind::Replace;
        } else if constexpr (std::is_same_v<T, TestOp>) {
            return OpKind::Test;
        } else if constexpr (std::is_same_v<T, CopyOp>) {
            return OpKind::Copy;
        } else if constexpr (std::is_same_v<T, MoveOp>) {
            return OpKind::Move;
        } else if constexpr (std::is_same_v<T, LogOp>) {
            return OpKind::Log;
        } else if constexpr (std::is_same_v<T, ReadOnlyOp>) {
            return n.inner ? n.inner->kind() : OpKind::Replace;
        } else {
            return OpKind::Replace;
        }
    }, node);
}

bool Operation::is_container() const
{
    return is<RecordOp>() || is<FixedArrayOp>() || is<MapOp>() || is<SequenceOp>() || is<RefOp>();
}

// ============================================================
// Factories
// ============================================================

OperationPtr make_operation(Operation::Node node)
{
    return std::make_shared<const Operation>(Operation{std::move(node), nullptr, nullptr, nullptr});
}

OperationPtr make_value_op(Value old_value, Value new_value)
{
    return make_operation(ValueOp{std::move(old_value), std::move(new_value)});
}

OperationPtr make_record_op(std::string type, std::vector<std::pair<std::string, OperationPtr>> fields)
{
    std::erase_if(fields, [](const auto& f) { return !f.second; });
    if (fields.empty()) {
        return nullptr;
    }
    return make_operation(RecordOp{std::move(type), std::move(fields)});
}

OperationPtr make_fixed_array_op(std::vector<std::pair<std::size_t, OperationPtr>> indices)
{
    std::erase_if(indices, [](const auto& i) { return !i.second; });
    if (indices.empty()) {
        return nullptr;
    }
    std::stable_sort(indices.begin(), indices.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    return make_operation(FixedArrayOp{std::move(indices)});
}

OperationPtr make_map_op(MapOp op)
{
    std::erase_if(op.modified, [](const auto& m) { return !m.second; });
    if (op.added.empty() && op.removed.empty() && op.modified.empty()) {
        return nullptr;
    }
    auto by_key = [](const auto& a, const auto& b) { return a.first < b.first; };
    std::stable_sort(op.added.begin(), op.added.end(), by_key);
    std::stable_sort(op.removed.begin(), op.removed.end(), by_key);
    std::stable_sort(op.modified.begin(), op.modified.end(), by_key);
    return make_operation(std::move(op));
}

OperationPtr make_sequence_op(std::vector<SequenceEdit> edits, std::string key_field)
{
    if (edits.empty()) {
        return nullptr;
    }
    return make_operation(SequenceOp{std::move(edits), std::move(key_field)});
}

OperationPtr make_ref_op(RefKind kind, OperationPtr inner)
{
    if (!inner) {
        return nullptr;
    }
    return make_operation(RefOp{kind, std::move(inner)});
}

OperationPtr make_test_op(Value expected)
{
    return make_operation(TestOp{std::move(expected)});
}

OperationPtr make_copy_op(Path from, Value value, Value previous)
{
    return make_operation(CopyOp{std::move(from), std::move(value), std::move(previous)});
}

OperationPtr make_move_op(Path from, Value value)
{
    return make_operation(MoveOp{std::move(from), std::move(value)});
}

OperationPtr make_log_op(std::string message)
{
    return make_operation(LogOp{std::move(message)});
}

OperationPtr make_read_only_op(OperationPtr inner)
{
    if (!inner) {
        return nullptr;
    }
    return make_operation(ReadOnlyOp{std::move(inner)});
}

OperationPtr with_guards(const OperationPtr& op, ConditionPtr cond, ConditionPtr if_cond,
                         ConditionPtr unless_cond)
{
    if (!op) {
        return nullptr;
    }
    Operation copy = *op;
    copy.cond = std::move(cond);
    copy.if_cond = std::move(if_cond);
    copy.unless_cond = std::move(unless_cond);
    return std::make_shared<const Operation>(std::move(copy));
}

// ============================================================
// Equality
// ============================================================

namespace {

bool conditions_equal(const ConditionPtr& a, const ConditionPtr& b)
{
    if (a == b) return true;
    if (!a || !b) return false;
    return to_string(*a) == to_string(*b);
}

bool optional_values_equal(const std::optional<Value>& a, const std::optional<Value>& b)
{
    if (a.has_value() != b.has_value()) return false;
    return !a || deep_equal(*a, *b);
}

template <typename K, typename V, typename Eq>
bool pairs_equal(const std::vector<std::pair<K, V>>& a, const std::vector<std::pair<K, V>>& b, Eq eq)
{
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!(a[i].first == b[i].first) || !eq(a[i].second, b[i].second)) return false;
    }
    return true;
}

bool nodes_equal(const Operation::Node& na, const Operation::Node& nb)
{
    if (na.index() != nb.index()) {
        return false;
    }
    auto value_eq = [](const Value& x, const Value& y) { return deep_equal(x, y); };
    auto op_eq = [](const OperationPtr& x, const OperationPtr& y) { return operations_equal(x, y); };

    return std::visit([&](const auto& a) -> bool {
        using T = std::decay_t<decltype(a)>;
        const T& b = std::get<T>(nb);
        if constexpr (std::is_same_v<T, ValueOp>) {
            return deep_equal(a.old_value, b.old_value) && deep_equal(a.new_value, b.new_value);
        } else if constexpr (std::is_same_v<T, RecordOp>) {
            return a.type == b.type && pairs_equal(a.fields, b.fields, op_eq);
        } else if constexpr (std::is_same_v<T, FixedArrayOp>) {
            return pairs_equal(a.indices, b.indices, op_eq);
        } else if constexpr (std::is_same_v<T, MapOp>) {
            return pairs_equal(a.added, b.added, value_eq) && pairs_equal(a.removed, b.removed, value_eq) &&
                   pairs_equal(a.modified, b.modified, op_eq);
        } else if constexpr (std::is_same_v<T, SequenceOp>) {
            return a.key_field == b.key_field &&
                   std::equal(a.edits.begin(), a.edits.end(), b.edits.begin(), b.edits.end(), edits_equal);
        } else if constexpr (std::is_same_v<T, RefOp>) {
            return a.kind == b.kind && operations_equal(a.inner, b.inner);
        } else if constexpr (std::is_same_v<T, TestOp>) {
            return deep_equal(a.expected, b.expected);
        } else if constexpr (std::is_same_v<T, CopyOp>) {
            return a.from == b.from;
        } else if constexpr (std::is_same_v<T, MoveOp>) {
            return a.from == b.from;
        } else if constexpr (std::is_same_v<T, LogOp>) {
            return a.message == b.message;
        } else {
            return operations_equal(a.inner, b.inner);
        }
    }, na);
}

} // anonymous namespace

bool edits_equal(const SequenceEdit& a, const SequenceEdit& b)
{
    return a.kind == b.kind && a.index == b.index && a.from_index == b.from_index &&
           a.from_path == b.from_path && optional_values_equal(a.key, b.key) &&
           optional_values_equal(a.prev_key, b.prev_key) && optional_values_equal(a.value, b.value) &&
           operations_equal(a.sub, b.sub);
}

bool operations_equal(const OperationPtr& a, const OperationPtr& b)
{
    if (a == b) return true;
    if (!a || !b) return false;
    return conditions_equal(a->cond, b->cond) && conditions_equal(a->if_cond, b->if_cond) &&
           conditions_equal(a->unless_cond, b->unless_cond) && nodes_equal(a->node, b->node);
}

// ============================================================
// Inspection
// ============================================================

std::string_view variant_name(const Operation& op) noexcept
{
    static constexpr std::string_view names[] = {
        "value", "record", "fixed_array", "map", "sequence", "ref",
        "test", "copy", "move", "log", "read_only",
    };
    return names[op.node.index()];
}

std::optional<Value> proposed_value(const Operation& op)
{
    if (auto* v = op.get_if<ValueOp>()) return v->new_value;
    if (auto* c = op.get_if<CopyOp>()) return c->value;
    if (auto* m = op.get_if<MoveOp>()) return m->value;
    return std::nullopt;
}

namespace {

std::string pad(std::size_t indent)
{
    return std::string(indent * 2, ' ');
}

void format_guards(std::ostringstream& out, const Operation& op)
{
    if (op.cond) out << " when(" << to_string(*op.cond) << ")";
    if (op.if_cond) out << " if(" << to_string(*op.if_cond) << ")";
    if (op.unless_cond) out << " unless(" << to_string(*op.unless_cond) << ")";
}

void format_edit(std::ostringstream& out, const SequenceEdit& e, std::size_t indent)
{
    out << pad(indent);
    switch (e.kind) {
        case OpKind::Add:
            out << "+ [" << e.index << "]: " << value_to_string(e.value.value_or(Value{}));
            break;
        case OpKind::Remove:
            out << "- [" << e.index << "]";
            break;
        case OpKind::Replace:
            out << "  [" << e.index << "]: " << (e.sub ? format_operation(*e.sub, indent) : "<none>");
            break;
        case OpKind::Move:
            out << "> [" << e.index << "] <- [" << e.from_index << "]";
            if (e.sub) out << ": " << format_operation(*e.sub, indent);
            break;
        case OpKind::Copy:
            out << "& [" << e.index << "] <- " << path_to_pointer(e.from_path);
            break;
        default:
            out << "? [" << e.index << "]";
            break;
    }
    if (e.key) out << " key=" << value_to_string(*e.key);
    out << "\n";
}

} // anonymous namespace

std::string format_operation(const Operation& op, std::size_t indent)
{
    std::ostringstream out;
    std::visit([&](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, ValueOp>) {
            out << value_to_string(n.old_value) << " -> " << value_to_string(n.new_value);
        } else if constexpr (std::is_same_v<T, RecordOp>) {
            out << n.type << "{\n";
            for (const auto& [name, sub] : n.fields) {
                out << pad(indent + 1) << name << ": " << format_operation(*sub, indent + 1) << "\n";
            }
            out << pad(indent) << "}";
        } else if constexpr (std::is_same_v<T, FixedArrayOp>) {
            out << "Array{\n";
            for (const auto& [idx, sub] : n.indices) {
                out << pad(indent + 1) << "[" << idx << "]: " << format_operation(*sub, indent + 1) << "\n";
            }
            out << pad(indent) << "}";
        } else if constexpr (std::is_same_v<T, MapOp>) {
            out << "Map{\n";
            for (const auto& [key, v] : n.removed) {
                out << pad(indent + 1) << "- " << key << "\n";
            }
            for (const auto& [key, v] : n.added) {
                out << pad(indent + 1) << "+ " << key << ": " << value_to_string(v) << "\n";
            }
            for (const auto& [key, sub] : n.modified) {
                out << pad(indent + 1) << "  " << key << ": " << format_operation(*sub, indent + 1) << "\n";
            }
            out << pad(indent) << "}";
        } else if constexpr (std::is_same_v<T, SequenceOp>) {
            out << "Sequence{\n";
            for (const auto& e : n.edits) {
                format_edit(out, e, indent + 1);
            }
            out << pad(indent) << "}";
        } else if constexpr (std::is_same_v<T, RefOp>) {
            out << (n.kind == RefKind::Owned ? "&" : "Poly(") << format_operation(*n.inner, indent)
                << (n.kind == RefKind::Owned ? "" : ")");
        } else if constexpr (std::is_same_v<T, TestOp>) {
            out << "Test(" << value_to_string(n.expected) << ")";
        } else if constexpr (std::is_same_v<T, CopyOp>) {
            out << "Copy(" << path_to_pointer(n.from) << ")";
        } else if constexpr (std::is_same_v<T, MoveOp>) {
            out << "Move(" << path_to_pointer(n.from) << ")";
        } else if constexpr (std::is_same_v<T, LogOp>) {
            out << "Log(\"" << n.message << "\")";
        } else {
            out << "ReadOnly(" << format_operation(*n.inner, indent) << ")";
        }
    }, op.node);
    format_guards(out, op);
    return out.str();
}

} // namespace lager_delta
