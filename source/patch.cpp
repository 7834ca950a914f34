// patch.cpp - Patch construction, walk and textual forms

#include <lager_delta/equal.h>
#include <lager_delta/patch.h>

#include <sstream>

namespace lager_delta {

Patch::Patch(OperationPtr root, ConditionPtr condition, bool strict, std::optional<Timestamp> timestamp)
    : root_(std::move(root))
    , condition_(std::move(condition))
    , strict_(strict)
    , timestamp_(std::move(timestamp))
{
}

Patch Patch::with_condition(ConditionPtr condition) const
{
    Patch p = *this;
    p.condition_ = std::move(condition);
    return p;
}

Patch Patch::with_strict(bool strict) const
{
    Patch p = *this;
    p.strict_ = strict;
    return p;
}

Patch Patch::with_timestamp(Timestamp ts) const
{
    Patch p = *this;
    p.timestamp_ = std::move(ts);
    return p;
}

// ============================================================
// Walk
// ============================================================

namespace {

using Visit = Patch::WalkUntilFn;

bool walk_node(const Operation& op, const Path& path, const Visit& fn);

bool walk_edit(const SequenceEdit& e, const Path& path, const Visit& fn)
{
    Path at = e.key ? child_path(path, key_string(*e.key)) : child_path(path, e.index);
    switch (e.kind) {
        case OpKind::Add:
            return fn(WalkEntry{at, OpKind::Add, Value{}, e.value.value_or(Value{}), std::nullopt});
        case OpKind::Remove:
            return fn(WalkEntry{at, OpKind::Remove, e.value.value_or(Value{}), Value{}, std::nullopt});
        case OpKind::Replace:
            return !e.sub || walk_node(*e.sub, at, fn);
        case OpKind::Move:
            if (!fn(WalkEntry{at, OpKind::Move, Value{}, Value{}, child_path(path, e.from_index)})) {
                return false;
            }
            return !e.sub || walk_node(*e.sub, at, fn);
        case OpKind::Copy:
            return fn(WalkEntry{at, OpKind::Copy, Value{}, e.value.value_or(Value{}), e.from_path});
        default:
            return true;
    }
}

bool walk_node(const Operation& op, const Path& path, const Visit& fn)
{
    return std::visit([&](const auto& n) -> bool {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, ValueOp>) {
            return fn(WalkEntry{path, op.kind(), n.old_value, n.new_value, std::nullopt});
        } else if constexpr (std::is_same_v<T, RecordOp>) {
            for (const auto& [name, sub] : n.fields) {
                if (!walk_node(*sub, child_path(path, name), fn)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, FixedArrayOp>) {
            for (const auto& [idx, sub] : n.indices) {
                if (!walk_node(*sub, child_path(path, idx), fn)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, MapOp>) {
            for (const auto& [key, v] : n.removed) {
                if (!fn(WalkEntry{child_path(path, key), OpKind::Remove, v, Value{}, std::nullopt})) return false;
            }
            for (const auto& [key, v] : n.added) {
                if (!fn(WalkEntry{child_path(path, key), OpKind::Add, Value{}, v, std::nullopt})) return false;
            }
            for (const auto& [key, sub] : n.modified) {
                if (!walk_node(*sub, child_path(path, key), fn)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, SequenceOp>) {
            for (const auto& e : n.edits) {
                if (!walk_edit(e, path, fn)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, RefOp> || std::is_same_v<T, ReadOnlyOp>) {
            return walk_node(*n.inner, path, fn);
        } else if constexpr (std::is_same_v<T, TestOp>) {
            return fn(WalkEntry{path, OpKind::Test, n.expected, n.expected, std::nullopt});
        } else if constexpr (std::is_same_v<T, CopyOp>) {
            return fn(WalkEntry{path, OpKind::Copy, n.previous, n.value, n.from});
        } else if constexpr (std::is_same_v<T, MoveOp>) {
            return fn(WalkEntry{path, OpKind::Move, Value{}, n.value, n.from});
        } else {
            return fn(WalkEntry{path, OpKind::Log, Value{}, Value{n.message}, std::nullopt});
        }
    }, op.node);
}

std::string where(const Path& path)
{
    return path.empty() ? "/" : path_to_pointer(path);
}

} // anonymous namespace

void Patch::walk(const WalkFn& fn) const
{
    walk_until([&](const WalkEntry& entry) {
        fn(entry);
        return true;
    });
}

bool Patch::walk_until(const WalkUntilFn& fn) const
{
    if (!root_) {
        return true;
    }
    return walk_node(*root_, Path{}, fn);
}

// ============================================================
// Textual forms
// ============================================================

std::string Patch::to_string() const
{
    std::ostringstream out;
    out << "Patch";
    if (condition_) {
        out << " if(" << lager_delta::to_string(*condition_) << ")";
    }
    if (timestamp_) {
        out << " @" << lager_delta::to_string(*timestamp_);
    }
    out << ": ";
    out << (root_ ? format_operation(*root_) : std::string("<empty>"));
    return out.str();
}

std::string Patch::summary() const
{
    std::ostringstream out;
    if (condition_) {
        out << "if " << lager_delta::to_string(*condition_) << "\n";
    }
    walk([&](const WalkEntry& e) {
        out << lager_delta::to_string(e.kind) << " " << where(e.path);
        switch (e.kind) {
            case OpKind::Add:
            case OpKind::Test:
                out << ": " << value_to_string(e.new_value);
                break;
            case OpKind::Replace:
                out << ": " << value_to_string(e.old_value) << " -> " << value_to_string(e.new_value);
                break;
            case OpKind::Move:
            case OpKind::Copy:
                out << " from " << where(e.from.value_or(Path{}));
                break;
            case OpKind::Log:
                out << ": " << e.new_value.as_string();
                break;
            case OpKind::Remove:
                break;
        }
        out << "\n";
    });
    return out.str();
}

} // namespace lager_delta
