// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file operation.h
/// @brief The operation tree: a typed change set mirroring the shape of a Value.
///
/// One Operation describes the change to one location. Containers nest:
///
///   Value{Name:"v1", Options:["a","b"]}  ->  Value{Name:"v2", Options:["a","c"]}
///
///   RecordOp Config
///     Name    : ValueOp "v1" -> "v2"
///     Options : SequenceOp [ Replace 1 : ValueOp "b" -> "c" ]
///
/// Container operations (record, fixed array, map, sequence) are never empty;
/// the make_* factories return nullptr for an empty change set so that "no
/// change" is always represented by a null OperationPtr.

#pragma once

#include "api.h"
#include "condition.h"
#include "path.h"
#include "value.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lager_delta {

struct Operation;
using OperationPtr = std::shared_ptr<const Operation>;

/// Kind of a flattened change, as reported by walk() and to resolvers.
enum class OpKind : uint8_t {
    Add,
    Remove,
    Replace,
    Move,
    Copy,
    Test,
    Log,
};

[[nodiscard]] LAGER_DELTA_API std::string_view to_string(OpKind kind) noexcept;

// ============================================================
// Sequence edit script
// ============================================================

/// One step of a sequence edit script.
///
/// Indices are coordinates in the source sequence:
/// - Add, Move and Copy insert before source element `index` (== size appends)
/// - Remove and Replace address source element `index`
/// - Move takes source element `from_index`
///
/// Several inserts at one index land in script order.
struct SequenceEdit {
    OpKind kind = OpKind::Add;
    std::size_t index = 0;
    std::size_t from_index = 0;
    Path from_path;                  ///< Copy source, resolved against the root
    std::optional<Value> key;        ///< entity key (keyed sequences)
    std::optional<Value> prev_key;   ///< key of the target predecessor; null = head
    std::optional<Value> value;      ///< Add: inserted, Remove: removed, Copy: copied
    OperationPtr sub;                ///< Replace/Move: change applied to the element
};

// ============================================================
// Operation variants
// ============================================================

/// Whole-value replacement. An empty side (null or empty reference) makes
/// it an add or a remove.
struct ValueOp {
    Value old_value;
    Value new_value;
};

/// Per-field changes of one record, in field declaration order.
struct RecordOp {
    std::string type;
    std::vector<std::pair<std::string, OperationPtr>> fields;
};

/// Per-slot changes of a fixed-size array, ascending index.
struct FixedArrayOp {
    std::vector<std::pair<std::size_t, OperationPtr>> indices;
};

/// Key-partitioned change set of a map, each part sorted by key.
struct MapOp {
    std::vector<std::pair<std::string, Value>> added;
    std::vector<std::pair<std::string, Value>> removed;
    std::vector<std::pair<std::string, OperationPtr>> modified;
};

/// Edit script of a dynamic sequence. key_field is set when the elements
/// were aligned by entity key.
struct SequenceOp {
    std::vector<SequenceEdit> edits;
    std::string key_field;
};

/// Change inside the referent of an owned reference or polymorphic
/// container. Applying to an empty reference allocates the referent.
struct RefOp {
    RefKind kind = RefKind::Owned;
    OperationPtr inner;
};

/// Asserts the current value without changing it.
struct TestOp {
    Value expected;
};

/// Stores the value found at `from` (in the root before the patch).
/// `value` and `previous` are snapshots of the copied value and of what the
/// target held; they make the copy reversible.
struct CopyOp {
    Path from;
    Value value;
    Value previous;
};

/// Like CopyOp, then removes `from` once the whole patch has been applied.
struct MoveOp {
    Path from;
    Value value;
};

/// Prints a message; never changes anything.
struct LogOp {
    std::string message;
};

/// Wraps the change of a read-only field. Applying anything but a log
/// operation through it fails.
struct ReadOnlyOp {
    OperationPtr inner;
};

struct Operation {
    using Node = std::variant<ValueOp,
                              RecordOp,
                              FixedArrayOp,
                              MapOp,
                              SequenceOp,
                              RefOp,
                              TestOp,
                              CopyOp,
                              MoveOp,
                              LogOp,
                              ReadOnlyOp>;

    Node node;
    ConditionPtr cond;         ///< must hold for the node's current value
    ConditionPtr if_cond;      ///< evaluated against the root; false = skip
    ConditionPtr unless_cond;  ///< evaluated against the root; true = skip

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&node); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(node); }

    [[nodiscard]] bool has_guards() const noexcept {
        return cond || if_cond || unless_cond;
    }

    /// Add/Remove/Replace for ValueOp, the obvious kind for leaves,
    /// Replace for containers.
    [[nodiscard]] LAGER_DELTA_API OpKind kind() const;

    /// True for record, fixed array, map, sequence and reference nodes.
    [[nodiscard]] LAGER_DELTA_API bool is_container() const;
};

// ============================================================
// Factories
// ============================================================

[[nodiscard]] LAGER_DELTA_API OperationPtr make_operation(Operation::Node node);

[[nodiscard]] LAGER_DELTA_API OperationPtr make_value_op(Value old_value, Value new_value);

/// nullptr when @p fields is empty.
[[nodiscard]] LAGER_DELTA_API OperationPtr
make_record_op(std::string type, std::vector<std::pair<std::string, OperationPtr>> fields);

/// nullptr when @p indices is empty.
[[nodiscard]] LAGER_DELTA_API OperationPtr
make_fixed_array_op(std::vector<std::pair<std::size_t, OperationPtr>> indices);

/// Sorts every part by key; nullptr when all parts are empty.
[[nodiscard]] LAGER_DELTA_API OperationPtr make_map_op(MapOp op);

/// nullptr when @p edits is empty.
[[nodiscard]] LAGER_DELTA_API OperationPtr make_sequence_op(std::vector<SequenceEdit> edits,
                                                            std::string key_field = {});

/// nullptr when @p inner is null.
[[nodiscard]] LAGER_DELTA_API OperationPtr make_ref_op(RefKind kind, OperationPtr inner);

[[nodiscard]] LAGER_DELTA_API OperationPtr make_test_op(Value expected);
[[nodiscard]] LAGER_DELTA_API OperationPtr make_copy_op(Path from, Value value = {}, Value previous = {});
[[nodiscard]] LAGER_DELTA_API OperationPtr make_move_op(Path from, Value value = {});
[[nodiscard]] LAGER_DELTA_API OperationPtr make_log_op(std::string message);

/// nullptr when @p inner is null.
[[nodiscard]] LAGER_DELTA_API OperationPtr make_read_only_op(OperationPtr inner);

/// Copy of @p op with the given guards (null arguments keep nothing).
[[nodiscard]] LAGER_DELTA_API OperationPtr with_guards(const OperationPtr& op,
                                                       ConditionPtr cond,
                                                       ConditionPtr if_cond,
                                                       ConditionPtr unless_cond);

// ============================================================
// Inspection
// ============================================================

/// Structural equality of two trees, guards compared by their text.
[[nodiscard]] LAGER_DELTA_API bool operations_equal(const OperationPtr& a, const OperationPtr& b);

[[nodiscard]] LAGER_DELTA_API bool edits_equal(const SequenceEdit& a, const SequenceEdit& b);

/// Indented multi-line rendering (Patch::to_string).
[[nodiscard]] LAGER_DELTA_API std::string format_operation(const Operation& op, std::size_t indent = 0);

/// Kind name of the variant ("value", "record", "map", ...); the codec
/// registers encoders under these names.
[[nodiscard]] LAGER_DELTA_API std::string_view variant_name(const Operation& op) noexcept;

/// Value written at the node's location, for leaf nodes that have one.
[[nodiscard]] LAGER_DELTA_API std::optional<Value> proposed_value(const Operation& op);

} // namespace lager_delta
