// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_patch.h
/// @brief RFC 6902 style wire form of a Patch, with guard predicates.
///
/// Each operation is an object
///   {"op": add|remove|replace|move|copy|test|log, "path": ptr,
///    "value"?: v, "from"?: ptr, "if"?: pred, "unless"?: pred}
///
/// Paths are exact when the operations are applied one after another, as
/// JSON Patch requires: sequence edits are emitted with a running index
/// shift. Guards of container operations are folded into the guards of
/// every operation emitted below them.
///
/// Conditions that are not attached to a single operation use a test
/// without a value:
///   {"op":"test","path":"","if":pred}      global condition of the patch
///   {"op":"test","path":"/a","if":pred}    local condition of the node at /a,
///                                          pred paths relative to /a
///
/// Predicates follow the JSON Patch predicate draft:
///   {"op":"test","path":"/x","value":5}                 x == 5
///   {"op":"test-","path":"/x","value":"a"}              case-folded ==
///   {"op":"less"|"more","path":"/x","value":5}          x < 5, x > 5
///   {"op":"defined"|"undefined","path":"/x"}
///   {"op":"type","path":"/x","value":"string"}
///   {"op":"contains"|"starts"|"ends" [-],"path":"/x","value":"s"}
///   {"op":"matches","path":"/x","value":"^a","ignoreCase":true}
///   {"op":"in" [-],"path":"/x","value":[...]}
///   {"op":"compare","path":"/x","from":"/y","value":"<","ignoreCase":false}
///   {"op":"and"|"or"|"not","apply":[...]}
///   {"op":"log","value":"message"}
/// != is written as not[test], <= as or[less,test], >= as or[more,test].

#pragma once

#include "api.h"
#include "condition.h"
#include "patch.h"
#include "type_registry.h"
#include "value.h"

#include <stdexcept>
#include <string>
#include <string_view>

namespace lager_delta {

/// Malformed wire document (not JSON, wrong shape, unknown op).
class LAGER_DELTA_API JsonPatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The operation list as a Value (vector of maps).
[[nodiscard]] LAGER_DELTA_API Value to_json_patch_value(const Patch& patch);

/// The operation list as JSON text.
[[nodiscard]] LAGER_DELTA_API std::string to_json_patch(const Patch& patch, bool compact = true);

/// Rebuild a Patch from JSON Patch text.
///
/// The operations are replayed through a PatchBuilder over @p shape, the
/// value the patch is meant for: old values are taken from it, and values
/// are conformed to its record types, reference kinds and number kinds.
/// @throws JsonPatchError, PathError
[[nodiscard]] LAGER_DELTA_API Patch from_json_patch(std::string_view text, const Value& shape,
                                                    const TypeRegistry* registry = nullptr);

/// Predicate object of one condition.
[[nodiscard]] LAGER_DELTA_API Value condition_to_predicate(const Condition& cond);

/// @throws JsonPatchError
[[nodiscard]] LAGER_DELTA_API ConditionPtr predicate_to_condition(const Value& predicate);

/// @p value reshaped after @p shape: maps become records of the shape's
/// record type, references are re-wrapped, numbers take the shape's kind.
[[nodiscard]] LAGER_DELTA_API Value conform_to_shape(const Value& value, const Value& shape);

} // namespace lager_delta
