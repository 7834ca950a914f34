// equal.h - registry-aware deep equality

#pragma once

#include "api.h"
#include "value.h"

#include <string>

namespace lager_delta {

class TypeRegistry;

/// Deep structural equality.
///
/// Fields flagged Ignore in @p registry are skipped on both sides. Containers
/// that share their immer root (or boxes that share their node) are equal
/// without being visited. Kinds must match exactly: 1 and 1.0 differ.
[[nodiscard]] LAGER_DELTA_API bool deep_equal(const Value& a, const Value& b,
                                              const TypeRegistry* registry = nullptr);

/// Canonical string form of an entity key, used for ordering keyed inserts.
/// Strings are used verbatim; other values use value_to_string().
[[nodiscard]] LAGER_DELTA_API std::string key_string(const Value& key);

} // namespace lager_delta
