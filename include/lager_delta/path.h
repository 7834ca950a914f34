// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Locations inside a Value: parsing, formatting, resolve/set/erase.
///
/// A Path is a sequence of parts, each a field/key name or an index:
///   "/users/0/name"    ->  ["users", 0, "name"]   (JSON Pointer, ~1 = '/', ~0 = '~')
///   "users[0].name"    ->  ["users", 0, "name"]   (dotted, used by conditions)
///   ""                 ->  []                     (root)
///   "/"                ->  [""]                   (the empty key)
///   "/m/007"           ->  ["m", "007"]           (only canonical decimals are indices)
///
/// Resolution dereferences owned references and polymorphic containers
/// before every step, then steps into a record field, map entry or
/// vector/array element. Numeric parts address map entries by their decimal
/// key; numeric string parts address sequence elements.

#pragma once

#include "api.h"
#include "value.h"

#include <lager/lens.hpp>
#include <lager/lenses.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lager_delta {

class TypeRegistry;

/// Navigation failure: missing intermediate step, wrong container kind,
/// index out of range, or an undeclared field of a registered record.
class LAGER_DELTA_API PathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================
// Parsing and formatting
// ============================================================

/// Parse either syntax. Never throws; a malformed escape is kept literally.
[[nodiscard]] LAGER_DELTA_API Path parse_path(std::string_view text);

/// Parse RFC 6901 style pointer. A pointer without leading '/' is read as
/// relative segments ("a/b" == "/a/b").
[[nodiscard]] LAGER_DELTA_API Path parse_json_pointer(std::string_view pointer);

/// Canonical escaped pointer string; "" for the root.
[[nodiscard]] LAGER_DELTA_API std::string path_to_pointer(const Path& path);

/// Dotted form for diagnostics, e.g. ".users[0].name"; "/" for the root.
[[nodiscard]] LAGER_DELTA_API std::string path_to_string(const Path& path);

/// Escape one key for use inside a pointer ("~" -> "~0", "/" -> "~1").
[[nodiscard]] LAGER_DELTA_API std::string escape_key(std::string_view key);

/// Text of one part: the key, or the decimal index.
[[nodiscard]] LAGER_DELTA_API std::string part_to_string(const PathElement& elem);

// ============================================================
// Prefix helpers
// ============================================================

[[nodiscard]] LAGER_DELTA_API bool is_prefix(const Path& prefix, const Path& path);

/// Longest part-wise common prefix; empty for an empty input.
[[nodiscard]] LAGER_DELTA_API Path longest_common_prefix(const std::vector<Path>& paths);

/// @p path with @p prefix removed, or nullopt when it does not start with it.
[[nodiscard]] LAGER_DELTA_API std::optional<Path> strip_prefix(const Path& path, const Path& prefix);

/// @p path extended by one part.
[[nodiscard]] LAGER_DELTA_API Path child_path(const Path& path, PathElement elem);

/// Part-wise equality that treats index 3 and key "3" as the same part.
[[nodiscard]] LAGER_DELTA_API bool parts_equal(const PathElement& a, const PathElement& b);

// ============================================================
// Resolution and mutation
// ============================================================

/// Follow references: the referent of a non-empty ref, @p v otherwise.
[[nodiscard]] LAGER_DELTA_API const Value& deref(const Value& v);

/// One navigation step (references dereferenced first); nullopt if missing.
[[nodiscard]] LAGER_DELTA_API std::optional<Value> resolve_step(const Value& current,
                                                                const PathElement& elem);

/// Value at @p path, or nullopt when any step is missing. Never throws.
/// An empty reference at the end of the path resolves to null.
[[nodiscard]] LAGER_DELTA_API std::optional<Value> resolve(const Value& root, const Path& path);

/// New root with @p value stored at @p path.
///
/// Null values and empty references along the way are replaced by a map
/// (next part is a key) or a vector (next part is an index). An index equal
/// to a vector's size, or the key "-", appends. Fixed arrays never grow.
/// @throws PathError
[[nodiscard]] LAGER_DELTA_API Value set_at(const Value& root, const Path& path, Value value,
                                           const TypeRegistry* registry = nullptr);

/// New root with @p path removed: map entries and vector elements are
/// erased; record fields, fixed-array slots and reference targets become
/// null/empty.
/// @throws PathError when the location does not exist
[[nodiscard]] LAGER_DELTA_API Value erase_at(const Value& root, const Path& path);

// ============================================================
// Lens integration
// ============================================================

using LagerValueLens = lager::lens<Value, Value>;

/// Lens over @p path: view = resolve (null when missing), set = set_at.
/// Usable with lager::view / lager::set / lager::over.
[[nodiscard]] LAGER_DELTA_API LagerValueLens path_lens(const Path& path);

template <typename Fn>
[[nodiscard]] Value update_at(const Value& root, const Path& path, Fn&& fn)
{
    return lager::over(path_lens(path), root, std::forward<Fn>(fn));
}

} // namespace lager_delta
