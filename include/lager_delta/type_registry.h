// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_registry.h
/// @brief Per-record-type metadata: field order, field policies, custom differs.
///
/// A record Value only carries its type name. Everything the engine needs to
/// know about that type lives in a TypeRegistry that the caller owns and
/// passes to Differ, PatchBuilder and from_json_patch:
///
/// @code
///   TypeRegistry registry;
///   registry.register_type("User", {
///       {"ID",       FieldFlags::Key},
///       {"Name",     FieldFlags::None},
///       {"Cache",    FieldFlags::Ignore},
///       {"Created",  FieldFlags::ReadOnly},
///       {"Settings", FieldFlags::Atomic},
///   });
/// @endcode

#pragma once

#include "api.h"
#include "value.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lager_delta {

struct Operation;
using OperationPtr = std::shared_ptr<const Operation>;

enum class FieldFlags : uint8_t {
    None     = 0,
    Key      = 1 << 0,  ///< entity identity for keyed sequence alignment
    Ignore   = 1 << 1,  ///< never diffed, never patched
    ReadOnly = 1 << 2,  ///< diffed, but patches targeting it fail
    Atomic   = 1 << 3,  ///< compared as a whole, replaced as a whole
};

[[nodiscard]] constexpr FieldFlags operator|(FieldFlags a, FieldFlags b) noexcept {
    return static_cast<FieldFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr bool has_flag(FieldFlags flags, FieldFlags f) noexcept {
    return (static_cast<uint8_t>(flags) & static_cast<uint8_t>(f)) != 0;
}

struct FieldDescriptor {
    std::string name;
    FieldFlags flags = FieldFlags::None;
};

struct TypeDescriptor {
    std::string name;
    std::vector<FieldDescriptor> fields;

    [[nodiscard]] const FieldDescriptor* find_field(const std::string& field) const;

    /// Name of the first field flagged Key, if any.
    [[nodiscard]] std::optional<std::string> key_field() const;
};

/// Produces the change from @p a to @p b for one record type, or nullptr
/// when they are equal. Throwing aborts the surrounding diff.
using CustomDiffer = std::function<OperationPtr(const Value& a, const Value& b)>;

class LAGER_DELTA_API TypeRegistry {
public:
    /// Registers (or replaces) the descriptor of @p type.
    TypeRegistry& register_type(std::string type, std::vector<FieldDescriptor> fields);

    /// Registers a differ used instead of the structural record diff.
    TypeRegistry& register_differ(std::string type, CustomDiffer differ);

    [[nodiscard]] const TypeDescriptor* find(const std::string& type) const;
    [[nodiscard]] const CustomDiffer* find_differ(const std::string& type) const;

    /// Flags of @p field in @p type; None for unknown types or fields.
    [[nodiscard]] FieldFlags flags(const std::string& type, const std::string& field) const;

    /// Field names of @p rec: declaration order for registered types,
    /// ascending otherwise. Fields present in the value but undeclared
    /// follow the declared ones, ascending.
    [[nodiscard]] std::vector<std::string> field_order(const Record& rec) const;

    /// Value of the Key field of @p element when it is a record of a
    /// type declaring one.
    [[nodiscard]] std::optional<Value> key_of(const Value& element) const;

    [[nodiscard]] bool empty() const noexcept { return types_.empty(); }

private:
    std::unordered_map<std::string, TypeDescriptor> types_;
    std::unordered_map<std::string, CustomDiffer> differs_;
};

/// Field order for an optional registry (ascending names without one).
[[nodiscard]] LAGER_DELTA_API std::vector<std::string>
field_order(const TypeRegistry* registry, const Record& rec);

} // namespace lager_delta
