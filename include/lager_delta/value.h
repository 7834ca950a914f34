// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief The immutable document model every diff, patch and merge works on.
///
/// A Value can represent:
/// - Scalars: int32, int64, uint64, float, double, bool, string
/// - Associative maps with string keys (immer::map)
/// - Dynamic arrays (immer::vector) and fixed arrays (immer::array)
/// - Records: a type name plus named fields, described by a TypeRegistry
/// - References: an owned pointer or a polymorphic container, possibly empty
/// - Null (std::monostate)
///
/// All containers are persistent. Updating a Value returns a new Value that
/// shares every untouched node with the old one, so a snapshot can never be
/// changed through an alias and copying is O(1).
///
/// The Value type is templated on an immer memory policy; Value uses the
/// single-threaded one.

#pragma once

#include "config.h"
#include "api.h"
#include "value_fwd.h"

#include <immer/array.hpp>
#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lager_delta {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if lager_delta_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if lager_delta_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if lager_delta_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                  BasicValueBox<MemoryPolicy>,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>,
                                        MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueArray = immer::array<BasicValueBox<MemoryPolicy>,
                                      MemoryPolicy>;

/// @brief A typed aggregate: the type name selects a TypeDescriptor.
template <typename MemoryPolicy>
struct BasicRecord {
    std::string type;
    BasicValueMap<MemoryPolicy> fields;

    bool operator==(const BasicRecord& other) const {
        return type == other.type && fields == other.fields;
    }
};

template <typename MemoryPolicy>
using BasicRecordBox = immer::box<BasicRecord<MemoryPolicy>, MemoryPolicy>;

/// @brief What a reference slot holds.
/// Owned: a plain pointer to one concrete value.
/// Polymorphic: an interface-like container whose concrete kind may vary.
enum class RefKind : uint8_t {
    Owned,
    Polymorphic,
};

/// @brief A pointer-like slot. An empty target means "absent" (nil).
template <typename MemoryPolicy>
struct BasicRef {
    RefKind kind = RefKind::Owned;
    std::optional<BasicValueBox<MemoryPolicy>> target;

    bool operator==(const BasicRef& other) const {
        if (kind != other.kind || target.has_value() != other.target.has_value()) {
            return false;
        }
        return !target || target->get() == other.target->get();
    }
};

using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

/// @brief Byte buffer type for binary serialization
using ByteBuffer  = std::vector<uint8_t>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;
    using value_array   = BasicValueArray<MemoryPolicy>;
    using record        = BasicRecord<MemoryPolicy>;
    using boxed_record  = BasicRecordBox<MemoryPolicy>;
    using value_ref     = BasicRef<MemoryPolicy>;

    std::variant<int32_t,
                 int64_t,
                 uint64_t,
                 float,
                 double,
                 bool,
                 std::string,
                 value_map,
                 value_vector,
                 value_array,
                 boxed_record,
                 value_ref,
                 std::monostate>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(int32_t v) noexcept : data(v) {}
    constexpr BasicValue(int64_t v) noexcept : data(v) {}
    constexpr BasicValue(uint64_t v) noexcept : data(v) {}
    constexpr BasicValue(float v) noexcept : data(v) {}
    constexpr BasicValue(double v) noexcept : data(v) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(value_vector v) : data(std::move(v)) {}
    BasicValue(value_array v) : data(std::move(v)) {}
    BasicValue(boxed_record v) : data(std::move(v)) {}
    BasicValue(record v) : data(boxed_record{std::move(v)}) {}
    BasicValue(value_ref v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(const std::vector<BasicValue>& items) {
        auto t = value_vector{}.transient();
        for (const auto& val : items) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue array(std::initializer_list<BasicValue> init) {
        value_array result;
        for (const auto& val : init) {
            result = std::move(result).push_back(value_box{val});
        }
        return BasicValue{std::move(result)};
    }

    static BasicValue make_record(std::string type,
                                  std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{record{std::move(type), t.persistent()}};
    }

    static BasicValue make_record(std::string type, value_map fields) {
        return BasicValue{record{std::move(type), std::move(fields)}};
    }

    /// Owned reference to @p target.
    static BasicValue ref(BasicValue target) {
        return BasicValue{value_ref{RefKind::Owned, value_box{std::move(target)}}};
    }

    /// Empty owned reference (nil pointer).
    static BasicValue null_ref() {
        return BasicValue{value_ref{RefKind::Owned, std::nullopt}};
    }

    /// Polymorphic container holding @p target.
    static BasicValue poly(BasicValue target) {
        return BasicValue{value_ref{RefKind::Polymorphic, value_box{std::move(target)}}};
    }

    /// Empty polymorphic container (nil interface).
    static BasicValue empty_poly() {
        return BasicValue{value_ref{RefKind::Polymorphic, std::nullopt}};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_array>(); }
    [[nodiscard]] bool is_record() const noexcept { return is<boxed_record>(); }
    [[nodiscard]] bool is_ref() const noexcept { return is<value_ref>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }

    [[nodiscard]] bool is_integer() const noexcept {
        return is<int32_t>() || is<int64_t>() || is<uint64_t>();
    }

    [[nodiscard]] bool is_number() const noexcept {
        return is_integer() || is<float>() || is<double>();
    }

    /// Null, or a reference slot without a target.
    [[nodiscard]] bool is_empty() const noexcept {
        if (is_null()) return true;
        if (auto* r = get_if<value_ref>()) return !r->target.has_value();
        return false;
    }

    [[nodiscard]] const record* get_record() const {
        if (auto* r = get_if<boxed_record>()) return &r->get();
        return nullptr;
    }

    [[nodiscard]] std::string record_type() const {
        if (auto* r = get_record()) return r->type;
        return {};
    }

    [[nodiscard]] const BasicValue* ref_target() const {
        if (auto* r = get_if<value_ref>()) {
            if (r->target) return &r->target->get();
        }
        return nullptr;
    }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        if (auto* r = get_record()) {
            if (auto* found = r->fields.find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        if (auto* a = get_if<value_array>()) {
            if (index < a->size()) return (*a)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    template<typename T>
    [[nodiscard]] T get_or(T default_val = T{}) const {
        if (auto* ptr = get_if<T>()) return *ptr;
        return default_val;
    }

    [[nodiscard]] int as_int(int default_val = 0) const {
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    /// Any numeric alternative widened to double.
    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<float>()) return static_cast<double>(*p);
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        if (auto* p = get_if<int32_t>()) return static_cast<double>(*p);
        if (auto* p = get_if<uint64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) return index < v->size();
        if (auto* a = get_if<value_array>()) return index < a->size();
        return false;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        if (auto* r = get_record()) {
            return record{r->type, r->fields.set(key, value_box{std::move(val)})};
        }
        detail::log_key_error("Value::set", key, "cannot set on non-map type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->set(index, value_box{std::move(val)});
        }
        if (auto* a = get_if<value_array>()) {
            if (index < a->size()) {
                return a->update(index, [&val](const value_box&) { return value_box{std::move(val)}; });
            }
        }
        detail::log_index_error("Value::set", index, "cannot set on non-vector type");
        return *this;
    }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key);
        if (auto* r = get_record()) return r->fields.count(key);
        return 0;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        if (auto* a = get_if<value_array>()) return a->size();
        if (auto* r = get_record()) return r->fields.size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

// ============================================================
// Value - the default document type (single-threaded)
//
// Sharing a Value tree across threads without external locking is UB.
// Replica guards its document with a mutex; everything else in
// lager_delta is a pure function of its arguments.
// ============================================================
using Value       = BasicValue<unsafe_memory_policy>;
using ValueBox    = BasicValueBox<unsafe_memory_policy>;
using ValueMap    = BasicValueMap<unsafe_memory_policy>;
using ValueVector = BasicValueVector<unsafe_memory_policy>;
using ValueArray  = BasicValueArray<unsafe_memory_policy>;
using Record      = BasicRecord<unsafe_memory_policy>;
using RecordBox   = BasicRecordBox<unsafe_memory_policy>;
using ValueRef    = BasicRef<unsafe_memory_policy>;

/// Structural equality. Boxes compare by content, so this is a deep
/// comparison; use deep_equal() (equal.h) to honour ignored fields.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Short human-readable rendering: strings quoted, containers summarised.
[[nodiscard]] LAGER_DELTA_API std::string value_to_string(const Value& val);

/// Kind name used in error messages ("int", "string", "map", "record Foo", ...)
[[nodiscard]] LAGER_DELTA_API std::string kind_name(const Value& val);

/// Keys of @p map in ascending order (immer::map iteration order is unspecified).
[[nodiscard]] LAGER_DELTA_API std::vector<std::string> sorted_keys(const ValueMap& map);

/// Print Value with indentation
LAGER_DELTA_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

// ============================================================
// Extern Template Declarations
//
// The instantiations live in value.cpp.
// ============================================================

LAGER_DELTA_EXTERN_TEMPLATE struct BasicValue<unsafe_memory_policy>;

} // namespace lager_delta
