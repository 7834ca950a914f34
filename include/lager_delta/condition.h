// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file condition.h
/// @brief Boolean predicates over a Value: the guard language of patches.
///
/// A Condition is an immutable expression tree. It is built either with the
/// fluent factories in namespace `cond`, or parsed from text:
///
/// @code
///   auto c1 = cond::all_of({cond::gt("/Value", 5), cond::defined("/Name")});
///   auto c2 = parse_condition("Value > 5 AND NOT (Name == 'locked')");
///   bool ok = evaluate(*c2, document);
/// @endcode
///
/// Evaluation resolves every path against the value it is given (the node's
/// current value for local conditions, the document root for if/unless
/// guards and global conditions).

#pragma once

#include "api.h"
#include "path.h"
#include "value.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lager_delta {

struct Condition;
using ConditionPtr = std::shared_ptr<const Condition>;

/// Evaluation failure: ordering incompatible kinds, unknown type name,
/// invalid regular expression.
class LAGER_DELTA_API ConditionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed condition text. fragment() is the offending token or input tail.
class LAGER_DELTA_API ConditionParseError : public std::runtime_error {
public:
    ConditionParseError(const std::string& message, std::string fragment)
        : std::runtime_error(message), fragment_(std::move(fragment)) {}

    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

private:
    std::string fragment_;
};

enum class CompareOp : uint8_t { Eq, Ne, Lt, Gt, Le, Ge };
enum class StringOp : uint8_t { Contains, Starts, Ends, Matches };

[[nodiscard]] LAGER_DELTA_API std::string_view to_string(CompareOp op) noexcept;
[[nodiscard]] LAGER_DELTA_API std::string_view to_string(StringOp op) noexcept;

// ============================================================
// Condition variants
// ============================================================

struct Compare {
    Path path;
    Value literal;
    CompareOp op = CompareOp::Eq;
    bool fold = false;
};

struct CompareFields {
    Path path1;
    Path path2;
    CompareOp op = CompareOp::Eq;
    bool fold = false;
};

struct Defined {
    Path path;
};

struct Undefined {
    Path path;
};

/// Kind names: string, number, boolean, object, array, null, undefined.
struct TypeOf {
    Path path;
    std::string type;
};

struct StringPredicate {
    Path path;
    std::string needle;
    StringOp op = StringOp::Contains;
    bool fold = false;
};

struct Membership {
    Path path;
    std::vector<Value> literals;
    bool fold = false;
};

struct And {
    std::vector<ConditionPtr> subs;
};

struct Or {
    std::vector<ConditionPtr> subs;
};

struct Not {
    ConditionPtr sub;
};

/// Prints its message with the evaluated value; always true.
struct Log {
    std::string message;
};

struct Condition {
    std::variant<Compare, CompareFields, Defined, Undefined, TypeOf,
                 StringPredicate, Membership, And, Or, Not, Log> node;
};

// ============================================================
// Evaluation and inspection
// ============================================================

/// @throws ConditionError
[[nodiscard]] LAGER_DELTA_API bool evaluate(const Condition& cond, const Value& root);

/// Every path the condition references, in tree order.
[[nodiscard]] LAGER_DELTA_API std::vector<Path> paths(const Condition& cond);

/// Copy of @p cond with @p prefix stripped from every path that starts with it.
[[nodiscard]] LAGER_DELTA_API ConditionPtr with_relative_prefix(const ConditionPtr& cond,
                                                                const Path& prefix);

/// Textual form accepted by parse_condition().
[[nodiscard]] LAGER_DELTA_API std::string to_string(const Condition& cond);

/// TypeOf classification of a resolved value (nullopt = undefined).
[[nodiscard]] LAGER_DELTA_API std::string type_name_of(const std::optional<Value>& v);

/// Recursive-descent parser.
///
/// Grammar (NOT > comparison > AND > OR):
///   expr       := and_expr ( OR and_expr )*
///   and_expr   := factor ( AND factor )*
///   factor     := NOT factor | '(' expr ')' | call | comparison | true | false
///   comparison := path op ( literal | path )
///   call       := name '(' path [ ',' literal ]* ')'
/// Paths are dotted/indexed identifiers (a.b[0]) or pointers (/a/b/0).
/// @throws ConditionParseError
[[nodiscard]] LAGER_DELTA_API ConditionPtr parse_condition(std::string_view text);

// ============================================================
// Fluent construction
// ============================================================

namespace cond {

[[nodiscard]] LAGER_DELTA_API ConditionPtr make(Condition c);

[[nodiscard]] LAGER_DELTA_API ConditionPtr compare(std::string_view path, CompareOp op, Value v, bool fold = false);
[[nodiscard]] LAGER_DELTA_API ConditionPtr eq(std::string_view path, Value v);
[[nodiscard]] LAGER_DELTA_API ConditionPtr ne(std::string_view path, Value v);
[[nodiscard]] LAGER_DELTA_API ConditionPtr gt(std::string_view path, Value v);
[[nodiscard]] LAGER_DELTA_API ConditionPtr lt(std::string_view path, Value v);
[[nodiscard]] LAGER_DELTA_API ConditionPtr ge(std::string_view path, Value v);
[[nodiscard]] LAGER_DELTA_API ConditionPtr le(std::string_view path, Value v);
[[nodiscard]] LAGER_DELTA_API ConditionPtr eq_fold(std::string_view path, Value v);
[[nodiscard]] LAGER_DELTA_API ConditionPtr ne_fold(std::string_view path, Value v);

[[nodiscard]] LAGER_DELTA_API ConditionPtr compare_fields(std::string_view path1, CompareOp op,
                                                          std::string_view path2, bool fold = false);
[[nodiscard]] LAGER_DELTA_API ConditionPtr eq_field(std::string_view path1, std::string_view path2);
[[nodiscard]] LAGER_DELTA_API ConditionPtr ne_field(std::string_view path1, std::string_view path2);
[[nodiscard]] LAGER_DELTA_API ConditionPtr gt_field(std::string_view path1, std::string_view path2);
[[nodiscard]] LAGER_DELTA_API ConditionPtr lt_field(std::string_view path1, std::string_view path2);

[[nodiscard]] LAGER_DELTA_API ConditionPtr defined(std::string_view path);
[[nodiscard]] LAGER_DELTA_API ConditionPtr undefined(std::string_view path);
[[nodiscard]] LAGER_DELTA_API ConditionPtr type_of(std::string_view path, std::string type);

[[nodiscard]] LAGER_DELTA_API ConditionPtr contains(std::string_view path, std::string needle, bool fold = false);
[[nodiscard]] LAGER_DELTA_API ConditionPtr starts_with(std::string_view path, std::string needle, bool fold = false);
[[nodiscard]] LAGER_DELTA_API ConditionPtr ends_with(std::string_view path, std::string needle, bool fold = false);
[[nodiscard]] LAGER_DELTA_API ConditionPtr matches(std::string_view path, std::string pattern, bool fold = false);

[[nodiscard]] LAGER_DELTA_API ConditionPtr in(std::string_view path, std::vector<Value> values, bool fold = false);

[[nodiscard]] LAGER_DELTA_API ConditionPtr log(std::string message);

[[nodiscard]] LAGER_DELTA_API ConditionPtr all_of(std::vector<ConditionPtr> subs);
[[nodiscard]] LAGER_DELTA_API ConditionPtr any_of(std::vector<ConditionPtr> subs);
[[nodiscard]] LAGER_DELTA_API ConditionPtr negate(ConditionPtr sub);

} // namespace cond

} // namespace lager_delta
