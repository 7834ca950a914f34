// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file condition.cpp
/// @brief Condition evaluation, inspection and fluent factories.

#include <lager_delta/condition.h>
#include <lager_delta/equal.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <regex>

namespace lager_delta {

std::string_view to_string(CompareOp op) noexcept
{
    switch (op) {
        case CompareOp::Eq: return "==";
        case CompareOp::Ne: return "!=";
        case CompareOp::Lt: return "<";
        case CompareOp::Gt: return ">";
        case CompareOp::Le: return "<=";
        case CompareOp::Ge: return ">=";
    }
    return "==";
}

std::string_view to_string(StringOp op) noexcept
{
    switch (op) {
        case StringOp::Contains: return "contains";
        case StringOp::Starts:   return "starts";
        case StringOp::Ends:     return "ends";
        case StringOp::Matches:  return "matches";
    }
    return "contains";
}

namespace {

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Signed magnitude representation so int64 and uint64 compare exactly.
struct Integer {
    bool negative = false;
    uint64_t magnitude = 0;
};

Integer to_integer(const Value& v)
{
    if (auto* p = v.get_if<int32_t>()) {
        return {*p < 0, *p < 0 ? static_cast<uint64_t>(-static_cast<int64_t>(*p)) : static_cast<uint64_t>(*p)};
    }
    if (auto* p = v.get_if<int64_t>()) {
        if (*p < 0) {
            return {true, static_cast<uint64_t>(-(*p + 1)) + 1};
        }
        return {false, static_cast<uint64_t>(*p)};
    }
    return {false, v.get_or<uint64_t>(0)};
}

int compare_integers(const Integer& a, const Integer& b)
{
    if (a.negative != b.negative) {
        if (a.magnitude == 0 && b.magnitude == 0) return 0;
        return a.negative ? -1 : 1;
    }
    int sign = a.negative ? -1 : 1;
    if (a.magnitude == b.magnitude) return 0;
    return a.magnitude < b.magnitude ? -sign : sign;
}

bool apply_ordering(int cmp, CompareOp op)
{
    switch (op) {
        case CompareOp::Eq: return cmp == 0;
        case CompareOp::Ne: return cmp != 0;
        case CompareOp::Lt: return cmp < 0;
        case CompareOp::Gt: return cmp > 0;
        case CompareOp::Le: return cmp <= 0;
        case CompareOp::Ge: return cmp >= 0;
    }
    return false;
}

bool is_equality(CompareOp op)
{
    return op == CompareOp::Eq || op == CompareOp::Ne;
}

bool is_absent(const std::optional<Value>& v)
{
    return !v || v->is_empty();
}

bool compare_values(const std::optional<Value>& lhs, const std::optional<Value>& rhs,
                    CompareOp op, bool fold)
{
    if (is_absent(lhs) || is_absent(rhs)) {
        bool both = is_absent(lhs) && is_absent(rhs);
        if (op == CompareOp::Eq) return both;
        if (op == CompareOp::Ne) return !both;
        return false;
    }

    const Value& a = deref(*lhs);
    const Value& b = deref(*rhs);

    if (a.is_integer() && b.is_integer()) {
        return apply_ordering(compare_integers(to_integer(a), to_integer(b)), op);
    }
    if (a.is_number() && b.is_number()) {
        double x = a.as_number();
        double y = b.as_number();
        int cmp = x < y ? -1 : (x > y ? 1 : 0);
        if (x != x || y != y) {
            // NaN only satisfies !=
            return op == CompareOp::Ne;
        }
        return apply_ordering(cmp, op);
    }
    if (a.is_string() && b.is_string()) {
        std::string x = a.as_string();
        std::string y = b.as_string();
        if (fold) {
            x = lower(std::move(x));
            y = lower(std::move(y));
        }
        return apply_ordering(x.compare(y) < 0 ? -1 : (x == y ? 0 : 1), op);
    }
    if (a.data.index() == b.data.index()) {
        if (!is_equality(op)) {
            throw ConditionError("ordering operator " + std::string(to_string(op)) +
                                 " is not defined for " + kind_name(a));
        }
        bool equal = deep_equal(a, b);
        return op == CompareOp::Eq ? equal : !equal;
    }

    if (is_equality(op)) {
        return op == CompareOp::Ne;
    }
    throw ConditionError("cannot compare " + kind_name(a) + " with " + kind_name(b) +
                         " using " + std::string(to_string(op)));
}

bool is_known_type_name(const std::string& type)
{
    static const char* const names[] = {"string", "number", "boolean", "object",
                                        "array", "null", "undefined"};
    return std::find(std::begin(names), std::end(names), type) != std::end(names);
}

bool evaluate_string_predicate(const StringPredicate& p, const Value& root)
{
    auto target = resolve(root, p.path);
    if (!target || !target->is_string()) {
        return false;
    }
    std::string haystack = target->as_string();

    if (p.op == StringOp::Matches) {
        try {
            auto flags = std::regex::ECMAScript;
            if (p.fold) {
                flags |= std::regex::icase;
            }
            std::regex re(p.needle, flags);
            return std::regex_search(haystack, re);
        } catch (const std::regex_error& e) {
            throw ConditionError("invalid regular expression '" + p.needle + "': " + e.what());
        }
    }

    std::string needle = p.needle;
    if (p.fold) {
        haystack = lower(std::move(haystack));
        needle = lower(std::move(needle));
    }
    switch (p.op) {
        case StringOp::Contains:
            return haystack.find(needle) != std::string::npos;
        case StringOp::Starts:
            return haystack.size() >= needle.size() &&
                   haystack.compare(0, needle.size(), needle) == 0;
        case StringOp::Ends:
            return haystack.size() >= needle.size() &&
                   haystack.compare(haystack.size() - needle.size(), needle.size(), needle) == 0;
        case StringOp::Matches:
            break;
    }
    return false;
}

} // anonymous namespace

std::string type_name_of(const std::optional<Value>& v)
{
    if (!v) return "undefined";
    const Value& d = deref(*v);
    if (d.is_empty()) return "null";
    if (d.is_string()) return "string";
    if (d.is_number()) return "number";
    if (d.is_bool()) return "boolean";
    if (d.is_record() || d.is_map()) return "object";
    if (d.is_vector() || d.is_array()) return "array";
    return "undefined";
}

bool evaluate(const Condition& cond, const Value& root)
{
    return std::visit([&](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, Compare>) {
            return compare_values(resolve(root, c.path), c.literal, c.op, c.fold);
        } else if constexpr (std::is_same_v<T, CompareFields>) {
            return compare_values(resolve(root, c.path1), resolve(root, c.path2), c.op, c.fold);
        } else if constexpr (std::is_same_v<T, Defined>) {
            auto v = resolve(root, c.path);
            return v && !v->is_empty();
        } else if constexpr (std::is_same_v<T, Undefined>) {
            auto v = resolve(root, c.path);
            return !v || v->is_empty();
        } else if constexpr (std::is_same_v<T, TypeOf>) {
            if (!is_known_type_name(c.type)) {
                throw ConditionError("unknown type name: " + c.type);
            }
            return type_name_of(resolve(root, c.path)) == c.type;
        } else if constexpr (std::is_same_v<T, StringPredicate>) {
            return evaluate_string_predicate(c, root);
        } else if constexpr (std::is_same_v<T, Membership>) {
            auto target = resolve(root, c.path);
            return std::any_of(c.literals.begin(), c.literals.end(), [&](const Value& lit) {
                return compare_values(target, lit, CompareOp::Eq, c.fold);
            });
        } else if constexpr (std::is_same_v<T, And>) {
            for (const auto& sub : c.subs) {
                if (!evaluate(*sub, root)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, Or>) {
            for (const auto& sub : c.subs) {
                if (evaluate(*sub, root)) return true;
            }
            return false;
        } else if constexpr (std::is_same_v<T, Not>) {
            return !evaluate(*c.sub, root);
        } else {
            std::cout << "[condition] " << c.message << " (value: " << value_to_string(root) << ")\n";
            return true;
        }
    }, cond.node);
}

std::vector<Path> paths(const Condition& cond)
{
    std::vector<Path> out;
    std::visit([&](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, CompareFields>) {
            out.push_back(c.path1);
            out.push_back(c.path2);
        } else if constexpr (std::is_same_v<T, And> || std::is_same_v<T, Or>) {
            for (const auto& sub : c.subs) {
                auto sub_paths = paths(*sub);
                out.insert(out.end(), sub_paths.begin(), sub_paths.end());
            }
        } else if constexpr (std::is_same_v<T, Not>) {
            out = paths(*c.sub);
        } else if constexpr (std::is_same_v<T, Log>) {
            // no paths
        } else {
            out.push_back(c.path);
        }
    }, cond.node);
    return out;
}

ConditionPtr with_relative_prefix(const ConditionPtr& cond, const Path& prefix)
{
    if (!cond || prefix.empty()) {
        return cond;
    }
    auto strip = [&](const Path& p) { return strip_prefix(p, prefix).value_or(p); };

    Condition copy = *cond;
    std::visit([&](auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, CompareFields>) {
            c.path1 = strip(c.path1);
            c.path2 = strip(c.path2);
        } else if constexpr (std::is_same_v<T, And> || std::is_same_v<T, Or>) {
            for (auto& sub : c.subs) {
                sub = with_relative_prefix(sub, prefix);
            }
        } else if constexpr (std::is_same_v<T, Not>) {
            c.sub = with_relative_prefix(c.sub, prefix);
        } else if constexpr (std::is_same_v<T, Log>) {
        } else {
            c.path = strip(c.path);
        }
    }, copy.node);
    return std::make_shared<const Condition>(std::move(copy));
}

// ============================================================
// Textual form
// ============================================================

namespace {

std::string quote(const std::string& s)
{
    std::string out = "'";
    for (char ch : s) {
        if (ch == '\'' || ch == '\\') out += '\\';
        out += ch;
    }
    return out + "'";
}

std::string literal_text(const Value& v)
{
    if (v.is_null()) return "null";
    if (v.is_string()) return quote(v.as_string());
    if (v.is_bool()) return v.as_bool() ? "true" : "false";
    return value_to_string(v);
}

std::string path_text(const Path& p)
{
    return p.empty() ? "/" : path_to_pointer(p);
}

/// Case-folding comparisons have no operator spelling: eqi(, nei(, lti( ...
std::string folded_call(CompareOp op)
{
    switch (op) {
        case CompareOp::Eq: return "eqi(";
        case CompareOp::Ne: return "nei(";
        case CompareOp::Lt: return "lti(";
        case CompareOp::Gt: return "gti(";
        case CompareOp::Le: return "lei(";
        case CompareOp::Ge: return "gei(";
    }
    return "eqi(";
}

} // anonymous namespace

std::string to_string(const Condition& cond)
{
    return std::visit([&](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Compare>) {
            if (c.fold) {
                return folded_call(c.op) + path_text(c.path) + ", " + literal_text(c.literal) + ")";
            }
            return path_text(c.path) + " " + std::string(to_string(c.op)) + " " + literal_text(c.literal);
        } else if constexpr (std::is_same_v<T, CompareFields>) {
            if (c.fold) {
                return folded_call(c.op) + path_text(c.path1) + ", " + path_text(c.path2) + ")";
            }
            return path_text(c.path1) + " " + std::string(to_string(c.op)) + " " + path_text(c.path2);
        } else if constexpr (std::is_same_v<T, Defined>) {
            return "defined(" + path_text(c.path) + ")";
        } else if constexpr (std::is_same_v<T, Undefined>) {
            return "undefined(" + path_text(c.path) + ")";
        } else if constexpr (std::is_same_v<T, TypeOf>) {
            return "type(" + path_text(c.path) + ", " + quote(c.type) + ")";
        } else if constexpr (std::is_same_v<T, StringPredicate>) {
            return std::string(to_string(c.op)) + (c.fold ? "i(" : "(") + path_text(c.path) + ", " +
                   quote(c.needle) + ")";
        } else if constexpr (std::is_same_v<T, Membership>) {
            std::string out = std::string(c.fold ? "ini(" : "in(") + path_text(c.path);
            for (const auto& lit : c.literals) {
                out += ", " + literal_text(lit);
            }
            return out + ")";
        } else if constexpr (std::is_same_v<T, And> || std::is_same_v<T, Or>) {
            if (c.subs.empty()) {
                return std::is_same_v<T, And> ? "true" : "false";
            }
            std::string out = "(";
            for (std::size_t i = 0; i < c.subs.size(); ++i) {
                if (i > 0) out += std::is_same_v<T, And> ? " AND " : " OR ";
                out += to_string(*c.subs[i]);
            }
            return out + ")";
        } else if constexpr (std::is_same_v<T, Not>) {
            return "NOT " + to_string(*c.sub);
        } else {
            return "log(" + quote(c.message) + ")";
        }
    }, cond.node);
}

// ============================================================
// Fluent construction
// ============================================================

namespace cond {

ConditionPtr make(Condition c)
{
    return std::make_shared<const Condition>(std::move(c));
}

ConditionPtr compare(std::string_view path, CompareOp op, Value v, bool fold)
{
    return make(Condition{Compare{parse_path(path), std::move(v), op, fold}});
}

ConditionPtr eq(std::string_view path, Value v) { return compare(path, CompareOp::Eq, std::move(v)); }
ConditionPtr ne(std::string_view path, Value v) { return compare(path, CompareOp::Ne, std::move(v)); }
ConditionPtr gt(std::string_view path, Value v) { return compare(path, CompareOp::Gt, std::move(v)); }
ConditionPtr lt(std::string_view path, Value v) { return compare(path, CompareOp::Lt, std::move(v)); }
ConditionPtr ge(std::string_view path, Value v) { return compare(path, CompareOp::Ge, std::move(v)); }
ConditionPtr le(std::string_view path, Value v) { return compare(path, CompareOp::Le, std::move(v)); }
ConditionPtr eq_fold(std::string_view path, Value v) { return compare(path, CompareOp::Eq, std::move(v), true); }
ConditionPtr ne_fold(std::string_view path, Value v) { return compare(path, CompareOp::Ne, std::move(v), true); }

ConditionPtr compare_fields(std::string_view path1, CompareOp op, std::string_view path2, bool fold)
{
    return make(Condition{CompareFields{parse_path(path1), parse_path(path2), op, fold}});
}

ConditionPtr eq_field(std::string_view p1, std::string_view p2) { return compare_fields(p1, CompareOp::Eq, p2); }
ConditionPtr ne_field(std::string_view p1, std::string_view p2) { return compare_fields(p1, CompareOp::Ne, p2); }
ConditionPtr gt_field(std::string_view p1, std::string_view p2) { return compare_fields(p1, CompareOp::Gt, p2); }
ConditionPtr lt_field(std::string_view p1, std::string_view p2) { return compare_fields(p1, CompareOp::Lt, p2); }

ConditionPtr defined(std::string_view path)
{
    return make(Condition{Defined{parse_path(path)}});
}

ConditionPtr undefined(std::string_view path)
{
    return make(Condition{Undefined{parse_path(path)}});
}

ConditionPtr type_of(std::string_view path, std::string type)
{
    return make(Condition{TypeOf{parse_path(path), std::move(type)}});
}

ConditionPtr contains(std::string_view path, std::string needle, bool fold)
{
    return make(Condition{StringPredicate{parse_path(path), std::move(needle), StringOp::Contains, fold}});
}

ConditionPtr starts_with(std::string_view path, std::string needle, bool fold)
{
    return make(Condition{StringPredicate{parse_path(path), std::move(needle), StringOp::Starts, fold}});
}

ConditionPtr ends_with(std::string_view path, std::string needle, bool fold)
{
    return make(Condition{StringPredicate{parse_path(path), std::move(needle), StringOp::Ends, fold}});
}

ConditionPtr matches(std::string_view path, std::string pattern, bool fold)
{
    return make(Condition{StringPredicate{parse_path(path), std::move(pattern), StringOp::Matches, fold}});
}

ConditionPtr in(std::string_view path, std::vector<Value> values, bool fold)
{
    return make(Condition{Membership{parse_path(path), std::move(values), fold}});
}

ConditionPtr log(std::string message)
{
    return make(Condition{Log{std::move(message)}});
}

ConditionPtr all_of(std::vector<ConditionPtr> subs)
{
    return make(Condition{And{std::move(subs)}});
}

ConditionPtr any_of(std::vector<ConditionPtr> subs)
{
    return make(Condition{Or{std::move(subs)}});
}

ConditionPtr negate(ConditionPtr sub)
{
    return make(Condition{Not{std::move(sub)}});
}

} // namespace cond

} // namespace lager_delta
