// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.cpp
/// @brief Path parsing, formatting and persistent resolve/set/erase.

#include <lager_delta/path.h>
#include <lager_delta/type_registry.h>

#include <algorithm>
#include <cctype>
#include <ranges>

namespace lager_delta {

// ============================================================
// Parsing
// ============================================================

namespace {

/// ~1 -> /, ~0 -> ~ ; any other '~' is kept as is
std::string unescape_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());

    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            } else if (segment[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += segment[i];
    }

    return result;
}

/// Canonical decimal only: "007" stays a key so it survives a round trip.
bool is_array_index(std::string_view s)
{
    if (s.empty() || s.size() > 18) {
        return false;
    }
    if (s.size() > 1 && s.front() == '0') {
        return false;
    }
    return std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c); });
}

PathElement make_part(std::string text)
{
    if (is_array_index(text)) {
        return static_cast<std::size_t>(std::stoull(text));
    }
    return text;
}

Path parse_dotted(std::string_view text)
{
    Path path;
    std::string current;
    bool have_current = false;

    auto flush = [&] {
        if (have_current) {
            path.push_back(make_part(std::move(current)));
            current.clear();
            have_current = false;
        }
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '.') {
            flush();
        } else if (c == '[') {
            flush();
            auto close = text.find(']', i);
            if (close == std::string_view::npos) {
                // Unterminated bracket: keep the rest as a literal key.
                current = std::string(text.substr(i));
                have_current = true;
                break;
            }
            std::string_view inner = text.substr(i + 1, close - i - 1);
            if (inner.size() >= 2 && (inner.front() == '\'' || inner.front() == '"') &&
                inner.back() == inner.front()) {
                path.emplace_back(std::string(inner.substr(1, inner.size() - 2)));
            } else {
                path.push_back(make_part(std::string(inner)));
            }
            i = close;
        } else {
            current += c;
            have_current = true;
        }
    }
    flush();
    return path;
}

} // anonymous namespace

Path parse_json_pointer(std::string_view pointer)
{
    if (pointer.empty()) {
        return Path{};
    }
    if (pointer.front() == '/') {
        pointer.remove_prefix(1);
    }

    Path path;
    while (true) {
        auto pos = pointer.find('/');
        std::string_view segment = (pos == std::string_view::npos)
                                    ? pointer
                                    : pointer.substr(0, pos);
        path.push_back(make_part(unescape_segment(segment)));
        if (pos == std::string_view::npos) {
            break;
        }
        pointer = pointer.substr(pos + 1);
    }
    return path;
}

Path parse_path(std::string_view text)
{
    if (text.empty()) {
        return Path{};
    }
    if (text.front() == '/') {
        return parse_json_pointer(text);
    }
    if (text.find_first_of(".[") != std::string_view::npos) {
        return parse_dotted(text);
    }
    return parse_json_pointer(text);
}

std::string escape_key(std::string_view key)
{
    std::string result;
    result.reserve(key.size());
    for (char c : key) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result += c;
        }
    }
    return result;
}

std::string part_to_string(const PathElement& elem)
{
    if (auto* key = std::get_if<std::string>(&elem)) {
        return *key;
    }
    return std::to_string(std::get<std::size_t>(elem));
}

std::string path_to_pointer(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        result += '/';
        if (auto* key = std::get_if<std::string>(&elem)) {
            result += escape_key(*key);
        } else {
            result += std::to_string(std::get<std::size_t>(elem));
        }
    }
    return result;
}

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                result += "." + v;
            } else {
                result += "[" + std::to_string(v) + "]";
            }
        }, elem);
    }
    return result.empty() ? "/" : result;
}

// ============================================================
// Prefix helpers
// ============================================================

bool parts_equal(const PathElement& a, const PathElement& b)
{
    if (a.index() == b.index()) {
        return a == b;
    }
    return part_to_string(a) == part_to_string(b);
}

bool is_prefix(const Path& prefix, const Path& path)
{
    if (prefix.size() > path.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (!parts_equal(prefix[i], path[i])) {
            return false;
        }
    }
    return true;
}

Path longest_common_prefix(const std::vector<Path>& paths)
{
    if (paths.empty()) {
        return Path{};
    }
    Path prefix = paths.front();
    for (const auto& p : paths) {
        std::size_t n = 0;
        while (n < prefix.size() && n < p.size() && parts_equal(prefix[n], p[n])) {
            ++n;
        }
        prefix.resize(n);
    }
    return prefix;
}

std::optional<Path> strip_prefix(const Path& path, const Path& prefix)
{
    if (!is_prefix(prefix, path)) {
        return std::nullopt;
    }
    return Path(path.begin() + static_cast<std::ptrdiff_t>(prefix.size()), path.end());
}

Path child_path(const Path& path, PathElement elem)
{
    Path result;
    result.reserve(path.size() + 1);
    result = path;
    result.push_back(std::move(elem));
    return result;
}

// ============================================================
// Resolution
// ============================================================

namespace {

std::optional<std::size_t> as_index(const PathElement& elem)
{
    if (auto* idx = std::get_if<std::size_t>(&elem)) {
        return *idx;
    }
    const auto& key = std::get<std::string>(elem);
    if (is_array_index(key)) {
        return static_cast<std::size_t>(std::stoull(key));
    }
    return std::nullopt;
}

/// Replacement for a removed slot that keeps reference slots typed.
Value empty_like(const Value& v)
{
    if (auto* r = v.get_if<ValueRef>()) {
        return Value{ValueRef{r->kind, std::nullopt}};
    }
    return Value{};
}

} // anonymous namespace

const Value& deref(const Value& v)
{
    const Value* current = &v;
    while (auto* target = current->ref_target()) {
        current = target;
    }
    return *current;
}

std::optional<Value> resolve_step(const Value& current, const PathElement& elem)
{
    const Value& c = deref(current);

    if (auto* m = c.get_if<ValueMap>()) {
        if (auto* found = m->find(part_to_string(elem))) {
            return found->get();
        }
        return std::nullopt;
    }
    if (auto* r = c.get_record()) {
        if (auto* found = r->fields.find(part_to_string(elem))) {
            return found->get();
        }
        return std::nullopt;
    }
    if (auto* v = c.get_if<ValueVector>()) {
        auto idx = as_index(elem);
        if (idx && *idx < v->size()) {
            return (*v)[*idx].get();
        }
        return std::nullopt;
    }
    if (auto* a = c.get_if<ValueArray>()) {
        auto idx = as_index(elem);
        if (idx && *idx < a->size()) {
            return (*a)[*idx].get();
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<Value> resolve(const Value& root, const Path& path)
{
    Value current = root;
    for (const auto& elem : path) {
        auto next = resolve_step(current, elem);
        if (!next) {
            return std::nullopt;
        }
        current = std::move(*next);
    }
    if (current.is_ref()) {
        if (current.is_empty()) {
            return Value{};
        }
        return deref(current);
    }
    return current;
}

// ============================================================
// Mutation
// ============================================================

namespace {

Value set_recursive(const Value& current, const Path& path, std::size_t i, Value value,
                    const TypeRegistry* registry)
{
    if (i >= path.size()) {
        return value;
    }

    // Step through references, allocating an empty one.
    if (auto* r = current.get_if<ValueRef>()) {
        Value inner = r->target ? r->target->get() : Value{};
        Value updated = set_recursive(inner, path, i, std::move(value), registry);
        return Value{ValueRef{r->kind, ValueBox{std::move(updated)}}};
    }

    const auto& elem = path[i];
    Value container = current;
    if (container.is_null()) {
        bool wants_key = std::holds_alternative<std::string>(elem) &&
                         std::get<std::string>(elem) != "-";
        container = wants_key ? Value{ValueMap{}} : Value{ValueVector{}};
    }

    auto child_of = [&](const Value& c) -> Value {
        auto found = resolve_step(c, elem);
        return found ? std::move(*found) : Value{};
    };

    if (auto* m = container.get_if<ValueMap>()) {
        auto key = part_to_string(elem);
        Value child = set_recursive(child_of(container), path, i + 1, std::move(value), registry);
        return m->set(key, ValueBox{std::move(child)});
    }

    if (auto* rec = container.get_record()) {
        auto key = part_to_string(elem);
        if (registry) {
            if (auto* desc = registry->find(rec->type); desc && !desc->find_field(key)) {
                throw PathError("field '" + key + "' is not declared on type " + rec->type);
            }
        }
        Value child = set_recursive(child_of(container), path, i + 1, std::move(value), registry);
        return container.set(key, std::move(child));
    }

    if (auto* vec = container.get_if<ValueVector>()) {
        std::optional<std::size_t> idx;
        if (auto* key = std::get_if<std::string>(&elem); key && *key == "-") {
            idx = vec->size();
        } else {
            idx = as_index(elem);
        }
        if (!idx) {
            throw PathError("invalid index '" + part_to_string(elem) + "' at " +
                            path_to_pointer(Path(path.begin(), path.begin() + i + 1)));
        }
        if (*idx > vec->size()) {
            throw PathError("index " + std::to_string(*idx) + " out of range (size " +
                            std::to_string(vec->size()) + ")");
        }
        Value child = *idx < vec->size() ? (*vec)[*idx].get() : Value{};
        child = set_recursive(child, path, i + 1, std::move(value), registry);
        if (*idx == vec->size()) {
            return vec->push_back(ValueBox{std::move(child)});
        }
        return vec->set(*idx, ValueBox{std::move(child)});
    }

    if (auto* arr = container.get_if<ValueArray>()) {
        auto idx = as_index(elem);
        if (!idx || *idx >= arr->size()) {
            throw PathError("fixed array index '" + part_to_string(elem) + "' out of range (size " +
                            std::to_string(arr->size()) + ")");
        }
        Value child = set_recursive((*arr)[*idx].get(), path, i + 1, std::move(value), registry);
        return container.set(*idx, std::move(child));
    }

    throw PathError("cannot step into " + kind_name(container) + " with '" +
                    part_to_string(elem) + "'");
}

Value erase_recursive(const Value& current, const Path& path, std::size_t i)
{
    if (auto* r = current.get_if<ValueRef>()) {
        if (!r->target) {
            throw PathError("cannot erase through empty reference at " +
                            path_to_pointer(Path(path.begin(), path.begin() + i)));
        }
        Value updated = erase_recursive(r->target->get(), path, i);
        return Value{ValueRef{r->kind, ValueBox{std::move(updated)}}};
    }

    const auto& elem = path[i];
    const bool last = i + 1 == path.size();

    auto missing = [&]() {
        return PathError("path " + path_to_pointer(path) + " not found");
    };

    if (auto* m = current.get_if<ValueMap>()) {
        auto key = part_to_string(elem);
        auto* found = m->find(key);
        if (!found) throw missing();
        if (last) return m->erase(key);
        return m->set(key, ValueBox{erase_recursive(found->get(), path, i + 1)});
    }

    if (auto* rec = current.get_record()) {
        auto key = part_to_string(elem);
        auto* found = rec->fields.find(key);
        if (!found) throw missing();
        if (last) return current.set(key, empty_like(found->get()));
        return current.set(key, erase_recursive(found->get(), path, i + 1));
    }

    if (auto* vec = current.get_if<ValueVector>()) {
        auto idx = as_index(elem);
        if (!idx || *idx >= vec->size()) throw missing();
        if (last) {
            auto t = vec->take(*idx).transient();
            for (std::size_t j = *idx + 1; j < vec->size(); ++j) {
                t.push_back((*vec)[j]);
            }
            return t.persistent();
        }
        return vec->set(*idx, ValueBox{erase_recursive((*vec)[*idx].get(), path, i + 1)});
    }

    if (auto* arr = current.get_if<ValueArray>()) {
        auto idx = as_index(elem);
        if (!idx || *idx >= arr->size()) throw missing();
        const Value& slot = (*arr)[*idx].get();
        if (last) return current.set(*idx, empty_like(slot));
        return current.set(*idx, erase_recursive(slot, path, i + 1));
    }

    throw missing();
}

} // anonymous namespace

Value set_at(const Value& root, const Path& path, Value value, const TypeRegistry* registry)
{
    return set_recursive(root, path, 0, std::move(value), registry);
}

Value erase_at(const Value& root, const Path& path)
{
    if (path.empty()) {
        return empty_like(root);
    }
    return erase_recursive(root, path, 0);
}

// ============================================================
// Lens integration
// ============================================================

LagerValueLens path_lens(const Path& path)
{
    return lager::lenses::getset(
        [path](const Value& whole) -> Value {
            return resolve(whole, path).value_or(Value{});
        },
        [path](Value whole, Value part) -> Value {
            return set_at(whole, path, std::move(part));
        });
}

} // namespace lager_delta
