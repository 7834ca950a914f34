// text.cpp - collaborative text over tombstoned runs

#include <lager_delta/text.h>

#include <algorithm>
#include <charconv>
#include <map>

namespace lager_delta {

namespace {

struct Char {
    Timestamp id;
    Timestamp prev;
    char ch = 0;
    bool deleted = false;
};

Timestamp offset(const Timestamp& id, std::size_t i)
{
    Timestamp t = id;
    t.logical += static_cast<uint32_t>(i);
    return t;
}

/// One entry per id; a character removed on either side stays removed.
std::map<Timestamp, Char> explode(const std::vector<TextRun>& runs)
{
    std::map<Timestamp, Char> chars;
    for (const auto& run : runs) {
        for (std::size_t i = 0; i < run.value.size(); ++i) {
            Char c{offset(run.id, i), i == 0 ? run.prev : offset(run.id, i - 1), run.value[i], run.deleted};
            auto [it, inserted] = chars.emplace(c.id, c);
            if (!inserted && c.deleted) {
                it->second.deleted = true;
            }
        }
    }
    return chars;
}

/// Depth-first from the start: a character, then whatever was typed behind
/// it, newest first. Characters whose predecessor is unknown start their own
/// tree after the main one.
std::vector<Char> order(const std::map<Timestamp, Char>& chars)
{
    std::map<Timestamp, std::vector<const Char*>> children;
    std::vector<const Char*> roots;
    for (const auto& [id, c] : chars) {
        if (c.prev.is_zero() || chars.count(c.prev)) {
            children[c.prev].push_back(&c);
        } else {
            roots.push_back(&c);
        }
    }

    std::vector<Char> result;
    result.reserve(chars.size());
    std::vector<const Char*> stack;

    // map iteration is ascending, so pushing in order pops newest first
    auto push_children = [&](const Timestamp& id) {
        auto it = children.find(id);
        if (it == children.end()) return;
        for (const Char* c : it->second) stack.push_back(c);
    };
    auto walk = [&] {
        while (!stack.empty()) {
            const Char* c = stack.back();
            stack.pop_back();
            result.push_back(*c);
            push_children(c->id);
        }
    };

    push_children(Timestamp{});
    walk();
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        stack.push_back(*it);
        walk();
    }
    return result;
}

std::vector<TextRun> to_runs(const std::vector<Char>& ordered)
{
    std::vector<TextRun> runs;
    for (const auto& c : ordered) {
        if (!runs.empty()) {
            TextRun& last = runs.back();
            const std::size_t n = last.value.size();
            if (last.deleted == c.deleted && c.id == offset(last.id, n) && c.prev == offset(last.id, n - 1)) {
                last.value += c.ch;
                continue;
            }
        }
        runs.push_back(TextRun{c.id, std::string(1, c.ch), c.prev, c.deleted});
    }
    return runs;
}

std::string id_text(const Timestamp& id)
{
    return id.is_zero() ? std::string{} : to_string(id);
}

/// Inverse of to_string(Timestamp): "<wall>.<logical>@<node>".
Timestamp parse_id(const std::string& text)
{
    if (text.empty()) {
        return Timestamp{};
    }
    auto dot = text.find('.');
    auto at = text.find('@');
    if (dot == std::string::npos || at == std::string::npos || at < dot) {
        throw TextError("malformed run id: " + text);
    }
    Timestamp id;
    const char* first = text.data();
    auto wall = std::from_chars(first, first + dot, id.wall);
    auto logical = std::from_chars(first + dot + 1, first + at, id.logical);
    if (wall.ec != std::errc{} || wall.ptr != first + dot || logical.ec != std::errc{} ||
        logical.ptr != first + at) {
        throw TextError("malformed run id: " + text);
    }
    id.node = text.substr(at + 1);
    return id;
}

std::string string_field(const Value& run, const std::string& field)
{
    Value v = run.at(field);
    if (!v.is_string()) {
        throw TextError("TextRun." + field + " must be a string, found " + kind_name(v));
    }
    return v.as_string();
}

} // anonymous namespace

Text::Text(const std::vector<TextRun>& runs)
    : runs_(to_runs(order(explode(runs))))
{
}

Text Text::insert(std::size_t pos, std::string_view value, LogicalClock& clock) const
{
    if (pos > size()) {
        throw TextError("insert position " + std::to_string(pos) + " past the end (size " +
                        std::to_string(size()) + ")");
    }
    if (value.empty()) {
        return *this;
    }

    Timestamp prev;
    std::size_t visible = 0;
    for (const auto& run : runs_) {
        if (run.deleted) continue;
        if (pos > visible && pos <= visible + run.value.size()) {
            prev = offset(run.id, pos - visible - 1);
            break;
        }
        visible += run.value.size();
    }

    // new ids must sort after every id already in the text
    if (!runs_.empty()) {
        clock.update(latest());
    }
    std::vector<TextRun> runs = runs_;
    runs.push_back(TextRun{clock.reserve(static_cast<uint32_t>(value.size())), std::string(value), prev, false});
    return Text(runs);
}

Text Text::erase(std::size_t pos, std::size_t length) const
{
    const std::size_t total = size();
    if (pos > total || length > total - pos) {
        throw TextError("erase range " + std::to_string(pos) + "+" + std::to_string(length) +
                        " past the end (size " + std::to_string(total) + ")");
    }
    if (length == 0) {
        return *this;
    }

    std::vector<Char> chars = order(explode(runs_));
    std::size_t visible = 0;
    for (auto& c : chars) {
        if (c.deleted) continue;
        if (visible >= pos && visible < pos + length) {
            c.deleted = true;
        }
        ++visible;
    }
    Text result;
    result.runs_ = to_runs(chars);
    return result;
}

Text Text::merge(const Text& other) const
{
    std::vector<TextRun> runs = runs_;
    runs.insert(runs.end(), other.runs_.begin(), other.runs_.end());
    return Text(runs);
}

std::string Text::str() const
{
    std::string out;
    for (const auto& run : runs_) {
        if (!run.deleted) out += run.value;
    }
    return out;
}

std::size_t Text::size() const
{
    std::size_t n = 0;
    for (const auto& run : runs_) {
        if (!run.deleted) n += run.value.size();
    }
    return n;
}

Timestamp Text::latest() const
{
    Timestamp best;
    for (const auto& run : runs_) {
        Timestamp last = offset(run.id, run.value.size() - 1);
        if (best < last) best = last;
    }
    return best;
}

// ============================================================
// Value form
// ============================================================

Value Text::to_value() const
{
    std::vector<Value> runs;
    runs.reserve(runs_.size());
    for (const auto& run : runs_) {
        runs.push_back(Value::make_record("TextRun", {
            {"id", id_text(run.id)},
            {"v", run.value},
            {"p", id_text(run.prev)},
            {"d", run.deleted},
        }));
    }
    return Value::make_record("Text", {{"runs", Value::vector(runs)}});
}

Text Text::from_value(const Value& v)
{
    if (v.record_type() != "Text") {
        throw TextError("expected record Text, found " + kind_name(v));
    }
    const auto* list = v.at("runs").get_if<ValueVector>();
    if (!list) {
        throw TextError("Text.runs must be a sequence");
    }

    std::vector<TextRun> runs;
    runs.reserve(list->size());
    for (const auto& box : *list) {
        const Value& run = box.get();
        if (run.record_type() != "TextRun") {
            throw TextError("expected record TextRun, found " + kind_name(run));
        }
        TextRun r{parse_id(string_field(run, "id")), string_field(run, "v"), parse_id(string_field(run, "p")),
                  run.at("d").as_bool()};
        if (r.id.is_zero() || r.value.empty()) {
            throw TextError("TextRun needs an id and a non-empty value");
        }
        runs.push_back(std::move(r));
    }
    return Text(runs);
}

void register_text_types(TypeRegistry& registry)
{
    registry.register_type("TextRun", {{"id", FieldFlags::Key}, {"v"}, {"p"}, {"d"}});
    registry.register_type("Text", {{"runs"}});
}

} // namespace lager_delta
