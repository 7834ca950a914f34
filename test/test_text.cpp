// test_text.cpp - Tests for collaborative text

#include <catch2/catch_all.hpp>
#include <lager_delta/codec.h>
#include <lager_delta/diff.h>
#include <lager_delta/text.h>
#include <lager_delta/value.h>

#include <deque>
#include <string>
#include <vector>

using namespace lager_delta;

namespace {

/// Every replica ticks within one millisecond, so ids differ by logical and node.
LogicalClock fixed_clock(std::string node) {
    return LogicalClock(std::move(node), [] { return int64_t{1000}; });
}

Text merged_in_order(const std::vector<Text>& texts, const std::vector<std::size_t>& order) {
    Text out;
    for (std::size_t i : order) out = out.merge(texts[i]);
    return out;
}

} // namespace

// ============================================================
// Local edits
// ============================================================

TEST_CASE("Insert splits runs", "[text][insert]") {
    auto clock = fixed_clock("n1");
    Text text = Text{}.insert(0, "Hello", clock);
    REQUIRE(text.str() == "Hello");
    REQUIRE(text.runs().size() == 1);

    text = text.insert(2, "!", clock);
    REQUIRE(text.str() == "He!llo");
    REQUIRE(text.size() == 6);
    REQUIRE(text.runs().size() == 3);
    REQUIRE(text.runs()[0].value == "He");
    REQUIRE(text.runs()[1].value == "!");
    REQUIRE(text.runs()[2].value == "llo");

    Timestamp third = text.runs()[0].id;
    third.logical += 2;
    REQUIRE(text.runs()[2].id == third);

    SECTION("at both ends") {
        text = text.insert(0, "<", clock).insert(7, ">", clock);
        REQUIRE(text.str() == "<He!llo>");
    }

    SECTION("past the end") {
        REQUIRE_THROWS_AS(text.insert(7, "x", clock), TextError);
        REQUIRE(text.insert(3, "", clock) == text);
    }
}

TEST_CASE("Erase leaves tombstones", "[text][erase]") {
    auto clock = fixed_clock("n1");
    Text text = Text{}.insert(0, "Hello World", clock);

    text = text.erase(5, 6);
    REQUIRE(text.str() == "Hello");
    REQUIRE(text.runs().size() == 2);
    REQUIRE(text.runs()[1].deleted);

    text = text.erase(2, 2);
    REQUIRE(text.str() == "Heo");
    REQUIRE(text.runs()[1].value == "ll");
    REQUIRE(text.runs()[1].deleted);

    // inserting after a tombstone keeps the visible position
    text = text.insert(2, "y", clock);
    REQUIRE(text.str() == "Heyo");

    REQUIRE_THROWS_AS(text.erase(3, 2), TextError);
    REQUIRE(text.erase(4, 0) == text);
}

TEST_CASE("Runs that continue each other are joined", "[text]") {
    Timestamp first{100, 0, "A"};
    Timestamp second{100, 3, "A"};
    Timestamp after_c{100, 2, "A"};

    Text text({TextRun{first, "abc", {}, false}, TextRun{second, "def", after_c, false}});
    REQUIRE(text.runs().size() == 1);
    REQUIRE(text.runs()[0].value == "abcdef");
    REQUIRE(text.runs()[0].id == first);
}

// ============================================================
// Convergence
// ============================================================

TEST_CASE("Concurrent inserts converge", "[text][merge]") {
    auto clock_a = fixed_clock("a");
    auto clock_b = fixed_clock("b");

    Text a = Text{}.insert(0, "Hello", clock_a);
    Text b = a;

    a = a.insert(5, " World", clock_a);
    b = b.insert(2, "!", clock_b);

    Text ab = a.merge(b);
    Text ba = b.merge(a);
    REQUIRE(ab == ba);
    REQUIRE(ab.str() == "He!llo World");
    REQUIRE(ab.merge(a) == ab);
}

TEST_CASE("Inserts at one position are ordered newest first", "[text][merge]") {
    auto clock_a = fixed_clock("a");
    auto clock_b = fixed_clock("b");
    auto clock_c = fixed_clock("c");

    Text base = Text{}.insert(0, "[]", clock_a);
    std::vector<Text> texts = {
        base.insert(1, "A", clock_a),
        base.insert(1, "B", clock_b),
        base.insert(1, "C", clock_c),
    };

    Text first = merged_in_order(texts, {0, 1, 2});
    REQUIRE(first.str() == "[CBA]");
    REQUIRE(merged_in_order(texts, {2, 0, 1}) == first);
    REQUIRE(merged_in_order(texts, {1, 2, 0}) == first);
}

TEST_CASE("Overlapping erases converge", "[text][merge]") {
    auto clock_a = fixed_clock("a");
    Text a = Text{}.insert(0, "ABCDEFG", clock_a);
    Text b = a;

    a = a.erase(1, 3);
    b = b.erase(3, 3);

    REQUIRE(a.merge(b).str() == "AG");
    REQUIRE(b.merge(a).str() == "AG");
}

TEST_CASE("Edits from many replicas converge in any merge order", "[text][merge]") {
    const std::vector<std::string> nodes = {"A", "B", "C", "D"};
    std::deque<LogicalClock> clocks;
    for (const auto& node : nodes) clocks.emplace_back(node, [] { return int64_t{1000}; });

    Text start = Text{}.insert(0, "START-END", clocks[0]);
    std::vector<Text> texts(nodes.size(), start);

    for (std::size_t j = 0; j < 12; ++j) {
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            Text& t = texts[i];
            if (t.size() == 0) {
                t = t.insert(0, nodes[i], clocks[i]);
                continue;
            }
            std::size_t pos = (j * (i + 1)) % t.size();
            t = j % 3 == 0 ? t.erase(pos, 1) : t.insert(pos, nodes[i], clocks[i]);
        }
        if (j == 6) {
            // a partial exchange halfway through
            texts[0] = texts[0].merge(texts[1]);
        }
    }

    Text expected = merged_in_order(texts, {0, 1, 2, 3});
    REQUIRE(merged_in_order(texts, {3, 2, 1, 0}) == expected);
    REQUIRE(merged_in_order(texts, {1, 3, 0, 2}) == expected);
    REQUIRE(expected.merge(texts[2]) == expected);

    // every replica reads the same after receiving the others
    for (std::size_t i = 0; i < texts.size(); ++i) {
        Text local = texts[i];
        for (const auto& other : texts) local = local.merge(other);
        REQUIRE(local.str() == expected.str());
    }
}

// ============================================================
// Value form
// ============================================================

TEST_CASE("Text as a document value", "[text][value]") {
    auto clock = fixed_clock("a");
    Text before = Text{}.insert(0, "draft", clock);
    Text after = before.insert(5, " two", clock).erase(0, 1);

    Value doc = Value::map({{"body", before.to_value()}});
    Value edited = doc.set("body", after.to_value());
    REQUIRE(Text::from_value(edited.at("body")) == after);

    SECTION("diffs as keyed runs") {
        TypeRegistry registry;
        register_text_types(registry);
        Patch p = diff(doc, edited, DiffOptions{&registry});
        Value out = p.apply_checked(doc);
        REQUIRE(out == edited);
        REQUIRE(Text::from_value(out.at("body")).str() == "raft two");

        PatchCodec codec;
        register_builtin_kinds(codec);
        REQUIRE(codec.from_json(codec.to_json(p)).apply_checked(doc) == edited);
    }

    SECTION("malformed values") {
        REQUIRE_THROWS_AS(Text::from_value(Value::map({{"runs", Value::vector(std::vector<Value>{})}})), TextError);
        Value bad_id = Value::make_record("Text", {{"runs", Value::vector({Value::make_record(
                                                                 "TextRun", {{"id", "x"}, {"v", "a"}, {"p", ""}})})}});
        REQUIRE_THROWS_AS(Text::from_value(bad_id), TextError);
    }
}
