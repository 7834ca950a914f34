// test_reverse_walk.cpp - Tests for patch reversal, walking and textual forms

#include <catch2/catch_all.hpp>
#include <lager_delta/builder.h>
#include <lager_delta/diff.h>
#include <lager_delta/patch.h>
#include <lager_delta/value.h>

#include <string>
#include <vector>

using namespace lager_delta;

namespace {

TypeRegistry make_registry() {
    TypeRegistry registry;
    registry.register_type("Item", {{"id", FieldFlags::Key}, {"name"}});
    return registry;
}

Value item(int id, std::string name = "") {
    return Value::make_record("Item", {{"id", id}, {"name", std::move(name)}});
}

std::vector<std::string> walked(const Patch& p) {
    std::vector<std::string> out;
    p.walk([&](const WalkEntry& e) {
        out.push_back(std::string(to_string(e.kind)) + " " + path_to_pointer(e.path));
    });
    return out;
}

} // namespace

// ============================================================
// Reverse
// ============================================================

TEST_CASE("reverse undoes map changes", "[reverse]") {
    Value a = Value::map({{"keep", 1}, {"gone", 2}, {"nested", Value::map({{"x", 1}})}});
    Value b = Value::map({{"keep", 1}, {"new", 3}, {"nested", Value::map({{"x", 2}})}});

    Patch p = diff(a, b);
    REQUIRE(p.reverse().apply(b) == a);
    REQUIRE(p.reverse().apply_checked(b) == a);
    REQUIRE(p.reverse().reverse().apply(a) == b);
}

TEST_CASE("reverse undoes positional sequence edits", "[reverse][sequence]") {
    SECTION("substitutions and inserts") {
        Value a = Value::vector({"k", "i", "t", "t", "e", "n"});
        Value b = Value::vector({"s", "i", "t", "t", "i", "n", "g"});
        Patch p = diff(a, b);
        REQUIRE(p.reverse().apply_checked(b) == a);
    }

    SECTION("removals at the front and the end") {
        Value a = Value::vector({1, 2, 3, 4, 5});
        Value b = Value::vector({2, 3, 4});
        Patch p = diff(a, b);
        REQUIRE(p.reverse().apply_checked(b) == a);
    }

    SECTION("appends") {
        Value a = Value::vector({1});
        Value b = Value::vector({1, 2, 3});
        Patch p = diff(a, b);
        REQUIRE(p.reverse().apply_checked(b) == a);
    }
}

TEST_CASE("reverse undoes keyed moves", "[reverse][sequence][keyed]") {
    auto registry = make_registry();
    DiffOptions options{&registry};

    SECTION("swap") {
        Value a = Value::vector({item(1), item(2)});
        Value b = Value::vector({item(2), item(1)});
        Patch p = diff(a, b, options);
        REQUIRE(p.reverse().apply(b) == a);
    }

    SECTION("reorder with insert and removal") {
        Value a = Value::vector({item(1), item(2), item(3), item(4)});
        Value b = Value::vector({item(4), item(1), item(5), item(3)});
        Patch p = diff(a, b, options);
        REQUIRE(p.apply(a) == b);
        REQUIRE(p.reverse().apply(b) == a);
    }
}

TEST_CASE("reverse undoes copies and moves", "[reverse]") {
    Value doc = Value::map({{"src", Value::map({{"v", 1}})}, {"other", 0}});

    SECTION("copy into a new key is removed again") {
        PatchBuilder builder(doc);
        builder.at("/dst").copy("/src");
        Patch p = builder.build();
        Value out = p.apply_checked(doc);
        REQUIRE(p.reverse().apply_checked(out) == doc);
    }

    SECTION("move goes back to its source") {
        PatchBuilder builder(doc);
        builder.at("/dst").move("/src");
        Patch p = builder.build();
        Value out = p.apply_checked(doc);
        REQUIRE(out.contains("dst"));
        REQUIRE(p.reverse().apply_checked(out) == doc);
    }
}

TEST_CASE("reverse keeps settings but drops the condition", "[reverse]") {
    Patch p = diff(Value::map({{"a", 1}}), Value::map({{"a", 2}}))
                  .with_condition(cond::eq("/a", 1))
                  .with_strict(false)
                  .with_timestamp(Timestamp{10, 2, "n"});

    Patch r = p.reverse();
    REQUIRE(r.condition() == nullptr);
    REQUIRE_FALSE(r.strict());
    REQUIRE(r.timestamp() == p.timestamp());
}

TEST_CASE("reverse of an empty patch is empty", "[reverse]") {
    Value v = Value::map({{"a", 1}});
    Patch p = diff(v, v);
    REQUIRE(p.is_empty());
    REQUIRE(p.reverse().is_empty());
}

// ============================================================
// Walk
// ============================================================

TEST_CASE("walk reports flattened changes in tree order", "[walk]") {
    Value a = Value::map({{"a", 1}, {"b", 2}, {"list", Value::vector({1, 2})}});
    Value b = Value::map({{"a", 5}, {"c", 3}, {"list", Value::vector({1, 2, 3})}});

    Patch p = diff(a, b);
    REQUIRE(walked(p) == std::vector<std::string>{"remove /b", "add /c", "replace /a", "add /list/2"});

    std::vector<WalkEntry> entries;
    p.walk([&](const WalkEntry& e) { entries.push_back(e); });
    REQUIRE(entries[0].old_value.as_int64() == 2);
    REQUIRE(entries[1].new_value.as_int64() == 3);
    REQUIRE(entries[2].old_value.as_int64() == 1);
    REQUIRE(entries[2].new_value.as_int64() == 5);
}

TEST_CASE("walk_until stops early", "[walk]") {
    Patch p = diff(Value::map({{"a", 1}, {"b", 1}, {"c", 1}}), Value::map({{"a", 2}, {"b", 2}, {"c", 2}}));

    int seen = 0;
    bool finished = p.walk_until([&](const WalkEntry&) { return ++seen < 2; });
    REQUIRE_FALSE(finished);
    REQUIRE(seen == 2);

    REQUIRE(p.walk_until([](const WalkEntry&) { return true; }));
}

TEST_CASE("walk propagates exceptions from the visitor", "[walk]") {
    Patch p = diff(Value::map({{"a", 1}}), Value::map({{"a", 2}}));
    REQUIRE_THROWS_AS(p.walk([](const WalkEntry&) { throw std::runtime_error("stop"); }),
                      std::runtime_error);
}

TEST_CASE("walk reports copy and move sources", "[walk]") {
    Value doc = Value::map({{"src", 1}});
    PatchBuilder builder(doc);
    builder.at("/dst").copy("/src");
    Patch p = builder.build();

    std::vector<WalkEntry> entries;
    p.walk([&](const WalkEntry& e) { entries.push_back(e); });
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].kind == OpKind::Copy);
    REQUIRE(entries[0].from.has_value());
    REQUIRE(path_to_pointer(*entries[0].from) == "/src");
}

// ============================================================
// Textual forms
// ============================================================

TEST_CASE("summary lists one line per change", "[walk][format]") {
    Patch p = diff(Value::map({{"Name", "v1"}, {"old", 1}}), Value::map({{"Name", "v2"}}));
    REQUIRE(p.summary() == "remove /old\nreplace /Name: \"v1\" -> \"v2\"\n");

    Patch guarded = p.with_condition(cond::defined("/Name"));
    REQUIRE(guarded.summary().rfind("if defined(/Name)\n", 0) == 0);
}

TEST_CASE("to_string renders the operation tree", "[walk][format]") {
    Patch empty;
    REQUIRE(empty.to_string() == "Patch: <empty>");

    Patch p = diff(Value::map({{"a", 1}}), Value::map({{"a", 2}}));
    REQUIRE(p.to_string().rfind("Patch: ", 0) == 0);
    REQUIRE(p.to_string().size() > empty.to_string().size());
}
