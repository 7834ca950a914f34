// test_path.cpp - Tests for path parsing, formatting and persistent resolve/set/erase

#include <catch2/catch_all.hpp>
#include <lager_delta/path.h>
#include <lager_delta/type_registry.h>
#include <lager_delta/value.h>

#include <string>
#include <vector>

using namespace lager_delta;

namespace {

Value sample() {
    return Value::map({
        {"config", Value::map({{"name", "demo"}, {"a/b", 1}, {"t~x", 2}})},
        {"items", Value::vector({10, 20, 30})},
        {"slots", Value::array({1, 2})},
        {"owner", Value::ref(Value::map({{"id", 7}}))},
    });
}

} // namespace

// ============================================================
// Parsing
// ============================================================

TEST_CASE("parse_json_pointer", "[path][parse]") {
    SECTION("root") {
        REQUIRE(parse_json_pointer("").empty());
    }

    SECTION("a lone slash is the empty key") {
        REQUIRE(parse_json_pointer("/") == Path{std::string{}});
        REQUIRE(parse_path("/") == Path{std::string{}});
        REQUIRE(path_to_pointer(Path{std::string{}}) == "/");
        REQUIRE(parse_json_pointer("/a/") == Path{std::string{"a"}, std::string{}});
    }

    SECTION("only canonical decimals become indices") {
        Path p = parse_json_pointer("/m/007/0/10");
        REQUIRE(std::get<std::string>(p[1]) == "007");
        REQUIRE(std::get<std::size_t>(p[2]) == 0);
        REQUIRE(std::get<std::size_t>(p[3]) == 10);
        REQUIRE(path_to_pointer(p) == "/m/007/0/10");
        REQUIRE(std::get<std::string>(parse_path("m[00]")[1]) == "00");
    }

    SECTION("keys and indices") {
        Path p = parse_json_pointer("/items/2/name");
        REQUIRE(p.size() == 3);
        REQUIRE(std::get<std::string>(p[0]) == "items");
        REQUIRE(std::get<std::size_t>(p[1]) == 2);
        REQUIRE(std::get<std::string>(p[2]) == "name");
    }

    SECTION("escapes") {
        Path p = parse_json_pointer("/a~1b/t~0x");
        REQUIRE(std::get<std::string>(p[0]) == "a/b");
        REQUIRE(std::get<std::string>(p[1]) == "t~x");
    }
}

TEST_CASE("parse_path accepts dotted form", "[path][parse]") {
    Path p = parse_path("users[1].profile['display.name']");
    REQUIRE(p.size() == 4);
    REQUIRE(std::get<std::string>(p[0]) == "users");
    REQUIRE(std::get<std::size_t>(p[1]) == 1);
    REQUIRE(std::get<std::string>(p[2]) == "profile");
    REQUIRE(std::get<std::string>(p[3]) == "display.name");

    REQUIRE(parse_path("/a/0") == parse_path("a[0]"));
    REQUIRE(parse_path("single").size() == 1);
}

TEST_CASE("path formatting", "[path][format]") {
    Path p{"config", "a/b", std::size_t{3}};
    REQUIRE(path_to_pointer(p) == "/config/a~1b/3");
    REQUIRE(path_to_pointer(Path{}).empty());
    REQUIRE(path_to_string(Path{}) == "/");
    REQUIRE(path_to_string(Path{"items", std::size_t{0}, "name"}) == ".items[0].name");
    REQUIRE(parse_json_pointer(path_to_pointer(p)) == p);
}

// ============================================================
// Prefix helpers
// ============================================================

TEST_CASE("prefix helpers", "[path][prefix]") {
    Path base{"a", "b"};
    Path full{"a", "b", std::size_t{2}};

    REQUIRE(is_prefix(Path{}, full));
    REQUIRE(is_prefix(base, full));
    REQUIRE_FALSE(is_prefix(full, base));
    REQUIRE(is_prefix(Path{"a", "b", "2"}, full));

    auto rest = strip_prefix(full, base);
    REQUIRE(rest.has_value());
    REQUIRE(rest->size() == 1);
    REQUIRE_FALSE(strip_prefix(base, Path{"x"}).has_value());

    REQUIRE(longest_common_prefix({full, Path{"a", "b", "c"}, Path{"a", "x"}}) == Path{"a"});
    REQUIRE(child_path(base, std::size_t{4}).size() == 3);
}

// ============================================================
// Resolution
// ============================================================

TEST_CASE("resolve", "[path][resolve]") {
    Value root = sample();

    SECTION("root path yields the whole value") {
        REQUIRE(resolve(root, Path{}) == root);
    }

    SECTION("nested values") {
        REQUIRE(resolve(root, parse_path("/config/name"))->as_string() == "demo");
        REQUIRE(resolve(root, parse_path("/items/1"))->as_int64() == 20);
        REQUIRE(resolve(root, parse_path("/slots/0"))->as_int64() == 1);
    }

    SECTION("references are followed") {
        REQUIRE(resolve(root, parse_path("/owner/id"))->as_int64() == 7);
        REQUIRE(resolve(root, parse_path("/owner"))->is_map());
    }

    SECTION("missing locations") {
        REQUIRE_FALSE(resolve(root, parse_path("/config/missing")).has_value());
        REQUIRE_FALSE(resolve(root, parse_path("/items/3")).has_value());
        REQUIRE_FALSE(resolve(root, parse_path("/items/x")).has_value());
        REQUIRE_FALSE(resolve(root, parse_path("/config/name/deeper")).has_value());
    }
}

// ============================================================
// Mutation
// ============================================================

TEST_CASE("set_at", "[path][set]") {
    Value root = sample();

    SECTION("replaces nested values without touching the input") {
        Value updated = set_at(root, parse_path("/config/name"), "changed");
        REQUIRE(resolve(updated, parse_path("/config/name"))->as_string() == "changed");
        REQUIRE(resolve(root, parse_path("/config/name"))->as_string() == "demo");
    }

    SECTION("creates intermediate maps") {
        Value updated = set_at(Value{}, parse_path("/a/b"), 1);
        REQUIRE(updated.is_map());
        REQUIRE(resolve(updated, parse_path("/a/b"))->as_int64() == 1);
    }

    SECTION("appends at the end of a sequence") {
        Value updated = set_at(root, parse_path("/items/3"), 40);
        REQUIRE(updated.at("items").size() == 4);
        Value dashed = set_at(root, parse_path("/items/-"), 40);
        REQUIRE(dashed == updated);
    }

    SECTION("writes through references") {
        Value updated = set_at(root, parse_path("/owner/id"), 8);
        REQUIRE(updated.at("owner").is_ref());
        REQUIRE(resolve(updated, parse_path("/owner/id"))->as_int64() == 8);
    }

    SECTION("rejects out of range indices") {
        REQUIRE_THROWS_AS(set_at(root, parse_path("/items/9"), 1), PathError);
        REQUIRE_THROWS_AS(set_at(root, parse_path("/slots/2"), 1), PathError);
        REQUIRE_THROWS_AS(set_at(root, parse_path("/config/name/x"), 1), PathError);
    }

    SECTION("rejects undeclared record fields when a registry is given") {
        TypeRegistry registry;
        registry.register_type("Point", {{"x"}, {"y"}});
        Value point = Value::make_record("Point", {{"x", 1}, {"y", 2}});
        REQUIRE(set_at(point, parse_path("/x"), 5, &registry).at("x").as_int64() == 5);
        REQUIRE_THROWS_AS(set_at(point, parse_path("/z"), 5, &registry), PathError);
    }
}

TEST_CASE("erase_at", "[path][erase]") {
    Value root = sample();

    SECTION("map entries are removed") {
        Value updated = erase_at(root, parse_path("/config/name"));
        REQUIRE_FALSE(updated.at("config").contains("name"));
    }

    SECTION("sequence elements shift down") {
        Value updated = erase_at(root, parse_path("/items/0"));
        REQUIRE(updated.at("items") == Value::vector({20, 30}));
    }

    SECTION("fixed array slots are emptied") {
        Value updated = erase_at(root, parse_path("/slots/1"));
        REQUIRE(updated.at("slots").size() == 2);
        REQUIRE(updated.at("slots").at(std::size_t{1}).is_null());
    }

    SECTION("a reference keeps its kind when erased") {
        Value updated = erase_at(root, parse_path("/owner"));
        REQUIRE_FALSE(updated.contains("owner"));
        Value record = Value::make_record("Holder", {{"ref", Value::poly(Value{1})}});
        Value cleared = erase_at(record, parse_path("/ref"));
        REQUIRE(cleared.at("ref").is_ref());
        REQUIRE(cleared.at("ref").is_empty());
        REQUIRE(cleared.at("ref").get_if<ValueRef>()->kind == RefKind::Polymorphic);
    }

    SECTION("missing paths throw") {
        REQUIRE_THROWS_AS(erase_at(root, parse_path("/config/missing")), PathError);
        REQUIRE_THROWS_AS(erase_at(root, parse_path("/items/5")), PathError);
    }
}

// ============================================================
// Lens integration
// ============================================================

TEST_CASE("path_lens", "[path][lens]") {
    Value root = sample();
    auto lens = path_lens(parse_path("/items/2"));

    REQUIRE(lager::view(lens, root).as_int64() == 30);
    Value updated = lager::set(lens, root, Value{99});
    REQUIRE(updated.at("items").at(std::size_t{2}).as_int64() == 99);

    Value doubled = update_at(root, parse_path("/items/0"),
                              [](const Value& v) { return Value{v.as_int() * 2}; });
    REQUIRE(doubled.at("items").at(std::size_t{0}).as_int64() == 20);
}
