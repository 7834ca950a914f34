// test_value.cpp - Tests for Value construction, equality, registry and serialization

#include <catch2/catch_all.hpp>
#include <lager_delta/equal.h>
#include <lager_delta/serialization.h>
#include <lager_delta/type_registry.h>
#include <lager_delta/value.h>

#include <string>

using namespace lager_delta;

namespace {

TypeRegistry make_registry() {
    TypeRegistry registry;
    registry.register_type("Item", {{"id", FieldFlags::Key}, {"name"}, {"cache", FieldFlags::Ignore}});
    return registry;
}

Value item(int id, std::string name, int cache = 0) {
    return Value::make_record("Item", {{"id", id}, {"name", std::move(name)}, {"cache", cache}});
}

} // namespace

// ============================================================
// Construction
// ============================================================

TEST_CASE("Value default construction", "[value][construction]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(v.is_empty());
    REQUIRE(v.type_index() == 12);  // std::monostate is last in variant
}

TEST_CASE("Value primitive kinds", "[value][construction]") {
    SECTION("int32") {
        Value v{42};
        REQUIRE(v.is<int32_t>());
        REQUIRE(v.is_integer());
        REQUIRE(v.as_int64() == 42);
    }

    SECTION("int64") {
        Value v{int64_t{9999999999LL}};
        REQUIRE(v.is<int64_t>());
        REQUIRE(v.as_int64() == 9999999999LL);
    }

    SECTION("double") {
        Value v{2.5};
        REQUIRE(v.is_number());
        REQUIRE_FALSE(v.is_integer());
        REQUIRE(v.as_number() == Catch::Approx(2.5));
    }

    SECTION("string") {
        Value v{"hello"};
        REQUIRE(v.is_string());
        REQUIRE(v.as_string() == "hello");
    }
}

TEST_CASE("Value containers", "[value][construction]") {
    SECTION("map") {
        Value m = Value::map({{"a", 1}, {"b", "two"}});
        REQUIRE(m.is_map());
        REQUIRE(m.size() == 2);
        REQUIRE(m.at("b").as_string() == "two");
        REQUIRE(m.contains("a"));
    }

    SECTION("vector and fixed array") {
        Value v = Value::vector({1, 2, 3});
        Value a = Value::array({1, 2, 3});
        REQUIRE(v.is_vector());
        REQUIRE(a.is_array());
        REQUIRE(v != a);
        REQUIRE(a.set(std::size_t{1}, 20).at(std::size_t{1}).as_int64() == 20);
    }

    SECTION("record") {
        Value r = item(1, "apple");
        REQUIRE(r.is_record());
        REQUIRE(r.record_type() == "Item");
        REQUIRE(r.at("name").as_string() == "apple");
        Value renamed = r.set("name", "pear");
        REQUIRE(renamed.record_type() == "Item");
        REQUIRE(renamed.at("name").as_string() == "pear");
        REQUIRE(r.at("name").as_string() == "apple");
    }

    SECTION("references") {
        Value owned = Value::ref(Value{5});
        Value empty = Value::null_ref();
        Value poly = Value::poly(Value{"impl"});
        REQUIRE(owned.is_ref());
        REQUIRE(owned.ref_target()->as_int64() == 5);
        REQUIRE(empty.is_empty());
        REQUIRE_FALSE(owned.is_empty());
        REQUIRE(poly.get_if<ValueRef>()->kind == RefKind::Polymorphic);
    }
}

// ============================================================
// Deep equality
// ============================================================

TEST_CASE("deep_equal compares structure", "[value][equal]") {
    REQUIRE(deep_equal(Value::map({{"a", Value::vector({1, 2})}}), Value::map({{"a", Value::vector({1, 2})}})));
    REQUIRE_FALSE(deep_equal(Value{1}, Value{1.0}));
    REQUIRE_FALSE(deep_equal(Value::vector({1, 2}), Value::vector({2, 1})));
    REQUIRE(deep_equal(Value::ref(Value{3}), Value::ref(Value{3})));
    REQUIRE_FALSE(deep_equal(Value::ref(Value{3}), Value::poly(Value{3})));
}

TEST_CASE("deep_equal honours ignored fields", "[value][equal]") {
    auto registry = make_registry();
    Value a = item(1, "apple", 10);
    Value b = item(1, "apple", 99);
    REQUIRE_FALSE(deep_equal(a, b));
    REQUIRE(deep_equal(a, b, &registry));
    REQUIRE_FALSE(deep_equal(a, item(1, "pear", 10), &registry));
}

TEST_CASE("key_string", "[value][equal]") {
    REQUIRE(key_string(Value{"abc"}) == "abc");
    REQUIRE(key_string(Value{12}) == "12");
}

// ============================================================
// Type registry
// ============================================================

TEST_CASE("TypeRegistry describes record types", "[value][registry]") {
    auto registry = make_registry();

    SECTION("flags") {
        REQUIRE(registry.flags("Item", "id") == FieldFlags::Key);
        REQUIRE(has_flag(registry.flags("Item", "cache"), FieldFlags::Ignore));
        REQUIRE(registry.flags("Item", "unknown") == FieldFlags::None);
        REQUIRE(registry.flags("Other", "id") == FieldFlags::None);
    }

    SECTION("key field") {
        REQUIRE(registry.find("Item")->key_field() == "id");
        REQUIRE(registry.key_of(item(7, "x"))->as_int64() == 7);
        REQUIRE_FALSE(registry.key_of(Value{7}).has_value());
        REQUIRE(registry.key_of(Value::ref(item(3, "y")))->as_int64() == 3);
    }

    SECTION("declared fields come first, the rest by name") {
        Value r = Value::make_record("Item", {{"name", "n"}, {"zeta", 1}, {"id", 1}, {"alpha", 2}});
        auto order = registry.field_order(*r.get_record());
        REQUIRE(order == std::vector<std::string>{"id", "name", "cache", "alpha", "zeta"});
    }

    SECTION("unregistered types use ascending names") {
        Value r = Value::make_record("Loose", {{"b", 1}, {"a", 2}});
        REQUIRE(field_order(nullptr, *r.get_record()) == std::vector<std::string>{"a", "b"});
    }
}

// ============================================================
// Serialization
// ============================================================

TEST_CASE("Binary serialization round trip", "[value][serialization]") {
    Value original = Value::map({
        {"int", 42},
        {"big", int64_t{1} << 40},
        {"unsigned", uint64_t{18446744073709551615ULL}},
        {"float", 1.5f},
        {"double", 0.1},
        {"flag", true},
        {"text", "hello"},
        {"list", Value::vector({1, "two", Value{}})},
        {"fixed", Value::array({1, 2})},
        {"record", item(1, "apple")},
        {"ref", Value::ref(Value{"target"})},
        {"nil", Value::null_ref()},
        {"poly", Value::poly(Value::map({{"k", 1}}))},
    });

    ByteBuffer bytes = serialize(original);
    REQUIRE(bytes.size() == serialized_size(original));
    REQUIRE(deserialize(bytes) == original);
}

TEST_CASE("Binary serialization is canonical", "[value][serialization]") {
    Value a = Value::map({{"x", 1}, {"y", 2}, {"z", 3}});
    Value b = Value::map({{"z", 3}, {"x", 1}, {"y", 2}});
    REQUIRE(serialize(a) == serialize(b));
}

TEST_CASE("Binary deserialization rejects truncated input", "[value][serialization]") {
    ByteBuffer bytes = serialize(Value{"a long enough string"});
    bytes.resize(bytes.size() - 3);
    REQUIRE_THROWS_AS(deserialize(bytes), std::runtime_error);
}

TEST_CASE("JSON serialization", "[value][serialization][json]") {
    SECTION("compact output sorts keys") {
        Value v = Value::map({{"b", 1}, {"a", Value::vector({true, Value{}})}});
        REQUIRE(to_json(v, true) == R"({"a":[true,null],"b":1})");
    }

    SECTION("records and references are written as their content") {
        Value v = Value::map({{"r", Value::ref(item(1, "x"))}});
        REQUIRE(to_json(v, true) == R"({"r":{"cache":0,"id":1,"name":"x"}})");
    }

    SECTION("parse") {
        std::string error;
        Value v = from_json(R"({"n": 5, "big": 5000000000, "d": 1.25, "s": "a\nb", "l": [1, "x"]})", &error);
        REQUIRE(error.empty());
        REQUIRE(v.at("n").is<int32_t>());
        REQUIRE(v.at("big").is<int64_t>());
        REQUIRE(v.at("d").as_number() == Catch::Approx(1.25));
        REQUIRE(v.at("s").as_string() == "a\nb");
        REQUIRE(v.at("l").size() == 2);
    }

    SECTION("parse error") {
        std::string error;
        Value v = from_json("{\"a\": ", &error);
        REQUIRE(v.is_null());
        REQUIRE_FALSE(error.empty());
    }
}
