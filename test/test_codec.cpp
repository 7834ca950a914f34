// test_codec.cpp - Tests for the self-describing patch encoding

#include <catch2/catch_all.hpp>
#include <lager_delta/builder.h>
#include <lager_delta/codec.h>
#include <lager_delta/diff.h>
#include <lager_delta/value.h>

#include <string>

using namespace lager_delta;

namespace {

Value config_v1() {
    return Value::map({{"Name", "v1"}, {"Value", 10}, {"Options", Value::vector({"a", "b"})}});
}

Value config_v2() {
    return Value::map({{"Name", "v2"}, {"Value", 20}, {"Options", Value::vector({"a", "c"})}});
}

PatchCodec builtin_codec() {
    PatchCodec codec;
    register_builtin_kinds(codec);
    return codec;
}

TypeRegistry make_registry() {
    TypeRegistry registry;
    registry.register_type("Item", {{"id", FieldFlags::Key}, {"name"}});
    registry.register_type("Account", {{"id", FieldFlags::ReadOnly}, {"limits", FieldFlags::Atomic}, {"owner"}});
    return registry;
}

/// A document touching every value and operation kind.
Value rich_before() {
    return Value::map({
        {"items", Value::vector({Value::make_record("Item", {{"id", 1}, {"name", "a"}}),
                                 Value::make_record("Item", {{"id", 2}, {"name", "b"}})})},
        {"slots", Value::array({1, 2, 3})},
        {"account", Value::make_record("Account", {{"id", 1},
                                                   {"limits", Value::vector({1, 2})},
                                                   {"owner", Value::ref(Value::map({{"n", "x"}}))}})},
        {"big", int64_t{1} << 40},
        {"ratio", 0.25},
        {"scale", 1.5f},
        {"count", uint64_t{7}},
        {"gone", true},
    });
}

Value rich_after() {
    return Value::map({
        {"items", Value::vector({Value::make_record("Item", {{"id", 2}, {"name", "B"}}),
                                 Value::make_record("Item", {{"id", 1}, {"name", "a"}})})},
        {"slots", Value::array({1, 5, 3})},
        {"account", Value::make_record("Account", {{"id", 1},
                                                   {"limits", Value::vector({1, 3})},
                                                   {"owner", Value::ref(Value::map({{"n", "y"}}))}})},
        {"big", (int64_t{1} << 40) + 1},
        {"ratio", 0.5},
        {"scale", 2.5f},
        {"count", uint64_t{8}},
        {"fresh", Value::poly(Value{"p"})},
    });
}

} // namespace

// ============================================================
// Whole patches
// ============================================================

TEST_CASE("Config patch survives binary and JSON", "[codec]") {
    PatchCodec codec = builtin_codec();
    Patch p = diff(config_v1(), config_v2())
                  .with_condition(cond::eq("/Name", "v1"))
                  .with_timestamp(Timestamp{1700000000000, 3, "node-a"});

    SECTION("binary") {
        Patch back = codec.from_binary(codec.to_binary(p));
        REQUIRE(back.summary() == p.summary());
        REQUIRE(back.timestamp() == p.timestamp());
        REQUIRE(back.strict());
        REQUIRE(back.apply_checked(config_v1()) == config_v2());
    }

    SECTION("JSON") {
        std::string text = codec.to_json(p);
        Patch back = codec.from_json(text);
        REQUIRE(back.summary() == p.summary());
        REQUIRE(back.timestamp() == p.timestamp());
        REQUIRE(back.apply_checked(config_v1()) == config_v2());
        REQUIRE(codec.to_json(back) == text);
    }

    SECTION("non-strict flag") {
        Patch back = codec.from_json(codec.to_json(p.with_strict(false)));
        REQUIRE_FALSE(back.strict());
    }
}

TEST_CASE("Keys that look like indices keep their text", "[codec]") {
    PatchCodec codec = builtin_codec();
    Value before = Value::map({{"m", Value::map({{"007", 1}, {"", 1}})}});
    Value after = Value::map({{"m", Value::map({{"007", 2}, {"", 2}})}});
    Patch p = diff(before, after).with_condition(cond::eq("/m/007", 1));

    SECTION("JSON") {
        Patch back = codec.from_json(codec.to_json(p));
        REQUIRE(back.apply_checked(before) == after);
        REQUIRE(codec.to_json(back) == codec.to_json(p));
    }

    SECTION("binary") {
        Patch back = codec.from_binary(codec.to_binary(p));
        REQUIRE(back.apply_checked(before) == after);
    }
}

TEST_CASE("Every operation kind round trips", "[codec]") {
    PatchCodec codec = builtin_codec();
    auto registry = make_registry();
    DiffOptions options{&registry};

    Value before = rich_before();
    Value after = rich_after();
    Patch p = diff(before, after, options);
    REQUIRE(p.apply(before) == after);

    Patch from_json = codec.from_json(codec.to_json(p));
    REQUIRE(from_json.to_string() == p.to_string());
    REQUIRE(from_json.apply(before) == after);

    Patch from_binary = codec.from_binary(codec.to_binary(p));
    REQUIRE(from_binary.apply(before) == after);
    REQUIRE(from_binary.reverse().apply(after) == before);
}

TEST_CASE("Builder-only operations and guards round trip", "[codec]") {
    PatchCodec codec = builtin_codec();
    Value doc = Value::map({{"src", Value::map({{"v", 1}})}, {"mode", "edit"}, {"n", 3}});

    PatchBuilder builder(doc);
    builder.at("/copy").copy("/src");
    builder.at("/n").test(3);
    builder.at("/note").log("checked n");
    builder.at("/mode")
        .put("view")
        .when(cond::eq("", "edit"))
        .only_if(cond::gt("/n", 1))
        .unless(cond::matches("/mode", "^x", true));
    builder.condition(cond::all_of({cond::defined("/src"), cond::negate(cond::in("/n", {0, 1}))}));
    Patch p = builder.build();

    Patch back = codec.from_json(codec.to_json(p, false));
    REQUIRE(back.to_string() == p.to_string());
    REQUIRE(back.apply_checked(doc) == p.apply_checked(doc));

    PatchBuilder mover(doc);
    mover.at("/dst").move("/src");
    Patch moved = codec.from_binary(codec.to_binary(mover.build()));
    Value out = moved.apply_checked(doc);
    REQUIRE(out.contains("dst"));
    REQUIRE_FALSE(out.contains("src"));
}

// ============================================================
// Values
// ============================================================

TEST_CASE("Encoded values keep their kind", "[codec][value]") {
    const Value values[] = {
        Value{int64_t{5}},
        Value{uint64_t{5}},
        Value{2.5f},
        Value{2.5},
        Value{5},
        Value{"text"},
        Value{false},
        Value{},
        Value::map({{"a", int64_t{1}}}),
        Value::array({1, 2}),
        Value::vector({0.5, "x"}),
        Value::make_record("T", {{"f", 1}}),
        Value::ref(Value{1}),
        Value::null_ref(),
        Value::poly(Value::map({{"k", 1}})),
        Value::empty_poly(),
    };

    for (const auto& v : values) {
        INFO(value_to_string(v));
        Value encoded = PatchCodec::encode_value(v);
        REQUIRE(PatchCodec::decode_value(encoded) == v);

        std::string error;
        Value reparsed = from_json(to_json(encoded, true), &error);
        REQUIRE(error.empty());
        REQUIRE(PatchCodec::decode_value(reparsed) == v);
    }
}

TEST_CASE("Tagged value forms", "[codec][value]") {
    REQUIRE(PatchCodec::encode_value(Value{int64_t{5}}).at("$int64").as_string() == "5");
    REQUIRE(PatchCodec::encode_value(Value::make_record("T", {{"f", 1}})).at("$record").as_string() == "T");
    REQUIRE(PatchCodec::encode_value(Value{5}).as_int64() == 5);
    REQUIRE_THROWS_AS(PatchCodec::decode_value(Value::map({{"plain", 1}})), CodecError);
    REQUIRE_THROWS_AS(PatchCodec::decode_value(Value::map({{"$int64", "abc"}})), CodecError);
}

// ============================================================
// Registration
// ============================================================

TEST_CASE("Only registered kinds are encoded", "[codec][registry]") {
    Patch p = diff(Value::map({{"a", 1}}), Value::map({{"a", 2}}));

    PatchCodec empty;
    REQUIRE_FALSE(empty.has_operation("map"));
    REQUIRE_THROWS_AS(empty.encode(p), CodecError);

    PatchCodec full = builtin_codec();
    REQUIRE(full.has_operation("map"));
    REQUIRE(full.has_condition("compare"));
    Value encoded = full.encode(p);
    REQUIRE_THROWS_AS(empty.decode(encoded), CodecError);

    REQUIRE(condition_kind(*cond::eq("/a", 1)) == "compare");
    REQUIRE(condition_kind(*cond::all_of({})) == "and");
}

TEST_CASE("Custom encoders replace built-in ones", "[codec][registry]") {
    PatchCodec codec = builtin_codec();
    codec.register_operation(
        "value",
        [](const Operation& op, const PatchCodec&) {
            const auto& v = std::get<ValueOp>(op.node);
            return Value::vector({PatchCodec::encode_value(v.old_value), PatchCodec::encode_value(v.new_value)});
        },
        [](const Value& data, const PatchCodec&) {
            return make_value_op(PatchCodec::decode_value(data.at(std::size_t{0})),
                                 PatchCodec::decode_value(data.at(std::size_t{1})));
        });

    Patch p = diff(Value::map({{"a", 1}}), Value::map({{"a", 2}}));
    Value encoded = codec.encode(p);
    REQUIRE(encoded.at("root").at("data").at("modified").is_vector());

    std::string text = codec.to_json(p);
    REQUIRE(text.find(R"("data":[1,2])") != std::string::npos);
    REQUIRE(codec.from_json(text).apply(Value::map({{"a", 1}})) == Value::map({{"a", 2}}));
}

TEST_CASE("Malformed encodings", "[codec][errors]") {
    PatchCodec codec = builtin_codec();

    REQUIRE_THROWS_AS(codec.from_json("{"), CodecError);
    REQUIRE_THROWS_AS(codec.from_json("[1,2]"), CodecError);
    REQUIRE_THROWS_AS(codec.from_json(R"({"version":2,"root":null,"condition":null})"), CodecError);
    REQUIRE_THROWS_AS(codec.from_json(R"({"version":1,"root":{"kind":"nope","data":null},"condition":null})"),
                      CodecError);
    REQUIRE_THROWS_AS(codec.from_binary(ByteBuffer{0xFF, 0x01}), CodecError);

    Patch empty = codec.from_json(R"({"version":1,"root":null,"condition":null})");
    REQUIRE(empty.is_empty());
}
