// test_apply.cpp - Tests for lenient, checked and resolved patch application

#include <catch2/catch_all.hpp>
#include <lager_delta/builder.h>
#include <lager_delta/diff.h>
#include <lager_delta/patch.h>
#include <lager_delta/resolvers.h>
#include <lager_delta/value.h>

#include <string>
#include <vector>

using namespace lager_delta;

namespace {

Value config_v1() {
    return Value::map({{"Name", "v1"}, {"Value", 10}, {"Options", Value::vector({"a", "b"})}});
}

Value config_v2() {
    return Value::map({{"Name", "v2"}, {"Value", 20}, {"Options", Value::vector({"a", "c"})}});
}

/// Records every request; accepts or rejects all of them.
class RecordingResolver : public ConflictResolver {
public:
    explicit RecordingResolver(bool accept) : accept_(accept) {}

    std::optional<Value> resolve(const ResolveRequest& request) override {
        requests.push_back(request);
        if (!accept_) {
            return std::nullopt;
        }
        return request.proposed.value_or(Value{});
    }

    std::vector<ResolveRequest> requests;

private:
    bool accept_;
};

const ResolveRequest* request_at(const RecordingResolver& r, std::string_view pointer) {
    for (const auto& req : r.requests) {
        if (path_to_pointer(req.path) == pointer) {
            return &req;
        }
    }
    return nullptr;
}

} // namespace

// ============================================================
// Lenient apply
// ============================================================

TEST_CASE("apply reproduces the diff target", "[apply][lenient]") {
    Patch p = diff(config_v1(), config_v2());
    REQUIRE(p.apply(config_v1()) == config_v2());
}

TEST_CASE("apply keeps going past failures", "[apply][lenient]") {
    Patch p = diff(Value::map({{"a", 1}, {"b", 2}}), Value::map({{"a", 3}}));

    std::vector<std::string> errors;
    Value out = p.apply(Value::map({{"a", 1}}), &errors);
    REQUIRE(out == Value::map({{"a", 3}}));
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].rfind("/b: ", 0) == 0);
}

TEST_CASE("apply reports out of range sequence edits", "[apply][lenient]") {
    Patch p = diff(Value::vector({1, 2, 3}), Value::vector({1, 2}));
    std::vector<std::string> errors;
    Value out = p.apply(Value::vector({1}), &errors);
    REQUIRE(out == Value::vector({1}));
    REQUIRE(errors.size() == 1);
}

TEST_CASE("apply reports container mismatches", "[apply][lenient]") {
    Patch p = diff(Value::map({{"a", 1}}), Value::map({{"a", 2}}));
    std::vector<std::string> errors;
    Value out = p.apply(Value{7}, &errors);
    REQUIRE(out == Value{7});
    REQUIRE(errors.size() == 1);
}

TEST_CASE("apply shares untouched subtrees", "[apply][sharing]") {
    Value big = Value::vector({1, 2, 3, 4, 5});
    Value root = Value::map({{"big", big}, {"small", 1}});
    Patch p = diff(root, root.set("small", 2));

    Value out = p.apply(root);
    const ValueBox* before = root.get_if<ValueMap>()->find("big");
    const ValueBox* after = out.get_if<ValueMap>()->find("big");
    REQUIRE(&before->get() == &after->get());
}

// ============================================================
// Checked apply
// ============================================================

TEST_CASE("apply_checked rejects stale input", "[apply][checked]") {
    Patch p = diff(config_v1(), config_v2());
    Value once = p.apply_checked(config_v1());
    REQUIRE(once == config_v2());
    REQUIRE_THROWS_AS(p.apply_checked(once), ApplyError);

    SECTION("non-strict patches skip old value checks") {
        REQUIRE(p.with_strict(false).apply_checked(once) == config_v2());
    }
}

TEST_CASE("apply_checked collects every failure", "[apply][checked]") {
    Patch p = diff(Value::map({{"a", 1}, {"b", 2}}), Value::map({{"a", 3}, {"b", 4}}));
    try {
        (void)p.apply_checked(Value::map({{"a", 9}, {"b", 9}}));
        FAIL("expected ApplyError");
    } catch (const ApplyError& e) {
        REQUIRE(e.errors().size() == 2);
        REQUIRE(std::string(e.what()).rfind("2 errors occurred:", 0) == 0);
    }
}

TEST_CASE("ApplyError message", "[apply][error]") {
    ApplyError single(std::vector<std::string>{"/a: broken"});
    REQUIRE(std::string(single.what()) == "/a: broken");

    ApplyError several(std::vector<std::string>{"x", "y"});
    REQUIRE(std::string(several.what()) == "2 errors occurred:\n  - x\n  - y");
    REQUIRE(several.errors().size() == 2);
}

TEST_CASE("Test operations verify without changing", "[apply][checked]") {
    Value doc = Value::map({{"a", 1}});
    PatchBuilder builder(doc);
    builder.at("/a").test(2);
    Patch p = builder.build();

    REQUIRE(p.apply(doc) == doc);
    REQUIRE_THROWS_AS(p.apply_checked(doc), ApplyError);
    REQUIRE(p.apply_checked(Value::map({{"a", 2}})) == Value::map({{"a", 2}}));
}

// ============================================================
// Conditions
// ============================================================

TEST_CASE("Global condition", "[apply][condition]") {
    Value doc = Value::map({{"version", 1}, {"x", 1}});
    Patch p = diff(doc, doc.set("x", 2)).with_condition(cond::eq("/version", 2));

    REQUIRE(p.apply(doc) == doc);
    REQUIRE_THROWS_AS(p.apply_checked(doc), ApplyError);

    Value v2 = doc.set("version", 2);
    REQUIRE(p.apply(v2).at("x").as_int64() == 2);
}

TEST_CASE("if and unless guards skip silently", "[apply][condition]") {
    Value doc = Value::map({{"mode", "view"}, {"count", 1}});

    PatchBuilder builder(doc);
    builder.at("/count").put(2).only_if(cond::eq("/mode", "edit"));
    Patch p = builder.build();

    REQUIRE(p.apply(doc) == doc);
    REQUIRE(p.apply_checked(doc) == doc);
    REQUIRE(p.apply(doc.set("mode", "edit")).at("count").as_int64() == 2);

    PatchBuilder unless_builder(doc);
    unless_builder.at("/count").put(3).unless(cond::eq("/mode", "view"));
    REQUIRE(unless_builder.build().apply_checked(doc) == doc);
}

TEST_CASE("local conditions fail verification", "[apply][condition]") {
    Value doc = Value::map({{"count", 150}});

    PatchBuilder builder(doc);
    builder.at("/count").set(50, 151).when(cond::lt("", 100));
    Patch p = builder.build();

    REQUIRE_THROWS_AS(p.apply_checked(doc), ApplyError);
    // lenient application does not evaluate local conditions
    REQUIRE(p.apply(doc).at("count").as_int64() == 151);
    REQUIRE(p.apply_checked(Value::map({{"count", 50}})).at("count").as_int64() == 151);
}

TEST_CASE("guard evaluation errors", "[apply][condition]") {
    Value doc = Value::map({{"name", "x"}, {"count", 1}});

    PatchBuilder builder(doc);
    builder.at("/count").put(2).only_if(cond::lt("/name", 5));
    Patch p = builder.build();

    REQUIRE(p.apply(doc) == doc);
    REQUIRE_THROWS_AS(p.apply_checked(doc), ApplyError);
}

// ============================================================
// Copy and move
// ============================================================

TEST_CASE("copy and move operations", "[apply][copy]") {
    Value doc = Value::map({{"src", Value::map({{"v", 1}})}, {"other", 0}});

    SECTION("copy") {
        PatchBuilder builder(doc);
        builder.at("/dst").copy("/src");
        Value out = builder.build().apply_checked(doc);
        REQUIRE(out.at("dst") == out.at("src"));
    }

    SECTION("move") {
        PatchBuilder builder(doc);
        builder.at("/dst").move("/src");
        Value out = builder.build().apply_checked(doc);
        REQUIRE(out.at("dst") == Value::map({{"v", 1}}));
        REQUIRE_FALSE(out.contains("src"));
    }

    SECTION("missing source") {
        PatchBuilder builder(doc);
        builder.at("/dst").copy("/src");
        Patch p = builder.build();
        REQUIRE_THROWS_AS(p.apply_checked(Value::map({{"other", 0}})), ApplyError);
    }
}

// ============================================================
// Resolved apply
// ============================================================

TEST_CASE("apply_resolved consults the resolver for every write", "[apply][resolved]") {
    Value a = Value::map({{"a", 1}, {"b", 2}});
    Value b = Value::map({{"a", 5}, {"c", 3}});
    Patch p = diff(a, b);

    SECTION("accepting everything reaches the target") {
        RecordingResolver resolver(true);
        REQUIRE(p.apply_resolved(a, resolver) == b);
        REQUIRE(resolver.requests.size() == 3);

        auto* removed = request_at(resolver, "/b");
        REQUIRE(removed != nullptr);
        REQUIRE(removed->kind == OpKind::Remove);
        REQUIRE(removed->current->as_int64() == 2);
        REQUIRE_FALSE(removed->proposed.has_value());

        auto* added = request_at(resolver, "/c");
        REQUIRE(added->kind == OpKind::Add);
        REQUIRE_FALSE(added->current.has_value());
        REQUIRE(added->proposed->as_int64() == 3);

        auto* replaced = request_at(resolver, "/a");
        REQUIRE(replaced->kind == OpKind::Replace);
        REQUIRE(replaced->current->as_int64() == 1);
    }

    SECTION("rejecting everything leaves the input") {
        RecordingResolver resolver(false);
        REQUIRE(p.apply_resolved(a, resolver) == a);
    }

    SECTION("old values are not checked") {
        RecordingResolver resolver(true);
        Value drifted = Value::map({{"a", 100}, {"b", 2}});
        REQUIRE(p.apply_resolved(drifted, resolver) == b);
    }
}

TEST_CASE("LastWriterWinsResolver", "[apply][resolved][lww]") {
    Value a = Value::map({{"a", 1}, {"b", 1}});
    Patch p = diff(a, Value::map({{"a", 2}, {"b", 2}}));

    ReplicaMetadata metadata;
    metadata.record(parse_path("/a"), Timestamp{100, 0, "local"}, false);

    LastWriterWinsResolver resolver(metadata, Timestamp{50, 0, "remote"});
    Value out = p.apply_resolved(a, resolver);
    REQUIRE(out.at("a").as_int64() == 1);
    REQUIRE(out.at("b").as_int64() == 2);
    REQUIRE(resolver.accepted() == 1);
    REQUIRE(resolver.rejected() == 1);
    REQUIRE(metadata.time_of(parse_path("/b"))->wall == 50);

    SECTION("a later write wins") {
        LastWriterWinsResolver later(metadata, Timestamp{200, 0, "remote"});
        REQUIRE(p.apply_resolved(a, later).at("a").as_int64() == 2);
        REQUIRE(metadata.time_of(parse_path("/a"))->wall == 200);
    }

    SECTION("a parent write shadows older children") {
        ReplicaMetadata parent;
        parent.record(Path{}, Timestamp{100, 0, "local"}, false);
        LastWriterWinsResolver older(parent, Timestamp{60, 0, "remote"});
        REQUIRE(p.apply_resolved(a, older) == a);
    }
}

TEST_CASE("ReplicaMetadata keeps the latest time per location", "[apply][resolved][lww]") {
    ReplicaMetadata m;
    m.record(parse_path("/x"), Timestamp{10, 0, "a"}, false);
    m.record(parse_path("/x"), Timestamp{5, 0, "b"}, false);
    REQUIRE(m.time_of(parse_path("/x"))->wall == 10);

    m.record(parse_path("/x"), Timestamp{10, 1, "a"}, true);
    REQUIRE(m.time_of(parse_path("/x/deep"))->logical == 1);
    REQUIRE_FALSE(m.time_of(parse_path("/y")).has_value());

    ReplicaMetadata other;
    other.record(parse_path("/y"), Timestamp{3, 0, "c"}, false);
    m.merge_from(other);
    REQUIRE(m.time_of(parse_path("/y"))->node == "c");
}
