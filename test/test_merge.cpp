// test_merge.cpp - Tests for patch merging, replicas and the hybrid logical clock

#include <catch2/catch_all.hpp>
#include <lager_delta/clock.h>
#include <lager_delta/diff.h>
#include <lager_delta/merge.h>
#include <lager_delta/replica.h>
#include <lager_delta/resolvers.h>
#include <lager_delta/value.h>

#include <memory>
#include <string>

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

/// Accepts every conflict with a fixed value.
class FixedResolver : public ConflictResolver {
public:
    explicit FixedResolver(Value v) : value_(std::move(v)) {}

    std::optional<Value> resolve(const ResolveRequest& request) override {
        last = request;
        return value_;
    }

    std::optional<ResolveRequest> last;

private:
    Value value_;
};

/// Wall source shared by the replicas of one test.
struct ManualWall {
    std::shared_ptr<int64_t> now = std::make_shared<int64_t>(1000);

    LogicalClock::WallSource source() const {
        auto shared = now;
        return [shared] { return *shared; };
    }
    void set(int64_t ms) { *now = ms; }
};

} // namespace

// ============================================================
// merge()
// ============================================================

TEST_CASE("Disjoint changes combine", "[merge]") {
    Value base = Value::map({{"a", 1}, {"b", 1}, {"c", 1}});
    Patch ours = diff(base, base.set("a", 2));
    Patch theirs = diff(base, base.set("b", 3));

    MergeResult merged = merge(ours, theirs);
    REQUIRE_FALSE(merged.has_conflicts());
    REQUIRE(merged.patch.apply_checked(base) == Value::map({{"a", 2}, {"b", 3}, {"c", 1}}));
}

TEST_CASE("Identical changes are kept once", "[merge]") {
    Value base = Value::map({{"a", 1}, {"list", Value::vector({1, 2, 3})}});
    Value target = Value::map({{"a", 2}, {"list", Value::vector({1, 3})}});

    MergeResult merged = merge(diff(base, target), diff(base, target));
    REQUIRE_FALSE(merged.has_conflicts());
    REQUIRE(merged.patch.apply_checked(base) == target);
}

TEST_CASE("Concurrent writes to one location conflict", "[merge][conflict]") {
    Value base = Value::map({{"a", 1}});
    Patch ours = diff(base, base.set("a", 2));
    Patch theirs = diff(base, base.set("a", 3));

    SECTION("ours wins without timestamps") {
        MergeResult merged = merge(ours, theirs);
        REQUIRE(merged.conflicts.size() == 1);

        const MergeConflict& c = merged.conflicts[0];
        REQUIRE(path_to_pointer(c.path) == "/a");
        REQUIRE(c.chosen == MergeSide::Ours);
        REQUIRE(c.ours->as_int64() == 2);
        REQUIRE(c.theirs->as_int64() == 3);
        REQUIRE(to_string(c) ==
                "conflict at /a: concurrent modification (ours: replace 2, theirs: replace 3, kept ours)");
        REQUIRE(merged.patch.apply(base).at("a").as_int64() == 2);
    }

    SECTION("the later timestamp wins") {
        MergeResult merged = merge(ours.with_timestamp(Timestamp{10, 0, "x"}),
                                   theirs.with_timestamp(Timestamp{20, 0, "y"}));
        REQUIRE(merged.conflicts[0].chosen == MergeSide::Theirs);
        REQUIRE(merged.patch.apply(base).at("a").as_int64() == 3);
        REQUIRE(merged.patch.timestamp()->wall == 20);
    }

    SECTION("a resolver decides") {
        FixedResolver resolver(Value{99});
        MergeResult merged = merge(ours, theirs, &resolver);
        REQUIRE(merged.conflicts[0].chosen == MergeSide::Theirs);
        REQUIRE(resolver.last->current->as_int64() == 2);
        REQUIRE(resolver.last->proposed->as_int64() == 3);
        REQUIRE(merged.patch.apply(base).at("a").as_int64() == 99);
    }
}

TEST_CASE("Editing inside a removed entry conflicts", "[merge][conflict]") {
    Value base = Value::map({{"doc", Value::map({{"x", 1}})}, {"other", 1}});
    Patch ours = diff(base, Value::map({{"other", 1}}));
    Patch theirs = diff(base, base.set("doc", Value::map({{"x", 2}})));

    MergeResult merged = merge(ours, theirs);
    REQUIRE(merged.conflicts.size() == 1);
    REQUIRE(merged.conflicts[0].message == "modification of a removed or replaced parent");
    REQUIRE(merged.conflicts[0].ours_kind == OpKind::Remove);
    REQUIRE_FALSE(merged.patch.apply(base).contains("doc"));
}

TEST_CASE("Concurrent inserts are ordered independently of the sides", "[merge][sequence]") {
    Value base = Value::vector({1, 3});
    Patch left = diff(base, Value::vector({1, 2, 3}));
    Patch right = diff(base, Value::vector({1, 4, 3}));

    Value expected = Value::vector({1, 2, 4, 3});
    REQUIRE(merge(left, right).patch.apply(base) == expected);
    REQUIRE(merge(right, left).patch.apply(base) == expected);
}

TEST_CASE("Keyed edits and moves of one entity combine", "[merge][sequence][keyed]") {
    auto registry = make_registry();
    DiffOptions options{&registry};

    Value base = Value::vector({item(1, "a"), item(2, "b")});
    Patch renamed = diff(base, Value::vector({item(1, "a"), item(2, "B")}), options);
    Patch moved = diff(base, Value::vector({item(2, "b"), item(1, "a")}), options);

    MergeResult merged = merge(renamed, moved);
    REQUIRE_FALSE(merged.has_conflicts());
    REQUIRE(merged.patch.apply(base) == Value::vector({item(2, "B"), item(1, "a")}));
}

TEST_CASE("Merged patch settings", "[merge]") {
    Value base = Value::map({{"a", 1}, {"b", 1}});
    Patch ours = diff(base, base.set("a", 2)).with_condition(cond::defined("/a"));
    Patch theirs = diff(base, base.set("b", 2)).with_condition(cond::defined("/b")).with_strict(false);

    MergeResult merged = merge(ours, theirs);
    REQUIRE_FALSE(merged.patch.strict());
    REQUIRE(to_string(*merged.patch.condition()) == "(defined(/a) AND defined(/b))");

    MergeResult one_sided = merge(ours, Patch{});
    REQUIRE(one_sided.patch.apply(base).at("a").as_int64() == 2);
}

// ============================================================
// LogicalClock
// ============================================================

TEST_CASE("LogicalClock", "[clock]") {
    ManualWall wall;
    LogicalClock clock("n", wall.source());

    Timestamp t1 = clock.now();
    Timestamp t2 = clock.now();
    REQUIRE(t1 == Timestamp{1000, 0, "n"});
    REQUIRE(t2 == Timestamp{1000, 1, "n"});
    REQUIRE(to_string(t2) == "1000.1@n");

    SECTION("never goes backwards") {
        wall.set(500);
        REQUIRE(clock.now() == Timestamp{1000, 2, "n"});
    }

    SECTION("advances with the wall") {
        wall.set(1500);
        REQUIRE(clock.now() == Timestamp{1500, 0, "n"});
    }

    SECTION("folds remote timestamps in") {
        Timestamp merged = clock.update(Timestamp{2000, 5, "r"});
        REQUIRE(merged == Timestamp{2000, 6, "n"});
        REQUIRE(clock.now() == Timestamp{2000, 7, "n"});
        REQUIRE(clock.last() == Timestamp{2000, 7, "n"});
    }

    SECTION("ordering") {
        REQUIRE(Timestamp{1, 0, "b"} < Timestamp{1, 1, "a"});
        REQUIRE(Timestamp{1, 1, "a"} < Timestamp{1, 1, "b"});
        REQUIRE(Timestamp{}.is_zero());
    }
}

// ============================================================
// Replica
// ============================================================

TEST_CASE("Deltas propagate edits", "[replica]") {
    ManualWall wall;
    Value initial = Value::map({{"title", "draft"}, {"count", 0}});
    Replica a("a", initial, nullptr, wall.source());
    Replica b("b", initial, nullptr, wall.source());

    Delta d = a.edit([](const Value& v) { return v.set("title", "final"); });
    REQUIRE_FALSE(d.empty());
    REQUIRE(d.timestamp == Timestamp{1000, 0, "a"});
    REQUIRE(b.apply_delta(d));
    REQUIRE(b.view() == a.view());
    REQUIRE(b.metadata().time_of(parse_path("/title")) == d.timestamp);

    SECTION("unchanged edits produce no delta") {
        Delta none = a.edit([](const Value& v) { return v; });
        REQUIRE(none.empty());
        REQUIRE_FALSE(b.apply_delta(none));
    }

    SECTION("removals are recorded as tombstones") {
        Delta removal = a.edit([](const Value& v) { return Value{v.get_if<ValueMap>()->erase("count")}; });
        REQUIRE(b.apply_delta(removal));
        REQUIRE_FALSE(b.view().contains("count"));
        REQUIRE(b.metadata().tombstones.count("/count") == 1);
    }
}

TEST_CASE("Concurrent writes converge on the later timestamp", "[replica]") {
    ManualWall wall;
    Value initial = Value::map({{"x", 0}, {"y", 0}});
    Replica a("a", initial, nullptr, wall.source());
    Replica b("b", initial, nullptr, wall.source());

    SECTION("same wall time: node id breaks the tie") {
        Delta da = a.edit([](const Value& v) { return v.set("x", 1); });
        Delta db = b.edit([](const Value& v) { return v.set("x", 2); });

        REQUIRE(a.apply_delta(db));
        REQUIRE_FALSE(b.apply_delta(da));
        REQUIRE(a.view() == b.view());
        REQUIRE(a.view().at("x").as_int64() == 2);
    }

    SECTION("a later write wins in either delivery order") {
        Delta da = a.edit([](const Value& v) { return v.set("x", 1); });
        wall.set(2000);
        Delta db = b.edit([](const Value& v) { return v.set("x", 2); });

        REQUIRE_FALSE(b.apply_delta(da));
        REQUIRE(a.apply_delta(db));
        REQUIRE(a.view().at("x").as_int64() == 2);
        REQUIRE(b.view().at("x").as_int64() == 2);
    }

    SECTION("writes to different locations both survive") {
        Delta da = a.edit([](const Value& v) { return v.set("x", 1); });
        Delta db = b.edit([](const Value& v) { return v.set("y", 1); });

        REQUIRE(a.apply_delta(db));
        REQUIRE(b.apply_delta(da));
        REQUIRE(a.view() == Value::map({{"x", 1}, {"y", 1}}));
        REQUIRE(b.view() == a.view());
    }
}

TEST_CASE("Keyed inserts from two replicas converge", "[replica][keyed]") {
    auto registry = make_registry();
    ManualWall wall;
    Value initial = Value::map({{"items", Value::vector({item(1), item(2)})}});
    Replica a("a", initial, &registry, wall.source());
    Replica b("b", initial, &registry, wall.source());

    Delta da = a.edit([](const Value&) {
        return Value::map({{"items", Value::vector({item(1), item(3), item(2)})}});
    });
    Delta db = b.edit([](const Value&) {
        return Value::map({{"items", Value::vector({item(1), item(2), item(4)})}});
    });

    REQUIRE(a.apply_delta(db));
    REQUIRE(b.apply_delta(da));
    REQUIRE(a.view() == b.view());
    REQUIRE(a.view().at("items") == Value::vector({item(1), item(3), item(2), item(4)}));
}

TEST_CASE("State merge keeps the newer location", "[replica][merge]") {
    ManualWall wall;
    Value initial = Value::map({{"title", "t"}, {"count", 0}});
    Replica a("a", initial, nullptr, wall.source());
    Replica b("b", initial, nullptr, wall.source());

    (void)a.edit([](const Value& v) { return v.set("title", "from a"); });
    wall.set(2000);
    (void)b.edit([](const Value& v) { return v.set("count", 5); });

    REQUIRE(a.merge(b));
    REQUIRE(a.view() == Value::map({{"title", "from a"}, {"count", 5}}));

    REQUIRE(b.merge(a));
    REQUIRE(b.view() == a.view());

    REQUIRE_FALSE(a.merge(b));
    REQUIRE_FALSE(a.merge(a));
}

TEST_CASE("State merge prefers the later of two writes", "[replica][merge]") {
    ManualWall wall;
    Value initial = Value::map({{"x", 0}});
    Replica a("a", initial, nullptr, wall.source());
    Replica b("b", initial, nullptr, wall.source());

    (void)a.edit([](const Value& v) { return v.set("x", 1); });
    wall.set(3000);
    (void)b.edit([](const Value& v) { return v.set("x", 2); });

    REQUIRE(a.merge(b));
    REQUIRE(a.view().at("x").as_int64() == 2);
    REQUIRE_FALSE(b.merge(a));
    REQUIRE(b.view().at("x").as_int64() == 2);
}

TEST_CASE("Committed patches are stamped and recorded", "[replica]") {
    ManualWall wall;
    Value initial = Value::map({{"x", 0}});
    Replica a("a", initial, nullptr, wall.source());
    Replica b("b", initial, nullptr, wall.source());

    Patch p = diff(initial, initial.set("x", 7));
    Delta d = a.commit(p);
    REQUIRE(d.patch.timestamp() == d.timestamp);
    REQUIRE(a.view().at("x").as_int64() == 7);
    REQUIRE(b.apply_delta(d));
    REQUIRE(b.view() == a.view());
    REQUIRE(a.commit(Patch{}).empty());
}

TEST_CASE("A failed delta leaves no clocks behind", "[replica]") {
    ManualWall wall;
    Replica a("a", Value::map({{"x", 0}, {"gone", 1}}), nullptr, wall.source());
    Replica b("b", Value::map({{"x", 0}}), nullptr, wall.source());

    // the x write would be accepted, the removal of "gone" cannot apply on b
    Delta d = a.edit([](const Value& v) { return Value{v.get_if<ValueMap>()->erase("gone")}.set("x", 1); });

    REQUIRE_FALSE(b.apply_delta(d));
    REQUIRE(b.view() == Value::map({{"x", 0}}));
    REQUIRE_FALSE(b.metadata().time_of(parse_path("/x")).has_value());
    REQUIRE(b.metadata().clocks.empty());

    SECTION("redelivery after the missing entry arrives applies the write") {
        (void)b.edit([](const Value& v) { return v.set("gone", 2); });
        REQUIRE(b.apply_delta(d));
        REQUIRE(b.view().at("x").as_int64() == 1);
        // the later local write of "gone" wins over the removal
        REQUIRE(b.view().at("gone").as_int64() == 2);
        REQUIRE(b.metadata().time_of(parse_path("/x")) == d.timestamp);
    }
}

TEST_CASE("Edit callbacks may call back into the replica", "[replica]") {
    ManualWall wall;
    Value initial = Value::map({{"x", 0}, {"y", 0}});
    Replica a("a", initial, nullptr, wall.source());

    SECTION("reading") {
        Delta d = a.edit([&a](const Value& v) {
            REQUIRE(a.view() == v);
            REQUIRE(a.metadata().clocks.empty());
            return v.set("x", 1);
        });
        REQUIRE_FALSE(d.empty());
        REQUIRE(a.view().at("x").as_int64() == 1);
    }

    SECTION("committing replays the edit on the newer value") {
        Delta inner;
        Delta outer = a.edit([&](const Value& v) {
            inner = a.commit(diff(v, v.set("y", 5)));
            return v.set("x", 1);
        });
        REQUIRE(a.view() == Value::map({{"x", 1}, {"y", 5}}));
        REQUIRE(inner.timestamp < outer.timestamp);
        // the outer delta carries only its own change
        REQUIRE(outer.patch.apply(initial) == Value::map({{"x", 1}, {"y", 0}}));

        Replica b("b", initial, nullptr, wall.source());
        REQUIRE(b.apply_delta(inner));
        REQUIRE(b.apply_delta(outer));
        REQUIRE(b.view() == a.view());
    }
}
