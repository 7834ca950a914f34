// test_diff.cpp - Tests for structural diff of maps, records, arrays and references

#include <catch2/catch_all.hpp>
#include <lager_delta/diff.h>
#include <lager_delta/equal.h>
#include <lager_delta/patch.h>
#include <lager_delta/value.h>

#include <string>
#include <vector>

using namespace lager_delta;

namespace {

std::vector<WalkEntry> entries_of(const Patch& patch) {
    std::vector<WalkEntry> out;
    patch.walk([&](const WalkEntry& e) { out.push_back(e); });
    return out;
}

const WalkEntry* find_entry(const std::vector<WalkEntry>& entries, std::string_view pointer) {
    for (const auto& e : entries) {
        if (path_to_pointer(e.path) == pointer) {
            return &e;
        }
    }
    return nullptr;
}

TypeRegistry make_registry() {
    TypeRegistry registry;
    registry.register_type("Item", {{"id", FieldFlags::Key}, {"name"}, {"cache", FieldFlags::Ignore}});
    registry.register_type("Account", {{"id", FieldFlags::ReadOnly}, {"owner"}, {"bounds", FieldFlags::Atomic}});
    return registry;
}

} // namespace

// ============================================================
// Identity and round trip
// ============================================================

TEST_CASE("diff of equal values is empty", "[diff][basic]") {
    Value v = Value::map({{"a", 1}, {"b", Value::vector({1, 2, 3})}, {"c", Value::ref(Value{"x"})}});
    REQUIRE(diff(v, v).is_empty());
    REQUIRE(diff(v, Value::map({{"c", Value::ref(Value{"x"})}, {"b", Value::vector({1, 2, 3})}, {"a", 1}}))
                .is_empty());
    REQUIRE(diff(Value{}, Value{}).is_empty());
}

TEST_CASE("diff then apply reproduces the target", "[diff][roundtrip]") {
    auto check = [](const Value& a, const Value& b) {
        Patch p = diff(a, b);
        REQUIRE(p.apply(a) == b);
        REQUIRE(p.apply_checked(a) == b);
    };

    SECTION("scalars") {
        check(Value{1}, Value{2});
        check(Value{1}, Value{"one"});
        check(Value{}, Value{5});
        check(Value{5}, Value{});
    }

    SECTION("maps") {
        check(Value::map({{"a", 1}, {"b", 2}}), Value::map({{"b", 3}, {"c", 4}}));
        check(Value::map({{"nested", Value::map({{"x", 1}})}}),
              Value::map({{"nested", Value::map({{"x", 2}, {"y", 3}})}}));
    }

    SECTION("sequences") {
        check(Value::vector({1, 2, 3}), Value::vector({3, 2, 1}));
        check(Value::vector({}), Value::vector({"a", "b"}));
        check(Value::vector({"a", "b", "c", "d"}), Value::vector({"b", "x", "d", "e"}));
    }

    SECTION("records, arrays and references") {
        check(Value::make_record("P", {{"x", 1}, {"y", 2}}), Value::make_record("P", {{"x", 1}, {"y", 5}}));
        check(Value::array({1, 2, 3}), Value::array({1, 9, 3}));
        check(Value::ref(Value::map({{"k", 1}})), Value::ref(Value::map({{"k", 2}})));
        check(Value::null_ref(), Value::ref(Value{1}));
    }
}

// ============================================================
// Shape of the operation tree
// ============================================================

TEST_CASE("diff of a configuration document", "[diff][scenario]") {
    Value before = Value::map({{"Name", "v1"}, {"Value", 10}, {"Options", Value::vector({"a", "b"})}});
    Value after = Value::map({{"Name", "v2"}, {"Value", 20}, {"Options", Value::vector({"a", "c"})}});

    Patch patch = diff(before, after);
    auto entries = entries_of(patch);
    REQUIRE(entries.size() >= 3);

    auto* option = find_entry(entries, "/Options/1");
    REQUIRE(option != nullptr);
    REQUIRE(option->kind == OpKind::Replace);
    REQUIRE(option->old_value.as_string() == "b");
    REQUIRE(option->new_value.as_string() == "c");

    auto* name = find_entry(entries, "/Name");
    REQUIRE(name != nullptr);
    REQUIRE(name->new_value.as_string() == "v2");

    REQUIRE(patch.apply(before) == after);
}

TEST_CASE("diff of maps", "[diff][map]") {
    Value a = Value::map({{"keep", 1}, {"drop", 2}, {"change", 3}});
    Value b = Value::map({{"keep", 1}, {"change", 4}, {"new", 5}});

    Patch p = diff(a, b);
    auto* m = p.root()->get_if<MapOp>();
    REQUIRE(m != nullptr);
    REQUIRE(m->added.size() == 1);
    REQUIRE(m->added[0].first == "new");
    REQUIRE(m->removed.size() == 1);
    REQUIRE(m->removed[0].first == "drop");
    REQUIRE(m->modified.size() == 1);
    REQUIRE(m->modified[0].first == "change");

    auto entries = entries_of(p);
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].kind == OpKind::Remove);
    REQUIRE(entries[1].kind == OpKind::Add);
    REQUIRE(entries[2].kind == OpKind::Replace);
}

TEST_CASE("diff of different kinds replaces the whole value", "[diff][kind]") {
    Patch p = diff(Value::map({{"v", 1}}), Value::map({{"v", Value::vector({1})}}));
    auto entries = entries_of(p);
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].kind == OpKind::Replace);
    REQUIRE(entries[0].new_value == Value::vector({1}));

    Patch records = diff(Value::make_record("A", {{"x", 1}}), Value::make_record("B", {{"x", 1}}));
    REQUIRE(records.root()->is<ValueOp>());

    Patch added = diff(Value{}, Value{1});
    REQUIRE(added.root()->kind() == OpKind::Add);
}

TEST_CASE("diff of fixed arrays", "[diff][array]") {
    SECTION("same size diffs per index") {
        Patch p = diff(Value::array({1, 2, 3}), Value::array({1, 5, 6}));
        auto* arr = p.root()->get_if<FixedArrayOp>();
        REQUIRE(arr != nullptr);
        REQUIRE(arr->indices.size() == 2);
        REQUIRE(arr->indices[0].first == 1);
    }

    SECTION("size change replaces the array") {
        Patch p = diff(Value::array({1, 2}), Value::array({1, 2, 3}));
        REQUIRE(p.root()->is<ValueOp>());
    }
}

TEST_CASE("diff of references", "[diff][ref]") {
    SECTION("changed target") {
        Patch p = diff(Value::ref(Value::map({{"a", 1}})), Value::ref(Value::map({{"a", 2}})));
        auto* ref = p.root()->get_if<RefOp>();
        REQUIRE(ref != nullptr);
        REQUIRE(ref->inner->is<MapOp>());
        REQUIRE(path_to_pointer(entries_of(p)[0].path) == "/a");
    }

    SECTION("emptied reference") {
        Patch p = diff(Value::ref(Value{1}), Value::null_ref());
        REQUIRE(p.root()->kind() == OpKind::Remove);
    }

    SECTION("reference kind change replaces the value") {
        Patch p = diff(Value::ref(Value{1}), Value::poly(Value{1}));
        REQUIRE(p.root()->is<ValueOp>());
    }
}

// ============================================================
// Registry-driven behaviour
// ============================================================

TEST_CASE("diff honours field flags", "[diff][registry]") {
    auto registry = make_registry();
    DiffOptions options{&registry};

    SECTION("ignored fields never appear") {
        Value a = Value::make_record("Item", {{"id", 1}, {"name", "a"}, {"cache", 1}});
        Value b = Value::make_record("Item", {{"id", 1}, {"name", "a"}, {"cache", 2}});
        REQUIRE(diff(a, b, options).is_empty());
        REQUIRE_FALSE(diff(a, b).is_empty());
    }

    SECTION("read-only fields are diffed but refuse to apply") {
        Value a = Value::make_record("Account", {{"id", 1}, {"owner", "x"}});
        Value b = Value::make_record("Account", {{"id", 2}, {"owner", "y"}});
        Patch p = diff(a, b, options);

        auto* rec = p.root()->get_if<RecordOp>();
        REQUIRE(rec != nullptr);
        REQUIRE(rec->fields.size() == 2);
        REQUIRE(rec->fields[0].first == "id");
        REQUIRE(rec->fields[0].second->is<ReadOnlyOp>());

        std::vector<std::string> errors;
        Value applied = p.apply(a, &errors);
        REQUIRE(errors.size() == 1);
        REQUIRE(applied.at("id").as_int64() == 1);
        REQUIRE(applied.at("owner").as_string() == "y");
        REQUIRE_THROWS_AS(p.apply_checked(a), ApplyError);
    }

    SECTION("atomic fields are replaced whole") {
        Value a = Value::make_record("Account", {{"bounds", Value::map({{"lo", 0}, {"hi", 9}})}});
        Value b = Value::make_record("Account", {{"bounds", Value::map({{"lo", 1}, {"hi", 9}})}});
        Patch p = diff(a, b, options);
        auto entries = entries_of(p);
        REQUIRE(entries.size() == 1);
        REQUIRE(path_to_pointer(entries[0].path) == "/bounds");
        REQUIRE(entries[0].new_value == Value::map({{"lo", 1}, {"hi", 9}}));
    }
}

TEST_CASE("diff uses registered custom differs", "[diff][registry]") {
    TypeRegistry registry;
    registry.register_differ("Blob", [](const Value& a, const Value& b) {
        return make_value_op(a, b);
    });
    registry.register_differ("Broken", [](const Value&, const Value&) -> OperationPtr {
        throw std::runtime_error("unsupported");
    });

    Value a = Value::make_record("Blob", {{"bytes", Value::vector({1, 2})}});
    Value b = Value::make_record("Blob", {{"bytes", Value::vector({1, 3})}});
    Patch p = diff(a, b, DiffOptions{&registry});
    REQUIRE(p.root()->is<ValueOp>());
    REQUIRE(p.apply(a) == b);

    Value c = Value::make_record("Broken", {{"v", 1}});
    Value d = Value::make_record("Broken", {{"v", 2}});
    REQUIRE_THROWS_AS(diff(c, d, DiffOptions{&registry}), DiffError);
}

TEST_CASE("diff skips ignored paths", "[diff][options]") {
    DiffOptions options;
    options.ignore_paths.push_back(parse_path("/meta/updated"));

    Value a = Value::map({{"meta", Value::map({{"updated", 1}, {"by", "a"}})}});
    Value b = Value::map({{"meta", Value::map({{"updated", 2}, {"by", "a"}})}});
    REQUIRE(diff(a, b, options).is_empty());

    Value c = Value::map({{"meta", Value::map({{"updated", 2}, {"by", "b"}})}});
    auto entries = entries_of(diff(a, c, options));
    REQUIRE(entries.size() == 1);
    REQUIRE(path_to_pointer(entries[0].path) == "/meta/by");
}

// ============================================================
// Relocation detection
// ============================================================

TEST_CASE("diff detects relocated records", "[diff][moves]") {
    DiffOptions options;
    options.detect_moves = true;
    Value item = Value::make_record("Item", {{"id", 1}, {"name", "widget"}});

    SECTION("a record moved between map keys becomes a move") {
        Value a = Value::map({{"items", Value::map({{"old", item}})}});
        Value b = Value::map({{"items", Value::map({{"new", item}})}});

        Patch p = diff(a, b, options);
        auto entries = entries_of(p);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].kind == OpKind::Move);
        REQUIRE(path_to_pointer(entries[0].path) == "/items/new");
        REQUIRE(path_to_pointer(*entries[0].from) == "/items/old");
        REQUIRE(p.apply(a) == b);
    }

    SECTION("a record duplicated elsewhere becomes a copy") {
        Value a = Value::map({{"primary", item}});
        Value b = Value::map({{"primary", item}, {"backup", item}});

        Patch p = diff(a, b, options);
        auto entries = entries_of(p);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].kind == OpKind::Copy);
        REQUIRE(path_to_pointer(*entries[0].from) == "/primary");
        REQUIRE(p.apply(a) == b);
    }

    SECTION("without the option the same change is add plus remove") {
        Value a = Value::map({{"old", item}});
        Value b = Value::map({{"new", item}});
        auto entries = entries_of(diff(a, b));
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].kind == OpKind::Remove);
        REQUIRE(entries[1].kind == OpKind::Add);
    }
}
