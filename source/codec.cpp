// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file codec.cpp
/// @brief PatchCodec and the encoders of the built-in kinds.

#include <lager_delta/codec.h>

#include <charconv>
#include <cstdint>

namespace lager_delta {

namespace {

constexpr int32_t format_version = 1;

// ============================================================
// Reading helpers
// ============================================================

const Value* find_member(const Value& obj, std::string_view key)
{
    if (auto* m = obj.get_if<ValueMap>()) {
        if (auto* found = m->find(std::string(key))) return &found->get();
    }
    return nullptr;
}

const Value& required(const Value& obj, std::string_view key, std::string_view what)
{
    if (auto* v = find_member(obj, key)) return *v;
    throw CodecError(std::string(what) + ": missing member '" + std::string(key) + "'");
}

std::string required_string(const Value& obj, std::string_view key, std::string_view what)
{
    const Value& v = required(obj, key, what);
    if (!v.is_string()) {
        throw CodecError(std::string(what) + ": member '" + std::string(key) + "' is not a string");
    }
    return v.as_string();
}

const ValueVector& required_list(const Value& obj, std::string_view key, std::string_view what)
{
    const Value& v = required(obj, key, what);
    if (auto* vec = v.get_if<ValueVector>()) return *vec;
    throw CodecError(std::string(what) + ": member '" + std::string(key) + "' is not a list");
}

bool optional_bool(const Value& obj, std::string_view key)
{
    auto* v = find_member(obj, key);
    return v && v->as_bool();
}

std::size_t to_index(const Value& v, std::string_view what)
{
    if (!v.is_integer() || v.as_number() < 0) {
        throw CodecError(std::string(what) + ": expected a non-negative integer, got " + kind_name(v));
    }
    if (auto* u = v.get_if<uint64_t>()) return static_cast<std::size_t>(*u);
    return static_cast<std::size_t>(v.as_int64());
}

Value from_index(std::size_t i)
{
    return Value{static_cast<int64_t>(i)};
}

Path read_path(const Value& obj, std::string_view key, std::string_view what)
{
    return parse_json_pointer(required_string(obj, key, what));
}

template <typename T>
std::string format_number(T number)
{
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), number);
    return std::string(buffer, result.ptr);
}

template <typename T>
T parse_number(const std::string& text, std::string_view tag)
{
    T number{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), number);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        throw CodecError("invalid " + std::string(tag) + " literal '" + text + "'");
    }
    return number;
}

std::string_view ref_kind_name(RefKind kind)
{
    return kind == RefKind::Owned ? "owned" : "polymorphic";
}

RefKind parse_ref_kind(const std::string& name)
{
    if (name == "owned") return RefKind::Owned;
    if (name == "polymorphic") return RefKind::Polymorphic;
    throw CodecError("unknown reference kind '" + name + "'");
}

CompareOp parse_compare_op(const std::string& text)
{
    for (auto op : {CompareOp::Eq, CompareOp::Ne, CompareOp::Lt, CompareOp::Gt, CompareOp::Le, CompareOp::Ge}) {
        if (to_string(op) == text) return op;
    }
    throw CodecError("unknown comparison operator '" + text + "'");
}

StringOp parse_string_op(const std::string& text)
{
    for (auto op : {StringOp::Contains, StringOp::Starts, StringOp::Ends, StringOp::Matches}) {
        if (to_string(op) == text) return op;
    }
    throw CodecError("unknown string operator '" + text + "'");
}

OpKind parse_op_kind(const std::string& text)
{
    for (auto kind : {OpKind::Add, OpKind::Remove, OpKind::Replace, OpKind::Move,
                      OpKind::Copy, OpKind::Test, OpKind::Log}) {
        if (to_string(kind) == text) return kind;
    }
    throw CodecError("unknown edit kind '" + text + "'");
}

// ============================================================
// Writing helpers
// ============================================================

class ObjectBuilder {
public:
    ObjectBuilder& set(const std::string& key, Value value) {
        t_.set(key, ValueBox{std::move(value)});
        return *this;
    }

    Value done() { return Value{t_.persistent()}; }

private:
    ValueMap::transient_type t_ = ValueMap{}.transient();
};

Value encode_map_entries(const ValueMap& m, Value (*encode)(const Value&))
{
    ObjectBuilder out;
    for (const auto& [key, box] : m) {
        out.set(key, encode(box.get()));
    }
    return out.done();
}

// ============================================================
// Operation encoders
// ============================================================

Value encode_value_op(const Operation& op, const PatchCodec&)
{
    const auto& v = std::get<ValueOp>(op.node);
    return ObjectBuilder{}
        .set("old", PatchCodec::encode_value(v.old_value))
        .set("new", PatchCodec::encode_value(v.new_value))
        .done();
}

OperationPtr decode_value_op(const Value& data, const PatchCodec&)
{
    return make_value_op(PatchCodec::decode_value(required(data, "old", "value")),
                         PatchCodec::decode_value(required(data, "new", "value")));
}

Value encode_record_op(const Operation& op, const PatchCodec& codec)
{
    const auto& r = std::get<RecordOp>(op.node);
    std::vector<Value> fields;
    for (const auto& [name, sub] : r.fields) {
        fields.push_back(Value::vector({Value{name}, codec.encode_operation(sub)}));
    }
    return ObjectBuilder{}.set("type", r.type).set("fields", Value::vector(fields)).done();
}

OperationPtr decode_record_op(const Value& data, const PatchCodec& codec)
{
    std::vector<std::pair<std::string, OperationPtr>> fields;
    for (const auto& entry : required_list(data, "fields", "record")) {
        const Value& pair = entry.get();
        if (pair.size() != 2) throw CodecError("record: field entry must be [name, op]");
        fields.emplace_back(pair.at(std::size_t{0}).as_string(), codec.decode_operation(pair.at(std::size_t{1})));
    }
    auto result = make_record_op(required_string(data, "type", "record"), std::move(fields));
    if (!result) throw CodecError("record: empty field list");
    return result;
}

Value encode_fixed_array_op(const Operation& op, const PatchCodec& codec)
{
    const auto& a = std::get<FixedArrayOp>(op.node);
    std::vector<Value> indices;
    for (const auto& [i, sub] : a.indices) {
        indices.push_back(Value::vector({from_index(i), codec.encode_operation(sub)}));
    }
    return ObjectBuilder{}.set("indices", Value::vector(indices)).done();
}

OperationPtr decode_fixed_array_op(const Value& data, const PatchCodec& codec)
{
    std::vector<std::pair<std::size_t, OperationPtr>> indices;
    for (const auto& entry : required_list(data, "indices", "fixed_array")) {
        const Value& pair = entry.get();
        if (pair.size() != 2) throw CodecError("fixed_array: slot entry must be [index, op]");
        indices.emplace_back(to_index(pair.at(std::size_t{0}), "fixed_array"),
                             codec.decode_operation(pair.at(std::size_t{1})));
    }
    auto result = make_fixed_array_op(std::move(indices));
    if (!result) throw CodecError("fixed_array: empty slot list");
    return result;
}

Value encode_entries(const std::vector<std::pair<std::string, Value>>& entries)
{
    std::vector<Value> out;
    for (const auto& [key, value] : entries) {
        out.push_back(Value::vector({Value{key}, PatchCodec::encode_value(value)}));
    }
    return Value::vector(out);
}

std::vector<std::pair<std::string, Value>> decode_entries(const Value& data, std::string_view key)
{
    std::vector<std::pair<std::string, Value>> out;
    for (const auto& entry : required_list(data, key, "map")) {
        const Value& pair = entry.get();
        if (pair.size() != 2) throw CodecError("map: entry must be [key, value]");
        out.emplace_back(pair.at(std::size_t{0}).as_string(), PatchCodec::decode_value(pair.at(std::size_t{1})));
    }
    return out;
}

Value encode_map_op(const Operation& op, const PatchCodec& codec)
{
    const auto& m = std::get<MapOp>(op.node);
    std::vector<Value> modified;
    for (const auto& [key, sub] : m.modified) {
        modified.push_back(Value::vector({Value{key}, codec.encode_operation(sub)}));
    }
    return ObjectBuilder{}
        .set("added", encode_entries(m.added))
        .set("removed", encode_entries(m.removed))
        .set("modified", Value::vector(modified))
        .done();
}

OperationPtr decode_map_op(const Value& data, const PatchCodec& codec)
{
    MapOp m;
    m.added = decode_entries(data, "added");
    m.removed = decode_entries(data, "removed");
    for (const auto& entry : required_list(data, "modified", "map")) {
        const Value& pair = entry.get();
        if (pair.size() != 2) throw CodecError("map: modified entry must be [key, op]");
        m.modified.emplace_back(pair.at(std::size_t{0}).as_string(), codec.decode_operation(pair.at(std::size_t{1})));
    }
    auto result = make_map_op(std::move(m));
    if (!result) throw CodecError("map: no entries");
    return result;
}

Value encode_edit(const SequenceEdit& edit, const PatchCodec& codec)
{
    ObjectBuilder out;
    out.set("kind", std::string(to_string(edit.kind))).set("index", from_index(edit.index));
    if (edit.kind == OpKind::Move) out.set("from_index", from_index(edit.from_index));
    if (!edit.from_path.empty() || edit.kind == OpKind::Copy) {
        out.set("from_path", path_to_pointer(edit.from_path));
    }
    if (edit.key) out.set("key", PatchCodec::encode_value(*edit.key));
    if (edit.prev_key) out.set("prev_key", PatchCodec::encode_value(*edit.prev_key));
    if (edit.value) out.set("value", PatchCodec::encode_value(*edit.value));
    if (edit.sub) out.set("sub", codec.encode_operation(edit.sub));
    return out.done();
}

SequenceEdit decode_edit(const Value& data, const PatchCodec& codec)
{
    SequenceEdit edit;
    edit.kind = parse_op_kind(required_string(data, "kind", "sequence edit"));
    edit.index = to_index(required(data, "index", "sequence edit"), "sequence edit");
    if (auto* from = find_member(data, "from_index")) edit.from_index = to_index(*from, "sequence edit");
    if (auto* from = find_member(data, "from_path")) edit.from_path = parse_json_pointer(from->as_string());
    if (auto* key = find_member(data, "key")) edit.key = PatchCodec::decode_value(*key);
    if (auto* prev = find_member(data, "prev_key")) edit.prev_key = PatchCodec::decode_value(*prev);
    if (auto* value = find_member(data, "value")) edit.value = PatchCodec::decode_value(*value);
    if (auto* sub = find_member(data, "sub")) edit.sub = codec.decode_operation(*sub);
    return edit;
}

Value encode_sequence_op(const Operation& op, const PatchCodec& codec)
{
    const auto& s = std::get<SequenceOp>(op.node);
    std::vector<Value> edits;
    edits.reserve(s.edits.size());
    for (const auto& edit : s.edits) {
        edits.push_back(encode_edit(edit, codec));
    }
    return ObjectBuilder{}.set("edits", Value::vector(edits)).set("key_field", s.key_field).done();
}

OperationPtr decode_sequence_op(const Value& data, const PatchCodec& codec)
{
    std::vector<SequenceEdit> edits;
    for (const auto& entry : required_list(data, "edits", "sequence")) {
        edits.push_back(decode_edit(entry.get(), codec));
    }
    std::string key_field;
    if (auto* k = find_member(data, "key_field")) key_field = k->as_string();
    auto result = make_sequence_op(std::move(edits), std::move(key_field));
    if (!result) throw CodecError("sequence: empty edit script");
    return result;
}

Value encode_ref_op(const Operation& op, const PatchCodec& codec)
{
    const auto& r = std::get<RefOp>(op.node);
    return ObjectBuilder{}
        .set("ref_kind", std::string(ref_kind_name(r.kind)))
        .set("inner", codec.encode_operation(r.inner))
        .done();
}

OperationPtr decode_ref_op(const Value& data, const PatchCodec& codec)
{
    auto result = make_ref_op(parse_ref_kind(required_string(data, "ref_kind", "ref")),
                              codec.decode_operation(required(data, "inner", "ref")));
    if (!result) throw CodecError("ref: missing inner operation");
    return result;
}

Value encode_read_only_op(const Operation& op, const PatchCodec& codec)
{
    return ObjectBuilder{}.set("inner", codec.encode_operation(std::get<ReadOnlyOp>(op.node).inner)).done();
}

OperationPtr decode_read_only_op(const Value& data, const PatchCodec& codec)
{
    auto result = make_read_only_op(codec.decode_operation(required(data, "inner", "read_only")));
    if (!result) throw CodecError("read_only: missing inner operation");
    return result;
}

// ============================================================
// Condition encoders
// ============================================================

Value encode_compare(const Condition& cond, const PatchCodec&)
{
    const auto& c = std::get<Compare>(cond.node);
    return ObjectBuilder{}
        .set("path", path_to_pointer(c.path))
        .set("op", std::string(to_string(c.op)))
        .set("value", PatchCodec::encode_value(c.literal))
        .set("fold", c.fold)
        .done();
}

Value encode_compare_fields(const Condition& cond, const PatchCodec&)
{
    const auto& c = std::get<CompareFields>(cond.node);
    return ObjectBuilder{}
        .set("path1", path_to_pointer(c.path1))
        .set("path2", path_to_pointer(c.path2))
        .set("op", std::string(to_string(c.op)))
        .set("fold", c.fold)
        .done();
}

Value encode_subs(const std::vector<ConditionPtr>& subs, const PatchCodec& codec)
{
    std::vector<Value> out;
    for (const auto& sub : subs) {
        out.push_back(codec.encode_condition(sub));
    }
    return ObjectBuilder{}.set("subs", Value::vector(out)).done();
}

std::vector<ConditionPtr> decode_subs(const Value& data, const PatchCodec& codec, std::string_view what)
{
    std::vector<ConditionPtr> subs;
    for (const auto& entry : required_list(data, "subs", what)) {
        subs.push_back(codec.decode_condition(entry.get()));
    }
    return subs;
}

} // namespace

// ============================================================
// Kind names
// ============================================================

std::string_view condition_kind(const Condition& cond) noexcept
{
    static constexpr std::string_view names[] = {
        "compare", "compare_fields", "defined", "undefined", "type_of",
        "string", "membership", "and", "or", "not", "log",
    };
    return names[cond.node.index()];
}

// ============================================================
// PatchCodec
// ============================================================

PatchCodec& PatchCodec::register_operation(std::string kind, OperationEncoder encoder, OperationDecoder decoder)
{
    operations_[std::move(kind)] = OperationEntry{std::move(encoder), std::move(decoder)};
    return *this;
}

PatchCodec& PatchCodec::register_condition(std::string kind, ConditionEncoder encoder, ConditionDecoder decoder)
{
    conditions_[std::move(kind)] = ConditionEntry{std::move(encoder), std::move(decoder)};
    return *this;
}

bool PatchCodec::has_operation(std::string_view kind) const
{
    return operations_.find(kind) != operations_.end();
}

bool PatchCodec::has_condition(std::string_view kind) const
{
    return conditions_.find(kind) != conditions_.end();
}

Value PatchCodec::encode_operation(const OperationPtr& op) const
{
    if (!op) return Value{};

    const auto kind = variant_name(*op);
    auto it = operations_.find(kind);
    if (it == operations_.end()) {
        throw CodecError("no encoder registered for operation kind '" + std::string(kind) + "'");
    }

    ObjectBuilder out;
    out.set("kind", std::string(kind)).set("data", it->second.encode(*op, *this));
    if (op->cond) out.set("cond", encode_condition(op->cond));
    if (op->if_cond) out.set("if", encode_condition(op->if_cond));
    if (op->unless_cond) out.set("unless", encode_condition(op->unless_cond));
    return out.done();
}

OperationPtr PatchCodec::decode_operation(const Value& encoded) const
{
    if (encoded.is_null()) return nullptr;
    if (!encoded.is_map()) {
        throw CodecError("operation: expected an object, got " + kind_name(encoded));
    }

    const auto kind = required_string(encoded, "kind", "operation");
    auto it = operations_.find(kind);
    if (it == operations_.end()) {
        throw CodecError("no decoder registered for operation kind '" + kind + "'");
    }

    auto op = it->second.decode(required(encoded, "data", "operation"), *this);
    if (!op) throw CodecError("decoder for '" + kind + "' produced no operation");

    ConditionPtr local, if_c, unless_c;
    if (auto* c = find_member(encoded, "cond")) local = decode_condition(*c);
    if (auto* c = find_member(encoded, "if")) if_c = decode_condition(*c);
    if (auto* c = find_member(encoded, "unless")) unless_c = decode_condition(*c);
    if (local || if_c || unless_c) {
        op = with_guards(op, std::move(local), std::move(if_c), std::move(unless_c));
    }
    return op;
}

Value PatchCodec::encode_condition(const ConditionPtr& cond) const
{
    if (!cond) return Value{};

    const auto kind = condition_kind(*cond);
    auto it = conditions_.find(kind);
    if (it == conditions_.end()) {
        throw CodecError("no encoder registered for condition kind '" + std::string(kind) + "'");
    }
    return ObjectBuilder{}.set("kind", std::string(kind)).set("data", it->second.encode(*cond, *this)).done();
}

ConditionPtr PatchCodec::decode_condition(const Value& encoded) const
{
    if (encoded.is_null()) return nullptr;

    const auto kind = required_string(encoded, "kind", "condition");
    auto it = conditions_.find(kind);
    if (it == conditions_.end()) {
        throw CodecError("no decoder registered for condition kind '" + kind + "'");
    }
    auto cond = it->second.decode(required(encoded, "data", "condition"), *this);
    if (!cond) throw CodecError("decoder for '" + kind + "' produced no condition");
    return cond;
}

Value PatchCodec::encode_value(const Value& v)
{
    return std::visit(
        [&](const auto& data) -> Value {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, int64_t>) {
                return Value::map({{"$int64", format_number(data)}});
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                return Value::map({{"$uint64", format_number(data)}});
            } else if constexpr (std::is_same_v<T, float>) {
                return Value::map({{"$float", format_number(data)}});
            } else if constexpr (std::is_same_v<T, double>) {
                return Value::map({{"$double", format_number(data)}});
            } else if constexpr (std::is_same_v<T, ValueMap>) {
                return Value::map({{"$map", encode_map_entries(data, &PatchCodec::encode_value)}});
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                auto t = ValueVector{}.transient();
                for (const auto& box : data) t.push_back(ValueBox{encode_value(box.get())});
                return Value{t.persistent()};
            } else if constexpr (std::is_same_v<T, ValueArray>) {
                auto t = ValueVector{}.transient();
                for (const auto& box : data) t.push_back(ValueBox{encode_value(box.get())});
                return Value::map({{"$array", Value{t.persistent()}}});
            } else if constexpr (std::is_same_v<T, RecordBox>) {
                return Value::map({{"$record", data->type},
                                   {"fields", encode_map_entries(data->fields, &PatchCodec::encode_value)}});
            } else if constexpr (std::is_same_v<T, ValueRef>) {
                ObjectBuilder out;
                out.set("$ref", std::string(ref_kind_name(data.kind)));
                if (data.target) out.set("target", encode_value(data.target->get()));
                return out.done();
            } else {
                return v;
            }
        },
        v.data);
}

Value PatchCodec::decode_value(const Value& encoded)
{
    if (auto* vec = encoded.get_if<ValueVector>()) {
        auto t = ValueVector{}.transient();
        for (const auto& box : *vec) t.push_back(ValueBox{decode_value(box.get())});
        return Value{t.persistent()};
    }
    if (!encoded.is_map()) return encoded;

    if (auto* s = find_member(encoded, "$int64")) return parse_number<int64_t>(s->as_string(), "int64");
    if (auto* s = find_member(encoded, "$uint64")) return parse_number<uint64_t>(s->as_string(), "uint64");
    if (auto* s = find_member(encoded, "$float")) return parse_number<float>(s->as_string(), "float");
    if (auto* s = find_member(encoded, "$double")) return parse_number<double>(s->as_string(), "double");

    auto decode_fields = [](const Value& fields) {
        auto t = ValueMap{}.transient();
        if (auto* m = fields.get_if<ValueMap>()) {
            for (const auto& [key, box] : *m) t.set(key, ValueBox{decode_value(box.get())});
        } else {
            throw CodecError("tagged map: entries must be an object");
        }
        return t.persistent();
    };

    if (auto* m = find_member(encoded, "$map")) return Value{decode_fields(*m)};
    if (auto* type = find_member(encoded, "$record")) {
        return Value::make_record(type->as_string(), decode_fields(required(encoded, "fields", "record value")));
    }
    if (auto* a = find_member(encoded, "$array")) {
        ValueArray out;
        if (auto* items = a->get_if<ValueVector>()) {
            for (const auto& box : *items) out = std::move(out).push_back(ValueBox{decode_value(box.get())});
        } else {
            throw CodecError("tagged array: elements must be a list");
        }
        return Value{std::move(out)};
    }
    if (auto* kind = find_member(encoded, "$ref")) {
        ValueRef ref{parse_ref_kind(kind->as_string()), std::nullopt};
        if (auto* target = find_member(encoded, "target")) ref.target = ValueBox{decode_value(*target)};
        return Value{std::move(ref)};
    }
    throw CodecError("untagged object in encoded value");
}

Value PatchCodec::encode(const Patch& patch) const
{
    ObjectBuilder out;
    out.set("version", format_version)
        .set("root", encode_operation(patch.root()))
        .set("condition", encode_condition(patch.condition()))
        .set("strict", patch.strict());
    if (const auto& ts = patch.timestamp()) {
        out.set("timestamp", ObjectBuilder{}
                                 .set("wall", encode_value(Value{ts->wall}))
                                 .set("logical", encode_value(Value{static_cast<int64_t>(ts->logical)}))
                                 .set("node", ts->node)
                                 .done());
    }
    return out.done();
}

Patch PatchCodec::decode(const Value& encoded) const
{
    if (!encoded.is_map()) {
        throw CodecError("patch: expected an object, got " + kind_name(encoded));
    }
    const Value& version = required(encoded, "version", "patch");
    if (!version.is_integer() || version.as_int64() != format_version) {
        throw CodecError("patch: unsupported format version " + value_to_string(version));
    }

    auto root = decode_operation(required(encoded, "root", "patch"));
    auto condition = decode_condition(required(encoded, "condition", "patch"));
    const bool strict = optional_bool(encoded, "strict");

    std::optional<Timestamp> timestamp;
    if (auto* ts = find_member(encoded, "timestamp")) {
        Timestamp t;
        t.wall = decode_value(required(*ts, "wall", "timestamp")).as_int64();
        t.logical = static_cast<uint32_t>(decode_value(required(*ts, "logical", "timestamp")).as_int64());
        t.node = required_string(*ts, "node", "timestamp");
        timestamp = std::move(t);
    }
    return Patch(std::move(root), std::move(condition), strict, std::move(timestamp));
}

ByteBuffer PatchCodec::to_binary(const Patch& patch) const
{
    return serialize(encode(patch));
}

Patch PatchCodec::from_binary(const ByteBuffer& bytes) const
{
    Value encoded;
    try {
        encoded = deserialize(bytes);
    } catch (const std::runtime_error& e) {
        throw CodecError(std::string("malformed binary patch: ") + e.what());
    }
    return decode(encoded);
}

std::string PatchCodec::to_json(const Patch& patch, bool compact) const
{
    return lager_delta::to_json(encode(patch), compact);
}

Patch PatchCodec::from_json(std::string_view text) const
{
    std::string error;
    Value encoded = lager_delta::from_json(std::string(text), &error);
    if (!error.empty()) {
        throw CodecError("malformed JSON patch document: " + error);
    }
    return decode(encoded);
}

// ============================================================
// Built-in kinds
// ============================================================

void register_builtin_kinds(PatchCodec& codec)
{
    codec.register_operation("value", encode_value_op, decode_value_op)
        .register_operation("record", encode_record_op, decode_record_op)
        .register_operation("fixed_array", encode_fixed_array_op, decode_fixed_array_op)
        .register_operation("map", encode_map_op, decode_map_op)
        .register_operation("sequence", encode_sequence_op, decode_sequence_op)
        .register_operation("ref", encode_ref_op, decode_ref_op)
        .register_operation("read_only", encode_read_only_op, decode_read_only_op);

    codec.register_operation(
        "test",
        [](const Operation& op, const PatchCodec&) {
            return Value::map({{"expected", PatchCodec::encode_value(std::get<TestOp>(op.node).expected)}});
        },
        [](const Value& data, const PatchCodec&) {
            return make_test_op(PatchCodec::decode_value(required(data, "expected", "test")));
        });

    codec.register_operation(
        "copy",
        [](const Operation& op, const PatchCodec&) {
            const auto& c = std::get<CopyOp>(op.node);
            return Value::map({{"from", path_to_pointer(c.from)},
                               {"value", PatchCodec::encode_value(c.value)},
                               {"previous", PatchCodec::encode_value(c.previous)}});
        },
        [](const Value& data, const PatchCodec&) {
            return make_copy_op(read_path(data, "from", "copy"),
                                PatchCodec::decode_value(required(data, "value", "copy")),
                                PatchCodec::decode_value(required(data, "previous", "copy")));
        });

    codec.register_operation(
        "move",
        [](const Operation& op, const PatchCodec&) {
            const auto& m = std::get<MoveOp>(op.node);
            return Value::map({{"from", path_to_pointer(m.from)}, {"value", PatchCodec::encode_value(m.value)}});
        },
        [](const Value& data, const PatchCodec&) {
            return make_move_op(read_path(data, "from", "move"),
                                PatchCodec::decode_value(required(data, "value", "move")));
        });

    codec.register_operation(
        "log",
        [](const Operation& op, const PatchCodec&) {
            return Value::map({{"message", std::get<LogOp>(op.node).message}});
        },
        [](const Value& data, const PatchCodec&) {
            return make_log_op(required_string(data, "message", "log"));
        });

    // ----- conditions -----

    codec.register_condition("compare", encode_compare, [](const Value& data, const PatchCodec&) {
        return cond::make({Compare{read_path(data, "path", "compare"),
                                   PatchCodec::decode_value(required(data, "value", "compare")),
                                   parse_compare_op(required_string(data, "op", "compare")),
                                   optional_bool(data, "fold")}});
    });

    codec.register_condition("compare_fields", encode_compare_fields, [](const Value& data, const PatchCodec&) {
        return cond::make({CompareFields{read_path(data, "path1", "compare_fields"),
                                         read_path(data, "path2", "compare_fields"),
                                         parse_compare_op(required_string(data, "op", "compare_fields")),
                                         optional_bool(data, "fold")}});
    });

    codec.register_condition(
        "defined",
        [](const Condition& c, const PatchCodec&) {
            return Value::map({{"path", path_to_pointer(std::get<Defined>(c.node).path)}});
        },
        [](const Value& data, const PatchCodec&) {
            return cond::make({Defined{read_path(data, "path", "defined")}});
        });

    codec.register_condition(
        "undefined",
        [](const Condition& c, const PatchCodec&) {
            return Value::map({{"path", path_to_pointer(std::get<Undefined>(c.node).path)}});
        },
        [](const Value& data, const PatchCodec&) {
            return cond::make({Undefined{read_path(data, "path", "undefined")}});
        });

    codec.register_condition(
        "type_of",
        [](const Condition& c, const PatchCodec&) {
            const auto& t = std::get<TypeOf>(c.node);
            return Value::map({{"path", path_to_pointer(t.path)}, {"type", t.type}});
        },
        [](const Value& data, const PatchCodec&) {
            return cond::make({TypeOf{read_path(data, "path", "type_of"), required_string(data, "type", "type_of")}});
        });

    codec.register_condition(
        "string",
        [](const Condition& c, const PatchCodec&) {
            const auto& s = std::get<StringPredicate>(c.node);
            return Value::map({{"path", path_to_pointer(s.path)},
                               {"needle", s.needle},
                               {"op", std::string(to_string(s.op))},
                               {"fold", s.fold}});
        },
        [](const Value& data, const PatchCodec&) {
            return cond::make({StringPredicate{read_path(data, "path", "string"),
                                               required_string(data, "needle", "string"),
                                               parse_string_op(required_string(data, "op", "string")),
                                               optional_bool(data, "fold")}});
        });

    codec.register_condition(
        "membership",
        [](const Condition& c, const PatchCodec&) {
            const auto& m = std::get<Membership>(c.node);
            std::vector<Value> literals;
            for (const auto& v : m.literals) literals.push_back(PatchCodec::encode_value(v));
            return Value::map({{"path", path_to_pointer(m.path)},
                               {"values", Value::vector(literals)},
                               {"fold", m.fold}});
        },
        [](const Value& data, const PatchCodec&) {
            std::vector<Value> literals;
            for (const auto& box : required_list(data, "values", "membership")) {
                literals.push_back(PatchCodec::decode_value(box.get()));
            }
            return cond::make({Membership{read_path(data, "path", "membership"), std::move(literals),
                                          optional_bool(data, "fold")}});
        });

    codec.register_condition(
        "and",
        [](const Condition& c, const PatchCodec& self) { return encode_subs(std::get<And>(c.node).subs, self); },
        [](const Value& data, const PatchCodec& self) { return cond::make({And{decode_subs(data, self, "and")}}); });

    codec.register_condition(
        "or",
        [](const Condition& c, const PatchCodec& self) { return encode_subs(std::get<Or>(c.node).subs, self); },
        [](const Value& data, const PatchCodec& self) { return cond::make({Or{decode_subs(data, self, "or")}}); });

    codec.register_condition(
        "not",
        [](const Condition& c, const PatchCodec& self) {
            return Value::map({{"sub", self.encode_condition(std::get<Not>(c.node).sub)}});
        },
        [](const Value& data, const PatchCodec& self) {
            auto sub = self.decode_condition(required(data, "sub", "not"));
            if (!sub) throw CodecError("not: missing operand");
            return cond::make({Not{std::move(sub)}});
        });

    codec.register_condition(
        "log",
        [](const Condition& c, const PatchCodec&) {
            return Value::map({{"message", std::get<Log>(c.node).message}});
        },
        [](const Value& data, const PatchCodec&) {
            return cond::make({Log{required_string(data, "message", "log")}});
        });
}

} // namespace lager_delta
