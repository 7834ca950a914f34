// type_registry.cpp - record type metadata

#include <lager_delta/type_registry.h>

#include <algorithm>
#include <unordered_set>

namespace lager_delta {

const FieldDescriptor* TypeDescriptor::find_field(const std::string& field) const
{
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const FieldDescriptor& f) { return f.name == field; });
    return it == fields.end() ? nullptr : &*it;
}

std::optional<std::string> TypeDescriptor::key_field() const
{
    for (const auto& f : fields) {
        if (has_flag(f.flags, FieldFlags::Key)) {
            return f.name;
        }
    }
    return std::nullopt;
}

TypeRegistry& TypeRegistry::register_type(std::string type, std::vector<FieldDescriptor> fields)
{
    TypeDescriptor desc{type, std::move(fields)};
    types_.insert_or_assign(std::move(type), std::move(desc));
    return *this;
}

TypeRegistry& TypeRegistry::register_differ(std::string type, CustomDiffer differ)
{
    differs_.insert_or_assign(std::move(type), std::move(differ));
    return *this;
}

const TypeDescriptor* TypeRegistry::find(const std::string& type) const
{
    auto it = types_.find(type);
    return it == types_.end() ? nullptr : &it->second;
}

const CustomDiffer* TypeRegistry::find_differ(const std::string& type) const
{
    auto it = differs_.find(type);
    return it == differs_.end() ? nullptr : &it->second;
}

FieldFlags TypeRegistry::flags(const std::string& type, const std::string& field) const
{
    if (auto* desc = find(type)) {
        if (auto* f = desc->find_field(field)) {
            return f->flags;
        }
    }
    return FieldFlags::None;
}

std::vector<std::string> TypeRegistry::field_order(const Record& rec) const
{
    auto* desc = find(rec.type);
    if (!desc) {
        return sorted_keys(rec.fields);
    }

    std::vector<std::string> order;
    std::unordered_set<std::string> declared;
    for (const auto& f : desc->fields) {
        order.push_back(f.name);
        declared.insert(f.name);
    }
    for (const auto& key : sorted_keys(rec.fields)) {
        if (!declared.count(key)) {
            order.push_back(key);
        }
    }
    return order;
}

std::optional<Value> TypeRegistry::key_of(const Value& element) const
{
    const Value* v = &element;
    if (auto* target = v->ref_target()) {
        v = target;
    }
    auto* rec = v->get_record();
    if (!rec) {
        return std::nullopt;
    }
    auto* desc = find(rec->type);
    if (!desc) {
        return std::nullopt;
    }
    auto key = desc->key_field();
    if (!key) {
        return std::nullopt;
    }
    if (auto* found = rec->fields.find(*key)) {
        return found->get();
    }
    return Value{};
}

std::vector<std::string> field_order(const TypeRegistry* registry, const Record& rec)
{
    if (registry) {
        return registry->field_order(rec);
    }
    return sorted_keys(rec.fields);
}

} // namespace lager_delta
