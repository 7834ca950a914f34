// equal.cpp - registry-aware deep equality

#include <lager_delta/equal.h>
#include <lager_delta/type_registry.h>

namespace lager_delta {

namespace {

bool same_node(const ValueBox& a, const ValueBox& b)
{
    return &a.get() == &b.get();
}

bool map_equal(const ValueMap& a, const ValueMap& b, const TypeRegistry* registry)
{
    // immer container identity check - O(1)
    if (a.impl().root == b.impl().root && a.impl().size == b.impl().size) [[likely]] {
        return true;
    }
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [key, box] : a) {
        auto* other = b.find(key);
        if (!other) {
            return false;
        }
        if (!same_node(box, *other) && !deep_equal(box.get(), other->get(), registry)) {
            return false;
        }
    }
    return true;
}

template <typename Seq>
bool sequence_equal(const Seq& a, const Seq& b, const TypeRegistry* registry)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!same_node(a[i], b[i]) && !deep_equal(a[i].get(), b[i].get(), registry)) {
            return false;
        }
    }
    return true;
}

bool record_equal(const Record& a, const Record& b, const TypeRegistry* registry)
{
    if (a.type != b.type) {
        return false;
    }
    const TypeDescriptor* desc = registry ? registry->find(a.type) : nullptr;
    if (!desc) {
        return map_equal(a.fields, b.fields, registry);
    }

    const Value null_value;
    for (const auto& name : registry->field_order(a)) {
        if (has_flag(registry->flags(a.type, name), FieldFlags::Ignore)) {
            continue;
        }
        auto* fa = a.fields.find(name);
        auto* fb = b.fields.find(name);
        const Value& va = fa ? fa->get() : null_value;
        const Value& vb = fb ? fb->get() : null_value;
        if (fa && fb && same_node(*fa, *fb)) {
            continue;
        }
        if (!deep_equal(va, vb, registry)) {
            return false;
        }
    }
    // Undeclared fields only present in b.
    for (const auto& [name, box] : b.fields) {
        if (!a.fields.find(name) && !desc->find_field(name) && !box.get().is_null()) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

bool deep_equal(const Value& a, const Value& b, const TypeRegistry* registry)
{
    if (&a == &b) {
        return true;
    }
    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const T& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, ValueMap>) {
            return map_equal(lhs, rhs, registry);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (lhs.impl().root == rhs.impl().root &&
                lhs.impl().tail == rhs.impl().tail &&
                lhs.impl().size == rhs.impl().size) [[likely]] {
                return true;
            }
            return sequence_equal(lhs, rhs, registry);
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return sequence_equal(lhs, rhs, registry);
        } else if constexpr (std::is_same_v<T, RecordBox>) {
            if (&lhs.get() == &rhs.get()) {
                return true;
            }
            return record_equal(lhs.get(), rhs.get(), registry);
        } else if constexpr (std::is_same_v<T, ValueRef>) {
            if (lhs.kind != rhs.kind || lhs.target.has_value() != rhs.target.has_value()) {
                return false;
            }
            if (!lhs.target || same_node(*lhs.target, *rhs.target)) {
                return true;
            }
            return deep_equal(lhs.target->get(), rhs.target->get(), registry);
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

std::string key_string(const Value& key)
{
    if (auto* s = key.get_if<std::string>()) {
        return *s;
    }
    return value_to_string(key);
}

} // namespace lager_delta
