// builder.cpp - PatchBuilder drafts and their conversion to operation trees

#include <lager_delta/builder.h>
#include <lager_delta/equal.h>

#include <algorithm>
#include <map>

namespace lager_delta {

namespace {

constexpr std::size_t no_source = static_cast<std::size_t>(-1);

std::string where(const Path& path)
{
    return path.empty() ? "/" : path_to_pointer(path);
}

ConditionPtr conjoin(const ConditionPtr& existing, ConditionPtr added)
{
    if (!existing) {
        return added;
    }
    return cond::all_of({existing, std::move(added)});
}

/// One element of a sequence as edited so far.
struct Slot {
    std::size_t source = no_source;   ///< source index, or no_source for inserts
    bool moved = false;
    OpKind kind = OpKind::Add;        ///< for inserts: Add or Copy
    Value value;
    Path from_path;
};

} // anonymous namespace

struct PatchBuilder::Draft {
    Value shape;
    bool read_only = false;

    OperationPtr leaf;
    ConditionPtr cond;
    ConditionPtr if_cond;
    ConditionPtr unless_cond;

    std::map<std::string, std::unique_ptr<Draft>> children;   // record fields, map entries
    std::map<std::size_t, std::unique_ptr<Draft>> elements;   // by source index
    std::unique_ptr<Draft> inner;                             // reference target

    std::vector<std::pair<std::string, Value>> added;
    std::vector<std::pair<std::string, Value>> removed;

    bool layout_ready = false;
    std::vector<Slot> layout;

    explicit Draft(Value s) : shape(std::move(s)) {}

    std::vector<Slot>& sequence_layout()
    {
        if (!layout_ready) {
            const auto& vec = *shape.get_if<ValueVector>();
            layout.resize(vec.size());
            for (std::size_t i = 0; i < vec.size(); ++i) {
                layout[i].source = i;
            }
            layout_ready = true;
        }
        return layout;
    }
};

// ============================================================
// PatchBuilder
// ============================================================

PatchBuilder::PatchBuilder(Value shape, const TypeRegistry* registry)
    : shape_(std::move(shape))
    , registry_(registry)
    , root_(std::make_unique<Draft>(shape_))
{
}

PatchBuilder::~PatchBuilder() = default;
PatchBuilder::PatchBuilder(PatchBuilder&&) noexcept = default;
PatchBuilder& PatchBuilder::operator=(PatchBuilder&&) noexcept = default;

PatchBuilder::Node PatchBuilder::root()
{
    return Node(this, root_.get(), Path{});
}

PatchBuilder::Node PatchBuilder::at(const Path& path)
{
    Node node = root();
    for (const auto& part : path) {
        node = node.step(part);
    }
    return node;
}

PatchBuilder& PatchBuilder::add_condition(ConditionPtr condition)
{
    if (!condition) {
        return *this;
    }
    Path prefix = longest_common_prefix(paths(*condition));

    // Deepest reachable node on the prefix.
    Node node = root();
    std::size_t depth = 0;
    for (; depth < prefix.size(); ++depth) {
        const Value& s = deref(node.shape());
        if (s.is_null() || (!s.get_record() && !s.is_map() && !s.is_vector() && !s.is_array())) {
            break;
        }
        try {
            node = node.step(prefix[depth]);
        } catch (const PathError&) {
            break;
        }
    }
    prefix.resize(depth);

    node.when(with_relative_prefix(condition, prefix));
    return *this;
}

PatchBuilder& PatchBuilder::add_condition(std::string_view expression)
{
    return add_condition(parse_condition(expression));
}

PatchBuilder& PatchBuilder::condition(ConditionPtr condition)
{
    condition_ = std::move(condition);
    return *this;
}

PatchBuilder& PatchBuilder::strict(bool strict)
{
    strict_ = strict;
    return *this;
}

PatchBuilder& PatchBuilder::timestamp(Timestamp ts)
{
    timestamp_ = std::move(ts);
    return *this;
}

// ============================================================
// Navigation
// ============================================================

const Value& PatchBuilder::Node::shape() const noexcept
{
    return draft_->shape;
}

std::size_t PatchBuilder::Node::size() const
{
    if (draft_->shape.is_vector()) {
        return draft_->sequence_layout().size();
    }
    return draft_->shape.size();
}

PatchBuilder::Node PatchBuilder::Node::field(const std::string& name) const
{
    const Record* rec = draft_->shape.get_record();
    if (!rec) {
        throw PathError(where(path_) + ": field '" + name + "' requested on " + kind_name(draft_->shape));
    }
    FieldFlags flags = FieldFlags::None;
    if (const TypeRegistry* registry = owner_->registry_) {
        if (const TypeDescriptor* desc = registry->find(rec->type)) {
            if (!desc->find_field(name)) {
                throw PathError(where(path_) + ": record " + rec->type + " has no field '" + name + "'");
            }
        }
        flags = registry->flags(rec->type, name);
        if (has_flag(flags, FieldFlags::Ignore)) {
            throw PathError(where(path_) + ": field '" + name + "' of " + rec->type + " is ignored");
        }
    }

    auto& child = draft_->children[name];
    if (!child) {
        auto* found = rec->fields.find(name);
        child = std::make_unique<Draft>(found ? found->get() : Value{});
        child->read_only = has_flag(flags, FieldFlags::ReadOnly);
    }
    return Node(owner_, child.get(), child_path(path_, name));
}

PatchBuilder::Node PatchBuilder::Node::key(const std::string& key) const
{
    const ValueMap* map = draft_->shape.get_if<ValueMap>();
    if (!map) {
        throw PathError(where(path_) + ": key '" + key + "' requested on " + kind_name(draft_->shape));
    }
    auto& child = draft_->children[key];
    if (!child) {
        auto* found = map->find(key);
        child = std::make_unique<Draft>(found ? found->get() : Value{});
    }
    return Node(owner_, child.get(), child_path(path_, key));
}

PatchBuilder::Node PatchBuilder::Node::index(std::size_t i) const
{
    const Value& s = draft_->shape;
    if (auto* arr = s.get_if<ValueArray>()) {
        if (i >= arr->size()) {
            throw PathError(where(path_) + ": index " + std::to_string(i) + " out of range (size " +
                            std::to_string(arr->size()) + ")");
        }
        auto& child = draft_->elements[i];
        if (!child) {
            child = std::make_unique<Draft>((*arr)[i].get());
        }
        return Node(owner_, child.get(), child_path(path_, i));
    }

    if (!s.is_vector()) {
        throw PathError(where(path_) + ": index " + std::to_string(i) + " requested on " + kind_name(s));
    }
    auto& layout = draft_->sequence_layout();
    if (i >= layout.size()) {
        throw PathError(where(path_) + ": index " + std::to_string(i) + " out of range (size " +
                        std::to_string(layout.size()) + ")");
    }
    const Slot& slot = layout[i];
    if (slot.source == no_source) {
        throw PathError(where(child_path(path_, i)) + ": element was inserted by this patch");
    }
    auto& child = draft_->elements[slot.source];
    if (!child) {
        child = std::make_unique<Draft>(s.get_if<ValueVector>()->operator[](slot.source).get());
    }
    return Node(owner_, child.get(), child_path(path_, i));
}

PatchBuilder::Node PatchBuilder::Node::elem() const
{
    const ValueRef* ref = draft_->shape.get_if<ValueRef>();
    if (!ref) {
        throw PathError(where(path_) + ": reference target requested on " + kind_name(draft_->shape));
    }
    if (!draft_->inner) {
        draft_->inner = std::make_unique<Draft>(ref->target ? ref->target->get() : Value{});
    }
    return Node(owner_, draft_->inner.get(), path_);
}

PatchBuilder::Node PatchBuilder::Node::step(const PathElement& part) const
{
    const Value& s = draft_->shape;
    if (s.is_ref()) {
        return elem().step(part);
    }
    const std::string name = part_to_string(part);
    if (s.is_record()) {
        return field(name);
    }
    if (s.is_map()) {
        return key(name);
    }
    if (s.is_vector() || s.is_array()) {
        if (auto* idx = std::get_if<std::size_t>(&part)) {
            return index(*idx);
        }
        Path parsed = parse_json_pointer(name);
        if (parsed.size() == 1) {
            if (auto* idx = std::get_if<std::size_t>(&parsed.front())) {
                return index(*idx);
            }
        }
    }
    throw PathError(where(path_) + ": cannot step into '" + name + "' of " + kind_name(s));
}

// ============================================================
// Actions
// ============================================================

PatchBuilder::Node& PatchBuilder::Node::set(Value old_value, Value new_value)
{
    draft_->leaf = make_value_op(std::move(old_value), std::move(new_value));
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::put(Value new_value)
{
    return set(draft_->shape, std::move(new_value));
}

PatchBuilder::Node& PatchBuilder::Node::test(Value expected)
{
    draft_->leaf = make_test_op(std::move(expected));
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::copy(std::string_view from)
{
    Path source = parse_path(from);
    auto value = resolve(owner_->shape_, source);
    if (!value) {
        throw PathError(where(path_) + ": copy source " + where(source) + " not found");
    }
    draft_->leaf = make_copy_op(std::move(source), std::move(*value), draft_->shape);
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::move(std::string_view from)
{
    Path source = parse_path(from);
    auto value = resolve(owner_->shape_, source);
    if (!value) {
        throw PathError(where(path_) + ": move source " + where(source) + " not found");
    }
    if (is_prefix(source, path_)) {
        throw PathError(where(path_) + ": cannot move " + where(source) + " into itself");
    }
    draft_->leaf = make_move_op(std::move(source), std::move(*value));
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::log(std::string message)
{
    draft_->leaf = make_log_op(std::move(message));
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::insert(std::size_t position, Value value)
{
    if (!draft_->shape.is_vector()) {
        throw PathError(where(path_) + ": insert on " + kind_name(draft_->shape));
    }
    auto& layout = draft_->sequence_layout();
    if (position > layout.size()) {
        throw PathError(where(child_path(path_, position)) + ": insert position out of range (size " +
                        std::to_string(layout.size()) + ")");
    }
    Slot slot;
    slot.kind = OpKind::Add;
    slot.value = std::move(value);
    layout.insert(layout.begin() + static_cast<std::ptrdiff_t>(position), std::move(slot));
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::insert_copy(std::size_t position, std::string_view from)
{
    if (!draft_->shape.is_vector()) {
        throw PathError(where(path_) + ": insert on " + kind_name(draft_->shape));
    }
    Path source = parse_path(from);
    auto value = resolve(owner_->shape_, source);
    if (!value) {
        throw PathError(where(path_) + ": copy source " + where(source) + " not found");
    }
    auto& layout = draft_->sequence_layout();
    if (position > layout.size()) {
        throw PathError(where(child_path(path_, position)) + ": insert position out of range (size " +
                        std::to_string(layout.size()) + ")");
    }
    Slot slot;
    slot.kind = OpKind::Copy;
    slot.value = std::move(*value);
    slot.from_path = std::move(source);
    layout.insert(layout.begin() + static_cast<std::ptrdiff_t>(position), std::move(slot));
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::remove(std::size_t position)
{
    if (!draft_->shape.is_vector()) {
        throw PathError(where(path_) + ": remove on " + kind_name(draft_->shape));
    }
    auto& layout = draft_->sequence_layout();
    if (position >= layout.size()) {
        throw PathError(where(child_path(path_, position)) + ": remove position out of range (size " +
                        std::to_string(layout.size()) + ")");
    }
    const Slot& slot = layout[position];
    if (slot.source != no_source) {
        draft_->elements.erase(slot.source);
    }
    layout.erase(layout.begin() + static_cast<std::ptrdiff_t>(position));
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::move_element(std::size_t from, std::size_t to)
{
    if (!draft_->shape.is_vector()) {
        throw PathError(where(path_) + ": move on " + kind_name(draft_->shape));
    }
    auto& layout = draft_->sequence_layout();
    if (from >= layout.size() || to >= layout.size()) {
        throw PathError(where(path_) + ": move " + std::to_string(from) + " -> " + std::to_string(to) +
                        " out of range (size " + std::to_string(layout.size()) + ")");
    }
    if (from == to) {
        return *this;
    }
    Slot slot = std::move(layout[from]);
    layout.erase(layout.begin() + static_cast<std::ptrdiff_t>(from));
    if (slot.source != no_source) {
        slot.moved = true;
    }
    layout.insert(layout.begin() + static_cast<std::ptrdiff_t>(to), std::move(slot));
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::add_entry(const std::string& key, Value value)
{
    const ValueMap* map = draft_->shape.get_if<ValueMap>();
    if (!map) {
        throw PathError(where(path_) + ": add_entry on " + kind_name(draft_->shape));
    }
    bool removed = std::any_of(draft_->removed.begin(), draft_->removed.end(),
                               [&](const auto& r) { return r.first == key; });
    if (map->find(key) && !removed) {
        throw PathError(where(child_path(path_, key)) + ": key '" + key + "' already exists");
    }
    std::erase_if(draft_->added, [&](const auto& a) { return a.first == key; });
    draft_->added.emplace_back(key, std::move(value));
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::remove_entry(const std::string& key)
{
    const ValueMap* map = draft_->shape.get_if<ValueMap>();
    if (!map) {
        throw PathError(where(path_) + ": remove_entry on " + kind_name(draft_->shape));
    }
    auto before = draft_->added.size();
    std::erase_if(draft_->added, [&](const auto& a) { return a.first == key; });
    if (before != draft_->added.size()) {
        // Removing an entry added by this builder cancels the add.
        return *this;
    }
    auto* found = map->find(key);
    if (!found) {
        throw PathError(where(child_path(path_, key)) + ": key '" + key + "' not found");
    }
    draft_->children.erase(key);
    draft_->removed.emplace_back(key, found->get());
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::when(ConditionPtr condition)
{
    draft_->cond = conjoin(draft_->cond, std::move(condition));
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::only_if(ConditionPtr condition)
{
    draft_->if_cond = conjoin(draft_->if_cond, std::move(condition));
    return *this;
}

PatchBuilder::Node& PatchBuilder::Node::unless(ConditionPtr condition)
{
    draft_->unless_cond = conjoin(draft_->unless_cond, std::move(condition));
    return *this;
}

// ============================================================
// Build
// ============================================================

Patch PatchBuilder::build() const
{
    return Patch(build_draft(*root_), condition_, strict_, timestamp_);
}

OperationPtr PatchBuilder::build_draft(const Draft& draft) const
{
    OperationPtr op = draft.leaf;
    const Value& s = draft.shape;

    if (!op) {
        if (const Record* rec = s.get_record()) {
            std::vector<std::string> order = field_order(registry_, *rec);
            for (const auto& [name, child] : draft.children) {
                if (std::find(order.begin(), order.end(), name) == order.end()) {
                    order.push_back(name);
                }
            }
            std::vector<std::pair<std::string, OperationPtr>> fields;
            for (const auto& name : order) {
                auto it = draft.children.find(name);
                if (it == draft.children.end()) continue;
                if (auto sub = build_draft(*it->second)) {
                    fields.emplace_back(name, std::move(sub));
                }
            }
            op = make_record_op(rec->type, std::move(fields));
        } else if (s.is_map()) {
            MapOp m;
            m.added = draft.added;
            m.removed = draft.removed;
            for (const auto& [key, child] : draft.children) {
                if (auto sub = build_draft(*child)) {
                    m.modified.emplace_back(key, std::move(sub));
                }
            }
            op = make_map_op(std::move(m));
        } else if (s.is_array()) {
            std::vector<std::pair<std::size_t, OperationPtr>> indices;
            for (const auto& [idx, child] : draft.elements) {
                if (auto sub = build_draft(*child)) {
                    indices.emplace_back(idx, std::move(sub));
                }
            }
            op = make_fixed_array_op(std::move(indices));
        } else if (s.is_vector()) {
            op = build_sequence(draft);
        } else if (const ValueRef* ref = s.get_if<ValueRef>(); ref && draft.inner) {
            op = make_ref_op(ref->kind, build_draft(*draft.inner));
        }
    }

    if (!op) {
        return nullptr;
    }
    if (draft.read_only) {
        op = make_read_only_op(std::move(op));
    }
    if (draft.cond || draft.if_cond || draft.unless_cond) {
        op = with_guards(op, draft.cond, draft.if_cond, draft.unless_cond);
    }
    return op;
}

OperationPtr PatchBuilder::build_sequence(const Draft& draft) const
{
    const ValueVector& src = *draft.shape.get_if<ValueVector>();
    const std::size_t n = src.size();

    std::vector<Slot> identity;
    if (!draft.layout_ready) {
        identity.resize(n);
        for (std::size_t i = 0; i < n; ++i) identity[i].source = i;
    }
    const std::vector<Slot>& layout = draft.layout_ready ? draft.layout : identity;

    // Elements are keyed when every source element and every inserted value
    // is a record declaring the same Key field.
    std::string key_field;
    if (registry_) {
        std::optional<std::string> common;
        bool keyed = n > 0 || !layout.empty();
        auto consider = [&](const Value& v) {
            const Record* rec = deref(v).get_record();
            const TypeDescriptor* desc = rec ? registry_->find(rec->type) : nullptr;
            auto k = desc ? desc->key_field() : std::nullopt;
            if (!k || (common && *common != *k)) {
                keyed = false;
                return;
            }
            common = k;
        };
        for (const auto& box : src) consider(box.get());
        for (const auto& slot : layout) {
            if (slot.source == no_source) consider(slot.value);
        }
        if (keyed && common) {
            key_field = *common;
        }
    }

    auto element = [&](const Slot& slot) -> const Value& {
        return slot.source == no_source ? slot.value : src[slot.source].get();
    };
    auto key_of = [&](const Value& v) -> std::optional<Value> {
        if (key_field.empty()) return std::nullopt;
        return registry_->key_of(v);
    };

    struct Ordered {
        std::size_t index;
        int group;
        std::size_t order;
        SequenceEdit edit;
    };
    std::vector<Ordered> out;

    std::vector<bool> present(n, false);
    for (const auto& slot : layout) {
        if (slot.source != no_source) present[slot.source] = true;
    }
    for (std::size_t i = 0; i < n; ++i) {
        if (present[i]) continue;
        SequenceEdit e;
        e.kind = OpKind::Remove;
        e.index = i;
        e.key = key_of(src[i].get());
        e.value = src[i].get();
        out.push_back({i, 1, i, std::move(e)});
    }

    // anchor[p]: source index of the first stable element after position p.
    std::vector<std::size_t> anchor(layout.size() + 1, n);
    for (std::size_t p = layout.size(); p-- > 0;) {
        const Slot& slot = layout[p];
        bool stable = slot.source != no_source && !slot.moved;
        anchor[p] = stable ? slot.source : anchor[p + 1];
    }

    for (std::size_t p = 0; p < layout.size(); ++p) {
        const Slot& slot = layout[p];
        OperationPtr sub;
        if (slot.source != no_source) {
            if (auto it = draft.elements.find(slot.source); it != draft.elements.end()) {
                sub = build_draft(*it->second);
            }
        }

        SequenceEdit e;
        e.key = key_of(element(slot));
        if (slot.source != no_source && !slot.moved) {
            if (!sub) continue;
            e.kind = OpKind::Replace;
            e.index = slot.source;
            e.sub = std::move(sub);
            out.push_back({e.index, 1, p, std::move(e)});
            continue;
        }

        e.index = anchor[p + 1];
        if (!key_field.empty()) {
            e.prev_key = p == 0 ? Value{} : key_of(element(layout[p - 1])).value_or(Value{});
        }
        if (slot.source != no_source) {
            e.kind = OpKind::Move;
            e.from_index = slot.source;
            e.sub = std::move(sub);
        } else {
            e.kind = slot.kind;
            e.value = slot.value;
            e.from_path = slot.from_path;
        }
        out.push_back({e.index, 0, p, std::move(e)});
    }

    std::stable_sort(out.begin(), out.end(), [](const Ordered& a, const Ordered& b) {
        if (a.index != b.index) return a.index < b.index;
        if (a.group != b.group) return a.group < b.group;
        return a.order < b.order;
    });
    std::vector<SequenceEdit> edits;
    edits.reserve(out.size());
    for (auto& o : out) {
        edits.push_back(std::move(o.edit));
    }
    return make_sequence_op(std::move(edits), std::move(key_field));
}

} // namespace lager_delta
