// merge.cpp - structural merge of sibling patches

#include <lager_delta/equal.h>
#include <lager_delta/merge.h>
#include <lager_delta/resolvers.h>

#include <algorithm>
#include <map>
#include <set>
#include <sstream>

namespace lager_delta {

namespace {

constexpr const char* concurrent_change = "concurrent modification";
constexpr const char* removed_parent = "modification of a removed or replaced parent";

bool same_condition(const ConditionPtr& a, const ConditionPtr& b)
{
    if (a == b) return true;
    if (!a || !b) return false;
    return to_string(*a) == to_string(*b);
}

bool same_guards(const Operation& a, const Operation& b)
{
    return same_condition(a.cond, b.cond) && same_condition(a.if_cond, b.if_cond) &&
           same_condition(a.unless_cond, b.unless_cond);
}

OperationPtr keep_guards(OperationPtr merged, const Operation& from)
{
    if (!merged || !from.has_guards()) return merged;
    return with_guards(merged, from.cond, from.if_cond, from.unless_cond);
}

bool removes_or_replaces(const Operation& op)
{
    return !op.is_container() && (op.kind() == OpKind::Remove || op.kind() == OpKind::Replace);
}

/// @p op writing @p resolved instead of its own value, where it has one.
OperationPtr with_resolved(const OperationPtr& op, const std::optional<Value>& resolved)
{
    if (!op || !resolved) return op;
    auto* v = op->get_if<ValueOp>();
    if (!v || deep_equal(v->new_value, *resolved)) return op;
    return with_guards(make_value_op(v->old_value, *resolved), op->cond, op->if_cond, op->unless_cond);
}

ConditionPtr conjoin(const ConditionPtr& a, const ConditionPtr& b)
{
    if (!a) return b;
    if (!b || same_condition(a, b)) return a;
    return cond::all_of({a, b});
}

struct Choice {
    MergeSide side = MergeSide::Ours;
    std::optional<Value> resolved;
};

// ============================================================
// Map entries
// ============================================================

struct Entry {
    enum Kind { None, Added, Removed, Modified } kind = None;
    Value value;
    OperationPtr op;

    [[nodiscard]] OpKind op_kind() const {
        switch (kind) {
            case Added: return OpKind::Add;
            case Removed: return OpKind::Remove;
            default: return op ? op->kind() : OpKind::Replace;
        }
    }

    [[nodiscard]] std::optional<Value> written() const {
        switch (kind) {
            case Added: return value;
            case Removed: return std::nullopt;
            default: return op ? proposed_value(*op) : std::nullopt;
        }
    }
};

std::map<std::string, Entry> entries_of(const MapOp& m)
{
    std::map<std::string, Entry> out;
    for (const auto& [key, value] : m.added) out[key] = Entry{Entry::Added, value, nullptr};
    for (const auto& [key, value] : m.removed) out[key] = Entry{Entry::Removed, value, nullptr};
    for (const auto& [key, op] : m.modified) out[key] = Entry{Entry::Modified, Value{}, op};
    return out;
}

// ============================================================
// Sequence edits
// ============================================================

bool is_insert(const SequenceEdit& e)
{
    return e.kind == OpKind::Add || e.kind == OpKind::Copy || e.kind == OpKind::Move;
}

std::optional<Value> edit_written(const SequenceEdit& e)
{
    switch (e.kind) {
        case OpKind::Add:
        case OpKind::Copy:
            return e.value;
        case OpKind::Replace:
        case OpKind::Move:
            return e.sub ? proposed_value(*e.sub) : std::nullopt;
        default:
            return std::nullopt;
    }
}

/// Ordering signature of one insert, independent of the side it came from.
std::string insert_signature(const SequenceEdit& e)
{
    if (e.key) return key_string(*e.key);
    if (e.value) return key_string(*e.value);
    return "#" + std::to_string(e.from_index);
}

bool same_edit_lists(const std::vector<SequenceEdit>& a, const std::vector<SequenceEdit>& b)
{
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), edits_equal);
}

std::vector<std::string> signatures(const std::vector<SequenceEdit>& group)
{
    std::vector<std::string> out;
    out.reserve(group.size());
    for (const auto& e : group) out.push_back(insert_signature(e));
    return out;
}

struct Placed {
    std::size_t index;
    int group;            // 0 = insert before index, 1 = edit of index
    std::size_t order;
    SequenceEdit edit;
};

// ============================================================
// Merger
// ============================================================

class Merger {
public:
    Merger(ConflictResolver* resolver, std::optional<Timestamp> ours_time, std::optional<Timestamp> theirs_time)
        : resolver_(resolver), ours_time_(std::move(ours_time)), theirs_time_(std::move(theirs_time)) {}

    OperationPtr merge(const OperationPtr& a, const OperationPtr& b, const Path& path);

    std::vector<MergeConflict> conflicts;

private:
    Choice decide(const Path& path, OpKind ours_kind, std::optional<Value> ours, OpKind theirs_kind,
                  std::optional<Value> theirs, const SequenceEdit* theirs_edit, const char* message);

    OperationPtr conflict(const OperationPtr& a, const OperationPtr& b, const Path& path);

    OperationPtr merge_record(const Operation& a, const Operation& b, const Path& path);
    OperationPtr merge_fixed_array(const Operation& a, const Operation& b, const Path& path);
    OperationPtr merge_map(const Operation& a, const Operation& b, const Path& path);
    OperationPtr merge_sequence(const OperationPtr& a, const OperationPtr& b, const Path& path);

    ConflictResolver* resolver_;
    std::optional<Timestamp> ours_time_;
    std::optional<Timestamp> theirs_time_;
};

Choice Merger::decide(const Path& path, OpKind ours_kind, std::optional<Value> ours, OpKind theirs_kind,
                      std::optional<Value> theirs, const SequenceEdit* theirs_edit, const char* message)
{
    Choice choice;
    if (resolver_) {
        ResolveRequest request;
        request.path = path;
        request.kind = theirs_kind;
        request.current = ours;
        request.proposed = theirs;
        if (theirs_edit) {
            request.key = theirs_edit->key;
            request.prev_key = theirs_edit->prev_key;
        }
        if (auto accepted = resolver_->resolve(request)) {
            choice.side = MergeSide::Theirs;
            if (theirs_kind != OpKind::Remove) choice.resolved = std::move(accepted);
        }
    } else if (theirs_time_ > ours_time_) {
        choice.side = MergeSide::Theirs;
    }

    conflicts.push_back(MergeConflict{path, ours_kind, theirs_kind, std::move(ours), std::move(theirs),
                                      choice.side, message});
    return choice;
}

OperationPtr Merger::conflict(const OperationPtr& a, const OperationPtr& b, const Path& path)
{
    // One side replacing or removing what the other edits inside.
    const bool under_removed = (a->is_container() != b->is_container() &&
                                (removes_or_replaces(*a) || removes_or_replaces(*b))) ||
                               a->kind() == OpKind::Remove || b->kind() == OpKind::Remove;
    Choice choice = decide(path, a->kind(), proposed_value(*a), b->kind(), proposed_value(*b), nullptr,
                           under_removed ? removed_parent : concurrent_change);
    return choice.side == MergeSide::Theirs ? with_resolved(b, choice.resolved) : a;
}

OperationPtr Merger::merge(const OperationPtr& a, const OperationPtr& b, const Path& path)
{
    if (!a) return b;
    if (!b) return a;
    if (operations_equal(a, b)) return a;

    if (a->node.index() != b->node.index() || !same_guards(*a, *b)) {
        return conflict(a, b, path);
    }

    OperationPtr merged;
    if (a->is<RecordOp>()) {
        if (a->get_if<RecordOp>()->type != b->get_if<RecordOp>()->type) return conflict(a, b, path);
        merged = merge_record(*a, *b, path);
    } else if (a->is<FixedArrayOp>()) {
        merged = merge_fixed_array(*a, *b, path);
    } else if (a->is<MapOp>()) {
        merged = merge_map(*a, *b, path);
    } else if (a->is<SequenceOp>()) {
        return merge_sequence(a, b, path);
    } else if (auto* ra = a->get_if<RefOp>()) {
        auto* rb = b->get_if<RefOp>();
        if (ra->kind != rb->kind) return conflict(a, b, path);
        merged = make_ref_op(ra->kind, merge(ra->inner, rb->inner, path));
    } else if (auto* wa = a->get_if<ReadOnlyOp>()) {
        merged = make_read_only_op(merge(wa->inner, b->get_if<ReadOnlyOp>()->inner, path));
    } else {
        return conflict(a, b, path);
    }
    return keep_guards(std::move(merged), *a);
}

OperationPtr Merger::merge_record(const Operation& a, const Operation& b, const Path& path)
{
    const auto& ra = std::get<RecordOp>(a.node);
    const auto& rb = std::get<RecordOp>(b.node);

    auto find = [](const RecordOp& r, const std::string& name) -> OperationPtr {
        for (const auto& [field, op] : r.fields) {
            if (field == name) return op;
        }
        return nullptr;
    };

    std::vector<std::pair<std::string, OperationPtr>> fields;
    for (const auto& [name, op] : ra.fields) {
        fields.emplace_back(name, merge(op, find(rb, name), child_path(path, name)));
    }
    for (const auto& [name, op] : rb.fields) {
        if (!find(ra, name)) fields.emplace_back(name, op);
    }
    return make_record_op(ra.type, std::move(fields));
}

OperationPtr Merger::merge_fixed_array(const Operation& a, const Operation& b, const Path& path)
{
    std::map<std::size_t, std::pair<OperationPtr, OperationPtr>> slots;
    for (const auto& [i, op] : std::get<FixedArrayOp>(a.node).indices) slots[i].first = op;
    for (const auto& [i, op] : std::get<FixedArrayOp>(b.node).indices) slots[i].second = op;

    std::vector<std::pair<std::size_t, OperationPtr>> indices;
    for (const auto& [i, pair] : slots) {
        if (auto op = merge(pair.first, pair.second, child_path(path, i))) {
            indices.emplace_back(i, std::move(op));
        }
    }
    return make_fixed_array_op(std::move(indices));
}

OperationPtr Merger::merge_map(const Operation& a, const Operation& b, const Path& path)
{
    auto ours = entries_of(std::get<MapOp>(a.node));
    auto theirs = entries_of(std::get<MapOp>(b.node));

    std::set<std::string> keys;
    for (const auto& [key, entry] : ours) keys.insert(key);
    for (const auto& [key, entry] : theirs) keys.insert(key);

    MapOp out;
    auto emit = [&out](const std::string& key, const Entry& e) {
        switch (e.kind) {
            case Entry::Added: out.added.emplace_back(key, e.value); break;
            case Entry::Removed: out.removed.emplace_back(key, e.value); break;
            case Entry::Modified: if (e.op) out.modified.emplace_back(key, e.op); break;
            case Entry::None: break;
        }
    };

    for (const auto& key : keys) {
        const Entry ea = ours.count(key) ? ours[key] : Entry{};
        const Entry eb = theirs.count(key) ? theirs[key] : Entry{};

        if (eb.kind == Entry::None) { emit(key, ea); continue; }
        if (ea.kind == Entry::None) { emit(key, eb); continue; }

        const Path at = child_path(path, key);
        if (ea.kind == eb.kind && ea.kind != Entry::Modified && deep_equal(ea.value, eb.value)) {
            emit(key, ea);
            continue;
        }
        if (ea.kind == Entry::Modified && eb.kind == Entry::Modified) {
            emit(key, Entry{Entry::Modified, Value{}, merge(ea.op, eb.op, at)});
            continue;
        }

        const bool under_removed = ea.kind == Entry::Removed || eb.kind == Entry::Removed;
        Choice choice = decide(at, ea.op_kind(), ea.written(), eb.op_kind(), eb.written(), nullptr,
                               under_removed ? removed_parent : concurrent_change);
        if (choice.side == MergeSide::Ours) {
            emit(key, ea);
            continue;
        }
        Entry winner = eb;
        if (choice.resolved) {
            if (winner.kind == Entry::Added) winner.value = *choice.resolved;
            if (winner.kind == Entry::Modified) winner.op = with_resolved(winner.op, choice.resolved);
        }
        emit(key, winner);
    }
    return make_map_op(std::move(out));
}

OperationPtr Merger::merge_sequence(const OperationPtr& a, const OperationPtr& b, const Path& path)
{
    const auto& sa = std::get<SequenceOp>(a->node);
    const auto& sb = std::get<SequenceOp>(b->node);
    if (sa.key_field != sb.key_field) return conflict(a, b, path);
    const bool keyed = !sa.key_field.empty();

    // The element an edit claims: its entity key, or its source position.
    auto claim = [keyed](const SequenceEdit& e) -> std::optional<std::string> {
        if (keyed && e.key) return "k:" + key_string(*e.key);
        switch (e.kind) {
            case OpKind::Remove:
            case OpKind::Replace:
                return "i:" + std::to_string(e.index);
            case OpKind::Move:
                return "i:" + std::to_string(e.from_index);
            default:
                return std::nullopt;
        }
    };
    auto element_path = [&](const SequenceEdit& e) {
        if (keyed && e.key) return child_path(path, key_string(*e.key));
        return child_path(path, e.kind == OpKind::Move ? e.from_index : e.index);
    };

    // Working copies; edits that lose a conflict are erased from them.
    std::vector<std::optional<SequenceEdit>> ours(sa.edits.begin(), sa.edits.end());
    std::vector<std::optional<SequenceEdit>> theirs(sb.edits.begin(), sb.edits.end());

    std::map<std::string, std::size_t> claimed_by_ours;
    for (std::size_t i = 0; i < ours.size(); ++i) {
        if (auto c = claim(*ours[i])) claimed_by_ours[*c] = i;
    }

    for (std::size_t j = 0; j < theirs.size(); ++j) {
        auto c = claim(*theirs[j]);
        if (!c) continue;
        auto found = claimed_by_ours.find(*c);
        if (found == claimed_by_ours.end()) continue;

        auto& ea = ours[found->second];
        auto& eb = theirs[j];
        if (edits_equal(*ea, *eb)) {
            eb.reset();
            continue;
        }

        const Path at = element_path(*eb);
        const bool a_moves = ea->kind == OpKind::Move;
        const bool b_moves = eb->kind == OpKind::Move;
        const bool same_place = !a_moves || !b_moves ||
                                (ea->index == eb->index && [&] {
                                    if (ea->prev_key.has_value() != eb->prev_key.has_value()) return false;
                                    return !ea->prev_key || deep_equal(*ea->prev_key, *eb->prev_key);
                                }());
        const bool combinable = (ea->kind == OpKind::Replace || a_moves) &&
                                (eb->kind == OpKind::Replace || b_moves) && same_place;
        if (combinable) {
            OperationPtr sub = merge(ea->sub, eb->sub, at);
            if (b_moves && !a_moves) {
                eb->sub = std::move(sub);
                ea.reset();
            } else {
                ea->sub = std::move(sub);
                eb.reset();
            }
            continue;
        }

        const bool under_removed = ea->kind == OpKind::Remove || eb->kind == OpKind::Remove;
        Choice choice = decide(at, ea->kind, edit_written(*ea), eb->kind, edit_written(*eb), &*eb,
                               under_removed ? removed_parent : concurrent_change);
        if (choice.side == MergeSide::Ours) {
            eb.reset();
            continue;
        }
        if (choice.resolved) {
            if (eb->kind == OpKind::Add) eb->value = choice.resolved;
            if (eb->sub) eb->sub = with_resolved(eb->sub, choice.resolved);
        }
        ea.reset();
    }

    // Lay the surviving edits out again: at every index, the inserts of
    // both sides (as two groups in signature order), then the edit of the
    // source element.
    std::map<std::size_t, std::vector<SequenceEdit>> inserts_a, inserts_b;
    std::vector<Placed> placed;
    std::size_t order = 0;

    auto collect = [&](std::vector<std::optional<SequenceEdit>>& edits,
                       std::map<std::size_t, std::vector<SequenceEdit>>& inserts) {
        for (auto& e : edits) {
            if (!e) continue;
            if (is_insert(*e)) {
                inserts[e->index].push_back(std::move(*e));
            } else {
                placed.push_back(Placed{e->index, 1, order++, std::move(*e)});
            }
        }
    };
    collect(ours, inserts_a);
    collect(theirs, inserts_b);

    std::set<std::size_t> positions;
    for (const auto& [index, group] : inserts_a) positions.insert(index);
    for (const auto& [index, group] : inserts_b) positions.insert(index);

    for (std::size_t index : positions) {
        auto& ga = inserts_a[index];
        auto& gb = inserts_b[index];
        std::vector<std::vector<SequenceEdit>*> groups;
        if (ga.empty() || gb.empty() || same_edit_lists(ga, gb)) {
            groups.push_back(ga.empty() ? &gb : &ga);
        } else if (signatures(gb) < signatures(ga)) {
            groups = {&gb, &ga};
        } else {
            groups = {&ga, &gb};
        }
        for (auto* group : groups) {
            for (auto& e : *group) {
                placed.push_back(Placed{index, 0, order++, std::move(e)});
            }
        }
    }

    std::stable_sort(placed.begin(), placed.end(), [](const Placed& x, const Placed& y) {
        if (x.index != y.index) return x.index < y.index;
        if (x.group != y.group) return x.group < y.group;
        return x.order < y.order;
    });

    std::vector<SequenceEdit> edits;
    edits.reserve(placed.size());
    for (auto& p : placed) edits.push_back(std::move(p.edit));

    return keep_guards(make_sequence_op(std::move(edits), sa.key_field), *a);
}

} // anonymous namespace

MergeResult merge(const Patch& ours, const Patch& theirs, ConflictResolver* resolver)
{
    Merger merger(resolver, ours.timestamp(), theirs.timestamp());
    OperationPtr root = merger.merge(ours.root(), theirs.root(), Path{});

    std::optional<Timestamp> timestamp = std::max(ours.timestamp(), theirs.timestamp());

    MergeResult result;
    result.patch = Patch(std::move(root), conjoin(ours.condition(), theirs.condition()),
                         ours.strict() && theirs.strict(), std::move(timestamp));
    result.conflicts = std::move(merger.conflicts);
    return result;
}

std::string to_string(const MergeConflict& conflict)
{
    auto written = [](const std::optional<Value>& v) {
        return v ? value_to_string(*v) : std::string("<none>");
    };

    std::ostringstream out;
    out << "conflict at " << path_to_pointer(conflict.path) << ": " << conflict.message
        << " (ours: " << to_string(conflict.ours_kind) << " " << written(conflict.ours)
        << ", theirs: " << to_string(conflict.theirs_kind) << " " << written(conflict.theirs)
        << ", kept " << (conflict.chosen == MergeSide::Ours ? "ours" : "theirs") << ")";
    return out.str();
}

} // namespace lager_delta
