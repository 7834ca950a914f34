// main.cpp - Patch-based editing session with undo/redo and replica sync

#include <lager_delta/builder.h>
#include <lager_delta/codec.h>
#include <lager_delta/diff.h>
#include <lager_delta/json_patch.h>
#include <lager_delta/merge.h>
#include <lager_delta/replica.h>
#include <lager_delta/text.h>
#include <lager_delta/value.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <immer/vector.hpp>

#include <iostream>
#include <string>
#include <variant>

using namespace lager_delta;

// ============================================================
// Application State and Actions
// ============================================================

struct AddItem
{
    std::string title;
};

struct RenameItem
{
    std::size_t index;
    std::string title;
};

struct Undo {};
struct Redo {};

using Action = std::variant<AddItem, RenameItem, Undo, Redo>;

/// The document plus the patches that produced it. Undo applies the
/// reverse of the last patch instead of restoring a snapshot.
struct AppState
{
    Value data;
    immer::vector<Patch> history;
    immer::vector<Patch> future;
};

AppState create_initial_state()
{
    auto item = Value::map({{"title", "Task 1"}, {"done", false}});
    return AppState{
        .data    = Value::map({{"items", Value::vector({item})}}),
        .history = {},
        .future  = {},
    };
}

// ============================================================
// Reducer
// ============================================================

AppState record(AppState state, const Value& next)
{
    Patch p = diff(state.data, next);
    if (p.is_empty())
        return state;
    state.data    = next;
    state.history = state.history.push_back(std::move(p));
    state.future  = {};
    return state;
}

AppState reducer(AppState state, Action action)
{
    return std::visit(
        [&](auto&& act) -> AppState {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, Undo>) {
                if (state.history.empty())
                    return state;
                Patch last   = state.history.back();
                state.data   = last.reverse().apply_checked(state.data);
                state.future = state.future.push_back(last);
                state.history = state.history.take(state.history.size() - 1);
                return state;

            } else if constexpr (std::is_same_v<T, Redo>) {
                if (state.future.empty())
                    return state;
                Patch next    = state.future.back();
                state.data    = next.apply_checked(state.data);
                state.history = state.history.push_back(next);
                state.future  = state.future.take(state.future.size() - 1);
                return state;

            } else if constexpr (std::is_same_v<T, AddItem>) {
                auto item = Value::map({{"title", act.title}, {"done", false}});
                Path end = {std::string{"items"}, std::string{"-"}};
                return record(state, set_at(state.data, end, std::move(item)));

            } else if constexpr (std::is_same_v<T, RenameItem>) {
                Path title = {std::string{"items"}, act.index, std::string{"title"}};
                if (!resolve(state.data, title))
                    return state;
                return record(state, lager::set(path_lens(title), state.data, Value{act.title}));
            }

            return state;
        },
        action);
}

// ============================================================
// Demos
// ============================================================

void demo_wire_formats(const AppState& state)
{
    if (state.history.empty()) {
        std::cout << "(no changes yet)\n";
        return;
    }
    const Patch& last = state.history.back();
    std::cout << "--- summary ---\n" << last.summary();
    std::cout << "--- JSON Patch ---\n" << to_json_patch(last, false) << "\n";

    PatchCodec codec;
    register_builtin_kinds(codec);
    std::cout << "--- codec (" << codec.to_binary(last).size() << " bytes binary) ---\n"
              << codec.to_json(last) << "\n";
}

void demo_guarded_patch(const AppState& state)
{
    PatchBuilder builder(state.data);
    builder.at("/items/0/done").put(true).only_if(cond::eq("/items/0/done", false));
    Patch p = builder.build();

    std::cout << p.to_string() << "\n";
    std::vector<std::string> errors;
    Value once = p.apply(state.data, &errors);
    Value twice = p.apply(once, &errors);
    std::cout << "applied twice, " << errors.size() << " error(s); result:\n";
    print_value(twice, "", 1);
}

void demo_replicas(const AppState& state)
{
    Replica a("node-a", state.data);
    Replica b("node-b", state.data);

    Delta da = a.edit([](const Value& v) { return v.set("owner", "alice"); });
    Delta db = b.edit([](const Value& v) { return v.set("owner", "bob"); });

    a.apply_delta(db);
    b.apply_delta(da);
    std::cout << "node-a owner: " << a.view().at("owner").as_string() << "\n";
    std::cout << "node-b owner: " << b.view().at("owner").as_string() << "\n";

    MergeResult merged = merge(da.patch, db.patch);
    for (const auto& conflict : merged.conflicts) {
        std::cout << to_string(conflict) << "\n";
    }
}

void demo_text_sync()
{
    LogicalClock clock_a("node-a");
    LogicalClock clock_b("node-b");

    Text a = Text{}.insert(0, "Hello", clock_a);
    Text b = a;
    std::cout << "both: " << a.str() << "\n";

    a = a.insert(5, " World", clock_a);
    b = b.insert(5, "!", clock_b);
    std::cout << "node-a: " << a.str() << "\nnode-b: " << b.str() << "\n";

    Text on_a = a.merge(b);
    Text on_b = b.merge(a);
    std::cout << "after sync: " << on_a.str() << " / " << on_b.str()
              << (on_a == on_b ? " (converged)" : " (diverged)") << "\n";
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    auto loop  = lager::with_manual_event_loop{};
    auto store = lager::make_store<Action>(create_initial_state(), loop, lager::with_reducer(reducer));

    while (true) {
        std::cout << "\nCurrent data:\n";
        print_value(store.get().data, "", 1);

        std::cout << "\n1. Add item\n";
        std::cout << "2. Rename item\n";
        std::cout << "U. Undo (" << store.get().history.size() << ")\n";
        std::cout << "R. Redo (" << store.get().future.size() << ")\n";
        std::cout << "W. Show last patch in every wire format\n";
        std::cout << "G. Guarded patch\n";
        std::cout << "S. Replica sync\n";
        std::cout << "T. Text sync\n";
        std::cout << "Q. Quit\n";
        std::cout << "\nChoice: ";

        char choice;
        if (!(std::cin >> choice))
            break;
        std::cin.ignore();

        switch (choice) {
        case '1': {
            std::cout << "Enter item title: ";
            std::string title;
            std::getline(std::cin, title);
            store.dispatch(AddItem{title});
            break;
        }
        case '2': {
            std::cout << "Enter item index: ";
            std::size_t index;
            std::cin >> index;
            std::cin.ignore();
            std::cout << "Enter new title: ";
            std::string title;
            std::getline(std::cin, title);
            store.dispatch(RenameItem{index, title});
            break;
        }
        case 'U':
        case 'u':
            store.dispatch(Undo{});
            break;
        case 'R':
        case 'r':
            store.dispatch(Redo{});
            break;
        case 'W':
        case 'w':
            demo_wire_formats(store.get());
            break;
        case 'G':
        case 'g':
            demo_guarded_patch(store.get());
            break;
        case 'S':
        case 's':
            demo_replicas(store.get());
            break;
        case 'T':
        case 't':
            demo_text_sync();
            break;
        case 'Q':
        case 'q':
            return 0;
        default:
            std::cout << "Unknown choice\n";
        }
    }
    return 0;
}
