// main.cpp - Change detection over a lager store

#include <change_detect/change_detector.h>
#include <change_detect/lager_adapters.h>
#include <change_detect/playback.h>
#include <change_detect/value.h>

#include <lager/event_loop/manual.hpp>
#include <lager/reader.hpp>
#include <lager/store.hpp>
#include <zug/transducer/map.hpp>

#include <any>
#include <iostream>
#include <string>
#include <variant>

using namespace change_detect;

// ============================================================
// Application State and Actions
// ============================================================

struct AddItem
{
    std::string text;
};

struct RenameList
{
    std::string title;
};

struct MoveToFront
{
    std::size_t index;
};

struct RemoveItem
{
    std::size_t index;
};

using Action = std::variant<AddItem, RenameList, MoveToFront, RemoveItem>;

Value create_initial_state()
{
    return Value::map({
        {"title", "Groceries"},
        {"items", Value::vector({
            Value::map({{"text", "milk"}, {"done", false}}),
            Value::map({{"text", "bread"}, {"done", false}})
        })}
    });
}

// Rebuild the list from the existing boxes so every item keeps its identity
Value reorder(const Value& items, std::size_t index, bool keep)
{
    auto* vec = items.get_if<ValueVector>();
    if (!vec || index >= vec->size()) {
        return items;
    }
    auto t = ValueVector{}.transient();
    if (keep) {
        t.push_back((*vec)[index]);
    }
    for (std::size_t i = 0; i < vec->size(); ++i) {
        if (i != index) {
            t.push_back((*vec)[i]);
        }
    }
    return Value{t.persistent()};
}

// ============================================================
// Reducer
// ============================================================

Value reducer(Value state, Action action)
{
    return std::visit(
        [&](auto&& act) -> Value {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, AddItem>) {
                auto item = Value::map({{"text", act.text}, {"done", false}});
                return state.set("items", state.at("items").push_back(item));
            } else if constexpr (std::is_same_v<T, RenameList>) {
                return state.set("title", act.title);
            } else if constexpr (std::is_same_v<T, MoveToFront>) {
                return state.set("items", reorder(state.at("items"), act.index, true));
            } else if constexpr (std::is_same_v<T, RemoveItem>) {
                return state.set("items", reorder(state.at("items"), act.index, false));
            }
            return state;
        },
        action);
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    auto loop  = lager::with_manual_event_loop{};
    auto store = lager::make_store<Action>(
        create_initial_state(),
        loop,
        lager::with_reducer(reducer)
    );

    // The item list as its own slot, so it can be watched with "[]"
    lager::reader<Value> items = store.xform(zug::map([](const Value& state) { return state.at("items"); }));

    ChangeDetector detector;
    auto header = detector.new_group();
    header.watch(store.get(), "title", std::string{"header title"});
    auto list = detector.new_group();
    list.watch(items.get(), "[]", std::string{"list rows"});

    PlaybackRecorder recorder;

    digest_on_change(store, detector, [&](const ChangeRecord* head) {
        for (const ChangeRecord* c = head; c; c = c->next_change()) {
            std::cout << "[" << std::any_cast<std::string>(c->handler()) << "] ";
            c->print();
        }
        recorder.record_value("state " + std::to_string(detector.stats().passes), store.get());
    });

    std::cout << "=== Change Detection Example ===\n\n";

    while (true) {
        std::cout << "Current state:\n";
        print_value(store.get(), "", 1);

        std::cout << "\n=== Operations ===\n";
        std::cout << "1. Add item\n";
        std::cout << "2. Rename list\n";
        std::cout << "3. Move item to front\n";
        std::cout << "4. Remove item\n";
        std::cout << "T. Stop/restart watching the title\n";
        std::cout << "P. Print playback data\n";
        std::cout << "\nQ. Quit\n";
        std::cout << "\nChoice: ";

        char choice;
        std::cin >> choice;
        std::cin.ignore();

        switch (choice) {
        case '1': {
            std::cout << "Enter item text: ";
            std::string text;
            std::getline(std::cin, text);
            store.dispatch(AddItem{text});
            break;
        }
        case '2': {
            std::cout << "Enter new title: ";
            std::string title;
            std::getline(std::cin, title);
            store.dispatch(RenameList{title});
            break;
        }
        case '3':
        case '4': {
            std::cout << "Enter item index: ";
            std::size_t index;
            std::cin >> index;
            std::cin.ignore();
            if (choice == '3') {
                store.dispatch(MoveToFront{index});
            } else {
                store.dispatch(RemoveItem{index});
            }
            break;
        }
        case 'T':
        case 't':
            if (header.alive()) {
                header.remove();
                std::cout << "Title watch removed\n";
            } else {
                header = detector.new_group();
                header.watch(store.get(), "title", std::string{"header title"});
                std::cout << "Title watch restored\n";
            }
            break;
        case 'P':
        case 'p':
            std::cout << recorder.generate() << "\n";
            break;
        case 'Q':
        case 'q':
            std::cout << "Goodbye!\n";
            return 0;
        default:
            std::cout << "Invalid choice!\n";
        }

        std::cout << "\n";
    }
}
