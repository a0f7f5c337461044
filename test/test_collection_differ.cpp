// test_collection_differ.cpp - Tests for CollectionDiffer
// Module 3: Identity-based sequence diff with minimal moves

#include <catch2/catch_all.hpp>
#include <change_detect/collection_differ.h>
#include <change_detect/errors.h>
#include <change_detect/identity.h>
#include <change_detect/value.h>

#include <string>
#include <vector>

using namespace change_detect;

// ============================================================
// Helper Functions
// ============================================================

namespace {

std::vector<std::string> moved_items(const CollectionChangeRecord& record) {
    std::vector<std::string> result;
    record.for_each_move([&](const CollectionItem& it) { result.push_back(it.value().as_string()); });
    return result;
}

} // anonymous namespace

// ============================================================
// Additions and removals
// ============================================================

TEST_CASE("CollectionDiffer additions", "[differ][collection]") {
    auto items = Value::vector({"a", "b", "c"});
    CollectionDiffer differ{items};

    items = items.push_back("d");
    REQUIRE(differ.check(items));

    const auto& record = differ.record();
    REQUIRE(record.addition_count() == 1);
    REQUIRE(record.removal_count() == 0);
    REQUIRE(record.move_count() == 0);

    record.for_each_addition([](const CollectionItem& it) {
        REQUIRE(it.value().as_string() == "d");
        REQUIRE(it.is_addition());
        REQUIRE(*it.current_index == 3);
    });

    SECTION("items list covers the whole sequence") {
        REQUIRE(record.items().size() == 4);
        REQUIRE(*record.items()[0].previous_index == 0);
        REQUIRE(*record.items()[2].previous_index == 2);
        REQUIRE(identical(record.iterable(), items));
    }
}

TEST_CASE("CollectionDiffer removals", "[differ][collection]") {
    auto items = Value::vector({"a", "b", "c"});
    CollectionDiffer differ{items};

    REQUIRE(differ.check(Value::vector({"a", "c"})));

    const auto& record = differ.record();
    REQUIRE(record.addition_count() == 0);
    REQUIRE(record.move_count() == 0);
    REQUIRE(record.removal_count() == 1);
    REQUIRE(record.removals()[0].value().as_string() == "b");
    REQUIRE(*record.removals()[0].previous_index == 1);
    REQUIRE(record.removals()[0].is_removal());
}

TEST_CASE("CollectionDiffer add and remove together", "[differ][collection]") {
    CollectionDiffer differ{Value::vector({"a", "b"})};

    REQUIRE(differ.check(Value::vector({"b", "c"})));

    const auto& record = differ.record();
    REQUIRE(record.addition_count() == 1);
    REQUIRE(record.removal_count() == 1);
    REQUIRE(record.move_count() == 0);
}

// ============================================================
// Moves
// ============================================================

TEST_CASE("CollectionDiffer reports minimal moves", "[differ][collection][moves]") {
    SECTION("swap of two neighbours moves one item") {
        CollectionDiffer differ{Value::vector({"a", "b", "c", "d"})};
        REQUIRE(differ.check(Value::vector({"b", "a", "c", "d"})));

        const auto& record = differ.record();
        REQUIRE(record.addition_count() == 0);
        REQUIRE(record.removal_count() == 0);
        REQUIRE(record.move_count() == 1);

        auto moved = moved_items(record);
        REQUIRE((moved[0] == "a" || moved[0] == "b"));
    }

    SECTION("moving the last item to the front") {
        CollectionDiffer differ{Value::vector({"a", "b", "c", "d"})};
        REQUIRE(differ.check(Value::vector({"d", "a", "b", "c"})));

        auto moved = moved_items(differ.record());
        REQUIRE(moved == std::vector<std::string>{"d"});
        differ.record().for_each_move([](const CollectionItem& it) {
            REQUIRE(*it.previous_index == 3);
            REQUIRE(*it.current_index == 0);
        });
    }

    SECTION("reversal keeps one item in place") {
        CollectionDiffer differ{Value::vector({"a", "b", "c", "d"})};
        REQUIRE(differ.check(Value::vector({"d", "c", "b", "a"})));
        REQUIRE(differ.record().move_count() == 3);
    }

    SECTION("removal before an item is not a move") {
        CollectionDiffer differ{Value::vector({"a", "b", "c"})};
        REQUIRE(differ.check(Value::vector({"b", "c"})));
        REQUIRE(differ.record().move_count() == 0);
        REQUIRE(differ.record().removal_count() == 1);
    }

    SECTION("insertion at the front is not a move") {
        CollectionDiffer differ{Value::vector({"a", "b"})};
        REQUIRE(differ.check(Value::vector({"x", "a", "b"})));
        REQUIRE(differ.record().move_count() == 0);
        REQUIRE(differ.record().addition_count() == 1);
    }
}

TEST_CASE("CollectionDiffer pairs duplicates first in first out", "[differ][collection][duplicates]") {
    CollectionDiffer differ{Value::vector({1, 1, 2})};

    REQUIRE(differ.check(Value::vector({1, 2, 1})));

    const auto& record = differ.record();
    REQUIRE(record.addition_count() == 0);
    REQUIRE(record.removal_count() == 0);
    REQUIRE(record.move_count() == 1);

    record.for_each_move([](const CollectionItem& it) {
        REQUIRE(it.value().as_int() == 2);
    });

    SECTION("n-th occurrence takes the n-th previous occurrence") {
        const auto& items = record.items();
        REQUIRE(*items[0].previous_index == 0);
        REQUIRE(*items[1].previous_index == 2);
        REQUIRE(*items[2].previous_index == 1);
    }

    SECTION("dropping a duplicate removes the last occurrence") {
        REQUIRE(differ.check(Value::vector({1, 2})));
        REQUIRE(differ.record().removal_count() == 1);
        REQUIRE(differ.record().move_count() == 0);
        REQUIRE(*differ.record().removals()[0].previous_index == 2);
    }
}

// ============================================================
// Identity semantics
// ============================================================

TEST_CASE("CollectionDiffer compares items by identity", "[differ][collection][identity]") {
    auto first = Value::map({{"id", 1}});
    auto second = Value::map({{"id", 2}});
    auto items = Value::vector({first, second});
    CollectionDiffer differ{items};

    SECTION("an equal but rebuilt item is a removal plus an addition") {
        auto rebuilt = items.set(std::size_t{0}, Value::map({{"id", 1}}));
        REQUIRE(differ.check(rebuilt));
        REQUIRE(differ.record().addition_count() == 1);
        REQUIRE(differ.record().removal_count() == 1);
    }

    SECTION("a rebuilt sequence of the same items reports nothing") {
        REQUIRE_FALSE(differ.check(Value::vector({first, second})));
        REQUIRE_FALSE(differ.record().has_changes());
    }

    SECTION("the same sequence takes the fast path") {
        REQUIRE_FALSE(differ.check(items));
        REQUIRE(differ.record().items().size() == 2);
        REQUIRE(*differ.record().items()[1].previous_index == 1);
    }
}

TEST_CASE("CollectionDiffer consecutive checks", "[differ][collection]") {
    auto items = Value::vector({"a"});
    CollectionDiffer differ{items};

    items = items.push_back("b");
    REQUIRE(differ.check(items));
    REQUIRE_FALSE(differ.check(items));
    REQUIRE_FALSE(differ.record().has_changes());

    items = items.push_back("c");
    REQUIRE(differ.check(items));
    REQUIRE(differ.record().addition_count() == 1);
}

TEST_CASE("CollectionDiffer supports arrays", "[differ][collection]") {
    CollectionDiffer differ{Value::array({"a", "b"})};
    REQUIRE(differ.check(Value::array({"b", "a", "c"})));
    REQUIRE(differ.record().addition_count() == 1);
    REQUIRE(differ.record().move_count() == 1);

    SECTION("switching between vector and array") {
        REQUIRE(differ.check(Value::vector({"b", "a", "c"})));
        REQUIRE_FALSE(differ.record().has_changes());
    }
}

TEST_CASE("CollectionDiffer rejects non-sequences", "[differ][collection][errors]") {
    REQUIRE_THROWS_AS(CollectionDiffer{Value::map({{"a", 1}})}, EvaluationError);

    CollectionDiffer differ{Value::vector({1})};
    REQUIRE_THROWS_AS(differ.check(Value{3}), EvaluationError);

    SECTION("reset starts over from a new baseline") {
        differ.reset(Value::vector({1, 2}));
        REQUIRE_FALSE(differ.check(Value::vector({1, 2})));
    }
}
