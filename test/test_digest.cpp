// test_digest.cpp - Tests for WatchRecord::check and ChangeDetector::collect_changes
// Module 6: Digest passes, error handling, statistics

#include <catch2/catch_all.hpp>
#include <change_detect/change_detector.h>
#include <change_detect/errors.h>
#include <change_detect/identity.h>
#include <change_detect/value.h>

#include <any>
#include <exception>
#include <string>
#include <vector>

using namespace change_detect;

// ============================================================
// Helper Functions
// ============================================================

namespace {

std::size_t count_changes(const ChangeRecord* head) {
    std::size_t count = 0;
    for (const ChangeRecord* c = head; c; c = c->next_change()) {
        ++count;
    }
    return count;
}

Value create_document() {
    return Value::map({
        {"title", "Draft"},
        {"tags", Value::vector({"a", "b", "c"})},
        {"meta", Value::map({{"author", "Alice"}})}
    });
}

} // anonymous namespace

// ============================================================
// No-change passes
// ============================================================

TEST_CASE("Digest without mutation reports nothing", "[digest][baseline]") {
    ChangeDetector detector;
    Value doc = create_document();
    Value tags = doc.at("tags");
    Value meta = doc.at("meta");
    Value number{5};

    auto group = detector.new_group();
    group.watch(doc, "title");
    group.watch(doc, "missing");
    group.watch(doc, ".");
    group.watch(tags, "[]");
    group.new_group().watch(meta, "{}");
    detector.watch(number, ".");

    REQUIRE(detector.collect_changes() == nullptr);
    REQUIRE(detector.collect_changes() == nullptr);

    SECTION("replacing a slot with an identical value reports nothing") {
        doc = Value{doc};
        tags = doc.at("tags");
        REQUIRE(detector.collect_changes() == nullptr);
    }
}

// ============================================================
// Field and identity selectors
// ============================================================

TEST_CASE("Field changes carry previous and current values", "[digest][field]") {
    ChangeDetector detector;
    Value doc = create_document();
    detector.watch(doc, "title", std::string{"title-handler"});

    doc = doc.set("title", "Final");

    const ChangeRecord* head = detector.collect_changes();
    REQUIRE(head != nullptr);
    REQUIRE(head->next_change() == nullptr);
    REQUIRE(head->previous_value().as_string() == "Draft");
    REQUIRE(head->current_value().as_string() == "Final");
    REQUIRE(head->selector() == FieldSelector::field("title"));
    REQUIRE(std::any_cast<std::string>(head->handler()) == "title-handler");
    REQUIRE(&head->object() == &doc);
    REQUIRE(head->collection_changes() == nullptr);
    REQUIRE(head->map_changes() == nullptr);

    SECTION("the record keeps the latest values") {
        auto record = head->record();
        REQUIRE(record.current_value().as_string() == "Final");
        REQUIRE(record.previous_value().as_string() == "Draft");
    }

    SECTION("the next pass is clean") {
        REQUIRE(detector.collect_changes() == nullptr);
    }
}

TEST_CASE("Unrelated field changes are ignored", "[digest][field]") {
    ChangeDetector detector;
    Value doc = create_document();
    detector.watch(doc, "title");

    doc = doc.set("meta", Value::map({{"author", "Bob"}}));
    REQUIRE(detector.collect_changes() == nullptr);
}

TEST_CASE("Absent fields read as null", "[digest][field]") {
    ChangeDetector detector;
    Value doc = create_document();
    auto record = detector.watch(doc, "subtitle");
    REQUIRE(record.current_value().is_null());

    doc = doc.set("subtitle", "Intro");
    const ChangeRecord* head = detector.collect_changes();
    REQUIRE(head != nullptr);
    REQUIRE(head->previous_value().is_null());
    REQUIRE(head->current_value().as_string() == "Intro");

    doc = doc.erase("subtitle");
    head = detector.collect_changes();
    REQUIRE(head != nullptr);
    REQUIRE(head->current_value().is_null());
}

TEST_CASE("Field values compare by identity", "[digest][field][identity]") {
    ChangeDetector detector;
    Value doc = create_document();
    detector.watch(doc, "meta");

    SECTION("an equal but rebuilt child is a change") {
        doc = doc.set("meta", Value::map({{"author", "Alice"}}));
        REQUIRE(detector.collect_changes() != nullptr);
    }

    SECTION("an equal atom is not a change") {
        doc = doc.set("title", "Draft");
        REQUIRE(detector.collect_changes() == nullptr);
    }
}

TEST_CASE("Identity selector watches the slot itself", "[digest][identity]") {
    ChangeDetector detector;
    Value counter{1};
    detector.watch(counter, ".");

    counter = Value{2};
    const ChangeRecord* head = detector.collect_changes();
    REQUIRE(head != nullptr);
    REQUIRE(head->previous_value().as_int() == 1);
    REQUIRE(head->current_value().as_int() == 2);

    SECTION("type changes are reported too") {
        counter = Value{"two"};
        REQUIRE(detector.collect_changes() != nullptr);
    }
}

// ============================================================
// Items and entries selectors
// ============================================================

TEST_CASE("Items selector exposes the collection diff", "[digest][items]") {
    ChangeDetector detector;
    Value list = Value::vector({"a", "b", "c"});
    detector.watch(list, FieldSelector::items());

    list = list.push_back("d");

    const ChangeRecord* head = detector.collect_changes();
    REQUIRE(head != nullptr);
    REQUIRE(head->collection_changes() != nullptr);
    REQUIRE(head->map_changes() == nullptr);
    REQUIRE(head->collection_changes()->addition_count() == 1);
    REQUIRE(head->collection_changes()->removal_count() == 0);
    REQUIRE(head->collection_changes()->move_count() == 0);
    REQUIRE(identical(head->current_value(), list));
    REQUIRE(head->previous_value().size() == 3);

    SECTION("a rebuilt list with the same items is not a change") {
        list = Value::vector({"a", "b", "c", "d"});
        REQUIRE(detector.collect_changes() == nullptr);

        // The rebuilt list is the baseline of the next change
        const Value rebuilt = list;
        list = list.push_back("e");
        head = detector.collect_changes();
        REQUIRE(head != nullptr);
        REQUIRE(identical(head->previous_value(), rebuilt));
        REQUIRE(head->collection_changes()->addition_count() == 1);
    }

    SECTION("a reorder is a change") {
        list = Value::vector({"b", "a", "c", "d"});
        head = detector.collect_changes();
        REQUIRE(head != nullptr);
        REQUIRE(head->collection_changes()->move_count() == 1);
    }
}

TEST_CASE("Entries selector exposes the map diff", "[digest][entries]") {
    ChangeDetector detector;
    Value meta = Value::map({{"author", "Alice"}, {"year", 2024}});
    detector.watch(meta, "{}");

    meta = meta.set("year", 2025).set("editor", "Bob");

    const ChangeRecord* head = detector.collect_changes();
    REQUIRE(head != nullptr);
    REQUIRE(head->map_changes() != nullptr);
    REQUIRE(head->collection_changes() == nullptr);
    REQUIRE(head->map_changes()->change_count() == 1);
    REQUIRE(head->map_changes()->addition_count() == 1);
    REQUIRE(head->map_changes()->removal_count() == 0);

    SECTION("a rebuilt map with the same entries is not a change") {
        meta = Value::map({{"author", "Alice"}, {"year", 2025}, {"editor", "Bob"}});
        REQUIRE(detector.collect_changes() == nullptr);

        const Value rebuilt = meta;
        meta = meta.erase("editor");
        head = detector.collect_changes();
        REQUIRE(head != nullptr);
        REQUIRE(identical(head->previous_value(), rebuilt));
        REQUIRE(head->map_changes()->removal_count() == 1);
    }
}

// ============================================================
// WatchRecord::check
// ============================================================

TEST_CASE("WatchRecord::check evaluates one record", "[digest][check]") {
    ChangeDetector detector;
    Value doc = create_document();
    auto title = detector.watch(doc, "title");
    detector.watch(doc, "meta");

    REQUIRE_FALSE(title.check().has_value());

    doc = doc.set("title", "Final").set("meta", Value::map({}));
    auto change = title.check();
    REQUIRE(change.has_value());
    REQUIRE(change->current_value().as_string() == "Final");
    REQUIRE(change->next_change() == nullptr);
    REQUIRE(change->record() == title);

    SECTION("an earlier change keeps its values after later checks") {
        doc = doc.set("title", "Revised");
        auto later = title.check();
        REQUIRE(later.has_value());
        REQUIRE(later->previous_value().as_string() == "Final");
        REQUIRE(later->current_value().as_string() == "Revised");
        REQUIRE(change->current_value().as_string() == "Final");
    }

    SECTION("the digest only sees what check did not consume") {
        const ChangeRecord* head = detector.collect_changes();
        REQUIRE(count_changes(head) == 1);
        REQUIRE(head->selector() == FieldSelector::field("meta"));
    }
}

TEST_CASE("WatchRecord::set_object re-targets and re-baselines", "[digest][set_object]") {
    ChangeDetector detector;
    Value first = Value::map({{"name", "first"}});
    Value second = Value::map({{"name", "second"}});
    Value number{3};

    auto record = detector.watch(first, "name");
    record.set_object(second);
    REQUIRE(&record.object() == &second);
    REQUIRE(record.current_value().as_string() == "second");
    REQUIRE(detector.collect_changes() == nullptr);

    first = first.set("name", "ignored");
    REQUIRE(detector.collect_changes() == nullptr);

    second = second.set("name", "changed");
    REQUIRE(detector.collect_changes() != nullptr);

    REQUIRE_THROWS_AS(record.set_object(number), InvalidFieldSelector);
    REQUIRE(&record.object() == &second);

    SECTION("collection watches restart from the new object") {
        Value a = Value::vector({1, 2});
        Value b = Value::vector({3});
        auto items = detector.watch(a, "[]");
        items.set_object(b);
        REQUIRE_FALSE(items.check().has_value());
        b = b.push_back(4);
        auto change = items.check();
        REQUIRE(change.has_value());
        REQUIRE(change->collection_changes()->addition_count() == 1);
        REQUIRE(change->collection_changes()->removal_count() == 0);
    }
}

// ============================================================
// Error handling
// ============================================================

TEST_CASE("Evaluation errors go to the exception handler", "[digest][errors]") {
    ChangeDetector detector;
    Value doc = create_document();
    Value other = create_document();
    detector.watch(doc, "title", std::string{"broken"});
    detector.watch(other, "title", std::string{"healthy"});

    doc = Value{42};
    other = other.set("title", "Changed");

    std::vector<std::string> failures;
    auto on_error = [&](std::exception_ptr error, const EvaluationContext& context) {
        REQUIRE_THROWS_AS(std::rethrow_exception(error), EvaluationError);
        REQUIRE(context.selector == FieldSelector::field("title"));
        REQUIRE(context.object.as_int() == 42);
        REQUIRE(context.record.alive());
        failures.push_back(std::any_cast<std::string>(context.handler));
    };

    const ChangeRecord* head = detector.collect_changes(on_error);
    REQUIRE(failures == std::vector<std::string>{"broken"});
    REQUIRE(count_changes(head) == 1);
    REQUIRE(std::any_cast<std::string>(head->handler()) == "healthy");
    REQUIRE(detector.stats().errors_handled == 1);
    REQUIRE(detector.stats().aborted_passes == 0);
}

TEST_CASE("Evaluation errors without a handler abort the pass", "[digest][errors]") {
    ChangeDetector detector;
    Value first = create_document();
    Value broken = create_document();
    Value last = create_document();
    auto first_record = detector.watch(first, "title");
    detector.watch(broken, "title");
    auto last_record = detector.watch(last, "title");

    first = first.set("title", "One");
    broken = Value::vector({});
    last = last.set("title", "Three");

    REQUIRE_THROWS_AS(detector.collect_changes(), EvaluationError);
    REQUIRE(detector.stats().aborted_passes == 1);
    REQUIRE_FALSE(detector.digesting());

    // Records before the failure advanced, records after it did not
    REQUIRE(first_record.current_value().as_string() == "One");
    REQUIRE(last_record.current_value().as_string() == "Draft");

    broken = create_document();
    const ChangeRecord* head = detector.collect_changes();
    REQUIRE(count_changes(head) == 1);
    REQUIRE(head->current_value().as_string() == "Three");
}

TEST_CASE("Mutating the tree during a digest throws", "[digest][errors][reentrancy]") {
    ChangeDetector detector;
    Value doc = create_document();
    Value broken = create_document();
    auto group = detector.new_group();
    auto record = group.watch(doc, "title");
    group.watch(broken, "title");

    broken = Value{1};

    SECTION("watch from the exception handler") {
        auto on_error = [&](std::exception_ptr, const EvaluationContext&) { group.watch(doc, "meta"); };
        REQUIRE_THROWS_AS(detector.collect_changes(on_error), DigestInProgress);
    }

    SECTION("new_group from the exception handler") {
        auto on_error = [&](std::exception_ptr, const EvaluationContext&) { detector.new_group(); };
        REQUIRE_THROWS_AS(detector.collect_changes(on_error), DigestInProgress);
    }

    SECTION("remove from the exception handler") {
        auto on_error = [&](std::exception_ptr, const EvaluationContext&) { record.remove(); };
        REQUIRE_THROWS_AS(detector.collect_changes(on_error), DigestInProgress);
        REQUIRE(record.alive());
    }

    SECTION("set_object from the exception handler") {
        auto on_error = [&](std::exception_ptr, const EvaluationContext& context) {
            WatchRecord failing = context.record;
            failing.set_object(doc);
        };
        REQUIRE_THROWS_AS(detector.collect_changes(on_error), DigestInProgress);
    }

    SECTION("re-entrant digest") {
        auto on_error = [&](std::exception_ptr, const EvaluationContext&) { detector.collect_changes(); };
        REQUIRE_THROWS_AS(detector.collect_changes(on_error), DigestInProgress);
    }

    REQUIRE_FALSE(detector.digesting());

    // The detector recovers once the offending slot is fixed
    broken = create_document();
    REQUIRE(detector.collect_changes() == nullptr);
}

// ============================================================
// Statistics
// ============================================================

TEST_CASE("Digest statistics", "[digest][stats]") {
    ChangeDetector detector;
    Value doc = create_document();
    detector.watch(doc, "title");
    detector.watch(doc, "meta");

    detector.collect_changes();
    doc = doc.set("title", "Final");
    detector.collect_changes();

    const auto& stats = detector.stats();
    REQUIRE(stats.passes == 2);
    REQUIRE(stats.records_checked == 4);
    REQUIRE(stats.changes_reported == 1);
    REQUIRE(stats.errors_handled == 0);

    detector.reset_stats();
    REQUIRE(detector.stats().passes == 0);
    REQUIRE(detector.stats().records_checked == 0);
}
