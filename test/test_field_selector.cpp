// test_field_selector.cpp - Tests for FieldSelector
// Module 2: Selector parsing and shape validation

#include <catch2/catch_all.hpp>
#include <change_detect/errors.h>
#include <change_detect/field_selector.h>
#include <change_detect/value.h>

using namespace change_detect;

TEST_CASE("FieldSelector parsing", "[selector][parse]") {
    SECTION("special forms") {
        REQUIRE(FieldSelector::parse(".").kind() == FieldSelector::Kind::Identity);
        REQUIRE(FieldSelector::parse("[]").kind() == FieldSelector::Kind::Items);
        REQUIRE(FieldSelector::parse("{}").kind() == FieldSelector::Kind::Entries);
    }

    SECTION("field names") {
        auto sel = FieldSelector::parse("name");
        REQUIRE(sel.kind() == FieldSelector::Kind::Field);
        REQUIRE(sel.name() == "name");
        REQUIRE(sel == FieldSelector::field("name"));
        REQUIRE(sel != FieldSelector::field("other"));
    }

    SECTION("to_string round trip") {
        REQUIRE(FieldSelector::identity().to_string() == ".");
        REQUIRE(FieldSelector::items().to_string() == "[]");
        REQUIRE(FieldSelector::entries().to_string() == "{}");
        REQUIRE(FieldSelector::field("title").to_string() == "title");
    }

    SECTION("empty name is rejected") {
        REQUIRE_THROWS_AS(FieldSelector::parse(""), InvalidFieldSelector);
        REQUIRE_THROWS_AS(FieldSelector::field(""), InvalidFieldSelector);
    }
}

TEST_CASE("FieldSelector shape validation", "[selector][validate]") {
    const auto map = Value::map({{"a", 1}});
    const auto table = Value::table({{"a", 1}});
    const auto vec = Value::vector({1});
    const auto arr = Value::array({1});
    const Value number{3};

    SECTION("field requires a map or table") {
        auto sel = FieldSelector::field("a");
        REQUIRE(sel.accepts(map));
        REQUIRE(sel.accepts(table));
        REQUIRE_FALSE(sel.accepts(vec));
        REQUIRE_THROWS_AS(sel.validate(number), InvalidFieldSelector);
    }

    SECTION("items requires a vector or array") {
        auto sel = FieldSelector::items();
        REQUIRE(sel.accepts(vec));
        REQUIRE(sel.accepts(arr));
        REQUIRE_FALSE(sel.accepts(map));
        REQUIRE_THROWS_AS(sel.validate(map), InvalidFieldSelector);
    }

    SECTION("entries requires a map or table") {
        auto sel = FieldSelector::entries();
        REQUIRE(sel.accepts(map));
        REQUIRE(sel.accepts(table));
        REQUIRE_THROWS_AS(sel.validate(vec), InvalidFieldSelector);
    }

    SECTION("identity accepts anything") {
        auto sel = FieldSelector::identity();
        REQUIRE(sel.accepts(number));
        REQUIRE(sel.accepts(Value{}));
        REQUIRE_NOTHROW(sel.validate(vec));
    }

    SECTION("errors derive from ChangeDetectError") {
        REQUIRE_THROWS_AS(FieldSelector::items().validate(number), ChangeDetectError);
    }
}
