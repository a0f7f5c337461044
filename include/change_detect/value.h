// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamic value type observed by the change detector.
///
/// A Value is one of:
/// - Atoms: null (std::monostate), bool, int32, int64, double, string
/// - Containers: map, vector, array, table (immer persistent containers)
///
/// Values are immutable. Every "modifying" member returns a new Value that
/// shares structure with the original, so children that were not touched
/// keep their identity. The change detector relies on this: it compares
/// containers by identity (see identity.h), never by content.
///
/// Usage:
/// @code
///   Value model = Value::map({{"name", "Alice"}, {"tags", Value::vector({"a", "b"})}});
///   model = model.set("name", "Bob");       // "tags" keeps its identity
/// @endcode

#pragma once

#include <change_detect/change_detect_config.h>
#include <change_detect/api.h>

#include <immer/array.hpp>
#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/table.hpp>
#include <immer/table_transient.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace change_detect {

/// Single-threaded memory policy: non-atomic refcount, no locks
using memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

struct Value;

using ValueBox    = immer::box<Value, memory_policy>;
using ValueMap    = immer::map<std::string, ValueBox, std::hash<std::string>,
                               std::equal_to<std::string>, memory_policy>;
using ValueVector = immer::vector<ValueBox, memory_policy>;
using ValueArray  = immer::array<ValueBox, memory_policy>;

struct TableEntry {
    std::string id;
    ValueBox value;

    bool operator==(const TableEntry& other) const {
        return id == other.id && value == other.value;
    }

    bool operator!=(const TableEntry& other) const {
        return !(*this == other);
    }
};

using ValueTable = immer::table<TableEntry, immer::table_key_fn, std::hash<std::string>,
                                std::equal_to<std::string>, memory_policy>;

struct CHANGE_DETECT_API Value
{
    std::variant<std::monostate,
                 bool,
                 int32_t,
                 int64_t,
                 double,
                 std::string,
                 ValueMap,
                 ValueVector,
                 ValueArray,
                 ValueTable>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}
    Value(int32_t v) noexcept : data(v) {}
    Value(int64_t v) noexcept : data(v) {}
    Value(double v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueMap v) : data(std::move(v)) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ValueArray v) : data(std::move(v)) {}
    Value(ValueTable v) : data(std::move(v)) {}

    // Factory functions for container types
    static Value map(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value vector(std::initializer_list<Value> init) {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value array(std::initializer_list<Value> init) {
        ValueArray result;
        for (const auto& val : init) {
            result = std::move(result).push_back(ValueBox{val});
        }
        return Value{std::move(result)};
    }

    static Value table(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueTable{}.transient();
        for (const auto& [id, val] : init) {
            t.insert(TableEntry{id, ValueBox{val}});
        }
        return Value{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<ValueMap>() || is<ValueTable>(); }
    [[nodiscard]] bool is_sequence() const noexcept { return is<ValueVector>() || is<ValueArray>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_map() || is_sequence(); }

    /// Child box for a key of a map/table, or nullptr
    [[nodiscard]] const ValueBox* find(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) return m->find(key);
        if (auto* t = get_if<ValueTable>()) {
            if (auto* entry = t->find(key)) return &entry->value;
        }
        return nullptr;
    }

    /// Child box at an index of a vector/array, or nullptr
    [[nodiscard]] const ValueBox* find(std::size_t index) const {
        if (auto* v = get_if<ValueVector>()) {
            if (index < v->size()) return &(*v)[index];
        }
        if (auto* a = get_if<ValueArray>()) {
            if (index < a->size()) return &(*a)[index];
        }
        return nullptr;
    }

    /// Value for a key, null when missing or not a map/table
    [[nodiscard]] Value at(const std::string& key) const {
        if (auto* box = find(key)) return box->get();
        return Value{};
    }

    /// Value at an index, null when out of range or not a sequence
    [[nodiscard]] Value at(std::size_t index) const {
        if (auto* box = find(index)) return box->get();
        return Value{};
    }

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<ValueMap>()) return m->size();
        if (auto* v = get_if<ValueVector>()) return v->size();
        if (auto* a = get_if<ValueArray>()) return a->size();
        if (auto* t = get_if<ValueTable>()) return t->size();
        return 0;
    }

    /// Returns a copy with `key` bound to `val`. Null becomes a map.
    /// Any other non-map value is returned unchanged.
    [[nodiscard]] Value set(const std::string& key, Value val) const;

    /// Returns a copy with element `index` replaced. Out of range or
    /// non-sequence values are returned unchanged.
    [[nodiscard]] Value set(std::size_t index, Value val) const;

    /// Returns a copy with the box of another Value stored under `key`,
    /// preserving that child's identity.
    [[nodiscard]] Value set_box(const std::string& key, ValueBox box) const;

    /// Returns a copy without `key`
    [[nodiscard]] Value erase(const std::string& key) const;

    /// Returns a copy of a vector/array with `val` appended. Null becomes a vector.
    [[nodiscard]] Value push_back(Value val) const;

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int32_t as_int(int32_t default_val = 0) const {
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        if (auto* p = get_if<int32_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }
};

/// Structural equality (deep). The change detector never uses this; it is
/// provided for tests and for callers that layer value semantics on top.
CHANGE_DETECT_API bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// ============================================================
// Utility functions
// ============================================================

/// Short human-readable rendering: atoms in full, containers as
/// "{map:N}", "[vector:N]", "[array:N]", "<table:N>"
[[nodiscard]] CHANGE_DETECT_API std::string value_to_string(const Value& val);

/// Print a Value tree with indentation to stdout
CHANGE_DETECT_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

/// Convert Value to a JSON string
/// @param compact If true, produce minimal output; otherwise indent by two spaces
[[nodiscard]] CHANGE_DETECT_API std::string to_json(const Value& val, bool compact = false);

/// Escape a string for inclusion in a JSON string literal (without quotes)
[[nodiscard]] CHANGE_DETECT_API std::string json_escape_string(std::string_view s);

} // namespace change_detect
