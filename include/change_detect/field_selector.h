// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file field_selector.h
/// @brief What a watch record observes on its object.
///
/// | Kind     | String form | Object must be   | Reported value           |
/// |----------|-------------|------------------|--------------------------|
/// | Field    | "name"      | map or table     | object[name] (null if absent) |
/// | Items    | "[]"        | vector or array  | CollectionChangeRecord   |
/// | Entries  | "{}"        | map or table     | MapChangeRecord          |
/// | Identity | "."         | anything         | the object itself        |

#pragma once

#include <change_detect/api.h>
#include <change_detect/value.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace change_detect {

class CHANGE_DETECT_API FieldSelector {
public:
    enum class Kind : std::uint8_t { Field, Items, Entries, Identity };

    /// Named field of a map/table
    static FieldSelector field(std::string name);
    static FieldSelector items() { return FieldSelector{Kind::Items, {}}; }
    static FieldSelector entries() { return FieldSelector{Kind::Entries, {}}; }
    static FieldSelector identity() { return FieldSelector{Kind::Identity, {}}; }

    /// Parse ".", "[]", "{}" or a field name.
    /// @throws InvalidFieldSelector for an empty string
    static FieldSelector parse(std::string_view text);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// True if `object` has a shape this selector can observe
    [[nodiscard]] bool accepts(const Value& object) const noexcept;

    /// @throws InvalidFieldSelector if !accepts(object)
    void validate(const Value& object) const;

    /// String form, as accepted by parse()
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const FieldSelector& a, const FieldSelector& b) {
        return a.kind_ == b.kind_ && a.name_ == b.name_;
    }
    friend bool operator!=(const FieldSelector& a, const FieldSelector& b) { return !(a == b); }

private:
    FieldSelector(Kind kind, std::string name) : kind_(kind), name_(std::move(name)) {}

    Kind kind_;
    std::string name_;
};

} // namespace change_detect
