// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file map_differ.h
/// @brief Key/value diff of maps and tables by identity.
///
/// Keys are stable identifiers. A key present before and after whose value
/// is no longer identical is a change; keys only present before are
/// removals, keys only present now are additions.

#pragma once

#include <change_detect/api.h>
#include <change_detect/identity.h>
#include <change_detect/value.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace change_detect {

/// One entry of a map diff. Additions have no previous_value, removals
/// have no current_value.
struct MapKeyValue {
    std::string key;
    std::optional<ValueBox> previous_value;
    std::optional<ValueBox> current_value;

    [[nodiscard]] bool is_addition() const noexcept { return !previous_value.has_value(); }
    [[nodiscard]] bool is_removal() const noexcept { return !current_value.has_value(); }
};

/// Result of the last MapDiffer::check(), rebuilt on every check.
class CHANGE_DETECT_API MapChangeRecord {
public:
    /// The map or table as of the last check
    [[nodiscard]] const Value& map() const noexcept { return map_; }

    /// Every current entry in iteration order
    [[nodiscard]] const std::vector<MapKeyValue>& entries() const noexcept { return entries_; }

    /// Removed entries in previous iteration order
    [[nodiscard]] const std::vector<MapKeyValue>& removals() const noexcept { return removals_; }

    [[nodiscard]] std::size_t change_count() const noexcept { return changes_.size(); }
    [[nodiscard]] std::size_t addition_count() const noexcept { return additions_.size(); }
    [[nodiscard]] std::size_t removal_count() const noexcept { return removals_.size(); }

    [[nodiscard]] bool has_changes() const noexcept {
        return !changes_.empty() || !additions_.empty() || !removals_.empty();
    }

    template <typename F>
    void for_each_entry(F&& f) const {
        for (const auto& kv : entries_) f(kv);
    }

    template <typename F>
    void for_each_change(F&& f) const {
        for (std::size_t index : changes_) f(entries_[index]);
    }

    template <typename F>
    void for_each_addition(F&& f) const {
        for (std::size_t index : additions_) f(entries_[index]);
    }

    template <typename F>
    void for_each_removal(F&& f) const {
        for (const auto& kv : removals_) f(kv);
    }

    /// Print changes, additions and removals to stdout
    void print() const;

private:
    friend class MapDiffer;

    void clear();

    Value map_;
    std::vector<MapKeyValue> entries_;
    std::vector<std::size_t> changes_;     // indices into entries_
    std::vector<std::size_t> additions_;   // indices into entries_
    std::vector<MapKeyValue> removals_;
};

class CHANGE_DETECT_API MapDiffer {
public:
    /// @throws EvaluationError if baseline is not a map or table
    explicit MapDiffer(const Value& baseline);

    MapDiffer(const MapDiffer&) = delete;
    MapDiffer& operator=(const MapDiffer&) = delete;

    /// Diff `current` against the previous map and make it the new
    /// previous map.
    /// @return true if any key was added, removed or changed
    /// @throws EvaluationError if current is not a map or table
    bool check(const Value& current);

    void reset(const Value& baseline);

    [[nodiscard]] const MapChangeRecord& record() const noexcept { return record_; }

private:
    Value previous_;
    MapChangeRecord record_;
};

} // namespace change_detect
