// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file collection_differ.h
/// @brief Order-sensitive structural diff of vectors/arrays by identity.
///
/// CollectionDiffer keeps the previous sequence and, on every check(),
/// reports which items were added, removed or moved.
///
/// Matching rules:
/// - Items are matched by identity (see identity.h), never by content.
/// - Repeated identities pair up first-in first-out: the n-th occurrence in
///   the new sequence takes the n-th unconsumed occurrence of the old one.
/// - A matched item is a move only if its order relative to the other
///   matched items changed. The unflagged items are the longest run of
///   matched items whose old positions are increasing, so the number of
///   reported moves is minimal.
///
/// Example:
/// @code
///   Value items = Value::vector({"a", "b", "c"});
///   CollectionDiffer differ{items};
///   items = items.push_back("d");
///   if (differ.check(items)) {
///       differ.record().for_each_addition([](const CollectionItem& it) {
///           // it.value() == "d", it.current_index == 3
///       });
///   }
/// @endcode

#pragma once

#include <change_detect/api.h>
#include <change_detect/identity.h>
#include <change_detect/value.h>

#include <tsl/robin_map.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace change_detect {

/// One item of a collection diff. Additions have no previous_index,
/// removals have no current_index.
struct CollectionItem {
    std::optional<std::size_t> previous_index;
    std::optional<std::size_t> current_index;
    ValueBox item;

    [[nodiscard]] const Value& value() const { return *item; }
    [[nodiscard]] bool is_addition() const noexcept { return !previous_index.has_value(); }
    [[nodiscard]] bool is_removal() const noexcept { return !current_index.has_value(); }
};

/// Result of the last CollectionDiffer::check(), rebuilt on every check.
class CHANGE_DETECT_API CollectionChangeRecord {
public:
    /// The sequence as of the last check
    [[nodiscard]] const Value& iterable() const noexcept { return iterable_; }

    /// Every current item in iteration order
    [[nodiscard]] const std::vector<CollectionItem>& items() const noexcept { return items_; }

    /// Removed items in their previous order
    [[nodiscard]] const std::vector<CollectionItem>& removals() const noexcept { return removals_; }

    [[nodiscard]] std::size_t addition_count() const noexcept { return additions_.size(); }
    [[nodiscard]] std::size_t move_count() const noexcept { return moves_.size(); }
    [[nodiscard]] std::size_t removal_count() const noexcept { return removals_.size(); }

    [[nodiscard]] bool has_changes() const noexcept {
        return !additions_.empty() || !moves_.empty() || !removals_.empty();
    }

    template <typename F>
    void for_each_item(F&& f) const {
        for (const auto& item : items_) f(item);
    }

    /// Added items in current order
    template <typename F>
    void for_each_addition(F&& f) const {
        for (std::size_t index : additions_) f(items_[index]);
    }

    /// Moved items in current order
    template <typename F>
    void for_each_move(F&& f) const {
        for (std::size_t index : moves_) f(items_[index]);
    }

    template <typename F>
    void for_each_removal(F&& f) const {
        for (const auto& item : removals_) f(item);
    }

    /// Print additions, moves and removals to stdout
    void print() const;

private:
    friend class CollectionDiffer;

    void clear();

    Value iterable_;
    std::vector<CollectionItem> items_;
    std::vector<std::size_t> additions_;   // indices into items_
    std::vector<std::size_t> moves_;       // indices into items_
    std::vector<CollectionItem> removals_;
};

class CHANGE_DETECT_API CollectionDiffer {
public:
    /// @param baseline The sequence later checks are compared against
    /// @throws EvaluationError if baseline is not a vector or array
    explicit CollectionDiffer(const Value& baseline);

    CollectionDiffer(const CollectionDiffer&) = delete;
    CollectionDiffer& operator=(const CollectionDiffer&) = delete;

    /// Diff `current` against the previous sequence and make it the new
    /// previous sequence.
    /// @return true if anything was added, removed or moved
    /// @throws EvaluationError if current is not a vector or array
    bool check(const Value& current);

    /// Forget the previous sequence and start over from `baseline`
    void reset(const Value& baseline);

    [[nodiscard]] const CollectionChangeRecord& record() const noexcept { return record_; }

private:
    // FIFO queue of previous positions sharing one identity
    struct Bucket {
        std::vector<std::size_t> positions;
        std::size_t next = 0;
    };

    void collect_previous();
    void flag_moves();

    Value previous_;
    CollectionChangeRecord record_;

    // Scratch state, kept to reuse its capacity between checks
    std::vector<const ValueBox*> previous_boxes_;
    tsl::robin_map<IdentityKey, Bucket, IdentityKeyHash> buckets_;
    std::vector<bool> consumed_;
    std::vector<std::size_t> matched_;   // indices into record_.items_
    std::vector<std::size_t> tails_;
    std::vector<std::size_t> parents_;
    std::vector<bool> stable_;
};

} // namespace change_detect
