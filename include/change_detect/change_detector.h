// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change_detector.h
/// @brief Hierarchical identity-based change detection.
///
/// A ChangeDetector owns a tree of WatchGroups. Each group holds an ordered
/// run of WatchRecords, each record observes one slot (a Value owned by the
/// caller) through a FieldSelector. collect_changes() re-evaluates every
/// record in registration order and returns the records whose value changed
/// since the previous pass as a linked list.
///
/// Traversal order: a group's own records (registration order), then each
/// child group's subtree (creation order). Removing a group detaches its
/// whole subtree in O(1).
///
/// Example:
/// @code
///   Value model = Value::map({{"name", "Alice"}});
///   ChangeDetector detector;
///   auto group = detector.new_group();
///   group.watch(model, "name", std::string{"title"});
///
///   model = model.set("name", "Bob");
///   for (auto* c = detector.collect_changes(); c; c = c->next_change()) {
///       // c->current_value() == "Bob", c->previous_value() == "Alice"
///   }
/// @endcode
///
/// Handles (WatchGroup, WatchRecord) are lightweight and copyable. They must
/// not outlive their detector. A handle to a removed group/record is stale:
/// alive() is false, check() returns nullopt, remove() does nothing and
/// everything else throws StaleHandle.
///
/// Watched slots are held by pointer and must outlive their records.

#pragma once

#include <change_detect/api.h>
#include <change_detect/collection_differ.h>
#include <change_detect/field_selector.h>
#include <change_detect/map_differ.h>
#include <change_detect/value.h>

#include <any>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace change_detect {

/// Opaque caller data attached to a watch record, returned untouched in
/// change records.
using Handler = std::any;

namespace detail {
struct DetectorImpl;
} // namespace detail

class ChangeRecord;

// ============================================================
// WatchRecord
// ============================================================

class CHANGE_DETECT_API WatchRecord {
public:
    /// A handle that refers to nothing (never alive)
    WatchRecord() = default;

    [[nodiscard]] bool alive() const noexcept;

    /// Re-read the watched field and compare it with the cached value.
    /// @return the change, or nullopt if nothing changed or the record is stale
    /// @throws EvaluationError if the object lost the shape its selector needs
    std::optional<ChangeRecord> check();

    /// Remove this record from its group. Idempotent.
    void remove();

    /// Watch another slot with the same selector and handler. The record is
    /// re-baselined to the new object's current state.
    /// @throws InvalidFieldSelector, StaleHandle, DigestInProgress
    void set_object(const Value& object);
    void set_object(const Value&&) = delete;

    [[nodiscard]] const Value& object() const;
    [[nodiscard]] const FieldSelector& selector() const;
    [[nodiscard]] const Handler& handler() const;
    [[nodiscard]] const Value& current_value() const;
    [[nodiscard]] const Value& previous_value() const;

    friend bool operator==(const WatchRecord& a, const WatchRecord& b) noexcept {
        return a.impl_ == b.impl_ && a.slot_ == b.slot_ && a.generation_ == b.generation_;
    }
    friend bool operator!=(const WatchRecord& a, const WatchRecord& b) noexcept { return !(a == b); }

private:
    friend struct detail::DetectorImpl;

    WatchRecord(detail::DetectorImpl* impl, std::uint32_t slot, std::uint32_t generation) noexcept
        : impl_(impl), slot_(slot), generation_(generation) {}

    detail::DetectorImpl* impl_ = nullptr;
    std::uint32_t slot_ = 0;
    std::uint32_t generation_ = 0;
};

// ============================================================
// ChangeRecord
// ============================================================

/// One record's change. The previous and current values are copies taken
/// when the change was detected. The handler, selector and diff records
/// are read from the record itself: they are valid until the next digest
/// pass, the next check() of the same record or the next mutation of the
/// watch tree.
class CHANGE_DETECT_API ChangeRecord {
public:
    [[nodiscard]] WatchRecord record() const noexcept { return record_; }
    [[nodiscard]] const Value& object() const noexcept { return *object_; }
    [[nodiscard]] const FieldSelector& selector() const noexcept { return *selector_; }
    [[nodiscard]] const Handler& handler() const noexcept { return *handler_; }

    /// Field value (or the collection itself for items/entries selectors)
    [[nodiscard]] const Value& current_value() const noexcept { return current_; }
    [[nodiscard]] const Value& previous_value() const noexcept { return previous_; }

    /// Structural diff for items selectors, nullptr otherwise
    [[nodiscard]] const CollectionChangeRecord* collection_changes() const noexcept { return collection_; }

    /// Structural diff for entries selectors, nullptr otherwise
    [[nodiscard]] const MapChangeRecord* map_changes() const noexcept { return map_; }

    /// Next change of the same pass in registration order, or nullptr
    [[nodiscard]] const ChangeRecord* next_change() const noexcept { return next_; }

    void print() const;

private:
    friend struct detail::DetectorImpl;

    ChangeRecord() = default;

    WatchRecord record_;
    const Value* object_ = nullptr;
    const FieldSelector* selector_ = nullptr;
    const Handler* handler_ = nullptr;
    Value current_;
    Value previous_;
    const CollectionChangeRecord* collection_ = nullptr;
    const MapChangeRecord* map_ = nullptr;
    const ChangeRecord* next_ = nullptr;
};

/// Passed to the exception handler of collect_changes() with the failure
struct EvaluationContext {
    WatchRecord record;
    const Value& object;
    const FieldSelector& selector;
    const Handler& handler;
};

using ExceptionHandler = std::function<void(std::exception_ptr, const EvaluationContext&)>;

// ============================================================
// WatchGroup
// ============================================================

class CHANGE_DETECT_API WatchGroup {
public:
    /// A handle that refers to nothing (never alive)
    WatchGroup() = default;

    [[nodiscard]] bool alive() const noexcept;

    /// Watch `object` through `selector`. The record is appended after this
    /// group's own records and before any child group's records.
    /// @throws InvalidFieldSelector if the object's shape does not fit
    /// @throws StaleHandle, DigestInProgress
    WatchRecord watch(const Value& object, FieldSelector selector, Handler handler = {});

    /// Same, with the selector in string form ("name", "[]", "{}", ".")
    WatchRecord watch(const Value& object, std::string_view selector, Handler handler = {});

    WatchRecord watch(const Value&&, FieldSelector, Handler = {}) = delete;
    WatchRecord watch(const Value&&, std::string_view, Handler = {}) = delete;

    /// Create a child group after the existing children
    /// @throws StaleHandle, DigestInProgress
    WatchGroup new_group();

    /// Detach this group, its descendants and all their records. Removing
    /// the root group clears the detector. Idempotent.
    /// @throws DigestInProgress
    void remove();

    /// Direct records (0 for a stale handle)
    [[nodiscard]] std::size_t record_count() const noexcept;

    /// Direct child groups (0 for a stale handle)
    [[nodiscard]] std::size_t child_count() const noexcept;

    friend bool operator==(const WatchGroup& a, const WatchGroup& b) noexcept {
        return a.impl_ == b.impl_ && a.slot_ == b.slot_ && a.generation_ == b.generation_;
    }
    friend bool operator!=(const WatchGroup& a, const WatchGroup& b) noexcept { return !(a == b); }

private:
    friend struct detail::DetectorImpl;

    WatchGroup(detail::DetectorImpl* impl, std::uint32_t slot, std::uint32_t generation) noexcept
        : impl_(impl), slot_(slot), generation_(generation) {}

    detail::DetectorImpl* impl_ = nullptr;
    std::uint32_t slot_ = 0;
    std::uint32_t generation_ = 0;
};

// ============================================================
// ChangeDetector
// ============================================================

class CHANGE_DETECT_API ChangeDetector {
public:
    ChangeDetector();
    ~ChangeDetector();

    // Non-copyable, movable (handles stay valid across moves). A moved-from
    // detector throws StaleHandle from root(), watch(), new_group(),
    // remove() and collect_changes() until a detector is assigned to it.
    ChangeDetector(const ChangeDetector&) = delete;
    ChangeDetector& operator=(const ChangeDetector&) = delete;
    ChangeDetector(ChangeDetector&&) noexcept;
    ChangeDetector& operator=(ChangeDetector&&) noexcept;

    /// The root group. A new handle is issued after the root is removed.
    [[nodiscard]] WatchGroup root() const;

    /// Shorthands for root().watch() / root().new_group()
    WatchRecord watch(const Value& object, FieldSelector selector, Handler handler = {});
    WatchRecord watch(const Value& object, std::string_view selector, Handler handler = {});
    WatchRecord watch(const Value&&, FieldSelector, Handler = {}) = delete;
    WatchRecord watch(const Value&&, std::string_view, Handler = {}) = delete;
    WatchGroup new_group();

    /// Remove every group and record
    void remove();

    /// Release what removed records still hold (handlers, cached values and
    /// diff snapshots). Removing a single record releases it at once;
    /// removing a group only detaches its subtree, whose records are
    /// released here, when their slots are reused or with the detector.
    /// @throws DigestInProgress
    void shrink();

    /// Run one digest pass.
    ///
    /// Without an exception handler the first failing record aborts the
    /// pass: its exception propagates and the partial change list is
    /// discarded. With one, each failure is handed to it and the pass goes on.
    ///
    /// @return head of the changes in registration order, or nullptr
    /// @throws DigestInProgress if called from inside a pass
    const ChangeRecord* collect_changes(const ExceptionHandler& on_error = {});

    [[nodiscard]] bool digesting() const noexcept;

    /// Statistics for performance monitoring
    struct Stats {
        std::size_t passes = 0;           ///< collect_changes() calls
        std::size_t records_checked = 0;  ///< Records evaluated
        std::size_t changes_reported = 0; ///< Change records returned
        std::size_t errors_handled = 0;   ///< Failures passed to an exception handler
        std::size_t aborted_passes = 0;   ///< Passes ended by an unhandled failure
    };

    [[nodiscard]] const Stats& stats() const noexcept;
    void reset_stats() noexcept;

private:
    detail::DetectorImpl& checked_impl(const char* func) const;

    std::unique_ptr<detail::DetectorImpl> impl_;
};

/// Print a change list to stdout
CHANGE_DETECT_API void print_changes(const ChangeRecord* head);

} // namespace change_detect
