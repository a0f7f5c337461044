// collection_differ.cpp - Identity-based sequence diff with minimal moves

#include <change_detect/collection_differ.h>
#include <change_detect/errors.h>
#include <change_detect/logging.h>

#include <algorithm>
#include <iostream>
#include <limits>

namespace change_detect {

namespace {

constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

template <typename F>
void for_each_box(const Value& sequence, F&& f)
{
    if (auto* v = sequence.get_if<ValueVector>()) {
        std::size_t index = 0;
        for (const auto& box : *v) f(index++, box);
    } else if (auto* a = sequence.get_if<ValueArray>()) {
        std::size_t index = 0;
        for (const auto& box : *a) f(index++, box);
    }
}

void require_sequence(const Value& val, const char* func)
{
    if (val.is_sequence()) {
        return;
    }
    detail::log_message(func, "not a vector or array");
    throw EvaluationError("collection watch requires a vector or array, got " + value_to_string(val));
}

} // anonymous namespace

// ============================================================
// CollectionChangeRecord
// ============================================================

void CollectionChangeRecord::clear()
{
    items_.clear();
    additions_.clear();
    moves_.clear();
    removals_.clear();
}

void CollectionChangeRecord::print() const
{
    if (!has_changes()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for_each_addition([](const CollectionItem& it) {
        std::cout << "  + [" << *it.current_index << "] " << value_to_string(it.value()) << "\n";
    });
    for_each_move([](const CollectionItem& it) {
        std::cout << "  ~ [" << *it.previous_index << " -> " << *it.current_index << "] "
                  << value_to_string(it.value()) << "\n";
    });
    for_each_removal([](const CollectionItem& it) {
        std::cout << "  - [" << *it.previous_index << "] " << value_to_string(it.value()) << "\n";
    });
}

// ============================================================
// CollectionDiffer
// ============================================================

CollectionDiffer::CollectionDiffer(const Value& baseline)
{
    reset(baseline);
}

void CollectionDiffer::reset(const Value& baseline)
{
    require_sequence(baseline, "CollectionDiffer::reset");

    previous_ = baseline;
    record_.clear();
    record_.iterable_ = baseline;
    record_.items_.reserve(baseline.size());
    for_each_box(baseline, [this](std::size_t index, const ValueBox& box) {
        record_.items_.push_back(CollectionItem{index, index, box});
    });
}

bool CollectionDiffer::check(const Value& current)
{
    require_sequence(current, "CollectionDiffer::check");

    // Fast path: same storage, every item stays where it was
    if (identical(previous_, current)) {
        reset(current);
        return false;
    }

    record_.clear();
    record_.iterable_ = current;
    record_.items_.reserve(current.size());
    collect_previous();

    matched_.clear();
    for_each_box(current, [this](std::size_t index, const ValueBox& box) {
        CollectionItem item{std::nullopt, index, box};

        // Oldest unconsumed previous occurrence of the same identity
        auto it = buckets_.find(IdentityKey{box.get()});
        if (it != buckets_.end() && it->second.next < it->second.positions.size()) {
            const std::size_t position = it->second.positions[it->second.next];
            it.value().next++;
            consumed_[position] = true;
            item.previous_index = position;
            matched_.push_back(record_.items_.size());
        } else {
            record_.additions_.push_back(record_.items_.size());
        }
        record_.items_.push_back(std::move(item));
    });

    flag_moves();

    for (std::size_t i = 0; i < previous_boxes_.size(); ++i) {
        if (!consumed_[i]) {
            record_.removals_.push_back(CollectionItem{i, std::nullopt, *previous_boxes_[i]});
        }
    }

    // Keys point into previous_, drop them before it is replaced
    buckets_.clear();
    previous_boxes_.clear();
    previous_ = current;

    return record_.has_changes();
}

void CollectionDiffer::collect_previous()
{
    previous_boxes_.clear();
    buckets_.clear();

    for_each_box(previous_, [this](std::size_t index, const ValueBox& box) {
        previous_boxes_.push_back(&box);
        buckets_[IdentityKey{box.get()}].positions.push_back(index);
    });

    consumed_.assign(previous_boxes_.size(), false);
}

void CollectionDiffer::flag_moves()
{
    const std::size_t count = matched_.size();
    auto previous_of = [this](std::size_t k) {
        return *record_.items_[matched_[k]].previous_index;
    };

    // Patience sorting: tails_[len] is the matched item ending the best
    // increasing run of length len + 1
    tails_.clear();
    parents_.assign(count, npos);
    for (std::size_t k = 0; k < count; ++k) {
        const std::size_t position = previous_of(k);
        auto slot = std::lower_bound(tails_.begin(), tails_.end(), position,
                                     [&](std::size_t tail, std::size_t p) { return previous_of(tail) < p; });
        if (slot != tails_.begin()) {
            parents_[k] = *(slot - 1);
        }
        if (slot == tails_.end()) {
            tails_.push_back(k);
        } else {
            *slot = k;
        }
    }

    stable_.assign(count, false);
    for (std::size_t k = tails_.empty() ? npos : tails_.back(); k != npos; k = parents_[k]) {
        stable_[k] = true;
    }

    for (std::size_t k = 0; k < count; ++k) {
        if (!stable_[k]) {
            record_.moves_.push_back(matched_[k]);
        }
    }
}

} // namespace change_detect
