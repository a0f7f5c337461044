// map_differ.cpp - Identity-based key/value diff for maps and tables

#include <change_detect/map_differ.h>
#include <change_detect/errors.h>
#include <change_detect/logging.h>

#include <iostream>

namespace change_detect {

namespace {

template <typename F>
void for_each_key_value(const Value& val, F&& f)
{
    if (auto* m = val.get_if<ValueMap>()) {
        for (const auto& kv : *m) f(kv.first, kv.second);
    } else if (auto* t = val.get_if<ValueTable>()) {
        for (const auto& entry : *t) f(entry.id, entry.value);
    }
}

void require_map(const Value& val, const char* func)
{
    if (val.is_map()) {
        return;
    }
    detail::log_message(func, "not a map or table");
    throw EvaluationError("map watch requires a map or table, got " + value_to_string(val));
}

} // anonymous namespace

// ============================================================
// MapChangeRecord
// ============================================================

void MapChangeRecord::clear()
{
    entries_.clear();
    changes_.clear();
    additions_.clear();
    removals_.clear();
}

void MapChangeRecord::print() const
{
    if (!has_changes()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for_each_change([](const MapKeyValue& kv) {
        std::cout << "  ~ " << kv.key << ": " << value_to_string(**kv.previous_value)
                  << " -> " << value_to_string(**kv.current_value) << "\n";
    });
    for_each_addition([](const MapKeyValue& kv) {
        std::cout << "  + " << kv.key << ": " << value_to_string(**kv.current_value) << "\n";
    });
    for_each_removal([](const MapKeyValue& kv) {
        std::cout << "  - " << kv.key << ": " << value_to_string(**kv.previous_value) << "\n";
    });
}

// ============================================================
// MapDiffer
// ============================================================

MapDiffer::MapDiffer(const Value& baseline)
{
    reset(baseline);
}

void MapDiffer::reset(const Value& baseline)
{
    require_map(baseline, "MapDiffer::reset");

    previous_ = baseline;
    record_.clear();
    record_.map_ = baseline;
    record_.entries_.reserve(baseline.size());
    for_each_key_value(baseline, [this](const std::string& key, const ValueBox& box) {
        record_.entries_.push_back(MapKeyValue{key, box, box});
    });
}

bool MapDiffer::check(const Value& current)
{
    require_map(current, "MapDiffer::check");

    // Fast path: same storage, nothing to compare
    if (identical(previous_, current)) {
        reset(current);
        return false;
    }

    record_.clear();
    record_.map_ = current;
    record_.entries_.reserve(current.size());

    for_each_key_value(current, [this](const std::string& key, const ValueBox& box) {
        MapKeyValue kv{key, std::nullopt, box};
        if (const ValueBox* before = previous_.find(key)) {
            kv.previous_value = *before;
            if (!identical(before->get(), box.get())) {
                record_.changes_.push_back(record_.entries_.size());
            }
        } else {
            record_.additions_.push_back(record_.entries_.size());
        }
        record_.entries_.push_back(std::move(kv));
    });

    for_each_key_value(previous_, [this, &current](const std::string& key, const ValueBox& box) {
        if (!current.contains(key)) {
            record_.removals_.push_back(MapKeyValue{key, box, std::nullopt});
        }
    });

    previous_ = current;
    return record_.has_changes();
}

} // namespace change_detect
