// change_detector.cpp - Watch tree, record evaluation and digest passes

#include "detector_impl.h"

#include <change_detect/errors.h>
#include <change_detect/identity.h>
#include <change_detect/logging.h>

#include <iostream>
#include <string>
#include <utility>

namespace change_detect {

namespace detail {

namespace {

// Clears DetectorImpl::digesting however the pass ends
class DigestGuard {
public:
    explicit DigestGuard(bool& flag) noexcept : flag_(flag) { flag_ = true; }
    ~DigestGuard() { flag_ = false; }

    DigestGuard(const DigestGuard&) = delete;
    DigestGuard& operator=(const DigestGuard&) = delete;

private:
    bool& flag_;
};

} // anonymous namespace

DetectorImpl::DetectorImpl()
{
    const std::uint32_t start = allocate(NodeKind::GroupStart);
    const std::uint32_t end = allocate(NodeKind::GroupEnd);
    nodes[start].next = end;
    nodes[start].end = end;
    nodes[end].prev = start;
    root = start;
}

// ============================================================
// Arena
// ============================================================

std::uint32_t DetectorImpl::allocate(NodeKind kind)
{
    std::uint32_t slot;
    if (free_head != npos) {
        slot = free_head;
        free_head = nodes[slot].next;
        const std::uint32_t generation = nodes[slot].generation + 1;
        nodes[slot] = Node{};
        nodes[slot].generation = generation;
    } else {
        slot = static_cast<std::uint32_t>(nodes.size());
        nodes.emplace_back();
    }
    nodes[slot].kind = kind;
    return slot;
}

void DetectorImpl::link_after(std::uint32_t position, std::uint32_t slot) noexcept
{
    const std::uint32_t next = nodes[position].next;
    nodes[slot].prev = position;
    nodes[slot].next = next;
    nodes[position].next = slot;
    nodes[next].prev = slot;
}

void DetectorImpl::unlink(std::uint32_t first, std::uint32_t last) noexcept
{
    const std::uint32_t before = nodes[first].prev;
    const std::uint32_t after = nodes[last].next;
    nodes[before].next = after;
    nodes[after].prev = before;
}

void DetectorImpl::release(std::uint32_t first, std::uint32_t last) noexcept
{
    // The run stays chained through `next`; only its tail is relinked
    nodes[last].next = free_head;
    free_head = first;
}

void DetectorImpl::reclaim(Node& node)
{
    node.kind = NodeKind::Free;
    node.removed = true;
    node.object = nullptr;
    node.handler.reset();
    node.previous = Value{};
    node.current = Value{};
    node.collection.reset();
    node.map.reset();
}

void DetectorImpl::shrink()
{
    ensure_not_digesting("ChangeDetector::shrink");
    for (std::uint32_t slot = free_head; slot != npos; slot = nodes[slot].next) {
        if (nodes[slot].kind != NodeKind::Free) {
            reclaim(nodes[slot]);
        }
    }
}

// ============================================================
// Liveness
// ============================================================

bool DetectorImpl::group_alive(std::uint32_t slot, std::uint32_t generation) const noexcept
{
    while (true) {
        if (slot >= nodes.size()) {
            return false;
        }
        const Node& node = nodes[slot];
        if (node.generation != generation || node.kind != NodeKind::GroupStart || node.removed) {
            return false;
        }
        if (node.parent == npos) {
            return true;
        }
        slot = node.parent;
        generation = node.parent_generation;
    }
}

bool DetectorImpl::record_alive(std::uint32_t slot, std::uint32_t generation) const noexcept
{
    if (slot >= nodes.size()) {
        return false;
    }
    const Node& node = nodes[slot];
    if (node.generation != generation || node.kind != NodeKind::Record || node.removed) {
        return false;
    }
    return group_alive(node.group, node.group_generation);
}

Node& DetectorImpl::checked_group(const WatchGroup& group, const char* func)
{
    if (!group_alive(group.slot_, group.generation_)) {
        log_message(func, "group handle is stale");
        throw StaleHandle(std::string(func) + ": group has been removed");
    }
    return nodes[group.slot_];
}

Node& DetectorImpl::checked_record(const WatchRecord& record, const char* func)
{
    return const_cast<Node&>(std::as_const(*this).checked_record(record, func));
}

const Node& DetectorImpl::checked_record(const WatchRecord& record, const char* func) const
{
    if (!record_alive(record.slot_, record.generation_)) {
        log_record_error(func, record.slot_, "handle is stale");
        throw StaleHandle(std::string(func) + ": record has been removed");
    }
    return nodes[record.slot_];
}

void DetectorImpl::ensure_not_digesting(const char* func) const
{
    if (digesting) {
        log_message(func, "watch tree mutated during a digest pass");
        throw DigestInProgress(std::string(func) + ": not allowed while a digest pass is running");
    }
}

// ============================================================
// Tree mutation
// ============================================================

WatchRecord DetectorImpl::watch(const WatchGroup& group, const Value& object, FieldSelector selector,
                                Handler handler)
{
    ensure_not_digesting("WatchGroup::watch");
    checked_group(group, "WatchGroup::watch");
    selector.validate(object);

    const std::uint32_t slot = allocate(NodeKind::Record);
    Node& owner = nodes[group.slot_];
    Node& node = nodes[slot];
    node.group = group.slot_;
    node.group_generation = group.generation_;
    node.object = &object;
    node.selector = std::move(selector);
    node.handler = std::move(handler);
    baseline(node);

    // Own records come before the first child group
    link_after(owner.last_record != npos ? owner.last_record : group.slot_, slot);
    owner.last_record = slot;
    owner.record_count++;

    return WatchRecord{this, slot, node.generation};
}

WatchGroup DetectorImpl::new_group(const WatchGroup& parent)
{
    ensure_not_digesting("WatchGroup::new_group");
    checked_group(parent, "WatchGroup::new_group");

    const std::uint32_t start = allocate(NodeKind::GroupStart);
    const std::uint32_t end = allocate(NodeKind::GroupEnd);

    Node& owner = nodes[parent.slot_];
    nodes[start].end = end;
    nodes[start].parent = parent.slot_;
    nodes[start].parent_generation = parent.generation_;

    // Last child: right before the parent's end marker
    link_after(nodes[owner.end].prev, start);
    link_after(start, end);
    owner.child_count++;

    return WatchGroup{this, start, nodes[start].generation};
}

void DetectorImpl::remove_group(const WatchGroup& group)
{
    ensure_not_digesting("WatchGroup::remove");
    if (!group_alive(group.slot_, group.generation_)) {
        log_message("WatchGroup::remove", "group already removed");
        return;
    }
    if (group.slot_ == root) {
        clear_root();
        return;
    }

    Node& start = nodes[group.slot_];
    const std::uint32_t end = start.end;
    start.removed = true;
    nodes[start.parent].child_count--;

    unlink(group.slot_, end);
    release(group.slot_, end);
}

void DetectorImpl::remove_record(const WatchRecord& record)
{
    ensure_not_digesting("WatchRecord::remove");
    if (!record_alive(record.slot_, record.generation_)) {
        log_record_error("WatchRecord::remove", record.slot_, "already removed");
        return;
    }

    Node& node = nodes[record.slot_];
    Node& owner = nodes[node.group];
    if (owner.last_record == record.slot_) {
        owner.last_record = node.prev == node.group ? npos : node.prev;
    }
    owner.record_count--;

    unlink(record.slot_, record.slot_);
    reclaim(node);
    release(record.slot_, record.slot_);
}

void DetectorImpl::set_object(const WatchRecord& record, const Value& object)
{
    ensure_not_digesting("WatchRecord::set_object");
    Node& node = checked_record(record, "WatchRecord::set_object");
    node.selector.validate(object);

    node.object = &object;
    node.collection.reset();
    node.map.reset();
    baseline(node);
}

void DetectorImpl::clear_root()
{
    Node& start = nodes[root];
    const std::uint32_t end = start.end;
    if (start.next != end) {
        const std::uint32_t first = start.next;
        const std::uint32_t last = nodes[end].prev;
        unlink(first, last);
        release(first, last);
    }

    // Old handles to the root (and everything under it) go stale
    start.generation++;
    start.last_record = npos;
    start.record_count = 0;
    start.child_count = 0;
}

// ============================================================
// Evaluation
// ============================================================

void DetectorImpl::baseline(Node& node)
{
    const Value& object = *node.object;
    node.previous = Value{};

    switch (node.selector.kind()) {
        case FieldSelector::Kind::Field:
            node.current = object.at(node.selector.name());
            break;
        case FieldSelector::Kind::Identity:
            node.current = object;
            break;
        case FieldSelector::Kind::Items:
            node.collection = std::make_unique<CollectionDiffer>(object);
            node.current = object;
            break;
        case FieldSelector::Kind::Entries:
            node.map = std::make_unique<MapDiffer>(object);
            node.current = object;
            break;
    }
}

bool DetectorImpl::evaluate(Node& node)
{
    const Value& object = *node.object;

    switch (node.selector.kind()) {
        case FieldSelector::Kind::Field: {
            if (!object.is_map()) {
                throw EvaluationError("field '" + node.selector.name() + "' read from a non-map value " +
                                      value_to_string(object));
            }
            const ValueBox* box = object.find(node.selector.name());
            Value value = box ? box->get() : Value{};
            if (identical(value, node.current)) {
                return false;
            }
            node.previous = std::move(node.current);
            node.current = std::move(value);
            return true;
        }
        case FieldSelector::Kind::Identity:
            if (identical(object, node.current)) {
                return false;
            }
            break;
        case FieldSelector::Kind::Items:
            if (!node.collection->check(object)) {
                // Same items in a new container: follow the differ's baseline
                node.current = object;
                return false;
            }
            break;
        case FieldSelector::Kind::Entries:
            if (!node.map->check(object)) {
                node.current = object;
                return false;
            }
            break;
    }

    node.previous = std::move(node.current);
    node.current = object;
    return true;
}

ChangeRecord DetectorImpl::make_change(std::uint32_t slot)
{
    const Node& node = nodes[slot];
    ChangeRecord change;
    change.record_ = WatchRecord{this, slot, node.generation};
    change.object_ = node.object;
    change.selector_ = &node.selector;
    change.handler_ = &node.handler;
    change.current_ = node.current;
    change.previous_ = node.previous;
    if (node.collection) {
        change.collection_ = &node.collection->record();
    }
    if (node.map) {
        change.map_ = &node.map->record();
    }
    return change;
}

std::optional<ChangeRecord> DetectorImpl::check(const WatchRecord& record)
{
    if (!record_alive(record.slot_, record.generation_)) {
        return std::nullopt;
    }
    if (!evaluate(nodes[record.slot_])) {
        return std::nullopt;
    }
    return make_change(record.slot_);
}

const ChangeRecord* DetectorImpl::collect_changes(const ExceptionHandler& on_error)
{
    ensure_not_digesting("ChangeDetector::collect_changes");
    DigestGuard guard{digesting};

    stats.passes++;
    changes.clear();

    const std::uint32_t end = nodes[root].end;
    for (std::uint32_t slot = nodes[root].next; slot != end; slot = nodes[slot].next) {
        Node& node = nodes[slot];
        if (node.kind != NodeKind::Record) {
            continue;
        }
        stats.records_checked++;

        try {
            if (evaluate(node)) {
                changes.push_back(make_change(slot));
            }
        } catch (...) {
            if (!on_error) {
                log_record_error("ChangeDetector::collect_changes", slot, "failed, pass aborted");
                stats.aborted_passes++;
                changes.clear();
                throw;
            }
            log_record_error("ChangeDetector::collect_changes", slot, "failed, passed to exception handler");
            stats.errors_handled++;
            on_error(std::current_exception(),
                     EvaluationContext{WatchRecord{this, slot, node.generation}, *node.object, node.selector,
                                       node.handler});
        }
    }

    if (changes.empty()) {
        return nullptr;
    }
    for (std::size_t i = 0; i + 1 < changes.size(); ++i) {
        changes[i].next_ = &changes[i + 1];
    }
    stats.changes_reported += changes.size();
    return &changes.front();
}

} // namespace detail

// ============================================================
// WatchRecord
// ============================================================

bool WatchRecord::alive() const noexcept
{
    return impl_ && impl_->record_alive(slot_, generation_);
}

std::optional<ChangeRecord> WatchRecord::check()
{
    if (!impl_) {
        return std::nullopt;
    }
    return impl_->check(*this);
}

void WatchRecord::remove()
{
    if (impl_) {
        impl_->remove_record(*this);
    }
}

void WatchRecord::set_object(const Value& object)
{
    if (!impl_) {
        throw StaleHandle("WatchRecord::set_object: empty handle");
    }
    impl_->set_object(*this, object);
}

const Value& WatchRecord::object() const
{
    if (!impl_) {
        throw StaleHandle("WatchRecord::object: empty handle");
    }
    return *impl_->checked_record(*this, "WatchRecord::object").object;
}

const FieldSelector& WatchRecord::selector() const
{
    if (!impl_) {
        throw StaleHandle("WatchRecord::selector: empty handle");
    }
    return impl_->checked_record(*this, "WatchRecord::selector").selector;
}

const Handler& WatchRecord::handler() const
{
    if (!impl_) {
        throw StaleHandle("WatchRecord::handler: empty handle");
    }
    return impl_->checked_record(*this, "WatchRecord::handler").handler;
}

const Value& WatchRecord::current_value() const
{
    if (!impl_) {
        throw StaleHandle("WatchRecord::current_value: empty handle");
    }
    return impl_->checked_record(*this, "WatchRecord::current_value").current;
}

const Value& WatchRecord::previous_value() const
{
    if (!impl_) {
        throw StaleHandle("WatchRecord::previous_value: empty handle");
    }
    return impl_->checked_record(*this, "WatchRecord::previous_value").previous;
}

// ============================================================
// ChangeRecord
// ============================================================

void ChangeRecord::print() const
{
    std::cout << selector_->to_string() << ": " << value_to_string(previous_) << " -> "
              << value_to_string(current_) << "\n";
    if (collection_) {
        collection_->print();
    }
    if (map_) {
        map_->print();
    }
}

// ============================================================
// WatchGroup
// ============================================================

bool WatchGroup::alive() const noexcept
{
    return impl_ && impl_->group_alive(slot_, generation_);
}

WatchRecord WatchGroup::watch(const Value& object, FieldSelector selector, Handler handler)
{
    if (!impl_) {
        throw StaleHandle("WatchGroup::watch: empty handle");
    }
    return impl_->watch(*this, object, std::move(selector), std::move(handler));
}

WatchRecord WatchGroup::watch(const Value& object, std::string_view selector, Handler handler)
{
    return watch(object, FieldSelector::parse(selector), std::move(handler));
}

WatchGroup WatchGroup::new_group()
{
    if (!impl_) {
        throw StaleHandle("WatchGroup::new_group: empty handle");
    }
    return impl_->new_group(*this);
}

void WatchGroup::remove()
{
    if (impl_) {
        impl_->remove_group(*this);
    }
}

std::size_t WatchGroup::record_count() const noexcept
{
    return alive() ? impl_->nodes[slot_].record_count : 0;
}

std::size_t WatchGroup::child_count() const noexcept
{
    return alive() ? impl_->nodes[slot_].child_count : 0;
}

// ============================================================
// ChangeDetector
// ============================================================

ChangeDetector::ChangeDetector()
    : impl_(std::make_unique<detail::DetectorImpl>())
{
}

ChangeDetector::~ChangeDetector() = default;
ChangeDetector::ChangeDetector(ChangeDetector&&) noexcept = default;
ChangeDetector& ChangeDetector::operator=(ChangeDetector&&) noexcept = default;

detail::DetectorImpl& ChangeDetector::checked_impl(const char* func) const
{
    if (!impl_) {
        detail::log_message(func, "detector has been moved from");
        throw StaleHandle(std::string(func) + ": detector has been moved from");
    }
    return *impl_;
}

WatchGroup ChangeDetector::root() const
{
    return checked_impl("ChangeDetector::root").root_handle();
}

WatchRecord ChangeDetector::watch(const Value& object, FieldSelector selector, Handler handler)
{
    return root().watch(object, std::move(selector), std::move(handler));
}

WatchRecord ChangeDetector::watch(const Value& object, std::string_view selector, Handler handler)
{
    return root().watch(object, selector, std::move(handler));
}

WatchGroup ChangeDetector::new_group()
{
    return root().new_group();
}

void ChangeDetector::remove()
{
    detail::DetectorImpl& impl = checked_impl("ChangeDetector::remove");
    impl.ensure_not_digesting("ChangeDetector::remove");
    impl.clear_root();
}

void ChangeDetector::shrink()
{
    checked_impl("ChangeDetector::shrink").shrink();
}

const ChangeRecord* ChangeDetector::collect_changes(const ExceptionHandler& on_error)
{
    return checked_impl("ChangeDetector::collect_changes").collect_changes(on_error);
}

bool ChangeDetector::digesting() const noexcept
{
    return impl_ && impl_->digesting;
}

const ChangeDetector::Stats& ChangeDetector::stats() const noexcept
{
    static const Stats empty{};
    return impl_ ? impl_->stats : empty;
}

void ChangeDetector::reset_stats() noexcept
{
    if (impl_) {
        impl_->stats = Stats{};
    }
}

void print_changes(const ChangeRecord* head)
{
    if (!head) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const ChangeRecord* change = head; change; change = change->next_change()) {
        change->print();
    }
}

} // namespace change_detect
