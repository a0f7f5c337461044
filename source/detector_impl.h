// detector_impl.h - Arena of watch records and group markers (internal)
//
// Every record and every group marker is a Node in one arena. Live nodes
// form a single doubly linked list in traversal order:
//
//   [root start] r r [g1 start] r [g1 end] [g2 start] [g2 end] [root end]
//
// A group's records follow its start marker, its child groups follow its
// records, its end marker closes the run. Removing a group unlinks the run
// between its markers and pushes it onto the free list as a whole.
//
// A removed record drops its payload at once. The nodes of a removed group
// keep theirs until shrink() or allocate() reaches them; allocate() hands a
// slot out again with a bumped generation, which invalidates every handle
// still pointing at it.

#pragma once

#include <change_detect/change_detector.h>

#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <vector>

namespace change_detect::detail {

constexpr std::uint32_t npos = std::numeric_limits<std::uint32_t>::max();

enum class NodeKind : std::uint8_t { Free, Record, GroupStart, GroupEnd };

struct Node {
    NodeKind kind = NodeKind::Free;
    std::uint32_t generation = 0;
    std::uint32_t prev = npos;
    std::uint32_t next = npos;   // free list link while Free
    bool removed = false;

    // Record
    std::uint32_t group = npos;  // start marker of the owning group
    std::uint32_t group_generation = 0;
    const Value* object = nullptr;
    FieldSelector selector = FieldSelector::identity();
    Handler handler;
    Value previous;
    Value current;
    std::unique_ptr<CollectionDiffer> collection;
    std::unique_ptr<MapDiffer> map;

    // GroupStart
    std::uint32_t end = npos;
    std::uint32_t last_record = npos;
    std::uint32_t parent = npos;
    std::uint32_t parent_generation = 0;
    std::size_t record_count = 0;
    std::size_t child_count = 0;
};

struct DetectorImpl {
    DetectorImpl();

    // --- liveness ---
    [[nodiscard]] bool group_alive(std::uint32_t slot, std::uint32_t generation) const noexcept;
    [[nodiscard]] bool record_alive(std::uint32_t slot, std::uint32_t generation) const noexcept;
    Node& checked_group(const WatchGroup& group, const char* func);
    Node& checked_record(const WatchRecord& record, const char* func);
    const Node& checked_record(const WatchRecord& record, const char* func) const;
    void ensure_not_digesting(const char* func) const;

    // --- tree mutation ---
    WatchRecord watch(const WatchGroup& group, const Value& object, FieldSelector selector, Handler handler);
    WatchGroup new_group(const WatchGroup& parent);
    void remove_group(const WatchGroup& group);
    void remove_record(const WatchRecord& record);
    void set_object(const WatchRecord& record, const Value& object);
    void clear_root();

    // --- evaluation ---
    void baseline(Node& node);
    bool evaluate(Node& node);
    ChangeRecord make_change(std::uint32_t slot);
    std::optional<ChangeRecord> check(const WatchRecord& record);
    const ChangeRecord* collect_changes(const ExceptionHandler& on_error);

    WatchGroup root_handle() { return WatchGroup{this, root, nodes[root].generation}; }

    // --- arena ---
    std::uint32_t allocate(NodeKind kind);
    void link_after(std::uint32_t position, std::uint32_t slot) noexcept;
    void unlink(std::uint32_t first, std::uint32_t last) noexcept;
    void release(std::uint32_t first, std::uint32_t last) noexcept;
    void reclaim(Node& node);
    void shrink();

    std::deque<Node> nodes;
    std::uint32_t free_head = npos;
    std::uint32_t root = npos;

    std::vector<ChangeRecord> changes;
    bool digesting = false;
    ChangeDetector::Stats stats;
};

} // namespace change_detect::detail
