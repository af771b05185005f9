#pragma once

#include <kingraph/graph/family_graph.hpp>

#include <cstdint>
#include <memory>
#include <mutex>

namespace kingraph {

using GraphSnapshot = std::shared_ptr<const FamilyGraph>;

// ---------------------------------------------------------------------------
// GraphSnapshotSlot: holds the current snapshot.
//
// Install() swaps the pointer under a mutex; readers that already hold a
// snapshot keep it alive and never observe a partially built graph. The slot
// starts out holding an empty graph.
// ---------------------------------------------------------------------------
class GraphSnapshotSlot {
public:
    GraphSnapshotSlot();

    GraphSnapshotSlot(const GraphSnapshotSlot&) = delete;
    GraphSnapshotSlot& operator=(const GraphSnapshotSlot&) = delete;

    [[nodiscard]] GraphSnapshot Current() const;

    // Replace the current snapshot. Returns the new generation number.
    uint64_t Install(FamilyGraph graph);

    // Number of snapshots installed so far.
    [[nodiscard]] uint64_t Generation() const;

private:
    mutable std::mutex mutex_;
    GraphSnapshot current_;
    uint64_t generation_ = 0;
};

} // namespace kingraph
