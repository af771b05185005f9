#include <kingraph/graph/graph_snapshot.hpp>

namespace kingraph {

GraphSnapshotSlot::GraphSnapshotSlot()
    : current_(std::make_shared<FamilyGraph>()) {}

GraphSnapshot GraphSnapshotSlot::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

uint64_t GraphSnapshotSlot::Install(FamilyGraph graph) {
    auto next = std::make_shared<FamilyGraph>(std::move(graph));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
    return ++generation_;
}

uint64_t GraphSnapshotSlot::Generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

} // namespace kingraph
