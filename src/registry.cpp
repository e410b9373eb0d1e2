#include "registry.hpp"

namespace snowid {

WorkerRegistry::WorkerRegistry(Layout layout, PClock clock)
    : layout_(layout)
    , clock_(clock ? std::move(clock) : system_clock()) {
    layout_.validate();
}

IdWorker& WorkerRegistry::worker(int64_t nodeId, int64_t datacenterId) {
    std::scoped_lock lk(mx_);
    const ShardKey key { datacenterId, nodeId };
    auto it = workers_.find(key);
    if (it != workers_.end()) {
        return *it->second;
    }
    // Construction validates the ids before anything is inserted.
    auto created = std::make_unique<IdWorker>(nodeId, datacenterId, layout_, clock_);
    IdWorker& ref = *created;
    workers_.emplace(key, std::move(created));
    // Workers are never removed, so the reference outlives the lock.
    return ref;
}

std::size_t WorkerRegistry::size() const {
    std::scoped_lock lk(mx_);
    return workers_.size();
}

WorkerRegistry& default_registry() {
    static WorkerRegistry registry;
    return registry;
}

int64_t next_id() {
    return default_registry().next(0, 0);
}

int64_t next_id(int64_t nodeId) {
    return default_registry().next(nodeId, 0);
}

int64_t next_id(int64_t nodeId, int64_t datacenterId) {
    return default_registry().next(nodeId, datacenterId);
}

} // namespace snowid
