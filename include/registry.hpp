#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include "snowflake.hpp"

namespace snowid {

/**
 * @brief Keeps exactly one IdWorker per (datacenter, node) shard.
 *
 * Workers are created on first use and retained for the lifetime of the
 * registry, so every request for a shard goes through the same sequence and
 * last-timestamp state. All workers share the registry's layout and clock.
 */
class WorkerRegistry {
public:
    explicit WorkerRegistry(Layout layout = {}, PClock clock = nullptr);

    WorkerRegistry(const WorkerRegistry&) = delete;
    WorkerRegistry& operator=(const WorkerRegistry&) = delete;

    // Returns the retained worker for the shard, creating it on first use.
    // Throws InvalidConfiguration for out-of-range ids; nothing is registered then.
    IdWorker& worker(int64_t nodeId, int64_t datacenterId);

    int64_t next(int64_t nodeId, int64_t datacenterId) { return worker(nodeId, datacenterId).next(); }

    std::size_t size() const;
    const Layout& layout() const { return layout_; }

private:
    using ShardKey = std::pair<int64_t, int64_t>; // datacenter, node

    const Layout layout_;
    const PClock clock_;
    std::map<ShardKey, std::unique_ptr<IdWorker>> workers_;
    mutable std::mutex mx_;
};

// Process-wide registry with the default layout and the system clock.
WorkerRegistry& default_registry();

// Convenience entry points on default_registry().
int64_t next_id();
int64_t next_id(int64_t nodeId);
int64_t next_id(int64_t nodeId, int64_t datacenterId);

} // namespace snowid
