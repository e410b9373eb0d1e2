#pragma once
#include <cstdint>
#include <mutex>
#include "clock.hpp"
#include "layout.hpp"

namespace snowid {

// The Snowflake ID worker. One instance per (datacenter, node) shard, kept for
// the lifetime of the process.
class IdWorker {
public:
    // Throws InvalidConfiguration if the layout is invalid or either id is
    // outside [0, max] for its field width, or if the time elapsed since the
    // epoch no longer fits the timestamp field. A null clock means the system clock.
    IdWorker(int64_t nodeId, int64_t datacenterId, Layout layout = {}, PClock clock = nullptr);

    IdWorker(const IdWorker&) = delete;
    IdWorker& operator=(const IdWorker&) = delete;

    // Generates a new, unique id. Thread-safe.
    // Throws ClockMovedBackwards if the clock reads earlier than the last
    // timestamp used; the worker state is left as it was.
    int64_t next();

    int64_t node_id() const { return nodeId_; }
    int64_t datacenter_id() const { return datacenterId_; }
    const Layout& layout() const { return layout_; }

    // -1 until the first id is generated.
    int64_t last_timestamp() const;
    int64_t sequence() const;

private:
    // Spins on the clock until it reads past lastTimestamp.
    int64_t waitNextMillis(int64_t lastTimestamp) const;

    const Layout layout_;
    const PClock clock_;
    const int64_t nodeId_;
    const int64_t datacenterId_;

    int64_t sequence_ = 0;
    int64_t lastTimestamp_ = -1;

    mutable std::mutex mutex_;
};

} // namespace snowid
