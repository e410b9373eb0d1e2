#include "snowflake.hpp"
#include <utility>
#include "lib.hpp"

namespace snowid {

IdWorker::IdWorker(int64_t nodeId, int64_t datacenterId, Layout layout, PClock clock)
    : layout_(layout)
    , clock_(clock ? std::move(clock) : system_clock())
    , nodeId_(nodeId)
    , datacenterId_(datacenterId) {
    layout_.validate();
    if (nodeId_ > layout_.max_node_id() || nodeId_ < 0) {
        THROW_CONFIG("worker Id can't be greater than %lld or less than 0",
            static_cast<long long>(layout_.max_node_id()));
    }
    if (datacenterId_ > layout_.max_datacenter_id() || datacenterId_ < 0) {
        THROW_CONFIG("dataCenterId Id can't be greater than %lld or less than 0",
            static_cast<long long>(layout_.max_datacenter_id()));
    }
    // The timestamp field must already hold the time elapsed since the epoch.
    const int64_t elapsed = clock_->now_millis() - layout_.epoch_ms;
    if (elapsed > layout_.max_elapsed_ms()) {
        THROW_CONFIG("%d timestamp bits can't hold %lld ms since the epoch %lld",
            layout_.timestamp_bits, static_cast<long long>(elapsed), static_cast<long long>(layout_.epoch_ms));
    }
}

int64_t IdWorker::next() {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t timestamp = clock_->now_millis();

    // Never issue a timestamp smaller than one already used.
    if (timestamp < lastTimestamp_) {
        THROW_CLOCK("Clock moved backwards. Refusing to generate id for %lld milliseconds",
            static_cast<long long>(lastTimestamp_ - timestamp));
    }
    if (timestamp < layout_.epoch_ms) {
        THROW_CLOCK("Clock reads %lld, before the epoch %lld",
            static_cast<long long>(timestamp), static_cast<long long>(layout_.epoch_ms));
    }

    if (timestamp == lastTimestamp_) {
        sequence_ = (sequence_ + 1) & layout_.sequence_mask();
        if (sequence_ == 0) {
            // sequence space of this millisecond is used up
            timestamp = waitNextMillis(lastTimestamp_);
        }
    } else {
        sequence_ = 0;
    }

    lastTimestamp_ = timestamp;

    return layout_.compose(timestamp - layout_.epoch_ms, datacenterId_, nodeId_, sequence_);
}

int64_t IdWorker::last_timestamp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastTimestamp_;
}

int64_t IdWorker::sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

int64_t IdWorker::waitNextMillis(int64_t lastTimestamp) const {
    int64_t timestamp = clock_->now_millis();
    while (timestamp <= lastTimestamp) {
        timestamp = clock_->now_millis();
    }
    return timestamp;
}

} // namespace snowid
