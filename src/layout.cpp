#include "layout.hpp"
#include "lib.hpp"

namespace snowid {

void Layout::validate() const {
    if (timestamp_bits < 1) THROW_CONFIG("timestamp bits must be at least 1, got %d", timestamp_bits);
    if (sequence_bits < 1) THROW_CONFIG("sequence bits must be at least 1, got %d", sequence_bits);
    if (datacenter_bits < 0) THROW_CONFIG("datacenter bits can't be negative, got %d", datacenter_bits);
    if (node_bits < 0) THROW_CONFIG("node bits can't be negative, got %d", node_bits);

    // bounded first so the sum below can't overflow
    const int room = ID_BITS - SIGN_BITS;
    if (timestamp_bits > room || datacenter_bits > room || node_bits > room || sequence_bits > room) {
        THROW_CONFIG("bit widths can't exceed %d, got %d+%d+%d+%d",
            room, timestamp_bits, datacenter_bits, node_bits, sequence_bits);
    }

    const int used = timestamp_bits + datacenter_bits + node_bits + sequence_bits;
    if (used != room) {
        THROW_CONFIG("bit layout %d+%d+%d+%d uses %d bits, expected %d",
            timestamp_bits, datacenter_bits, node_bits, sequence_bits, used, room);
    }
    if (epoch_ms < 0) THROW_CONFIG("epoch can't be before 1970-01-01, got %lld", static_cast<long long>(epoch_ms));
}

int64_t Layout::compose(int64_t elapsed_ms, int64_t datacenter_id, int64_t node_id, int64_t sequence) const {
    return (elapsed_ms << timestamp_shift())
        | (datacenter_id << datacenter_shift())
        | (node_id << node_shift())
        | sequence;
}

IdParts Layout::decode(int64_t id) const {
    IdParts parts;
    parts.id = id;
    parts.sequence = id & sequence_mask();
    parts.node_id = (id >> node_shift()) & max_node_id();
    parts.datacenter_id = (id >> datacenter_shift()) & max_datacenter_id();
    parts.elapsed_ms = (id >> timestamp_shift()) & max_elapsed_ms();
    parts.timestamp_ms = parts.elapsed_ms + epoch_ms;
    return parts;
}

} // namespace snowid
