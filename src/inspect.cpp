#include "inspect.hpp"

namespace snowid {

namespace {
constexpr int64_t MS_PER_YEAR = 1000LL * 60 * 60 * 24 * 365;
}

nlohmann::json inspect_id(int64_t id, const Layout& layout) {
    const IdParts parts = layout.decode(id);
    return nlohmann::json {
        { "id", parts.id },
        { "timestamp_ms", parts.timestamp_ms },
        { "elapsed_ms", parts.elapsed_ms },
        { "datacenter_id", parts.datacenter_id },
        { "node_id", parts.node_id },
        { "sequence", parts.sequence },
    };
}

nlohmann::json inspect_layout(const Layout& layout) {
    nlohmann::json j;
    j["epoch_ms"] = layout.epoch_ms;
    j["bits"] = {
        { "timestamp", layout.timestamp_bits },
        { "datacenter", layout.datacenter_bits },
        { "node", layout.node_bits },
        { "sequence", layout.sequence_bits },
    };
    j["shifts"] = {
        { "timestamp", layout.timestamp_shift() },
        { "datacenter", layout.datacenter_shift() },
        { "node", layout.node_shift() },
    };
    j["max_datacenter_id"] = layout.max_datacenter_id();
    j["max_node_id"] = layout.max_node_id();
    j["ids_per_ms"] = layout.sequence_mask() + 1;
    j["years"] = layout.max_elapsed_ms() / MS_PER_YEAR;
    return j;
}

} // namespace snowid
