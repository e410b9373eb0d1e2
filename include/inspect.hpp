#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include "layout.hpp"

namespace snowid {

// {"id", "timestamp_ms", "elapsed_ms", "datacenter_id", "node_id", "sequence"}
nlohmann::json inspect_id(int64_t id, const Layout& layout);

// Widths, shifts and maxima of a layout, plus how many whole years its
// timestamp field covers from the epoch.
nlohmann::json inspect_layout(const Layout& layout);

} // namespace snowid
