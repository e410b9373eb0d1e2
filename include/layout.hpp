#pragma once
#include <cstdint>
#include <climits>

namespace snowid {

// 2020-01-01 00:00:00 UTC+8
static constexpr int64_t DEFAULT_EPOCH_MS = 1577808000000;

static constexpr int ID_BITS = 64;
static constexpr int SIGN_BITS = 1;

struct IdParts {
    int64_t id = 0;
    int64_t timestamp_ms = 0; // absolute, ms since the Unix epoch
    int64_t elapsed_ms = 0;   // ms since the layout epoch, as stored in the id
    int64_t datacenter_id = 0;
    int64_t node_id = 0;
    int64_t sequence = 0;
};

/**
 * @brief Bit partition of an identifier, most significant field first:
 *
 *      sign(1) | elapsed ms(timestamp_bits) | datacenter | node | sequence
 *
 * The widths must add up to 63 so the sign bit stays clear. Every mask and
 * shift is derived from the widths.
 */
struct Layout {
    int64_t epoch_ms = DEFAULT_EPOCH_MS;
    int timestamp_bits = 41;
    int datacenter_bits = 5;
    int node_bits = 5;
    int sequence_bits = 12;

    int64_t max_node_id() const { return mask(node_bits); }
    int64_t max_datacenter_id() const { return mask(datacenter_bits); }
    int64_t sequence_mask() const { return mask(sequence_bits); }
    int64_t max_elapsed_ms() const { return mask(timestamp_bits); }

    int node_shift() const { return sequence_bits; }
    int datacenter_shift() const { return sequence_bits + node_bits; }
    int timestamp_shift() const { return sequence_bits + node_bits + datacenter_bits; }

    // Throws InvalidConfiguration when the widths or the epoch are unusable.
    void validate() const;

    int64_t compose(int64_t elapsed_ms, int64_t datacenter_id, int64_t node_id, int64_t sequence) const;
    IdParts decode(int64_t id) const;

    bool operator==(const Layout& other) const = default;

private:
    static int64_t mask(int bits) {
        if (bits <= 0) return 0;
        if (bits >= ID_BITS - SIGN_BITS) return INT64_MAX;
        return static_cast<int64_t>(~(~uint64_t{0} << bits));
    }
};

} // namespace snowid
