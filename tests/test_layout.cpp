#include "catch.hpp"
#include "layout.hpp"
#include "lib.hpp"
#include "snowflake.hpp"

using snowid::InvalidConfiguration;
using snowid::Layout;

TEST_CASE("Default layout is 1+41+5+5+12", "[layout]")
{
    Layout l;
    REQUIRE_NOTHROW(l.validate());
    CHECK(l.epoch_ms == 1577808000000);
    CHECK(l.node_shift() == 12);
    CHECK(l.datacenter_shift() == 17);
    CHECK(l.timestamp_shift() == 22);
    CHECK(l.max_node_id() == 31);
    CHECK(l.max_datacenter_id() == 31);
    CHECK(l.sequence_mask() == 4095);
    CHECK(l.max_elapsed_ms() == (int64_t { 1 } << 41) - 1);
}

TEST_CASE("Layout must fill exactly 63 bits", "[layout]")
{
    Layout l;
    // the widths of the old deployment: 41 + 4 + 4 + 12
    l.datacenter_bits = 4;
    l.node_bits = 4;
    REQUIRE_THROWS_AS(l.validate(), InvalidConfiguration);

    l.timestamp_bits = 43;
    REQUIRE_NOTHROW(l.validate());
    CHECK(l.max_node_id() == 15);
    CHECK(l.timestamp_shift() == 20);
}

TEST_CASE("Layout rejects empty or negative fields", "[layout]")
{
    Layout no_seq;
    no_seq.sequence_bits = 0;
    no_seq.timestamp_bits = 53;
    REQUIRE_THROWS_AS(no_seq.validate(), InvalidConfiguration);

    Layout no_ts;
    no_ts.timestamp_bits = 0;
    no_ts.sequence_bits = 53;
    REQUIRE_THROWS_AS(no_ts.validate(), InvalidConfiguration);

    Layout negative;
    negative.node_bits = -1;
    negative.timestamp_bits = 47;
    REQUIRE_THROWS_AS(negative.validate(), InvalidConfiguration);

    Layout early;
    early.epoch_ms = -1;
    REQUIRE_THROWS_AS(early.validate(), InvalidConfiguration);
}

TEST_CASE("Layout rejects widths wider than an id", "[layout]")
{
    // the four widths would wrap around to 63 when added as int
    Layout huge;
    huge.timestamp_bits = 2147483647;
    huge.datacenter_bits = 2147483647;
    huge.node_bits = 64;
    huge.sequence_bits = 1;
    REQUIRE_THROWS_AS(huge.validate(), InvalidConfiguration);
    REQUIRE_THROWS_AS(snowid::IdWorker(0, 0, huge), InvalidConfiguration);

    Layout wide;
    wide.node_bits = 64;
    wide.timestamp_bits = 0;
    REQUIRE_THROWS_AS(wide.validate(), InvalidConfiguration);

    Layout all_sequence;
    all_sequence.timestamp_bits = 1;
    all_sequence.datacenter_bits = 0;
    all_sequence.node_bits = 0;
    all_sequence.sequence_bits = 62;
    REQUIRE_NOTHROW(all_sequence.validate());
    all_sequence.sequence_bits = 64;
    all_sequence.timestamp_bits = -1;
    REQUIRE_THROWS_AS(all_sequence.validate(), InvalidConfiguration);
}

TEST_CASE("A zero-width node field only admits node 0", "[layout][worker]")
{
    Layout l;
    l.node_bits = 0;
    l.timestamp_bits = 46;
    REQUIRE_NOTHROW(l.validate());
    CHECK(l.max_node_id() == 0);
    CHECK(l.node_shift() == l.datacenter_shift());

    REQUIRE_NOTHROW(snowid::IdWorker(0, 31, l));
    REQUIRE_THROWS_AS(snowid::IdWorker(1, 0, l), InvalidConfiguration);
}

TEST_CASE("decode reads back the composed fields", "[layout]")
{
    Layout l;
    int64_t id = l.compose(123456789, 17, 30, 4000);
    CHECK(id == ((int64_t { 123456789 } << 22) | (17 << 17) | (30 << 12) | 4000));

    auto p = l.decode(id);
    CHECK(p.id == id);
    CHECK(p.elapsed_ms == 123456789);
    CHECK(p.timestamp_ms == l.epoch_ms + 123456789);
    CHECK(p.datacenter_id == 17);
    CHECK(p.node_id == 30);
    CHECK(p.sequence == 4000);
}

TEST_CASE("Largest id of a layout stays non-negative", "[layout]")
{
    Layout l;
    int64_t id = l.compose(l.max_elapsed_ms(), l.max_datacenter_id(), l.max_node_id(), l.sequence_mask());
    CHECK(id == INT64_MAX);

    auto p = l.decode(id);
    CHECK(p.elapsed_ms == l.max_elapsed_ms());
    CHECK(p.datacenter_id == 31);
    CHECK(p.node_id == 31);
    CHECK(p.sequence == 4095);
}
