#include "catch.hpp"
#include "inspect.hpp"

using snowid::Layout;

TEST_CASE("inspect_id lists every field of the id", "[inspect]")
{
    Layout l;
    int64_t id = l.compose(86'400'000, 3, 12, 99);
    auto j = snowid::inspect_id(id, l);

    CHECK(j["id"].get<int64_t>() == id);
    CHECK(j["elapsed_ms"].get<int64_t>() == 86'400'000);
    CHECK(j["timestamp_ms"].get<int64_t>() == l.epoch_ms + 86'400'000);
    CHECK(j["datacenter_id"].get<int64_t>() == 3);
    CHECK(j["node_id"].get<int64_t>() == 12);
    CHECK(j["sequence"].get<int64_t>() == 99);
}

TEST_CASE("inspect_layout describes the default partition", "[inspect]")
{
    auto j = snowid::inspect_layout(Layout {});

    CHECK(j["epoch_ms"].get<int64_t>() == snowid::DEFAULT_EPOCH_MS);
    CHECK(j["bits"]["timestamp"].get<int>() == 41);
    CHECK(j["bits"]["sequence"].get<int>() == 12);
    CHECK(j["shifts"]["timestamp"].get<int>() == 22);
    CHECK(j["shifts"]["datacenter"].get<int>() == 17);
    CHECK(j["shifts"]["node"].get<int>() == 12);
    CHECK(j["max_node_id"].get<int64_t>() == 31);
    CHECK(j["max_datacenter_id"].get<int64_t>() == 31);
    CHECK(j["ids_per_ms"].get<int64_t>() == 4096);
    CHECK(j["years"].get<int64_t>() == 69);
}
