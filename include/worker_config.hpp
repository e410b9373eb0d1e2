#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include "jsonhlp.hpp"
#include "layout.hpp"
#include "snowflake.hpp"

/****************** LITERAL CONSTS */
#define SNOWID_KEY_NODE_ID       "node_id"
#define SNOWID_KEY_DATACENTER_ID "datacenter_id"
#define SNOWID_KEY_EPOCH_MS      "epoch_ms"
#define SNOWID_KEY_BITS          "bits"
#define SNOWID_KEY_TIMESTAMP     "timestamp"
#define SNOWID_KEY_DATACENTER    "datacenter"
#define SNOWID_KEY_NODE          "node"
#define SNOWID_KEY_SEQUENCE      "sequence"

namespace snowid {

// Deployment settings of one worker: its shard coordinates and the id layout.
struct WorkerConfig {
    int64_t node_id = 0;
    int64_t datacenter_id = 0;
    Layout layout;

    /**
     * @brief Hydrate a WorkerConfig from a parsed JSON document.
     *
     * Every key is optional; missing keys keep their defaults.
     *
     * @return false if the document is not a JSON object
     * @throws InvalidConfiguration if a present key is not an integer or the
     *         resulting layout is invalid
     */
    static bool from_json(const jdoc& doc, WorkerConfig& cfg);

    // Parses the file and calls from_json(). Returns false (and reports on
    // stderr) when the file can't be read or isn't valid JSON.
    static bool load_file(const std::string& path, WorkerConfig& cfg);

    // Builds the worker for this shard; validates as IdWorker does.
    std::unique_ptr<IdWorker> build(PClock clock = nullptr) const;
};

} // namespace snowid
