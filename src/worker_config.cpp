#include "worker_config.hpp"
#include "lib.hpp"

namespace snowid {

namespace {

// Reads an optional integer member; a present member of any other type is a
// configuration error rather than a silent fallback to the default.
int64_t int_member(const jval& parent, const char* key, int64_t default_value) {
    if (!jhlp::has(parent, key)) return default_value;
    const jval& val = parent.FindMember(key)->value;
    if (!val.IsInt64()) THROW_CONFIG("'%s' must be an integer, got %s", key, jhlp::stringify(val).c_str());
    return val.GetInt64();
}

int width_member(const jval& parent, const char* key, int default_value) {
    if (!jhlp::has(parent, key)) return default_value;
    const jval& val = parent.FindMember(key)->value;
    if (!val.IsInt()) THROW_CONFIG("bit width '%s' must be an integer, got %s", key, jhlp::stringify(val).c_str());
    return val.GetInt();
}

} // namespace

bool WorkerConfig::from_json(const jdoc& doc, WorkerConfig& cfg) {
    if (!doc.IsObject()) return false;
    const jval& j = doc;

    WorkerConfig parsed;
    parsed.node_id = int_member(j, SNOWID_KEY_NODE_ID, parsed.node_id);
    parsed.datacenter_id = int_member(j, SNOWID_KEY_DATACENTER_ID, parsed.datacenter_id);
    parsed.layout.epoch_ms = int_member(j, SNOWID_KEY_EPOCH_MS, parsed.layout.epoch_ms);

    if (jhlp::has(j, SNOWID_KEY_BITS)) {
        const jval& bits = j.FindMember(SNOWID_KEY_BITS)->value;
        if (!bits.IsObject()) THROW_CONFIG("'%s' must be an object", SNOWID_KEY_BITS);
        Layout& l = parsed.layout;
        l.timestamp_bits = width_member(bits, SNOWID_KEY_TIMESTAMP, l.timestamp_bits);
        l.datacenter_bits = width_member(bits, SNOWID_KEY_DATACENTER, l.datacenter_bits);
        l.node_bits = width_member(bits, SNOWID_KEY_NODE, l.node_bits);
        l.sequence_bits = width_member(bits, SNOWID_KEY_SEQUENCE, l.sequence_bits);
    }
    parsed.layout.validate();

    cfg = parsed;
    return true;
}

bool WorkerConfig::load_file(const std::string& path, WorkerConfig& cfg) {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) return false;
    if (!from_json(doc, cfg)) {
        std::cerr << "Config " << path << " must hold a JSON object" << std::endl;
        return false;
    }
    return true;
}

std::unique_ptr<IdWorker> WorkerConfig::build(PClock clock) const {
    return std::make_unique<IdWorker>(node_id, datacenter_id, layout, std::move(clock));
}

} // namespace snowid
