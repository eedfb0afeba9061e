#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace linkagent {

struct BashConfig {
    uint64_t default_timeout_ms = 120000;
};

struct Config {
    std::string model = "opencode/kimi-k2.5-free"; // providerID/modelID
    bool compact_json = false;
    bool verbose = false;
    std::string working_directory; // empty = process cwd

    BashConfig bash;

    // Load from ~/.linkagent/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Fields present in j override the defaults; wrong types are ignored
    static Config from_json(const nlohmann::json& j);

    // LINKAGENT_MODEL, LINKAGENT_WORKING_DIRECTORY, LINKAGENT_VERBOSE
    void apply_env();

    // "opencode/kimi" -> "opencode" / "kimi". A model without '/' has an
    // empty provider.
    std::string provider_id() const;
    std::string model_id() const;
};

} // namespace linkagent
