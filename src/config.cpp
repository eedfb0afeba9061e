#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace linkagent {

namespace {

constexpr uint64_t kMaxBashTimeoutMs = 600000;

nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

bool env_flag(const char* value) {
    std::string v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // namespace

nlohmann::json Config::defaults_json() {
    return {
        {"model", "opencode/kimi-k2.5-free"},
        {"compact_json", false},
        {"verbose", false},
        {"working_directory", ""},
        {"bash", {
            {"default_timeout_ms", 120000}
        }}
    };
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("compact_json") && j["compact_json"].is_boolean())
        cfg.compact_json = j["compact_json"].get<bool>();
    if (j.contains("verbose") && j["verbose"].is_boolean())
        cfg.verbose = j["verbose"].get<bool>();
    if (j.contains("working_directory") && j["working_directory"].is_string())
        cfg.working_directory = expand_home(j["working_directory"].get<std::string>());

    if (j.contains("bash") && j["bash"].is_object()) {
        auto& b = j["bash"];
        if (b.contains("default_timeout_ms") && b["default_timeout_ms"].is_number_integer() &&
            b["default_timeout_ms"].get<int64_t>() >= 0)
            cfg.bash.default_timeout_ms = std::min(
                static_cast<uint64_t>(b["default_timeout_ms"].get<int64_t>()), kMaxBashTimeoutMs);
    }
    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("LINKAGENT_MODEL"))
        model = v;
    if (const char* v = std::getenv("LINKAGENT_WORKING_DIRECTORY"))
        working_directory = expand_home(v);
    if (const char* v = std::getenv("LINKAGENT_VERBOSE"))
        verbose = env_flag(v);
}

Config Config::load() {
    std::string config_path = expand_home("~/.linkagent/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

std::string Config::provider_id() const {
    auto slash = model.find('/');
    if (slash == std::string::npos) return {};
    return model.substr(0, slash);
}

std::string Config::model_id() const {
    auto slash = model.find('/');
    if (slash == std::string::npos) return model;
    return model.substr(slash + 1);
}

} // namespace linkagent
