#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <sstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace linkagent;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.model == "opencode/kimi-k2.5-free");
    REQUIRE_FALSE(cfg.compact_json);
    REQUIRE_FALSE(cfg.verbose);
    REQUIRE(cfg.working_directory.empty());
    REQUIRE(cfg.bash.default_timeout_ms == 120000);
}

TEST_CASE("Config::defaults_json: round-trips to default Config", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    REQUIRE(cfg.model == Config().model);
    REQUIRE(cfg.bash.default_timeout_ms == 120000);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: fields override defaults", "[config]") {
    Config cfg = Config::from_json({
        {"model", "anthropic/claude"},
        {"compact_json", true},
        {"verbose", true},
        {"working_directory", "/srv/project"},
        {"bash", {{"default_timeout_ms", 5000}}}
    });
    REQUIRE(cfg.model == "anthropic/claude");
    REQUIRE(cfg.compact_json);
    REQUIRE(cfg.verbose);
    REQUIRE(cfg.working_directory == "/srv/project");
    REQUIRE(cfg.bash.default_timeout_ms == 5000);
}

TEST_CASE("Config::from_json: wrong types are ignored", "[config]") {
    Config cfg = Config::from_json({
        {"model", 42},
        {"compact_json", "yes"},
        {"bash", {{"default_timeout_ms", -5}}}
    });
    REQUIRE(cfg.model == "opencode/kimi-k2.5-free");
    REQUIRE_FALSE(cfg.compact_json);
    REQUIRE(cfg.bash.default_timeout_ms == 120000);
}

TEST_CASE("Config::from_json: bash timeout capped at ten minutes", "[config]") {
    Config cfg = Config::from_json({{"bash", {{"default_timeout_ms", 9999999}}}});
    REQUIRE(cfg.bash.default_timeout_ms == 600000);
}

// ── provider_id / model_id ──────────────────────────────────────

TEST_CASE("Config: model string split at first slash", "[config]") {
    Config cfg;
    cfg.model = "openrouter/meta/llama";
    REQUIRE(cfg.provider_id() == "openrouter");
    REQUIRE(cfg.model_id() == "meta/llama");

    cfg.model = "local-model";
    REQUIRE(cfg.provider_id().empty());
    REQUIRE(cfg.model_id() == "local-model");
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "linkagent_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("LINKAGENT_MODEL");
        unsetenv("LINKAGENT_WORKING_DIRECTORY");
        unsetenv("LINKAGENT_VERBOSE");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("LINKAGENT_MODEL");
        unsetenv("LINKAGENT_WORKING_DIRECTORY");
        unsetenv("LINKAGENT_VERBOSE");
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.linkagent/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.linkagent");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "model": "anthropic/claude-sonnet",
        "compact_json": true,
        "working_directory": "~/work",
        "bash": {"default_timeout_ms": 30000}
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.model == "anthropic/claude-sonnet");
    REQUIRE(cfg.compact_json);
    REQUIRE(cfg.working_directory == g.dir + "/work");
    REQUIRE(cfg.bash.default_timeout_ms == 30000);
}

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.model == "opencode/kimi-k2.5-free");
    REQUIRE(std::filesystem::exists(g.config_path()));

    auto written = nlohmann::json::parse(g.read_config());
    REQUIRE(written == Config::defaults_json());
}

TEST_CASE("Config::load: migrates config missing new keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"model": "custom/model"})");
    Config cfg = Config::load();
    REQUIRE(cfg.model == "custom/model");

    auto written = nlohmann::json::parse(g.read_config());
    REQUIRE(written["model"] == "custom/model");
    REQUIRE(written["bash"]["default_timeout_ms"] == 120000);
    REQUIRE(written.contains("compact_json"));
}

TEST_CASE("Config::load: complete config is not rewritten", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    auto full = Config::defaults_json();
    full["model"] = "a/b";
    std::string text = full.dump();
    g.write_config(text);

    Config::load();
    REQUIRE(g.read_config() == text);
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("{ this is not json");
    Config cfg = Config::load();
    REQUIRE(cfg.model == "opencode/kimi-k2.5-free");
    REQUIRE(g.read_config() == "{ this is not json");
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"model": "from/file", "verbose": false})");
    setenv("LINKAGENT_MODEL", "from/env", 1);
    setenv("LINKAGENT_WORKING_DIRECTORY", "/opt/env", 1);
    setenv("LINKAGENT_VERBOSE", "true", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.model == "from/env");
    REQUIRE(cfg.working_directory == "/opt/env");
    REQUIRE(cfg.verbose);
}

TEST_CASE("Config::apply_env: verbose flag spellings", "[config]") {
    ConfigTestGuard g;
    Config cfg;

    setenv("LINKAGENT_VERBOSE", " ON ", 1);
    cfg.apply_env();
    REQUIRE(cfg.verbose);

    setenv("LINKAGENT_VERBOSE", "0", 1);
    cfg.apply_env();
    REQUIRE_FALSE(cfg.verbose);
}
