#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <iterator>
#include <cstdlib>
#include <stdexcept>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace thinkproxy;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.listen == "0.0.0.0:8000");
    REQUIRE(cfg.upstream_url == "https://api.glhf.chat");
    REQUIRE(cfg.chat_path == "/v1/chat/completions");
    REQUIRE(cfg.timeout_seconds == 300);
    REQUIRE(cfg.max_body == 10485760);
    REQUIRE(cfg.max_connections == 64);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("ReasoningConfig: default values", "[config]") {
    ReasoningConfig rc;
    REQUIRE(rc.start_marker == "<think>");
    REQUIRE(rc.end_marker == "</think>");
    REQUIRE(rc.field == "reasoning_content");
    REQUIRE(rc.effort == "high");
}

// ── upstream_for ─────────────────────────────────────────────────

TEST_CASE("Config::upstream_for: joins base and path", "[config]") {
    Config cfg;
    REQUIRE(cfg.upstream_for("/v1/models", "") == "https://api.glhf.chat/v1/models");
}

TEST_CASE("Config::upstream_for: trailing slash on base is dropped", "[config]") {
    Config cfg;
    cfg.upstream_url = "http://localhost:11434/";
    REQUIRE(cfg.upstream_for("/v1/chat/completions", "") ==
            "http://localhost:11434/v1/chat/completions");
}

TEST_CASE("Config::upstream_for: query string forwarded verbatim", "[config]") {
    Config cfg;
    REQUIRE(cfg.upstream_for("/v1/models", "a=1&b=%20x") ==
            "https://api.glhf.chat/v1/models?a=1&b=%20x");
}

TEST_CASE("Config::upstream_for: base with a path prefix", "[config]") {
    Config cfg;
    cfg.upstream_url = "https://example.com/openai";
    REQUIRE(cfg.upstream_for("/v1/models", "") == "https://example.com/openai/v1/models");
}

// ── validate ─────────────────────────────────────────────────────

TEST_CASE("Config::validate: rejects bad settings", "[config]") {
    Config cfg;

    SECTION("listen address") {
        cfg.listen = "localhost";
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("upstream scheme") {
        cfg.upstream_url = "ftp://example.com";
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("chat path") {
        cfg.chat_path = "v1/chat/completions";
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("timeout") {
        cfg.timeout_seconds = 0;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("connection limit") {
        cfg.max_connections = 0;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("empty marker") {
        cfg.reasoning.end_marker.clear();
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("identical markers") {
        cfg.reasoning.start_marker = "|";
        cfg.reasoning.end_marker = "|";
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("empty field") {
        cfg.reasoning.field.clear();
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
}

TEST_CASE("Config::validate: empty effort is allowed", "[config]") {
    Config cfg;
    cfg.reasoning.effort.clear();
    REQUIRE_NOTHROW(cfg.validate());
}

// ── apply_json ───────────────────────────────────────────────────

TEST_CASE("Config::apply_json: wrong types are ignored", "[config]") {
    Config cfg;
    cfg.apply_json(nlohmann::json::parse(R"({
        "listen": 8080,
        "timeout_seconds": "soon",
        "max_body": -1,
        "reasoning": {"field": ["x"], "effort": "low"}
    })"));
    REQUIRE(cfg.listen == "0.0.0.0:8000");
    REQUIRE(cfg.timeout_seconds == 300);
    REQUIRE(cfg.max_body == 10485760);
    REQUIRE(cfg.reasoning.field == "reasoning_content");
    REQUIRE(cfg.reasoning.effort == "low");
}

TEST_CASE("Config::apply_json: values beyond 32 bits are ignored", "[config]") {
    Config cfg;
    cfg.apply_json(nlohmann::json::parse(R"({
        "max_body": 4294967297,
        "timeout_seconds": 4294967295,
        "max_connections": 18446744073709551615
    })"));
    REQUIRE(cfg.max_body == 10485760);
    REQUIRE(cfg.timeout_seconds == 4294967295u);
    REQUIRE(cfg.max_connections == 64);
}

TEST_CASE("Config::apply_json: non-object is ignored", "[config]") {
    Config cfg;
    cfg.apply_json(nlohmann::json::array({1, 2}));
    REQUIRE(cfg.listen == "0.0.0.0:8000");
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "thinkproxy_cfg_XXXXXX";
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
        unsetenv("THINKPROXY_LISTEN");
        unsetenv("THINKPROXY_UPSTREAM_URL");
        unsetenv("THINKPROXY_TIMEOUT");
        unsetenv("THINKPROXY_REASONING_EFFORT");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.thinkproxy/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.thinkproxy");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "listen": "127.0.0.1:9000",
        "upstream_url": "http://localhost:11434",
        "chat_path": "/api/chat",
        "timeout_seconds": 60,
        "max_body": 1024,
        "max_connections": 4,
        "reasoning": {
            "start_marker": "<reasoning>",
            "end_marker": "</reasoning>",
            "field": "reasoning",
            "effort": "medium"
        }
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.listen == "127.0.0.1:9000");
    REQUIRE(cfg.upstream_url == "http://localhost:11434");
    REQUIRE(cfg.chat_path == "/api/chat");
    REQUIRE(cfg.timeout_seconds == 60);
    REQUIRE(cfg.max_body == 1024);
    REQUIRE(cfg.max_connections == 4);
    REQUIRE(cfg.reasoning.start_marker == "<reasoning>");
    REQUIRE(cfg.reasoning.end_marker == "</reasoning>");
    REQUIRE(cfg.reasoning.field == "reasoning");
    REQUIRE(cfg.reasoning.effort == "medium");
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"upstream_url": "http://from-file:1", "reasoning": {"effort": "low"}})");
    setenv("THINKPROXY_UPSTREAM_URL", "http://from-env:2", 1);
    setenv("THINKPROXY_REASONING_EFFORT", "", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.upstream_url == "http://from-env:2");
    REQUIRE(cfg.reasoning.effort.empty());

    unsetenv("THINKPROXY_UPSTREAM_URL");
    unsetenv("THINKPROXY_REASONING_EFFORT");
}

TEST_CASE("Config::load: all env var overrides", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("THINKPROXY_LISTEN", "127.0.0.1:8123", 1);
    setenv("THINKPROXY_UPSTREAM_URL", "http://env:1234", 1);
    setenv("THINKPROXY_TIMEOUT", "42", 1);
    setenv("THINKPROXY_REASONING_EFFORT", "low", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.listen == "127.0.0.1:8123");
    REQUIRE(cfg.upstream_url == "http://env:1234");
    REQUIRE(cfg.timeout_seconds == 42);
    REQUIRE(cfg.reasoning.effort == "low");

    unsetenv("THINKPROXY_LISTEN");
    unsetenv("THINKPROXY_UPSTREAM_URL");
    unsetenv("THINKPROXY_TIMEOUT");
    unsetenv("THINKPROXY_REASONING_EFFORT");
}

TEST_CASE("Config::load: invalid timeout env var is ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("THINKPROXY_TIMEOUT", "forever", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.timeout_seconds == 300);

    setenv("THINKPROXY_TIMEOUT", "0", 1);
    cfg = Config::load();
    REQUIRE(cfg.timeout_seconds == 300);

    unsetenv("THINKPROXY_TIMEOUT");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.listen == "0.0.0.0:8000");
    REQUIRE(cfg.reasoning.start_marker == "<think>");
}

TEST_CASE("Config::load: missing config file uses defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.upstream_url == "https://api.glhf.chat");
    REQUIRE(cfg.timeout_seconds == 300);
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);

    REQUIRE(j == Config::defaults_json());
    REQUIRE(j["reasoning"]["start_marker"] == "<think>");
    REQUIRE(j["reasoning"]["effort"] == "high");
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"upstream_url": "http://local:8080", "reasoning": {"field": "reasoning"}})");

    Config cfg = Config::load();

    // User values preserved
    REQUIRE(cfg.upstream_url == "http://local:8080");
    REQUIRE(cfg.reasoning.field == "reasoning");

    // Re-read file to verify migration wrote new keys
    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);

    REQUIRE(j["upstream_url"] == "http://local:8080");
    REQUIRE(j["reasoning"]["field"] == "reasoning");
    REQUIRE(j["reasoning"]["start_marker"] == "<think>");
    REQUIRE(j["listen"] == "0.0.0.0:8000");
    REQUIRE(j["max_connections"] == 64);
}

TEST_CASE("Config::load: malformed file is left untouched", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("{ broken");
    Config::load();

    std::ifstream f(g.config_path());
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    REQUIRE(content == "{ broken");
}
