#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace thinkproxy {

// Which marker pair delimits reasoning and where the extracted text goes.
struct ReasoningConfig {
    std::string start_marker = "<think>";
    std::string end_marker = "</think>";
    std::string field = "reasoning_content";
    std::string effort = "high";   // injected when the request omits it; empty = leave alone
};

struct Config {
    std::string listen = "0.0.0.0:8000";
    std::string upstream_url = "https://api.glhf.chat";
    std::string chat_path = "/v1/chat/completions";
    uint32_t timeout_seconds = 300;
    uint32_t max_body = 10485760;      // 10 MiB request body cap
    uint32_t max_connections = 64;

    ReasoningConfig reasoning;

    // Load from ~/.thinkproxy/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed config object; unknown keys and wrong types are ignored.
    void apply_json(const nlohmann::json& j);

    // Apply THINKPROXY_* environment overrides.
    void apply_env();

    // Throws std::invalid_argument describing the first invalid setting.
    void validate() const;

    // Upstream URL for a request path + raw query string.
    std::string upstream_for(const std::string& path, const std::string& query) const;
};

} // namespace thinkproxy
