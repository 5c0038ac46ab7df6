#include "config.hpp"
#include "server.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace thinkproxy {

nlohmann::json Config::defaults_json() {
    return {
        {"listen", "0.0.0.0:8000"},
        {"upstream_url", "https://api.glhf.chat"},
        {"chat_path", "/v1/chat/completions"},
        {"timeout_seconds", 300},
        {"max_body", 10485760},
        {"max_connections", 64},
        {"reasoning", {
            {"start_marker", "<think>"},
            {"end_marker", "</think>"},
            {"field", "reasoning_content"},
            {"effort", "high"}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
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

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.thinkproxy/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    cfg.apply_json(j);

    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

// Unsigned values above the uint32_t range are ignored rather than truncated.
static void read_u32(const nlohmann::json& j, const char* key, uint32_t& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned()) return;
    uint64_t v = it->get<uint64_t>();
    if (v > std::numeric_limits<uint32_t>::max()) {
        std::cerr << "[config] Ignoring out of range " << key << ": " << v << "\n";
        return;
    }
    out = static_cast<uint32_t>(v);
}

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) return;

    if (j.contains("listen") && j["listen"].is_string())
        listen = j["listen"].get<std::string>();
    if (j.contains("upstream_url") && j["upstream_url"].is_string())
        upstream_url = j["upstream_url"].get<std::string>();
    if (j.contains("chat_path") && j["chat_path"].is_string())
        chat_path = j["chat_path"].get<std::string>();
    read_u32(j, "timeout_seconds", timeout_seconds);
    read_u32(j, "max_body", max_body);
    read_u32(j, "max_connections", max_connections);

    if (j.contains("reasoning") && j["reasoning"].is_object()) {
        auto& r = j["reasoning"];
        if (r.contains("start_marker") && r["start_marker"].is_string())
            reasoning.start_marker = r["start_marker"].get<std::string>();
        if (r.contains("end_marker") && r["end_marker"].is_string())
            reasoning.end_marker = r["end_marker"].get<std::string>();
        if (r.contains("field") && r["field"].is_string())
            reasoning.field = r["field"].get<std::string>();
        if (r.contains("effort") && r["effort"].is_string())
            reasoning.effort = r["effort"].get<std::string>();
    }
}

void Config::apply_env() {
    if (const char* v = std::getenv("THINKPROXY_LISTEN"))
        listen = v;
    if (const char* v = std::getenv("THINKPROXY_UPSTREAM_URL"))
        upstream_url = v;
    if (const char* v = std::getenv("THINKPROXY_REASONING_EFFORT"))
        reasoning.effort = v;
    if (const char* v = std::getenv("THINKPROXY_TIMEOUT")) {
        try {
            unsigned long secs = std::stoul(v);
            if (secs > 0) timeout_seconds = static_cast<uint32_t>(secs);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid THINKPROXY_TIMEOUT: " << v << "\n";
        }
    }
}

void Config::validate() const {
    std::string host;
    uint16_t port = 0;
    if (!parse_listen_addr(listen, host, port))
        throw std::invalid_argument("invalid listen address: " + listen);
    if (upstream_url.rfind("http://", 0) != 0 && upstream_url.rfind("https://", 0) != 0)
        throw std::invalid_argument("upstream_url must start with http:// or https://: " +
                                    upstream_url);
    if (chat_path.empty() || chat_path[0] != '/')
        throw std::invalid_argument("chat_path must start with '/': " + chat_path);
    if (timeout_seconds == 0)
        throw std::invalid_argument("timeout_seconds must be positive");
    if (max_connections == 0)
        throw std::invalid_argument("max_connections must be positive");
    if (reasoning.start_marker.empty() || reasoning.end_marker.empty())
        throw std::invalid_argument("reasoning markers must not be empty");
    if (reasoning.start_marker == reasoning.end_marker)
        throw std::invalid_argument("reasoning start and end markers must differ");
    if (reasoning.field.empty())
        throw std::invalid_argument("reasoning field name must not be empty");
}

std::string Config::upstream_for(const std::string& path, const std::string& query) const {
    std::string url = upstream_url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += path.empty() ? "/" : path;
    if (!query.empty()) url += "?" + query;
    return url;
}

} // namespace thinkproxy
