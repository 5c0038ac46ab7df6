#include "config.hpp"
#include "http.hpp"
#include "proxy.hpp"
#include "server.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: thinkproxy [options]\n"
              << "\n"
              << "Reverse proxy for OpenAI-compatible chat completions that moves\n"
              << "inline <think>...</think> reasoning into reasoning_content.\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Address to listen on (default 0.0.0.0:8000)\n"
              << "  --upstream URL       Upstream API base URL (default https://api.glhf.chat)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Configuration file: ~/.thinkproxy/config.json\n"
              << "\n"
              << "Environment variables:\n"
              << "  THINKPROXY_LISTEN            Listen address\n"
              << "  THINKPROXY_UPSTREAM_URL      Upstream API base URL\n"
              << "  THINKPROXY_TIMEOUT           Upstream timeout in seconds (default 300)\n"
              << "  THINKPROXY_REASONING_EFFORT  Default reasoning_effort (empty disables)\n";
}

int main(int argc, char* argv[]) try {
    std::string listen;
    std::string upstream;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--upstream") == 0 && i + 1 < argc) {
            upstream = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = thinkproxy::Config::load();

    // Override config with CLI args
    if (!listen.empty()) config.listen = listen;
    if (!upstream.empty()) config.upstream_url = upstream;

    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: invalid configuration: " << e.what() << "\n";
        return 1;
    }

    thinkproxy::http_init();
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);
    thinkproxy::http_set_abort_flag(&g_shutdown);

    thinkproxy::PlatformHttpClient http_client;
    thinkproxy::ReasoningProxy proxy(config, &http_client);

    thinkproxy::HttpServer server(
        config.listen, config.max_body, config.max_connections,
        [&proxy](const thinkproxy::HttpRequest& req, thinkproxy::ResponseWriter& out) {
            proxy.handle(req, out);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        thinkproxy::http_cleanup();
        return 1;
    }

    std::cerr << "[server] Listening on " << config.listen
              << ", forwarding to " << config.upstream_url << "\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    thinkproxy::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
