// Almanac MCP Server
// Model Context Protocol server over stdio or streamable HTTP
//
// Usage:
//   almanac_mcp [options]
//
// stdio mode: newline-delimited JSON-RPC on stdin/stdout (default)
// http mode:  POST/DELETE /mcp and GET /health on --host:--port

#include <almanac/config.hpp>
#include <almanac/log.hpp>
#include <almanac/rpc/handler.hpp>
#include <almanac/transport/http_endpoint.hpp>
#include <almanac/transport/http_server.hpp>
#include <almanac/transport/pump.hpp>
#include <almanac/transport/session.hpp>
#include <almanac/transport/stdio_server.hpp>
#include <almanac/version.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace almanac;

static std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested.store(true);
}

int run_stdio(rpc::Handler& handler) {
    transport::StdioServer server(handler);
    server.run();
    log_info("main", "shutdown complete");
    return 0;
}

int run_http(rpc::Handler& handler, const ServerConfig& config) {
    auto session = transport::Session::open({config.max_pending});

    transport::EndpointOptions options;
    options.max_body_bytes = config.max_body_bytes;
    options.idle_timeout = std::chrono::milliseconds(config.idle_timeout_ms);
    transport::McpEndpoint endpoint(*session, options);

    transport::Pump pump(*session, handler);
    pump.start();

    transport::HttpServer server(endpoint, config.host, config.port);
    if (!server.start()) {
        log_critical("main", "failed to start HTTP transport: %s", server.last_error().c_str());
        session->close("server failed to start");
        pump.join();
        return 1;
    }

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    bool announced_close = false;
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (!announced_close && session->state() == transport::SessionState::Closed) {
            log_notice("main", "session %s was terminated by the client; "
                       "further POST /mcp calls are refused", session->id().c_str());
            announced_close = true;
        }
    }

    log_info("main", "signal received, shutting down");

    // Close first: wakes every connection blocked on a reply and ends the pump
    session->close("server shutting down");
    server.stop();
    pump.join();

    log_info("main", "shutdown complete (%zu message(s) processed)", pump.processed());
    return 0;
}

int main(int argc, char* argv[]) {
    ServerConfig config;

    std::string env_error;
    if (!apply_environment(config, env_error)) {
        std::cerr << "Error: " << env_error << "\n";
        return 1;
    }

    auto parsed = parse_command_line(config, argc, argv);
    switch (parsed.action) {
        case ConfigParse::Action::ShowHelp:
            print_usage(argv[0]);
            return 0;
        case ConfigParse::Action::ShowVersion:
            std::cout << ALMANAC_SERVER_NAME << " " << ALMANAC_VERSION << "\n";
            return 0;
        case ConfigParse::Action::Fail:
            std::cerr << "Error: " << parsed.error << "\n";
            print_usage(argv[0]);
            return 1;
        case ConfigParse::Action::Run:
            break;
    }

    set_log_level(config.log_level);
    log_info("main", "%s %s starting (transport=%s, log-level=%s)",
             ALMANAC_SERVER_NAME, ALMANAC_VERSION, transport_name(config.transport),
             log_level_name(config.log_level));

    rpc::Handler handler;

    if (config.transport == TransportMode::Http) {
        return run_http(handler, config);
    }
    return run_stdio(handler);
}
