#pragma once
// Config: server settings from defaults, environment and command line
//
// Priority (lowest to highest):
//   built-in defaults < ALMANAC_* environment variables < command-line options

#include <almanac/log.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace almanac {

enum class TransportMode {
    Stdio,
    Http,
};

struct ServerConfig {
    static constexpr size_t DEFAULT_MAX_BODY_BYTES = 1024 * 1024;  // 1 MiB
    static constexpr size_t DEFAULT_MAX_PENDING = 1024;
    // One day; larger values overflow std::chrono's nanosecond waits
    static constexpr uint64_t MAX_IDLE_TIMEOUT_MS = 24ULL * 60 * 60 * 1000;

    TransportMode transport = TransportMode::Stdio;
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    size_t max_body_bytes = DEFAULT_MAX_BODY_BYTES;
    size_t max_pending = DEFAULT_MAX_PENDING;  // 0 = unbounded
    uint64_t idle_timeout_ms = 0;              // 0 = wait until reply or close
    LogLevel log_level = LogLevel::Info;
};

// Outcome of command-line parsing
struct ConfigParse {
    enum class Action {
        Run,
        ShowHelp,
        ShowVersion,
        Fail,
    };

    Action action = Action::Run;
    std::string error;
};

// Apply ALMANAC_HOST, ALMANAC_PORT, ALMANAC_MAX_BODY, ALMANAC_MAX_PENDING,
// ALMANAC_IDLE_TIMEOUT_MS and ALMANAC_LOG_LEVEL when set.
// Returns false with error_msg set on the first malformed value.
bool apply_environment(ServerConfig& config, std::string& error_msg);

ConfigParse parse_command_line(ServerConfig& config, int argc, char* argv[]);

const char* transport_name(TransportMode mode);

void print_usage(const char* prog);

} // namespace almanac
