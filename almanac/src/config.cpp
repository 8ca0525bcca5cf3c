#include <almanac/config.hpp>
#include <almanac/version.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>

namespace almanac {

namespace {

// Strict unsigned decimal: digits only, no sign, no trailing garbage
bool parse_unsigned(const char* text, uint64_t max_value, uint64_t& out) {
    if (!text || !*text) return false;
    for (const char* p = text; *p; ++p) {
        if (*p < '0' || *p > '9') return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text, &end, 10);
    if (errno == ERANGE || *end != '\0' || value > max_value) return false;
    out = value;
    return true;
}

bool set_port(ServerConfig& config, const char* text, std::string& error_msg) {
    uint64_t value = 0;
    if (!parse_unsigned(text, std::numeric_limits<uint16_t>::max(), value)) {
        error_msg = std::string("Invalid port: ") + text;
        return false;
    }
    config.port = static_cast<uint16_t>(value);
    return true;
}

bool set_size(size_t& field, const char* what, const char* text, std::string& error_msg) {
    uint64_t value = 0;
    if (!parse_unsigned(text, std::numeric_limits<size_t>::max(), value)) {
        error_msg = std::string("Invalid ") + what + ": " + text;
        return false;
    }
    field = static_cast<size_t>(value);
    return true;
}

bool set_timeout(ServerConfig& config, const char* text, std::string& error_msg) {
    uint64_t value = 0;
    if (!parse_unsigned(text, ServerConfig::MAX_IDLE_TIMEOUT_MS, value)) {
        error_msg = std::string("Invalid idle timeout: ") + text +
                    " (max " + std::to_string(ServerConfig::MAX_IDLE_TIMEOUT_MS) + ")";
        return false;
    }
    config.idle_timeout_ms = value;
    return true;
}

bool set_transport(ServerConfig& config, const char* text, std::string& error_msg) {
    if (std::strcmp(text, "stdio") == 0) {
        config.transport = TransportMode::Stdio;
    } else if (std::strcmp(text, "http") == 0) {
        config.transport = TransportMode::Http;
    } else {
        error_msg = std::string("Invalid transport: ") + text + " (expected stdio or http)";
        return false;
    }
    return true;
}

bool set_level(ServerConfig& config, const char* text, std::string& error_msg) {
    if (!is_log_level_name(text)) {
        error_msg = std::string("Invalid log level: ") + text;
        return false;
    }
    config.log_level = parse_log_level(text);
    return true;
}

bool is_option(const char* arg, const char* long_name, const char* short_name = nullptr) {
    return std::strcmp(arg, long_name) == 0 ||
           (short_name && std::strcmp(arg, short_name) == 0);
}

} // namespace

bool apply_environment(ServerConfig& config, std::string& error_msg) {
    if (const char* host = std::getenv("ALMANAC_HOST")) {
        config.host = host;
    }
    if (const char* port = std::getenv("ALMANAC_PORT")) {
        if (!set_port(config, port, error_msg)) return false;
    }
    if (const char* max_body = std::getenv("ALMANAC_MAX_BODY")) {
        if (!set_size(config.max_body_bytes, "max body", max_body, error_msg)) return false;
    }
    if (const char* max_pending = std::getenv("ALMANAC_MAX_PENDING")) {
        if (!set_size(config.max_pending, "max pending", max_pending, error_msg)) return false;
    }
    if (const char* timeout = std::getenv("ALMANAC_IDLE_TIMEOUT_MS")) {
        if (!set_timeout(config, timeout, error_msg)) return false;
    }
    if (const char* level = std::getenv("ALMANAC_LOG_LEVEL")) {
        // Environment is lenient: unknown names fall back to info
        config.log_level = parse_log_level(level);
    }
    return true;
}

ConfigParse parse_command_line(ServerConfig& config, int argc, char* argv[]) {
    ConfigParse result;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;
        bool ok = true;

        if (is_option(arg, "--help", "-h")) {
            result.action = ConfigParse::Action::ShowHelp;
            return result;
        } else if (is_option(arg, "--version", "-v")) {
            result.action = ConfigParse::Action::ShowVersion;
            return result;
        } else if (is_option(arg, "--transport", "-t") && has_value) {
            ok = set_transport(config, argv[++i], result.error);
        } else if (is_option(arg, "--host") && has_value) {
            config.host = argv[++i];
        } else if (is_option(arg, "--port", "-p") && has_value) {
            ok = set_port(config, argv[++i], result.error);
        } else if (is_option(arg, "--log-level", "-l") && has_value) {
            ok = set_level(config, argv[++i], result.error);
        } else if (is_option(arg, "--max-body") && has_value) {
            ok = set_size(config.max_body_bytes, "max body", argv[++i], result.error);
        } else if (is_option(arg, "--max-pending") && has_value) {
            ok = set_size(config.max_pending, "max pending", argv[++i], result.error);
        } else if (is_option(arg, "--idle-timeout-ms") && has_value) {
            ok = set_timeout(config, argv[++i], result.error);
        } else {
            result.error = std::string("Unknown option: ") + arg;
            ok = false;
        }

        if (!ok) {
            result.action = ConfigParse::Action::Fail;
            return result;
        }
    }

    return result;
}

const char* transport_name(TransportMode mode) {
    return mode == TransportMode::Http ? "http" : "stdio";
}

void print_usage(const char* prog) {
    std::cerr << ALMANAC_SERVER_NAME << " " << ALMANAC_VERSION
              << " - MCP server over stdio or streamable HTTP\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -t, --transport MODE    stdio or http (default: stdio)\n"
              << "      --host HOST         HTTP bind address (default: 127.0.0.1)\n"
              << "  -p, --port PORT         HTTP port (default: 8080)\n"
              << "  -l, --log-level LEVEL   trace, debug, info, notice, warning, error, critical\n"
              << "      --max-body BYTES    Largest accepted POST body (default: 1048576)\n"
              << "      --max-pending N     Outstanding requests before 503 (0 = unbounded)\n"
              << "      --idle-timeout-ms MS  Per-request wait limit, at most 86400000 (0 = none)\n"
              << "  -v, --version           Show version\n"
              << "  -h, --help              Show this help message\n"
              << "\n"
              << "Environment: ALMANAC_HOST, ALMANAC_PORT, ALMANAC_MAX_BODY,\n"
              << "             ALMANAC_MAX_PENDING, ALMANAC_IDLE_TIMEOUT_MS, ALMANAC_LOG_LEVEL\n";
}

} // namespace almanac
