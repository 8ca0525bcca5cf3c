#pragma once

#include <string>

#define ALMANAC_VERSION "1.0.0"
#define ALMANAC_SERVER_NAME "almanac"
#define ALMANAC_MCP_PROTOCOL_VERSION "2024-11-05"

namespace almanac {
namespace version {

// initialize always answers with our revision; a mismatch is only logged
inline bool protocol_supported(const std::string& requested) {
    return requested == ALMANAC_MCP_PROTOCOL_VERSION;
}

} // namespace version
} // namespace almanac
