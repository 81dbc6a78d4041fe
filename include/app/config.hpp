#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "util/constants.hpp"

namespace app
{

struct BridgeConfig
{
    std::string                transport     = "loopback";  // "bluez" | "loopback"
    std::string                adapter       = "hci0";
    std::string                name_filter   = std::string(constants::NAME_FILTER);
    std::optional<std::string> peer_addr{};                 // skips scanning when set
    std::uint8_t               threshold     = constants::SENSOR_THRESHOLD;
    std::uint32_t              subscribe_ms  = constants::SUBSCRIBE_INTERVAL_MS;
    std::uint32_t              connect_timeout_ms = constants::CONNECT_TIMEOUT_MS;
    std::string                ctl_sock{};                  // empty => constants::ctl_sock_path()
};

// Reads SLIDELINK_* variables; invalid values are logged and the default kept.
BridgeConfig config_from_env();

// Strict decimal parse into [lo, hi]; nullopt on junk or out of range.
std::optional<std::uint32_t> parse_uint(const char *s, std::uint32_t lo, std::uint32_t hi);

}  // namespace app
