#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Sensor band GATT identifiers
inline constexpr std::string_view SENSOR_UUID = "43680201-4d74-1001-726b-526f64696f6e";  // Notify
inline constexpr std::string_view CCCD_UUID   = "00002902-0000-1000-8000-00805f9b34fb";

// Advertised-name substring of the band
inline constexpr std::string_view NAME_FILTER = "FEST-X";

// Classifier / link defaults
inline constexpr std::uint8_t  SENSOR_THRESHOLD      = 100;
inline constexpr std::uint32_t SUBSCRIBE_INTERVAL_MS = 500;
inline constexpr std::uint32_t CONNECT_TIMEOUT_MS    = 10000;  // 0 disables the deadline

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("SLIDELINK_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/slidelink/ctl.sock";
    LOG_SYSTEM("Control socket at %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
