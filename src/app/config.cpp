#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

#include "app/config.hpp"
#include "util/log.hpp"
#include "util/mac.hpp"

namespace app
{

std::optional<std::uint32_t> parse_uint(const char *s, std::uint32_t lo, std::uint32_t hi)
{
    if (!s || !*s || !std::isdigit(static_cast<unsigned char>(*s)))
        return std::nullopt;
    char *end = nullptr;
    errno     = 0;
    unsigned long v = std::strtoul(s, &end, 10);
    if (errno != 0 || !end || *end != '\0')
        return std::nullopt;
    if (v < lo || v > hi)
        return std::nullopt;
    return static_cast<std::uint32_t>(v);
}

namespace
{

// numeric env override: keep def when unset, warn and keep def when invalid
std::uint32_t env_uint(const char *key, std::uint32_t def, std::uint32_t lo, std::uint32_t hi)
{
    const char *e = std::getenv(key);
    if (!e)
        return def;
    if (auto v = parse_uint(e, lo, hi))
    {
        LOG_INFO("Using %s=%u", key, (unsigned)*v);
        return *v;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect %u..%u)", key, e, (unsigned)lo, (unsigned)hi);
    return def;
}

}  // namespace

BridgeConfig config_from_env()
{
    BridgeConfig cfg;

    if (const char *t = std::getenv("SLIDELINK_TRANSPORT"))
    {
        std::string ts = t;
        std::transform(ts.begin(), ts.end(), ts.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ts == "bluez" || ts == "loopback")
            cfg.transport = ts;
        else
            LOG_WARN("Ignoring unknown SLIDELINK_TRANSPORT='%s' (bluez|loopback)", t);
    }
    if (const char *a = std::getenv("SLIDELINK_ADAPTER"); a && *a)
        cfg.adapter = a;
    if (const char *n = std::getenv("SLIDELINK_NAME_FILTER"); n && *n)
        cfg.name_filter = n;
    if (const char *p = std::getenv("SLIDELINK_PEER"); p && *p)
    {
        std::string m = mac::normalize(p);
        if (mac::is_valid(m))
            cfg.peer_addr = m;
        else
            LOG_WARN("Ignoring invalid SLIDELINK_PEER='%s'", p);
    }

    cfg.threshold = static_cast<std::uint8_t>(
        env_uint("SLIDELINK_THRESHOLD", constants::SENSOR_THRESHOLD, 0, 254));
    cfg.subscribe_ms =
        env_uint("SLIDELINK_SUBSCRIBE_MS", constants::SUBSCRIBE_INTERVAL_MS, 50, 10000);
    cfg.connect_timeout_ms =
        env_uint("SLIDELINK_CONNECT_TIMEOUT_MS", constants::CONNECT_TIMEOUT_MS, 0, 600000);

    if (const char *s = std::getenv("SLIDELINK_CTL_SOCK"); s && *s)
        cfg.ctl_sock = s;

    return cfg;
}

}  // namespace app
