// include/transport/bluez_dbus_util.hpp
#pragma once
#include "transport/bluez_transport.hpp"

#include <cctype>
#include <cstdint>
#include <string>

#if SLIDELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

static inline std::string lower(std::string s)
{
    for (auto &c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF" ("" when not a device path)
[[maybe_unused]] static inline std::string mac_from_path(const std::string &obj_path)
{
    auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return {};
    std::string tail = obj_path.substr(pos + 5);
    if (tail.find('/') != std::string::npos)
        return {};  // a child object (service/char) of the device
    for (auto &c : tail)
        c = (c == '_') ? ':' : (char)std::toupper((unsigned char)c);
    return tail;
}

// inverse of mac_from_path under adapter_path
[[maybe_unused]] static inline std::string dev_path_for(const std::string &adapter_path,
                                                        const std::string &mac)
{
    std::string tail = mac;
    for (auto &c : tail)
        c = (c == ':') ? '_' : (char)std::toupper((unsigned char)c);
    return adapter_path + "/dev_" + tail;
}

#if SLIDELINK_HAVE_SDBUS
[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::string &out)
{
    // read variant "s"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "s", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_o(sd_bus_message *m, std::string &out)
{
    // read variant "o" (object path)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "o");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "o", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b = 0;
    r     = sd_bus_message_read(m, "b", &b);
    out   = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_q(sd_bus_message *m, uint16_t &out)
{
    // read variant "q" (uint16, GATT handle)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "q");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "q", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}
#endif
