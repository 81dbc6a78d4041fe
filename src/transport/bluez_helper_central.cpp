// src/transport/bluez_helper_central.cpp
#include "transport/bluez_transport.hpp"
#include "transport/bluez_helper_central.hpp"
#include "transport/bluez_dbus_util.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>

#include "util/log.hpp"

#if SLIDELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace transport
{

// Callbacks run on the bus thread with bus_mu held; they only record state and queue
// events through the note_*() methods.

int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<transport::BluezTransport *>(userdata);
    if (!self->is_running())
        return 0;

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    const std::string obj_path(obj);
    const std::string prefix = self->adapter_path() + "/dev_";
    if (obj_path.rfind(prefix, 0) != 0 || mac_from_path(obj_path).empty())
        return 0;  // services/characteristics of some device, or another adapter

    std::string addr, name;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;

        if (iface && strcmp(iface, "org.bluez.Device1") == 0)
        {
            if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
                return r;

            while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
            {
                const char *key = nullptr;
                if ((r = sd_bus_message_read(m, "s", &key)) < 0)
                    return r;

                if (key && strcmp(key, "Address") == 0)
                    r = read_var_s(m, addr);
                else if (key && strcmp(key, "Name") == 0)
                    r = read_var_s(m, name);
                else
                    r = sd_bus_message_skip(m, "v");
                if (r < 0)
                    return r;

                if ((r = sd_bus_message_exit_container(m)) < 0)
                    return r;
            }
            if ((r = sd_bus_message_exit_container(m)) < 0)
                return r;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
                return r;
        }

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    self->note_device(obj_path, addr, name);
    return 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<transport::BluezTransport *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;
    r = sd_bus_message_skip(m, "as");
    if (r < 0)
        return r;

    if (self->is_running())
        self->note_device_removed(obj);
    return 0;
}

// ======================================================================
// Function: bluez_on_props_changed
// - In: PropertiesChanged(s iface, a{sv} changed, as invalidated) from org.bluez
// - Out: Device1 Name (scan), Connected / ServicesResolved (our device) and
//        GattCharacteristic1 Value (notifications) are forwarded
// ======================================================================
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto *self = static_cast<transport::BluezTransport *>(userdata);
    if (!self->is_running())
        return 0;

    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;

    const bool is_device = iface && strcmp(iface, "org.bluez.Device1") == 0;
    const bool is_char   = iface && strcmp(iface, "org.bluez.GattCharacteristic1") == 0;
    if (!is_device && !is_char)
        return 0;

    bool services_resolved_hit = false;
    bool services_resolved_val = false;
    bool connected_hit         = false;
    bool connected_val         = false;
    bool name_hit              = false;
    std::string name;

    bool        value_hit = false;
    const void *val_buf   = nullptr;
    size_t      val_len   = 0;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;

    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        r               = sd_bus_message_read(m, "s", &key);
        if (r < 0)
            return r;

        if (is_device && key && strcmp(key, "ServicesResolved") == 0)
        {
            r                     = read_var_b(m, services_resolved_val);
            services_resolved_hit = true;
        }
        else if (is_device && key && strcmp(key, "Connected") == 0)
        {
            r             = read_var_b(m, connected_val);
            connected_hit = true;
        }
        else if (is_device && key && strcmp(key, "Name") == 0)
        {
            r        = read_var_s(m, name);
            name_hit = true;
        }
        else if (is_char && key && strcmp(key, "Value") == 0)
        {
            r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
            if (r < 0)
                return r;
            r = sd_bus_message_read_array(m, 'y', &val_buf, &val_len);
            if (r < 0)
                return r;
            value_hit = true;
            r         = sd_bus_message_exit_container(m);
        }
        else
        {
            r = sd_bus_message_skip(m, "v");
        }
        if (r < 0)
            return r;
        r = sd_bus_message_exit_container(m);
        if (r < 0)
            return r;
    }
    if (r < 0)
        return r;
    r = sd_bus_message_exit_container(m);
    if (r < 0)
        return r;

    r = sd_bus_message_skip(m, "as");
    if (r < 0)
        return r;

    const char *p = sd_bus_message_get_path(m);
    if (!p)
        return 0;
    const std::string path(p);

    if (name_hit)
        self->note_device(path, mac_from_path(path), name);

    const bool ours = !self->dev_path().empty() && self->dev_path() == path;
    if (ours && connected_hit)
        self->note_connected(connected_val, "Connected property");
    if (ours && services_resolved_hit)
        self->note_services_resolved(services_resolved_val);

    if (value_hit && !self->dev_path().empty() &&
        path.rfind(self->dev_path() + "/", 0) == 0)
    {
        self->note_value(path, static_cast<const uint8_t *>(val_buf), val_len);
    }
    return 0;
}

int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<transport::BluezTransport *>(userdata);
    if (!self->is_running())
        return 1;

    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e     = sd_bus_message_get_error(m);
        const char         *ename = (e && e->name) ? e->name : "unknown";
        const char         *emsg  = (e && e->message) ? e->message : "no message";
        self->note_connect_reply(false, ename, emsg);
        return 1;
    }

    self->note_connect_reply(true, "", "");
    return 1;
}

int bluez_on_start_notify_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<transport::BluezTransport *>(userdata);
    if (!self->is_running())
        return 1;

    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e = sd_bus_message_get_error(m);
        self->note_start_notify_reply(false, (e && e->name) ? e->name : "",
                                      (e && e->message) ? e->message : "");
        return 1;
    }

    self->note_start_notify_reply(true, "", "");
    return 1;
}

}  // namespace transport

#endif
