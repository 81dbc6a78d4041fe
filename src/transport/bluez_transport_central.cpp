/* ======================================================================
 * BlueZ Central - normal path
 *
 *  Link actor / subscriber           Bus thread                  BlueZ/DBus           Band (Peripheral)
 *  -----------------------           ----------                  ----------           -----------------
 *  start()
 *    └─ open system bus, match signals ──────────────────────────────────────────▶  InterfacesAdded / PropertiesChanged
 *    └─ spawn bus loop
 *  adapter_available() ─────────────────────────────────────────────────────────▶  Adapter1.Powered
 *  start_scan()
 *    └─ set_discovery_filter ───────────────────────────────────────────────────▶  Adapter.SetDiscoveryFilter (le)
 *    └─ start_discovery ────────────────────────────────────────────────────────▶  Adapter.StartDiscovery
 *    └─ cold_scan (cache) ──────────────────────────────────────────────────────▶  ObjectManager.GetManagedObjects
 *                                      ◀── InterfacesAdded / Name changes: DeviceFound
 *  connect(addr)
 *    └─ stop_discovery, Device1.Connect (async) ────────────────────────────────▶
 *                                      ◀── on_connect_reply / Connected=true: LinkEstablished
 *  discover_services()  (catalog owed)
 *                                      ◀── ServicesResolved=true
 *                                      central_pump(): GetManagedObjects walk → ServicesDiscovered
 *  enable_notifications(uuid) ──────────────────────────────────────────────────▶  GattCharacteristic1.StartNotify (async)
 *                                      ◀── on_start_notify_reply: log only, subscriber retries
 *                                      ◀────────── Value changes: CharacteristicNotification
 *  disconnect() ────────────────────────────────────────────────────────────────▶  Device1.Disconnect
 *                                      ◀── Connected=false / InterfacesRemoved: LinkLost
 *
 *  DBus calls on caller threads are under impl_->bus_mu
 * ====================================================================== */

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

// clang-format off
#include "transport/bluez_transport.hpp"
#include "transport/bluez_transport_impl.hpp"
#include "util/log.hpp"
#include "transport/bluez_dbus_util.hpp"
// clang-format on

#if SLIDELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "transport/bluez_helper_central.hpp"
namespace
{

// ======================================================================
// Function: adapter_start_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true if StartDiscovery succeeds and discovery_on becomes true
// - Note: safe to call repeatedly, only starts when off
// ======================================================================
static bool adapter_start_discovery_locked(sd_bus            *bus,
                                           const std::string &adapter_path,
                                           std::atomic_bool  &discovery_on)
{
    if (!bus)
        return false;
    if (discovery_on.load())
        return true;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StartDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::string(err.name) == "org.bluez.Error.InProgress")
        {
            discovery_on.store(true);
            LOG_INFO("[BLUEZ][central] StartDiscovery already in progress on %s",
                     adapter_path.c_str());
            sd_bus_error_free(&err);
            return true;
        }
        LOG_WARN("[BLUEZ][central] StartDiscovery failed: %s",
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    discovery_on.store(true);
    LOG_SYSTEM("[BLUEZ][central] StartDiscovery OK on %s", adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: adapter_stop_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true if StopDiscovery succeeds or already off
// - Note: clears discovery_on even if StopDiscovery fails
// ======================================================================
static bool adapter_stop_discovery_locked(sd_bus            *bus,
                                          const std::string &adapter_path,
                                          std::atomic_bool  &discovery_on)
{
    if (!bus)
        return false;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    discovery_on.store(false);
    if (r < 0)
    {
        // usually "not discovering"; the flag is off either way
        LOG_WARN("[BLUEZ][central] StopDiscovery failed (treat as off): %s",
                 err.message ? err.message : strerror(-r));
    }
    else
    {
        LOG_INFO("[BLUEZ][central] StopDiscovery OK");
    }
    sd_bus_error_free(&err);
    return true;
}

// Properties of one GattService1 / GattCharacteristic1 interface
struct GattProps
{
    std::string uuid;
    std::string service;  // characteristics only
    uint16_t    handle = 0;
};

// ======================================================================
// Function: read_gatt_props
// - In: m positioned before an a{sv} property array
// - Out: UUID, Handle and Service copied into out, other keys skipped
// ======================================================================
static int read_gatt_props(sd_bus_message *m, GattProps &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;
        if (key && std::strcmp(key, "UUID") == 0)
            r = read_var_s(m, out.uuid);
        else if (key && std::strcmp(key, "Handle") == 0)
            r = read_var_q(m, out.handle);
        else if (key && std::strcmp(key, "Service") == 0)
            r = read_var_o(m, out.service);
        else
            r = sd_bus_message_skip(m, "v");
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;  // dict-entry
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);  // a{sv}
}

}  // namespace
#endif

namespace transport
{

// ======================================================================
// Function: BluezTransport::central_set_discovery_filter
// - In: bus valid, sets Adapter1.SetDiscoveryFilter to LE without duplicates
// - Out: true on success
// - Note: no UUID filter, the band is matched by its advertised name
// ======================================================================
bool BluezTransport::central_set_discovery_filter()
{
#if !SLIDELINK_HAVE_SDBUS
    return false;
#else
    if (!impl_ || !impl_->bus)
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);

    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int             r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez",
                                                       impl_->adapter_path.c_str(), "org.bluez.Adapter1",
                                                       "SetDiscoveryFilter");
    if (r < 0)
        goto out;

    // a{sv}
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    // Transport="le"
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "s", "Transport");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "v", "s", "le");
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // dict
    if (r < 0)
        goto out;
    // DuplicateData=false
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "s", "DuplicateData");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "v", "b", 0);
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // dict
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
        goto out;

    r = sd_bus_call(impl_->bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] SetDiscoveryFilter failed: %s",
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ][central] SetDiscoveryFilter OK (Transport=le)");
    return true;
#endif
}

// ======================================================================
// Function: BluezTransport::adapter_available
// - In: bus open
// - Out: true when the configured adapter exists and is powered
// ======================================================================
bool BluezTransport::adapter_available() const
{
#if !SLIDELINK_HAVE_SDBUS
    return false;
#else
    if (!impl_ || !impl_->bus)
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    sd_bus_error err{};
    int          powered = 0;
    int r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                        "org.bluez.Adapter1", "Powered", &err, 'b', &powered);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] adapter %s not reachable: %s", impl_->adapter_path.c_str(),
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    if (!powered)
        LOG_WARN("[BLUEZ][central] adapter %s is powered off", impl_->adapter_path.c_str());
    return powered != 0;
#endif
}

// ======================================================================
// Function: BluezTransport::start_scan
// - In: bus open
// - Out: true when discovery runs; cached devices are reported right away
// ======================================================================
bool BluezTransport::start_scan()
{
#if !SLIDELINK_HAVE_SDBUS
    return false;
#else
    if (!impl_ || !impl_->bus)
        return false;

    (void)central_set_discovery_filter();  // a failed filter only means noisier results
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (!adapter_start_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on))
            return false;
        impl_->scanning.store(true);
    }
    if (!central_cold_scan())
        LOG_INFO("[BLUEZ][central] cold scan failed; waiting for InterfacesAdded");
    return true;
#endif
}

void BluezTransport::stop_scan()
{
#if SLIDELINK_HAVE_SDBUS
    if (!impl_ || !impl_->bus)
        return;
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    impl_->scanning.store(false);
    if (impl_->discovery_on.load())
        (void)adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
#endif
}

// ======================================================================
// Function: BluezTransport::connect
// - In: address "AA:BB:CC:DD:EE:FF"
// - Out: true after Device1.Connect is submitted
// - Note: the outcome arrives as LinkEstablished or LinkLost
// ======================================================================
bool BluezTransport::connect(const std::string &address)
{
#if !SLIDELINK_HAVE_SDBUS
    (void)address;
    return false;
#else
    if (!impl_ || !impl_->bus || address.empty())
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    // Stop active discovery before connecting to avoid object churn/aborts.
    impl_->scanning.store(false);
    if (impl_->discovery_on.load())
        (void)adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);

    unref_slot(impl_->connect_call_slot);
    unref_slot(impl_->notify_call_slot);
    impl_->notify_inflight.store(false);
    impl_->dev_path = dev_path_for(impl_->adapter_path, address);
    impl_->dev_addr = address;
    impl_->connected.store(false);
    impl_->services_resolved.store(false);
    impl_->discover_requested.store(false);
    impl_->char_paths.clear();
    impl_->path_uuids.clear();

    int r = sd_bus_call_method_async(impl_->bus, &impl_->connect_call_slot, "org.bluez",
                                     impl_->dev_path.c_str(), "org.bluez.Device1", "Connect",
                                     bluez_on_connect_reply, this, "");
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] submit Connect() to %s failed: %s", address.c_str(),
                  strerror(-r));
        impl_->dev_path.clear();
        impl_->dev_addr.clear();
        return false;
    }
    impl_->connect_inflight.store(true);
    LOG_DEBUG("[BLUEZ][central] Connect() submitted to %s", impl_->dev_path.c_str());
    return true;
#endif
}

// ======================================================================
// Function: BluezTransport::disconnect
// - In: any state
// - Out: pending Connect dropped, Device1.Disconnect sent, device forgotten
// - Note: no LinkLost is raised for a requested disconnect
// ======================================================================
void BluezTransport::disconnect()
{
#if SLIDELINK_HAVE_SDBUS
    if (!impl_ || !impl_->bus)
        return;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->connect_inflight.load())
    {
        unref_slot(impl_->connect_call_slot);
        impl_->connect_inflight.store(false);
    }
    unref_slot(impl_->notify_call_slot);
    impl_->notify_inflight.store(false);
    if (!impl_->dev_path.empty())
    {
        sd_bus_error    derr{};
        sd_bus_message *drep = nullptr;
        int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->dev_path.c_str(),
                                   "org.bluez.Device1", "Disconnect", &derr, &drep, "");
        if (drep)
            sd_bus_message_unref(drep);
        if (r < 0)
            LOG_INFO("[BLUEZ][central] Disconnect %s: %s", impl_->dev_path.c_str(),
                     derr.message ? derr.message : strerror(-r));
        sd_bus_error_free(&derr);
        LOG_INFO("[BLUEZ][central] link to %s dropped", impl_->dev_addr.c_str());
    }
    impl_->dev_path.clear();
    impl_->dev_addr.clear();
    impl_->connected.store(false);
    impl_->services_resolved.store(false);
    impl_->discover_requested.store(false);
    impl_->char_paths.clear();
    impl_->path_uuids.clear();
#endif
}

// ======================================================================
// Function: BluezTransport::discover_services
// - In: connected
// - Out: true when a catalog is owed; it is delivered by central_pump()
//        once BlueZ reports ServicesResolved
// ======================================================================
bool BluezTransport::discover_services()
{
    if (!impl_ || !impl_->connected.load())
        return false;
    impl_->discover_requested.store(true);
    LOG_DEBUG("[BLUEZ][central] catalog requested (resolved=%d)",
              (int)impl_->services_resolved.load());
    return true;
}

// ======================================================================
// Function: BluezTransport::enable_notifications
// - In: characteristic UUID from the delivered catalog
// - Out: true once StartNotify is submitted or still pending
// - Note: never waits for the reply; the subscriber thread must stay
//         stoppable within one retry interval
// ======================================================================
bool BluezTransport::enable_notifications(const std::string &char_uuid)
{
#if !SLIDELINK_HAVE_SDBUS
    (void)char_uuid;
    return false;
#else
    if (!impl_ || !impl_->bus || !impl_->connected.load())
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    auto it = impl_->char_paths.find(lower(char_uuid));
    if (it == impl_->char_paths.end())
    {
        LOG_WARN("[BLUEZ][central] no characteristic %s on %s", char_uuid.c_str(),
                 impl_->dev_path.c_str());
        return false;
    }
    if (impl_->notify_inflight.load())
        return true;  // previous request not answered yet

    unref_slot(impl_->notify_call_slot);
    int r = sd_bus_call_method_async(impl_->bus, &impl_->notify_call_slot, "org.bluez",
                                     it->second.c_str(), "org.bluez.GattCharacteristic1",
                                     "StartNotify", bluez_on_start_notify_reply, this, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] submit StartNotify on %s failed: %s", it->second.c_str(),
                 strerror(-r));
        return false;
    }
    impl_->notify_inflight.store(true);
    LOG_DEBUG("[BLUEZ][central] StartNotify submitted on %s", it->second.c_str());
    return true;
#endif
}

// ======================================================================
// Function: BluezTransport::central_cold_scan
// - In: bus open, scanning set
// - Out: true if the walk succeeds; cached named devices are queued as DeviceFound
// - Note: does not start active discovery
// ======================================================================
bool BluezTransport::central_cold_scan()
{
#if !SLIDELINK_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] GetManagedObjects failed: %s",
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    const std::string dev_prefix = impl_->adapter_path + "/dev_";

    // Walk a{oa{sa{sv}}}
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    // =========================
    // Hierarchy:
    // Object path (o)
    // |- Interfaces (a{sa{sv}})
    //     |- Properties ({sv})
    // =========================
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto out;
        if (!obj)
        {
            r = -EINVAL;
            goto out;
        }

        std::string path(obj);
        if (path.rfind(dev_prefix, 0) != 0 || mac_from_path(path).empty())
        {
            // only /org/bluez/<adapter>/dev_* device objects
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
            continue;
        }

        std::string addr, name;
        int16_t     rssi      = 0;
        bool        have_rssi = false;

        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto out;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                goto out;

            if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
            {
                if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
                    goto out;
                // --- Device1 props: Address (s), Name (s), RSSI (n)
                while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sv")) >
                       0)
                {
                    const char *key = nullptr;
                    if ((r = sd_bus_message_read(reply, "s", &key)) < 0)
                        goto out;
                    if (key && std::strcmp(key, "Address") == 0)
                        r = read_var_s(reply, addr);
                    else if (key && std::strcmp(key, "Name") == 0)
                        r = read_var_s(reply, name);
                    else if (key && std::strcmp(key, "RSSI") == 0)
                    {
                        r         = read_var_i16(reply, rssi);
                        have_rssi = true;
                    }
                    else
                        r = sd_bus_message_skip(reply, "v");
                    if (r < 0)
                        goto out;
                    if ((r = sd_bus_message_exit_container(reply)) < 0)
                        goto out;  // dict-entry
                }
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    goto out;  // exit a{sv}
            }
            else
            {
                // skip other interfaces
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    goto out;
            }

            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;  // {sa{sv}} dict-entry
        }
        if (r < 0)
            goto out;

        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // {oa{sa{sv}}}

        if (have_rssi)
            LOG_DEBUG("[BLUEZ][central] cold-scan %s name='%s' rssi=%d", path.c_str(),
                      name.c_str(), (int)rssi);
        note_device(path, addr, name);
    }

out:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    return r >= 0;
#endif
}

// ======================================================================
// Function: BluezTransport::central_build_catalog
// - In: bus_mu locked, dev_path set and services resolved
// - Out: services and characteristics exported below dev_path; also rebuilds
//        the uuid <-> path maps used by enable_notifications / note_value
// - Note: services ordered by object path, characteristics by handle
// ======================================================================
bool BluezTransport::central_build_catalog(ServiceCatalog &out)
{
#if !SLIDELINK_HAVE_SDBUS
    (void)out;
    return false;
#else
    out.clear();
    if (!impl_->bus || impl_->dev_path.empty())
        return false;

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] GetManagedObjects failed: %s",
                 err.message ? err.message : strerror(-r));
        if (reply)
            sd_bus_message_unref(reply);
        sd_bus_error_free(&err);
        return false;
    }

    std::map<std::string, GattProps>              services;  // path -> props
    std::vector<std::pair<std::string, GattProps>> chars;    // (path, props)
    const std::string                               dev_prefix = impl_->dev_path + "/";

    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto done;
    // --- Objects
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            break;
        if (!obj)
        {
            r = -EINVAL;
            break;
        }

        std::string path(obj);
        // Only consider objects under our device path
        if (path.rfind(dev_prefix, 0) != 0)
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                break;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                break;
            continue;
        }

        // --- Interfaces
        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            break;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                break;
            if (iface && std::strcmp(iface, "org.bluez.GattService1") == 0)
            {
                GattProps p;
                if ((r = read_gatt_props(reply, p)) < 0)
                    break;
                services[path] = p;
            }
            else if (iface && std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0)
            {
                GattProps p;
                if ((r = read_gatt_props(reply, p)) < 0)
                    break;
                chars.emplace_back(path, p);
            }
            else
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    break;
            }
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                break;  // {sa{sv}} dict-entry
        }

        if (r < 0)
            break;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;  // {oa{sa{sv}}}
    }

done:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][central] GATT object walk failed: %s", strerror(-r));
        return false;
    }

    std::sort(chars.begin(), chars.end(),
              [](const auto &a, const auto &b) { return a.second.handle < b.second.handle; });

    impl_->char_paths.clear();
    impl_->path_uuids.clear();
    std::map<std::string, size_t> index;  // service path -> position in out
    for (const auto &kv : services)
    {
        ServiceDescriptor sd;
        sd.uuid = lower(kv.second.uuid);
        index[kv.first] = out.size();
        out.push_back(std::move(sd));
    }
    for (const auto &c : chars)
    {
        auto it = index.find(c.second.service);
        if (it == index.end())
        {
            LOG_DEBUG("[BLUEZ][central] characteristic %s without a known service", c.first.c_str());
            continue;
        }
        CharacteristicDescriptor cd;
        cd.uuid   = lower(c.second.uuid);
        cd.handle = c.second.handle;
        out[it->second].characteristics.push_back(cd);
        impl_->char_paths[cd.uuid] = c.first;
        impl_->path_uuids[c.first] = cd.uuid;
    }

    LOG_INFO("[BLUEZ][central] GATT discovered: %zu services, %zu characteristics", out.size(),
             impl_->char_paths.size());
    return true;
#endif
}

// ======================================================================
// Function: BluezTransport::central_pump
// - In: bus thread, bus_mu not held
// - Out: delivers an owed catalog once services are resolved
// - Note: polls ServicesResolved while a catalog is owed
// ======================================================================
void BluezTransport::central_pump()
{
#if SLIDELINK_HAVE_SDBUS
    if (!impl_->discover_requested.load() || !impl_->connected.load())
        return;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->services_resolved.load())
    {
        // an already-resolved device sends no ServicesResolved change; ask directly
        sd_bus_error err{};
        int          resolved = 0;
        int r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", impl_->dev_path.c_str(),
                                            "org.bluez.Device1", "ServicesResolved", &err, 'b',
                                            &resolved);
        sd_bus_error_free(&err);
        if (r < 0 || !resolved)
            return;
        impl_->services_resolved.store(true);
    }
    if (!impl_->discover_requested.exchange(false))
        return;  // a disconnect() raced us

    ServiceCatalog cat;
    if (central_build_catalog(cat))
        queue_event(LinkEvent::services_discovered(GATT_SUCCESS, std::move(cat)));
    else
        queue_event(LinkEvent::services_discovered(GATT_FAILURE, {}));
#endif
}

// ======================================================================
// Function: BluezTransport::start_central
// - In: clean Impl
// - Out: system bus open, signal matches installed, bus loop running
// ======================================================================
bool BluezTransport::start_central()
{
#if !SLIDELINK_HAVE_SDBUS
    LOG_ERROR("[BLUEZ][central] sd-bus not available (SLIDELINK_HAVE_SDBUS=0)");
    return false;
#else
    // connect system bus
    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ][central] failed to connect system bus: %s", strerror(-r));
        return false;
    }

    // adapter path + unique name
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
    const char *name = nullptr;
    if (sd_bus_get_unique_name(impl_->bus, &name) >= 0 && name)
        impl_->unique_name = name;

    // subscribe signals (iface added/removed)
    r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                            bluez_on_iface_added, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] subscribe to InterfacesAdded failed: %s", strerror(-r));
        return false;
    }
    r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                            bluez_on_iface_removed, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] subscribe to InterfacesRemoved failed: %s", strerror(-r));
        return false;
    }
    // PropertiesChanged (Device1.Connected / ServicesResolved / Name, GattCharacteristic1.Value)
    r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                            "org.freedesktop.DBus.Properties", "PropertiesChanged",
                            bluez_on_props_changed, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][central] subscribe to PropertiesChanged failed: %s", strerror(-r));
        return false;
    }
    LOG_INFO("[BLUEZ][central] bus %s ready on %s", impl_->unique_name.c_str(),
             impl_->adapter_path.c_str());

    running_.store(true, std::memory_order_relaxed);
    const uint64_t wait_usec = (uint64_t)cfg_.bus_wait_ms * 1000;
    impl_->loop              = std::thread([this, wait_usec] {
        while (running_.load(std::memory_order_relaxed))
        {
            {
                std::lock_guard<std::mutex> lk(impl_->bus_mu);
                while (1)
                {
                    int pr = sd_bus_process(impl_->bus, nullptr);
                    if (pr <= 0)
                        break;
                }
            }
            // do not hold the lock while waiting, callers need bus_mu for their calls
            sd_bus_wait(impl_->bus, wait_usec);
            central_pump();
            flush_events();
        }
    });

    return true;
#endif
}

// ======================================================================
// Function: BluezTransport::stop_central
// - In: running_ already cleared; may be called after a partial start
// - Out: tears down matches and threads, discovery is turned off
// - Note: joins the bus loop thread outside of locks
// ======================================================================
void BluezTransport::stop_central()
{
    // clang-format off
#if SLIDELINK_HAVE_SDBUS
    running_.store(false, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        unref_slot(impl_->connect_call_slot);
        unref_slot(impl_->notify_call_slot);
        // Disconnect active device (best-effort)
        if (impl_->bus && !impl_->dev_path.empty()) {
            sd_bus_error    derr{};
            sd_bus_message *drep = nullptr;
            (void)sd_bus_call_method(impl_->bus, "org.bluez", impl_->dev_path.c_str(),
                                     "org.bluez.Device1", "Disconnect", &derr, &drep, "");
            if (drep) sd_bus_message_unref(drep);
            sd_bus_error_free(&derr);
        }
        if (impl_->bus && impl_->discovery_on.load())
            (void)adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path,
                                                impl_->discovery_on);
        // Wake the event loop thread if it's in sd_bus_wait()
        if (impl_->bus)
            sd_bus_close(impl_->bus);
    }

    // Join OUTSIDE of the mutex to avoid deadlocks with the loop thread.
    if (impl_->loop.joinable())
        impl_->loop.join();

    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->props_slot);

    impl_->connect_inflight.store(false);
    impl_->notify_inflight.store(false);
    impl_->connected.store(false);
    impl_->scanning.store(false);
    impl_->pending.clear();

    if (impl_->bus) {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
    // clang-format on
#endif
}

}  // namespace transport
