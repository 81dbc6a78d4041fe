/* ======================================================================
 * BlueZ Transport (facade) - overall flow
 *
 *  Link actor / subscriber                 Transport (facade)                  Bus thread
 *  -----------------------                 ------------------                  ----------
 *  start(on_event)
 *    └─ store callback, create Impl ──────────────────────────────────────────▶  start_central()
 *
 *  start_scan / connect / discover_services / enable_notifications / disconnect
 *    └─ DBus calls under impl_->bus_mu (see bluez_transport_central.cpp)
 *
 *                                                                  sd_bus_process (bus_mu held)
 *                                            note_*() ◀──────────── bluez_on_* callbacks
 *                                              └─ queue_event(ev) → impl_->pending
 *                                                                  central_pump(): owed catalog
 *                                                                  flush_events() (bus_mu released)
 *    on_event(ev) ◀──────────────────────────────────────────────────┘
 *
 *  stop()
 *    └─ stop_central(): Disconnect, StopDiscovery, close bus, join loop
 *
 *  Notes
 *    └─ on_event never runs with bus_mu held, so the receiver may call back into us
 * ====================================================================== */

#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// clang-format off
#include "transport/bluez_transport.hpp"
#include "transport/bluez_transport_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "transport/itransport.hpp"
#include "util/log.hpp"
// clang-format on

namespace transport
{
BluezTransport::BluezTransport(BluezConfig cfg) : cfg_(std::move(cfg)) {}

BluezTransport::~BluezTransport()
{
    stop();
}

// ============== Impl accessors ==============
const std::string &BluezTransport::adapter_path() const
{
    return impl_->adapter_path;
}
const std::string &BluezTransport::dev_path() const
{
    return impl_->dev_path;
}
bool BluezTransport::scanning() const
{
    return impl_ && impl_->scanning.load();
}
// ============= End of Impl accessors =============

std::string BluezTransport::name() const
{
    return "bluez";
}

void BluezTransport::queue_event(LinkEvent ev)
{
    LOG_DEBUG("[BLUEZ] queue %s", event_name(ev.kind));
    impl_->pending.push_back(std::move(ev));
}

void BluezTransport::flush_events()
{
    std::vector<LinkEvent> batch;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        batch.swap(impl_->pending);
    }
    if (!on_event_)
        return;
    for (auto &ev : batch)
        on_event_(std::move(ev));
}

// ======================================================================
// Function: BluezTransport::note_device
// - In: device object path, Address and Name as BlueZ reports them
// - Out: queues DeviceFound while a scan is active
// - Note: nameless devices are skipped, the locator matches on names only
// ======================================================================
void BluezTransport::note_device(const std::string &path,
                                 const std::string &addr,
                                 const std::string &name)
{
    if (!scanning() || name.empty())
        return;
    // derive from path when the Address property was not part of the signal
    std::string a = addr.empty() ? mac_from_path(path) : addr;
    if (a.empty())
        return;
    LOG_DEBUG("[BLUEZ][central] seen %s name='%s'", a.c_str(), name.c_str());
    queue_event(LinkEvent::device_found(a, name));
}

// ======================================================================
// Function: BluezTransport::note_connected
// - In: Device1.Connected transitions for our device
// - Out: LinkEstablished on the first up edge, LinkLost on the down edge
// ======================================================================
void BluezTransport::note_connected(bool up, const char *why)
{
    if (up)
    {
        if (!impl_->connected.exchange(true))
        {
            LOG_SYSTEM("[BLUEZ][central] Device connected: %s (%s)", impl_->dev_path.c_str(), why);
            queue_event(LinkEvent::link_established());
        }
        return;
    }
    if (impl_->connected.exchange(false))
    {
        impl_->services_resolved.store(false);
        impl_->discover_requested.store(false);
        impl_->char_paths.clear();
        impl_->path_uuids.clear();
        LOG_SYSTEM("[BLUEZ][central] Disconnected (%s): %s", impl_->dev_path.c_str(), why);
        queue_event(LinkEvent::link_lost());
    }
}

void BluezTransport::note_connect_reply(bool ok, const char *ename, const char *emsg)
{
    impl_->connect_inflight.store(false);
    if (ok)
    {
        note_connected(true, "Connect() reply");
        return;
    }
    LOG_ERROR("[BLUEZ][central] Device1.Connect failed: %s: %s", ename, emsg);
    if (impl_->connected.load())
    {
        note_connected(false, "Connect() error");
        return;
    }
    // never came up; report the failed attempt as a lost link
    queue_event(LinkEvent::link_lost());
}

// ======================================================================
// Function: BluezTransport::note_start_notify_reply
// - In: bus thread, bus_mu held, reply to the async StartNotify
// - Out: inflight cleared; failures are only logged, the subscriber retries
// ======================================================================
void BluezTransport::note_start_notify_reply(bool ok, const char *ename, const char *emsg)
{
    impl_->notify_inflight.store(false);
    if (ok)
    {
        LOG_SYSTEM("[BLUEZ][central] StartNotify OK on %s", impl_->dev_path.c_str());
        return;
    }
    const bool transient = std::strstr(emsg, "ATT error: 0x0e") != nullptr ||  // CCCD race
                           std::strcmp(ename, "org.freedesktop.DBus.Error.NoReply") == 0 ||
                           std::strcmp(ename, "org.bluez.Error.InProgress") == 0;
    if (transient)
        LOG_INFO("[BLUEZ][central] StartNotify transient failure (%s)", *emsg ? emsg : ename);
    else
        LOG_WARN("[BLUEZ][central] StartNotify failed: %s: %s", ename, emsg);
}

void BluezTransport::note_services_resolved(bool v)
{
    impl_->services_resolved.store(v);
    LOG_SYSTEM("[BLUEZ][central] ServicesResolved=%s on %s", v ? "true" : "false",
               impl_->dev_path.c_str());
}

// ======================================================================
// Function: BluezTransport::note_value
// - In: GattCharacteristic1.Value change below our device
// - Out: queues CharacteristicNotification tagged with the characteristic UUID
// - Note: paths outside the last catalog walk are dropped
// ======================================================================
void BluezTransport::note_value(const std::string &path, const std::uint8_t *data, std::size_t len)
{
    auto it = impl_->path_uuids.find(path);
    if (it == impl_->path_uuids.end())
    {
        LOG_DEBUG("[BLUEZ][central] value on unknown path %s len=%zu", path.c_str(), len);
        return;
    }
    Bytes v(data, data + len);
    LOG_DEBUG("[BLUEZ][central] notify on %s len=%zu", path.c_str(), len);
    queue_event(LinkEvent::notification(it->second, std::move(v)));
}

void BluezTransport::note_device_removed(const std::string &path)
{
    if (impl_->dev_path.empty() || impl_->dev_path != path)
        return;
    note_connected(false, "InterfacesRemoved");
}

// ======================================================================
// Function: BluezTransport::start
// - In: event sink
// - Out: true once the system bus is open and the bus loop runs
// - Note: adapter presence is checked separately (adapter_available)
// ======================================================================
bool BluezTransport::start(OnEvent on_event)
{
    if (running_.load(std::memory_order_relaxed))
        return true;

    on_event_ = std::move(on_event);
    if (!impl_)
        impl_ = std::make_unique<Impl>();

    LOG_DEBUG("[BLUEZ] start: adapter=%s", cfg_.adapter.c_str());

    bool ok = start_central();
    if (!ok)
    {
        stop_central();
        impl_.reset();
    }
    return ok;
}

// ======================================================================
// Function: BluezTransport::stop
// - In: can be called anytime
// - Out: tears down the central path and the Impl
// ======================================================================
void BluezTransport::stop()
{
    if (!running_.exchange(false, std::memory_order_relaxed))
        return;

    if (!impl_)
        return;

    stop_central();

    LOG_DEBUG("[BLUEZ] stopped");
    impl_.reset();
}

}  // namespace transport
