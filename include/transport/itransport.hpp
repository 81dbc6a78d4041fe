#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace transport
{

using Bytes = std::vector<std::uint8_t>;

struct CharacteristicDescriptor
{
    std::string   uuid;
    std::string   name;        // display name, filled from the attribute registry
    std::uint16_t handle{0};   // ATT handle, 0 if the stack does not expose it
};

struct ServiceDescriptor
{
    std::string                           uuid;
    std::string                           name;
    std::vector<CharacteristicDescriptor> characteristics;
};

using ServiceCatalog = std::vector<ServiceDescriptor>;

// GATT-style status codes carried by ServicesDiscovered
inline constexpr int GATT_SUCCESS = 0;
inline constexpr int GATT_FAILURE = 0x101;

enum class EventKind
{
    DeviceFound,                // scan result: address + advertised name
    LinkEstablished,            // link layer reports connected
    LinkLost,                   // link layer reports disconnected (or connect attempt failed)
    ServicesDiscovered,         // status + catalog
    CharacteristicNotification  // uuid + value
};

struct LinkEvent
{
    EventKind      kind{EventKind::LinkLost};
    std::string    address;
    std::string    name;
    int            status{GATT_SUCCESS};
    ServiceCatalog catalog;
    std::string    uuid;
    Bytes          value;

    static LinkEvent device_found(std::string addr, std::string adv_name)
    {
        LinkEvent ev;
        ev.kind    = EventKind::DeviceFound;
        ev.address = std::move(addr);
        ev.name    = std::move(adv_name);
        return ev;
    }
    static LinkEvent link_established()
    {
        LinkEvent ev;
        ev.kind = EventKind::LinkEstablished;
        return ev;
    }
    static LinkEvent link_lost()
    {
        LinkEvent ev;
        ev.kind = EventKind::LinkLost;
        return ev;
    }
    static LinkEvent services_discovered(int st, ServiceCatalog cat)
    {
        LinkEvent ev;
        ev.kind    = EventKind::ServicesDiscovered;
        ev.status  = st;
        ev.catalog = std::move(cat);
        return ev;
    }
    static LinkEvent notification(std::string char_uuid, Bytes data)
    {
        LinkEvent ev;
        ev.kind  = EventKind::CharacteristicNotification;
        ev.uuid  = std::move(char_uuid);
        ev.value = std::move(data);
        return ev;
    }
};

inline const char *event_name(EventKind k)
{
    switch (k)
    {
        case EventKind::DeviceFound:
            return "device_found";
        case EventKind::LinkEstablished:
            return "link_established";
        case EventKind::LinkLost:
            return "link_lost";
        case EventKind::ServicesDiscovered:
            return "services_discovered";
        case EventKind::CharacteristicNotification:
            return "characteristic_notification";
    }
    return "?";
}

using OnEvent = std::function<void(LinkEvent)>;

// Central-side link to one peripheral. Events may be delivered on any thread;
// the receiver must only enqueue them.
struct ITransport
{
    // false => no adapter/radio available
    virtual bool start(OnEvent on_event)                             = 0;
    virtual void stop()                                              = 0;
    virtual bool adapter_available() const                           = 0;
    virtual bool start_scan()                                        = 0;
    virtual void stop_scan()                                         = 0;
    virtual bool connect(const std::string &address)                 = 0;
    virtual void disconnect()                                        = 0;
    virtual bool discover_services()                                 = 0;
    virtual bool enable_notifications(const std::string &char_uuid) = 0;
    virtual std::string name() const { return ""; }
    virtual ~ITransport() = default;
};

}  // namespace transport
