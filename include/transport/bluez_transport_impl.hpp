// include/transport/bluez_transport_impl.hpp
#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct sd_bus;
struct sd_bus_slot;

#include "transport/bluez_transport.hpp"

namespace transport
{
struct BluezTransport::Impl
{
#if SLIDELINK_HAVE_SDBUS
    sd_bus *bus = nullptr;

    sd_bus_slot *added_slot        = nullptr;  // ObjectManager.InterfacesAdded
    sd_bus_slot *removed_slot      = nullptr;  // ObjectManager.InterfacesRemoved
    sd_bus_slot *props_slot        = nullptr;  // Properties.PropertiesChanged
    sd_bus_slot *connect_call_slot = nullptr;  // Device1.Connect (async)
    sd_bus_slot *notify_call_slot  = nullptr;  // GattCharacteristic1.StartNotify (async)
#endif
    // serialize all sd-bus access
    std::mutex  bus_mu;
    std::thread loop;

    std::string adapter_path;  // "/org/bluez/hci0"
    std::string unique_name;   // our bus unique name (debug)

    // central state (guarded by bus_mu)
    std::string dev_path;  // "/org/bluez/hci0/dev_AA_BB_..."
    std::string dev_addr;  // "AA:BB:..."

    std::atomic_bool discovery_on{false};
    std::atomic_bool scanning{false};  // report DeviceFound while set
    std::atomic_bool connected{false};
    std::atomic_bool connect_inflight{false};
    std::atomic_bool notify_inflight{false};
    std::atomic_bool services_resolved{false};
    std::atomic_bool discover_requested{false};  // catalog owed to the upper layer

    // characteristic uuid (lowercase) <-> object path, from the last catalog walk
    std::unordered_map<std::string, std::string> char_paths;
    std::unordered_map<std::string, std::string> path_uuids;

    // events raised under bus_mu, delivered by the bus thread once unlocked
    std::vector<LinkEvent> pending;
};
}  // namespace transport
