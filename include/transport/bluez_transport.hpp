#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "transport/itransport.hpp"

#if SLIDELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace
{
// TU-local wrapper to unref and null a slot ptr
inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}
}  // namespace

#endif

namespace transport
{

struct BluezConfig
{
    std::string   adapter     = "hci0";
    std::uint32_t bus_wait_ms = 100;  // sd_bus_wait slice of the bus loop
};

// BLE central on BlueZ over the system D-Bus. One bus loop thread processes signals and
// async replies; radio events are queued under bus_mu and handed to on_event outside it.
class BluezTransport final : public ITransport
{
  public:
    explicit BluezTransport(BluezConfig cfg);
    ~BluezTransport() override;

    bool        start(OnEvent on_event) override;
    void        stop() override;
    bool        adapter_available() const override;
    bool        start_scan() override;
    void        stop_scan() override;
    bool        connect(const std::string &address) override;
    void        disconnect() override;
    bool        discover_services() override;
    bool        enable_notifications(const std::string &char_uuid) override;
    std::string name() const override;

    const BluezConfig &config() const { return cfg_; }

    // ---- used by the bus callbacks (bus thread, bus_mu held) ----
    const std::string &adapter_path() const;
    const std::string &dev_path() const;
    bool               scanning() const;
    bool               is_running() const noexcept { return running_.load(std::memory_order_relaxed); }
    void               note_device(const std::string &path, const std::string &addr,
                                   const std::string &name);
    void               note_connected(bool up, const char *why);
    void               note_connect_reply(bool ok, const char *ename, const char *emsg);
    void               note_start_notify_reply(bool ok, const char *ename, const char *emsg);
    void               note_services_resolved(bool v);
    void               note_value(const std::string &path, const std::uint8_t *data, std::size_t len);
    void               note_device_removed(const std::string &path);

  private:
    BluezConfig      cfg_;
    OnEvent          on_event_{};
    std::atomic_bool running_{false};

    struct Impl;
    std::unique_ptr<Impl> impl_;

    void queue_event(LinkEvent ev);  // bus_mu held
    void flush_events();             // bus thread, bus_mu not held

    // central-side helpers
    bool start_central();
    void stop_central();
    bool central_set_discovery_filter();
    bool central_cold_scan();
    bool central_build_catalog(ServiceCatalog &out);
    void central_pump();
};

}  // namespace transport
