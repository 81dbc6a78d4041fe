#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "transport/itransport.hpp"

namespace transport
{

struct LoopbackConfig
{
    bool        adapter_present = true;
    bool        accept_connect  = true;
    bool        auto_respond    = false;  // answer scan/connect/discover like a band would
    std::string sim_address     = "C0:FF:EE:00:00:01";
    std::string sim_name        = "FEST-X sim";
};

// In-process link: records every outbound call and lets the caller inject radio events.
class LoopbackTransport final : public ITransport
{
  public:
    LoopbackTransport() = default;
    explicit LoopbackTransport(LoopbackConfig cfg);

    bool        start(OnEvent on_event) override;
    void        stop() override;
    bool        adapter_available() const override;
    bool        start_scan() override;
    void        stop_scan() override;
    bool        connect(const std::string &address) override;
    void        disconnect() override;
    bool        discover_services() override;
    bool        enable_notifications(const std::string &char_uuid) override;
    std::string name() const override { return "loopback"; }

    // deliver ev as if it came from the radio; false when not started
    bool inject(LinkEvent ev);

    // observe connect() from the calling thread, before it returns
    void set_connect_hook(std::function<void(const std::string &)> hook);

    std::vector<std::string> connect_calls() const;
    std::size_t              enable_calls() const;
    std::size_t              discover_calls() const;
    std::size_t              disconnect_calls() const;
    std::size_t              scan_starts() const;
    std::size_t              scan_stops() const;
    bool                     scanning() const;

    static ServiceCatalog sim_catalog();

  private:
    LoopbackConfig                           cfg_{};
    OnEvent                                  on_event_{};
    std::function<void(const std::string &)> connect_hook_{};
    bool                                     started_{false};
    bool                                     scanning_{false};
    bool                                     sim_notified_{false};

    mutable std::mutex       mu_;
    std::vector<std::string> connect_calls_;
    std::size_t              enable_calls_{0};
    std::size_t              discover_calls_{0};
    std::size_t              disconnect_calls_{0};
    std::size_t              scan_starts_{0};
    std::size_t              scan_stops_{0};
};

}  // namespace transport
