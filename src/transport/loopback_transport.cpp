#include <string>
#include <utility>

#include "transport/loopback_transport.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: a fake radio to test the pipeline (locator → link → classifier) without BLE.
LoopbackTransport::LoopbackTransport(LoopbackConfig cfg) : cfg_(std::move(cfg)) {}

bool LoopbackTransport::start(OnEvent on_event)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!cfg_.adapter_present)
    {
        LOG_ERROR("[LOOPBACK] no adapter");
        return false;
    }
    on_event_     = std::move(on_event);
    started_      = true;
    sim_notified_ = false;
    return true;
}

void LoopbackTransport::stop()
{
    std::lock_guard<std::mutex> lk(mu_);
    started_  = false;
    scanning_ = false;
    on_event_ = nullptr;
}

bool LoopbackTransport::adapter_available() const
{
    return cfg_.adapter_present;
}

bool LoopbackTransport::inject(LinkEvent ev)
{
    OnEvent cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_ || !on_event_)
            return false;
        cb = on_event_;
    }
    // never call out while holding mu_: the receiver may call back into us
    cb(std::move(ev));
    return true;
}

void LoopbackTransport::set_connect_hook(std::function<void(const std::string &)> hook)
{
    std::lock_guard<std::mutex> lk(mu_);
    connect_hook_ = std::move(hook);
}

bool LoopbackTransport::start_scan()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return false;
        scanning_ = true;
        ++scan_starts_;
    }
    if (cfg_.auto_respond)
        inject(LinkEvent::device_found(cfg_.sim_address, cfg_.sim_name));
    return true;
}

void LoopbackTransport::stop_scan()
{
    std::lock_guard<std::mutex> lk(mu_);
    scanning_ = false;
    ++scan_stops_;
}

bool LoopbackTransport::connect(const std::string &address)
{
    std::function<void(const std::string &)> hook;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return false;
        connect_calls_.push_back(address);
        hook = connect_hook_;
    }
    if (hook)
        hook(address);
    if (!cfg_.accept_connect)
        return false;
    if (cfg_.auto_respond)
        inject(LinkEvent::link_established());
    return true;
}

void LoopbackTransport::disconnect()
{
    std::lock_guard<std::mutex> lk(mu_);
    ++disconnect_calls_;
}

bool LoopbackTransport::discover_services()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return false;
        ++discover_calls_;
    }
    if (cfg_.auto_respond)
        inject(LinkEvent::services_discovered(GATT_SUCCESS, sim_catalog()));
    return true;
}

bool LoopbackTransport::enable_notifications(const std::string &char_uuid)
{
    bool first = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return false;
        ++enable_calls_;
        first         = !sim_notified_;
        sim_notified_ = true;
    }
    // simulated band at rest: both magnitudes below threshold
    if (cfg_.auto_respond && first)
        inject(LinkEvent::notification(char_uuid, Bytes{0x10, 0x10}));
    return true;
}

std::vector<std::string> LoopbackTransport::connect_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return connect_calls_;
}

std::size_t LoopbackTransport::enable_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return enable_calls_;
}

std::size_t LoopbackTransport::discover_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return discover_calls_;
}

std::size_t LoopbackTransport::disconnect_calls() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return disconnect_calls_;
}

std::size_t LoopbackTransport::scan_starts() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scan_starts_;
}

std::size_t LoopbackTransport::scan_stops() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scan_stops_;
}

bool LoopbackTransport::scanning() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scanning_;
}

ServiceCatalog LoopbackTransport::sim_catalog()
{
    ServiceCatalog cat;
    ServiceDescriptor info{"0000180a-0000-1000-8000-00805f9b34fb", "", {}};
    info.characteristics.push_back({"00002a29-0000-1000-8000-00805f9b34fb", "", 0x0003});
    cat.push_back(std::move(info));

    ServiceDescriptor band{"00001810-0000-1000-8000-00805f9b34fb", "", {}};
    band.characteristics.push_back({"43680200-4d74-1001-726b-526f64696f6e", "", 0x0010});
    band.characteristics.push_back({std::string(constants::SENSOR_UUID), "", 0x0012});
    cat.push_back(std::move(band));
    return cat;
}

}  // namespace transport
