#include <chrono>
#include <memory>
#include <string>

#include "app/config.hpp"
#include "app/control.hpp"
#include "app/device_locator.hpp"
#include "app/link_manager.hpp"
#include "app/signal_classifier.hpp"
#include "app/state_publisher.hpp"
#include "ctl/ipc.hpp"
#include "transport/bluez_transport.hpp"
#include "transport/loopback_transport.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace
{

std::unique_ptr<transport::ITransport> make_transport(const app::BridgeConfig &cfg)
{
    if (cfg.transport == "bluez")
    {
        transport::BluezConfig bc;
        bc.adapter = cfg.adapter;
        return std::make_unique<transport::BluezTransport>(bc);
    }
    // default - loopback answering like a band, so the daemon is usable without a radio
    transport::LoopbackConfig lc;
    lc.auto_respond = true;
    return std::make_unique<transport::LoopbackTransport>(lc);
}

}  // namespace

int main()
{
    slidelink::set_log_level_from_env();

    app::BridgeConfig cfg = app::config_from_env();
    LOG_SYSTEM("Config: transport=%s adapter=%s filter=%s peer=%s threshold=%u",
               cfg.transport.c_str(), cfg.adapter.c_str(), cfg.name_filter.c_str(),
               cfg.peer_addr ? cfg.peer_addr->c_str() : "(none)", (unsigned)cfg.threshold);

    auto tx = make_transport(cfg);

    app::StatePublisher publisher;
    publisher.subscribe([](int code) {
        LOG_SYSTEM("[SIGNAL] %d %s", code, app::signal_code_name(code));
    });

    app::SignalClassifier classifier(cfg.threshold);
    app::DeviceLocator    locator(*tx, cfg.name_filter);

    app::LinkOptions opts;
    opts.subscribe_interval = std::chrono::milliseconds(cfg.subscribe_ms);
    opts.connect_timeout    = std::chrono::milliseconds(cfg.connect_timeout_ms);
    app::LinkManager mgr(*tx, locator, classifier, publisher, opts);

    app::LinkError err = mgr.start(cfg.peer_addr);
    if (err == app::LinkError::AdapterUnavailable)
    {
        LOG_ERROR("No usable adapter (%s on %s)", tx->name().c_str(), cfg.adapter.c_str());
        return 1;
    }
    if (err != app::LinkError::None)
        LOG_WARN("Initial session did not start: %s", app::link_error_name(err));

    std::string sock = ipc::expand_user(cfg.ctl_sock.empty() ? constants::ctl_sock_path()
                                                             : cfg.ctl_sock);

    bool ok = ipc::start_server(sock, [&](const std::string &line) {
        return app::handle_control_line(line, mgr, publisher);
    });
    mgr.stop();
    if (!ok)
    {
        LOG_ERROR("start_server failed");
        return 1;
    }
    LOG_SYSTEM("slidelinkd stopped");
    return 0;
}
