/* ======================================================================
 * LinkManager - session flow
 *
 *  caller / transport thread          actor thread                         subscriber thread
 *  -------------------------          ------------                         -----------------
 *  start(peer?)
 *    └─ tx.start(post) ─────────────▶ do_begin
 *                                       └─ peer ? do_connect : locator.start (scan)
 *  post(device_found) ──────────────▶ locator.offer → match → stop_scan → do_connect
 *  post(link_established) ──────────▶ CONNECTED, tx.discover_services
 *  post(services_discovered) ───────▶ store catalog, subscriber.arm ───▶ enable_notifications
 *                                                                          every interval
 *  post(notification) ──────────────▶ first frame → subscriber.stop ──▶ (loop exits)
 *                                     classifier.feed → publisher.publish
 *  post(link_lost) ─────────────────▶ DISCONNECTED, clear catalog, subscriber.stop,
 *                                     do_connect(last address)
 *  disconnect() ────────────────────▶ session closed, no reconnect, signal frozen
 *
 *  CONNECTING carries a deadline (opts.connect_timeout); expiry is handled as link loss.
 * ====================================================================== */

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "app/link_manager.hpp"
#include "proto/attributes.hpp"
#include "util/log.hpp"
#include "util/mac.hpp"

namespace app
{

const char *link_state_name(LinkState s)
{
    switch (s)
    {
        case LinkState::Disconnected:
            return "DISCONNECTED";
        case LinkState::Connecting:
            return "CONNECTING";
        case LinkState::Connected:
            return "CONNECTED";
    }
    return "?";
}

const char *link_error_name(LinkError e)
{
    switch (e)
    {
        case LinkError::None:
            return "none";
        case LinkError::AdapterUnavailable:
            return "adapter unavailable";
        case LinkError::ConnectFailure:
            return "connect failure";
        case LinkError::InvalidState:
            return "invalid state";
    }
    return "?";
}

LinkManager::LinkManager(transport::ITransport &t,
                         DeviceLocator         &locator,
                         SignalClassifier      &classifier,
                         StatePublisher        &publisher,
                         LinkOptions            opts)
    : tx_(t),
      locator_(locator),
      classifier_(classifier),
      publisher_(publisher),
      opts_(opts),
      subscriber_([this] { return subscribe_sensor(); }, opts.subscribe_interval)
{
}

LinkManager::~LinkManager()
{
    stop();
}

// ======================================================================
// Function: LinkManager::start
// - In: optional fixed peer address
// - Out: None once the session has begun (connect submitted or scan running)
// - Note: AdapterUnavailable leaves the manager stopped
// ======================================================================
LinkError LinkManager::start(const std::optional<std::string> &peer)
{
    if (running_.load())
        return run_sync([this, peer] { return do_begin(peer); });

    {
        std::lock_guard<std::mutex> lk(q_mu_);
        stop_req_ = false;
        queue_.clear();
    }
    running_.store(true);
    actor_ = std::thread([this] { run(); });

    if (!tx_.start([this](transport::LinkEvent ev) { post(std::move(ev)); }))
    {
        LOG_ERROR("[LINK] transport '%s' failed to start: no adapter", tx_.name().c_str());
        stop();
        return LinkError::AdapterUnavailable;
    }

    const LinkError err = run_sync([this, peer] { return do_begin(peer); });
    if (err != LinkError::None)
        LOG_ERROR("[LINK] session not started: %s", link_error_name(err));
    return err;
}

// ======================================================================
// Function: LinkManager::stop
// - In: can be called anytime, idempotent
// - Out: session closed, actor joined, transport stopped
// ======================================================================
void LinkManager::stop()
{
    if (!running_.load())
        return;

    (void)run_sync([this] {
        do_disconnect();
        return LinkError::None;
    });

    {
        std::lock_guard<std::mutex> lk(q_mu_);
        stop_req_ = true;
    }
    q_cv_.notify_all();
    if (actor_.joinable() && !on_actor_thread())
        actor_.join();
    running_.store(false);

    tx_.stop();
    LOG_DEBUG("[LINK] stopped");
}

LinkError LinkManager::connect(const std::string &address)
{
    return run_sync([this, address] { return do_connect(address, "requested"); });
}

void LinkManager::disconnect()
{
    (void)run_sync([this] {
        do_disconnect();
        return LinkError::None;
    });
}

void LinkManager::post(transport::LinkEvent ev)
{
    auto shared = std::make_shared<transport::LinkEvent>(std::move(ev));
    enqueue([this, shared] { on_event(*shared); });
}

transport::ServiceCatalog LinkManager::catalog() const
{
    std::lock_guard<std::mutex> lk(data_mu_);
    return catalog_;
}

std::string LinkManager::address() const
{
    std::lock_guard<std::mutex> lk(data_mu_);
    return address_;
}

// -------- actor plumbing --------

bool LinkManager::on_actor_thread() const
{
    return actor_.get_id() == std::this_thread::get_id();
}

void LinkManager::enqueue(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lk(q_mu_);
        if (stop_req_ || !running_.load())
            return;
        queue_.push_back(std::move(task));
    }
    q_cv_.notify_one();
}

LinkError LinkManager::run_sync(const std::function<LinkError()> &fn)
{
    if (on_actor_thread())
        return fn();
    if (!running_.load())
    {
        LOG_WARN("[LINK] not running");
        return LinkError::InvalidState;
    }

    auto done = std::make_shared<std::promise<LinkError>>();
    auto fut  = done->get_future();
    enqueue([fn, done] { done->set_value(fn()); });
    try
    {
        return fut.get();
    }
    catch (const std::future_error &e)
    {
        // actor shut down before the call was taken off the queue
        LOG_WARN("[LINK] call dropped: %s", e.what());
        return LinkError::InvalidState;
    }
}

void LinkManager::run()
{
    std::unique_lock<std::mutex> lk(q_mu_);
    while (true)
    {
        auto ready = [this] { return stop_req_ || !queue_.empty(); };
        if (deadline_armed_)
            q_cv_.wait_until(lk, deadline_, ready);
        else
            q_cv_.wait(lk, ready);

        while (!queue_.empty())
        {
            auto task = std::move(queue_.front());
            queue_.pop_front();
            lk.unlock();
            task();
            lk.lock();
        }
        if (stop_req_)
            break;

        lk.unlock();
        check_deadline();
        lk.lock();
    }
}

// -------- actor handlers --------

LinkError LinkManager::do_begin(const std::optional<std::string> &peer)
{
    if (!tx_.adapter_available())
    {
        LOG_ERROR("[LINK] no adapter available");
        return LinkError::AdapterUnavailable;
    }
    if (peer && !peer->empty())
        return do_connect(*peer, "configured peer");

    if (state_.load() != LinkState::Disconnected)
        return LinkError::InvalidState;
    session_active_.store(true);
    if (!locator_.start())
    {
        session_active_.store(false);
        return LinkError::AdapterUnavailable;
    }
    return LinkError::None;
}

// ======================================================================
// Function: LinkManager::do_connect
// - In: actor thread; address in AA:BB:CC:DD:EE:FF form
// - Out: None when the transport accepted the request (state CONNECTING)
// - Note: failures leave state DISCONNECTED and are not retried here; the
//         address only becomes the last known one once the transport accepts it
// ======================================================================
LinkError LinkManager::do_connect(const std::string &address, const char *reason)
{
    if (!tx_.adapter_available())
    {
        LOG_ERROR("[LINK] connect(%s): no adapter available", address.c_str());
        return LinkError::AdapterUnavailable;
    }
    if (!mac::is_valid(address))
    {
        LOG_WARN("[LINK] connect: invalid address '%s'", address.c_str());
        return LinkError::ConnectFailure;
    }
    if (state_.load() != LinkState::Disconnected)
    {
        LOG_WARN("[LINK] connect(%s) ignored in state %s", address.c_str(),
                 link_state_name(state_.load()));
        return LinkError::InvalidState;
    }

    const std::string addr = mac::normalize(address);
    if (!tx_.connect(addr))
    {
        // nothing is committed on refusal
        LOG_ERROR("[LINK] connect(%s) refused by transport", addr.c_str());
        return LinkError::ConnectFailure;
    }

    locator_.cancel();
    session_active_.store(true);
    {
        std::lock_guard<std::mutex> lk(data_mu_);
        address_ = addr;
    }
    state_.store(LinkState::Connecting);
    if (opts_.connect_timeout.count() > 0)
    {
        deadline_armed_ = true;
        deadline_       = std::chrono::steady_clock::now() + opts_.connect_timeout;
    }
    LOG_SYSTEM("[LINK] connecting to %s (%s)", addr.c_str(), reason);
    return LinkError::None;
}

void LinkManager::do_disconnect()
{
    const bool was_active = session_active_.exchange(false);
    locator_.cancel();
    subscriber_.stop();

    if (state_.load() != LinkState::Disconnected)
        tx_.disconnect();
    state_.store(LinkState::Disconnected);
    deadline_armed_ = false;
    frame_seen_     = false;
    clear_catalog();

    if (was_active)
        LOG_SYSTEM("[LINK] session closed (signal frozen at %s)",
                   signal_code_name(publisher_.current()));
}

void LinkManager::on_event(const transport::LinkEvent &ev)
{
    if (!session_active_.load())
    {
        LOG_DEBUG("[LINK] drop %s: no active session", transport::event_name(ev.kind));
        return;
    }

    switch (ev.kind)
    {
        case transport::EventKind::DeviceFound:
            on_device_found(ev);
            break;
        case transport::EventKind::LinkEstablished:
            on_link_established();
            break;
        case transport::EventKind::ServicesDiscovered:
            on_services_discovered(ev);
            break;
        case transport::EventKind::CharacteristicNotification:
            on_notification(ev);
            break;
        case transport::EventKind::LinkLost:
            on_link_lost("link lost");
            break;
    }
}

void LinkManager::on_device_found(const transport::LinkEvent &ev)
{
    if (state_.load() != LinkState::Disconnected)
        return;
    auto match = locator_.offer(ev.address, ev.name);
    if (!match)
        return;
    const LinkError err = do_connect(*match, "scan match");
    if (err != LinkError::None)
        LOG_ERROR("[LINK] connect after scan failed: %s", link_error_name(err));
}

void LinkManager::on_link_established()
{
    const LinkState prev = state_.load();
    if (prev == LinkState::Disconnected)
    {
        LOG_DEBUG("[LINK] link_established while DISCONNECTED; ignored");
        return;
    }

    state_.store(LinkState::Connected);
    deadline_armed_ = false;
    if (prev == LinkState::Connecting)
        LOG_SYSTEM("[LINK] connected to %s", address().c_str());

    if (!tx_.discover_services())
        LOG_WARN("[LINK] service discovery could not be requested");
}

void LinkManager::on_services_discovered(const transport::LinkEvent &ev)
{
    if (state_.load() != LinkState::Connected)
    {
        LOG_DEBUG("[LINK] services_discovered outside CONNECTED; ignored");
        return;
    }
    if (ev.status != transport::GATT_SUCCESS)
    {
        // no retry and no reconnect: the link stays up without a sensor channel
        LOG_WARN("[LINK] service discovery failed, status=%d", ev.status);
        return;
    }

    transport::ServiceCatalog cat = ev.catalog;
    std::size_t               n_chars = 0;
    for (auto &svc : cat)
    {
        svc.name = gatt::lookup(svc.uuid, "Unknown service");
        LOG_DEBUG("[LINK] service %s (%s)", svc.uuid.c_str(), svc.name.c_str());
        for (auto &ch : svc.characteristics)
        {
            ch.name = gatt::lookup(ch.uuid, "Unknown characteristic");
            LOG_DEBUG("[LINK]   char %s handle=0x%04x (%s)", ch.uuid.c_str(), ch.handle,
                      ch.name.c_str());
            ++n_chars;
        }
    }
    {
        std::lock_guard<std::mutex> lk(data_mu_);
        catalog_ = std::move(cat);
    }
    LOG_INFO("[LINK] catalog: %zu services, %zu characteristics", ev.catalog.size(), n_chars);

    frame_seen_ = false;
    subscriber_.arm();
}

void LinkManager::on_notification(const transport::LinkEvent &ev)
{
    if (!gatt::is_sensor_uuid(ev.uuid))
    {
        LOG_DEBUG("[LINK] notify on %s (%s) ignored", ev.uuid.c_str(),
                  gatt::lookup(ev.uuid, "unknown").c_str());
        return;
    }
    if (state_.load() != LinkState::Connected)
    {
        LOG_DEBUG("[LINK] sensor notify outside CONNECTED; ignored");
        return;
    }

    auto frame = frame_from_bytes(ev.value.data(), ev.value.size());
    if (!frame)
    {
        LOG_WARN("[LINK] short sensor frame (%zu bytes): %s", ev.value.size(),
                 slidelink::hex_bytes(ev.value.data(), ev.value.size()).c_str());
        return;
    }

    if (!frame_seen_)
    {
        frame_seen_ = true;
        subscriber_.stop();
        LOG_SYSTEM("[LINK] notifications enabled; sensor stream live");
    }
    frames_.fetch_add(1);

    const Direction prev = classifier_.state();
    const Direction next = classifier_.feed(*frame);
    publisher_.publish(next);
    if (next != prev)
        LOG_INFO("[LINK] s1=%u s2=%u %s -> %s", (unsigned)frame->s1, (unsigned)frame->s2,
                 direction_name(prev), direction_name(next));
}

// ======================================================================
// Function: LinkManager::on_link_lost
// - In: actor thread, any state
// - Out: DISCONNECTED with an empty catalog, then exactly one connect to the
//        last known address
// - Note: no backoff and no retry cap; a refused reconnect ends the session
// ======================================================================
void LinkManager::on_link_lost(const char *why)
{
    const LinkState prev = state_.load();
    state_.store(LinkState::Disconnected);
    deadline_armed_ = false;
    frame_seen_     = false;
    clear_catalog();
    subscriber_.stop();

    const std::string addr = address();
    LOG_SYSTEM("[LINK] %s (%s, was %s)", why, addr.empty() ? "?" : addr.c_str(),
               link_state_name(prev));
    if (addr.empty())
        return;

    const LinkError err = do_connect(addr, "reconnect");
    if (err != LinkError::None)
    {
        LOG_ERROR("[LINK] reconnect to %s failed: %s", addr.c_str(), link_error_name(err));
        session_active_.store(false);
    }
}

void LinkManager::check_deadline()
{
    if (!deadline_armed_ || state_.load() != LinkState::Connecting)
        return;
    if (std::chrono::steady_clock::now() < deadline_)
        return;

    LOG_WARN("[LINK] connect to %s timed out after %lldms", address().c_str(),
             (long long)opts_.connect_timeout.count());
    tx_.disconnect();
    on_link_lost("connect timeout");
}

void LinkManager::clear_catalog()
{
    std::lock_guard<std::mutex> lk(data_mu_);
    catalog_.clear();
}

// -------- subscriber thread --------

bool LinkManager::subscribe_sensor()
{
    if (state_.load() != LinkState::Connected)
        return false;

    std::string uuid;
    {
        std::lock_guard<std::mutex> lk(data_mu_);
        for (const auto &svc : catalog_)
        {
            for (const auto &ch : svc.characteristics)
            {
                if (gatt::is_sensor_uuid(ch.uuid))
                {
                    uuid = ch.uuid;
                    break;
                }
            }
            if (!uuid.empty())
                break;
        }
    }
    if (uuid.empty())
    {
        LOG_DEBUG("[LINK] sensor characteristic not in catalog");
        return false;
    }

    if (!tx_.enable_notifications(uuid))
    {
        LOG_WARN("[LINK] enable notifications on %s failed", uuid.c_str());
        return false;
    }
    return true;
}

}  // namespace app
