#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "app/device_locator.hpp"
#include "app/notification_subscriber.hpp"
#include "app/signal_classifier.hpp"
#include "app/state_publisher.hpp"
#include "transport/itransport.hpp"
#include "util/constants.hpp"

namespace app
{

enum class LinkState
{
    Disconnected,
    Connecting,
    Connected
};

enum class LinkError
{
    None,
    AdapterUnavailable,  // no local radio; fatal for the session
    ConnectFailure,      // bad/absent address or the transport refused the request
    InvalidState         // connect() outside DISCONNECTED, or manager not running
};

const char *link_state_name(LinkState s);
const char *link_error_name(LinkError e);

struct LinkOptions
{
    std::chrono::milliseconds subscribe_interval{constants::SUBSCRIBE_INTERVAL_MS};
    std::chrono::milliseconds connect_timeout{constants::CONNECT_TIMEOUT_MS};  // 0 = none
};

// Owns the link state machine. Every transition runs on one actor thread: transport
// callbacks are posted to its queue, and connect()/disconnect() are posted and awaited.
class LinkManager
{
  public:
    LinkManager(transport::ITransport &t,
                DeviceLocator         &locator,
                SignalClassifier      &classifier,
                StatePublisher        &publisher,
                LinkOptions            opts = {});
    ~LinkManager();

    LinkManager(const LinkManager &)            = delete;
    LinkManager &operator=(const LinkManager &) = delete;

    // Spawn the actor, open the transport and begin a session: connect to peer when
    // given, otherwise scan for the band.
    LinkError start(const std::optional<std::string> &peer = std::nullopt);
    void      stop();

    LinkError connect(const std::string &address);
    void      disconnect();

    // transport event sink; safe from any thread
    void post(transport::LinkEvent ev);

    LinkState                 state() const { return state_.load(); }
    transport::ServiceCatalog catalog() const;
    std::string               address() const;
    bool                      session_active() const { return session_active_.load(); }
    bool                      subscribing() const { return subscriber_.running(); }
    std::size_t               subscribe_attempts() const { return subscriber_.attempts(); }
    std::size_t               frames() const { return frames_.load(); }

  private:
    void      run();
    void      enqueue(std::function<void()> task);
    LinkError run_sync(const std::function<LinkError()> &fn);
    bool      on_actor_thread() const;

    // actor-thread handlers
    LinkError do_begin(const std::optional<std::string> &peer);
    LinkError do_connect(const std::string &address, const char *reason);
    void      do_disconnect();
    void      on_event(const transport::LinkEvent &ev);
    void      on_device_found(const transport::LinkEvent &ev);
    void      on_link_established();
    void      on_services_discovered(const transport::LinkEvent &ev);
    void      on_notification(const transport::LinkEvent &ev);
    void      on_link_lost(const char *why);
    void      check_deadline();
    void      clear_catalog();

    // subscriber thread
    bool subscribe_sensor();

    transport::ITransport &tx_;
    DeviceLocator         &locator_;
    SignalClassifier      &classifier_;
    StatePublisher        &publisher_;
    LinkOptions            opts_;

    std::atomic<LinkState> state_{LinkState::Disconnected};
    std::atomic_bool       session_active_{false};
    std::atomic<std::size_t> frames_{0};
    bool                   frame_seen_{false};  // actor thread only

    mutable std::mutex        data_mu_;  // catalog_ + address_
    transport::ServiceCatalog catalog_;
    std::string               address_;

    // connect deadline (actor thread only)
    bool                                  deadline_armed_{false};
    std::chrono::steady_clock::time_point deadline_{};

    // actor queue
    std::mutex                        q_mu_;
    std::condition_variable           q_cv_;
    std::deque<std::function<void()>> queue_;
    bool                              stop_req_{false};
    std::atomic_bool                  running_{false};
    std::thread                       actor_;

    NotificationSubscriber subscriber_;
};

}  // namespace app
