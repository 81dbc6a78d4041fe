#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

#include "util/constants.hpp"

namespace app
{

// Re-issues a subscribe command at a fixed interval on its own thread until stopped.
// The wait between attempts is interruptible, so stop() returns within one command call.
class NotificationSubscriber
{
  public:
    using Command = std::function<bool()>;  // true when the command was issued

    explicit NotificationSubscriber(
        Command                   cmd,
        std::chrono::milliseconds interval =
            std::chrono::milliseconds(constants::SUBSCRIBE_INTERVAL_MS));
    ~NotificationSubscriber();

    NotificationSubscriber(const NotificationSubscriber &)            = delete;
    NotificationSubscriber &operator=(const NotificationSubscriber &) = delete;

    // start the retry loop; no-op while already running
    void arm();
    // stop the retry loop and wait for it, unless called from the loop itself
    void stop();

    bool        running() const { return running_.load(); }
    std::size_t attempts() const { return attempts_.load(); }
    std::chrono::milliseconds interval() const { return interval_; }

  private:
    void loop();

    Command                   cmd_;
    std::chrono::milliseconds interval_;

    std::mutex              mu_;
    std::condition_variable cv_;
    bool                    stop_req_{true};
    std::thread             thr_;
    std::atomic_bool        running_{false};
    std::atomic<std::size_t> attempts_{0};
};

}  // namespace app
