#pragma once
#include <atomic>
#include <functional>
#include <map>
#include <mutex>

#include "app/signal_classifier.hpp"

namespace app
{

// Integer projection handed to the overlay
enum SignalCode : int
{
    SIGNAL_UNSPECIFIED = 0,
    SIGNAL_LEFT        = 1,
    SIGNAL_RIGHT       = 2,
    SIGNAL_STOP        = 3
};

int         to_signal_code(Direction d);
const char *signal_code_name(int code);

using SignalObserver = std::function<void(int code)>;

// Last-value cell for the published signal. One instance is owned by the daemon
// and handed to the producer (LinkManager) and to every reader.
class StatePublisher
{
  public:
    StatePublisher() = default;
    StatePublisher(const StatePublisher &)            = delete;
    StatePublisher &operator=(const StatePublisher &) = delete;

    // last write wins; observers run on the writer's thread when the value changes
    void publish(Direction d);
    void publish_code(int code);

    int current() const { return code_.load(std::memory_order_acquire); }

    int  subscribe(SignalObserver cb);
    void unsubscribe(int id);

  private:
    std::atomic<int>              code_{SIGNAL_UNSPECIFIED};
    std::mutex                    mu_;
    int                           next_id_{1};
    std::map<int, SignalObserver> observers_;
};

}  // namespace app
