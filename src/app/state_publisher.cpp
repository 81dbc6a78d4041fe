#include <mutex>
#include <utility>
#include <vector>

#include "app/state_publisher.hpp"

namespace app
{

int to_signal_code(Direction d)
{
    switch (d)
    {
        case Direction::Left:
            return SIGNAL_LEFT;
        case Direction::Right:
            return SIGNAL_RIGHT;
        case Direction::Stop:
            return SIGNAL_STOP;
    }
    return SIGNAL_UNSPECIFIED;
}

const char *signal_code_name(int code)
{
    switch (code)
    {
        case SIGNAL_LEFT:
            return "LEFT";
        case SIGNAL_RIGHT:
            return "RIGHT";
        case SIGNAL_STOP:
            return "STOP";
        default:
            return "UNSPECIFIED";
    }
}

void StatePublisher::publish(Direction d)
{
    publish_code(to_signal_code(d));
}

void StatePublisher::publish_code(int code)
{
    const int prev = code_.exchange(code, std::memory_order_acq_rel);
    if (prev == code)
        return;

    std::vector<SignalObserver> cbs;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cbs.reserve(observers_.size());
        for (const auto &kv : observers_)
            cbs.push_back(kv.second);
    }
    for (const auto &cb : cbs)
        cb(code);
}

int StatePublisher::subscribe(SignalObserver cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    const int id = next_id_++;
    observers_.emplace(id, std::move(cb));
    return id;
}

void StatePublisher::unsubscribe(int id)
{
    std::lock_guard<std::mutex> lk(mu_);
    observers_.erase(id);
}

}  // namespace app
