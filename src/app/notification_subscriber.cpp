#include <chrono>
#include <mutex>
#include <thread>
#include <utility>

#include "app/notification_subscriber.hpp"
#include "util/log.hpp"

namespace app
{

NotificationSubscriber::NotificationSubscriber(Command cmd, std::chrono::milliseconds interval)
    : cmd_(std::move(cmd)), interval_(interval)
{
}

NotificationSubscriber::~NotificationSubscriber()
{
    stop();
    if (thr_.joinable())
        thr_.join();
}

void NotificationSubscriber::arm()
{
    std::thread old;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (running_.load())
            return;
        // a previous loop that stopped itself may still need joining
        old = std::move(thr_);
    }
    if (old.joinable())
        old.join();

    std::lock_guard<std::mutex> lk(mu_);
    stop_req_ = false;
    running_.store(true);
    thr_ = std::thread([this] { loop(); });
    LOG_DEBUG("[SUB] armed, interval=%lldms", (long long)interval_.count());
}

void NotificationSubscriber::stop()
{
    std::thread t;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stop_req_ && !thr_.joinable())
            return;
        stop_req_ = true;
        if (thr_.joinable() && thr_.get_id() != std::this_thread::get_id())
            t = std::move(thr_);
    }
    cv_.notify_all();
    if (t.joinable())
        t.join();
}

void NotificationSubscriber::loop()
{
    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_req_)
    {
        lk.unlock();
        const bool issued = cmd_ ? cmd_() : false;
        attempts_.fetch_add(1);
        if (!issued)
            LOG_DEBUG("[SUB] subscribe command not issued; retry in %lldms",
                      (long long)interval_.count());
        lk.lock();
        cv_.wait_for(lk, interval_, [this] { return stop_req_; });
    }
    running_.store(false);
    LOG_DEBUG("[SUB] stopped after %zu attempts", attempts_.load());
}

}  // namespace app
