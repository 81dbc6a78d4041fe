#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "app/state_publisher.hpp"

using app::Direction;
using app::StatePublisher;

TEST(StatePublisher, StartsUnspecified)
{
    StatePublisher p;
    EXPECT_EQ(p.current(), app::SIGNAL_UNSPECIFIED);
    EXPECT_STREQ(app::signal_code_name(p.current()), "UNSPECIFIED");
}

TEST(StatePublisher, IntegerEncoding)
{
    EXPECT_EQ(app::to_signal_code(Direction::Left), 1);
    EXPECT_EQ(app::to_signal_code(Direction::Right), 2);
    EXPECT_EQ(app::to_signal_code(Direction::Stop), 3);
    EXPECT_STREQ(app::signal_code_name(2), "RIGHT");
    EXPECT_STREQ(app::signal_code_name(42), "UNSPECIFIED");
}

TEST(StatePublisher, LastWriteWins)
{
    StatePublisher p;
    p.publish(Direction::Left);
    p.publish(Direction::Right);
    p.publish(Direction::Stop);
    EXPECT_EQ(p.current(), app::SIGNAL_STOP);
}

TEST(StatePublisher, ObserversSeeChangesOnly)
{
    StatePublisher   p;
    std::vector<int> seen;
    const int        id = p.subscribe([&](int code) { seen.push_back(code); });

    p.publish(Direction::Right);
    p.publish(Direction::Right);
    p.publish(Direction::Stop);
    EXPECT_EQ(seen, (std::vector<int>{app::SIGNAL_RIGHT, app::SIGNAL_STOP}));

    p.unsubscribe(id);
    p.publish(Direction::Left);
    EXPECT_EQ(seen.size(), 2u);
    EXPECT_EQ(p.current(), app::SIGNAL_LEFT);
}

TEST(StatePublisher, ObserverMayUnsubscribeItself)
{
    StatePublisher p;
    int            calls = 0;
    int            id    = 0;
    id                   = p.subscribe([&](int) {
        ++calls;
        p.unsubscribe(id);
    });
    p.publish(Direction::Left);
    p.publish(Direction::Right);
    EXPECT_EQ(calls, 1);
}

TEST(StatePublisher, ConcurrentReaderSeesOnlyValidCodes)
{
    StatePublisher    p;
    std::atomic<bool> done{false};
    std::atomic<bool> bad{false};

    std::thread reader([&] {
        while (!done.load())
        {
            int c = p.current();
            if (c < app::SIGNAL_UNSPECIFIED || c > app::SIGNAL_STOP)
                bad.store(true);
        }
    });
    for (int i = 0; i < 10000; ++i)
        p.publish(i % 2 ? Direction::Left : Direction::Right);
    done.store(true);
    reader.join();

    EXPECT_FALSE(bad.load());
    EXPECT_EQ(p.current(), app::SIGNAL_LEFT);
}
