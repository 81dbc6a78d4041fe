#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>

#include "app/control.hpp"
#include "app/device_locator.hpp"
#include "app/link_manager.hpp"
#include "app/signal_classifier.hpp"
#include "app/state_publisher.hpp"
#include "transport/loopback_transport.hpp"
#include "util/constants.hpp"

using namespace std::chrono_literals;
using app::handle_control_line;

namespace
{
struct Daemon
{
    Daemon() : locator(tx, std::string(constants::NAME_FILTER)), mgr(tx, locator, clf, pub, opts())
    {
    }

    static app::LinkOptions opts()
    {
        app::LinkOptions o;
        o.subscribe_interval = 20ms;
        o.connect_timeout    = 0ms;
        return o;
    }

    std::string send(const std::string &line) { return handle_control_line(line, mgr, pub); }

    transport::LoopbackTransport tx;
    app::DeviceLocator           locator;
    app::SignalClassifier        clf;
    app::StatePublisher          pub;
    app::LinkManager             mgr;
};
}  // namespace

TEST(Control, StateReportsCodeAndName)
{
    Daemon d;
    EXPECT_EQ(d.send("STATE"), "0 UNSPECIFIED");
    d.pub.publish(app::Direction::Right);
    EXPECT_EQ(d.send("STATE"), "2 RIGHT");
}

TEST(Control, LinkAndConnect)
{
    Daemon d;
    ASSERT_EQ(d.mgr.start(), app::LinkError::None);
    EXPECT_EQ(d.send("LINK"), "DISCONNECTED -");

    EXPECT_EQ(d.send("CONNECT c0:ff:ee:00:00:01"), "OK");
    EXPECT_EQ(d.send("LINK"), "CONNECTING C0:FF:EE:00:00:01");
    EXPECT_EQ(d.send("CONNECT C0:FF:EE:00:00:02"), "ERR invalid state");

    // the last peer stays listed after a disconnect
    EXPECT_EQ(d.send("DISCONNECT"), "OK");
    EXPECT_EQ(d.send("LINK"), "DISCONNECTED C0:FF:EE:00:00:01");
    EXPECT_EQ(d.tx.disconnect_calls(), 1u);
}

TEST(Control, RejectsBadInput)
{
    Daemon d;
    ASSERT_EQ(d.mgr.start(), app::LinkError::None);
    EXPECT_EQ(d.send("CONNECT"), "ERR invalid address");
    EXPECT_EQ(d.send("CONNECT zz:zz"), "ERR invalid address");
    EXPECT_EQ(d.send("state"), "ERR unknown command");
    EXPECT_EQ(d.send(""), "ERR unknown command");
    EXPECT_EQ(d.send("QUIT"), "OK");
    EXPECT_TRUE(d.tx.connect_calls().empty());
}
