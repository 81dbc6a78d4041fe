#include <gtest/gtest.h>
#include <string>

#include "app/device_locator.hpp"
#include "transport/loopback_transport.hpp"

using app::DeviceLocator;
using transport::LinkEvent;
using transport::LoopbackTransport;

TEST(DeviceLocator, NameMatching)
{
    EXPECT_TRUE(DeviceLocator::name_matches("FEST-X 0042", "FEST-X"));
    EXPECT_TRUE(DeviceLocator::name_matches("my FEST-X", "FEST-X"));
    EXPECT_FALSE(DeviceLocator::name_matches("fest-x 0042", "FEST-X"));  // case matters
    EXPECT_FALSE(DeviceLocator::name_matches("Other", "FEST-X"));
    EXPECT_FALSE(DeviceLocator::name_matches("", "FEST-X"));
    EXPECT_FALSE(DeviceLocator::name_matches("", ""));
    EXPECT_TRUE(DeviceLocator::name_matches("anything", ""));
}

TEST(DeviceLocator, FirstMatchStopsScan)
{
    LoopbackTransport t;
    ASSERT_TRUE(t.start([](LinkEvent) {}));
    DeviceLocator loc(t, "FEST-X");

    ASSERT_TRUE(loc.start());
    EXPECT_TRUE(loc.scanning());
    EXPECT_TRUE(t.scanning());
    EXPECT_EQ(t.scan_starts(), 1u);

    EXPECT_FALSE(loc.offer("11:11:11:11:11:11", "Headphones").has_value());
    EXPECT_FALSE(loc.offer("22:22:22:22:22:22", "").has_value());
    EXPECT_TRUE(loc.scanning());

    auto hit = loc.offer("C0:FF:EE:00:00:01", "FEST-X 01");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "C0:FF:EE:00:00:01");
    EXPECT_EQ(loc.last_match(), "C0:FF:EE:00:00:01");
    EXPECT_FALSE(loc.scanning());
    EXPECT_FALSE(t.scanning());

    // later results are ignored until the next scan
    EXPECT_FALSE(loc.offer("C0:FF:EE:00:00:02", "FEST-X 02").has_value());
    EXPECT_EQ(loc.last_match(), "C0:FF:EE:00:00:01");
}

TEST(DeviceLocator, NoMatchKeepsScanning)
{
    LoopbackTransport t;
    ASSERT_TRUE(t.start([](LinkEvent) {}));
    DeviceLocator loc(t, "FEST-X");
    ASSERT_TRUE(loc.start());
    for (int i = 0; i < 50; ++i)
        EXPECT_FALSE(loc.offer("33:33:33:33:33:33", "Watch").has_value());
    EXPECT_TRUE(loc.scanning());
    EXPECT_EQ(t.scan_stops(), 0u);
}

TEST(DeviceLocator, CancelStopsScanOnce)
{
    LoopbackTransport t;
    ASSERT_TRUE(t.start([](LinkEvent) {}));
    DeviceLocator loc(t, "FEST-X");
    ASSERT_TRUE(loc.start());
    loc.cancel();
    loc.cancel();
    EXPECT_FALSE(loc.scanning());
    EXPECT_EQ(t.scan_stops(), 1u);
    EXPECT_FALSE(loc.offer("C0:FF:EE:00:00:01", "FEST-X").has_value());
}

TEST(DeviceLocator, StartFailsWithoutTransport)
{
    LoopbackTransport t;  // never started
    DeviceLocator     loc(t, "FEST-X");
    EXPECT_FALSE(loc.start());
    EXPECT_FALSE(loc.scanning());
}
