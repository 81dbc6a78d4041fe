#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "transport/itransport.hpp"
#include "transport/loopback_transport.hpp"
#include "util/constants.hpp"

using namespace transport;

TEST(Loopback, InjectDeliversEvent)
{
    LoopbackTransport      t;
    std::vector<LinkEvent> got;

    ASSERT_TRUE(t.start([&](LinkEvent ev) { got.push_back(std::move(ev)); }));
    EXPECT_TRUE(t.inject(LinkEvent::notification("abc", Bytes{1, 2, 3})));
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].kind, EventKind::CharacteristicNotification);
    EXPECT_EQ(got[0].uuid, "abc");
    EXPECT_EQ(got[0].value, (Bytes{1, 2, 3}));

    t.stop();
    EXPECT_FALSE(t.inject(LinkEvent::link_lost()));
}

TEST(Loopback, CallsFailWhenNotStarted)
{
    LoopbackTransport t;
    EXPECT_FALSE(t.start_scan());
    EXPECT_FALSE(t.connect("C0:FF:EE:00:00:01"));
    EXPECT_FALSE(t.discover_services());
    EXPECT_FALSE(t.enable_notifications(std::string(constants::SENSOR_UUID)));
    EXPECT_FALSE(t.inject(LinkEvent::link_established()));
    EXPECT_TRUE(t.connect_calls().empty());
}

TEST(Loopback, NoAdapter)
{
    LoopbackConfig cfg;
    cfg.adapter_present = false;
    LoopbackTransport t(cfg);
    EXPECT_FALSE(t.adapter_available());
    EXPECT_FALSE(t.start([](LinkEvent) {}));
}

TEST(Loopback, RecordsCalls)
{
    LoopbackTransport t;
    ASSERT_TRUE(t.start([](LinkEvent) {}));

    std::string hooked;
    t.set_connect_hook([&](const std::string &a) { hooked = a; });

    EXPECT_TRUE(t.start_scan());
    EXPECT_TRUE(t.scanning());
    t.stop_scan();
    EXPECT_FALSE(t.scanning());
    EXPECT_TRUE(t.connect("C0:FF:EE:00:00:01"));
    EXPECT_EQ(hooked, "C0:FF:EE:00:00:01");
    EXPECT_TRUE(t.discover_services());
    EXPECT_TRUE(t.enable_notifications(std::string(constants::SENSOR_UUID)));
    t.disconnect();

    EXPECT_EQ(t.scan_starts(), 1u);
    EXPECT_EQ(t.scan_stops(), 1u);
    EXPECT_EQ(t.connect_calls(), (std::vector<std::string>{"C0:FF:EE:00:00:01"}));
    EXPECT_EQ(t.discover_calls(), 1u);
    EXPECT_EQ(t.enable_calls(), 1u);
    EXPECT_EQ(t.disconnect_calls(), 1u);
}

TEST(Loopback, AutoRespondPlaysBand)
{
    LoopbackConfig cfg;
    cfg.auto_respond = true;
    LoopbackTransport      t(cfg);
    std::vector<LinkEvent> got;
    ASSERT_TRUE(t.start([&](LinkEvent ev) { got.push_back(std::move(ev)); }));

    ASSERT_TRUE(t.start_scan());
    ASSERT_TRUE(t.connect(cfg.sim_address));
    ASSERT_TRUE(t.discover_services());
    ASSERT_TRUE(t.enable_notifications(std::string(constants::SENSOR_UUID)));
    ASSERT_TRUE(t.enable_notifications(std::string(constants::SENSOR_UUID)));

    ASSERT_EQ(got.size(), 4u);
    EXPECT_EQ(got[0].kind, EventKind::DeviceFound);
    EXPECT_EQ(got[0].address, cfg.sim_address);
    EXPECT_EQ(got[0].name, cfg.sim_name);
    EXPECT_EQ(got[1].kind, EventKind::LinkEstablished);
    EXPECT_EQ(got[2].kind, EventKind::ServicesDiscovered);
    EXPECT_EQ(got[2].status, GATT_SUCCESS);
    EXPECT_EQ(got[2].catalog.size(), 2u);
    // only the first enable produces a frame
    EXPECT_EQ(got[3].kind, EventKind::CharacteristicNotification);
    EXPECT_EQ(got[3].value.size(), 2u);
}

TEST(Loopback, SimCatalogOrderedByHandle)
{
    const ServiceCatalog cat = LoopbackTransport::sim_catalog();
    ASSERT_EQ(cat.size(), 2u);
    const auto &band = cat[1].characteristics;
    ASSERT_EQ(band.size(), 2u);
    EXPECT_LT(band[0].handle, band[1].handle);
    EXPECT_EQ(band[1].uuid, std::string(constants::SENSOR_UUID));
}

TEST(Transport, EventNames)
{
    EXPECT_STREQ(event_name(EventKind::DeviceFound), "device_found");
    EXPECT_STREQ(event_name(EventKind::LinkEstablished), "link_established");
    EXPECT_STREQ(event_name(EventKind::LinkLost), "link_lost");
    EXPECT_STREQ(event_name(EventKind::ServicesDiscovered), "services_discovered");
    EXPECT_STREQ(event_name(EventKind::CharacteristicNotification), "characteristic_notification");
}
