// tests/test_env.cpp
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#include "app/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_CtlSockPath, FromEnv)
{
    EnvGuard          g("SLIDELINK_CTL_SOCK");
    const std::string want = "/tmp/slidelink-test.sock";
    g.set(want);

    // should NOT log the default path when env is set
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(got, want);
    EXPECT_TRUE(err.find("Control socket at") == std::string::npos);
}

TEST(Env_CtlSockPath, DefaultFromHomeAndLogs)
{
    EnvGuard g_sock("SLIDELINK_CTL_SOCK");
    g_sock.unset();

    EnvGuard              g_home("HOME");
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "slidelink-home";
    std::filesystem::create_directories(tmp);
    g_home.set(tmp.string());

    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    std::string want = (tmp / ".cache/slidelink/ctl.sock").string();
    EXPECT_EQ(got, want);
    EXPECT_NE(err.find("Control socket at " + want), std::string::npos);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace slidelink;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // SYSTEM is shown at every threshold
    testing::internal::CaptureStderr();
    LOG_SYSTEM("system_always_visible");
    std::string out_sys = testing::internal::GetCapturedStderr();
    EXPECT_NE(out_sys.find("system_always_visible"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);
}

TEST(LogLevel, FromEnv)
{
    using namespace slidelink;
    EnvGuard g("SLIDELINK_LOG_LEVEL");
    g.set("warn");
    set_log_level_from_env();
    EXPECT_EQ(global_level(), Level::Warning);

    // unset keeps the current level
    g.unset();
    set_log_level_from_env();
    EXPECT_EQ(global_level(), Level::Warning);
    set_log_level(Level::Debug);
}

TEST(Config, ParseUint)
{
    EXPECT_EQ(app::parse_uint("42", 0, 100), 42u);
    EXPECT_EQ(app::parse_uint("0", 0, 100), 0u);
    EXPECT_FALSE(app::parse_uint("101", 0, 100).has_value());
    EXPECT_FALSE(app::parse_uint("-1", 0, 100).has_value());
    EXPECT_FALSE(app::parse_uint("12ms", 0, 100).has_value());
    EXPECT_FALSE(app::parse_uint(" 7", 0, 100).has_value());
    EXPECT_FALSE(app::parse_uint("", 0, 100).has_value());
    EXPECT_FALSE(app::parse_uint(nullptr, 0, 100).has_value());
}

TEST(Config, DefaultsWhenUnset)
{
    EnvGuard g1("SLIDELINK_TRANSPORT"), g2("SLIDELINK_PEER"), g3("SLIDELINK_THRESHOLD"),
        g4("SLIDELINK_SUBSCRIBE_MS"), g5("SLIDELINK_CONNECT_TIMEOUT_MS"),
        g6("SLIDELINK_NAME_FILTER"), g7("SLIDELINK_ADAPTER"), g8("SLIDELINK_CTL_SOCK");
    for (auto *g : {&g1, &g2, &g3, &g4, &g5, &g6, &g7, &g8})
        g->unset();

    app::BridgeConfig c = app::config_from_env();
    EXPECT_EQ(c.transport, "loopback");
    EXPECT_EQ(c.adapter, "hci0");
    EXPECT_EQ(c.name_filter, "FEST-X");
    EXPECT_FALSE(c.peer_addr.has_value());
    EXPECT_EQ(c.threshold, 100);
    EXPECT_EQ(c.subscribe_ms, 500u);
    EXPECT_EQ(c.connect_timeout_ms, 10000u);
    EXPECT_TRUE(c.ctl_sock.empty());
}

TEST(Config, ValidOverrides)
{
    EnvGuard g1("SLIDELINK_TRANSPORT"), g2("SLIDELINK_PEER"), g3("SLIDELINK_THRESHOLD"),
        g4("SLIDELINK_SUBSCRIBE_MS"), g5("SLIDELINK_NAME_FILTER");
    g1.set("BlueZ");
    g2.set("aa:bb:cc:dd:ee:ff");
    g3.set("80");
    g4.set("250");
    g5.set("Band");

    app::BridgeConfig c = app::config_from_env();
    EXPECT_EQ(c.transport, "bluez");
    ASSERT_TRUE(c.peer_addr.has_value());
    EXPECT_EQ(*c.peer_addr, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(c.threshold, 80);
    EXPECT_EQ(c.subscribe_ms, 250u);
    EXPECT_EQ(c.name_filter, "Band");
}

TEST(Config, InvalidValuesKeepDefaultsAndWarn)
{
    EnvGuard g1("SLIDELINK_TRANSPORT"), g2("SLIDELINK_PEER"), g3("SLIDELINK_THRESHOLD"),
        g4("SLIDELINK_SUBSCRIBE_MS");
    g1.set("serial");
    g2.set("not-a-mac");
    g3.set("300");
    g4.set("fast");

    slidelink::set_log_level(slidelink::Level::Debug);
    testing::internal::CaptureStderr();
    app::BridgeConfig c = app::config_from_env();
    std::string       err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(c.transport, "loopback");
    EXPECT_FALSE(c.peer_addr.has_value());
    EXPECT_EQ(c.threshold, 100);
    EXPECT_EQ(c.subscribe_ms, 500u);
    EXPECT_NE(err.find("SLIDELINK_THRESHOLD"), std::string::npos);
    EXPECT_NE(err.find("SLIDELINK_PEER"), std::string::npos);
}
