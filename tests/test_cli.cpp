// tests/test_cli.cpp
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/exitcodes.hpp"

using namespace std::chrono_literals;

namespace test_cli
{
std::mutex               g_mu;
std::vector<std::string> g_lines_seen;

// stands in for the daemon's command handler
static std::string on_line_cb(const std::string &line)
{
    {
        std::lock_guard<std::mutex> lockguard(g_mu);
        g_lines_seen.push_back(line);
    }
    if (line == "STATE")
        return "2 RIGHT";
    if (line == "LINK")
        return "CONNECTED C0:FF:EE:00:00:01";
    if (line.rfind("CONNECT ", 0) == 0)
        return "ERR invalid state";
    if (line == "DISCONNECT" || line == "QUIT")
        return "OK";
    return "ERR unknown command";
}

static std::string temp_sock_path()
{
    const char *tmp  = std::getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    return base + "/slidelink-cli-test-" + std::to_string(::getpid()) + ".sock";
}

static int run_cli(const std::string &sock, const std::string &args)
{
    // ctest runs from the build directory; binaries live in ./bin
    std::string cmd = "./bin/slidelinkctl --sock " + sock + " " + args + " >/dev/null 2>&1";
    int         rc  = std::system(cmd.c_str());
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}
}  // namespace test_cli

TEST(CLI, TestCliFunctionalality)
{
    test_cli::g_lines_seen.clear();
    const auto sock = test_cli::temp_sock_path();

    std::atomic<bool> server_done{false};
    std::thread       th([&] {
        (void)ipc::start_server(sock, test_cli::on_line_cb);
        server_done.store(true);
    });

    // Wait for server to bind the socket
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            break;
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(access(sock.c_str(), F_OK) == 0) << "socket not created: " << sock;

    // Exercise CLI argument parsing + IPC
    EXPECT_EQ(test_cli::run_cli(sock, "state"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "link"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "connect c0:ff:ee:00:00:01"), exitc::failure);
    EXPECT_EQ(test_cli::run_cli(sock, "disconnect"), exitc::ok);

    // rejected locally, never sent
    EXPECT_EQ(test_cli::run_cli(sock, "connect nope"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "state extra"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "frobnicate"), exitc::bad_args);

    EXPECT_EQ(test_cli::run_cli(sock, "quit"), exitc::ok);

    th.join();
    ASSERT_TRUE(server_done.load());

    // Validate the lines the daemon saw
    {
        std::lock_guard<std::mutex> lockguard(test_cli::g_mu);
        ASSERT_EQ(test_cli::g_lines_seen.size(), 5u);
        EXPECT_EQ(test_cli::g_lines_seen[0], "STATE");
        EXPECT_EQ(test_cli::g_lines_seen[1], "LINK");
        EXPECT_EQ(test_cli::g_lines_seen[2], "CONNECT C0:FF:EE:00:00:01");
        EXPECT_EQ(test_cli::g_lines_seen[3], "DISCONNECT");
        EXPECT_EQ(test_cli::g_lines_seen.back(), "QUIT");
    }

    // start_server should have cleaned up the socket file
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(CLI, TestCliNoDaemon)
{
    const auto sock = test_cli::temp_sock_path() + ".absent";
    unlink(sock.c_str());
    EXPECT_EQ(test_cli::run_cli(sock, "state"), exitc::no_server);
    EXPECT_EQ(test_cli::run_cli(sock, "--help"), exitc::ok);
}
