#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <thread>
#include <unistd.h>

#include "ctl/ipc.hpp"

TEST(IPC, TestExpandUser)
{
    const char *path      = std::getenv("HOME");
    std::string saved     = path ? path : "";
    const char *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");

    if (path)
        setenv("HOME", saved.c_str(), 1);
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char *path  = std::getenv("HOME");
    std::string saved = path ? path : "";
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", saved.c_str(), 1);
}

TEST(IPC, TestStartServerAndSendLine)
{
    // temporary socket path
    std::string sock = "/tmp/slidelink-ipc-ut-" + std::to_string(getpid()) + ".sock";

    // run server (blocks until QUIT)
    std::thread th([&] { ipc::start_server(sock, nullptr); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    std::string reply;
    ASSERT_TRUE(ipc::send_line(sock, "QUIT", &reply));
    th.join();
    EXPECT_EQ(reply, "OK");
    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, TestRequestReply)
{
    std::string sock = "/tmp/slidelink-ipc-rr-" + std::to_string(getpid()) + ".sock";

    std::thread th([&] {
        ipc::start_server(sock, [](const std::string &line) -> std::string {
            if (line == "STATE")
                return "2 RIGHT";
            if (line == "QUIT")
                return "";
            return "ERR unknown command";
        });
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::string reply;
    ASSERT_TRUE(ipc::send_line(sock, "STATE", &reply));
    EXPECT_EQ(reply, "2 RIGHT");
    ASSERT_TRUE(ipc::send_line(sock, "BOGUS", &reply));
    EXPECT_EQ(reply, "ERR unknown command");
    // fire-and-forget still reaches the server
    ASSERT_TRUE(ipc::send_line(sock, "STATE"));
    ASSERT_TRUE(ipc::send_line(sock, "QUIT", &reply));
    th.join();
    EXPECT_EQ(reply, "OK");
}

TEST(IPC, TestSendLineNoServer)
{
    std::string sock = "/tmp/slidelink-ipc-none-" + std::to_string(getpid()) + ".sock";
    unlink(sock.c_str());
    EXPECT_FALSE(ipc::send_line(sock, "STATE"));
    EXPECT_FALSE(ipc::send_line(sock, ""));
}
