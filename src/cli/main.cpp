#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"
#include "util/mac.hpp"

namespace
{

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  slidelinkctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  state                      current signal (code and name)\n"
                         "  link                       link state and peer address\n"
                         "  connect AA:BB:CC:DD:EE:FF\n"
                         "  disconnect\n"
                         "  quit\n");
}

// Send one request, print the reply. "ERR ..." replies map to failure.
static int request(const std::string &sock, const std::string &line)
{
    std::string reply;
    if (!ipc::send_line(sock, line, &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    if (reply.rfind("ERR", 0) == 0)
    {
        std::fprintf(stderr, "%s\n", reply.c_str());
        return exitc::failure;
    }
    std::printf("%s\n", reply.c_str());
    return exitc::ok;
}

static int run_cmd(const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send)
{
    auto no_args = [&](const char *line) -> std::function<int()> {
        return [&, line]() -> int {
            if (args.size() != 1)
            {
                print_usage();
                return exitc::bad_args;
            }
            return send(line);
        };
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"state", no_args("STATE")},
        {"link", no_args("LINK")},
        {"connect",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string m = mac::normalize(args[1]);
             if (!mac::is_valid(m))
             {
                 std::fprintf(stderr, "error: invalid MAC address: %s\n", args[1].c_str());
                 return exitc::bad_args;
             }
             return send("CONNECT " + m);
         }},
        {"disconnect", no_args("DISCONNECT")},
        {"quit", no_args("QUIT")},
    };

    auto it = cmd_map.find(args[0]);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", args[0].c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", args[0].c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    slidelink::set_log_level_from_env();
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    std::vector<std::string> args;
    args.reserve(argc - 1);

    // --sock beats SLIDELINK_CTL_SOCK, which beats the default path
    std::string sock_opt;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock")
        {
            if (i + 1 >= argc)
            {
                print_usage();
                return exitc::bad_args;
            }
            sock_opt = argv[++i];
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    std::string sock = ipc::expand_user(sock_opt.empty() ? constants::ctl_sock_path() : sock_opt);
    auto sender = [&](const std::string &line) -> int { return request(sock, line); };
    return run_cmd(args, sender);
}
