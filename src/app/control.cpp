#include <string>

#include "app/control.hpp"
#include "util/log.hpp"
#include "util/mac.hpp"

namespace app
{

namespace
{
std::string trim(std::string s)
{
    auto l = s.find_first_not_of(" \t\r");
    if (l == std::string::npos)
        return {};
    auto r = s.find_last_not_of(" \t\r");
    return s.substr(l, r - l + 1);
}
}  // namespace

std::string handle_control_line(const std::string &line, LinkManager &mgr,
                                const StatePublisher &pub)
{
    if (line == "STATE")
    {
        int code = pub.current();
        return std::to_string(code) + " " + signal_code_name(code);
    }
    if (line == "LINK")
    {
        std::string addr = mgr.address();
        return std::string(link_state_name(mgr.state())) + " " +
               (addr.empty() ? std::string("-") : addr);
    }
    if (line == "CONNECT" || line.rfind("CONNECT ", 0) == 0)
    {
        std::string m = mac::normalize(trim(line.substr(7)));
        if (!mac::is_valid(m))
        {
            LOG_WARN("[CONNECT] invalid MAC address: '%s'", m.c_str());
            return "ERR invalid address";
        }
        LinkError e = mgr.connect(m);
        if (e != LinkError::None)
        {
            LOG_WARN("[CONNECT] %s refused: %s", m.c_str(), link_error_name(e));
            return std::string("ERR ") + link_error_name(e);
        }
        return "OK";
    }
    if (line == "DISCONNECT")
    {
        mgr.disconnect();
        return "OK";
    }
    if (line == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "OK";
    }
    LOG_WARN("Unknown control line: %s", line.c_str());
    return "ERR unknown command";
}

}  // namespace app
