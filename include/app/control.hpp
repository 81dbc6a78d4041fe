#pragma once
#include <string>

#include "app/link_manager.hpp"
#include "app/state_publisher.hpp"

namespace app
{

// Control protocol, one request line -> one reply line:
//   STATE            -> "<code> <NAME>"            e.g. "2 RIGHT"
//   LINK             -> "<STATE> <addr|->"         e.g. "CONNECTED C0:FF:EE:00:00:01"
//   CONNECT <mac>    -> "OK" | "ERR <reason>"
//   DISCONNECT       -> "OK"
//   QUIT             -> "OK" (the server stops after replying)
// Anything else     -> "ERR unknown command"
std::string handle_control_line(const std::string &line, LinkManager &mgr,
                                const StatePublisher &pub);

}  // namespace app
