#pragma once
#include <functional>
#include <string>

namespace ipc
{

// One request line in, one reply line out (reply may be empty).
using LineHandler = std::function<std::string(const std::string &line)>;

// Serve sock_path until a "QUIT" line arrives; the socket file is removed on return.
bool start_server(const std::string &sock_path, const LineHandler &on_line);

// Send one line; when reply is non-null, wait for the server's reply (trailing newline trimmed).
bool send_line(const std::string &sock_path, const std::string &line,
               std::string *reply = nullptr);

std::string expand_user(const std::string &path);

}  // namespace ipc
