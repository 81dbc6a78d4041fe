#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        p(sock_path);
    fs::path        dir = p.parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
    }
    // Enforce 0700 on the directory
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
    {
        LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    }
    return true;
}

// Fill a sockaddr_un for sock_path; false (errno set) when the path does not fit.
static bool make_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &addr_len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
    addr.sun_path[sizeof(addr.sun_path) - 1] = '\0';
    addr_len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                      std::strlen(addr.sun_path) + 1);
    return true;
}

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Read until the first '\n' or EOF. Returns false on a socket error.
static bool read_line(int fd, std::string &out)
{
    out.clear();
    char buf[256];
    while (1)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            out.append(buf, static_cast<size_t>(n));
            if (out.find('\n') != std::string::npos)
                break;
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }

    // take first line only, trim optional '\r'
    auto pos = out.find('\n');
    if (pos != std::string::npos)
        out.resize(pos);
    if (!out.empty() && out.back() == '\r')
        out.pop_back();
    return true;
}

static bool write_all(int fd, const std::string &data)
{
    const char *buf  = data.data();
    size_t      len  = data.size();
    size_t      sent = 0;
    while (sent < len)
    {
        ssize_t n = send(fd, buf + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

bool start_server(const std::string &sock_path, const LineHandler &on_line)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!make_addr(sock_path, addr, addr_len))
        return false;

    // ensure parent directory exists (mkdir -p)
    if (!ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // ignore errors

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (listen(fd, 4) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Listening on %s", sock_path.c_str());

    while (1)
    {
        int newfd = accept(fd, nullptr, nullptr);
        if (newfd == -1)
        {
            if (errno == EINTR)
                continue;
            int saved = errno;
            close(fd);
            unlink(sock_path.c_str());
            errno = saved;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            return false;
        }
        set_cloexec(newfd);

        std::string first;
        if (!read_line(newfd, first))
        {
            close(newfd);
            continue;  // keep server alive; accept next connection
        }

        std::string reply = on_line ? on_line(first) : std::string{};
        if (first == "QUIT" && reply.empty())
            reply = "OK";
        if (!reply.empty())
        {
            reply.push_back('\n');
            // a client that does not wait for the reply is not an error
            if (!write_all(newfd, reply))
                LOG_DEBUG("reply to '%s' not delivered", first.c_str());
        }
        close(newfd);

        if (first == "QUIT")
            break;  // graceful shutdown
    }

    close(fd);
    unlink(sock_path.c_str());
    return true;
}

bool send_line(const std::string &sock_path, const std::string &line, std::string *reply)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid line");
        return false;
    }
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!make_addr(sock_path, addr, addr_len))
        return false;

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("connect() failed: %s", std::strerror(errno));
        return false;
    }

    std::string out = line;
    if (out.back() != '\n')
        out.push_back('\n');
    LOG_DEBUG("Sending line: %s", line.c_str());
    if (!write_all(fd, out))
    {
        close(fd);
        return false;
    }

    bool ok = true;
    if (reply)
    {
        // half-close so the server sees EOF even if it reads past the newline
        (void)shutdown(fd, SHUT_WR);
        ok = read_line(fd, *reply);
    }
    close(fd);
    return ok;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))  // non-empty
        {
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
        }
    }
    return p;
}

}  // namespace ipc
