#include "net/Probe.hpp"

#include "utils/Log.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tbl::net
{

namespace
{

class SocketGuard
{
  public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
        }
    }
    SocketGuard(SocketGuard const &) = delete;
    SocketGuard &operator=(SocketGuard const &) = delete;

    int get() const noexcept { return fd_; }

  private:
    int fd_;
};

bool connect_with_timeout(addrinfo const *ai, std::chrono::milliseconds timeout)
{
    SocketGuard sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (sock.get() < 0)
    {
        return false;
    }
    int flags = ::fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0)
    {
        return false;
    }
    int rc = ::connect(sock.get(), ai->ai_addr, ai->ai_addrlen);
    if (rc == 0)
    {
        return true;
    }
    if (errno != EINPROGRESS)
    {
        return false;
    }
    pollfd pfd{};
    pfd.fd = sock.get();
    pfd.events = POLLOUT;
    do
    {
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);
    if (rc <= 0)
    {
        return false;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0)
    {
        return false;
    }
    return so_error == 0;
}

} // namespace

bool port_is_open(std::string const &host, std::uint16_t port,
                  std::chrono::milliseconds timeout)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;
    addrinfo *results = nullptr;
    auto service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0 || results == nullptr)
    {
        TBL_LOG_DEBUG("cannot resolve {}: {}", host, gai_strerror(rc));
        return false;
    }
    bool open = false;
    for (auto *ai = results; ai != nullptr && !open; ai = ai->ai_next)
    {
        open = connect_with_timeout(ai, timeout);
    }
    ::freeaddrinfo(results);
    return open;
}

} // namespace tbl::net
