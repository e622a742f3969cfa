// ===================== src/tcp_socket.cpp =====================
#include "tcp_socket.hpp"
#include "utils_net.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace netprobe
{
    TcpSocket::TcpSocket() : sockfd_(-1) {}
    TcpSocket::~TcpSocket() { closeSocket(); }

    void TcpSocket::closeSocket()
    {
        if (sockfd_ != -1)
        {
            ::close(sockfd_);
            sockfd_ = -1;
        }
    }

    void TcpSocket::connectTo(const ResolvedAddress &ra, Context &ctx, const std::string &source_ip)
    {
        closeSocket();
        sockfd_ = ::socket(ra.family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (sockfd_ == -1)
            throw ProbeError("connect", std::string("socket: ") + std::strerror(errno));

        if (!source_ip.empty())
            net::bind_source(sockfd_, ra.family, source_ip);

        if (::connect(sockfd_, reinterpret_cast<const sockaddr *>(&ra.addr), ra.addrlen) == 0)
            return;
        if (errno != EINPROGRESS)
            throw ProbeError("connect", "dial " + ra.ip() + ": " + std::strerror(errno));

        ctx.waitFor(sockfd_, POLLOUT, "connect");

        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(sockfd_, SOL_SOCKET, SO_ERROR, &err, &len) != 0)
            err = errno;
        if (err != 0)
            throw ProbeError("connect", "dial " + ra.ip() + ": " + std::strerror(err));
    }

    void TcpSocket::writeAll(const std::string &data, Context &ctx)
    {
        if (sockfd_ == -1)
            throw ProbeError("write", "socket not connected");

        size_t off = 0;
        while (off < data.size())
        {
            ssize_t n = ::send(sockfd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
            if (n >= 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                ctx.waitFor(sockfd_, POLLOUT, "write");
                continue;
            }
            throw ProbeError("write", std::string("send: ") + std::strerror(errno));
        }
    }

    std::size_t TcpSocket::readSome(char *buf, std::size_t len, Context &ctx)
    {
        if (sockfd_ == -1)
            throw ProbeError("read", "socket not connected");

        while (true)
        {
            ssize_t n = ::recv(sockfd_, buf, len, 0);
            if (n >= 0)
                return static_cast<size_t>(n);
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                ctx.waitFor(sockfd_, POLLIN, "read");
                continue;
            }
            throw ProbeError("read", std::string("recv: ") + std::strerror(errno));
        }
    }
} // namespace netprobe
