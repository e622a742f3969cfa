// ===================== src/icmp_socket.cpp =====================
#include "icmp_socket.hpp"
#include "utils_net.hpp"

#include <cerrno>
#include <cstring>
#include <netinet/icmp6.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/uio.h>
#include <unistd.h>

namespace netprobe
{
    namespace
    {
        uint16_t be16(const uint8_t *p)
        {
            return static_cast<uint16_t>((p[0] << 8) | p[1]);
        }
    } // namespace

    void IcmpEchoSocket::open(int family, const std::string &source_ip, bool dont_fragment)
    {
        close();
        family_ = family;
        const int proto = family == AF_INET ? IPPROTO_ICMP : IPPROTO_ICMPV6;

        fd_ = ::socket(family, SOCK_RAW | SOCK_NONBLOCK | SOCK_CLOEXEC, proto);
        raw_ = fd_ != -1;
        if (fd_ == -1)
        {
            const int raw_err = errno;
            fd_ = ::socket(family, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, proto);
            if (fd_ == -1)
                throw ProbeError("setup", std::string("cannot open ICMP socket: raw: ") + std::strerror(raw_err) +
                                              ", datagram: " + std::strerror(errno));
        }

        if (!source_ip.empty())
            net::bind_source(fd_, family, source_ip);

        int on = 1;
        if (family == AF_INET)
        {
            // raw IPv4 sockets see the IP header and read the TTL from there
            if (!raw_ && ::setsockopt(fd_, IPPROTO_IP, IP_RECVTTL, &on, sizeof(on)) != 0)
                throw ProbeError("setup", std::string("setsockopt(IP_RECVTTL): ") + std::strerror(errno));
            if (dont_fragment)
            {
                int pmtu = IP_PMTUDISC_DO;
                if (::setsockopt(fd_, IPPROTO_IP, IP_MTU_DISCOVER, &pmtu, sizeof(pmtu)) != 0)
                    throw ProbeError("setup", std::string("setsockopt(IP_MTU_DISCOVER): ") + std::strerror(errno));
            }
        }
        else if (::setsockopt(fd_, IPPROTO_IPV6, IPV6_RECVHOPLIMIT, &on, sizeof(on)) != 0)
        {
            throw ProbeError("setup", std::string("setsockopt(IPV6_RECVHOPLIMIT): ") + std::strerror(errno));
        }
    }

    void IcmpEchoSocket::close()
    {
        if (fd_ != -1)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    void IcmpEchoSocket::sendEcho(const ResolvedAddress &dst, uint16_t id, uint16_t seq, const std::string &payload,
                                  Context &ctx)
    {
        std::string pkt(8 + payload.size(), '\0');
        pkt[0] = static_cast<char>(family_ == AF_INET ? ICMP_ECHO : ICMP6_ECHO_REQUEST);
        pkt[4] = static_cast<char>(id >> 8);
        pkt[5] = static_cast<char>(id & 0xFF);
        pkt[6] = static_cast<char>(seq >> 8);
        pkt[7] = static_cast<char>(seq & 0xFF);
        std::memcpy(&pkt[8], payload.data(), payload.size());
        if (family_ == AF_INET)
        {
            // the kernel fills in the ICMPv6 checksum itself
            uint16_t sum = net::csum16(pkt.data(), pkt.size());
            std::memcpy(&pkt[2], &sum, sizeof(sum));
        }

        while (true)
        {
            ssize_t n = ::sendto(fd_, pkt.data(), pkt.size(), 0, reinterpret_cast<const sockaddr *>(&dst.addr),
                                 dst.addrlen);
            if (n >= 0)
                return;
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                ctx.waitFor(fd_, POLLOUT, "write");
                continue;
            }
            throw ProbeError("write", "sendto " + dst.ip() + ": " + std::strerror(errno));
        }
    }

    IcmpEchoSocket::Reply IcmpEchoSocket::awaitReply(const ResolvedAddress &dst, uint16_t id, uint16_t seq,
                                                     const std::string &payload, Context &ctx)
    {
        const uint8_t want_type = family_ == AF_INET ? ICMP_ECHOREPLY : ICMP6_ECHO_REPLY;
        const std::string want_from = dst.ip();

        uint8_t buf[65536];
        char cbuf[256];
        while (true)
        {
            ctx.waitFor(fd_, POLLIN, "rtt");

            sockaddr_storage from{};
            iovec iov{buf, sizeof(buf)};
            msghdr mh{};
            mh.msg_name = &from;
            mh.msg_namelen = sizeof(from);
            mh.msg_iov = &iov;
            mh.msg_iovlen = 1;
            mh.msg_control = cbuf;
            mh.msg_controllen = sizeof(cbuf);

            ssize_t n = ::recvmsg(fd_, &mh, 0);
            if (n < 0)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                    continue;
                throw ProbeError("read", std::string("recvmsg: ") + std::strerror(errno));
            }

            Reply reply;
            size_t off = 0;
            if (family_ == AF_INET && raw_)
            {
                if (n < static_cast<ssize_t>(sizeof(iphdr)))
                    continue;
                off = static_cast<size_t>(buf[0] & 0x0F) * 4;
                reply.hop_limit = buf[8];
            }
            if (static_cast<size_t>(n) < off + 8)
                continue;

            const uint8_t *icmp = buf + off;
            if (icmp[0] != want_type)
                continue;
            if (raw_ && be16(icmp + 4) != id)
                continue; // datagram sockets get their id rewritten by the kernel
            if (be16(icmp + 6) != seq)
                continue;
            if (net::addr_to_string(from) != want_from)
                continue;
            if (std::string(reinterpret_cast<const char *>(icmp + 8), static_cast<size_t>(n) - off - 8) != payload)
                continue;

            for (cmsghdr *c = CMSG_FIRSTHDR(&mh); c != nullptr; c = CMSG_NXTHDR(&mh, c))
            {
                if ((c->cmsg_level == IPPROTO_IP && c->cmsg_type == IP_TTL) ||
                    (c->cmsg_level == IPPROTO_IPV6 && c->cmsg_type == IPV6_HOPLIMIT))
                {
                    int v = 0;
                    std::memcpy(&v, CMSG_DATA(c), sizeof(v));
                    reply.hop_limit = v;
                }
            }
            reply.from_ip = want_from;
            return reply;
        }
    }
} // namespace netprobe
