// ===================== include/icmp_socket.hpp =====================
#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "context.hpp"
#include "dns_resolver.hpp"

namespace netprobe
{
    // ICMP / ICMPv6 echo socket. Prefers a raw socket and falls back to the
    // unprivileged datagram flavour (net.ipv4.ping_group_range).
    class IcmpEchoSocket
    {
    public:
        struct Reply
        {
            std::string from_ip;
            std::optional<int> hop_limit; // TTL / hop limit of the reply, when known
        };

        IcmpEchoSocket() = default;
        ~IcmpEchoSocket() { close(); }
        IcmpEchoSocket(const IcmpEchoSocket &) = delete;
        IcmpEchoSocket &operator=(const IcmpEchoSocket &) = delete;

        // Throws ProbeError("setup", ...) when neither socket type may be
        // opened; permission errors name EPERM/EACCES in the message.
        void open(int family, const std::string &source_ip, bool dont_fragment);
        void close();
        int fd() const { return fd_; }
        bool raw() const { return raw_; }

        void sendEcho(const ResolvedAddress &dst, uint16_t id, uint16_t seq, const std::string &payload,
                      Context &ctx);

        // Waits for the echo reply matching seq (and id on raw sockets)
        // from dst, skipping anything else.
        Reply awaitReply(const ResolvedAddress &dst, uint16_t id, uint16_t seq, const std::string &payload,
                         Context &ctx);

    private:
        int fd_ = -1;
        int family_ = 0;
        bool raw_ = false;
    };
} // namespace netprobe
