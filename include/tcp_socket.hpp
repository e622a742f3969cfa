// ===================== include/tcp_socket.hpp =====================
#pragma once
#include <string>
#include "byte_stream.hpp"
#include "dns_resolver.hpp"

namespace netprobe
{
    class TcpSocket : public ByteStream
    {
        int sockfd_;

    public:
        TcpSocket();
        ~TcpSocket() override;
        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;

        void closeSocket();
        // Non-blocking connect bounded by ctx. Throws ProbeError("connect", ...).
        void connectTo(const ResolvedAddress &ra, Context &ctx, const std::string &source_ip = "");
        void writeAll(const std::string &data, Context &ctx) override;
        std::size_t readSome(char *buf, std::size_t len, Context &ctx) override;
        int fd() const { return sockfd_; }
    };
} // namespace netprobe
