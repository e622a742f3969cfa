// ===================== include/dns_resolver.hpp =====================
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

#include "context.hpp"

namespace netprobe
{
    class DiagLogger;
    class ResultSink;

    struct ResolvedAddress
    {
        int family;
        int socktype;
        int protocol;
        sockaddr_storage addr;
        socklen_t addrlen;

        std::string ip() const;
    };

    class DNSResolver
    {
    public:
        // getaddrinfo bounded by ctx. Throws ProbeError("resolve", ...) on failure.
        static std::vector<ResolvedAddress> resolve(const std::string &host, int port, int socktype,
                                                    Context &ctx);

        // First address of the preferred family ("ip4"/"ip6"), or of the
        // other family when fallback is set.
        static std::optional<ResolvedAddress> pick(const std::vector<ResolvedAddress> &addrs,
                                                   const std::string &ip_protocol, bool fallback);

        // resolve + pick for a probe target; publishes probe_ip_protocol and
        // probe_dns_lookup_time_seconds.
        static ResolvedAddress chooseProtocol(const std::string &host, int port, int socktype,
                                              const std::string &ip_protocol, bool fallback,
                                              Context &ctx, ResultSink &sink, DiagLogger *diag);
    };
} // namespace netprobe
