// ===================== src/dns_resolver.cpp =====================
#include "dns_resolver.hpp"
#include "diag_logger.hpp"
#include "result_sink.hpp"
#include "utils_net.hpp"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <poll.h>
#include <sys/eventfd.h>
#include <thread>
#include <unistd.h>

namespace netprobe
{
    namespace
    {
        // Owned jointly by the caller and the lookup thread, so the caller
        // may give up at its deadline while getaddrinfo is still running.
        struct Lookup
        {
            std::string host;
            std::string port;
            int socktype = SOCK_STREAM;
            int status = 0;
            addrinfo *res = nullptr;
            // publishes status and res to the caller
            std::atomic<bool> done{false};
            int done_fd = -1;

            ~Lookup()
            {
                if (res)
                    freeaddrinfo(res);
                if (done_fd != -1)
                    ::close(done_fd);
            }
        };

        std::vector<ResolvedAddress> collect(const addrinfo *res)
        {
            std::vector<ResolvedAddress> results;
            for (auto *p = res; p != nullptr; p = p->ai_next)
            {
                ResolvedAddress ra{};
                ra.family = p->ai_family;
                ra.socktype = p->ai_socktype;
                ra.protocol = p->ai_protocol;
                ra.addrlen = static_cast<socklen_t>(p->ai_addrlen);
                std::memcpy(&ra.addr, p->ai_addr, p->ai_addrlen);
                results.push_back(ra);
            }
            return results;
        }

        std::string gai_error(const std::string &host, int status)
        {
            return std::string("DNS resolution failed for ") + host + ": " + gai_strerror(status);
        }
    } // namespace

    std::string ResolvedAddress::ip() const
    {
        return net::addr_to_string(addr);
    }

    std::vector<ResolvedAddress> DNSResolver::resolve(const std::string &host, int port, int socktype,
                                                      Context &ctx)
    {
        ctx.check("resolve");

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = socktype;
        const std::string portStr = std::to_string(port);

        // Literal addresses never block.
        if (net::is_ip_literal(host))
        {
            hints.ai_flags = AI_NUMERICHOST;
            addrinfo *res = nullptr;
            int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
            if (status != 0)
                throw ProbeError("resolve", gai_error(host, status));
            auto results = collect(res);
            freeaddrinfo(res);
            return results;
        }

        auto job = std::make_shared<Lookup>();
        job->host = host;
        job->port = portStr;
        job->socktype = socktype;
        job->done_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (job->done_fd == -1)
            throw ProbeError("resolve", std::string("eventfd failed: ") + std::strerror(errno));

        std::thread([job]() {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = job->socktype;
            job->status = getaddrinfo(job->host.c_str(), job->port.c_str(), &hints, &job->res);
            job->done.store(true, std::memory_order_release);
            uint64_t one = 1;
            (void)::write(job->done_fd, &one, sizeof(one));
        }).detach();

        while (!job->done.load(std::memory_order_acquire))
            ctx.waitFor(job->done_fd, POLLIN, "resolve");

        if (job->status != 0)
            throw ProbeError("resolve", gai_error(host, job->status));
        auto results = collect(job->res);
        if (results.empty())
            throw ProbeError("resolve", "no addresses found for " + host);
        return results;
    }

    std::optional<ResolvedAddress> DNSResolver::pick(const std::vector<ResolvedAddress> &addrs,
                                                     const std::string &ip_protocol, bool fallback)
    {
        const int preferred = (ip_protocol == "ip4") ? AF_INET : AF_INET6;
        for (const auto &ra : addrs)
            if (ra.family == preferred)
                return ra;
        if (!fallback)
            return std::nullopt;
        for (const auto &ra : addrs)
            if (ra.family == AF_INET || ra.family == AF_INET6)
                return ra;
        return std::nullopt;
    }

    ResolvedAddress DNSResolver::chooseProtocol(const std::string &host, int port, int socktype,
                                                const std::string &ip_protocol, bool fallback,
                                                Context &ctx, ResultSink &sink, DiagLogger *diag)
    {
        sink.describe("probe_ip_protocol", "Specifies whether probe ip protocol is IP4 or IP6");
        sink.describe("probe_dns_lookup_time_seconds", "Returns the time taken for probe dns lookup in seconds");

        if (diag)
            diag->log("RESOLVE target=" + host + " ip_protocol=" + ip_protocol +
                      " fallback=" + (fallback ? "1" : "0"));

        const auto t0 = clk::now();
        auto addrs = resolve(host, port, socktype, ctx);
        auto chosen = pick(addrs, ip_protocol, fallback);
        sink.set("probe_dns_lookup_time_seconds",
                 std::chrono::duration<double>(clk::now() - t0).count());
        if (!chosen)
            throw ProbeError("resolve", "no " + ip_protocol + " address for " + host + " and fallback disabled");

        sink.set("probe_ip_protocol", chosen->family == AF_INET ? 4 : 6);
        if (diag)
            diag->log("RESOLVED target=" + host + " ip=" + chosen->ip());
        return *chosen;
    }
} // namespace netprobe
