// ===================== src/icmp_probe.cpp =====================
#include "icmp_probe.hpp"
#include "diag_logger.hpp"
#include "dns_resolver.hpp"
#include "icmp_socket.hpp"
#include "result_sink.hpp"

#include <cstdio>
#include <random>

namespace netprobe
{
    namespace
    {
        const char kMarker[] = "netprobe icmp echo";
    } // namespace

    std::string IcmpProber::payload(std::size_t size)
    {
        std::string data(kMarker);
        if (size > 0)
            data.resize(size, '\0');
        return data;
    }

    bool IcmpProber::probe(Context &ctx, const std::string &target, const Module &module,
                           ResultSink &sink, DiagLogger *diag)
    {
        const IcmpProbeConfig &cfg = module.icmp;

        sink.describe("probe_icmp_duration_seconds", "Duration of icmp request by phase");
        sink.describe("probe_icmp_reply_hop_limit", "Replied packet hop limit (TTL for ipv4)");

        try
        {
            // ICMP has no ports; SOCK_DGRAM only keeps getaddrinfo to one entry per address.
            ResolvedAddress dst = DNSResolver::chooseProtocol(target, 0, SOCK_DGRAM, cfg.ip_protocol,
                                                              cfg.ip_protocol_fallback, ctx, sink, diag);

            IcmpEchoSocket sock;
            sock.open(dst.family, cfg.source_ip_address, cfg.dont_fragment && dst.family == AF_INET);

            static thread_local std::mt19937 rng{std::random_device{}()};
            const uint16_t id = static_cast<uint16_t>(rng());
            const uint16_t seq = static_cast<uint16_t>(rng());
            const std::string data = payload(cfg.payload_size);
            if (diag)
                diag->log("ICMP_SEND dst=" + dst.ip() + " raw=" + (sock.raw() ? "1" : "0") +
                          " id=" + std::to_string(id) + " seq=" + std::to_string(seq) +
                          " bytes=" + std::to_string(data.size()));

            const auto t0 = clk::now();
            sock.sendEcho(dst, id, seq, data, ctx);
            IcmpEchoSocket::Reply reply = sock.awaitReply(dst, id, seq, data, ctx);
            const double rtt = std::chrono::duration<double>(clk::now() - t0).count();

            sink.set("probe_icmp_duration_seconds", rtt, {{"phase", "rtt"}});
            if (reply.hop_limit)
                sink.set("probe_icmp_reply_hop_limit", *reply.hop_limit);

            if (diag)
            {
                char rtt_ms[32];
                std::snprintf(rtt_ms, sizeof(rtt_ms), "%.3f", rtt * 1000.0);
                diag->log("ICMP_REPLY from=" + reply.from_ip + " rtt_ms=" + rtt_ms + " hop_limit=" +
                          (reply.hop_limit ? std::to_string(*reply.hop_limit) : std::string("-")));
            }
        }
        catch (const DeadlineExceeded &e)
        {
            if (diag)
                diag->log("ICMP_PROBE_TIMEOUT phase=" + e.phase() + " err=" + e.what());
            return false;
        }
        catch (const ProbeError &e)
        {
            if (diag)
                diag->log("ICMP_PROBE_FAIL phase=" + e.phase() + " err=" + e.what());
            return false;
        }
        catch (const std::exception &e)
        {
            if (diag)
                diag->log(std::string("ICMP_PROBE_FAIL err=") + e.what());
            return false;
        }

        if (diag)
            diag->log("ICMP_PROBE_DONE success=1");
        return true;
    }
} // namespace netprobe
