// ===================== src/dns_probe.cpp =====================
#include "dns_probe.hpp"
#include "diag_logger.hpp"
#include "dns_message.hpp"
#include "dns_resolver.hpp"
#include "result_sink.hpp"
#include "tcp_socket.hpp"
#include "utils_net.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <random>
#include <regex>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace netprobe
{
    namespace
    {
        uint16_t make_id()
        {
            static thread_local std::mt19937 rng{std::random_device{}()};
            return static_cast<uint16_t>(rng());
        }

        struct CompiledValidator
        {
            std::vector<std::regex> fail_if_matches;
            std::vector<std::regex> fail_if_not_matches;

            explicit CompiledValidator(const DnsRRValidator &v)
            {
                for (const auto &p : v.fail_if_matches_regexp)
                    fail_if_matches.emplace_back(p, std::regex::ECMAScript);
                for (const auto &p : v.fail_if_not_matches_regexp)
                    fail_if_not_matches.emplace_back(p, std::regex::ECMAScript);
            }
        };

        bool valid_rrs(const std::vector<dns::ResourceRecord> &rrs, const CompiledValidator &v,
                       const char *section, DiagLogger *diag)
        {
            for (const auto &rr : rrs)
            {
                const std::string text = rr.toString();
                for (const auto &re : v.fail_if_matches)
                {
                    if (std::regex_search(text, re))
                    {
                        if (diag)
                            diag->log(std::string("CHECK_FAIL kind=rr_matches section=") + section + " rr=" + text);
                        return false;
                    }
                }
                for (const auto &re : v.fail_if_not_matches)
                {
                    if (!std::regex_search(text, re))
                    {
                        if (diag)
                            diag->log(std::string("CHECK_FAIL kind=rr_not_matches section=") + section + " rr=" + text);
                        return false;
                    }
                }
            }
            return true;
        }

        std::string exchange_udp(const ResolvedAddress &server, const std::string &query, uint16_t id,
                                 const std::string &source_ip, Context &ctx)
        {
            net::ScopedFd fd(::socket(server.family, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
            if (fd.get() == -1)
                throw ProbeError("setup", std::string("socket: ") + std::strerror(errno));
            if (!source_ip.empty())
                net::bind_source(fd.get(), server.family, source_ip);
            // connected, so the kernel drops datagrams from other peers
            if (::connect(fd.get(), reinterpret_cast<const sockaddr *>(&server.addr), server.addrlen) != 0)
                throw ProbeError("connect", "dial " + server.ip() + ": " + std::strerror(errno));
            if (::send(fd.get(), query.data(), query.size(), 0) < 0)
                throw ProbeError("write", std::string("send: ") + std::strerror(errno));

            char buf[65535];
            while (true)
            {
                ctx.waitFor(fd.get(), POLLIN, "read");
                ssize_t n = ::recv(fd.get(), buf, sizeof(buf), 0);
                if (n < 0)
                {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                        continue;
                    throw ProbeError("read", std::string("recv: ") + std::strerror(errno));
                }
                if (n < 2)
                    continue;
                uint16_t got = static_cast<uint16_t>((static_cast<uint8_t>(buf[0]) << 8) | static_cast<uint8_t>(buf[1]));
                if (got != id)
                    continue; // stale or spoofed reply
                return std::string(buf, static_cast<size_t>(n));
            }
        }

        void read_exact(ByteStream &stream, std::string &out, std::size_t n, Context &ctx)
        {
            char tmp[4096];
            while (out.size() < n)
            {
                size_t got = stream.readSome(tmp, std::min(sizeof(tmp), n - out.size()), ctx);
                if (got == 0)
                    throw ProbeError("read", "connection closed before full DNS response");
                out.append(tmp, got);
            }
        }

        std::string exchange_tcp(const ResolvedAddress &server, const std::string &query,
                                 const std::string &source_ip, Context &ctx)
        {
            TcpSocket sock;
            sock.connectTo(server, ctx, source_ip);

            std::string framed;
            framed += static_cast<char>(query.size() >> 8);
            framed += static_cast<char>(query.size() & 0xFF);
            framed += query;
            sock.writeAll(framed, ctx);

            std::string len;
            read_exact(sock, len, 2, ctx);
            size_t n = (static_cast<uint8_t>(len[0]) << 8) | static_cast<uint8_t>(len[1]);
            std::string resp;
            read_exact(sock, resp, n, ctx);
            return resp;
        }
    } // namespace

    bool DnsProber::probe(Context &ctx, const std::string &target, const Module &module,
                          ResultSink &sink, DiagLogger *diag)
    {
        const DnsProbeConfig &cfg = module.dns;

        sink.describe("probe_dns_duration_seconds", "Duration of DNS request by phase");
        sink.describe("probe_dns_answer_rrs", "Returns number of entries in the answer resource record list");
        sink.describe("probe_dns_authority_rrs", "Returns number of entries in the authority resource record list");
        sink.describe("probe_dns_additional_rrs", "Returns number of entries in the additional resource record list");
        sink.set("probe_dns_answer_rrs", 0);
        sink.set("probe_dns_authority_rrs", 0);
        sink.set("probe_dns_additional_rrs", 0);

        bool success = false;
        try
        {
            if (cfg.query_name.empty())
                throw std::invalid_argument("query_name must be set");
            const uint16_t qtype = dns::typeFromString(cfg.query_type.empty() ? std::string("ANY") : cfg.query_type);
            const std::string transport = cfg.transport_protocol.empty() ? std::string("udp") : cfg.transport_protocol;
            if (transport != "udp" && transport != "tcp")
                throw std::invalid_argument("transport_protocol must be udp or tcp, got " + transport);

            std::vector<int> valid_rcodes;
            for (const auto &name : cfg.valid_rcodes)
            {
                auto rc = dns::rcodeFromString(name);
                if (!rc)
                    throw std::invalid_argument("unknown rcode " + name);
                valid_rcodes.push_back(*rc);
            }
            if (valid_rcodes.empty())
                valid_rcodes.push_back(0);

            const CompiledValidator answer(cfg.validate_answer_rrs);
            const CompiledValidator authority(cfg.validate_authority_rrs);
            const CompiledValidator additional(cfg.validate_additional_rrs);

            const auto hp = net::split_host_port(target, 53);
            const int socktype = transport == "udp" ? SOCK_DGRAM : SOCK_STREAM;
            ResolvedAddress server = DNSResolver::chooseProtocol(hp.first, hp.second, socktype, cfg.ip_protocol,
                                                                 cfg.ip_protocol_fallback, ctx, sink, diag);

            const uint16_t id = make_id();
            const std::string query = dns::buildQuery(id, cfg.query_name, qtype, cfg.recursion_desired);
            if (diag)
                diag->log("DNS_QUERY server=" + server.ip() + " port=" + std::to_string(hp.second) +
                          " transport=" + transport + " qname=" + cfg.query_name + " qtype=" + dns::typeToString(qtype));

            const auto t0 = clk::now();
            const std::string wire = transport == "udp" ? exchange_udp(server, query, id, cfg.source_ip_address, ctx)
                                                        : exchange_tcp(server, query, cfg.source_ip_address, ctx);
            sink.set("probe_dns_duration_seconds", std::chrono::duration<double>(clk::now() - t0).count(),
                     {{"phase", "resolve"}});

            const dns::Message msg = dns::parseMessage(wire);
            if (msg.id != id)
                throw ProbeError("read", "DNS response id mismatch");
            sink.set("probe_dns_answer_rrs", static_cast<double>(msg.answers.size()));
            sink.set("probe_dns_authority_rrs", static_cast<double>(msg.authority.size()));
            sink.set("probe_dns_additional_rrs", static_cast<double>(msg.additional.size()));
            if (diag)
                diag->log("DNS_RESPONSE rcode=" + dns::rcodeToString(msg.rcode()) +
                          " answers=" + std::to_string(msg.answers.size()) +
                          " authority=" + std::to_string(msg.authority.size()) +
                          " additional=" + std::to_string(msg.additional.size()));

            success = std::find(valid_rcodes.begin(), valid_rcodes.end(), msg.rcode()) != valid_rcodes.end();
            if (!success && diag)
                diag->log("CHECK_FAIL kind=rcode rcode=" + dns::rcodeToString(msg.rcode()));
            success = valid_rrs(msg.answers, answer, "answer", diag) && success;
            success = valid_rrs(msg.authority, authority, "authority", diag) && success;
            success = valid_rrs(msg.additional, additional, "additional", diag) && success;
        }
        catch (const DeadlineExceeded &e)
        {
            if (diag)
                diag->log("DNS_PROBE_TIMEOUT phase=" + e.phase() + " err=" + e.what());
            success = false;
        }
        catch (const ProbeError &e)
        {
            if (diag)
                diag->log("DNS_PROBE_FAIL phase=" + e.phase() + " err=" + e.what());
            success = false;
        }
        catch (const std::regex_error &e)
        {
            if (diag)
                diag->log(std::string("DNS_PROBE_CONFIG_ERROR err=invalid regexp: ") + e.what());
            success = false;
        }
        catch (const std::exception &e)
        {
            if (diag)
                diag->log(std::string("DNS_PROBE_FAIL err=") + e.what());
            success = false;
        }

        if (diag)
            diag->log(std::string("DNS_PROBE_DONE success=") + (success ? "1" : "0"));
        return success;
    }
} // namespace netprobe
