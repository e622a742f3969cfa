// ===================== src/tcp_probe.cpp =====================
#include "tcp_probe.hpp"
#include "diag_logger.hpp"
#include "dns_resolver.hpp"
#include "result_sink.hpp"
#include "ssl_session.hpp"
#include "tcp_socket.hpp"
#include "utils_net.hpp"

#include <cctype>
#include <memory>
#include <optional>
#include <vector>

namespace netprobe
{
    namespace
    {
        double seconds_since(clk::time_point t0)
        {
            return std::chrono::duration<double>(clk::now() - t0).count();
        }

        // Line-oriented reads over whichever stream is current.
        class LineReader
        {
        public:
            explicit LineReader(ByteStream *stream) : stream_(stream) {}

            // Buffered plaintext is discarded when the stream is upgraded.
            void reset(ByteStream *stream)
            {
                stream_ = stream;
                buf_.clear();
            }

            // Next line without its terminator; nullopt once the peer closed.
            std::optional<std::string> next(Context &ctx)
            {
                while (true)
                {
                    size_t nl = buf_.find('\n');
                    if (nl != std::string::npos)
                    {
                        std::string line = buf_.substr(0, nl);
                        buf_.erase(0, nl + 1);
                        if (!line.empty() && line.back() == '\r')
                            line.pop_back();
                        return line;
                    }
                    char tmp[4096];
                    size_t n = stream_->readSome(tmp, sizeof(tmp), ctx);
                    if (n == 0)
                    {
                        if (buf_.empty())
                            return std::nullopt;
                        std::string line;
                        line.swap(buf_);
                        return line;
                    }
                    buf_.append(tmp, n);
                }
            }

        private:
            ByteStream *stream_;
            std::string buf_;
        };
    } // namespace

    std::string TcpProber::expand(const std::string &tmpl, const std::smatch &m)
    {
        std::string out;
        for (size_t i = 0; i < tmpl.size(); ++i)
        {
            if (tmpl[i] != '$' || i + 1 >= tmpl.size())
            {
                out += tmpl[i];
                continue;
            }
            if (tmpl[i + 1] == '$')
            {
                out += '$';
                ++i;
                continue;
            }

            const bool braced = tmpl[i + 1] == '{';
            size_t j = i + (braced ? 2 : 1);
            size_t k = j;
            while (k < tmpl.size() && std::isdigit(static_cast<unsigned char>(tmpl[k])))
                ++k;
            if (k == j || (braced && (k >= tmpl.size() || tmpl[k] != '}')))
            {
                out += tmpl[i];
                continue;
            }
            size_t group = std::stoul(tmpl.substr(j, k - j));
            if (group < m.size())
                out += m[group].str();
            i = braced ? k : k - 1;
        }
        return out;
    }

    bool TcpProber::probe(Context &ctx, const std::string &target, const Module &module,
                          ResultSink &sink, DiagLogger *diag)
    {
        const TcpProbeConfig &cfg = module.tcp;

        sink.describe("probe_tcp_duration_seconds", "Duration of tcp connection by phase");
        sink.describe("probe_failed_due_to_regex", "Indicates if probe failed due to regex");
        sink.describe("probe_ssl_earliest_cert_expiry", "Returns earliest SSL cert expiry in unixtime");
        sink.describe("probe_tls_version_info", "Contains the TLS version used");
        sink.set("probe_failed_due_to_regex", 0);

        try
        {
            const auto hp = net::split_host_port(target, -1);

            std::vector<std::optional<std::regex>> expects;
            bool need_tls = cfg.tls;
            for (const auto &qr : cfg.query_response)
            {
                if (qr.expect.empty())
                    expects.emplace_back();
                else
                    expects.emplace_back(std::regex(qr.expect, std::regex::ECMAScript));
                need_tls = need_tls || qr.starttls;
            }
            std::unique_ptr<TlsContext> tls;
            if (need_tls)
                tls = std::make_unique<TlsContext>(cfg.tls_config);

            ResolvedAddress addr = DNSResolver::chooseProtocol(hp.first, hp.second, SOCK_STREAM, cfg.ip_protocol,
                                                               cfg.ip_protocol_fallback, ctx, sink, diag);

            TcpSocket sock;
            const auto t_connect = clk::now();
            sock.connectTo(addr, ctx, cfg.source_ip_address);
            sink.set("probe_tcp_duration_seconds", seconds_since(t_connect), {{"phase", "connect"}});
            if (diag)
                diag->log("TCP_CONNECTED ip=" + addr.ip() + " port=" + std::to_string(hp.second));

            ByteStream *stream = &sock;
            std::unique_ptr<SslSession> ssl;
            auto upgrade = [&]() {
                ssl = std::make_unique<SslSession>(*tls);
                const auto t_tls = clk::now();
                ssl->handshake(sock.fd(), hp.first, ctx);
                sink.set("probe_tcp_duration_seconds", seconds_since(t_tls), {{"phase", "tls"}});
                if (auto expiry = ssl->earliestCertExpiry())
                    sink.set("probe_ssl_earliest_cert_expiry", static_cast<double>(*expiry));
                sink.set("probe_tls_version_info", 1, {{"version", ssl->version()}});
                stream = ssl.get();
                if (diag)
                    diag->log("TCP_TLS version=" + ssl->version());
            };

            if (cfg.tls)
                upgrade();

            LineReader reader(stream);
            for (size_t i = 0; i < cfg.query_response.size(); ++i)
            {
                const QueryResponse &qr = cfg.query_response[i];
                std::string send = qr.send;

                if (expects[i])
                {
                    bool matched = false;
                    try
                    {
                        while (auto line = reader.next(ctx))
                        {
                            if (diag)
                                diag->log("TCP_READ line=" + *line);
                            std::smatch m;
                            if (std::regex_search(*line, m, *expects[i]))
                            {
                                send = expand(qr.send, m);
                                matched = true;
                                break;
                            }
                        }
                    }
                    catch (const DeadlineExceeded &)
                    {
                        sink.set("probe_failed_due_to_regex", 1);
                        throw;
                    }
                    if (!matched)
                    {
                        sink.set("probe_failed_due_to_regex", 1);
                        throw ProbeError("expect", "regexp " + qr.expect + " did not match before EOF");
                    }
                }

                if (!send.empty())
                {
                    if (diag)
                        diag->log("TCP_SEND line=" + send);
                    stream->writeAll(send + "\n", ctx);
                }

                if (qr.starttls)
                {
                    upgrade();
                    reader.reset(stream);
                }
            }
        }
        catch (const DeadlineExceeded &e)
        {
            if (diag)
                diag->log("TCP_PROBE_TIMEOUT phase=" + e.phase() + " err=" + e.what());
            return false;
        }
        catch (const ProbeError &e)
        {
            if (diag)
                diag->log("TCP_PROBE_FAIL phase=" + e.phase() + " err=" + e.what());
            return false;
        }
        catch (const std::regex_error &e)
        {
            if (diag)
                diag->log(std::string("TCP_PROBE_CONFIG_ERROR err=invalid regexp: ") + e.what());
            return false;
        }
        catch (const std::exception &e)
        {
            if (diag)
                diag->log(std::string("TCP_PROBE_FAIL err=") + e.what());
            return false;
        }

        if (diag)
            diag->log("TCP_PROBE_DONE success=1");
        return true;
    }
} // namespace netprobe
