// ===================== src/http_probe.cpp =====================
#include "http_probe.hpp"
#include "content_decoder.hpp"
#include "cookie_jar.hpp"
#include "diag_logger.hpp"
#include "dns_resolver.hpp"
#include "http_message.hpp"
#include "http_validation.hpp"
#include "parsed_url.hpp"
#include "phase_tracer.hpp"
#include "result_sink.hpp"
#include "ssl_session.hpp"
#include "tcp_socket.hpp"
#include "utils_net.hpp"

#include <cstdlib>
#include <ctime>
#include <memory>
#include <openssl/evp.h>
#include <regex>
#include <stdexcept>

namespace netprobe
{
    namespace
    {
        ParsedURL parse_target(const std::string &target)
        {
            try
            {
                return ParsedURL(target);
            }
            catch (const std::invalid_argument &e)
            {
                throw ProbeError("setup", e.what());
            }
        }

        ParsedURL resolve_location(const ParsedURL &base, const std::string &location)
        {
            try
            {
                return base.resolveReference(location);
            }
            catch (const std::invalid_argument &e)
            {
                throw ProbeError("redirect", std::string(e.what()) + " (Location: " + location + ")");
            }
        }

        std::string base64(const std::string &in)
        {
            std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
            int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                    reinterpret_cast<const unsigned char *>(in.data()),
                                    static_cast<int>(in.size()));
            out.resize(n > 0 ? static_cast<size_t>(n) : 0);
            return out;
        }

        bool is_redirect(int status)
        {
            return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
        }

        // "HTTP/1.1" -> 1.1, 0 when unparsable
        double version_number(const std::string &version)
        {
            if (version.rfind("HTTP/", 0) != 0)
                return 0;
            const char *begin = version.c_str() + 5;
            char *end = nullptr;
            double v = std::strtod(begin, &end);
            return end == begin ? 0 : v;
        }

        std::optional<std::time_t> parse_http_date(const std::string &s)
        {
            std::tm tm{};
            const char *end = strptime(s.c_str(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
            if (!end || *end != '\0')
                return std::nullopt;
            return timegm(&tm);
        }

        std::optional<unsigned long long> parse_length(const std::string &s)
        {
            if (s.empty() || s[0] < '0' || s[0] > '9')
                return std::nullopt;
            char *end = nullptr;
            unsigned long long n = std::strtoull(s.c_str(), &end, 10);
            if (*end != '\0')
                return std::nullopt;
            return n;
        }

        void describe(ResultSink &sink)
        {
            sink.describe("probe_http_duration_seconds", "Duration of http request by phase, summed over all redirects");
            sink.describe("probe_http_content_length", "Length of http content response");
            sink.describe("probe_http_uncompressed_body_length", "Length of uncompressed response body");
            sink.describe("probe_http_redirects", "The number of redirects");
            sink.describe("probe_http_ssl", "Indicates if SSL was used for the final redirect");
            sink.describe("probe_http_status_code", "Response HTTP status code");
            sink.describe("probe_http_version", "Returns the version of HTTP of the probe response");
            sink.describe("probe_failed_due_to_regex", "Indicates if probe failed due to regex");
            sink.describe("probe_http_last_modified_timestamp_seconds", "Returns the Last-Modified HTTP response header in unixtime");
            sink.describe("probe_ssl_earliest_cert_expiry", "Returns earliest SSL cert expiry in unixtime");
            sink.describe("probe_tls_version_info", "Contains the TLS version used");
        }
    } // namespace

    bool HttpProber::probe(Context &ctx, const std::string &target, const Module &module,
                           ResultSink &sink, DiagLogger *diag)
    {
        const HttpProbeConfig &cfg = module.http;
        const HttpClientConfig &client = cfg.http_client_config;

        describe(sink);
        for (const char *name : {"probe_http_status_code", "probe_http_content_length",
                                 "probe_http_uncompressed_body_length", "probe_http_redirects",
                                 "probe_http_ssl", "probe_http_version", "probe_failed_due_to_regex"})
            sink.set(name, 0);

        PhaseTracer tracer;
        bool success = false;

        try
        {
            // Configuration is checked before any network activity.
            const ParsedURL origin = parse_target(target);
            const CompiledHttpChecks checks = CompiledHttpChecks::compile(cfg);

            std::unique_ptr<TlsContext> tls;
            if (origin.isTls())
                tls = std::make_unique<TlsContext>(client.tls_config);

            std::string host_header;
            HttpHeaders configured;
            for (const auto &h : cfg.headers)
            {
                if (iequals(h.first, "Host"))
                    host_header = h.second;
                else
                    configured.add(h.first, h.second);
            }
            // A configured Host header also names the TLS peer.
            std::string host_header_name;
            if (!host_header.empty())
                host_header_name = net::split_host_port(host_header, 0).first;

            std::string authorization;
            if (client.basic_auth)
                authorization = "Basic " + base64(client.basic_auth->username + ":" + client.basic_auth->password);
            else if (!client.bearer_token.empty())
                authorization = "Bearer " + client.bearer_token;

            if (diag)
                diag->log("HTTP_PROBE target=" + origin.toString() + " method=" + cfg.method +
                          " timeout_ms=" + std::to_string(module.timeout.count()));

            ParsedURL url = origin;
            std::string method = cfg.method.empty() ? std::string("GET") : cfg.method;
            std::string body = cfg.body;
            CookieJar jar;
            int redirects = 0;
            HttpResponse resp;
            bool over_tls = false;
            std::string tls_version;
            std::optional<std::time_t> cert_expiry;

            while (true)
            {
                const bool same_host = url.host == origin.host;
                const bool same_origin = same_host && url.port == origin.port;
                tracer.startHop();

                // resolve
                tracer.resolveStart();
                std::optional<ResolvedAddress> addr;
                if (redirects == 0)
                {
                    addr = DNSResolver::chooseProtocol(url.host, url.port, SOCK_STREAM, cfg.ip_protocol,
                                                       cfg.ip_protocol_fallback, ctx, sink, diag);
                }
                else
                {
                    addr = DNSResolver::pick(DNSResolver::resolve(url.host, url.port, SOCK_STREAM, ctx),
                                             cfg.ip_protocol, cfg.ip_protocol_fallback);
                    if (!addr)
                        throw ProbeError("resolve", "no usable address for " + url.host);
                }
                tracer.resolveDone();

                // connect
                TcpSocket sock;
                tracer.connectStart();
                sock.connectTo(*addr, ctx);
                tracer.connectDone();
                if (diag)
                    diag->log("HTTP_CONNECTED ip=" + addr->ip() + " port=" + std::to_string(url.port));

                // tls
                ByteStream *stream = &sock;
                std::unique_ptr<SslSession> ssl;
                over_tls = false;
                if (url.isTls())
                {
                    if (!tls)
                        tls = std::make_unique<TlsContext>(client.tls_config);
                    ssl = std::make_unique<SslSession>(*tls);
                    const std::string peer = (same_origin && !host_header_name.empty()) ? host_header_name : url.host;
                    tracer.tlsStart();
                    ssl->handshake(sock.fd(), peer, ctx);
                    tracer.tlsDone();
                    over_tls = true;
                    tls_version = ssl->version();
                    cert_expiry = ssl->earliestCertExpiry();
                    stream = ssl.get();
                    if (diag)
                        diag->log("HTTP_TLS peer=" + peer + " version=" + tls_version);
                }

                HttpRequest req;
                req.method = method;
                req.target = url.path.empty() ? "/" : url.path;
                req.headers.add("Host", (same_origin && !host_header.empty()) ? host_header : url.hostPort());
                if (!configured.has("User-Agent"))
                    req.headers.add("User-Agent", kUserAgent);
                for (const auto &h : configured.entries())
                {
                    // credentials never leave the original host
                    if (!same_host && (iequals(h.first, "Authorization") || iequals(h.first, "Cookie")))
                        continue;
                    req.headers.add(h.first, h.second);
                }
                if (same_host && !authorization.empty() && !req.headers.has("Authorization"))
                    req.headers.add("Authorization", authorization);
                const std::string cookies = jar.header(url);
                if (!cookies.empty())
                {
                    if (auto existing = req.headers.get("Cookie"))
                        req.headers.set("Cookie", *existing + "; " + cookies);
                    else
                        req.headers.add("Cookie", cookies);
                }
                if (!body.empty() || method == "POST" || method == "PUT" || method == "PATCH")
                    req.headers.set("Content-Length", std::to_string(body.size()));
                req.headers.set("Connection", "close");
                req.body = body;

                stream->writeAll(req.serialize(), ctx);
                tracer.wroteRequest();

                HttpResponseReader reader(*stream, ctx, &tracer);
                resp = reader.read(method == "HEAD");
                jar.store(url, resp.headers.values("Set-Cookie"));
                if (diag)
                    diag->log("HTTP_RESPONSE url=" + url.toString() + " status=" + std::to_string(resp.status) +
                              " version=" + resp.version + " bytes=" + std::to_string(resp.wire_bytes));

                auto location = resp.headers.get("Location");
                if (cfg.no_follow_redirects || !is_redirect(resp.status) || !location)
                    break;

                if (redirects >= kMaxRedirects)
                    throw ProbeError("redirect", "stopped after " + std::to_string(kMaxRedirects) + " redirects");
                ParsedURL next = resolve_location(url, *location);
                ++redirects;
                sink.set("probe_http_redirects", redirects);
                if (resp.status != 307 && resp.status != 308)
                {
                    if (method != "GET" && method != "HEAD")
                        method = "GET";
                    body.clear();
                }
                if (diag)
                    diag->log("HTTP_REDIRECT n=" + std::to_string(redirects) + " location=" + next.toString() +
                              " method=" + method);
                url = next;
            }

            sink.set("probe_http_status_code", resp.status);
            sink.set("probe_http_ssl", over_tls ? 1 : 0);
            sink.set("probe_http_version", version_number(resp.version));
            if (over_tls)
            {
                if (cert_expiry)
                    sink.set("probe_ssl_earliest_cert_expiry", static_cast<double>(*cert_expiry));
                sink.set("probe_tls_version_info", 1, {{"version", tls_version}});
            }
            if (auto lm = resp.headers.get("Last-Modified"))
            {
                if (auto t = parse_http_date(*lm))
                    sink.set("probe_http_last_modified_timestamp_seconds", static_cast<double>(*t));
            }

            double content_length = static_cast<double>(resp.wire_bytes);
            if (auto cl = resp.headers.get("Content-Length"))
            {
                if (auto n = parse_length(*cl))
                    content_length = static_cast<double>(*n);
            }
            sink.set("probe_http_content_length", content_length);

            const std::string decoded = ContentDecoder::decode(resp.headers.get("Content-Encoding").value_or(""),
                                                               resp.body, cfg.body_size_limit);
            sink.set("probe_http_uncompressed_body_length", static_cast<double>(decoded.size()));

            // every check runs so the log lists all failures
            success = matchStatusCode(resp.status, cfg.valid_status_codes, diag);
            success = matchHttpVersion(resp.version, cfg.valid_http_versions, diag) && success;
            if (cfg.fail_if_ssl && over_tls)
            {
                if (diag)
                    diag->log("CHECK_FAIL kind=ssl msg=final response was over TLS");
                success = false;
            }
            if (cfg.fail_if_not_ssl && !over_tls)
            {
                if (diag)
                    diag->log("CHECK_FAIL kind=not_ssl msg=final response was not over TLS");
                success = false;
            }
            bool regex_ok = matchBodyRegexps(decoded, checks, diag);
            regex_ok = matchHeaderRegexps(resp.headers, checks, diag) && regex_ok;
            sink.set("probe_failed_due_to_regex", regex_ok ? 0 : 1);
            success = success && regex_ok;
        }
        catch (const DeadlineExceeded &e)
        {
            if (diag)
                diag->log("HTTP_PROBE_TIMEOUT phase=" + e.phase() + " err=" + e.what());
            success = false;
        }
        catch (const ProbeError &e)
        {
            if (diag)
                diag->log("HTTP_PROBE_FAIL phase=" + e.phase() + " err=" + e.what());
            success = false;
        }
        catch (const std::regex_error &e)
        {
            if (diag)
                diag->log(std::string("HTTP_PROBE_CONFIG_ERROR err=invalid regexp: ") + e.what());
            success = false;
        }
        catch (const std::exception &e)
        {
            if (diag)
                diag->log(std::string("HTTP_PROBE_FAIL err=") + e.what());
            success = false;
        }

        for (const auto &p : tracer.phaseDurations())
            sink.set("probe_http_duration_seconds", p.second, {{"phase", p.first}});
        if (diag)
            diag->log(std::string("HTTP_PROBE_DONE success=") + (success ? "1" : "0"));
        return success;
    }
} // namespace netprobe
