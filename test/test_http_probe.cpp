// ===================== test/test_http_probe.cpp =====================
#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <ctime>
#include <set>
#include <sstream>
#include <string>
#include <thread>

#include "diag_logger.hpp"
#include "http_probe.hpp"
#include "result_sink.hpp"
#include "test_cert.hpp"
#include "test_server.hpp"
#include "test_zlib.hpp"

using namespace netprobe;
using namespace netprobe::test;
using namespace std::chrono_literals;

namespace
{
    struct Outcome
    {
        bool ok = false;
        ResultSink sink;
        std::string log;

        double value(const std::string &name, const Labels &labels = {}) const
        {
            auto v = sink.value(name, labels);
            EXPECT_TRUE(v.has_value()) << name;
            return v.value_or(-1);
        }

        std::set<std::string> phases() const
        {
            std::set<std::string> out;
            for (const auto &s : sink.family("probe_http_duration_seconds"))
                out.insert(s.labels.at(0).second);
            return out;
        }

        bool logged(const std::string &needle) const { return log.find(needle) != std::string::npos; }
    };

    Module httpModule()
    {
        Module m;
        m.prober = "http";
        m.timeout = 5000ms;
        m.http.ip_protocol = "ip4";
        return m;
    }

    Outcome run(const std::string &target, const Module &module)
    {
        Outcome out;
        std::ostringstream log;
        DiagLogger diag(log);
        Context ctx(module.timeout);
        out.ok = HttpProber::probe(ctx, target, module, out.sink, &diag);
        out.log = log.str();
        return out;
    }

    std::string ok(const std::string &body = "ok")
    {
        return httpResponse(200, body);
    }

    std::string redirect(int status, const std::string &location,
                         std::vector<std::pair<std::string, std::string>> extra = {})
    {
        extra.emplace_back("Location", location);
        return httpResponse(status, "", extra);
    }
} // namespace

TEST(HttpProbe, PlainSuccess)
{
    HttpTestServer server([](const SeenRequest &) { return ok("hello"); });
    auto r = run(server.url("/health"), httpModule());

    EXPECT_TRUE(r.ok) << r.log;
    EXPECT_EQ(r.value("probe_http_status_code"), 200);
    EXPECT_EQ(r.value("probe_http_content_length"), 5);
    EXPECT_EQ(r.value("probe_http_uncompressed_body_length"), 5);
    EXPECT_EQ(r.value("probe_http_redirects"), 0);
    EXPECT_EQ(r.value("probe_http_ssl"), 0);
    EXPECT_EQ(r.value("probe_http_version"), 1.1);
    EXPECT_EQ(r.value("probe_failed_due_to_regex"), 0);
    EXPECT_EQ(r.value("probe_ip_protocol"), 4);
    EXPECT_EQ(r.phases(), (std::set<std::string>{"resolve", "connect", "processing", "transfer"}));
    EXPECT_FALSE(r.sink.value("probe_tls_version_info", {{"version", "TLSv1.3"}}).has_value());

    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "GET");
    EXPECT_EQ(seen[0].target, "/health");
    EXPECT_EQ(seen[0].headers.get("Host"), "127.0.0.1:" + std::to_string(server.port()));
    EXPECT_EQ(seen[0].headers.get("User-Agent"), HttpProber::kUserAgent);
    EXPECT_EQ(seen[0].headers.get("Connection"), "close");
    EXPECT_FALSE(seen[0].headers.has("Content-Length"));
}

TEST(HttpProbe, StatusOutsideDefaultRange)
{
    HttpTestServer server([](const SeenRequest &) { return httpResponse(404, "missing"); });
    auto r = run(server.url(), httpModule());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.value("probe_http_status_code"), 404);
    EXPECT_EQ(r.value("probe_failed_due_to_regex"), 0);
    EXPECT_TRUE(r.logged("CHECK_FAIL kind=status_code status=404"));
}

TEST(HttpProbe, ConfiguredStatusCodes)
{
    HttpTestServer server([](const SeenRequest &) { return httpResponse(404, "missing"); });
    Module m = httpModule();
    m.http.valid_status_codes = {404};
    EXPECT_TRUE(run(server.url(), m).ok);

    m.http.valid_status_codes = {200, 201};
    EXPECT_FALSE(run(server.url(), m).ok);
}

TEST(HttpProbe, HttpVersionCheck)
{
    HttpTestServer server([](const SeenRequest &) { return ok(); });
    Module m = httpModule();
    m.http.valid_http_versions = {"HTTP/1.0"};
    auto r = run(server.url(), m);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.value("probe_http_status_code"), 200);

    m.http.valid_http_versions = {"HTTP/1.0", "HTTP/1.1"};
    EXPECT_TRUE(run(server.url(), m).ok);
}

TEST(HttpProbe, FollowsRedirects)
{
    HttpTestServer server([](const SeenRequest &req) {
        if (req.target == "/start")
            return redirect(301, "/middle");
        if (req.target == "/middle")
            return redirect(302, "final?x=1");
        return ok("done");
    });
    auto r = run(server.url("/start"), httpModule());

    EXPECT_TRUE(r.ok) << r.log;
    EXPECT_EQ(r.value("probe_http_status_code"), 200);
    EXPECT_EQ(r.value("probe_http_redirects"), 2);
    EXPECT_EQ(r.value("probe_http_content_length"), 4);

    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[1].target, "/middle");
    EXPECT_EQ(seen[2].target, "/final?x=1");
}

TEST(HttpProbe, RedirectCarryingReturnUrl)
{
    HttpTestServer server([](const SeenRequest &req) {
        if (req.target == "/")
            return redirect(302, "/login?next=http://example.com/");
        return ok("login");
    });
    auto r = run(server.url(), httpModule());

    EXPECT_TRUE(r.ok) << r.log;
    EXPECT_EQ(r.value("probe_http_redirects"), 1);
    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1].target, "/login?next=http://example.com/");
}

TEST(HttpProbe, UnfollowableLocation)
{
    HttpTestServer server([](const SeenRequest &) { return redirect(302, "ftp://files.example.com/"); });
    auto r = run(server.url(), httpModule());

    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.logged("HTTP_PROBE_FAIL phase=redirect err=unsupported URL scheme: ftp"));
    EXPECT_EQ(r.value("probe_http_redirects"), 0);
    EXPECT_EQ(server.requests().size(), 1u);
}

TEST(HttpProbe, NoFollowReportsFirstResponse)
{
    HttpTestServer server([](const SeenRequest &req) {
        return req.target == "/" ? redirect(302, "/elsewhere") : ok();
    });
    Module m = httpModule();
    m.http.no_follow_redirects = true;

    auto rejected = run(server.url(), m);
    EXPECT_FALSE(rejected.ok);
    EXPECT_EQ(rejected.value("probe_http_status_code"), 302);

    m.http.valid_status_codes = {302};
    auto accepted = run(server.url(), m);
    EXPECT_TRUE(accepted.ok);
    EXPECT_EQ(accepted.value("probe_http_redirects"), 0);
    EXPECT_EQ(server.requests().size(), 2u);
}

TEST(HttpProbe, RedirectWithoutLocationIsFinal)
{
    HttpTestServer server([](const SeenRequest &) { return httpResponse(302, ""); });
    Module m = httpModule();
    m.http.valid_status_codes = {302};
    auto r = run(server.url(), m);
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(server.requests().size(), 1u);
}

TEST(HttpProbe, TooManyRedirects)
{
    HttpTestServer server([](const SeenRequest &req) { return redirect(302, req.target + "x"); });
    auto r = run(server.url("/r"), httpModule());

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.value("probe_http_redirects"), HttpProber::kMaxRedirects);
    EXPECT_EQ(server.requests().size(), static_cast<size_t>(HttpProber::kMaxRedirects + 1));
    EXPECT_TRUE(r.logged("phase=redirect"));
    EXPECT_TRUE(r.logged("stopped after 10 redirects"));
}

TEST(HttpProbe, ContentLengthWithoutHeader)
{
    HttpTestServer server([](const SeenRequest &) {
        return std::string("HTTP/1.1 200 OK\r\nConnection: close\r\n\r\nsix by");
    });
    auto r = run(server.url(), httpModule());
    EXPECT_TRUE(r.ok) << r.log;
    EXPECT_EQ(r.value("probe_http_content_length"), 6);
    EXPECT_EQ(r.value("probe_http_uncompressed_body_length"), 6);
}

TEST(HttpProbe, ContentLengthOfChunkedBody)
{
    HttpTestServer server([](const SeenRequest &) {
        return httpResponse(200, "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n", {{"Transfer-Encoding", "chunked"}});
    });
    auto r = run(server.url(), httpModule());
    EXPECT_TRUE(r.ok) << r.log;
    EXPECT_EQ(r.value("probe_http_content_length"), 11);
    EXPECT_EQ(r.value("probe_http_uncompressed_body_length"), 11);
}

TEST(HttpProbe, ContentLengthHeaderOfHeadResponse)
{
    HttpTestServer server([](const SeenRequest &) {
        return std::string("HTTP/1.1 200 OK\r\nContent-Length: 1234\r\nConnection: close\r\n\r\n");
    });
    Module m = httpModule();
    m.http.method = "HEAD";
    auto r = run(server.url(), m);
    EXPECT_TRUE(r.ok) << r.log;
    EXPECT_EQ(r.value("probe_http_content_length"), 1234);
    EXPECT_EQ(r.value("probe_http_uncompressed_body_length"), 0);
    EXPECT_EQ(server.requests().at(0).method, "HEAD");
}

TEST(HttpProbe, GzipBody)
{
    std::string body;
    for (int i = 0; i < 100; ++i)
        body += "repetitive payload line\n";
    const std::string packed = compress(body, Wrapper::Gzip);

    HttpTestServer server([&](const SeenRequest &) {
        return httpResponse(200, packed, {{"Content-Encoding", "gzip"}});
    });
    Module m = httpModule();
    m.http.fail_if_body_not_matches_regexp = {"repetitive payload"};
    auto r = run(server.url(), m);

    EXPECT_TRUE(r.ok) << r.log;
    EXPECT_EQ(r.value("probe_http_content_length"), packed.size());
    EXPECT_EQ(r.value("probe_http_uncompressed_body_length"), body.size());
    EXPECT_FALSE(server.requests().at(0).headers.has("Accept-Encoding"));
}

TEST(HttpProbe, UnknownEncodingPassesThrough)
{
    HttpTestServer server([](const SeenRequest &) {
        return httpResponse(200, "opaque-bytes", {{"Content-Encoding", "br"}});
    });
    auto r = run(server.url(), httpModule());
    EXPECT_TRUE(r.ok) << r.log;
    EXPECT_EQ(r.value("probe_http_content_length"), 12);
    EXPECT_EQ(r.value("probe_http_uncompressed_body_length"), 12);
}

TEST(HttpProbe, BodySizeLimit)
{
    HttpTestServer server([](const SeenRequest &) { return ok(std::string(100, 'x')); });
    Module m = httpModule();
    m.http.body_size_limit = 10;
    auto r = run(server.url(), m);
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.logged("body size limit of 10 bytes exceeded"));

    m.http.body_size_limit = 100;
    EXPECT_TRUE(run(server.url(), m).ok);
}

TEST(HttpProbe, TlsExchange)
{
    HttpTestServer server([](const SeenRequest &) { return ok("secure"); }, true);
    Module m = httpModule();
    m.http.http_client_config.tls_config.insecure_skip_verify = true;
    auto r = run(server.url(), m);

    EXPECT_TRUE(r.ok) << r.log;
    EXPECT_EQ(r.value("probe_http_ssl"), 1);
    EXPECT_EQ(r.phases(), (std::set<std::string>{"resolve", "connect", "tls", "processing", "transfer"}));

    auto versions = r.sink.family("probe_tls_version_info");
    ASSERT_EQ(versions.size(), 1u);
    EXPECT_EQ(versions[0].labels.at(0).first, "version");
    EXPECT_EQ(versions[0].labels.at(0).second.rfind("TLSv1.", 0), 0u);
    EXPECT_GT(r.value("probe_ssl_earliest_cert_expiry"), static_cast<double>(std::time(nullptr)));
    EXPECT_TRUE(server.requests().at(0).tls);
}

TEST(HttpProbe, TlsPeerClosesDuringUpload)
{
    // the process keeps the default SIGPIPE action
    struct sigaction current{};
    ASSERT_EQ(sigaction(SIGPIPE, nullptr, &current), 0);
    ASSERT_EQ(current.sa_handler, SIG_DFL);

    TestCert cert;
    SSL_CTX *ctx = cert.newServerContext();
    {
        TcpTestServer server([](ServerStream &s) { s.closeNow(); }, ctx);
        Module m = httpModule();
        m.http.method = "POST";
        m.http.body = std::string(32 << 20, 'x');
        m.http.http_client_config.tls_config.insecure_skip_verify = true;

        auto r = run("https://" + server.hostPort() + "/upload", m);
        EXPECT_FALSE(r.ok);
        EXPECT_TRUE(r.logged("HTTP_PROBE_FAIL phase=")) << r.log;
        EXPECT_EQ(r.value("probe_http_status_code"), 0);
    }
    SSL_CTX_free(ctx);
}

TEST(HttpProbe, SelfSignedCertificateIsRejected)
{
    HttpTestServer server([](const SeenRequest &) { return ok(); }, true);
    auto r = run(server.url(), httpModule());

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.value("probe_http_ssl"), 0);
    EXPECT_TRUE(r.logged("HTTP_PROBE_FAIL phase=tls"));
    EXPECT_TRUE(server.requests().empty());
}

TEST(HttpProbe, TrustedThroughCaFile)
{
    HttpTestServer server([](const SeenRequest &) { return ok(); }, true);
    Module m = httpModule();
    m.http.http_client_config.tls_config.ca_file = server.cert().writeTempFile();
    m.http.fail_if_not_ssl = true;

    auto by_name = run(server.localhostUrl(), m);
    EXPECT_TRUE(by_name.ok) << by_name.log;
    EXPECT_EQ(by_name.value("probe_http_ssl"), 1);

    auto by_address = run(server.url(), m);
    EXPECT_TRUE(by_address.ok) << by_address.log;
}

TEST(HttpProbe, ServerNameOverride)
{
    HttpTestServer server([](const SeenRequest &) { return ok(); }, true);
    Module m = httpModule();
    auto &tls = m.http.http_client_config.tls_config;
    tls.ca_file = server.cert().writeTempFile();
    tls.server_name = "wrong.example";
    EXPECT_FALSE(run(server.url(), m).ok);

    tls.server_name = "localhost";
    EXPECT_TRUE(run(server.url(), m).ok);
}

TEST(HttpProbe, UnreadableCaFileIsAConfigError)
{
    HttpTestServer server([](const SeenRequest &) { return ok(); }, true);
    Module m = httpModule();
    m.http.http_client_config.tls_config.ca_file = "/nonexistent/ca.pem";
    auto r = run(server.url(), m);
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.logged("unable to load CA file"));
    EXPECT_EQ(server.requests().size(), 0u);
}

TEST(HttpProbe, TlsConfigIgnoredForPlainTargets)
{
    HttpTestServer server([](const SeenRequest &) { return ok(); });
    Module m = httpModule();
    m.http.http_client_config.tls_config.ca_file = "/nonexistent/ca.pem";
    EXPECT_TRUE(run(server.url(), m).ok);
}

TEST(HttpProbe, FailIfNotSsl)
{
    HttpTestServer server([](const SeenRequest &) { return ok(); });
    Module m = httpModule();
    m.http.fail_if_not_ssl = true;
    auto r = run(server.url(), m);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.value("probe_http_ssl"), 0);
    EXPECT_EQ(r.value("probe_http_status_code"), 200);
    EXPECT_EQ(r.value("probe_failed_due_to_regex"), 0);
}

TEST(HttpProbe, FailIfSsl)
{
    HttpTestServer server([](const SeenRequest &) { return ok(); }, true);
    Module m = httpModule();
    m.http.http_client_config.tls_config.insecure_skip_verify = true;
    m.http.fail_if_ssl = true;
    auto r = run(server.url(), m);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.value("probe_http_ssl"), 1);
}

TEST(HttpProbe, SslReflectsFinalHop)
{
    HttpTestServer plain([](const SeenRequest &) { return ok("plain"); });
    HttpTestServer secure([&](const SeenRequest &) { return redirect(302, plain.url("/landing")); }, true);
    Module m = httpModule();
    m.http.http_client_config.tls_config.insecure_skip_verify = true;

    auto r = run(secure.url(), m);
    EXPECT_TRUE(r.ok) << r.log;
    EXPECT_EQ(r.value("probe_http_ssl"), 0);
    EXPECT_EQ(r.value("probe_http_redirects"), 1);
    // the encrypted first hop still contributes a tls phase
    EXPECT_EQ(r.phases().count("tls"), 1u);
}

TEST(HttpProbe, BodyRegexSetsMarker)
{
    HttpTestServer server([](const SeenRequest &) { return ok("status: degraded, error budget low"); });
    Module m = httpModule();
    m.http.fail_if_body_matches_regexp = {"error"};
    auto r = run(server.url(), m);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.value("probe_failed_due_to_regex"), 1);
    EXPECT_EQ(r.value("probe_http_status_code"), 200);

    m.http.fail_if_body_matches_regexp.clear();
    m.http.fail_if_body_not_matches_regexp = {"status: (ok|degraded)"};
    auto pass = run(server.url(), m);
    EXPECT_TRUE(pass.ok);
    EXPECT_EQ(pass.value("probe_failed_due_to_regex"), 0);
}

TEST(HttpProbe, HeaderRegexWithAllowMissing)
{
    HttpTestServer server([](const SeenRequest &) {
        return httpResponse(200, "ok", {{"X-Backend", "blue"}, {"x-backend", "canary"}});
    });
    Module m = httpModule();

    m.http.fail_if_header_matches_regexp = {{"X-Debug", ".*", true}};
    EXPECT_TRUE(run(server.url(), m).ok);

    m.http.fail_if_header_matches_regexp = {{"X-Debug", ".*", false}};
    auto missing = run(server.url(), m);
    EXPECT_FALSE(missing.ok);
    EXPECT_EQ(missing.value("probe_failed_due_to_regex"), 1);

    m.http.fail_if_header_matches_regexp = {{"X-Backend", "^canary$", false}};
    EXPECT_FALSE(run(server.url(), m).ok);

    m.http.fail_if_header_matches_regexp.clear();
    m.http.fail_if_header_not_matches_regexp = {{"x-BACKEND", "^blue$", false}};
    EXPECT_TRUE(run(server.url(), m).ok);
}

TEST(HttpProbe, PredicatesAreAllEvaluated)
{
    HttpTestServer server([](const SeenRequest &) { return httpResponse(500, "boom"); });
    Module m = httpModule();
    m.http.fail_if_body_matches_regexp = {"boom"};
    m.http.fail_if_not_ssl = true;
    auto r = run(server.url(), m);
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.logged("kind=status_code"));
    EXPECT_TRUE(r.logged("kind=not_ssl"));
    EXPECT_TRUE(r.logged("kind=body_matches"));
    EXPECT_EQ(r.value("probe_failed_due_to_regex"), 1);
}

TEST(HttpProbe, CookiesPersistAcrossHops)
{
    HttpTestServer server([](const SeenRequest &req) {
        if (req.target == "/login")
            return redirect(302, "/home", {{"Set-Cookie", "session=abc123; Path=/"}});
        return ok();
    });
    Module m = httpModule();
    m.http.headers = {{"Cookie", "pref=1"}};
    auto r = run(server.url("/login"), m);
    EXPECT_TRUE(r.ok) << r.log;

    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].headers.get("Cookie"), "pref=1");
    EXPECT_EQ(seen[1].headers.get("Cookie"), "pref=1; session=abc123");
}

TEST(HttpProbe, CredentialsStrippedOnCrossHostRedirect)
{
    HttpTestServer other([](const SeenRequest &) { return ok(); });
    HttpTestServer origin([&](const SeenRequest &) { return redirect(302, other.localhostUrl("/landing")); });

    Module m = httpModule();
    m.http.http_client_config.basic_auth = BasicAuth{"user", "pass"};
    m.http.headers = {{"X-Trace", "t1"}, {"Cookie", "secret=1"}};
    auto r = run(origin.url(), m);
    EXPECT_TRUE(r.ok) << r.log;

    auto first = origin.requests();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].headers.get("Authorization"), "Basic dXNlcjpwYXNz");
    EXPECT_EQ(first[0].headers.get("Cookie"), "secret=1");

    auto second = other.requests();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_FALSE(second[0].headers.has("Authorization"));
    EXPECT_FALSE(second[0].headers.has("Cookie"));
    EXPECT_EQ(second[0].headers.get("X-Trace"), "t1");
    EXPECT_EQ(second[0].headers.get("Host"), "localhost:" + std::to_string(other.port()));
}

TEST(HttpProbe, CredentialsKeptOnSameHostRedirect)
{
    HttpTestServer server([](const SeenRequest &req) {
        return req.target == "/" ? redirect(307, "/next") : ok();
    });
    Module m = httpModule();
    m.http.http_client_config.bearer_token = "tok3n";
    auto r = run(server.url(), m);
    EXPECT_TRUE(r.ok) << r.log;

    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].headers.get("Authorization"), "Bearer tok3n");
    EXPECT_EQ(seen[1].headers.get("Authorization"), "Bearer tok3n");
}

TEST(HttpProbe, ConfiguredAuthorizationWinsOverCredentials)
{
    HttpTestServer server([](const SeenRequest &) { return ok(); });
    Module m = httpModule();
    m.http.http_client_config.bearer_token = "ignored";
    m.http.headers = {{"authorization", "Token custom"}};
    EXPECT_TRUE(run(server.url(), m).ok);
    EXPECT_EQ(server.requests().at(0).headers.values("Authorization"), std::vector<std::string>{"Token custom"});
}

TEST(HttpProbe, PostBodyAndSeeOther)
{
    HttpTestServer server([](const SeenRequest &req) {
        return req.target == "/submit" ? redirect(303, "/result") : ok();
    });
    Module m = httpModule();
    m.http.method = "POST";
    m.http.body = "{\"k\":1}";
    m.http.headers = {{"Content-Type", "application/json"}};
    auto r = run(server.url("/submit"), m);
    EXPECT_TRUE(r.ok) << r.log;

    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].method, "POST");
    EXPECT_EQ(seen[0].body, "{\"k\":1}");
    EXPECT_EQ(seen[0].headers.get("Content-Length"), "7");
    EXPECT_EQ(seen[1].method, "GET");
    EXPECT_TRUE(seen[1].body.empty());
    EXPECT_FALSE(seen[1].headers.has("Content-Length"));
}

TEST(HttpProbe, TemporaryRedirectKeepsMethodAndBody)
{
    HttpTestServer server([](const SeenRequest &req) {
        return req.target == "/a" ? redirect(308, "/b") : ok();
    });
    Module m = httpModule();
    m.http.method = "PUT";
    m.http.body = "payload";
    EXPECT_TRUE(run(server.url("/a"), m).ok);

    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1].method, "PUT");
    EXPECT_EQ(seen[1].body, "payload");
}

TEST(HttpProbe, HostHeaderOverride)
{
    HttpTestServer server([](const SeenRequest &req) {
        return req.target == "/" ? redirect(302, "/next") : ok();
    });
    Module m = httpModule();
    m.http.headers = {{"host", "virtual.example"}, {"User-Agent", "custom-agent"}};
    EXPECT_TRUE(run(server.url(), m).ok);

    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 2u);
    for (const auto &req : seen)
    {
        EXPECT_EQ(req.headers.values("Host"), std::vector<std::string>{"virtual.example"});
        EXPECT_EQ(req.headers.values("User-Agent"), std::vector<std::string>{"custom-agent"});
    }
}

TEST(HttpProbe, LastModified)
{
    HttpTestServer server([](const SeenRequest &) {
        return httpResponse(200, "x", {{"Last-Modified", "Wed, 21 Oct 2015 07:28:00 GMT"}});
    });
    auto r = run(server.url(), httpModule());
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.value("probe_http_last_modified_timestamp_seconds"), 1445412480);
}

TEST(HttpProbe, DurationsAccumulateOverRedirects)
{
    HttpTestServer server([](const SeenRequest &req) {
        std::this_thread::sleep_for(150ms);
        return req.target == "/" ? redirect(302, "/slow") : ok();
    });
    auto r = run(server.url(), httpModule());
    EXPECT_TRUE(r.ok) << r.log;
    // each hop spends at least 150ms between request and first byte
    EXPECT_GE(r.value("probe_http_duration_seconds", {{"phase", "processing"}}), 0.29);
}

TEST(HttpProbe, DeadlineExceeded)
{
    HttpTestServer server([](const SeenRequest &) {
        std::this_thread::sleep_for(1500ms);
        return ok();
    });
    Module m = httpModule();
    m.timeout = 300ms;

    const auto t0 = clk::now();
    auto r = run(server.url(), m);
    EXPECT_LT(clk::now() - t0, 1200ms);

    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.logged("HTTP_PROBE_TIMEOUT"));
    EXPECT_EQ(r.value("probe_http_status_code"), 0);
    // phases completed before the deadline are still reported
    EXPECT_EQ(r.phases().count("connect"), 1u);
    EXPECT_EQ(r.phases().count("transfer"), 0u);
}

TEST(HttpProbe, ConnectionRefused)
{
    int port = 0;
    {
        TcpTestServer probe_port([](ServerStream &) {});
        port = probe_port.port();
    }
    auto r = run("http://127.0.0.1:" + std::to_string(port) + "/", httpModule());
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.logged("phase=connect"));
    EXPECT_EQ(r.value("probe_http_ssl"), 0);
}

TEST(HttpProbe, MalformedRegexFailsBeforeConnecting)
{
    HttpTestServer server([](const SeenRequest &) { return ok(); });
    Module m = httpModule();
    m.http.fail_if_body_matches_regexp = {"(unclosed"};
    auto r = run(server.url(), m);
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.logged("HTTP_PROBE_CONFIG_ERROR"));
    EXPECT_TRUE(server.requests().empty());
}

TEST(HttpProbe, BadTarget)
{
    auto r = run("gopher://example.com/", httpModule());
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.logged("HTTP_PROBE_FAIL phase=setup err=unsupported URL scheme: gopher"));
    EXPECT_EQ(r.value("probe_http_status_code"), 0);
    EXPECT_TRUE(r.phases().empty());
}
