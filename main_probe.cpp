/**
 * # run one probe by hand
 *   ./build/netprobe http https://example.com --log=-
 *   ./build/netprobe tcp smtp.example.com:25 --expect='^220' --send='QUIT'
 *   ./build/netprobe dns 8.8.8.8 --query-name=example.com --query-type=A
 *   sudo ./build/netprobe icmp example.com --ip=ip4
 */

//// ===================== File: main_probe.cpp =====================
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "diag_logger.hpp"
#include "prober.hpp"
#include "result_sink.hpp"

using namespace std;
using namespace netprobe;

static void print_usage(const char *argv0) {
    cerr << "Usage:\n"
         << "  " << argv0 << " <http|tcp|dns|icmp> <target> [--timeout=MS] [--ip=ip4|ip6] [--no-fallback] [--log=PATH|-]\n"
         << "\nHTTP:\n"
         << "  --method=M --header=Name:Value --body=STR --valid-status=200,301 --valid-version=HTTP/1.1\n"
         << "  --no-follow-redirects --fail-if-ssl --fail-if-not-ssl --body-size-limit=BYTES\n"
         << "  --body-match=RE --body-not-match=RE --header-match=Name:RE --header-not-match=Name:RE\n"
         << "  --allow-missing (applies to the header rules given before it)\n"
         << "  --basic-auth=USER:PASS --bearer=TOKEN\n"
         << "TLS (http, tcp):\n"
         << "  --ca-file=PATH --cert-file=PATH --key-file=PATH --server-name=NAME --insecure\n"
         << "TCP:\n"
         << "  --tls --expect=RE --send=STR --starttls --source-ip=ADDR\n"
         << "DNS:\n"
         << "  --query-name=NAME --query-type=TYPE --transport=udp|tcp --no-recursion --valid-rcodes=NOERROR,NXDOMAIN\n"
         << "  --rr-match=answer|authority|additional:RE --rr-not-match=SECTION:RE --source-ip=ADDR\n"
         << "ICMP:\n"
         << "  --payload-size=BYTES --dont-fragment --source-ip=ADDR\n";
}

static vector<string> split(const string &s, char sep) {
    vector<string> out;
    string item;
    istringstream in(s);
    while (getline(in, item, sep))
        if (!item.empty()) out.push_back(item);
    return out;
}

static pair<string, string> split_once(const string &s, char sep) {
    size_t p = s.find(sep);
    if (p == string::npos) throw invalid_argument("expected NAME" + string(1, sep) + "VALUE, got " + s);
    return {s.substr(0, p), s.substr(p + 1)};
}

static DnsRRValidator &rr_section(DnsProbeConfig &dns, const string &name) {
    if (name == "answer") return dns.validate_answer_rrs;
    if (name == "authority") return dns.validate_authority_rrs;
    if (name == "additional") return dns.validate_additional_rrs;
    throw invalid_argument("bad record section: " + name);
}

static QueryResponse &tcp_step(TcpProbeConfig &tcp, bool fresh) {
    if (fresh || tcp.query_response.empty()) tcp.query_response.emplace_back();
    return tcp.query_response.back();
}

// Applies one --flag[=value] to the module; false for unknown flags.
static bool apply_flag(Module &m, const string &flag, const string &value) {
    HttpProbeConfig &http = m.http;
    TlsConfig &tls = (m.prober == "tcp") ? m.tcp.tls_config : http.http_client_config.tls_config;

    if (flag == "--timeout") m.timeout = chrono::milliseconds(stol(value));
    else if (flag == "--ip") http.ip_protocol = m.tcp.ip_protocol = m.dns.ip_protocol = m.icmp.ip_protocol = value;
    else if (flag == "--no-fallback")
        http.ip_protocol_fallback = m.tcp.ip_protocol_fallback = m.dns.ip_protocol_fallback =
            m.icmp.ip_protocol_fallback = false;
    else if (flag == "--source-ip") m.tcp.source_ip_address = m.dns.source_ip_address = m.icmp.source_ip_address = value;
    // http
    else if (flag == "--method") http.method = value;
    else if (flag == "--header") http.headers.push_back(split_once(value, ':'));
    else if (flag == "--body") http.body = value;
    else if (flag == "--valid-status") { for (const auto &c : split(value, ',')) http.valid_status_codes.push_back(stoi(c)); }
    else if (flag == "--valid-version") http.valid_http_versions.push_back(value);
    else if (flag == "--no-follow-redirects") http.no_follow_redirects = true;
    else if (flag == "--fail-if-ssl") http.fail_if_ssl = true;
    else if (flag == "--fail-if-not-ssl") http.fail_if_not_ssl = true;
    else if (flag == "--body-size-limit") http.body_size_limit = stoul(value);
    else if (flag == "--body-match") http.fail_if_body_matches_regexp.push_back(value);
    else if (flag == "--body-not-match") http.fail_if_body_not_matches_regexp.push_back(value);
    else if (flag == "--header-match") {
        auto kv = split_once(value, ':');
        http.fail_if_header_matches_regexp.push_back(HeaderMatch{kv.first, kv.second, false});
    } else if (flag == "--header-not-match") {
        auto kv = split_once(value, ':');
        http.fail_if_header_not_matches_regexp.push_back(HeaderMatch{kv.first, kv.second, false});
    } else if (flag == "--allow-missing") {
        for (auto &r : http.fail_if_header_matches_regexp) r.allow_missing = true;
        for (auto &r : http.fail_if_header_not_matches_regexp) r.allow_missing = true;
    } else if (flag == "--basic-auth") {
        auto kv = split_once(value, ':');
        http.http_client_config.basic_auth = BasicAuth{kv.first, kv.second};
    } else if (flag == "--bearer") http.http_client_config.bearer_token = value;
    // tls
    else if (flag == "--ca-file") tls.ca_file = value;
    else if (flag == "--cert-file") tls.cert_file = value;
    else if (flag == "--key-file") tls.key_file = value;
    else if (flag == "--server-name") tls.server_name = value;
    else if (flag == "--insecure") tls.insecure_skip_verify = true;
    // tcp
    else if (flag == "--tls") m.tcp.tls = true;
    else if (flag == "--expect") tcp_step(m.tcp, true).expect = value;
    else if (flag == "--send") {
        bool fresh = m.tcp.query_response.empty() || !m.tcp.query_response.back().send.empty();
        tcp_step(m.tcp, fresh).send = value;
    } else if (flag == "--starttls") tcp_step(m.tcp, false).starttls = true;
    // dns
    else if (flag == "--query-name") m.dns.query_name = value;
    else if (flag == "--query-type") m.dns.query_type = value;
    else if (flag == "--transport") m.dns.transport_protocol = value;
    else if (flag == "--no-recursion") m.dns.recursion_desired = false;
    else if (flag == "--valid-rcodes") m.dns.valid_rcodes = split(value, ',');
    else if (flag == "--rr-match") {
        auto kv = split_once(value, ':');
        rr_section(m.dns, kv.first).fail_if_matches_regexp.push_back(kv.second);
    } else if (flag == "--rr-not-match") {
        auto kv = split_once(value, ':');
        rr_section(m.dns, kv.first).fail_if_not_matches_regexp.push_back(kv.second);
    }
    // icmp
    else if (flag == "--payload-size") m.icmp.payload_size = stoul(value);
    else if (flag == "--dont-fragment") m.icmp.dont_fragment = true;
    else return false;
    return true;
}

static string format_labels(const Labels &labels) {
    if (labels.empty()) return string();
    string out = "{";
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i) out += ",";
        out += labels[i].first + "=\"" + labels[i].second + "\"";
    }
    return out + "}";
}

int main(int argc, char *argv[]) {
    ios::sync_with_stdio(false);

    if (argc < 3) { print_usage(argv[0]); return 2; }

    Module module;
    module.prober = argv[1];
    const string target = argv[2];
    string log_path;

    ProbeFn fn = findProber(module.prober);
    if (!fn) {
        cerr << "Unknown prober: " << module.prober << "\n";
        print_usage(argv[0]);
        return 2;
    }

    for (int i = 3; i < argc; ++i) {
        string a = argv[i];
        size_t eq = a.find('=');
        string flag = a.substr(0, eq);
        string value = (eq == string::npos) ? string() : a.substr(eq + 1);
        if (flag == "--log") { log_path = value; continue; }
        try {
            if (!apply_flag(module, flag, value)) {
                cerr << "Unknown flag: " << a << "\n";
                print_usage(argv[0]);
                return 2;
            }
        } catch (const exception &e) {
            cerr << "Bad value for " << flag << ": " << e.what() << "\n";
            return 2;
        }
    }

    // Optional diagnostics; "-" logs to stderr
    DiagLogger file_diag(log_path == "-" ? string() : log_path);
    DiagLogger err_diag(cerr);
    DiagLogger *dptr = nullptr;
    if (log_path == "-") dptr = &err_diag;
    else if (!log_path.empty() && file_diag.ok()) dptr = &file_diag;
    else if (!log_path.empty()) cerr << "Warning: couldn't open log file: " << log_path << "\n";

    ResultSink sink;
    Context ctx(module.timeout);
    const auto t0 = clk::now();
    const bool ok = fn(ctx, target, module, sink, dptr);
    const double elapsed = chrono::duration<double>(clk::now() - t0).count();

    cout << setprecision(9);
    for (const auto &s : sink.samples())
        cout << s.name << format_labels(s.labels) << " " << s.value << "\n";
    cout << "probe_duration_seconds " << elapsed << "\n";
    cout << "probe_success " << (ok ? 1 : 0) << "\n";
    return ok ? 0 : 1;
}
