// ===================== include/module_config.hpp =====================
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace netprobe
{
    struct TlsConfig
    {
        std::string ca_file;     // empty: system trust store
        std::string cert_file;   // client certificate (PEM chain)
        std::string key_file;    // client key (PEM)
        std::string server_name; // empty: hostname of the request
        bool insecure_skip_verify = false;
    };

    struct BasicAuth
    {
        std::string username;
        std::string password;
    };

    struct HttpClientConfig
    {
        TlsConfig tls_config;
        std::optional<BasicAuth> basic_auth;
        std::string bearer_token;
    };

    struct HeaderMatch
    {
        std::string header;
        std::string regexp;
        bool allow_missing = false;
    };

    struct HttpProbeConfig
    {
        std::string ip_protocol = "ip6";
        bool ip_protocol_fallback = true;
        std::vector<int> valid_status_codes;          // empty: 2xx
        std::vector<std::string> valid_http_versions; // empty: any
        bool no_follow_redirects = false;
        std::string method = "GET";
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        HttpClientConfig http_client_config;
        bool fail_if_ssl = false;
        bool fail_if_not_ssl = false;
        std::vector<std::string> fail_if_body_matches_regexp;
        std::vector<std::string> fail_if_body_not_matches_regexp;
        std::vector<HeaderMatch> fail_if_header_matches_regexp;
        std::vector<HeaderMatch> fail_if_header_not_matches_regexp;
        std::size_t body_size_limit = 0; // 0: unlimited
    };

    struct QueryResponse
    {
        std::string expect; // regex; ${N} in send refers to its groups
        std::string send;
        bool starttls = false;
    };

    struct TcpProbeConfig
    {
        std::string ip_protocol = "ip6";
        bool ip_protocol_fallback = true;
        std::string source_ip_address;
        std::vector<QueryResponse> query_response;
        bool tls = false;
        TlsConfig tls_config;
    };

    struct DnsRRValidator
    {
        std::vector<std::string> fail_if_matches_regexp;
        std::vector<std::string> fail_if_not_matches_regexp;
    };

    struct DnsProbeConfig
    {
        std::string ip_protocol = "ip6";
        bool ip_protocol_fallback = true;
        std::string source_ip_address;
        std::string transport_protocol = "udp";
        std::string query_name;
        std::string query_type = "ANY";
        bool recursion_desired = true;
        std::vector<std::string> valid_rcodes{"NOERROR"};
        DnsRRValidator validate_answer_rrs;
        DnsRRValidator validate_authority_rrs;
        DnsRRValidator validate_additional_rrs;
    };

    struct IcmpProbeConfig
    {
        std::string ip_protocol = "ip6";
        bool ip_protocol_fallback = true;
        std::string source_ip_address;
        std::size_t payload_size = 0;
        bool dont_fragment = false;
    };

    // One named probe configuration. Only the sub-configuration selected
    // by `prober` is consulted.
    struct Module
    {
        std::string prober = "http";
        std::chrono::milliseconds timeout{5000};
        HttpProbeConfig http;
        TcpProbeConfig tcp;
        DnsProbeConfig dns;
        IcmpProbeConfig icmp;
    };
} // namespace netprobe
