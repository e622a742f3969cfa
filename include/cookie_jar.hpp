// ===================== include/cookie_jar.hpp =====================
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "parsed_url.hpp"

namespace netprobe
{
    // Per-attempt cookie store; lives only as long as one probe invocation.
    class CookieJar
    {
    public:
        // Stores the Set-Cookie values of a response received from url.
        void store(const ParsedURL &url, const std::vector<std::string> &set_cookie);

        // Cookie header value for a request to url, empty when none apply.
        std::string header(const ParsedURL &url) const;

        std::size_t size() const { return cookies_.size(); }

    private:
        struct Cookie
        {
            std::string name;
            std::string value;
            std::string domain;
            bool host_only = true;
            std::string path;
            bool secure = false;
            std::optional<std::chrono::system_clock::time_point> expires;
        };
        std::vector<Cookie> cookies_;

        static bool domainMatch(const Cookie &c, const std::string &host);
        static bool pathMatch(const Cookie &c, const std::string &path);
    };
} // namespace netprobe
