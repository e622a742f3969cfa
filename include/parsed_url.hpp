// ===================== include/parsed_url.hpp =====================
#pragma once
#include <string>

namespace netprobe
{
    class ParsedURL
    {
    public:
        std::string scheme; // "http" or "https"
        std::string host;   // e.g., "example.com" or "::1" (no brackets)
        int port = 0;       // explicit port, or the scheme default
        std::string path;   // path plus query, e.g., "/tools/yourip.php?x=1"

        // Missing scheme defaults to http. Throws std::invalid_argument on
        // unsupported schemes or malformed authorities.
        explicit ParsedURL(const std::string &url);

        bool isTls() const { return scheme == "https"; }
        bool hasDefaultPort() const;

        // Authority for the Host header; port omitted when default.
        std::string hostPort() const;
        std::string toString() const;

        // Resolves a Location header value against this URL (RFC 3986 5.2).
        ParsedURL resolveReference(const std::string &ref) const;

    private:
        ParsedURL() = default;
    };
} // namespace netprobe
