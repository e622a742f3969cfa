// ===================== src/parsed_url.cpp =====================
#include "parsed_url.hpp"
#include "utils_net.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace netprobe
{
    namespace
    {
        int default_port(const std::string &scheme)
        {
            return scheme == "https" ? 443 : 80;
        }

        // Offset of the ':' ending a leading RFC 3986 scheme, or npos.
        size_t scheme_end(const std::string &s)
        {
            if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0])))
                return std::string::npos;
            for (size_t i = 1; i < s.size(); ++i)
            {
                const unsigned char c = static_cast<unsigned char>(s[i]);
                if (c == ':')
                    return i;
                if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
                    return std::string::npos;
            }
            return std::string::npos;
        }

        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string remove_dot_segments(const std::string &path)
        {
            std::vector<std::string> out;
            size_t pos = 0;
            bool trailing = false;
            while (pos <= path.size())
            {
                size_t next = path.find('/', pos);
                if (next == std::string::npos)
                    next = path.size();
                std::string seg = path.substr(pos, next - pos);
                trailing = false;
                if (seg == "..")
                {
                    if (!out.empty())
                        out.pop_back();
                    trailing = true;
                }
                else if (seg == ".")
                {
                    trailing = true;
                }
                else if (!seg.empty() || next == path.size())
                {
                    out.push_back(seg);
                }
                pos = next + 1;
            }

            std::string result;
            for (const auto &seg : out)
                result += "/" + seg;
            if (trailing || result.empty())
                result += "/";
            return result;
        }
    } // namespace

    ParsedURL::ParsedURL(const std::string &url)
    {
        scheme = "http"; // default
        path = "/";

        std::string rest = url;
        size_t frag = rest.find('#');
        if (frag != std::string::npos)
            rest = rest.substr(0, frag);

        // "host:port" has no "//" after the colon and keeps the default scheme
        const size_t colon = scheme_end(rest);
        if (colon != std::string::npos && rest.compare(colon + 1, 2, "//") == 0)
        {
            scheme = lower(rest.substr(0, colon));
            rest = rest.substr(colon + 3);
        }
        if (scheme != "http" && scheme != "https")
            throw std::invalid_argument("unsupported URL scheme: " + scheme);

        size_t path_start = rest.find_first_of("/?");
        std::string authority = rest.substr(0, path_start);
        if (path_start != std::string::npos)
        {
            path = rest.substr(path_start);
            if (path[0] == '?')
                path = "/" + path;
        }

        // credentials in the authority are not used
        size_t at = authority.rfind('@');
        if (at != std::string::npos)
            authority = authority.substr(at + 1);

        auto hp = net::split_host_port(authority, default_port(scheme));
        host = lower(hp.first);
        port = hp.second;
    }

    bool ParsedURL::hasDefaultPort() const
    {
        return port == default_port(scheme);
    }

    std::string ParsedURL::hostPort() const
    {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (!hasDefaultPort())
            h += ":" + std::to_string(port);
        return h;
    }

    std::string ParsedURL::toString() const
    {
        return scheme + "://" + hostPort() + path;
    }

    ParsedURL ParsedURL::resolveReference(const std::string &ref) const
    {
        const size_t colon = scheme_end(ref);
        if (colon != std::string::npos)
        {
            if (ref.compare(colon + 1, 2, "//") != 0)
                throw std::invalid_argument("unsupported URL scheme: " + lower(ref.substr(0, colon)));
            return ParsedURL(ref);
        }
        if (ref.rfind("//", 0) == 0)
            return ParsedURL(scheme + ":" + ref);

        ParsedURL out;
        out.scheme = scheme;
        out.host = host;
        out.port = port;

        std::string ref_path = ref;
        size_t frag = ref_path.find('#');
        if (frag != std::string::npos)
            ref_path = ref_path.substr(0, frag);

        const size_t q = path.find('?');
        const std::string base_path = path.substr(0, q);

        if (ref_path.empty())
        {
            out.path = path;
        }
        else if (ref_path[0] == '?')
        {
            out.path = base_path + ref_path;
        }
        else
        {
            std::string query;
            size_t rq = ref_path.find('?');
            if (rq != std::string::npos)
            {
                query = ref_path.substr(rq);
                ref_path = ref_path.substr(0, rq);
            }
            std::string merged;
            if (ref_path[0] == '/')
                merged = ref_path;
            else
                merged = base_path.substr(0, base_path.rfind('/') + 1) + ref_path;
            out.path = remove_dot_segments(merged) + query;
        }
        return out;
    }
} // namespace netprobe
