// ===================== src/cookie_jar.cpp =====================
#include "cookie_jar.hpp"
#include "utils_net.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>

namespace netprobe
{
    namespace
    {
        using sys_clock = std::chrono::system_clock;

        std::string trim(const std::string &s)
        {
            size_t b = s.find_first_not_of(" \t");
            if (b == std::string::npos)
                return std::string();
            size_t e = s.find_last_not_of(" \t");
            return s.substr(b, e - b + 1);
        }

        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::optional<sys_clock::time_point> parse_cookie_date(const std::string &s)
        {
            static const char *formats[] = {
                "%a, %d %b %Y %H:%M:%S GMT",
                "%a, %d-%b-%Y %H:%M:%S GMT",
                "%a, %d-%b-%y %H:%M:%S GMT",
                "%A, %d-%b-%y %H:%M:%S GMT",
            };
            for (const char *fmt : formats)
            {
                std::tm tm{};
                const char *end = strptime(s.c_str(), fmt, &tm);
                if (end && *end == '\0')
                    return sys_clock::from_time_t(timegm(&tm));
            }
            return std::nullopt;
        }

        // directory of the request path, per RFC 6265 5.1.4
        std::string default_path(const std::string &request_path)
        {
            std::string p = request_path.substr(0, request_path.find('?'));
            if (p.empty() || p[0] != '/')
                return "/";
            size_t slash = p.rfind('/');
            return slash == 0 ? "/" : p.substr(0, slash);
        }
    } // namespace

    bool CookieJar::domainMatch(const Cookie &c, const std::string &host)
    {
        if (c.host_only)
            return host == c.domain;
        if (host == c.domain)
            return true;
        return host.size() > c.domain.size() &&
               host.compare(host.size() - c.domain.size(), c.domain.size(), c.domain) == 0 &&
               host[host.size() - c.domain.size() - 1] == '.' && !net::is_ip_literal(host);
    }

    bool CookieJar::pathMatch(const Cookie &c, const std::string &path)
    {
        std::string p = path.substr(0, path.find('?'));
        if (p == c.path)
            return true;
        if (p.rfind(c.path, 0) != 0)
            return false;
        return c.path.back() == '/' || p[c.path.size()] == '/';
    }

    void CookieJar::store(const ParsedURL &url, const std::vector<std::string> &set_cookie)
    {
        const auto now = sys_clock::now();

        for (const auto &line : set_cookie)
        {
            size_t semi = line.find(';');
            std::string pair = trim(line.substr(0, semi));
            size_t eq = pair.find('=');
            if (eq == std::string::npos)
                continue;

            Cookie c;
            c.name = trim(pair.substr(0, eq));
            c.value = trim(pair.substr(eq + 1));
            if (c.name.empty())
                continue;
            if (c.value.size() >= 2 && c.value.front() == '"' && c.value.back() == '"')
                c.value = c.value.substr(1, c.value.size() - 2);
            c.domain = url.host;
            c.path = default_path(url.path);

            bool reject = false;
            std::optional<sys_clock::time_point> max_age_expiry;
            size_t pos = semi;
            while (pos != std::string::npos)
            {
                size_t next = line.find(';', pos + 1);
                std::string attr = trim(line.substr(pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1));
                pos = next;
                size_t aeq = attr.find('=');
                std::string key = lower(trim(attr.substr(0, aeq)));
                std::string val = aeq == std::string::npos ? std::string() : trim(attr.substr(aeq + 1));

                if (key == "domain" && !val.empty())
                {
                    if (val[0] == '.')
                        val = val.substr(1);
                    val = lower(val);
                    Cookie probe;
                    probe.domain = val;
                    probe.host_only = false;
                    if (!domainMatch(probe, url.host))
                        reject = true;
                    c.domain = val;
                    c.host_only = false;
                }
                else if (key == "path" && !val.empty() && val[0] == '/')
                {
                    c.path = val;
                }
                else if (key == "secure")
                {
                    c.secure = true;
                }
                else if (key == "max-age" && !val.empty())
                {
                    try
                    {
                        long long secs = std::stoll(val);
                        // clamp so the addition stays inside the clock's range
                        const long long room =
                            std::chrono::duration_cast<std::chrono::seconds>(sys_clock::time_point::max() - now).count();
                        if (secs <= 0)
                            max_age_expiry = sys_clock::time_point::min();
                        else if (secs >= room)
                            max_age_expiry = sys_clock::time_point::max();
                        else
                            max_age_expiry = now + std::chrono::seconds(secs);
                    }
                    catch (const std::exception &)
                    {
                        // ignored per RFC 6265 5.2.2
                    }
                }
                else if (key == "expires")
                {
                    if (auto t = parse_cookie_date(val))
                        c.expires = *t;
                }
            }
            if (reject)
                continue;
            if (max_age_expiry)
                c.expires = max_age_expiry; // Max-Age wins over Expires

            cookies_.erase(std::remove_if(cookies_.begin(), cookies_.end(),
                                          [&](const Cookie &o) {
                                              return o.name == c.name && o.domain == c.domain && o.path == c.path;
                                          }),
                           cookies_.end());
            if (c.expires && *c.expires <= now)
                continue;
            cookies_.push_back(c);
        }
    }

    std::string CookieJar::header(const ParsedURL &url) const
    {
        const auto now = sys_clock::now();
        std::vector<const Cookie *> matching;
        for (const auto &c : cookies_)
        {
            if (c.expires && *c.expires <= now)
                continue;
            if (c.secure && !url.isTls())
                continue;
            if (!domainMatch(c, url.host) || !pathMatch(c, url.path))
                continue;
            matching.push_back(&c);
        }
        // longer paths first
        std::stable_sort(matching.begin(), matching.end(),
                         [](const Cookie *a, const Cookie *b) { return a->path.size() > b->path.size(); });

        std::string out;
        for (const Cookie *c : matching)
        {
            if (!out.empty())
                out += "; ";
            out += c->name + "=" + c->value;
        }
        return out;
    }
} // namespace netprobe
