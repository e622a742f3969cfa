// ===================== src/http_validation.cpp =====================
#include "http_validation.hpp"
#include "diag_logger.hpp"

#include <algorithm>

namespace netprobe
{
    namespace
    {
        std::vector<CompiledHeaderMatch> compile_headers(const std::vector<HeaderMatch> &rules)
        {
            std::vector<CompiledHeaderMatch> out;
            for (const auto &r : rules)
            {
                CompiledHeaderMatch m;
                m.header = r.header;
                m.re = std::regex(r.regexp, std::regex::ECMAScript);
                m.pattern = r.regexp;
                m.allow_missing = r.allow_missing;
                out.push_back(std::move(m));
            }
            return out;
        }
    } // namespace

    CompiledHttpChecks CompiledHttpChecks::compile(const HttpProbeConfig &cfg)
    {
        CompiledHttpChecks c;
        for (const auto &p : cfg.fail_if_body_matches_regexp)
            c.body_matches.emplace_back(p, std::regex(p, std::regex::ECMAScript));
        for (const auto &p : cfg.fail_if_body_not_matches_regexp)
            c.body_not_matches.emplace_back(p, std::regex(p, std::regex::ECMAScript));
        c.header_matches = compile_headers(cfg.fail_if_header_matches_regexp);
        c.header_not_matches = compile_headers(cfg.fail_if_header_not_matches_regexp);
        return c;
    }

    bool matchStatusCode(int status, const std::vector<int> &valid_codes, DiagLogger *diag)
    {
        bool ok;
        if (valid_codes.empty())
            ok = status >= 200 && status < 300;
        else
            ok = std::find(valid_codes.begin(), valid_codes.end(), status) != valid_codes.end();
        if (!ok && diag)
            diag->log("CHECK_FAIL kind=status_code status=" + std::to_string(status));
        return ok;
    }

    bool matchHttpVersion(const std::string &version, const std::vector<std::string> &valid_versions,
                          DiagLogger *diag)
    {
        if (valid_versions.empty())
            return true;
        if (std::find(valid_versions.begin(), valid_versions.end(), version) != valid_versions.end())
            return true;
        if (diag)
            diag->log("CHECK_FAIL kind=http_version version=" + version);
        return false;
    }

    bool matchBodyRegexps(const std::string &body, const CompiledHttpChecks &checks, DiagLogger *diag)
    {
        bool ok = true;
        for (const auto &m : checks.body_matches)
        {
            if (std::regex_search(body, m.second))
            {
                if (diag)
                    diag->log("CHECK_FAIL kind=body_matches regexp=" + m.first);
                ok = false;
            }
        }
        for (const auto &m : checks.body_not_matches)
        {
            if (!std::regex_search(body, m.second))
            {
                if (diag)
                    diag->log("CHECK_FAIL kind=body_not_matches regexp=" + m.first);
                ok = false;
            }
        }
        return ok;
    }

    bool matchHeaderRegexps(const HttpHeaders &headers, const CompiledHttpChecks &checks, DiagLogger *diag)
    {
        bool ok = true;
        for (const auto &rule : checks.header_matches)
        {
            auto values = headers.values(rule.header);
            if (values.empty())
            {
                if (!rule.allow_missing)
                {
                    if (diag)
                        diag->log("CHECK_FAIL kind=header_missing header=" + rule.header);
                    ok = false;
                }
                continue;
            }
            for (const auto &v : values)
            {
                if (std::regex_search(v, rule.re))
                {
                    if (diag)
                        diag->log("CHECK_FAIL kind=header_matches header=" + rule.header +
                                  " regexp=" + rule.pattern + " value=" + v);
                    ok = false;
                    break;
                }
            }
        }
        for (const auto &rule : checks.header_not_matches)
        {
            auto values = headers.values(rule.header);
            if (values.empty())
            {
                if (!rule.allow_missing)
                {
                    if (diag)
                        diag->log("CHECK_FAIL kind=header_missing header=" + rule.header);
                    ok = false;
                }
                continue;
            }
            bool any = std::any_of(values.begin(), values.end(),
                                   [&](const std::string &v) { return std::regex_search(v, rule.re); });
            if (!any)
            {
                if (diag)
                    diag->log("CHECK_FAIL kind=header_not_matches header=" + rule.header +
                              " regexp=" + rule.pattern);
                ok = false;
            }
        }
        return ok;
    }
} // namespace netprobe
