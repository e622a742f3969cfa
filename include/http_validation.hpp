// ===================== include/http_validation.hpp =====================
#pragma once
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "http_message.hpp"
#include "module_config.hpp"

namespace netprobe
{
    class DiagLogger;

    struct CompiledHeaderMatch
    {
        std::string header;
        std::regex re;
        std::string pattern;
        bool allow_missing = false;
    };

    /**
     * Regex predicates of an HTTP module, compiled once before the attempt
     * starts. compile() throws std::regex_error on a malformed pattern.
     */
    struct CompiledHttpChecks
    {
        std::vector<std::pair<std::string, std::regex>> body_matches;
        std::vector<std::pair<std::string, std::regex>> body_not_matches;
        std::vector<CompiledHeaderMatch> header_matches;
        std::vector<CompiledHeaderMatch> header_not_matches;

        static CompiledHttpChecks compile(const HttpProbeConfig &cfg);
    };

    // Empty valid_codes accepts 200..299.
    bool matchStatusCode(int status, const std::vector<int> &valid_codes, DiagLogger *diag);

    // Empty valid_versions accepts any version.
    bool matchHttpVersion(const std::string &version, const std::vector<std::string> &valid_versions,
                          DiagLogger *diag);

    bool matchBodyRegexps(const std::string &body, const CompiledHttpChecks &checks, DiagLogger *diag);

    bool matchHeaderRegexps(const HttpHeaders &headers, const CompiledHttpChecks &checks, DiagLogger *diag);
} // namespace netprobe
