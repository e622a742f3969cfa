// ===================== include/dns_probe.hpp =====================
#pragma once
#include <string>

#include "context.hpp"
#include "module_config.hpp"

namespace netprobe
{
    class DiagLogger;
    class ResultSink;

    class DnsProber
    {
    public:
        // Sends one query to target ("server[:port]", port 53 by default)
        // and validates the response code and record sections.
        static bool probe(Context &ctx, const std::string &target, const Module &module,
                          ResultSink &sink, DiagLogger *diag);
    };
} // namespace netprobe
