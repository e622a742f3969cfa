// ===================== include/http_probe.hpp =====================
#pragma once
#include <string>

#include "context.hpp"
#include "module_config.hpp"

namespace netprobe
{
    class DiagLogger;
    class ResultSink;

    class HttpProber
    {
    public:
        // Maximum number of redirects followed within one attempt.
        static constexpr int kMaxRedirects = 10;
        static constexpr const char *kUserAgent = "netprobe/1.0";

        // One HTTP(S) attempt against target (a URL; scheme defaults to
        // http). Returns true iff the exchange completed and every
        // configured check passed. Never throws.
        static bool probe(Context &ctx, const std::string &target, const Module &module,
                          ResultSink &sink, DiagLogger *diag);
    };
} // namespace netprobe
