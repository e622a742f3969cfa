// ===================== include/tcp_probe.hpp =====================
#pragma once
#include <regex>
#include <string>

#include "context.hpp"
#include "module_config.hpp"

namespace netprobe
{
    class DiagLogger;
    class ResultSink;

    class TcpProber
    {
    public:
        // Connects to target ("host:port"), optionally wraps it in TLS, then
        // plays the module's query_response script. Never throws.
        static bool probe(Context &ctx, const std::string &target, const Module &module,
                          ResultSink &sink, DiagLogger *diag);

        // Replaces $N and ${N} in tmpl with submatch N of m; "$$" is a literal $.
        static std::string expand(const std::string &tmpl, const std::smatch &m);
    };
} // namespace netprobe
