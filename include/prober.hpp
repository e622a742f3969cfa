// ===================== include/prober.hpp =====================
#pragma once
#include <map>
#include <string>

#include "context.hpp"
#include "module_config.hpp"

namespace netprobe
{
    class DiagLogger;
    class ResultSink;

    // Every prober has this shape: one attempt against target, samples into
    // sink, true on success. Implementations never throw.
    using ProbeFn = bool (*)(Context &ctx, const std::string &target, const Module &module,
                             ResultSink &sink, DiagLogger *diag);

    // "http", "tcp", "dns", "icmp" -> prober.
    const std::map<std::string, ProbeFn> &probers();

    // nullptr for unknown names.
    ProbeFn findProber(const std::string &name);
} // namespace netprobe
