// ===================== include/icmp_probe.hpp =====================
#pragma once
#include <cstddef>
#include <string>

#include "context.hpp"
#include "module_config.hpp"

namespace netprobe
{
    class DiagLogger;
    class ResultSink;

    class IcmpProber
    {
    public:
        // One echo request / reply exchange with target (a host name or
        // address). Never throws; a socket permission failure yields false.
        static bool probe(Context &ctx, const std::string &target, const Module &module,
                          ResultSink &sink, DiagLogger *diag);

        // Echo data: a fixed marker, padded or cut to size when size > 0.
        static std::string payload(std::size_t size);
    };
} // namespace netprobe
