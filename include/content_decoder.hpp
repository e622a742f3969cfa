// ===================== include/content_decoder.hpp =====================
#pragma once
#include <cstddef>
#include <string>

#include "context.hpp"

namespace netprobe
{
    class BodyLimitExceeded : public ProbeError
    {
    public:
        explicit BodyLimitExceeded(std::size_t limit);
    };

    /**
     * Undoes Content-Encoding codings the prober understands (gzip, x-gzip,
     * deflate, identity). A header naming any other coding leaves the body
     * untouched. limit bounds the decoded size (0 = unbounded); exceeding it
     * throws BodyLimitExceeded. Corrupt input throws ProbeError("transfer", ...).
     */
    class ContentDecoder
    {
    public:
        static bool isKnown(const std::string &coding);
        static std::string decode(const std::string &content_encoding, const std::string &body,
                                  std::size_t limit);
    };
} // namespace netprobe
