// ===================== include/byte_stream.hpp =====================
#pragma once
#include <cstddef>
#include <string>

#include "context.hpp"

namespace netprobe
{
    // Bidirectional byte stream whose blocking calls are bounded by a Context.
    class ByteStream
    {
    public:
        virtual ~ByteStream() = default;

        virtual void writeAll(const std::string &data, Context &ctx) = 0;

        // Returns 0 once the peer closed the stream.
        virtual std::size_t readSome(char *buf, std::size_t len, Context &ctx) = 0;
    };
} // namespace netprobe
