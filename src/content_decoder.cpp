// ===================== src/content_decoder.cpp =====================
#include "content_decoder.hpp"
#include "context.hpp"

#include <algorithm>
#include <cctype>
#include <vector>
#include <zlib.h>

namespace netprobe
{
    namespace
    {
        std::string normalize(std::string s)
        {
            s.erase(0, s.find_first_not_of(" \t"));
            s.erase(s.find_last_not_of(" \t") + 1);
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::vector<std::string> split_codings(const std::string &header)
        {
            std::vector<std::string> out;
            size_t pos = 0;
            while (pos <= header.size())
            {
                size_t comma = header.find(',', pos);
                if (comma == std::string::npos)
                    comma = header.size();
                std::string c = normalize(header.substr(pos, comma - pos));
                if (!c.empty())
                    out.push_back(c);
                pos = comma + 1;
            }
            return out;
        }

        class Inflater
        {
            z_stream z{};
            bool initialized = false;

        public:
            explicit Inflater(int window_bits)
            {
                int err = inflateInit2(&z, window_bits);
                if (err != Z_OK)
                    throw ProbeError("transfer", std::string("inflateInit2() failed: ") + zError(err));
                initialized = true;
            }

            ~Inflater()
            {
                if (initialized)
                    inflateEnd(&z);
            }

            Inflater(const Inflater &) = delete;
            Inflater &operator=(const Inflater &) = delete;

            // Returns Z_OK when the whole stream was inflated, otherwise the
            // zlib error code.
            int run(const std::string &in, std::string &out, std::size_t limit)
            {
                z.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(in.data()));
                z.avail_in = static_cast<uInt>(in.size());

                char buf[16384];
                while (true)
                {
                    z.next_out = reinterpret_cast<Bytef *>(buf);
                    z.avail_out = sizeof(buf);
                    int err = inflate(&z, Z_NO_FLUSH);
                    out.append(buf, sizeof(buf) - z.avail_out);
                    if (limit != 0 && out.size() > limit)
                        throw BodyLimitExceeded(limit);
                    if (err == Z_STREAM_END)
                        return Z_OK;
                    if (err == Z_BUF_ERROR && z.avail_in == 0)
                        return Z_BUF_ERROR; // truncated input
                    if (err != Z_OK)
                        return err;
                }
            }

            const char *message() const { return z.msg; }
        };

        std::string inflate_body(const std::string &body, int window_bits, std::size_t limit)
        {
            std::string out;
            Inflater inflater(window_bits);
            int err = inflater.run(body, out, limit);
            if (err != Z_OK)
            {
                const char *msg = inflater.message();
                throw ProbeError("transfer", std::string("inflate() failed: ") + (msg ? msg : zError(err)));
            }
            return out;
        }

        std::string undo(const std::string &coding, const std::string &body, std::size_t limit)
        {
            if (coding == "gzip" || coding == "x-gzip")
                return inflate_body(body, MAX_WBITS + 16, limit);
            if (coding == "deflate")
            {
                // zlib-wrapped per RFC 9110; some servers send raw deflate
                try
                {
                    return inflate_body(body, MAX_WBITS, limit);
                }
                catch (const BodyLimitExceeded &)
                {
                    throw;
                }
                catch (const ProbeError &)
                {
                    return inflate_body(body, -MAX_WBITS, limit);
                }
            }
            return body; // identity
        }
    } // namespace

    BodyLimitExceeded::BodyLimitExceeded(std::size_t limit)
        : ProbeError("transfer", "body size limit of " + std::to_string(limit) + " bytes exceeded")
    {
    }

    bool ContentDecoder::isKnown(const std::string &coding)
    {
        const std::string c = normalize(coding);
        return c == "gzip" || c == "x-gzip" || c == "deflate" || c == "identity";
    }

    std::string ContentDecoder::decode(const std::string &content_encoding, const std::string &body,
                                       std::size_t limit)
    {
        auto codings = split_codings(content_encoding);
        bool known = true;
        for (const auto &c : codings)
            known = known && isKnown(c);

        std::string out = body;
        // codings are listed in the order they were applied
        if (known && !body.empty())
            for (auto it = codings.rbegin(); it != codings.rend(); ++it)
                out = undo(*it, out, limit);
        if (limit != 0 && out.size() > limit)
            throw BodyLimitExceeded(limit);
        return out;
    }
} // namespace netprobe
