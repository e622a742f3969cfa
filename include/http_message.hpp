// ===================== include/http_message.hpp =====================
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "byte_stream.hpp"
#include "phase_tracer.hpp"

namespace netprobe
{
    // Ordered header list with case-insensitive lookup. Repeated names keep
    // every value in arrival order.
    class HttpHeaders
    {
    public:
        void add(const std::string &name, const std::string &value);
        void set(const std::string &name, const std::string &value);
        void remove(const std::string &name);

        bool has(const std::string &name) const;
        std::optional<std::string> get(const std::string &name) const;
        std::vector<std::string> values(const std::string &name) const;
        const std::vector<std::pair<std::string, std::string>> &entries() const { return entries_; }

    private:
        std::vector<std::pair<std::string, std::string>> entries_;
    };

    bool iequals(const std::string &a, const std::string &b);

    struct HttpRequest
    {
        std::string method = "GET";
        std::string target = "/";
        HttpHeaders headers;
        std::string body;

        std::string serialize() const;
    };

    struct HttpResponse
    {
        std::string version; // "HTTP/1.1"
        int status = 0;
        std::string reason;
        HttpHeaders headers;
        std::string body;          // de-chunked, still content-encoded
        std::size_t wire_bytes = 0; // body bytes after transfer decoding
    };

    /**
     * Reads one HTTP/1.x response from a stream. Reports the first byte and
     * the end of the body to the trace listener. Interim 1xx responses are
     * skipped.
     */
    class HttpResponseReader
    {
    public:
        HttpResponseReader(ByteStream &stream, Context &ctx, TraceListener *trace);

        HttpResponse read(bool head_request);

    private:
        ByteStream &stream_;
        Context &ctx_;
        TraceListener *trace_;
        std::string buf_;
        bool eof_ = false;

        bool fill();
        std::optional<std::string> readLine();
        void readHead(HttpResponse &resp);
        void readChunked(HttpResponse &resp);
        void readExact(HttpResponse &resp, std::size_t n);
        void readToEof(HttpResponse &resp);
    };
} // namespace netprobe
