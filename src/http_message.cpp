// ===================== src/http_message.cpp =====================
#include "http_message.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace netprobe
{
    namespace
    {
        constexpr std::size_t kMaxLineLength = 64 * 1024;

        std::string trim(const std::string &s)
        {
            size_t b = s.find_first_not_of(" \t");
            if (b == std::string::npos)
                return std::string();
            size_t e = s.find_last_not_of(" \t");
            return s.substr(b, e - b + 1);
        }

        // stoul and friends accept signs and leading blanks; wire numbers do not
        bool is_number(const std::string &s, bool hex)
        {
            return !s.empty() && std::all_of(s.begin(), s.end(), [hex](unsigned char c) {
                return hex ? std::isxdigit(c) != 0 : std::isdigit(c) != 0;
            });
        }

        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }
    } // namespace

    bool iequals(const std::string &a, const std::string &b)
    {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    }

    void HttpHeaders::add(const std::string &name, const std::string &value)
    {
        entries_.emplace_back(name, value);
    }

    void HttpHeaders::set(const std::string &name, const std::string &value)
    {
        remove(name);
        add(name, value);
    }

    void HttpHeaders::remove(const std::string &name)
    {
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                      [&](const std::pair<std::string, std::string> &e) {
                                          return iequals(e.first, name);
                                      }),
                       entries_.end());
    }

    bool HttpHeaders::has(const std::string &name) const
    {
        for (const auto &e : entries_)
            if (iequals(e.first, name))
                return true;
        return false;
    }

    std::optional<std::string> HttpHeaders::get(const std::string &name) const
    {
        for (const auto &e : entries_)
            if (iequals(e.first, name))
                return e.second;
        return std::nullopt;
    }

    std::vector<std::string> HttpHeaders::values(const std::string &name) const
    {
        std::vector<std::string> out;
        for (const auto &e : entries_)
            if (iequals(e.first, name))
                out.push_back(e.second);
        return out;
    }

    std::string HttpRequest::serialize() const
    {
        std::string out = method + " " + target + " HTTP/1.1\r\n";
        for (const auto &h : headers.entries())
            out += h.first + ": " + h.second + "\r\n";
        out += "\r\n";
        out += body;
        return out;
    }

    HttpResponseReader::HttpResponseReader(ByteStream &stream, Context &ctx, TraceListener *trace)
        : stream_(stream), ctx_(ctx), trace_(trace)
    {
    }

    bool HttpResponseReader::fill()
    {
        if (eof_)
            return false;
        char tmp[8192];
        size_t n = stream_.readSome(tmp, sizeof(tmp), ctx_);
        if (n == 0)
        {
            eof_ = true;
            return false;
        }
        if (trace_)
            trace_->gotFirstResponseByte();
        buf_.append(tmp, n);
        return true;
    }

    std::optional<std::string> HttpResponseReader::readLine()
    {
        size_t scanned = 0;
        while (true)
        {
            size_t nl = buf_.find('\n', scanned);
            if (nl != std::string::npos)
            {
                std::string line = buf_.substr(0, nl);
                buf_.erase(0, nl + 1);
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                return line;
            }
            scanned = buf_.size();
            if (scanned > kMaxLineLength)
                throw ProbeError("processing", "response line too long");
            if (!fill())
                return std::nullopt;
        }
    }

    void HttpResponseReader::readHead(HttpResponse &resp)
    {
        while (true)
        {
            auto status = readLine();
            if (!status)
                throw ProbeError("processing", "server closed connection before sending a response");
            if (status->empty())
                continue;

            const std::string &line = *status;
            size_t sp = line.find(' ');
            if (line.rfind("HTTP/", 0) != 0 || sp == std::string::npos || line.size() < sp + 4)
                throw ProbeError("processing", "malformed status line: " + line);
            const std::string code = line.substr(sp + 1, 3);
            if (!std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c); }))
                throw ProbeError("processing", "malformed status code: " + line);

            resp.version = line.substr(0, sp);
            resp.status = std::stoi(code);
            resp.reason = line.size() > sp + 5 ? line.substr(sp + 5) : std::string();
            resp.headers = HttpHeaders();

            std::string last_name, last_value;
            bool have_last = false;
            while (true)
            {
                auto h = readLine();
                if (!h)
                    throw ProbeError("processing", "unexpected EOF in response headers");
                if (h->empty())
                    break;
                if ((*h)[0] == ' ' || (*h)[0] == '\t')
                {
                    // obsolete line folding
                    if (have_last)
                        last_value += " " + trim(*h);
                    continue;
                }
                if (have_last)
                    resp.headers.add(last_name, last_value);
                size_t colon = h->find(':');
                if (colon == std::string::npos)
                    throw ProbeError("processing", "malformed header line: " + *h);
                last_name = trim(h->substr(0, colon));
                last_value = trim(h->substr(colon + 1));
                have_last = true;
            }
            if (have_last)
                resp.headers.add(last_name, last_value);

            if (resp.status >= 100 && resp.status < 200 && resp.status != 101)
                continue;
            return;
        }
    }

    void HttpResponseReader::readExact(HttpResponse &resp, std::size_t n)
    {
        while (buf_.size() < n)
            if (!fill())
                throw ProbeError("transfer", "unexpected EOF reading response body");
        resp.body.append(buf_, 0, n);
        buf_.erase(0, n);
    }

    void HttpResponseReader::readToEof(HttpResponse &resp)
    {
        while (fill())
        {
        }
        resp.body += buf_;
        buf_.clear();
    }

    void HttpResponseReader::readChunked(HttpResponse &resp)
    {
        while (true)
        {
            auto line = readLine();
            if (!line)
                throw ProbeError("transfer", "unexpected EOF in chunked body");
            std::string size_str = trim(line->substr(0, line->find(';')));
            size_t used = 0;
            unsigned long size = 0;
            if (!is_number(size_str, true))
                throw ProbeError("transfer", "malformed chunk size: " + *line);
            try
            {
                size = std::stoul(size_str, &used, 16);
            }
            catch (const std::exception &)
            {
                throw ProbeError("transfer", "malformed chunk size: " + *line);
            }
            if (used != size_str.size())
                throw ProbeError("transfer", "malformed chunk size: " + *line);

            if (size == 0)
            {
                // trailers
                while (true)
                {
                    auto t = readLine();
                    if (!t || t->empty())
                        return;
                }
            }

            readExact(resp, size);
            auto crlf = readLine();
            if (!crlf || !crlf->empty())
                throw ProbeError("transfer", "missing CRLF after chunk");
        }
    }

    HttpResponse HttpResponseReader::read(bool head_request)
    {
        HttpResponse resp;
        readHead(resp);

        const bool no_body = head_request || resp.status == 204 || resp.status == 304 ||
                             (resp.status >= 100 && resp.status < 200);
        if (!no_body)
        {
            auto te = resp.headers.get("Transfer-Encoding");
            auto cl = resp.headers.get("Content-Length");
            if (te && lower(*te).find("chunked") != std::string::npos)
            {
                readChunked(resp);
            }
            else if (cl)
            {
                size_t used = 0;
                unsigned long long n = 0;
                if (!is_number(*cl, false))
                    throw ProbeError("processing", "malformed Content-Length: " + *cl);
                try
                {
                    n = std::stoull(*cl, &used);
                }
                catch (const std::exception &)
                {
                    throw ProbeError("processing", "malformed Content-Length: " + *cl);
                }
                if (used != cl->size())
                    throw ProbeError("processing", "malformed Content-Length: " + *cl);
                readExact(resp, static_cast<std::size_t>(n));
            }
            else
            {
                readToEof(resp);
            }
        }

        resp.wire_bytes = resp.body.size();
        if (trace_)
            trace_->bodyDone();
        return resp;
    }
} // namespace netprobe
