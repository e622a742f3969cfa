// ===================== src/dns_message.cpp =====================
#include "dns_message.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace netprobe::dns
{
    namespace
    {
        const std::pair<const char *, uint16_t> kTypes[] = {
            {"A", 1},       {"NS", 2},      {"CNAME", 5},  {"SOA", 6},    {"PTR", 12},   {"HINFO", 13},
            {"MX", 15},     {"TXT", 16},    {"AAAA", 28},  {"SRV", 33},   {"NAPTR", 35}, {"OPT", 41},
            {"DS", 43},     {"RRSIG", 46},  {"NSEC", 47},  {"DNSKEY", 48}, {"TLSA", 52}, {"SVCB", 64},
            {"HTTPS", 65},  {"ANY", 255},   {"CAA", 257},
        };

        const char *const kRcodes[] = {"NOERROR", "FORMERR", "SERVFAIL", "NXDOMAIN", "NOTIMP", "REFUSED",
                                       "YXDOMAIN", "YXRRSET", "NXRRSET", "NOTAUTH", "NOTZONE"};

        void need(const std::string &w, size_t pos, size_t n)
        {
            if (pos + n > w.size())
                throw std::runtime_error("truncated DNS message");
        }

        uint8_t u8(const std::string &w, size_t &pos)
        {
            need(w, pos, 1);
            return static_cast<uint8_t>(w[pos++]);
        }

        uint16_t u16(const std::string &w, size_t &pos)
        {
            need(w, pos, 2);
            uint16_t v = static_cast<uint16_t>((static_cast<uint8_t>(w[pos]) << 8) | static_cast<uint8_t>(w[pos + 1]));
            pos += 2;
            return v;
        }

        uint32_t u32(const std::string &w, size_t &pos)
        {
            uint32_t hi = u16(w, pos);
            return (hi << 16) | u16(w, pos);
        }

        void put16(std::string &out, uint16_t v)
        {
            out += static_cast<char>(v >> 8);
            out += static_cast<char>(v & 0xFF);
        }

        // Escapes label or character-string bytes in presentation form.
        std::string escape(const std::string &raw, bool in_name)
        {
            std::string out;
            for (unsigned char c : raw)
            {
                if ((in_name && c == '.') || c == '\\' || (!in_name && c == '"'))
                {
                    out += '\\';
                    out += static_cast<char>(c);
                }
                else if (c < 0x21 || c > 0x7E)
                {
                    if (!in_name && c == ' ')
                    {
                        out += ' ';
                        continue;
                    }
                    char buf[5];
                    std::snprintf(buf, sizeof(buf), "\\%03u", c);
                    out += buf;
                }
                else
                {
                    out += static_cast<char>(c);
                }
            }
            return out;
        }

        // Reads a possibly compressed name starting at pos; pos ends after
        // the name as it appears in place.
        std::string read_name(const std::string &w, size_t &pos)
        {
            std::string out;
            size_t p = pos;
            bool jumped = false;
            int jumps = 0;
            while (true)
            {
                need(w, p, 1);
                uint8_t len = static_cast<uint8_t>(w[p]);
                if ((len & 0xC0) == 0xC0)
                {
                    need(w, p, 2);
                    size_t target = (static_cast<size_t>(len & 0x3F) << 8) | static_cast<uint8_t>(w[p + 1]);
                    if (!jumped)
                        pos = p + 2;
                    jumped = true;
                    if (++jumps > 64 || target >= w.size())
                        throw std::runtime_error("bad compression pointer in DNS message");
                    p = target;
                    continue;
                }
                if (len & 0xC0)
                    throw std::runtime_error("unsupported label type in DNS message");
                ++p;
                if (len == 0)
                    break;
                need(w, p, len);
                out += escape(w.substr(p, len), true);
                out += '.';
                p += len;
                if (out.size() > 1024)
                    throw std::runtime_error("DNS name too long");
            }
            if (!jumped)
                pos = p;
            return out.empty() ? std::string(".") : out;
        }

        std::string character_strings(const std::string &w, size_t pos, size_t end)
        {
            std::string out;
            while (pos < end)
            {
                uint8_t len = u8(w, pos);
                if (pos + len > end)
                    throw std::runtime_error("truncated character-string in DNS message");
                if (!out.empty())
                    out += ' ';
                out += '"' + escape(w.substr(pos, len), false) + '"';
                pos += len;
            }
            return out;
        }

        std::string generic_rdata(const std::string &w, size_t pos, size_t end)
        {
            static const char hex[] = "0123456789abcdef";
            std::string out = "\\# " + std::to_string(end - pos);
            if (end > pos)
                out += ' ';
            for (size_t i = pos; i < end; ++i)
            {
                unsigned char c = static_cast<unsigned char>(w[i]);
                out += hex[c >> 4];
                out += hex[c & 0x0F];
            }
            return out;
        }

        std::string rdata_text(const std::string &w, uint16_t type, size_t pos, size_t end)
        {
            char buf[INET6_ADDRSTRLEN];
            switch (type)
            {
            case 1: // A
                if (end - pos != 4)
                    break;
                return inet_ntop(AF_INET, w.data() + pos, buf, sizeof(buf)) ? buf : generic_rdata(w, pos, end);
            case 28: // AAAA
                if (end - pos != 16)
                    break;
                return inet_ntop(AF_INET6, w.data() + pos, buf, sizeof(buf)) ? buf : generic_rdata(w, pos, end);
            case 2:  // NS
            case 5:  // CNAME
            case 12: // PTR
                return read_name(w, pos);
            case 15: // MX
            {
                uint16_t pref = u16(w, pos);
                return std::to_string(pref) + " " + read_name(w, pos);
            }
            case 16: // TXT
                return character_strings(w, pos, end);
            case 6: // SOA
            {
                std::string mname = read_name(w, pos);
                std::string rname = read_name(w, pos);
                std::string out = mname + " " + rname;
                for (int i = 0; i < 5; ++i)
                    out += " " + std::to_string(u32(w, pos));
                return out;
            }
            case 33: // SRV
            {
                uint16_t prio = u16(w, pos);
                uint16_t weight = u16(w, pos);
                uint16_t port = u16(w, pos);
                return std::to_string(prio) + " " + std::to_string(weight) + " " + std::to_string(port) + " " +
                       read_name(w, pos);
            }
            default:
                break;
            }
            return generic_rdata(w, pos, end);
        }

        ResourceRecord read_rr(const std::string &w, size_t &pos)
        {
            ResourceRecord rr;
            rr.name = read_name(w, pos);
            rr.type = u16(w, pos);
            rr.klass = u16(w, pos);
            rr.ttl = u32(w, pos);
            uint16_t rdlen = u16(w, pos);
            need(w, pos, rdlen);
            rr.rdata = rdata_text(w, rr.type, pos, pos + rdlen);
            pos += rdlen;
            return rr;
        }
    } // namespace

    std::string ResourceRecord::toString() const
    {
        return name + "\t" + std::to_string(ttl) + "\t" + classToString(klass) + "\t" + typeToString(type) + "\t" +
               rdata;
    }

    uint16_t typeFromString(const std::string &name)
    {
        for (const auto &t : kTypes)
            if (name == t.first)
                return t.second;
        if (name.rfind("TYPE", 0) == 0 && name.size() > 4 && name.size() <= 9 &&
            std::all_of(name.begin() + 4, name.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
        {
            unsigned long v = std::stoul(name.substr(4));
            if (v <= 0xFFFF)
                return static_cast<uint16_t>(v);
        }
        throw std::invalid_argument("unknown DNS query type " + name);
    }

    std::string typeToString(uint16_t type)
    {
        for (const auto &t : kTypes)
            if (type == t.second)
                return t.first;
        return "TYPE" + std::to_string(type);
    }

    std::string classToString(uint16_t klass)
    {
        switch (klass)
        {
        case 1:
            return "IN";
        case 3:
            return "CH";
        case 4:
            return "HS";
        case 255:
            return "ANY";
        default:
            return "CLASS" + std::to_string(klass);
        }
    }

    std::optional<int> rcodeFromString(const std::string &name)
    {
        for (int i = 0; i < static_cast<int>(sizeof(kRcodes) / sizeof(kRcodes[0])); ++i)
            if (name == kRcodes[i])
                return i;
        return std::nullopt;
    }

    std::string rcodeToString(int rcode)
    {
        if (rcode >= 0 && rcode < static_cast<int>(sizeof(kRcodes) / sizeof(kRcodes[0])))
            return kRcodes[rcode];
        return "RCODE" + std::to_string(rcode);
    }

    std::string buildQuery(uint16_t id, const std::string &qname, uint16_t qtype, bool recursion_desired)
    {
        std::string out;
        put16(out, id);
        put16(out, recursion_desired ? 0x0100 : 0x0000);
        put16(out, 1); // QDCOUNT
        put16(out, 0);
        put16(out, 0);
        put16(out, 0);

        std::string name = qname;
        if (!name.empty() && name.back() == '.')
            name.pop_back();
        size_t start = 0;
        while (start < name.size())
        {
            size_t dot = name.find('.', start);
            if (dot == std::string::npos)
                dot = name.size();
            size_t len = dot - start;
            if (len == 0 || len > 63)
                throw std::invalid_argument("invalid label in DNS name " + qname);
            out += static_cast<char>(len);
            out.append(name, start, len);
            start = dot + 1;
        }
        out += '\0';
        if (out.size() - 12 > 255)
            throw std::invalid_argument("DNS name too long: " + qname);

        put16(out, qtype);
        put16(out, 1); // IN
        return out;
    }

    Message parseMessage(const std::string &wire)
    {
        Message msg;
        size_t pos = 0;
        msg.id = u16(wire, pos);
        msg.flags = u16(wire, pos);
        uint16_t qd = u16(wire, pos);
        uint16_t an = u16(wire, pos);
        uint16_t ns = u16(wire, pos);
        uint16_t ar = u16(wire, pos);

        for (uint16_t i = 0; i < qd; ++i)
        {
            Question q;
            q.name = read_name(wire, pos);
            q.type = u16(wire, pos);
            q.klass = u16(wire, pos);
            msg.questions.push_back(q);
        }
        for (uint16_t i = 0; i < an; ++i)
            msg.answers.push_back(read_rr(wire, pos));
        for (uint16_t i = 0; i < ns; ++i)
            msg.authority.push_back(read_rr(wire, pos));
        for (uint16_t i = 0; i < ar; ++i)
            msg.additional.push_back(read_rr(wire, pos));
        return msg;
    }
} // namespace netprobe::dns
