// ===================== include/dns_message.hpp =====================
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netprobe::dns
{
    struct Question
    {
        std::string name; // fully qualified, trailing dot
        uint16_t type = 0;
        uint16_t klass = 1;
    };

    struct ResourceRecord
    {
        std::string name;
        uint16_t type = 0;
        uint16_t klass = 1;
        uint32_t ttl = 0;
        std::string rdata; // presentation form, e.g. "10 mail.example.com."

        // "name\tttl\tclass\ttype\trdata", the form validators match against.
        std::string toString() const;
    };

    struct Message
    {
        uint16_t id = 0;
        uint16_t flags = 0;
        std::vector<Question> questions;
        std::vector<ResourceRecord> answers;
        std::vector<ResourceRecord> authority;
        std::vector<ResourceRecord> additional;

        int rcode() const { return flags & 0x0F; }
        bool isResponse() const { return (flags & 0x8000) != 0; }
        bool truncated() const { return (flags & 0x0200) != 0; }
    };

    // "AAAA" -> 28. Throws std::invalid_argument for names it does not know.
    uint16_t typeFromString(const std::string &name);
    // 28 -> "AAAA", unknown types as "TYPE<n>".
    std::string typeToString(uint16_t type);
    std::string classToString(uint16_t klass);

    std::optional<int> rcodeFromString(const std::string &name);
    std::string rcodeToString(int rcode);

    // Wire-format query with a single question of class IN. Throws
    // std::invalid_argument on malformed names.
    std::string buildQuery(uint16_t id, const std::string &qname, uint16_t qtype, bool recursion_desired);

    // Throws std::runtime_error on truncated or malformed input.
    Message parseMessage(const std::string &wire);
} // namespace netprobe::dns
