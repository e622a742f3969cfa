// ===================== File: src/utils_net.cpp =====================
#include "utils_net.hpp"
#include "context.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <unistd.h>

namespace netprobe::net {

uint16_t csum16(const void* data, std::size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    uint32_t sum = 0;
    while (len > 1) {
        uint16_t word;
        std::memcpy(&word, p, sizeof(word));
        sum += word;
        p += 2;
        len -= 2;
    }
    if (len) sum += *p;
    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return static_cast<uint16_t>(~sum);
}

std::string addr_to_string(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN];
    const void* src = nullptr;
    if (ss.ss_family == AF_INET)
        src = &reinterpret_cast<const sockaddr_in*>(&ss)->sin_addr;
    else if (ss.ss_family == AF_INET6)
        src = &reinterpret_cast<const sockaddr_in6*>(&ss)->sin6_addr;
    else
        return std::string();
    return inet_ntop(ss.ss_family, src, buf, sizeof(buf)) ? std::string(buf) : std::string();
}

bool is_ip_literal(const std::string& host) {
    in6_addr a6{};
    in_addr a4{};
    return inet_pton(AF_INET, host.c_str(), &a4) == 1 ||
           inet_pton(AF_INET6, host.c_str(), &a6) == 1;
}

std::pair<std::string, int> split_host_port(const std::string& target, int default_port) {
    std::string host = target;
    std::string port;

    if (!target.empty() && target[0] == '[') {
        size_t close = target.find(']');
        if (close == std::string::npos)
            throw std::invalid_argument("missing ']' in address " + target);
        host = target.substr(1, close - 1);
        if (close + 1 < target.size()) {
            if (target[close + 1] != ':')
                throw std::invalid_argument("bad address " + target);
            port = target.substr(close + 2);
        }
    } else {
        size_t colon = target.rfind(':');
        // more than one colon without brackets: bare IPv6 literal
        if (colon != std::string::npos && target.find(':') == colon) {
            host = target.substr(0, colon);
            port = target.substr(colon + 1);
        }
    }

    if (host.empty())
        throw std::invalid_argument("missing host in address " + target);
    if (port.empty()) {
        if (default_port < 0)
            throw std::invalid_argument("missing port in address " + target);
        return {host, default_port};
    }

    size_t used = 0;
    int p = 0;
    try {
        p = std::stoi(port, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad port in address " + target);
    }
    if (used != port.size() || p <= 0 || p > 65535)
        throw std::invalid_argument("bad port in address " + target);
    return {host, p};
}

void bind_source(int fd, int family, const std::string& source_ip) {
    sockaddr_storage ss{};
    socklen_t len = 0;
    if (family == AF_INET) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&ss);
        sin->sin_family = AF_INET;
        if (inet_pton(AF_INET, source_ip.c_str(), &sin->sin_addr) != 1)
            throw ProbeError("setup", "source address " + source_ip + " is not an IPv4 address");
        len = sizeof(sockaddr_in);
    } else {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&ss);
        sin6->sin6_family = AF_INET6;
        if (inet_pton(AF_INET6, source_ip.c_str(), &sin6->sin6_addr) != 1)
            throw ProbeError("setup", "source address " + source_ip + " is not an IPv6 address");
        len = sizeof(sockaddr_in6);
    }
    if (::bind(fd, reinterpret_cast<sockaddr*>(&ss), len) != 0)
        throw ProbeError("setup", "bind " + source_ip + ": " + std::strerror(errno));
}

void ScopedFd::reset(int fd) {
    if (fd_ != -1)
        ::close(fd_);
    fd_ = fd;
}

} // namespace netprobe::net
