// ===================== File: include/utils_net.hpp =====================
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <sys/socket.h>

namespace netprobe::net {

// Internet checksum over an arbitrary buffer
uint16_t csum16(const void* data, std::size_t len);

// Numeric form of the address held in ss ("127.0.0.1", "::1")
std::string addr_to_string(const sockaddr_storage& ss);

// True for literal IPv4/IPv6 addresses (no brackets)
bool is_ip_literal(const std::string& host);

// Splits "host:port" / "[v6]:port" / "host". Port is default_port when absent;
// throws std::invalid_argument when absent and default_port < 0.
std::pair<std::string, int> split_host_port(const std::string& target, int default_port);

// Binds fd to a local numeric address of the given family.
void bind_source(int fd, int family, const std::string& source_ip);

// Owns a raw descriptor; closes it on destruction.
class ScopedFd {
public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}
    ~ScopedFd() { reset(); }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    void reset(int fd = -1);

private:
    int fd_;
};

} // namespace netprobe::net
