// ===================== src/prober.cpp =====================
#include "prober.hpp"
#include "dns_probe.hpp"
#include "http_probe.hpp"
#include "icmp_probe.hpp"
#include "tcp_probe.hpp"

namespace netprobe
{
    const std::map<std::string, ProbeFn> &probers()
    {
        static const std::map<std::string, ProbeFn> table = {
            {"http", &HttpProber::probe},
            {"tcp", &TcpProber::probe},
            {"dns", &DnsProber::probe},
            {"icmp", &IcmpProber::probe},
        };
        return table;
    }

    ProbeFn findProber(const std::string &name)
    {
        auto it = probers().find(name);
        return it == probers().end() ? nullptr : it->second;
    }
} // namespace netprobe
