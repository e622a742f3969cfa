// ===================== src/phase_tracer.cpp =====================
#include "phase_tracer.hpp"

namespace netprobe
{
    namespace
    {
        using Stamp = std::optional<clk::time_point>;

        // Adds end-start to total when both are known.
        void accumulate(const Stamp &start, const Stamp &end, std::optional<double> &total)
        {
            if (!start || !end)
                return;
            double secs = std::chrono::duration<double>(*end - *start).count();
            total = total.value_or(0.0) + (secs < 0 ? 0.0 : secs);
        }
    } // namespace

    void PhaseTracer::startHop()
    {
        hops_.emplace_back();
    }

    HopTiming &PhaseTracer::current()
    {
        if (hops_.empty())
            hops_.emplace_back();
        return hops_.back();
    }

    void PhaseTracer::resolveStart() { current().resolve_start = clk::now(); }
    void PhaseTracer::resolveDone() { current().resolve_done = clk::now(); }
    void PhaseTracer::connectStart() { current().connect_start = clk::now(); }
    void PhaseTracer::connectDone() { current().connect_done = clk::now(); }
    void PhaseTracer::tlsStart() { current().tls_start = clk::now(); }
    void PhaseTracer::tlsDone() { current().tls_done = clk::now(); }
    void PhaseTracer::wroteRequest() { current().wrote_request = clk::now(); }

    void PhaseTracer::gotFirstResponseByte()
    {
        auto &hop = current();
        if (!hop.first_byte)
            hop.first_byte = clk::now();
    }

    void PhaseTracer::bodyDone() { current().body_done = clk::now(); }

    std::vector<std::pair<std::string, double>> PhaseTracer::phaseDurations() const
    {
        std::optional<double> resolve, connect, tls, processing, transfer;
        for (const auto &hop : hops_)
        {
            accumulate(hop.resolve_start, hop.resolve_done, resolve);
            accumulate(hop.connect_start, hop.connect_done, connect);
            accumulate(hop.tls_start, hop.tls_done, tls);
            accumulate(hop.wrote_request, hop.first_byte, processing);
            accumulate(hop.first_byte, hop.body_done, transfer);
        }

        std::vector<std::pair<std::string, double>> out;
        if (resolve)
            out.emplace_back("resolve", *resolve);
        if (connect)
            out.emplace_back("connect", *connect);
        if (tls)
            out.emplace_back("tls", *tls);
        if (processing)
            out.emplace_back("processing", *processing);
        if (transfer)
            out.emplace_back("transfer", *transfer);
        return out;
    }
} // namespace netprobe
