// ===================== include/phase_tracer.hpp =====================
#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "context.hpp"

namespace netprobe
{
    // Lifecycle events of one request/response exchange.
    class TraceListener
    {
    public:
        virtual ~TraceListener() = default;

        virtual void resolveStart() = 0;
        virtual void resolveDone() = 0;
        virtual void connectStart() = 0;
        virtual void connectDone() = 0;
        virtual void tlsStart() = 0;
        virtual void tlsDone() = 0;
        virtual void wroteRequest() = 0;
        virtual void gotFirstResponseByte() = 0;
        virtual void bodyDone() = 0;
    };

    struct HopTiming
    {
        std::optional<clk::time_point> resolve_start, resolve_done;
        std::optional<clk::time_point> connect_start, connect_done;
        std::optional<clk::time_point> tls_start, tls_done;
        std::optional<clk::time_point> wrote_request, first_byte, body_done;
    };

    /**
     * Records event timestamps per hop and turns them into phase durations.
     * A phase is reported only if both its boundaries were seen in at least
     * one hop; durations of the same phase are summed over all hops.
     */
    class PhaseTracer : public TraceListener
    {
    public:
        void startHop();
        const std::vector<HopTiming> &hops() const { return hops_; }

        // (phase, seconds) in resolve, connect, tls, processing, transfer order.
        std::vector<std::pair<std::string, double>> phaseDurations() const;

        void resolveStart() override;
        void resolveDone() override;
        void connectStart() override;
        void connectDone() override;
        void tlsStart() override;
        void tlsDone() override;
        void wroteRequest() override;
        void gotFirstResponseByte() override;
        void bodyDone() override;

    private:
        std::vector<HopTiming> hops_;

        HopTiming &current();
    };
} // namespace netprobe
