// ===================== include/context.hpp =====================
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace netprobe
{
    using clk = std::chrono::steady_clock;

    // Failure of one probe step. phase() names the step that failed
    // ("resolve", "connect", "tls", "processing", "transfer", ...).
    class ProbeError : public std::runtime_error
    {
    public:
        ProbeError(const std::string &phase, const std::string &what);
        const std::string &phase() const { return phase_; }

    private:
        std::string phase_;
    };

    // Thrown when the context is cancelled or its deadline passes while
    // an operation is waiting.
    class DeadlineExceeded : public ProbeError
    {
    public:
        DeadlineExceeded(const std::string &phase, const std::string &what);
    };

    /**
     * Deadline plus cooperative cancellation token for one probe attempt.
     * Copies share the same cancellation state, so a copy handed to
     * another thread can cancel the attempt.
     */
    class Context
    {
    public:
        explicit Context(clk::duration timeout);
        explicit Context(clk::time_point deadline);

        clk::time_point deadline() const;
        clk::duration remaining() const;

        // Safe to call from any thread.
        void cancel();
        bool cancelled() const;
        bool done() const;

        // Throws DeadlineExceeded if the context is done.
        void check(const std::string &phase) const;

        // Waits until fd reports one of events (POLLIN/POLLOUT), the
        // context is cancelled, or the deadline passes. Returns revents.
        short waitFor(int fd, short events, const std::string &phase) const;

    private:
        struct State
        {
            clk::time_point deadline;
            std::atomic<bool> cancelled{false};
            int event_fd = -1;
            ~State();
        };
        std::shared_ptr<State> state_;
    };
} // namespace netprobe
