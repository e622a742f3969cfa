// ===================== src/context.cpp =====================
#include "context.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace netprobe
{
    ProbeError::ProbeError(const std::string &phase, const std::string &what)
        : std::runtime_error(what), phase_(phase)
    {
    }

    DeadlineExceeded::DeadlineExceeded(const std::string &phase, const std::string &what)
        : ProbeError(phase, what)
    {
    }

    Context::State::~State()
    {
        if (event_fd != -1)
            ::close(event_fd);
    }

    Context::Context(clk::duration timeout) : Context(clk::now() + timeout) {}

    Context::Context(clk::time_point deadline) : state_(std::make_shared<State>())
    {
        state_->deadline = deadline;
        state_->event_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (state_->event_fd == -1)
            throw std::runtime_error(std::string("eventfd failed: ") + std::strerror(errno));
    }

    clk::time_point Context::deadline() const
    {
        return state_->deadline;
    }

    clk::duration Context::remaining() const
    {
        auto left = state_->deadline - clk::now();
        return left.count() > 0 ? left : clk::duration::zero();
    }

    void Context::cancel()
    {
        if (state_->cancelled.exchange(true))
            return;
        uint64_t one = 1;
        // eventfd counter cannot overflow from a single write
        (void)::write(state_->event_fd, &one, sizeof(one));
    }

    bool Context::cancelled() const
    {
        return state_->cancelled.load();
    }

    bool Context::done() const
    {
        return cancelled() || clk::now() >= state_->deadline;
    }

    void Context::check(const std::string &phase) const
    {
        if (cancelled())
            throw DeadlineExceeded(phase, "context canceled");
        if (clk::now() >= state_->deadline)
            throw DeadlineExceeded(phase, "context deadline exceeded");
    }

    short Context::waitFor(int fd, short events, const std::string &phase) const
    {
        using std::chrono::duration_cast;
        using std::chrono::milliseconds;

        while (true)
        {
            check(phase);

            // round up so we never spin on a zero timeout before the deadline
            auto left = remaining();
            auto ms = duration_cast<milliseconds>(left);
            if (ms < left)
                ms += milliseconds(1);

            pollfd pfds[2]{};
            pfds[0].fd = fd;
            pfds[0].events = events;
            pfds[1].fd = state_->event_fd;
            pfds[1].events = POLLIN;

            int rc = ::poll(pfds, 2, static_cast<int>(ms.count()));
            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                throw ProbeError(phase, std::string("poll failed: ") + std::strerror(errno));
            }
            if (pfds[1].revents != 0)
                throw DeadlineExceeded(phase, "context canceled");
            if (rc > 0 && pfds[0].revents != 0)
                return pfds[0].revents;
        }
    }
} // namespace netprobe
