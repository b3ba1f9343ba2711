#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace agent_runner::core {

// Run-wide cancellation: an explicit stop request and/or a deadline.
// Shared by reference between the orchestrator and every task of one run.
class StopToken {
public:
    using Clock = std::chrono::steady_clock;

    StopToken() = default;
    StopToken(const StopToken&) = delete;
    StopToken& operator=(const StopToken&) = delete;

    void request_stop(const std::string& reason = "stop requested");
    void set_deadline(Clock::time_point deadline);
    void set_timeout(std::chrono::milliseconds timeout);

    bool stop_requested() const;
    std::string reason() const;

    /**
     * Sleep for up to `duration`, waking early on stop or deadline.
     * @return true if the token is stopped when the wait ends.
     */
    bool wait_for(std::chrono::milliseconds duration) const;

    // Throws StopRequested carrying "cancelled: <reason>"
    void throw_if_stopped() const;

private:
    bool check_deadline_locked() const;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable bool stopped_ = false;
    mutable std::string reason_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace agent_runner::core
