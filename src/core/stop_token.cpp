#include "agent_runner/core/stop_token.hpp"
#include "agent_runner/core/errors.hpp"
#include "agent_runner/core/types.hpp"

#include <algorithm>

namespace agent_runner::core {

void StopToken::request_stop(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        reason_ = reason;
    }
    cv_.notify_all();
}

void StopToken::set_deadline(Clock::time_point deadline) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_ = deadline;
    }
    cv_.notify_all();
}

void StopToken::set_timeout(std::chrono::milliseconds timeout) {
    set_deadline(Clock::now() + timeout);
}

bool StopToken::check_deadline_locked() const {
    if (!stopped_ && deadline_ && Clock::now() >= *deadline_) {
        stopped_ = true;
        reason_ = "run deadline exceeded";
    }
    return stopped_;
}

bool StopToken::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_deadline_locked();
}

std::string StopToken::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    check_deadline_locked();
    return reason_;
}

bool StopToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (check_deadline_locked()) return true;

    Clock::time_point wake = Clock::now() + duration;
    if (deadline_) {
        wake = std::min(wake, *deadline_);
    }
    cv_.wait_until(lock, wake, [this] { return stopped_; });
    return check_deadline_locked();
}

void StopToken::throw_if_stopped() const {
    if (stop_requested()) {
        throw StopRequested(std::string(kCancelledPrefix) + ": " + reason());
    }
}

} // namespace agent_runner::core
