#include "agent_runner/task/task_unit.hpp"
#include "agent_runner/core/errors.hpp"
#include "agent_runner/core/logging.hpp"
#include "agent_runner/core/utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace agent_runner::task {

namespace {

std::string cancelled_detail(const std::string& message) {
    if (core::starts_with(message, kCancelledPrefix)) {
        return message;
    }
    return std::string(kCancelledPrefix) + ": " + message;
}

} // namespace

TaskUnit::TaskUnit(std::unique_ptr<Task> task, context::ContextStore& store,
                   bus::EventBus& bus, persistence::PersistenceSink& sink)
    : task_(std::move(task)), store_(store), bus_(bus), sink_(sink) {
    if (!task_) {
        throw std::invalid_argument("TaskUnit requires a task");
    }
    name_ = task_->name();
    display_name_ = task_->display_name();
    dependencies_ = task_->dependencies();
    policy_ = task_->retry_policy();
    if (policy_.max_retries < 1) {
        policy_.max_retries = 1;
    }

    record_.name = name_;
    record_.display_name = display_name_;
    record_.result_payload = nullptr;
    store_.initialize_records({name_});
}

bool TaskUnit::can_run() const {
    for (const auto& dep : dependencies_) {
        if (!store_.is_completed(dep)) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> TaskUnit::unmet_dependencies() const {
    std::vector<std::string> unmet;
    for (const auto& dep : dependencies_) {
        if (!store_.is_completed(dep)) {
            unmet.push_back(dep);
        }
    }
    return unmet;
}

TaskRecord TaskUnit::record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_;
}

template <typename Fn>
void TaskUnit::persist(const char* what, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        core::Logger::warn(name_, std::string("Persisting ") + what + " failed: " + e.what());
    }
}

void TaskUnit::commit(const TaskRecord& snapshot) {
    store_.set_result(snapshot);
}

void TaskUnit::publish(EventType type, json payload) {
    Event event;
    event.sender = name_;
    event.type = type;
    event.payload = std::move(payload);
    bus_.publish(std::move(event));
}

void TaskUnit::start() {
    TaskRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record_.status != TaskStatus::PENDING) {
            throw std::logic_error("Task '" + name_ + "' started twice");
        }
        record_.status = TaskStatus::RUNNING;
        record_.started_at = core::get_iso_timestamp();
        record_.attempts = 0;
        snapshot = record_;
    }
    commit(snapshot);
    persist("start", [&] { sink_.save_started(name_, snapshot.started_at); });
    core::Logger::info(name_, "Starting " + display_name_);
    update_progress(0, "Starting " + display_name_);
}

void TaskUnit::update_progress(int percent, const std::string& label) {
    std::lock_guard<std::mutex> publish_lock(progress_mutex_);

    TaskRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record_.terminal()) {
            return;
        }
        const int clamped = std::clamp(percent, 0, 100);
        record_.progress_percent = std::max(record_.progress_percent, clamped);
        record_.current_task_label = label;
        snapshot = record_;
    }

    commit(snapshot);
    publish(EventType::PROGRESS,
            json{{"progress", snapshot.progress_percent}, {"task", snapshot.current_task_label}});
    persist("progress", [&] {
        sink_.save_progress(name_, snapshot.progress_percent, snapshot.current_task_label,
                            snapshot.status);
    });
}

WorkOutcome TaskUnit::run_attempt(TaskContext& ctx, bool& cancelled) {
    try {
        return task_->do_work(ctx);
    } catch (const StopRequested& e) {
        cancelled = true;
        return WorkOutcome::failure(cancelled_detail(e.what()));
    } catch (const std::exception& e) {
        return WorkOutcome::failure(e.what());
    } catch (...) {
        return WorkOutcome::failure("unknown error");
    }
}

TaskRecord TaskUnit::execute(const core::StopToken& stop) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record_.terminal()) {
            return record_;
        }
    }
    start();

    TaskContext ctx(name_, store_, stop,
                    [this](int percent, const std::string& label) {
                        update_progress(percent, label);
                    });

    const int max_attempts = policy_.max_retries;
    std::string last_error = "no attempt made";

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (stop.stop_requested()) {
            last_error = cancelled_detail(stop.reason());
            break;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            record_.attempts = attempt;
        }

        bool cancelled = false;
        WorkOutcome outcome = run_attempt(ctx, cancelled);
        if (outcome.ok) {
            return complete(outcome.payload);
        }

        last_error = outcome.error.empty() ? "unknown error" : outcome.error;
        if (!cancelled && stop.stop_requested()) {
            // work gave up because the run was stopped underneath it
            cancelled = true;
            last_error = cancelled_detail(stop.reason());
        }
        core::Logger::warn(name_, "Attempt " + std::to_string(attempt) + "/" +
                                      std::to_string(max_attempts) + " failed: " + last_error);
        if (cancelled) {
            break;
        }

        if (attempt < max_attempts) {
            const auto delay = policy_.backoff_for(attempt);
            core::Logger::debug(name_, "Retrying in " + std::to_string(delay.count()) + " ms");
            if (stop.wait_for(delay)) {
                last_error = cancelled_detail(stop.reason());
                break;
            }
        }
    }

    return fail(last_error);
}

TaskRecord TaskUnit::complete(const json& payload) {
    update_progress(100, "Complete");

    json result = payload.is_object() ? payload : json{{"result", payload}};
    result["status"] = task_status_to_string(TaskStatus::COMPLETED);

    TaskRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record_.status = TaskStatus::COMPLETED;
        record_.progress_percent = 100;
        record_.current_task_label = "Complete";
        record_.result_payload = result;
        record_.error_detail.reset();
        record_.finished_at = core::get_iso_timestamp();
        snapshot = record_;
    }

    commit(snapshot);
    persist("result", [&] {
        sink_.save_result(name_, TaskStatus::COMPLETED, result, std::nullopt);
    });
    core::Logger::info(name_, display_name_ + " completed after " +
                                  std::to_string(snapshot.attempts) + " attempt(s)");
    publish(EventType::COMPLETED, result);
    return snapshot;
}

TaskRecord TaskUnit::fail(const std::string& error) {
    TaskRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record_.status = TaskStatus::FAILED;
        record_.result_payload = nullptr;
        record_.error_detail = error;
        record_.finished_at = core::get_iso_timestamp();
        snapshot = record_;
    }

    commit(snapshot);
    persist("result", [&] {
        sink_.save_result(name_, TaskStatus::FAILED, nullptr, error);
    });
    core::Logger::error(name_, display_name_ + " failed: " + error);
    publish(EventType::FAILED,
            json{{"status", task_status_to_string(TaskStatus::FAILED)}, {"error", error}});
    return snapshot;
}

} // namespace agent_runner::task
