#include "agent_runner/task/command_task.hpp"
#include "agent_runner/core/errors.hpp"
#include "agent_runner/core/logging.hpp"
#include "agent_runner/core/utils.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace agent_runner::task {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr auto kTerminateGrace = std::chrono::seconds(2);

// Writing the request to a child that already exited must not kill the runner
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

// Runs in the forked child only: drops descriptors other than stdio that the
// runner opened without close-on-exec (the event log, for one).
void close_inherited_fds() {
    long max_fd = ::sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
    for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
        ::close(fd);
    }
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Owns the child's pipes and pid; kills and reaps on early exit
class ChildProcess {
public:
    explicit ChildProcess(const std::vector<std::string>& argv) {
        // close-on-exec so sibling tasks forked concurrently never inherit these ends
        int in_pipe[2];
        int out_pipe[2];
        if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
            throw std::runtime_error(errno_message("pipe"));
        }
        if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
            ::close(in_pipe[0]);
            ::close(in_pipe[1]);
            throw std::runtime_error(errno_message("pipe"));
        }

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) {
            args.push_back(const_cast<char*>(a.c_str()));
        }
        args.push_back(nullptr);

        pid_ = ::fork();
        if (pid_ < 0) {
            const std::string msg = errno_message("fork");
            ::close(in_pipe[0]);
            ::close(in_pipe[1]);
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
            throw std::runtime_error(msg);
        }
        if (pid_ == 0) {
            ::dup2(in_pipe[0], STDIN_FILENO);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::close(in_pipe[0]);
            ::close(in_pipe[1]);
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
            close_inherited_fds();
            ::signal(SIGPIPE, SIG_DFL);
            ::execvp(args[0], args.data());
            _exit(127);
        }

        ::close(in_pipe[0]);
        ::close(out_pipe[1]);
        stdin_fd_ = in_pipe[1];
        stdout_fd_ = out_pipe[0];
        ::fcntl(stdin_fd_, F_SETFL, ::fcntl(stdin_fd_, F_GETFL) | O_NONBLOCK);
    }

    ~ChildProcess() {
        close_fd(stdin_fd_);
        close_fd(stdout_fd_);
        if (pid_ > 0) {
            ::kill(pid_, SIGKILL);
            int status = 0;
            ::waitpid(pid_, &status, 0);
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    int& stdin_fd() { return stdin_fd_; }
    int& stdout_fd() { return stdout_fd_; }

    void terminate() {
        if (pid_ <= 0) return;
        ::kill(pid_, SIGTERM);
        const auto give_up = std::chrono::steady_clock::now() + kTerminateGrace;
        while (std::chrono::steady_clock::now() < give_up) {
            int status = 0;
            if (::waitpid(pid_, &status, WNOHANG) == pid_) {
                pid_ = -1;
                return;
            }
            ::usleep(20 * 1000);
        }
        ::kill(pid_, SIGKILL);
        int status = 0;
        ::waitpid(pid_, &status, 0);
        pid_ = -1;
    }

    // Waits until the child exits and returns the raw wait status, or
    // std::nullopt once `stop` fires first. The child is still running then.
    std::optional<int> wait(const core::StopToken& stop) {
        for (;;) {
            int status = 0;
            const pid_t rc = ::waitpid(pid_, &status, WNOHANG);
            if (rc == pid_) {
                pid_ = -1;
                return status;
            }
            if (rc < 0 && errno != EINTR) {
                throw std::runtime_error(errno_message("waitpid"));
            }
            if (stop.wait_for(std::chrono::milliseconds(kPollIntervalMs))) {
                return std::nullopt;
            }
        }
    }

private:
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
};

std::string describe_exit(int status) {
    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        if (code == 127) {
            return "command not found or not executable (exit 127)";
        }
        return "command exited with status " + std::to_string(code);
    }
    if (WIFSIGNALED(status)) {
        return "command killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "command ended abnormally";
}

} // namespace

CommandTask::CommandTask(std::string name, std::vector<std::string> argv,
                         std::vector<std::string> dependencies, RetryPolicy policy)
    : name_(std::move(name)),
      argv_(std::move(argv)),
      dependencies_(std::move(dependencies)),
      policy_(policy) {
    if (argv_.empty()) {
        throw ConfigError("task '" + name_ + "' has an empty command");
    }
}

json CommandTask::build_request(const TaskContext& ctx) const {
    json deps = json::object();
    for (const auto& dep : dependencies_) {
        deps[dep] = ctx.dependency_result(dep);
    }
    return {
        {"target", ctx.target()},
        {"run_id", ctx.run_id()},
        {"run_mode", ctx.run_mode()},
        {"task", name_},
        {"dependencies", deps}
    };
}

bool CommandTask::apply_directive(const std::string& line, TaskContext& ctx) {
    if (core::starts_with(line, "PROGRESS ")) {
        std::istringstream iss(line.substr(9));
        int percent = 0;
        if (!(iss >> percent)) {
            return false;
        }
        std::string label;
        std::getline(iss, label);
        ctx.update_progress(percent, core::trim(label));
        return true;
    }

    if (core::starts_with(line, "ARTIFACT ")) {
        std::istringstream iss(line.substr(9));
        std::string kind;
        std::string key;
        if (!(iss >> kind >> key)) {
            return false;
        }
        std::string rest;
        std::getline(iss, rest);
        rest = core::trim(rest);
        json data;
        try {
            data = rest.empty() ? json::object() : json::parse(rest);
        } catch (const json::parse_error& e) {
            core::Logger::warn(ctx.task_name(),
                               "Ignoring artifact " + kind + "/" + key + ": " + e.what());
            return true;
        }
        ctx.publish_artifact(kind, key, std::move(data));
        return true;
    }

    return false;
}

WorkOutcome CommandTask::parse_result(const std::string& text) {
    const std::string body = core::trim(text);
    if (body.empty()) {
        return WorkOutcome::success(json::object());
    }
    try {
        json parsed = json::parse(body);
        if (!parsed.is_object()) {
            return WorkOutcome::failure("command result is not a JSON object");
        }
        return WorkOutcome::success(std::move(parsed));
    } catch (const json::parse_error& e) {
        return WorkOutcome::failure(std::string("unparsable command output: ") + e.what());
    }
}

WorkOutcome CommandTask::do_work(TaskContext& ctx) {
    ctx.throw_if_stopped();
    ignore_sigpipe_once();

    const std::string request = build_request(ctx).dump() + "\n";
    core::Logger::debug(name_, "Spawning " + core::join(argv_, " "));

    ChildProcess child(argv_);

    std::size_t written = 0;
    std::string pending;   // partial stdout line
    std::string result_text;
    bool stopped = false;

    auto handle_line = [&](const std::string& line) {
        if (!apply_directive(line, ctx)) {
            result_text += line;
            result_text += '\n';
        }
    };

    while (child.stdout_fd() >= 0) {
        if (ctx.stop_token().stop_requested()) {
            stopped = true;
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds++] = {child.stdout_fd(), POLLIN, 0};
        const bool writing = child.stdin_fd() >= 0;
        if (writing) {
            fds[nfds++] = {child.stdin_fd(), POLLOUT, 0};
        }

        const int rc = ::poll(fds, nfds, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return WorkOutcome::failure(errno_message("poll"));
        }
        if (rc == 0) continue;

        if (writing && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
            const ssize_t n = ::write(child.stdin_fd(), request.data() + written,
                                      request.size() - written);
            if (n > 0) {
                written += static_cast<std::size_t>(n);
            }
            // EPIPE: the child does not read its request, which is allowed
            if (written >= request.size() || (n < 0 && errno != EAGAIN && errno != EINTR)) {
                close_fd(child.stdin_fd());
            }
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            char buf[4096];
            const ssize_t n = ::read(child.stdout_fd(), buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                return WorkOutcome::failure(errno_message("read"));
            }
            if (n == 0) {
                close_fd(child.stdout_fd());
                break;
            }
            pending.append(buf, static_cast<std::size_t>(n));
            std::size_t pos;
            while ((pos = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, pos);
                pending.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                handle_line(line);
            }
        }
    }

    if (stopped) {
        core::Logger::warn(name_, "Stopping command: " + ctx.stop_token().reason());
        child.terminate();
        ctx.throw_if_stopped();
    }

    if (!pending.empty()) {
        handle_line(pending);
    }
    close_fd(child.stdin_fd());

    const std::optional<int> status = child.wait(ctx.stop_token());
    if (!status) {
        core::Logger::warn(name_, "Stopping command: " + ctx.stop_token().reason());
        child.terminate();
        ctx.throw_if_stopped();
    }
    if (!WIFEXITED(*status) || WEXITSTATUS(*status) != 0) {
        return WorkOutcome::failure(describe_exit(*status));
    }
    return parse_result(result_text);
}

} // namespace agent_runner::task
