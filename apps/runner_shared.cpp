#include "runner_shared.hpp"

#include "agent_runner/core/errors.hpp"

#include <chrono>
#include <csignal>
#include <string>
#include <system_error>

namespace agent_runner::runner {

namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t g_signal = 0;

extern "C" void on_stop_signal(int sig) { g_signal = sig; }

} // namespace

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

RunLayout prepare_run_dir(const fs::path &runs_dir, const std::string &run_id) {
  RunLayout layout;
  layout.root = runs_dir / run_id;
  layout.logs_dir = layout.root / "logs";
  layout.tasks_dir = layout.root / "tasks";
  layout.config_path = layout.root / "config.yaml";
  layout.event_log_path = layout.logs_dir / "run_events.jsonl";
  layout.summary_path = layout.root / "summary.json";

  std::error_code ec;
  fs::create_directories(layout.logs_dir, ec);
  if (!ec)
    fs::create_directories(layout.tasks_dir, ec);
  if (ec) {
    throw IOError("Cannot create run directory " + layout.root.string() +
                  ": " + ec.message());
  }
  return layout;
}

SignalWatcher::SignalWatcher(core::StopToken &token) : token_(token) {
  g_signal = 0;
  std::signal(SIGINT, on_stop_signal);
  std::signal(SIGTERM, on_stop_signal);
  thread_ = std::thread([this] {
    while (!done_.load()) {
      if (g_signal != 0) {
        const int sig = g_signal;
        token_.request_stop(sig == SIGINT ? "interrupted (SIGINT)"
                                          : "terminated (SIGTERM)");
        g_signal = 0;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });
}

SignalWatcher::~SignalWatcher() {
  done_.store(true);
  if (thread_.joinable())
    thread_.join();
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

} // namespace agent_runner::runner
