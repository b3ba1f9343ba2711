#pragma once

#include "agent_runner/core/stop_token.hpp"

#include <atomic>
#include <filesystem>
#include <streambuf>
#include <string>
#include <thread>

namespace agent_runner::runner {

// Duplicates everything written to it into two stream buffers
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

struct RunLayout {
  std::filesystem::path root;
  std::filesystem::path logs_dir;
  std::filesystem::path tasks_dir;
  std::filesystem::path config_path;
  std::filesystem::path event_log_path;
  std::filesystem::path summary_path;
};

// Creates <runs_dir>/<run_id>/{logs,tasks}; throws IOError on failure
RunLayout prepare_run_dir(const std::filesystem::path &runs_dir,
                          const std::string &run_id);

// Turns SIGINT/SIGTERM into a stop request on `token` while alive
class SignalWatcher {
public:
  explicit SignalWatcher(core::StopToken &token);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

private:
  core::StopToken &token_;
  std::atomic<bool> done_{false};
  std::thread thread_;
};

} // namespace agent_runner::runner
