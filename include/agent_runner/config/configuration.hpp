#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace agent_runner::config {

namespace fs = std::filesystem;

struct RunConfig {
  std::string mode = "full"; // full | quick
  std::string target;
  std::string run_id;        // empty = generated
  int timeout_minutes = 45;  // 0 = no deadline
};

// Upper bound for any configured retry delay, in seconds
constexpr float kMaxRetryDelaySeconds = 3600.0f;

struct RetryConfig {
  int max_retries = 3;
  float retry_delay_s = 2.0f; // exponential backoff base
};

struct BusConfig {
  int history_capacity = 10000;
};

struct LoggingConfig {
  std::string level = "info"; // error | warn | info | debug
  bool event_log = true;
};

struct TaskConfig {
  // argv; a scalar YAML string becomes {"/bin/sh", "-c", <string>}
  std::vector<std::string> command;
  bool enabled = true;
  std::optional<int> max_retries;
  std::optional<float> retry_delay_s;
};

struct Config {
  RunConfig run;
  RetryConfig retry;
  BusConfig bus;
  LoggingConfig logging;
  std::map<std::string, std::vector<std::string>> modes;
  std::map<std::string, TaskConfig> tasks;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace agent_runner::config
