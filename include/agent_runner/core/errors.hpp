#pragma once

#include <stdexcept>
#include <string>

namespace agent_runner {

class AgentRunnerError : public std::runtime_error {
public:
    explicit AgentRunnerError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public AgentRunnerError {
public:
    explicit ConfigError(const std::string& message)
        : AgentRunnerError("Config error: " + message) {}
};

class ValidationError : public AgentRunnerError {
public:
    explicit ValidationError(const std::string& message)
        : AgentRunnerError("Validation error: " + message) {}
};

class IOError : public AgentRunnerError {
public:
    explicit IOError(const std::string& message)
        : AgentRunnerError("I/O error: " + message) {}
};

class SchedulingError : public AgentRunnerError {
public:
    explicit SchedulingError(const std::string& message)
        : AgentRunnerError("Scheduling error: " + message) {}
};

class StopRequested : public AgentRunnerError {
public:
    StopRequested() : AgentRunnerError("Stop requested") {}
    explicit StopRequested(const std::string& reason)
        : AgentRunnerError(reason) {}
};

} // namespace agent_runner
