#pragma once

#include <string>
#include <chrono>
#include <expected>

#include "../core/Error.hpp"

// Runs an untrusted arithmetic program in duktape, inside a forked child
// process, racing it against a deadline. On timeout the child is killed and
// ERROR_TIMEOUT is returned instead of whatever partial value it had.
class CSandboxEvaluator {
  public:
    CSandboxEvaluator(std::chrono::milliseconds deadline);

    std::expected<double, SError> evaluate(const std::string& script) const;

    static std::expected<double, SError> evaluate(const std::string& script, std::chrono::milliseconds deadline);

  private:
    std::chrono::milliseconds m_deadline;
};
