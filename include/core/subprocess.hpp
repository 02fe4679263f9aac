#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace infer_gateway::core {

// Runs argv[0] (resolved through PATH) and returns its stdout when the child
// exits with status 0 before the timeout. The child is killed on timeout.
// stderr of the child is discarded.
std::optional<std::string> run_bounded(const std::vector<std::string>& argv,
                                       std::chrono::milliseconds timeout) noexcept;

}  // namespace infer_gateway::core
