#pragma once

#include <rosid/result.hpp>
#include <rosid/environment.hpp>
#include <optional>
#include <string>
#include <vector>

namespace rosid {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// When `env` is given it replaces the child's environment; the executable is
// still looked up on the caller's PATH.
// Returns error on pipe/fork/wait failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const std::optional<Environment>& env = std::nullopt);

} // namespace rosid
