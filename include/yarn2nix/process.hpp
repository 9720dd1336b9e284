#pragma once

#include <yarn2nix/cancel.hpp>
#include <yarn2nix/result.hpp>
#include <string>
#include <vector>

namespace yarn2nix {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command (no shell), capturing stdout and stderr.
// Returns error on fork/exec failure, timeout, or when `cancel` is raised
// (the child is killed in both cases). A binary that cannot be executed
// reports exit code 127.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const CancelFlag* cancel = nullptr);

} // namespace yarn2nix
