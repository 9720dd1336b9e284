#pragma once

#include <yarn2nix/log.hpp>
#include <yarn2nix/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace yarn2nix {

struct Options {
    std::string lockfile = "./yarn.lock";
    bool no_nix = false;        // don't print the Nix expression
    bool no_patch = false;      // fail instead of rewriting the lockfile
    bool help = false;
    std::optional<std::string> config_path;
    std::optional<int> jobs;
    std::optional<log::Level> log_level;   // from --verbose / --quiet
};

const char* usage();

// Parse command-line arguments (without argv[0])
Result<Options> parse_args(const std::vector<std::string>& args);

} // namespace yarn2nix
