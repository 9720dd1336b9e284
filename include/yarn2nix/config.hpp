#pragma once

#include <yarn2nix/result.hpp>
#include <yarn2nix/fetch.hpp>
#include <yarn2nix/log.hpp>
#include <yarn2nix/prefetch.hpp>
#include <optional>
#include <string>
#include <vector>

namespace yarn2nix {

// Layered configuration: defaults < global < project < --config file.
// Every setting is optional so a layer only overrides what it names.
struct Config {
    // [fetch]
    std::optional<int> fetch_timeout;
    std::optional<int> fetch_connect_timeout;
    std::optional<std::string> user_agent;

    // [prefetch]
    std::optional<std::vector<std::string>> prefetch_command;
    std::optional<int> prefetch_timeout;

    // [reconcile]
    std::optional<int> jobs;

    // [log]
    std::optional<log::Level> log_level;
    std::optional<bool> color;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; `origin` names the source in errors
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& origin = "<config>");

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& explicit_file);

    // Resolved settings with built-in defaults filled in
    FetchOptions fetch_options() const;
    PrefetchOptions prefetch_options() const;
    int effective_jobs() const;        // 0 = one per hardware thread
    log::Level effective_log_level() const;
};

// ~/.yarn2nix/config.toml ("" when HOME is unset)
std::string global_config_path();

// yarn2nix.toml in the directory holding the lockfile
std::string project_config_path(const std::string& lockfile_path);

// Load the global and project layers (missing files are skipped) and the
// explicit file if given (missing is an error), then merge them.
Result<Config> load_layered_config(const std::string& lockfile_path,
                                   const std::optional<std::string>& explicit_path);

} // namespace yarn2nix
