#include <yarn2nix/config.hpp>
#include <yarn2nix/lockfile.hpp>
#include <toml++/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace yarn2nix {

namespace {

Yarn2nixError type_error(const std::string& origin, const std::string& key,
                         const char* expected) {
    return Yarn2nixError{Yarn2nixError::Config,
        "'" + key + "' must be " + expected, "", origin, 0};
}

// Positive integer setting (seconds, job counts)
Status read_positive_int(const toml::table& tbl, const char* section,
                         const char* name, const std::string& origin,
                         std::optional<int>& out) {
    const toml::node* node = tbl.get(name);
    if (!node) return ok_status();

    std::string key = std::string(section) + "." + name;
    auto v = node->value<int64_t>();
    if (!node->is_integer() || !v) {
        return type_error(origin, key, "an integer");
    }
    if (*v <= 0 || *v > 1000000) {
        return Yarn2nixError{Yarn2nixError::Config,
            "'" + key + "' out of range: " + std::to_string(*v), "", origin, 0};
    }
    out = static_cast<int>(*v);
    return ok_status();
}

Status read_string(const toml::table& tbl, const char* section,
                   const char* name, const std::string& origin,
                   std::optional<std::string>& out) {
    const toml::node* node = tbl.get(name);
    if (!node) return ok_status();
    auto v = node->value<std::string>();
    if (!node->is_string() || !v) {
        return type_error(origin, std::string(section) + "." + name, "a string");
    }
    out = *v;
    return ok_status();
}

// A command is either "prog" or ["prog", "arg", ...]
Status read_command(const toml::table& tbl, const std::string& origin,
                    std::optional<std::vector<std::string>>& out) {
    const toml::node* node = tbl.get("command");
    if (!node) return ok_status();

    std::vector<std::string> argv;
    if (auto s = node->value<std::string>(); node->is_string() && s) {
        argv.push_back(*s);
    } else if (auto arr = node->as_array()) {
        for (const auto& el : *arr) {
            auto part = el.value<std::string>();
            if (!el.is_string() || !part) {
                return type_error(origin, "prefetch.command",
                                  "a string or an array of strings");
            }
            argv.push_back(*part);
        }
    } else {
        return type_error(origin, "prefetch.command", "a string or an array of strings");
    }

    if (argv.empty() || argv.front().empty()) {
        return Yarn2nixError{Yarn2nixError::Config,
            "'prefetch.command' must not be empty", "", origin, 0};
    }
    out = std::move(argv);
    return ok_status();
}

} // anonymous namespace

Result<Config> Config::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        return Yarn2nixError{Yarn2nixError::Parse,
            std::string("config TOML parse error: ") + e.what(), "",
            origin, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [fetch] section
    if (auto fetch = doc["fetch"].as_table()) {
        YARN2NIX_TRY(read_positive_int(*fetch, "fetch", "timeout", origin, cfg.fetch_timeout));
        YARN2NIX_TRY(read_positive_int(*fetch, "fetch", "connect-timeout", origin,
                                       cfg.fetch_connect_timeout));
        YARN2NIX_TRY(read_string(*fetch, "fetch", "user-agent", origin, cfg.user_agent));
    }

    // [prefetch] section
    if (auto prefetch = doc["prefetch"].as_table()) {
        YARN2NIX_TRY(read_command(*prefetch, origin, cfg.prefetch_command));
        YARN2NIX_TRY(read_positive_int(*prefetch, "prefetch", "timeout", origin,
                                       cfg.prefetch_timeout));
    }

    // [reconcile] section
    if (auto reconcile = doc["reconcile"].as_table()) {
        YARN2NIX_TRY(read_positive_int(*reconcile, "reconcile", "jobs", origin, cfg.jobs));
    }

    // [log] section
    if (auto logtbl = doc["log"].as_table()) {
        std::optional<std::string> level;
        YARN2NIX_TRY(read_string(*logtbl, "log", "level", origin, level));
        if (level) {
            log::Level lvl;
            if (!log::parse_level(*level, lvl)) {
                return Yarn2nixError{Yarn2nixError::Config,
                    "unknown log level '" + *level + "'",
                    "use one of: trace, debug, info, warn, error", origin, 0};
            }
            cfg.log_level = lvl;
        }
        if (const toml::node* color = logtbl->get("color")) {
            auto v = color->value<bool>();
            if (!color->is_boolean() || !v) {
                return type_error(origin, "log.color", "a boolean");
            }
            cfg.color = *v;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    return read_text_file(path).and_then([&](std::string& text) {
        return Config::parse(text, path);
    });
}

void Config::merge(const Config& other) {
    if (other.fetch_timeout) fetch_timeout = other.fetch_timeout;
    if (other.fetch_connect_timeout) fetch_connect_timeout = other.fetch_connect_timeout;
    if (other.user_agent) user_agent = other.user_agent;
    if (other.prefetch_command) prefetch_command = other.prefetch_command;
    if (other.prefetch_timeout) prefetch_timeout = other.prefetch_timeout;
    if (other.jobs) jobs = other.jobs;
    if (other.log_level) log_level = other.log_level;
    if (other.color) color = other.color;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& explicit_file) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (explicit_file.has_value()) result.merge(explicit_file.value());
    return result;
}

FetchOptions Config::fetch_options() const {
    FetchOptions opts;
    if (fetch_timeout) opts.timeout_seconds = *fetch_timeout;
    if (fetch_connect_timeout) opts.connect_timeout_seconds = *fetch_connect_timeout;
    if (user_agent) opts.user_agent = *user_agent;
    return opts;
}

PrefetchOptions Config::prefetch_options() const {
    PrefetchOptions opts;
    if (prefetch_command) opts.command = *prefetch_command;
    if (prefetch_timeout) opts.timeout_seconds = *prefetch_timeout;
    return opts;
}

int Config::effective_jobs() const {
    return jobs.value_or(0);
}

log::Level Config::effective_log_level() const {
    return log_level.value_or(log::Info);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.yarn2nix/config.toml";
}

std::string project_config_path(const std::string& lockfile_path) {
    fs::path dir = fs::path(lockfile_path).parent_path();
    if (dir.empty()) dir = ".";
    return (dir / "yarn2nix.toml").string();
}

static Result<std::optional<Config>> load_optional(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    if (cfg.is_err()) return std::move(cfg).error();
    log::debug("loaded config %s", path.c_str());
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

Result<Config> load_layered_config(const std::string& lockfile_path,
                                   const std::optional<std::string>& explicit_path) {
    auto global = load_optional(global_config_path());
    if (global.is_err()) return std::move(global).error();

    auto project = load_optional(project_config_path(lockfile_path));
    if (project.is_err()) return std::move(project).error();

    std::optional<Config> explicit_cfg;
    if (explicit_path) {
        auto cfg = Config::load(*explicit_path);
        if (cfg.is_err()) return std::move(cfg).error();
        explicit_cfg = std::move(cfg).value();
    }

    return Result<Config>::ok(
        Config::effective(global.value(), project.value(), explicit_cfg));
}

} // namespace yarn2nix
