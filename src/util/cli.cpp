#include <yarn2nix/cli.hpp>

#include <cctype>

namespace yarn2nix {

const char* usage() {
    return
        "Usage: yarn2nix [options]\n"
        "\n"
        "Options:\n"
        "  -h --help          Shows this help.\n"
        "  --no-nix           Hide the nix output\n"
        "  --no-patch         Don't patch the lockfile if hashes are missing\n"
        "  --lockfile=FILE    Specify path to the lockfile [default: ./yarn.lock].\n"
        "  --config=FILE      Read settings from FILE on top of the defaults\n"
        "  --jobs=N           Number of concurrent reconciliation tasks\n"
        "  -v --verbose       Log debug output\n"
        "  -q --quiet         Only log errors\n";
}

static Yarn2nixError usage_error(const std::string& msg) {
    return Yarn2nixError{Yarn2nixError::InvalidArg, msg, "see yarn2nix --help"};
}

static Result<int> parse_jobs(const std::string& text) {
    if (text.empty() || text.size() > 6) {
        return usage_error("invalid --jobs value '" + text + "'");
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return usage_error("invalid --jobs value '" + text + "'");
        }
    }
    int n = std::stoi(text);
    if (n < 1) {
        return usage_error("--jobs must be at least 1");
    }
    return Result<int>::ok(n);
}

Result<Options> parse_args(const std::vector<std::string>& args) {
    Options opts;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Split "--name=value"
        std::string name = arg;
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                name = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }
        }

        auto take_value = [&]() -> Result<std::string> {
            if (inline_value) return Result<std::string>::ok(*inline_value);
            if (i + 1 >= args.size()) {
                return usage_error(name + " requires a value");
            }
            return Result<std::string>::ok(args[++i]);
        };

        auto no_value = [&]() -> Status {
            if (inline_value) return usage_error(name + " does not take a value");
            return ok_status();
        };

        if (name == "-h" || name == "--help") {
            YARN2NIX_TRY(no_value());
            opts.help = true;
        } else if (name == "--no-nix") {
            YARN2NIX_TRY(no_value());
            opts.no_nix = true;
        } else if (name == "--no-patch") {
            YARN2NIX_TRY(no_value());
            opts.no_patch = true;
        } else if (name == "--lockfile") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            if (v.value().empty()) return usage_error("--lockfile must not be empty");
            opts.lockfile = v.value();
        } else if (name == "--config") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            opts.config_path = v.value();
        } else if (name == "--jobs") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            auto n = parse_jobs(v.value());
            if (n.is_err()) return std::move(n).error();
            opts.jobs = n.value();
        } else if (name == "-v" || name == "--verbose") {
            YARN2NIX_TRY(no_value());
            opts.log_level = log::Debug;
        } else if (name == "-q" || name == "--quiet") {
            YARN2NIX_TRY(no_value());
            opts.log_level = log::Error;
        } else if (!arg.empty() && arg[0] == '-') {
            return usage_error("unknown option '" + arg + "'");
        } else {
            return usage_error("unexpected argument '" + arg + "'");
        }
    }

    return Result<Options>::ok(std::move(opts));
}

} // namespace yarn2nix
