#include <yarn2nix/prefetch.hpp>
#include <yarn2nix/process.hpp>
#include <yarn2nix/log.hpp>

#include <nlohmann/json.hpp>

namespace yarn2nix {

Result<std::string> parse_prefetch_output(const std::string& json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return Yarn2nixError{Yarn2nixError::Resolution,
            std::string("cannot parse nix-prefetch-git output: ") + e.what()};
    }

    if (!doc.is_object()) {
        return Yarn2nixError{Yarn2nixError::Resolution,
            "nix-prefetch-git output is not a JSON object"};
    }

    auto it = doc.find("sha256");
    if (it == doc.end() || !it->is_string() || it->get<std::string>().empty()) {
        return Yarn2nixError{Yarn2nixError::Resolution,
            "nix-prefetch-git output has no \"sha256\" member"};
    }
    return Result<std::string>::ok(it->get<std::string>());
}

GitPrefetcher::GitPrefetcher(PrefetchOptions opts)
    : opts_(std::move(opts)) {}

Result<std::string> GitPrefetcher::sha256_of(const std::string& url,
                                             const std::string& rev,
                                             const CancelFlag* cancel) const {
    if (opts_.command.empty()) {
        return Yarn2nixError{Yarn2nixError::Config,
            "prefetch command is empty", "set [prefetch] command in the config"};
    }

    std::vector<std::string> args = opts_.command;
    args.push_back("--quiet");
    args.push_back(url);
    args.push_back(rev);

    log::debug("%s --quiet %s %s", opts_.command.front().c_str(),
               url.c_str(), rev.c_str());
    auto r = run_command(args, "", opts_.timeout_seconds, cancel);
    if (r.is_err()) {
        auto err = std::move(r).error();
        if (err.code != Yarn2nixError::Cancelled) {
            err.code = Yarn2nixError::Resolution;
        }
        return err;
    }

    auto& cmd = r.value();
    if (cmd.exit_code == 127) {
        return Yarn2nixError{Yarn2nixError::Resolution,
            "cannot run " + opts_.command.front(),
            "install nix-prefetch-git or set [prefetch] command in the config"};
    }
    if (cmd.exit_code != 0) {
        return Yarn2nixError{Yarn2nixError::Resolution,
            opts_.command.front() + " failed for " + url + " at " + rev +
            " (exit " + std::to_string(cmd.exit_code) + "): " + cmd.stderr_str};
    }

    return parse_prefetch_output(cmd.stdout_str);
}

} // namespace yarn2nix
