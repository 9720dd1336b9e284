#include <yarn2nix/app.hpp>
#include <yarn2nix/cli.hpp>
#include <yarn2nix/config.hpp>
#include <yarn2nix/fetch.hpp>
#include <yarn2nix/log.hpp>
#include <yarn2nix/prefetch.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace yarn2nix;

static int fail(const Yarn2nixError& err) {
    log::error("%s", err.format().c_str());
    return exit_code_for(&err);
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = parse_args(args);
    if (parsed.is_err()) {
        std::cerr << usage();
        return fail(parsed.error());
    }
    const Options& opts = parsed.value();

    if (opts.help) {
        std::cout << usage();
        return 0;
    }

    auto config = load_layered_config(opts.lockfile, opts.config_path);
    if (config.is_err()) return fail(config.error());
    const Config& cfg = config.value();

    log::set_level(opts.log_level.value_or(cfg.effective_log_level()));
    if (cfg.color) log::set_color_enabled(*cfg.color);

    CurlGlobal curl;
    if (!curl.ok()) {
        return fail(Yarn2nixError{Yarn2nixError::Network, "curl_global_init failed"});
    }

    UrlFetcher fetcher(cfg.fetch_options());
    GitPrefetcher prefetcher(cfg.prefetch_options());

    RunSettings settings;
    settings.lockfile = opts.lockfile;
    settings.emit_nix = !opts.no_nix;
    settings.allow_patch = !opts.no_patch;
    settings.jobs = opts.jobs.value_or(cfg.effective_jobs());

    auto outcome = run_yarn2nix(
        settings,
        [&fetcher](const std::string& url, const CancelFlag* cancel) {
            return fetcher.sha1_of(url, cancel);
        },
        [&prefetcher](const std::string& url, const std::string& rev,
                      const CancelFlag* cancel) {
            return prefetcher.sha256_of(url, rev, cancel);
        },
        std::cout);
    if (outcome.is_err()) return fail(outcome.error());

    if (outcome.value().patched) {
        log::info("updated %s", opts.lockfile.c_str());
    }
    return 0;
}
