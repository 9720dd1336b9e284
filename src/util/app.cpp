#include <yarn2nix/app.hpp>
#include <yarn2nix/catalog.hpp>
#include <yarn2nix/lockfile.hpp>
#include <yarn2nix/log.hpp>

namespace yarn2nix {

Result<RunOutcome> run_yarn2nix(const RunSettings& settings,
                                const Sha1Lookup& fetch_sha1,
                                const GitHashLookup& git_sha256,
                                std::ostream& out) {
    RunOutcome outcome;
    const std::string& path = settings.lockfile;

    auto text = read_text_file(path);
    if (text.is_err()) return std::move(text).error();

    auto parsed = LockFile::parse(text.value(), path);
    if (parsed.is_err()) return std::move(parsed).error();
    LockFile lock = std::move(parsed).value();
    log::debug("%s: %zu entries, %zu keys", path.c_str(),
               lock.entries.size(), lock.key_count());

    // Check for missing hashes and patch if necessary
    Reconciler reconciler(fetch_sha1, git_sha256, settings.jobs);
    auto stats = reconciler.run(lock);
    if (stats.is_err()) return std::move(stats).error();

    auto original = LockFile::parse(text.value(), path);
    if (original.is_err()) return std::move(original).error();

    if (original.value() != lock) {
        log::info("found changes in the lockfile %s", path.c_str());

        if (!settings.allow_patch) {
            log::error("...aborting");
            return Yarn2nixError{Yarn2nixError::PatchBlocked,
                "lockfile " + path + " is missing hashes",
                "run without --no-patch to update it"};
        }

        YARN2NIX_TRY(lock.save(path));
        outcome.patched = true;
    }

    auto catalog = build_catalog(lock);
    if (catalog.is_err()) return std::move(catalog).error();
    outcome.descriptors = catalog.value().size();

    if (settings.emit_nix) {
        out << render_nix(catalog.value());
        out.flush();
        if (!out) {
            return Yarn2nixError{Yarn2nixError::IO, "cannot write the Nix expression"};
        }
    }

    return Result<RunOutcome>::ok(outcome);
}

int exit_code_for(const Yarn2nixError* error) {
    return error == nullptr ? 0 : 1;
}

} // namespace yarn2nix
