#pragma once

#include <yarn2nix/reconcile.hpp>
#include <yarn2nix/result.hpp>
#include <ostream>
#include <string>

namespace yarn2nix {

struct RunSettings {
    std::string lockfile = "./yarn.lock";
    bool emit_nix = true;
    bool allow_patch = true;
    int jobs = 0;
};

struct RunOutcome {
    bool patched = false;         // lockfile was rewritten
    size_t descriptors = 0;
};

// One full run: parse, reconcile, persist changes, build and print the
// catalog. Nothing reaches `out` unless every step succeeded.
// With allow_patch == false a pending change fails with PatchBlocked and
// the lockfile is left as it was.
Result<RunOutcome> run_yarn2nix(const RunSettings& settings,
                                const Sha1Lookup& fetch_sha1,
                                const GitHashLookup& git_sha256,
                                std::ostream& out);

// Process exit status for a finished run
int exit_code_for(const Yarn2nixError* error);

} // namespace yarn2nix
