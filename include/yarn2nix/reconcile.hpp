#pragma once

#include <yarn2nix/cancel.hpp>
#include <yarn2nix/lockfile.hpp>
#include <yarn2nix/result.hpp>
#include <functional>
#include <string>

namespace yarn2nix {

// Hex SHA-1 of the artifact at a URL
using Sha1Lookup = std::function<Result<std::string>(const std::string& url,
                                                     const CancelFlag* cancel)>;

// sha256 of a git repository tree at a revision
using GitHashLookup = std::function<Result<std::string>(const std::string& url,
                                                        const std::string& rev,
                                                        const CancelFlag* cancel)>;

// What an entry needs before the catalog can be built from it
enum class EntryAction {
    None,        // no "resolved" field, or already hashed
    FetchSha1,   // "resolved" has no token
    GitSha256    // git-hosted; the token is a revision
};

EntryAction classify_entry(const LockEntry& entry);

struct ReconcileStats {
    size_t fetched = 0;      // entries whose tarball hash was computed
    size_t prefetched = 0;   // git entries whose sha256 was resolved
};

// Fills in missing integrity data for every lockfile entry.
//
// Entries are processed concurrently; each task works on its own copy of
// one entry. Results are written back only after every task succeeded.
// The first failure cancels the remaining tasks and is returned, leaving
// the lockfile untouched.
class Reconciler {
public:
    Reconciler(Sha1Lookup fetch_sha1, GitHashLookup git_sha256, int jobs = 0);

    Result<ReconcileStats> run(LockFile& lock) const;

    // Reconcile a single entry
    Result<LockEntry> reconcile_entry(LockEntry entry,
                                      const CancelFlag* cancel = nullptr) const;

    int jobs() const { return jobs_; }

private:
    Sha1Lookup fetch_sha1_;
    GitHashLookup git_sha256_;
    int jobs_;
};

} // namespace yarn2nix
