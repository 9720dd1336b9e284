#include <yarn2nix/reconcile.hpp>
#include <yarn2nix/source.hpp>
#include <yarn2nix/log.hpp>

#include <algorithm>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace yarn2nix {

EntryAction classify_entry(const LockEntry& entry) {
    auto resolved = entry.resolved();
    if (!resolved) return EntryAction::None;

    auto ref = ResolvedRef::split(*resolved);
    if (ref.missing_hash()) return EntryAction::FetchSha1;
    if (is_git_url(ref.url)) return EntryAction::GitSha256;
    return EntryAction::None;
}

Reconciler::Reconciler(Sha1Lookup fetch_sha1, GitHashLookup git_sha256, int jobs)
    : fetch_sha1_(std::move(fetch_sha1)),
      git_sha256_(std::move(git_sha256)),
      jobs_(jobs > 0 ? jobs
                     : std::max(1, static_cast<int>(std::thread::hardware_concurrency()))) {}

Result<LockEntry> Reconciler::reconcile_entry(LockEntry entry,
                                              const CancelFlag* cancel) const {
    auto resolved = entry.resolved();
    if (!resolved) {
        return Result<LockEntry>::ok(std::move(entry));
    }

    auto ref = ResolvedRef::split(*resolved);
    const std::string& key = entry.keys.empty() ? ref.url : entry.keys.front();

    switch (classify_entry(entry)) {
        case EntryAction::FetchSha1: {
            log::info("computing missing hash for %s", key.c_str());
            auto sha1 = fetch_sha1_(ref.url, cancel);
            if (sha1.is_err()) return std::move(sha1).error();
            ref.token = sha1.value();
            entry.set_resolved(ref.url + "#" + ref.token);
            break;
        }
        case EntryAction::GitSha256: {
            auto git = as_git_source(ref);
            log::info("prefetching %s at %s", git->url.c_str(), git->rev.c_str());
            auto sha256 = git_sha256_(git->url, git->rev, cancel);
            if (sha256.is_err()) return std::move(sha256).error();
            entry.set_sha256(sha256.value());
            break;
        }
        case EntryAction::None:
            break;
    }

    return Result<LockEntry>::ok(std::move(entry));
}

Result<ReconcileStats> Reconciler::run(LockFile& lock) const {
    ReconcileStats stats;

    std::vector<size_t> pending;
    for (size_t i = 0; i < lock.entries.size(); ++i) {
        switch (classify_entry(lock.entries[i])) {
            case EntryAction::FetchSha1: ++stats.fetched; pending.push_back(i); break;
            case EntryAction::GitSha256: ++stats.prefetched; pending.push_back(i); break;
            case EntryAction::None: break;
        }
    }

    if (pending.empty()) {
        log::debug("all %zu entries already carry their hashes", lock.entries.size());
        return Result<ReconcileStats>::ok(stats);
    }

    size_t workers = std::min(pending.size(), static_cast<size_t>(jobs_));
    log::debug("reconciling %zu entries with %zu workers", pending.size(), workers);

    std::vector<std::optional<LockEntry>> results(pending.size());
    std::atomic<size_t> next{0};
    CancelFlag cancel{false};
    std::mutex error_mutex;
    std::optional<Yarn2nixError> first_error;

    auto worker = [&]() {
        while (!cancel.load()) {
            size_t slot = next.fetch_add(1);
            if (slot >= pending.size()) return;

            auto r = reconcile_entry(lock.entries[pending[slot]], &cancel);
            if (r.is_err()) {
                std::lock_guard<std::mutex> guard(error_mutex);
                if (!first_error && r.error().code != Yarn2nixError::Cancelled) {
                    first_error = std::move(r).error();
                }
                cancel.store(true);
                return;
            }
            results[slot] = std::move(r).value();
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) threads.emplace_back(worker);
    for (auto& t : threads) t.join();

    if (first_error) {
        return std::move(*first_error);
    }
    if (cancel.load()) {
        return Yarn2nixError{Yarn2nixError::Cancelled, "reconciliation cancelled"};
    }

    for (size_t slot = 0; slot < pending.size(); ++slot) {
        lock.entries[pending[slot]] = std::move(*results[slot]);
    }
    return Result<ReconcileStats>::ok(stats);
}

} // namespace yarn2nix
