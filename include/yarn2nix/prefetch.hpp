#pragma once

#include <yarn2nix/cancel.hpp>
#include <yarn2nix/result.hpp>
#include <string>
#include <vector>

namespace yarn2nix {

struct PrefetchOptions {
    // argv prefix; "--quiet <url> <rev>" is appended
    std::vector<std::string> command = {"nix-prefetch-git"};
    int timeout_seconds = 600;
};

// Extract "sha256" from nix-prefetch-git's JSON report.
Result<std::string> parse_prefetch_output(const std::string& json_text);

// Resolves the content hash (sha256 of the fetched tree) of a git
// revision by running nix-prefetch-git.
class GitPrefetcher {
public:
    explicit GitPrefetcher(PrefetchOptions opts = {});

    Result<std::string> sha256_of(const std::string& url,
                                  const std::string& rev,
                                  const CancelFlag* cancel = nullptr) const;

    const PrefetchOptions& options() const { return opts_; }

private:
    PrefetchOptions opts_;
};

} // namespace yarn2nix
