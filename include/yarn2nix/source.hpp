#pragma once

#include <optional>
#include <string>

namespace yarn2nix {

// A lockfile "resolved" value split into location and integrity token.
//
// The split point is the LAST '#': "https://h/p#frag#abc" gives url
// "https://h/p#frag" and token "abc". Without a '#' the whole value is the
// url and the token is empty, which means the hash is missing.
struct ResolvedRef {
    std::string url;
    std::string token;
    bool has_separator = false;

    static ResolvedRef split(const std::string& resolved);

    bool missing_hash() const { return token.empty(); }
    std::string join() const;
};

// A package hosted in a git repository, pinned to a revision
struct GitSource {
    std::string url;   // repository URL, "git+" scheme prefix removed
    std::string rev;
};

// True for "git+https://..." URLs and for URLs ending in ".git"
bool is_git_url(const std::string& url);

// Repository URL for a git-hosted package (nullopt for plain tarballs)
std::optional<std::string> git_repo_url(const std::string& url);

// Classify a resolved reference; nullopt for plain fetches.
std::optional<GitSource> as_git_source(const ResolvedRef& ref);

// Path component of a URL: scheme and authority dropped, query and
// fragment cut off. Strings without a scheme are treated as paths.
std::string url_path(const std::string& url);

// Last segment of url_path(), ignoring trailing slashes
std::string url_basename(const std::string& url);

// "@scope-" for keys of the form "@scope/name@range", "" otherwise
std::string scope_prefix(const std::string& key);

} // namespace yarn2nix
