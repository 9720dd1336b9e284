#include <yarn2nix/source.hpp>

namespace yarn2nix {

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ResolvedRef ResolvedRef::split(const std::string& resolved) {
    ResolvedRef ref;
    auto hash_pos = resolved.rfind('#');
    if (hash_pos == std::string::npos) {
        ref.url = resolved;
        return ref;
    }
    ref.url = resolved.substr(0, hash_pos);
    ref.token = resolved.substr(hash_pos + 1);
    ref.has_separator = true;
    return ref;
}

std::string ResolvedRef::join() const {
    if (token.empty()) return url;
    return url + "#" + token;
}

bool is_git_url(const std::string& url) {
    return starts_with(url, "git+https://") || ends_with(url, ".git");
}

std::optional<std::string> git_repo_url(const std::string& url) {
    if (starts_with(url, "git+https://")) {
        return url.substr(4);
    }
    if (ends_with(url, ".git")) {
        return url;
    }
    return std::nullopt;
}

std::optional<GitSource> as_git_source(const ResolvedRef& ref) {
    auto repo = git_repo_url(ref.url);
    if (!repo) return std::nullopt;
    return GitSource{*repo, ref.token};
}

std::string url_path(const std::string& url) {
    std::string rest = url;

    auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos &&
        rest.find_first_of("/?#") > scheme_end) {
        rest = rest.substr(scheme_end + 3);
        auto path_start = rest.find_first_of("/?#");
        rest = (path_start == std::string::npos) ? "" : rest.substr(path_start);
    }

    auto cut = rest.find_first_of("?#");
    if (cut != std::string::npos) rest = rest.substr(0, cut);
    return rest;
}

std::string url_basename(const std::string& url) {
    std::string path = url_path(url);
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return path;
    return path.substr(slash + 1);
}

std::string scope_prefix(const std::string& key) {
    if (key.size() < 3 || key[0] != '@') return "";
    auto slash = key.find('/');
    if (slash == std::string::npos || slash < 2) return "";
    std::string scope = key.substr(0, slash);
    if (scope.find('@', 1) != std::string::npos) return "";
    return scope + "-";
}

} // namespace yarn2nix
