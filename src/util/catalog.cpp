#include <yarn2nix/catalog.hpp>
#include <yarn2nix/source.hpp>
#include <yarn2nix/log.hpp>

#include <optional>
#include <unordered_set>

namespace yarn2nix {

const char* fetch_kind_name(FetchKind kind) {
    switch (kind) {
        case FetchKind::PlainFetch:         return "fetchurl";
        case FetchKind::SourceControlFetch: return "fetchgitTarball";
    }
    return "unknown";
}

Result<std::vector<FetchDescriptor>> build_catalog(const LockFile& lock) {
    std::vector<FetchDescriptor> catalog;
    std::unordered_set<std::string> seen;
    std::optional<Yarn2nixError> failure;

    lock.for_each_key([&](const std::string& key, const LockEntry& entry) {
        if (failure) return;

        auto resolved = entry.resolved();
        if (!resolved) return;

        auto ref = ResolvedRef::split(*resolved);

        FetchDescriptor d;
        d.file_name = url_basename(ref.url);

        auto git = as_git_source(ref);
        std::string cache_name = git ? d.file_name + "-" + ref.token : d.file_name;
        d.name = scope_prefix(key) + cache_name;

        if (!seen.insert(d.name).second) {
            log::trace("skipping %s: %s already listed", key.c_str(), d.name.c_str());
            return;
        }

        if (git) {
            auto sha256 = entry.sha256();
            if (!sha256) {
                failure = Yarn2nixError{Yarn2nixError::Integrity,
                    "git dependency '" + key + "' has no sha256",
                    "let yarn2nix patch the lockfile (run without --no-patch)"};
                return;
            }
            d.kind = FetchKind::SourceControlFetch;
            d.url = git->url;
            d.rev = git->rev;
            d.sha256 = *sha256;
        } else {
            d.kind = FetchKind::PlainFetch;
            d.url = ref.url;
            d.sha1 = ref.token;
        }
        catalog.push_back(std::move(d));
    });

    if (failure) return std::move(*failure);
    return Result<std::vector<FetchDescriptor>>::ok(std::move(catalog));
}

std::string nix_string(const std::string& s) {
    std::string out = "\"";
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '$':
                // "${" would start an antiquotation
                out += (i + 1 < s.size() && s[i + 1] == '{') ? "\\$" : "$";
                break;
            default:   out += c;
        }
    }
    out += '"';
    return out;
}

std::string render_nix(const std::vector<FetchDescriptor>& catalog) {
    std::string out;
    out += "{fetchgitTarball, fetchurl, linkFarm}: rec {\n";
    out += "  offline_cache = linkFarm \"offline\" packages;\n";
    out += "  packages = [\n";

    for (const auto& d : catalog) {
        out += "\n";
        out += "    {\n";
        out += "      name = " + nix_string(d.name) + ";\n";
        if (d.kind == FetchKind::SourceControlFetch) {
            out += "      path = fetchgitTarball " + nix_string(d.file_name) + " {\n";
            out += "        url = " + nix_string(d.url) + ";\n";
            out += "        rev = " + nix_string(d.rev) + ";\n";
            out += "        sha256 = " + nix_string(d.sha256) + ";\n";
        } else {
            out += "      path = fetchurl {\n";
            out += "        name = " + nix_string(d.file_name) + ";\n";
            out += "        url  = " + nix_string(d.url) + ";\n";
            out += "        sha1 = " + nix_string(d.sha1) + ";\n";
        }
        out += "      };\n";
        out += "    }\n";
    }

    out += "  ];\n";
    out += "}\n";
    return out;
}

} // namespace yarn2nix
