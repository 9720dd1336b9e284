#pragma once

#include <yarn2nix/lockfile.hpp>
#include <yarn2nix/result.hpp>
#include <string>
#include <vector>

namespace yarn2nix {

enum class FetchKind {
    PlainFetch,          // fetchurl { url; sha1; }
    SourceControlFetch   // fetchgitTarball { url; rev; sha256; }
};

const char* fetch_kind_name(FetchKind kind);

struct FetchDescriptor {
    std::string name;       // offline cache file name, unique in a catalog
    FetchKind kind = FetchKind::PlainFetch;
    std::string file_name;  // basename of the package URL
    std::string url;        // tarball URL, or repository URL without "git+"
    std::string sha1;       // PlainFetch
    std::string rev;        // SourceControlFetch
    std::string sha256;     // SourceControlFetch
};

// Build the fetch list in lockfile key order. Entries without "resolved"
// are skipped; a name seen before is dropped (first occurrence wins).
// A git entry that was never given a sha256 is an Integrity error.
Result<std::vector<FetchDescriptor>> build_catalog(const LockFile& lock);

// Render the catalog as a Nix function of {fetchgitTarball, fetchurl,
// linkFarm} exposing `packages` and an `offline_cache` link farm.
std::string render_nix(const std::vector<FetchDescriptor>& catalog);

// Nix double-quoted string literal
std::string nix_string(const std::string& s);

} // namespace yarn2nix
