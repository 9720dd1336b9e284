#pragma once

#include <yarn2nix/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace yarn2nix {

struct LockField;

// A value in a yarn v1 lockfile: a scalar or an ordered block of fields.
struct LockNode {
    enum Kind { String, Boolean, Number, Object };

    Kind kind = Object;
    std::string text;               // String / Boolean / Number
    std::vector<LockField> fields;  // Object, in file order

    static LockNode make_string(std::string s);
    static LockNode make_scalar(Kind kind, std::string text);
    static LockNode make_object();

    bool is_object() const { return kind == Object; }

    // Field lookup on an Object (nullptr if absent or not an object)
    const LockNode* get(const std::string& key) const;
    LockNode* get(const std::string& key);

    // Replace the field in place, or append it if absent
    void set(const std::string& key, LockNode value);
};

struct LockField {
    std::string key;
    LockNode value;
};

bool operator==(const LockNode& a, const LockNode& b);
bool operator!=(const LockNode& a, const LockNode& b);
bool operator==(const LockField& a, const LockField& b);

// One resolution record. Yarn lists every specifier that resolved to the
// same package on one line ("a@^1.0.0", "a@^1.1.0":), so an entry owns
// several keys.
struct LockEntry {
    std::vector<std::string> keys;
    LockNode body;

    // The "resolved" field ("<url>#<hash>"). Empty or non-string values
    // count as absent (local and workspace packages).
    std::optional<std::string> resolved() const;
    void set_resolved(const std::string& value);

    std::optional<std::string> sha256() const;
    void set_sha256(const std::string& value);
};

bool operator==(const LockEntry& a, const LockEntry& b);
bool operator!=(const LockEntry& a, const LockEntry& b);

struct LockFile {
    std::vector<LockEntry> entries;

    // Parse yarn.lock text. Malformed input yields a Parse error with the
    // offending line; a key listed twice yields Duplicate.
    static Result<LockFile> parse(const std::string& text,
                                  const std::string& filename = "<input>");

    static Result<LockFile> load(const std::string& path);

    // Serialize the way `yarn` writes lockfiles (header, sorted entries,
    // prioritized field order, minimal quoting).
    std::string stringify() const;

    // Write atomically (temporary sibling + rename)
    Status save(const std::string& path) const;

    size_t key_count() const;

    // Visit every key in file order together with the entry owning it.
    template<typename F>
    void for_each_key(F&& fn) const {
        for (const auto& entry : entries) {
            for (const auto& key : entry.keys) {
                fn(key, entry);
            }
        }
    }
};

bool operator==(const LockFile& a, const LockFile& b);
bool operator!=(const LockFile& a, const LockFile& b);

// Read a whole file into memory
Result<std::string> read_text_file(const std::string& path);

} // namespace yarn2nix
