#pragma once

#include <string>

namespace yarn2nix {

// Source position for error reporting
struct SourcePos {
    std::string file;
    int line = 1;
    int col = 1;
};

enum class LockTokenType {
    Newline,
    Comment,
    Indent,     // leading spaces after a newline; depth = count / 2
    String,     // quoted or bare word
    Number,
    Boolean,
    Colon,
    Comma,
    Eof
};

struct LockToken {
    LockTokenType type;
    std::string text;   // decoded string, digits, "true"/"false", comment body
    int depth = 0;      // Indent only
    bool quoted = false;
    SourcePos pos;
};

const char* lock_token_name(LockTokenType t);

} // namespace yarn2nix
