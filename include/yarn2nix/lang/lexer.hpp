#pragma once

#include <yarn2nix/lang/token.hpp>
#include <yarn2nix/result.hpp>
#include <string>
#include <vector>

namespace yarn2nix {

// Tokenize a yarn v1 lockfile. The stream always ends with an Eof token.
// Errors (odd indentation, bad string escapes, stray characters) carry
// the file name and line.
Result<std::vector<LockToken>> lex_lockfile(const std::string& source,
                                            const std::string& filename = "<input>");

// Decode the body of a JSON string literal (without the surrounding
// quotes). Returns false on a malformed escape.
bool decode_json_string(const std::string& body, std::string& out);

} // namespace yarn2nix
