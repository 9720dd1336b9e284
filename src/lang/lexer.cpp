#include <yarn2nix/lang/lexer.hpp>
#include <cctype>
#include <cstdint>

namespace yarn2nix {

const char* lock_token_name(LockTokenType t) {
    switch (t) {
    case LockTokenType::Newline: return "Newline";
    case LockTokenType::Comment: return "Comment";
    case LockTokenType::Indent:  return "Indent";
    case LockTokenType::String:  return "String";
    case LockTokenType::Number:  return "Number";
    case LockTokenType::Boolean: return "Boolean";
    case LockTokenType::Colon:   return "Colon";
    case LockTokenType::Comma:   return "Comma";
    case LockTokenType::Eof:     return "Eof";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// JSON string decoding
// ---------------------------------------------------------------------------

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

static bool read_hex4(const std::string& s, size_t at, uint32_t& out) {
    if (at + 4 > s.size()) return false;
    out = 0;
    for (size_t i = at; i < at + 4; ++i) {
        char c = s[i];
        out <<= 4;
        if (c >= '0' && c <= '9') out |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
        else return false;
    }
    return true;
}

bool decode_json_string(const std::string& body, std::string& out) {
    out.clear();
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (static_cast<unsigned char>(c) < 0x20) return false;
        if (c == '"') return false;
        if (c != '\\') {
            out += c;
            continue;
        }
        if (++i >= body.size()) return false;
        switch (body[i]) {
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            case '/':  out += '/'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                uint32_t cp = 0;
                if (!read_hex4(body, i + 1, cp)) return false;
                i += 4;
                // Surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF &&
                    i + 2 < body.size() && body[i + 1] == '\\' && body[i + 2] == 'u') {
                    uint32_t lo = 0;
                    if (read_hex4(body, i + 3, lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, cp);
                break;
            }
            default:
                return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

namespace {

struct Lexer {
    const std::string& source;
    const std::string& filename;
    size_t pos;
    int line;
    int col;
    bool after_newline;

    std::vector<LockToken> tokens;

    Lexer(const std::string& src, const std::string& fname)
        : source(src), filename(fname), pos(0), line(1), col(1),
          after_newline(false) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    char peek_next() const {
        return (pos + 1 < source.size()) ? source[pos + 1] : '\0';
    }

    bool starts_with(const char* word) const {
        return source.compare(pos, std::char_traits<char>::length(word), word) == 0;
    }

    SourcePos current_pos() const {
        return {filename, line, col};
    }

    void emit(LockTokenType type, std::string text, SourcePos p) {
        LockToken tok;
        tok.type = type;
        tok.text = std::move(text);
        tok.pos = std::move(p);
        tokens.push_back(std::move(tok));
    }

    Yarn2nixError error_at(const SourcePos& p, const std::string& msg) const {
        return Yarn2nixError{Yarn2nixError::Parse, msg, "", p.file, p.line};
    }

    Result<std::vector<LockToken>> run() {
        while (!at_end()) {
            auto p = current_pos();
            char c = peek();
            bool newline_token = false;

            if (c == '\n' || c == '\r') {
                pos += (c == '\r' && peek_next() == '\n') ? 2 : 1;
                ++line;
                col = 1;
                emit(LockTokenType::Newline, "", p);
                newline_token = true;
            } else if (c == '#') {
                lex_comment(p);
            } else if (c == ' ') {
                auto r = lex_spaces(p);
                if (r.is_err()) return std::move(r).error();
            } else if (c == '"') {
                auto r = lex_quoted(p);
                if (r.is_err()) return std::move(r).error();
            } else if (std::isdigit(static_cast<unsigned char>(c))) {
                lex_number(p);
            } else if (starts_with("true")) {
                advance_by(4);
                emit(LockTokenType::Boolean, "true", p);
            } else if (starts_with("false")) {
                advance_by(5);
                emit(LockTokenType::Boolean, "false", p);
            } else if (c == ':') {
                advance_by(1);
                emit(LockTokenType::Colon, ":", p);
            } else if (c == ',') {
                advance_by(1);
                emit(LockTokenType::Comma, ",", p);
            } else if (std::isalpha(static_cast<unsigned char>(c)) ||
                       c == '/' || c == '.' || c == '-') {
                lex_bare(p);
            } else {
                return error_at(p, std::string("unexpected character '") + c +
                                   "' at column " + std::to_string(p.col));
            }

            after_newline = newline_token;
        }

        emit(LockTokenType::Eof, "", current_pos());
        return Result<std::vector<LockToken>>::ok(std::move(tokens));
    }

    void advance_by(size_t n) {
        pos += n;
        col += static_cast<int>(n);
    }

    void lex_comment(SourcePos p) {
        advance_by(1); // #
        size_t start = pos;
        while (!at_end() && peek() != '\n' && peek() != '\r') ++pos;
        col += static_cast<int>(pos - start);
        emit(LockTokenType::Comment, source.substr(start, pos - start), p);
    }

    // Spaces are only significant at the start of a line.
    Status lex_spaces(SourcePos p) {
        size_t start = pos;
        while (!at_end() && peek() == ' ') ++pos;
        size_t count = pos - start;
        col += static_cast<int>(count);

        if (!after_newline) return ok_status();
        if (count % 2 != 0) {
            return error_at(p, "invalid number of spaces (" +
                               std::to_string(count) + "), indentation must be even");
        }
        LockToken tok;
        tok.type = LockTokenType::Indent;
        tok.depth = static_cast<int>(count / 2);
        tok.pos = p;
        tokens.push_back(std::move(tok));
        return ok_status();
    }

    Status lex_quoted(SourcePos p) {
        size_t i = pos + 1;
        bool closed = false;
        for (; i < source.size(); ++i) {
            if (source[i] == '\n') break;
            if (source[i] == '"') {
                bool escaped = source[i - 1] == '\\' && source[i - 2] != '\\';
                if (!escaped) {
                    closed = true;
                    break;
                }
            }
        }
        if (!closed) {
            return error_at(p, "unterminated string");
        }

        std::string decoded;
        if (!decode_json_string(source.substr(pos + 1, i - pos - 1), decoded)) {
            return error_at(p, "invalid string literal " + source.substr(pos, i - pos + 1));
        }
        advance_by(i + 1 - pos);

        emit(LockTokenType::String, std::move(decoded), p);
        tokens.back().quoted = true;
        return ok_status();
    }

    void lex_number(SourcePos p) {
        size_t start = pos;
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) ++pos;
        col += static_cast<int>(pos - start);

        std::string digits = source.substr(start, pos - start);
        size_t nz = digits.find_first_not_of('0');
        digits = (nz == std::string::npos) ? "0" : digits.substr(nz);
        emit(LockTokenType::Number, std::move(digits), p);
    }

    void lex_bare(SourcePos p) {
        size_t start = pos;
        while (!at_end()) {
            char c = peek();
            if (c == ':' || c == ' ' || c == '\n' || c == '\r' || c == ',') break;
            ++pos;
        }
        col += static_cast<int>(pos - start);
        emit(LockTokenType::String, source.substr(start, pos - start), p);
    }
};

} // anonymous namespace

Result<std::vector<LockToken>> lex_lockfile(const std::string& source,
                                            const std::string& filename) {
    Lexer lexer(source, filename);
    return lexer.run();
}

} // namespace yarn2nix
