#include <yarn2nix/lockfile.hpp>
#include <yarn2nix/lang/lexer.hpp>
#include <yarn2nix/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace yarn2nix {

// ---------------------------------------------------------------------------
// LockNode / LockEntry
// ---------------------------------------------------------------------------

LockNode LockNode::make_string(std::string s) {
    return make_scalar(String, std::move(s));
}

LockNode LockNode::make_scalar(Kind kind, std::string text) {
    LockNode n;
    n.kind = kind;
    n.text = std::move(text);
    return n;
}

LockNode LockNode::make_object() {
    return LockNode{};
}

const LockNode* LockNode::get(const std::string& key) const {
    if (kind != Object) return nullptr;
    for (const auto& f : fields) {
        if (f.key == key) return &f.value;
    }
    return nullptr;
}

LockNode* LockNode::get(const std::string& key) {
    if (kind != Object) return nullptr;
    for (auto& f : fields) {
        if (f.key == key) return &f.value;
    }
    return nullptr;
}

void LockNode::set(const std::string& key, LockNode value) {
    if (auto* existing = get(key)) {
        *existing = std::move(value);
        return;
    }
    fields.push_back(LockField{key, std::move(value)});
}

bool operator==(const LockNode& a, const LockNode& b) {
    if (a.kind != b.kind) return false;
    if (a.kind != LockNode::Object) return a.text == b.text;
    return a.fields == b.fields;
}

bool operator!=(const LockNode& a, const LockNode& b) {
    return !(a == b);
}

bool operator==(const LockField& a, const LockField& b) {
    return a.key == b.key && a.value == b.value;
}

static std::optional<std::string> string_field(const LockNode& body,
                                               const char* key) {
    const LockNode* v = body.get(key);
    if (!v || v->kind != LockNode::String || v->text.empty()) {
        return std::nullopt;
    }
    return v->text;
}

std::optional<std::string> LockEntry::resolved() const {
    return string_field(body, "resolved");
}

void LockEntry::set_resolved(const std::string& value) {
    body.set("resolved", LockNode::make_string(value));
}

std::optional<std::string> LockEntry::sha256() const {
    return string_field(body, "sha256");
}

void LockEntry::set_sha256(const std::string& value) {
    body.set("sha256", LockNode::make_string(value));
}

bool operator==(const LockEntry& a, const LockEntry& b) {
    return a.keys == b.keys && a.body == b.body;
}

bool operator!=(const LockEntry& a, const LockEntry& b) {
    return !(a == b);
}

bool operator==(const LockFile& a, const LockFile& b) {
    return a.entries == b.entries;
}

bool operator!=(const LockFile& a, const LockFile& b) {
    return !(a == b);
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

namespace {

using TT = LockTokenType;

// `a, b:` followed by a block, or `a "value"`
struct Assignment {
    std::vector<std::string> keys;
    LockNode value;
    SourcePos pos;
};

struct Parser {
    const std::vector<LockToken>& tokens;
    size_t pos;

    explicit Parser(const std::vector<LockToken>& toks) : tokens(toks), pos(0) {}

    const LockToken& peek() const { return tokens[pos]; }

    void advance() {
        if (tokens[pos].type != TT::Eof) ++pos;
    }

    Yarn2nixError error(const std::string& msg) const {
        const auto& p = peek().pos;
        return Yarn2nixError{Yarn2nixError::Parse,
            msg + " (line " + std::to_string(p.line) + ", column " +
            std::to_string(p.col) + ")", "", p.file, p.line};
    }

    static bool is_value(const LockToken& t) {
        return t.type == TT::String || t.type == TT::Number ||
               t.type == TT::Boolean;
    }

    static LockNode scalar_of(const LockToken& t) {
        switch (t.type) {
            case TT::Number:  return LockNode::make_scalar(LockNode::Number, t.text);
            case TT::Boolean: return LockNode::make_scalar(LockNode::Boolean, t.text);
            default:          return LockNode::make_string(t.text);
        }
    }

    // Parse the block at `indent`. Returns when a line at a shallower
    // indentation (or EOF) is reached.
    Result<std::vector<Assignment>> parse_block(int indent) {
        std::vector<Assignment> out;

        while (true) {
            const LockToken& tok = peek();

            if (tok.type == TT::Newline) {
                advance();
                if (indent == 0) continue;
                const LockToken& next = peek();
                if (next.type != TT::Indent) break;
                if (next.depth == indent) {
                    advance();
                } else {
                    break;
                }
            } else if (tok.type == TT::Indent) {
                if (tok.depth == indent) {
                    advance();
                } else {
                    break;
                }
            } else if (tok.type == TT::Eof) {
                break;
            } else if (tok.type == TT::Comment) {
                advance();
            } else if (tok.type == TT::String) {
                Assignment a;
                a.pos = tok.pos;
                a.keys.push_back(tok.text);
                advance();

                while (peek().type == TT::Comma) {
                    advance();
                    if (peek().type != TT::String) {
                        return error("expected a key after ','");
                    }
                    a.keys.push_back(peek().text);
                    advance();
                }

                bool was_colon = peek().type == TT::Colon;
                if (was_colon) advance();

                if (is_value(peek())) {
                    a.value = scalar_of(peek());
                    advance();
                    out.push_back(std::move(a));
                } else if (was_colon) {
                    auto block = parse_block(indent + 1);
                    if (block.is_err()) return std::move(block).error();
                    a.value = LockNode::make_object();
                    for (auto& child : block.value()) {
                        for (const auto& key : child.keys) {
                            a.value.set(key, child.value);
                        }
                    }
                    out.push_back(std::move(a));
                    if (indent > 0 && peek().type != TT::Indent) break;
                } else {
                    return error("invalid value type for key '" + a.keys.front() + "'");
                }
            } else {
                return error(std::string("unexpected token ") +
                             lock_token_name(tok.type));
            }
        }

        return Result<std::vector<Assignment>>::ok(std::move(out));
    }
};

} // anonymous namespace

Result<LockFile> LockFile::parse(const std::string& text,
                                 const std::string& filename) {
    auto lexed = lex_lockfile(text, filename);
    if (lexed.is_err()) return std::move(lexed).error();

    Parser parser(lexed.value());
    auto top = parser.parse_block(0);
    if (top.is_err()) return std::move(top).error();

    if (parser.peek().type != TT::Eof) {
        return parser.error("unexpected indentation at top level");
    }

    LockFile lock;
    std::unordered_set<std::string> seen;
    for (auto& a : top.value()) {
        for (const auto& key : a.keys) {
            if (!seen.insert(key).second) {
                return Yarn2nixError{Yarn2nixError::Duplicate,
                    "key '" + key + "' is listed more than once", "",
                    a.pos.file, a.pos.line};
            }
        }

        if (a.value.is_object()) {
            lock.entries.push_back(LockEntry{std::move(a.keys), std::move(a.value)});
        } else {
            // Scalars are never shared between keys
            for (auto& key : a.keys) {
                lock.entries.push_back(LockEntry{{key}, a.value});
            }
        }
    }

    return Result<LockFile>::ok(std::move(lock));
}

// ---------------------------------------------------------------------------
// Serializer
// ---------------------------------------------------------------------------

static int field_priority(const std::string& key) {
    if (key == "name")         return 1;
    if (key == "version")      return 2;
    if (key == "uid")          return 3;
    if (key == "resolved")     return 4;
    if (key == "integrity")    return 5;
    if (key == "registry")     return 6;
    if (key == "dependencies") return 7;
    return 0;
}

static bool key_order(const std::string& a, const std::string& b) {
    int pa = field_priority(a);
    int pb = field_priority(b);
    if (pa || pb) {
        return (pa ? pa : 100) < (pb ? pb : 100);
    }
    return a < b;
}

static bool needs_quotes(const std::string& s) {
    if (s.rfind("true", 0) == 0 || s.rfind("false", 0) == 0) return true;
    if (s.empty()) return true;
    unsigned char first = static_cast<unsigned char>(s[0]);
    if (!std::isalpha(first)) return true;
    for (char c : s) {
        switch (c) {
            case ':': case '\\': case '"': case ',': case '[': case ']':
            case ' ': case '\t': case '\n': case '\r': case '\f': case '\v':
                return true;
            default:
                break;
        }
    }
    return false;
}

static std::string json_quote(const std::string& s) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex_chars[(c >> 4) & 0x0f];
                    out += hex_chars[c & 0x0f];
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

static std::string maybe_quote(const std::string& s) {
    return needs_quotes(s) ? json_quote(s) : s;
}

static std::string scalar_text(const LockNode& n) {
    if (n.kind == LockNode::String) return maybe_quote(n.text);
    return n.text;
}

static std::string join_keys(std::vector<std::string> keys) {
    std::sort(keys.begin(), keys.end());
    std::string line;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) line += ", ";
        line += maybe_quote(keys[i]);
    }
    return line;
}

// Nested block: "<indent>k v\n<indent>k2:\n..." without a trailing newline.
static std::string stringify_block(const LockNode& obj, const std::string& indent) {
    std::vector<const LockField*> sorted;
    for (const auto& f : obj.fields) sorted.push_back(&f);
    std::sort(sorted.begin(), sorted.end(),
              [](const LockField* a, const LockField* b) {
                  return key_order(a->key, b->key);
              });

    std::string out = indent;
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0) out += "\n" + indent;
        const LockField& f = *sorted[i];
        if (f.value.is_object()) {
            out += maybe_quote(f.key) + ":\n" + stringify_block(f.value, indent + "  ");
        } else {
            out += maybe_quote(f.key) + " " + scalar_text(f.value);
        }
    }
    return out;
}

std::string LockFile::stringify() const {
    struct Item {
        const LockEntry* entry;
        std::string first_key;
    };

    std::vector<Item> items;
    for (const auto& e : entries) {
        if (e.keys.empty()) continue;
        auto first = std::min_element(e.keys.begin(), e.keys.end(), key_order);
        items.push_back(Item{&e, *first});
    }
    std::sort(items.begin(), items.end(), [](const Item& a, const Item& b) {
        return key_order(a.first_key, b.first_key);
    });

    std::string out;
    out += "# THIS IS AN AUTOGENERATED FILE. DO NOT EDIT THIS FILE DIRECTLY.\n";
    out += "# yarn lockfile v1\n";
    out += "\n\n";

    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += "\n";
        const LockEntry& e = *items[i].entry;
        if (e.body.is_object()) {
            out += join_keys(e.keys) + ":\n" + stringify_block(e.body, "  ") + "\n";
        } else {
            out += join_keys(e.keys) + " " + scalar_text(e.body);
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// File I/O
// ---------------------------------------------------------------------------

Result<std::string> read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Yarn2nixError{Yarn2nixError::IO, "cannot open file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

Result<LockFile> LockFile::load(const std::string& path) {
    return read_text_file(path).and_then([&](std::string& text) {
        return LockFile::parse(text, path);
    });
}

Status LockFile::save(const std::string& path) const {
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return Yarn2nixError{Yarn2nixError::IO,
                "cannot write lockfile: " + tmp};
        }
        out << stringify();
        out.flush();
        if (!out) {
            return Yarn2nixError{Yarn2nixError::IO,
                "failed writing lockfile: " + tmp};
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp, ec);
        return Yarn2nixError{Yarn2nixError::IO,
            "cannot replace " + path + ": " + reason};
    }

    log::debug("wrote %s", path.c_str());
    return ok_status();
}

size_t LockFile::key_count() const {
    size_t n = 0;
    for (const auto& e : entries) n += e.keys.size();
    return n;
}

} // namespace yarn2nix
