#include <catch2/catch.hpp>
#include <yarn2nix/lang/lexer.hpp>

using namespace yarn2nix;

using TT = LockTokenType;

static std::vector<TT> types_of(const std::vector<LockToken>& toks) {
    std::vector<TT> out;
    for (const auto& t : toks) out.push_back(t.type);
    return out;
}

// ===== Basic tokenization =====

TEST_CASE("lex empty string", "[lexer]") {
    auto r = lex_lockfile("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].type == TT::Eof);
}

TEST_CASE("lex header comments", "[lexer]") {
    auto r = lex_lockfile("# yarn lockfile v1\n");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(types_of(toks) == std::vector<TT>{TT::Comment, TT::Newline, TT::Eof});
    REQUIRE(toks[0].text == " yarn lockfile v1");
}

TEST_CASE("lex entry header with several keys", "[lexer]") {
    auto r = lex_lockfile("\"a@^1.0.0\", a@^1.1.0:\n");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(types_of(toks) == std::vector<TT>{
        TT::String, TT::Comma, TT::String, TT::Colon, TT::Newline, TT::Eof});
    REQUIRE(toks[0].text == "a@^1.0.0");
    REQUIRE(toks[0].quoted);
    REQUIRE(toks[2].text == "a@^1.1.0");
    REQUIRE_FALSE(toks[2].quoted);
}

TEST_CASE("lex indentation depth", "[lexer]") {
    auto r = lex_lockfile("a:\n  b:\n    c \"1\"\n");
    REQUIRE(r.is_ok());
    auto& toks = r.value();

    std::vector<int> depths;
    for (const auto& t : toks) {
        if (t.type == TT::Indent) depths.push_back(t.depth);
    }
    REQUIRE(depths == std::vector<int>{1, 2});
}

TEST_CASE("spaces inside a line are not indentation", "[lexer]") {
    auto r = lex_lockfile("version \"1.0.0\"\n");
    REQUIRE(r.is_ok());
    REQUIRE(types_of(r.value()) == std::vector<TT>{
        TT::String, TT::String, TT::Newline, TT::Eof});
}

TEST_CASE("lex numbers strip leading zeros", "[lexer]") {
    auto r = lex_lockfile("n 007\nz 000\n");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks[1].type == TT::Number);
    REQUIRE(toks[1].text == "7");
    REQUIRE(toks[4].type == TT::Number);
    REQUIRE(toks[4].text == "0");
}

TEST_CASE("lex booleans", "[lexer]") {
    auto r = lex_lockfile("optional true\nbundled false\n");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks[1].type == TT::Boolean);
    REQUIRE(toks[1].text == "true");
    REQUIRE(toks[4].type == TT::Boolean);
    REQUIRE(toks[4].text == "false");
}

TEST_CASE("lex bare words with URL characters", "[lexer]") {
    auto r = lex_lockfile("resolved https://registry.yarnpkg.com/a/-/a-1.0.0.tgz#abc\n");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    // The colon after the scheme ends the bare word
    REQUIRE(toks[1].type == TT::String);
    REQUIRE(toks[1].text == "https");
    REQUIRE(toks[2].type == TT::Colon);
}

TEST_CASE("lex CRLF line endings", "[lexer]") {
    auto r = lex_lockfile("a:\r\n  b \"1\"\r\n");
    REQUIRE(r.is_ok());
    REQUIRE(types_of(r.value()) == std::vector<TT>{
        TT::String, TT::Colon, TT::Newline, TT::Indent, TT::String,
        TT::String, TT::Newline, TT::Eof});
}

TEST_CASE("lex tracks line numbers", "[lexer]") {
    auto r = lex_lockfile("# c\n\na:\n");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    const LockToken* key = nullptr;
    for (const auto& t : toks) {
        if (t.type == TT::String) { key = &t; break; }
    }
    REQUIRE(key != nullptr);
    REQUIRE(key->pos.line == 3);
    REQUIRE(key->pos.col == 1);
}

// ===== String literals =====

TEST_CASE("lex quoted string escapes", "[lexer]") {
    auto r = lex_lockfile(R"(k "a\"b\\c\n")" "\n");
    REQUIRE(r.is_ok());
    auto& toks = r.value();
    REQUIRE(toks[1].type == TT::String);
    REQUIRE(toks[1].text == "a\"b\\c\n");
}

TEST_CASE("decode_json_string unicode escapes", "[lexer]") {
    std::string out;
    REQUIRE(decode_json_string("caf\\u00e9", out));
    REQUIRE(out == "caf\xc3\xa9");

    REQUIRE(decode_json_string("\\ud83d\\ude00", out));
    REQUIRE(out == "\xf0\x9f\x98\x80");
}

TEST_CASE("decode_json_string rejects bad escapes", "[lexer]") {
    std::string out;
    REQUIRE_FALSE(decode_json_string("\\x41", out));
    REQUIRE_FALSE(decode_json_string("\\u12", out));
    REQUIRE_FALSE(decode_json_string("trailing\\", out));
}

// ===== Errors =====

TEST_CASE("odd indentation is a parse error", "[lexer]") {
    auto r = lex_lockfile("a:\n   b \"1\"\n", "yarn.lock");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Yarn2nixError::Parse);
    REQUIRE(r.error().file == "yarn.lock");
    REQUIRE(r.error().line == 2);
}

TEST_CASE("unterminated string is a parse error", "[lexer]") {
    auto r = lex_lockfile("a \"open\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Yarn2nixError::Parse);
    REQUIRE(r.error().line == 1);
}

TEST_CASE("unexpected character is a parse error", "[lexer]") {
    auto r = lex_lockfile("a:\n  b {1}\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Yarn2nixError::Parse);
    REQUIRE(r.error().line == 2);
    REQUIRE(r.error().message.find("'{'") != std::string::npos);
}

TEST_CASE("lock_token_name", "[lexer]") {
    REQUIRE(std::string(lock_token_name(TT::Indent)) == "Indent");
    REQUIRE(std::string(lock_token_name(TT::Eof)) == "Eof");
}
