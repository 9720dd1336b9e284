#include <catch2/catch.hpp>
#include <yarn2nix/config.hpp>
#include <yarn2nix/log.hpp>

#include <atomic>
#include <cstdio>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace yarn2nix;

// Runs `fn` with stderr pointed at a temporary file and returns what it wrote
static std::string stderr_of(const std::function<void()>& fn) {
    std::fflush(stderr);
    std::FILE* sink = std::tmpfile();
    REQUIRE(sink != nullptr);

    int saved = dup(fileno(stderr));
    dup2(fileno(sink), fileno(stderr));
    fn();
    std::fflush(stderr);
    dup2(saved, fileno(stderr));
    close(saved);

    std::string text;
    std::rewind(sink);
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), sink)) > 0) {
        text.append(buf, n);
    }
    std::fclose(sink);
    return text;
}

static std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

// Applies a [log] table the way main() does
static void apply_log_config(const std::string& toml) {
    auto cfg = Config::parse(toml, "yarn2nix.toml");
    REQUIRE(cfg.is_ok());
    log::set_level(cfg.value().effective_log_level());
    if (cfg.value().color) log::set_color_enabled(*cfg.value().color);
}

TEST_CASE("parse_level accepts every level name", "[log]") {
    log::Level lvl = log::Error;
    REQUIRE(log::parse_level("trace", lvl));
    REQUIRE(lvl == log::Trace);
    REQUIRE(log::parse_level("debug", lvl));
    REQUIRE(lvl == log::Debug);
    REQUIRE(log::parse_level("info", lvl));
    REQUIRE(lvl == log::Info);
    REQUIRE(log::parse_level("warn", lvl));
    REQUIRE(lvl == log::Warn);
    REQUIRE(log::parse_level("error", lvl));
    REQUIRE(lvl == log::Error);
}

TEST_CASE("parse_level rejects unknown names", "[log]") {
    log::Level lvl = log::Warn;
    REQUIRE_FALSE(log::parse_level("verbose", lvl));
    REQUIRE_FALSE(log::parse_level("INFO", lvl));
    REQUIRE_FALSE(log::parse_level("", lvl));
    REQUIRE(lvl == log::Warn);
}

TEST_CASE("log level from config sets the threshold", "[log]") {
    apply_log_config("[log]\nlevel = \"warn\"\ncolor = false\n");
    REQUIRE(log::get_level() == log::Warn);

    auto output = stderr_of([] {
        log::debug("fetching %s", "https://registry.yarnpkg.com/a/-/a-1.0.0.tgz");
        log::info("found changes in the lockfile %s", "yarn.lock");
        log::warn("%d entries have no resolved field", 2);
        log::error("...aborting");
    });
    REQUIRE(output ==
            "warn: 2 entries have no resolved field\n"
            "error: ...aborting\n");

    apply_log_config("[log]\nlevel = \"debug\"\n");
    output = stderr_of([] {
        log::trace("skipping %s", "left-pad@~1.3.0");
        log::debug("wrote %s", "yarn.lock");
    });
    REQUIRE(output == "debug: wrote yarn.lock\n");

    log::set_level(log::Info);
}

TEST_CASE("colored output wraps the level name", "[log]") {
    log::set_level(log::Info);
    apply_log_config("[log]\ncolor = true\n");
    REQUIRE(log::is_color_enabled());

    auto output = stderr_of([] {
        log::info("updated %s", "yarn.lock");
        log::error("lockfile %s is missing hashes", "yarn.lock");
    });
    REQUIRE(output ==
            "\033[32minfo\033[0m: updated yarn.lock\n"
            "\033[31merror\033[0m: lockfile yarn.lock is missing hashes\n");

    log::set_color_enabled(false);
    REQUIRE_FALSE(log::is_color_enabled());
}

TEST_CASE("Concurrent messages stay on their own lines", "[log]") {
    log::set_level(log::Info);
    log::set_color_enabled(false);

    auto output = stderr_of([] {
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([t] {
                for (int i = 0; i < 25; ++i) {
                    log::info("worker %d message %d", t, i);
                }
            });
        }
        for (auto& th : threads) th.join();
    });

    auto lines = lines_of(output);
    REQUIRE(lines.size() == 100);
    for (const auto& line : lines) {
        REQUIRE(line.rfind("info: worker ", 0) == 0);
    }
}

TEST_CASE("color can be toggled while workers log", "[log]") {
    log::set_level(log::Info);
    log::set_color_enabled(false);

    auto output = stderr_of([] {
        std::atomic<bool> done{false};
        std::thread toggler([&done] {
            bool on = false;
            while (!done.load()) {
                on = !on;
                log::set_color_enabled(on);
                (void)log::is_color_enabled();
            }
        });

        std::vector<std::thread> workers;
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([t] {
                for (int i = 0; i < 25; ++i) {
                    log::info("prefetched dep-%d-%d", t, i);
                }
            });
        }
        for (auto& w : workers) w.join();
        done = true;
        toggler.join();
    });
    log::set_color_enabled(false);

    auto lines = lines_of(output);
    REQUIRE(lines.size() == 100);
    for (const auto& line : lines) {
        bool plain = line.rfind("info: prefetched dep-", 0) == 0;
        bool colored = line.rfind("\033[32minfo\033[0m: prefetched dep-", 0) == 0;
        REQUIRE((plain || colored));
    }
}
