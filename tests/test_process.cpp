#include <catch2/catch.hpp>
#include <yarn2nix/process.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include <unistd.h>

using namespace yarn2nix;

namespace fs = std::filesystem;

// True once `pid` has exited (gone, or a zombie awaiting its new parent)
static bool process_gone(int pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) return true;
    std::string line;
    std::getline(stat, line);
    auto paren = line.rfind(')');
    return paren == std::string::npos || paren + 2 >= line.size() ||
           line[paren + 2] == 'Z' || line[paren + 2] == 'X';
}

static int read_pid(const std::string& path) {
    std::ifstream in(path);
    int pid = 0;
    in >> pid;
    return pid;
}

TEST_CASE("run_command echo", "[process]") {
    auto r = run_command({"echo", "hello"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str == "hello\n");
}

TEST_CASE("run_command false returns nonzero", "[process]") {
    auto r = run_command({"false"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code != 0);
}

TEST_CASE("run_command captures stderr", "[process]") {
    auto r = run_command({"sh", "-c", "echo err >&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE(r.value().stderr_str.find("err") != std::string::npos);
    REQUIRE(r.value().stdout_str.empty());
}

TEST_CASE("run_command empty args error", "[process]") {
    auto r = run_command({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Yarn2nixError::InvalidArg);
}

TEST_CASE("run_command with working dir", "[process]") {
    auto r = run_command({"pwd"}, "/tmp");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str.find("/tmp") != std::string::npos);
}

TEST_CASE("run_command nonexistent binary", "[process]") {
    auto r = run_command({"__yarn2nix_nonexistent_binary_xyz__"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("run_command output larger than a pipe buffer", "[process]") {
    auto r = run_command({"sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str.size() == 20000u * 11u);
}

TEST_CASE("run_command timeout kills the child", "[process]") {
    auto start = std::chrono::steady_clock::now();
    auto r = run_command({"sleep", "30"}, "", 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Yarn2nixError::IO);
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
    REQUIRE(elapsed < std::chrono::seconds(10));
}

TEST_CASE("run_command honors cancellation", "[process]") {
    CancelFlag cancel{false};
    std::thread trigger([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.store(true);
    });

    auto start = std::chrono::steady_clock::now();
    auto r = run_command({"sleep", "30"}, "", 60, &cancel);
    auto elapsed = std::chrono::steady_clock::now() - start;
    trigger.join();

    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Yarn2nixError::Cancelled);
    REQUIRE(elapsed < std::chrono::seconds(10));
}

TEST_CASE("run_command with cancel already raised", "[process]") {
    CancelFlag cancel{true};
    auto r = run_command({"echo", "never"}, "", 60, &cancel);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Yarn2nixError::Cancelled);
}

TEST_CASE("run_command cancellation also kills grandchildren", "[process]") {
    auto pid_file = (fs::temp_directory_path() /
        ("yarn2nix_test_grandchild_" + std::to_string(getpid()))).string();
    fs::remove(pid_file);

    // Stands in for nix-prefetch-git running git underneath it
    std::string script = "sleep 30 & echo $! > " + pid_file + "; wait";

    CancelFlag cancel{false};
    std::thread trigger([&cancel, &pid_file] {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (read_pid(pid_file) == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        cancel.store(true);
    });

    auto r = run_command({"sh", "-c", script}, "", 60, &cancel);
    trigger.join();

    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Yarn2nixError::Cancelled);

    int grandchild = read_pid(pid_file);
    REQUIRE(grandchild > 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!process_gone(grandchild) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    REQUIRE(process_gone(grandchild));
    fs::remove(pid_file);
}
