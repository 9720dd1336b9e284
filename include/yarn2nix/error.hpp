#pragma once

#include <string>

namespace yarn2nix {

struct Yarn2nixError {
    enum Code {
        IO,
        Parse,
        Network,
        Resolution,
        PatchBlocked,
        Integrity,
        Config,
        Duplicate,
        InvalidArg,
        Cancelled
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    Yarn2nixError() = default;
    Yarn2nixError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    Yarn2nixError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    Yarn2nixError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace yarn2nix
