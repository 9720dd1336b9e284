#include <yarn2nix/error.hpp>

namespace yarn2nix {

const char* Yarn2nixError::code_name(Code c) {
    switch (c) {
        case IO:           return "IO";
        case Parse:        return "Parse";
        case Network:      return "Network";
        case Resolution:   return "Resolution";
        case PatchBlocked: return "PatchBlocked";
        case Integrity:    return "Integrity";
        case Config:       return "Config";
        case Duplicate:    return "Duplicate";
        case InvalidArg:   return "InvalidArg";
        case Cancelled:    return "Cancelled";
    }
    return "Unknown";
}

std::string Yarn2nixError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace yarn2nix
