#include <lode/error.hpp>

namespace lode {

const char* LodeError::code_name(Code c) {
    switch (c) {
        case IO:             return "IO";
        case Parse:          return "Parse";
        case Config:         return "Config";
        case NotFound:       return "NotFound";
        case InvalidArg:     return "InvalidArg";
        case InvalidPattern: return "InvalidPattern";
        case RootNotFound:   return "RootNotFound";
    }
    return "Unknown";
}

std::string LodeError::format() const {
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

} // namespace lode
