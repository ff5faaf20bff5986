#pragma once

#include <string>

namespace lode {

struct LodeError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg,
        InvalidPattern,
        RootNotFound
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    LodeError() = default;
    LodeError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    LodeError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    LodeError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace lode
