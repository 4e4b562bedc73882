#pragma once

#include <string>

namespace weft {

struct WeftError {
    enum Code {
        Parse,
        Version,
        Range,
        Constraint,
        Config,
        IO,
        InvalidArg
    };

    Code code = InvalidArg;
    std::string message;
    std::string hint;

    WeftError() = default;
    WeftError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    WeftError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // "error[Code]: message" followed by an optional hint line
    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace weft
