#pragma once

#include <string>

namespace kuid {

struct KuidError {
    enum Code {
        InvalidLength,
        InvalidChar,
        InvalidUUID,
        Generation,
        IO,
        Parse,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    KuidError() = default;
    KuidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    KuidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    KuidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace kuid
