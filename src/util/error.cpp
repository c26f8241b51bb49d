#include <kuid/error.hpp>

namespace kuid {

const char* KuidError::code_name(Code c) {
    switch (c) {
        case InvalidLength: return "InvalidLength";
        case InvalidChar:   return "InvalidChar";
        case InvalidUUID:   return "InvalidUUID";
        case Generation:    return "Generation";
        case IO:            return "IO";
        case Parse:         return "Parse";
        case Config:        return "Config";
        case InvalidArg:    return "InvalidArg";
    }
    return "Unknown";
}

std::string KuidError::format() const {
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

} // namespace kuid
