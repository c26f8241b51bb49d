#include <kuid/cli.hpp>
#include <cerrno>
#include <cstdlib>

namespace kuid {

Result<long> parse_count(const std::string& s) {
    if (s.empty()) {
        return KuidError{KuidError::InvalidArg,
            "empty count", "expected a positive integer"};
    }

    char* end = nullptr;
    errno = 0;
    long n = std::strtol(s.c_str(), &end, 10);
    if (*end != '\0' || n < 1) {
        return KuidError{KuidError::InvalidArg,
            "invalid count '" + s + "'", "expected a positive integer"};
    }
    if (errno == ERANGE || n > max_count) {
        return KuidError{KuidError::InvalidArg,
            "count '" + s + "' is too large",
            "at most " + std::to_string(max_count) + " identifiers per run"};
    }
    return Result<long>::ok(n);
}

} // namespace kuid
