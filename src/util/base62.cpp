#include <kuid/base62.hpp>

namespace kuid::base62 {

std::string encode(uint64_t value) {
    char buf[width];
    for (int i = static_cast<int>(width) - 1; i >= 0; --i) {
        buf[i] = alphabet[value % radix];
        value /= radix;
    }
    return std::string(buf, width);
}

int digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    if (c >= 'a' && c <= 'z') return c - 'a' + 36;
    return -1;
}

Result<uint64_t> decode(const std::string& s) {
    if (s.size() != width) {
        return KuidError(KuidError::InvalidLength,
            "base62 segment must be 11 characters",
            "Got " + std::to_string(s.size()) + " characters");
    }

    // Strings above the encodable maximum wrap modulo 2^64
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        int d = digit_value(s[i]);
        if (d < 0) {
            return KuidError(KuidError::InvalidChar,
                "base62 segment contains invalid character",
                std::string("Invalid char '") + s[i] + "' at position " + std::to_string(i));
        }
        value = value * radix + static_cast<uint64_t>(d);
    }
    return Result<uint64_t>::ok(value);
}

} // namespace kuid::base62
