#pragma once

#include <kuid/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace kuid::base62 {

// Digit value of a character is its index in this string
inline constexpr char alphabet[] =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
inline constexpr uint64_t radix = 62;

// 62^11 > 2^64, so 11 digits always hold a uint64_t
inline constexpr size_t width = 11;

// Fixed-width encoding, left-padded with '0'
std::string encode(uint64_t value);

// Fails with InvalidLength unless s.size() == width, InvalidChar on the
// first character outside the alphabet.
Result<uint64_t> decode(const std::string& s);

// Digit value of c, or -1
int digit_value(char c);

} // namespace kuid::base62
