#pragma once

#include <kuid/result.hpp>
#include <string>

namespace kuid {

// Upper bound for `kuid new <count>`
inline constexpr long max_count = 1000000;

// Decimal count in [1, max_count]; anything else is InvalidArg
Result<long> parse_count(const std::string& s);

} // namespace kuid
