#pragma once

#include <kuid/result.hpp>
#include <kuid/entropy.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace kuid {

// 128-bit identifier held as two big-endian halves. Immutable: every
// conversion yields a new value or string.
//
//   bytes[0:8]  -> high
//   bytes[8:16] -> low
//
// Text forms:
//   compact: 22 base62 chars, encode(high) + encode(low)
//   uuid:    xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase on output
class Kuid {
public:
    static constexpr size_t byte_size = 16;
    static constexpr size_t compact_size = 22;
    static constexpr size_t uuid_size = 36;

    static Kuid from_parts(uint64_t high, uint64_t low);

    // 16 bytes from the system entropy source
    static Result<Kuid> generate();
    static Result<Kuid> generate(EntropySource& source);

    static Result<Kuid> from_bytes(const uint8_t* data, size_t len);
    static Result<Kuid> from_bytes(const std::vector<uint8_t>& data);
    std::array<uint8_t, byte_size> bytes() const;

    static Result<Kuid> from_uuid(const std::string& s);
    std::string to_uuid() const;

    static Result<Kuid> from_string(const std::string& s);
    std::string to_string() const;

    // Accepts either text form, chosen by length
    static Result<Kuid> parse(const std::string& s);

    uint64_t high() const { return high_; }
    uint64_t low() const { return low_; }

    bool operator==(const Kuid& other) const;
    bool operator!=(const Kuid& other) const;

private:
    Kuid(uint64_t high, uint64_t low) : high_(high), low_(low) {}

    uint64_t high_;
    uint64_t low_;
};

// False whenever either side is absent
bool equal(const std::optional<Kuid>& a, const std::optional<Kuid>& b);

std::ostream& operator<<(std::ostream& os, const Kuid& id);

} // namespace kuid
