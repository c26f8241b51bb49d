#include <kuid/kuid.hpp>
#include <kuid/base62.hpp>
#include <ostream>

namespace kuid {

// ---- Byte order helpers ----

static uint64_t load_be64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | p[i];
    }
    return v;
}

static void store_be64(uint8_t* p, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        p[i] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
}

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// ---- Construction ----

Kuid Kuid::from_parts(uint64_t high, uint64_t low) {
    return Kuid(high, low);
}

Result<Kuid> Kuid::generate() {
    return generate(system_entropy());
}

Result<Kuid> Kuid::generate(EntropySource& source) {
    uint8_t buf[byte_size];
    KUID_TRY(source.fill(buf, byte_size));
    return from_bytes(buf, byte_size);
}

// ---- Bytes: 16, big-endian ----

Result<Kuid> Kuid::from_bytes(const uint8_t* data, size_t len) {
    if (len != byte_size) {
        return KuidError(KuidError::InvalidLength,
            "identifier must be exactly 16 bytes",
            "Got " + std::to_string(len) + " bytes");
    }
    return Result<Kuid>::ok(Kuid(load_be64(data), load_be64(data + 8)));
}

Result<Kuid> Kuid::from_bytes(const std::vector<uint8_t>& data) {
    return from_bytes(data.data(), data.size());
}

std::array<uint8_t, Kuid::byte_size> Kuid::bytes() const {
    std::array<uint8_t, byte_size> out;
    store_be64(out.data(), high_);
    store_be64(out.data() + 8, low_);
    return out;
}

// ---- UUID text: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx ----

Result<Kuid> Kuid::from_uuid(const std::string& s) {
    if (s.size() != uuid_size) {
        return KuidError(KuidError::InvalidUUID,
            "UUID string must be 36 characters",
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }
    if (s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
        return KuidError(KuidError::InvalidUUID,
            "UUID string has invalid dash positions",
            "Expected dashes at positions 8, 13, 18, 23");
    }

    uint8_t buf[byte_size];
    size_t byte_idx = 0;
    for (size_t i = 0; i < uuid_size; ) {
        if (i == 8 || i == 13 || i == 18 || i == 23) { ++i; continue; }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return KuidError(KuidError::InvalidUUID,
                "UUID string contains invalid hex character",
                std::string("Invalid char at position ") + std::to_string(hi < 0 ? i : i + 1));
        }
        buf[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return from_bytes(buf, byte_size);
}

std::string Kuid::to_uuid() const {
    auto b = bytes();
    std::string out;
    out.reserve(uuid_size);
    for (size_t i = 0; i < byte_size; ++i) {
        out += hex_chars[b[i] >> 4];
        out += hex_chars[b[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

// ---- Compact text: base62(high) + base62(low) ----

Result<Kuid> Kuid::from_string(const std::string& s) {
    if (s.size() != compact_size) {
        return KuidError(KuidError::InvalidLength,
            "compact identifier must be 22 characters",
            "Got " + std::to_string(s.size()) + " characters");
    }

    auto high = base62::decode(s.substr(0, base62::width));
    KUID_TRY(high);
    auto low = base62::decode(s.substr(base62::width));
    if (low.is_err()) {
        auto e = std::move(low).error();
        e.hint += " (second half)";
        return e;
    }
    return Result<Kuid>::ok(Kuid(high.value(), low.value()));
}

std::string Kuid::to_string() const {
    return base62::encode(high_) + base62::encode(low_);
}

Result<Kuid> Kuid::parse(const std::string& s) {
    if (s.size() == compact_size) return from_string(s);
    if (s.size() == uuid_size) return from_uuid(s);
    return KuidError(KuidError::InvalidLength,
        "unrecognized identifier length " + std::to_string(s.size()),
        "expected 22 (compact) or 36 (UUID) characters");
}

// ---- Equality ----

bool Kuid::operator==(const Kuid& other) const {
    return high_ == other.high_ && low_ == other.low_;
}

bool Kuid::operator!=(const Kuid& other) const {
    return !(*this == other);
}

bool equal(const std::optional<Kuid>& a, const std::optional<Kuid>& b) {
    if (!a.has_value() || !b.has_value()) return false;
    return *a == *b;
}

std::ostream& operator<<(std::ostream& os, const Kuid& id) {
    return os << id.to_string();
}

} // namespace kuid
