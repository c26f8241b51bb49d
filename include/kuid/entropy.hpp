#pragma once

#include <kuid/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace kuid {

// Source of cryptographically secure random bytes. fill() either writes
// exactly len bytes or fails; a short read is never success.
class EntropySource {
public:
    virtual ~EntropySource() = default;
    virtual Status fill(uint8_t* buf, size_t len) = 0;
};

// Reads from the kernel CSPRNG device. No fallback generator.
class SystemEntropySource : public EntropySource {
public:
    explicit SystemEntropySource(std::string device = "/dev/urandom");

    Status fill(uint8_t* buf, size_t len) override;

    const std::string& device() const { return device_; }

private:
    std::string device_;
};

// Process-wide system source
EntropySource& system_entropy();

} // namespace kuid
