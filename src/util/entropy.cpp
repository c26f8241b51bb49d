#include <kuid/entropy.hpp>
#include <kuid/log.hpp>
#include <fstream>

namespace kuid {

SystemEntropySource::SystemEntropySource(std::string device)
    : device_(std::move(device)) {}

Status SystemEntropySource::fill(uint8_t* buf, size_t len) {
    std::ifstream dev(device_, std::ios::binary);
    if (!dev.is_open()) {
        log::debug("entropy: cannot open %s", device_.c_str());
        return KuidError{KuidError::Generation,
            "cannot open entropy source " + device_,
            "a readable CSPRNG device is required to generate identifiers"};
    }

    dev.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    auto got = static_cast<size_t>(dev.gcount());
    if (got != len) {
        log::debug("entropy: short read from %s (%zu of %zu bytes)",
                   device_.c_str(), got, len);
        return KuidError{KuidError::Generation,
            "short read from entropy source " + device_,
            "got " + std::to_string(got) + " of " + std::to_string(len) + " bytes"};
    }
    return ok_status();
}

EntropySource& system_entropy() {
    static SystemEntropySource source;
    return source;
}

} // namespace kuid
