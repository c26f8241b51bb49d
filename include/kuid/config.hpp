#pragma once

#include <kuid/result.hpp>
#include <kuid/log.hpp>
#include <optional>
#include <string>

namespace kuid {

enum class OutputFormat { Compact, Uuid, Bytes, All };

const char* format_name(OutputFormat f);
Result<OutputFormat> parse_format(const std::string& name);

// Layered configuration: global (~/.kuid/config.toml) < local (./kuid.toml).
// A layer only overrides the keys it actually sets.
struct Config {
    log::Level log_level = log::Info;
    std::optional<bool> log_color;
    OutputFormat format = OutputFormat::Compact;

    bool log_level_set = false;
    bool format_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& source_name = "");

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// ~/.kuid/config.toml, or "" when HOME is unset
std::string global_config_path();

} // namespace kuid
