#include <kuid/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace kuid {

const char* format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::Compact: return "compact";
        case OutputFormat::Uuid:    return "uuid";
        case OutputFormat::Bytes:   return "bytes";
        case OutputFormat::All:     return "all";
    }
    return "unknown";
}

Result<OutputFormat> parse_format(const std::string& name) {
    if (name == "compact") return Result<OutputFormat>::ok(OutputFormat::Compact);
    if (name == "uuid")    return Result<OutputFormat>::ok(OutputFormat::Uuid);
    if (name == "bytes")   return Result<OutputFormat>::ok(OutputFormat::Bytes);
    if (name == "all")     return Result<OutputFormat>::ok(OutputFormat::All);
    return KuidError{KuidError::Config,
        "unknown output format '" + name + "'",
        "expected one of: compact, uuid, bytes, all"};
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& source_name) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source_name);
    } catch (const toml::parse_error& e) {
        return KuidError{KuidError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", source_name, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto s = node->value<std::string>();
            if (!s) {
                return KuidError{KuidError::Config,
                    "[log] level must be a string", "", source_name,
                    static_cast<int>(node->source().begin.line)};
            }
            auto lvl = log::parse_level(*s);
            if (lvl.is_err()) {
                auto e = std::move(lvl).error();
                e.file = source_name;
                e.line = static_cast<int>(node->source().begin.line);
                return e;
            }
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
        }
    }

    // [output] section
    if (auto out = doc["output"].as_table()) {
        if (auto node = out->get("format")) {
            auto s = node->value<std::string>();
            auto fmt = s ? parse_format(*s)
                         : Result<OutputFormat>::err(KuidError{KuidError::Config,
                               "[output] format must be a string"});
            if (fmt.is_err()) {
                auto e = std::move(fmt).error();
                e.file = source_name;
                e.line = static_cast<int>(node->source().begin.line);
                return e;
            }
            cfg.format = fmt.value();
            cfg.format_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return KuidError{KuidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color.has_value()) {
        log_color = other.log_color;
    }
    if (other.format_set) {
        format = other.format;
        format_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.kuid/config.toml";
}

} // namespace kuid
