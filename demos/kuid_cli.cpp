// kuid_cli.cpp
//
// Command-line front end for the kuid library.
//
//     kuid new [count]                 # generate identifiers
//     kuid compact <uuid>              # UUID text -> compact text
//     kuid uuid <compact>              # compact text -> UUID text
//     kuid inspect <uuid-or-compact>   # show every representation
//
// Options: -v (debug logging), --format compact|uuid|bytes|all
//
// Settings are read from ~/.kuid/config.toml, then ./kuid.toml.

#include <kuid/cli.hpp>
#include <kuid/config.hpp>
#include <kuid/kuid.hpp>
#include <kuid/log.hpp>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace kuid;

static const char* usage_text =
    "usage: kuid [-v] [--format compact|uuid|bytes|all] <command> [args]\n"
    "\n"
    "commands:\n"
    "  new [count]               generate random identifiers\n"
    "  compact <uuid>            convert UUID text to compact text\n"
    "  uuid <compact>            convert compact text to UUID text\n"
    "  inspect <uuid|compact>    print every representation\n";

struct Options {
    bool verbose = false;
    std::optional<OutputFormat> format;
    std::string command;
    std::vector<std::string> args;
};

static Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "--verbose") {
            opts.verbose = true;
        } else if (a == "--format") {
            if (i + 1 >= argc) {
                return KuidError{KuidError::InvalidArg,
                    "--format requires a value", "compact, uuid, bytes or all"};
            }
            auto f = parse_format(argv[++i]);
            KUID_TRY(f);
            opts.format = f.value();
        } else if (opts.command.empty()) {
            opts.command = a;
        } else {
            opts.args.push_back(a);
        }
    }
    if (opts.command.empty()) {
        return KuidError{KuidError::InvalidArg, "no command given"};
    }
    return Result<Options>::ok(std::move(opts));
}

// Missing files are silently skipped; malformed ones are errors.
static Result<Config> load_config() {
    std::optional<Config> global;
    std::optional<Config> local;

    std::string gpath = global_config_path();
    if (!gpath.empty() && fs::exists(gpath)) {
        auto c = Config::load(gpath);
        KUID_TRY(c);
        global = c.value();
        log::debug("loaded %s", gpath.c_str());
    }
    if (fs::exists("kuid.toml")) {
        auto c = Config::load("kuid.toml");
        KUID_TRY(c);
        local = c.value();
        log::debug("loaded kuid.toml");
    }
    return Result<Config>::ok(Config::effective(global, local));
}

static std::string hex_bytes(const Kuid& id) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    for (uint8_t b : id.bytes()) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

static void print_id(const Kuid& id, OutputFormat fmt) {
    switch (fmt) {
        case OutputFormat::Compact:
            std::cout << id.to_string() << "\n";
            break;
        case OutputFormat::Uuid:
            std::cout << id.to_uuid() << "\n";
            break;
        case OutputFormat::Bytes:
            std::cout << hex_bytes(id) << "\n";
            break;
        case OutputFormat::All:
            std::cout << "compact: " << id.to_string() << "\n"
                      << "uuid:    " << id.to_uuid() << "\n"
                      << "bytes:   " << hex_bytes(id) << "\n";
            break;
    }
}

static Result<std::string> single_arg(const Options& opts, const char* what) {
    if (opts.args.size() != 1) {
        return KuidError{KuidError::InvalidArg,
            "'" + opts.command + "' takes exactly one argument",
            std::string("usage: kuid ") + opts.command + " <" + what + ">"};
    }
    return Result<std::string>::ok(opts.args[0]);
}

static Status run(const Options& opts, OutputFormat fmt) {
    if (opts.command == "new") {
        long count = 1;
        if (!opts.args.empty()) {
            auto n = parse_count(opts.args[0]);
            KUID_TRY(n);
            count = n.value();
        }
        for (long i = 0; i < count; ++i) {
            auto id = Kuid::generate();
            KUID_TRY(id);
            print_id(id.value(), fmt);
        }
        return ok_status();
    }

    if (opts.command == "compact") {
        auto arg = single_arg(opts, "uuid");
        KUID_TRY(arg);
        auto id = Kuid::from_uuid(arg.value());
        KUID_TRY(id);
        std::cout << id.value().to_string() << "\n";
        return ok_status();
    }

    if (opts.command == "uuid") {
        auto arg = single_arg(opts, "compact");
        KUID_TRY(arg);
        auto id = Kuid::from_string(arg.value());
        KUID_TRY(id);
        std::cout << id.value().to_uuid() << "\n";
        return ok_status();
    }

    if (opts.command == "inspect") {
        auto arg = single_arg(opts, "uuid|compact");
        KUID_TRY(arg);
        auto id = Kuid::parse(arg.value());
        KUID_TRY(id);
        print_id(id.value(), OutputFormat::All);
        return ok_status();
    }

    return KuidError{KuidError::InvalidArg,
        "unknown command '" + opts.command + "'",
        "run kuid without arguments for usage"};
}

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n\n" << usage_text;
        return 2;
    }

    auto cfg = load_config();
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }

    const Config& c = cfg.value();
    log::set_level(opts.value().verbose ? log::Debug : c.log_level);
    if (c.log_color.has_value()) {
        log::set_color_enabled(*c.log_color);
    }

    OutputFormat fmt = opts.value().format.value_or(c.format);
    log::debug("command '%s', format %s", opts.value().command.c_str(), format_name(fmt));

    auto status = run(opts.value(), fmt);
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return status.error().code == KuidError::InvalidArg ? 2 : 1;
    }
    return 0;
}
