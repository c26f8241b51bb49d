#include <catch2/catch.hpp>
#include <kuid/log.hpp>
#include <kuid/entropy.hpp>
#include <cstdio>
#include <functional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define dup _dup
#define dup2 _dup2
#define fileno _fileno
#define read _read
#define close _close
#define pipe(fds) _pipe(fds, 4096, 0)
#else
#include <unistd.h>
#endif

using namespace kuid::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    if (pipe(pipefd) != 0) return "";

    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    long n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);

    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name() and parse_level() agree", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        auto parsed = parse_level(level_name(lvl));
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value() == lvl);
    }
}

TEST_CASE("parse_level() accepts 'warning' and rejects unknown names", "[log]") {
    auto w = parse_level("warning");
    REQUIRE(w.is_ok());
    REQUIRE(w.value() == Warn);

    auto bad = parse_level("loud");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == kuid::KuidError::Config);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);

    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("should not appear");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("warn: this is a warning\n") != std::string::npos);
    REQUIRE(output.find("error: this is an error\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Colored prefix wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] {
        info("hello");
    });
    REQUIRE(output.find("\033[32minfo\033[0m: hello") != std::string::npos);

    set_color_enabled(false);
}

TEST_CASE("Entropy failures are logged at debug", "[log]") {
    set_level(Debug);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        kuid::SystemEntropySource src("/nonexistent/kuid/device");
        uint8_t buf[16];
        auto s = src.fill(buf, sizeof(buf));
        REQUIRE(s.is_err());
    });
    REQUIRE(output.find("debug: entropy: cannot open /nonexistent/kuid/device") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("generated %d identifiers in %s", 42, "compact");
    });
    REQUIRE(output.find("info: generated 42 identifiers in compact") != std::string::npos);
}
