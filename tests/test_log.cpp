#include <catch2/catch.hpp>
#include <crlf/log.hpp>
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
#else
#include <unistd.h>
#endif

using namespace crlf::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
#ifdef _WIN32
    _pipe(pipefd, 4096, 0);
#else
    REQUIRE(pipe(pipefd) == 0);
#endif

    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    int n;
    while ((n = static_cast<int>(read(pipefd[0], buf, sizeof(buf)))) > 0) {
        output.append(buf, n);
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

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level() accepts level names only", "[log]") {
    REQUIRE(parse_level("trace") == Trace);
    REQUIRE(parse_level("warn") == Warn);
    REQUIRE(parse_level("error") == Error);
    REQUIRE_FALSE(parse_level("WARN").has_value());
    REQUIRE_FALSE(parse_level("verbose").has_value());
    REQUIRE_FALSE(parse_level("").has_value());
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled());

    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("should not appear");
        debug("nor this");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at and above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output == "warn: this is a warning\nerror: this is an error\n");

    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("%zu converted, %s", static_cast<size_t>(3), "done");
    });
    REQUIRE(output == "info: 3 converted, done\n");
}

TEST_CASE("Colored output wraps the level tag", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] {
        warn("tinted");
    });
    REQUIRE(output.find("\033[33mwarn\033[0m: tinted") != std::string::npos);

    set_color_enabled(false);
}
