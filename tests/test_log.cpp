#include <catch2/catch.hpp>
#include <packmeta/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace packmeta::log;

// Route log output into a temporary file and return what was written
static std::string capture(const std::function<void()>& fn) {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_sink(tmp);
    set_color_enabled(false);

    fn();

    std::fflush(tmp);
    std::rewind(tmp);
    std::string out;
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        out.append(buf, n);
    }
    set_sink(nullptr);
    std::fclose(tmp);
    return out;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Off}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Warn);
}

TEST_CASE("parse_level accepts names case-insensitively", "[log]") {
    Level lvl = Info;
    REQUIRE(parse_level("DEBUG", lvl));
    REQUIRE(lvl == Debug);
    REQUIRE(parse_level("warning", lvl));
    REQUIRE(lvl == Warn);
    REQUIRE(parse_level("off", lvl));
    REQUIRE(lvl == Off);

    lvl = Info;
    REQUIRE_FALSE(parse_level("loud", lvl));
    REQUIRE(lvl == Info);
}

TEST_CASE("messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    auto out = capture([] { info("should not appear"); });
    REQUIRE(out.empty());
}

TEST_CASE("messages at or above threshold are emitted with level prefix", "[log]") {
    set_level(Warn);
    auto out = capture([] {
        warn("manifest %s has %d members", "Package.toml", 3);
        error("boom");
    });
    REQUIRE(out.find("packmeta warn: manifest Package.toml has 3 members") != std::string::npos);
    REQUIRE(out.find("packmeta error: boom") != std::string::npos);
}

TEST_CASE("Off silences everything", "[log]") {
    set_level(Off);
    auto out = capture([] { error("nothing"); });
    REQUIRE(out.empty());
    REQUIRE_FALSE(enabled(Error));
    set_level(Warn);
}

TEST_CASE("each level function writes its own prefix", "[log]") {
    set_level(Trace);
    auto out = capture([] {
        trace("t %d", 1);
        debug("d %d", 2);
        info("i %d", 3);
        warn("w %d", 4);
        error("e %d", 5);
    });
    REQUIRE(out == "packmeta trace: t 1\n"
                   "packmeta debug: d 2\n"
                   "packmeta info: i 3\n"
                   "packmeta warn: w 4\n"
                   "packmeta error: e 5\n");
    set_level(Warn);
}
