// Test cases and behaviors for loading and saving audio.cfg.

#include "header/AudioConfig.h"
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <string>

namespace {

// Scratch file in the working directory, removed when the test ends
struct TempFile {
    explicit TempFile(const std::string& name) : path(name) { std::remove(path.c_str()); }
    ~TempFile() { std::remove(path.c_str()); }

    void write(const std::string& text) const {
        std::ofstream out(path);
        out << text;
    }

    std::string path;
};

} // namespace

TEST_CASE("defaults") {
    AudioConfig c = AudioConfig::Defaults();
    REQUIRE(48000 == c.sampleRate);
    REQUIRE(240.0 == c.producerHz);
    REQUIRE(200 == c.bufferMs);
    REQUIRE(60 == c.targetFillMs);
    REQUIRE(3 == c.startRetries);
    REQUIRE(12000.0 == c.filterCutoffHz);
    REQUIRE(1.0f == c.volume);
    REQUIRE(9600 == c.bufferSamples(48000));
    REQUIRE(2880 == c.targetSamples(48000));
}

SCENARIO("a missing file") {
    GIVEN("a path that does not exist") {
        TempFile f("famiaudio_missing.cfg");
        AudioConfig c = AudioConfig::Defaults();
        c.sampleRate = 22050;
        THEN("load fails and leaves the config alone") {
            REQUIRE_FALSE(LoadAudioConfig(c, f.path));
            REQUIRE(22050 == c.sampleRate);
        }
    }
}

SCENARIO("save then load") {
    GIVEN("a customised config") {
        TempFile f("famiaudio_roundtrip.cfg");
        AudioConfig out = AudioConfig::Defaults();
        out.sampleRate = 44100;
        out.producerHz = 120.0;
        out.bufferMs = 500;
        out.targetFillMs = 100;
        out.startRetries = 5;
        out.filterCutoffHz = 9000.0;
        out.volume = 0.5f;
        WHEN("it is saved and loaded") {
            REQUIRE(SaveAudioConfig(out, f.path));
            AudioConfig in;
            REQUIRE(LoadAudioConfig(in, f.path));
            THEN("every field survives") {
                REQUIRE(44100 == in.sampleRate);
                REQUIRE(120.0 == in.producerHz);
                REQUIRE(500 == in.bufferMs);
                REQUIRE(100 == in.targetFillMs);
                REQUIRE(5 == in.startRetries);
                REQUIRE(9000.0 == in.filterCutoffHz);
                REQUIRE(0.5f == in.volume);
            }
        }
    }
}

SCENARIO("partial and malformed files") {
    GIVEN("a file with comments, unknown keys and a bad value") {
        TempFile f("famiaudio_partial.cfg");
        f.write("# audio settings\n"
                "\n"
                "sampleRate=44100\n"
                "colour=blue\n"
                "bufferMs=lots\n"
                "no equals sign here\n"
                "volume=0.25\n");
        WHEN("it is loaded") {
            AudioConfig c;
            REQUIRE(LoadAudioConfig(c, f.path));
            THEN("good lines apply and the rest fall back to defaults") {
                REQUIRE(44100 == c.sampleRate);
                REQUIRE(200 == c.bufferMs);
                REQUIRE(0.25f == c.volume);
                REQUIRE(240.0 == c.producerHz);
            }
        }
    }
}

SCENARIO("out of range values are clamped on load") {
    GIVEN("a file with extreme values") {
        TempFile f("famiaudio_clamp.cfg");
        f.write("sampleRate=100\n"
                "producerHz=100000\n"
                "bufferMs=5\n"
                "targetFillMs=900\n"
                "startRetries=99\n"
                "filterCutoffHz=-5\n"
                "volume=3\n");
        WHEN("it is loaded") {
            AudioConfig c;
            REQUIRE(LoadAudioConfig(c, f.path));
            THEN("each field is pulled into range") {
                REQUIRE(8000 == c.sampleRate);
                REQUIRE(1000.0 == c.producerHz);
                REQUIRE(20 == c.bufferMs);
                REQUIRE(10 == c.targetFillMs);
                REQUIRE(10 == c.startRetries);
                REQUIRE(12000.0 == c.filterCutoffHz);
                REQUIRE(1.0f == c.volume);
            }
        }
    }
}

TEST_CASE("clamping a valid config changes nothing") {
    AudioConfig c = AudioConfig::Defaults();
    ClampAudioConfig(c);
    AudioConfig d = AudioConfig::Defaults();
    REQUIRE(d.sampleRate == c.sampleRate);
    REQUIRE(d.producerHz == c.producerHz);
    REQUIRE(d.bufferMs == c.bufferMs);
    REQUIRE(d.targetFillMs == c.targetFillMs);
    REQUIRE(d.startRetries == c.startRetries);
    REQUIRE(d.filterCutoffHz == c.filterCutoffHz);
    REQUIRE(d.volume == c.volume);
}
