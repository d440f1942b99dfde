// Test cases and behaviors for CPU clock to sample rate conversion.

#include "header/RateConverter.h"
#include "header/apu.h"
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

SCENARIO("one second of samples steps one second of CPU cycles") {
    const double rates[3] = { 44100.0, 48000.0, 96000.0 };
    for (double rate : rates) {
        GIVEN("a converter at " + std::to_string((int)rate) + " Hz") {
            RateConverter conv;
            WHEN("a second of samples is produced") {
                int64_t total = 0;
                for (int i = 0; i < (int)rate; i++) total += conv.cyclesForNextSample(rate);
                THEN("the cycle count is within one of the CPU clock") {
                    REQUIRE(std::fabs((double)total - ApuTables::CPU_HZ) <= 1.0);
                }
            }
        }
    }
}

SCENARIO("no long-run drift") {
    GIVEN("a converter at 44.1kHz") {
        RateConverter conv;
        double const perSample = ApuTables::CPU_HZ / 44100.0;
        WHEN("10000 samples are produced") {
            int64_t total = 0;
            for (int i = 1; i <= 10000; i++) {
                int c = conv.cyclesForNextSample(44100.0);
                REQUIRE((c == 40 || c == 41));
                total += c;
                REQUIRE(std::fabs((double)total - perSample * i) < 1.0);
            }
            THEN("the remainder stays fractional") {
                REQUIRE(conv.remainder() >= 0.0);
                REQUIRE(conv.remainder() < 1.0);
            }
        }
    }
}

TEST_CASE("a non-positive rate yields no cycles") {
    RateConverter conv;
    REQUIRE(0 == conv.cyclesForNextSample(0.0));
    REQUIRE(0 == conv.cyclesForNextSample(-44100.0));
    REQUIRE(0.0 == conv.remainder());
}

SCENARIO("very slow sample rates") {
    GIVEN("a converter") {
        RateConverter conv;
        WHEN("a rate far below 1 Hz is requested") {
            int c1 = conv.cyclesForNextSample(1e-4);
            int c2 = conv.cyclesForNextSample(1e-12);
            THEN("each step is capped at one second of cycles") {
                REQUIRE(1789773 == c1);
                REQUIRE(1789773 == c2);
                REQUIRE(conv.remainder() >= 0.0);
                REQUIRE(conv.remainder() < 1.0);
            }
        }
    }
    GIVEN("an apu") {
        apu APU;
        WHEN("two samples are rendered at 0.0001 Hz") {
            float buf[2];
            APU.fillBuffer(1e-4, buf, 2);
            THEN("two seconds of cycles ran") {
                REQUIRE(2u * 1789773u == APU.totalCycles());
            }
        }
    }
}

SCENARIO("the apu steps the converted cycle count") {
    GIVEN("an apu") {
        apu APU;
        WHEN("one second is rendered in uneven batches") {
            std::vector<float> buf(1000);
            size_t left = 44100;
            size_t batch = 1;
            while (left > 0) {
                size_t n = std::min(left, std::min(batch, buf.size()));
                APU.fillBuffer(44100.0, buf.data(), n);
                left -= n;
                batch = batch * 3 + 7;
            }
            THEN("the apu ran one second of cycles") {
                REQUIRE(std::fabs((double)APU.totalCycles() - ApuTables::CPU_HZ) <= 1.0);
            }
        }
    }
}
