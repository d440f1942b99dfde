// Test cases and behaviors for the noise channel.

#include "Channels/NoiseChannel.h"
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

namespace {

// Reference 15-bit LFSR step
uint16_t lfsrStep(uint16_t value, bool shortMode) {
    uint16_t tap = shortMode ? ((value >> 6) & 1) : ((value >> 1) & 1);
    uint16_t feedback = (value & 1) ^ tap;
    return (uint16_t)((value >> 1) | (feedback << 14));
}

// Runs the timer until the shift register moves once
void clockShift(NoiseChannel& noise) {
    uint16_t const before = noise.shiftRegister();
    for (int i = 0; i < 5000 && noise.shiftRegister() == before; i++) {
        noise.tickTimer();
    }
}

} // namespace

SCENARIO("power-on state") {
    GIVEN("a fresh noise channel") {
        NoiseChannel noise;
        THEN("the shift register is seeded with 1") {
            REQUIRE(1 == noise.shiftRegister());
            REQUIRE(4 == noise.timer());
            REQUIRE_FALSE(noise.shortMode());
            REQUIRE(0.0 == noise.sample());
        }
    }
}

SCENARIO("the shift register follows the long-mode taps") {
    GIVEN("a noise channel in long mode") {
        NoiseChannel noise;
        noise.writePeriod(0x00);
        WHEN("it shifts 1000 times") {
            uint16_t expected = 1;
            for (int i = 0; i < 1000; i++) {
                clockShift(noise);
                expected = lfsrStep(expected, false);
                REQUIRE(expected == noise.shiftRegister());
            }
            THEN("the register never leaves 15 bits") {
                REQUIRE(noise.shiftRegister() <= 0x7FFF);
            }
        }
    }
}

SCENARIO("the shift register follows the short-mode taps") {
    GIVEN("a noise channel in short mode") {
        NoiseChannel noise;
        noise.writePeriod(0x80);
        REQUIRE(noise.shortMode());
        WHEN("it shifts 1000 times") {
            uint16_t expected = 1;
            for (int i = 0; i < 1000; i++) {
                clockShift(noise);
                expected = lfsrStep(expected, true);
                REQUIRE(expected == noise.shiftRegister());
            }
        }
    }
}

SCENARIO("sequence lengths") {
    GIVEN("long mode") {
        NoiseChannel noise;
        noise.writePeriod(0x00);
        THEN("the register returns to 1 after 32767 shifts") {
            int shifts = 0;
            do {
                clockShift(noise);
                shifts++;
                REQUIRE(0 != noise.shiftRegister());
            } while (noise.shiftRegister() != 1 && shifts < 40000);
            REQUIRE(32767 == shifts);
        }
    }
    GIVEN("short mode") {
        NoiseChannel noise;
        noise.writePeriod(0x80);
        THEN("the register returns to 1 after 93 shifts") {
            int shifts = 0;
            do {
                clockShift(noise);
                shifts++;
            } while (noise.shiftRegister() != 1 && shifts < 40000);
            REQUIRE(93 == shifts);
        }
    }
}

SCENARIO("the timer period comes from the table") {
    GIVEN("a noise channel") {
        NoiseChannel noise;
        WHEN("period index 3 is written") {
            noise.writePeriod(0x03);
            THEN("the timer is 32 and shifts happen every 33 cycles") {
                REQUIRE(32 == noise.timer());
                noise.tickTimer();      // counter starts at 0
                uint16_t const first = noise.shiftRegister();
                for (int i = 0; i < 32; i++) noise.tickTimer();
                REQUIRE(first == noise.shiftRegister());
                noise.tickTimer();
                REQUIRE(lfsrStep(first, false) == noise.shiftRegister());
            }
        }
    }
}

SCENARIO("output is gated by bit 0 of the shift register") {
    GIVEN("an enabled noise channel with constant volume 7") {
        NoiseChannel noise;
        noise.setEnabled(true);
        noise.writeControl(0x37);
        noise.writeLength(0x08);
        THEN("it is silent while bit 0 is set") {
            REQUIRE(1 == (noise.shiftRegister() & 1));
            REQUIRE(0.0 == noise.sample());
        }
        WHEN("the register shifts to 0x4000") {
            clockShift(noise);
            REQUIRE(0x4000 == noise.shiftRegister());
            THEN("the envelope level is output") {
                REQUIRE(7.0 == noise.sample());
            }
        }
        WHEN("the channel is disabled") {
            clockShift(noise);
            noise.setEnabled(false);
            THEN("it is silent") {
                REQUIRE(0 == noise.lengthCounter());
                REQUIRE(0.0 == noise.sample());
            }
        }
    }
}

SCENARIO("length counter halt comes from the envelope loop flag") {
    GIVEN("a noise channel with length 254") {
        NoiseChannel noise;
        noise.setEnabled(true);
        WHEN("halt is set") {
            noise.writeControl(0x20);
            noise.writeLength(0x08);
            noise.tickLength();
            THEN("the counter holds") {
                REQUIRE(254 == noise.lengthCounter());
            }
        }
        WHEN("halt is clear") {
            noise.writeControl(0x00);
            noise.writeLength(0x08);
            noise.tickLength();
            THEN("the counter decrements") {
                REQUIRE(253 == noise.lengthCounter());
            }
        }
    }
}

SCENARIO("quarter frames clock the noise envelope") {
    GIVEN("a noise channel in looping decay mode with volume 0") {
        NoiseChannel noise;
        noise.writeControl(0x20);
        REQUIRE(noise.envelope().loop());
        WHEN("sixteen quarter frames run") {
            for (int i = 0; i < 16; i++) noise.tickEnvelope();
            THEN("the level has decayed to 0") {
                REQUIRE(0 == noise.envelope().decayLevel());
            }
            AND_WHEN("one more runs") {
                noise.tickEnvelope();
                THEN("it loops back to 15") {
                    REQUIRE(15 == noise.envelope().output());
                }
            }
        }
        WHEN("a $400F write restarts it mid-decay") {
            for (int i = 0; i < 8; i++) noise.tickEnvelope();
            REQUIRE(8 == noise.envelope().decayLevel());
            noise.writeLength(0x08);
            noise.tickEnvelope();
            THEN("the level is back at 15") {
                REQUIRE(15 == noise.envelope().decayLevel());
            }
        }
    }
}
