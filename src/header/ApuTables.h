// header/ApuTables.h
#pragma once
#include <cstdint>

// Constant tables shared by the APU channels (NTSC timing).
namespace ApuTables {

    // NTSC 2A03 CPU clock
    constexpr double CPU_HZ = 1789773.0;

    // Length counter lookup table (32 entries)
    constexpr uint8_t length[32] = {
        10,254, 20,  2, 40,  4, 80,  6,
        160, 8, 60, 10, 14, 12, 26, 14,
        12, 16, 24, 18, 48, 20, 96, 22,
        192,24, 72, 26, 16, 28, 32, 30
    };

    // Noise timer periods in CPU cycles, indexed by $400E low nibble
    constexpr uint16_t noisePeriod[16] = {
        4, 8, 16, 32, 64, 96, 128, 160,
        202, 254, 380, 508, 762, 1016, 2034, 4068
    };

    // DMC timer periods in CPU cycles, indexed by $4010 low nibble
    constexpr uint16_t dmcRate[16] = {
        428, 380, 340, 320, 286, 254, 226, 214,
        190, 160, 142, 128, 106, 85, 72, 54
    };

    // 32-step triangle waveform
    constexpr uint8_t triangleSteps[32] = {
        15, 14, 13, 12, 11, 10, 9, 8,
        7, 6, 5, 4, 3, 2, 1, 0,
        0, 1, 2, 3, 4, 5, 6, 7,
        8, 9, 10, 11, 12, 13, 14, 15
    };

    // Pulse duty cycle as a fraction of the period: 12.5%, 25%, 50%, 75%
    constexpr double pulseDuty[4] = { 0.125, 0.25, 0.5, 0.75 };

    inline uint8_t lengthFor(uint8_t idx) { return length[idx & 0x1F]; }
    inline uint16_t noisePeriodFor(uint8_t idx) { return noisePeriod[idx & 0x0F]; }
    inline uint16_t dmcRateFor(uint8_t idx) { return dmcRate[idx & 0x0F]; }

} // namespace ApuTables
