// header/RateConverter.h
#pragma once
#include "ApuTables.h"

// Converts the CPU clock to an output sample rate. Each output sample is
// preceded by a whole number of CPU cycles; the fractional part carries over,
// so the stepped total never drifts more than one cycle from the ideal.
class RateConverter {
public:
    // Slower rates are treated as 1 Hz, capping a single step at one
    // second of CPU cycles
    static constexpr double MIN_SAMPLE_RATE = 1.0;

    void reset() { m_remainder = 0.0; }

    // CPU cycles to run before producing the next sample at 'sampleRate'.
    int cyclesForNextSample(double sampleRate) {
        if (!(sampleRate > 0.0)) return 0;
        if (sampleRate < MIN_SAMPLE_RATE) sampleRate = MIN_SAMPLE_RATE;

        m_remainder += ApuTables::CPU_HZ / sampleRate;
        int cycles = (int)m_remainder;
        m_remainder -= (double)cycles;
        return cycles;
    }

    double remainder() const { return m_remainder; }

private:
    double m_remainder = 0.0;
};
