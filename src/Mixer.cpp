// src/Mixer.cpp
#include "header/Mixer.h"

namespace Mixer {

double pulseOut(double pulse1, double pulse2) {
    // pulse_out = 95.88 / (8128/(p1+p2) + 100), 0 when both are silent
    double sum = pulse1 + pulse2;
    if (sum <= 0.0) return 0.0;
    return 95.88 / ((8128.0 / sum) + 100.0);
}

double tndOut(double triangle, double noise, double dmc) {
    double tnd = (triangle / 8227.0) + (noise / 12241.0) + (dmc / 22638.0);
    if (tnd <= 0.0) return 0.0;
    return 159.79 / ((1.0 / tnd) + 100.0);
}

} // namespace Mixer

namespace {
constexpr double PI = 3.141592653589793;
}

LowPassFilter::LowPassFilter(double cutoffHz) : m_cutoff(DEFAULT_CUTOFF_HZ) {
    setCutoff(cutoffHz);
}

void LowPassFilter::setCutoff(double hz) {
    if (hz > 0.0) m_cutoff = hz;
}

double LowPassFilter::process(double input, double sampleRate) {
    if (!(sampleRate > 0.0)) return m_state;

    double rc = 1.0 / (2.0 * PI * m_cutoff);
    double dt = 1.0 / sampleRate;
    double alpha = dt / (rc + dt);

    m_state += alpha * (input - m_state);
    return m_state;
}
