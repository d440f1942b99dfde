// header/Mixer.h
#pragma once

// Non-linear 2A03 output mixer. Inputs are raw channel levels:
// pulses 0..15, triangle 0..15, noise 0..15, DMC 0..127.
namespace Mixer {

    double pulseOut(double pulse1, double pulse2);
    double tndOut(double triangle, double noise, double dmc);

    inline double mix(double pulse1, double pulse2, double triangle, double noise, double dmc) {
        return pulseOut(pulse1, pulse2) + tndOut(triangle, noise, dmc);
    }

} // namespace Mixer

// One-pole low-pass approximating the console's output stage.
class LowPassFilter {
public:
    static constexpr double DEFAULT_CUTOFF_HZ = 12000.0;

    explicit LowPassFilter(double cutoffHz = DEFAULT_CUTOFF_HZ);

    // Filters one input sample at 'sampleRate'. State persists between calls.
    double process(double input, double sampleRate);

    void   reset() { m_state = 0.0; }
    void   setCutoff(double hz);
    double cutoff() const { return m_cutoff; }
    double state() const { return m_state; }

private:
    double m_cutoff;
    double m_state = 0.0;
};
