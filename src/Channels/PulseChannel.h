#ifndef PULSE_CHANNEL_H
#define PULSE_CHANNEL_H

#include <cstdint>
#include "Envelope.h"

// Square wave voice ($4000-$4003 / $4004-$4007).
class PulseChannel {
public:
    // Pulse 1 subtracts one extra in negate mode (ones' complement adder),
    // pulse 2 does not.
    explicit PulseChannel(bool onesComplementSweep);

    void reset();

    void writeControl(uint8_t data);   // $4000/$4004
    void writeSweep(uint8_t data);     // $4001/$4005
    void writeTimerLow(uint8_t data);  // $4002/$4006
    void writeTimerHigh(uint8_t data); // $4003/$4007
    void setEnabled(bool value);

    void tickLength();                 // half frame
    void tickEnvelope();               // quarter frame
    void tickSweep();                  // half frame

    // Advances the phase accumulator by one output sample and returns the
    // raw 0-15 level.
    double sample(double sampleRate);

    bool     enabled() const { return is_enabled; }
    uint8_t  lengthCounter() const { return length_counter; }
    uint16_t timer() const { return timer_period; }
    uint8_t  duty() const { return duty_index; }
    bool     sweepMuted() const { return sweep_mute; }
    double   phase() const { return phase_acc; }
    const Envelope& envelope() const { return env; }

private:
    void applySweep();

    bool onesComplement;

    bool     is_enabled = false;
    uint8_t  duty_index = 0;      // 0..3
    uint16_t timer_period = 0;    // 11-bit
    uint8_t  length_counter = 0;
    double   phase_acc = 0.0;     // 0..1

    Envelope env;

    // Sweep ($4001/$4005)
    bool    sweep_enabled = false;
    uint8_t sweep_period = 0;
    bool    sweep_negate = false;
    uint8_t sweep_shift = 0;
    uint8_t sweep_divider = 0;
    bool    sweep_reload = false;
    bool    sweep_mute = false;
};

#endif
