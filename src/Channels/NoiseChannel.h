#ifndef NOISE_CHANNEL_H
#define NOISE_CHANNEL_H

#include <cstdint>
#include "Envelope.h"
#include "header/ApuTables.h"

// Pseudo-random voice ($400C, $400E, $400F) built on a 15-bit LFSR.
class NoiseChannel {
public:
    void reset() { *this = NoiseChannel(); }

    void writeControl(uint8_t data);   // $400C
    void writePeriod(uint8_t data);    // $400E
    void writeLength(uint8_t data);    // $400F
    void setEnabled(bool value);

    void tickLength();                 // half frame
    void tickEnvelope();               // quarter frame
    void tickTimer();                  // every CPU cycle

    double sample() const;

    bool     enabled() const { return is_enabled; }
    uint8_t  lengthCounter() const { return length_counter; }
    uint16_t shiftRegister() const { return lfsr; }
    uint16_t timer() const { return timer_period; }
    bool     shortMode() const { return mode; }
    const Envelope& envelope() const { return env; }

private:
    bool is_enabled = false;

    Envelope env;

    // $400E
    bool     mode = false;          // 0=long (tap bit1), 1=short (tap bit6)
    uint16_t timer_period = ApuTables::noisePeriod[0];
    uint16_t timer_counter = 0;

    // Bit0 is the output: set means silent
    uint16_t lfsr = 1;

    uint8_t length_counter = 0;
};

#endif
