#ifndef ENVELOPE_H
#define ENVELOPE_H

#include <cstdint>

// Volume envelope shared by the pulse and noise channels.
//
// Control byte layout ($4000/$4004/$400C):
//   bit 5   loop envelope / halt length counter
//   bit 4   constant volume
//   bit 0-3 volume, also the divider period
class Envelope {
public:
    void reset() { *this = Envelope(); }

    void writeControl(uint8_t data);
    void restart() { start = true; }

    // Quarter-frame clock
    void tick();

    // Current 4-bit level: constant volume or decay level
    uint8_t output() const { return constant_volume ? volume : decay; }

    bool loop() const { return loop_flag; }
    uint8_t decayLevel() const { return decay; }

private:
    uint8_t volume = 0;
    bool    constant_volume = false;
    bool    loop_flag = false;

    uint8_t divider = 0;
    uint8_t decay = 0;
    bool    start = false;
};

#endif
