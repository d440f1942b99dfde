#ifndef TRIANGLE_CHANNEL_H
#define TRIANGLE_CHANNEL_H

#include <cstdint>

// Triangle voice ($4008, $400A, $400B). Timer runs at CPU rate.
class TriangleChannel {
public:
    void reset() { *this = TriangleChannel(); }

    void writeControl(uint8_t data);   // $4008
    void writeTimerLow(uint8_t data);  // $400A
    void writeTimerHigh(uint8_t data); // $400B
    void setEnabled(bool value);

    void tickLength();                 // half frame
    void tickLinear();                 // quarter frame
    void tickTimer();                  // every CPU cycle

    double sample() const;

    bool     enabled() const { return is_enabled; }
    uint8_t  lengthCounter() const { return length_counter; }
    uint8_t  linearCounter() const { return linear_counter; }
    bool     linearReloadPending() const { return linear_reload_flag; }
    uint8_t  sequenceStep() const { return seq_step; }
    uint16_t timer() const { return timer_period; }

private:
    bool is_enabled = false;

    // $4008
    bool    control_flag = false;   // also length counter halt
    uint8_t linear_reload = 0;      // 0..127

    uint8_t linear_counter = 0;
    bool    linear_reload_flag = false;

    uint16_t timer_period = 0;      // 11-bit
    uint16_t timer_counter = 0;

    uint8_t seq_step = 0;           // 0..31
    uint8_t length_counter = 0;
};

#endif
