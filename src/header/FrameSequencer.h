// header/FrameSequencer.h
#pragma once
#include <cstdint>

// Shared frame counter ($4017). Counts CPU cycles and reports the
// quarter/half-frame events that clock envelopes, linear counter, length
// counters and sweeps.
class FrameSequencer {
public:
    enum Event : uint8_t {
        NONE    = 0,
        QUARTER = 1 << 0,   // envelopes + triangle linear counter
        HALF    = 1 << 1    // length counters + sweeps
    };

    // NTSC step points in CPU cycles
    static constexpr uint32_t STEP_1 = 3729;
    static constexpr uint32_t STEP_2 = 7457;
    static constexpr uint32_t STEP_3 = 11186;
    static constexpr uint32_t STEP_4 = 14915;
    static constexpr uint32_t STEP_5 = 18641;   // 5-step sequence end

    void reset() { *this = FrameSequencer(); }

    // Advances one CPU cycle. Returns the Event bits that fire on it.
    uint8_t clock();

    // $4017 write. Returns the events that fire immediately (quarter+half
    // when 5-step mode is selected).
    uint8_t writeControl(uint8_t data);

    bool     fiveStep() const { return five_step; }
    bool     irqInhibit() const { return irq_inhibit; }
    bool     irqPending() const { return frame_irq; }
    void     clearIrq() { frame_irq = false; }
    uint32_t cycle() const { return counter; }

private:
    uint32_t counter = 0;
    bool five_step = false;
    bool irq_inhibit = false;
    bool frame_irq = false;
};
