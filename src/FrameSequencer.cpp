// src/FrameSequencer.cpp
#include "header/FrameSequencer.h"

uint8_t FrameSequencer::clock() {
    counter++;

    switch (counter) {
    case STEP_1:
        return QUARTER;
    case STEP_2:
        return QUARTER | HALF;
    case STEP_3:
        return QUARTER;
    case STEP_4:
        if (!five_step) {
            // last tick of the 4-step sequence
            counter = 0;
            if (!irq_inhibit) frame_irq = true;
        }
        return QUARTER | HALF;
    case STEP_5:
        // 5-step: silent final step, no IRQ
        if (five_step) counter = 0;
        return NONE;
    default:
        return NONE;
    }
}

uint8_t FrameSequencer::writeControl(uint8_t data) {
    five_step = (data & 0x80) != 0;
    irq_inhibit = (data & 0x40) != 0;
    counter = 0;

    if (irq_inhibit) frame_irq = false;

    // Selecting 5-step mode clocks everything once, right away
    return five_step ? (QUARTER | HALF) : NONE;
}
