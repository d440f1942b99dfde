#include "Envelope.h"

void Envelope::writeControl(uint8_t data) {
    loop_flag = (data & 0x20) != 0;
    constant_volume = (data & 0x10) != 0;
    volume = data & 0x0F;
}

void Envelope::tick() {
    if (start) {
        start = false;
        decay = 15;
        divider = volume;
        return;
    }

    if (divider == 0) {
        divider = volume;

        if (decay > 0) {
            decay--;
        } else if (loop_flag) {
            decay = 15;
        }
    } else {
        divider--;
    }
}
