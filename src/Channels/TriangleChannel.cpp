#include "TriangleChannel.h"
#include "header/ApuTables.h"

void TriangleChannel::writeControl(uint8_t data) {
    control_flag = (data & 0x80) != 0;
    linear_reload = data & 0x7F;
}

void TriangleChannel::writeTimerLow(uint8_t data) {
    timer_period = (uint16_t)((timer_period & 0xFF00) | data);
}

void TriangleChannel::writeTimerHigh(uint8_t data) {
    timer_period = (uint16_t)((timer_period & 0x00FF) | ((uint16_t)(data & 0x07) << 8));
    length_counter = ApuTables::lengthFor((data >> 3) & 0x1F);
    linear_reload_flag = true;
}

void TriangleChannel::setEnabled(bool value) {
    is_enabled = value;
    if (!is_enabled) length_counter = 0;
}

void TriangleChannel::tickLength() {
    if (!control_flag && length_counter > 0) {
        length_counter--;
    }
}

void TriangleChannel::tickLinear() {
    if (linear_reload_flag) {
        linear_counter = linear_reload;
    } else if (linear_counter > 0) {
        linear_counter--;
    }

    if (!control_flag) {
        linear_reload_flag = false;
    }
}

void TriangleChannel::tickTimer() {
    if (timer_counter == 0) {
        timer_counter = timer_period;
        if (length_counter > 0 && linear_counter > 0) {
            seq_step = (seq_step + 1) & 0x1F;
        }
    } else {
        timer_counter--;
    }
}

double TriangleChannel::sample() const {
    if (!is_enabled || length_counter == 0 || linear_counter == 0) return 0.0;
    return (double)ApuTables::triangleSteps[seq_step];
}
