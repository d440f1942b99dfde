#include "PulseChannel.h"
#include "header/ApuTables.h"

#include <cmath>

PulseChannel::PulseChannel(bool onesComplementSweep)
    : onesComplement(onesComplementSweep) {}

void PulseChannel::reset() {
    *this = PulseChannel(onesComplement);
}

void PulseChannel::writeControl(uint8_t data) {
    duty_index = (data >> 6) & 0x03;
    env.writeControl(data);
    env.restart();
}

void PulseChannel::writeSweep(uint8_t data) {
    sweep_enabled = (data & 0x80) != 0;
    sweep_period = (data >> 4) & 0x07;
    sweep_negate = (data & 0x08) != 0;
    sweep_shift = data & 0x07;
    sweep_reload = true;
}

void PulseChannel::writeTimerLow(uint8_t data) {
    timer_period = (uint16_t)((timer_period & 0xFF00) | data);
}

void PulseChannel::writeTimerHigh(uint8_t data) {
    timer_period = (uint16_t)((timer_period & 0x00FF) | ((uint16_t)(data & 0x07) << 8));
    length_counter = ApuTables::lengthFor((data >> 3) & 0x1F);
    env.restart();
}

void PulseChannel::setEnabled(bool value) {
    is_enabled = value;
    if (!is_enabled) length_counter = 0;
}

void PulseChannel::tickLength() {
    // Envelope loop flag doubles as the length counter halt
    if (!env.loop() && length_counter > 0) {
        length_counter--;
    }
}

void PulseChannel::tickEnvelope() {
    env.tick();
}

void PulseChannel::applySweep() {
    if (!sweep_enabled || sweep_shift == 0) {
        sweep_mute = false;
        return;
    }

    int change = timer_period >> sweep_shift;
    int target;
    if (sweep_negate) {
        target = (int)timer_period - change - (onesComplement ? 1 : 0);
    } else {
        target = (int)timer_period + change;
    }

    sweep_mute = target < 0 || target > 0x7FF || timer_period < 8;
    if (!sweep_mute) {
        timer_period = (uint16_t)target;
    }
}

void PulseChannel::tickSweep() {
    if (sweep_reload) {
        sweep_reload = false;
        sweep_divider = sweep_period;
        if (sweep_enabled) applySweep();
        return;
    }

    if (sweep_divider == 0) {
        sweep_divider = sweep_period;
        if (sweep_enabled) applySweep();
    } else {
        sweep_divider--;
    }
}

double PulseChannel::sample(double sampleRate) {
    if (!is_enabled || length_counter == 0) return 0.0;

    // Silencing rules: timer < 8 is ultrasonic on real hardware
    if (timer_period < 8 || sweep_mute) return 0.0;
    if (!(sampleRate > 0.0)) return 0.0;

    double frequency = ApuTables::CPU_HZ / (16.0 * ((double)timer_period + 1.0));

    phase_acc += frequency / sampleRate;
    if (phase_acc >= 1.0) {
        phase_acc -= std::floor(phase_acc);
    }

    if (phase_acc < ApuTables::pulseDuty[duty_index]) {
        return (double)env.output();
    }
    return 0.0;
}
