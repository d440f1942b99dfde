#include "NoiseChannel.h"

void NoiseChannel::writeControl(uint8_t data) {
    env.writeControl(data);
    env.restart();
}

void NoiseChannel::writePeriod(uint8_t data) {
    mode = (data & 0x80) != 0;
    timer_period = ApuTables::noisePeriodFor(data & 0x0F);
}

void NoiseChannel::writeLength(uint8_t data) {
    length_counter = ApuTables::lengthFor((data >> 3) & 0x1F);
    env.restart();
}

void NoiseChannel::setEnabled(bool value) {
    is_enabled = value;
    if (!is_enabled) length_counter = 0;
}

void NoiseChannel::tickLength() {
    if (!env.loop() && length_counter > 0) {
        length_counter--;
    }
}

void NoiseChannel::tickEnvelope() {
    env.tick();
}

void NoiseChannel::tickTimer() {
    if (timer_counter == 0) {
        timer_counter = timer_period;

        uint16_t tap = mode ? ((lfsr >> 6) & 0x01) : ((lfsr >> 1) & 0x01);
        uint16_t feedback = (lfsr & 0x01) ^ tap;
        lfsr = (uint16_t)((lfsr >> 1) | (feedback << 14));
    } else {
        timer_counter--;
    }
}

double NoiseChannel::sample() const {
    if (!is_enabled || length_counter == 0) return 0.0;
    if (lfsr & 0x0001) return 0.0;
    return (double)env.output();
}
