#include "DmcChannel.h"
#include "header/MemoryReader.h"

void DmcChannel::writeControl(uint8_t data) {
    irq_enable = (data & 0x80) != 0;
    loop = (data & 0x40) != 0;
    timer_period = ApuTables::dmcRateFor(data & 0x0F);

    if (!irq_enable) irq_flag = false;
}

void DmcChannel::writeDirectLoad(uint8_t data) {
    output_level = data & 0x7F;
}

void DmcChannel::writeSampleAddress(uint8_t data) {
    // base address = 0xC000 + (reg * 64)
    sample_addr = (uint16_t)(0xC000 | ((uint16_t)data << 6));
}

void DmcChannel::writeSampleLength(uint8_t data) {
    // length = (reg * 16) + 1 bytes
    sample_len = (uint16_t)((uint16_t)data * 16 + 1);
}

void DmcChannel::restart() {
    current_addr = sample_addr;
    bytes_remaining = sample_len;
}

void DmcChannel::setEnabled(bool value) {
    is_enabled = value;
    if (!is_enabled) {
        bytes_remaining = 0;
    } else if (bytes_remaining == 0) {
        restart();
    }
}

void DmcChannel::fetchSample(MemoryReader* reader) {
    if (!sample_buffer_empty || bytes_remaining == 0) return;

    sample_buffer = reader ? reader->readMemory(current_addr) : 0;
    sample_buffer_empty = false;

    // Address wraps from $FFFF to $8000
    current_addr = (current_addr == 0xFFFF) ? 0x8000 : (uint16_t)(current_addr + 1);

    bytes_remaining--;
    if (bytes_remaining == 0) {
        if (loop) {
            restart();
        } else if (irq_enable) {
            irq_flag = true;
        }
    }
}

void DmcChannel::tickTimer() {
    if (timer_counter != 0) {
        timer_counter--;
        return;
    }

    timer_counter = timer_period;

    if (bits_remaining == 0) {
        // No byte to play yet: hold the current level
        if (sample_buffer_empty) return;

        shift_reg = sample_buffer;
        sample_buffer_empty = true;
        bits_remaining = 8;
    }

    if (shift_reg & 0x01) {
        if (output_level <= 125) output_level += 2;
    } else {
        if (output_level >= 2) output_level -= 2;
    }

    shift_reg >>= 1;
    bits_remaining--;
}
