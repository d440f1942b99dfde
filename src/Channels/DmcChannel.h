#ifndef DMC_CHANNEL_H
#define DMC_CHANNEL_H

#include <cstdint>
#include "header/ApuTables.h"

class MemoryReader;

// Delta modulation channel ($4010-$4013). Streams 1-bit deltas from CPU
// memory, one byte at a time, into a 7-bit DAC.
class DmcChannel {
public:
    void reset() { *this = DmcChannel(); }

    void writeControl(uint8_t data);       // $4010
    void writeDirectLoad(uint8_t data);    // $4011
    void writeSampleAddress(uint8_t data); // $4012
    void writeSampleLength(uint8_t data);  // $4013
    void setEnabled(bool value);

    // Refills the sample buffer through 'reader' when it is empty and bytes
    // remain. A null reader feeds zero bytes.
    void fetchSample(MemoryReader* reader);

    // Output unit, every CPU cycle
    void tickTimer();

    double sample() const { return (double)output_level; }

    bool     enabled() const { return is_enabled; }
    uint8_t  outputLevel() const { return output_level; }
    uint16_t bytesRemaining() const { return bytes_remaining; }
    uint16_t currentAddress() const { return current_addr; }
    uint16_t sampleAddress() const { return sample_addr; }
    uint16_t sampleLength() const { return sample_len; }
    bool     sampleBufferEmpty() const { return sample_buffer_empty; }
    bool     looping() const { return loop; }
    bool     irqPending() const { return irq_flag; }
    void     clearIrq() { irq_flag = false; }

private:
    void restart();

    bool is_enabled = false;

    // $4010
    bool     irq_enable = false;
    bool     loop = false;
    uint16_t timer_period = ApuTables::dmcRate[0];
    uint16_t timer_counter = 0;

    // $4011 DAC
    uint8_t output_level = 0;       // 0..127

    // $4012/$4013 reload values
    uint16_t sample_addr = 0xC000;
    uint16_t sample_len = 1;

    // Memory reader
    uint16_t current_addr = 0xC000;
    uint16_t bytes_remaining = 0;
    uint8_t  sample_buffer = 0;
    bool     sample_buffer_empty = true;

    // Output unit
    uint8_t shift_reg = 0;
    uint8_t bits_remaining = 0;     // 0..8

    bool irq_flag = false;
};

#endif
