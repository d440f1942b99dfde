// header/apu.h
#pragma once
#include <cstdint>
#include <cstddef>
#include <mutex>

#include "Channels/PulseChannel.h"
#include "Channels/TriangleChannel.h"
#include "Channels/NoiseChannel.h"
#include "Channels/DmcChannel.h"
#include "FrameSequencer.h"
#include "Mixer.h"
#include "RateConverter.h"

class MemoryReader;

// The 2A03 audio processing unit. Owns every channel, the frame sequencer,
// the output filter and the rate converter. All entry points lock one mutex,
// so the CPU thread may write registers while the producer thread samples.
class apu {
public:
    explicit apu(MemoryReader* reader = nullptr);

    // Reinitialises all audio state. The memory reader and filter cutoff
    // are kept.
    void reset();

    // DMC sample source. Non-owning; must outlive the apu or be replaced.
    void connectMemory(MemoryReader* reader);

    // CPU memory-mapped interface ($4000-$4017)
    uint8_t cpuRead(uint16_t addr, bool readonly = false);
    void    cpuWrite(uint16_t addr, uint8_t data);

    // Advance the APU by 'cycles' CPU cycles
    void step(uint32_t cycles);

    // One mixed and filtered output sample at 'sampleRate' (no cycle stepping)
    float sample(double sampleRate);

    // Fills 'out' with 'count' samples, stepping the right number of CPU
    // cycles before each one
    void fillBuffer(double sampleRate, float* out, size_t count);

    void   setFilterCutoff(double hz);
    double filterCutoff() const;

    // Debug helpers
    uint8_t  debugReg(uint16_t addr) const;
    uint8_t  debugStatus4015() const;
    uint64_t totalCycles() const;

private:
    void     stepUnlocked(uint32_t cycles);
    float    sampleUnlocked(double sampleRate);
    uint8_t  statusUnlocked() const;

    void fireFrameEvents(uint8_t events);
    void quarterFrame(); // envelopes + linear counter
    void halfFrame();    // length counters + sweeps

    mutable std::mutex m_lock;

    MemoryReader* m_reader = nullptr;

    // Raw register mirror ($4000-$4017)
    uint8_t reg[0x18] = {};

    PulseChannel    p1{true};
    PulseChannel    p2{false};
    TriangleChannel tri;
    NoiseChannel    noise;
    DmcChannel      dmc;

    FrameSequencer  frame;
    LowPassFilter   m_filter;
    RateConverter   m_converter;

    // Internal cycle counter
    uint64_t cpu_cycle = 0;
};
