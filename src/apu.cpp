// src/apu.cpp
#include "header/apu.h"
#include "header/MemoryReader.h"

apu::apu(MemoryReader* reader) : m_reader(reader) {}

void apu::reset() {
    std::lock_guard<std::mutex> guard(m_lock);

    for (auto& b : reg) b = 0x00;

    p1.reset();
    p2.reset();
    tri.reset();
    noise.reset();
    dmc.reset();
    frame.reset();

    m_filter.reset();
    m_converter.reset();

    cpu_cycle = 0;
}

void apu::connectMemory(MemoryReader* reader) {
    std::lock_guard<std::mutex> guard(m_lock);
    m_reader = reader;
}

uint8_t apu::debugReg(uint16_t addr) const {
    if (addr < 0x4000 || addr > 0x4017) return 0x00;
    std::lock_guard<std::mutex> guard(m_lock);
    return reg[addr - 0x4000];
}

uint8_t apu::debugStatus4015() const {
    std::lock_guard<std::mutex> guard(m_lock);
    return statusUnlocked();
}

uint64_t apu::totalCycles() const {
    std::lock_guard<std::mutex> guard(m_lock);
    return cpu_cycle;
}

void apu::setFilterCutoff(double hz) {
    std::lock_guard<std::mutex> guard(m_lock);
    m_filter.setCutoff(hz);
}

double apu::filterCutoff() const {
    std::lock_guard<std::mutex> guard(m_lock);
    return m_filter.cutoff();
}

uint8_t apu::statusUnlocked() const {
    uint8_t s = 0;
    if (p1.enabled() && p1.lengthCounter() > 0)       s |= (1 << 0);
    if (p2.enabled() && p2.lengthCounter() > 0)       s |= (1 << 1);
    if (tri.enabled() && tri.lengthCounter() > 0)     s |= (1 << 2);
    if (noise.enabled() && noise.lengthCounter() > 0) s |= (1 << 3);
    if (dmc.bytesRemaining() > 0)                     s |= (1 << 4);
    if (frame.irqPending())                           s |= (1 << 6);
    if (dmc.irqPending())                             s |= (1 << 7);
    return s;
}

uint8_t apu::cpuRead(uint16_t addr, bool readonly) {
    if (addr != 0x4015) return 0x00;

    std::lock_guard<std::mutex> guard(m_lock);
    uint8_t s = statusUnlocked();

    // Reading $4015 clears frame IRQ
    if (!readonly) frame.clearIrq();
    return s;
}

void apu::cpuWrite(uint16_t addr, uint8_t data) {
    if (addr < 0x4000 || addr > 0x4017) return;

    std::lock_guard<std::mutex> guard(m_lock);

    reg[addr - 0x4000] = data;

    switch (addr) {
    // -------- Pulse 1 ($4000-$4003) --------
    case 0x4000: p1.writeControl(data); break;
    case 0x4001: p1.writeSweep(data); break;
    case 0x4002: p1.writeTimerLow(data); break;
    case 0x4003: p1.writeTimerHigh(data); break;

    // -------- Pulse 2 ($4004-$4007) --------
    case 0x4004: p2.writeControl(data); break;
    case 0x4005: p2.writeSweep(data); break;
    case 0x4006: p2.writeTimerLow(data); break;
    case 0x4007: p2.writeTimerHigh(data); break;

    // -------- Triangle ($4008, $400A, $400B) --------
    case 0x4008: tri.writeControl(data); break;
    case 0x400A: tri.writeTimerLow(data); break;
    case 0x400B: tri.writeTimerHigh(data); break;

    // -------- Noise ($400C, $400E, $400F) --------
    case 0x400C: noise.writeControl(data); break;
    case 0x400E: noise.writePeriod(data); break;
    case 0x400F: noise.writeLength(data); break;

    // -------- DMC ($4010-$4013) --------
    case 0x4010: dmc.writeControl(data); break;
    case 0x4011: dmc.writeDirectLoad(data); break;
    case 0x4012: dmc.writeSampleAddress(data); break;
    case 0x4013: dmc.writeSampleLength(data); break;

    // -------- Channel enables ($4015) --------
    case 0x4015:
        p1.setEnabled((data & 0x01) != 0);
        p2.setEnabled((data & 0x02) != 0);
        tri.setEnabled((data & 0x04) != 0);
        noise.setEnabled((data & 0x08) != 0);
        dmc.setEnabled((data & 0x10) != 0);
        dmc.clearIrq();
        break;

    // -------- Frame counter ($4017) --------
    case 0x4017:
        fireFrameEvents(frame.writeControl(data));
        break;

    // $4009, $400D, $4014, $4016 are not ours
    default:
        break;
    }
}

void apu::quarterFrame() {
    p1.tickEnvelope();
    p2.tickEnvelope();
    noise.tickEnvelope();
    tri.tickLinear();
}

void apu::halfFrame() {
    p1.tickLength();
    p2.tickLength();
    tri.tickLength();
    noise.tickLength();
    p1.tickSweep();
    p2.tickSweep();
}

void apu::fireFrameEvents(uint8_t events) {
    if (events & FrameSequencer::QUARTER) quarterFrame();
    if (events & FrameSequencer::HALF) halfFrame();
}

void apu::step(uint32_t cycles) {
    std::lock_guard<std::mutex> guard(m_lock);
    stepUnlocked(cycles);
}

void apu::stepUnlocked(uint32_t cycles) {
    for (uint32_t i = 0; i < cycles; i++) {
        cpu_cycle++;

        fireFrameEvents(frame.clock());

        tri.tickTimer();
        noise.tickTimer();
        dmc.tickTimer();
        dmc.fetchSample(m_reader);
    }
}

float apu::sample(double sampleRate) {
    std::lock_guard<std::mutex> guard(m_lock);
    return sampleUnlocked(sampleRate);
}

float apu::sampleUnlocked(double sampleRate) {
    double p1o = p1.sample(sampleRate);
    double p2o = p2.sample(sampleRate);
    double to  = tri.sample();
    double no  = noise.sample();
    double dmo = dmc.sample();

    double mixed = Mixer::mix(p1o, p2o, to, no, dmo);
    return (float)m_filter.process(mixed, sampleRate);
}

void apu::fillBuffer(double sampleRate, float* out, size_t count) {
    if (!out || count == 0) return;
    if (!(sampleRate > 0.0)) return;

    std::lock_guard<std::mutex> guard(m_lock);

    for (size_t i = 0; i < count; i++) {
        int cycles = m_converter.cyclesForNextSample(sampleRate);
        if (cycles > 0) stepUnlocked((uint32_t)cycles);
        out[i] = sampleUnlocked(sampleRate);
    }
}
