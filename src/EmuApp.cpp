#include "header/EmuApp.h"

#include <chrono>
#include <iostream>
#include <thread>

namespace {

// Frames per row of the demo pattern (~7.5 rows per second)
constexpr uint32_t FRAMES_PER_ROW = 8;

// DMC sample lives at $C000: $4012 = 0x00, $4013 = 0x04 -> 65 bytes
constexpr uint16_t DMC_SAMPLE_ADDR = 0xC000;
constexpr size_t   DMC_SAMPLE_LEN  = 65;

// Pulse/triangle timer value for a pitch in Hz
uint16_t pulsePeriod(double hz) {
    double t = ApuTables::CPU_HZ / (16.0 * hz) - 1.0;
    if (t < 8.0) t = 8.0;
    if (t > 2047.0) t = 2047.0;
    return (uint16_t)(t + 0.5);
}

uint16_t trianglePeriod(double hz) {
    // One octave lower than pulse for the same timer value
    double t = ApuTables::CPU_HZ / (32.0 * hz) - 1.0;
    if (t < 2.0) t = 2.0;
    if (t > 2047.0) t = 2047.0;
    return (uint16_t)(t + 0.5);
}

// 0 = rest
const double melody[16] = {
    659.26, 0.0, 587.33, 523.25, 587.33, 659.26, 659.26, 0.0,
    587.33, 587.33, 659.26, 783.99, 783.99, 0.0, 523.25, 0.0
};

const double bass[4] = { 130.81, 98.00, 110.00, 87.31 };

} // namespace

bool EmuApp::init(const std::string& configPath)
{
    cfgPath = configPath;

    // Config
    cfg = AudioConfig::Defaults();
    if (!LoadAudioConfig(cfg, cfgPath)) {
        std::cout << "[config] " << cfgPath << " not found, writing defaults\n";
        if (!SaveAudioConfig(cfg, cfgPath)) {
            std::cerr << "[config] could not write " << cfgPath << "\n";
        }
    }

    // Wire emulator
    BUS.connectAPU(&APU);
    APU.connectMemory(&BUS);
    APU.reset();
    APU.setFilterCutoff(cfg.filterCutoffHz);

    loadDemoSamples();

    audioOk = audio.init(&APU, cfg);
    if (!audioOk) {
        std::cerr << "[app] Failed to init audio, running silent\n";
    }

    return true;
}

void EmuApp::shutdown()
{
    audio.stop();
    audio.shutdown();
    BUS.connectAPU(nullptr);
}

void EmuApp::loadDemoSamples()
{
    // Kick drum: a fast rise followed by a long fall, as 1-bit deltas
    uint8_t kick[DMC_SAMPLE_LEN];
    for (size_t i = 0; i < DMC_SAMPLE_LEN; i++) {
        if (i < 4)       kick[i] = 0xFF;
        else if (i < 24) kick[i] = 0x00;
        else             kick[i] = 0x55;    // hold level
    }

    if (!BUS.loadPrg(DMC_SAMPLE_ADDR, kick, sizeof(kick))) {
        std::cerr << "[app] DMC sample does not fit in PRG space\n";
    }
}

void EmuApp::startDemo()
{
    // Frame counter: 4-step, IRQ inhibited
    BUS.write(0x4017, 0x40);

    // Pulse 1: 50% duty, decaying envelope, no sweep
    BUS.write(0x4000, 0x86);
    BUS.write(0x4001, 0x00);

    // Pulse 2: 25% duty, constant volume 4, slow upward sweep
    BUS.write(0x4004, 0x54);
    BUS.write(0x4005, 0xF9);

    // Triangle: linear counter halted at max
    BUS.write(0x4008, 0xFF);

    // Noise: short decay, loud
    BUS.write(0x400C, 0x03);

    // DMC: rate 15, no loop, sample at $C000, 65 bytes
    BUS.write(0x4010, 0x0F);
    BUS.write(0x4011, 0x40);
    BUS.write(0x4012, (uint8_t)((DMC_SAMPLE_ADDR - 0xC000) >> 6));
    BUS.write(0x4013, (uint8_t)((DMC_SAMPLE_LEN - 1) / 16));

    BUS.write(0x4015, 0x0F);
}

void EmuApp::playRow(uint32_t row)
{
    double note = melody[row % 16];
    if (note > 0.0) {
        uint16_t t = pulsePeriod(note);
        BUS.write(0x4002, (uint8_t)(t & 0xFF));
        BUS.write(0x4003, (uint8_t)(0x08 | ((t >> 8) & 0x07)));   // length 254
    }

    if (row % 8 == 0) {
        uint16_t t = pulsePeriod(note > 0.0 ? note * 0.5 : 261.63);
        BUS.write(0x4006, (uint8_t)(t & 0xFF));
        BUS.write(0x4007, (uint8_t)(0x08 | ((t >> 8) & 0x07)));
    }

    if (row % 4 == 0) {
        uint16_t t = trianglePeriod(bass[(row / 4) % 4]);
        BUS.write(0x400A, (uint8_t)(t & 0xFF));
        BUS.write(0x400B, (uint8_t)(0x08 | ((t >> 8) & 0x07)));
    }

    // Hi-hat on the off beats
    if (row % 2 == 1) {
        BUS.write(0x400E, 0x03);
        BUS.write(0x400F, 0x08);
    }

    // Kick on every fourth row: re-enabling the DMC restarts the sample
    if (row % 4 == 0) {
        BUS.write(0x4015, 0x1F);
    }
}

void EmuApp::logStatus()
{
    uint8_t status = APU.debugStatus4015();
    uint8_t reg4017 = APU.debugReg(0x4017);

    std::cout << "[app] frame " << frameCount
              << "  $4015=" << std::hex << (int)status
              << " $4017=" << (int)reg4017 << std::dec
              << "  underruns=" << audio.underruns() << "\n";
}

void EmuApp::tickEmulation()
{
    if (frameCount % FRAMES_PER_ROW == 0) {
        playRow(frameCount / FRAMES_PER_ROW);
    }

    if (frameCount % 60 == 0) logStatus();

    frameCount++;
}

int EmuApp::run(double seconds)
{
    using clock = std::chrono::steady_clock;

    startDemo();

    if (audioOk && !audio.start()) {
        std::cerr << "[app] audio did not start, running silent\n";
    }

    auto const frame = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(targetFrameTime));
    uint32_t const totalFrames = (uint32_t)(seconds / targetFrameTime);

    auto next = clock::now();
    while (frameCount < totalFrames) {
        tickEmulation();
        audio.service();

        next += frame;
        std::this_thread::sleep_until(next);
    }

    // Silence everything before the device stops
    BUS.write(0x4015, 0x00);

    return 0;
}
