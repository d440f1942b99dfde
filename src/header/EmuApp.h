#pragma once
#include <cstdint>
#include <string>

#include "apu.h"
#include "Bus.h"
#include "AudioOut.h"
#include "AudioConfig.h"

// Headless player. The main thread plays the role of the CPU: once per video
// frame it writes APU registers through the bus, while the producer thread
// and the audio device run on their own schedules.
class EmuApp {
public:
    bool init(const std::string& configPath);
    int  run(double seconds);
    void shutdown();

private:
    void loadDemoSamples();
    void startDemo();
    void tickEmulation();
    void playRow(uint32_t row);
    void logStatus();

private:
    apu APU;
    bus BUS;
    AudioOut audio;

    AudioConfig cfg = AudioConfig::Defaults();
    std::string cfgPath = "audio.cfg";

    bool audioOk = false;

    // timing
    uint32_t frameCount = 0;
    const double targetFrameTime = 1.0 / 60.0;
};
