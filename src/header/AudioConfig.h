//
// Audio settings, stored as key=value lines in audio.cfg
//

#ifndef AUDIOCONFIG_H
#define AUDIOCONFIG_H

#pragma once
#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

struct AudioConfig {
    uint32_t sampleRate;      // requested device rate, Hz
    double   producerHz;      // producer ticks per second
    uint32_t bufferMs;        // ring buffer capacity
    uint32_t targetFillMs;    // level the producer tops up to
    uint32_t startRetries;    // device rebuilds attempted when start fails
    double   filterCutoffHz;  // output low-pass cutoff
    float    volume;          // output gain, 0..1

    static AudioConfig Defaults() {
        AudioConfig c{};
        c.sampleRate     = 48000;
        c.producerHz     = 240.0;
        c.bufferMs       = 200;
        c.targetFillMs   = 60;
        c.startRetries   = 3;
        c.filterCutoffHz = 12000.0;
        c.volume         = 1.0f;
        return c;
    }

    // Samples held by a ring buffer of bufferMs at 'rate'
    size_t bufferSamples(uint32_t rate) const { return (size_t)rate * bufferMs / 1000; }
    size_t targetSamples(uint32_t rate) const { return (size_t)rate * targetFillMs / 1000; }
};

// Pulls every field back into its legal range
inline void ClampAudioConfig(AudioConfig& c) {
    if (c.sampleRate < 8000)   c.sampleRate = 8000;
    if (c.sampleRate > 192000) c.sampleRate = 192000;
    if (!(c.producerHz >= 30.0))  c.producerHz = 30.0;
    if (c.producerHz > 1000.0) c.producerHz = 1000.0;
    if (c.bufferMs < 20)   c.bufferMs = 20;
    if (c.bufferMs > 2000) c.bufferMs = 2000;
    if (c.targetFillMs == 0 || c.targetFillMs > c.bufferMs) c.targetFillMs = c.bufferMs / 2;
    if (c.startRetries > 10) c.startRetries = 10;
    if (!(c.filterCutoffHz > 0.0)) c.filterCutoffHz = 12000.0;
    if (!(c.volume >= 0.0f)) c.volume = 0.0f;
    if (c.volume > 1.0f) c.volume = 1.0f;
}

inline bool SaveAudioConfig(const AudioConfig& c, const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) return false;

    out << "sampleRate=" << c.sampleRate << "\n";
    out << "producerHz=" << c.producerHz << "\n";
    out << "bufferMs=" << c.bufferMs << "\n";
    out << "targetFillMs=" << c.targetFillMs << "\n";
    out << "startRetries=" << c.startRetries << "\n";
    out << "filterCutoffHz=" << c.filterCutoffHz << "\n";
    out << "volume=" << c.volume << "\n";
    return true;
}

inline bool LoadAudioConfig(AudioConfig& c, const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;

    // Start from defaults so missing lines still work
    c = AudioConfig::Defaults();

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        lineNo++;
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);

        try {
            if      (key == "sampleRate")     c.sampleRate = (uint32_t)std::stoul(val);
            else if (key == "producerHz")     c.producerHz = std::stod(val);
            else if (key == "bufferMs")       c.bufferMs = (uint32_t)std::stoul(val);
            else if (key == "targetFillMs")   c.targetFillMs = (uint32_t)std::stoul(val);
            else if (key == "startRetries")   c.startRetries = (uint32_t)std::stoul(val);
            else if (key == "filterCutoffHz") c.filterCutoffHz = std::stod(val);
            else if (key == "volume")         c.volume = std::stof(val);
            else std::cerr << "[config] " << path << ":" << lineNo << ": unknown key '" << key << "'\n";
        }
        catch (const std::logic_error&) {
            // invalid_argument / out_of_range from the sto* family
            std::cerr << "[config] " << path << ":" << lineNo << ": bad value for '" << key << "'\n";
        }
    }

    ClampAudioConfig(c);
    return true;
}

#endif //AUDIOCONFIG_H
