// header/AudioOut.h
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>

#include "AudioConfig.h"

class apu;
struct ma_context;

// Playback sink. Owns the miniaudio device, the ring buffer it pulls from
// and the producer that fills it. The device callback never touches apu
// state directly.
class AudioOut {
public:
    ~AudioOut();

    // 'context' selects the backend (e.g. a null backend for headless runs).
    // It is not owned and must outlive the AudioOut; null uses the default.
    bool init(apu* a, const AudioConfig& cfg, ma_context* context = nullptr);
    void shutdown();

    // Starts producer + device. A device start failure rebuilds and retries
    // up to cfg.startRetries times; on final failure output stays silent.
    bool start();

    // Cancels the producer and pauses the device. APU state is untouched.
    void stop();

    // Tears down device, ring buffer and producer and recreates them at the
    // device's current rate. Restarts playback if it was running.
    bool rebuild();

    // Handles device notifications queued by the backend thread (reroute,
    // interruption). Call regularly from the application thread.
    void service();

    bool     isPlaying() const { return m_playing; }
    uint32_t sampleRate() const;
    uint64_t underruns() const { return m_underruns.load(std::memory_order_relaxed); }

    // Output pipeline state
    bool     deviceStarted() const;
    bool     producerRunning() const;
    size_t   bufferCapacity() const;
    size_t   bufferedSamples() const;
    uint32_t rebuilds() const { return m_rebuilds; }

    apu* m_apu = nullptr;
    AudioConfig m_cfg = AudioConfig::Defaults();

    // Opaque miniaudio types (defined in .cpp)
    struct Impl;
    Impl* impl = nullptr;

    // Set from the backend's notification thread, consumed by service()
    std::atomic<bool> m_rebuildRequested{false};
    std::atomic<bool> m_interrupted{false};
    std::atomic<bool> m_resumeRequested{false};

    std::atomic<uint64_t> m_underruns{0};

private:
    bool createDevice();
    void destroyDevice();
    bool startDevice();
    void pauseOutput();
    bool resumeOutput();

    bool m_playing = false;
    uint32_t m_rebuilds = 0;
};
