// header/SampleProducer.h
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

class apu;
class AudioRingBuffer;

// Periodic task that keeps the ring buffer topped up. Each tick asks the
// apu for enough samples to bring the buffer back to its target fill level.
// Runs on its own thread, independent of the device's pull cadence.
class SampleProducer {
public:
    static constexpr double DEFAULT_TICK_HZ = 240.0;

    // 'targetFill' of 0 means half the ring capacity.
    SampleProducer(apu& source, AudioRingBuffer& ring, double sampleRate,
                   double tickHz = DEFAULT_TICK_HZ, size_t targetFill = 0);
    ~SampleProducer();

    SampleProducer(const SampleProducer&) = delete;
    SampleProducer& operator=(const SampleProducer&) = delete;

    // Starts the periodic task. Returns false if it is already running.
    bool start();

    // Cancels the task and joins the thread. APU state is left untouched.
    void stop();

    bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    // One production pass, as run on every tick. Returns samples written.
    size_t produceOnce();

    double   sampleRate() const { return m_sampleRate; }
    size_t   targetFill() const { return m_targetFill; }
    uint64_t ticks() const { return m_ticks.load(std::memory_order_relaxed); }

private:
    void run();

    apu&             m_apu;
    AudioRingBuffer& m_ring;

    double                   m_sampleRate;
    std::chrono::nanoseconds m_period;
    size_t                   m_targetFill;

    std::vector<float> m_scratch;

    std::thread             m_thread;
    std::mutex              m_waitLock;
    std::condition_variable m_wake;
    bool                    m_stopRequested = false;
    std::atomic<bool>       m_running{false};
    std::atomic<uint64_t>   m_ticks{0};
};
