// src/SampleProducer.cpp
#include "header/SampleProducer.h"
#include "header/AudioRingBuffer.h"
#include "header/apu.h"

#include <algorithm>

SampleProducer::SampleProducer(apu& source, AudioRingBuffer& ring, double sampleRate,
                               double tickHz, size_t targetFill)
    : m_apu(source), m_ring(ring), m_sampleRate(sampleRate)
{
    if (!(tickHz > 0.0)) tickHz = DEFAULT_TICK_HZ;
    m_period = std::chrono::nanoseconds((int64_t)(1e9 / tickHz));

    size_t const cap = m_ring.capacity();
    m_targetFill = (targetFill == 0) ? cap / 2 : std::min(targetFill, cap);

    m_scratch.resize(m_targetFill);
}

SampleProducer::~SampleProducer() {
    stop();
}

bool SampleProducer::start() {
    if (m_running.load(std::memory_order_acquire)) return false;

    {
        std::lock_guard<std::mutex> guard(m_waitLock);
        m_stopRequested = false;
    }

    m_running.store(true, std::memory_order_release);
    m_thread = std::thread(&SampleProducer::run, this);
    return true;
}

void SampleProducer::stop() {
    {
        std::lock_guard<std::mutex> guard(m_waitLock);
        m_stopRequested = true;
    }
    m_wake.notify_all();

    if (m_thread.joinable()) m_thread.join();
    m_running.store(false, std::memory_order_release);
}

size_t SampleProducer::produceOnce() {
    size_t const have = m_ring.size();
    if (have >= m_targetFill) return 0;

    size_t const want = m_targetFill - have;

    // Generate outside the ring lock; the apu takes its own lock
    m_apu.fillBuffer(m_sampleRate, m_scratch.data(), want);
    return m_ring.write(m_scratch.data(), want);
}

void SampleProducer::run() {
    using clock = std::chrono::steady_clock;

    auto next = clock::now();

    std::unique_lock<std::mutex> lk(m_waitLock);
    while (!m_stopRequested) {
        lk.unlock();
        produceOnce();
        m_ticks.fetch_add(1, std::memory_order_relaxed);
        lk.lock();

        next += m_period;
        // Fell more than a tick behind (e.g. suspended): resync instead of
        // bursting to catch up
        auto now = clock::now();
        if (next + m_period < now) next = now;

        m_wake.wait_until(lk, next, [this] { return m_stopRequested; });
    }
}
