// header/AudioRingBuffer.h
#pragma once
#include <cstddef>
#include <mutex>
#include <vector>

// Bounded FIFO of finished samples between the producer thread and the
// audio device callback. Neither side ever waits for the other: writes and
// reads move what fits and report how much that was.
class AudioRingBuffer {
public:
    explicit AudioRingBuffer(size_t capacity);

    // Copies up to 'len' samples in. Returns the number written; the rest
    // is dropped.
    size_t write(const float* samples, size_t len);

    // Moves up to 'len' samples out. Returns the number read; the caller
    // silences the remainder.
    size_t read(float* out, size_t len);

    void clear();

    size_t size() const;
    size_t capacity() const { return m_buf.size(); }

    // Fill level in the range 0.0-1.0
    double fillLevel() const;

private:
    mutable std::mutex m_lock;

    std::vector<float> m_buf;
    // Samples live from m_head up to (m_head + m_count) modulo capacity
    size_t m_head = 0;
    size_t m_tail = 0;
    size_t m_count = 0;
};
