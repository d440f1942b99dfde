// src/AudioRingBuffer.cpp
#include "header/AudioRingBuffer.h"

#include <algorithm>
#include <cstring>

AudioRingBuffer::AudioRingBuffer(size_t capacity)
    : m_buf(capacity > 0 ? capacity : 1, 0.0f) {}

size_t AudioRingBuffer::write(const float* samples, size_t len) {
    if (!samples || len == 0) return 0;

    std::lock_guard<std::mutex> guard(m_lock);

    size_t const cap = m_buf.size();
    size_t const n = std::min(len, cap - m_count);

    // Copy in at most two contiguous segments
    size_t const first = std::min(n, cap - m_tail);
    memcpy(m_buf.data() + m_tail, samples, sizeof(float) * first);
    if (n > first) {
        memcpy(m_buf.data(), samples + first, sizeof(float) * (n - first));
    }

    m_tail = (m_tail + n) % cap;
    m_count += n;
    return n;
}

size_t AudioRingBuffer::read(float* out, size_t len) {
    if (!out || len == 0) return 0;

    std::lock_guard<std::mutex> guard(m_lock);

    size_t const cap = m_buf.size();
    size_t const n = std::min(len, m_count);

    size_t const first = std::min(n, cap - m_head);
    memcpy(out, m_buf.data() + m_head, sizeof(float) * first);
    if (n > first) {
        memcpy(out + first, m_buf.data(), sizeof(float) * (n - first));
    }

    m_head = (m_head + n) % cap;
    m_count -= n;
    return n;
}

void AudioRingBuffer::clear() {
    std::lock_guard<std::mutex> guard(m_lock);
    m_head = 0;
    m_tail = 0;
    m_count = 0;
}

size_t AudioRingBuffer::size() const {
    std::lock_guard<std::mutex> guard(m_lock);
    return m_count;
}

double AudioRingBuffer::fillLevel() const {
    std::lock_guard<std::mutex> guard(m_lock);
    return (double)m_count / (double)m_buf.size();
}
