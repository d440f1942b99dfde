// src/AudioOut.cpp
#include "header/AudioOut.h"
#include "header/AudioRingBuffer.h"
#include "header/SampleProducer.h"
#include "header/apu.h"

#include <iostream>
#include <memory>

#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

struct AudioOut::Impl {
    ma_context* context = nullptr;
    ma_device device{};
    bool deviceReady = false;

    std::unique_ptr<AudioRingBuffer> ring;
    std::unique_ptr<SampleProducer> producer;
};

static void data_callback(ma_device* pDevice, void* pOutput, const void* pInput, ma_uint32 frameCount) {
    (void)pInput;

    AudioOut* self = (AudioOut*)pDevice->pUserData;
    float* out = (float*)pOutput;
    if (!out || frameCount == 0) return;

    ma_uint32 got = 0;
    if (self && self->impl && self->impl->ring) {
        got = (ma_uint32)self->impl->ring->read(out, frameCount);

        float const gain = self->m_cfg.volume;
        if (gain != 1.0f) {
            for (ma_uint32 i = 0; i < got; i++) out[i] *= gain;
        }

        if (got < frameCount) self->m_underruns.fetch_add(1, std::memory_order_relaxed);
    }

    // Underflow: remainder stays silent
    for (ma_uint32 i = got; i < frameCount; i++) out[i] = 0.0f;
}

// Runs on the backend's thread. Only flags work for service().
static void notification_callback(const ma_device_notification* pNotification) {
    AudioOut* self = (AudioOut*)pNotification->pDevice->pUserData;
    if (!self) return;

    switch (pNotification->type) {
    case ma_device_notification_type_rerouted:
        self->m_rebuildRequested.store(true, std::memory_order_release);
        break;
    case ma_device_notification_type_interruption_began:
        self->m_interrupted.store(true, std::memory_order_release);
        break;
    case ma_device_notification_type_interruption_ended:
        self->m_resumeRequested.store(true, std::memory_order_release);
        break;
    default:
        break;
    }
}

AudioOut::~AudioOut() {
    shutdown();
}

bool AudioOut::init(apu* a, const AudioConfig& cfg, ma_context* context) {
    if (impl) shutdown();

    m_apu = a;
    if (!m_apu) return false;

    m_cfg = cfg;
    ClampAudioConfig(m_cfg);

    impl = new Impl();
    impl->context = context;

    if (!createDevice()) {
        delete impl; impl = nullptr;
        return false;
    }

    return true;
}

void AudioOut::shutdown() {
    if (impl) {
        destroyDevice();
        delete impl;
        impl = nullptr;
    }
    m_playing = false;
    m_apu = nullptr;
}

uint32_t AudioOut::sampleRate() const {
    if (!impl || !impl->deviceReady) return 0;
    return impl->device.sampleRate;
}

bool AudioOut::deviceStarted() const {
    if (!impl || !impl->deviceReady) return false;
    return ma_device_is_started(&impl->device) != MA_FALSE;
}

bool AudioOut::producerRunning() const {
    return impl && impl->producer && impl->producer->isRunning();
}

size_t AudioOut::bufferCapacity() const {
    return (impl && impl->ring) ? impl->ring->capacity() : 0;
}

size_t AudioOut::bufferedSamples() const {
    return (impl && impl->ring) ? impl->ring->size() : 0;
}

bool AudioOut::createDevice() {
    ma_device_config config = ma_device_config_init(ma_device_type_playback);
    config.playback.format   = ma_format_f32;
    config.playback.channels = 1;
    config.sampleRate        = m_cfg.sampleRate;
    config.dataCallback      = data_callback;
    config.notificationCallback = notification_callback;
    config.pUserData         = this;

    ma_result result = ma_device_init(impl->context, &config, &impl->device);
    if (result != MA_SUCCESS) {
        std::cerr << "[audio] device init failed: " << ma_result_description(result) << "\n";
        return false;
    }
    impl->deviceReady = true;

    // The backend may not honour the requested rate; size everything for
    // the one we actually got
    uint32_t const rate = impl->device.sampleRate;

    impl->ring = std::make_unique<AudioRingBuffer>(m_cfg.bufferSamples(rate));
    impl->producer = std::make_unique<SampleProducer>(
        *m_apu, *impl->ring, (double)rate, m_cfg.producerHz, m_cfg.targetSamples(rate));

    std::cout << "[audio] device ready: " << rate << " Hz, buffer "
              << impl->ring->capacity() << " samples\n";
    return true;
}

void AudioOut::destroyDevice() {
    // Producer first: it writes into the ring
    if (impl->producer) impl->producer->stop();

    if (impl->deviceReady) {
        ma_device_uninit(&impl->device);
        impl->deviceReady = false;
    }

    impl->producer.reset();
    impl->ring.reset();
}

bool AudioOut::startDevice() {
    ma_result result = ma_device_start(&impl->device);
    if (result != MA_SUCCESS) {
        std::cerr << "[audio] device start failed: " << ma_result_description(result) << "\n";
        return false;
    }
    return true;
}

bool AudioOut::resumeOutput() {
    for (uint32_t attempt = 0; ; attempt++) {
        if (impl->deviceReady) {
            if (impl->producer->isRunning()) return true;

            // Prime the buffer so the first callback has something to play
            impl->producer->produceOnce();

            if (startDevice()) {
                impl->producer->start();
                return true;
            }
        }

        if (attempt >= m_cfg.startRetries) break;

        std::cerr << "[audio] rebuilding output (retry " << (attempt + 1)
                  << " of " << m_cfg.startRetries << ")\n";
        destroyDevice();
        createDevice();
    }

    std::cerr << "[audio] could not start output; continuing silent\n";
    return false;
}

void AudioOut::pauseOutput() {
    if (impl->producer) impl->producer->stop();

    if (impl->deviceReady && ma_device_is_started(&impl->device)) {
        ma_result result = ma_device_stop(&impl->device);
        if (result != MA_SUCCESS) {
            std::cerr << "[audio] device stop failed: " << ma_result_description(result) << "\n";
        }
    }
}

bool AudioOut::start() {
    if (!impl) return false;
    if (m_playing) return true;

    m_playing = true;
    return resumeOutput();
}

void AudioOut::stop() {
    if (!impl) return;

    m_playing = false;
    pauseOutput();

    uint64_t const n = m_underruns.exchange(0, std::memory_order_relaxed);
    if (n > 0) std::cout << "[audio] " << n << " buffer underruns since start\n";
}

bool AudioOut::rebuild() {
    if (!impl) return false;

    destroyDevice();
    m_rebuilds++;
    if (!createDevice()) {
        // resumeOutput() retries the device if playback is wanted
        if (m_playing) return resumeOutput();
        return false;
    }

    if (m_playing) return resumeOutput();
    return true;
}

void AudioOut::service() {
    if (!impl) return;

    if (m_rebuildRequested.exchange(false, std::memory_order_acq_rel)) {
        std::cout << "[audio] output route changed, rebuilding\n";
        rebuild();
    }

    if (m_interrupted.exchange(false, std::memory_order_acq_rel)) {
        std::cout << "[audio] interrupted, pausing output\n";
        pauseOutput();
    }

    if (m_resumeRequested.exchange(false, std::memory_order_acq_rel)) {
        if (m_playing) {
            std::cout << "[audio] interruption ended, resuming\n";
            resumeOutput();
        }
    }
}
