// SPDX-License-Identifier: Apache-2.0

#include "AudioCapture.hpp"

#include <core/Log.hpp>
#include <core/Text.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <format>
#include <optional>
#include <string>

namespace parley
{

struct AudioCapture::Impl
{
    ma_context context {};
    ma_device device {};
    ma_encoder encoder {};
    std::optional<ma_device_id> deviceId;
    EncodeErrorHandler onEncodeError;
    std::atomic<float> peakLevel { 0.0f };
    std::atomic<bool> encodeFailed { false };
    bool contextInitialized = false;
    bool capturing = false;

    void close()
    {
        ma_device_uninit(&device);
        ma_encoder_uninit(&encoder);
        capturing = false;
    }
};

namespace
{

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(device->pUserData);
        if (!impl || !input || impl->encodeFailed.load(std::memory_order_relaxed))
            return;

        // Peak amplitude for the level meter (lock-free)
        auto const* samples = static_cast<const ma_int16*>(input);
        auto const sampleCount = static_cast<std::size_t>(frameCount) * device->capture.channels;
        auto peak = 0;
        for (auto i = std::size_t { 0 }; i < sampleCount; ++i)
            peak = std::max(peak, std::abs(static_cast<int>(samples[i])));
        impl->peakLevel.store(static_cast<float>(peak) / 32768.0f, std::memory_order_relaxed);

        auto written = ma_uint64 { 0 };
        auto const result = ma_encoder_write_pcm_frames(&impl->encoder, input, frameCount, &written);
        if (result == MA_SUCCESS && written == frameCount)
            return;

        // Report once; the remaining callbacks of this stream are ignored.
        if (!impl->encodeFailed.exchange(true) && impl->onEncodeError)
            impl->onEncodeError(Error { ErrorCode::RecordingFailed,
                                        std::format("Failed to write recorded audio (code {})", static_cast<int>(result)) });
    }

} // namespace

AudioCapture::AudioCapture(): _impl(std::make_unique<Impl>())
{
}

AudioCapture::~AudioCapture()
{
    stop();
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto AudioCapture::initialize(std::string_view deviceName) -> VoidResult
{
    // Persistent context, must outlive every device opened from it
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    ma_device_info* pCaptureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult =
        ma_context_get_devices(&_impl->context, nullptr, nullptr, &pCaptureDevices, &captureCount);

    if (enumResult != MA_SUCCESS)
    {
        log::warning("Failed to enumerate capture devices (code: {}), using default",
                     static_cast<int>(enumResult));
        return {};
    }

    log::debug("Available capture devices:");
    for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
        log::debug("  [{}] {}", i, pCaptureDevices[i].name);

    if (!deviceName.empty())
    {
        auto const target = text::toLower(deviceName);
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
        {
            if (text::toLower(pCaptureDevices[i].name).find(target) != std::string::npos)
            {
                log::info("Matched capture device '{}' for filter '{}'", pCaptureDevices[i].name, deviceName);
                _impl->deviceId = pCaptureDevices[i].id;
                return {};
            }
        }
        log::warning("No capture device matching '{}' found, falling back to auto-select", deviceName);
    }

    // Monitors are loopback sources, not microphones
    for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
    {
        if (!text::toLower(pCaptureDevices[i].name).starts_with("monitor"))
        {
            log::info("Auto-selected capture device '{}'", pCaptureDevices[i].name);
            _impl->deviceId = pCaptureDevices[i].id;
            break;
        }
    }
    return {};
}

auto AudioCapture::start(const std::filesystem::path& file,
                         const CaptureFormat& format,
                         EncodeErrorHandler onEncodeError) -> VoidResult
{
    if (!_impl->contextInitialized)
        return makeError(ErrorCode::AudioError, "Audio capture not initialized");
    if (_impl->capturing)
        return makeError(ErrorCode::InvalidState, "Audio capture already running");
    if (format.bitsPerSample != 16)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Unsupported capture sample size: {} bits", format.bitsPerSample));

    auto const encoderConfig =
        ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, format.channels, format.sampleRate);
    auto const encoderResult = ma_encoder_init_file(file.string().c_str(), &encoderConfig, &_impl->encoder);
    if (encoderResult != MA_SUCCESS)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create recording file {}: {}",
                                     file.string(),
                                     static_cast<int>(encoderResult)));

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_s16;
    deviceConfig.capture.channels = format.channels;
    deviceConfig.sampleRate = format.sampleRate;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.pUserData = _impl.get();
    if (_impl->deviceId)
        deviceConfig.capture.pDeviceID = &*_impl->deviceId;

    _impl->onEncodeError = std::move(onEncodeError);
    _impl->encodeFailed.store(false);
    _impl->peakLevel.store(0.0f);

    auto const deviceResult = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (deviceResult != MA_SUCCESS)
    {
        ma_encoder_uninit(&_impl->encoder);
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio device: {}", static_cast<int>(deviceResult)));
    }

    auto const startResult = ma_device_start(&_impl->device);
    if (startResult != MA_SUCCESS)
    {
        _impl->close();
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to start audio capture: {}", static_cast<int>(startResult)));
    }

    _impl->capturing = true;
    log::debug("Audio capture started on '{}' ({}Hz, {} channel(s), s16) -> {}",
               _impl->device.capture.name,
               format.sampleRate,
               format.channels,
               file.string());
    return {};
}

void AudioCapture::stop()
{
    if (!_impl->capturing)
        return;

    ma_device_stop(&_impl->device);
    _impl->close();
    _impl->onEncodeError = nullptr;
    log::debug("Audio capture stopped");
}

auto AudioCapture::isCapturing() const -> bool
{
    return _impl->capturing;
}

auto AudioCapture::peakLevel() const -> float
{
    return _impl->peakLevel.load(std::memory_order_relaxed);
}

} // namespace parley
