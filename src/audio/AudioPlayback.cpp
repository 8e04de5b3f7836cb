// SPDX-License-Identifier: Apache-2.0
#include "AudioPlayback.hpp"

#include <audio/ClipReader.hpp>
#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <format>

namespace parley
{

namespace
{

    /// State shared with the miniaudio callback. Lives at a stable address for the device's lifetime.
    struct ClipState
    {
        std::vector<std::uint8_t> clip;
        ma_decoder decoder {};
        ClipReader reader { decoder };
        ma_device device {};
        PlayerEvents events;
        std::atomic<bool> finished { false };
        std::atomic<bool> stopped { false };
        bool decoderInitialized = false;
        bool deviceInitialized = false;
        bool playing = false;

        ~ClipState()
        {
            if (deviceInitialized)
                ma_device_uninit(&device);
            if (decoderInitialized)
                ma_decoder_uninit(&decoder);
        }
    };

    void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* state = static_cast<ClipState*>(device->pUserData);
        auto* out = static_cast<float*>(output);
        auto const channels = device->playback.channels;

        if (state->finished.load(std::memory_order_relaxed))
        {
            std::fill_n(out, frameCount * channels, 0.0f);
            return;
        }

        auto const step = state->reader.read(out, frameCount, channels);
        if (step == ClipReader::Step::Playing)
            return;
        if (state->finished.exchange(true) || state->stopped.load())
            return;

        if (step == ClipReader::Step::Finished)
        {
            if (state->events.onFinished)
                state->events.onFinished();
        }
        else if (state->events.onDecodeError)
        {
            state->events.onDecodeError(Error { ErrorCode::PlaybackDecodeError,
                                                std::format("Failed to decode audio clip (code {})",
                                                            static_cast<int>(state->reader.lastResult())) });
        }
    }

    class ClipPlayer final: public AudioPlayer
    {
      public:
        explicit ClipPlayer(std::unique_ptr<ClipState> state): _state(std::move(state)) {}

        ~ClipPlayer() override { stop(); }

        auto play() -> VoidResult override
        {
            if (_state->stopped)
                return makeError(ErrorCode::InvalidState, "Player already stopped");

            if (!_state->reader.rewind())
                return makeError(ErrorCode::PlaybackDecodeError, "Failed to rewind audio clip");
            _state->finished = false;
            return start();
        }

        void pause() override
        {
            if (!_state->playing)
                return;
            ma_device_stop(&_state->device);
            _state->playing = false;
        }

        auto resume() -> VoidResult override
        {
            if (_state->stopped)
                return makeError(ErrorCode::InvalidState, "Player already stopped");
            if (_state->playing)
                return {};
            return start();
        }

        void stop() override
        {
            if (_state->stopped.exchange(true))
                return;
            if (_state->playing)
                ma_device_stop(&_state->device);
            _state->playing = false;
        }

        auto isPlaying() const -> bool override { return _state->playing && !_state->finished; }

      private:
        auto start() -> VoidResult
        {
            auto const result = ma_device_start(&_state->device);
            if (result != MA_SUCCESS)
                return makeError(ErrorCode::AudioError,
                                 std::format("Failed to start playback: {}", static_cast<int>(result)));
            _state->playing = true;
            return {};
        }

        std::unique_ptr<ClipState> _state;
    };

} // namespace

auto AudioPlayback::load(std::vector<std::uint8_t> clip, PlayerEvents events) -> Result<std::unique_ptr<AudioPlayer>>
{
    auto state = std::make_unique<ClipState>();
    state->clip = std::move(clip);
    state->events = std::move(events);

    auto const decoderConfig = ma_decoder_config_init(ma_format_f32, 0, 0);
    auto const decoderResult =
        ma_decoder_init_memory(state->clip.data(), state->clip.size(), &decoderConfig, &state->decoder);
    if (decoderResult != MA_SUCCESS)
        return makeError(ErrorCode::PlaybackDecodeError,
                         std::format("Unsupported or corrupt audio clip ({} bytes, code {})",
                                     state->clip.size(),
                                     static_cast<int>(decoderResult)));
    state->decoderInitialized = true;

    auto config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = state->decoder.outputChannels;
    config.sampleRate = state->decoder.outputSampleRate;
    config.dataCallback = playbackDataCallback;
    config.pUserData = state.get();

    auto const deviceResult = ma_device_init(nullptr, &config, &state->device);
    if (deviceResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize playback device: {}", static_cast<int>(deviceResult)));
    state->deviceInitialized = true;

    log::debug("Loaded clip: {} bytes, {}Hz, {} channel(s)",
               state->clip.size(),
               state->decoder.outputSampleRate,
               state->decoder.outputChannels);
    return std::make_unique<ClipPlayer>(std::move(state));
}

} // namespace parley
