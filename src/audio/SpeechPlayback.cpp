// SPDX-License-Identifier: Apache-2.0
#include "SpeechPlayback.hpp"

#include <audio/WavContainer.hpp>
#include <core/BackgroundJobs.hpp>
#include <core/Log.hpp>
#include <core/Text.hpp>
#include <speech/ChunkPacker.hpp>

#include <deque>
#include <format>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace parley
{

namespace
{

    /// Identifies one session. The generation tells apart two sessions speaking the same message.
    struct SessionToken
    {
        std::string messageId;
        std::uint64_t generation = 0;

        bool operator==(const SessionToken&) const = default;
    };

    struct ClipSynthesized
    {
        std::vector<std::uint8_t> clip;
    };

    struct SynthesisCompleted
    {
    };

    struct SynthesisFailed
    {
        Error error;
    };

    struct ClipFinished
    {
        std::uint64_t serial = 0;
    };

    struct ClipDecodeFailed
    {
        std::uint64_t serial = 0;
        Error error;
    };

    using PlaybackEvent =
        std::variant<ClipSynthesized, SynthesisCompleted, SynthesisFailed, ClipFinished, ClipDecodeFailed>;

} // namespace

struct SpeechPlayback::Impl: std::enable_shared_from_this<SpeechPlayback::Impl>
{
    Executor& executor;
    PlaybackDevice& device;
    SpeechProviderFactory& providers;

    PlaybackState state;
    PlaybackStateObserver observer;

    std::optional<SessionToken> session;
    std::uint64_t nextGeneration = 1;
    PlaybackErrorHandler onError;
    std::stop_source synthesisJob;
    bool synthesisFinished = false;

    std::deque<std::vector<std::uint8_t>> queue;
    std::unique_ptr<AudioPlayer> player;
    std::uint64_t playerSerial = 0;

    // Declared last so that job threads are joined before the members above go away.
    BackgroundJobs jobs;

    Impl(Executor& executor, PlaybackDevice& device, SpeechProviderFactory& providers):
        executor(executor), device(device), providers(providers)
    {
    }

    void setState(PlaybackPhase phase, std::string messageId)
    {
        auto next = PlaybackState { .phase = phase, .messageId = std::move(messageId) };
        if (next == state)
            return;
        log::trace("Playback: {} -> {} ({})", phaseName(state.phase), phaseName(next.phase), next.messageId);
        state = std::move(next);
        if (observer)
            observer(state);
    }

    /// Posts an event for @p token back into the executor. Safe to call from any thread.
    static void post(Executor& executor, std::weak_ptr<Impl> weak, SessionToken token, PlaybackEvent event)
    {
        executor.post([weak = std::move(weak), token = std::move(token), event = std::move(event)]() mutable {
            if (auto self = weak.lock())
                self->deliver(token, std::move(event));
        });
    }

    /// Single entry point for every asynchronous completion.
    void deliver(const SessionToken& token, PlaybackEvent event)
    {
        if (!session || *session != token)
        {
            log::trace("Playback: discarding stale completion for '{}' (generation {})",
                       token.messageId,
                       token.generation);
            return;
        }

        if (auto* clip = std::get_if<ClipSynthesized>(&event))
            onClipSynthesized(std::move(clip->clip));
        else if (std::holds_alternative<SynthesisCompleted>(event))
            onSynthesisCompleted();
        else if (auto* failed = std::get_if<SynthesisFailed>(&event))
            fail(failed->error);
        else if (auto* finished = std::get_if<ClipFinished>(&event))
            onClipFinished(finished->serial);
        else if (auto* decodeFailed = std::get_if<ClipDecodeFailed>(&event))
        {
            if (decodeFailed->serial == playerSerial)
                fail(decodeFailed->error);
        }
    }

    void start(const std::string& messageId, std::string_view text, const SynthesisConfig& config, PlaybackErrorHandler handler)
    {
        auto const token = SessionToken { .messageId = messageId, .generation = nextGeneration++ };
        session = token;
        onError = std::move(handler);
        synthesisFinished = false;
        queue.clear();

        auto chunks = packChunks(text, chunkLimit(config));
        auto const pcmSampleRate = headerlessPcmSampleRate(config);
        auto provider = std::shared_ptr<SynthesisProvider>(providers.makeSynthesizer(config));

        log::debug("Playback: speaking '{}' in {} chunk(s) via {}",
                   messageId,
                   chunks.size(),
                   backendName(backendOf(config)));

        setState(PlaybackPhase::Generating, messageId);

        synthesisJob = jobs.spawn([&executor = executor,
                                   weak = weak_from_this(),
                                   token,
                                   chunks = std::move(chunks),
                                   pcmSampleRate,
                                   provider = std::move(provider)](std::stop_token stopToken) {
            // Chunk n+1 is only requested once chunk n has returned.
            for (auto const& chunk: chunks)
            {
                if (stopToken.stop_requested())
                    return;

                auto audio = provider->synthesize(SynthesisRequest { .text = chunk }, stopToken);
                if (stopToken.stop_requested())
                    return;
                if (!audio)
                {
                    post(executor, weak, token, SynthesisFailed { audio.error() });
                    return;
                }

                if (pcmSampleRate)
                    *audio = wav::wrapPcm16LeMono(*audio, *pcmSampleRate);
                post(executor, weak, token, ClipSynthesized { std::move(*audio) });
            }
            post(executor, weak, token, SynthesisCompleted {});
        });
    }

    void onClipSynthesized(std::vector<std::uint8_t> clip)
    {
        queue.push_back(std::move(clip));
        if (state.phase == PlaybackPhase::Generating)
            setState(PlaybackPhase::Playing, state.messageId);
        if (state.phase == PlaybackPhase::Playing && !player)
            playNext();
    }

    void onSynthesisCompleted()
    {
        synthesisFinished = true;
        if (state.phase == PlaybackPhase::Generating
            || (state.phase == PlaybackPhase::Playing && !player && queue.empty()))
            teardown();
    }

    void onClipFinished(std::uint64_t serial)
    {
        if (serial != playerSerial || !player)
            return;

        player->stop();
        player.reset();
        if (state.phase == PlaybackPhase::Playing)
            playNext();
    }

    /// Starts the next queued clip, waits for synthesis, or ends the session when everything was played.
    void playNext()
    {
        if (queue.empty())
        {
            if (synthesisFinished)
            {
                log::debug("Playback: finished '{}'", state.messageId);
                teardown();
            }
            return;
        }

        auto clip = std::move(queue.front());
        queue.pop_front();

        auto const serial = ++playerSerial;
        auto weak = weak_from_this();
        auto* exec = &executor;
        auto const token = *session;
        auto events = PlayerEvents {
            .onFinished = [exec, weak, token, serial] { post(*exec, weak, token, ClipFinished { serial }); },
            .onDecodeError =
                [exec, weak, token, serial](Error error) {
                    post(*exec, weak, token, ClipDecodeFailed { serial, std::move(error) });
                },
        };

        auto loaded = device.load(std::move(clip), std::move(events));
        if (!loaded)
        {
            fail(loaded.error());
            return;
        }

        player = std::move(*loaded);
        if (auto played = player->play(); !played)
            fail(played.error());
    }

    void pausePlayback()
    {
        if (player)
            player->pause();
        setState(PlaybackPhase::Paused, state.messageId);
    }

    void resumePlayback()
    {
        setState(PlaybackPhase::Playing, state.messageId);
        if (player)
        {
            if (auto resumed = player->resume(); !resumed)
                fail(resumed.error());
            return;
        }
        playNext();
    }

    /// Ends the session: the handler is taken first, the session torn down, then the handler invoked.
    void fail(const Error& error)
    {
        auto handler = std::exchange(onError, nullptr);
        log::debug("Playback: session '{}' failed: {}", state.messageId, error);
        teardown();
        if (handler)
            handler(error);
    }

    void teardown()
    {
        synthesisJob.request_stop();
        synthesisJob = std::stop_source { std::nostopstate };
        if (player)
        {
            player->stop();
            player.reset();
        }
        queue.clear();
        onError = nullptr;
        session.reset();
        synthesisFinished = false;
        setState(PlaybackPhase::Idle, {});
    }
};

SpeechPlayback::SpeechPlayback(Executor& executor, PlaybackDevice& device, SpeechProviderFactory& providers):
    _impl(std::make_shared<Impl>(executor, device, providers))
{
}

SpeechPlayback::~SpeechPlayback()
{
    _impl->observer = nullptr;
    _impl->teardown();
}

auto SpeechPlayback::request(const std::string& messageId,
                             std::string_view text,
                             const SynthesisConfig& config,
                             PlaybackErrorHandler onError) -> VoidResult
{
    if (isActive(messageId))
    {
        switch (_impl->state.phase)
        {
            case PlaybackPhase::Playing: _impl->pausePlayback(); break;
            case PlaybackPhase::Paused: _impl->resumePlayback(); break;
            case PlaybackPhase::Generating: _impl->teardown(); break;
            case PlaybackPhase::Idle: break;
        }
        return {};
    }

    _impl->teardown();

    auto const trimmed = text::trim(text);
    if (trimmed.empty())
        return {};

    if (auto playable = validatePlayableFormat(config); !playable)
    {
        log::debug("Playback: '{}' not started: {}", messageId, playable.error().message);
        if (onError)
            onError(playable.error());
        return {};
    }

    _impl->start(messageId, trimmed, config, std::move(onError));
    return {};
}

void SpeechPlayback::stop()
{
    _impl->teardown();
}

void SpeechPlayback::stop(std::string_view messageId)
{
    if (isActive(messageId))
        _impl->teardown();
}

auto SpeechPlayback::pause(std::string_view messageId) -> VoidResult
{
    if (!isPlaying(messageId))
        return makeError(ErrorCode::InvalidState, std::format("'{}' is not playing", messageId));
    _impl->pausePlayback();
    return {};
}

auto SpeechPlayback::resume(std::string_view messageId) -> VoidResult
{
    if (!isPaused(messageId))
        return makeError(ErrorCode::InvalidState, std::format("'{}' is not paused", messageId));
    _impl->resumePlayback();
    return {};
}

auto SpeechPlayback::state() const -> const PlaybackState&
{
    return _impl->state;
}

auto SpeechPlayback::isActive(std::string_view messageId) const -> bool
{
    return _impl->state.phase != PlaybackPhase::Idle && _impl->state.messageId == messageId;
}

auto SpeechPlayback::isGenerating(std::string_view messageId) const -> bool
{
    return isActive(messageId) && _impl->state.phase == PlaybackPhase::Generating;
}

auto SpeechPlayback::isPlaying(std::string_view messageId) const -> bool
{
    return isActive(messageId) && _impl->state.phase == PlaybackPhase::Playing;
}

auto SpeechPlayback::isPaused(std::string_view messageId) const -> bool
{
    return isActive(messageId) && _impl->state.phase == PlaybackPhase::Paused;
}

auto SpeechPlayback::queuedClipCount() const -> std::size_t
{
    return _impl->queue.size();
}

void SpeechPlayback::setStateObserver(PlaybackStateObserver observer)
{
    _impl->observer = std::move(observer);
}

} // namespace parley
