// SPDX-License-Identifier: Apache-2.0
#include "SpeechRecorder.hpp"

#include <core/BackgroundJobs.hpp>
#include <core/Log.hpp>
#include <core/TempFile.hpp>
#include <core/Text.hpp>

#include <condition_variable>
#include <format>
#include <mutex>
#include <utility>
#include <variant>

namespace parley
{

namespace
{

    constexpr auto TickInterval = std::chrono::milliseconds { 100 };

    struct PermissionAnswered
    {
        bool granted = false;
    };

    struct Tick
    {
    };

    struct EncodeFailed
    {
        Error error;
    };

    struct TranscriptionDone
    {
        Result<std::string> transcript;
    };

    using RecorderEvent = std::variant<PermissionAnswered, Tick, EncodeFailed, TranscriptionDone>;

    auto cancelled() -> Error
    {
        return Error { ErrorCode::Cancelled, "Recording session was cancelled" };
    }

} // namespace

struct SpeechRecorder::Impl: std::enable_shared_from_this<SpeechRecorder::Impl>
{
    Executor& executor;
    CaptureDevice& capture;
    MicrophonePermission& permission;
    SpeechProviderFactory& providers;

    RecordingState state;
    RecordingStateObserver stateObserver;
    ElapsedTimeObserver elapsedObserver;

    /// Identifies the current session; bumped on every teardown so older completions are dropped.
    std::uint64_t generation = 0;
    bool permissionPending = false;

    TempFile recording;
    RecordingStartHandler onStarted;
    RecordingInterruptionHandler onInterrupted;
    TranscriptHandler onTranscript;
    std::stop_source ticker { std::nostopstate };

    // Declared last so that job threads are joined before the members above go away.
    BackgroundJobs jobs;

    Impl(Executor& executor, CaptureDevice& capture, MicrophonePermission& permission, SpeechProviderFactory& providers):
        executor(executor), capture(capture), permission(permission), providers(providers)
    {
    }

    void setState(RecordingState next)
    {
        if (next == state)
            return;
        log::trace("Recorder: {} -> {}", phaseName(state.phase), phaseName(next.phase));
        state = std::move(next);
        if (stateObserver)
            stateObserver(state);
    }

    static void post(Executor& executor, std::weak_ptr<Impl> weak, std::uint64_t generation, RecorderEvent event)
    {
        executor.post([weak = std::move(weak), generation, event = std::move(event)]() mutable {
            if (auto self = weak.lock())
                self->deliver(generation, std::move(event));
        });
    }

    /// Single entry point for every asynchronous completion.
    void deliver(std::uint64_t token, RecorderEvent event)
    {
        if (token != generation)
        {
            log::trace("Recorder: discarding stale completion (generation {}, current {})", token, generation);
            return;
        }

        if (auto* answer = std::get_if<PermissionAnswered>(&event))
            onPermissionAnswered(answer->granted);
        else if (std::holds_alternative<Tick>(event))
            onTick();
        else if (auto* encode = std::get_if<EncodeFailed>(&event))
            onEncodeFailed(encode->error);
        else if (auto* done = std::get_if<TranscriptionDone>(&event))
            onTranscriptionDone(std::move(done->transcript));
    }

    void requestPermission()
    {
        permissionPending = true;
        log::debug("Recorder: requesting microphone access");
        jobs.spawn([&executor = executor, &permission = permission, weak = weak_from_this(), token = generation](
                       std::stop_token stopToken) {
            auto const granted = permission.request();
            if (!stopToken.stop_requested())
                post(executor, weak, token, PermissionAnswered { granted });
        });
    }

    void onPermissionAnswered(bool granted)
    {
        if (!permissionPending)
            return;
        permissionPending = false;

        auto handler = std::exchange(onStarted, nullptr);
        auto result = granted ? beginCapture() : permissionDenied();
        if (!result)
            onInterrupted = nullptr;
        if (handler)
            handler(std::move(result));
    }

    auto permissionDenied() -> VoidResult
    {
        return makeError(ErrorCode::PermissionDenied,
                         "Microphone access is denied. Enable it in the audio section of the configuration.");
    }

    auto beginCapture() -> VoidResult
    {
        recording = TempFile::reserve("parley_recording_", ".wav");

        auto weak = weak_from_this();
        auto* exec = &executor;
        auto const token = generation;
        auto started = capture.start(recording.path(), CaptureFormat {}, [exec, weak, token](Error error) {
            post(*exec, weak, token, EncodeFailed { std::move(error) });
        });
        if (!started)
        {
            recording.reset();
            setState(RecordingState {});
            return makeError(ErrorCode::RecordingFailed,
                             std::format("Failed to record audio: {}", started.error().message));
        }

        setState(RecordingState { .phase = RecordingPhase::Recording, .startedAt = std::chrono::steady_clock::now() });
        startTicker();
        log::debug("Recorder: recording to {}", recording.path().string());
        return {};
    }

    void startTicker()
    {
        ticker = jobs.spawn([&executor = executor, weak = weak_from_this(), token = generation](std::stop_token stopToken) {
            auto mutex = std::mutex {};
            auto wakeup = std::condition_variable_any {};
            auto lock = std::unique_lock(mutex);
            while (!wakeup.wait_for(lock, stopToken, TickInterval, [] { return false; }) && !stopToken.stop_requested())
                post(executor, weak, token, Tick {});
        });
    }

    void stopTicker()
    {
        ticker.request_stop();
        ticker = std::stop_source { std::nostopstate };
    }

    void onTick()
    {
        if (state.phase == RecordingPhase::Recording && elapsedObserver)
            elapsedObserver(elapsedSeconds());
    }

    [[nodiscard]] auto elapsedSeconds() const -> double
    {
        if (state.phase != RecordingPhase::Recording || !state.startedAt)
            return 0.0;
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - *state.startedAt).count();
    }

    void onEncodeFailed(const Error& error)
    {
        if (state.phase != RecordingPhase::Recording)
            return;

        auto handler = std::exchange(onInterrupted, nullptr);
        log::debug("Recorder: capture failed: {}", error);
        cancel();
        if (handler)
            handler(Error { ErrorCode::RecordingFailed, std::format("Failed to record audio: {}", error.message) });
    }

    void transcribe(const TranscriptionConfig& config, TranscriptHandler handler)
    {
        stopTicker();
        capture.stop();
        onInterrupted = nullptr;
        onTranscript = std::move(handler);
        setState(RecordingState { .phase = RecordingPhase::Transcribing });

        auto provider = std::shared_ptr<TranscriptionProvider>(providers.makeTranscriber(config));
        auto const translate = transcriptionSettings(config).translateToEnglish;

        log::debug("Recorder: transcribing via {}{}", backendName(backendOf(config)), translate ? " (translate)" : "");

        jobs.spawn([&executor = executor,
                    weak = weak_from_this(),
                    token = generation,
                    path = recording.path(),
                    provider = std::move(provider),
                    translate](std::stop_token stopToken) {
            auto audio = readFileBytes(path);
            if (!audio)
            {
                post(executor, weak, token, TranscriptionDone { std::unexpected(audio.error()) });
                return;
            }
            if (stopToken.stop_requested())
                return;

            auto request = TranscriptionRequest { .audio = std::move(*audio) };
            auto transcript =
                translate ? provider->translate(request, stopToken) : provider->transcribe(request, stopToken);
            if (!stopToken.stop_requested())
                post(executor, weak, token, TranscriptionDone { std::move(transcript) });
        });
    }

    void onTranscriptionDone(Result<std::string> transcript)
    {
        if (state.phase != RecordingPhase::Transcribing)
            return;

        auto handler = std::exchange(onTranscript, nullptr);
        recording.reset();
        ++generation;
        setState(RecordingState {});

        if (transcript)
            *transcript = std::string(text::trim(*transcript));
        if (handler)
            handler(std::move(transcript));
    }

    /// Tears everything down, then completes any pending operation with Cancelled if @p notify is set.
    void cancel(bool notify = true)
    {
        ++generation;
        jobs.cancelAll();
        stopTicker();
        capture.stop();
        recording.reset();

        auto startHandler = std::exchange(onStarted, nullptr);
        auto transcriptHandler = std::exchange(onTranscript, nullptr);
        permissionPending = false;
        onInterrupted = nullptr;
        setState(RecordingState {});

        if (!notify)
            return;
        if (startHandler)
            startHandler(std::unexpected(cancelled()));
        if (transcriptHandler)
            transcriptHandler(std::unexpected(cancelled()));
    }
};

SpeechRecorder::SpeechRecorder(Executor& executor,
                               CaptureDevice& capture,
                               MicrophonePermission& permission,
                               SpeechProviderFactory& providers):
    _impl(std::make_shared<Impl>(executor, capture, permission, providers))
{
}

SpeechRecorder::~SpeechRecorder()
{
    _impl->stateObserver = nullptr;
    _impl->elapsedObserver = nullptr;
    _impl->cancel(false);
}

void SpeechRecorder::startRecording(RecordingStartHandler onStarted, RecordingInterruptionHandler onInterrupted)
{
    if (_impl->state.phase != RecordingPhase::Idle || _impl->permissionPending)
    {
        if (onStarted)
            onStarted(makeError(ErrorCode::InvalidState,
                                std::format("Cannot start recording while {}",
                                            _impl->permissionPending ? "waiting for microphone access"
                                                                     : phaseName(_impl->state.phase))));
        return;
    }

    switch (_impl->permission.status())
    {
        case PermissionStatus::Authorized: break;
        case PermissionStatus::NotDetermined:
            _impl->onStarted = std::move(onStarted);
            _impl->onInterrupted = std::move(onInterrupted);
            _impl->requestPermission();
            return;
        case PermissionStatus::Denied:
        case PermissionStatus::Restricted:
            if (onStarted)
                onStarted(_impl->permissionDenied());
            return;
    }

    _impl->onInterrupted = std::move(onInterrupted);
    auto result = _impl->beginCapture();
    if (!result)
        _impl->onInterrupted = nullptr;
    if (onStarted)
        onStarted(std::move(result));
}

void SpeechRecorder::stopAndTranscribe(const TranscriptionConfig& config, TranscriptHandler onTranscript)
{
    if (_impl->state.phase != RecordingPhase::Recording)
    {
        if (onTranscript)
            onTranscript(makeError(ErrorCode::InvalidState,
                                   std::format("Cannot transcribe while {}", phaseName(_impl->state.phase))));
        return;
    }

    _impl->transcribe(config, std::move(onTranscript));
}

void SpeechRecorder::cancelAndCleanup()
{
    _impl->cancel();
}

auto SpeechRecorder::state() const -> const RecordingState&
{
    return _impl->state;
}

auto SpeechRecorder::isRecording() const -> bool
{
    return _impl->state.phase == RecordingPhase::Recording;
}

auto SpeechRecorder::isTranscribing() const -> bool
{
    return _impl->state.phase == RecordingPhase::Transcribing;
}

auto SpeechRecorder::elapsedSeconds() const -> double
{
    return _impl->elapsedSeconds();
}

auto SpeechRecorder::recordingFile() const -> std::optional<std::filesystem::path>
{
    if (_impl->recording.empty())
        return std::nullopt;
    return _impl->recording.path();
}

void SpeechRecorder::setStateObserver(RecordingStateObserver observer)
{
    _impl->stateObserver = std::move(observer);
}

void SpeechRecorder::setElapsedTimeObserver(ElapsedTimeObserver observer)
{
    _impl->elapsedObserver = std::move(observer);
}

} // namespace parley
