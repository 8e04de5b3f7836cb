// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Devices.hpp>
#include <core/Error.hpp>
#include <core/Executor.hpp>
#include <speech/Providers.hpp>
#include <speech/SpeechConfig.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace parley
{

enum class RecordingPhase : std::uint8_t
{
    Idle,
    Recording,
    Transcribing,
};

[[nodiscard]] constexpr auto phaseName(RecordingPhase phase) -> std::string_view
{
    switch (phase)
    {
        case RecordingPhase::Idle: return "idle";
        case RecordingPhase::Recording: return "recording";
        case RecordingPhase::Transcribing: return "transcribing";
    }
    return "unknown";
}

struct RecordingState
{
    RecordingPhase phase = RecordingPhase::Idle;
    std::optional<std::chrono::steady_clock::time_point> startedAt; ///< Set while Recording.

    bool operator==(const RecordingState&) const = default;
};

using RecordingStartHandler = std::function<void(VoidResult result)>;
using RecordingInterruptionHandler = std::function<void(const Error& error)>;
using TranscriptHandler = std::function<void(Result<std::string> transcript)>;
using RecordingStateObserver = std::function<void(const RecordingState& state)>;
using ElapsedTimeObserver = std::function<void(double seconds)>;

/// @brief Records one utterance into a temporary WAV file and has it transcribed.
///
/// All methods must be called from the executor's context; every handler is invoked there as well,
/// sometimes before the call that was given the handler returns. The temporary file is created when
/// recording starts and removed on every way out of the session.
class SpeechRecorder
{
  public:
    SpeechRecorder(Executor& executor,
                   CaptureDevice& capture,
                   MicrophonePermission& permission,
                   SpeechProviderFactory& providers);
    ~SpeechRecorder();

    SpeechRecorder(const SpeechRecorder&) = delete;
    SpeechRecorder& operator=(const SpeechRecorder&) = delete;

    /// @brief Starts recording at 16 kHz mono 16-bit PCM.
    ///
    /// Asks for microphone access first if it was never granted or denied.
    /// @param onStarted Completion: success once capturing, or InvalidState, PermissionDenied, RecordingFailed
    ///                  or Cancelled.
    /// @param onInterrupted Invoked with RecordingFailed if the recording breaks while running. The session
    ///                      has already been cleaned up by then.
    void startRecording(RecordingStartHandler onStarted, RecordingInterruptionHandler onInterrupted = {});

    /// @brief Stops recording and transcribes (or translates, as configured) what was recorded.
    /// @param onTranscript Receives the trimmed transcript, the provider's error, InvalidState if not
    ///                     recording, or Cancelled.
    void stopAndTranscribe(const TranscriptionConfig& config, TranscriptHandler onTranscript);

    /// @brief Abandons whatever is in progress and returns to Idle. Idempotent.
    void cancelAndCleanup();

    [[nodiscard]] auto state() const -> const RecordingState&;
    [[nodiscard]] auto isRecording() const -> bool;
    [[nodiscard]] auto isTranscribing() const -> bool;

    /// @brief Seconds since recording started, 0 unless Recording.
    [[nodiscard]] auto elapsedSeconds() const -> double;

    /// @brief Path of the temporary recording, if one exists.
    [[nodiscard]] auto recordingFile() const -> std::optional<std::filesystem::path>;

    void setStateObserver(RecordingStateObserver observer);

    /// @brief Called about ten times per second while recording.
    void setElapsedTimeObserver(ElapsedTimeObserver observer);

    struct Impl;

  private:
    std::shared_ptr<Impl> _impl;
};

} // namespace parley
