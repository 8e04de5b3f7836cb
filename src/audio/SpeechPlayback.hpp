// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Devices.hpp>
#include <core/Error.hpp>
#include <core/Executor.hpp>
#include <speech/Providers.hpp>
#include <speech/SpeechConfig.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace parley
{

enum class PlaybackPhase : std::uint8_t
{
    Idle,
    Generating, ///< Synthesis running, nothing queued yet.
    Playing,    ///< At least one clip queued or playing.
    Paused,     ///< Playback suspended, queue retained.
};

[[nodiscard]] constexpr auto phaseName(PlaybackPhase phase) -> std::string_view
{
    switch (phase)
    {
        case PlaybackPhase::Idle: return "idle";
        case PlaybackPhase::Generating: return "generating";
        case PlaybackPhase::Playing: return "playing";
        case PlaybackPhase::Paused: return "paused";
    }
    return "unknown";
}

/// @brief Observable playback state. messageId is empty when Idle.
struct PlaybackState
{
    PlaybackPhase phase = PlaybackPhase::Idle;
    std::string messageId;

    bool operator==(const PlaybackState&) const = default;
};

using PlaybackErrorHandler = std::function<void(const Error& error)>;
using PlaybackStateObserver = std::function<void(const PlaybackState& state)>;

/// @brief Speaks one message at a time: synthesizes it chunk by chunk and plays the clips in order.
///
/// All methods must be called from the executor's context, which is also where completions of the
/// background synthesis job and of the player are delivered. At most one session exists at a time; a
/// request for another message preempts the current one and anything the old session still produces is
/// discarded on arrival.
class SpeechPlayback
{
  public:
    SpeechPlayback(Executor& executor, PlaybackDevice& device, SpeechProviderFactory& providers);
    ~SpeechPlayback();

    SpeechPlayback(const SpeechPlayback&) = delete;
    SpeechPlayback& operator=(const SpeechPlayback&) = delete;

    /// @brief Speaks @p text as message @p messageId, or toggles the session if it already speaks that message.
    ///
    /// Toggling pauses a playing session, resumes a paused one and cancels one that is still generating.
    /// Any other session is torn down first. Blank text then leaves the coordinator idle. An output format
    /// the player cannot open fails the new session with ProviderError before any provider call.
    ///
    /// @param onError Invoked at most once, after teardown, if the session fails.
    [[nodiscard]] auto request(const std::string& messageId,
                               std::string_view text,
                               const SynthesisConfig& config,
                               PlaybackErrorHandler onError) -> VoidResult;

    /// @brief Tears down the current session, if any. Idempotent.
    void stop();

    /// @brief Tears down the current session only if it speaks @p messageId.
    void stop(std::string_view messageId);

    /// @brief Pauses a playing session. InvalidState unless @p messageId is playing.
    [[nodiscard]] auto pause(std::string_view messageId) -> VoidResult;

    /// @brief Resumes a paused session. InvalidState unless @p messageId is paused.
    [[nodiscard]] auto resume(std::string_view messageId) -> VoidResult;

    [[nodiscard]] auto state() const -> const PlaybackState&;
    [[nodiscard]] auto isActive(std::string_view messageId) const -> bool;
    [[nodiscard]] auto isGenerating(std::string_view messageId) const -> bool;
    [[nodiscard]] auto isPlaying(std::string_view messageId) const -> bool;
    [[nodiscard]] auto isPaused(std::string_view messageId) const -> bool;

    /// @brief Number of synthesized clips waiting behind the one currently playing.
    [[nodiscard]] auto queuedClipCount() const -> std::size_t;

    /// @brief Called on every state change.
    void setStateObserver(PlaybackStateObserver observer);

    struct Impl;

  private:
    std::shared_ptr<Impl> _impl;
};

} // namespace parley
