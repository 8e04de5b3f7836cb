// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

namespace parley
{

/// @brief Sample format used when recording to a file.
struct CaptureFormat
{
    std::uint32_t sampleRate = 16000;
    std::uint32_t channels = 1;
    std::uint32_t bitsPerSample = 16;
};

/// @brief Called from the capture thread when writing the recording fails.
using EncodeErrorHandler = std::function<void(Error)>;

/// @brief Records from a microphone into a WAV file.
class CaptureDevice
{
  public:
    virtual ~CaptureDevice() = default;

    /// @brief Starts recording into @p file, creating or truncating it.
    /// @param file Destination of the WAV file.
    /// @param format The sample format to write.
    /// @param onEncodeError Invoked (on an arbitrary thread) if the recording can no longer be written.
    [[nodiscard]] virtual auto start(const std::filesystem::path& file,
                                     const CaptureFormat& format,
                                     EncodeErrorHandler onEncodeError) -> VoidResult = 0;

    /// @brief Stops recording and finalizes the file. No-op if not recording.
    virtual void stop() = 0;

    [[nodiscard]] virtual auto isCapturing() const -> bool = 0;
};

/// @brief Completion notifications of one AudioPlayer. Invoked on an arbitrary thread.
struct PlayerEvents
{
    std::function<void()> onFinished;
    std::function<void(Error)> onDecodeError;
};

/// @brief Plays one loaded clip.
class AudioPlayer
{
  public:
    virtual ~AudioPlayer() = default;

    /// @brief Starts playback from the beginning of the clip.
    [[nodiscard]] virtual auto play() -> VoidResult = 0;

    /// @brief Suspends playback, keeping the current position.
    virtual void pause() = 0;

    /// @brief Continues playback from where pause() left off.
    [[nodiscard]] virtual auto resume() -> VoidResult = 0;

    /// @brief Stops playback for good. No events are delivered after stop() returns.
    virtual void stop() = 0;

    [[nodiscard]] virtual auto isPlaying() const -> bool = 0;
};

/// @brief Opens encoded clips (WAV, MP3, FLAC) for playback.
class PlaybackDevice
{
  public:
    virtual ~PlaybackDevice() = default;

    /// @brief Decodes the clip header and prepares a player for it.
    /// @return The player, or PlaybackDecodeError if the clip cannot be opened.
    [[nodiscard]] virtual auto load(std::vector<std::uint8_t> clip, PlayerEvents events)
        -> Result<std::unique_ptr<AudioPlayer>> = 0;
};

enum class PermissionStatus : std::uint8_t
{
    NotDetermined,
    Authorized,
    Denied,
    Restricted,
};

/// @brief Microphone access as granted by the platform.
class MicrophonePermission
{
  public:
    virtual ~MicrophonePermission() = default;

    [[nodiscard]] virtual auto status() const -> PermissionStatus = 0;

    /// @brief Asks the user for access. Blocks until answered.
    /// @return true if access was granted.
    [[nodiscard]] virtual auto request() -> bool = 0;
};

} // namespace parley
