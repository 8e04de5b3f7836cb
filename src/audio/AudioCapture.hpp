// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Devices.hpp>
#include <core/Error.hpp>

#include <memory>
#include <string_view>

namespace parley
{

/// @brief Records from the microphone into a WAV file using miniaudio.
///
/// initialize() selects the capture device once; every start() opens a fresh device stream and a
/// ma_encoder writing linear PCM at the requested format.
class AudioCapture final: public CaptureDevice
{
  public:
    AudioCapture();
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /// @brief Initializes the audio context and picks the capture device.
    /// @param deviceName Optional substring to match against capture device names (case-insensitive).
    ///                   If empty, the first non-monitor device is used.
    /// @return Success or an error.
    [[nodiscard]] auto initialize(std::string_view deviceName = {}) -> VoidResult;

    [[nodiscard]] auto start(const std::filesystem::path& file,
                             const CaptureFormat& format,
                             EncodeErrorHandler onEncodeError) -> VoidResult override;

    void stop() override;

    [[nodiscard]] auto isCapturing() const -> bool override;

    /// @brief Returns the current peak audio level (0.0 to 1.0).
    ///
    /// Updated atomically from the audio callback thread. Safe to call from any thread.
    [[nodiscard]] auto peakLevel() const -> float;

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace parley
