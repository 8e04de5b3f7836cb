// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <miniaudio.h>

#include <cstdint>

namespace parley
{

/// @brief Feeds a decoded clip to a playback device one period at a time.
///
/// The period that carries the clip's last frames does not end the clip, because those frames have yet to
/// reach the speaker. The clip ends on the following period, which is all silence.
class ClipReader
{
  public:
    enum class Step : std::uint8_t
    {
        Playing,
        Finished,
        Failed,
    };

    explicit ClipReader(ma_decoder& decoder): _decoder(decoder) {}

    /// @brief Fills @p frameCount interleaved float frames, padding with silence past the end of the clip.
    [[nodiscard]] auto read(float* output, ma_uint32 frameCount, ma_uint32 channels) -> Step;

    /// @brief Seeks back to the first frame.
    /// @return false if the decoder cannot seek.
    [[nodiscard]] auto rewind() -> bool;

    /// @brief The decoder result of the last read(); describes a Failed step.
    [[nodiscard]] auto lastResult() const noexcept -> ma_result { return _lastResult; }

  private:
    ma_decoder& _decoder;
    bool _drained = false;
    ma_result _lastResult = MA_SUCCESS;
};

} // namespace parley
