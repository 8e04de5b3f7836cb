// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Devices.hpp>
#include <core/Error.hpp>

#include <memory>

namespace parley
{

/// @brief Plays encoded clips through the default playback device using miniaudio.
///
/// Each loaded clip gets its own ma_decoder reading from memory and its own playback device running at the
/// clip's native sample rate and channel count.
class AudioPlayback final: public PlaybackDevice
{
  public:
    AudioPlayback() = default;

    [[nodiscard]] auto load(std::vector<std::uint8_t> clip, PlayerEvents events)
        -> Result<std::unique_ptr<AudioPlayer>> override;
};

} // namespace parley
