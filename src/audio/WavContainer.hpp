// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace parley::wav
{

/// @brief Size of the canonical RIFF/WAVE header written by wrapPcm16LeMono().
inline constexpr auto HeaderSize = std::size_t { 44 };

/// @brief Wraps headerless 16-bit little-endian mono PCM in a canonical WAV container.
///
/// Total for every input: any sample rate and any payload length (including zero) is accepted, and the
/// header fields are computed arithmetically from the payload size. The payload is copied verbatim.
/// @param pcm The raw PCM payload.
/// @param sampleRate The payload's sample rate in Hz.
/// @return A 44-byte header followed by the payload.
[[nodiscard]] auto wrapPcm16LeMono(std::span<const std::uint8_t> pcm, std::uint32_t sampleRate)
    -> std::vector<std::uint8_t>;

} // namespace parley::wav
