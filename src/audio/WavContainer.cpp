// SPDX-License-Identifier: Apache-2.0
#include "WavContainer.hpp"

#include <string_view>

namespace parley::wav
{

namespace
{

    void appendTag(std::vector<std::uint8_t>& out, std::string_view tag)
    {
        out.insert(out.end(), tag.begin(), tag.end());
    }

    void appendU16(std::vector<std::uint8_t>& out, std::uint16_t value)
    {
        out.push_back(static_cast<std::uint8_t>(value & 0xFF));
        out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    }

    void appendU32(std::vector<std::uint8_t>& out, std::uint32_t value)
    {
        for (auto shift = 0; shift < 32; shift += 8)
            out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }

} // namespace

auto wrapPcm16LeMono(std::span<const std::uint8_t> pcm, std::uint32_t sampleRate) -> std::vector<std::uint8_t>
{
    constexpr auto Channels = std::uint16_t { 1 };
    constexpr auto BitsPerSample = std::uint16_t { 16 };
    constexpr auto BlockAlign = static_cast<std::uint16_t>(Channels * (BitsPerSample / 8));

    auto const byteRate = sampleRate * BlockAlign;
    auto const dataSize = static_cast<std::uint32_t>(pcm.size());

    auto out = std::vector<std::uint8_t> {};
    out.reserve(HeaderSize + pcm.size());

    appendTag(out, "RIFF");
    appendU32(out, 36 + dataSize);
    appendTag(out, "WAVE");

    appendTag(out, "fmt ");
    appendU32(out, 16); // fmt chunk size for PCM
    appendU16(out, 1);  // PCM
    appendU16(out, Channels);
    appendU32(out, sampleRate);
    appendU32(out, byteRate);
    appendU16(out, BlockAlign);
    appendU16(out, BitsPerSample);

    appendTag(out, "data");
    appendU32(out, dataSize);

    out.insert(out.end(), pcm.begin(), pcm.end());
    return out;
}

} // namespace parley::wav
