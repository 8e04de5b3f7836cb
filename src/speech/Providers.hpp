// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <speech/SpeechConfig.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace parley
{

/// @brief One audio file to be transcribed.
struct TranscriptionRequest
{
    std::vector<std::uint8_t> audio;
    std::string filename = "audio.wav";
    std::string mimeType = "audio/wav";
};

/// @brief One chunk of text to be synthesized.
struct SynthesisRequest
{
    std::string text;
};

/// @brief Remote speech-to-text capability.
///
/// Calls block until the provider answers. The stop token is only consulted before work starts; a call
/// already on the wire runs to completion.
class TranscriptionProvider
{
  public:
    virtual ~TranscriptionProvider() = default;

    /// @brief Transcribes the audio in its spoken language.
    [[nodiscard]] virtual auto transcribe(const TranscriptionRequest& request, std::stop_token stopToken)
        -> Result<std::string> = 0;

    /// @brief Transcribes the audio into English.
    [[nodiscard]] virtual auto translate(const TranscriptionRequest& request, std::stop_token stopToken)
        -> Result<std::string> = 0;
};

/// @brief Remote text-to-speech capability.
class SynthesisProvider
{
  public:
    virtual ~SynthesisProvider() = default;

    /// @brief Synthesizes one chunk into an encoded audio clip in the configured output format.
    [[nodiscard]] virtual auto synthesize(const SynthesisRequest& request, std::stop_token stopToken)
        -> Result<std::vector<std::uint8_t>> = 0;
};

/// @brief Turns a resolved configuration into a ready-to-use provider.
class SpeechProviderFactory
{
  public:
    virtual ~SpeechProviderFactory() = default;

    [[nodiscard]] virtual auto makeTranscriber(const TranscriptionConfig& config)
        -> std::unique_ptr<TranscriptionProvider> = 0;

    [[nodiscard]] virtual auto makeSynthesizer(const SynthesisConfig& config)
        -> std::unique_ptr<SynthesisProvider> = 0;
};

} // namespace parley
