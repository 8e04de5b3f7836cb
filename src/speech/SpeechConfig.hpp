// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <speech/SettingsStore.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace parley
{

/// @brief Remote speech-to-text backends.
enum class TranscriptionBackend : std::uint8_t
{
    OpenAI,
    Groq,
};

/// @brief Remote text-to-speech backends.
enum class SynthesisBackend : std::uint8_t
{
    OpenAI,
    Groq,
    ElevenLabs,
};

[[nodiscard]] constexpr auto backendName(TranscriptionBackend backend) -> std::string_view
{
    switch (backend)
    {
        case TranscriptionBackend::OpenAI: return "openai";
        case TranscriptionBackend::Groq: return "groq";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto backendName(SynthesisBackend backend) -> std::string_view
{
    switch (backend)
    {
        case SynthesisBackend::OpenAI: return "openai";
        case SynthesisBackend::Groq: return "groq";
        case SynthesisBackend::ElevenLabs: return "elevenlabs";
    }
    return "unknown";
}

/// @brief Parameters shared by every OpenAI-compatible transcription backend.
struct TranscriptionSettings
{
    std::string apiKey;
    std::string baseUrl;
    std::string model;

    /// @brief Use the translation endpoint (always English output) instead of transcription.
    bool translateToEnglish = false;

    std::optional<std::string> language;
    std::optional<std::string> prompt;
    std::optional<std::string> responseFormat;
    std::optional<double> temperature;
    std::vector<std::string> timestampGranularities;
};

struct OpenAITranscriptionConfig: TranscriptionSettings
{
};

struct GroqTranscriptionConfig: TranscriptionSettings
{
};

/// @brief Resolved speech-to-text configuration, one alternative per backend.
using TranscriptionConfig = std::variant<OpenAITranscriptionConfig, GroqTranscriptionConfig>;

struct OpenAISynthesisConfig
{
    std::string apiKey;
    std::string baseUrl;
    std::string model;
    std::string voice;
    std::string responseFormat;
    std::optional<double> speed;
    std::optional<std::string> instructions;
};

struct GroqSynthesisConfig
{
    std::string apiKey;
    std::string baseUrl;
    std::string model;
    std::string voice;
    std::string responseFormat;
};

struct ElevenLabsVoiceSettings
{
    std::optional<double> stability;
    std::optional<double> similarityBoost;
    std::optional<double> style;
    std::optional<bool> useSpeakerBoost;

    [[nodiscard]] auto empty() const -> bool
    {
        return !stability && !similarityBoost && !style && !useSpeakerBoost;
    }
};

struct ElevenLabsSynthesisConfig
{
    std::string apiKey;
    std::string baseUrl;
    std::string voiceId;
    std::optional<std::string> modelId;
    std::optional<std::string> outputFormat;
    std::optional<int> optimizeStreamingLatency;
    std::optional<bool> enableLogging;
    ElevenLabsVoiceSettings voiceSettings;
};

/// @brief Resolved text-to-speech configuration, one alternative per backend.
using SynthesisConfig = std::variant<OpenAISynthesisConfig, GroqSynthesisConfig, ElevenLabsSynthesisConfig>;

/// @brief Default base endpoints per backend.
namespace endpoints
{
    inline constexpr auto OpenAI = std::string_view { "https://api.openai.com/v1" };
    inline constexpr auto Groq = std::string_view { "https://api.groq.com/openai/v1" };
    inline constexpr auto ElevenLabs = std::string_view { "https://api.elevenlabs.io/v1" };
} // namespace endpoints

/// @brief Validates and normalizes an API base URL.
///
/// Accepts http and https URLs with a non-empty host and no whitespace. Trailing slashes are removed.
/// @return The normalized URL, or std::nullopt if it does not parse.
[[nodiscard]] auto parseEndpoint(std::string_view url) -> std::optional<std::string>;

/// @brief Builds the speech-to-text configuration from persisted settings.
///
/// Fails with NotConfigured when the selected backend has no API key and with InvalidEndpoint when the
/// stored base URL does not parse. Never performs I/O beyond reading @p settings.
[[nodiscard]] auto resolveSpeechToText(const SettingsStore& settings) -> Result<TranscriptionConfig>;

/// @brief Builds the text-to-speech configuration from persisted settings.
///
/// Fails with NotConfigured, InvalidEndpoint, or MissingVoice (ElevenLabs without a voice id).
[[nodiscard]] auto resolveTextToSpeech(const SettingsStore& settings) -> Result<SynthesisConfig>;

/// @brief Returns the backend selected in the settings, falling back to the default when unset or unknown.
[[nodiscard]] auto selectedTranscriptionBackend(const SettingsStore& settings) -> TranscriptionBackend;

/// @copydoc selectedTranscriptionBackend
[[nodiscard]] auto selectedSynthesisBackend(const SettingsStore& settings) -> SynthesisBackend;

[[nodiscard]] auto backendOf(const TranscriptionConfig& config) -> TranscriptionBackend;
[[nodiscard]] auto backendOf(const SynthesisConfig& config) -> SynthesisBackend;

/// @brief Common view of the shared transcription parameters of any backend.
[[nodiscard]] auto transcriptionSettings(const TranscriptionConfig& config) -> const TranscriptionSettings&;

/// @brief Maximum characters per synthesis request for the configured backend.
[[nodiscard]] auto chunkLimit(const SynthesisConfig& config) -> std::size_t;

/// @brief Sample rate of headerless PCM output, or std::nullopt if the declared format carries a header.
[[nodiscard]] auto headerlessPcmSampleRate(const SynthesisConfig& config) -> std::optional<std::uint32_t>;

/// @brief Checks that the declared output format is something the playback device can open.
///
/// Fails with ProviderError for OpenAI formats outside mp3, wav, flac and pcm.
[[nodiscard]] auto validatePlayableFormat(const SynthesisConfig& config) -> VoidResult;

/// @brief Renders a synthesis error for display, adding backend-specific hints.
[[nodiscard]] auto describeSynthesisError(const Error& error, SynthesisBackend backend) -> std::string;

/// @brief Settings keys understood by the resolvers.
namespace keys
{
    inline constexpr auto SttProvider = std::string_view { "sttProvider" };
    inline constexpr auto TtsProvider = std::string_view { "ttsProvider" };
} // namespace keys

} // namespace parley
