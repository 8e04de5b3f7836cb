// SPDX-License-Identifier: Apache-2.0
#include "SpeechConfig.hpp"

#include <core/Text.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <format>

namespace parley
{

namespace
{

    constexpr auto GroqChunkLimit = std::size_t { 200 };
    constexpr auto OpenAIChunkLimit = std::size_t { 4096 };
    constexpr auto ElevenLabsChunkLimit = std::size_t { 6000 };

    constexpr auto OpenAIPcmSampleRate = std::uint32_t { 24000 };

    constexpr auto PlayableOpenAIFormats = std::array<std::string_view, 4> { "mp3", "wav", "flac", "pcm" };

    /// Reads a string setting, treating missing and blank values alike. The result is trimmed.
    auto optionalString(const SettingsStore& settings, std::string_view key) -> std::optional<std::string>
    {
        auto const value = settings.string(key);
        if (!value || text::isBlank(*value))
            return std::nullopt;
        return std::string(text::trim(*value));
    }

    auto stringOr(const SettingsStore& settings, std::string_view key, std::string_view fallback) -> std::string
    {
        return optionalString(settings, key).value_or(std::string(fallback));
    }

    auto resolveBaseUrl(const SettingsStore& settings, std::string_view key, std::string_view fallback)
        -> Result<std::string>
    {
        auto const candidate = stringOr(settings, key, fallback);
        if (auto endpoint = parseEndpoint(candidate); endpoint)
            return std::move(*endpoint);
        return makeError(ErrorCode::InvalidEndpoint, std::format("Invalid API base URL: \"{}\".", candidate));
    }

    auto requireApiKey(const SettingsStore& settings, std::string_view key, std::string_view what)
        -> Result<std::string>
    {
        if (auto apiKey = optionalString(settings, key); apiKey)
            return std::move(*apiKey);
        return makeError(ErrorCode::NotConfigured,
                         std::format("{} is not configured. Set an API key in the speech settings.", what));
    }

    /// Reads the transcription settings sharing @p prefix ("sttOpenAI" or "sttGroq").
    auto readTranscriptionSettings(const SettingsStore& settings,
                                   std::string_view prefix,
                                   std::string_view defaultBaseUrl,
                                   std::string_view defaultModel) -> Result<TranscriptionSettings>
    {
        auto const key = [prefix](std::string_view suffix) { return std::format("{}{}", prefix, suffix); };

        auto apiKey = requireApiKey(settings, key("APIKey"), "Speech to text");
        if (!apiKey)
            return std::unexpected(apiKey.error());

        auto baseUrl = resolveBaseUrl(settings, key("BaseURL"), defaultBaseUrl);
        if (!baseUrl)
            return std::unexpected(baseUrl.error());

        auto result = TranscriptionSettings {};
        result.apiKey = std::move(*apiKey);
        result.baseUrl = std::move(*baseUrl);
        result.model = stringOr(settings, key("Model"), defaultModel);
        result.translateToEnglish = settings.boolean(key("TranslateToEnglish")).value_or(false);
        result.language = optionalString(settings, key("Language"));
        result.prompt = optionalString(settings, key("Prompt"));
        result.responseFormat = optionalString(settings, key("ResponseFormat"));
        result.temperature = settings.number(key("Temperature"));
        result.timestampGranularities = settings.stringList(key("TimestampGranularitiesJSON"));
        return result;
    }

    auto resolveOpenAISynthesis(const SettingsStore& settings) -> Result<SynthesisConfig>
    {
        auto apiKey = requireApiKey(settings, "ttsOpenAIAPIKey", "Text to speech");
        if (!apiKey)
            return std::unexpected(apiKey.error());
        auto baseUrl = resolveBaseUrl(settings, "ttsOpenAIBaseURL", endpoints::OpenAI);
        if (!baseUrl)
            return std::unexpected(baseUrl.error());

        auto config = OpenAISynthesisConfig {};
        config.apiKey = std::move(*apiKey);
        config.baseUrl = std::move(*baseUrl);
        config.model = stringOr(settings, "ttsOpenAIModel", "gpt-4o-mini-tts");
        config.voice = stringOr(settings, "ttsOpenAIVoice", "alloy");
        config.responseFormat = text::toLower(stringOr(settings, "ttsOpenAIResponseFormat", "mp3"));
        config.speed = settings.number("ttsOpenAISpeed");
        config.instructions = optionalString(settings, "ttsOpenAIInstructions");
        return config;
    }

    auto resolveGroqSynthesis(const SettingsStore& settings) -> Result<SynthesisConfig>
    {
        auto apiKey = requireApiKey(settings, "ttsGroqAPIKey", "Text to speech");
        if (!apiKey)
            return std::unexpected(apiKey.error());
        auto baseUrl = resolveBaseUrl(settings, "ttsGroqBaseURL", endpoints::Groq);
        if (!baseUrl)
            return std::unexpected(baseUrl.error());

        auto config = GroqSynthesisConfig {};
        config.apiKey = std::move(*apiKey);
        config.baseUrl = std::move(*baseUrl);
        config.model = stringOr(settings, "ttsGroqModel", "canopylabs/orpheus-v1-english");
        config.voice = stringOr(settings, "ttsGroqVoice", "troy");
        config.responseFormat = stringOr(settings, "ttsGroqResponseFormat", "wav");
        return config;
    }

    auto resolveElevenLabsSynthesis(const SettingsStore& settings) -> Result<SynthesisConfig>
    {
        auto apiKey = requireApiKey(settings, "ttsElevenLabsAPIKey", "Text to speech");
        if (!apiKey)
            return std::unexpected(apiKey.error());
        auto baseUrl = resolveBaseUrl(settings, "ttsElevenLabsBaseURL", endpoints::ElevenLabs);
        if (!baseUrl)
            return std::unexpected(baseUrl.error());

        auto voiceId = optionalString(settings, "ttsElevenLabsVoiceID");
        if (!voiceId)
            return makeError(ErrorCode::MissingVoice,
                             "ElevenLabs voice is not selected. Choose a voice in the speech settings.");

        auto config = ElevenLabsSynthesisConfig {};
        config.apiKey = std::move(*apiKey);
        config.baseUrl = std::move(*baseUrl);
        config.voiceId = std::move(*voiceId);
        config.modelId = optionalString(settings, "ttsElevenLabsModelID");
        config.outputFormat = optionalString(settings, "ttsElevenLabsOutputFormat");
        config.optimizeStreamingLatency = settings.integer("ttsElevenLabsOptimizeStreamingLatency");
        config.enableLogging = settings.boolean("ttsElevenLabsEnableLogging");
        config.voiceSettings.stability = settings.number("ttsElevenLabsStability");
        config.voiceSettings.similarityBoost = settings.number("ttsElevenLabsSimilarityBoost");
        config.voiceSettings.style = settings.number("ttsElevenLabsStyle");
        config.voiceSettings.useSpeakerBoost = settings.boolean("ttsElevenLabsUseSpeakerBoost");
        return config;
    }

    auto parseSampleRate(std::string_view digits) -> std::optional<std::uint32_t>
    {
        auto rate = std::uint32_t { 0 };
        auto const [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), rate);
        if (ec != std::errc {} || ptr != digits.data() + digits.size() || rate == 0)
            return std::nullopt;
        return rate;
    }

} // namespace

auto parseEndpoint(std::string_view url) -> std::optional<std::string>
{
    auto const trimmed = text::trim(url);
    if (trimmed.find_first_of(text::Whitespace) != std::string_view::npos)
        return std::nullopt;

    auto const separator = trimmed.find("://");
    if (separator == std::string_view::npos)
        return std::nullopt;

    auto const scheme = text::toLower(trimmed.substr(0, separator));
    if (scheme != "http" && scheme != "https")
        return std::nullopt;

    auto const rest = trimmed.substr(separator + 3);
    auto const host = rest.substr(0, rest.find_first_of("/?#"));
    if (host.empty() || host.front() == ':' || host.front() == '@')
        return std::nullopt;

    auto normalized = std::string(trimmed);
    while (normalized.size() > separator + 3 + host.size() && normalized.back() == '/')
        normalized.pop_back();
    return normalized;
}

auto selectedTranscriptionBackend(const SettingsStore& settings) -> TranscriptionBackend
{
    auto const raw = text::toLower(stringOr(settings, keys::SttProvider, ""));
    if (raw == backendName(TranscriptionBackend::OpenAI))
        return TranscriptionBackend::OpenAI;
    return TranscriptionBackend::Groq;
}

auto selectedSynthesisBackend(const SettingsStore& settings) -> SynthesisBackend
{
    auto const raw = text::toLower(stringOr(settings, keys::TtsProvider, ""));
    if (raw == backendName(SynthesisBackend::Groq))
        return SynthesisBackend::Groq;
    if (raw == backendName(SynthesisBackend::ElevenLabs))
        return SynthesisBackend::ElevenLabs;
    return SynthesisBackend::OpenAI;
}

auto resolveSpeechToText(const SettingsStore& settings) -> Result<TranscriptionConfig>
{
    switch (selectedTranscriptionBackend(settings))
    {
        case TranscriptionBackend::OpenAI:
            return readTranscriptionSettings(settings, "sttOpenAI", endpoints::OpenAI, "gpt-4o-mini-transcribe")
                .transform([](TranscriptionSettings&& s) -> TranscriptionConfig {
                    return OpenAITranscriptionConfig { std::move(s) };
                });
        case TranscriptionBackend::Groq: break;
    }
    return readTranscriptionSettings(settings, "sttGroq", endpoints::Groq, "whisper-large-v3-turbo")
        .transform([](TranscriptionSettings&& s) -> TranscriptionConfig {
            return GroqTranscriptionConfig { std::move(s) };
        });
}

auto resolveTextToSpeech(const SettingsStore& settings) -> Result<SynthesisConfig>
{
    switch (selectedSynthesisBackend(settings))
    {
        case SynthesisBackend::Groq: return resolveGroqSynthesis(settings);
        case SynthesisBackend::ElevenLabs: return resolveElevenLabsSynthesis(settings);
        case SynthesisBackend::OpenAI: break;
    }
    return resolveOpenAISynthesis(settings);
}

auto backendOf(const TranscriptionConfig& config) -> TranscriptionBackend
{
    return std::holds_alternative<OpenAITranscriptionConfig>(config) ? TranscriptionBackend::OpenAI
                                                                     : TranscriptionBackend::Groq;
}

auto backendOf(const SynthesisConfig& config) -> SynthesisBackend
{
    if (std::holds_alternative<GroqSynthesisConfig>(config))
        return SynthesisBackend::Groq;
    if (std::holds_alternative<ElevenLabsSynthesisConfig>(config))
        return SynthesisBackend::ElevenLabs;
    return SynthesisBackend::OpenAI;
}

auto transcriptionSettings(const TranscriptionConfig& config) -> const TranscriptionSettings&
{
    return std::visit([](const auto& c) -> const TranscriptionSettings& { return c; }, config);
}

auto chunkLimit(const SynthesisConfig& config) -> std::size_t
{
    switch (backendOf(config))
    {
        case SynthesisBackend::Groq: return GroqChunkLimit;
        case SynthesisBackend::ElevenLabs: return ElevenLabsChunkLimit;
        case SynthesisBackend::OpenAI: break;
    }
    return OpenAIChunkLimit;
}

auto headerlessPcmSampleRate(const SynthesisConfig& config) -> std::optional<std::uint32_t>
{
    if (auto const* openai = std::get_if<OpenAISynthesisConfig>(&config))
    {
        if (text::toLower(openai->responseFormat) == "pcm")
            return OpenAIPcmSampleRate;
        return std::nullopt;
    }

    // ElevenLabs names raw PCM output "pcm_<rate>".
    if (auto const* elevenLabs = std::get_if<ElevenLabsSynthesisConfig>(&config); elevenLabs && elevenLabs->outputFormat)
    {
        constexpr auto Prefix = std::string_view { "pcm_" };
        auto const format = text::toLower(*elevenLabs->outputFormat);
        if (format.starts_with(Prefix))
            return parseSampleRate(std::string_view(format).substr(Prefix.size()));
    }
    return std::nullopt;
}

auto validatePlayableFormat(const SynthesisConfig& config) -> VoidResult
{
    auto const* openai = std::get_if<OpenAISynthesisConfig>(&config);
    if (!openai)
        return {};

    auto const format = text::toLower(openai->responseFormat);
    if (std::ranges::find(PlayableOpenAIFormats, format) != PlayableOpenAIFormats.end())
        return {};

    return makeError(ErrorCode::ProviderError,
                     std::format("Unsupported OpenAI TTS response format \"{}\". Choose mp3, wav, flac or pcm.",
                                 openai->responseFormat));
}

auto describeSynthesisError(const Error& error, SynthesisBackend backend) -> std::string
{
    if (error.code == ErrorCode::AuthenticationFailed && backend == SynthesisBackend::ElevenLabs)
        return std::format("{}\n\nIf your ElevenLabs key uses endpoint scopes, enable access to /v1/text-to-speech.",
                           error.message);
    return error.message;
}

} // namespace parley
