// SPDX-License-Identifier: Apache-2.0
#include <speech/SpeechConfig.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace parley;

namespace
{

auto storeWith(nlohmann::json values) -> JsonSettingsStore
{
    return JsonSettingsStore(std::move(values));
}

} // namespace

TEST_CASE("parseEndpoint accepts http and https URLs", "[speech-config]")
{
    CHECK(parseEndpoint("https://api.openai.com/v1") == "https://api.openai.com/v1");
    CHECK(parseEndpoint("  http://localhost:8080/v1///  ") == "http://localhost:8080/v1");
    CHECK(parseEndpoint("HTTPS://Example.com/") == "HTTPS://Example.com");
    CHECK(parseEndpoint("https://example.com") == "https://example.com");
}

TEST_CASE("parseEndpoint rejects malformed URLs", "[speech-config]")
{
    CHECK(!parseEndpoint("").has_value());
    CHECK(!parseEndpoint("api.openai.com/v1").has_value());
    CHECK(!parseEndpoint("ftp://example.com").has_value());
    CHECK(!parseEndpoint("https://").has_value());
    CHECK(!parseEndpoint("https:///v1").has_value());
    CHECK(!parseEndpoint("https://:443/v1").has_value());
    CHECK(!parseEndpoint("https://exa mple.com").has_value());
}

TEST_CASE("Backend selection falls back to the defaults", "[speech-config]")
{
    CHECK(selectedTranscriptionBackend(storeWith({})) == TranscriptionBackend::Groq);
    CHECK(selectedTranscriptionBackend(storeWith({ { "sttProvider", "OpenAI" } })) == TranscriptionBackend::OpenAI);
    CHECK(selectedTranscriptionBackend(storeWith({ { "sttProvider", "whisper" } })) == TranscriptionBackend::Groq);

    CHECK(selectedSynthesisBackend(storeWith({})) == SynthesisBackend::OpenAI);
    CHECK(selectedSynthesisBackend(storeWith({ { "ttsProvider", "groq" } })) == SynthesisBackend::Groq);
    CHECK(selectedSynthesisBackend(storeWith({ { "ttsProvider", "elevenlabs" } })) == SynthesisBackend::ElevenLabs);
    CHECK(selectedSynthesisBackend(storeWith({ { "ttsProvider", "polly" } })) == SynthesisBackend::OpenAI);
}

TEST_CASE("resolveSpeechToText requires an API key", "[speech-config]")
{
    auto const result = resolveSpeechToText(storeWith({ { "sttGroqAPIKey", "   " } }));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::NotConfigured);
    CHECK(result.error().message.starts_with("Speech to text is not configured"));
}

TEST_CASE("resolveSpeechToText builds the Groq configuration with defaults", "[speech-config]")
{
    auto const result = resolveSpeechToText(storeWith({ { "sttGroqAPIKey", " gsk-123 " } }));
    REQUIRE(result.has_value());
    REQUIRE(std::holds_alternative<GroqTranscriptionConfig>(*result));
    CHECK(backendOf(*result) == TranscriptionBackend::Groq);

    auto const& settings = transcriptionSettings(*result);
    CHECK(settings.apiKey == "gsk-123");
    CHECK(settings.baseUrl == endpoints::Groq);
    CHECK(settings.model == "whisper-large-v3-turbo");
    CHECK(!settings.translateToEnglish);
    CHECK(!settings.language.has_value());
    CHECK(!settings.prompt.has_value());
    CHECK(!settings.responseFormat.has_value());
    CHECK(!settings.temperature.has_value());
    CHECK(settings.timestampGranularities.empty());
}

TEST_CASE("resolveSpeechToText reads every OpenAI transcription setting", "[speech-config]")
{
    auto const result = resolveSpeechToText(storeWith({
        { "sttProvider", "openai" },
        { "sttOpenAIAPIKey", "sk-1" },
        { "sttOpenAIBaseURL", "https://proxy.example.com/v1/" },
        { "sttOpenAIModel", "whisper-1" },
        { "sttOpenAITranslateToEnglish", "true" },
        { "sttOpenAILanguage", "de" },
        { "sttOpenAIPrompt", "Names: Parley" },
        { "sttOpenAIResponseFormat", "verbose_json" },
        { "sttOpenAITemperature", "0.2" },
        { "sttOpenAITimestampGranularitiesJSON", R"(["word","segment"])" },
    }));
    REQUIRE(result.has_value());
    REQUIRE(std::holds_alternative<OpenAITranscriptionConfig>(*result));

    auto const& settings = transcriptionSettings(*result);
    CHECK(settings.apiKey == "sk-1");
    CHECK(settings.baseUrl == "https://proxy.example.com/v1");
    CHECK(settings.model == "whisper-1");
    CHECK(settings.translateToEnglish);
    CHECK(settings.language == "de");
    CHECK(settings.prompt == "Names: Parley");
    CHECK(settings.responseFormat == "verbose_json");
    CHECK(settings.temperature == 0.2);
    CHECK(settings.timestampGranularities == std::vector<std::string> { "word", "segment" });
}

TEST_CASE("resolveSpeechToText rejects an invalid base URL", "[speech-config]")
{
    auto const result = resolveSpeechToText(storeWith({
        { "sttGroqAPIKey", "gsk" },
        { "sttGroqBaseURL", "not a url" },
    }));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidEndpoint);
    CHECK(result.error().message == "Invalid API base URL: \"not a url\".");
}

TEST_CASE("resolveTextToSpeech builds the OpenAI configuration with defaults", "[speech-config]")
{
    auto const result = resolveTextToSpeech(storeWith({
        { "ttsOpenAIAPIKey", "sk" },
        { "ttsOpenAIResponseFormat", "MP3" },
        { "ttsOpenAISpeed", 1.5 },
    }));
    REQUIRE(result.has_value());
    auto const* config = std::get_if<OpenAISynthesisConfig>(&*result);
    REQUIRE(config != nullptr);
    CHECK(config->baseUrl == endpoints::OpenAI);
    CHECK(config->model == "gpt-4o-mini-tts");
    CHECK(config->voice == "alloy");
    CHECK(config->responseFormat == "mp3");
    CHECK(config->speed == 1.5);
    CHECK(!config->instructions.has_value());
    CHECK(chunkLimit(*result) == 4096);
}

TEST_CASE("resolveTextToSpeech builds the Groq configuration with defaults", "[speech-config]")
{
    auto const result = resolveTextToSpeech(storeWith({ { "ttsProvider", "groq" }, { "ttsGroqAPIKey", "gsk" } }));
    REQUIRE(result.has_value());
    auto const* config = std::get_if<GroqSynthesisConfig>(&*result);
    REQUIRE(config != nullptr);
    CHECK(config->baseUrl == endpoints::Groq);
    CHECK(config->model == "canopylabs/orpheus-v1-english");
    CHECK(config->voice == "troy");
    CHECK(config->responseFormat == "wav");
    CHECK(chunkLimit(*result) == 200);
}

TEST_CASE("resolveTextToSpeech requires an ElevenLabs voice", "[speech-config]")
{
    auto const result = resolveTextToSpeech(storeWith({
        { "ttsProvider", "elevenlabs" },
        { "ttsElevenLabsAPIKey", "xi" },
        { "ttsElevenLabsVoiceID", "" },
    }));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::MissingVoice);
}

TEST_CASE("resolveTextToSpeech checks the key before the voice", "[speech-config]")
{
    auto const result = resolveTextToSpeech(storeWith({ { "ttsProvider", "elevenlabs" } }));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::NotConfigured);
    CHECK(result.error().message.starts_with("Text to speech is not configured"));
}

TEST_CASE("resolveTextToSpeech reads the ElevenLabs tunables", "[speech-config]")
{
    auto const result = resolveTextToSpeech(storeWith({
        { "ttsProvider", "elevenlabs" },
        { "ttsElevenLabsAPIKey", "xi" },
        { "ttsElevenLabsVoiceID", "voice-1" },
        { "ttsElevenLabsModelID", "eleven_multilingual_v2" },
        { "ttsElevenLabsOutputFormat", "pcm_22050" },
        { "ttsElevenLabsOptimizeStreamingLatency", "2" },
        { "ttsElevenLabsEnableLogging", false },
        { "ttsElevenLabsStability", 0.4 },
        { "ttsElevenLabsUseSpeakerBoost", "yes" },
    }));
    REQUIRE(result.has_value());
    auto const* config = std::get_if<ElevenLabsSynthesisConfig>(&*result);
    REQUIRE(config != nullptr);
    CHECK(config->voiceId == "voice-1");
    CHECK(config->modelId == "eleven_multilingual_v2");
    CHECK(config->optimizeStreamingLatency == 2);
    CHECK(config->enableLogging == false);
    CHECK(config->voiceSettings.stability == 0.4);
    CHECK(!config->voiceSettings.similarityBoost.has_value());
    CHECK(config->voiceSettings.useSpeakerBoost == true);
    CHECK(!config->voiceSettings.empty());
    CHECK(chunkLimit(*result) == 6000);
    CHECK(headerlessPcmSampleRate(*result) == 22050u);
}

TEST_CASE("headerlessPcmSampleRate recognizes raw PCM output", "[speech-config]")
{
    CHECK(headerlessPcmSampleRate(OpenAISynthesisConfig { .responseFormat = "pcm" }) == 24000u);
    CHECK(!headerlessPcmSampleRate(OpenAISynthesisConfig { .responseFormat = "wav" }).has_value());
    CHECK(!headerlessPcmSampleRate(GroqSynthesisConfig { .responseFormat = "wav" }).has_value());
    CHECK(!headerlessPcmSampleRate(ElevenLabsSynthesisConfig { .outputFormat = "mp3_44100_128" }).has_value());
    CHECK(!headerlessPcmSampleRate(ElevenLabsSynthesisConfig { .outputFormat = "pcm_fast" }).has_value());
    CHECK(!headerlessPcmSampleRate(ElevenLabsSynthesisConfig {}).has_value());
}

TEST_CASE("validatePlayableFormat rejects OpenAI formats the player cannot open", "[speech-config]")
{
    CHECK(validatePlayableFormat(OpenAISynthesisConfig { .responseFormat = "flac" }).has_value());
    CHECK(validatePlayableFormat(GroqSynthesisConfig { .responseFormat = "ogg" }).has_value());

    auto const rejected = validatePlayableFormat(OpenAISynthesisConfig { .responseFormat = "opus" });
    REQUIRE(!rejected.has_value());
    CHECK(rejected.error().code == ErrorCode::ProviderError);
    CHECK(rejected.error().message.find("\"opus\"") != std::string::npos);
}

TEST_CASE("describeSynthesisError adds the ElevenLabs scope hint", "[speech-config]")
{
    auto const denied = Error { ErrorCode::AuthenticationFailed, "Authentication failed (HTTP 401): bad key" };
    CHECK(describeSynthesisError(denied, SynthesisBackend::OpenAI) == denied.message);

    auto const described = describeSynthesisError(denied, SynthesisBackend::ElevenLabs);
    CHECK(described.starts_with(denied.message));
    CHECK(described.find("/v1/text-to-speech") != std::string::npos);

    auto const other = Error { ErrorCode::ProviderError, "HTTP 500: boom" };
    CHECK(describeSynthesisError(other, SynthesisBackend::ElevenLabs) == other.message);
}
