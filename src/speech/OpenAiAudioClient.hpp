// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <speech/HttpClient.hpp>
#include <speech/Providers.hpp>
#include <speech/SpeechConfig.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parley
{

/// @brief Parameters of a POST /audio/speech call.
struct SpeechParams
{
    std::string model;
    std::string voice;
    std::optional<std::string> responseFormat;
    std::optional<double> speed;
    std::optional<std::string> instructions;
};

/// @brief Client for the OpenAI audio API. Groq serves the same API under its own base URL.
class OpenAiAudioClient
{
  public:
    OpenAiAudioClient(std::shared_ptr<HttpClient> http, std::string apiKey, std::string baseUrl);

    /// @brief POST {base}/audio/speech, returning the encoded audio.
    [[nodiscard]] auto createSpeech(std::string_view input, const SpeechParams& params, std::stop_token stopToken)
        -> Result<std::vector<std::uint8_t>>;

    /// @brief POST {base}/audio/transcriptions.
    [[nodiscard]] auto createTranscription(const TranscriptionRequest& audio,
                                           const TranscriptionSettings& settings,
                                           std::stop_token stopToken) -> Result<std::string>;

    /// @brief POST {base}/audio/translations. Language and timestamp granularities do not apply here.
    [[nodiscard]] auto createTranslation(const TranscriptionRequest& audio,
                                         const TranscriptionSettings& settings,
                                         std::stop_token stopToken) -> Result<std::string>;

  private:
    [[nodiscard]] auto postAudio(std::string_view path,
                                 const TranscriptionRequest& audio,
                                 const TranscriptionSettings& settings,
                                 bool withLanguage,
                                 std::stop_token stopToken) -> Result<std::string>;

    std::shared_ptr<HttpClient> _http;
    std::string _apiKey;
    std::string _baseUrl;
};

/// @brief TranscriptionProvider for OpenAI and Groq.
class OpenAiTranscriber final: public TranscriptionProvider
{
  public:
    OpenAiTranscriber(std::shared_ptr<HttpClient> http, TranscriptionSettings settings);

    [[nodiscard]] auto transcribe(const TranscriptionRequest& request, std::stop_token stopToken)
        -> Result<std::string> override;
    [[nodiscard]] auto translate(const TranscriptionRequest& request, std::stop_token stopToken)
        -> Result<std::string> override;

  private:
    TranscriptionSettings _settings;
    OpenAiAudioClient _client;
};

/// @brief SynthesisProvider for OpenAI and Groq.
class OpenAiSynthesizer final: public SynthesisProvider
{
  public:
    OpenAiSynthesizer(std::shared_ptr<HttpClient> http, std::string apiKey, std::string baseUrl, SpeechParams params);

    [[nodiscard]] auto synthesize(const SynthesisRequest& request, std::stop_token stopToken)
        -> Result<std::vector<std::uint8_t>> override;

  private:
    SpeechParams _params;
    OpenAiAudioClient _client;
};

} // namespace parley
