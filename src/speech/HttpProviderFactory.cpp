// SPDX-License-Identifier: Apache-2.0
#include "HttpProviderFactory.hpp"

#include <speech/ElevenLabsClient.hpp>
#include <speech/OpenAiAudioClient.hpp>

namespace parley
{

HttpProviderFactory::HttpProviderFactory(std::shared_ptr<HttpClient> http): _http(std::move(http))
{
}

auto HttpProviderFactory::makeTranscriber(const TranscriptionConfig& config) -> std::unique_ptr<TranscriptionProvider>
{
    // Groq speaks the OpenAI audio API, only the endpoint and model differ.
    return std::make_unique<OpenAiTranscriber>(_http, transcriptionSettings(config));
}

auto HttpProviderFactory::makeSynthesizer(const SynthesisConfig& config) -> std::unique_ptr<SynthesisProvider>
{
    if (auto const* openai = std::get_if<OpenAISynthesisConfig>(&config))
    {
        return std::make_unique<OpenAiSynthesizer>(_http,
                                                   openai->apiKey,
                                                   openai->baseUrl,
                                                   SpeechParams {
                                                       .model = openai->model,
                                                       .voice = openai->voice,
                                                       .responseFormat = openai->responseFormat,
                                                       .speed = openai->speed,
                                                       .instructions = openai->instructions,
                                                   });
    }

    if (auto const* groq = std::get_if<GroqSynthesisConfig>(&config))
    {
        return std::make_unique<OpenAiSynthesizer>(_http,
                                                   groq->apiKey,
                                                   groq->baseUrl,
                                                   SpeechParams {
                                                       .model = groq->model,
                                                       .voice = groq->voice,
                                                       .responseFormat = groq->responseFormat,
                                                   });
    }

    return std::make_unique<ElevenLabsClient>(_http, std::get<ElevenLabsSynthesisConfig>(config));
}

} // namespace parley
