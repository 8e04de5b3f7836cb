// SPDX-License-Identifier: Apache-2.0
#include "OpenAiAudioClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Text.hpp>

#include <format>

namespace parley
{

namespace
{

    /// Text response formats are returned verbatim; JSON ones carry the transcript in "text".
    auto extractTranscript(const HttpResponse& response, const std::optional<std::string>& responseFormat)
        -> Result<std::string>
    {
        auto const format = text::toLower(text::trim(responseFormat.value_or("json")));
        if (format != "json" && format != "verbose_json")
            return response.text();

        auto parsed = json::parse(response.text());
        if (!parsed)
            return makeError(ErrorCode::ProviderError,
                             std::format("Unexpected transcription response: {}", response.text()));
        return json::getStringOr(*parsed, "text", "");
    }

} // namespace

OpenAiAudioClient::OpenAiAudioClient(std::shared_ptr<HttpClient> http, std::string apiKey, std::string baseUrl):
    _http(std::move(http)), _apiKey(std::move(apiKey)), _baseUrl(std::move(baseUrl))
{
}

auto OpenAiAudioClient::createSpeech(std::string_view input, const SpeechParams& params, std::stop_token stopToken)
    -> Result<std::vector<std::uint8_t>>
{
    auto body = nlohmann::json {
        { "model", params.model },
        { "input", std::string(input) },
        { "voice", params.voice },
    };
    if (params.responseFormat)
        body["response_format"] = *params.responseFormat;
    if (params.speed)
        body["speed"] = *params.speed;
    if (params.instructions)
        body["instructions"] = *params.instructions;

    auto request = HttpRequest {};
    request.url = std::format("{}/audio/speech", _baseUrl);
    request.headers.emplace_back("Authorization", std::format("Bearer {}", _apiKey));
    request.jsonBody = body.dump();

    auto response = _http->post(request, stopToken);
    if (!response)
        return std::unexpected(response.error());
    return std::move(response->body);
}

auto OpenAiAudioClient::createTranscription(const TranscriptionRequest& audio,
                                            const TranscriptionSettings& settings,
                                            std::stop_token stopToken) -> Result<std::string>
{
    return postAudio("audio/transcriptions", audio, settings, true, stopToken);
}

auto OpenAiAudioClient::createTranslation(const TranscriptionRequest& audio,
                                          const TranscriptionSettings& settings,
                                          std::stop_token stopToken) -> Result<std::string>
{
    return postAudio("audio/translations", audio, settings, false, stopToken);
}

auto OpenAiAudioClient::postAudio(std::string_view path,
                                  const TranscriptionRequest& audio,
                                  const TranscriptionSettings& settings,
                                  bool withLanguage,
                                  std::stop_token stopToken) -> Result<std::string>
{
    auto request = HttpRequest {};
    request.url = std::format("{}/{}", _baseUrl, path);
    request.headers.emplace_back("Authorization", std::format("Bearer {}", _apiKey));
    request.file = HttpFilePart {
        .name = "file",
        .filename = audio.filename,
        .mimeType = audio.mimeType,
        .contents = audio.audio,
    };

    request.formFields.emplace_back("model", settings.model);
    if (withLanguage && settings.language)
        request.formFields.emplace_back("language", *settings.language);
    if (settings.prompt)
        request.formFields.emplace_back("prompt", *settings.prompt);
    if (settings.responseFormat)
        request.formFields.emplace_back("response_format", *settings.responseFormat);
    if (settings.temperature)
        request.formFields.emplace_back("temperature", std::format("{}", *settings.temperature));
    if (withLanguage)
    {
        for (auto const& granularity: settings.timestampGranularities)
            request.formFields.emplace_back("timestamp_granularities[]", granularity);
    }

    auto response = _http->post(request, stopToken);
    if (!response)
        return std::unexpected(response.error());
    return extractTranscript(*response, settings.responseFormat);
}

OpenAiTranscriber::OpenAiTranscriber(std::shared_ptr<HttpClient> http, TranscriptionSettings settings):
    _settings(std::move(settings)), _client(std::move(http), _settings.apiKey, _settings.baseUrl)
{
}

auto OpenAiTranscriber::transcribe(const TranscriptionRequest& request, std::stop_token stopToken)
    -> Result<std::string>
{
    return _client.createTranscription(request, _settings, stopToken);
}

auto OpenAiTranscriber::translate(const TranscriptionRequest& request, std::stop_token stopToken)
    -> Result<std::string>
{
    return _client.createTranslation(request, _settings, stopToken);
}

OpenAiSynthesizer::OpenAiSynthesizer(std::shared_ptr<HttpClient> http,
                                     std::string apiKey,
                                     std::string baseUrl,
                                     SpeechParams params):
    _params(std::move(params)), _client(std::move(http), std::move(apiKey), std::move(baseUrl))
{
}

auto OpenAiSynthesizer::synthesize(const SynthesisRequest& request, std::stop_token stopToken)
    -> Result<std::vector<std::uint8_t>>
{
    return _client.createSpeech(request.text, _params, stopToken);
}

} // namespace parley
