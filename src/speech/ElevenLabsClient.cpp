// SPDX-License-Identifier: Apache-2.0
#include "ElevenLabsClient.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace parley
{

ElevenLabsClient::ElevenLabsClient(std::shared_ptr<HttpClient> http, ElevenLabsSynthesisConfig config):
    _http(std::move(http)), _config(std::move(config))
{
}

auto ElevenLabsClient::speechUrl() const -> std::string
{
    auto query = std::vector<std::string> {};
    if (_config.outputFormat)
        query.push_back(std::format("output_format={}", percentEncode(*_config.outputFormat)));
    if (_config.optimizeStreamingLatency)
        query.push_back(std::format("optimize_streaming_latency={}", *_config.optimizeStreamingLatency));
    if (_config.enableLogging)
        query.push_back(std::format("enable_logging={}", *_config.enableLogging ? "true" : "false"));

    auto url = std::format("{}/text-to-speech/{}", _config.baseUrl, percentEncode(_config.voiceId));
    for (auto i = std::size_t { 0 }; i < query.size(); ++i)
    {
        url += i == 0 ? '?' : '&';
        url += query[i];
    }
    return url;
}

auto ElevenLabsClient::synthesize(const SynthesisRequest& request, std::stop_token stopToken)
    -> Result<std::vector<std::uint8_t>>
{
    auto body = nlohmann::json { { "text", request.text } };
    if (_config.modelId)
        body["model_id"] = *_config.modelId;

    auto const& voice = _config.voiceSettings;
    if (!voice.empty())
    {
        auto settings = nlohmann::json::object();
        if (voice.stability)
            settings["stability"] = *voice.stability;
        if (voice.similarityBoost)
            settings["similarity_boost"] = *voice.similarityBoost;
        if (voice.style)
            settings["style"] = *voice.style;
        if (voice.useSpeakerBoost)
            settings["use_speaker_boost"] = *voice.useSpeakerBoost;
        body["voice_settings"] = std::move(settings);
    }

    auto httpRequest = HttpRequest {};
    httpRequest.url = speechUrl();
    httpRequest.headers.emplace_back("xi-api-key", _config.apiKey);
    httpRequest.jsonBody = body.dump();

    auto response = _http->post(httpRequest, stopToken);
    if (!response)
        return std::unexpected(response.error());
    return std::move(response->body);
}

} // namespace parley
