// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <speech/HttpClient.hpp>
#include <speech/Providers.hpp>
#include <speech/SpeechConfig.hpp>

#include <memory>

namespace parley
{

/// @brief SynthesisProvider for the ElevenLabs text-to-speech API.
///
/// Sends POST {base}/text-to-speech/{voiceId} with the output format, latency hint and logging flag as
/// query parameters and the text, model id and voice settings as JSON body.
class ElevenLabsClient final: public SynthesisProvider
{
  public:
    ElevenLabsClient(std::shared_ptr<HttpClient> http, ElevenLabsSynthesisConfig config);

    [[nodiscard]] auto synthesize(const SynthesisRequest& request, std::stop_token stopToken)
        -> Result<std::vector<std::uint8_t>> override;

    /// @brief The request URL including query parameters.
    [[nodiscard]] auto speechUrl() const -> std::string;

  private:
    std::shared_ptr<HttpClient> _http;
    ElevenLabsSynthesisConfig _config;
};

} // namespace parley
