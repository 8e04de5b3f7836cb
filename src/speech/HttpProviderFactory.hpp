// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <speech/HttpClient.hpp>
#include <speech/Providers.hpp>

#include <memory>

namespace parley
{

/// @brief SpeechProviderFactory backed by the HTTP clients of the supported vendors.
class HttpProviderFactory final: public SpeechProviderFactory
{
  public:
    explicit HttpProviderFactory(std::shared_ptr<HttpClient> http);

    [[nodiscard]] auto makeTranscriber(const TranscriptionConfig& config)
        -> std::unique_ptr<TranscriptionProvider> override;

    [[nodiscard]] auto makeSynthesizer(const SynthesisConfig& config)
        -> std::unique_ptr<SynthesisProvider> override;

  private:
    std::shared_ptr<HttpClient> _http;
};

} // namespace parley
