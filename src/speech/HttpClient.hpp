// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace parley
{

/// @brief A binary part of a multipart/form-data body.
struct HttpFilePart
{
    std::string name;
    std::string filename;
    std::string mimeType;
    std::span<const std::uint8_t> contents;
};

/// @brief A POST request. Either jsonBody or the form fields/file are used, never both.
struct HttpRequest
{
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<std::string> jsonBody;
    std::vector<std::pair<std::string, std::string>> formFields;
    std::optional<HttpFilePart> file;
    std::chrono::seconds timeout { 120 };
};

struct HttpResponse
{
    int status = 0;
    std::vector<std::uint8_t> body;

    [[nodiscard]] auto text() const -> std::string { return { body.begin(), body.end() }; }
};

/// @brief Minimal blocking HTTP client used by the provider adapters.
class HttpClient
{
  public:
    virtual ~HttpClient() = default;

    /// @brief Performs a POST request.
    ///
    /// Non-2xx answers are reported as errors: 401 and 403 as AuthenticationFailed, anything else as
    /// ProviderError. Failures to reach the server are TransportError.
    [[nodiscard]] virtual auto post(const HttpRequest& request, std::stop_token stopToken)
        -> Result<HttpResponse> = 0;
};

/// @brief Maps a raw HTTP answer onto the error taxonomy.
///
/// Passes 2xx responses through. For JSON error bodies the provider's "error.message" (or "detail")
/// is used as message.
[[nodiscard]] auto classifyResponse(HttpResponse response) -> Result<HttpResponse>;

/// @brief Encodes a string for use inside a URL query component.
[[nodiscard]] auto percentEncode(std::string_view input) -> std::string;

/// @brief Locations of the temporary files a curl invocation reads from and writes to.
struct CurlFiles
{
    std::filesystem::path body;   ///< JSON body, if any.
    std::filesystem::path upload; ///< Multipart file part, if any.
    std::filesystem::path output; ///< Response body.
};

/// @brief Renders the curl config file ("--config -") that performs @p request.
///
/// Credentials only ever appear in this text, which is passed to curl through its stdin.
[[nodiscard]] auto buildCurlConfig(const HttpRequest& request, const CurlFiles& files) -> std::string;

/// @brief HttpClient that runs the curl executable.
///
/// Each request spawns "curl --config -" and writes the generated config to the child's stdin. Bodies and
/// responses go through TempFile instances that are removed on every path.
class CurlHttpClient final: public HttpClient
{
  public:
    explicit CurlHttpClient(std::string executable = "curl");

    [[nodiscard]] auto post(const HttpRequest& request, std::stop_token stopToken)
        -> Result<HttpResponse> override;

  private:
    std::string _executable;
};

} // namespace parley
