// SPDX-License-Identifier: Apache-2.0
#include <speech/HttpClient.hpp>

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <string>

using namespace parley;

namespace
{

auto responseOf(int status, std::string_view body) -> HttpResponse
{
    return HttpResponse { .status = status, .body = { body.begin(), body.end() } };
}

auto files() -> CurlFiles
{
    return CurlFiles { .body = "/tmp/body.json", .upload = "/tmp/upload.bin", .output = "/tmp/out.bin" };
}

} // namespace

TEST_CASE("classifyResponse passes 2xx responses through", "[http]")
{
    auto result = classifyResponse(responseOf(201, "ok"));
    REQUIRE(result.has_value());
    CHECK(result->status == 201);
    CHECK(result->text() == "ok");
}

TEST_CASE("classifyResponse maps 401 and 403 to AuthenticationFailed", "[http]")
{
    auto unauthorized = classifyResponse(responseOf(401, R"({"error":{"message":"Incorrect API key provided"}})"));
    REQUIRE(!unauthorized.has_value());
    CHECK(unauthorized.error().code == ErrorCode::AuthenticationFailed);
    CHECK(unauthorized.error().message.find("Incorrect API key provided") != std::string::npos);

    auto forbidden = classifyResponse(responseOf(403, ""));
    REQUIRE(!forbidden.has_value());
    CHECK(forbidden.error().code == ErrorCode::AuthenticationFailed);
    CHECK(forbidden.error().message.find("HTTP 403") != std::string::npos);
}

TEST_CASE("classifyResponse extracts the provider's error message", "[http]")
{
    SECTION("error.message")
    {
        auto result = classifyResponse(responseOf(400, R"({"error":{"message":"Invalid voice"}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProviderError);
        CHECK(result.error().message == "HTTP 400: Invalid voice");
    }

    SECTION("error as string")
    {
        auto result = classifyResponse(responseOf(429, R"({"error":"Rate limited"})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "HTTP 429: Rate limited");
    }

    SECTION("detail")
    {
        auto result = classifyResponse(responseOf(422, R"({"detail":"Text too long"})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "HTTP 422: Text too long");
    }

    SECTION("detail.message")
    {
        auto result = classifyResponse(responseOf(400, R"({"detail":{"status":"voice_not_found","message":"Voice not found"}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "HTTP 400: Voice not found");
    }

    SECTION("plain text body")
    {
        auto result = classifyResponse(responseOf(502, "  Bad Gateway\n"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProviderError);
        CHECK(result.error().message == "HTTP 502: Bad Gateway");
    }
}

TEST_CASE("percentEncode escapes everything but unreserved characters", "[http]")
{
    CHECK(percentEncode("AZaz09-_.~") == "AZaz09-_.~");
    CHECK(percentEncode("a b/c?d") == "a%20b%2Fc%3Fd");
    CHECK(percentEncode("ä") == "%C3%A4");
    CHECK(percentEncode("") == "");
}

TEST_CASE("buildCurlConfig renders a JSON request", "[http]")
{
    auto request = HttpRequest {};
    request.url = "https://api.openai.com/v1/audio/speech";
    request.headers.emplace_back("Authorization", "Bearer sk-\"quoted\"");
    request.jsonBody = R"({"input":"hi"})";
    request.timeout = std::chrono::seconds { 30 };

    auto const config = buildCurlConfig(request, files());

    CHECK(config.starts_with("silent\n"));
    CHECK(config.find("url = \"https://api.openai.com/v1/audio/speech\"\n") != std::string::npos);
    CHECK(config.find("request = \"POST\"\n") != std::string::npos);
    CHECK(config.find("max-time = \"30\"\n") != std::string::npos);
    CHECK(config.find("header = \"Authorization: Bearer sk-\\\"quoted\\\"\"\n") != std::string::npos);
    CHECK(config.find("header = \"Content-Type: application/json\"\n") != std::string::npos);
    CHECK(config.find("data-binary = \"@/tmp/body.json\"\n") != std::string::npos);
    CHECK(config.find("output = \"/tmp/out.bin\"\n") != std::string::npos);
    CHECK(config.find("write-out = \"%{http_code}\"\n") != std::string::npos);
    CHECK(config.find("form") == std::string::npos);
    // The body itself never appears in the config.
    CHECK(config.find("\"input\"") == std::string::npos);
}

TEST_CASE("buildCurlConfig renders a multipart request", "[http]")
{
    auto const audio = std::vector<std::uint8_t> { 1, 2, 3 };

    auto request = HttpRequest {};
    request.url = "https://api.groq.com/openai/v1/audio/transcriptions";
    request.formFields.emplace_back("model", "whisper-large-v3-turbo");
    request.formFields.emplace_back("prompt", "line one\nline two");
    request.file = HttpFilePart { .name = "file", .filename = "audio.wav", .mimeType = "audio/wav", .contents = audio };

    auto const config = buildCurlConfig(request, files());

    CHECK(config.find("form-string = \"model=whisper-large-v3-turbo\"\n") != std::string::npos);
    CHECK(config.find("form-string = \"prompt=line one\\nline two\"\n") != std::string::npos);
    CHECK(config.find("form = \"file=@/tmp/upload.bin;filename=audio.wav;type=audio/wav\"\n") != std::string::npos);
    CHECK(config.find("data-binary") == std::string::npos);
    CHECK(config.find("max-time = \"120\"\n") != std::string::npos);
}

TEST_CASE("CurlHttpClient reports cancellation before sending", "[http]")
{
    auto client = CurlHttpClient {};
    auto source = std::stop_source {};
    source.request_stop();

    auto result = client.post(HttpRequest { .url = "https://example.com" }, source.get_token());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Cancelled);
}

#ifndef _WIN32
TEST_CASE("CurlHttpClient reports a missing executable as TransportError", "[http]")
{
    auto client = CurlHttpClient { "parley-no-such-curl-binary" };
    auto result = client.post(HttpRequest { .url = "https://example.com", .jsonBody = "{}" }, std::stop_token {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("CurlHttpClient reports a failing curl as TransportError", "[http]")
{
    // "false" exits with status 1 without reading its input.
    std::signal(SIGPIPE, SIG_IGN);
    auto client = CurlHttpClient { "false" };
    auto result = client.post(HttpRequest { .url = "https://example.com", .jsonBody = "{}" }, std::stop_token {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}
#endif
