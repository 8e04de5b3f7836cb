// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/TempFile.hpp>
#include <core/Text.hpp>

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>

#ifndef _WIN32
    #include <sys/wait.h>

    #include <fcntl.h>
    #include <spawn.h>
    #include <unistd.h>

extern char** environ;
#endif

namespace parley
{

namespace
{

    /// Quotes a value for the curl config file format.
    auto quote(std::string_view value) -> std::string
    {
        auto result = std::string { "\"" };
        for (auto const c: value)
        {
            switch (c)
            {
                case '\\': result += "\\\\"; break;
                case '"': result += "\\\""; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default: result += c; break;
            }
        }
        result += '"';
        return result;
    }

    auto errorMessageOf(const HttpResponse& response) -> std::string
    {
        auto const body = response.text();
        if (auto const parsed = json::parse(body); parsed && parsed->is_object())
        {
            auto const& object = *parsed;
            if (object.contains("error"))
            {
                auto const& error = object["error"];
                if (error.is_string())
                    return error.get<std::string>();
                if (auto message = json::findString(error, "message"); message)
                    return *message;
            }
            if (auto detail = json::findString(object, "detail"); detail)
                return *detail;
            if (object.contains("detail") && object["detail"].is_object())
            {
                if (auto message = json::findString(object["detail"], "message"); message)
                    return *message;
            }
        }

        auto const trimmed = text::trim(body);
        if (trimmed.empty())
            return std::format("HTTP {}", response.status);
        return std::string(trimmed.substr(0, 500));
    }

#ifndef _WIN32
    auto writeAll(int fd, std::string_view data) -> bool
    {
        while (!data.empty())
        {
            auto const written = ::write(fd, data.data(), data.size());
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            data.remove_prefix(static_cast<std::size_t>(written));
        }
        return true;
    }

    auto readAll(int fd) -> std::string
    {
        auto result = std::string {};
        auto buf = std::array<char, 256> {};
        while (true)
        {
            auto const bytesRead = ::read(fd, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                break;
            result.append(buf.data(), static_cast<std::size_t>(bytesRead));
        }
        return result;
    }

    struct CurlOutcome
    {
        int exitCode = 0;
        std::string stdoutText;
    };

    /// Runs "<executable> --config -" feeding @p config on stdin and collecting stdout.
    auto runCurl(const std::string& executable, const std::string& config) -> Result<CurlOutcome>
    {
        int stdinPipe[2];
        int stdoutPipe[2];

        if (pipe(stdinPipe) != 0)
            return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
        if (pipe(stdoutPipe) != 0)
        {
            ::close(stdinPipe[0]);
            ::close(stdinPipe[1]);
            return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
        }

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
        posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addclose(&actions, stdinPipe[1]);
        posix_spawn_file_actions_addclose(&actions, stdoutPipe[0]);

        auto program = executable;
        auto configFlag = std::string { "--config" };
        auto fromStdin = std::string { "-" };
        auto argv = std::array<char*, 4> { program.data(), configFlag.data(), fromStdin.data(), nullptr };

        pid_t pid;
        auto const status = posix_spawnp(&pid, executable.c_str(), &actions, nullptr, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);

        ::close(stdinPipe[0]);
        ::close(stdoutPipe[1]);

        if (status != 0)
        {
            ::close(stdinPipe[1]);
            ::close(stdoutPipe[0]);
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to spawn '{}': {}", executable, std::strerror(status)));
        }

        auto const configWritten = writeAll(stdinPipe[1], config);
        ::close(stdinPipe[1]);

        auto outcome = CurlOutcome {};
        outcome.stdoutText = readAll(stdoutPipe[0]);
        ::close(stdoutPipe[0]);

        auto waitStatus = 0;
        while (waitpid(pid, &waitStatus, 0) < 0)
        {
            if (errno != EINTR)
                return makeError(ErrorCode::TransportError, "Failed to wait for curl");
        }

        if (!configWritten)
            return makeError(ErrorCode::TransportError, "Failed to pass the request to curl");

        if (WIFEXITED(waitStatus))
            outcome.exitCode = WEXITSTATUS(waitStatus);
        else
            outcome.exitCode = -1;
        return outcome;
    }
#endif

} // namespace

auto classifyResponse(HttpResponse response) -> Result<HttpResponse>
{
    if (response.status >= 200 && response.status < 300)
        return response;

    auto const message = errorMessageOf(response);
    if (response.status == 401 || response.status == 403)
        return makeError(ErrorCode::AuthenticationFailed,
                         std::format("Authentication failed (HTTP {}): {}", response.status, message));
    return makeError(ErrorCode::ProviderError, std::format("HTTP {}: {}", response.status, message));
}

auto percentEncode(std::string_view input) -> std::string
{
    constexpr auto Hex = std::string_view { "0123456789ABCDEF" };

    auto result = std::string {};
    for (auto const ch: input)
    {
        auto const c = static_cast<unsigned char>(ch);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_'
            || c == '.' || c == '~')
        {
            result += static_cast<char>(c);
        }
        else
        {
            result += '%';
            result += Hex[c >> 4];
            result += Hex[c & 0xF];
        }
    }
    return result;
}

auto buildCurlConfig(const HttpRequest& request, const CurlFiles& files) -> std::string
{
    auto config = std::string {};
    auto const line = [&config](std::string_view option, std::string_view value) {
        config += std::format("{} = {}\n", option, quote(value));
    };

    config += "silent\n";
    line("url", request.url);
    line("request", "POST");
    line("max-time", std::to_string(request.timeout.count()));
    for (auto const& [name, value]: request.headers)
        line("header", std::format("{}: {}", name, value));

    if (request.jsonBody)
    {
        line("header", "Content-Type: application/json");
        line("data-binary", std::format("@{}", files.body.string()));
    }
    else
    {
        for (auto const& [name, value]: request.formFields)
            line("form-string", std::format("{}={}", name, value));
        if (request.file)
            line("form",
                 std::format("{}=@{};filename={};type={}",
                             request.file->name,
                             files.upload.string(),
                             request.file->filename,
                             request.file->mimeType));
    }

    line("output", files.output.string());
    line("write-out", "%{http_code}");
    return config;
}

CurlHttpClient::CurlHttpClient(std::string executable): _executable(std::move(executable))
{
}

auto CurlHttpClient::post(const HttpRequest& request, std::stop_token stopToken) -> Result<HttpResponse>
{
    if (stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, "Request cancelled before it was sent");

#ifdef _WIN32
    return makeError(ErrorCode::TransportError, "HTTP requests are not supported on this platform");
#else
    auto body = TempFile {};
    auto upload = TempFile {};
    auto output = TempFile::reserve("parley_response_", ".bin");

    if (request.jsonBody)
    {
        auto const& json = *request.jsonBody;
        auto file = TempFile::withContents(
            "parley_body_",
            ".json",
            std::span(reinterpret_cast<const std::uint8_t*>(json.data()), json.size()));
        if (!file)
            return std::unexpected(file.error());
        body = std::move(*file);
    }
    else if (request.file)
    {
        auto file = TempFile::withContents("parley_upload_", ".bin", request.file->contents);
        if (!file)
            return std::unexpected(file.error());
        upload = std::move(*file);
    }

    auto const config = buildCurlConfig(request,
                                        CurlFiles {
                                            .body = body.path(),
                                            .upload = upload.path(),
                                            .output = output.path(),
                                        });

    log::debug("POST {}", request.url);
    auto outcome = runCurl(_executable, config);
    if (!outcome)
        return std::unexpected(outcome.error());

    if (outcome->exitCode != 0)
        return makeError(ErrorCode::TransportError,
                         std::format("Request to {} failed (curl exit code {})", request.url, outcome->exitCode));

    auto response = HttpResponse {};
    auto const statusText = text::trim(outcome->stdoutText);
    auto const [ptr, ec] = std::from_chars(statusText.data(), statusText.data() + statusText.size(), response.status);
    if (ec != std::errc {} || response.status == 0)
        return makeError(ErrorCode::TransportError, std::format("No HTTP status received from {}", request.url));

    auto bytes = readFileBytes(output.path());
    if (!bytes)
    {
        if (response.status >= 300)
            return classifyResponse(std::move(response));
        return std::unexpected(bytes.error());
    }
    response.body = std::move(*bytes);

    log::debug("POST {} -> HTTP {} ({} bytes)", request.url, response.status, response.body.size());
    return classifyResponse(std::move(response));
#endif
}

} // namespace parley
