// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace parley
{

/// @brief Error codes for categorizing failures across the voice pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    InvalidState,
    Cancelled,
    IoError,
    ConfigError,
    AudioError,
    TransportError,

    // Provider configuration
    NotConfigured,
    InvalidEndpoint,
    MissingVoice,

    // Recording
    PermissionDenied,
    RecordingFailed,

    // Remote providers and playback
    ProviderError,
    AuthenticationFailed,
    PlaybackDecodeError,
};

/// @brief Returns a stable lowercase name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::InvalidState: return "invalid-state";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::ConfigError: return "config-error";
        case ErrorCode::AudioError: return "audio-error";
        case ErrorCode::TransportError: return "transport-error";
        case ErrorCode::NotConfigured: return "not-configured";
        case ErrorCode::InvalidEndpoint: return "invalid-endpoint";
        case ErrorCode::MissingVoice: return "missing-voice";
        case ErrorCode::PermissionDenied: return "permission-denied";
        case ErrorCode::RecordingFailed: return "recording-failed";
        case ErrorCode::ProviderError: return "provider-error";
        case ErrorCode::AuthenticationFailed: return "authentication-failed";
        case ErrorCode::PlaybackDecodeError: return "playback-decode-error";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace parley

template <>
struct std::formatter<parley::Error>: std::formatter<std::string>
{
    auto format(const parley::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", parley::errorCodeName(error.code), error.message), ctx);
    }
};
