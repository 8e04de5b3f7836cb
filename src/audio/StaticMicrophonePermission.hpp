// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Devices.hpp>

#include <atomic>

namespace parley
{

/// @brief MicrophonePermission driven by configuration.
///
/// Desktop Linux has no OS-level microphone prompt; access is whatever the configuration says. A status of
/// NotDetermined makes the first request() grant access, which stands in for the user accepting a prompt.
class StaticMicrophonePermission final: public MicrophonePermission
{
  public:
    explicit StaticMicrophonePermission(PermissionStatus status): _status(status) {}

    [[nodiscard]] auto status() const -> PermissionStatus override { return _status.load(); }

    [[nodiscard]] auto request() -> bool override
    {
        auto expected = PermissionStatus::NotDetermined;
        _status.compare_exchange_strong(expected, PermissionStatus::Authorized);
        return _status.load() == PermissionStatus::Authorized;
    }

  private:
    std::atomic<PermissionStatus> _status;
};

} // namespace parley
