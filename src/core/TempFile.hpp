// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace parley
{

/// @brief Exclusive owner of a file in the system temporary directory.
///
/// The file (if it was ever created) is removed when the owner is destroyed or reset.
/// Move-only; a moved-from TempFile owns nothing.
class TempFile
{
  public:
    TempFile() = default;
    ~TempFile();

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    /// @brief Reserves a fresh, unique path. The file itself is created by whoever writes it.
    /// @param prefix File name prefix, e.g. "parley_recording_".
    /// @param extension File name extension including the dot, e.g. ".wav".
    [[nodiscard]] static auto reserve(std::string_view prefix, std::string_view extension) -> TempFile;

    /// @brief Reserves a fresh path and writes the given bytes to it.
    [[nodiscard]] static auto withContents(std::string_view prefix,
                                           std::string_view extension,
                                           std::span<const std::uint8_t> bytes) -> Result<TempFile>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }
    [[nodiscard]] auto empty() const -> bool { return _path.empty(); }

    /// @brief Reads the whole file into memory.
    [[nodiscard]] auto read() const -> Result<std::vector<std::uint8_t>>;

    /// @brief Removes the file now and forgets the path.
    void reset();

  private:
    explicit TempFile(std::filesystem::path path): _path(std::move(path)) {}

    std::filesystem::path _path;
};

/// @brief Reads a whole file into memory.
[[nodiscard]] auto readFileBytes(const std::filesystem::path& path) -> Result<std::vector<std::uint8_t>>;

} // namespace parley
