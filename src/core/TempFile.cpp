// SPDX-License-Identifier: Apache-2.0
#include "TempFile.hpp"

#include <core/Log.hpp>

#include <array>
#include <format>
#include <fstream>
#include <iterator>
#include <random>

namespace parley
{

namespace
{

    /// @brief Returns 32 random hex digits, enough to make temp file names collision-free.
    auto randomToken() -> std::string
    {
        thread_local auto engine = std::mt19937_64 { std::random_device {}() };
        constexpr auto Digits = std::string_view { "0123456789abcdef" };

        auto token = std::string {};
        token.reserve(32);
        for (auto i = 0; i < 2; ++i)
        {
            auto value = engine();
            for (auto j = 0; j < 16; ++j)
            {
                token.push_back(Digits[value & 0xF]);
                value >>= 4;
            }
        }
        return token;
    }

} // namespace

TempFile::~TempFile()
{
    reset();
}

TempFile::TempFile(TempFile&& other) noexcept: _path(std::move(other._path))
{
    other._path.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept
{
    if (this != &other)
    {
        reset();
        _path = std::move(other._path);
        other._path.clear();
    }
    return *this;
}

auto TempFile::reserve(std::string_view prefix, std::string_view extension) -> TempFile
{
    auto ec = std::error_code {};
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec)
        dir = ".";

    return TempFile(dir / std::format("{}{}{}", prefix, randomToken(), extension));
}

auto TempFile::withContents(std::string_view prefix,
                            std::string_view extension,
                            std::span<const std::uint8_t> bytes) -> Result<TempFile>
{
    auto file = reserve(prefix, extension);

    auto out = std::ofstream(file.path(), std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot create temporary file: {}", file.path().string()));

    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out)
        return makeError(ErrorCode::IoError, std::format("Cannot write temporary file: {}", file.path().string()));

    return file;
}

auto TempFile::read() const -> Result<std::vector<std::uint8_t>>
{
    return readFileBytes(_path);
}

void TempFile::reset()
{
    if (_path.empty())
        return;

    auto ec = std::error_code {};
    std::filesystem::remove(_path, ec);
    if (ec)
        log::warning("Failed to remove temporary file {}: {}", _path.string(), ec.message());
    _path.clear();
}

auto readFileBytes(const std::filesystem::path& path) -> Result<std::vector<std::uint8_t>>
{
    auto file = std::ifstream(path, std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path.string()));

    auto bytes = std::vector<std::uint8_t> {};
    auto buffer = std::array<char, 8192> {};
    while (file)
    {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto const count = file.gcount();
        if (count > 0)
            bytes.insert(bytes.end(), buffer.data(), buffer.data() + count);
    }

    if (file.bad())
        return makeError(ErrorCode::IoError, std::format("Failed to read file: {}", path.string()));

    return bytes;
}

} // namespace parley
