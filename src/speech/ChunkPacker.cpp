// SPDX-License-Identifier: Apache-2.0
#include "ChunkPacker.hpp"

#include <core/Text.hpp>

#include <algorithm>

namespace parley
{

namespace
{

    /// @brief Byte length of the UTF-8 sequence introduced by @p lead. Stray bytes count as one.
    constexpr auto sequenceLength(unsigned char lead) -> std::size_t
    {
        if (lead < 0x80)
            return 1;
        if ((lead >> 5) == 0x6)
            return 2;
        if ((lead >> 4) == 0xE)
            return 3;
        if ((lead >> 3) == 0x1E)
            return 4;
        return 1;
    }

    /// @brief Splits on LF, CRLF and CR, dropping blank lines.
    auto splitLines(std::string_view text) -> std::vector<std::string_view>
    {
        auto lines = std::vector<std::string_view> {};
        auto start = std::size_t { 0 };

        auto emit = [&](std::size_t end) {
            auto const line = text.substr(start, end - start);
            if (!text::isBlank(line))
                lines.push_back(line);
        };

        for (auto i = std::size_t { 0 }; i < text.size(); ++i)
        {
            auto const ch = text[i];
            if (ch != '\n' && ch != '\r')
                continue;

            emit(i);
            if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            start = i + 1;
        }
        emit(text.size());

        return lines;
    }

    /// @brief Cuts @p line into pieces of at most @p maxChars code points.
    void hardSplit(std::string_view line, std::size_t maxChars, std::vector<std::string>& out)
    {
        auto pieceStart = std::size_t { 0 };
        auto pieceChars = std::size_t { 0 };
        auto pos = std::size_t { 0 };

        auto emit = [&](std::size_t end) {
            auto const piece = line.substr(pieceStart, end - pieceStart);
            if (!text::isBlank(piece))
                out.emplace_back(piece);
            pieceStart = end;
            pieceChars = 0;
        };

        while (pos < line.size())
        {
            auto const length = std::min(sequenceLength(static_cast<unsigned char>(line[pos])), line.size() - pos);
            pos += length;
            if (++pieceChars >= maxChars)
                emit(pos);
        }

        if (pieceStart < line.size())
            emit(line.size());
    }

} // namespace

auto codePointCount(std::string_view utf8) -> std::size_t
{
    auto count = std::size_t { 0 };
    auto pos = std::size_t { 0 };
    while (pos < utf8.size())
    {
        pos += std::min(sequenceLength(static_cast<unsigned char>(utf8[pos])), utf8.size() - pos);
        ++count;
    }
    return count;
}

auto packChunks(std::string_view text, std::size_t maxChars) -> std::vector<std::string>
{
    auto const trimmed = text::trim(text);
    if (trimmed.empty())
        return {};

    if (maxChars == 0 || codePointCount(trimmed) <= maxChars)
        return { std::string(trimmed) };

    auto chunks = std::vector<std::string> {};
    auto current = std::string {};
    auto currentChars = std::size_t { 0 };

    auto flush = [&] {
        if (!text::isBlank(current))
            chunks.push_back(std::move(current));
        current.clear();
        currentChars = 0;
    };

    for (auto const line: splitLines(trimmed))
    {
        auto const lineChars = codePointCount(line);

        if (lineChars > maxChars)
        {
            flush();
            hardSplit(line, maxChars, chunks);
            continue;
        }

        if (current.empty())
        {
            current = line;
            currentChars = lineChars;
            continue;
        }

        if (currentChars + 1 + lineChars <= maxChars)
        {
            current += '\n';
            current += line;
            currentChars += 1 + lineChars;
        }
        else
        {
            flush();
            current = line;
            currentChars = lineChars;
        }
    }

    flush();
    return chunks;
}

} // namespace parley
