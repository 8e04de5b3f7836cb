// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace parley
{

/// @brief Splits text into ordered pieces that each fit a provider's request size limit.
///
/// The input is trimmed first. If it fits, it is returned as a single chunk. Otherwise it is split into
/// lines (LF, CRLF or CR) and the non-blank lines are packed greedily, joined by '\n', into chunks of at
/// most @p maxChars characters. A line that alone exceeds the limit is hard-split every @p maxChars
/// characters, without looking for word boundaries, and its pieces take the line's place in the stream.
///
/// Lengths are counted in Unicode code points and a multi-byte UTF-8 sequence is never cut. Blank lines
/// and blank hard-split pieces are dropped, so no chunk is ever empty or whitespace only.
///
/// @param text The text to split.
/// @param maxChars The maximum chunk length in code points. Zero means unlimited.
/// @return The chunks in input order; empty if the trimmed input is empty.
[[nodiscard]] auto packChunks(std::string_view text, std::size_t maxChars) -> std::vector<std::string>;

/// @brief Counts the Unicode code points in a UTF-8 string.
///
/// Invalid bytes count as one character each, matching how packChunks() measures lengths.
[[nodiscard]] auto codePointCount(std::string_view utf8) -> std::size_t;

} // namespace parley
