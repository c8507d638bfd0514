#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace archive_mcp {

constexpr std::size_t kDefaultSummaryLength = 200;

// ---------------------------------------------------------------------------
// GenerateSummary — extractive summary of the leading text.
//
//   1. Trim leading/trailing whitespace, keep the first max_length bytes.
//   2. Collapse every whitespace run (newlines included) to one space.
//   3. If content is longer than max_length: cut after the last ". ", "! "
//      or "? " located beyond max_length / 2, else append "...".
//
// The result is at most max_length + 3 bytes long.
// ---------------------------------------------------------------------------
std::string GenerateSummary(std::string_view content,
                            std::size_t max_length = kDefaultSummaryLength);

// Number of whitespace-separated tokens.
std::size_t CountWords(std::string_view content);

} // namespace archive_mcp
