#pragma once

#include <string>
#include <chrono>

namespace chatgate {

// Shortens to at most max_len bytes, ending in "..." when cut. max_len <= 3 leaves the text untouched.
std::string truncate(const std::string& text, size_t max_len);

// Filters input to alphanumerics, '_', '-', ':' and '.' (others become ' '), limited to max_length.
std::string sanitize_field(const std::string& input, size_t max_length = 256);

std::string to_lower(std::string text);

// RFC 3339 UTC timestamp with second precision, e.g. 2024-05-01T12:00:00Z.
std::string format_utc(std::chrono::system_clock::time_point tp);

// Wall-clock time of day (HH:MM:SS, UTC) for chat-facing summaries.
std::string format_clock(std::chrono::system_clock::time_point tp);

}
