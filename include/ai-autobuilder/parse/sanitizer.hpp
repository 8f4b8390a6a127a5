/*
 * Response sanitizer - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace autobuilder {

// Bare section delimiter the backend sometimes leaves dangling at the end of a response.
inline constexpr const char* kSectionDelimiter = "---";

// Splits the text into lines (any line break, CRLF included) and rejoins them with '\n'.
// Trailing lines that are only a section delimiter are dropped repeatedly, along with the
// blank lines that follow them; blank lines not followed by a delimiter stay. The result
// is a fixed point: sanitize_response(sanitize_response(x)) == sanitize_response(x).
std::string sanitize_response(const std::string& raw);

} // namespace autobuilder
