/*
 * AI-AutoBuilder Block Extractor
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Splits a sanitized backend response into file proposals. The grammar is a single
 *   marker line
 *
 *       --- file: <relative/path> ---
 *
 *   followed by the file content, which runs until the next marker line or the end of
 *   the text. There is no escaping: a marker line inside generated content always starts
 *   a new block. Paths are returned exactly as written (trimmed), never normalized; the
 *   write guard decides whether they are safe.
 *
 * License: MIT.
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace autobuilder {

inline constexpr const char* kFileMarkerPrefix = "--- file: ";
inline constexpr const char* kFileMarkerSuffix = " ---";

struct FileProposal {
    std::string path;    // marker capture, trimmed, unresolved
    std::string content; // block body, trailing whitespace removed
    std::size_t line = 0; // 1-based line of the marker in the scanned text
};

class BlockScanner {
public:
    explicit BlockScanner(std::string input);
    // Proposals in document order. Blocks with blank content are dropped.
    std::vector<FileProposal> run();
    // Number of blocks dropped by the last run() because their content was blank.
    std::size_t discarded() const { return m_discarded; }
private:
    bool eof() const;
    std::size_t line_end() const;
    bool marker_path(const std::string& line, std::string& path) const;
    void flush(const std::string& path, std::size_t marker_line, std::size_t begin, std::size_t end, std::vector<FileProposal>& out);

    std::string m_input;
    std::size_t m_pos = 0;
    std::size_t m_discarded = 0;
};

// Convenience wrapper around BlockScanner.
std::vector<FileProposal> extract_blocks(const std::string& text);

} // namespace autobuilder
