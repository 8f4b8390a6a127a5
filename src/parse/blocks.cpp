/*
 * Block Extractor implementation - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-autobuilder/parse/blocks.hpp>
#include <ai-autobuilder/util/text.hpp>
#include <cstring>

namespace autobuilder {

BlockScanner::BlockScanner(std::string input) : m_input(std::move(input)) {}

bool BlockScanner::eof() const { return m_pos >= m_input.size(); }

std::size_t BlockScanner::line_end() const {
    std::size_t nl = m_input.find('\n', m_pos);
    return nl == std::string::npos ? m_input.size() : nl;
}

bool BlockScanner::marker_path(const std::string& raw_line, std::string& path) const {
    std::string line = raw_line;
    if (!line.empty() && line.back()=='\r') line.pop_back(); // tolerate CRLF responses
    const std::size_t pre = std::strlen(kFileMarkerPrefix);
    const std::size_t suf = std::strlen(kFileMarkerSuffix);
    // the capture needs at least one character between prefix and suffix
    if (line.size() < pre + suf + 1) return false;
    if (!util::starts_with(line, kFileMarkerPrefix) || !util::ends_with(line, kFileMarkerSuffix)) return false;
    path = util::trim(line.substr(pre, line.size() - pre - suf));
    return true;
}

void BlockScanner::flush(const std::string& path, std::size_t marker_line, std::size_t begin, std::size_t end, std::vector<FileProposal>& out) {
    std::string content = end > begin ? m_input.substr(begin, end - begin) : std::string();
    content = util::rtrim(content);
    if (content.empty()) { ++m_discarded; return; }
    out.push_back(FileProposal{path, std::move(content), marker_line});
}

std::vector<FileProposal> BlockScanner::run() {
    std::vector<FileProposal> out;
    m_pos = 0; m_discarded = 0;
    bool in_block = false;
    std::string path;
    std::size_t marker_line = 0, begin = 0, lineno = 0;
    while (!eof()) {
        std::size_t le = line_end();
        ++lineno;
        std::string next_path;
        if (marker_path(m_input.substr(m_pos, le - m_pos), next_path)) {
            // previous content stops before the newline that precedes this marker
            if (in_block) flush(path, marker_line, begin, m_pos > 0 ? m_pos - 1 : 0, out);
            in_block = true;
            path = next_path;
            marker_line = lineno;
            begin = le < m_input.size() ? le + 1 : le;
        }
        m_pos = le + 1;
    }
    if (in_block) flush(path, marker_line, begin, m_input.size(), out);
    return out;
}

std::vector<FileProposal> extract_blocks(const std::string& text) {
    BlockScanner scanner(text);
    return scanner.run();
}

} // namespace autobuilder
