#include <ai-autobuilder/parse/sanitizer.hpp>
#include <ai-autobuilder/util/text.hpp>
#include <vector>

namespace autobuilder {

// Length of the line break starting at text[i], 0 when there is none. Besides "\n", "\r\n"
// and "\r" this accepts \v, \f, \x1c-\x1e and the UTF-8 forms of U+0085, U+2028, U+2029.
static size_t line_break_at(const std::string& text, size_t i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c == '\r') return (i+1 < text.size() && text[i+1] == '\n') ? 2 : 1;
    if (c == '\n' || c == '\v' || c == '\f' || (c >= 0x1c && c <= 0x1e)) return 1;
    if (c == 0xC2 && i+1 < text.size() && static_cast<unsigned char>(text[i+1]) == 0x85) return 2;
    if (c == 0xE2 && i+2 < text.size() && static_cast<unsigned char>(text[i+1]) == 0x80) {
        unsigned char d = static_cast<unsigned char>(text[i+2]);
        if (d == 0xA8 || d == 0xA9) return 3;
    }
    return 0;
}

// A break after the last line does not add an empty line.
static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0, i = 0;
    while (i < text.size()) {
        size_t n = line_break_at(text, i);
        if (n == 0) { ++i; continue; }
        lines.push_back(text.substr(start, i-start));
        i += n; start = i;
    }
    if (start < text.size()) lines.push_back(text.substr(start));
    return lines;
}

static bool is_blank(const std::string& line) { return util::trim(line).empty(); }

std::string sanitize_response(const std::string& raw) {
    std::vector<std::string> lines = split_lines(raw);
    while (true) {
        size_t n = lines.size();
        while (n > 0 && is_blank(lines[n-1])) --n;
        if (n == 0 || util::trim(lines[n-1]) != kSectionDelimiter) break;
        lines.resize(n-1);
    }
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    // an empty last line needs its own terminator to survive the next split
    if (!lines.empty() && lines.back().empty()) out += '\n';
    return out;
}

} // namespace autobuilder
