/*
 * Run log - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>

namespace autobuilder {

// Local time, "YYYY-MM-DD HH:MM:SS.ffffff".
std::string format_log_timestamp(std::chrono::system_clock::time_point tp);

// Append-only record of every step. Each append opens the file, writes one entry
//
//     \n[<timestamp>]\n<text>\n
//
// and closes it again. The file is never truncated or read back. There is no locking:
// two processes appending at once may interleave.
class RunLogger {
public:
    explicit RunLogger(std::filesystem::path file) : m_file(std::move(file)) {}

    // Creates the parent directory if needed. Returns false (and fills error) on I/O failure.
    bool append(const std::string& text, std::string* error = nullptr) const;
    bool append(const std::string& text, std::chrono::system_clock::time_point when, std::string* error = nullptr) const;

    const std::filesystem::path& file() const { return m_file; }
private:
    std::filesystem::path m_file;
};

} // namespace autobuilder
