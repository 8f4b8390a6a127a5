/*
 * Write Guard - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ai-autobuilder/parse/blocks.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace autobuilder {

enum class Verdict { Allowed, UnsafePath, OutsideWhitelist, WriteFailed };

// Stable identifiers used in logs: allowed, unsafe_path, outside_whitelist, write_failed.
const char* to_string(Verdict v);

struct WriteDecision {
    Verdict verdict = Verdict::Allowed;
    std::string reason;          // human readable, empty when allowed
    bool allowed() const { return verdict == Verdict::Allowed; }
};

struct Rejection {
    std::string path;
    Verdict verdict = Verdict::UnsafePath;
    std::string reason;
};

struct WriteReport {
    std::vector<std::string> written;   // in processing order
    std::vector<Rejection> rejected;    // unsafe, outside whitelist, or failed writes
    bool wrote_any() const { return !written.empty(); }
};

struct WriteGuardConfig {
    std::filesystem::path base_dir;             // every accepted path is written relative to it
    std::string output_dir = "output";          // writable subtree
    std::string state_file = "progress.json";   // writable singleton file
};

// Validates proposed paths against a traversal blacklist and a destination whitelist,
// then writes the accepted ones. Paths are checked literally: "./output/x" or
// "output\\x" are not treated as equivalent to "output/x".
class WriteGuard {
public:
    // Throws ConfigError when output_dir or state_file is not itself a safe relative path.
    explicit WriteGuard(WriteGuardConfig cfg);

    // Classification only, no I/O.
    WriteDecision check(const std::string& path) const;

    // Checks every proposal and writes the allowed ones, overwriting existing files.
    // A rejected or failed proposal never stops the batch.
    WriteReport apply(const std::vector<FileProposal>& proposals) const;

private:
    static bool is_unsafe(const std::string& path, std::string& why);
    bool in_whitelist(const std::string& path) const;
    bool write_file(const std::string& rel_path, const std::string& content, std::string& error) const;

    WriteGuardConfig m_cfg;
    std::string m_output_prefix; // output_dir with exactly one trailing '/'
};

} // namespace autobuilder
