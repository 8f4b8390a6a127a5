/*
 * Write Guard implementation - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-autobuilder/guard/write_guard.hpp>
#include <ai-autobuilder/errors.hpp>
#include <ai-autobuilder/util/text.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace autobuilder {

const char* to_string(Verdict v) {
    switch (v) {
        case Verdict::Allowed: return "allowed";
        case Verdict::UnsafePath: return "unsafe_path";
        case Verdict::OutsideWhitelist: return "outside_whitelist";
        case Verdict::WriteFailed: return "write_failed";
    }
    return "unknown";
}

WriteGuard::WriteGuard(WriteGuardConfig cfg) : m_cfg(std::move(cfg)) {
    std::string why;
    std::string out = m_cfg.output_dir;
    while (!out.empty() && out.back()=='/') out.pop_back();
    if (out.empty() || is_unsafe(out, why)) throw ConfigError("invalid output_dir '" + m_cfg.output_dir + "'" + (why.empty()?"":": "+why));
    if (m_cfg.state_file.empty() || is_unsafe(m_cfg.state_file, why)) throw ConfigError("invalid state_file '" + m_cfg.state_file + "'" + (why.empty()?"":": "+why));
    m_output_prefix = out + "/";
}

bool WriteGuard::is_unsafe(const std::string& path, std::string& why) {
    if (path.empty()) { why = "empty path"; return true; }
    if (path.find("..") != std::string::npos) { why = "parent directory reference"; return true; }
    if (path.front()=='/' || path.front()=='\\') { why = "absolute path"; return true; }
    if (path.find(':') != std::string::npos) { why = "drive or scheme separator"; return true; }
    return false;
}

bool WriteGuard::in_whitelist(const std::string& path) const {
    if (path == m_cfg.state_file) return true;
    return util::starts_with(path, m_output_prefix) && path.size() > m_output_prefix.size();
}

WriteDecision WriteGuard::check(const std::string& path) const {
    WriteDecision d;
    std::string why;
    if (is_unsafe(path, why)) {
        d.verdict = Verdict::UnsafePath;
        d.reason = "unsafe path (" + why + ")";
        return d;
    }
    if (!in_whitelist(path)) {
        d.verdict = Verdict::OutsideWhitelist;
        d.reason = "not under " + m_output_prefix + " and not " + m_cfg.state_file;
    }
    return d;
}

bool WriteGuard::write_file(const std::string& rel_path, const std::string& content, std::string& error) const {
    fs::path target = m_cfg.base_dir / rel_path;
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) { error = "cannot create " + target.parent_path().string() + ": " + ec.message(); return false; }
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) { error = "cannot open " + target.string() + " for writing"; return false; }
    out << content;
    out.close();
    if (out.fail()) { error = "write to " + target.string() + " failed"; return false; }
    return true;
}

WriteReport WriteGuard::apply(const std::vector<FileProposal>& proposals) const {
    WriteReport report;
    for (auto& p : proposals) {
        WriteDecision d = check(p.path);
        if (!d.allowed()) {
            spdlog::warn("rejected {} [{}]: {}", p.path, to_string(d.verdict), d.reason);
            report.rejected.push_back(Rejection{p.path, d.verdict, d.reason});
            continue;
        }
        std::string error;
        if (!write_file(p.path, p.content, error)) {
            spdlog::error("write failed for {}: {}", p.path, error);
            report.rejected.push_back(Rejection{p.path, Verdict::WriteFailed, error});
            continue;
        }
        spdlog::info("wrote {} ({} bytes)", p.path, p.content.size());
        report.written.push_back(p.path);
    }
    return report;
}

} // namespace autobuilder
