/*
 * Step runner implementation - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-autobuilder/step/step.hpp>
#include <ai-autobuilder/errors.hpp>
#include <ai-autobuilder/parse/sanitizer.hpp>
#include <spdlog/spdlog.h>
#include <ostream>
#include <system_error>

namespace fs = std::filesystem;

namespace autobuilder {

const char* to_string(StepStatus s) {
    switch (s) {
        case StepStatus::Written: return "written";
        case StepStatus::NothingWritten: return "nothing_written";
        case StepStatus::NoProposals: return "no_proposals";
        case StepStatus::Suggested: return "suggested";
    }
    return "unknown";
}

StepRunner::StepRunner(BuilderConfig cfg, ai::LLMClient& llm, PromptSources sources)
    : m_cfg(std::move(cfg)), m_llm(llm), m_sources(std::move(sources)),
      m_guard(to_guard_config(m_cfg)), m_log(m_cfg.project_dir / m_cfg.log_file) {}

void StepRunner::bootstrap() const {
    for (const fs::path& dir : {m_cfg.project_dir / m_cfg.output_dir, m_log.file().parent_path()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) spdlog::warn("cannot create {}: {}", dir.string(), ec.message());
    }
}

void StepRunner::record(const std::string& text) const {
    std::string error;
    if (!m_log.append(text, &error)) spdlog::error("run log not updated: {}", error);
}

StepOutcome StepRunner::run() {
    bootstrap();
    PromptDocument doc = assemble_prompt(m_cfg.project_dir, m_sources);
    std::string prompt = doc.render();
    for (auto& sec : doc.sections) spdlog::debug("prompt section {} <- {} ({} bytes)", sec.name, sec.source.string(), sec.text.size());
    spdlog::debug("prompt assembled: {} sections, {} bytes", doc.sections.size(), prompt.size());

    std::string cleaned;
    try {
        spdlog::info("invoking {}", m_llm.describe());
        ai::LLMCompletion completion = m_llm.complete(prompt);
        if (completion.completion_tokens >= 0)
            spdlog::debug("usage: prompt={} completion={}", completion.prompt_tokens, completion.completion_tokens);
        cleaned = sanitize_response(completion.text);
    } catch (const std::exception& e) {
        spdlog::error("backend call failed: {}", e.what());
        record(std::string("ERROR: ") + e.what());
        throw;
    }
    record(cleaned);

    StepOutcome outcome;
    BlockScanner scanner(cleaned);
    outcome.proposals = scanner.run();
    outcome.discarded_blocks = scanner.discarded();
    if (outcome.discarded_blocks > 0) spdlog::debug("{} empty block(s) discarded", outcome.discarded_blocks);
    if (outcome.proposals.empty()) {
        spdlog::info("response contained no file blocks");
        outcome.status = StepStatus::NoProposals;
        return outcome;
    }
    spdlog::info("{} file proposal(s) extracted", outcome.proposals.size());

    if (m_cfg.mode == "suggest") {
        for (auto& p : outcome.proposals) outcome.decisions.emplace_back(p.path, m_guard.check(p.path));
        outcome.status = StepStatus::Suggested;
        return outcome;
    }
    outcome.report = m_guard.apply(outcome.proposals);
    outcome.status = outcome.report.wrote_any() ? StepStatus::Written : StepStatus::NothingWritten;
    return outcome;
}

void print_summary(std::ostream& out, const StepOutcome& o) {
    switch (o.status) {
        case StepStatus::NoProposals:
            out << "No files to write. Agent did nothing.\n";
            return;
        case StepStatus::Suggested:
            out << "Proposed files (suggest mode, nothing written):\n";
            for (auto& d : o.decisions) {
                out << " - " << d.first << " [" << to_string(d.second.verdict) << "]";
                if (!d.second.allowed()) out << " " << d.second.reason;
                out << "\n";
            }
            return;
        case StepStatus::Written:
        case StepStatus::NothingWritten:
            break;
    }
    for (auto& r : o.report.rejected) {
        if (r.verdict == Verdict::UnsafePath) out << "Skipped unsafe path: ";
        else if (r.verdict == Verdict::OutsideWhitelist) out << "Skipped unauthorized path: ";
        else out << "Failed to write: ";
        out << r.path << " (" << r.reason << ")\n";
    }
    if (o.status == StepStatus::NothingWritten) {
        out << "No permitted files written.\n";
        return;
    }
    out << "Written files:\n";
    for (auto& w : o.report.written) out << " - " << w << "\n";
}

} // namespace autobuilder
