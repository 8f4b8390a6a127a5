/*
 * Step runner - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ai-autobuilder/ai/llm.hpp>
#include <ai-autobuilder/config/config.hpp>
#include <ai-autobuilder/guard/write_guard.hpp>
#include <ai-autobuilder/log/run_log.hpp>
#include <ai-autobuilder/parse/blocks.hpp>
#include <ai-autobuilder/prompt/assembler.hpp>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace autobuilder {

enum class StepStatus {
    Written,         // at least one file written
    NothingWritten,  // proposals found, every one rejected or failed
    NoProposals,     // response held no usable block; not an error
    Suggested,       // suggest mode: classified, nothing written
};

const char* to_string(StepStatus s);

struct StepOutcome {
    StepStatus status = StepStatus::NoProposals;
    std::vector<FileProposal> proposals;
    std::size_t discarded_blocks = 0;                               // blocks with blank content
    WriteReport report;                                             // apply mode
    std::vector<std::pair<std::string, WriteDecision>> decisions;  // suggest mode
};

// One assemble -> invoke -> sanitize -> extract -> guard -> log cycle.
// MissingInputError and BackendError propagate; a backend failure is appended to the run
// log first.
class StepRunner {
public:
    StepRunner(BuilderConfig cfg, ai::LLMClient& llm, PromptSources sources = {});
    StepOutcome run();
    const RunLogger& run_log() const { return m_log; }
private:
    void bootstrap() const;
    void record(const std::string& text) const;

    BuilderConfig m_cfg;
    ai::LLMClient& m_llm;
    PromptSources m_sources;
    WriteGuard m_guard;
    RunLogger m_log;
};

// Human-readable result of a step: written files, skipped paths with their reason, or the
// "nothing to do" line.
void print_summary(std::ostream& out, const StepOutcome& o);

} // namespace autobuilder
