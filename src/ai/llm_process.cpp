#include <ai-autobuilder/ai/llm.hpp>
#include <ai-autobuilder/errors.hpp>
#include <ai-autobuilder/exec/process.hpp>
#include <spdlog/spdlog.h>

namespace autobuilder::ai {

LLMCompletion ProcessLLMClient::complete(const std::string& prompt) {
    ProcessSpec spec;
    spec.argv = {m_cfg.command, "run", m_cfg.model};
    // deterministic encoding regardless of the caller's locale
    spec.env = {{"LANG", "C.UTF-8"}, {"LC_ALL", "C.UTF-8"}};
    spec.input = prompt;
    spec.timeout_seconds = m_cfg.timeout_seconds;
    spdlog::debug("spawning {} run {} (prompt {} bytes, timeout {}s)", m_cfg.command, m_cfg.model, prompt.size(), m_cfg.timeout_seconds);
    ProcessResult r = run_process(spec);
    if (r.timed_out) {
        throw BackendError(r.status, "timed out after " + std::to_string(m_cfg.timeout_seconds) + "s\n" + r.err, r.out, m_cfg.command);
    }
    if (r.status != 0) throw BackendError(r.status, r.err, r.out, m_cfg.command);
    return LLMCompletion{r.out, "ollama-cli", -1, -1};
}

std::string ProcessLLMClient::describe() const { return m_cfg.command + " run " + m_cfg.model; }

} // namespace autobuilder::ai
