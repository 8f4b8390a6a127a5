#include <ai-autobuilder/ai/llm.hpp>
#include <ai-autobuilder/errors.hpp>
#include <fstream>
#include <sstream>

namespace autobuilder::ai {

LLMCompletion StubLLMClient::complete(const std::string&) {
    std::ifstream in(m_cfg.stub_file, std::ios::binary);
    if (m_cfg.stub_file.empty() || !in) {
        throw BackendError(1, "stub response file not readable: '" + m_cfg.stub_file + "'", "", "stub");
    }
    std::ostringstream oss; oss << in.rdbuf();
    return LLMCompletion{oss.str(), "stub", -1, -1};
}

std::string StubLLMClient::describe() const { return "stub(" + m_cfg.stub_file + ")"; }

std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg) {
    if (cfg.provider == "ollama-cli") return std::make_unique<ProcessLLMClient>(cfg);
    if (cfg.provider == "ollama") return std::make_unique<OllamaLLMClient>(cfg);
    if (cfg.provider == "stub") return std::make_unique<StubLLMClient>(cfg);
    throw ConfigError("unknown llm_provider '" + cfg.provider + "' (expected ollama-cli|ollama|stub)");
}

} // namespace autobuilder::ai
