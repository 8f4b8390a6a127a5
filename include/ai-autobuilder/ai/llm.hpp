#pragma once
#include <memory>
#include <string>

namespace autobuilder::ai {

struct LLMConfig {
    std::string provider = "ollama-cli";   // ollama-cli, ollama, stub
    std::string model = "qwen3-coder:480b-cloud";
    std::string command = "ollama";        // executable for ollama-cli
    std::string endpoint;                  // HTTP endpoint (ollama); empty = local default
    std::string stub_file;                 // canned response (stub)
    int timeout_seconds = 0;               // 0 = no limit
};

// Response from a backend call.
struct LLMCompletion {
    std::string text;                // raw model text, unmodified
    std::string source;              // ollama-cli|ollama|stub
    int prompt_tokens = -1;          // when the backend reports usage
    int completion_tokens = -1;
};

// One synchronous text-in/text-out call. Implementations throw BackendError when the
// backend reports a non-zero completion status.
class LLMClient {
public:
    virtual ~LLMClient() = default;
    virtual LLMCompletion complete(const std::string& prompt) = 0;
    virtual std::string describe() const = 0;
};

// Returns the content of stub_file; handy offline and in tests.
class StubLLMClient : public LLMClient {
public:
    explicit StubLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    LLMCompletion complete(const std::string& prompt) override;
    std::string describe() const override;
private:
    LLMConfig m_cfg;
};

// Runs "<command> run <model>" with the prompt on stdin and a UTF-8 C locale.
class ProcessLLMClient : public LLMClient {
public:
    explicit ProcessLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    LLMCompletion complete(const std::string& prompt) override;
    std::string describe() const override;
private:
    LLMConfig m_cfg;
};

// Ollama HTTP API (/api/generate, non streaming). Requires libcurl.
class OllamaLLMClient : public LLMClient {
public:
    explicit OllamaLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    LLMCompletion complete(const std::string& prompt) override;
    std::string describe() const override;
private:
    LLMConfig m_cfg;
};

// Throws ConfigError for an unknown provider.
std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg);

} // namespace autobuilder::ai
