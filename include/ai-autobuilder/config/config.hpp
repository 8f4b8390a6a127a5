/*
 * Configuration - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ai-autobuilder/ai/llm.hpp>
#include <ai-autobuilder/guard/write_guard.hpp>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace autobuilder {

inline constexpr const char* kRcFileName = ".ai-autobuilderrc";
inline constexpr const char* kModelEnvVar = "BUILDER_MODEL";

// Every field has an rc key of the same name.
struct BuilderConfig {
    std::filesystem::path project_dir;                 // base of every relative path below
    std::string llm_provider = "ollama-cli";          // ollama-cli|ollama|stub
    std::string llm_model = "qwen3-coder:480b-cloud";
    std::string llm_command = "ollama";
    std::string llm_endpoint;                          // empty = http://localhost:11434/api/generate
    int llm_timeout = 0;                               // seconds, 0 = unbounded
    std::string llm_stub_file;
    std::string output_dir = "output";
    std::string state_file = "progress.json";
    std::string log_file = "logs/run.log";
    std::string log_level = "info";                    // debug|info|warn|error|off
    std::string mode = "apply";                        // apply|suggest
};

// Command line, already split into rc-style settings.
struct CliOptions {
    std::vector<std::pair<std::string,std::string>> settings;
    std::string config_file;     // --config, must exist when given
    bool help = false;
};

// Applies one key=value pair. Unknown keys return false; malformed values throw ConfigError.
bool apply_setting(BuilderConfig& cfg, const std::string& key, const std::string& value);

// Reads an rc file (key=value, '#' comments). A missing optional file is not an error;
// a missing required one throws ConfigError.
bool load_rc_file(const std::filesystem::path& file, BuilderConfig& cfg, bool required);

// BUILDER_MODEL overrides llm_model.
void apply_environment(BuilderConfig& cfg);

// Throws ConfigError on an unknown option or a missing value.
CliOptions parse_command_line(const std::vector<std::string>& args);

// defaults < ~/.ai-autobuilderrc < <project>/.ai-autobuilderrc < --config < environment < command line
BuilderConfig load_config(const CliOptions& cli);

// Rejects inconsistent values (unknown mode, provider, log level...).
void validate(const BuilderConfig& cfg);

ai::LLMConfig to_llm_config(const BuilderConfig& cfg);
WriteGuardConfig to_guard_config(const BuilderConfig& cfg);

std::string usage_text(const char* argv0);

} // namespace autobuilder
