/*
 * Prompt assembler - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace autobuilder {

// One named input document. The first section (the template) is emitted without a header,
// the others as "--- <name> ---" followed by their text.
struct PromptSection {
    std::string name;                 // header label, e.g. project.md
    std::filesystem::path source;     // file the text was read from
    std::string text;
};

struct PromptDocument {
    std::vector<PromptSection> sections;
    // Sections joined as the backend expects them, surrounding whitespace stripped.
    std::string render() const;
};

struct PromptSources {
    std::filesystem::path template_file = "agent/prompt.txt";
    std::filesystem::path project_file = "project.md";
    std::filesystem::path rules_file = "rules.json";
    std::filesystem::path progress_file = "progress.json";
};

// Reads a whole file; throws MissingInputError when it does not exist or cannot be opened.
std::string read_input_file(const std::filesystem::path& path);

// Reads the four input documents relative to base_dir. Throws MissingInputError on the
// first absent one, before anything else happens.
PromptDocument assemble_prompt(const std::filesystem::path& base_dir, const PromptSources& sources = {});

} // namespace autobuilder
