#include <ai-autobuilder/prompt/assembler.hpp>
#include <ai-autobuilder/errors.hpp>
#include <ai-autobuilder/util/text.hpp>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace autobuilder {

std::string read_input_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) throw MissingInputError(path.string());
    std::ifstream in(path, std::ios::binary);
    if (!in) throw MissingInputError(path.string());
    std::ostringstream oss; oss << in.rdbuf();
    return oss.str();
}

std::string PromptDocument::render() const {
    std::string out;
    for (size_t i=0;i<sections.size();++i) {
        auto& s = sections[i];
        if (i==0) { out += s.text; continue; }
        out += "\n\n--- " + s.name + " ---\n" + s.text;
    }
    return util::trim(out);
}

PromptDocument assemble_prompt(const fs::path& base_dir, const PromptSources& sources) {
    PromptDocument doc;
    auto add = [&](const fs::path& rel){
        fs::path full = base_dir / rel;
        doc.sections.push_back(PromptSection{rel.filename().string(), full, read_input_file(full)});
    };
    add(sources.template_file);
    add(sources.project_file);
    add(sources.rules_file);
    add(sources.progress_file);
    return doc;
}

} // namespace autobuilder
