#include <gtest/gtest.h>
#include <ai-autobuilder/prompt/assembler.hpp>
#include <ai-autobuilder/errors.hpp>
#include "temp_project.hpp"

using namespace autobuilder;

TEST(PromptAssembler, SectionOrderAndHeaders) {
    test_support::TempProject proj;
    proj.write("agent/prompt.txt", "\nTEMPLATE\n");
    proj.write("project.md", "PROJECT");
    proj.write("rules.json", "RULES");
    proj.write("progress.json", "PROGRESS\n");
    auto doc = assemble_prompt(proj.root());
    ASSERT_EQ(doc.sections.size(), 4u);
    EXPECT_EQ(doc.sections[1].name, "project.md");
    EXPECT_EQ(doc.sections[0].source, proj.path("agent/prompt.txt"));
    EXPECT_EQ(doc.sections[3].source, proj.path("progress.json"));
    EXPECT_EQ(doc.render(),
              "TEMPLATE\n\n\n--- project.md ---\nPROJECT\n\n--- rules.json ---\nRULES\n\n--- progress.json ---\nPROGRESS");
}

TEST(PromptAssembler, MissingInputNamesTheFile) {
    test_support::TempProject proj;
    proj.write_inputs();
    std::filesystem::remove(proj.path("rules.json"));
    try {
        assemble_prompt(proj.root());
        FAIL() << "expected MissingInputError";
    } catch (const MissingInputError& e) {
        EXPECT_EQ(e.path(), proj.path("rules.json").string());
        EXPECT_NE(std::string(e.what()).find("rules.json"), std::string::npos);
    }
}

TEST(PromptAssembler, DirectoryIsNotAnInput) {
    test_support::TempProject proj;
    proj.write_inputs();
    std::filesystem::remove(proj.path("project.md"));
    std::filesystem::create_directories(proj.path("project.md"));
    EXPECT_THROW(assemble_prompt(proj.root()), MissingInputError);
}

TEST(PromptAssembler, CustomSources) {
    test_support::TempProject proj;
    proj.write("t.txt", "T"); proj.write("p.md", "P"); proj.write("r.json", "R"); proj.write("s.json", "S");
    PromptSources src{"t.txt", "p.md", "r.json", "s.json"};
    EXPECT_EQ(assemble_prompt(proj.root(), src).render(), "T\n\n--- p.md ---\nP\n\n--- r.json ---\nR\n\n--- s.json ---\nS");
}
