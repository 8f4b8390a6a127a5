/*
 * Configuration tests - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <ai-autobuilder/config/config.hpp>
#include <ai-autobuilder/errors.hpp>
#include "temp_project.hpp"
#include <cstdlib>

using namespace autobuilder;
using autobuilder::test_support::TempProject;

namespace {
// Keeps HOME and BUILDER_MODEL from leaking into the test.
class ConfigEnv : public ::testing::Test {
protected:
    void SetUp() override {
        save("HOME", m_home); save(kModelEnvVar, m_model);
        ::setenv("HOME", m_fakeHome.root().c_str(), 1);
        ::unsetenv(kModelEnvVar);
    }
    void TearDown() override { restore("HOME", m_home); restore(kModelEnvVar, m_model); }
    TempProject m_fakeHome{"ai_autobuilder_home"};
private:
    struct Saved { bool set = false; std::string value; };
    static void save(const char* k, Saved& s) { const char* v = std::getenv(k); s.set = v != nullptr; if (v) s.value = v; }
    static void restore(const char* k, const Saved& s) { if (s.set) ::setenv(k, s.value.c_str(), 1); else ::unsetenv(k); }
    Saved m_home, m_model;
};
} // namespace

TEST(ConfigSetting, KnownKeys) {
    BuilderConfig cfg;
    EXPECT_TRUE(apply_setting(cfg, "llm_model", "tiny"));
    EXPECT_TRUE(apply_setting(cfg, "llm_timeout", "30"));
    EXPECT_TRUE(apply_setting(cfg, "output_dir", "build"));
    EXPECT_EQ(cfg.llm_model, "tiny");
    EXPECT_EQ(cfg.llm_timeout, 30);
    EXPECT_EQ(cfg.output_dir, "build");
    EXPECT_FALSE(apply_setting(cfg, "colour", "blue"));
}

TEST(ConfigSetting, MalformedTimeout) {
    BuilderConfig cfg;
    EXPECT_THROW(apply_setting(cfg, "llm_timeout", "ten"), ConfigError);
    EXPECT_THROW(apply_setting(cfg, "llm_timeout", "10s"), ConfigError);
    EXPECT_THROW(apply_setting(cfg, "llm_timeout", "-1"), ConfigError);
    EXPECT_THROW(apply_setting(cfg, "llm_timeout", "90000"), ConfigError);
    EXPECT_EQ(cfg.llm_timeout, 0);
}

TEST(ConfigRc, CommentsBlanksAndUnknownKeys) {
    TempProject tp;
    tp.write("rc", "# comment\n\n  llm_model = qwen:7b  \nno_equals_here\ncolour=blue\nmode=suggest\n");
    BuilderConfig cfg;
    EXPECT_TRUE(load_rc_file(tp.path("rc"), cfg, true));
    EXPECT_EQ(cfg.llm_model, "qwen:7b");
    EXPECT_EQ(cfg.mode, "suggest");
}

TEST(ConfigRc, MissingFile) {
    BuilderConfig cfg;
    EXPECT_FALSE(load_rc_file("/nonexistent/ai-autobuilder.rc", cfg, false));
    EXPECT_THROW(load_rc_file("/nonexistent/ai-autobuilder.rc", cfg, true), ConfigError);
}

TEST(ConfigCli, ParsesOptions) {
    auto o = parse_command_line({"--project", "/tmp/p", "--suggest", "-d", "--timeout", "5", "--config", "x.rc"});
    EXPECT_FALSE(o.help);
    EXPECT_EQ(o.config_file, "x.rc");
    ASSERT_EQ(o.settings.size(), 4u);
    EXPECT_EQ(o.settings[0], std::make_pair(std::string("project_dir"), std::string("/tmp/p")));
    EXPECT_EQ(o.settings[1], std::make_pair(std::string("mode"), std::string("suggest")));
    EXPECT_EQ(o.settings[2], std::make_pair(std::string("log_level"), std::string("debug")));
    EXPECT_EQ(o.settings[3], std::make_pair(std::string("llm_timeout"), std::string("5")));
    EXPECT_TRUE(parse_command_line({"-h"}).help);
}

TEST(ConfigCli, Errors) {
    EXPECT_THROW(parse_command_line({"--bogus"}), ConfigError);
    EXPECT_THROW(parse_command_line({"--model"}), ConfigError);
}

TEST(ConfigValidate, RejectsBadValues) {
    BuilderConfig cfg;
    EXPECT_NO_THROW(validate(cfg));
    BuilderConfig bad = cfg; bad.mode = "dry";
    EXPECT_THROW(validate(bad), ConfigError);
    bad = cfg; bad.llm_provider = "openai";
    EXPECT_THROW(validate(bad), ConfigError);
    bad = cfg; bad.llm_provider = "stub";
    EXPECT_THROW(validate(bad), ConfigError);
    bad = cfg; bad.log_level = "chatty";
    EXPECT_THROW(validate(bad), ConfigError);
    bad = cfg; bad.log_level = "off";
    EXPECT_NO_THROW(validate(bad));
    bad = cfg; bad.llm_model.clear();
    EXPECT_THROW(validate(bad), ConfigError);
}

TEST_F(ConfigEnv, PrecedenceRcEnvironmentCommandLine) {
    TempProject project;
    m_fakeHome.write(kRcFileName, "llm_model=from-home\nllm_timeout=7\noutput_dir=home-out\n");
    project.write(kRcFileName, "llm_model=from-project\noutput_dir=gen\n");

    auto cfg = load_config(parse_command_line({"--project", project.root().string()}));
    EXPECT_EQ(cfg.project_dir, project.root());
    EXPECT_EQ(cfg.llm_model, "from-project");
    EXPECT_EQ(cfg.llm_timeout, 7);
    EXPECT_EQ(cfg.output_dir, "gen");

    ::setenv(kModelEnvVar, "from-env", 1);
    cfg = load_config(parse_command_line({"--project", project.root().string()}));
    EXPECT_EQ(cfg.llm_model, "from-env");

    cfg = load_config(parse_command_line({"--project", project.root().string(), "--model", "from-cli"}));
    EXPECT_EQ(cfg.llm_model, "from-cli");
}

TEST_F(ConfigEnv, ExplicitConfigFileMustExist) {
    TempProject project;
    EXPECT_THROW(load_config(parse_command_line({"--project", project.root().string(), "--config", project.path("nope.rc").string()})),
                 ConfigError);
    project.write("extra.rc", "llm_provider=stub\nllm_stub_file=canned.txt\n");
    auto cfg = load_config(parse_command_line({"--project", project.root().string(), "--config", project.path("extra.rc").string()}));
    EXPECT_EQ(cfg.llm_provider, "stub");
    auto lc = to_llm_config(cfg);
    EXPECT_EQ(lc.provider, "stub");
    EXPECT_EQ(lc.stub_file, "canned.txt");
    auto gc = to_guard_config(cfg);
    EXPECT_EQ(gc.base_dir, project.root());
    EXPECT_EQ(gc.output_dir, "output");
}

TEST_F(ConfigEnv, InvalidValueFromRcIsConfigError) {
    TempProject project;
    project.write(kRcFileName, "mode=yolo\n");
    EXPECT_THROW(load_config(parse_command_line({"--project", project.root().string()})), ConfigError);
}
