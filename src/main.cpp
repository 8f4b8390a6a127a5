// AI-AutoBuilder main: runs exactly one build step and exits.
#include <ai-autobuilder/ai/llm.hpp>
#include <ai-autobuilder/config/config.hpp>
#include <ai-autobuilder/errors.hpp>
#include <ai-autobuilder/exit_codes.hpp>
#include <ai-autobuilder/step/step.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <string>
#include <vector>

using namespace autobuilder;

int main(int argc, char* argv[]) {
    auto console = spdlog::stderr_color_mt("ai-autobuilder");
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(console);

    std::vector<std::string> args(argv + 1, argv + argc);
    BuilderConfig cfg;
    try {
        CliOptions cli = parse_command_line(args);
        if (cli.help) { std::cout << usage_text(argv[0]); return to_int(ExitCode::kSuccess); }
        // level from the command line first so rc loading can be traced
        for (auto& kv : cli.settings) if (kv.first == "log_level") spdlog::set_level(spdlog::level::from_str(kv.second));
        cfg = load_config(cli);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n" << usage_text(argv[0]);
        return to_int(ExitCode::kUsage);
    }
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));
    spdlog::debug("project={} provider={} model={} mode={}", cfg.project_dir.string(), cfg.llm_provider, cfg.llm_model, cfg.mode);

    try {
        auto llm = ai::make_llm(to_llm_config(cfg));
        StepRunner runner(cfg, *llm);
        StepOutcome outcome = runner.run();
        print_summary(std::cout, outcome);
        spdlog::info("run log: {}", runner.run_log().file().string());
        spdlog::debug("step finished: {}", to_string(outcome.status));
        return to_int(ExitCode::kSuccess);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return to_int(ExitCode::kUsage);
    } catch (const MissingInputError& e) {
        spdlog::error("{}", e.what());
        return to_int(ExitCode::kMissingInput);
    } catch (const BackendError& e) {
        std::cerr << e.what() << "\n";
        return to_int(ExitCode::kBackendFailed);
    } catch (const std::exception& e) {
        spdlog::error("step aborted: {}", e.what());
        return to_int(ExitCode::kFailure);
    }
}
