/*
 * Configuration implementation - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-autobuilder/config/config.hpp>
#include <ai-autobuilder/errors.hpp>
#include <ai-autobuilder/util/text.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace autobuilder {

static std::string getenv_or(const char* k, const std::string& def=""){ const char* v=std::getenv(k); return v?std::string(v):def; }

static int parse_seconds(const std::string& key, const std::string& val){
    size_t used=0; long v=0;
    try { v=std::stol(val,&used); } catch(const std::exception&) { throw ConfigError("invalid "+key+" '"+val+"' (expected seconds)"); }
    if(used!=val.size() || v<0 || v>86400) throw ConfigError("invalid "+key+" '"+val+"' (expected 0..86400 seconds)");
    return static_cast<int>(v);
}

bool apply_setting(BuilderConfig& cfg, const std::string& key, const std::string& val){
    if(key=="project_dir") cfg.project_dir=val;
    else if(key=="llm_provider") cfg.llm_provider=val;
    else if(key=="llm_model") cfg.llm_model=val;
    else if(key=="llm_command") cfg.llm_command=val;
    else if(key=="llm_endpoint") cfg.llm_endpoint=val;
    else if(key=="llm_timeout") cfg.llm_timeout=parse_seconds(key,val);
    else if(key=="llm_stub_file") cfg.llm_stub_file=val;
    else if(key=="output_dir") cfg.output_dir=val;
    else if(key=="state_file") cfg.state_file=val;
    else if(key=="log_file") cfg.log_file=val;
    else if(key=="log_level") cfg.log_level=val;
    else if(key=="mode") cfg.mode=val;
    else return false;
    return true;
}

bool load_rc_file(const fs::path& file, BuilderConfig& cfg, bool required){
    std::ifstream in(file);
    if(!in){
        if(required) throw ConfigError("cannot read config file '"+file.string()+"'");
        return false;
    }
    std::string line; size_t lineno=0;
    while(std::getline(in,line)){
        ++lineno;
        line=util::trim(line);
        if(line.empty()||line[0]=='#') continue;
        auto eq=line.find('=');
        if(eq==std::string::npos){ spdlog::warn("{}:{}: ignoring line without '='", file.string(), lineno); continue; }
        auto key=util::trim(line.substr(0,eq)); auto val=util::trim(line.substr(eq+1));
        if(!apply_setting(cfg,key,val)) spdlog::warn("{}:{}: unknown key '{}'", file.string(), lineno, key);
    }
    spdlog::debug("loaded config {}", file.string());
    return true;
}

void apply_environment(BuilderConfig& cfg){
    std::string model=getenv_or(kModelEnvVar);
    if(!model.empty()) cfg.llm_model=model;
}

CliOptions parse_command_line(const std::vector<std::string>& args){
    CliOptions o;
    auto value_of=[&](size_t& i)->std::string{
        if(i+1>=args.size()) throw ConfigError("missing value for "+args[i]);
        return args[++i];
    };
    for(size_t i=0;i<args.size();++i){
        const std::string& a=args[i];
        if(a=="-h"||a=="--help") o.help=true;
        else if(a=="-d"||a=="--debug") o.settings.emplace_back("log_level","debug");
        else if(a=="--suggest") o.settings.emplace_back("mode","suggest");
        else if(a=="--config") o.config_file=value_of(i);
        else if(a=="--project") o.settings.emplace_back("project_dir",value_of(i));
        else if(a=="--provider") o.settings.emplace_back("llm_provider",value_of(i));
        else if(a=="--model") o.settings.emplace_back("llm_model",value_of(i));
        else if(a=="--command") o.settings.emplace_back("llm_command",value_of(i));
        else if(a=="--endpoint") o.settings.emplace_back("llm_endpoint",value_of(i));
        else if(a=="--timeout") o.settings.emplace_back("llm_timeout",value_of(i));
        else if(a=="--stub") o.settings.emplace_back("llm_stub_file",value_of(i));
        else if(a=="--log-level") o.settings.emplace_back("log_level",value_of(i));
        else throw ConfigError("unknown argument: "+a);
    }
    return o;
}

void validate(const BuilderConfig& cfg){
    if(cfg.mode!="apply" && cfg.mode!="suggest") throw ConfigError("invalid mode '"+cfg.mode+"' (expected apply|suggest)");
    if(cfg.llm_provider!="ollama-cli" && cfg.llm_provider!="ollama" && cfg.llm_provider!="stub")
        throw ConfigError("invalid llm_provider '"+cfg.llm_provider+"' (expected ollama-cli|ollama|stub)");
    if(cfg.llm_provider=="stub" && cfg.llm_stub_file.empty()) throw ConfigError("llm_provider=stub needs llm_stub_file");
    if(cfg.llm_model.empty()) throw ConfigError("llm_model is empty");
    if(spdlog::level::from_str(cfg.log_level)==spdlog::level::off && cfg.log_level!="off")
        throw ConfigError("invalid log_level '"+cfg.log_level+"' (expected debug|info|warn|error|off)");
    if(cfg.log_file.empty()) throw ConfigError("log_file is empty");
}

BuilderConfig load_config(const CliOptions& cli){
    BuilderConfig cfg;
    std::error_code ec;
    cfg.project_dir=fs::current_path(ec);
    if(ec) throw ConfigError("cannot determine current directory: "+ec.message());
    std::string home=getenv_or("HOME");
    if(!home.empty()) load_rc_file(fs::path(home)/kRcFileName, cfg, false);
    for(auto& kv: cli.settings) if(kv.first=="project_dir") cfg.project_dir=kv.second;
    load_rc_file(cfg.project_dir/kRcFileName, cfg, false);
    if(!cli.config_file.empty()) load_rc_file(cli.config_file, cfg, true);
    apply_environment(cfg);
    for(auto& kv: cli.settings) apply_setting(cfg, kv.first, kv.second);
    validate(cfg);
    return cfg;
}

ai::LLMConfig to_llm_config(const BuilderConfig& cfg){
    ai::LLMConfig lc;
    lc.provider=cfg.llm_provider;
    lc.model=cfg.llm_model;
    lc.command=cfg.llm_command;
    lc.endpoint=cfg.llm_endpoint;
    lc.stub_file=cfg.llm_stub_file;
    lc.timeout_seconds=cfg.llm_timeout;
    return lc;
}

WriteGuardConfig to_guard_config(const BuilderConfig& cfg){
    return WriteGuardConfig{cfg.project_dir, cfg.output_dir, cfg.state_file};
}

std::string usage_text(const char* argv0){
    std::ostringstream u;
    u << "Usage: " << argv0 << " [options]\n"
      << "Runs one build step: prompt -> backend -> parse -> guarded write -> log.\n\n"
      << "  --project <dir>     project root (default: current directory)\n"
      << "  --config <file>     extra rc file (key=value)\n"
      << "  --provider <name>   ollama-cli | ollama | stub\n"
      << "  --model <name>      model name (env " << kModelEnvVar << " also works)\n"
      << "  --command <exe>     executable for ollama-cli (default: ollama)\n"
      << "  --endpoint <url>    HTTP endpoint for the ollama provider\n"
      << "  --timeout <s>       backend timeout in seconds, 0 = none\n"
      << "  --stub <file>       canned response for the stub provider\n"
      << "  --suggest           parse and classify only, write nothing\n"
      << "  --log-level <lvl>   debug | info | warn | error | off\n"
      << "  -d, --debug         same as --log-level debug\n"
      << "  -h, --help          this text\n";
    return u.str();
}

} // namespace autobuilder
