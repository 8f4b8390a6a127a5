/*
 * Child process execution - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace autobuilder {

struct ProcessSpec {
    std::vector<std::string> argv;                               // argv[0] resolved through PATH
    std::vector<std::pair<std::string,std::string>> env;         // added to / overriding the inherited environment
    std::string input;                                           // written to the child's stdin, then EOF
    int timeout_seconds = 0;                                     // 0 = wait forever
};

struct ProcessResult {
    int status = 0;          // exit code, 128+signal when killed, 127 when not found
    std::string out;
    std::string err;
    bool timed_out = false;
};

// Resolve command name to an executable path using path_env (a PATH-style list).
// A name containing '/' is only checked for being executable.
std::optional<std::string> resolve_executable(const std::string& cmd, const char* path_env);

// Runs argv synchronously, feeding input and capturing both output streams.
// Throws std::system_error when pipes or fork fail; a missing executable is reported
// as status 127 rather than thrown.
ProcessResult run_process(const ProcessSpec& spec);

} // namespace autobuilder
