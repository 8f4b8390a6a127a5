/*
 * Error types - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace autobuilder {

// Base of every fatal error raised by a step.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// A required input document is absent. Raised before the backend is invoked.
class MissingInputError : public Error {
public:
    explicit MissingInputError(const std::string& path)
        : Error("Missing file: " + path), m_path(path) {}
    const std::string& path() const { return m_path; }
private:
    std::string m_path;
};

// The backend reported a non-zero completion status (exit code, HTTP code or curl code).
class BackendError : public Error {
public:
    BackendError(int status, std::string stderr_text, std::string stdout_text, const std::string& backend = "backend")
        : Error(backend + " failed with code " + std::to_string(status) + ":\nSTDERR: " + stderr_text + "\nSTDOUT: " + stdout_text),
          m_status(status), m_stderr(std::move(stderr_text)), m_stdout(std::move(stdout_text)) {}
    int status() const { return m_status; }
    const std::string& stderr_text() const { return m_stderr; }
    const std::string& stdout_text() const { return m_stdout; }
private:
    int m_status;
    std::string m_stderr;
    std::string m_stdout;
};

// Invalid rc file value or command line argument.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace autobuilder
