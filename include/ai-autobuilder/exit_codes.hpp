#pragma once

namespace autobuilder {

// Process exit contract of the ai-autobuilder executable. A step that wrote nothing
// (no blocks, or every block rejected) still exits with kSuccess; the printed summary
// tells the two apart.
enum class ExitCode : int {
    kSuccess = 0,
    kFailure = 1,          // unexpected I/O or system failure
    kUsage = 2,            // bad command line or configuration
    kMissingInput = 10,    // a prompt input document is absent
    kBackendFailed = 20,   // backend returned a non-zero status
};

constexpr int to_int(ExitCode code) { return static_cast<int>(code); }

} // namespace autobuilder
