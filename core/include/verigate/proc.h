#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace verigate {

struct ProcLimits {
    int timeout_ms{5000};
    size_t output_max_bytes{64 * 1024}; // per stream

    int rlimit_cpu_sec{0};          // CPU time seconds (0 = leave as is)
    size_t rlimit_as_mb{0};         // virtual memory MB
    size_t rlimit_fsize_mb{0};      // max file size MB
    int rlimit_nofile{0};           // max open fds
    int rlimit_nproc{0};            // max processes (best-effort)

    bool no_new_privs{true};

    // seccomp-BPF syscall allowlist (Linux only, requires no_new_privs).
    // If installation fails the child is not started.
    bool enable_seccomp{false};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string out;    // child stdout
    std::string err;    // child stderr
    std::string error;  // internal runner error, not child stderr
    int64_t duration_ms{0};
};

// Run a process (argv[0] is executable, resolved via PATH), capture stdout
// and stderr separately, enforce the timeout and rlimits (POSIX best-effort).
// The child leads its own process group. On timeout the whole group is
// killed and the child reaped; on a normal exit the group is killed after
// the child is reaped, so nothing it left running survives the call.
//
// Returns false if the process could not be started (pipe/fork failure,
// exec failure, or a requested seccomp filter that failed to install);
// res->error then carries the reason.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res);

// Split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace verigate
