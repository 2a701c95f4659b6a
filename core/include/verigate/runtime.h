#pragma once

// Isolation runtimes: the collaborator that actually runs a snippet.
//
// Every run() creates exactly one disposable instance and tears it down
// before returning, on every path (clean exit, non-zero exit, timeout,
// exception). Nothing is reused between calls.

#include "proc.h"
#include "retry.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace verigate {

struct IsolationLimits {
    size_t memory_mb{64};
    double cpus{0.5};
    int pids_limit{64};
    size_t output_max_bytes{64 * 1024};
};

struct RunRequest {
    std::string source_path; // host path; exposed to the instance read-only
    int timeout_ms{5000};
};

struct RunResult {
    bool launched{false};   // false: the instance never ran (see error)
    int exit_code{-1};
    bool timed_out{false};
    bool output_truncated{false};
    std::string out;
    std::string err;
    std::string error;      // launch / teardown diagnostics
    int64_t duration_ms{0};
};

class IsolationRuntime {
public:
    virtual ~IsolationRuntime() = default;
    virtual const char* name() const = 0;
    virtual RunResult run(const RunRequest& req) = 0;
};

// ---- Docker ----

struct DockerOptions {
    std::string docker_bin{"docker"};
    std::string image{"verigate-sandbox"};
    std::vector<std::string> interpreter{"python3"};
    std::string mount_path{"/sandbox/code.py"};
    IsolationLimits limits;
    RetryPolicy teardown_retry{3, 200, 2, 2000, 0};
    int teardown_timeout_ms{10000};
};

class DockerRuntime : public IsolationRuntime {
public:
    explicit DockerRuntime(DockerOptions opts);

    const char* name() const override { return "docker"; }
    RunResult run(const RunRequest& req) override;

    // Full `docker run` argv for one instance.
    std::vector<std::string> build_run_argv(const std::string& instance,
                                            const std::string& source_path) const;

    // `docker rm -f <instance>`, retried with backoff. True once the
    // container is gone (including "no such container").
    bool force_remove(const std::string& instance);

    // Unique per call: verigate-<pid>-<seq>-<random>.
    std::string next_instance_name();

    size_t forced_removals() const { return forced_removals_.load(); }
    const DockerOptions& options() const { return opts_; }

private:
    DockerOptions opts_;
    std::atomic<uint64_t> seq_{0};
    std::atomic<size_t> forced_removals_{0};
    std::string name_salt_;
};

// ---- local process (rlimits + optional seccomp) ----

struct ProcessOptions {
    std::vector<std::string> interpreter{"python3"};
    IsolationLimits limits;
    size_t rlimit_as_mb{512};   // interpreters need far more address space than RSS
    size_t rlimit_fsize_mb{8};
    int rlimit_nofile{64};
    int rlimit_nproc{0};        // 0 = inherit; RLIMIT_NPROC is per-user, not per-tree
    bool enable_seccomp{false};
};

class ProcessRuntime : public IsolationRuntime {
public:
    explicit ProcessRuntime(ProcessOptions opts);

    const char* name() const override { return "process"; }
    RunResult run(const RunRequest& req) override;

    ProcLimits limits_for(int timeout_ms) const;
    const ProcessOptions& options() const { return opts_; }

private:
    ProcessOptions opts_;
};

} // namespace verigate
