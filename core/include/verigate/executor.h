#pragma once

#include "runtime.h"
#include "types.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace verigate {

// A file that exists for exactly the lifetime of this object.
// Created with mkstemp (then made world-readable so an unprivileged
// sandbox user can read the bind mount); removed in the destructor.
class ScopedTempFile {
public:
    // dir empty = system temp directory. On failure ok() is false and
    // error() explains why.
    ScopedTempFile(const std::string& dir, const std::string& suffix, const std::string& contents);
    ~ScopedTempFile();
    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::string path_;
    std::string error_;
};

struct ExecutorOptions {
    std::chrono::milliseconds default_timeout{5000};
    std::string temp_dir;               // empty = system temp
    std::string file_suffix{".py"};
};

// Runs one snippet in one fresh isolation instance. One attempt only;
// retrying across different candidates is the orchestrator's job.
class SandboxExecutor {
public:
    explicit SandboxExecutor(std::unique_ptr<IsolationRuntime> runtime, ExecutorOptions opts = {});

    // Precondition: source already passed the screener. A non-positive
    // timeout falls back to options().default_timeout. The temp file and
    // the instance are gone when this returns (or throws).
    ExecutionOutcome execute(const std::string& source, std::chrono::milliseconds timeout);

    IsolationRuntime& runtime() { return *runtime_; }
    const ExecutorOptions& options() const { return opts_; }

    // Number of isolation instances requested so far.
    size_t executions() const { return executions_.load(); }

private:
    std::unique_ptr<IsolationRuntime> runtime_;
    ExecutorOptions opts_;
    std::atomic<size_t> executions_{0};
};

} // namespace verigate
