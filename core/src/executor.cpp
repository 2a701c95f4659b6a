#include "verigate/executor.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <vector>

#ifndef _WIN32
  #include <unistd.h>
  #include <sys/stat.h>
#endif

namespace verigate {

static std::string trim_ws(std::string s) {
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    size_t i = 0;
    while (i < s.size() && std::isspace((unsigned char)s[i])) i++;
    if (i) s.erase(0, i);
    return s;
}

// ---- ScopedTempFile ----

ScopedTempFile::ScopedTempFile(const std::string& dir, const std::string& suffix, const std::string& contents) {
#ifdef _WIN32
    (void)dir; (void)suffix; (void)contents;
    error_ = "temp files not supported on Windows";
#else
    std::error_code ec;
    std::filesystem::path base = dir.empty() ? std::filesystem::temp_directory_path(ec) : std::filesystem::path(dir);
    if (ec) {
        error_ = "temp dir: " + ec.message();
        return;
    }

    std::string tmpl = (base / "verigate-XXXXXX").string() + suffix;
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = mkstemps(buf.data(), (int)suffix.size());
    if (fd < 0) {
        error_ = std::string("mkstemps failed: ") + std::strerror(errno);
        return;
    }
    std::string path(buf.data());

    size_t off = 0;
    while (off < contents.size()) {
        ssize_t n = write(fd, contents.data() + off, contents.size() - off);
        if (n > 0) { off += (size_t)n; continue; }
        if (n < 0 && errno == EINTR) continue;
        error_ = std::string("write failed: ") + std::strerror(errno);
        close(fd);
        (void)unlink(path.c_str());
        return;
    }
    if (fchmod(fd, 0644) != 0 || close(fd) != 0) {
        error_ = std::string("finalize failed: ") + std::strerror(errno);
        (void)unlink(path.c_str());
        return;
    }
    path_ = std::move(path);
#endif
}

ScopedTempFile::~ScopedTempFile() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

// ---- SandboxExecutor ----

SandboxExecutor::SandboxExecutor(std::unique_ptr<IsolationRuntime> runtime, ExecutorOptions opts)
    : runtime_(std::move(runtime)), opts_(std::move(opts)) {
    if (!runtime_) throw std::invalid_argument("SandboxExecutor: null runtime");
    if (opts_.default_timeout.count() <= 0) opts_.default_timeout = std::chrono::milliseconds(5000);
}

ExecutionOutcome SandboxExecutor::execute(const std::string& source, std::chrono::milliseconds timeout) {
    ExecutionOutcome oc;
    oc.runtime = runtime_->name();
    if (timeout.count() <= 0) timeout = opts_.default_timeout;

    ScopedTempFile src(opts_.temp_dir, opts_.file_suffix, source);
    if (!src.ok()) {
        oc.failure_kind = FailureKind::LAUNCH_ERROR;
        oc.error = src.error();
        return oc;
    }

    RunRequest req;
    req.source_path = src.path();
    req.timeout_ms = (int)timeout.count();

    executions_++;
    RunResult rr = runtime_->run(req);

    oc.exit_code = rr.exit_code;
    oc.stdout_text = trim_ws(std::move(rr.out));
    oc.stderr_text = trim_ws(std::move(rr.err));
    oc.output_truncated = rr.output_truncated;
    oc.duration_ms = rr.duration_ms;
    oc.error = std::move(rr.error);

    if (rr.timed_out) {
        oc.failure_kind = FailureKind::TIMEOUT;
    } else if (!rr.launched) {
        oc.failure_kind = FailureKind::LAUNCH_ERROR;
    } else if (rr.exit_code != 0) {
        oc.failure_kind = FailureKind::NONZERO_EXIT;
    } else {
        oc.success = true;
    }
    return oc;
}

} // namespace verigate
