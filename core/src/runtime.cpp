#include "verigate/runtime.h"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

#ifndef _WIN32
  #include <unistd.h>
#endif

namespace verigate {

namespace {

std::string random_salt() {
    uint64_t r = 0;
    try {
        std::random_device rd;
        r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
    } catch (const std::exception&) {
        r = (uint64_t)std::chrono::steady_clock::now().time_since_epoch().count() ^ 0x9e3779b97f4a7c15ULL;
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << (uint32_t)(r ^ (r >> 32));
    return oss.str();
}

std::string format_cpus(double cpus) {
    if (!(cpus > 0.0)) cpus = 0.5;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << cpus;
    std::string s = oss.str();
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

std::string first_line(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && (s[i] == '\n' || s[i] == '\r' || s[i] == ' ')) i++;
    size_t e = s.find('\n', i);
    return s.substr(i, e == std::string::npos ? std::string::npos : e - i);
}

// First stderr line written by the docker client itself ("docker: ..."),
// or empty when the output came from the contained process.
std::string docker_client_error(const std::string& err) {
    std::istringstream in(err);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("docker:", 0) == 0) return line;
    }
    return "";
}

// Removes the container on scope exit unless released. Covers the
// timeout path and any exception thrown between launch and return.
class ContainerGuard {
public:
    ContainerGuard(DockerRuntime& rt, std::string instance)
        : rt_(rt), instance_(std::move(instance)) {}
    ~ContainerGuard() {
        if (!armed_) return;
        try {
            teardown();
        } catch (const std::exception& e) {
            std::cerr << "[verigate] container teardown failed for " << instance_ << ": " << e.what() << "\n";
        }
    }
    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

    void release() { armed_ = false; }
    bool teardown() {
        armed_ = false;
        return rt_.force_remove(instance_);
    }

private:
    DockerRuntime& rt_;
    std::string instance_;
    bool armed_{true};
};

} // namespace

// ---- DockerRuntime ----

DockerRuntime::DockerRuntime(DockerOptions opts)
    : opts_(std::move(opts)), name_salt_(random_salt()) {}

std::string DockerRuntime::next_instance_name() {
    uint64_t n = ++seq_;
    std::ostringstream oss;
#ifndef _WIN32
    oss << "verigate-" << (long)getpid() << "-" << n << "-" << name_salt_;
#else
    oss << "verigate-" << n << "-" << name_salt_;
#endif
    return oss.str();
}

std::vector<std::string> DockerRuntime::build_run_argv(const std::string& instance,
                                                       const std::string& source_path) const {
    const auto& lim = opts_.limits;
    const std::string mem = std::to_string(lim.memory_mb > 0 ? lim.memory_mb : 64) + "m";

    std::vector<std::string> argv = {
        opts_.docker_bin, "run", "--rm",
        "--name", instance,
        "--network", "none",
        "--memory", mem,
        "--memory-swap", mem,
        "--cpus", format_cpus(lim.cpus),
        "--pids-limit", std::to_string(lim.pids_limit > 0 ? lim.pids_limit : 64),
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--read-only",
        "--tmpfs", "/tmp:rw,size=16m",
        "-v", source_path + ":" + opts_.mount_path + ":ro",
        opts_.image,
    };
    argv.insert(argv.end(), opts_.interpreter.begin(), opts_.interpreter.end());
    argv.push_back(opts_.mount_path);
    return argv;
}

bool DockerRuntime::force_remove(const std::string& instance) {
    forced_removals_++;
    const std::vector<std::string> argv = {opts_.docker_bin, "rm", "-f", instance};

    ProcLimits lim;
    lim.timeout_ms = opts_.teardown_timeout_ms;
    lim.output_max_bytes = 4096;
    lim.no_new_privs = false;

    std::string last_error;
    bool ok = retry_with_backoff(opts_.teardown_retry, [&](int) {
        ProcResult pr;
        if (!proc_run_capture(argv, "", lim, &pr)) {
            last_error = pr.error;
            return false;
        }
        if (pr.exit_code == 0) return true;
        if (pr.err.find("No such container") != std::string::npos) return true;
        last_error = first_line(pr.err);
        return false;
    });
    if (!ok) {
        std::cerr << "[verigate] docker rm -f " << instance << " failed: " << last_error << "\n";
    }
    return ok;
}

RunResult DockerRuntime::run(const RunRequest& req) {
    RunResult rr;
    const std::string instance = next_instance_name();
    const auto argv = build_run_argv(instance, req.source_path);

    ProcLimits lim;
    lim.timeout_ms = req.timeout_ms;
    lim.output_max_bytes = opts_.limits.output_max_bytes;
    // the docker client itself needs no rlimits; the container carries them
    lim.no_new_privs = false;

    ContainerGuard guard(*this, instance);

    ProcResult pr;
    if (!proc_run_capture(argv, "", lim, &pr)) {
        // the docker client never started, so no container exists
        guard.release();
        rr.launched = false;
        rr.error = pr.error;
        return rr;
    }

    rr.exit_code = pr.exit_code;
    rr.timed_out = pr.timed_out;
    rr.output_truncated = pr.output_truncated;
    rr.out = std::move(pr.out);
    rr.err = std::move(pr.err);
    rr.duration_ms = pr.duration_ms;
    rr.launched = true;

    if (rr.timed_out) {
        // killing the client does not stop the container
        if (!guard.teardown()) rr.error = "timeout; container " + instance + " could not be removed";
        else rr.error = "timeout";
        return rr;
    }

    // 125: docker daemon/run error, 126: contained command not invocable.
    // A snippet may exit with either code itself; only the client's own
    // diagnostic makes it a launch failure.
    const std::string client_err = (rr.exit_code == 125 || rr.exit_code == 126)
                                       ? docker_client_error(rr.err) : std::string();
    if (!client_err.empty()) {
        rr.launched = false;
        rr.error = "docker run failed (" + std::to_string(rr.exit_code) + "): " + client_err;
        if (!guard.teardown()) rr.error += "; container " + instance + " could not be removed";
        return rr;
    }

    // --rm removed it on exit
    guard.release();
    return rr;
}

// ---- ProcessRuntime ----

ProcessRuntime::ProcessRuntime(ProcessOptions opts) : opts_(std::move(opts)) {}

ProcLimits ProcessRuntime::limits_for(int timeout_ms) const {
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.output_max_bytes = opts_.limits.output_max_bytes;
    // RLIMIT_CPU is only a backstop and must outlast the wall clock, or a
    // busy loop dies by SIGKILL before it can be reported as a timeout.
    // limits.cpus has no rlimit equivalent; only the docker runtime applies it.
    lim.rlimit_cpu_sec = (int)std::ceil(timeout_ms / 1000.0) + 1;
    lim.rlimit_as_mb = opts_.rlimit_as_mb;
    lim.rlimit_fsize_mb = opts_.rlimit_fsize_mb;
    lim.rlimit_nofile = opts_.rlimit_nofile;
    lim.rlimit_nproc = opts_.rlimit_nproc;
    lim.no_new_privs = true;
    lim.enable_seccomp = opts_.enable_seccomp;
    return lim;
}

RunResult ProcessRuntime::run(const RunRequest& req) {
    RunResult rr;
    if (opts_.interpreter.empty()) {
        rr.error = "no interpreter configured";
        return rr;
    }

    std::vector<std::string> argv = opts_.interpreter;
    argv.push_back(req.source_path);

    std::string cwd = std::filesystem::path(req.source_path).parent_path().string();

    ProcResult pr;
    if (!proc_run_capture(argv, cwd, limits_for(req.timeout_ms), &pr)) {
        rr.launched = false;
        rr.error = pr.error;
        return rr;
    }

    rr.launched = true;
    rr.exit_code = pr.exit_code;
    rr.timed_out = pr.timed_out;
    rr.output_truncated = pr.output_truncated;
    rr.out = std::move(pr.out);
    rr.err = std::move(pr.err);
    rr.duration_ms = pr.duration_ms;
    if (rr.timed_out) rr.error = "timeout";
    return rr;
}

} // namespace verigate
