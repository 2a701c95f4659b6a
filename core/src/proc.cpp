#include "verigate/proc.h"
#include "verigate/sandbox.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>

#ifndef _WIN32
  #include <unistd.h>
  #include <fcntl.h>
  #include <sys/stat.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <sys/resource.h>
  #include <poll.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif
#endif

namespace verigate {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    for (char c : cmd) {
        switch (st) {
        case NORM:
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (have_token) out.push_back(cur);
                cur.clear();
                have_token = false;
            } else if (c == '\'') {
                st = SQ; have_token = true;
            } else if (c == '"') {
                st = DQ; esc = false; have_token = true;
            } else {
                cur.push_back(c); have_token = true;
            }
            break;
        case SQ:
            if (c == '\'') st = NORM;
            else cur.push_back(c);
            break;
        case DQ:
            if (esc) { cur.push_back(c); esc = false; }
            else if (c == '\\') esc = true;
            else if (c == '"') st = NORM;
            else cur.push_back(c);
            break;
        }
    }
    if (st != NORM) return {};
    if (have_token) out.push_back(cur);
    return out;
}

#ifndef _WIN32
namespace {

void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Sent over the exec report pipe in place of an errno.
constexpr int SECCOMP_INSTALL_FAILED = -1;

void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
    p[0] = p[1] = -1;
}

// Bounded capture of one child stream.
struct StreamSink {
    int fd{-1};
    std::string data;
    size_t cap{0};
    bool truncated{false};
    bool eof{false};

    void append(const char* buf, size_t n) {
        size_t can = cap > data.size() ? cap - data.size() : 0;
        if (n > can) truncated = true;
        if (can > 0) data.append(buf, std::min(n, can));
    }

    // Read whatever is available without blocking.
    void drain() {
        if (fd < 0 || eof) return;
        char buf[4096];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) { append(buf, (size_t)n); continue; }
            if (n == 0) { eof = true; break; }
            if (errno == EINTR) continue;
            break; // EAGAIN or error
        }
    }
};

void apply_child_limits(const ProcLimits& lim) {
    if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
    if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
#ifdef RLIMIT_NPROC
    if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
#endif
}

} // namespace
#endif

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

#ifdef _WIN32
    res->error = "proc_run_capture: not supported on Windows";
    return false;
#else
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1}; // child reports exec errno here; CLOEXEC closes it on success
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe(exec_pipe) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return false;
    }
    set_cloexec(exec_pipe[1]);

    // argv must be built before fork: no allocation in the child
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) { (void)dup2(devnull, STDIN_FILENO); close(devnull); }

        // own process group so a timeout can kill the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        const int report_fd = exec_pipe[1];
        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != report_fd) (void)close(fd);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int e = errno;
            (void)!write(report_fd, &e, sizeof(e));
            _exit(127);
        }

        unsetenv("LD_PRELOAD");
        unsetenv("LD_LIBRARY_PATH");

#ifdef __linux__
        if (lim.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
        apply_child_limits(lim);

        // must come after no_new_privs; never run unfiltered once asked to filter
        if (lim.enable_seccomp && !install_seccomp_filter().empty()) {
            int e = SECCOMP_INSTALL_FAILED;
            (void)!write(report_fd, &e, sizeof(e));
            _exit(127);
        }

        execvp(cargv[0], cargv.data());
        int e = errno;
        (void)!write(report_fd, &e, sizeof(e));
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t en;
    do {
        en = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (en < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (en == (ssize_t)sizeof(exec_errno)) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close(out_pipe[0]);
        close(err_pipe[0]);
        if (exec_errno == SECCOMP_INSTALL_FAILED) res->error = "seccomp filter could not be installed";
        else res->error = "exec " + argv[0] + " failed: " + std::strerror(exec_errno);
        return false;
    }

    StreamSink sout, serr;
    sout.fd = out_pipe[0];
    sout.cap = lim.output_max_bytes;
    serr.fd = err_pipe[0];
    serr.cap = lim.output_max_bytes;
    set_nonblocking(sout.fd);
    set_nonblocking(serr.fd);

    int status = 0;
    while (true) {
        sout.drain();
        serr.drain();

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (lim.timeout_ms > 0 && elapsed_ms >= lim.timeout_ms) {
            res->timed_out = true;
            // kill process group first, then the direct pid, and reap
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            break;
        }

        struct pollfd pfds[2];
        nfds_t n = 0;
        if (!sout.eof) { pfds[n].fd = sout.fd; pfds[n].events = POLLIN; n++; }
        if (!serr.eof) { pfds[n].fd = serr.fd; pfds[n].events = POLLIN; n++; }
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining < slice) slice = std::max(1, remaining);
        }
        (void)poll(n ? pfds : nullptr, n, slice);
    }

    // the group outlives its leader when the child left background work behind
    (void)kill(-pid, SIGKILL);

    // whatever is already buffered; killed grandchildren may still hold the pipes
    sout.drain();
    serr.drain();
    close(out_pipe[0]);
    close(err_pipe[0]);

    res->duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    res->out = std::move(sout.data);
    res->err = std::move(serr.data);
    res->output_truncated = sout.truncated || serr.truncated;

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    return true;
#endif
}

} // namespace verigate
