#include "test_common.h"
#include "verigate/proc.h"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <thread>

using namespace verigate;

#ifdef __linux__
// Not running: no /proc entry, or a zombie waiting for its reaper.
static bool process_gone(long pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    if (!in) return true;
    std::string line;
    std::getline(in, line);
    size_t rp = line.rfind(')');
    if (rp == std::string::npos || rp + 2 >= line.size()) return true;
    const char state = line[rp + 2];
    return state == 'Z' || state == 'X';
}
#endif

int main() {
#ifndef _WIN32
    ProcLimits lim;
    lim.timeout_ms = 5000;

    // stdout captured, exit code 0
    {
        ProcResult r;
        bool ok = proc_run_capture({"/bin/sh", "-c", "echo hello"}, "", lim, &r);
        expect_true(ok, "sh should start: " + r.error);
        expect_eq_ll(r.exit_code, 0, "echo exit code");
        expect_eq_str(r.out, "hello\n", "stdout captured");
        expect_true(r.err.empty(), "stderr empty");
        expect_true(!r.timed_out, "no timeout");
    }

    // stdout and stderr kept apart, exit code propagated
    {
        ProcResult r;
        bool ok = proc_run_capture({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, "", lim, &r);
        expect_true(ok, "sh should start");
        expect_eq_ll(r.exit_code, 3, "exit code propagated");
        expect_eq_str(r.out, "out\n", "stdout separate");
        expect_eq_str(r.err, "err\n", "stderr separate");
    }

    // stdin is /dev/null
    {
        ProcResult r;
        bool ok = proc_run_capture({"/bin/sh", "-c", "cat"}, "", lim, &r);
        expect_true(ok && r.exit_code == 0 && r.out.empty(), "cat sees empty stdin");
    }

    // cwd honored
    {
        ProcResult r;
        bool ok = proc_run_capture({"/bin/sh", "-c", "pwd"}, "/", lim, &r);
        expect_true(ok, "pwd should start");
        expect_eq_str(r.out, "/\n", "cwd applied");
    }

    // timeout kills the whole process group
    {
        ProcLimits t = lim;
        t.timeout_ms = 300;
        ProcResult r;
        bool ok = proc_run_capture({"/bin/sh", "-c", "sleep 10 & sleep 10"}, "", t, &r);
        expect_true(ok, "sleep should start");
        expect_true(r.timed_out, "timeout flagged");
        expect_true(r.duration_ms < 3000, "returned promptly after timeout");
        expect_true(r.exit_code != 0, "killed process reports non-zero");
    }

#ifdef __linux__
    // background work does not outlive a child that exits normally
    {
        ProcResult r;
        bool ok = proc_run_capture({"/bin/sh", "-c", "sleep 30 >/dev/null 2>&1 &\necho $!"}, "", lim, &r);
        expect_true(ok, "sh should start");
        expect_eq_ll(r.exit_code, 0, "shell exits cleanly");
        expect_true(!r.timed_out, "no timeout");
        expect_true(r.duration_ms < 3000, "did not wait for the background sleep");
        const long bg = std::strtol(r.out.c_str(), nullptr, 10);
        expect_true(bg > 0, "background pid reported: " + r.out);

        bool gone = false;
        for (int i = 0; i < 40 && !gone; i++) {
            gone = process_gone(bg);
            if (!gone) std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        expect_true(gone, "background process killed with its group");
    }
#endif

    // output cap
    {
        ProcLimits c = lim;
        c.output_max_bytes = 100;
        ProcResult r;
        bool ok = proc_run_capture({"/bin/sh", "-c", "head -c 10000 /dev/zero"}, "", c, &r);
        expect_true(ok, "head should start");
        expect_eq_ll((long long)r.out.size(), 100, "stdout capped");
        expect_true(r.output_truncated, "truncation flagged");
    }

    // exec failure is reported, not mistaken for exit 127
    {
        ProcResult r;
        bool ok = proc_run_capture({"/nonexistent/verigate-no-such-binary"}, "", lim, &r);
        expect_true(!ok, "missing executable must fail to start");
        expect_true(r.error.find("exec") != std::string::npos, "error names exec: " + r.error);
    }

    // empty argv
    {
        ProcResult r;
        expect_true(!proc_run_capture({}, "", lim, &r), "empty argv rejected");
    }

    // rlimits are applied in the child
    {
        ProcLimits f = lim;
        f.rlimit_nofile = 32;
        ProcResult r;
        bool ok = proc_run_capture({"/bin/sh", "-c", "ulimit -n"}, "", f, &r);
        expect_true(ok, "ulimit should start");
        expect_eq_str(r.out, "32\n", "RLIMIT_NOFILE applied");
    }
#endif

    // argv splitting
    {
        auto v = split_argv_quoted("python3 -u 'a b' \"c \\\" d\"");
        expect_eq_ll((long long)v.size(), 4, "four tokens");
        expect_eq_str(v[0], "python3", "token 0");
        expect_eq_str(v[2], "a b", "single quotes group");
        expect_eq_str(v[3], "c \" d", "escaped quote in double quotes");
        expect_true(split_argv_quoted("'unterminated").empty(), "unterminated quote rejected");
        expect_true(split_argv_quoted("   ").empty(), "blank yields nothing");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
