#include "verigate/sandbox.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#if defined(__x86_64__)
  #define VERIGATE_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define VERIGATE_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define VERIGATE_AUDIT_ARCH 0
#endif

namespace verigate {

#if VERIGATE_AUDIT_ARCH != 0
namespace {

std::vector<unsigned int> allowed_syscalls() {
    std::vector<unsigned int> v = {
        // I/O
        __NR_read, __NR_write, __NR_readv, __NR_writev, __NR_pread64, __NR_pwrite64,
        __NR_openat, __NR_close, __NR_lseek, __NR_fstat, __NR_newfstatat, __NR_statx,
        __NR_fcntl, __NR_ioctl, __NR_flock, __NR_fsync, __NR_fdatasync,
        __NR_ftruncate, __NR_truncate, __NR_getdents64, __NR_getcwd, __NR_chdir, __NR_fchdir,
        __NR_readlinkat, __NR_faccessat, __NR_mkdirat, __NR_unlinkat, __NR_renameat,
        __NR_fchmod, __NR_fchmodat, __NR_statfs, __NR_fstatfs, __NR_umask,
        __NR_dup, __NR_dup3, __NR_pipe2, __NR_ppoll, __NR_pselect6,
        __NR_epoll_create1, __NR_epoll_ctl, __NR_epoll_pwait, __NR_eventfd2,
        // memory
        __NR_mmap, __NR_mprotect, __NR_munmap, __NR_brk, __NR_mremap, __NR_madvise,
        // signals
        __NR_rt_sigaction, __NR_rt_sigprocmask, __NR_rt_sigreturn, __NR_sigaltstack,
        __NR_kill, __NR_tgkill,
        // process / threads
        __NR_clone, __NR_execve, __NR_exit, __NR_exit_group, __NR_wait4,
        __NR_set_tid_address, __NR_set_robust_list, __NR_futex, __NR_sched_yield,
        __NR_sched_getaffinity, __NR_prctl, __NR_prlimit64, __NR_getrlimit,
        __NR_getpid, __NR_getppid, __NR_gettid, __NR_getuid, __NR_geteuid,
        __NR_getgid, __NR_getegid, __NR_setsid,
        // time / info
        __NR_clock_gettime, __NR_clock_getres, __NR_clock_nanosleep, __NR_nanosleep,
        __NR_gettimeofday, __NR_uname, __NR_sysinfo, __NR_times, __NR_getrandom,
    };
    // legacy entry points that only exist on some architectures
#ifdef __NR_open
    v.push_back(__NR_open);
#endif
#ifdef __NR_stat
    v.push_back(__NR_stat);
#endif
#ifdef __NR_lstat
    v.push_back(__NR_lstat);
#endif
#ifdef __NR_access
    v.push_back(__NR_access);
#endif
#ifdef __NR_readlink
    v.push_back(__NR_readlink);
#endif
#ifdef __NR_poll
    v.push_back(__NR_poll);
#endif
#ifdef __NR_select
    v.push_back(__NR_select);
#endif
#ifdef __NR_pipe
    v.push_back(__NR_pipe);
#endif
#ifdef __NR_dup2
    v.push_back(__NR_dup2);
#endif
#ifdef __NR_getdents
    v.push_back(__NR_getdents);
#endif
#ifdef __NR_unlink
    v.push_back(__NR_unlink);
#endif
#ifdef __NR_mkdir
    v.push_back(__NR_mkdir);
#endif
#ifdef __NR_rename
    v.push_back(__NR_rename);
#endif
#ifdef __NR_arch_prctl
    v.push_back(__NR_arch_prctl);
#endif
#ifdef __NR_epoll_wait
    v.push_back(__NR_epoll_wait);
#endif
#ifdef __NR_faccessat2
    v.push_back(__NR_faccessat2);
#endif
#ifdef __NR_clone3
    v.push_back(__NR_clone3);
#endif
#ifdef __NR_rseq
    v.push_back(__NR_rseq);
#endif
    return v;
}

std::vector<unsigned int> network_syscalls() {
    return {
        __NR_socket, __NR_socketpair, __NR_connect, __NR_bind, __NR_listen,
        __NR_accept, __NR_accept4, __NR_sendto, __NR_recvfrom, __NR_sendmsg,
        __NR_recvmsg, __NR_shutdown, __NR_getsockname, __NR_getpeername,
        __NR_setsockopt, __NR_getsockopt,
    };
}

// Tiny BPF assembler: conditional jumps name a label, resolved at the end.
class FilterBuilder {
public:
    enum Label { L_ALLOW, L_KILL, L_DENY_NET, L_MPROTECT, L_COUNT };

    void stmt(uint16_t code, uint32_t k) {
        prog_.push_back(sock_filter{code, 0, 0, k});
    }
    void jeq_to(uint32_t k, Label target) {
        fixups_.push_back({prog_.size(), target});
        prog_.push_back(sock_filter{(uint16_t)(BPF_JMP | BPF_JEQ | BPF_K), 0, 0, k});
    }
    void jset_skip(uint32_t k, uint8_t jt) {
        prog_.push_back(sock_filter{(uint16_t)(BPF_JMP | BPF_JSET | BPF_K), jt, 0, k});
    }
    void jeq_skip(uint32_t k, uint8_t jt) {
        prog_.push_back(sock_filter{(uint16_t)(BPF_JMP | BPF_JEQ | BPF_K), jt, 0, k});
    }
    void mark(Label l) { labels_[l] = prog_.size(); }

    // Returns false if a jump distance does not fit the 8-bit offset.
    bool resolve() {
        for (const auto& f : fixups_) {
            size_t dist = labels_[f.target] - f.at - 1;
            if (labels_[f.target] <= f.at || dist > 255) return false;
            prog_[f.at].jt = (uint8_t)dist;
        }
        return true;
    }
    std::vector<sock_filter>& program() { return prog_; }

private:
    struct Fixup { size_t at; Label target; };
    std::vector<sock_filter> prog_;
    std::vector<Fixup> fixups_;
    size_t labels_[L_COUNT] = {0, 0, 0, 0};
};

} // namespace
#endif

std::string install_seccomp_filter() {
#if VERIGATE_AUDIT_ARCH == 0
    return "seccomp: unsupported architecture";
#else
    FilterBuilder b;

    b.stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch));
    b.jeq_skip(VERIGATE_AUDIT_ARCH, 1);
    b.stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS);

    b.stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr));
    b.jeq_to(__NR_mprotect, FilterBuilder::L_MPROTECT);
    for (unsigned int nr : network_syscalls()) b.jeq_to(nr, FilterBuilder::L_DENY_NET);
    for (unsigned int nr : allowed_syscalls()) {
        if (nr == (unsigned int)__NR_mprotect) continue;
        b.jeq_to(nr, FilterBuilder::L_ALLOW);
    }

    b.mark(FilterBuilder::L_KILL);
    b.stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS);

    b.mark(FilterBuilder::L_DENY_NET);
    b.stmt(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EACCES & SECCOMP_RET_DATA));

    // mprotect: arg2 (prot) must not carry PROT_EXEC
    b.mark(FilterBuilder::L_MPROTECT);
    b.stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t));
    b.jset_skip(0x4, 1);
    b.stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW);
    b.stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS);

    b.mark(FilterBuilder::L_ALLOW);
    b.stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW);

    if (!b.resolve()) return "seccomp: filter too large for BPF jump offsets";

    auto& insns = b.program();
    struct sock_fprog prog = {};
    prog.len = (unsigned short)insns.size();
    prog.filter = insns.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // 0: available, not active; 2: filter mode active; -1/EINVAL: unsupported
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

} // namespace verigate

#else // !__linux__

namespace verigate {

std::string install_seccomp_filter() {
    return "";
}

bool seccomp_available() {
    return false;
}

} // namespace verigate

#endif
