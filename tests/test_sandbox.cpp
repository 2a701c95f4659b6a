#include "test_common.h"
#include "verigate/sandbox.h"

#ifdef __linux__
#include <cerrno>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#endif

int main() {
    bool avail = verigate::seccomp_available();
#ifdef __linux__
    expect_true(avail, "seccomp should be available on Linux");
#else
    expect_true(!avail, "seccomp should not be available on non-Linux");
    std::string err = verigate::install_seccomp_filter();
    expect_true(err.empty(), "install_seccomp_filter should no-op on non-Linux");
#endif

    // The filter restricts the calling process, so every check runs in a
    // forked child.
#ifdef __linux__
    // basic I/O still works
    {
        pid_t pid = fork();
        if (pid == 0) {
            prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
            std::string err = verigate::install_seccomp_filter();
            if (!err.empty()) _exit(1);
            const char* msg = "seccomp_ok\n";
            ssize_t n = write(STDOUT_FILENO, msg, 11);
            _exit(n > 0 ? 0 : 2);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        expect_true(WIFEXITED(status) && WEXITSTATUS(status) == 0,
                    "child with seccomp should exit cleanly after write()");
    }

    // sockets fail with EACCES instead of killing
    {
        pid_t pid = fork();
        if (pid == 0) {
            prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
            std::string err = verigate::install_seccomp_filter();
            if (!err.empty()) _exit(1);
            int fd = socket(AF_INET, SOCK_STREAM, 0);
            if (fd >= 0) _exit(3);
            _exit(errno == EACCES ? 0 : 4);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        expect_true(WIFEXITED(status), "socket() must not kill the child");
        expect_eq_ll(WEXITSTATUS(status), 0, "socket() denied with EACCES");
    }
#endif

    std::cerr << "test_sandbox: ALL PASSED" << std::endl;
    return 0;
}
