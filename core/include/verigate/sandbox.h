#pragma once

// seccomp-BPF syscall allowlist for locally executed snippets.
//
// Allowlist-only: any syscall not listed kills the process (SIGSYS).
// The socket family (socket, connect, bind, sendto, ...) is never allowed;
// those calls fail with EACCES instead of killing, so an interpreter
// reports a clean "permission denied" and exits non-zero.
// mprotect with PROT_EXEC kills the process.
//
// Architecture-aware: x86_64 and aarch64. Used by the process runtime when
// ProcLimits::enable_seccomp is set.

#include <string>

namespace verigate {

// Install the filter on the calling process. Must be called AFTER
// prctl(PR_SET_NO_NEW_PRIVS, 1). Returns empty string on success, error
// message on failure. No-op success on non-Linux platforms.
std::string install_seccomp_filter();

// Check if seccomp is available on this system.
bool seccomp_available();

} // namespace verigate
