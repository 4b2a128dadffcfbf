#pragma once

// seccomp-BPF syscall allowlist for sandboxed interpreter processes.
//
// Allowlist-only: any syscall not on the list kills the process (SIGSYS).
// Networking (socket, connect, bind, ...) is blocked unless allow_net is set,
// as are ptrace, mount, namespaces, module loading, reboot and friends.
// mprotect with PROT_EXEC is rejected.
//
// The program is built in the parent, where allocating is fine, and
// installed in the forked child with a single prctl().

#include <string>
#include <vector>

#if defined(__linux__)
  #include <linux/filter.h>
#endif

namespace gradebench {

class SeccompFilter {
public:
    // Architecture-aware (x86_64, aarch64). Empty on other platforms.
    static SeccompFilter allowlist(bool allow_net);

    // Must be called AFTER prctl(PR_SET_NO_NEW_PRIVS, 1).
    // Returns 0 on success or an errno value. Async-signal-safe: no allocation.
    int install() const;

    bool empty() const;

private:
#if defined(__linux__)
    std::vector<struct sock_filter> prog_;
#endif
};

// Check if seccomp is available on this system.
bool seccomp_available();

} // namespace gradebench
