#include "gradebench/seccomp.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>

#include <linux/audit.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>

#if defined(__x86_64__)
  #define GRADEBENCH_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define GRADEBENCH_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define GRADEBENCH_AUDIT_ARCH 0
#endif

namespace gradebench {

static struct sock_filter stmt(unsigned short code, unsigned int k) {
    struct sock_filter f{};
    f.code = code;
    f.k = k;
    return f;
}

static struct sock_filter jump(unsigned short code, unsigned int k, unsigned char jt, unsigned char jf) {
    struct sock_filter f{};
    f.code = code;
    f.jt = jt;
    f.jf = jf;
    f.k = k;
    return f;
}

// What an interpreter needs to start, import its stdlib, run pure code and
// report back over stdout: file reads, memory management, signals, time,
// threads/futexes, exec of itself, exit. Raw numbers per architecture.
#if defined(__x86_64__)
static const unsigned int kAllowed[] = {
    0, 1, 3, 4, 5, 6, 7, 8,      // read write close stat fstat lstat poll lseek
    9, 10, 11, 12,               // mmap mprotect munmap brk
    13, 14, 15, 16,              // rt_sigaction rt_sigprocmask rt_sigreturn ioctl
    17, 18, 19, 20, 21,          // pread64 pwrite64 readv writev access
    22, 23, 24, 25, 28,          // pipe select sched_yield mremap madvise
    32, 33, 35, 37, 39,          // dup dup2 nanosleep alarm getpid
    56, 59, 60, 61, 62, 63,      // clone execve exit wait4 kill uname
    72, 73, 74, 75, 77,          // fcntl flock fsync fdatasync ftruncate
    78, 79, 80, 81, 89,          // getdents getcwd chdir fchdir readlink
    95, 96, 97, 98, 99, 100,     // umask gettimeofday getrlimit getrusage sysinfo times
    102, 104, 107, 108, 110, 111, // getuid getgid geteuid getegid getppid getpgrp
    131, 137, 138,               // sigaltstack statfs fstatfs
    157, 158, 186,               // prctl arch_prctl gettid
    202, 204, 217, 218, 221,     // futex sched_getaffinity getdents64 set_tid_address fadvise64
    228, 229, 230, 231,          // clock_gettime clock_getres clock_nanosleep exit_group
    232, 233, 234,               // epoll_wait epoll_ctl tgkill
    257, 262, 267, 269,          // openat newfstatat readlinkat faccessat
    270, 271, 273, 281,          // pselect6 ppoll set_robust_list epoll_pwait
    290, 291, 292, 293,          // eventfd2 epoll_create1 dup3 pipe2
    302, 318, 332, 334,          // prlimit64 getrandom statx rseq
    435, 436, 439,               // clone3 close_range faccessat2
};
static const unsigned int kNetAllowed[] = {
    41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, 52, 53, 54, 55, 288, 299, 307,
};
static const unsigned int kMprotectNr = 10;
#elif defined(__aarch64__)
static const unsigned int kAllowed[] = {
    56, 57, 62, 63, 64, 65, 66, 67, 68,   // openat close lseek read write readv writev pread64 pwrite64
    25, 29, 32, 74, 79, 80,               // fcntl ioctl flock ftruncate fstatat fstat
    49, 50, 78, 48, 52,                   // chdir fchdir readlinkat faccessat2 faccessat
    23, 24, 22, 73, 72, 43, 44,           // dup dup3 pipe2 ppoll pselect6 statfs fstatfs
    222, 226, 215, 214, 233, 225, 223,    // mmap mprotect munmap brk madvise mremap fadvise64
    134, 135, 139, 132,                   // rt_sigaction rt_sigprocmask rt_sigreturn sigaltstack
    220, 435, 221, 93, 94, 260,           // clone clone3 execve exit exit_group wait4
    129, 131, 160, 163, 261, 179, 153,    // kill tgkill uname getrlimit prlimit64 sysinfo times
    165, 174, 175, 176, 177,              // getrusage getuid geteuid getgid getegid
    172, 173, 178, 96, 99, 98,            // getpid getppid gettid set_tid_address set_robust_list futex
    113, 114, 115, 169, 101, 124, 123,    // clock_* gettimeofday nanosleep sched_yield sched_getaffinity
    278, 291, 167, 39, 82, 83, 61, 17,    // getrandom statx prctl umask fsync fdatasync getdents64 getcwd
    20, 21, 19, 281, 436,                 // epoll_create1 epoll_ctl eventfd2 rseq close_range
    22,
};
static const unsigned int kNetAllowed[] = {
    198, 199, 200, 201, 202, 203, 204, 205, 206, 207, 208, 209, 210, 211, 212, 242, 243, 269,
};
static const unsigned int kMprotectNr = 226;
#endif

SeccompFilter SeccompFilter::allowlist(bool allow_net) {
    SeccompFilter f;
#if GRADEBENCH_AUDIT_ARCH != 0
    std::vector<unsigned int> allowed(kAllowed, kAllowed + sizeof(kAllowed) / sizeof(kAllowed[0]));
    if (allow_net) {
        allowed.insert(allowed.end(), kNetAllowed, kNetAllowed + sizeof(kNetAllowed) / sizeof(kNetAllowed[0]));
    }
    const size_t n = allowed.size();

    // Layout:
    //   [0]         load arch
    //   [1]         arch ok -> skip next
    //   [2]         KILL (foreign arch)
    //   [3]         load syscall nr
    //   [4..4+n-1]  nr == allowed[s] -> ALLOW (or MPROTECT_CHECK)
    //   [4+n]       KILL (default deny)
    //   [4+n+1]     MPROTECT_CHECK: load args[2] (prot)
    //   [4+n+2]     PROT_EXEC set -> KILL
    //   [4+n+3]     ALLOW (mprotect without PROT_EXEC)
    //   [4+n+4]     KILL
    //   [4+n+5]     ALLOW
    auto& p = f.prog_;
    p.reserve(n + 10);
    p.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    p.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, GRADEBENCH_AUDIT_ARCH, 1, 0));
    p.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    p.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    for (size_t s = 0; s < n; s++) {
        // jt counts instructions to skip after this one
        unsigned char jt = (allowed[s] == kMprotectNr)
            ? (unsigned char)(n - s)
            : (unsigned char)(n + 4 - s);
        p.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, allowed[s], jt, 0));
    }

    p.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    p.push_back(stmt(BPF_LD | BPF_W | BPF_ABS,
                     offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    p.push_back(jump(BPF_JMP | BPF_JSET | BPF_K, 0x4 /* PROT_EXEC */, 1, 0));
    p.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    p.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    p.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
#else
    (void)allow_net;
#endif
    return f;
}

int SeccompFilter::install() const {
    if (prog_.empty()) return ENOSYS;
    struct sock_fprog fprog{};
    fprog.len = (unsigned short)prog_.size();
    fprog.filter = const_cast<struct sock_filter*>(prog_.data());
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &fprog, 0, 0) != 0) return errno;
    return 0;
}

bool SeccompFilter::empty() const {
    return prog_.empty();
}

bool seccomp_available() {
    // 0: available, not active; 2: filter mode active; -1/EINVAL: unsupported
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

} // namespace gradebench

#else // !__linux__

#include <cerrno>

namespace gradebench {

SeccompFilter SeccompFilter::allowlist(bool) {
    return SeccompFilter{};
}

int SeccompFilter::install() const {
    return ENOSYS;
}

bool SeccompFilter::empty() const {
    return true;
}

bool seccomp_available() {
    return false;
}

} // namespace gradebench

#endif
