#include "gradebench/proc.h"
#include "gradebench/seccomp.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>

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
    #include <sys/syscall.h>
  #endif
extern char** environ;
#endif

namespace gradebench {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

#ifndef _WIN32
static void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

// Child environment, computed in the parent: after fork() only
// async-signal-safe calls are made, so no setenv/malloc in the child.
static std::vector<std::string> build_child_env(const ProcEnv& env) {
    std::vector<std::string> unset = env.unset;
    // scrub dangerous loader env vars
    unset.push_back("LD_PRELOAD");
    unset.push_back("LD_LIBRARY_PATH");

    auto key_of = [](const std::string& kv) { return kv.substr(0, kv.find('=')); };
    auto dropped = [&](const std::string& key) {
        if (std::find(unset.begin(), unset.end(), key) != unset.end()) return true;
        for (const auto& s : env.set) {
            if (s.first == key) return true;
        }
        return false;
    };

    std::vector<std::string> out;
    for (char** e = environ; e && *e; e++) {
        std::string kv = *e;
        if (!dropped(key_of(kv))) out.push_back(std::move(kv));
    }
    for (const auto& s : env.set) out.push_back(s.first + "=" + s.second);
    return out;
}

static void ignore_sigpipe_once() {
    // A child that closes stdin early must not take the harness down.
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction sa{};
        sa.sa_handler = SIG_IGN;
        sigemptyset(&sa.sa_mask);
        (void)sigaction(SIGPIPE, &sa, nullptr);
    });
}

// True once the child has exited; the zombie is kept (WNOWAIT) so its pid,
// and therefore its process group id, cannot be recycled before we kill it.
static bool child_done(pid_t pid) {
    siginfo_t info{};
    if (waitid(P_PID, (id_t)pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) return false;
    return info.si_pid == pid;
}

static void kill_group(pid_t pid, int* status) {
    // process group first (catches grandchildren), then the direct pid
    (void)kill(-pid, SIGKILL);
    (void)kill(pid, SIGKILL);
    while (waitpid(pid, status, 0) < 0 && errno == EINTR) {}
}
#endif

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      const ProcEnv& env,
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

    std::vector<std::string> eff_argv;
    eff_argv.reserve(lim.wrapper.size() + argv.size());
    eff_argv.insert(eff_argv.end(), lim.wrapper.begin(), lim.wrapper.end());
    eff_argv.insert(eff_argv.end(), argv.begin(), argv.end());

    std::vector<char*> cargv;
    cargv.reserve(eff_argv.size() + 1);
    for (const auto& s : eff_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<std::string> child_env = build_child_env(env);
    std::vector<char*> cenv;
    cenv.reserve(child_env.size() + 1);
    for (const auto& s : child_env) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    SeccompFilter seccomp;
    if (lim.enable_seccomp) {
        seccomp = SeccompFilter::allowlist(lim.seccomp_allow_net);
        if (seccomp.empty()) {
            res->error = "seccomp requested but not supported on this platform";
            return false;
        }
    }

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }

    int in_pipe[2];
    if (pipe(in_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }

    ignore_sigpipe_once();

    int flags = fcntl(out_pipe[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);

    // keep our write end out of any other child forked concurrently
    (void)fcntl(in_pipe[1], F_SETFD, FD_CLOEXEC);
    (void)fcntl(out_pipe[0], F_SETFD, FD_CLOEXEC);

    const auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(in_pipe[0]); close(in_pipe[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(out_pipe[1], STDERR_FILENO);

        // isolate process group so timeout can kill the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

#if defined(__linux__) && defined(SYS_close_range)
        if (syscall(SYS_close_range, 3U, ~0U, 0U) != 0)
#endif
        {
            long maxfd = sysconf(_SC_OPEN_MAX);
            if (maxfd < 256) maxfd = 256;
            for (int fd = 3; fd < maxfd; fd++) {
                (void)close(fd);
            }
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(126);
        }

#ifdef __linux__
        if (lim.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        if (lim.rlimit_cpu_sec > 0) {
            set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec, (rlim_t)lim.rlimit_cpu_sec);
        }
        if (lim.rlimit_as_mb > 0) {
            rlim_t bytes = (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL;
            set_rlimit(RLIMIT_AS, bytes, bytes);
        }
        if (lim.rlimit_fsize_mb > 0) {
            rlim_t bytes = (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL;
            set_rlimit(RLIMIT_FSIZE, bytes, bytes);
        }
        if (lim.rlimit_nofile > 0) {
            set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile, (rlim_t)lim.rlimit_nofile);
        }
#ifdef RLIMIT_NPROC
        if (lim.rlimit_nproc > 0) {
            set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc, (rlim_t)lim.rlimit_nproc);
        }
#endif

        // must come after no_new_privs
        if (lim.enable_seccomp && seccomp.install() != 0) _exit(125);

        execvpe(cargv[0], cargv.data(), cenv.data());
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(in_pipe[0]);

    // Interleave stdin writes with stdout reads so a large request cannot
    // deadlock against a child that is already producing output.
    int in_fd = in_pipe[1];
    if (!stdin_data.empty()) {
        int fl = fcntl(in_fd, F_GETFL, 0);
        if (fl >= 0) (void)fcntl(in_fd, F_SETFL, fl | O_NONBLOCK);
    } else {
        close(in_fd);
        in_fd = -1;
    }
    size_t write_off = 0;

    std::string out;
    out.reserve(std::min<size_t>(lim.stdout_max_bytes, 64 * 1024));

    bool child_exited = false;
    int status = 0;

    auto append_output = [&](const char* buf, ssize_t n) {
        size_t can = lim.stdout_max_bytes > out.size() ? (lim.stdout_max_bytes - out.size()) : 0;
        if (can > 0) {
            size_t take = (size_t)n;
            if (take > can) { take = can; res->output_truncated = true; }
            out.append(buf, buf + take);
        } else {
            res->output_truncated = true;
        }
    };

    auto elapsed_ms = [&]() {
        return (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    while (true) {
        struct pollfd fds[2];
        int nfds = 0;
        int in_idx = -1;
        if (in_fd >= 0) {
            in_idx = nfds;
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            fds[nfds].revents = 0;
            nfds++;
        }
        const int out_idx = nfds;
        fds[nfds].fd = out_pipe[0];
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        nfds++;

        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms();
            if (remaining <= 0) {
                res->timed_out = true;
                kill_group(pid, &status);
                child_exited = true;
                break;
            }
            if (remaining < slice) slice = remaining;
        }

        int pr = poll(fds, (nfds_t)nfds, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data.size(); // EPIPE: child stopped reading
                break;
            }
            if (write_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        if (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP)) {
            char buf[4096];
            while (true) {
                ssize_t n = read(out_pipe[0], buf, sizeof(buf));
                if (n > 0) { append_output(buf, n); continue; }
                break;
            }
        }

        if (child_done(pid)) {
            // grandchildren may linger after the direct child exits
            kill_group(pid, &status);
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);

    // drain whatever the child wrote before exiting
    while (true) {
        char buf[4096];
        ssize_t n = read(out_pipe[0], buf, sizeof(buf));
        if (n > 0) { append_output(buf, n); continue; }
        break;
    }
    close(out_pipe[0]);

    res->elapsed_ms = elapsed_ms();
    res->output = std::move(out);
    if (!child_exited) {
        res->exit_code = 128;
        res->error = "child did not exit";
        return true;
    }

    if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->term_signal = WTERMSIG(status);
        res->exit_code = 128 + res->term_signal;
    } else {
        res->exit_code = 128;
    }
    return true;
#endif
}

} // namespace gradebench
