#include "test_common.h"
#include "gradebench/proc.h"

#include <chrono>
#include <cstdlib>

using namespace gradebench;

int main() {
    ProcLimits lim;
    lim.timeout_ms = 3000;
    ProcEnv env;

    // stdout and stdin plumbing
    {
        ProcResult r;
        bool started = proc_run_capture({"/bin/sh", "-c", "cat; echo done"}, "", "hello\n", lim, env, &r);
        expect_true(started, "sh should start: " + r.error);
        expect_eq_ll(r.exit_code, 0, "exit code");
        expect_true(!r.timed_out, "no timeout");
        expect_eq_str(r.output, "hello\ndone\n", "stdin echoed then stdout");
    }

    // exit codes and merged stderr
    {
        ProcResult r;
        proc_run_capture({"/bin/sh", "-c", "echo oops >&2; exit 7"}, "", "", lim, env, &r);
        expect_eq_ll(r.exit_code, 7, "non-zero exit");
        expect_true(contains(r.output, "oops"), "stderr merged into output");
    }

    // timeout kills the group and returns promptly
    {
        ProcLimits tl = lim;
        tl.timeout_ms = 200;
        ProcResult r;
        auto t0 = std::chrono::steady_clock::now();
        proc_run_capture({"/bin/sh", "-c", "sleep 5 & sleep 5"}, "", "", tl, env, &r);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        expect_true(r.timed_out, "sleep should time out");
        expect_true(ms < 2000, "timeout returns within bound (ms=" + std::to_string(ms) + ")");
    }

    // output cap
    {
        ProcLimits cl = lim;
        cl.stdout_max_bytes = 16;
        ProcResult r;
        proc_run_capture({"/bin/sh", "-c", "echo 0123456789abcdefghijklmnop"}, "", "", cl, env, &r);
        expect_true(r.output_truncated, "output marked truncated");
        expect_true(r.output.size() <= 16, "output capped");
    }

    // environment edits
    {
        setenv("GRADEBENCH_TEST_LEAK", "parent", 1);
        ProcEnv e;
        e.set.push_back({"GRADEBENCH_TEST_SET", "child"});
        e.unset.push_back("GRADEBENCH_TEST_LEAK");
        ProcResult r;
        proc_run_capture({"/bin/sh", "-c", "echo \"$GRADEBENCH_TEST_SET:${GRADEBENCH_TEST_LEAK-unset}\""},
                         "", "", lim, e, &r);
        expect_eq_str(r.output, "child:unset\n", "env set and unset");
        unsetenv("GRADEBENCH_TEST_LEAK");
    }

    // cwd
    {
        ProcResult r;
        proc_run_capture({"/bin/sh", "-c", "pwd"}, "/", "", lim, env, &r);
        expect_eq_str(r.output, "/\n", "cwd applied");
    }

    // missing binary
    {
        ProcResult r;
        proc_run_capture({"/nonexistent/gradebench-binary"}, "", "", lim, env, &r);
        expect_eq_ll(r.exit_code, 127, "exec failure exits 127");
    }

    // argv splitting
    {
        auto v = split_argv_quoted("bwrap --ro-bind / / 'a b' \"c \\\"d\\\"\"");
        expect_eq_ll((long long)v.size(), 6, "token count");
        expect_eq_str(v[4], "a b", "single quotes");
        expect_eq_str(v[5], "c \"d\"", "double quotes with escapes");
        expect_true(split_argv_quoted("unterminated 'quote").empty(), "parse error gives empty");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
