#include "gradebench/sandbox.h"
#include "gradebench/json_util.h"
#include "gradebench/proc.h"

#include <json-c/json.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

#ifndef _WIN32
  #include <unistd.h>
#endif

namespace gradebench {

namespace {

// Runs inside the interpreter. Reads one request from stdin, binds the target
// function, calls it, and writes "<nonce> <json>" as the last stdout line.
// The candidate is compiled as "<candidate>" so its frames can be told apart
// from ours in tracebacks.
const char* kBootstrap = R"PY(
import builtins, copy, io, json, linecache, os, sys, time, traceback, tracemalloc, types

FILE = "<candidate>"

DENIED_EVENTS = ("os.system", "os.fork", "os.forkpty", "os.exec", "os.posix_spawn", "os.spawn",
                 "os.kill", "os.killpg", "os.symlink", "os.link", "subprocess.Popen",
                 "ctypes.dlopen", "ctypes.dlsym")
PATH_EVENTS = {"os.remove": (0,), "os.rmdir": (0,), "os.mkdir": (0,), "os.rename": (0, 1),
               "os.chmod": (0,), "os.chown": (0,), "os.truncate": (0,), "os.utime": (0,),
               "shutil.rmtree": (0,)}
WRITE_FLAGS = os.O_WRONLY | os.O_RDWR | os.O_CREAT | os.O_TRUNC | os.O_APPEND

def inside(workdir, path):
    if isinstance(path, int):
        return True
    p = os.path.realpath(os.fsdecode(path))
    return p == workdir or p.startswith(workdir + os.sep)

def install_guard(workdir):
    # Candidates may read anything but change nothing outside their directory.
    def guard(event, args):
        if event == "open":
            path, mode, flags = args
            writing = (any(c in mode for c in "wax+") if isinstance(mode, str)
                       else bool((flags or 0) & WRITE_FLAGS))
            if writing and path is not None and not inside(workdir, path):
                raise PermissionError("write outside the working directory: %r" % (path,))
        elif event.startswith("socket.") or event.startswith(DENIED_EVENTS):
            raise PermissionError("operation not permitted: " + event)
        elif event in PATH_EVENTS:
            for i in PATH_EVENTS[event]:
                if i < len(args) and args[i] is not None and not inside(workdir, args[i]):
                    raise PermissionError("%s outside the working directory: %r" % (event, args[i]))
    sys.addaudithook(guard)

def plain(v):
    if v is None or isinstance(v, (bool, str, float)):
        return v
    if isinstance(v, int):
        if -2**63 <= v < 2**63:
            return v
        return float(v)
    if isinstance(v, (list, tuple)):
        return [plain(x) for x in v]
    if isinstance(v, (set, frozenset)):
        items = [plain(x) for x in v]
        try:
            return sorted(items)
        except TypeError:
            return sorted(items, key=repr)
    if isinstance(v, dict):
        return {(k if isinstance(k, str) else str(k)): plain(x) for k, x in v.items()}
    raise TypeError("unsupported return type: " + type(v).__name__)

def main(real_out):
    req = json.loads(sys.stdin.read())
    nonce = req["nonce"]
    trace_max = int(req.get("trace_max", 2048))
    stdout_max = int(req.get("stdout_max", 4096))
    captured = io.StringIO()

    def reply(obj):
        sys.stdout = real_out
        obj["stdout"] = captured.getvalue()[:stdout_max]
        real_out.write("\n" + nonce + " " + json.dumps(obj) + "\n")
        real_out.flush()

    def headline(exc):
        return "".join(traceback.format_exception_only(type(exc), exc)).strip()

    def failure(exc):
        frames = [f for f in traceback.extract_tb(exc.__traceback__) if f.filename == FILE]
        trace = "".join(traceback.format_list(frames))
        if trace_max > 0 and len(trace) > trace_max:
            trace = trace[-trace_max:]
        return {"status": "runtime_error", "message": headline(exc), "trace": trace}

    src = req["source"]
    linecache.cache[FILE] = (len(src), None, src.splitlines(True), FILE)
    try:
        code = compile(src, FILE, "exec")
    except (SyntaxError, ValueError) as exc:
        reply({"status": "syntax_error", "message": headline(exc)})
        return

    ns = {"__name__": "__candidate__", "__builtins__": builtins}
    # annotations such as List[int] resolve when the def runs
    exec("from typing import *", ns)
    install_guard(os.path.realpath(os.getcwd()))
    sys.stdout = captured
    try:
        exec(code, ns)
    except BaseException as exc:
        reply(failure(exc))
        return

    name = req["function_name"]
    fn = ns.get(name)
    if not callable(fn):
        defined = [v for v in ns.values()
                   if isinstance(v, types.FunctionType) and v.__module__ == "__candidate__"]
        fn = defined[-1] if defined else None
    if fn is None:
        reply({"status": "runtime_error",
               "message": "NameError: function '%s' is not defined" % name, "trace": ""})
        return

    args = req["args"]
    reps = max(1, int(req.get("repetitions", 1)))
    batch = 1
    durations = []
    value = None
    try:
        if req.get("calibrate"):
            min_ns = int(req.get("calibrate_min_ns", 2000000))
            while True:
                copies = [copy.deepcopy(args) for _ in range(batch)]
                t0 = time.perf_counter_ns()
                for a in copies:
                    value = fn(*a)
                if time.perf_counter_ns() - t0 >= min_ns or batch >= 1000000:
                    break
                batch *= 10
        for _ in range(reps):
            copies = [copy.deepcopy(args) for _ in range(batch)]
            t0 = time.perf_counter_ns()
            for a in copies:
                value = fn(*a)
            durations.append((time.perf_counter_ns() - t0) // batch)
        peak = None
        if req.get("collect_memory"):
            # separate pass so tracing does not skew the timings
            peak = 0
            for _ in range(reps):
                a = copy.deepcopy(args)
                tracemalloc.start()
                try:
                    fn(*a)
                    peak = max(peak, tracemalloc.get_traced_memory()[1])
                finally:
                    tracemalloc.stop()
        value = plain(value)
    except BaseException as exc:
        reply(failure(exc))
        return
    out = {"status": "ok", "value": value, "durations_ns": durations}
    if peak is not None:
        out["peak_memory_bytes"] = peak
    reply(out)

real_out = sys.stdout
try:
    main(real_out)
except BaseException as exc:
    sys.stdout = real_out
    sys.stderr.write("bootstrap failure: %r\n" % (exc,))
    sys.exit(3)
)PY";

std::string make_nonce() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << rng() << rng();
    return "gb" + oss.str();
}

// Private working directory for one invocation; removed with everything the
// candidate left in it.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& root) {
        std::string base = root;
        if (base.empty()) {
            const char* t = std::getenv("TMPDIR");
            base = (t && *t) ? t : "/tmp";
        }
        std::string tmpl = base + "/gradebench_XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
#ifndef _WIN32
        if (mkdtemp(buf.data())) path_ = buf.data();
        else error_ = std::strerror(errno);
#else
        error_ = "not supported";
#endif
    }
    ~ScratchDir() {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::string path_;
    std::string error_;
};

std::string tail(const std::string& s, size_t max) {
    if (max == 0 || s.size() <= max) return s;
    return s.substr(s.size() - max);
}

// Locate the reply line. Anything the candidate wrote to the raw descriptors
// precedes it; only a line starting with our nonce counts.
bool find_reply(const std::string& output, const std::string& nonce, std::string* json_out) {
    const std::string marker = nonce + " ";
    size_t pos = std::string::npos;
    size_t from = output.size();
    while (true) {
        size_t p = output.rfind(marker, from);
        if (p == std::string::npos) break;
        if (p == 0 || output[p - 1] == '\n') { pos = p; break; }
        from = p - 1;
    }
    if (pos == std::string::npos) return false;
    size_t start = pos + marker.size();
    size_t end = output.find('\n', start);
    *json_out = output.substr(start, end == std::string::npos ? std::string::npos : end - start);
    return true;
}

std::string describe_abnormal_exit(const ProcResult& pr, const std::string& interpreter) {
    if (pr.output_truncated) return "reply exceeded the output limit";
    if (pr.term_signal != 0) {
        switch (pr.term_signal) {
#ifdef SIGXCPU
            case SIGXCPU: return "CPU time limit exceeded";
#endif
#ifdef SIGSYS
            case SIGSYS:  return "blocked system call";
#endif
            case SIGSEGV: return "interpreter crashed (SIGSEGV)";
            case SIGKILL: return "interpreter killed (SIGKILL)";
            default: break;
        }
        return "interpreter killed by signal " + std::to_string(pr.term_signal);
    }
    if (pr.exit_code == 127) return "cannot execute interpreter '" + interpreter + "'";
    if (pr.exit_code == 126) return "cannot enter working directory";
    if (pr.exit_code == 125) return "cannot install syscall filter";
    return "interpreter exited with code " + std::to_string(pr.exit_code) + " without a result";
}

ExecutionOutcome parse_reply(const std::string& json, size_t trace_max) {
    json_util::Doc doc = json_util::parse(json);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        return RuntimeFailure{"sandbox: malformed reply from interpreter", ""};
    }
    std::string status, message, trace, out_text;
    json_util::get_string(doc.root, "status", &status);
    json_util::get_string(doc.root, "message", &message);
    json_util::get_string(doc.root, "trace", &trace);
    json_util::get_string(doc.root, "stdout", &out_text);

    if (status == "syntax_error") return SyntaxFailure{message};
    if (status == "runtime_error") return RuntimeFailure{message, tail(trace, trace_max)};
    if (status != "ok") return RuntimeFailure{"sandbox: unknown reply status '" + status + "'", ""};

    Success s;
    json_object* v = nullptr;
    if (json_object_object_get_ex(doc.root, "value", &v)) s.value = value_from_json(v);
    s.stdout_text = std::move(out_text);
    if (json_object* pm = json_util::get_typed(doc.root, "peak_memory_bytes", json_type_int)) {
        s.peak_memory_bytes = json_object_get_int64(pm);
    }
    if (json_object* d = json_util::get_typed(doc.root, "durations_ns", json_type_array)) {
        const size_t n = json_object_array_length(d);
        s.durations_ns.reserve(n);
        for (size_t i = 0; i < n; i++) {
            s.durations_ns.push_back(json_object_get_int64(json_object_array_get_idx(d, i)));
        }
    }
    return s;
}

std::vector<std::string> interpreter_argv(const std::string& interpreter, const char* script) {
    // -I: ignore PYTHON* variables and user site-packages, no cwd on sys.path
    // -B: no bytecode written next to imported modules
    return {interpreter, "-I", "-B", "-c", script};
}

ProcEnv interpreter_env(const std::string& workdir) {
    ProcEnv env;
    env.set = {
        {"PYTHONHASHSEED", "0"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONIOENCODING", "utf-8"},
        {"HOME", workdir},
        {"TMPDIR", workdir},
    };
    env.unset = {"PYTHONPATH", "PYTHONSTARTUP", "PYTHONHOME", "PYTHONUSERBASE"};
    return env;
}

} // namespace

std::string describe_outcome(const ExecutionOutcome& o) {
    if (const auto* s = std::get_if<Success>(&o)) return "returned " + s->value.render();
    if (const auto* r = std::get_if<RuntimeFailure>(&o)) return "runtime failure: " + r->message;
    if (const auto* y = std::get_if<SyntaxFailure>(&o)) return "syntax failure: " + y->message;
    const auto& t = std::get<Timeout>(o);
    return "timed out after " + std::to_string(t.elapsed_ms) + " ms";
}

Sandbox::Sandbox(SandboxConfig cfg) : cfg_(std::move(cfg)) {}

ExecutionOutcome Sandbox::execute(const std::string& source,
                                  const FunctionPrototype& proto,
                                  const ValueList& args,
                                  int time_budget_ms,
                                  const ExecuteOptions& opts) const {
    try {
        const std::string nonce = make_nonce();

        json_util::Doc req{json_object_new_object()};
        json_object_object_add(req.root, "nonce", json_util::new_string(nonce));
        json_object_object_add(req.root, "source", json_util::new_string(source));
        json_object_object_add(req.root, "function_name", json_util::new_string(proto.function_name));
        json_object* jargs = json_object_new_array();
        for (const auto& a : args) json_object_array_add(jargs, value_to_json(a));
        json_object_object_add(req.root, "args", jargs);
        json_object_object_add(req.root, "repetitions", json_object_new_int(opts.repetitions > 0 ? opts.repetitions : 1));
        json_object_object_add(req.root, "calibrate", json_object_new_boolean(opts.calibrate ? 1 : 0));
        json_object_object_add(req.root, "collect_memory", json_object_new_boolean(opts.collect_memory ? 1 : 0));
        json_object_object_add(req.root, "calibrate_min_ns", json_object_new_int64(cfg_.calibrate_min_ns));
        json_object_object_add(req.root, "trace_max", json_object_new_int64((int64_t)cfg_.trace_max_bytes));
        json_object_object_add(req.root, "stdout_max", json_object_new_int64((int64_t)cfg_.stdout_max_bytes));
        const std::string request = json_util::to_string(req.root);

        ScratchDir dir(cfg_.temp_root);
        if (!dir.ok()) {
            return RuntimeFailure{"sandbox: cannot create working directory: " + dir.error(), ""};
        }

        ProcLimits lim;
        lim.timeout_ms = time_budget_ms > 0 ? time_budget_ms : 0;
        lim.stdout_max_bytes = cfg_.reply_max_bytes;
        lim.rlimit_cpu_sec = time_budget_ms > 0 ? time_budget_ms / 1000 + 1 : 0;
        lim.rlimit_as_mb = cfg_.memory_mb;
        lim.rlimit_fsize_mb = 1;
        lim.rlimit_nofile = 64;
        lim.rlimit_nproc = 32;
        lim.no_new_privs = true;
        lim.enable_seccomp = cfg_.enable_seccomp;
        lim.wrapper = cfg_.wrapper;

        ProcResult pr;
        const bool started = proc_run_capture(interpreter_argv(cfg_.interpreter, kBootstrap),
                                              dir.path(), request, lim,
                                              interpreter_env(dir.path()), &pr);
        if (!started) {
            return RuntimeFailure{"sandbox: failed to start interpreter: " + pr.error, ""};
        }
        if (pr.timed_out) return Timeout{pr.elapsed_ms};

        std::string reply;
        if (pr.output_truncated || !find_reply(pr.output, nonce, &reply)) {
            return RuntimeFailure{"sandbox: " + describe_abnormal_exit(pr, cfg_.interpreter), ""};
        }
        return parse_reply(reply, cfg_.trace_max_bytes);
    } catch (const std::exception& e) {
        return RuntimeFailure{std::string("sandbox: ") + e.what(), ""};
    }
}

bool Sandbox::interpreter_available() const {
    ProcLimits lim;
    lim.timeout_ms = 10000;
    lim.rlimit_cpu_sec = 10;
    lim.rlimit_as_mb = cfg_.memory_mb;
    lim.wrapper = cfg_.wrapper;
    ProcResult pr;
    if (!proc_run_capture(interpreter_argv(cfg_.interpreter, "pass"), "", "", lim, ProcEnv{}, &pr)) {
        return false;
    }
    return !pr.timed_out && pr.exit_code == 0;
}

} // namespace gradebench
