#include "sandbox/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/cgroup.hpp"
#include "sandbox/supervisor.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

const int BUF_SIZE = 4096;
const int MAX_READS_PER_PUMP = 64;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

/**
 * @brief 子进程启动失败时通过错误管道告诉父进程失败在哪一步
 */
enum spawn_stage {
    STAGE_SYNC = 1,
    STAGE_SETSID,
    STAGE_RLIMIT,
    STAGE_REDIRECT,
    STAGE_CHDIR,
    STAGE_EXEC
};

struct spawn_error {
    int stage;
    int err;
};

static const char *stage_name(int stage) {
    switch (stage) {
        case STAGE_SYNC: return "waiting for parent";
        case STAGE_SETSID: return "setsid";
        case STAGE_RLIMIT: return "setrlimit";
        case STAGE_REDIRECT: return "redirecting standard streams";
        case STAGE_CHDIR: return "changing working directory";
        case STAGE_EXEC: return "execve";
        default: return "unknown stage";
    }
}

namespace {

/**
 * @brief 管道的文件描述符，离开作用域时关闭
 */
struct pipe_guard {
    int fd[2] = {-1, -1};

    pipe_guard() {
        if (pipe2(fd, O_CLOEXEC) != 0)
            throw internal_error(fmt::format("unable to create pipe: {}", strerror(errno)));
    }

    ~pipe_guard() {
        close_end(PIPE_IN);
        close_end(PIPE_OUT);
    }

    void close_end(int end) {
        if (fd[end] >= 0) {
            close(fd[end]);
            fd[end] = -1;
        }
    }
};

struct rlimit_setting {
    int resource;
    struct rlimit value;
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw internal_error(fmt::format("unable to set O_NONBLOCK: {}", strerror(errno)));
}

/**
 * @brief 子进程的输出流
 */
struct output_stream {
    int fd;
    string data;
    int64_t total = 0;
    int64_t cap;

    /**
     * @brief 读取管道中现有的数据
     * 超出 cap 的数据读取后丢弃，但仍然统计字节数。
     * 每次最多读取 MAX_READS_PER_PUMP 次，避免持续输出的进程让监控饿死
     * @return 是否读到了 EOF
     */
    bool pump() {
        char buf[BUF_SIZE];
        for (int i = 0; i < MAX_READS_PER_PUMP; ++i) {
            ssize_t nread = read(fd, buf, BUF_SIZE);
            if (nread > 0) {
                total += nread;
                if ((int64_t)data.size() < cap)
                    data.append(buf, (size_t)min<int64_t>(nread, cap - (int64_t)data.size()));
                continue;
            }
            if (nread == 0) return true;
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return false;
            LOG(WARNING) << "Error reading from child pipe: " << strerror(errno);
            return true;
        }
        return false;
    }
};

}  // namespace

string find_executable(const string &name, const string &path_env) {
    if (name.find('/') != string::npos) return name;

    vector<string> dirs;
    boost::split(dirs, path_env, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0)
            return candidate.string();
    }
    return "";
}

static execution_attempt spawn_failure(const string &reason) {
    execution_attempt attempt;
    attempt.status = attempt_status::SPAWN_FAILED;
    attempt.exit_code = -1;
    attempt.error = reason;
    return attempt;
}

process_runner::process_runner(runner_options options) : options(options) {
    // 子进程提前关闭标准输入时 write 会触发 SIGPIPE，我们通过 EPIPE 处理
    static once_flag flag;
    call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

execution_attempt process_runner::run(const process_request &request, const cancellation_token *cancel) const {
    if (request.command.empty())
        return spawn_failure("empty command");
    if (!fs::is_directory(request.workdir))
        return spawn_failure("working directory " + request.workdir.string() + " does not exist");

    // fork 之后子进程只能调用 async-signal-safe 的函数，因此所有的内存分配都在这里完成
    string path_env = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    map<string, string> env = request.env;
    if (!env.count("PATH")) env["PATH"] = path_env;

    string executable = find_executable(request.command[0], env["PATH"]);
    if (executable.empty())
        return spawn_failure(fmt::format("unable to find command {}: {}", request.command[0], strerror(ENOENT)));

    vector<string> env_strings;
    for (auto &[key, value] : env) env_strings.push_back(key + "=" + value);

    vector<char *> argv, envp;
    for (auto &arg : request.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    for (auto &entry : env_strings) envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);

    const resource_limits &limits = request.limits;
    vector<rlimit_setting> rlimits;
    {
        /* Setting the real hard limit one second higher: at the soft
           limit the kernel will send SIGXCPU at the hard limit a SIGKILL. */
        rlim_t cputime_limit = (rlim_t)ceil(limits.cpu_time);
        rlimits.push_back({RLIMIT_CPU, {cputime_limit, cputime_limit + 1}});
        rlimits.push_back({RLIMIT_FSIZE, {(rlim_t)limits.output, (rlim_t)limits.output}});
        rlimits.push_back({RLIMIT_CORE, {0, 0}});
        if (limits.processes > 0)
            rlimits.push_back({RLIMIT_NPROC, {(rlim_t)limits.processes, (rlim_t)limits.processes}});

        // 递归较深的程序需要较大的栈空间，这里将软限制提高到硬限制
        struct rlimit stack;
        if (getrlimit(RLIMIT_STACK, &stack) == 0) {
            stack.rlim_cur = stack.rlim_max;
            rlimits.push_back({RLIMIT_STACK, stack});
        }
    }
    string workdir = request.workdir.string();

    unique_ptr<execution_cgroup> cgroup;
    if (options.use_cgroup) {
        try {
            cgroup = make_unique<execution_cgroup>(limits.memory);
        } catch (cgroup_exception &e) {
            throw internal_error(fmt::format("unable to create cgroup: {}", e.what()));
        }
    }

    pipe_guard stdin_pipe, stdout_pipe, stderr_pipe, error_pipe, sync_pipe;

    pid_t child_pid = fork();
    if (child_pid < 0)
        return spawn_failure(fmt::format("unable to fork: {}", strerror(errno)));

    if (child_pid == 0) {  // child process, run the command
        auto fail = [&](int stage) {
            spawn_error err{stage, errno};
            ssize_t ignored = write(error_pipe.fd[PIPE_IN], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        };

        sigset_t emptymask;
        sigemptyset(&emptymask);
        sigprocmask(SIG_SETMASK, &emptymask, nullptr);
        signal(SIGPIPE, SIG_DFL);

        // 等待父进程把我们放进 cgroup
        char go;
        if (read(sync_pipe.fd[PIPE_OUT], &go, 1) != 1) fail(STAGE_SYNC);

        // run the command in a separate session and process group,
        // so the command and all its child processes can be killed
        // off with one signal
        if (setsid() == -1) fail(STAGE_SETSID);

        for (auto &setting : rlimits)
            if (setrlimit(setting.resource, &setting.value) != 0) fail(STAGE_RLIMIT);

        if (dup2(stdin_pipe.fd[PIPE_OUT], STDIN_FILENO) < 0 ||
            dup2(stdout_pipe.fd[PIPE_IN], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe.fd[PIPE_IN], STDERR_FILENO) < 0)
            fail(STAGE_REDIRECT);

        if (chdir(workdir.c_str()) != 0) fail(STAGE_CHDIR);

        execve(executable.c_str(), argv.data(), envp.data());
        fail(STAGE_EXEC);
    }

    // watchdog
    stdin_pipe.close_end(PIPE_OUT);
    stdout_pipe.close_end(PIPE_IN);
    stderr_pipe.close_end(PIPE_IN);
    error_pipe.close_end(PIPE_IN);
    sync_pipe.close_end(PIPE_OUT);

    if (cgroup) {
        try {
            cgroup->attach(child_pid);
        } catch (cgroup_exception &e) {
            kill(child_pid, SIGKILL);
            waitpid(child_pid, nullptr, 0);
            throw internal_error(fmt::format("unable to attach process to cgroup: {}", e.what()));
        }
    }
    {
        char go = 1;
        if (write(sync_pipe.fd[PIPE_IN], &go, 1) != 1)
            LOG(WARNING) << "Unable to signal child process " << child_pid << ": " << strerror(errno);
        sync_pipe.close_end(PIPE_IN);
    }

    // 错误管道在 execve 成功时因为 O_CLOEXEC 被关闭，此时读到 EOF
    spawn_error err{0, 0};
    ssize_t nread;
    do {
        nread = read(error_pipe.fd[PIPE_OUT], &err, sizeof(err));
    } while (nread < 0 && errno == EINTR);
    if (nread == (ssize_t)sizeof(err)) {
        waitpid(child_pid, nullptr, 0);
        string reason = fmt::format("{} failed for {}: {}", stage_name(err.stage), request.command[0], strerror(err.err));
        LOG(WARNING) << "Unable to spawn process: " << reason;
        return spawn_failure(reason);
    }

    resource_limiter limiter(limits, options.kill_grace, cgroup.get());
    limiter.supervise(child_pid);

    set_nonblocking(stdin_pipe.fd[PIPE_IN]);
    set_nonblocking(stdout_pipe.fd[PIPE_OUT]);
    set_nonblocking(stderr_pipe.fd[PIPE_OUT]);

    output_stream out{stdout_pipe.fd[PIPE_OUT], "", 0, limits.output};
    output_stream errout{stderr_pipe.fd[PIPE_OUT], "", 0, limits.output};
    bool out_open = true, err_open = true;
    size_t stdin_written = 0;
    if (request.stdin_data.empty()) stdin_pipe.close_end(PIPE_IN);

    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    bool exited = false;
    auto next_check = chrono::steady_clock::now() + options.poll_interval;

    while (!exited) {
        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (stdin_pipe.fd[PIPE_IN] >= 0) fds[nfds++] = {stdin_pipe.fd[PIPE_IN], POLLOUT, 0};
        if (out_open) fds[nfds++] = {out.fd, POLLIN, 0};
        if (err_open) fds[nfds++] = {errout.fd, POLLIN, 0};

        auto now = chrono::steady_clock::now();
        int timeout = (int)max<int64_t>(0, chrono::duration_cast<chrono::milliseconds>(next_check - now).count());
        // 管道都已经关闭时只能靠轮询发现进程结束，缩短等待时间
        if (nfds == 0) timeout = min(timeout, 2);

        int r = poll(fds, nfds, timeout);
        if (r < 0 && errno != EINTR)
            LOG(WARNING) << "Error polling child pipes: " << strerror(errno);

        for (nfds_t i = 0; r > 0 && i < nfds; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == stdin_pipe.fd[PIPE_IN]) {
                ssize_t nwritten = write(fds[i].fd, request.stdin_data.data() + stdin_written,
                                         min<size_t>(BUF_SIZE * 16, request.stdin_data.size() - stdin_written));
                if (nwritten > 0) stdin_written += nwritten;
                // 子进程不读标准输入就退出时会得到 EPIPE，这不是错误
                if ((nwritten < 0 && errno != EAGAIN && errno != EINTR) || stdin_written == request.stdin_data.size())
                    stdin_pipe.close_end(PIPE_IN);
            } else if (fds[i].fd == out.fd) {
                if (out.pump()) out_open = false;
            } else if (fds[i].fd == errout.fd) {
                if (errout.pump()) err_open = false;
            }
        }

        pid_t pid = wait4(child_pid, &status, WNOHANG, &usage);
        if (pid == child_pid) {
            exited = true;
        } else if (pid < 0 && errno != EINTR) {
            throw internal_error(fmt::format("unable to wait for child process {}: {}", child_pid, strerror(errno)));
        }

        if (!exited && chrono::steady_clock::now() >= next_check) {
            limiter.check(out.total, errout.total, cancel && cancel->is_cancelled());
            next_check = chrono::steady_clock::now() + options.poll_interval;
        }
    }

    // 主进程结束之后杀死所有子孙进程，它们可能仍然持有输出管道
    limiter.kill_group();
    stdin_pipe.close_end(PIPE_IN);

    auto drain_deadline = chrono::steady_clock::now() + options.kill_grace + options.poll_interval * 2;
    while ((out_open || err_open) && chrono::steady_clock::now() < drain_deadline) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) fds[nfds++] = {out.fd, POLLIN, 0};
        if (err_open) fds[nfds++] = {errout.fd, POLLIN, 0};
        if (poll(fds, nfds, 10) < 0 && errno != EINTR) break;
        if (out_open && out.pump()) out_open = false;
        if (err_open && errout.pump()) err_open = false;
    }

    usage_report report = limiter.finish(usage);

    execution_attempt attempt;
    if (WIFEXITED(status)) {
        attempt.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        attempt.signal = WTERMSIG(status);
        attempt.exit_code = attempt.signal + 128;
    }
    attempt.cpu_time = report.cpu_time;
    attempt.wall_time = report.wall_time;
    attempt.peak_memory = report.peak_memory;
    attempt.stdout_data = move(out.data);
    attempt.stderr_data = move(errout.data);
    attempt.stdout_bytes = out.total;
    attempt.stderr_bytes = errout.total;

    // 监控器记录的原因优先于进程实际结束的方式
    switch (report.cause) {
        case termination_cause::TIMED_OUT:
            attempt.status = attempt_status::TIMED_OUT;
            break;
        case termination_cause::MEMORY_EXCEEDED:
            attempt.status = attempt_status::MEMORY_EXCEEDED;
            break;
        case termination_cause::OUTPUT_EXCEEDED:
            attempt.status = attempt_status::OUTPUT_EXCEEDED;
            break;
        case termination_cause::PROCESS_EXCEEDED:
            // 和 RLIMIT_NPROC 导致 fork 失败一样视为运行时错误
            attempt.status = attempt_status::RUNTIME_ERROR;
            break;
        case termination_cause::CANCELLED:
            attempt.status = attempt_status::KILLED;
            break;
        case termination_cause::NATURAL:
            // 进程在两次检查之间输出过多并且自己退出了
            if (attempt.stdout_bytes > limits.output || attempt.stderr_bytes > limits.output)
                attempt.status = attempt_status::OUTPUT_EXCEEDED;
            else if (attempt.signal == SIGXCPU)
                attempt.status = attempt_status::TIMED_OUT;
            else if (attempt.signal == SIGXFSZ)
                attempt.status = attempt_status::OUTPUT_EXCEEDED;
            else if (attempt.signal != 0 || attempt.exit_code != 0)
                attempt.status = attempt_status::RUNTIME_ERROR;
            else
                attempt.status = attempt_status::COMPLETED;
            break;
    }

    DLOG(INFO) << fmt::format("Process {} finished: {}, exit code {}, cpu {:.3f}s, wall {:.3f}s, memory {}KB",
                              request.command[0], get_name(attempt.status), attempt.exit_code,
                              attempt.cpu_time, attempt.wall_time, attempt.peak_memory / 1024);
    return attempt;
}

}  // namespace grader
