#include "sandbox/supervisor.hpp"
#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "sandbox/cgroup.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

optional<proc_stat> read_proc_stat(pid_t pid) {
    ifstream fin("/proc/" + to_string(pid) + "/stat");
    string content;
    if (!fin || !getline(fin, content)) return nullopt;

    // 进程名可能包含空格和括号，因此从最后一个 ')' 之后开始解析
    size_t pos = content.rfind(')');
    if (pos == string::npos) return nullopt;

    istringstream ss(content.substr(pos + 1));
    proc_stat stat;
    stat.pid = pid;
    string state;
    uint64_t utime = 0, stime = 0;
    int64_t cutime = 0, cstime = 0;
    ss >> state >> stat.ppid >> stat.pgrp >> stat.session;
    // tty_nr tpgid flags minflt cminflt majflt cmajflt
    for (int i = 0; i < 7; ++i) {
        string ignored;
        ss >> ignored;
    }
    ss >> utime >> stime >> cutime >> cstime;
    // priority nice num_threads itrealvalue starttime vsize
    for (int i = 0; i < 6; ++i) {
        string ignored;
        ss >> ignored;
    }
    ss >> stat.rss_pages;
    if (!ss) return nullopt;

    stat.cpu_ticks = utime + stime + (uint64_t)max<int64_t>(cutime, 0) + (uint64_t)max<int64_t>(cstime, 0);
    return stat;
}

vector<proc_stat> session_members(pid_t sid) {
    vector<proc_stat> members;
    error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        const string name = it->path().filename().string();
        if (name.empty() || !all_of(name.begin(), name.end(), ::isdigit)) continue;
        auto stat = read_proc_stat((pid_t)stoi(name));
        if (stat && stat->session == sid) members.push_back(*stat);
    }
    return members;
}

resource_limiter::resource_limiter(const resource_limits &limits, chrono::milliseconds grace, execution_cgroup *cgroup)
    : limits(limits), grace(grace), cgroup(cgroup) {}

void resource_limiter::supervise(pid_t child) {
    pid = child;
    start = chrono::steady_clock::now();
}

double resource_limiter::elapsed() const {
    return chrono::duration<double>(chrono::steady_clock::now() - start).count();
}

termination_cause resource_limiter::cause() const {
    return reason;
}

void resource_limiter::sample() {
    static const long ticks_per_second = sysconf(_SC_CLK_TCK);
    static const long page_size = sysconf(_SC_PAGESIZE);

    // RLIMIT_NPROC 对 root 无效，并且统计的是整个用户的进程，因此进程数以会话为准
    vector<proc_stat> members = session_members(pid);
    processes = (int)members.size();

    if (cgroup) {
        try {
            cpu_time = max(cpu_time, cgroup->cpu_usage());
            peak_memory = max(peak_memory, cgroup->memory_usage());
            return;
        } catch (cgroup_exception &e) {
            LOG(WARNING) << "Unable to read cgroup " << cgroup->name() << ", falling back to /proc: " << e.what();
        }
    }

    uint64_t ticks = 0;
    int64_t rss = 0;
    for (auto &member : members) {
        ticks += member.cpu_ticks;
        rss += member.rss_pages * page_size;
    }
    cpu_time = max(cpu_time, (double)ticks / ticks_per_second);
    peak_memory = max(peak_memory, rss);
}

bool resource_limiter::check(int64_t stdout_bytes, int64_t stderr_bytes, bool cancelled) {
    if (reason != termination_cause::NATURAL) {
        if (!sigkill_sent && chrono::steady_clock::now() >= kill_deadline) {
            LOG(INFO) << "Process group " << pid << " survived SIGTERM, sending SIGKILL";
            signal_group(SIGKILL);
            sigkill_sent = true;
        }
        return true;
    }

    if (cancelled) {
        terminate(termination_cause::CANCELLED);
    } else if (stdout_bytes > limits.output || stderr_bytes > limits.output) {
        terminate(termination_cause::OUTPUT_EXCEEDED);
    } else if (elapsed() > limits.wall_time) {
        terminate(termination_cause::TIMED_OUT);
    } else {
        sample();
        if (cpu_time > limits.cpu_time)
            terminate(termination_cause::TIMED_OUT);
        else if (peak_memory > limits.memory)
            terminate(termination_cause::MEMORY_EXCEEDED);
        else if (processes > limits.processes)
            terminate(termination_cause::PROCESS_EXCEEDED);
    }
    return reason != termination_cause::NATURAL;
}

void resource_limiter::terminate(termination_cause cause) {
    if (reason != termination_cause::NATURAL || pid <= 0) return;
    reason = cause;
    LOG(INFO) << "Terminating process group " << pid << ": " << get_name(cause);

    // 先尝试让进程自行结束，超过 grace 之后再强制杀死
    if (grace.count() > 0) {
        signal_group(SIGTERM);
        kill_deadline = chrono::steady_clock::now() + grace;
    } else {
        signal_group(SIGKILL);
        sigkill_sent = true;
    }
}

void resource_limiter::kill_group() {
    if (pid > 0) signal_group(SIGKILL);
}

void resource_limiter::signal_group(int sig) {
    // 已经结束的进程不视为错误
    if (kill(-pid, sig) != 0 && errno != ESRCH)
        LOG(ERROR) << "Unable to send signal " << sig << " to process group " << pid << ": " << strerror(errno);

    for (auto &member : session_members(pid)) {
        if (kill(member.pid, sig) != 0 && errno != ESRCH)
            LOG(ERROR) << "Unable to send signal " << sig << " to process " << member.pid << ": " << strerror(errno);
    }

    if (cgroup) cgroup->kill_all(sig);
}

usage_report resource_limiter::finish(const struct rusage &usage) {
    usage_report report;
    report.wall_time = elapsed();

    double rusage_cpu = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec * 1e-6 +
                        usage.ru_stime.tv_sec + usage.ru_stime.tv_usec * 1e-6;
    cpu_time = max(cpu_time, rusage_cpu);
    peak_memory = max(peak_memory, (int64_t)usage.ru_maxrss * 1024);

    bool oom = false;
    if (cgroup) {
        try {
            cpu_time = max(cpu_time, cgroup->cpu_usage());
            peak_memory = max(peak_memory, cgroup->max_memory_usage());
            oom = cgroup->is_oom();
        } catch (cgroup_exception &e) {
            LOG(WARNING) << "Unable to read cgroup " << cgroup->name() << ": " << e.what();
        }
    }

    // 两次轮询之间发生的超限在这里补上
    if (reason == termination_cause::NATURAL) {
        if (oom || peak_memory > limits.memory)
            reason = termination_cause::MEMORY_EXCEEDED;
        else if (cpu_time > limits.cpu_time || report.wall_time > limits.wall_time)
            reason = termination_cause::TIMED_OUT;
    }

    report.cause = reason;
    report.cpu_time = cpu_time;
    report.peak_memory = peak_memory;
    return report;
}

}  // namespace grader
