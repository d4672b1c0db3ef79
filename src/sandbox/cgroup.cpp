#include "sandbox/cgroup.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <signal.h>
#include <fstream>
#include <mutex>
#include "common/utils.hpp"

namespace grader {
using namespace std;

cgroup_exception::cgroup_exception(const string &cgroup_op, int err) {
    if (err == ECGOTHER) {
        errmsg += "libcgroup: ";
        errmsg += cgroup_op;
        errmsg += ": ";
        errmsg += cgroup_strerror(cgroup_get_last_errno());
    } else {
        errmsg += cgroup_op;
        errmsg += ": ";
        errmsg += cgroup_strerror(err);
    }
}

const char *cgroup_exception::what() const noexcept {
    return errmsg.c_str();
}

void cgroup_exception::ensure(const string &cgroup_op, int err) {
    if (err != 0) {
        throw cgroup_exception(cgroup_op, err);
    }
}

void cgroup_guard::init() {
    static once_flag flag;
    call_once(flag, [] {
        cgroup_exception::ensure("cgroup_init", cgroup_init());
    });
}

void cgroup_ctrl::add_value(const string &name, int64_t value) {
    cgroup_exception::ensure(
        fmt::format("cgroup_add_value_int64({}, {})", name, value),
        cgroup_add_value_int64(ctrl, name.c_str(), value));
}

int64_t cgroup_ctrl::get_value_int64(const string &name) {
    int64_t value;
    cgroup_exception::ensure(
        fmt::format("cgroup_get_value_int64({})", name),
        cgroup_get_value_int64(ctrl, name.c_str(), &value));
    return value;
}

cgroup_guard::cgroup_guard(const string &cgroup_name) {
    cg = cgroup_new_cgroup(cgroup_name.c_str());
    if (!cg)
        throw cgroup_exception(
            fmt::format("cgroup_new_cgroup({})", cgroup_name),
            cgroup_get_last_errno());
}

cgroup_guard::~cgroup_guard() {
    cgroup_free(&cg);
}

void cgroup_guard::create_cgroup(int ignore_ownership) {
    cgroup_exception::ensure(
        fmt::format("cgroup_create_cgroup({})", ignore_ownership),
        cgroup_create_cgroup(cg, ignore_ownership));
}

cgroup_ctrl cgroup_guard::add_controller(const string &name) {
    struct cgroup_controller *cg_controller = cgroup_add_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_exception(
            fmt::format("cgroup_add_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

cgroup_ctrl cgroup_guard::get_controller(const string &name) {
    struct cgroup_controller *cg_controller = cgroup_get_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_exception(
            fmt::format("cgroup_get_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

void cgroup_guard::get_cgroup() {
    cgroup_exception::ensure(
        "cgroup_get_cgroup",
        cgroup_get_cgroup(cg));
}

void cgroup_guard::attach_task(pid_t pid) {
    cgroup_exception::ensure(
        fmt::format("cgroup_attach_task_pid({})", pid),
        cgroup_attach_task_pid(cg, pid));
}

void cgroup_guard::delete_cgroup() {
    cgroup_exception::ensure(
        "cgroup_delete_cgroup",
        cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE));
}

execution_cgroup::execution_cgroup(int64_t memory_limit)
    : cgroup_name("/grader/" + random_uuid()) {
    cgroup_guard::init();

    cgroup_guard cg(cgroup_name);
    cgroup_ctrl ctrl = cg.add_controller("memory");
    // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
    ctrl.add_value("memory.limit_in_bytes", memory_limit);
    ctrl.add_value("memory.memsw.limit_in_bytes", memory_limit);
    cg.add_controller("cpuacct");
    cg.create_cgroup(1);
    created = true;
}

execution_cgroup::~execution_cgroup() {
    if (!created) return;
    try {
        kill_all(SIGKILL);
        cgroup_guard cg(cgroup_name);
        cg.add_controller("cpuacct");
        cg.add_controller("memory");
        cg.delete_cgroup();
    } catch (cgroup_exception &e) {
        LOG(WARNING) << "Unable to delete cgroup " << cgroup_name << ": " << e.what();
    }
}

void execution_cgroup::attach(pid_t pid) {
    cgroup_guard cg(cgroup_name);
    cg.get_cgroup();
    cg.attach_task(pid);
}

int64_t execution_cgroup::memory_usage() {
    cgroup_guard cg(cgroup_name);
    cg.get_cgroup();
    return cg.get_controller("memory").get_value_int64("memory.usage_in_bytes");
}

int64_t execution_cgroup::max_memory_usage() {
    cgroup_guard cg(cgroup_name);
    cg.get_cgroup();
    return cg.get_controller("memory").get_value_int64("memory.memsw.max_usage_in_bytes");
}

double execution_cgroup::cpu_usage() {
    cgroup_guard cg(cgroup_name);
    cg.get_cgroup();
    int64_t cpu_time = cg.get_controller("cpuacct").get_value_int64("cpuacct.usage");  // in ns
    return (double)cpu_time / 1e9;
}

bool execution_cgroup::is_oom() {
    bool oom = false;
    ifstream fin("/sys/fs/cgroup/memory" + cgroup_name + "/memory.oom_control");
    while (fin.good()) {
        string token;
        fin >> token;
        if (token == "oom_kill") {
            int count = 0;
            fin >> count;
            oom = count > 0;
        }
    }
    return oom;
}

void execution_cgroup::kill_all(int sig) {
    void *handle = nullptr;
    pid_t pid;
    int ret = cgroup_get_task_begin(cgroup_name.c_str(), "memory", &handle, &pid);
    while (ret == 0) {
        if (kill(pid, sig) != 0 && errno != ESRCH)
            LOG(WARNING) << "Unable to kill process " << pid << " in cgroup " << cgroup_name;
        ret = cgroup_get_task_next(&handle, &pid);
    }
    cgroup_get_task_end(&handle);
}

const string &execution_cgroup::name() const {
    return cgroup_name;
}

}  // namespace grader
