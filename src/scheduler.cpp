#include "scheduler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include "common/cancellation.hpp"
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "judge/pipeline.hpp"

namespace grader {
using namespace std;

namespace detail {

/**
 * @brief 一个已被接受的提交，由 ticket 和调度器共享
 */
struct job {
    shared_ptr<const submission> submit;
    cancellation_token token;
    weak_ptr<scheduler_state> owner;

    mutable mutex mut;
    mutable condition_variable cond;
    optional<submission_result> result;

    bool finished() const {
        lock_guard<mutex> guard(mut);
        return result.has_value();
    }
};

struct scheduler_state {
    scheduler_state(const engine_config &config, const toolchain_registry &registry, const process_runner &runner,
                    store::result_store &store, vector<shared_ptr<monitor>> monitors)
        : config(config), registry(registry), runner(runner), store(store), monitors(move(monitors)), queue(config.max_queue_depth) {}

    /**
     * @brief 检查提交是否可以被接受，可以则记录 PENDING 状态后入队
     * PENDING 必须在入队之前写入，否则 worker 写入的 TESTING 和 FINISHED 可能被它覆盖
     * @throw overloaded_error 如果提交被拒绝
     */
    void admit(const shared_ptr<job> &j, int priority);

    /**
     * @brief 检查并占用提交的名额
     * @throw overloaded_error 如果提交被拒绝
     */
    void reserve(const submission &submit, chrono::steady_clock::time_point now);

    /**
     * @brief 提交结束，释放提交占用的名额
     */
    void release(const job &j);

    /**
     * @brief 删除滑动窗口之外的接受记录，没有记录的用户会被移除
     */
    void prune_admissions(chrono::steady_clock::time_point now);

    /**
     * @brief 保存提交的状态，重试失败时通知监控
     */
    void persist_state(int worker_id, const submission &submit, submission_state state);

    void worker_loop(int worker_id);
    void process(int worker_id, const shared_ptr<job> &j);

    /**
     * @brief 保存评测结果并唤醒等待的 ticket
     */
    void complete(int worker_id, const shared_ptr<job> &j, submission_result result);

    /**
     * @brief 如果提交还在队列中，将其删除并以 CANCELLED 结束
     * @return 提交是否还在队列中
     */
    bool cancel_queued(const shared_ptr<job> &j);

    void call_monitor(int worker_id, const function<void(monitor &)> &callback);

    const engine_config &config;
    const toolchain_registry &registry;
    const process_runner &runner;
    store::result_store &store;
    vector<shared_ptr<monitor>> monitors;

    concurrent_queue<shared_ptr<job>> queue;

    mutable mutex mut;
    bool shutting_down = false;
    // 已被接受且还没有结束的提交，键为提交 id
    unordered_map<string, shared_ptr<job>> active;
    unordered_map<string, size_t> user_in_flight;
    // 每个用户在滑动窗口内被接受的提交的时间
    unordered_map<string, deque<chrono::steady_clock::time_point>> user_admissions;
    // 已经占用名额但还没有入队的提交数，关闭调度器前需要等待它们入队
    size_t reserving = 0;
    condition_variable reserving_cond;
};

void scheduler_state::call_monitor(int worker_id, const function<void(monitor &)> &callback) {
    try {
        for (auto &m : monitors) callback(*m);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " has crashed when reporting monitoring information, " << ex.what();
    }
}

void scheduler_state::prune_admissions(chrono::steady_clock::time_point now) {
    for (auto it = user_admissions.begin(); it != user_admissions.end();) {
        auto &window = it->second;
        while (!window.empty() && now - window.front() >= config.user_rate_window)
            window.pop_front();
        if (window.empty())
            it = user_admissions.erase(it);
        else
            ++it;
    }
}

void scheduler_state::reserve(const submission &submit, chrono::steady_clock::time_point now) {
    if (shutting_down)
        throw overloaded_error(overloaded_error::reason::SHUTTING_DOWN, "Scheduler is shutting down");
    if (active.count(submit.id))
        throw overloaded_error(overloaded_error::reason::DUPLICATE, fmt::format("Submission[{}] is already in flight", submit.id));

    prune_admissions(now);
    if (!submit.user_id.empty()) {
        if (config.max_user_in_flight > 0) {
            auto it = user_in_flight.find(submit.user_id);
            if (it != user_in_flight.end() && it->second >= config.max_user_in_flight)
                throw overloaded_error(overloaded_error::reason::USER_LIMIT,
                                       fmt::format("User {} already has {} submissions in flight", submit.user_id, it->second));
        }
        if (config.max_user_per_minute > 0) {
            auto it = user_admissions.find(submit.user_id);
            if (it != user_admissions.end() && it->second.size() >= config.max_user_per_minute)
                throw overloaded_error(overloaded_error::reason::USER_RATE,
                                       fmt::format("User {} exceeded {} submissions per minute", submit.user_id, config.max_user_per_minute));
        }
    }

    // 正在写入 PENDING 的提交也占用队列的位置，保证随后的入队不会因为队列已满而失败
    if (config.max_queue_depth > 0 && queue.size() + reserving >= config.max_queue_depth)
        throw overloaded_error(overloaded_error::reason::QUEUE_FULL,
                               fmt::format("Queue is full ({} submissions waiting)", config.max_queue_depth));

    if (!submit.user_id.empty()) {
        ++user_in_flight[submit.user_id];
        if (config.max_user_per_minute > 0) user_admissions[submit.user_id].push_back(now);
    }
    ++reserving;
}

void scheduler_state::admit(const shared_ptr<job> &j, int priority) {
    const submission &submit = *j->submit;
    auto now = chrono::steady_clock::now();

    {
        lock_guard<mutex> guard(mut);
        reserve(submit, now);
        active[submit.id] = j;
    }
    defer {
        {
            lock_guard<mutex> guard(mut);
            --reserving;
        }
        reserving_cond.notify_all();
    };

    persist_state(-1, submit, submission_state::PENDING);

    // 关闭调度器会等待所有占用名额的提交入队，因此这里只有队列本身出错时才会失败
    if (!queue.push(j, priority)) {
        release(*j);
        throw internal_error(fmt::format("Unable to enqueue Submission[{}]", submit.id));
    }
}

void scheduler_state::release(const job &j) {
    const submission &submit = *j.submit;
    lock_guard<mutex> guard(mut);
    active.erase(submit.id);
    if (!submit.user_id.empty()) {
        auto it = user_in_flight.find(submit.user_id);
        if (it != user_in_flight.end() && --it->second == 0)
            user_in_flight.erase(it);
    }
}

void scheduler_state::persist_state(int worker_id, const submission &submit, submission_state state) {
    bool saved = store::persist_with_retry(
        [&] { store.set_state(submit.id, state); },
        config.persist_attempts, config.persist_backoff, fmt::format("state of Submission[{}]", submit.id));
    if (!saved)
        call_monitor(worker_id, [&](monitor &m) {
            m.persistence_failed(submit, fmt::format("unable to record state {} after retries", get_name(state)));
        });
}

void scheduler_state::complete(int worker_id, const shared_ptr<job> &j, submission_result result) {
    const submission &submit = *j->submit;

    result.persisted = true;
    bool saved = store::persist_with_retry(
        [&] { store.save(result); },
        config.persist_attempts, config.persist_backoff, fmt::format("result of Submission[{}]", submit.id));
    if (saved) {
        persist_state(worker_id, submit, submission_state::FINISHED);
    } else {
        result.persisted = false;
        call_monitor(worker_id, [&](monitor &m) { m.persistence_failed(submit, "unable to save result after retries"); });
    }

    release(*j);
    call_monitor(worker_id, [&](monitor &m) { m.end_submission(worker_id, submit, result); });

    {
        lock_guard<mutex> guard(j->mut);
        j->result = move(result);
    }
    j->cond.notify_all();
}

void scheduler_state::process(int worker_id, const shared_ptr<job> &j) {
    const submission &submit = *j->submit;

    if (j->token.is_cancelled()) {
        complete(worker_id, j, synthesize_result(submit, verdict::CANCELLED, "cancelled before execution"));
        return;
    }

    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::JUDGING, ""); });
    defer {
        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });
    };
    call_monitor(worker_id, [&](monitor &m) { m.start_submission(worker_id, submit); });

    persist_state(worker_id, submit, submission_state::TESTING);

    execution_pipeline pipeline(config, registry, runner);
    submission_result result = pipeline.execute(submit, &j->token);
    complete(worker_id, j, move(result));
}

void scheduler_state::worker_loop(int worker_id) {
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::START, ""); });

    // 队列关闭且为空时 pop 返回空，worker 自然退出
    while (auto next = queue.pop()) {
        shared_ptr<job> j = *next;
        try {
            process(worker_id, j);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when judging " << *j->submit << ": " << ex.what();
            call_monitor(worker_id, [&](monitor &m) {
                m.worker_state_changed(worker_id, worker_state::CRASHED, ex.what());
                m.report_error(ex.what());
            });
            if (!j->finished())
                complete(worker_id, j, synthesize_result(*j->submit, verdict::SYSTEM_ERROR, ex.what()));
        }
    }

    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::STOPPED, ""); });
}

bool scheduler_state::cancel_queued(const shared_ptr<job> &j) {
    auto removed = queue.remove_if([&](const shared_ptr<job> &queued) { return queued == j; });
    if (removed.empty()) return false;
    LOG(INFO) << *j->submit << " cancelled before execution";
    complete(-1, j, synthesize_result(*j->submit, verdict::CANCELLED, "cancelled before execution"));
    return true;
}

}  // namespace detail

ticket::ticket(shared_ptr<detail::job> job) : job(move(job)) {}

const string &ticket::submission_id() const {
    return job->submit->id;
}

bool ticket::done() const {
    return job->finished();
}

void ticket::wait() const {
    unique_lock<mutex> lock(job->mut);
    job->cond.wait(lock, [this] { return job->result.has_value(); });
}

bool ticket::wait_for(chrono::milliseconds timeout) const {
    unique_lock<mutex> lock(job->mut);
    return job->cond.wait_for(lock, timeout, [this] { return job->result.has_value(); });
}

const submission_result &ticket::get() const {
    wait();
    lock_guard<mutex> guard(job->mut);
    return *job->result;
}

void ticket::cancel() {
    if (job->finished()) return;
    job->token.cancel();
    if (auto owner = job->owner.lock())
        owner->cancel_queued(job);
}

scheduler::scheduler(const engine_config &config, const toolchain_registry &registry, const process_runner &runner,
                     store::result_store &store, vector<shared_ptr<monitor>> monitors)
    : state(make_shared<detail::scheduler_state>(config, registry, runner, store, move(monitors))) {
    if (config.concurrency < 1)
        throw config_error("concurrency must be at least 1");

    LOG(INFO) << "Starting " << config.concurrency << " workers";
    for (size_t i = 0; i < config.concurrency; ++i) {
        detail::scheduler_state *s = state.get();
        int worker_id = (int)i;
        workers.emplace_back([s, worker_id] { s->worker_loop(worker_id); });
    }
}

scheduler::~scheduler() {
    shutdown(false);
}

ticket scheduler::submit(shared_ptr<const submission> submit, int priority) {
    if (!submit)
        throw invalid_argument("submission must not be null");
    if (submit->test_cases.empty())
        throw invalid_argument(fmt::format("Submission[{}] has no test cases", submit->id));

    auto j = make_shared<detail::job>();
    j->submit = move(submit);
    j->owner = state;
    state->admit(j, priority);

    LOG(INFO) << *j->submit << " admitted with priority " << priority << ", queue size: " << state->queue.size();
    return ticket(j);
}

void scheduler::shutdown(bool drain) {
    {
        unique_lock<mutex> lock(state->mut);
        if (state->shutting_down && workers.empty()) return;
        state->shutting_down = true;
        state->reserving_cond.wait(lock, [this] { return state->reserving == 0; });
    }
    LOG(INFO) << "Shutting down scheduler, " << (drain ? "draining" : "cancelling") << " " << state->queue.size() << " queued submissions";

    if (!drain) {
        for (auto &j : state->queue.remove_if([](const shared_ptr<detail::job> &) { return true; }))
            state->complete(-1, j, synthesize_result(*j->submit, verdict::CANCELLED, "scheduler shut down"));

        vector<shared_ptr<detail::job>> running;
        {
            lock_guard<mutex> guard(state->mut);
            for (auto &[id, j] : state->active) running.push_back(j);
        }
        for (auto &j : running) j->token.cancel();
    }

    state->queue.close();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
    workers.clear();
    LOG(INFO) << "Scheduler stopped";
}

size_t scheduler::queued() const {
    return state->queue.size();
}

size_t scheduler::tracked_users() const {
    lock_guard<mutex> guard(state->mut);
    state->prune_admissions(chrono::steady_clock::now());
    return state->user_admissions.size();
}

size_t scheduler::in_flight() const {
    lock_guard<mutex> guard(state->mut);
    return state->active.size();
}

}  // namespace grader
