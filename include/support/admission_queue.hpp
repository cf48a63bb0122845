#ifndef PICTOR_ADMISSION_QUEUE_HPP
#define PICTOR_ADMISSION_QUEUE_HPP

#include <support/abort_signal.hpp>
#include <support/errors.hpp>
#include <trantor/net/EventLoopThread.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace pictor {

struct QueueOptions {
    size_t concurrency = 4;
    // queued + running jobs allowed before admissions are refused
    size_t maxQueueSize = 100;
    // 0 disables the corresponding deadline
    std::chrono::milliseconds jobTimeout{30000};
    std::chrono::milliseconds requestTimeout{60000};
    std::chrono::milliseconds drainTimeout{0};
};

struct QueueStatus {
    size_t queued = 0;
    size_t running = 0;
};

enum class JobState { Queued, Running, Completed, Failed, Cancelled };

/**
 * @brief Bounded-concurrency priority scheduler in front of every heavy task.
 *
 * A fixed pool of `concurrency` workers pulls jobs in (-priority, admission order).
 * Two deadlines race every job: the job timeout (execution only) and the request
 * timeout (queue wait + execution). When one fires the caller gets TimedOut right
 * away and the job's abort signal is raised; the worker slot is only released once
 * the work actually returns, and whatever it produced is discarded.
 */
class AdmissionQueue {
public:
    static constexpr int kDefaultPriority = 2;

    explicit AdmissionQueue(QueueOptions options);
    ~AdmissionQueue();

    AdmissionQueue(const AdmissionQueue&) = delete;
    AdmissionQueue& operator=(const AdmissionQueue&) = delete;

    /**
     * @brief Admits a unit of work.
     * @param work Runs on a worker thread; receives the job's abort signal.
     * @param priority Higher runs first.
     * @param signal Optional caller-owned signal (client disconnect). One is created if null.
     * @return Future holding the work's result, the work's own exception, or a ServiceError
     *         of kind Overloaded, TimedOut, ServiceUnavailable or Cancelled.
     */
    template <typename T>
    std::future<T> accept(std::function<T(const AbortSignal&)> work,
                          int priority = kDefaultPriority,
                          AbortSignalPtr signal = nullptr);

    /**
     * @brief Callback flavour of accept() for callers that must not block.
     *
     * `done` receives the ready future exactly once, on a worker thread, the timer
     * thread or the caller's thread when admission is refused.
     */
    template <typename T>
    void submit(std::function<T(const AbortSignal&)> work,
                std::function<void(std::future<T>)> done,
                int priority = kDefaultPriority,
                AbortSignalPtr signal = nullptr);

    QueueStatus status() const;
    const QueueOptions& options() const { return options_; }
    bool shuttingDown() const;

    // Refuses new admissions; admitted jobs keep running.
    void beginShutdown();
    // Blocks until idle or until the drain timeout elapses. Returns true when idle.
    bool awaitIdle();
    // beginShutdown() + awaitIdle(); leftovers are cancelled if the drain timed out.
    bool shutdown();

private:
    using Settle = std::function<bool(bool succeeded, const std::string& error)>;

    struct Job {
        int priority = 0;
        uint64_t sequence = 0;
        JobState state = JobState::Queued;
        AbortSignalPtr signal;
        std::chrono::steady_clock::time_point admittedAt;
        std::function<void(const AbortSignal&, const Settle&)> run;
        std::function<void(std::exception_ptr)> reject;
        trantor::TimerId requestTimer = 0;
        trantor::TimerId jobTimer = 0;
        AbortSignal::Registration abortRegistration = 0;
    };
    using JobPtr = std::shared_ptr<Job>;

    struct JobOrder {
        // true when a should run after b
        bool operator()(const JobPtr& a, const JobPtr& b) const {
            if (a->priority != b->priority) return a->priority < b->priority;
            return a->sequence > b->sequence;
        }
    };

    template <typename T>
    static JobPtr makeJob(std::function<T(const AbortSignal&)> work, int priority, AbortSignalPtr signal,
                          std::shared_ptr<std::promise<T>> promise, std::function<void()> notify);

    void admit(const JobPtr& job);
    void workerLoop();
    void execute(const JobPtr& job);
    bool settle(const JobPtr& job, bool succeeded, const std::string& error);
    void cancel(const JobPtr& job, ErrorKind kind, const std::string& message);
    void release(const JobPtr& job);
    void abandonRemaining();
    trantor::TimerId startTimer(std::chrono::milliseconds delay, std::function<void()> callback);
    long long elapsedMs(const JobPtr& job) const;

    QueueOptions options_;
    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;
    std::priority_queue<JobPtr, std::vector<JobPtr>, JobOrder> waiting_;
    std::unordered_set<JobPtr> runningJobs_;
    size_t queued_ = 0;
    size_t running_ = 0;
    uint64_t nextSequence_ = 0;
    bool shuttingDown_ = false;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
    // Declared last: destroyed first, so no deadline fires into a half-destroyed queue
    trantor::EventLoopThread timerThread_{"AdmissionTimers"};
};

template <typename T>
std::future<T> AdmissionQueue::accept(std::function<T(const AbortSignal&)> work,
                                      int priority,
                                      AbortSignalPtr signal) {
    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> future = promise->get_future();
    admit(makeJob<T>(std::move(work), priority, std::move(signal), promise, nullptr));
    return future;
}

template <typename T>
void AdmissionQueue::submit(std::function<T(const AbortSignal&)> work,
                            std::function<void(std::future<T>)> done,
                            int priority,
                            AbortSignalPtr signal) {
    auto promise = std::make_shared<std::promise<T>>();
    auto future = std::make_shared<std::future<T>>(promise->get_future());
    // The promise is settled exactly once, so this runs exactly once
    auto notify = [future, done = std::move(done)]() { done(std::move(*future)); };
    admit(makeJob<T>(std::move(work), priority, std::move(signal), promise, std::move(notify)));
}

template <typename T>
AdmissionQueue::JobPtr AdmissionQueue::makeJob(std::function<T(const AbortSignal&)> work,
                                               int priority,
                                               AbortSignalPtr signal,
                                               std::shared_ptr<std::promise<T>> promise,
                                               std::function<void()> notify) {
    auto job = std::make_shared<Job>();
    job->priority = priority;
    job->signal = signal ? std::move(signal) : AbortSignal::create();
    job->run = [work = std::move(work), promise, notify](const AbortSignal& abort, const Settle& done) {
        try {
            T value = work(abort);
            if (!done(true, "")) return;
            promise->set_value(std::move(value));
        } catch (const std::exception& e) {
            if (!done(false, e.what())) return;
            promise->set_exception(std::current_exception());
        } catch (...) {
            if (!done(false, "Unknown error")) return;
            promise->set_exception(std::current_exception());
        }
        if (notify) notify();
    };
    job->reject = [promise, notify](std::exception_ptr error) {
        promise->set_exception(error);
        if (notify) notify();
    };
    return job;
}

}

#endif // PICTOR_ADMISSION_QUEUE_HPP
