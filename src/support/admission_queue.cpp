#include <support/admission_queue.hpp>
#include <trantor/net/EventLoop.h>
#include <trantor/utils/Logger.h>

#include <stdexcept>
#include <sstream>

namespace pictor {

AdmissionQueue::AdmissionQueue(QueueOptions options) : options_(options) {
    if (options_.concurrency == 0) {
        throw std::invalid_argument("AdmissionQueue concurrency must be at least 1");
    }
    if (options_.maxQueueSize == 0) {
        throw std::invalid_argument("AdmissionQueue maxQueueSize must be at least 1");
    }

    timerThread_.run();
    workers_.reserve(options_.concurrency);
    for (size_t i = 0; i < options_.concurrency; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }

    LOG_INFO << "Queue initialized with maxConcurrency: " << options_.concurrency
             << ", maxQueueSize: " << options_.maxQueueSize
             << ", job timeout: " << options_.jobTimeout.count() << "ms"
             << ", request timeout: " << options_.requestTimeout.count() << "ms";
}

AdmissionQueue::~AdmissionQueue() {
    beginShutdown();
    abandonRemaining();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    workAvailable_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

QueueStatus AdmissionQueue::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueueStatus{queued_, running_};
}

bool AdmissionQueue::shuttingDown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shuttingDown_;
}

void AdmissionQueue::admit(const JobPtr& job) {
    std::optional<ServiceError> refusal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shuttingDown_) {
            refusal.emplace(ErrorKind::ServiceUnavailable, "Service is shutting down, rejecting new tasks");
        } else if (queued_ + running_ >= options_.maxQueueSize) {
            std::ostringstream message;
            message << "Queue is overloaded (queueSize=" << queued_ << ", pending=" << running_ << ")";
            refusal.emplace(ErrorKind::Overloaded, message.str());
        } else {
            job->sequence = nextSequence_++;
            job->admittedAt = std::chrono::steady_clock::now();
            waiting_.push(job);
            ++queued_;
        }
    }

    if (refusal) {
        LOG_WARN << "Task rejected: " << refusal->what();
        job->reject(std::make_exception_ptr(*refusal));
        return;
    }
    workAvailable_.notify_one();

    std::weak_ptr<Job> weak = job;
    if (options_.requestTimeout.count() > 0) {
        auto timer = startTimer(options_.requestTimeout, [this, weak]() {
            auto expired = weak.lock();
            if (!expired) return;
            QueueStatus snapshot = status();
            std::ostringstream message;
            message << "Request timeout (queueSize=" << snapshot.queued << ", pending=" << snapshot.running << ")";
            cancel(expired, ErrorKind::TimedOut, message.str());
        });
        std::lock_guard<std::mutex> lock(mutex_);
        job->requestTimer = timer;
    }

    // May run inline when the caller's signal already fired
    auto registration = job->signal->onAbort([this, weak]() {
        auto aborted = weak.lock();
        if (!aborted) return;
        auto reason = aborted->signal->reason();
        if (reason) {
            cancel(aborted, reason->kind(), reason->what());
        } else {
            cancel(aborted, ErrorKind::Cancelled, "Task aborted");
        }
    });
    std::lock_guard<std::mutex> lock(mutex_);
    job->abortRegistration = registration;
}

void AdmissionQueue::workerLoop() {
    for (;;) {
        JobPtr job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            workAvailable_.wait(lock, [this]() { return stopping_ || !waiting_.empty(); });
            if (waiting_.empty()) return;
            job = waiting_.top();
            waiting_.pop();
            // Cancelled while waiting; its counters were already settled
            if (job->state != JobState::Queued) continue;
            job->state = JobState::Running;
            --queued_;
            ++running_;
            runningJobs_.insert(job);
        }
        execute(job);
    }
}

void AdmissionQueue::execute(const JobPtr& job) {
    if (options_.jobTimeout.count() > 0) {
        std::weak_ptr<Job> weak = job;
        auto timer = startTimer(options_.jobTimeout, [this, weak]() {
            auto expired = weak.lock();
            if (!expired) return;
            std::ostringstream message;
            message << "Job timeout after " << options_.jobTimeout.count() << "ms";
            cancel(expired, ErrorKind::TimedOut, message.str());
        });
        std::lock_guard<std::mutex> lock(mutex_);
        job->jobTimer = timer;
    }

    job->run(*job->signal, [this, &job](bool succeeded, const std::string& error) {
        return settle(job, succeeded, error);
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        --running_;
        runningJobs_.erase(job);
    }
    release(job);
    idle_.notify_all();
}

bool AdmissionQueue::settle(const JobPtr& job, bool succeeded, const std::string& error) {
    QueueStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job->state != JobState::Running) {
            // Deadline or abort got there first; the result is dropped
            return false;
        }
        job->state = succeeded ? JobState::Completed : JobState::Failed;
        snapshot = QueueStatus{queued_, running_};
    }

    if (succeeded) {
        LOG_DEBUG << "Task completed, duration: " << elapsedMs(job) << "ms"
                  << ", queueSize: " << snapshot.queued << ", pending: " << snapshot.running;
    } else {
        LOG_ERROR << "Task failed, duration: " << elapsedMs(job) << "ms, error: " << error;
    }
    return true;
}

void AdmissionQueue::cancel(const JobPtr& job, ErrorKind kind, const std::string& message) {
    bool wasQueued = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job->state == JobState::Queued) {
            wasQueued = true;
            --queued_;
        } else if (job->state != JobState::Running) {
            return;
        }
        job->state = JobState::Cancelled;
    }

    LOG_ERROR << "Task failed, duration: " << elapsedMs(job) << "ms, error: " << message;

    // Tell whatever is running to stop; a no-op when this came from the signal itself
    job->signal->abort(kind, message);
    job->reject(std::make_exception_ptr(ServiceError(kind, message)));

    if (wasQueued) {
        release(job);
        idle_.notify_all();
    }
}

void AdmissionQueue::release(const JobPtr& job) {
    trantor::TimerId requestTimer;
    trantor::TimerId jobTimer;
    AbortSignal::Registration registration;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requestTimer = job->requestTimer;
        jobTimer = job->jobTimer;
        registration = job->abortRegistration;
        job->requestTimer = 0;
        job->jobTimer = 0;
        job->abortRegistration = 0;
    }
    auto loop = timerThread_.getLoop();
    if (requestTimer) loop->invalidateTimer(requestTimer);
    if (jobTimer) loop->invalidateTimer(jobTimer);
    job->signal->removeCallback(registration);
}

void AdmissionQueue::beginShutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    shuttingDown_ = true;
}

bool AdmissionQueue::awaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto isIdle = [this]() { return queued_ == 0 && running_ == 0; };
    if (options_.drainTimeout.count() <= 0) {
        idle_.wait(lock, isIdle);
        return true;
    }
    return idle_.wait_for(lock, options_.drainTimeout, isIdle);
}

bool AdmissionQueue::shutdown() {
    LOG_INFO << "Starting graceful shutdown...";
    beginShutdown();
    bool drained = awaitIdle();
    if (drained) {
        LOG_INFO << "All tasks completed, shutdown complete";
    } else {
        QueueStatus snapshot = status();
        LOG_WARN << "Drain timeout of " << options_.drainTimeout.count() << "ms elapsed with "
                 << snapshot.queued << " queued and " << snapshot.running << " running tasks";
        abandonRemaining();
    }
    return drained;
}

void AdmissionQueue::abandonRemaining() {
    std::vector<JobPtr> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto pending = waiting_;
        while (!pending.empty()) {
            if (pending.top()->state == JobState::Queued) leftovers.push_back(pending.top());
            pending.pop();
        }
        leftovers.insert(leftovers.end(), runningJobs_.begin(), runningJobs_.end());
    }
    for (const auto& job : leftovers) {
        cancel(job, ErrorKind::ServiceUnavailable, "Service shut down before the task completed");
    }
}

trantor::TimerId AdmissionQueue::startTimer(std::chrono::milliseconds delay, std::function<void()> callback) {
    double seconds = std::chrono::duration<double>(delay).count();
    return timerThread_.getLoop()->runAfter(seconds, std::move(callback));
}

long long AdmissionQueue::elapsedMs(const JobPtr& job) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - job->admittedAt).count();
}

}
