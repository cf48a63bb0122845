#ifndef PICTOR_ABORT_SIGNAL_HPP
#define PICTOR_ABORT_SIGNAL_HPP

#include <support/errors.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace pictor {

/**
 * @brief Cooperative cancellation token shared by a job and everything it calls.
 *
 * Fired by a request deadline, a job deadline or a client disconnect. Work checks
 * it at its interruption points with throwIfAborted(); long-running collaborators
 * (the codec) subscribe with onAbort() to be told to stop.
 */
class AbortSignal {
public:
    using Callback = std::function<void()>;
    using Registration = uint64_t;

    static std::shared_ptr<AbortSignal> create() { return std::make_shared<AbortSignal>(); }

    // Returns false when the signal had already fired; only the first reason is kept.
    bool abort(ErrorKind kind, const std::string& reason);

    bool aborted() const { return aborted_.load(std::memory_order_acquire); }

    // Kind and message of the first abort() call, if any
    std::optional<ServiceError> reason() const;

    void throwIfAborted() const;

    // Callback runs inline if the signal already fired.
    Registration onAbort(Callback callback) const;
    // Once this returns the callback is neither running nor going to run.
    void removeCallback(Registration id) const;

private:
    std::atomic<bool> aborted_{false};
    mutable std::mutex mutex_;
    std::optional<ServiceError> reason_;
    mutable std::map<Registration, Callback> callbacks_;
    mutable Registration nextId_ = 1;
    // Callback currently being run by abort(), 0 when none
    Registration running_ = 0;
    std::thread::id runningThread_;
    mutable std::condition_variable finished_;
};

using AbortSignalPtr = std::shared_ptr<AbortSignal>;

/**
 * @brief Keeps an onAbort() registration alive for one scope.
 */
class AbortScope {
public:
    AbortScope(const AbortSignal& signal, AbortSignal::Callback callback);
    ~AbortScope();

    AbortScope(const AbortScope&) = delete;
    AbortScope& operator=(const AbortScope&) = delete;

private:
    const AbortSignal& signal_;
    AbortSignal::Registration id_;
};

}

#endif // PICTOR_ABORT_SIGNAL_HPP
