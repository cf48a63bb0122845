#include <support/abort_signal.hpp>
#include <trantor/utils/Logger.h>

namespace pictor {

bool AbortSignal::abort(ErrorKind kind, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (aborted_.load(std::memory_order_relaxed)) return false;
        reason_.emplace(kind, reason);
        aborted_.store(true, std::memory_order_release);
        runningThread_ = std::this_thread::get_id();
    }
    // One at a time and outside the lock, so callbacks may touch the signal again
    // and removeCallback() can still withdraw the ones not started yet
    for (;;) {
        Callback callback;
        Registration id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (callbacks_.empty()) break;
            auto next = callbacks_.begin();
            id = next->first;
            callback = std::move(next->second);
            callbacks_.erase(next);
            running_ = id;
        }
        try {
            callback();
        } catch (const std::exception& e) {
            LOG_ERROR << "Abort callback " << id << " failed: " << e.what();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = 0;
        }
        finished_.notify_all();
    }
    return true;
}

std::optional<ServiceError> AbortSignal::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

void AbortSignal::throwIfAborted() const {
    if (!aborted()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    throw *reason_;
}

AbortSignal::Registration AbortSignal::onAbort(Callback callback) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!aborted_.load(std::memory_order_relaxed)) {
            Registration id = nextId_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void AbortSignal::removeCallback(Registration id) const {
    if (id == 0) return;
    std::unique_lock<std::mutex> lock(mutex_);
    callbacks_.erase(id);
    // A callback withdrawing itself from inside abort() must not wait on itself
    if (runningThread_ == std::this_thread::get_id()) return;
    finished_.wait(lock, [this, id]() { return running_ != id; });
}

AbortScope::AbortScope(const AbortSignal& signal, AbortSignal::Callback callback)
    : signal_(signal), id_(signal.onAbort(std::move(callback))) {}

AbortScope::~AbortScope() {
    signal_.removeCallback(id_);
}

}
