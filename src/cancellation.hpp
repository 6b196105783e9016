#pragma once
#include <atomic>
#include <functional>
#include <map>
#include <mutex>

// One-shot cancellation flag shared between the runtime controller and a
// backend call running on another thread.
//
// Callbacks run with the token's lock held, so once unsubscribe() returns the
// callback is guaranteed not to be running and never will. Callbacks must be
// short and must not touch the token themselves.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cancelled_) return;
        cancelled_ = true;
        for (auto& [id, cb] : callbacks_) cb();
        callbacks_.clear();
    }

    bool cancelled() const { return cancelled_.load(); }

    // Registers cb; runs it right away if the token is already cancelled.
    // Returns an id for unsubscribe() (0 when cb already ran).
    size_t on_cancel(Callback cb) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cancelled_) {
            cb();
            return 0;
        }
        size_t id = ++next_id_;
        callbacks_.emplace(id, std::move(cb));
        return id;
    }

    void unsubscribe(size_t id) {
        std::lock_guard<std::mutex> lock(mtx_);
        callbacks_.erase(id);
    }

private:
    std::mutex mtx_;
    std::atomic<bool> cancelled_{false};
    size_t next_id_ = 0;
    std::map<size_t, Callback> callbacks_;
};

// Keeps a callback registered for the lifetime of a scope.
class CancelSubscription {
public:
    CancelSubscription(CancellationToken& token, CancellationToken::Callback cb)
        : token_(token), id_(token.on_cancel(std::move(cb))) {}
    ~CancelSubscription() { if (id_) token_.unsubscribe(id_); }

    CancelSubscription(const CancelSubscription&) = delete;
    CancelSubscription& operator=(const CancelSubscription&) = delete;

private:
    CancellationToken& token_;
    size_t id_;
};
