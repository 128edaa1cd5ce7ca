#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

// Broadcast stop request for one run. Every runner subscribes a listener that
// aborts its stream; any runner (or the process signal handler) may trigger.
// Triggering twice is harmless: only the first call fires the listeners.
//
// Listeners run under call_m_, which unsubscribe() also takes, so once a
// Subscription is reset its listener is neither running nor about to run.
// A listener must not reset a Subscription of the same signal.
class ShutdownSignal {
public:
    using Listener = std::function<void()>;

    // RAII registration; unsubscribes on destruction so a listener never
    // outlives the connector it points at.
    class Subscription {
    public:
        Subscription() = default;
        Subscription(ShutdownSignal* sig, std::size_t id) : sig_(sig), id_(id) {}
        ~Subscription() { reset(); }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;
        Subscription(Subscription&& o) noexcept : sig_(std::exchange(o.sig_, nullptr)), id_(o.id_) {}
        Subscription& operator=(Subscription&& o) noexcept {
            if (this != &o) {
                reset();
                sig_ = std::exchange(o.sig_, nullptr);
                id_  = o.id_;
            }
            return *this;
        }

        void reset() {
            if (sig_) sig_->unsubscribe(id_);
            sig_ = nullptr;
        }

    private:
        ShutdownSignal* sig_{nullptr};
        std::size_t id_{0};
    };

    ShutdownSignal() = default;
    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    // A listener registered after the trigger runs immediately on the caller.
    [[nodiscard]] Subscription subscribe(Listener fn) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (!fired_) {
                const std::size_t id = next_id_++;
                listeners_.emplace_back(id, std::move(fn));
                return Subscription(this, id);
            }
        }
        if (fn) fn();
        return Subscription();
    }

    // Returns true for the call that actually fired the broadcast.
    bool trigger() {
        if (triggered()) return false;

        std::lock_guard<std::mutex> call_lk(call_m_);
        std::vector<std::pair<std::size_t, Listener>> to_call;
        {
            std::lock_guard<std::mutex> lk(m_);
            if (fired_) return false;
            fired_ = true;
            flag_.store(true, std::memory_order_release);
            to_call = listeners_;
        }
        // m_ is released so listeners may subscribe or trigger again.
        for (auto& l : to_call) {
            if (l.second) l.second();
        }
        return true;
    }

    bool triggered() const noexcept { return flag_.load(std::memory_order_acquire); }

private:
    // Blocks while a trigger() is running listeners.
    void unsubscribe(std::size_t id) {
        std::lock_guard<std::mutex> call_lk(call_m_);
        std::lock_guard<std::mutex> lk(m_);
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (it->first == id) {
                listeners_.erase(it);
                return;
            }
        }
    }

    std::mutex call_m_; // held while listeners run
    mutable std::mutex m_;
    bool fired_{false};
    std::atomic<bool> flag_{false};
    std::size_t next_id_{1};
    std::vector<std::pair<std::size_t, Listener>> listeners_;
};
