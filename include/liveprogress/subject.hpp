#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace liveprogress {

using Subscription = std::uint64_t;

inline constexpr Subscription kNoSubscription = 0;

// Broadcast channel that keeps the latest value. New subscribers get the
// latest value first, then every later publish, in enqueue order.
//
// enqueue() may be called from any thread and never runs listeners. drain()
// delivers everything queued so far; only one thread drains at a time and a
// drain requested while another is running (including from inside a
// listener) is left to the running one.
template <typename T>
class Subject {
public:
    using Listener = std::function<void(const T&)>;

    Subscription subscribe(Listener listener) {
        Subscription id = kNoSubscription;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_id_++;
            observers_.push_back(Observer{id, next_sequence_,
                                          std::make_shared<Listener>(std::move(listener)),
                                          std::make_shared<std::atomic<bool>>(true)});
            if (latest_) {
                queue_.push_back(Pending{latest_, 0, id});
            }
        }
        drain();
        return id;
    }

    bool unsubscribe(Subscription id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = observers_.begin(); it != observers_.end(); ++it) {
            if (it->id == id) {
                it->active->store(false);
                observers_.erase(it);
                return true;
            }
        }
        return false;
    }

    void enqueue(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = std::make_shared<const T>(std::move(value));
        queue_.push_back(Pending{latest_, next_sequence_++, kNoSubscription});
    }

    void drain() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (draining_) {
                return;
            }
            draining_ = true;
        }

        try {
            for (;;) {
                Pending next;
                std::vector<Observer> targets;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (queue_.empty()) {
                        draining_ = false;
                        return;
                    }
                    next = std::move(queue_.front());
                    queue_.pop_front();
                    for (const auto& observer : observers_) {
                        const bool wanted = next.target != kNoSubscription
                                                ? observer.id == next.target
                                                : observer.first_sequence <= next.sequence;
                        if (wanted) {
                            targets.push_back(observer);
                        }
                    }
                }

                for (const auto& target : targets) {
                    if (target.active->load()) {
                        (*target.listener)(*next.value);
                    }
                }
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(mutex_);
            draining_ = false;
            throw;
        }
    }

    void publish(T value) {
        enqueue(std::move(value));
        drain();
    }

    [[nodiscard]] std::shared_ptr<const T> latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_;
    }

    [[nodiscard]] std::size_t observerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return observers_.size();
    }

private:
    struct Observer {
        Subscription id{kNoSubscription};
        std::uint64_t first_sequence{0};
        std::shared_ptr<Listener> listener;
        std::shared_ptr<std::atomic<bool>> active;
    };

    struct Pending {
        std::shared_ptr<const T> value;
        std::uint64_t sequence{0};
        Subscription target{kNoSubscription};
    };

    mutable std::mutex mutex_;
    std::vector<Observer> observers_;
    std::deque<Pending> queue_;
    std::shared_ptr<const T> latest_;
    std::uint64_t next_sequence_{1};
    Subscription next_id_{1};
    bool draining_{false};
};

} // namespace liveprogress
