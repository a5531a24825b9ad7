#pragma once

#include "call.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "progress_source.hpp"
#include "subject.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace liveprogress {

struct Options {
    // Publish NotStarted and wait for its start action instead of starting
    // on the first observer.
    bool manual_start{false};
    // Every failure is terminal.
    bool no_retry{false};
};

// Drives one logical operation over a Call: clones it for each attempt,
// follows its byte counter and turns its outcome into Progress states.
//
// Nothing happens until the first observer arrives. Only the most recent
// attempt may publish; callbacks of superseded attempts are dropped by
// comparing their generation with the current one.
template <typename T>
class CallProgress final : public ProgressSource<T>, public std::enable_shared_from_this<CallProgress<T>> {
public:
    using typename ProgressSource<T>::Listener;

    static std::shared_ptr<CallProgress> create(CallPtr<T> source, Options options = {}) {
        if (!source) {
            throw std::invalid_argument("CallProgress needs a call");
        }
        return std::shared_ptr<CallProgress>(new CallProgress(std::move(source), options));
    }

    ~CallProgress() override {
        if (current_.tag) {
            current_.tag->detach();
        }
        if (current_.call && current_.phase == Phase::Running) {
            current_.call->cancel();
        }
    }

    CallProgress(const CallProgress&) = delete;
    CallProgress& operator=(const CallProgress&) = delete;

    Subscription observe(Listener listener) override {
        const Subscription id = subject_.subscribe(std::move(listener));

        bool first = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!initialized_) {
                initialized_ = true;
                first = true;
            }
        }
        if (!first) {
            return id;
        }

        if (options_.manual_start) {
            std::weak_ptr<CallProgress> weak = this->weak_from_this();
            subject_.publish(NotStarted([weak] {
                if (auto self = weak.lock()) {
                    self->start();
                }
            }));
        } else {
            start();
        }
        return id;
    }

    void removeObserver(Subscription subscription) override { subject_.unsubscribe(subscription); }

    [[nodiscard]] std::shared_ptr<const Progress<T>> latest() const { return subject_.latest(); }

    [[nodiscard]] std::size_t observerCount() const { return subject_.observerCount(); }

    [[nodiscard]] const Options& options() const { return options_; }

private:
    enum class Phase {
        Idle,
        Running,
        Retriable,
        Finished
    };

    struct Attempt {
        std::uint64_t generation{0};
        int retries{-1};
        std::shared_ptr<Call<T>> call;
        ByteCounterTagPtr tag;
        std::int64_t bytes_read{0};
        Phase phase{Phase::Idle};
        bool aborted{false};
        std::exception_ptr error;
    };

    class AttemptCallback final : public Callback<T> {
    public:
        AttemptCallback(std::weak_ptr<CallProgress> owner, std::uint64_t generation)
            : owner_(std::move(owner)), generation_(generation) {}

        void onResponse(Response<T> response) override {
            if (auto self = owner_.lock()) {
                self->onResponse(generation_, std::move(response));
            }
        }

        void onFailure(std::exception_ptr error) override {
            if (auto self = owner_.lock()) {
                self->onFailure(generation_, std::move(error));
            }
        }

    private:
        std::weak_ptr<CallProgress> owner_;
        std::uint64_t generation_;
    };

    CallProgress(CallPtr<T> source, Options options) : source_(std::move(source)), options_(options) {}

    void start() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (started_) {
                return;
            }
            started_ = true;
        }
        launch(0);
    }

    void launch(int retries) {
        std::shared_ptr<Call<T>> call;
        std::exception_ptr clone_error;
        try {
            call = source_->clone();
            if (!call) {
                throw std::logic_error("Call::clone() returned nothing");
            }
        } catch (const std::exception& ex) {
            logger()->warn("attempt {} could not be created: {}", retries, ex.what());
            clone_error = std::current_exception();
        }
        ByteCounterTagPtr tag = call ? call->tag() : nullptr;
        std::weak_ptr<CallProgress> weak = this->weak_from_this();

        // Released after the lock: destroying a call may join its transport
        // thread, which can be inside one of our listeners.
        Attempt superseded;
        std::uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (current_.tag) {
                current_.tag->detach();
            }
            superseded = std::exchange(current_, Attempt{});

            generation = ++generation_;
            current_.generation = generation;
            current_.retries = retries;
            current_.call = call;
            current_.tag = tag;
            current_.phase = Phase::Running;

            if (!clone_error) {
                subject_.enqueue(InProgress(0, kInitialWork, abortAction(generation)));
                if (tag) {
                    tag->attach([weak, generation](std::int64_t delta) {
                        if (auto self = weak.lock()) {
                            self->onBytes(generation, delta);
                        }
                    });
                }
            }
        }

        if (superseded.call && superseded.phase == Phase::Running) {
            logger()->debug("canceling superseded attempt before attempt {}", retries);
            superseded.call->cancel();
        }
        if (clone_error) {
            onFailure(generation, clone_error);
            return;
        }
        logger()->debug("starting attempt {} (generation {})", retries, generation);
        subject_.drain();

        try {
            call->enqueue(std::make_shared<AttemptCallback>(weak, generation));
        } catch (const std::exception& ex) {
            logger()->warn("attempt {} could not be enqueued: {}", retries, ex.what());
            onFailure(generation, std::current_exception());
        }
    }

    Procedure abortAction(std::uint64_t generation) {
        std::weak_ptr<CallProgress> weak = this->weak_from_this();
        return [weak, generation] {
            if (auto self = weak.lock()) {
                self->abort(generation);
            }
        };
    }

    [[nodiscard]] bool isCurrent(std::uint64_t generation, Phase phase) const {
        return generation == current_.generation && current_.phase == phase;
    }

    void onBytes(std::uint64_t generation, std::int64_t delta) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!isCurrent(generation, Phase::Running) || current_.aborted) {
                logger()->trace("dropping byte count of stale generation {}", generation);
                return;
            }
            if (delta < 0) {
                current_.tag->detach();
                return;
            }
            current_.bytes_read += delta;
            subject_.enqueue(InProgress(current_.bytes_read, current_.tag->totalBytes(), abortAction(generation)));
        }
        subject_.drain();
    }

    void onResponse(std::uint64_t generation, Response<T> response) {
        if (!response.isSuccessful()) {
            const std::string message = response.message.empty() ? "(No status message)" : response.message;
            onFailure(generation, std::make_exception_ptr(ServiceError(message, response.code,
                                                                       std::move(response.error_body))));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!isCurrent(generation, Phase::Running)) {
                logger()->trace("dropping response of stale generation {}", generation);
                return;
            }
            current_.phase = Phase::Finished;
            if (current_.tag) {
                current_.tag->detach();
            }
            if (response.body) {
                subject_.enqueue(Completed<T>(std::move(*response.body)));
            } else {
                subject_.enqueue(Completed<T>());
            }
            logger()->debug("attempt {} completed", current_.retries);
        }
        subject_.drain();
    }

    void onFailure(std::uint64_t generation, std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!isCurrent(generation, Phase::Running)) {
                logger()->trace("dropping failure of stale generation {}", generation);
                return;
            }
            if (current_.tag) {
                current_.tag->detach();
            }

            const int retries = current_.retries;
            if (current_.aborted) {
                current_.phase = Phase::Finished;
                current_.error = aborted();
                subject_.enqueue(Failed(current_.error, retries));
                logger()->debug("attempt {} aborted", retries);
            } else if (options_.no_retry) {
                current_.phase = Phase::Finished;
                current_.error = std::move(error);
                subject_.enqueue(Failed(current_.error, retries));
            } else {
                current_.phase = Phase::Retriable;
                current_.error = std::move(error);
                std::weak_ptr<CallProgress> weak = this->weak_from_this();
                subject_.enqueue(Failed(
                    current_.error, retries, true,
                    [weak, generation] {
                        if (auto self = weak.lock()) {
                            self->retry(generation);
                        }
                    },
                    [weak, generation] {
                        if (auto self = weak.lock()) {
                            self->giveUp(generation);
                        }
                    }));
            }
            logger()->debug("attempt {} failed: {}", retries, Failed(current_.error).message());
        }
        subject_.drain();
    }

    void retry(std::uint64_t generation) {
        int next = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!isCurrent(generation, Phase::Retriable)) {
                return;
            }
            current_.phase = Phase::Finished;
            next = current_.retries + 1;
        }
        logger()->info("retrying, attempt {}", next);
        launch(next);
    }

    void giveUp(std::uint64_t generation) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!isCurrent(generation, Phase::Retriable)) {
                return;
            }
            current_.phase = Phase::Finished;
            subject_.enqueue(Failed(current_.error, current_.retries));
        }
        subject_.drain();
    }

    // Stops the transfer; the resulting failure is published when the
    // transport reports it.
    void abort(std::uint64_t generation) {
        std::shared_ptr<Call<T>> call;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!isCurrent(generation, Phase::Running) || current_.aborted) {
                return;
            }
            current_.aborted = true;
            if (current_.tag) {
                current_.tag->detach();
            }
            call = current_.call;
        }
        logger()->debug("aborting generation {}", generation);
        if (call) {
            call->cancel();
        }
    }

    CallPtr<T> source_;
    const Options options_;
    Subject<Progress<T>> subject_;

    mutable std::mutex mutex_;
    Attempt current_;
    std::uint64_t generation_{0};
    bool initialized_{false};
    bool started_{false};
};

template <typename T>
using CallProgressPtr = std::shared_ptr<CallProgress<T>>;

} // namespace liveprogress
