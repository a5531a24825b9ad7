#pragma once

#include "progress.hpp"
#include "progress_source.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace liveprogress {

// Dispatches every state to the visitor until the source is told otherwise.
template <typename Source>
Subscription observe(const std::shared_ptr<Source>& source,
                     std::shared_ptr<Visitor<typename Source::value_type, void>> visitor) {
    using T = typename Source::value_type;
    if (!source || !visitor) {
        throw std::invalid_argument("observe needs a source and a visitor");
    }
    return source->observe([visitor](const Progress<T>& state) { state.select(*visitor); });
}

// Dispatches every state to the visitor and stops observing after the first
// terminal state.
template <typename Source>
Subscription collect(const std::shared_ptr<Source>& source,
                     std::shared_ptr<Visitor<typename Source::value_type, void>> visitor) {
    using T = typename Source::value_type;
    if (!source || !visitor) {
        throw std::invalid_argument("collect needs a source and a visitor");
    }

    struct Link {
        std::mutex mutex;
        Subscription id{kNoSubscription};
        bool finished{false};
    };
    auto link = std::make_shared<Link>();
    std::weak_ptr<ProgressSource<T>> weak = source;

    const Subscription id = source->observe([link, weak, visitor](const Progress<T>& state) {
        {
            std::lock_guard<std::mutex> lock(link->mutex);
            if (link->finished) {
                return;
            }
            if (state.isTerminal()) {
                link->finished = true;
            }
        }

        state.select(*visitor);

        if (!state.isTerminal()) {
            return;
        }
        Subscription registered = kNoSubscription;
        {
            std::lock_guard<std::mutex> lock(link->mutex);
            registered = link->id;
        }
        auto owner = weak.lock();
        if (owner && registered != kNoSubscription) {
            owner->removeObserver(registered);
        }
    });

    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(link->mutex);
        link->id = id;
        finished = link->finished;
    }
    // A terminal state may arrive before observe() returns.
    if (finished) {
        source->removeObserver(id);
    }
    return id;
}

namespace detail {

template <typename T>
class PromiseVisitor final : public When<T> {
public:
    [[nodiscard]] std::future<T> future() { return promise_.get_future(); }

    void onFailed(const Failed& error) override {
        if (error.isTerminal()) {
            promise_.set_exception(error.reason() ? error.reason() : std::make_exception_ptr(
                                                                        std::runtime_error("Unknown failure")));
        }
    }

    void onCompleted(const Completed<T>& result) override {
        if (!result.hasValue()) {
            promise_.set_exception(std::make_exception_ptr(NoContentError()));
            return;
        }
        promise_.set_value(result.value());
    }

private:
    std::promise<T> promise_;
};

} // namespace detail

// Future of the completed value, or of the reason of the terminal failure.
// Retriable failures are not terminal and leave the future pending.
template <typename Source, typename T = typename Source::value_type>
[[nodiscard]] std::future<T> awaitAsync(const std::shared_ptr<Source>& source) {
    auto visitor = std::make_shared<detail::PromiseVisitor<T>>();
    auto future = visitor->future();
    collect(source, std::shared_ptr<Visitor<T, void>>(visitor));
    return future;
}

// Blocks until the operation reaches a terminal state.
template <typename Source, typename T = typename Source::value_type>
T await(const std::shared_ptr<Source>& source) {
    return awaitAsync(source).get();
}

} // namespace liveprogress
