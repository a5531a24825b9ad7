#pragma once

#include "progress.hpp"
#include "subject.hpp"

#include <functional>
#include <memory>
#include <utility>

namespace liveprogress {

template <typename T>
class ProgressSource {
public:
    using value_type = T;
    using Listener = std::function<void(const Progress<T>&)>;

    virtual ~ProgressSource() = default;

    // The listener receives the latest state right away if there is one,
    // then every state published after it.
    virtual Subscription observe(Listener listener) = 0;
    virtual void removeObserver(Subscription subscription) = 0;
};

template <typename T>
using ProgressSourcePtr = std::shared_ptr<ProgressSource<T>>;

// A source whose states are published by the owner, for work that reports
// its progress by hand.
template <typename T>
class MutableProgress final : public ProgressSource<T> {
public:
    using typename ProgressSource<T>::Listener;

    Subscription observe(Listener listener) override { return subject_.subscribe(std::move(listener)); }

    void removeObserver(Subscription subscription) override { subject_.unsubscribe(subscription); }

    void publish(Progress<T> state) { subject_.publish(std::move(state)); }

    [[nodiscard]] std::shared_ptr<const Progress<T>> latest() const { return subject_.latest(); }

    [[nodiscard]] std::size_t observerCount() const { return subject_.observerCount(); }

private:
    Subject<Progress<T>> subject_;
};

} // namespace liveprogress
