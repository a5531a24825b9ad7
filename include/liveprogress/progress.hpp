#pragma once

#include "errors.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace liveprogress {

using Procedure = std::function<void()>;

// Total used while the size of the work is not known yet.
inline constexpr std::int64_t kInitialWork = -1;

class NotStarted {
public:
    explicit NotStarted(Procedure start = {}) : start_(std::move(start)) {}

    void start() const {
        if (start_) {
            start_();
        }
    }

    void operator()() const { start(); }

private:
    Procedure start_;
};

class InProgress {
public:
    explicit InProgress(std::int64_t done = 0, std::int64_t total = kInitialWork, Procedure abort = {})
        : done_(done), total_(total), abort_(std::move(abort)) {}

    [[nodiscard]] std::int64_t done() const { return done_; }
    [[nodiscard]] std::int64_t total() const { return total_; }
    [[nodiscard]] bool isIndeterminate() const { return total_ <= 0; }

    // 0 when the total is unknown.
    [[nodiscard]] float percentDone() const {
        if (isIndeterminate()) {
            return 0.0F;
        }
        return static_cast<float>(done_) / static_cast<float>(total_);
    }

    void abort() const {
        if (abort_) {
            abort_();
        }
    }

private:
    std::int64_t done_;
    std::int64_t total_;
    Procedure abort_;
};

class Failed {
public:
    explicit Failed(std::exception_ptr reason, int retries = -1)
        : Failed(std::move(reason), retries, false, {}, {}) {}

    Failed(std::exception_ptr reason, int retries, bool can_retry, Procedure retry, Procedure abort)
        : reason_(std::move(reason)),
          retries_(retries),
          can_retry_(can_retry),
          retry_(std::move(retry)),
          abort_(std::move(abort)) {}

    [[nodiscard]] const std::exception_ptr& reason() const { return reason_; }
    [[nodiscard]] int retries() const { return retries_; }
    [[nodiscard]] bool canRetry() const { return can_retry_; }
    [[nodiscard]] bool isTerminal() const { return !can_retry_; }

    // Starts the next attempt. Does nothing unless canRetry().
    void retry() const {
        if (can_retry_ && retry_) {
            retry_();
        }
    }

    // Gives up on a retriable failure, turning it into a terminal one.
    void abort() const {
        if (abort_) {
            abort_();
        }
    }

    [[noreturn]] void rethrow() const {
        if (reason_) {
            std::rethrow_exception(reason_);
        }
        throw std::runtime_error("Unknown failure");
    }

    [[nodiscard]] std::string message() const {
        if (!reason_) {
            return "Unknown failure";
        }
        try {
            std::rethrow_exception(reason_);
        } catch (const std::exception& ex) {
            return ex.what();
        } catch (...) {
            return "Non-standard exception";
        }
    }

    template <typename E>
    [[nodiscard]] bool holds() const {
        if (!reason_) {
            return false;
        }
        try {
            std::rethrow_exception(reason_);
        } catch (const E&) {
            return true;
        } catch (...) {
            return false;
        }
    }

private:
    std::exception_ptr reason_;
    int retries_;
    bool can_retry_;
    Procedure retry_;
    Procedure abort_;
};

template <typename T>
class Completed {
public:
    // Succeeded without a payload.
    Completed() = default;

    explicit Completed(T value) : value_(std::move(value)) {}

    [[nodiscard]] bool hasValue() const { return value_.has_value(); }

    [[nodiscard]] const T& value() const {
        if (!value_) {
            throw NoContentError();
        }
        return *value_;
    }

    [[nodiscard]] const std::optional<T>& result() const { return value_; }

private:
    std::optional<T> value_;
};

template <typename T, typename R>
class Visitor {
public:
    virtual ~Visitor() = default;

    virtual R on(const NotStarted& start) = 0;
    virtual R on(const InProgress& work) = 0;
    virtual R on(const Failed& error) = 0;
    virtual R on(const Completed<T>& result) = 0;
};

// Visitor for callers that only care about outcomes. A NotStarted state is
// started by default and InProgress is ignored.
template <typename T>
class When : public Visitor<T, void> {
public:
    virtual void onFailed(const Failed& error) = 0;
    virtual void onCompleted(const Completed<T>& result) = 0;

    virtual void onNotStarted(const NotStarted& start) { start(); }
    virtual void onInProgress(const InProgress& /*work*/) {}

    void on(const NotStarted& start) final { onNotStarted(start); }
    void on(const InProgress& work) final { onInProgress(work); }
    void on(const Failed& error) final { onFailed(error); }
    void on(const Completed<T>& result) final { onCompleted(result); }
};

template <typename T>
class Progress {
public:
    using value_type = T;
    using State = std::variant<NotStarted, InProgress, Failed, Completed<T>>;

    Progress(NotStarted state) : state_(std::move(state)) {}
    Progress(InProgress state) : state_(std::move(state)) {}
    Progress(Failed state) : state_(std::move(state)) {}
    Progress(Completed<T> state) : state_(std::move(state)) {}

    [[nodiscard]] bool isTerminal() const {
        if (std::holds_alternative<Completed<T>>(state_)) {
            return true;
        }
        if (const auto* error = std::get_if<Failed>(&state_)) {
            return error->isTerminal();
        }
        return false;
    }

    template <typename Case>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<Case>(state_);
    }

    template <typename Case>
    [[nodiscard]] const Case& get() const {
        return std::get<Case>(state_);
    }

    template <typename Case>
    [[nodiscard]] const Case* getIf() const {
        return std::get_if<Case>(&state_);
    }

    [[nodiscard]] const State& state() const { return state_; }

    template <typename R>
    R select(Visitor<T, R>& k) const {
        return std::visit([&k](const auto& state) -> R { return k.on(state); }, state_);
    }

    template <typename F>
    decltype(auto) visit(F&& f) const {
        return std::visit(std::forward<F>(f), state_);
    }

    // Transforms the payload of a Completed state. Every other case carries
    // no T and comes back unchanged.
    template <typename F>
    auto map(F&& transform) const -> Progress<std::decay_t<std::invoke_result_t<F&, const T&>>> {
        using R = std::decay_t<std::invoke_result_t<F&, const T&>>;
        return std::visit(
            [&transform](const auto& state) -> Progress<R> {
                using Case = std::decay_t<decltype(state)>;
                if constexpr (std::is_same_v<Case, Completed<T>>) {
                    if (!state.hasValue()) {
                        return Completed<R>();
                    }
                    return Completed<R>(transform(state.value()));
                } else {
                    return state;
                }
            },
            state_);
    }

    template <typename F>
    void forSome(F&& action) const {
        if (const auto* result = std::get_if<Completed<T>>(&state_)) {
            if (result->hasValue()) {
                action(result->value());
            }
        }
    }

private:
    State state_;
};

template <typename T>
[[nodiscard]] Completed<std::decay_t<T>> completed(T&& value) {
    return Completed<std::decay_t<T>>(std::forward<T>(value));
}

// A retriable failure iff a retry action is given.
[[nodiscard]] inline Failed failed(std::exception_ptr reason, int retries = -1, Procedure retry = {},
                                   Procedure abort = {}) {
    const bool can_retry = static_cast<bool>(retry);
    return Failed(std::move(reason), retries, can_retry, std::move(retry), std::move(abort));
}

[[nodiscard]] inline std::exception_ptr aborted() {
    return std::make_exception_ptr(ProgressAborted());
}

} // namespace liveprogress
