#pragma once

#include "byte_counter.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace liveprogress {

template <typename T>
struct Response {
    int code{0};
    std::string message;
    std::optional<T> body;
    std::string error_body;

    [[nodiscard]] bool isSuccessful() const { return code >= 200 && code < 300; }
};

template <typename T>
class Callback {
public:
    virtual ~Callback() = default;

    // Any status code, including failures reported by the server.
    virtual void onResponse(Response<T> response) = 0;

    // The transport could not produce a response, or was canceled.
    virtual void onFailure(std::exception_ptr error) = 0;
};

template <typename T>
using CallbackPtr = std::shared_ptr<Callback<T>>;

// One re-runnable unit of work. A call is enqueued at most once; retries run
// on a clone.
template <typename T>
class Call {
public:
    virtual ~Call() = default;

    virtual void enqueue(CallbackPtr<T> callback) = 0;
    [[nodiscard]] virtual std::unique_ptr<Call<T>> clone() const = 0;
    virtual void cancel() = 0;
    [[nodiscard]] virtual bool isCanceled() const = 0;

    // Counter for the response body, or nullptr when the call reports no
    // byte progress.
    [[nodiscard]] virtual ByteCounterTagPtr tag() const = 0;
};

template <typename T>
using CallPtr = std::unique_ptr<Call<T>>;

} // namespace liveprogress
