#pragma once

#include <stdexcept>
#include <string>

namespace liveprogress {

enum class HttpError {
    Rejected,
    NotAllowed,
    NotFound,
    Unavailable,
    Unspecified
};

[[nodiscard]] HttpError classifyStatus(int code);
[[nodiscard]] const char* toString(HttpError type);

// Thrown when a completed state without a payload is asked for its value.
class NoContentError : public std::logic_error {
public:
    NoContentError() : std::logic_error("No content") {}
};

// Reason carried by the failed state of an aborted attempt.
class ProgressAborted : public std::runtime_error {
public:
    explicit ProgressAborted(const std::string& message = "Aborted")
        : std::runtime_error(message) {}
};

// The transport succeeded but the server answered with a failure status.
class ServiceError : public std::runtime_error {
public:
    ServiceError(const std::string& message, int code, std::string body = {});

    [[nodiscard]] int code() const { return code_; }
    [[nodiscard]] const std::string& body() const { return body_; }
    [[nodiscard]] HttpError type() const { return type_; }

private:
    int code_;
    std::string body_;
    HttpError type_;
};

} // namespace liveprogress
