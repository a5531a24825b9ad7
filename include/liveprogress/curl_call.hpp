#pragma once

#include "call.hpp"

#include <memory>
#include <string>

namespace liveprogress {

struct CurlRequest {
    std::string url;
    bool follow_redirects{true};
    long connect_timeout_seconds{30};
    std::string user_agent{"liveprogress/1.0"};
};

// GET over libcurl on a worker thread owned by the call. The response body
// is reported to the call's ByteCounterTag chunk by chunk.
class CurlCall final : public Call<std::string> {
public:
    explicit CurlCall(CurlRequest request);
    ~CurlCall() override;

    void enqueue(CallbackPtr<std::string> callback) override;
    [[nodiscard]] std::unique_ptr<Call<std::string>> clone() const override;
    void cancel() override;
    [[nodiscard]] bool isCanceled() const override;
    [[nodiscard]] ByteCounterTagPtr tag() const override;

    [[nodiscard]] const CurlRequest& request() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace liveprogress
