#include "liveprogress/curl_call.hpp"
#include "liveprogress/errors.hpp"
#include "liveprogress/log.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <curl/curl.h>

namespace liveprogress {

namespace {

// curl_global_init for the whole process, undone at static destruction.
class CurlRuntime {
public:
    static void require() { static const CurlRuntime runtime; }

    ~CurlRuntime() { curl_global_cleanup(); }

private:
    CurlRuntime() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error(std::string{"libcurl setup failed: "} + curl_easy_strerror(code));
        }
    }
};

} // namespace

class CurlCall::Impl {
public:
    explicit Impl(CurlRequest request)
        : state_(std::make_shared<TransferState>(std::move(request))) {}

    ~Impl() {
        if (!worker_.joinable()) {
            return;
        }
        // Destroyed from one of our own callbacks: the worker only touches
        // the shared state from here on.
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
            return;
        }
        state_->canceled = true;
        worker_.join();
    }

    void enqueue(CallbackPtr<std::string> callback) {
        if (!callback) {
            throw std::invalid_argument("CurlCall needs a callback");
        }
        bool expected = false;
        if (!executed_.compare_exchange_strong(expected, true)) {
            throw std::logic_error("Already executed");
        }
        worker_ = std::thread([state = state_, callback = std::move(callback)]() { perform(state, callback); });
    }

    void cancel() { state_->canceled = true; }

    [[nodiscard]] bool isCanceled() const { return state_->canceled.load(); }

    [[nodiscard]] const ByteCounterTagPtr& tag() const { return state_->tag; }

    [[nodiscard]] const CurlRequest& request() const { return state_->request; }

private:
    struct TransferState {
        explicit TransferState(CurlRequest req) : request(std::move(req)) {}

        CurlRequest request;
        ByteCounterTagPtr tag{std::make_shared<ByteCounterTag>()};
        std::atomic<bool> canceled{false};

        // Only touched by the worker.
        CURL* handle{nullptr};
        std::string body;
        std::string status_message;
    };

    static void perform(const std::shared_ptr<TransferState>& state, const CallbackPtr<std::string>& callback) {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        if (state->canceled) {
            deliverFailure(callback, std::make_exception_ptr(ProgressAborted("Canceled")));
            return;
        }

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            deliverFailure(callback, std::make_exception_ptr(std::runtime_error("Failed to allocate curl handle")));
            return;
        }
        state->handle = curl.get();

        const auto& request = state->request;
        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, request.connect_timeout_seconds);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, request.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, state.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, state.get());
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &transferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, state.get());

        const CURLcode res = curl_easy_perform(curl.get());
        state->tag->record(kEndOfStream);

        if (state->canceled) {
            deliverFailure(callback, std::make_exception_ptr(ProgressAborted("Canceled")));
            return;
        }
        if (res != CURLE_OK) {
            deliverFailure(callback,
                           std::make_exception_ptr(std::runtime_error(std::string{"curl error: "} + curl_easy_strerror(res))));
            return;
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        state->handle = nullptr;

        Response<std::string> response;
        // Protocols without status codes (file://) report 0.
        response.code = code == 0 ? 200 : static_cast<int>(code);
        response.message = std::move(state->status_message);
        if (response.isSuccessful()) {
            if (!state->body.empty()) {
                response.body = std::move(state->body);
            }
        } else {
            response.error_body = std::move(state->body);
        }

        try {
            callback->onResponse(std::move(response));
        } catch (const std::exception& ex) {
            logger()->error("response handler of {} threw: {}", state->request.url, ex.what());
        }
    }

    static void deliverFailure(const CallbackPtr<std::string>& callback, std::exception_ptr error) {
        try {
            callback->onFailure(std::move(error));
        } catch (const std::exception& ex) {
            logger()->error("failure handler threw: {}", ex.what());
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* state = static_cast<TransferState*>(userdata);
        if (!state || state->canceled) {
            return 0;
        }

        const size_t total = size * nmemb;
        curl_off_t length = state->tag->totalBytes();
        if (!state->tag->isOpen() &&
            curl_easy_getinfo(state->handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK) {
            length = -1;
        }

        state->body.append(ptr, total);
        state->tag->recordRead(static_cast<std::int64_t>(length), static_cast<std::int64_t>(total));
        return total;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* state = static_cast<TransferState*>(userdata);
        const size_t total = size * nitems;
        if (!state) {
            return total;
        }

        // "HTTP/1.1 404 Not Found\r\n"; redirects produce one status line each
        const std::string line(buffer, total);
        if (line.rfind("HTTP/", 0) == 0) {
            state->status_message.clear();
            const auto code_start = line.find(' ');
            const auto text_start = code_start == std::string::npos ? code_start : line.find(' ', code_start + 1);
            if (text_start != std::string::npos) {
                auto text = line.substr(text_start + 1);
                while (!text.empty() && (text.back() == '\r' || text.back() == '\n')) {
                    text.pop_back();
                }
                state->status_message = std::move(text);
            }
        }
        return total;
    }

    static int transferInfoCallback(void* userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                                    curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
        auto* state = static_cast<TransferState*>(userdata);
        return state && state->canceled ? 1 : 0;
    }

    std::shared_ptr<TransferState> state_;
    std::atomic<bool> executed_{false};
    std::thread worker_;
};

CurlCall::CurlCall(CurlRequest request) {
    CurlRuntime::require();
    impl_ = std::make_unique<Impl>(std::move(request));
}

CurlCall::~CurlCall() = default;

void CurlCall::enqueue(CallbackPtr<std::string> callback) { impl_->enqueue(std::move(callback)); }

std::unique_ptr<Call<std::string>> CurlCall::clone() const {
    return std::make_unique<CurlCall>(impl_->request());
}

void CurlCall::cancel() { impl_->cancel(); }

bool CurlCall::isCanceled() const { return impl_->isCanceled(); }

ByteCounterTagPtr CurlCall::tag() const { return impl_->tag(); }

const CurlRequest& CurlCall::request() const { return impl_->request(); }

} // namespace liveprogress
