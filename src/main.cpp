#include "liveprogress/call_progress.hpp"
#include "liveprogress/curl_call.hpp"
#include "liveprogress/errors.hpp"
#include "liveprogress/log.hpp"
#include "liveprogress/observe.hpp"
#include "liveprogress/progress_panel.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>


namespace {

volatile std::sig_atomic_t interrupted = 0;

void onInterrupt(int /*signal*/) {
    interrupted = 1;
}

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-o <file>] [-r <retries>] [-t <seconds>] [-n] [-m] [-v] <url>"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -o <file>        Write the response body to a file (default: stdout)\n"
              << "  -r <retries>     Retry a failed transfer up to this many times (default: 3)\n"
              << "  -t <seconds>     Connect timeout (default: 30)\n"
              << "  -n               Never retry; every failure is final\n"
              << "  -m               Manual start: wait for the start action before connecting\n"
              << "  -v               Debug logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

// Draws every state and applies the retry policy of the command line.
class ConsoleObserver final : public liveprogress::When<std::string> {
public:
    ConsoleObserver(std::string name, int max_retries)
        : name_(std::move(name)), max_retries_(max_retries), panel_(std::cerr) {}

    void onNotStarted(const liveprogress::NotStarted& start) override {
        panel_.update(name_, liveprogress::Progress<std::string>(start));
        liveprogress::logger()->info("starting {}", name_);
        start();
    }

    void onInProgress(const liveprogress::InProgress& work) override {
        panel_.update(name_, liveprogress::Progress<std::string>(work));
    }

    void onFailed(const liveprogress::Failed& error) override {
        panel_.update(name_, liveprogress::Progress<std::string>(error));
        if (!error.canRetry()) {
            return;
        }
        if (error.retries() < max_retries_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            error.retry();
        } else {
            error.abort();
        }
    }

    void onCompleted(const liveprogress::Completed<std::string>& result) override {
        panel_.update(name_, liveprogress::Progress<std::string>(result));
    }

private:
    std::string name_;
    int max_retries_;
    liveprogress::ProgressPanel panel_;
};

int parseNumber(const char* value, const char* what) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid ") + what + ": " + value);
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        liveprogress::CurlRequest request;
        liveprogress::Options options;
        std::filesystem::path output;
        int retries = 3;        //默认重试次数
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-o" || option == "-r" || option == "-t") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }
                const char* value = argv[arg_index + 1];
                if (option == "-o") {
                    output = value;
                } else if (option == "-r") {
                    retries = parseNumber(value, "retry count");
                    if (retries < 0) {
                        throw std::runtime_error("Retry count is invalid.");
                    }
                } else {
                    request.connect_timeout_seconds = parseNumber(value, "timeout");
                    if (request.connect_timeout_seconds <= 0) {
                        throw std::runtime_error("Timeout is invalid.");
                    }
                }
                arg_index += 2;
            } else if (option == "-n") {
                options.no_retry = true;
                ++arg_index;
            } else if (option == "-m") {
                options.manual_start = true;
                ++arg_index;
            } else if (option == "-v") {
                liveprogress::setLogLevel(spdlog::level::debug);
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (argc - arg_index != 1) {
            printUsage(argv[0]);
            return 1;
        }
        request.url = argv[arg_index];

        auto progress = liveprogress::CallProgress<std::string>::create(
            std::make_unique<liveprogress::CurlCall>(request), options);

        const std::string name = output.empty() ? request.url : output.string();
        liveprogress::collect(progress, std::make_shared<ConsoleObserver>(name, retries));
        auto result = liveprogress::awaitAsync(progress);

        std::signal(SIGINT, onInterrupt);
        bool abort_requested = false;
        while (result.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (interrupted && !abort_requested) {
                abort_requested = true;
                if (auto latest = progress->latest()) {
                    if (const auto* work = latest->getIf<liveprogress::InProgress>()) {
                        work->abort();
                    } else if (const auto* error = latest->getIf<liveprogress::Failed>()) {
                        error->abort();
                    }
                }
            }
        }

        try {
            const std::string body = result.get();
            if (output.empty()) {
                std::cout << body << std::flush;
            } else {
                std::ofstream file(output, std::ios::binary);
                if (!file) {
                    throw std::runtime_error("Cannot create destination file: " + output.string());
                }
                file << body;
            }
        } catch (const liveprogress::NoContentError&) {
            liveprogress::logger()->warn("{} returned no content", request.url);
        } catch (const liveprogress::ServiceError& ex) {
            std::cerr << "HTTP " << ex.code() << " (" << liveprogress::toString(ex.type()) << "): "
                      << ex.what() << std::endl;
            return 1;
        } catch (const liveprogress::ProgressAborted&) {
            std::cerr << "Aborted" << std::endl;
            return 130;
        }

    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
