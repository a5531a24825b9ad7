#include <gtest/gtest.h>

#include "liveprogress/call_progress.hpp"
#include "liveprogress/observe.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace liveprogress;
using liveprogress::test::FakeCall;
using liveprogress::test::Recorder;
using liveprogress::test::Exchange;
using liveprogress::test::Script;
using liveprogress::test::ThreadedCall;
using liveprogress::test::into;

namespace {

void expectBusy(const Progress<std::string>& state, std::int64_t done, std::int64_t total) {
    ASSERT_TRUE(state.is<InProgress>());
    EXPECT_EQ(state.get<InProgress>().done(), done);
    EXPECT_EQ(state.get<InProgress>().total(), total);
}

void expectStarting(const Progress<std::string>& state) {
    ASSERT_TRUE(state.is<InProgress>());
    EXPECT_EQ(state.get<InProgress>().done(), 0);
    EXPECT_TRUE(state.get<InProgress>().isIndeterminate());
}

template <typename Predicate>
bool eventually(Predicate predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace

class CallProgressTest : public ::testing::Test {
protected:
    std::shared_ptr<CallProgress<std::string>> make(Options options = {}) {
        return CallProgress<std::string>::create(std::make_unique<FakeCall<std::string>>(script_), options);
    }

    std::shared_ptr<CallProgress<std::string>> makeThreaded(Options options = {}) {
        return CallProgress<std::string>::create(std::make_unique<ThreadedCall<std::string>>(script_), options);
    }

    std::shared_ptr<Script<std::string>> script_ = std::make_shared<Script<std::string>>();
    std::shared_ptr<Recorder<std::string>> recorder_ = std::make_shared<Recorder<std::string>>();
};

TEST_F(CallProgressTest, NothingStartsWithoutAnObserver) {
    auto progress = make();
    EXPECT_EQ(script_->enqueued(), 0U);
    EXPECT_EQ(progress->latest(), nullptr);
}

TEST_F(CallProgressTest, FirstObserverStartsTheOperation) {
    auto progress = make();
    progress->observe(into(recorder_));

    ASSERT_EQ(script_->enqueued(), 1U);
    ASSERT_EQ(recorder_->size(), 1U);
    expectStarting(recorder_->last());
}

TEST_F(CallProgressTest, KnownLengthReadsThenSuccess) {
    auto progress = make();
    progress->observe(into(recorder_));

    auto attempt = script_->at(0);
    attempt->stream(std::string(100, 'x'), {40, 60}, 100);
    attempt->respond(200, std::string("ok"));

    const auto states = recorder_->states();
    ASSERT_EQ(states.size(), 4U);
    expectStarting(states[0]);
    expectBusy(states[1], 40, 100);
    expectBusy(states[2], 100, 100);
    EXPECT_FALSE(states[1].get<InProgress>().isIndeterminate());
    EXPECT_FALSE(states[2].get<InProgress>().isIndeterminate());
    ASSERT_TRUE(states[3].is<Completed<std::string>>());
    EXPECT_EQ(states[3].get<Completed<std::string>>().value(), "ok");
    EXPECT_TRUE(states[3].isTerminal());
}

TEST_F(CallProgressTest, UnknownLengthIsAlwaysIndeterminate) {
    auto progress = make();
    progress->observe(into(recorder_));

    script_->at(0)->stream("0123456789abcdefghijklmnopqrst", {10, 20}, -1);

    const auto states = recorder_->states();
    ASSERT_EQ(states.size(), 3U);
    for (const auto& state : states) {
        ASSERT_TRUE(state.is<InProgress>());
        EXPECT_TRUE(state.get<InProgress>().isIndeterminate());
    }
    EXPECT_EQ(states[1].get<InProgress>().done(), 10);
    EXPECT_EQ(states[2].get<InProgress>().done(), 30);
}

TEST_F(CallProgressTest, ManualStartWaitsForTheStartAction) {
    auto progress = make(Options{true, false});
    progress->observe(into(recorder_));

    ASSERT_EQ(recorder_->size(), 1U);
    ASSERT_TRUE(recorder_->last().is<NotStarted>());
    EXPECT_FALSE(recorder_->last().isTerminal());
    EXPECT_EQ(script_->enqueued(), 0U);

    const auto idle = recorder_->last();
    idle.get<NotStarted>().start();
    EXPECT_EQ(script_->enqueued(), 1U);
    expectStarting(recorder_->last());

    idle.get<NotStarted>().start();
    EXPECT_EQ(script_->enqueued(), 1U);
}

TEST_F(CallProgressTest, TransportFailureIsRetriable) {
    auto progress = make();
    progress->observe(into(recorder_));
    script_->at(0)->fail(std::runtime_error("network down"));

    const auto state = recorder_->last();
    ASSERT_TRUE(state.is<Failed>());
    const auto& error = state.get<Failed>();
    EXPECT_TRUE(error.canRetry());
    EXPECT_FALSE(state.isTerminal());
    EXPECT_EQ(error.retries(), 0);
    EXPECT_EQ(error.message(), "network down");
}

TEST_F(CallProgressTest, RetryRunsANewAttemptThatCanSucceed) {
    auto progress = make();
    progress->observe(into(recorder_));
    script_->at(0)->fail(std::runtime_error("network down"));

    recorder_->last().get<Failed>().retry();
    ASSERT_EQ(script_->enqueued(), 2U);
    script_->at(1)->respond(200, std::string("value"));

    const auto states = recorder_->states();
    ASSERT_EQ(states.size(), 4U);
    expectStarting(states[0]);
    ASSERT_TRUE(states[1].is<Failed>());
    EXPECT_EQ(states[1].get<Failed>().retries(), 0);
    EXPECT_TRUE(states[1].get<Failed>().canRetry());
    expectStarting(states[2]);
    ASSERT_TRUE(states[3].is<Completed<std::string>>());
    EXPECT_EQ(states[3].get<Completed<std::string>>().value(), "value");
}

TEST_F(CallProgressTest, EachAttemptCountsBytesFromZero) {
    auto progress = make();
    progress->observe(into(recorder_));

    auto first = script_->at(0);
    first->tag->open(100);
    first->tag->record(30);
    expectBusy(recorder_->last(), 30, 100);
    first->fail(std::runtime_error("reset by peer"));

    recorder_->last().get<Failed>().retry();
    auto second = script_->at(1);
    expectStarting(recorder_->last());
    second->stream(std::string(100, 'y'), {20, 80}, 100);

    const auto states = recorder_->states();
    ASSERT_EQ(states.size(), 6U);
    expectBusy(states[4], 20, 100);
    expectBusy(states[5], 100, 100);
}

TEST_F(CallProgressTest, SupersededAttemptCannotPublish) {
    auto progress = make();
    progress->observe(into(recorder_));

    auto first = script_->at(0);
    first->fail(std::runtime_error("network down"));
    recorder_->last().get<Failed>().retry();
    const auto published = recorder_->size();

    first->tag->record(10);
    first->respond(200, std::string("stale"));
    first->fail(std::runtime_error("late"));
    EXPECT_EQ(recorder_->size(), published);

    script_->at(1)->respond(200, std::string("fresh"));
    EXPECT_EQ(recorder_->last().get<Completed<std::string>>().value(), "fresh");
}

TEST_F(CallProgressTest, RetryActionOnlyWorksOnce) {
    auto progress = make();
    progress->observe(into(recorder_));
    script_->at(0)->fail(std::runtime_error("network down"));

    const auto error = recorder_->last();
    error.get<Failed>().retry();
    error.get<Failed>().retry();
    EXPECT_EQ(script_->enqueued(), 2U);
}

TEST_F(CallProgressTest, RetryCountGrowsWithEachAttempt) {
    auto progress = make();
    progress->observe(into(recorder_));

    script_->at(0)->fail(std::runtime_error("first"));
    recorder_->last().get<Failed>().retry();
    script_->at(1)->fail(std::runtime_error("second"));

    const auto state = recorder_->last();
    ASSERT_TRUE(state.is<Failed>());
    EXPECT_EQ(state.get<Failed>().retries(), 1);
    EXPECT_EQ(state.get<Failed>().message(), "second");
}

TEST_F(CallProgressTest, AbortingARetriableFailureMakesItTerminal) {
    auto progress = make();
    progress->observe(into(recorder_));
    script_->at(0)->fail(std::runtime_error("network down"));

    const auto retriable = recorder_->last();
    retriable.get<Failed>().abort();

    const auto state = recorder_->last();
    ASSERT_TRUE(state.is<Failed>());
    EXPECT_FALSE(state.get<Failed>().canRetry());
    EXPECT_TRUE(state.isTerminal());
    EXPECT_EQ(state.get<Failed>().retries(), 0);
    EXPECT_EQ(state.get<Failed>().message(), "network down");

    const auto published = recorder_->size();
    retriable.get<Failed>().retry();
    retriable.get<Failed>().abort();
    EXPECT_EQ(script_->enqueued(), 1U);
    EXPECT_EQ(recorder_->size(), published);
}

TEST_F(CallProgressTest, NoRetryMakesEveryFailureTerminal) {
    auto progress = make(Options{false, true});
    progress->observe(into(recorder_));
    script_->at(0)->fail(std::runtime_error("network down"));

    const auto state = recorder_->last();
    ASSERT_TRUE(state.is<Failed>());
    EXPECT_FALSE(state.get<Failed>().canRetry());
    EXPECT_TRUE(state.isTerminal());
    EXPECT_EQ(state.get<Failed>().retries(), 0);
}

TEST_F(CallProgressTest, AbortCancelsAndWaitsForTheTransport) {
    auto progress = make();
    progress->observe(into(recorder_));

    auto attempt = script_->at(0);
    attempt->tag->open(100);
    attempt->tag->record(10);
    const auto published = recorder_->size();

    recorder_->last().get<InProgress>().abort();
    EXPECT_TRUE(attempt->canceled.load());
    EXPECT_FALSE(attempt->tag->isAttached());
    EXPECT_EQ(recorder_->size(), published);

    attempt->tag->record(20);
    EXPECT_EQ(recorder_->size(), published);

    attempt->fail(std::runtime_error("socket closed"));
    ASSERT_EQ(recorder_->size(), published + 1);
    const auto state = recorder_->last();
    ASSERT_TRUE(state.is<Failed>());
    EXPECT_FALSE(state.get<Failed>().canRetry());
    EXPECT_TRUE(state.get<Failed>().holds<ProgressAborted>());
    EXPECT_EQ(state.get<Failed>().retries(), 0);

    attempt->fail(std::runtime_error("again"));
    EXPECT_EQ(recorder_->size(), published + 1);
}

TEST_F(CallProgressTest, FailureStatusBecomesAServiceError) {
    auto progress = make();
    progress->observe(into(recorder_));
    script_->at(0)->respond(404, std::nullopt, "Not Found", "missing");

    const auto state = recorder_->last();
    ASSERT_TRUE(state.is<Failed>());
    EXPECT_TRUE(state.get<Failed>().canRetry());
    try {
        state.get<Failed>().rethrow();
        FAIL() << "expected a ServiceError";
    } catch (const ServiceError& error) {
        EXPECT_EQ(error.code(), 404);
        EXPECT_EQ(error.type(), HttpError::NotFound);
        EXPECT_EQ(error.body(), "missing");
        EXPECT_STREQ(error.what(), "Not Found");
    }
}

TEST_F(CallProgressTest, FailureStatusWithoutMessageGetsAPlaceholder) {
    auto progress = make(Options{false, true});
    progress->observe(into(recorder_));
    script_->at(0)->respond(503, std::nullopt);

    const auto state = recorder_->last();
    ASSERT_TRUE(state.is<Failed>());
    EXPECT_EQ(state.get<Failed>().message(), "(No status message)");
    EXPECT_TRUE(state.get<Failed>().holds<ServiceError>());
}

TEST_F(CallProgressTest, SuccessWithoutBodyCompletesWithoutContent) {
    auto progress = make();
    progress->observe(into(recorder_));
    script_->at(0)->respond(204, std::nullopt);

    const auto state = recorder_->last();
    ASSERT_TRUE(state.is<Completed<std::string>>());
    EXPECT_FALSE(state.get<Completed<std::string>>().hasValue());
    EXPECT_THROW((void)state.get<Completed<std::string>>().value(), NoContentError);
}

TEST_F(CallProgressTest, NothingIsPublishedAfterTheTerminalState) {
    auto progress = make();
    progress->observe(into(recorder_));

    auto attempt = script_->at(0);
    attempt->respond(200, std::string("done"));
    attempt->fail(std::runtime_error("late"));
    attempt->tag->record(5);

    const auto states = recorder_->states();
    ASSERT_EQ(states.size(), 2U);
    EXPECT_TRUE(states.back().isTerminal());
    for (std::size_t i = 0; i + 1 < states.size(); ++i) {
        EXPECT_FALSE(states[i].isTerminal());
    }
}

TEST_F(CallProgressTest, ObserversShareEveryPublish) {
    auto progress = make();
    auto late = std::make_shared<Recorder<std::string>>();
    progress->observe(into(recorder_));
    progress->observe(into(late));

    script_->at(0)->stream("abcd", {2, 2}, 4);
    script_->at(0)->respond(200, std::string("abcd"));

    ASSERT_EQ(late->size(), recorder_->size());
    EXPECT_EQ(late->addresses(), recorder_->addresses());
    EXPECT_EQ(progress->observerCount(), 2U);
    EXPECT_EQ(script_->enqueued(), 1U);
}

TEST_F(CallProgressTest, LateObserverGetsTheLatestState) {
    auto progress = make();
    progress->observe(into(recorder_));
    script_->at(0)->respond(200, std::string("cached"));

    auto late = std::make_shared<Recorder<std::string>>();
    progress->observe(into(late));

    ASSERT_EQ(late->size(), 1U);
    EXPECT_EQ(late->last().get<Completed<std::string>>().value(), "cached");
    EXPECT_EQ(script_->enqueued(), 1U);
}

TEST_F(CallProgressTest, ObserverMayRetryFromItsCallback) {
    auto progress = make();
    std::weak_ptr<Recorder<std::string>> weak = recorder_;
    progress->observe([weak](const Progress<std::string>& state) {
        if (auto recorder = weak.lock()) {
            (*recorder)(state);
        }
        if (const auto* error = state.getIf<Failed>()) {
            if (error->retries() == 0) {
                error->retry();
            }
        }
    });

    script_->at(0)->fail(std::runtime_error("flaky"));
    ASSERT_EQ(script_->enqueued(), 2U);
    script_->at(1)->respond(200, std::string("second time lucky"));

    const auto states = recorder_->states();
    ASSERT_EQ(states.size(), 4U);
    expectStarting(states[0]);
    EXPECT_TRUE(states[1].is<Failed>());
    expectStarting(states[2]);
    EXPECT_TRUE(states[3].is<Completed<std::string>>());
}

TEST_F(CallProgressTest, EnqueueErrorIsReportedAsAFailure) {
    script_->enqueue_error = std::make_exception_ptr(std::runtime_error("refused"));
    auto progress = make();
    progress->observe(into(recorder_));

    const auto state = recorder_->last();
    ASSERT_TRUE(state.is<Failed>());
    EXPECT_EQ(state.get<Failed>().message(), "refused");
    EXPECT_EQ(script_->enqueued(), 0U);
}

TEST_F(CallProgressTest, CloneErrorIsReportedAsARetriableFailure) {
    auto progress = make();
    script_->clone_error = std::make_exception_ptr(std::runtime_error("no handle"));
    progress->observe(into(recorder_));

    ASSERT_EQ(recorder_->size(), 1U);
    const auto state = recorder_->last();
    ASSERT_TRUE(state.is<Failed>());
    EXPECT_EQ(state.get<Failed>().message(), "no handle");
    EXPECT_EQ(state.get<Failed>().retries(), 0);
    EXPECT_TRUE(state.get<Failed>().canRetry());
    EXPECT_EQ(script_->enqueued(), 0U);

    script_->clone_error = nullptr;
    state.get<Failed>().retry();
    ASSERT_EQ(script_->enqueued(), 1U);
    script_->at(0)->respond(200, std::string("built"));
    EXPECT_EQ(recorder_->last().get<Completed<std::string>>().value(), "built");
}

TEST_F(CallProgressTest, CloneErrorEndsAnOperationThatNeverRetries) {
    auto progress = make(Options{false, true});
    script_->clone_error = std::make_exception_ptr(std::runtime_error("no handle"));

    auto result = awaitAsync(progress);
    ASSERT_EQ(result.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_THROW(result.get(), std::runtime_error);
}

TEST_F(CallProgressTest, DestroyingTheOperationCancelsTheAttempt) {
    auto progress = make();
    progress->observe(into(recorder_));
    auto attempt = script_->at(0);
    const auto published = recorder_->size();

    progress.reset();
    EXPECT_TRUE(attempt->canceled.load());

    attempt->respond(200, std::string("orphan"));
    EXPECT_EQ(recorder_->size(), published);
}

TEST_F(CallProgressTest, ProgressFromATransportThreadStaysOrdered) {
    constexpr std::size_t kLength = 1000;
    auto progress = make();
    progress->observe(into(recorder_));
    auto attempt = script_->at(0);

    std::thread transport([attempt] {
        attempt->stream(std::string(kLength, 'q'), std::vector<std::size_t>(kLength, 1), kLength);
        attempt->respond(200, std::string("fin"));
    });
    transport.join();

    const auto states = recorder_->states();
    ASSERT_EQ(states.size(), kLength + 2);
    std::int64_t previous = -1;
    for (std::size_t i = 0; i + 1 < states.size(); ++i) {
        ASSERT_TRUE(states[i].is<InProgress>());
        EXPECT_GT(states[i].get<InProgress>().done(), previous);
        previous = states[i].get<InProgress>().done();
    }
    EXPECT_EQ(previous, static_cast<std::int64_t>(kLength));
    EXPECT_TRUE(states.back().is<Completed<std::string>>());
}

TEST_F(CallProgressTest, RequiresACall) {
    EXPECT_THROW(CallProgress<std::string>::create(nullptr), std::invalid_argument);
}

TEST_F(CallProgressTest, RetryFromTheCallerWhileTheTransportListenerRuns) {
    auto progress = makeThreaded();

    std::promise<Failed> delivered;
    std::atomic<bool> first_failure{true};
    progress->observe([&](const Progress<std::string>& state) {
        if (state.is<Failed>() && first_failure.exchange(false)) {
            delivered.set_value(state.get<Failed>());
            // An automatic retry that is slower than the caller's.
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            state.get<Failed>().retry();
        }
    });
    script_->at(0)->run([](Exchange<std::string>& exchange) { exchange.fail(std::runtime_error("dropped")); });

    auto failure = delivered.get_future();
    ASSERT_EQ(failure.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    const Failed failed_state = failure.get();

    std::promise<void> returned;
    std::thread caller([&failed_state, &returned] {
        failed_state.retry();
        returned.set_value();
    });
    if (returned.get_future().wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        caller.detach();
        FAIL() << "retry() did not return while the transport thread was delivering";
    }
    caller.join();

    ASSERT_TRUE(eventually([this] { return script_->enqueued() == 2U; }));
    script_->at(1)->run([](Exchange<std::string>& exchange) { exchange.respond(200, std::string("second")); });
    script_->at(1)->join();

    EXPECT_EQ(script_->enqueued(), 2U);
    ASSERT_TRUE(progress->latest()->is<Completed<std::string>>());
    EXPECT_EQ(progress->latest()->get<Completed<std::string>>().value(), "second");
}

TEST_F(CallProgressTest, LateEventsOfAFailedAttemptRaceTheRetry) {
    auto progress = makeThreaded();
    progress->observe(into(recorder_));

    script_->at(0)->run([](Exchange<std::string>& exchange) {
        exchange.tag->recordRead(100, 10);
        exchange.fail(std::runtime_error("reset"));
        for (int i = 0; i < 50; ++i) {
            exchange.tag->record(1);
            std::this_thread::yield();
        }
        exchange.respond(200, std::string("stale"));
    });

    ASSERT_TRUE(eventually([&progress] {
        const auto latest = progress->latest();
        return latest && latest->is<Failed>();
    }));
    progress->latest()->get<Failed>().retry();
    ASSERT_EQ(script_->enqueued(), 2U);
    script_->at(1)->respond(200, std::string("fresh"));

    const auto states = recorder_->states();
    std::size_t failure = states.size();
    for (std::size_t i = 0; i < states.size(); ++i) {
        if (const auto* completed = states[i].getIf<Completed<std::string>>()) {
            EXPECT_NE(completed->value(), "stale");
        }
        if (states[i].is<Failed>() && failure == states.size()) {
            failure = i;
        }
    }
    ASSERT_LT(failure + 2, states.size());
    expectStarting(states[failure + 1]);
    EXPECT_EQ(states.size(), failure + 3);
    EXPECT_EQ(states.back().get<Completed<std::string>>().value(), "fresh");
}

TEST_F(CallProgressTest, ConcurrentRetriesStartOneAttempt) {
    auto progress = makeThreaded();
    progress->observe(into(recorder_));
    script_->at(0)->fail(std::runtime_error("network down"));
    const Failed failed_state = recorder_->last().get<Failed>();

    std::promise<void> go;
    std::shared_future<void> ready = go.get_future().share();
    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([ready, &failed_state] {
            ready.wait();
            failed_state.retry();
        });
    }
    go.set_value();
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(script_->enqueued(), 2U);
    const auto states = recorder_->states();
    ASSERT_EQ(states.size(), 3U);
    expectStarting(states[2]);
}

TEST_F(CallProgressTest, AbortStopsAStreamingTransportThread) {
    auto progress = makeThreaded();
    progress->observe(into(recorder_));
    auto result = awaitAsync(progress);

    script_->at(0)->run([](Exchange<std::string>& exchange) {
        exchange.tag->open(kInitialWork);
        for (int i = 0; i < 100000 && !exchange.canceled.load(); ++i) {
            exchange.tag->record(1);
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
        exchange.fail(std::runtime_error("connection reset"));
    });

    ASSERT_TRUE(eventually([&progress] {
        const auto latest = progress->latest();
        return latest && latest->is<InProgress>() && latest->get<InProgress>().done() > 0;
    }));
    progress->latest()->get<InProgress>().abort();

    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_THROW(result.get(), ProgressAborted);
    script_->at(0)->join();

    const auto states = recorder_->states();
    ASSERT_TRUE(states.back().is<Failed>());
    EXPECT_TRUE(states.back().isTerminal());
    for (std::size_t i = 0; i + 1 < states.size(); ++i) {
        EXPECT_TRUE(states[i].is<InProgress>());
    }
}
