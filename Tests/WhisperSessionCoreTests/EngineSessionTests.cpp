#include <gtest/gtest.h>

#include "EngineSession.hpp"
#include "Errors.hpp"
#include "FakeEngine.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ws;
using namespace std::chrono_literals;
using ws::test::Batch;
using ws::test::FakeEngine;
using ws::test::test_samples;

namespace {

/// Records delegate calls.  Used with a MainLoop, so everything runs on the
/// test thread.
class RecordingDelegate : public SessionDelegate {
public:
    void on_progress(EngineSession&, float fraction) override {
        progress.push_back(fraction);
    }

    void on_new_segments(EngineSession&, const std::vector<Segment>& segments, int start_index) override {
        batches.emplace_back(start_index, segments);
    }

    void on_complete(EngineSession&, const std::vector<Segment>& segments) override {
        ++completions;
        final_segments = segments;
    }

    void on_error(EngineSession&, std::exception_ptr error) override {
        ++errors;
        last_error = error;
    }

    std::vector<float> progress;
    std::vector<std::pair<int, std::vector<Segment>>> batches;
    std::vector<Segment> final_segments;
    std::exception_ptr last_error;
    int completions = 0;
    int errors = 0;
};

struct Outcome {
    int calls = 0;
    std::vector<Segment> segments;
    std::exception_ptr error;
};

CompletionHandler record_into(Outcome& outcome) {
    return [&outcome](const std::vector<Segment>& segments, std::exception_ptr error) {
        ++outcome.calls;
        outcome.segments = segments;
        outcome.error = error;
    };
}

template <typename E>
bool holds(std::exception_ptr error) {
    if (!error) return false;
    try {
        std::rethrow_exception(error);
    } catch (const E&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<Batch> three_batches() {
    return {
        Batch{{0, 150, " And so,"}, {150, 320, " my fellow Americans,"}},
        Batch{{320, 500, " ask not"}},
        Batch{{500, 700, " what your country"}, {700, 880, " can do for you."}},
    };
}

class EngineSessionTest : public ::testing::Test {
protected:
    std::shared_ptr<EngineSession> make_session(std::vector<Batch> batches,
                                                int result_code = 0,
                                                int abort_code = -6) {
        auto engine = std::make_unique<FakeEngine>(std::move(batches), result_code, abort_code);
        engine_ = engine.get();
        auto session = EngineSession::with_engine(std::move(engine), ParameterSet(), loop_);
        session->set_delegate(delegate_);
        return session;
    }

    bool pump_until(const std::function<bool()>& done) {
        return loop_->run_until(done, 5s);
    }

    std::shared_ptr<MainLoop> loop_ = std::make_shared<MainLoop>();
    std::shared_ptr<RecordingDelegate> delegate_ = std::make_shared<RecordingDelegate>();
    FakeEngine* engine_ = nullptr;
};

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(EngineSessionConstructionTest, NullEngineRejected) {
    EXPECT_THROW(EngineSession::with_engine(nullptr), ConstructionError);
}

TEST(EngineSessionConstructionTest, MissingModelFileRejected) {
    EXPECT_THROW(EngineSession::from_file("/nonexistent/ggml-missing.bin"), ConstructionError);
}

TEST(EngineSessionConstructionTest, EmptyModelBufferRejected) {
    EXPECT_THROW(EngineSession::from_buffer(std::vector<uint8_t>{}), ConstructionError);
}

TEST_F(EngineSessionTest, StartsIdle) {
    auto session = make_session({});
    EXPECT_EQ(session->state(), SessionState::idle);
    EXPECT_FALSE(session->is_busy());
}

// ============================================================================
// Normal runs
// ============================================================================

TEST_F(EngineSessionTest, BatchesArriveInOrderAndCoverTheFinalList) {
    auto session = make_session(three_batches());
    Outcome outcome;

    session->transcribe(test_samples(), record_into(outcome));
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));

    ASSERT_EQ(outcome.calls, 1);
    EXPECT_FALSE(outcome.error);
    ASSERT_EQ(outcome.segments.size(), 5u);
    EXPECT_EQ(delegate_->completions, 1);
    EXPECT_EQ(delegate_->final_segments, outcome.segments);

    // Batches are contiguous, gap-free and add up to the final list.
    ASSERT_EQ(delegate_->batches.size(), 3u);
    size_t next = 0;
    for (const auto& batch : delegate_->batches) {
        EXPECT_EQ(static_cast<size_t>(batch.first), next);
        for (size_t i = 0; i < batch.second.size(); ++i) {
            EXPECT_EQ(batch.second[i], outcome.segments[next + i]);
        }
        next += batch.second.size();
    }
    EXPECT_EQ(next, outcome.segments.size());

    ASSERT_FALSE(delegate_->progress.empty());
    EXPECT_FLOAT_EQ(delegate_->progress.back(), 1.0f);
    EXPECT_EQ(session->state(), SessionState::idle);
    EXPECT_EQ(engine_->last_sample_count(), 1600);
}

TEST_F(EngineSessionTest, SegmentTimesAreMilliseconds) {
    auto session = make_session({Batch{{150, 320, " hello"}}});
    Outcome outcome;

    session->transcribe(test_samples(), record_into(outcome));
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));

    ASSERT_EQ(outcome.segments.size(), 1u);
    EXPECT_EQ(outcome.segments[0].start_time, 1500);
    EXPECT_EQ(outcome.segments[0].end_time, 3200);
    EXPECT_EQ(outcome.segments[0].text, " hello");
}

TEST_F(EngineSessionTest, UndecodableSegmentDropped) {
    auto session = make_session({Batch{{0, 100, " ok"}, {100, 200, "\xC3"}}});
    Outcome outcome;

    session->transcribe(test_samples(), record_into(outcome));
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));

    EXPECT_FALSE(outcome.error);
    ASSERT_EQ(outcome.segments.size(), 1u);
    EXPECT_EQ(outcome.segments[0].text, " ok");
}

TEST_F(EngineSessionTest, CompletionHandlerMayStartTheNextRun) {
    auto session = make_session({Batch{{0, 100, " again"}}});
    Outcome second;
    int first_calls = 0;

    session->transcribe(test_samples(), [&](const std::vector<Segment>&, std::exception_ptr error) {
        ++first_calls;
        EXPECT_FALSE(error);
        EXPECT_FALSE(session->is_busy());
        session->transcribe(test_samples(800), record_into(second));
    });
    ASSERT_TRUE(pump_until([&] { return second.calls > 0; }));

    EXPECT_EQ(first_calls, 1);
    EXPECT_EQ(second.calls, 1);
    EXPECT_EQ(engine_->runs(), 2);
    EXPECT_EQ(engine_->last_sample_count(), 800);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(EngineSessionTest, SecondTranscribeWhileInFlightThrows) {
    auto session = make_session(three_batches());
    Outcome outcome;

    engine_->hold();
    session->transcribe(test_samples(), record_into(outcome));
    engine_->wait_until_parked();

    EXPECT_EQ(session->state(), SessionState::running);
    EXPECT_THROW(session->transcribe(test_samples(), [](const std::vector<Segment>&, std::exception_ptr) {}),
                 ConcurrencyViolation);

    engine_->release();
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));
    EXPECT_EQ(outcome.calls, 1);
    EXPECT_EQ(engine_->runs(), 1);
}

TEST_F(EngineSessionTest, SetParamsRejectedWhileInFlight) {
    auto session = make_session({Batch{{0, 10, " x"}}});
    Outcome outcome;

    engine_->hold();
    session->transcribe(test_samples(), record_into(outcome));
    engine_->wait_until_parked();

    ParameterSet replacement;
    replacement.set_language("en");
    EXPECT_THROW(session->set_params(replacement), ConcurrencyViolation);

    engine_->release();
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));
    EXPECT_EQ(session->params().language(), "auto");
}

TEST_F(EngineSessionTest, SetParamsRewiresCallbacks) {
    auto session = make_session({Batch{{0, 10, " x"}}});

    ParameterSet replacement;
    replacement.set_language("en");
    replacement.set(&whisper_full_params::n_threads, 2);
    session->set_params(replacement);

    const whisper_full_params& n = session->params().native();
    EXPECT_STREQ(n.language, "en");
    EXPECT_EQ(n.n_threads, 2);
    EXPECT_TRUE(n.new_segment_callback != nullptr);
    EXPECT_TRUE(n.new_segment_callback_user_data != nullptr);
    EXPECT_NE(n.language, replacement.native().language);

    Outcome outcome;
    session->transcribe(test_samples(), record_into(outcome));
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));
    EXPECT_EQ(delegate_->batches.size(), 1u);
}

TEST_F(EngineSessionTest, TwoSessionsDoNotCrossDeliver) {
    auto first = make_session({Batch{{0, 10, " first"}}});
    auto second_delegate = std::make_shared<RecordingDelegate>();
    auto second = EngineSession::with_engine(
        std::make_unique<FakeEngine>(std::vector<Batch>{Batch{{0, 10, " second"}, {10, 20, " more"}}}),
        ParameterSet(), loop_);
    second->set_delegate(second_delegate);

    Outcome a, b;
    first->transcribe(test_samples(), record_into(a));
    second->transcribe(test_samples(), record_into(b));
    ASSERT_TRUE(pump_until([&] { return a.calls > 0 && b.calls > 0; }));

    ASSERT_EQ(a.segments.size(), 1u);
    EXPECT_EQ(a.segments[0].text, " first");
    ASSERT_EQ(b.segments.size(), 2u);
    EXPECT_EQ(b.segments[0].text, " second");

    ASSERT_EQ(delegate_->batches.size(), 1u);
    EXPECT_EQ(delegate_->batches[0].second[0].text, " first");
    ASSERT_EQ(second_delegate->batches.size(), 1u);
    EXPECT_EQ(second_delegate->batches[0].second[0].text, " second");
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(EngineSessionTest, StopBeforeFirstSegmentCompletesOnceWithNothing) {
    auto session = make_session(three_batches());
    Outcome outcome;

    engine_->hold();
    session->transcribe(test_samples(), record_into(outcome));
    engine_->wait_until_parked();

    session->stop();
    EXPECT_EQ(session->state(), SessionState::stopping);
    session->stop();    // idempotent

    engine_->release();
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));
    loop_->drain();

    EXPECT_EQ(outcome.calls, 1);
    EXPECT_FALSE(outcome.error);
    EXPECT_TRUE(outcome.segments.empty());
    EXPECT_TRUE(delegate_->batches.empty());
    EXPECT_EQ(delegate_->completions, 1);
    EXPECT_EQ(delegate_->errors, 0);
    EXPECT_EQ(session->state(), SessionState::idle);
}

TEST_F(EngineSessionTest, TranscribeAfterStopIsRejectedUntilCompletionDelivered) {
    auto session = make_session(three_batches());
    Outcome outcome;

    engine_->hold();
    session->transcribe(test_samples(), record_into(outcome));
    engine_->wait_until_parked();
    session->stop();

    EXPECT_THROW(session->transcribe(test_samples(), [](const std::vector<Segment>&, std::exception_ptr) {}),
                 ConcurrencyViolation);

    engine_->release();
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));

    Outcome next;
    session->transcribe(test_samples(), record_into(next));
    ASSERT_TRUE(pump_until([&] { return next.calls > 0; }));
    EXPECT_EQ(next.segments.size(), 5u);
}

TEST_F(EngineSessionTest, StopWhenIdleIsHarmless) {
    auto session = make_session({});
    session->stop();
    EXPECT_EQ(session->state(), SessionState::idle);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(EngineSessionTest, EmptyInputReportedOnceThroughCompletion) {
    auto session = make_session(three_batches());
    Outcome outcome;

    session->transcribe({}, record_into(outcome));
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));
    loop_->drain();

    EXPECT_EQ(outcome.calls, 1);
    EXPECT_TRUE(holds<InvalidInputError>(outcome.error));
    EXPECT_EQ(delegate_->errors, 1);
    EXPECT_EQ(delegate_->completions, 0);
    EXPECT_EQ(engine_->runs(), 0);
    EXPECT_FALSE(session->is_busy());
}

TEST_F(EngineSessionTest, NonFiniteSamplesRejected) {
    auto session = make_session(three_batches());
    Outcome outcome;

    std::vector<float> samples = test_samples();
    samples[10] = std::numeric_limits<float>::quiet_NaN();
    session->transcribe(std::move(samples), record_into(outcome));
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));

    EXPECT_TRUE(holds<InvalidInputError>(outcome.error));
    EXPECT_EQ(engine_->runs(), 0);
}

TEST_F(EngineSessionTest, EngineFailureCarriesResultCode) {
    auto session = make_session({Batch{{0, 10, " partial"}}}, -3);
    Outcome outcome;

    session->transcribe(test_samples(), record_into(outcome));
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));

    ASSERT_TRUE(outcome.error);
    EXPECT_TRUE(outcome.segments.empty());
    try {
        std::rethrow_exception(outcome.error);
    } catch (const EngineRunError& e) {
        EXPECT_EQ(e.code(), -3);
    }
    EXPECT_EQ(delegate_->errors, 1);
    EXPECT_EQ(delegate_->completions, 0);
}

TEST_F(EngineSessionTest, ThrowingDelegateDoesNotStarveCompletion) {
    class ThrowingDelegate : public SessionDelegate {
    public:
        void on_complete(EngineSession&, const std::vector<Segment>&) override {
            throw std::runtime_error("delegate failure");
        }
    };

    auto session = make_session({Batch{{0, 10, " x"}}});
    session->set_delegate(std::make_shared<ThrowingDelegate>());
    Outcome outcome;

    session->transcribe(test_samples(), record_into(outcome));
    ASSERT_TRUE(pump_until([&] { return outcome.calls > 0; }));
    EXPECT_FALSE(outcome.error);
    EXPECT_EQ(outcome.segments.size(), 1u);
}

// ============================================================================
// Teardown
// ============================================================================

namespace {

/// Reports the thread its destructor ran on.
class TrackedEngine : public FakeEngine {
public:
    TrackedEngine(std::vector<Batch> batches, std::shared_ptr<std::promise<std::thread::id>> destroyed_on)
        : FakeEngine(std::move(batches)), destroyed_on_(std::move(destroyed_on)) {}

    ~TrackedEngine() override { destroyed_on_->set_value(std::this_thread::get_id()); }

private:
    std::shared_ptr<std::promise<std::thread::id>> destroyed_on_;
};

} // namespace

TEST(EngineSessionTeardownTest, CompletedSessionIsTornDownByTheLastCaller) {
    for (int i = 0; i < 100; ++i) {
        auto loop = std::make_shared<MainLoop>();
        auto destroyed_on = std::make_shared<std::promise<std::thread::id>>();
        std::future<std::thread::id> destroyed = destroyed_on->get_future();

        auto session = EngineSession::with_engine(
            std::make_unique<TrackedEngine>(three_batches(), destroyed_on), ParameterSet(), loop);
        Outcome outcome;
        session->transcribe(test_samples(), record_into(outcome));
        ASSERT_TRUE(loop->run_until([&] { return outcome.calls > 0; }, 5s));

        session.reset();
        ASSERT_EQ(destroyed.wait_for(5s), std::future_status::ready);
        EXPECT_EQ(destroyed.get(), std::this_thread::get_id());
    }
}

TEST(EngineSessionTeardownTest, SessionDroppedBeforeCompletionIsTornDownOnItsContext) {
    auto queue = std::make_shared<SerialQueue>();
    auto destroyed_on = std::make_shared<std::promise<std::thread::id>>();
    std::future<std::thread::id> destroyed = destroyed_on->get_future();
    std::promise<std::thread::id> completed_on;

    auto engine = std::make_unique<TrackedEngine>(three_batches(), destroyed_on);
    TrackedEngine* raw = engine.get();
    raw->hold();

    auto session = EngineSession::with_engine(std::move(engine), ParameterSet(), queue);
    session->transcribe(test_samples(), [&completed_on](const std::vector<Segment>&, std::exception_ptr) {
        completed_on.set_value(std::this_thread::get_id());
    });
    raw->wait_until_parked();
    session.reset();
    raw->release();

    std::future<std::thread::id> completion = completed_on.get_future();
    ASSERT_EQ(completion.wait_for(5s), std::future_status::ready);
    ASSERT_EQ(destroyed.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(destroyed.get(), completion.get());
}

// ============================================================================
// Future variant
// ============================================================================

TEST(EngineSessionFutureTest, FutureResolvesWithSegments) {
    auto session = EngineSession::with_engine(std::make_unique<FakeEngine>(three_batches()));

    std::future<std::vector<Segment>> result = session->transcribe(test_samples());
    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);

    std::vector<Segment> segments = result.get();
    ASSERT_EQ(segments.size(), 5u);
    EXPECT_EQ(segments.back().text, " can do for you.");
}

TEST(EngineSessionFutureTest, FutureMatchesCallbackVariant) {
    auto session = EngineSession::with_engine(std::make_unique<FakeEngine>(three_batches()));

    std::promise<std::vector<Segment>> delivered;
    session->transcribe(test_samples(), [&delivered](const std::vector<Segment>& segments,
                                                     std::exception_ptr error) {
        EXPECT_FALSE(error);
        delivered.set_value(segments);
    });
    std::future<std::vector<Segment>> by_callback = delivered.get_future();
    ASSERT_EQ(by_callback.wait_for(5s), std::future_status::ready);
    const std::vector<Segment> expected = by_callback.get();

    std::future<std::vector<Segment>> by_future = session->transcribe(test_samples());
    ASSERT_EQ(by_future.wait_for(5s), std::future_status::ready);

    EXPECT_EQ(by_future.get(), expected);
    EXPECT_EQ(expected.size(), 5u);
}

TEST(EngineSessionFutureTest, FutureCarriesErrors) {
    auto session = EngineSession::with_engine(std::make_unique<FakeEngine>(three_batches()));

    std::future<std::vector<Segment>> result = session->transcribe(std::vector<float>{});
    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    EXPECT_THROW(result.get(), InvalidInputError);
}

TEST(EngineSessionFutureTest, SessionOutlivesCallerReference) {
    auto engine = std::make_unique<FakeEngine>(three_batches());
    FakeEngine* raw = engine.get();
    raw->hold();

    auto session = EngineSession::with_engine(std::move(engine));
    std::future<std::vector<Segment>> result = session->transcribe(test_samples());
    raw->wait_until_parked();

    session.reset();
    raw->release();

    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(result.get().size(), 5u);
}
