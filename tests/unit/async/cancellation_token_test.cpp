#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "cgc/async/cancellation_token.hpp"
#include "cgc/async/completion_signal.hpp"

using namespace cgc::async;
using cgc::foundation::ErrorCode;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// CancellationToken / CancellationSource
// ---------------------------------------------------------------------------

TEST(CancellationTokenTest, NoneIsNeverCancelled) {
    auto token = CancellationToken::none();
    EXPECT_FALSE(token.canBeCancelled());
    EXPECT_FALSE(token.isCancelled());
    EXPECT_FALSE(token.waitFor(10ms));
    EXPECT_TRUE(token.checkpoint().hasValue());
}

TEST(CancellationTokenTest, CancelIsObservedByCopies) {
    CancellationSource source;
    auto a = source.token();
    auto b = a;
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a.isCancelled());

    source.cancel();
    EXPECT_TRUE(a.isCancelled());
    EXPECT_TRUE(b.isCancelled());
    EXPECT_TRUE(source.isCancelled());

    auto checkpoint = b.checkpoint();
    ASSERT_TRUE(checkpoint.hasError());
    EXPECT_EQ(checkpoint.error().code(), ErrorCode::OperationCancelled);
}

TEST(CancellationTokenTest, WaitForWakesOnCancel) {
    CancellationSource source;
    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(source.token().waitFor(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    canceller.join();
}

TEST(CancellationTokenTest, CallbacksRunOnceAndRegistrationCanBeDropped) {
    CancellationSource source;
    std::atomic<int> kept{0};
    std::atomic<int> dropped{0};

    auto keep = source.token().onCancel([&] { kept.fetch_add(1); });
    {
        auto drop = source.token().onCancel([&] { dropped.fetch_add(1); });
    }

    source.cancel();
    source.cancel();

    EXPECT_EQ(kept.load(), 1);
    EXPECT_EQ(dropped.load(), 0);
}

TEST(CancellationTokenTest, OnCancelAfterCancelRunsImmediately) {
    CancellationSource source;
    source.cancel();
    bool ran = false;
    auto registration = source.token().onCancel([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CancellationTokenTest, RegistrationMayOutliveSource) {
    CancellationRegistration registration;
    {
        CancellationSource source;
        registration = source.token().onCancel([] {});
    }
    registration.reset();
    SUCCEED();
}

TEST(CancellationTokenTest, LinkedSourceFollowsAnyParent) {
    CancellationSource app;
    CancellationSource session;
    auto linked = CancellationSource::linked({app.token(), session.token()});

    EXPECT_FALSE(linked.isCancelled());
    session.cancel();
    EXPECT_TRUE(linked.isCancelled());
    EXPECT_FALSE(app.isCancelled());
}

TEST(CancellationTokenTest, LinkedToCancelledParentStartsCancelled) {
    CancellationSource parent;
    parent.cancel();
    auto linked = CancellationSource::linked({parent.token()});
    EXPECT_TRUE(linked.isCancelled());
}

TEST(CancellationTokenTest, CancellingChildLeavesParent) {
    CancellationSource parent;
    auto child = CancellationSource::linked({parent.token()});
    child.cancel();
    EXPECT_FALSE(parent.isCancelled());
}

TEST(CancellationTokenTest, LinkingToTemporaryLinkedTokenFollowsRoots) {
    CancellationSource app;
    CancellationSource session;

    // The intermediate linked source is dropped right away; only its token
    // survives inside the child.
    auto child = CancellationSource::linked(
        {CancellationSource::linked({app.token(), session.token()}).token()});
    auto token = child.token();

    session.cancel();
    EXPECT_TRUE(token.isCancelled());
    EXPECT_FALSE(app.isCancelled());
}

TEST(CancellationTokenTest, ChainOfLinkedSourcesPropagatesFromRoot) {
    CancellationSource root;
    auto token = CancellationSource::linked(
        {CancellationSource::linked({CancellationSource::linked({root.token()}).token()})
             .token()}).token();

    std::atomic<int> fired{0};
    auto reg = token.onCancel([&] { ++fired; });
    root.cancel();
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(fired.load(), 1);
}

TEST(CancellationTokenTest, ResetWaitsForRunningCallback) {
    CancellationSource source;
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};

    auto reg = source.token().onCancel([&] {
        entered = true;
        std::this_thread::sleep_for(100ms);
        finished = true;
    });

    std::thread canceller([&] { source.cancel(); });
    while (!entered.load()) {
        std::this_thread::yield();
    }

    reg.reset();
    EXPECT_TRUE(finished.load());
    canceller.join();
}

TEST(CancellationTokenTest, CallbackMayDropItsOwnRegistration) {
    CancellationSource source;
    std::atomic<int> fired{0};
    CancellationRegistration reg;
    reg = source.token().onCancel([&] {
        ++fired;
        reg.reset();
    });

    source.cancel();
    EXPECT_EQ(fired.load(), 1);
}

TEST(CancellationTokenTest, ResetBeforeCancelSkipsCallback) {
    CancellationSource source;
    std::atomic<int> fired{0};
    auto first = source.token().onCancel([&] { ++fired; });
    auto second = source.token().onCancel([&] { ++fired; });
    second.reset();

    source.cancel();
    EXPECT_EQ(fired.load(), 1);
}

// ---------------------------------------------------------------------------
// CompletionSignal
// ---------------------------------------------------------------------------

TEST(CompletionSignalTest, FirstValueWins) {
    CompletionSignal<bool> signal;
    EXPECT_TRUE(signal.trySet(true));
    EXPECT_FALSE(signal.trySet(false));
    auto value = signal.waitFor(0ms);
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(*value);
}

TEST(CompletionSignalTest, WaitReturnsNulloptOnTimeoutOrCancel) {
    CompletionSignal<int> signal;
    EXPECT_FALSE(signal.waitFor(10ms).has_value());

    CancellationSource source;
    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(signal.waitFor(5s, source.token()).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    canceller.join();
}

TEST(CompletionSignalTest, CrossThreadCompletion) {
    CompletionSignal<int> signal;
    std::thread setter([&] {
        std::this_thread::sleep_for(10ms);
        signal.trySet(42);
    });
    auto value = signal.waitFor(2s);
    setter.join();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42);
}

TEST(CompletionSignalPoolTest, ReleasedSignalsAreResetAndReused) {
    CompletionSignalPool<bool> pool;
    auto signal = pool.acquire();
    signal->trySet(true);
    auto* raw = signal.get();
    pool.release(std::move(signal));
    EXPECT_EQ(pool.idleCount(), 1u);

    auto again = pool.acquire();
    EXPECT_EQ(again.get(), raw);
    EXPECT_FALSE(again->isSet());
}

TEST(CompletionSignalPoolTest, PoolIsBounded) {
    CompletionSignalPool<bool> pool;
    std::vector<std::shared_ptr<CompletionSignal<bool>>> held;
    for (std::size_t i = 0; i < CompletionSignalPool<bool>::kMaxPooled + 5; ++i) {
        held.push_back(pool.acquire());
    }
    for (auto& s : held) {
        pool.release(std::move(s));
    }
    EXPECT_EQ(pool.idleCount(), CompletionSignalPool<bool>::kMaxPooled);
}
