#include "mediator/mediator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "di/service_collection.hpp"
#include "di/service_provider.hpp"
#include "mediator/handler_registry.hpp"
#include "mediator/unit.hpp"

using namespace std::chrono_literals;
namespace di = conduit::di;
namespace mediator = conduit::mediator;

namespace {

struct TestResponse {
    std::string result;
};

struct TestRequest : mediator::Request<TestResponse> {
    explicit TestRequest(std::string v) : value(std::move(v)) {}
    std::string value;
};

std::atomic<int> g_test_handler_calls{0};

class TestRequestHandler : public mediator::RequestHandler<TestRequest, TestResponse> {
public:
    std::future<TestResponse> handle(const TestRequest& request, mediator::CancellationToken token) override {
        ++g_test_handler_calls;
        token.throw_if_cancellation_requested();
        return mediator::make_ready_future(TestResponse{"Handled: " + request.value});
    }
};

struct AnotherResponse {
    int value;
};

struct AnotherRequest : mediator::Request<AnotherResponse> {
    explicit AnotherRequest(int n) : number(n) {}
    int number;
};

class AnotherRequestHandler : public mediator::RequestHandler<AnotherRequest, AnotherResponse> {
public:
    std::future<AnotherResponse> handle(const AnotherRequest& request, mediator::CancellationToken) override {
        return mediator::make_ready_future(AnotherResponse{request.number});
    }
};

struct UnitRequest : mediator::Request<mediator::Unit> {};

class UnitRequestHandler : public mediator::RequestHandler<UnitRequest, mediator::Unit> {
public:
    std::future<mediator::Unit> handle(const UnitRequest&, mediator::CancellationToken) override {
        return mediator::make_ready_future(mediator::Unit::value);
    }
};

struct IntRequest : mediator::Request<int> {
    explicit IntRequest(int v) : value(v) {}
    int value;
};
struct StringRequest : mediator::Request<std::string> {
    explicit StringRequest(std::string t) : text(std::move(t)) {}
    std::string text;
};
struct BoolRequest : mediator::Request<bool> {
    explicit BoolRequest(bool f) : flag(f) {}
    bool flag;
};

class PrimitiveHandler : public mediator::RequestHandler<IntRequest, int>,
                         public mediator::RequestHandler<StringRequest, std::string>,
                         public mediator::RequestHandler<BoolRequest, bool> {
public:
    std::future<int> handle(const IntRequest& r, mediator::CancellationToken) override {
        return mediator::make_ready_future(r.value);
    }
    std::future<std::string> handle(const StringRequest& r, mediator::CancellationToken) override {
        return mediator::make_ready_future(r.text);
    }
    std::future<bool> handle(const BoolRequest& r, mediator::CancellationToken) override {
        return mediator::make_ready_future(r.flag);
    }
};

// Used only by the cache test so that its key starts out uncached.
struct CacheProbeRequest : mediator::Request<std::string> {
    explicit CacheProbeRequest(std::string v) : value(std::move(v)) {}
    std::string value;
};

class CacheProbeHandler : public mediator::RequestHandler<CacheProbeRequest, std::string> {
public:
    std::future<std::string> handle(const CacheProbeRequest& r, mediator::CancellationToken) override {
        return mediator::make_ready_future("probe:" + r.value);
    }
};

struct ThrowingRequest : mediator::Request<int> {
    explicit ThrowingRequest(bool sync) : synchronous(sync) {}
    bool synchronous;
};

class ThrowingHandler : public mediator::RequestHandler<ThrowingRequest, int> {
public:
    std::future<int> handle(const ThrowingRequest& r, mediator::CancellationToken) override {
        if (r.synchronous) {
            throw std::domain_error("sync failure");
        }
        return std::async(std::launch::async, []() -> int { throw std::domain_error("async failure"); });
    }
};

struct SelfCancellingRequest : mediator::Request<int> {};

class SelfCancellingHandler : public mediator::RequestHandler<SelfCancellingRequest, int> {
public:
    std::future<int> handle(const SelfCancellingRequest&, mediator::CancellationToken) override {
        throw mediator::OperationCancelled();
    }
};

struct SlowRequest : mediator::Request<std::string> {
    explicit SlowRequest(std::string v) : value(std::move(v)) {}
    std::string value;
};

std::atomic<bool> g_slow_started{false};

class SlowHandler : public mediator::RequestHandler<SlowRequest, std::string>,
                    public std::enable_shared_from_this<SlowHandler> {
public:
    // The pending work keeps the handler alive and copies what it needs
    // from the request.
    std::future<std::string> handle(const SlowRequest& request, mediator::CancellationToken token) override {
        return std::async(std::launch::async, [self = shared_from_this(), value = request.value, token]() {
            g_slow_started = true;
            std::chrono::milliseconds budget =
                token.can_be_cancelled() ? std::chrono::milliseconds(10s) : 20ms;
            if (token.wait_for(budget)) {
                throw mediator::OperationCancelled();
            }
            return self->prefix_ + value;
        });
    }

private:
    std::string prefix_ = "slow:";
};

struct BrokenRequest : mediator::Request<int> {};

class BrokenHandler : public mediator::RequestHandler<BrokenRequest, int> {
public:
    std::future<int> handle(const BrokenRequest&, mediator::CancellationToken) override {
        return {};
    }
};

struct UnhandledRequest : mediator::Request<std::string> {};

class MediatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        mediator::register_handlers(services_, {mediator::scan_module<
            TestRequest, TestRequestHandler,
            AnotherRequest, AnotherRequestHandler,
            UnitRequest, UnitRequestHandler,
            IntRequest, StringRequest, BoolRequest, PrimitiveHandler,
            CacheProbeRequest, CacheProbeHandler,
            ThrowingRequest, ThrowingHandler,
            SelfCancellingRequest, SelfCancellingHandler,
            SlowRequest, SlowHandler,
            BrokenRequest, BrokenHandler,
            UnhandledRequest>()});
        provider_ = services_.build_provider();
        g_test_handler_calls = 0;
    }

    mediator::Mediator make_mediator() { return mediator::Mediator(*provider_); }

    di::ServiceCollection services_;
    std::shared_ptr<di::ServiceProvider> provider_;
};

TEST(MediatorNullTest, NullRequestFailsWithInvalidArgument) {
    di::ServiceProvider provider({});
    mediator::Mediator m(provider);

    auto pending = m.send(std::shared_ptr<const mediator::Request<std::string>>());
    try {
        pending.get();
        FAIL() << "expected InvalidArgument";
    } catch (const mediator::InvalidArgument& e) {
        EXPECT_EQ(e.parameter(), "request");
    }

    EXPECT_THROW(m.send(std::shared_ptr<TestRequest>()).get(), mediator::InvalidArgument);
}

TEST_F(MediatorTest, MissingHandlerFailsWithHandlerNotFound) {
    auto m = make_mediator();
    try {
        m.send(std::make_shared<UnhandledRequest>()).get();
        FAIL() << "expected HandlerNotFound";
    } catch (const mediator::HandlerNotFound& e) {
        EXPECT_NE(std::string(e.what()).find("No handler registered for request type"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("UnhandledRequest"), std::string::npos);
        EXPECT_NE(e.request_type().find("UnhandledRequest"), std::string::npos);
    }
}

TEST_F(MediatorTest, EmptyProviderFailsWithHandlerNotFound) {
    di::ServiceProvider provider({});
    mediator::Mediator m(provider);
    EXPECT_THROW(m.send(std::make_shared<TestRequest>("x")).get(), mediator::HandlerNotFound);
}

TEST_F(MediatorTest, ReturnsHandlerResponse) {
    auto m = make_mediator();
    auto response = m.send(std::make_shared<TestRequest>("test")).get();
    EXPECT_EQ(response.result, "Handled: test");
    EXPECT_EQ(g_test_handler_calls.load(), 1);
}

TEST_F(MediatorTest, RoutesEachRequestTypeToItsHandler) {
    auto m = make_mediator();
    auto first = m.send(std::make_shared<TestRequest>("first")).get();
    auto second = m.send(std::make_shared<AnotherRequest>(42)).get();

    EXPECT_EQ(first.result, "Handled: first");
    EXPECT_EQ(second.value, 42);
}

TEST_F(MediatorTest, RoutesByRuntimeTypeThroughBasePointer) {
    auto m = make_mediator();
    std::shared_ptr<const mediator::Request<std::string>> request = std::make_shared<StringRequest>("hello");
    EXPECT_EQ(m.send(request).get(), "hello");
}

TEST_F(MediatorTest, UnitResponse) {
    auto m = make_mediator();
    EXPECT_EQ(m.send(std::make_shared<UnitRequest>()).get(), mediator::Unit::value);
}

TEST_F(MediatorTest, DifferentResponseTypes) {
    auto m = make_mediator();
    EXPECT_EQ(m.send(std::make_shared<IntRequest>(42)).get(), 42);
    EXPECT_EQ(m.send(std::make_shared<StringRequest>("hello")).get(), "hello");
    EXPECT_TRUE(m.send(std::make_shared<BoolRequest>(true)).get());
}

TEST_F(MediatorTest, CachedInvokerDoesNotReturnStaleResults) {
    auto before = mediator::Mediator::cached_invoker_count();

    auto m = make_mediator();
    EXPECT_EQ(m.send(std::make_shared<CacheProbeRequest>("first")).get(), "probe:first");
    EXPECT_EQ(m.send(std::make_shared<CacheProbeRequest>("second")).get(), "probe:second");

    // A fresh mediator shares the process-wide cache.
    auto other = make_mediator();
    EXPECT_EQ(other.send(std::make_shared<CacheProbeRequest>("third")).get(), "probe:third");

    EXPECT_EQ(mediator::Mediator::cached_invoker_count(), before + 1);
}

TEST_F(MediatorTest, PreCancelledTokenYieldsCancellationWithoutRunningHandler) {
    auto m = make_mediator();
    mediator::CancellationSource source;
    source.cancel();

    EXPECT_THROW(m.send(std::make_shared<TestRequest>("test"), source.token()).get(),
                 mediator::OperationCancelled);
    EXPECT_EQ(g_test_handler_calls.load(), 0);
}

TEST_F(MediatorTest, CancellationDuringHandlerYieldsCancellation) {
    auto m = make_mediator();
    mediator::CancellationSource source;
    g_slow_started = false;

    auto pending = m.send(std::make_shared<SlowRequest>("x"), source.token());
    while (!g_slow_started.load()) {
        std::this_thread::sleep_for(1ms);
    }
    source.cancel();

    EXPECT_THROW(pending.get(), mediator::OperationCancelled);
}

TEST_F(MediatorTest, SynchronousCancellationIsNotWrapped) {
    auto m = make_mediator();
    try {
        m.send(std::make_shared<SelfCancellingRequest>()).get();
        FAIL() << "expected OperationCancelled";
    } catch (const mediator::OperationCancelled&) {
        SUCCEED();
    } catch (const mediator::InvocationError&) {
        FAIL() << "cancellation leaked out wrapped";
    }
}

TEST_F(MediatorTest, SynchronousHandlerExceptionPropagatesUnwrapped) {
    auto m = make_mediator();
    try {
        m.send(std::make_shared<ThrowingRequest>(true)).get();
        FAIL() << "expected std::domain_error";
    } catch (const mediator::InvocationError&) {
        FAIL() << "handler error leaked out wrapped";
    } catch (const std::domain_error& e) {
        EXPECT_STREQ(e.what(), "sync failure");
    }
}

TEST_F(MediatorTest, AsynchronousHandlerExceptionPropagatesUnwrapped) {
    auto m = make_mediator();
    try {
        m.send(std::make_shared<ThrowingRequest>(false)).get();
        FAIL() << "expected std::domain_error";
    } catch (const std::domain_error& e) {
        EXPECT_STREQ(e.what(), "async failure");
    }
}

TEST_F(MediatorTest, EmptyFutureFromHandlerIsReported) {
    auto m = make_mediator();
    EXPECT_THROW(m.send(std::make_shared<BrokenRequest>()).get(), mediator::InvalidHandlerResult);
}

TEST_F(MediatorTest, HandlerStateOutlivesSend) {
    std::future<std::string> pending;
    {
        auto m = make_mediator();
        auto request = std::make_shared<SlowRequest>("kept");
        pending = m.send(request);
    }
    std::this_thread::sleep_for(5ms);

    EXPECT_EQ(pending.get(), "slow:kept");
}

TEST_F(MediatorTest, SynchronousHandlerResultIsReadyImmediately) {
    auto m = make_mediator();
    auto pending = m.send(std::make_shared<TestRequest>("now"));

    ASSERT_EQ(pending.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(pending.get().result, "Handled: now");
}

TEST_F(MediatorTest, FailuresAreReadyImmediately) {
    auto m = make_mediator();
    auto missing = m.send(std::make_shared<UnhandledRequest>());
    auto null = m.send(std::shared_ptr<TestRequest>());

    EXPECT_EQ(missing.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(null.wait_for(0s), std::future_status::ready);
}

TEST_F(MediatorTest, TimedWaitOnSlowHandlerTimesOut) {
    auto m = make_mediator();
    mediator::CancellationSource source;

    auto pending = m.send(std::make_shared<SlowRequest>("late"), source.token());
    EXPECT_EQ(pending.wait_for(50ms), std::future_status::timeout);

    source.cancel();
    EXPECT_EQ(pending.wait_for(5s), std::future_status::ready);
    EXPECT_THROW(pending.get(), mediator::OperationCancelled);
}

} // namespace
