/// @file router_components_test.cpp
/// @brief Unit tests for the routing pipeline stages: access log,
///        ResponseCommitter, CompletionResolver, RetryController and
///        UpstreamDispatcher.

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "agw/foundation/error_code.hpp"
#include "agw/foundation/task_executor.hpp"
#include "agw/service/access_log.hpp"
#include "agw/service/completion_resolver.hpp"
#include "agw/service/exchange_context.hpp"
#include "agw/service/response_committer.hpp"
#include "agw/service/response_writer.hpp"
#include "agw/service/retry_controller.hpp"
#include "agw/service/router_stats.hpp"
#include "agw/service/upstream_client.hpp"
#include "agw/service/upstream_dispatcher.hpp"

using namespace agw::service;
using agw::foundation::ErrorCode;
using agw::foundation::GatewayError;
using agw::foundation::TaskExecutor;
using namespace std::chrono_literals;

namespace {

class CapturingWriter : public ResponseWriter {
public:
    void write(const ExchangeContext& ctx) override {
        std::lock_guard lock(mutex_);
        auto response = ctx.response();
        statuses_.push_back(response ? response->status : 0);
        if (throwOnWrite) {
            throw std::runtime_error("connection reset by client");
        }
    }

    std::vector<int> statuses() const {
        std::lock_guard lock(mutex_);
        return statuses_;
    }

    bool throwOnWrite = false;

private:
    mutable std::mutex mutex_;
    std::vector<int> statuses_;
};

class CapturingSink : public AccessLogSink {
public:
    void record(const AccessLogRecord& entry) override {
        std::lock_guard lock(mutex_);
        entries_.push_back(entry);
    }

    std::vector<AccessLogRecord> entries() const {
        std::lock_guard lock(mutex_);
        return entries_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<AccessLogRecord> entries_;
};

/// Client returning pre-built futures in order, recording each request.
class QueueClient : public UpstreamClient {
public:
    UpstreamFuture submit(const UpstreamRequest& request) override {
        std::lock_guard lock(mutex_);
        requests.push_back(request);
        if (throwOnSubmit) {
            throw std::runtime_error("connection refused");
        }
        if (next < futures.size()) {
            return futures[next++];
        }
        return UpstreamFuture::failed({UpstreamErrorKind::Other, "no scripted response"});
    }

    std::mutex mutex_;
    std::vector<UpstreamFuture> futures;
    std::vector<UpstreamRequest> requests;
    std::size_t next = 0;
    bool throwOnSubmit = false;
};

std::shared_ptr<Rule> makeRule(uint32_t retries) {
    auto rule = std::make_shared<Rule>();
    rule->id = "orders";
    rule->retryConfig.times = retries;
    return rule;
}

std::shared_ptr<ExchangeContext> makeContext(std::shared_ptr<const Rule> rule,
                                             std::string path = "/orders/list") {
    GatewayRequest request;
    request.uniqueId = "req-42";
    request.clientIp = "192.168.1.7";
    request.method = "GET";
    request.path = std::move(path);
    request.host = "orders.internal";
    request.body = "payload";
    return std::make_shared<ExchangeContext>(std::move(rule), std::move(request));
}

}  // namespace

// ===========================================================================
// Access log
// ===========================================================================

TEST(AccessLogTest, FormatsFieldsInOrder) {
    AccessLogRecord record;
    record.elapsedMs = 12;
    record.clientIp = "10.1.2.3";
    record.requestId = "req-7";
    record.method = "POST";
    record.path = "/orders/list";
    record.statusCode = 504;
    record.bodyLength = 42;

    EXPECT_EQ(formatAccessLog(record), "12 10.1.2.3 req-7 POST /orders/list 504 42");
}

TEST(AccessLogTest, RecordFromContext) {
    auto ctx = makeContext(makeRule(0));
    ctx->setResponse(GatewayResponse::fromCode(ResponseCode::HttpResponseError));

    auto now = ctx->request().beginTime + 35ms;
    auto record = makeAccessLogRecord(*ctx, now);
    EXPECT_EQ(record.elapsedMs, 35);
    EXPECT_EQ(record.clientIp, "192.168.1.7");
    EXPECT_EQ(record.requestId, "req-42");
    EXPECT_EQ(record.method, "GET");
    EXPECT_EQ(record.path, "/orders/list");
    EXPECT_EQ(record.statusCode, 502);
    EXPECT_EQ(record.bodyLength, ctx->response()->body.size());
}

// ===========================================================================
// ResponseCommitter
// ===========================================================================

class ResponseCommitterTest : public ::testing::Test {
protected:
    std::shared_ptr<CapturingWriter> writer_ = std::make_shared<CapturingWriter>();
    std::shared_ptr<CapturingSink> sink_ = std::make_shared<CapturingSink>();
    std::shared_ptr<RouterCounters> counters_ = std::make_shared<RouterCounters>();
    ResponseCommitter committer_{writer_, sink_, counters_};
};

TEST_F(ResponseCommitterTest, CommitsOnce) {
    auto ctx = makeContext(makeRule(0));

    EXPECT_TRUE(committer_.commit(*ctx, GatewayResponse::fromCode(ResponseCode::RequestTimeout),
                                  GatewayError(ErrorCode::UpstreamTimeout, "slow")));
    EXPECT_FALSE(committer_.commit(*ctx, GatewayResponse::fromCode(ResponseCode::InternalError)));

    EXPECT_TRUE(ctx->isWritten());
    EXPECT_EQ(ctx->response()->status, 504);
    EXPECT_EQ(ctx->failure()->code(), ErrorCode::UpstreamTimeout);
    EXPECT_EQ(writer_->statuses(), std::vector<int>{504});
    ASSERT_EQ(sink_->entries().size(), 1u);
    EXPECT_EQ(sink_->entries()[0].statusCode, 504);

    auto stats = counters_->snapshot();
    EXPECT_EQ(stats.responsesWritten, 1u);
    EXPECT_EQ(stats.duplicateCompletions, 1u);
}

TEST_F(ResponseCommitterTest, AccessLogCanBeSuppressed) {
    auto ctx = makeContext(makeRule(0));
    EXPECT_TRUE(committer_.commit(*ctx, GatewayResponse::fixed(503, "busy"), std::nullopt, false));
    EXPECT_EQ(writer_->statuses().size(), 1u);
    EXPECT_TRUE(sink_->entries().empty());
}

TEST_F(ResponseCommitterTest, WriterFailureStillLogsAccess) {
    writer_->throwOnWrite = true;
    auto ctx = makeContext(makeRule(0));
    EXPECT_TRUE(committer_.commit(*ctx, GatewayResponse::fromCode(ResponseCode::InternalError)));
    EXPECT_EQ(sink_->entries().size(), 1u);
    EXPECT_EQ(counters_->snapshot().responsesWritten, 1u);
}

TEST(ResponseCommitterConstructionTest, RequiresWriter) {
    EXPECT_THROW(ResponseCommitter(nullptr, nullptr, std::make_shared<RouterCounters>()),
                 std::invalid_argument);
}

// ===========================================================================
// CompletionResolver + RetryController
// ===========================================================================

class CompletionResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        committer_ = std::make_shared<ResponseCommitter>(writer_, sink_, counters_);
        retry_ = std::make_shared<RetryController>(
            counters_, [this](const std::shared_ptr<ExchangeContext>& ctx) {
                reinvoked_.push_back(ctx);
            });
        resolver_ = std::make_shared<CompletionResolver>(committer_, counters_, retry_);
    }

    UpstreamRequest requestFor(const std::shared_ptr<ExchangeContext>& ctx) {
        return ctx->outboundRequest();
    }

    std::shared_ptr<CapturingWriter> writer_ = std::make_shared<CapturingWriter>();
    std::shared_ptr<CapturingSink> sink_ = std::make_shared<CapturingSink>();
    std::shared_ptr<RouterCounters> counters_ = std::make_shared<RouterCounters>();
    std::shared_ptr<ResponseCommitter> committer_;
    std::shared_ptr<RetryController> retry_;
    std::shared_ptr<CompletionResolver> resolver_;
    std::vector<std::shared_ptr<ExchangeContext>> reinvoked_;
};

TEST_F(CompletionResolverTest, SuccessPassesUpstreamThrough) {
    auto ctx = makeContext(makeRule(2));
    UpstreamResponse upstream{200, {{"Content-Type", "text/plain"}}, "hello"};

    resolver_->complete(requestFor(ctx), UpstreamOutcome::ok(upstream), ctx, nullptr);

    EXPECT_TRUE(ctx->requestReleased());
    ASSERT_TRUE(ctx->response().has_value());
    EXPECT_EQ(ctx->response()->status, 200);
    EXPECT_EQ(ctx->response()->body, "hello");
    EXPECT_FALSE(ctx->failure().has_value());
    EXPECT_EQ(writer_->statuses().size(), 1u);
    EXPECT_EQ(sink_->entries().size(), 1u);
    EXPECT_TRUE(reinvoked_.empty());
}

TEST_F(CompletionResolverTest, TimeoutWithoutBudgetWritesRequestTimeout) {
    auto ctx = makeContext(makeRule(0));
    resolver_->complete(requestFor(ctx),
                        UpstreamOutcome::err({UpstreamErrorKind::Timeout, "read timeout"}),
                        ctx, nullptr);

    ASSERT_TRUE(ctx->response().has_value());
    EXPECT_EQ(ctx->response()->status, 504);
    EXPECT_EQ(ctx->response()->code, ResponseCode::RequestTimeout);
    EXPECT_EQ(ctx->failure()->code(), ErrorCode::UpstreamTimeout);
    EXPECT_EQ(counters_->snapshot().timeouts, 1u);
}

TEST_F(CompletionResolverTest, RetryableFailureWithBudgetRetries) {
    auto ctx = makeContext(makeRule(2));
    resolver_->complete(requestFor(ctx),
                        UpstreamOutcome::err({UpstreamErrorKind::Connection, "refused"}),
                        ctx, nullptr);

    ASSERT_EQ(reinvoked_.size(), 1u);
    EXPECT_EQ(reinvoked_[0], ctx);
    EXPECT_EQ(ctx->currentRetryTimes(), 1u);
    EXPECT_FALSE(ctx->isWritten());
    EXPECT_TRUE(writer_->statuses().empty());
    EXPECT_TRUE(sink_->entries().empty());
    EXPECT_EQ(counters_->snapshot().retries, 1u);
}

TEST_F(CompletionResolverTest, ExhaustedBudgetWritesError) {
    auto ctx = makeContext(makeRule(1));
    (void)ctx->incrementRetryTimes();

    resolver_->complete(requestFor(ctx),
                        UpstreamOutcome::err({UpstreamErrorKind::Connection, "refused"}),
                        ctx, nullptr);

    EXPECT_TRUE(reinvoked_.empty());
    ASSERT_TRUE(ctx->response().has_value());
    EXPECT_EQ(ctx->response()->status, 502);

    auto failure = ctx->failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->code(), ErrorCode::UpstreamResponseError);
    const auto* detail = failure->context<UpstreamErrorContext>();
    ASSERT_NE(detail, nullptr);
    EXPECT_EQ(detail->cause, "refused");
    EXPECT_EQ(detail->requestId, "req-42");
    EXPECT_EQ(detail->url, "http://orders.internal/orders/list");
}

TEST_F(CompletionResolverTest, NonRetryableFailureIsNotRetried) {
    auto ctx = makeContext(makeRule(3));
    resolver_->complete(requestFor(ctx),
                        UpstreamOutcome::err({UpstreamErrorKind::Other, "protocol error"}),
                        ctx, nullptr);

    EXPECT_TRUE(reinvoked_.empty());
    EXPECT_EQ(ctx->response()->status, 502);
    EXPECT_EQ(counters_->snapshot().upstreamErrors, 1u);
}

TEST_F(CompletionResolverTest, BreakerRouteFailureIsLeftToFallback) {
    auto rule = makeRule(3);
    BreakerConfig breaker;
    breaker.path = "/orders/list";
    rule->breakerConfigs.push_back(breaker);
    auto ctx = makeContext(rule);

    resolver_->complete(requestFor(ctx),
                        UpstreamOutcome::err({UpstreamErrorKind::Timeout, "read timeout"}),
                        ctx, rule->findBreakerConfig("/orders/list"));

    EXPECT_TRUE(ctx->requestReleased());
    EXPECT_TRUE(reinvoked_.empty());
    EXPECT_FALSE(ctx->isWritten());
    EXPECT_TRUE(writer_->statuses().empty());
}

TEST_F(CompletionResolverTest, InvalidUpstreamBecomesInternalError) {
    auto ctx = makeContext(makeRule(0));
    UpstreamResponse upstream;
    upstream.status = 0;

    resolver_->complete(requestFor(ctx), UpstreamOutcome::ok(upstream), ctx, nullptr);

    ASSERT_TRUE(ctx->response().has_value());
    EXPECT_EQ(ctx->response()->status, 500);
    EXPECT_EQ(ctx->failure()->code(), ErrorCode::InternalError);
    EXPECT_EQ(counters_->snapshot().internalErrors, 1u);
}

TEST_F(CompletionResolverTest, DuplicateCompletionIsDiscarded) {
    auto ctx = makeContext(makeRule(0));
    auto request = requestFor(ctx);

    resolver_->complete(request, UpstreamOutcome::ok(UpstreamResponse{}), ctx, nullptr);
    resolver_->complete(request, UpstreamOutcome::err({UpstreamErrorKind::Other, "late"}),
                        ctx, nullptr);

    EXPECT_EQ(writer_->statuses(), std::vector<int>{200});
    EXPECT_EQ(sink_->entries().size(), 1u);
    EXPECT_EQ(counters_->snapshot().duplicateCompletions, 1u);
}

TEST(CompletionResolverGateTest, ShouldRetry) {
    auto rule = makeRule(1);
    auto ctx = makeContext(rule);
    BreakerConfig breaker;

    EXPECT_TRUE(CompletionResolver::shouldRetry(*ctx, {UpstreamErrorKind::Timeout, ""}, nullptr));
    EXPECT_TRUE(CompletionResolver::shouldRetry(*ctx, {UpstreamErrorKind::Connection, ""}, nullptr));
    EXPECT_FALSE(CompletionResolver::shouldRetry(*ctx, {UpstreamErrorKind::Other, ""}, nullptr));
    EXPECT_FALSE(CompletionResolver::shouldRetry(*ctx, {UpstreamErrorKind::Cancelled, ""}, nullptr));
    EXPECT_FALSE(CompletionResolver::shouldRetry(*ctx, {UpstreamErrorKind::Timeout, ""}, &breaker));

    (void)ctx->incrementRetryTimes();
    EXPECT_FALSE(CompletionResolver::shouldRetry(*ctx, {UpstreamErrorKind::Timeout, ""}, nullptr));
}

// ===========================================================================
// RetryController trampoline
// ===========================================================================

TEST(RetryControllerTest, NestedRetriesRunWithConstantDepth) {
    auto counters = std::make_shared<RouterCounters>();
    auto ctx = makeContext(makeRule(100));

    int depth = 0;
    int maxDepth = 0;
    int calls = 0;
    std::shared_ptr<RetryController> controller;
    controller = std::make_shared<RetryController>(
        counters, [&](const std::shared_ptr<ExchangeContext>& c) {
            ++depth;
            maxDepth = std::max(maxDepth, depth);
            ++calls;
            EXPECT_TRUE(RetryController::driving());
            if (c->currentRetryTimes() < 50) {
                controller->retry(c);
            }
            --depth;
        });

    EXPECT_FALSE(RetryController::driving());
    controller->retry(ctx);

    EXPECT_EQ(calls, 50);
    EXPECT_EQ(maxDepth, 1);
    EXPECT_EQ(ctx->currentRetryTimes(), 50u);
    EXPECT_EQ(counters->snapshot().retries, 50u);
    EXPECT_FALSE(RetryController::driving());
}

TEST(RetryControllerTest, ExceptionsPropagateAndResetDrive) {
    auto counters = std::make_shared<RouterCounters>();
    auto ctx = makeContext(makeRule(3));
    RetryController controller(counters, [](const std::shared_ptr<ExchangeContext>&) {
        throw std::runtime_error("router failure");
    });

    EXPECT_THROW(controller.retry(ctx), std::runtime_error);
    EXPECT_FALSE(RetryController::driving());
    EXPECT_EQ(ctx->currentRetryTimes(), 1u);
}

TEST(RetryControllerTest, FailingExchangeDoesNotStrandOthersQueuedOnThread) {
    auto counters = std::make_shared<RouterCounters>();
    auto failing = makeContext(makeRule(3));
    auto bystander = makeContext(makeRule(3));

    int bystanderRoutes = 0;
    std::shared_ptr<RetryController> controller;
    controller = std::make_shared<RetryController>(
        counters, [&](const std::shared_ptr<ExchangeContext>& c) {
            if (c == failing) {
                // Queued behind the current drive, then the drive fails.
                controller->retry(bystander);
                controller->retry(failing);
                throw std::runtime_error("route failed");
            }
            ++bystanderRoutes;
        });

    EXPECT_THROW(controller->retry(failing), std::runtime_error);
    EXPECT_FALSE(RetryController::driving());

    EXPECT_EQ(bystanderRoutes, 1);
    EXPECT_EQ(bystander->currentRetryTimes(), 1u);
    // The failing exchange's own queued retry is dropped.
    EXPECT_EQ(failing->currentRetryTimes(), 2u);
}

// ===========================================================================
// UpstreamDispatcher
// ===========================================================================

class UpstreamDispatcherTest : public ::testing::Test {
protected:
    struct Delivery {
        UpstreamRequest request;
        bool success = false;
        UpstreamErrorKind kind = UpstreamErrorKind::Other;
        const BreakerConfig* breaker = nullptr;
        std::thread::id thread;
    };

    UpstreamDispatcher::CompletionHandler handler() {
        return [this](const UpstreamRequest& request,
                      const UpstreamOutcome& outcome,
                      const std::shared_ptr<ExchangeContext>&,
                      const BreakerConfig* breaker) {
            std::lock_guard lock(mutex_);
            Delivery d;
            d.request = request;
            d.success = outcome.hasValue();
            if (outcome.hasError()) {
                d.kind = outcome.error().kind;
            }
            d.breaker = breaker;
            d.thread = std::this_thread::get_id();
            deliveries_.push_back(d);
        };
    }

    std::vector<Delivery> deliveries() {
        std::lock_guard lock(mutex_);
        return deliveries_;
    }

    std::shared_ptr<QueueClient> client_ = std::make_shared<QueueClient>();
    std::shared_ptr<RouterCounters> counters_ = std::make_shared<RouterCounters>();
    std::mutex mutex_;
    std::vector<Delivery> deliveries_;
};

TEST_F(UpstreamDispatcherTest, InlineCompletionRunsOnCompletingThread) {
    UpstreamDispatcher dispatcher(client_, CompletionMode::Inline, nullptr, counters_, handler());
    UpstreamPromise promise;
    client_->futures.push_back(promise.future());

    auto ctx = makeContext(makeRule(0));
    auto future = dispatcher.dispatch(ctx, nullptr);
    EXPECT_FALSE(future.isReady());
    EXPECT_TRUE(deliveries().empty());

    std::thread::id completer;
    std::thread t([&] {
        completer = std::this_thread::get_id();
        promise.complete(UpstreamResponse{});
    });
    t.join();

    auto got = deliveries();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_TRUE(got[0].success);
    EXPECT_EQ(got[0].thread, completer);
    EXPECT_EQ(got[0].request.url, "http://orders.internal/orders/list");
    EXPECT_EQ(got[0].request.body, "payload");
    EXPECT_EQ(counters_->snapshot().attempts, 1u);
}

TEST_F(UpstreamDispatcherTest, PooledCompletionRunsOnExecutor) {
    auto executor = std::make_shared<TaskExecutor>(1, "test_completion");
    UpstreamDispatcher dispatcher(client_, CompletionMode::Pooled, executor, counters_, handler());
    client_->futures.push_back(UpstreamFuture::completed(UpstreamResponse{}));

    auto ctx = makeContext(makeRule(0));
    BreakerConfig breaker;
    (void)dispatcher.dispatch(ctx, &breaker);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (deliveries().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    auto got = deliveries();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_NE(got[0].thread, std::this_thread::get_id());
    EXPECT_EQ(got[0].breaker, &breaker);
    executor->shutdown();
}

TEST_F(UpstreamDispatcherTest, SubmitExceptionBecomesConnectionFailure) {
    UpstreamDispatcher dispatcher(client_, CompletionMode::Inline, nullptr, counters_, handler());
    client_->throwOnSubmit = true;

    auto ctx = makeContext(makeRule(0));
    auto future = dispatcher.dispatch(ctx, nullptr);

    ASSERT_TRUE(future.isReady());
    auto got = deliveries();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_FALSE(got[0].success);
    EXPECT_EQ(got[0].kind, UpstreamErrorKind::Connection);
}

TEST_F(UpstreamDispatcherTest, InvalidFutureBecomesFailure) {
    UpstreamDispatcher dispatcher(client_, CompletionMode::Inline, nullptr, counters_, handler());
    client_->futures.push_back(UpstreamFuture{});

    auto ctx = makeContext(makeRule(0));
    (void)dispatcher.dispatch(ctx, nullptr);

    auto got = deliveries();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].kind, UpstreamErrorKind::Other);
}

TEST(UpstreamDispatcherConstructionTest, PooledModeRequiresExecutor) {
    auto client = std::make_shared<QueueClient>();
    auto counters = std::make_shared<RouterCounters>();
    auto noop = [](const UpstreamRequest&, const UpstreamOutcome&,
                   const std::shared_ptr<ExchangeContext>&, const BreakerConfig*) {};
    EXPECT_THROW(UpstreamDispatcher(client, CompletionMode::Pooled, nullptr, counters, noop),
                 std::invalid_argument);
}
