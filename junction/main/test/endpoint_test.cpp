#include "junction/endpoint.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "junction/endpoint-error.hpp"
#include "junction/http-method.hpp"
#include "junction/http-request.hpp"
#include "junction/http-response.hpp"
#include "junction/http-status-code.hpp"
#include "junction/request-body.hpp"
#include "junction/request-task.hpp"

namespace junction {

namespace {

struct AppState {
  std::string greeting{"hello"};
};

class GreetEndpoint final : public Endpoint<AppState> {
 public:
  RequestTask<HttpResponse> call(Request<AppState>& request) const override {
    co_return HttpResponse(request.state().greeting + " " + std::string(request.path()));
  }
};

RequestTask<HttpResponse> AsyncEcho(Request<AppState>& request) {
  std::string body = co_await request.body().text();
  co_return HttpResponse(http::StatusCodeCreated).body(std::move(body));
}

HttpResponse SyncTeapot([[maybe_unused]] Request<AppState>& request) {
  return HttpResponse(http::StatusCodeAccepted).body("sync");
}

HttpResponse StaticOk() { return HttpResponse("static"); }

}  // namespace

class EndpointTest : public ::testing::Test {
 protected:
  HttpResponse call(const Endpoint<AppState>& endpoint) { return endpoint.call(request).runSynchronously(); }

  std::shared_ptr<AppState> state = std::make_shared<AppState>();
  Request<AppState> request{http::Method::POST, "/items?x=1", {}, RequestBody("posted"), state};
};

TEST_F(EndpointTest, CustomEndpointReadsState) {
  GreetEndpoint endpoint;
  auto response = call(endpoint);
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.bodyInMemory(), "hello /items");
}

TEST_F(EndpointTest, AsyncFunction) {
  auto endpoint = MakeEndpoint<AppState>(&AsyncEcho);
  auto response = call(*endpoint);
  EXPECT_EQ(response.status(), http::StatusCodeCreated);
  EXPECT_EQ(response.bodyInMemory(), "posted");
}

TEST_F(EndpointTest, SyncFunction) {
  auto response = call(*MakeEndpoint<AppState>(&SyncTeapot));
  EXPECT_EQ(response.status(), http::StatusCodeAccepted);
  EXPECT_EQ(response.bodyInMemory(), "sync");
}

TEST_F(EndpointTest, StaticFunction) {
  auto response = call(*MakeEndpoint<AppState>(&StaticOk));
  EXPECT_EQ(response.bodyInMemory(), "static");
}

TEST_F(EndpointTest, Lambdas) {
  auto sync = MakeEndpoint<AppState>(
      [](Request<AppState>& req) { return HttpResponse(std::string(req.query())); });
  EXPECT_EQ(call(*sync).bodyInMemory(), "x=1");

  auto async = MakeEndpoint<AppState>([](Request<AppState>& req) -> RequestTask<HttpResponse> {
    co_return HttpResponse(req.state().greeting);
  });
  EXPECT_EQ(call(*async).bodyInMemory(), "hello");
}

TEST_F(EndpointTest, SharedEndpointIsReturnedAsIs) {
  auto endpoint = std::make_shared<const GreetEndpoint>();
  EndpointPtr<AppState> wrapped = MakeEndpoint<AppState>(endpoint);
  EXPECT_EQ(wrapped.get(), endpoint.get());

  EXPECT_NE(MakeEndpoint<AppState>(GreetEndpoint{}), nullptr);
}

TEST_F(EndpointTest, EmptyHandlersAreRejected) {
  EXPECT_THROW((void)Async<AppState>(AsyncHandler<AppState>{}), std::invalid_argument);
  EXPECT_THROW((void)Sync<AppState>(SyncHandler<AppState>{}), std::invalid_argument);
  EXPECT_THROW((void)Static<AppState>(StaticHandler{}), std::invalid_argument);
  EXPECT_THROW((void)MakeEndpoint<AppState>(EndpointPtr<AppState>{}), std::invalid_argument);
}

TEST_F(EndpointTest, FailuresPropagateThroughTheTask) {
  auto endpoint = MakeEndpoint<AppState>([]([[maybe_unused]] Request<AppState>& req) -> HttpResponse {
    throw EndpointError("no such item", http::StatusCodeNotFound);
  });
  auto task = endpoint->call(request);
  try {
    (void)task.runSynchronously();
    FAIL() << "expected EndpointError";
  } catch (const EndpointError& ex) {
    EXPECT_EQ(ex.status(), http::StatusCodeNotFound);
    EXPECT_STREQ(ex.what(), "no such item");
  }
}

TEST(EndpointError, DefaultsTo500) {
  EndpointError error("boom");
  EXPECT_EQ(error.status(), http::StatusCodeInternalServerError);
}

}  // namespace junction
