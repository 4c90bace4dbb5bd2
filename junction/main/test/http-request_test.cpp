#include "junction/http-request.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "junction/http-header.hpp"
#include "junction/http-method.hpp"
#include "junction/path-param-capture.hpp"
#include "junction/request-body.hpp"
#include "junction/vector.hpp"

namespace junction {

namespace {

struct Counter {
  int value{};
};

}  // namespace

class HttpRequestTest : public ::testing::Test {
 protected:
  HttpRequest req{http::Method::GET, "/users/42/posts/abc?sort=asc&limit=10",
                  http::HeaderMap{{"Host", "example.com"}, {"Accept", "*/*"}}, RequestBody("payload")};

  void bindParams() {
    const std::string_view path = req.path();
    vector<PathParamCapture> params;
    params.push_back(PathParamCapture{"userId", path.substr(7, 2)});
    params.push_back(PathParamCapture{"slug", path.substr(16, 3)});
    req.setRouteMatch(std::move(params), {});
  }
};

TEST_F(HttpRequestTest, SplitsPathAndQuery) {
  EXPECT_EQ(req.method(), http::Method::GET);
  EXPECT_EQ(req.methodToken(), "GET");
  EXPECT_EQ(req.path(), "/users/42/posts/abc");
  EXPECT_EQ(req.query(), "sort=asc&limit=10");
  EXPECT_TRUE(req.remainder().empty());
}

TEST_F(HttpRequestTest, MethodTokenAsReceived) {
  HttpRequest standard(std::string("DELETE"), "/x", {}, RequestBody());
  EXPECT_EQ(standard.method(), http::Method::DELETE);
  EXPECT_EQ(standard.methodToken(), "DELETE");

  HttpRequest extension(std::string("PROPFIND"), "/x", {}, RequestBody());
  EXPECT_FALSE(extension.method());
  EXPECT_EQ(extension.methodToken(), "PROPFIND");

  HttpRequest lowerCase(std::string("get"), "/x", {}, RequestBody());
  EXPECT_FALSE(lowerCase.method());
  EXPECT_EQ(lowerCase.methodToken(), "get");
}

TEST_F(HttpRequestTest, NoQuery) {
  HttpRequest other(http::Method::POST, "/a/b", {}, RequestBody());
  EXPECT_EQ(other.path(), "/a/b");
  EXPECT_TRUE(other.query().empty());

  HttpRequest emptyQuery(http::Method::POST, "/a?", {}, RequestBody());
  EXPECT_EQ(emptyQuery.path(), "/a");
  EXPECT_TRUE(emptyQuery.query().empty());
}

TEST_F(HttpRequestTest, HeadersAreCaseInsensitive) {
  EXPECT_EQ(req.headerValue("host").value_or(""), "example.com");
  EXPECT_EQ(req.headers().size(), 2U);
  EXPECT_FALSE(req.headerValue("Content-Type"));
}

TEST_F(HttpRequestTest, ParamsBeforeMatchAreEmpty) {
  EXPECT_TRUE(req.params().empty());
  EXPECT_FALSE(req.param("userId"));
  EXPECT_FALSE(req.paramAt(0));
}

TEST_F(HttpRequestTest, ParamsByNameAndPosition) {
  bindParams();
  ASSERT_EQ(req.params().size(), 2U);
  EXPECT_EQ(req.param("userId").value_or(""), "42");
  EXPECT_EQ(req.param("slug").value_or(""), "abc");
  EXPECT_FALSE(req.param("missing"));
  EXPECT_EQ(req.paramAt(0).value_or(""), "42");
  EXPECT_EQ(req.paramAt(1).value_or(""), "abc");
  EXPECT_FALSE(req.paramAt(2));
}

TEST_F(HttpRequestTest, TypedParams) {
  bindParams();
  EXPECT_EQ(req.param<int>("userId"), 42);
  EXPECT_EQ(req.param<std::uint8_t>("userId"), std::uint8_t{42});
  EXPECT_FALSE(req.param<int>("slug"));
  EXPECT_FALSE(req.param<int>("missing"));
}

TEST_F(HttpRequestTest, TypedParamsRejectPartialAndOverflow) {
  HttpRequest other(http::Method::GET, "/n/12x/300/-5", {}, RequestBody());
  const std::string_view path = other.path();
  vector<PathParamCapture> params;
  params.push_back(PathParamCapture{"partial", path.substr(3, 3)});
  params.push_back(PathParamCapture{"big", path.substr(7, 3)});
  params.push_back(PathParamCapture{"neg", path.substr(11, 2)});
  other.setRouteMatch(std::move(params), {});

  EXPECT_FALSE(other.param<int>("partial"));
  EXPECT_FALSE(other.param<std::uint8_t>("big"));
  EXPECT_EQ(other.param<std::int16_t>("big"), std::int16_t{300});
  EXPECT_EQ(other.param<int>("neg"), -5);
  EXPECT_FALSE(other.param<unsigned>("neg"));
}

TEST_F(HttpRequestTest, Remainder) {
  HttpRequest other(http::Method::GET, "/static/css/site.css", {}, RequestBody());
  other.setRouteMatch({}, other.path().substr(8));
  EXPECT_EQ(other.remainder(), "css/site.css");
}

TEST_F(HttpRequestTest, BodyIsSingleConsumer) {
  EXPECT_FALSE(req.body().consumed());
  EXPECT_EQ(req.body().text().await_resume(), "payload");
  EXPECT_TRUE(req.body().consumed());
  EXPECT_THROW((void)req.body().text(), std::logic_error);
}

TEST(Request, SharesState) {
  auto state = std::make_shared<Counter>();
  Request<Counter> first(http::Method::GET, "/", {}, RequestBody(), state);
  Request<Counter> second(http::Method::GET, "/", {}, RequestBody(), state);
  ++first.state().value;
  ++second.state().value;
  EXPECT_EQ(state->value, 2);
  EXPECT_EQ(first.sharedState().get(), second.sharedState().get());
  EXPECT_EQ(state.use_count(), 3);
}

}  // namespace junction
