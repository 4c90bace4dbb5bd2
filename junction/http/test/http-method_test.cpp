#include "junction/http-method.hpp"

#include <gtest/gtest.h>

#include <optional>

namespace junction::http {

TEST(HttpMethod, ParseKnownTokens) {
  EXPECT_EQ(MethodStrToOptEnum("GET"), Method::GET);
  EXPECT_EQ(MethodStrToOptEnum("PUT"), Method::PUT);
  EXPECT_EQ(MethodStrToOptEnum("HEAD"), Method::HEAD);
  EXPECT_EQ(MethodStrToOptEnum("POST"), Method::POST);
  EXPECT_EQ(MethodStrToOptEnum("TRACE"), Method::TRACE);
  EXPECT_EQ(MethodStrToOptEnum("PATCH"), Method::PATCH);
  EXPECT_EQ(MethodStrToOptEnum("DELETE"), Method::DELETE);
  EXPECT_EQ(MethodStrToOptEnum("CONNECT"), Method::CONNECT);
  EXPECT_EQ(MethodStrToOptEnum("OPTIONS"), Method::OPTIONS);
}

TEST(HttpMethod, MethodTokensAreCaseSensitive) {
  EXPECT_EQ(MethodStrToOptEnum("get"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("Put"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("post"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("deletE"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("options"), std::nullopt);
}

TEST(HttpMethod, ParseUnknownTokens) {
  EXPECT_EQ(MethodStrToOptEnum(""), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("GOT"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("PURGE"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("HEADER"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("PROPFIND"), std::nullopt);
}

TEST(HttpMethod, ValidMethodTokens) {
  EXPECT_TRUE(IsValidMethodToken("GET"));
  EXPECT_TRUE(IsValidMethodToken("get"));
  EXPECT_TRUE(IsValidMethodToken("PROPFIND"));
  EXPECT_TRUE(IsValidMethodToken("M-SEARCH"));
  EXPECT_TRUE(IsValidMethodToken("X_CUSTOM.1"));

  EXPECT_FALSE(IsValidMethodToken(""));
  EXPECT_FALSE(IsValidMethodToken("G ET"));
  EXPECT_FALSE(IsValidMethodToken("GET\r"));
  EXPECT_FALSE(IsValidMethodToken("GET/1"));
  EXPECT_FALSE(IsValidMethodToken("(GET)"));
  EXPECT_FALSE(IsValidMethodToken("G\xC3\xA9T"));
}

TEST(HttpMethod, IdxRoundTrip) {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    const Method method = MethodFromIdx(methodIdx);
    EXPECT_EQ(MethodToIdx(method), methodIdx);
    EXPECT_EQ(MethodStrToOptEnum(MethodToStr(method)), method);
  }
}

TEST(HttpMethod, BmpToStrFollowsDeclarationOrder) {
  EXPECT_EQ(MethodBmpToStr(Method::POST | Method::GET), "GET, POST");
  EXPECT_EQ(MethodBmpToStr(Method::DELETE | Method::PUT | Method::GET, ","), "GET,PUT,DELETE");
  EXPECT_EQ(MethodBmpToStr(0), "");
  EXPECT_EQ(MethodBmpToStr(kAllMethods), "GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH");
}

TEST(HttpMethod, IsMethodSet) {
  const MethodBmp bmp = Method::GET | Method::PATCH;
  EXPECT_TRUE(IsMethodSet(bmp, Method::GET));
  EXPECT_TRUE(IsMethodSet(bmp, Method::PATCH));
  EXPECT_FALSE(IsMethodSet(bmp, Method::HEAD));
}

}  // namespace junction::http
