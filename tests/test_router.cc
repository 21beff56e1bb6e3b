#include <gtest/gtest.h>

#include <stdexcept>

#include "kite_router.h"

using namespace kite;
using json = nlohmann::json;

namespace {

HttpRequest Request(HttpMethod method, const std::string& path) {
  HttpRequest request;
  request.method = method;
  request.method_name = HttpMethodToString(method);
  request.path = path;
  return request;
}

RouteHandler Echo(const std::string& name) {
  return [name](const HttpRequest&, const RouteParams& params) {
    json body;
    body["route"] = name;
    for (const auto& p : params) {
      body["params"][p.first] = p.second;
    }
    return MakeJsonResponse(HTTP_200_OK, body);
  };
}

}  // namespace

TEST(UrlDecodeTest, DecodesPercentEscapes) {
  EXPECT_EQ(UrlDecode("a%20b"), "a b");
  EXPECT_EQ(UrlDecode("%2Fpath%2f"), "/path/");
  EXPECT_EQ(UrlDecode("caf%C3%A9"), "caf\xC3\xA9");
}

TEST(UrlDecodeTest, KeepsInvalidEscapesAndPlus) {
  EXPECT_EQ(UrlDecode("100%"), "100%");
  EXPECT_EQ(UrlDecode("%4"), "%4");
  EXPECT_EQ(UrlDecode("%zz"), "%zz");
  EXPECT_EQ(UrlDecode("a+b"), "a+b");
  EXPECT_EQ(UrlDecode("a+b", true), "a b");
}

TEST(SplitPathTest, DropsEmptySegments) {
  std::vector<std::string> expected = {"api", "session", "x"};
  EXPECT_EQ(SplitPath("/api/session/x"), expected);
  EXPECT_EQ(SplitPath("/api//session/x/"), expected);
  EXPECT_TRUE(SplitPath("/").empty());
  EXPECT_TRUE(SplitPath("").empty());
}

class RouterTest : public ::testing::Test {
protected:
  void SetUp() override {
    router.Add(HTTP_GET, "/api/status", Echo("status"));
    router.Add(HTTP_POST, "/api/session/create", Echo("create"));
    router.Add(HTTP_DELETE, "/api/session/{sessionId}", Echo("close"));
    router.Add(HTTP_GET, "/api/session/{sessionId}", Echo("info"));
    router.Add(HTTP_GET, "/api/session/list", Echo("list"));
    router.Add(HTTP_POST, "/api/element/click/{sessionId}/{elementId}", Echo("click"));
  }

  json Body(const HttpResponse& response) {
    return json::parse(response.body);
  }

  KiteRouter router;
};

TEST_F(RouterTest, MatchesLiteralRoute) {
  HttpResponse r = router.Dispatch(Request(HTTP_GET, "/api/status"));
  EXPECT_EQ(r.status, HTTP_200_OK);
  EXPECT_EQ(Body(r)["route"], "status");
  EXPECT_EQ(router.size(), 6u);
}

TEST_F(RouterTest, CapturesParameters) {
  HttpResponse r = router.Dispatch(Request(HTTP_POST, "/api/element/click/s-1/e%2F2"));
  json body = Body(r);
  EXPECT_EQ(body["route"], "click");
  EXPECT_EQ(body["params"]["sessionId"], "s-1");
  EXPECT_EQ(body["params"]["elementId"], "e/2");
}

TEST_F(RouterTest, LiteralSegmentsWinOverCaptures) {
  // Registered after the capture route, still preferred
  HttpResponse r = router.Dispatch(Request(HTTP_GET, "/api/session/list"));
  EXPECT_EQ(Body(r)["route"], "list");

  r = router.Dispatch(Request(HTTP_GET, "/api/session/abc"));
  EXPECT_EQ(Body(r)["route"], "info");
  EXPECT_EQ(Body(r)["params"]["sessionId"], "abc");
}

TEST_F(RouterTest, FirstRegisteredWinsOnTie) {
  router.Add(HTTP_GET, "/api/thing/{a}", Echo("first"));
  router.Add(HTTP_GET, "/api/thing/{b}", Echo("second"));
  HttpResponse r = router.Dispatch(Request(HTTP_GET, "/api/thing/x"));
  EXPECT_EQ(Body(r)["route"], "first");
}

TEST_F(RouterTest, UnknownPathIs404) {
  HttpResponse r = router.Dispatch(Request(HTTP_GET, "/api/nothing/here"));
  EXPECT_EQ(r.status, HTTP_404_NOT_FOUND);
  json body = Body(r);
  EXPECT_EQ(body["success"], false);
  EXPECT_EQ(body["status"], "not_found");
}

TEST_F(RouterTest, WrongMethodIs405WithAllow) {
  HttpResponse r = router.Dispatch(Request(HTTP_PUT, "/api/session/abc"));
  EXPECT_EQ(r.status, HTTP_405_METHOD_NOT_ALLOWED);
  EXPECT_EQ(Body(r)["status"], "method_not_allowed");
  EXPECT_EQ(r.headers["Allow"], "DELETE, GET");
}

TEST_F(RouterTest, MatchReportsAllowedMethods) {
  const RouteHandler* handler = nullptr;
  RouteParams params;
  std::vector<HttpMethod> allowed;
  KiteRouter::MatchResult result =
      router.Match(HTTP_GET, "/api/session/create", &handler, params, allowed);
  // GET /api/session/{sessionId} matches too
  EXPECT_EQ(result, KiteRouter::MatchResult::MATCHED);
  EXPECT_EQ(params["sessionId"], "create");

  result = router.Match(HTTP_POST, "/api/status", &handler, params, allowed);
  EXPECT_EQ(result, KiteRouter::MatchResult::METHOD_NOT_ALLOWED);
  ASSERT_EQ(allowed.size(), 1u);
  EXPECT_EQ(allowed[0], HTTP_GET);
}

TEST_F(RouterTest, HandlerExceptionBecomes500) {
  router.Add(HTTP_GET, "/api/boom", [](const HttpRequest&, const RouteParams&) -> HttpResponse {
    throw std::runtime_error("kaboom");
  });
  HttpResponse r = router.Dispatch(Request(HTTP_GET, "/api/boom"));
  EXPECT_EQ(r.status, HTTP_500_INTERNAL_ERROR);
  json body = Body(r);
  EXPECT_EQ(body["status"], "internal_error");
  EXPECT_NE(body["error"].get<std::string>().find("kaboom"), std::string::npos);
}
