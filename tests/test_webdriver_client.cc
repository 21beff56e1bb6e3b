#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <thread>

#include "kite_api_server.h"
#include "kite_router.h"
#include "kite_webdriver_client.h"

using namespace kite;
using json = nlohmann::json;

// ============================================================
// Protocol helpers
// ============================================================

TEST(WebDriverProtocolTest, ErrorStrings) {
  EXPECT_EQ(DriverErrorFromW3C("no such element"), DriverError::NO_SUCH_ELEMENT);
  EXPECT_EQ(DriverErrorFromW3C("stale element reference"), DriverError::STALE_ELEMENT);
  EXPECT_EQ(DriverErrorFromW3C("no such frame"), DriverError::NO_SUCH_FRAME);
  EXPECT_EQ(DriverErrorFromW3C("no such alert"), DriverError::NO_SUCH_ALERT);
  EXPECT_EQ(DriverErrorFromW3C("no such cookie"), DriverError::NO_SUCH_COOKIE);
  EXPECT_EQ(DriverErrorFromW3C("invalid argument"), DriverError::INVALID_ARGUMENT);
  EXPECT_EQ(DriverErrorFromW3C("invalid selector"), DriverError::INVALID_ARGUMENT);
  EXPECT_EQ(DriverErrorFromW3C("timeout"), DriverError::TIMEOUT);
  EXPECT_EQ(DriverErrorFromW3C("script timeout"), DriverError::TIMEOUT);
  EXPECT_EQ(DriverErrorFromW3C("invalid session id"), DriverError::INVALID_SESSION);
  EXPECT_EQ(DriverErrorFromW3C("javascript error"), DriverError::JAVASCRIPT_ERROR);
  EXPECT_EQ(DriverErrorFromW3C("element not interactable"), DriverError::UNKNOWN);
}

TEST(WebDriverProtocolTest, CssEscapeIdentifier) {
  EXPECT_EQ(CssEscapeIdentifier("login"), "login");
  EXPECT_EQ(CssEscapeIdentifier("user_name-2"), "user_name-2");
  EXPECT_EQ(CssEscapeIdentifier("a.b"), "a\\.b");
  EXPECT_EQ(CssEscapeIdentifier("x:y"), "x\\:y");
  EXPECT_EQ(CssEscapeIdentifier("1st"), "\\31 st");
  EXPECT_EQ(CssEscapeIdentifier("-2"), "-\\32 ");
  EXPECT_EQ(CssEscapeIdentifier("-"), "\\-");
}

TEST(WebDriverProtocolTest, LocatorTranslation) {
  std::string using_strategy, value;

  ToWebDriverLocator(Locator(LocatorStrategy::ID, "main.nav"), using_strategy, value);
  EXPECT_EQ(using_strategy, "css selector");
  EXPECT_EQ(value, "#main\\.nav");

  ToWebDriverLocator(Locator(LocatorStrategy::NAME, "q\"x"), using_strategy, value);
  EXPECT_EQ(using_strategy, "css selector");
  EXPECT_EQ(value, "*[name=\"q\\\"x\"]");

  ToWebDriverLocator(Locator(LocatorStrategy::CLASS_NAME, "btn"), using_strategy, value);
  EXPECT_EQ(value, ".btn");

  ToWebDriverLocator(Locator(LocatorStrategy::TAG_NAME, "input"), using_strategy, value);
  EXPECT_EQ(using_strategy, "tag name");
  EXPECT_EQ(value, "input");

  ToWebDriverLocator(Locator(LocatorStrategy::LINK_TEXT, "Home"), using_strategy, value);
  EXPECT_EQ(using_strategy, "link text");

  ToWebDriverLocator(Locator(LocatorStrategy::PARTIAL_LINK_TEXT, "Ho"), using_strategy, value);
  EXPECT_EQ(using_strategy, "partial link text");

  ToWebDriverLocator(Locator(LocatorStrategy::XPATH, "//div[@id='x']"), using_strategy, value);
  EXPECT_EQ(using_strategy, "xpath");
  EXPECT_EQ(value, "//div[@id='x']");

  ToWebDriverLocator(Locator(LocatorStrategy::CSS_SELECTOR, "div > p"), using_strategy, value);
  EXPECT_EQ(using_strategy, "css selector");
  EXPECT_EQ(value, "div > p");
}

TEST(WebDriverProtocolTest, EncodePathSegment) {
  EXPECT_EQ(EncodePathSegment("abc-1.2_~"), "abc-1.2_~");
  EXPECT_EQ(EncodePathSegment("a b/c"), "a%20b%2Fc");
  EXPECT_EQ(EncodePathSegment("data-role?"), "data-role%3F");
}

TEST(WebDriverProtocolTest, NewSessionRequest) {
  KiteWebDriverClientFactory factory("http://127.0.0.1:9515/", {"--headless=new", "--no-sandbox"},
                                     "/opt/chrome/chrome", 30);
  json request = factory.BuildNewSessionRequest();
  const json& always = request["capabilities"]["alwaysMatch"];
  EXPECT_EQ(always["browserName"], "chrome");
  EXPECT_EQ(always["goog:chromeOptions"]["args"], json({"--headless=new", "--no-sandbox"}));
  EXPECT_EQ(always["goog:chromeOptions"]["binary"], "/opt/chrome/chrome");

  KiteWebDriverClientFactory plain("http://127.0.0.1:9515", {}, "", 30);
  EXPECT_FALSE(plain.BuildNewSessionRequest()["capabilities"]["alwaysMatch"]
                   ["goog:chromeOptions"].contains("binary"));
}

TEST(WebDriverProtocolTest, UnreachableEndpoint) {
  KiteWebDriverClientFactory factory("http://127.0.0.1:1", {}, "", 2);
  std::string error;
  std::unique_ptr<KiteDriver> driver = factory.Create(error);
  EXPECT_EQ(driver, nullptr);
  EXPECT_EQ(error.find("Failed to create WebDriver session"), 0u);
}

// ============================================================
// Against a scripted WebDriver endpoint
// ============================================================

namespace {

HttpResponse W3CValue(const json& value) {
  json body;
  body["value"] = value;
  return MakeJsonResponse(HTTP_200_OK, body);
}

HttpResponse W3CError(HttpStatus status, const std::string& error, const std::string& message) {
  json body;
  body["value"]["error"] = error;
  body["value"]["message"] = message;
  body["value"]["stacktrace"] = "";
  return MakeJsonResponse(status, body);
}

json ElementValue(const std::string& ref) {
  json element = json::object();
  element[kWebElementKey] = ref;
  return element;
}

}  // namespace

class WebDriverClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    pool_.reset(new ThreadPool(4));
    RegisterEndpoints();
    server_.reset(new KiteApiServer(
        [this](const HttpRequest& request) { return router_.Dispatch(request); }, *pool_));
    ApiServerOptions options;
    options.port = 0;
    ASSERT_TRUE(server_->Start(options));
    base_url_ = "http://127.0.0.1:" + std::to_string(server_->GetPort());

    factory_.reset(new KiteWebDriverClientFactory(base_url_, {"--headless=new"}, "", 1));
    std::string error;
    std::unique_ptr<KiteDriver> driver = factory_->Create(error);
    ASSERT_NE(driver, nullptr) << error;
    driver_.reset(static_cast<KiteWebDriverClient*>(driver.release()));
  }

  void TearDown() override {
    driver_.reset();
    server_->Stop();
    pool_->Shutdown();
  }

  json LastBody(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return bodies_[key];
  }

  void Record(const std::string& key, const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    bodies_[key] = json::parse(request.body, nullptr, false);
  }

  void RegisterEndpoints() {
    router_.Add(HTTP_POST, "/session", [this](const HttpRequest& req, const RouteParams&) {
      Record("new", req);
      json value;
      value["sessionId"] = "wd-1";
      value["capabilities"]["browserName"] = "chrome";
      return W3CValue(value);
    });

    router_.Add(HTTP_DELETE, "/session/{sid}", [this](const HttpRequest&, const RouteParams& p) {
      std::lock_guard<std::mutex> lock(mutex_);
      deleted_.push_back(p.at("sid"));
      return W3CValue(nullptr);
    });

    router_.Add(HTTP_POST, "/session/{sid}/timeouts",
                [this](const HttpRequest& req, const RouteParams&) {
      Record("timeouts", req);
      return W3CValue(nullptr);
    });

    router_.Add(HTTP_POST, "/session/{sid}/url", [this](const HttpRequest& req, const RouteParams&) {
      Record("url", req);
      std::lock_guard<std::mutex> lock(mutex_);
      url_ = json::parse(req.body)["url"].get<std::string>();
      return W3CValue(nullptr);
    });

    router_.Add(HTTP_GET, "/session/{sid}/url", [this](const HttpRequest&, const RouteParams&) {
      std::lock_guard<std::mutex> lock(mutex_);
      return W3CValue(url_);
    });

    router_.Add(HTTP_GET, "/session/{sid}/title", [](const HttpRequest&, const RouteParams&) {
      return W3CValue("Example Domain");
    });

    router_.Add(HTTP_GET, "/session/{sid}/source", [](const HttpRequest&, const RouteParams&) {
      HttpResponse response;
      response.content_type = "text/html";
      response.body = "<html>not the protocol</html>";
      return response;
    });

    router_.Add(HTTP_POST, "/session/{sid}/refresh", [](const HttpRequest&, const RouteParams&) {
      std::this_thread::sleep_for(std::chrono::milliseconds(2500));
      return W3CValue(nullptr);
    });

    router_.Add(HTTP_POST, "/session/{sid}/element",
                [this](const HttpRequest& req, const RouteParams&) {
      Record("element", req);
      json body = json::parse(req.body);
      if (body["value"] == "#q") {
        return W3CValue(ElementValue("el-1"));
      }
      if (body["value"] == "[[") {
        return W3CError(HTTP_400_BAD_REQUEST, "invalid selector", "bad selector");
      }
      return W3CError(HTTP_404_NOT_FOUND, "no such element", "Unable to locate element");
    });

    router_.Add(HTTP_POST, "/session/{sid}/elements", [](const HttpRequest&, const RouteParams&) {
      return W3CValue(json::array({ElementValue("el-1"), ElementValue("el-2")}));
    });

    router_.Add(HTTP_POST, "/session/{sid}/element/{eid}/elements",
                [](const HttpRequest&, const RouteParams& p) {
      return W3CValue(json::array({ElementValue(p.at("eid") + "-child")}));
    });

    router_.Add(HTTP_POST, "/session/{sid}/element/{eid}/value",
                [this](const HttpRequest& req, const RouteParams&) {
      Record("value", req);
      return W3CValue(nullptr);
    });

    router_.Add(HTTP_POST, "/session/{sid}/element/{eid}/click",
                [](const HttpRequest&, const RouteParams& p) {
      if (p.at("eid") == "gone") {
        return W3CError(HTTP_404_NOT_FOUND, "stale element reference", "element is not attached");
      }
      return W3CValue(nullptr);
    });

    router_.Add(HTTP_GET, "/session/{sid}/element/{eid}/attribute/{name}",
                [](const HttpRequest&, const RouteParams& p) {
      if (p.at("name") == "missing") {
        return W3CValue(nullptr);
      }
      if (p.at("name") == "tabindex") {
        return W3CValue(3);
      }
      return W3CValue("value of " + p.at("name"));
    });

    router_.Add(HTTP_GET, "/session/{sid}/element/{eid}/text",
                [](const HttpRequest&, const RouteParams&) { return W3CValue(5); });

    router_.Add(HTTP_GET, "/session/{sid}/element/{eid}/displayed",
                [](const HttpRequest&, const RouteParams&) { return W3CValue(true); });

    router_.Add(HTTP_POST, "/session/{sid}/execute/sync",
                [this](const HttpRequest& req, const RouteParams&) {
      Record("script", req);
      json body = json::parse(req.body);
      if (body["script"] == "throw") {
        return W3CError(HTTP_500_INTERNAL_ERROR, "javascript error", "Error: boom");
      }
      return W3CValue(body["args"]);
    });

    router_.Add(HTTP_GET, "/session/{sid}/cookie", [](const HttpRequest&, const RouteParams&) {
      json cookie = {{"name", "sid"},     {"value", "abc"},   {"domain", ".example.com"},
                     {"path", "/"},       {"secure", true},   {"httpOnly", false},
                     {"expiry", 1700000000.0}, {"sameSite", "Lax"}};
      return W3CValue(json::array({cookie, json("junk")}));
    });

    router_.Add(HTTP_GET, "/session/{sid}/cookie/{name}",
                [](const HttpRequest&, const RouteParams& p) {
      return W3CError(HTTP_404_NOT_FOUND, "no such cookie", "No cookie named " + p.at("name"));
    });

    router_.Add(HTTP_POST, "/session/{sid}/cookie",
                [this](const HttpRequest& req, const RouteParams&) {
      Record("cookie", req);
      return W3CValue(nullptr);
    });

    router_.Add(HTTP_POST, "/session/{sid}/frame",
                [this](const HttpRequest& req, const RouteParams&) {
      Record("frame", req);
      return W3CValue(nullptr);
    });

    router_.Add(HTTP_GET, "/session/{sid}/alert/text",
                [](const HttpRequest&, const RouteParams&) {
      return W3CError(HTTP_404_NOT_FOUND, "no such alert", "no such alert");
    });
  }

  KiteRouter router_;
  std::unique_ptr<ThreadPool> pool_;
  std::unique_ptr<KiteApiServer> server_;
  std::string base_url_;
  std::unique_ptr<KiteWebDriverClientFactory> factory_;
  std::unique_ptr<KiteWebDriverClient> driver_;

  std::mutex mutex_;
  std::map<std::string, json> bodies_;
  std::vector<std::string> deleted_;
  std::string url_ = "about:blank";
};

TEST_F(WebDriverClientTest, CreateOpensSession) {
  EXPECT_EQ(driver_->webdriver_session_id(), "wd-1");
  json request = LastBody("new");
  EXPECT_EQ(request["capabilities"]["alwaysMatch"]["browserName"], "chrome");
}

TEST_F(WebDriverClientTest, TimeoutsInMilliseconds) {
  ASSERT_TRUE(driver_->SetPageLoadTimeout(30).ok());
  EXPECT_EQ(LastBody("timeouts"), json({{"pageLoad", 30000}}));
  ASSERT_TRUE(driver_->SetImplicitWait(2).ok());
  EXPECT_EQ(LastBody("timeouts"), json({{"implicit", 2000}}));
}

TEST_F(WebDriverClientTest, NavigationRoundTrip) {
  ASSERT_TRUE(driver_->Navigate("https://example.com/").ok());
  std::string url, title;
  ASSERT_TRUE(driver_->GetCurrentUrl(url).ok());
  EXPECT_EQ(url, "https://example.com/");
  ASSERT_TRUE(driver_->GetTitle(title).ok());
  EXPECT_EQ(title, "Example Domain");
}

TEST_F(WebDriverClientTest, NonProtocolResponseIsError) {
  std::string source;
  DriverStatus status = driver_->GetPageSource(source);
  EXPECT_EQ(status.error, DriverError::UNKNOWN);
  EXPECT_NE(status.message.find("Invalid WebDriver response"), std::string::npos);
}

TEST_F(WebDriverClientTest, CommandTimeout) {
  auto start = std::chrono::steady_clock::now();
  DriverStatus status = driver_->Refresh();
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(status.error, DriverError::TIMEOUT);
  EXPECT_LT(elapsed, std::chrono::milliseconds(2400));
}

TEST_F(WebDriverClientTest, FindElementTranslatesLocator) {
  ElementRef element;
  ASSERT_TRUE(driver_->FindElement(Locator(LocatorStrategy::ID, "q"), element).ok());
  EXPECT_EQ(element, "el-1");
  json body = LastBody("element");
  EXPECT_EQ(body["using"], "css selector");
  EXPECT_EQ(body["value"], "#q");
}

TEST_F(WebDriverClientTest, FindElementErrors) {
  ElementRef element;
  DriverStatus missing = driver_->FindElement(Locator(LocatorStrategy::ID, "nope"), element);
  EXPECT_EQ(missing.error, DriverError::NO_SUCH_ELEMENT);
  EXPECT_EQ(missing.message, "Unable to locate element");

  DriverStatus invalid =
      driver_->FindElement(Locator(LocatorStrategy::CSS_SELECTOR, "[["), element);
  EXPECT_EQ(invalid.error, DriverError::INVALID_ARGUMENT);
}

TEST_F(WebDriverClientTest, FindElementLists) {
  std::vector<ElementRef> elements;
  ASSERT_TRUE(driver_->FindElements(Locator(LocatorStrategy::TAG_NAME, "li"), elements).ok());
  EXPECT_EQ(elements, (std::vector<ElementRef>{"el-1", "el-2"}));

  ASSERT_TRUE(driver_->FindChildElements("el-1", Locator(LocatorStrategy::TAG_NAME, "option"),
                                         elements).ok());
  EXPECT_EQ(elements, (std::vector<ElementRef>{"el-1-child"}));
}

TEST_F(WebDriverClientTest, ElementCommands) {
  ASSERT_TRUE(driver_->SendKeys("el-1", "hello").ok());
  EXPECT_EQ(LastBody("value"), json({{"text", "hello"}}));

  DriverStatus stale = driver_->Click("gone");
  EXPECT_EQ(stale.error, DriverError::STALE_ELEMENT);

  bool displayed = false;
  ASSERT_TRUE(driver_->IsDisplayed("el-1", displayed).ok());
  EXPECT_TRUE(displayed);
}

TEST_F(WebDriverClientTest, AttributeValues) {
  std::string value;
  bool present = false;
  ASSERT_TRUE(driver_->GetAttribute("el-1", "href", value, present).ok());
  EXPECT_TRUE(present);
  EXPECT_EQ(value, "value of href");

  ASSERT_TRUE(driver_->GetAttribute("el-1", "missing", value, present).ok());
  EXPECT_FALSE(present);
  EXPECT_TRUE(value.empty());

  ASSERT_TRUE(driver_->GetAttribute("el-1", "tabindex", value, present).ok());
  EXPECT_EQ(value, "3");
}

TEST_F(WebDriverClientTest, UnexpectedValueType) {
  std::string text;
  DriverStatus status = driver_->GetText("el-1", text);
  EXPECT_EQ(status.error, DriverError::UNKNOWN);
  EXPECT_NE(status.message.find("Unexpected WebDriver response"), std::string::npos);
}

TEST_F(WebDriverClientTest, ExecuteScriptPassesArguments) {
  json result;
  ASSERT_TRUE(driver_->ExecuteScript("return arguments", json::array({1, "two"}), result).ok());
  EXPECT_EQ(result, json::array({1, "two"}));

  ASSERT_TRUE(driver_->ExecuteScript("return 1", json(), result).ok());
  EXPECT_EQ(LastBody("script")["args"], json::array());

  DriverStatus failed = driver_->ExecuteScript("throw", json::array(), result);
  EXPECT_EQ(failed.error, DriverError::JAVASCRIPT_ERROR);
  EXPECT_EQ(failed.message, "Error: boom");
}

TEST_F(WebDriverClientTest, Cookies) {
  std::vector<CookieData> cookies;
  ASSERT_TRUE(driver_->GetCookies(cookies).ok());
  ASSERT_EQ(cookies.size(), 1u);
  EXPECT_EQ(cookies[0].name, "sid");
  EXPECT_EQ(cookies[0].domain, ".example.com");
  EXPECT_TRUE(cookies[0].secure);
  EXPECT_TRUE(cookies[0].has_expiry);
  EXPECT_EQ(cookies[0].expiry, 1700000000);
  EXPECT_EQ(cookies[0].same_site, "Lax");

  CookieData cookie;
  EXPECT_EQ(driver_->GetCookie("absent", cookie).error, DriverError::NO_SUCH_COOKIE);

  CookieData added;
  added.name = "theme";
  added.value = "dark";
  added.has_expiry = true;
  added.expiry = 1800000000;
  ASSERT_TRUE(driver_->AddCookie(added).ok());
  json sent = LastBody("cookie")["cookie"];
  EXPECT_EQ(sent["name"], "theme");
  EXPECT_EQ(sent["expiry"], 1800000000);
  EXPECT_FALSE(sent.contains("domain"));
  EXPECT_FALSE(sent.contains("sameSite"));
}

TEST_F(WebDriverClientTest, FrameSwitching) {
  ASSERT_TRUE(driver_->SwitchToFrameIndex(2).ok());
  EXPECT_EQ(LastBody("frame"), json({{"id", 2}}));

  ASSERT_TRUE(driver_->SwitchToFrameElement("el-9").ok());
  EXPECT_EQ(LastBody("frame")["id"][kWebElementKey], "el-9");

  ASSERT_TRUE(driver_->SwitchToDefaultContent().ok());
  EXPECT_TRUE(LastBody("frame")["id"].is_null());
}

TEST_F(WebDriverClientTest, MissingAlert) {
  std::string text;
  EXPECT_EQ(driver_->GetAlertText(text).error, DriverError::NO_SUCH_ALERT);
}

TEST_F(WebDriverClientTest, QuitEndsSessionOnce) {
  ASSERT_TRUE(driver_->Quit().ok());
  ASSERT_TRUE(driver_->Quit().ok());
  driver_.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(deleted_, std::vector<std::string>{"wd-1"});
}

TEST_F(WebDriverClientTest, DestructorEndsSession) {
  driver_.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(deleted_, std::vector<std::string>{"wd-1"});
}

TEST_F(WebDriverClientTest, UnknownEndpointIsError) {
  std::string png;
  // No screenshot route: the router answers 404 without a W3C error object
  DriverStatus status = driver_->TakeScreenshot(png);
  EXPECT_FALSE(status.ok());
}
