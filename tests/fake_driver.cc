#include "fake_driver.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <thread>

using json = nlohmann::json;

namespace kite {
namespace testing {

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool HasClass(const FakeElement& element, const std::string& name) {
  auto it = element.attributes.find("class");
  if (it == element.attributes.end()) {
    return false;
  }
  std::istringstream classes(it->second);
  std::string token;
  while (classes >> token) {
    if (token == name) {
      return true;
    }
  }
  return false;
}

bool AttributeEquals(const FakeElement& element, const std::string& name,
                     const std::string& value) {
  auto it = element.attributes.find(name);
  return it != element.attributes.end() && it->second == value;
}

// One compound selector: tag, #id, .class and [attr="value"], each optional
const std::regex kSimpleSelector(
    "^([a-zA-Z][a-zA-Z0-9]*|\\*)?(?:#([A-Za-z0-9_-]+))?(?:\\.([A-Za-z0-9_-]+))?"
    "(?:\\[([A-Za-z_-]+)=\"([^\"]*)\"\\])?$");

std::string Trim(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

bool MatchesCss(const FakeElement& element, const std::smatch& m) {
  if (m[1].matched && m[1].str() != "*" && ToLower(m[1].str()) != ToLower(element.tag)) {
    return false;
  }
  if (m[2].matched && !AttributeEquals(element, "id", m[2].str())) {
    return false;
  }
  if (m[3].matched && !HasClass(element, m[3].str())) {
    return false;
  }
  if (m[4].matched && !AttributeEquals(element, m[4].str(), m[5].str())) {
    return false;
  }
  return true;
}

}  // namespace

FakeDriver::FakeDriver(std::shared_ptr<FakeDriverProbe> probe)
    : probe_(probe ? std::move(probe) : std::make_shared<FakeDriverProbe>()) {
  history_.push_back(url_);
}

// ============================================================
// Test setup
// ============================================================

std::string FakeDriver::AddElement(const std::string& tag,
                                   const std::map<std::string, std::string>& attributes,
                                   const std::string& text, const std::string& parent) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement element;
  element.ref = "ref-" + std::to_string(next_ref_++);
  element.tag = tag;
  element.attributes = attributes;
  element.text = text;
  element.parent = parent;
  element.present_at = Clock::now();
  element.visible_at = element.present_at;
  elements_.push_back(element);
  return elements_.back().ref;
}

FakeElement* FakeDriver::Element(const std::string& ref) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  for (auto& element : elements_) {
    if (element.ref == ref) {
      return &element;
    }
  }
  return nullptr;
}

void FakeDriver::SetPage(const std::string& url, const std::string& title,
                         const std::string& source) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  url_ = url;
  title_ = title;
  source_ = source;
}

void FakeDriver::SetReadyState(const std::string& state) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  ready_state_ = state;
}

void FakeDriver::SetScriptHandler(
    const std::string& script, std::function<DriverStatus(const json&, json&)> handler) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  script_handlers_[script] = std::move(handler);
}

void FakeDriver::FailOn(const std::string& operation, DriverError error,
                        const std::string& message) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  failures_[operation] = DriverStatus::Fail(
      error, message.empty() ? std::string(DriverErrorToString(error)) : message);
}

void FakeDriver::SetHonorImplicitWait(bool honor) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  honor_implicit_wait_ = honor;
}

void FakeDriver::ClearFailures() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  failures_.clear();
}

void FakeDriver::SetCallDelay(std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  delay_ = delay;
}

void FakeDriver::SetFrameCount(int count) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  frame_count_ = count;
}

void FakeDriver::OpenAlert(const std::string& text) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  has_alert_ = true;
  alert_text_ = text;
  prompt_text_.clear();
}

int FakeDriver::Calls(const std::string& operation) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto it = calls_.find(operation);
  return it == calls_.end() ? 0 : it->second;
}

bool FakeDriver::HasCookie(const std::string& name) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return cookies_.count(name) > 0;
}

// ============================================================
// Internals
// ============================================================

DriverStatus FakeDriver::Begin(const std::string& operation) {
  std::chrono::milliseconds delay;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    delay = delay_;
  }

  if (active_.fetch_add(1) + 1 > 1) {
    probe_->same_driver_overlap = true;
  }
  int now_active = probe_->active.fetch_add(1) + 1;
  int seen = probe_->max_active.load();
  while (now_active > seen && !probe_->max_active.compare_exchange_weak(seen, now_active)) {
  }

  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }

  probe_->active.fetch_sub(1);
  active_.fetch_sub(1);

  std::lock_guard<std::mutex> lock(state_mutex_);
  calls_[operation]++;
  if (quit_) {
    return DriverStatus::Fail(DriverError::INVALID_SESSION, "invalid session id");
  }
  auto it = failures_.find(operation);
  if (it != failures_.end()) {
    return it->second;
  }
  return DriverStatus::Ok();
}

DriverStatus FakeDriver::LookupLocked(const ElementRef& ref, FakeElement*& element) {
  for (auto& candidate : elements_) {
    if (candidate.ref == ref) {
      if (candidate.stale) {
        return DriverStatus::Fail(DriverError::STALE_ELEMENT, "stale element reference");
      }
      element = &candidate;
      return DriverStatus::Ok();
    }
  }
  return DriverStatus::Fail(DriverError::NO_SUCH_ELEMENT, "no such element: " + ref);
}

bool FakeDriver::IsDisplayedLocked(const FakeElement& element) const {
  const auto now = Clock::now();
  return element.displayed && now >= element.visible_at && now < element.hidden_at;
}

DriverStatus FakeDriver::MatchLocked(const Locator& locator, const std::string& parent,
                                     std::vector<ElementRef>& matches) {
  std::vector<std::smatch> selectors;
  std::vector<std::string> parts;  // owns the strings the smatch objects point into
  if (locator.strategy == LocatorStrategy::CSS_SELECTOR) {
    std::string part;
    std::istringstream stream(locator.value);
    while (std::getline(stream, part, ',')) {
      parts.push_back(Trim(part));
    }
    selectors.resize(parts.size());
    for (size_t i = 0; i < parts.size(); ++i) {
      if (parts[i].empty() || !std::regex_match(parts[i], selectors[i], kSimpleSelector)) {
        return DriverStatus::Fail(DriverError::INVALID_ARGUMENT,
                                  "invalid selector: " + locator.value);
      }
    }
  } else if (locator.strategy == LocatorStrategy::XPATH) {
    if (locator.value.empty() || (locator.value[0] != '/' && locator.value[0] != '(')) {
      return DriverStatus::Fail(DriverError::INVALID_ARGUMENT,
                                "invalid selector: " + locator.value);
    }
  }

  const auto now = Clock::now();
  matches.clear();
  for (const auto& element : elements_) {
    if (element.stale || now < element.present_at) {
      continue;
    }
    if (!parent.empty() && element.parent != parent) {
      continue;
    }

    bool hit = false;
    switch (locator.strategy) {
      case LocatorStrategy::ID:
        hit = AttributeEquals(element, "id", locator.value);
        break;
      case LocatorStrategy::NAME:
        hit = AttributeEquals(element, "name", locator.value);
        break;
      case LocatorStrategy::CLASS_NAME:
        hit = HasClass(element, locator.value);
        break;
      case LocatorStrategy::TAG_NAME:
        hit = ToLower(element.tag) == ToLower(locator.value);
        break;
      case LocatorStrategy::LINK_TEXT:
        hit = ToLower(element.tag) == "a" && element.text == locator.value;
        break;
      case LocatorStrategy::PARTIAL_LINK_TEXT:
        hit = ToLower(element.tag) == "a" && element.text.find(locator.value) != std::string::npos;
        break;
      case LocatorStrategy::XPATH:
        hit = AttributeEquals(element, "xpath", locator.value);
        break;
      case LocatorStrategy::CSS_SELECTOR:
        for (const auto& selector : selectors) {
          if (MatchesCss(element, selector)) {
            hit = true;
            break;
          }
        }
        break;
    }
    if (hit) {
      matches.push_back(element.ref);
    }
  }
  return DriverStatus::Ok();
}

// ============================================================
// KiteDriver
// ============================================================

DriverStatus FakeDriver::SetPageLoadTimeout(int seconds) {
  DriverStatus status = Begin("SetPageLoadTimeout");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  page_load_timeout_ = seconds;
  return status;
}

DriverStatus FakeDriver::SetImplicitWait(int seconds) {
  DriverStatus status = Begin("SetImplicitWait");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  implicit_wait_ = seconds;
  return status;
}

DriverStatus FakeDriver::Navigate(const std::string& url) {
  DriverStatus status = Begin("Navigate");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  url_ = url;
  history_.resize(history_index_ + 1);
  history_.push_back(url);
  history_index_ = history_.size() - 1;
  return status;
}

DriverStatus FakeDriver::GetCurrentUrl(std::string& url) {
  DriverStatus status = Begin("GetCurrentUrl");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  url = url_;
  return status;
}

DriverStatus FakeDriver::GetTitle(std::string& title) {
  DriverStatus status = Begin("GetTitle");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  title = title_;
  return status;
}

DriverStatus FakeDriver::GetPageSource(std::string& source) {
  DriverStatus status = Begin("GetPageSource");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  source = source_;
  return status;
}

DriverStatus FakeDriver::Back() {
  DriverStatus status = Begin("Back");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (history_index_ > 0) {
    --history_index_;
    url_ = history_[history_index_];
  }
  return status;
}

DriverStatus FakeDriver::Forward() {
  DriverStatus status = Begin("Forward");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (history_index_ + 1 < history_.size()) {
    ++history_index_;
    url_ = history_[history_index_];
  }
  return status;
}

DriverStatus FakeDriver::Refresh() {
  return Begin("Refresh");
}

DriverStatus FakeDriver::FindElement(const Locator& locator, ElementRef& element) {
  DriverStatus status = Begin("FindElement");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  std::vector<ElementRef> matches;
  status = MatchLocked(locator, "", matches);
  if (!status.ok()) {
    return status;
  }
  if (matches.empty()) {
    return DriverStatus::Fail(DriverError::NO_SUCH_ELEMENT,
                              "no such element: " + locator.Describe());
  }
  element = matches.front();
  return status;
}

DriverStatus FakeDriver::FindElements(const Locator& locator, std::vector<ElementRef>& elements) {
  DriverStatus status = Begin("FindElements");
  if (!status.ok()) {
    return status;
  }
  std::unique_lock<std::mutex> lock(state_mutex_);
  status = MatchLocked(locator, "", elements);
  if (status.ok() && elements.empty() && honor_implicit_wait_ && implicit_wait_ > 0) {
    // A W3C driver blocks for the implicit wait before reporting no matches
    auto blocked = std::chrono::seconds(implicit_wait_);
    lock.unlock();
    std::this_thread::sleep_for(blocked);
  }
  return status;
}

DriverStatus FakeDriver::FindChildElements(const ElementRef& parent, const Locator& locator,
                                           std::vector<ElementRef>& elements) {
  DriverStatus status = Begin("FindChildElements");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* owner = nullptr;
  status = LookupLocked(parent, owner);
  if (!status.ok()) {
    return status;
  }
  return MatchLocked(locator, parent, elements);
}

DriverStatus FakeDriver::Click(const ElementRef& element) {
  DriverStatus status = Begin("Click");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* target = nullptr;
  status = LookupLocked(element, target);
  if (!status.ok()) {
    return status;
  }
  if (!IsDisplayedLocked(*target) || !target->enabled) {
    return DriverStatus::Fail(DriverError::UNKNOWN, "element not interactable");
  }

  if (ToLower(target->tag) == "option") {
    FakeElement* select = nullptr;
    bool multiple = false;
    if (!target->parent.empty() && LookupLocked(target->parent, select).ok()) {
      multiple = select->attributes.count("multiple") > 0;
    }
    if (multiple) {
      target->selected = !target->selected;
    } else {
      for (auto& sibling : elements_) {
        if (sibling.parent == target->parent && ToLower(sibling.tag) == "option") {
          sibling.selected = false;
        }
      }
      target->selected = true;
    }
  }
  return status;
}

DriverStatus FakeDriver::Clear(const ElementRef& element) {
  DriverStatus status = Begin("Clear");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* target = nullptr;
  status = LookupLocked(element, target);
  if (!status.ok()) {
    return status;
  }
  target->attributes["value"] = "";
  return status;
}

DriverStatus FakeDriver::SendKeys(const ElementRef& element, const std::string& text) {
  DriverStatus status = Begin("SendKeys");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* target = nullptr;
  status = LookupLocked(element, target);
  if (!status.ok()) {
    return status;
  }
  if (!target->enabled) {
    return DriverStatus::Fail(DriverError::UNKNOWN, "element not interactable");
  }
  target->attributes["value"] += text;
  return status;
}

DriverStatus FakeDriver::GetAttribute(const ElementRef& element, const std::string& name,
                                      std::string& value, bool& present) {
  DriverStatus status = Begin("GetAttribute");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* target = nullptr;
  status = LookupLocked(element, target);
  if (!status.ok()) {
    return status;
  }
  auto it = target->attributes.find(name);
  present = it != target->attributes.end();
  value = present ? it->second : "";
  return status;
}

DriverStatus FakeDriver::GetText(const ElementRef& element, std::string& text) {
  DriverStatus status = Begin("GetText");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* target = nullptr;
  status = LookupLocked(element, target);
  if (!status.ok()) {
    return status;
  }
  text = Clock::now() >= target->later_text_at ? target->later_text : target->text;
  return status;
}

DriverStatus FakeDriver::GetTagName(const ElementRef& element, std::string& tag_name) {
  DriverStatus status = Begin("GetTagName");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* target = nullptr;
  status = LookupLocked(element, target);
  if (!status.ok()) {
    return status;
  }
  tag_name = target->tag;
  return status;
}

DriverStatus FakeDriver::IsDisplayed(const ElementRef& element, bool& displayed) {
  DriverStatus status = Begin("IsDisplayed");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* target = nullptr;
  status = LookupLocked(element, target);
  if (!status.ok()) {
    return status;
  }
  displayed = IsDisplayedLocked(*target);
  return status;
}

DriverStatus FakeDriver::IsEnabled(const ElementRef& element, bool& enabled) {
  DriverStatus status = Begin("IsEnabled");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* target = nullptr;
  status = LookupLocked(element, target);
  if (!status.ok()) {
    return status;
  }
  enabled = target->enabled;
  return status;
}

DriverStatus FakeDriver::IsSelected(const ElementRef& element, bool& selected) {
  DriverStatus status = Begin("IsSelected");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* target = nullptr;
  status = LookupLocked(element, target);
  if (!status.ok()) {
    return status;
  }
  selected = target->selected;
  return status;
}

DriverStatus FakeDriver::ExecuteScript(const std::string& script, const json& args,
                                       json& result) {
  DriverStatus status = Begin("ExecuteScript");
  if (!status.ok()) {
    return status;
  }

  std::function<DriverStatus(const json&, json&)> handler;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_script_args_ = args;
    auto it = script_handlers_.find(script);
    if (it != script_handlers_.end()) {
      handler = it->second;
    } else if (script == "return document.readyState") {
      result = ready_state_;
      return status;
    } else {
      result = nullptr;
      return status;
    }
  }
  // Handlers may call back into the driver's setup API
  return handler(args, result);
}

DriverStatus FakeDriver::TakeScreenshot(std::string& base64_png) {
  DriverStatus status = Begin("TakeScreenshot");
  if (status.ok()) {
    base64_png = kScreenshot;
  }
  return status;
}

DriverStatus FakeDriver::TakeElementScreenshot(const ElementRef& element,
                                               std::string& base64_png) {
  DriverStatus status = Begin("TakeElementScreenshot");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* target = nullptr;
  status = LookupLocked(element, target);
  if (status.ok()) {
    base64_png = kScreenshot;
  }
  return status;
}

DriverStatus FakeDriver::GetCookies(std::vector<CookieData>& cookies) {
  DriverStatus status = Begin("GetCookies");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  cookies.clear();
  for (const auto& entry : cookies_) {
    cookies.push_back(entry.second);
  }
  return status;
}

DriverStatus FakeDriver::GetCookie(const std::string& name, CookieData& cookie) {
  DriverStatus status = Begin("GetCookie");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto it = cookies_.find(name);
  if (it == cookies_.end()) {
    return DriverStatus::Fail(DriverError::NO_SUCH_COOKIE, name);
  }
  cookie = it->second;
  return status;
}

DriverStatus FakeDriver::AddCookie(const CookieData& cookie) {
  DriverStatus status = Begin("AddCookie");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  cookies_[cookie.name] = cookie;
  return status;
}

DriverStatus FakeDriver::DeleteCookie(const std::string& name) {
  DriverStatus status = Begin("DeleteCookie");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  cookies_.erase(name);
  return status;
}

DriverStatus FakeDriver::DeleteAllCookies() {
  DriverStatus status = Begin("DeleteAllCookies");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  cookies_.clear();
  return status;
}

DriverStatus FakeDriver::SwitchToFrameIndex(int index) {
  DriverStatus status = Begin("SwitchToFrameIndex");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (index < 0 || index >= frame_count_) {
    return DriverStatus::Fail(DriverError::NO_SUCH_FRAME, "no such frame: " + std::to_string(index));
  }
  ++frame_depth_;
  return status;
}

DriverStatus FakeDriver::SwitchToFrameElement(const ElementRef& frame) {
  DriverStatus status = Begin("SwitchToFrameElement");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  FakeElement* target = nullptr;
  status = LookupLocked(frame, target);
  if (!status.ok()) {
    return status;
  }
  const std::string tag = ToLower(target->tag);
  if (tag != "iframe" && tag != "frame") {
    return DriverStatus::Fail(DriverError::NO_SUCH_FRAME, "element is not a frame");
  }
  ++frame_depth_;
  return status;
}

DriverStatus FakeDriver::SwitchToDefaultContent() {
  DriverStatus status = Begin("SwitchToDefaultContent");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  frame_depth_ = 0;
  return status;
}

DriverStatus FakeDriver::SwitchToParentFrame() {
  DriverStatus status = Begin("SwitchToParentFrame");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (frame_depth_ > 0) {
    --frame_depth_;
  }
  return status;
}

DriverStatus FakeDriver::GetAlertText(std::string& text) {
  DriverStatus status = Begin("GetAlertText");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!has_alert_) {
    return DriverStatus::Fail(DriverError::NO_SUCH_ALERT, "no such alert");
  }
  text = alert_text_;
  return status;
}

DriverStatus FakeDriver::AcceptAlert() {
  DriverStatus status = Begin("AcceptAlert");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!has_alert_) {
    return DriverStatus::Fail(DriverError::NO_SUCH_ALERT, "no such alert");
  }
  has_alert_ = false;
  return status;
}

DriverStatus FakeDriver::DismissAlert() {
  DriverStatus status = Begin("DismissAlert");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!has_alert_) {
    return DriverStatus::Fail(DriverError::NO_SUCH_ALERT, "no such alert");
  }
  has_alert_ = false;
  return status;
}

DriverStatus FakeDriver::SendAlertText(const std::string& text) {
  DriverStatus status = Begin("SendAlertText");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!has_alert_) {
    return DriverStatus::Fail(DriverError::NO_SUCH_ALERT, "no such alert");
  }
  prompt_text_ = text;
  return status;
}

DriverStatus FakeDriver::Quit() {
  DriverStatus status = Begin("Quit");
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  quit_ = true;
  probe_->quit.fetch_add(1);
  return status;
}

// ============================================================
// FakeDriverFactory
// ============================================================

FakeDriverFactory::FakeDriverFactory() : probe_(std::make_shared<FakeDriverProbe>()) {}

std::unique_ptr<KiteDriver> FakeDriverFactory::Create(std::string& error) {
  if (fail_create) {
    error = "fake driver startup failure";
    return nullptr;
  }
  std::unique_ptr<FakeDriver> driver(new FakeDriver(probe_));
  probe_->created.fetch_add(1);
  if (on_create) {
    on_create(*driver);
  }
  return std::unique_ptr<KiteDriver>(driver.release());
}

}  // namespace testing
}  // namespace kite
