#include "kite_session_registry.h"
#include "kite_ids.h"
#include "logger.h"

namespace kite {

// ============================================================
// SessionCommand
// ============================================================

SessionCommand::SessionCommand(std::shared_ptr<KiteSession> session,
                               std::unique_lock<std::mutex> lock)
    : session_(std::move(session)), lock_(std::move(lock)) {}

SessionCommand::~SessionCommand() {
  Release();
}

SessionCommand::SessionCommand(SessionCommand&& other) noexcept
    : session_(std::move(other.session_)), lock_(std::move(other.lock_)) {}

SessionCommand& SessionCommand::operator=(SessionCommand&& other) noexcept {
  if (this != &other) {
    Release();
    session_ = std::move(other.session_);
    lock_ = std::move(other.lock_);
  }
  return *this;
}

void SessionCommand::Release() {
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
  session_.reset();
}

// ============================================================
// KiteSessionRegistry
// ============================================================

KiteSessionRegistry::KiteSessionRegistry(std::unique_ptr<KiteDriverFactory> factory,
                                         KiteElementRegistry& elements,
                                         int default_implicit_wait_s,
                                         int default_page_load_timeout_s)
    : factory_(std::move(factory)),
      elements_(elements),
      default_implicit_wait_s_(default_implicit_wait_s),
      default_page_load_timeout_s_(default_page_load_timeout_s) {}

KiteSessionRegistry::~KiteSessionRegistry() {
  size_t closed = CloseAll();
  if (closed > 0) {
    LOG_INFO("SessionRegistry", "Closed " + std::to_string(closed) + " session(s) on shutdown");
  }
}

ActionResult KiteSessionRegistry::Create(std::string& session_id) {
  std::string error;
  std::unique_ptr<KiteDriver> driver = factory_->Create(error);
  if (!driver) {
    LOG_ERROR("SessionRegistry", "Driver startup failed: " + error);
    return ActionResult::Failure(ActionStatus::DRIVER_STARTUP_FAILED,
                                 "Failed to start browser driver: " + error);
  }

  DriverStatus status = driver->SetImplicitWait(default_implicit_wait_s_);
  if (status.ok()) {
    status = driver->SetPageLoadTimeout(default_page_load_timeout_s_);
  }
  if (!status.ok()) {
    DriverStatus quit = driver->Quit();
    if (!quit.ok()) {
      LOG_WARN("SessionRegistry", "Quit after failed setup also failed: " + quit.message);
    }
    LOG_ERROR("SessionRegistry", "Driver setup failed: " + status.message);
    return ActionResult::Failure(ActionStatus::DRIVER_STARTUP_FAILED,
                                 "Failed to configure browser driver: " + status.message);
  }

  auto session = std::make_shared<KiteSession>();
  session->id = GenerateId();
  session->driver = std::move(driver);
  session->implicit_wait_seconds.store(default_implicit_wait_s_, std::memory_order_relaxed);

  {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    sessions_[session->id] = session;
  }

  session_id = session->id;
  LOG_INFO("SessionRegistry", "Created session " + session_id);
  return ActionResult::Success("Session created");
}

std::shared_ptr<KiteSession> KiteSessionRegistry::Get(const std::string& session_id) const {
  std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

bool KiteSessionRegistry::Exists(const std::string& session_id) const {
  std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
  return sessions_.find(session_id) != sessions_.end();
}

ActionResult KiteSessionRegistry::Acquire(const std::string& session_id,
                                          SessionCommand& command) const {
  std::shared_ptr<KiteSession> session = Get(session_id);
  if (!session) {
    return ActionResult::SessionNotFound(session_id);
  }

  std::unique_lock<std::mutex> lock(session->command_mutex);
  if (session->closed.load(std::memory_order_acquire)) {
    // Closed while we were waiting for the lock
    return ActionResult::SessionNotFound(session_id);
  }

  command = SessionCommand(session, std::move(lock));
  return ActionResult::Success();
}

ActionResult KiteSessionRegistry::SetImplicitWait(const std::string& session_id, int seconds) {
  if (seconds < 0) {
    return ActionResult::InvalidParameter("Implicit wait must not be negative: " +
                                          std::to_string(seconds));
  }

  SessionCommand command;
  ActionResult acquired = Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }

  DriverStatus status = command.driver().SetImplicitWait(seconds);
  if (!status.ok()) {
    return ActionResult::DriverError("Failed to set implicit wait", status.message);
  }
  command.session().implicit_wait_seconds.store(seconds, std::memory_order_relaxed);
  return ActionResult::Success("Implicit wait set to " + std::to_string(seconds) + "s");
}

ActionResult KiteSessionRegistry::GetImplicitWait(const std::string& session_id,
                                                  int& seconds) const {
  std::shared_ptr<KiteSession> session = Get(session_id);
  if (!session) {
    return ActionResult::SessionNotFound(session_id);
  }
  seconds = session->implicit_wait_seconds.load(std::memory_order_relaxed);
  return ActionResult::Success();
}

void KiteSessionRegistry::ReleaseSession(const std::shared_ptr<KiteSession>& session) {
  // Wait for the in-flight command, then mark closed so queued callers bail out
  {
    std::lock_guard<std::mutex> lock(session->command_mutex);
    session->closed.store(true, std::memory_order_release);

    DriverStatus status = session->driver->Quit();
    if (!status.ok()) {
      LOG_WARN("SessionRegistry", "Driver quit failed for session " + session->id +
               ": " + status.message);
    }
  }

  size_t released = elements_.ClearSession(session->id);
  LOG_INFO("SessionRegistry", "Closed session " + session->id + " (" +
           std::to_string(released) + " element(s) released)");
}

ActionResult KiteSessionRegistry::Close(const std::string& session_id) {
  std::shared_ptr<KiteSession> session;

  // Phase 1: Extract session under lock (fast)
  {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return ActionResult::SessionNotFound(session_id);
    }
    session = std::move(it->second);
    sessions_.erase(it);
  }

  // Phase 2: Release the driver outside the map lock
  ReleaseSession(session);
  return ActionResult::Success("Session closed");
}

size_t KiteSessionRegistry::CloseAll() {
  std::unordered_map<std::string, std::shared_ptr<KiteSession>> snapshot;
  {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    snapshot.swap(sessions_);
  }

  for (auto& entry : snapshot) {
    ReleaseSession(entry.second);
  }
  return snapshot.size();
}

std::map<std::string, std::string> KiteSessionRegistry::List() const {
  std::vector<std::string> ids;
  {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
      ids.push_back(entry.first);
    }
  }

  std::map<std::string, std::string> result;
  for (const auto& id : ids) {
    SessionCommand command;
    if (!Acquire(id, command).success) {
      continue;  // Closed since the snapshot
    }
    std::string url;
    DriverStatus status = command.driver().GetCurrentUrl(url);
    result[id] = status.ok() ? url : "Error: " + status.message;
  }
  return result;
}

size_t KiteSessionRegistry::Count() const {
  std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
  return sessions_.size();
}

}  // namespace kite
