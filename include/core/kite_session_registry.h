#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "action_result.h"
#include "kite_driver.h"
#include "kite_element_registry.h"

namespace kite {

struct KiteSession {
  std::string id;
  std::unique_ptr<KiteDriver> driver;

  // Readable without the command lock
  std::atomic<int> implicit_wait_seconds{0};

  // At most one driver command at a time
  std::mutex command_mutex;

  // Set under command_mutex once the driver has been released
  std::atomic<bool> closed{false};
};

// Exclusive access to one session's driver for the lifetime of the object
class SessionCommand {
public:
  SessionCommand() = default;
  SessionCommand(std::shared_ptr<KiteSession> session, std::unique_lock<std::mutex> lock);
  ~SessionCommand();

  SessionCommand(SessionCommand&& other) noexcept;
  SessionCommand& operator=(SessionCommand&& other) noexcept;
  SessionCommand(const SessionCommand&) = delete;
  SessionCommand& operator=(const SessionCommand&) = delete;

  explicit operator bool() const { return session_ != nullptr; }

  KiteDriver& driver() const { return *session_->driver; }
  KiteSession& session() const { return *session_; }
  const std::string& session_id() const { return session_->id; }

  // Releases the lock early
  void Release();

private:
  std::shared_ptr<KiteSession> session_;
  std::unique_lock<std::mutex> lock_;
};

// Registry of live sessions keyed by generated session ID.
//
// The map lock is held only for O(1) map operations, never while a driver
// command runs. Commands on one session are serialized by its command lock;
// different sessions run in parallel.
class KiteSessionRegistry {
public:
  KiteSessionRegistry(std::unique_ptr<KiteDriverFactory> factory,
                      KiteElementRegistry& elements,
                      int default_implicit_wait_s,
                      int default_page_load_timeout_s);
  ~KiteSessionRegistry();

  KiteSessionRegistry(const KiteSessionRegistry&) = delete;
  KiteSessionRegistry& operator=(const KiteSessionRegistry&) = delete;

  // Starts a browser and registers it. DRIVER_STARTUP_FAILED when the
  // driver cannot be acquired.
  ActionResult Create(std::string& session_id);

  std::shared_ptr<KiteSession> Get(const std::string& session_id) const;
  bool Exists(const std::string& session_id) const;

  // Blocks until the session's command lock is held.
  // SESSION_NOT_FOUND for unknown IDs and sessions closed while waiting.
  ActionResult Acquire(const std::string& session_id, SessionCommand& command) const;

  // Negative values are rejected; serialized with other commands
  ActionResult SetImplicitWait(const std::string& session_id, int seconds);
  ActionResult GetImplicitWait(const std::string& session_id, int& seconds) const;

  // Releases the driver and forgets the session's elements.
  // A failing driver quit is logged and the session is still removed.
  ActionResult Close(const std::string& session_id);

  // Closes everything registered at call time, returns that count
  size_t CloseAll();

  // session ID -> current URL, or "Error: <message>"
  std::map<std::string, std::string> List() const;

  size_t Count() const;

  KiteElementRegistry& elements() const { return elements_; }
  int default_page_load_timeout() const { return default_page_load_timeout_s_; }

private:
  void ReleaseSession(const std::shared_ptr<KiteSession>& session);

  std::unique_ptr<KiteDriverFactory> factory_;
  KiteElementRegistry& elements_;
  int default_implicit_wait_s_;
  int default_page_load_timeout_s_;

  mutable std::shared_mutex sessions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<KiteSession>> sessions_;
};

}  // namespace kite
