#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "kite_driver.h"

// Per-session tables mapping generated element IDs to driver element references.
//
// The outer map is guarded by a shared_mutex held only for lookups and
// insertions of whole tables; each table has its own mutex, independent of
// the session command lock. Entries live until their session is cleared.

namespace kite {

class KiteElementRegistry {
public:
  KiteElementRegistry() = default;
  KiteElementRegistry(const KiteElementRegistry&) = delete;
  KiteElementRegistry& operator=(const KiteElementRegistry&) = delete;

  // Returns a fresh globally unique element ID
  std::string Store(const std::string& session_id, const ElementRef& ref);

  // False when the session has no table or the ID is unknown
  bool Get(const std::string& session_id, const std::string& element_id, ElementRef& ref) const;

  bool Exists(const std::string& session_id, const std::string& element_id) const;
  size_t Count(const std::string& session_id) const;

  // Drops every entry of the session, returns how many were dropped
  size_t ClearSession(const std::string& session_id);

private:
  struct ElementTable {
    mutable std::mutex mutex;
    std::unordered_map<std::string, ElementRef> elements;
  };

  std::shared_ptr<ElementTable> FindTable(const std::string& session_id) const;
  std::shared_ptr<ElementTable> FindOrCreateTable(const std::string& session_id);

  mutable std::shared_mutex tables_mutex_;
  std::unordered_map<std::string, std::shared_ptr<ElementTable>> tables_;
};

}  // namespace kite
