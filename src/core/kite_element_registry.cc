#include "kite_element_registry.h"
#include "kite_ids.h"
#include "logger.h"

namespace kite {

std::shared_ptr<KiteElementRegistry::ElementTable> KiteElementRegistry::FindTable(
    const std::string& session_id) const {
  std::shared_lock<std::shared_mutex> lock(tables_mutex_);
  auto it = tables_.find(session_id);
  if (it == tables_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<KiteElementRegistry::ElementTable> KiteElementRegistry::FindOrCreateTable(
    const std::string& session_id) {
  // Fast path: table already exists
  auto table = FindTable(session_id);
  if (table) {
    return table;
  }

  std::unique_lock<std::shared_mutex> lock(tables_mutex_);
  auto& slot = tables_[session_id];
  if (!slot) {
    slot = std::make_shared<ElementTable>();
  }
  return slot;
}

std::string KiteElementRegistry::Store(const std::string& session_id, const ElementRef& ref) {
  auto table = FindOrCreateTable(session_id);
  std::string element_id = GenerateId();

  std::lock_guard<std::mutex> lock(table->mutex);
  table->elements[element_id] = ref;
  return element_id;
}

bool KiteElementRegistry::Get(const std::string& session_id, const std::string& element_id,
                              ElementRef& ref) const {
  auto table = FindTable(session_id);
  if (!table) {
    return false;
  }

  std::lock_guard<std::mutex> lock(table->mutex);
  auto it = table->elements.find(element_id);
  if (it == table->elements.end()) {
    return false;
  }
  ref = it->second;
  return true;
}

bool KiteElementRegistry::Exists(const std::string& session_id,
                                 const std::string& element_id) const {
  ElementRef unused;
  return Get(session_id, element_id, unused);
}

size_t KiteElementRegistry::Count(const std::string& session_id) const {
  auto table = FindTable(session_id);
  if (!table) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(table->mutex);
  return table->elements.size();
}

size_t KiteElementRegistry::ClearSession(const std::string& session_id) {
  std::shared_ptr<ElementTable> table;
  {
    std::unique_lock<std::shared_mutex> lock(tables_mutex_);
    auto it = tables_.find(session_id);
    if (it == tables_.end()) {
      return 0;
    }
    table = std::move(it->second);
    tables_.erase(it);
  }

  // A concurrent Store may still hold the detached table; empty it anyway
  std::lock_guard<std::mutex> lock(table->mutex);
  size_t count = table->elements.size();
  table->elements.clear();
  LOG_DEBUG("ElementRegistry", "Released " + std::to_string(count) +
            " element(s) for session " + session_id);
  return count;
}

}  // namespace kite
