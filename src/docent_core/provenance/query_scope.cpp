#include "docent_core/provenance/query_scope.hpp"

#include <algorithm>
#include <utility>

namespace docent_core {

bool QueryScope::is_usable(const SourceRecord &source) {
  return !source.filename.empty() && source.filename != "Unknown";
}

bool QueryScope::record_locked(const SourceRecord &source) {
  if (!is_usable(source)) {
    return false;
  }
  // Scopes hold a handful of sources
  if (std::find(sources_.begin(), sources_.end(), source) != sources_.end()) {
    return false;
  }
  sources_.push_back(source);
  return true;
}

size_t QueryScope::record(const std::vector<SourceRecord> &sources) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t added = 0;
  for (const auto &source : sources) {
    if (record_locked(source)) {
      ++added;
    }
  }
  return added;
}

bool QueryScope::record(const SourceRecord &source) {
  std::lock_guard<std::mutex> lock(mutex_);
  return record_locked(source);
}

std::vector<SourceRecord> QueryScope::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SourceRecord> drained;
  drained.swap(sources_);
  return drained;
}

void QueryScope::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  sources_.clear();
}

size_t QueryScope::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sources_.size();
}

bool QueryScope::empty() const {
  return size() == 0;
}

}  // namespace docent_core
