#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include "docent_core/types/source_record.hpp"

namespace docent_core {

// Sources collected while answering one request. A scope is created per
// request and handed to every tool call of that request; it is never shared
// between requests.
class QueryScope {
 public:
  QueryScope() = default;

  QueryScope(const QueryScope &) = delete;
  QueryScope &operator=(const QueryScope &) = delete;

  // Appends records with a usable filename that are not present yet, in
  // order. Returns how many were appended.
  size_t record(const std::vector<SourceRecord> &sources);
  bool record(const SourceRecord &source);

  // Returns everything recorded so far in first-seen order and empties the
  // scope.
  std::vector<SourceRecord> drain();

  void reset();

  size_t size() const;
  bool empty() const;

  // Empty and "Unknown" filenames do not identify a source
  static bool is_usable(const SourceRecord &source);

 private:
  bool record_locked(const SourceRecord &source);

  mutable std::mutex mutex_;
  std::vector<SourceRecord> sources_;
};

}  // namespace docent_core
