#pragma once

#include <atomic>
#include <memory>

namespace docent_core::async {

// Copyable handle to a shared cancellation flag. Copies observe the same
// flag, so a caller can keep one and hand the other to a running query.
class CancellationToken {
 public:
  CancellationToken();

  void cancel() const;
  bool is_cancelled() const;

 private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace docent_core::async
