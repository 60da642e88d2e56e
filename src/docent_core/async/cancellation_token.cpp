#include "docent_core/async/cancellation_token.hpp"

namespace docent_core::async {

CancellationToken::CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

void CancellationToken::cancel() const {
  cancelled_->store(true, std::memory_order_release);
}

bool CancellationToken::is_cancelled() const {
  return cancelled_->load(std::memory_order_acquire);
}

}  // namespace docent_core::async
