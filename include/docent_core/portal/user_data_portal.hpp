#pragma once

#include <exception>
#include <nlohmann/json.hpp>
#include <string>

#include "docent_core/async/cancellation_token.hpp"

namespace docent_core {

enum class PortalErrorKind { Unavailable, Unauthorized, NotFound, Cancelled };

class PortalError : public std::exception {
 public:
  PortalError(PortalErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }
  PortalErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  PortalErrorKind kind_;
  std::string message_;
};

// Internal portal holding per-user records (marks, attendance, profile...).
class UserDataPortal {
 public:
  virtual ~UserDataPortal() = default;

  virtual bool is_configured() const = 0;

  // Fetches one record type for a user on behalf of the credential holder.
  // Throws PortalError.
  virtual nlohmann::json fetch(const std::string &user_id,
                               const std::string &data_type,
                               const std::string &credential,
                               const async::CancellationToken &cancel) = 0;
};

}  // namespace docent_core
