#pragma once

#include <string>

#include "docent_core/portal/user_data_portal.hpp"

namespace docent_core {

struct PortalOptions {
  std::string base_url;
  std::string api_key;
  long timeout_ms = 10000;
};

// GET {base_url}/api/user/{user_id}/{data_type} with a bearer credential and
// the portal API key. Each call uses its own curl handle, so concurrent calls
// are safe once curl_global_init has run.
class HttpPortalClient : public UserDataPortal {
 public:
  explicit HttpPortalClient(PortalOptions options);

  bool is_configured() const override;

  nlohmann::json fetch(const std::string &user_id,
                       const std::string &data_type,
                       const std::string &credential,
                       const async::CancellationToken &cancel) override;

  std::string build_url(const std::string &user_id, const std::string &data_type) const;

 private:
  PortalOptions options_;
};

}  // namespace docent_core
