#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace docent_core {

// Who is asking. The credential is only ever handed to tools that call the
// portal; it is never shown to the model.
struct UserContext {
  std::string user_id;
  std::optional<std::string> department;
  std::optional<std::string> credential;
  // Any further caller-supplied fields (role, name...)
  nlohmann::json extra = nlohmann::json::object();

  bool has_user() const {
    return !user_id.empty();
  }

  // Context as shown to the model, without the credential
  nlohmann::json to_prompt_json() const;

  // Overwrites the fields present in `fields`. "user_id", "department" and
  // "credential" map to the members, everything else goes to `extra`.
  void merge(const nlohmann::json &fields);

  static UserContext from_json(const nlohmann::json &fields);
};

}  // namespace docent_core
