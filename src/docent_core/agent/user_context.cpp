#include "docent_core/agent/user_context.hpp"

#include <stdexcept>

namespace docent_core {

namespace {

std::optional<std::string> optional_string(const nlohmann::json &value) {
  if (value.is_null()) {
    return std::nullopt;
  }
  if (!value.is_string()) {
    throw std::invalid_argument("user context value must be a string or null");
  }
  std::string text = value.get<std::string>();
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

}  // namespace

nlohmann::json UserContext::to_prompt_json() const {
  nlohmann::json context = extra.is_object() ? extra : nlohmann::json::object();
  if (has_user()) {
    context["user_id"] = user_id;
  }
  if (department) {
    context["department"] = *department;
  }
  context["authenticated"] = credential.has_value();
  return context;
}

void UserContext::merge(const nlohmann::json &fields) {
  if (!fields.is_object()) {
    throw std::invalid_argument("user context update must be a JSON object");
  }
  if (!extra.is_object()) {
    extra = nlohmann::json::object();
  }
  for (const auto &[key, value] : fields.items()) {
    if (key == "user_id") {
      user_id = optional_string(value).value_or("");
    } else if (key == "department") {
      department = optional_string(value);
    } else if (key == "credential") {
      credential = optional_string(value);
    } else {
      extra[key] = value;
    }
  }
}

UserContext UserContext::from_json(const nlohmann::json &fields) {
  UserContext context;
  context.merge(fields);
  return context;
}

}  // namespace docent_core
