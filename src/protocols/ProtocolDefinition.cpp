/* @file ProtocolDefinition.cpp
 * @brief document → ProtocolDefinition with shape validation.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <regex>

#include "core/Errors.hpp"
#include "protocols/ProtocolDefinition.hpp"

namespace ivlab::protocols {

  using core::ValidationError;

  namespace {
    const std::regex kActionShape{ "^[a-z][a-z0-9_-]*(/[a-z][a-z0-9_-]*)?$" };
    const std::regex kIdentifier{ "^[A-Za-z_][A-Za-z0-9_]*$" };

    std::string textField(const nlohmann::json& doc, const char* key, const std::string& fallback) {
      if (!doc.contains(key) || doc.at(key).is_null())
        return fallback;
      const auto& v = doc.at(key);
      if (v.is_string())
        return v.get<std::string>();
      if (v.is_number())
        return v.dump(); // `version: 2` is common in hand-written files
      throw ValidationError(std::string("[Protocol] '") + key + "' must be a string");
    }

    [[noreturn]] void badStep(std::size_t index, const std::string& why) {
      throw ValidationError("[Protocol] step " + std::to_string(index) + ": " + why);
    }
  } // namespace

  bool isValidActionName(const std::string& action) { return std::regex_match(action, kActionShape); }

  bool isValidVariableName(const std::string& name) { return std::regex_match(name, kIdentifier); }

  std::optional<std::string> variableReference(const nlohmann::json& value) {
    if (!value.is_string())
      return std::nullopt;
    const auto& text = value.get_ref<const std::string&>();
    if (text.size() < 2 || text.front() != '$')
      return std::nullopt;
    auto name = text.substr(1);
    if (!isValidVariableName(name))
      return std::nullopt;
    return name;
  }

  ProtocolDefinition ProtocolDefinition::fromJson(const nlohmann::json& doc, const std::string& fallbackName) {
    if (!doc.is_object())
      throw ValidationError("[Protocol] document must be an object");

    ProtocolDefinition def;
    def.name = textField(doc, "name", fallbackName);
    if (def.name.empty())
      throw ValidationError("[Protocol] 'name' is required");
    def.description = textField(doc, "description", "");
    def.version = textField(doc, "version", def.version);

    if (!doc.contains("steps") || !doc.at("steps").is_array())
      throw ValidationError("[Protocol] '" + def.name + "': 'steps' must be a list");
    const auto& steps = doc.at("steps");
    if (steps.empty())
      throw ValidationError("[Protocol] '" + def.name + "': 'steps' is empty");

    def.steps.reserve(steps.size());
    for (std::size_t i = 0; i < steps.size(); ++i) {
      const auto& raw = steps[i];
      if (!raw.is_object())
        badStep(i, "must be an object");

      Step step;
      if (!raw.contains("action") || !raw.at("action").is_string())
        badStep(i, "'action' is required and must be a string");
      step.action = raw.at("action").get<std::string>();
      if (!isValidActionName(step.action))
        badStep(i, "malformed action '" + step.action + "'");

      if (raw.contains("params") && !raw.at("params").is_null()) {
        if (!raw.at("params").is_object())
          badStep(i, "'params' must be a mapping");
        step.params = raw.at("params");
      }

      if (raw.contains("capture_as") && !raw.at("capture_as").is_null()) {
        if (!raw.at("capture_as").is_string() || !isValidVariableName(raw.at("capture_as").get<std::string>()))
          badStep(i, "'capture_as' must be an identifier");
        step.captureAs = raw.at("capture_as").get<std::string>();
      }

      def.steps.push_back(std::move(step));
    }
    return def;
  }

  nlohmann::json ProtocolDefinition::toJson() const {
    nlohmann::json out = { { "name", name }, { "description", description }, { "version", version } };
    auto& arr = out["steps"] = nlohmann::json::array();
    for (const auto& s : steps) {
      nlohmann::json j = { { "action", s.action }, { "params", s.params } };
      if (s.captureAs)
        j["capture_as"] = *s.captureAs;
      arr.push_back(std::move(j));
    }
    return out;
  }

} // namespace ivlab::protocols
