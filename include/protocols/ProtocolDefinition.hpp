#pragma once
/** @file  ProtocolDefinition.hpp
 *  @brief Immutable, validated protocol document: name, version, ordered steps.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ivlab::protocols {

  struct Step {
    std::string action;                               ///< `domain/verb` or a bare verb such as `wait`
    nlohmann::json params = nlohmann::json::object(); ///< literals and `$name` references
    std::optional<std::string> captureAs;
  };

  /**
 * @struct ProtocolDefinition
 * @brief Parsed form of
 *        `{name, description, version, steps:[{action, params, capture_as?}]}`.
 */
  struct ProtocolDefinition {
    std::string name;
    std::string description;
    std::string version{ "1.0" };
    std::vector<Step> steps;

    /** Validates the document shape; throws core::ValidationError naming the
     *  offending step index. \p fallbackName is used when `name` is absent. */
    static ProtocolDefinition fromJson(const nlohmann::json& doc, const std::string& fallbackName = {});

    nlohmann::json toJson() const;
  };

  /// `[a-z][a-z0-9_-]*` optionally followed by `/` and another such segment.
  bool isValidActionName(const std::string& action);

  /// C identifier rules; used for `capture_as` and `$name`.
  bool isValidVariableName(const std::string& name);

  /// `"$name"` → "name"; nullopt for anything else, including `"$"` and `"$5"`.
  std::optional<std::string> variableReference(const nlohmann::json& value);

} // namespace ivlab::protocols
