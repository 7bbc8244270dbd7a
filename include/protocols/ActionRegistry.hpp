#pragma once
/** @file  ActionRegistry.hpp
 *  @brief Runtime registry that maps step action names to handlers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace ivlab::protocols {

  /**
 * @class ActionRegistry
 * @brief Register & look up step handlers by `domain/verb` key.
 *
 *  * Keeps the engine decoupled from concrete device clients.
 *  * Handlers take resolved params and return the value a step captures.
 *  * Populated once at startup; lookups may race with nothing but lookups.
 */
  class ActionRegistry {
  public:
    using Handler = std::function<nlohmann::json(const nlohmann::json& params)>;

    /// Register a handler under \p name. Returns false on duplicate or malformed name.
    bool registerAction(const std::string& name, Handler handler);

    /// Throws core::ActionNotFoundError if unknown.
    const Handler& find(const std::string& name) const;

    bool contains(const std::string& name) const;

    /// Sorted.
    std::vector<std::string> names() const;

  private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, Handler> handlers_;
  };

} // namespace ivlab::protocols
