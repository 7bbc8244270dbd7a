#include <algorithm>

#include "core/Errors.hpp"
#include "protocols/ActionRegistry.hpp"
#include "protocols/ProtocolDefinition.hpp"

using namespace ivlab::protocols;

bool ActionRegistry::registerAction(const std::string& name, Handler handler) {
  if (!handler || !isValidActionName(name))
    return false;
  std::lock_guard<std::mutex> lock(mtx_);
  return handlers_.emplace(name, std::move(handler)).second;
}

const ActionRegistry::Handler& ActionRegistry::find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = handlers_.find(name);
  if (it == handlers_.end())
    throw ivlab::core::ActionNotFoundError("[ActionRegistry] unknown action: " + name);
  return it->second;
}

bool ActionRegistry::contains(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return handlers_.count(name) != 0;
}

std::vector<std::string> ActionRegistry::names() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<std::string> out;
  out.reserve(handlers_.size());
  for (const auto& [name, _] : handlers_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}
