#include "core/ExecutionContext.hpp"
#include "core/Errors.hpp"

using namespace ivlab::core;

ExecutionContext::ExecutionContext(nlohmann::json initial) {
  if (initial.is_null())
    return;
  if (!initial.is_object())
    throw ValidationError("[ExecutionContext] initial parameters must be an object");
  initial_ = std::move(initial);
}

void ExecutionContext::set(const std::string& name, nlohmann::json value) {
  std::lock_guard<std::mutex> lock(mtx_);
  captures_[name] = std::move(value);
}

std::optional<nlohmann::json> ExecutionContext::get(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (auto it = captures_.find(name); it != captures_.end())
    return *it;
  if (auto it = initial_.find(name); it != initial_.end())
    return *it;
  return std::nullopt;
}

nlohmann::json ExecutionContext::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return captures_;
}
