#include <algorithm>
#include <stdexcept>

#include "core/Errors.hpp"
#include "protocols/ProtocolLoader.hpp"

using namespace ivlab::protocols;

ProtocolLoader::ProtocolLoader(std::shared_ptr<ProtocolRepository> repository)
    : repository_(std::move(repository)) {
  if (!repository_)
    throw std::invalid_argument("[ProtocolLoader] repository is nullptr");
}

std::vector<std::string> ProtocolLoader::list() const {
  auto ids = repository_->list();
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

std::shared_ptr<const ProtocolDefinition> ProtocolLoader::load(const std::string& id) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (auto it = cache_.find(id); it != cache_.end())
      return it->second;
  }

  // parse outside the lock; a racing load of the same id keeps the first insert
  auto def = std::make_shared<const ProtocolDefinition>(ProtocolDefinition::fromJson(repository_->load(id), id));

  std::lock_guard<std::mutex> lock(mtx_);
  return cache_.emplace(id, std::move(def)).first->second;
}

nlohmann::json ProtocolLoader::catalogue() {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& id : list()) {
    try {
      const auto def = load(id);
      out.push_back({ { "id", id },
                      { "name", def->name },
                      { "description", def->description },
                      { "version", def->version },
                      { "steps", def->steps.size() } });
    } catch (const ivlab::core::Error& e) {
      out.push_back({ { "id", id }, { "error", e.what() } });
    }
  }
  return out;
}

void ProtocolLoader::reload() {
  std::lock_guard<std::mutex> lock(mtx_);
  cache_.clear();
}

std::size_t ProtocolLoader::cachedCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return cache_.size();
}
