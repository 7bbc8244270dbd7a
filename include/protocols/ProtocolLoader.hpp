#pragma once
/** @file  ProtocolLoader.hpp
 *  @brief Validating, caching front of a ProtocolRepository.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "protocols/ProtocolDefinition.hpp"
#include "protocols/ProtocolRepository.hpp"

namespace ivlab::protocols {

  /**
 * @class ProtocolLoader
 * @brief `load()` parses + validates once per id, then serves the cached
 *        definition until `reload()`.
 *
 *  * Thread-safe. Cached definitions are shared and immutable.
 */
  class ProtocolLoader {
  public:
    explicit ProtocolLoader(std::shared_ptr<ProtocolRepository> repository);

    /// Sorted, de-duplicated ids.
    std::vector<std::string> list() const;

    /// Throws core::NotFoundError / core::ValidationError.
    std::shared_ptr<const ProtocolDefinition> load(const std::string& id);

    /// `[{id, name, description, version, steps}]`; unparsable entries carry `error`.
    nlohmann::json catalogue();

    /// Drops the cache; next `load()` re-reads the repository.
    void reload();

    std::size_t cachedCount() const;

  private:
    std::shared_ptr<ProtocolRepository> repository_;
    mutable std::mutex mtx_;
    std::map<std::string, std::shared_ptr<const ProtocolDefinition>> cache_;
  };

} // namespace ivlab::protocols
