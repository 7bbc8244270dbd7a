#pragma once
/** @file  ProtocolRepository.hpp
 *  @brief Where raw protocol documents come from.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ivlab::protocols {

  /**
 * @class ProtocolRepository
 * @brief `list()` the ids it knows, `load(id)` one raw (unvalidated) document.
 */
  class ProtocolRepository {
  public:
    virtual ~ProtocolRepository() = default;

    virtual std::vector<std::string> list() const = 0;
    /// Throws core::NotFoundError for an unknown id, core::ValidationError for unparsable text.
    virtual nlohmann::json load(const std::string& id) const = 0;
  };

  /**
 * @class FileProtocolRepository
 * @brief `*.json` files under a root directory, searched recursively.
 *
 *  * The id is the path relative to the root without extension,
 *    e.g. `users/led_iv`.
 *  * Ids containing `..` are rejected.
 */
  class FileProtocolRepository : public ProtocolRepository {
  public:
    explicit FileProtocolRepository(std::string rootDir);

    std::vector<std::string> list() const override;
    nlohmann::json load(const std::string& id) const override;

    const std::string& root() const { return root_; }

  private:
    std::string root_;
  };

} // namespace ivlab::protocols
