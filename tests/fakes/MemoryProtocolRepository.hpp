#pragma once
/** @file  MemoryProtocolRepository.hpp
 *  @brief ProtocolRepository over an in-memory map; counts loads.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <map>
#include <string>
#include <vector>

#include "core/Errors.hpp"
#include "protocols/ProtocolRepository.hpp"

namespace ivlab {
  namespace test {

    class MemoryProtocolRepository : public ivlab::protocols::ProtocolRepository {
    public:
      std::map<std::string, nlohmann::json> documents;
      mutable int loads = 0;

      std::vector<std::string> list() const override {
        std::vector<std::string> ids;
        for (const auto& [id, _] : documents)
          ids.push_back(id);
        return ids;
      }

      nlohmann::json load(const std::string& id) const override {
        ++loads;
        auto it = documents.find(id);
        if (it == documents.end())
          throw ivlab::core::NotFoundError("protocol not found: " + id);
        return it->second;
      }
    };

  } // namespace test
} // namespace ivlab
