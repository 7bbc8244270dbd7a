#pragma once
/** @file  ExecutionContext.hpp
 *  @brief Thread-safe capture store scoped to one protocol run.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ivlab {
  namespace core {

    /** @class ExecutionContext
 *  @brief Lock-protected map of <capture name → JSON value>.
 *
 *  * Written by the engine after each successful step, read by status polls.
 *  * `initial` values resolve `$name` but are never reported as captures;
 *    a capture of the same name shadows them.
 */
    class ExecutionContext {

    public:
      ExecutionContext() = default;
      explicit ExecutionContext(nlohmann::json initial);
      ~ExecutionContext() = default;

      /// Atomically stores \p value under \p name.
      void set(const std::string& name, nlohmann::json value);

      /// Capture first, then initial parameter; nullopt when neither exists.
      std::optional<nlohmann::json> get(const std::string& name) const;

      /// Captures only, as a JSON object.
      nlohmann::json snapshot() const;

    private:
      mutable std::mutex mtx_;
      nlohmann::json initial_ = nlohmann::json::object();
      nlohmann::json captures_ = nlohmann::json::object();
    };

  } // namespace core
} // namespace ivlab
