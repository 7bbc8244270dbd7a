#pragma once
/** @file  ProtocolEngine.hpp
 *  @brief Sequential step executor with variable capture and cooperative abort.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/ExecutionContext.hpp"
#include "core/Logger.hpp"
#include "core/RunManager.hpp"
#include "protocols/ActionRegistry.hpp"
#include "protocols/ProtocolDefinition.hpp"
#include "protocols/ProtocolLoader.hpp"

namespace ivlab::protocols {

  struct ExecutionResult {
    bool success{ false };
    std::string name;
    std::size_t stepsCompleted{ 0 };
    std::size_t totalSteps{ 0 };
    bool aborted{ false };
    std::optional<std::string> error;
    nlohmann::json capturedData = nlohmann::json::object();

    /// `{success, name, steps_completed, total_steps, aborted, error, captured_data}`
    nlohmann::json toJson() const;
  };

  struct EngineProgress {
    std::string protocolName;
    std::size_t stepsCompleted{ 0 };
    std::size_t totalSteps{ 0 };
    std::string currentAction;
    bool running{ false };

    nlohmann::json toJson() const;
  };

  /**
 * @class ProtocolEngine
 * @brief Runs one protocol at a time on the caller's thread.
 *
 *  * Enters RUNNING from IDLE (arm + start) or ARMED (start); anything else is
 *    a StateError before any step runs.
 *  * Per step: resolve `$name` params, look up the handler, look at the abort
 *    flag, invoke, capture.
 *  * Ends the run through RunManager: complete / abort / fault.
 *  * Run-end hooks run after every run, before the final transition.
 */
  class ProtocolEngine {
  public:
    ProtocolEngine(std::shared_ptr<core::RunManager> runManager, std::shared_ptr<ActionRegistry> registry,
                   std::shared_ptr<ProtocolLoader> loader = nullptr, std::shared_ptr<core::Logger> log = nullptr);

    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    ExecutionResult execute(const ProtocolDefinition& definition,
                            const nlohmann::json& initialParams = nlohmann::json::object());

    /// Loads \p id through the loader first; load errors propagate before any state change.
    ExecutionResult executeNamed(const std::string& id, const nlohmann::json& initialParams = nlohmann::json::object());

    void registerRunEndHook(std::string name, std::function<void()> hook);

    EngineProgress progress() const;

    /// Substitutes every `$name` in \p value (recursively) from \p context.
    /// Throws core::VariableNotFoundError.
    static nlohmann::json resolve(const nlohmann::json& value, const core::ExecutionContext& context);

  private:
    void enterRunning(const std::string& name);
    void finishRun(const ExecutionResult& result);
    void runEndHooks();
    void setProgress(std::size_t completed, const std::string& action);

    std::shared_ptr<core::RunManager> runManager_;
    std::shared_ptr<ActionRegistry> registry_;
    std::shared_ptr<ProtocolLoader> loader_;
    std::shared_ptr<core::Logger> log_;

    std::mutex runMtx_; ///< one execute() at a time
    mutable std::mutex progressMtx_;
    EngineProgress progress_{};

    std::mutex hooksMtx_;
    std::vector<std::pair<std::string, std::function<void()>>> runEndHooks_;
  };

} // namespace ivlab::protocols
