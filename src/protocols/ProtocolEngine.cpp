/* @file ProtocolEngine.cpp
 * @brief step loop: resolve → dispatch → abort check → invoke → capture.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// ivlab headers
#include "core/Errors.hpp"
#include "protocols/ProtocolEngine.hpp"

namespace ivlab::protocols {

  using core::LogLevel;
  using core::RunState;

  namespace {
    constexpr const char* kSource = "engine";

    nlohmann::json optionalText(const std::optional<std::string>& v) {
      return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
    }

    /// A multi-point handler that stopped early marks its own result.
    bool reportsAbort(const nlohmann::json& out) {
      return out.is_object() && out.contains("aborted") && out.at("aborted").is_boolean() &&
             out.at("aborted").get<bool>();
    }
  } // namespace

  nlohmann::json ExecutionResult::toJson() const {
    return { { "success", success },
             { "name", name },
             { "steps_completed", stepsCompleted },
             { "total_steps", totalSteps },
             { "aborted", aborted },
             { "error", optionalText(error) },
             { "captured_data", capturedData } };
  }

  nlohmann::json EngineProgress::toJson() const {
    return { { "protocol_name", protocolName },
             { "steps_completed", stepsCompleted },
             { "total_steps", totalSteps },
             { "current_action", currentAction },
             { "running", running } };
  }

  ProtocolEngine::ProtocolEngine(std::shared_ptr<core::RunManager> runManager,
                                 std::shared_ptr<ActionRegistry> registry, std::shared_ptr<ProtocolLoader> loader,
                                 std::shared_ptr<core::Logger> log)
      : runManager_(std::move(runManager)), registry_(std::move(registry)), loader_(std::move(loader)),
        log_(std::move(log)) {
    if (!runManager_ || !registry_)
      throw std::invalid_argument("[ProtocolEngine] run manager and registry are required");
  }

  void ProtocolEngine::registerRunEndHook(std::string name, std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(hooksMtx_);
    runEndHooks_.emplace_back(std::move(name), std::move(hook));
  }

  EngineProgress ProtocolEngine::progress() const {
    std::lock_guard<std::mutex> lock(progressMtx_);
    return progress_;
  }

  void ProtocolEngine::setProgress(std::size_t completed, const std::string& action) {
    {
      std::lock_guard<std::mutex> lock(progressMtx_);
      progress_.stepsCompleted = completed;
      progress_.currentAction = action;
    }
    runManager_->setProgress(completed, progress_.totalSteps);
  }

  nlohmann::json ProtocolEngine::resolve(const nlohmann::json& value, const core::ExecutionContext& context) {
    if (auto ref = variableReference(value)) {
      auto found = context.get(*ref);
      if (!found)
        throw core::VariableNotFoundError("[ProtocolEngine] unresolved variable $" + *ref);
      return *found;
    }
    if (value.is_object()) {
      nlohmann::json out = nlohmann::json::object();
      for (auto it = value.begin(); it != value.end(); ++it)
        out[it.key()] = resolve(it.value(), context);
      return out;
    }
    if (value.is_array()) {
      nlohmann::json out = nlohmann::json::array();
      for (const auto& v : value)
        out.push_back(resolve(v, context));
      return out;
    }
    return value;
  }

  void ProtocolEngine::enterRunning(const std::string& name) {
    const auto state = runManager_->state();
    if (state == RunState::IDLE)
      runManager_->arm();
    else if (state != RunState::ARMED)
      throw core::StateError(std::string("[ProtocolEngine] cannot run a protocol while ") + core::toString(state));
    runManager_->start(name);
  }

  ExecutionResult ProtocolEngine::executeNamed(const std::string& id, const nlohmann::json& initialParams) {
    if (!loader_)
      throw std::logic_error("[ProtocolEngine] no protocol loader configured");
    const auto def = loader_->load(id);
    return execute(*def, initialParams);
  }

  ExecutionResult ProtocolEngine::execute(const ProtocolDefinition& definition, const nlohmann::json& initialParams) {
    std::unique_lock<std::mutex> runLock(runMtx_, std::try_to_lock);
    if (!runLock.owns_lock())
      throw core::StateError("[ProtocolEngine] another protocol is already running");

    core::ExecutionContext context(initialParams);
    enterRunning(definition.name);

    ExecutionResult result;
    result.name = definition.name;
    result.totalSteps = definition.steps.size();
    {
      std::lock_guard<std::mutex> lock(progressMtx_);
      progress_ = EngineProgress{ definition.name, 0, result.totalSteps, {}, true };
    }
    runManager_->setProgress(0, result.totalSteps);

    const auto abortFlag = runManager_->abortFlag();
    if (log_)
      log_->log(LogLevel::Info, kSource, "run start",
                { { "protocol", definition.name }, { "steps", result.totalSteps } });

    std::size_t index = 0;
    try {
      for (; index < definition.steps.size(); ++index) {
        const auto& step = definition.steps[index];
        setProgress(result.stepsCompleted, step.action);

        const auto params = resolve(step.params, context);
        const auto& handler = registry_->find(step.action);

        if (abortFlag->requested()) {
          result.aborted = true;
          break;
        }

        auto out = handler(params);
        const bool partial = reportsAbort(out);
        if (step.captureAs)
          context.set(*step.captureAs, std::move(out));
        ++result.stepsCompleted;
        setProgress(result.stepsCompleted, step.action);

        if (log_)
          log_->log(LogLevel::Debug, kSource, "step done", { { "index", index }, { "action", step.action } });

        if (partial) {
          result.aborted = true;
          break;
        }
      }
      if (!result.aborted && abortFlag->requested())
        result.aborted = true;
    } catch (const core::AbortRequested&) {
      result.aborted = true;
    } catch (const std::exception& e) {
      const auto& action = index < definition.steps.size() ? definition.steps[index].action : std::string{};
      result.error = "step " + std::to_string(index) + " (" + action + "): " + e.what();
    }

    result.capturedData = context.snapshot();
    result.success = !result.aborted && !result.error;

    runEndHooks();
    finishRun(result);

    {
      std::lock_guard<std::mutex> lock(progressMtx_);
      progress_.running = false;
      progress_.currentAction.clear();
    }
    return result;
  }

  void ProtocolEngine::runEndHooks() {
    std::vector<std::pair<std::string, std::function<void()>>> hooks;
    {
      std::lock_guard<std::mutex> lock(hooksMtx_);
      hooks = runEndHooks_;
    }
    for (auto& [name, fn] : hooks) {
      try {
        fn();
      } catch (const std::exception& e) {
        if (log_)
          log_->error(kSource, "run-end hook '" + name + "' failed: " + e.what());
      }
    }
  }

  void ProtocolEngine::finishRun(const ExecutionResult& result) {
    try {
      if (result.error) {
        // an external reset() during the failing step already ended the run
        if (!runManager_->faultRunning(*result.error) && log_)
          log_->warn(kSource, "run was reset before its failure landed: " + *result.error);
      } else if (result.aborted) {
        // an external abort() or reset() may already have moved the state on
        if (runManager_->state() == RunState::RUNNING)
          runManager_->abort();
      } else {
        runManager_->complete();
      }
    } catch (const core::StateError& e) {
      if (log_)
        log_->warn(kSource, std::string("final transition skipped: ") + e.what());
    }

    if (log_) {
      const auto level = result.error ? LogLevel::Error : result.aborted ? LogLevel::Warning : LogLevel::Info;
      log_->log(level, kSource, "run end",
                { { "protocol", result.name },
                  { "steps_completed", result.stepsCompleted },
                  { "total_steps", result.totalSteps },
                  { "aborted", result.aborted },
                  { "error", optionalText(result.error) } });
    }
  }

} // namespace ivlab::protocols
