// ivlab headers
#include "core/Errors.hpp"
#include "core/ExecutionContext.hpp"
#include "core/LabCoordinator.hpp"
#include "core/RunManager.hpp"
#include "protocols/ActionRegistry.hpp"
#include "protocols/ProtocolDefinition.hpp"
#include "protocols/ProtocolEngine.hpp"
#include "protocols/ProtocolLoader.hpp"
#include "protocols/ProtocolRepository.hpp"

// ivlab fakes
#include "MemoryLogSink.hpp"
#include "MemoryProtocolRepository.hpp"
#include "MemoryResultSink.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <filesystem>
#include <fstream>

namespace ivlab::test {

  using namespace ivlab::protocols;
  using ivlab::core::ActionNotFoundError;
  using ivlab::core::ExecutionContext;
  using ivlab::core::NotFoundError;
  using ivlab::core::RunManager;
  using ivlab::core::RunState;
  using ivlab::core::ValidationError;
  using ivlab::core::VariableNotFoundError;
  using nlohmann::json;
  using testing::HasSubstr;

  namespace {
    json step(const std::string& action, json params = json::object(), const std::string& capture = {}) {
      json s = { { "action", action }, { "params", std::move(params) } };
      if (!capture.empty())
        s["capture_as"] = capture;
      return s;
    }

    json document(const std::string& name, std::vector<json> steps) {
      json doc = { { "steps", json(std::move(steps)) } };
      if (!name.empty())
        doc["name"] = name;
      return doc;
    }
  } // namespace

  //---ProtocolDefinition------------------------------------------------------------

  TEST(ProtocolDefinition, parsesStepsAndDefaults) {
    auto doc = document("iv", { step("smu/sweep", { { "start", 0 } }, "iv"), step("wait") });
    doc["version"] = 2;
    const auto def = ProtocolDefinition::fromJson(doc);
    EXPECT_EQ(def.name, "iv");
    EXPECT_EQ(def.version, "2");
    ASSERT_EQ(def.steps.size(), 2u);
    EXPECT_EQ(def.steps[0].captureAs, "iv");
    EXPECT_FALSE(def.steps[1].captureAs);
    EXPECT_TRUE(def.steps[1].params.is_object());
    EXPECT_EQ(ProtocolDefinition::fromJson(def.toJson()).steps.size(), 2u);
  }

  TEST(ProtocolDefinition, validationNamesTheOffendingStep) {
    const json doc = document("bad", { step("wait"), step("smu/sweep"), json{ { "params", json::object() } } });
    try {
      ProtocolDefinition::fromJson(doc);
      FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
      EXPECT_THAT(e.what(), HasSubstr("step 2"));
    }
  }

  TEST(ProtocolDefinition, rejectsMalformedDocuments) {
    EXPECT_THROW(ProtocolDefinition::fromJson(json::array()), ValidationError);
    EXPECT_THROW(ProtocolDefinition::fromJson(document("", { step("wait") })), ValidationError);
    EXPECT_THROW(ProtocolDefinition::fromJson(document("x", {})), ValidationError);
    EXPECT_THROW(ProtocolDefinition::fromJson(document("x", { step("Smu/Sweep") })), ValidationError);
    EXPECT_THROW(ProtocolDefinition::fromJson(document("x", { step("wait", json::array()) })), ValidationError);
    EXPECT_THROW(ProtocolDefinition::fromJson(document("x", { step("wait", nullptr, "2fast") })), ValidationError);
    EXPECT_EQ(ProtocolDefinition::fromJson(document("", { step("wait") }), "fallback").name, "fallback");
  }

  TEST(ProtocolDefinition, variableReferences) {
    EXPECT_EQ(variableReference("$iv"), "iv");
    EXPECT_FALSE(variableReference("$"));
    EXPECT_FALSE(variableReference("$5"));
    EXPECT_FALSE(variableReference("iv"));
    EXPECT_FALSE(variableReference(5));
    EXPECT_TRUE(isValidActionName("relays/all-off"));
    EXPECT_FALSE(isValidActionName("a/b/c"));
  }

  //---FileProtocolRepository + ProtocolLoader-------------------------------------------

  TEST(FileProtocolRepository, listsNestedJsonFilesById) {
    const auto root = std::filesystem::temp_directory_path() / "ivlab_protocols_test";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "led");
    std::ofstream(root / "iv.json") << R"({"name": "iv", "steps": [{"action": "wait"}]})";
    std::ofstream(root / "led" / "cal.json") << R"({"name": "cal", // comment
      "steps": [{"action": "wait"}]})";
    std::ofstream(root / "notes.txt") << "ignored";
    std::ofstream(root / "broken.json") << "{";

    FileProtocolRepository repo(root.string());
    EXPECT_THAT(repo.list(), testing::ElementsAre("broken", "iv", "led/cal"));
    EXPECT_EQ(repo.load("led/cal").at("name"), "cal");
    EXPECT_THROW(repo.load("../etc/passwd"), NotFoundError);
    EXPECT_THROW(repo.load("absent"), NotFoundError);
    EXPECT_THROW(repo.load("broken"), ValidationError);

    ProtocolLoader loader(std::make_shared<FileProtocolRepository>(root.string()));
    const auto cat = loader.catalogue();
    ASSERT_EQ(cat.size(), 3u);
    EXPECT_TRUE(cat[0].contains("error"));
    EXPECT_EQ(cat[1].at("steps"), 1);
    std::filesystem::remove_all(root);
  }

  TEST(ProtocolLoader, cachesUntilReload) {
    auto repo = std::make_shared<MemoryProtocolRepository>();
    repo->documents["iv"] = { { "name", "iv" }, { "steps", { step("wait") } } };
    ProtocolLoader loader(repo);

    const auto first = loader.load("iv");
    const auto second = loader.load("iv");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(repo->loads, 1);

    loader.reload();
    EXPECT_EQ(loader.cachedCount(), 0u);
    loader.load("iv");
    EXPECT_EQ(repo->loads, 2);
    EXPECT_THROW(loader.load("missing"), NotFoundError);
  }

  //---ActionRegistry------------------------------------------------------------------

  TEST(ActionRegistry, rejectsDuplicatesAndUnknownNames) {
    ActionRegistry reg;
    EXPECT_TRUE(reg.registerAction("smu/measure", [](const json&) { return json(1); }));
    EXPECT_FALSE(reg.registerAction("smu/measure", [](const json&) { return json(2); }));
    EXPECT_FALSE(reg.registerAction("Bad Name", [](const json&) { return json(); }));
    EXPECT_FALSE(reg.registerAction("wait", nullptr));
    EXPECT_EQ(reg.find("smu/measure")(json::object()), 1);
    EXPECT_THROW(reg.find("smu/teleport"), ActionNotFoundError);
    EXPECT_THAT(reg.names(), testing::ElementsAre("smu/measure"));
  }

  //---ProtocolEngine--------------------------------------------------------------------

  class ProtocolEngineTest : public ::testing::Test {
  protected:
    void SetUp() override {
      runManager = std::make_shared<RunManager>();
      registry = std::make_shared<ActionRegistry>();
      registry->registerAction("test/echo", [this](const json& p) {
        calls.push_back(p);
        return p;
      });
      registry->registerAction("test/stop", [this](const json&) -> json {
        runManager->abort();
        throw ivlab::core::AbortRequested("[test] stop requested");
      });
      registry->registerAction("test/fail", [](const json&) -> json {
        throw ivlab::core::DeviceFault("[test] instrument overload");
      });
      engine = std::make_shared<ProtocolEngine>(runManager, registry);
    }

    std::shared_ptr<RunManager> runManager;
    std::shared_ptr<ActionRegistry> registry;
    std::shared_ptr<ProtocolEngine> engine;
    std::vector<json> calls;
  };

  TEST_F(ProtocolEngineTest, capturesFlowIntoLaterSteps) {
    ProtocolDefinition def;
    def.name = "chain";
    def.steps = { Step{ "test/echo", { { "v", 8.0 } }, "first" },
                  Step{ "test/echo", { { "prev", "$first" }, { "limit", "$vmax" }, { "price", "$5" } }, "second" } };

    const auto result = engine->execute(def, { { "vmax", 21 } });
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stepsCompleted, 2u);
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1].at("prev").at("v"), 8.0);
    EXPECT_EQ(calls[1].at("limit"), 21);
    EXPECT_EQ(calls[1].at("price"), "$5");
    EXPECT_FALSE(result.capturedData.contains("vmax"));
    EXPECT_EQ(runManager->state(), RunState::IDLE);
  }

  TEST_F(ProtocolEngineTest, abortAtStepFourStopsWithThreeCompleted) {
    ProtocolDefinition def;
    def.name = "ten";
    for (int i = 1; i <= 10; ++i) {
      if (i == 4)
        def.steps.push_back(Step{ "test/stop", json::object(), "s4" });
      else
        def.steps.push_back(Step{ "test/echo", { { "i", i } }, "s" + std::to_string(i) });
    }

    const auto result = engine->execute(def);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.aborted);
    EXPECT_FALSE(result.error);
    EXPECT_EQ(result.stepsCompleted, 3u);
    EXPECT_EQ(result.totalSteps, 10u);
    EXPECT_EQ(calls.size(), 3u);

    const auto j = result.toJson();
    EXPECT_TRUE(j.at("error").is_null());
    EXPECT_EQ(j.at("captured_data").size(), 3u);
    EXPECT_TRUE(j.at("captured_data").contains("s3"));
    EXPECT_FALSE(j.at("captured_data").contains("s4"));
    EXPECT_EQ(runManager->state(), RunState::ABORTED);
  }

  TEST_F(ProtocolEngineTest, unresolvedVariableFaultsTheRun) {
    ProtocolDefinition def;
    def.name = "dangling";
    def.steps = { Step{ "test/echo", { { "x", 1 } }, "a" }, Step{ "test/echo", { { "y", "$missing" } }, {} } };

    const auto result = engine->execute(def);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error);
    EXPECT_THAT(*result.error, HasSubstr("step 1"));
    EXPECT_THAT(*result.error, HasSubstr("$missing"));
    EXPECT_EQ(result.stepsCompleted, 1u);
    EXPECT_EQ(runManager->state(), RunState::ERROR);
    EXPECT_EQ(runManager->status().lastError, result.error);
  }

  TEST_F(ProtocolEngineTest, unknownActionAndDeviceFaultsAreReported) {
    ProtocolDefinition def;
    def.name = "unknown";
    def.steps = { Step{ "test/teleport", json::object(), {} } };
    auto result = engine->execute(def);
    ASSERT_TRUE(result.error);
    EXPECT_THAT(*result.error, HasSubstr("test/teleport"));

    runManager->reset();
    def.steps = { Step{ "test/fail", json::object(), {} } };
    result = engine->execute(def);
    ASSERT_TRUE(result.error);
    EXPECT_THAT(*result.error, HasSubstr("overload"));
    EXPECT_EQ(runManager->state(), RunState::ERROR);
  }

  TEST_F(ProtocolEngineTest, refusesToStartFromErrorState) {
    runManager->fault("earlier failure");
    ProtocolDefinition def;
    def.name = "x";
    def.steps = { Step{ "test/echo", json::object(), {} } };
    EXPECT_THROW(engine->execute(def), ivlab::core::StateError);
    EXPECT_TRUE(calls.empty());
  }

  TEST_F(ProtocolEngineTest, partialStepResultMarksRunAborted) {
    registry->registerAction("test/partial", [](const json&) { return json{ { "aborted", true }, { "points", 2 } }; });
    ProtocolDefinition def;
    def.name = "partial";
    def.steps = { Step{ "test/partial", json::object(), "iv" }, Step{ "test/echo", json::object(), {} } };

    const auto result = engine->execute(def);
    EXPECT_TRUE(result.aborted);
    EXPECT_EQ(result.stepsCompleted, 1u);
    EXPECT_EQ(result.capturedData.at("iv").at("points"), 2);
    EXPECT_TRUE(calls.empty());
  }

  TEST_F(ProtocolEngineTest, failureAfterExternalResetLeavesManagerIdle) {
    registry->registerAction("test/reset-then-fail", [this](const json&) -> json {
      runManager->reset();
      throw ivlab::core::DeviceFault("[test] link lost while resetting");
    });
    ProtocolDefinition def;
    def.name = "reset_mid_step";
    def.steps = { Step{ "test/echo", json::object(), std::nullopt },
                  Step{ "test/reset-then-fail", json::object(), std::nullopt } };

    const auto result = engine->execute(def, json::object());
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error);
    EXPECT_THAT(*result.error, HasSubstr("step 1"));
    EXPECT_EQ(runManager->state(), RunState::IDLE);
    EXPECT_FALSE(runManager->status().lastError);
  }

  TEST(RunManagerFaultRunning, onlyFaultsAnActiveOrFailedRun) {
    RunManager rm;
    EXPECT_FALSE(rm.faultRunning("late"));
    EXPECT_EQ(rm.state(), RunState::IDLE);
    rm.arm();
    EXPECT_FALSE(rm.faultRunning("late"));
    EXPECT_EQ(rm.state(), RunState::ARMED);
    rm.start("p");
    EXPECT_TRUE(rm.faultRunning("step 0 (x): boom"));
    EXPECT_EQ(rm.state(), RunState::ERROR);
    EXPECT_TRUE(rm.faultRunning("step 0 (x): detail"));
    ASSERT_TRUE(rm.status().lastError);
    EXPECT_EQ(*rm.status().lastError, "step 0 (x): detail");
  }

  TEST_F(ProtocolEngineTest, runEndHooksRunEvenAfterFailure) {
    int hookCalls = 0;
    engine->registerRunEndHook("count", [&hookCalls] { ++hookCalls; });
    ProtocolDefinition def;
    def.name = "x";
    def.steps = { Step{ "test/fail", json::object(), {} } };
    engine->execute(def);
    EXPECT_EQ(hookCalls, 1);
    EXPECT_FALSE(engine->progress().running);
  }

  TEST(ProtocolEngineResolve, substitutesNestedReferences) {
    ExecutionContext ctx;
    ctx.set("iv", { { "points", 3 } });
    const auto out = ProtocolEngine::resolve({ { "data", "$iv" }, { "list", { 1, "$iv" } }, { "lit", "$" } }, ctx);
    EXPECT_EQ(out.at("data").at("points"), 3);
    EXPECT_EQ(out.at("list").at(1).at("points"), 3);
    EXPECT_EQ(out.at("lit"), "$");
    EXPECT_THROW(ProtocolEngine::resolve("$nope", ctx), VariableNotFoundError);
  }

  //---LabCoordinator end to end on mock hardware-------------------------------------------

  class LabCoordinatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      auto cfg = ivlab::core::LabConfig::fromJson(json::parse(R"({
        "data_dir": "/tmp/ivlab-test-data",
        "log": {"console": false, "level": "debug"},
        "mock": {"photodetector": {"noise_floor": 0}}
      })"));
      logSink = std::make_shared<MemoryLogSink>();
      results = std::make_shared<MemoryResultSink>();
      repo = std::make_shared<MemoryProtocolRepository>();
      repo->documents["iv_sweep"] = json::parse(R"({
        "name": "iv_sweep",
        "steps": [
          {"action": "smu/connect", "params": {"mock": true}},
          {"action": "smu/sweep", "params": {"start": 0, "stop": "$vmax", "points": 41}, "capture_as": "iv"},
          {"action": "data/save", "params": {"data": "$iv", "filename": "led_iv"}}
        ]
      })");

      ivlab::core::LabCoordinator::Overrides o;
      o.logSink = logSink;
      o.resultSink = results;
      o.repository = repo;
      lab = std::make_unique<ivlab::core::LabCoordinator>(cfg, o);
    }

    std::shared_ptr<MemoryLogSink> logSink;
    std::shared_ptr<MemoryResultSink> results;
    std::shared_ptr<MemoryProtocolRepository> repo;
    std::unique_ptr<ivlab::core::LabCoordinator> lab;
  };

  TEST_F(LabCoordinatorTest, ledSweepRunsAndSavesTable) {
    const auto out = lab->runProtocol("iv_sweep", { { "vmax", 8.0 } });
    EXPECT_TRUE(out.at("success").get<bool>()) << out.dump();
    EXPECT_EQ(out.at("steps_completed"), 3);
    EXPECT_EQ(out.at("captured_data").at("iv").at("points"), 41);

    const auto saved = results->saved();
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved[0].request.folder, "/tmp/ivlab-test-data");
    EXPECT_EQ(saved[0].request.filename, "led_iv");
    EXPECT_EQ(saved[0].rows.size(), 41u);

    EXPECT_EQ(lab->status().at("state"), "IDLE");
    EXPECT_FALSE(lab->smuStatus().at("channel_state").at(0).at("output_enabled").get<bool>());

    lab->shutdown();
    EXPECT_TRUE(logSink->contains("engine", "run end"));
    EXPECT_FALSE(lab->smuStatus().at("connected").get<bool>());
  }

  TEST_F(LabCoordinatorTest, missingParameterFaultsAndResetRecovers) {
    const auto out = lab->runProtocol("iv_sweep");
    EXPECT_FALSE(out.at("success").get<bool>());
    EXPECT_THAT(out.at("error").get<std::string>(), HasSubstr("$vmax"));
    EXPECT_EQ(lab->status().at("state"), "ERROR");

    EXPECT_FALSE(lab->arm().at("success").get<bool>());
    EXPECT_EQ(lab->reset().at("state"), "IDLE");
    EXPECT_TRUE(lab->runProtocol("iv_sweep", { { "vmax", 2.0 } }).at("success").get<bool>());
  }

  TEST_F(LabCoordinatorTest, unknownProtocolAndInvalidInlineDocumentAreRejected) {
    EXPECT_FALSE(lab->runProtocol("nope").at("success").get<bool>());
    const auto bad = lab->runInline(document("", { step("wait"), step("NOT VALID") }));
    EXPECT_FALSE(bad.at("success").get<bool>());
    EXPECT_THAT(bad.at("message").get<std::string>(), HasSubstr("step 1"));
    EXPECT_EQ(lab->status().at("state"), "IDLE");
  }

  TEST_F(LabCoordinatorTest, listsCatalogue) {
    const auto cat = lab->listProtocols().at("protocols");
    ASSERT_EQ(cat.size(), 1u);
    EXPECT_EQ(cat[0].at("id"), "iv_sweep");
    EXPECT_EQ(cat[0].at("steps"), 3);
  }

  TEST_F(LabCoordinatorTest, lightCalibrationInstallsCurveForIrradianceSweeps) {
    const auto out = lab->runInline(json::parse(R"({
      "name": "calibrate_then_sweep",
      "steps": [
        {"action": "smu/connect", "params": {"backend": "mock"}},
        {"action": "calibration/run", "params": {"currents": [0.005, 0.01, 0.02], "settle": 0}, "capture_as": "cal"},
        {"action": "smu/sweep",
         "params": {"quantity": "irradiance", "start": 0.0001, "stop": 0.0009, "points": 3}, "capture_as": "irr"}
      ]
    })"));
    ASSERT_TRUE(out.at("success").get<bool>()) << out.dump();
    EXPECT_EQ(out.at("captured_data").at("cal").at("points"), 4);
    EXPECT_TRUE(lab->calibrationStatus().at("loaded").get<bool>());

    const auto& irr = out.at("captured_data").at("irr");
    EXPECT_EQ(irr.at("quantity"), "irradiance");
    EXPECT_EQ(irr.at("source_mode"), "current");
    EXPECT_DOUBLE_EQ(irr.at("results").at(2).at("irradiance").get<double>(), 0.0009);
  }

  TEST_F(LabCoordinatorTest, backgroundRunReportsResult) {
    EXPECT_TRUE(lab->lastResult().is_null());
    const auto started = lab->startProtocol("iv_sweep", { { "vmax", 4.0 } });
    EXPECT_TRUE(started.at("success").get<bool>());
    EXPECT_TRUE(lab->waitForBackgroundRun());
    EXPECT_TRUE(lab->lastResult().at("success").get<bool>());
  }

  TEST_F(LabCoordinatorTest, connectFailureEscalatesToError) {
    // a real SMU on a port that does not exist
    const auto out = lab->runInline(json::parse(R"({
      "name": "no_hardware",
      "steps": [{"action": "smu/connect", "params": {"address": "/dev/ivlab-no-such-port"}}]
    })"));
    EXPECT_FALSE(out.at("success").get<bool>());
    EXPECT_EQ(lab->status().at("state"), "ERROR");
    EXPECT_GE(lab->errorMonitor()->failureCount(), 1u);
  }

} // namespace ivlab::test
