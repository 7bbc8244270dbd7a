// ivlab headers
#include "core/AbortFlag.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "hal/ArduinoRelayBackend.hpp"
#include "hal/MockSmuBackend.hpp"
#include "hal/RelayBackend.hpp"
#include "hal/RelayClient.hpp"
#include "hal/ScpiSmuBackend.hpp"
#include "hal/SmuClient.hpp"
#include "sim/MockBench.hpp"

// ivlab fakes
#include "MockErrorMonitor.hpp"
#include "FakeInstrumentLink.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <thread>

namespace ivlab::test {

  using namespace ivlab::hal;
  using ivlab::core::AbortFlag;
  using ivlab::core::ConnectionError;
  using ivlab::core::DeviceFault;
  using ivlab::core::ErrorMonitor;
  using ivlab::core::ValidationError;
  using testing::ElementsAre;

  //---ScpiSmuBackend------------------------------------------------------------

  class ScpiSmuBackendTest : public ::testing::Test {
  protected:
    void SetUp() override {
      state = std::make_shared<FakeLinkState>();
      state->answers["*IDN?"] = "Keysight Technologies,B2902A,MY0000,3.4";
      state->answers["MEAS:VOLT? (@1)"] = "+7.950000E+00";
      state->answers["MEAS:CURR? (@1)"] = "+2.000000E-02";
      backend = std::make_unique<ScpiSmuBackend>(std::make_unique<FakeInstrumentLink>(state, "smu"), 2, 50.0,
                                                 std::chrono::milliseconds{ 100 });
    }

    std::shared_ptr<FakeLinkState> state;
    std::unique_ptr<ScpiSmuBackend> backend;
  };

  TEST_F(ScpiSmuBackendTest, open_ResetsIdentifiesAndSelectsVoltageMode) {
    backend->open(std::chrono::milliseconds{ 100 });
    EXPECT_THAT(state->sent, ElementsAre("*RST", "*IDN?", "SOUR1:FUNC:MODE VOLT", "SOUR2:FUNC:MODE VOLT"));
    EXPECT_EQ(backend->identify(), "Keysight Technologies,B2902A,MY0000,3.4");
  }

  TEST_F(ScpiSmuBackendTest, channelCommands_UseChannelSuffix) {
    backend->open(std::chrono::milliseconds{ 100 });
    state->sent.clear();

    backend->configure(1, ChannelSettings{ 0.01, Quantity::Current, 0.02 });
    backend->setSourceMode(1, Quantity::Current);
    backend->setValue(1, 0.005);
    backend->setOutput(1, true);

    EXPECT_THAT(state->sent, ElementsAre("SENS1:CURR:PROT 0.01", "SENS1:VOLT:NPLC 1", "SENS1:CURR:NPLC 1",
                                         "SOUR1:FUNC:MODE CURR", "SOUR1:CURR 0.005", "OUTP1 ON"));
  }

  TEST_F(ScpiSmuBackendTest, measure_QueriesVoltageThenCurrent) {
    backend->open(std::chrono::milliseconds{ 100 });
    const auto [v, i] = backend->measure(1);
    EXPECT_DOUBLE_EQ(v, 7.95);
    EXPECT_DOUBLE_EQ(i, 0.02);
  }

  TEST_F(ScpiSmuBackendTest, measure_OverloadIsDeviceFault) {
    state->answers["MEAS:CURR? (@1)"] = "9.9E+37";
    backend->open(std::chrono::milliseconds{ 100 });
    EXPECT_THROW(backend->measure(1), DeviceFault);
  }

  TEST_F(ScpiSmuBackendTest, close_AbortsAndSwitchesEveryOutputOff) {
    backend->open(std::chrono::milliseconds{ 100 });
    state->sent.clear();
    backend->close();
    EXPECT_THAT(state->sent, ElementsAre("ABOR", "OUTP1 OFF", "OUTP2 OFF"));
    EXPECT_FALSE(state->open);
  }

  TEST_F(ScpiSmuBackendTest, channelOutOfRangeOrClosedLinkRejected) {
    EXPECT_THROW(backend->setOutput(1, true), ConnectionError);
    backend->open(std::chrono::milliseconds{ 100 });
    EXPECT_THROW(backend->setOutput(3, true), ValidationError);
  }

  TEST(ScpiSmuBackend, toNplc_ClampsToInstrumentRange) {
    EXPECT_DOUBLE_EQ(ScpiSmuBackend::toNplc(0.02, 50.0), 1.0);
    EXPECT_DOUBLE_EQ(ScpiSmuBackend::toNplc(0.0, 60.0), 0.001);
    EXPECT_DOUBLE_EQ(ScpiSmuBackend::toNplc(10.0, 50.0), 100.0);
  }

  //---SmuClient on the mock bench-------------------------------------------------

  class SmuClientTest : public ::testing::Test {
  protected:
    void SetUp() override {
      sim::MockBenchConfig cfg;
      cfg.photodetector.noiseFloor = 0.0;
      bench = std::make_shared<sim::MockBench>(cfg);
      abortFlag = std::make_shared<AbortFlag>();
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
      auto b = bench;
      client = std::make_unique<SmuClient>(
          [b](BackendKind kind, const std::string&) -> std::unique_ptr<SmuBackend> {
            if (kind != BackendKind::Mock)
              throw ConnectionError("[test] no real SMU attached");
            return std::make_unique<MockSmuBackend>(b);
          },
          abortFlag, errorMonitor);
    }

    std::shared_ptr<sim::MockBench> bench;
    std::shared_ptr<AbortFlag> abortFlag;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::unique_ptr<SmuClient> client;
  };

  TEST_F(SmuClientTest, operationsWithoutSessionThrow) {
    EXPECT_FALSE(client->isConnected());
    EXPECT_THROW(client->measure(), ConnectionError);
    EXPECT_THROW(client->setOutput(true), ConnectionError);
    EXPECT_FALSE(client->status().at("connected").get<bool>());
  }

  TEST_F(SmuClientTest, connectFailureIsReportedAndRethrown) {
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("no real SMU"))).Times(1);
    EXPECT_THROW(client->connect(BackendKind::Real, "/dev/ttyUSB0"), ConnectionError);
    EXPECT_FALSE(client->isConnected());
  }

  TEST_F(SmuClientTest, connectRejectsUnknownChannel) {
    EXPECT_THROW(client->connect(BackendKind::Mock, {}, 3), ValidationError);
  }

  TEST_F(SmuClientTest, ledSweepProducesFullCurveAndSwitchesOutputOff) {
    client->connect(BackendKind::Mock);
    sweep::SweepSpec spec;
    spec.start = 0.0;
    spec.stop = 8.0;
    spec.points = 41;

    const auto result = client->sweep(spec);
    EXPECT_FALSE(result.aborted);
    ASSERT_EQ(result.points.size(), 41u);
    EXPECT_EQ(result.sourceMode, Quantity::Voltage);
    EXPECT_NEAR(result.points.front().current, 0.0, 1e-9);
    EXPECT_GT(result.points.back().current, 20e-3);
    EXPECT_LT(result.points.back().current, 35e-3);
    EXPECT_DOUBLE_EQ(result.points[20].setValue, 4.0);

    const auto st = client->status();
    EXPECT_FALSE(st.at("channel_state").at(0).at("output_enabled").get<bool>());
    EXPECT_DOUBLE_EQ(bench->led().opticalPower(), 0.0);
  }

  TEST_F(SmuClientTest, sweepComplianceCapsLedCurrent) {
    client->connect(BackendKind::Mock);
    SweepOptions opts;
    opts.compliance = 0.005;
    const auto result = client->listSweep({ 6.0, 8.0, 10.0 }, opts);
    for (const auto& p : result.points)
      EXPECT_LE(p.current, 0.005 + 1e-12);
    EXPECT_NEAR(result.points.back().current, 0.005, 1e-9);
  }

  TEST_F(SmuClientTest, abortBeforeFirstPointReturnsEmptyAbortedResult) {
    client->connect(BackendKind::Mock);
    abortFlag->request();
    const auto result = client->listSweep({ 1.0, 2.0, 3.0 });
    EXPECT_TRUE(result.aborted);
    EXPECT_TRUE(result.points.empty());
    EXPECT_FALSE(client->status().at("channel_state").at(0).at("output_enabled").get<bool>());
  }

  TEST_F(SmuClientTest, abortMidSweepKeepsCompletedPoints) {
    client->connect(BackendKind::Mock);
    SweepOptions opts;
    opts.delay = 0.01;
    std::vector<double> values(200, 5.0);

    std::thread stopper([this] {
      std::this_thread::sleep_for(std::chrono::milliseconds{ 100 });
      abortFlag->request();
    });
    const auto result = client->listSweep(values, opts);
    stopper.join();

    EXPECT_TRUE(result.aborted);
    EXPECT_LT(result.points.size(), values.size());
    EXPECT_EQ(result.toJson().at("points"), result.points.size());
  }

  TEST_F(SmuClientTest, currentSourcingGetsConfiguredVoltageLimit) {
    client->setCurrentSourceVoltageLimit(3.0);
    client->connect(BackendKind::Mock);

    SweepOptions opts;
    opts.sourceMode = Quantity::Current;
    const auto result = client->listSweep({ 0.01, 0.02 }, opts);
    ASSERT_EQ(result.points.size(), 2u);
    for (const auto& p : result.points) {
      EXPECT_LE(p.voltage, 3.0 + 1e-9);
      EXPECT_LT(p.current, 0.001); // LED stays below turn-on at 3 V
    }
    const auto ch1 = client->status().at("channel_state").at(0);
    EXPECT_EQ(ch1.at("compliance_type"), "voltage");
    EXPECT_DOUBLE_EQ(ch1.at("compliance").get<double>(), 3.0);
  }

  TEST_F(SmuClientTest, explicitOrExistingVoltageComplianceWins) {
    client->setCurrentSourceVoltageLimit(3.0);
    client->connect(BackendKind::Mock);

    ChannelSettings own;
    own.compliance = 12.0;
    own.complianceType = Quantity::Voltage;
    client->configure(own, 2);
    client->setSourceMode(Quantity::Current, 2);
    EXPECT_DOUBLE_EQ(client->status().at("channel_state").at(1).at("compliance").get<double>(), 12.0);

    client->setSourceMode(Quantity::Current, 1);
    EXPECT_DOUBLE_EQ(client->status().at("channel_state").at(0).at("compliance").get<double>(), 3.0);

    SweepOptions opts;
    opts.sourceMode = Quantity::Current;
    opts.compliance = 10.0;
    client->listSweep({ 0.02 }, opts);
    EXPECT_DOUBLE_EQ(client->status().at("channel_state").at(0).at("compliance").get<double>(), 10.0);
    EXPECT_THROW(client->setCurrentSourceVoltageLimit(-1.0), ValidationError);
  }

  TEST_F(SmuClientTest, invalidSweepRequestsRejectedBeforeTouchingHardware) {
    client->connect(BackendKind::Mock);
    EXPECT_THROW(client->listSweep({}), ValidationError);
    SweepOptions opts;
    opts.compliance = -1.0;
    EXPECT_THROW(client->listSweep({ 1.0 }, opts), ValidationError);
  }

  TEST_F(SmuClientTest, detectorSeesLedThroughTheBench) {
    client->connect(BackendKind::Mock);
    client->setSourceMode(Quantity::Voltage, 2);
    client->setOutput(true, 2);
    const double dark = client->measure(2).current;

    client->setSourceMode(Quantity::Current, 1);
    client->setValue(0.02, 1);
    client->setOutput(true, 1);
    EXPECT_GT(client->measure(2).current, dark);

    client->safeOutputOff();
    EXPECT_EQ(client->measure(2).current, 0.0);
    EXPECT_TRUE(client->isConnected());
  }

  TEST_F(SmuClientTest, safeDisconnectClosesSession) {
    client->connect(BackendKind::Mock);
    client->setOutput(true);
    client->safeDisconnect();
    EXPECT_FALSE(client->isConnected());
    EXPECT_DOUBLE_EQ(bench->led().operatingPoint().current, 0.0);
  }

  //---RelayClient------------------------------------------------------------------

  class RelayClientTest : public ::testing::Test {
  protected:
    void SetUp() override {
      client = std::make_unique<RelayClient>(
          [this](BackendKind, const std::string&) -> std::unique_ptr<RelayBackend> {
            auto b = std::make_unique<MockRelayBackend>();
            backend = b.get(); // raw ptr for assertions
            return b;
          },
          std::make_shared<ErrorMonitor>());
    }

    static std::vector<std::string> describe(const std::vector<MockRelayBackend::Switch>& h, std::size_t from) {
      std::vector<std::string> out;
      for (std::size_t i = from; i < h.size(); ++i)
        out.push_back(std::string(toString(h[i].board)) + ":" + std::to_string(h[i].relay) +
                      (h[i].on ? ":on" : ":off"));
      return out;
    }

    std::unique_ptr<RelayClient> client;
    MockRelayBackend* backend = nullptr;
  };

  TEST_F(RelayClientTest, connectSwitchesEverythingOff) {
    client->connect(BackendKind::Mock);
    ASSERT_NE(backend, nullptr);
    EXPECT_EQ(backend->history().size(),
              static_cast<std::size_t>(RelayClient::kPixelCount + RelayClient::kLedCount));
    for (const auto& sw : backend->history())
      EXPECT_FALSE(sw.on);
  }

  TEST_F(RelayClientTest, pixelSelectionIsExclusive) {
    client->connect(BackendKind::Mock);
    const auto mark = backend->history().size();

    client->selectPixel(2);
    client->selectPixel(2); // already selected
    client->selectPixel(5);
    client->selectLed(0);

    EXPECT_THAT(describe(backend->history(), mark),
                ElementsAre("pixel:2:on", "pixel:2:off", "pixel:5:on", "led:0:on"));
    const auto sel = client->selection();
    EXPECT_EQ(sel.pixel, 5);
    EXPECT_EQ(sel.led, 0);
    EXPECT_EQ(client->status().at("pixel"), 5);
  }

  TEST_F(RelayClientTest, outOfRangeAndDisconnectedRejected) {
    EXPECT_THROW(client->selectPixel(0), ConnectionError);
    client->connect(BackendKind::Mock);
    EXPECT_THROW(client->selectPixel(8), ValidationError);
    EXPECT_THROW(client->selectLed(-1), ValidationError);
    EXPECT_FALSE(client->selection().pixel);
  }

  TEST_F(RelayClientTest, allOffClearsSelection) {
    client->connect(BackendKind::Mock);
    client->selectPixel(1);
    client->allOff();
    EXPECT_FALSE(client->selection().pixel);
    EXPECT_TRUE(client->status().at("pixel").is_null());
  }

  TEST(ArduinoRelayBackend, commandFor_UsesBoardOffsets) {
    EXPECT_EQ(ArduinoRelayBackend::commandFor(RelayBoard::Pixel, 0, true), "101");
    EXPECT_EQ(ArduinoRelayBackend::commandFor(RelayBoard::Pixel, 0, false), "1");
    EXPECT_EQ(ArduinoRelayBackend::commandFor(RelayBoard::Led, 0, true), "11");
    EXPECT_EQ(ArduinoRelayBackend::commandFor(RelayBoard::Led, 3, false), "4");
  }

  TEST(ArduinoRelayBackend, setRelay_SendsOnTheMatchingBoard) {
    auto pixel = std::make_shared<FakeLinkState>();
    auto led = std::make_shared<FakeLinkState>();
    pixel->pending = { "ready" };
    ArduinoRelayBackend backend(std::make_unique<FakeInstrumentLink>(pixel, "pixel"),
                                std::make_unique<FakeInstrumentLink>(led, "led"), std::chrono::milliseconds{ 0 },
                                std::chrono::milliseconds{ 0 });
    backend.open(std::chrono::milliseconds{ 10 });
    EXPECT_TRUE(pixel->pending.empty()); // boot banner drained

    backend.setRelay(RelayBoard::Pixel, 4, true);
    backend.setRelay(RelayBoard::Led, 1, true);
    EXPECT_THAT(pixel->sent, ElementsAre("105"));
    EXPECT_THAT(led->sent, ElementsAre("12"));
  }

  TEST(ArduinoRelayBackend, pixelOnlySetupConnectsAndSkipsLedBoard) {
    auto pixel = std::make_shared<FakeLinkState>();
    auto errorMonitor = std::make_shared<testing::StrictMock<MockErrorMonitor>>();
    RelayClient client(
        [pixel](BackendKind, const std::string&) -> std::unique_ptr<RelayBackend> {
          return std::make_unique<ArduinoRelayBackend>(std::make_unique<FakeInstrumentLink>(pixel, "pixel"), nullptr,
                                                       std::chrono::milliseconds{ 0 }, std::chrono::milliseconds{ 0 });
        },
        errorMonitor);

    ASSERT_NO_THROW(client.connect(BackendKind::Real, "/dev/ttyACM0"));
    EXPECT_TRUE(client.isConnected());
    EXPECT_THAT(pixel->sent, ElementsAre("1", "2", "3", "4", "5", "6", "7", "8"));

    client.selectPixel(3);
    EXPECT_EQ(pixel->sent.back(), "104");
    EXPECT_THROW(client.selectLed(0), ConnectionError);
    EXPECT_FALSE(client.selection().led);

    client.safeDisconnect();
    EXPECT_FALSE(client.isConnected());
    EXPECT_FALSE(pixel->open);
    EXPECT_EQ(pixel->sent.size(), 17u); // connect all-off, select, safe-disconnect all-off
  }

} // namespace ivlab::test
