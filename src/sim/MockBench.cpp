#include "sim/MockBench.hpp"

using namespace ivlab::sim;

MockBenchConfig MockBenchConfig::fromJson(const nlohmann::json& j) {
  MockBenchConfig cfg;
  if (j.contains("led"))
    cfg.led = LedParameters::fromJson(j.at("led"));
  if (j.contains("photodetector"))
    cfg.photodetector = PhotodetectorParameters::fromJson(j.at("photodetector"));
  cfg.couplingEfficiency = j.value("coupling_efficiency", cfg.couplingEfficiency);
  cfg.seed = j.value("seed", cfg.seed);
  return cfg;
}

MockBench::MockBench(const MockBenchConfig& cfg)
    : led_(std::make_shared<LedModel>(cfg.led)),
      detector_(std::make_unique<PhotodetectorModel>(cfg.photodetector, led_,
                                                     cfg.couplingEfficiency, cfg.seed)) {}
