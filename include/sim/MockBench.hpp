#pragma once
/** @file  MockBench.hpp
 *  @brief The simulated optical bench: one LED shining on one photodetector.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <mutex>

#include <nlohmann/json.hpp>

#include "sim/LedModel.hpp"
#include "sim/PhotodetectorModel.hpp"

namespace ivlab {
  namespace sim {

    struct MockBenchConfig {
      LedParameters led{};
      PhotodetectorParameters photodetector{};
      double couplingEfficiency{ 0.1 }; ///< fraction of LED light reaching the detector
      std::uint32_t seed{ 42 };         ///< noise generator seed

      static MockBenchConfig fromJson(const nlohmann::json& j);
    };

    /**
 * @class MockBench
 * @brief Owns the coupled device models shared by every mock SMU session.
 *
 *  * Outlives sessions so the LED operating point survives a reconnect.
 *  * `lock()` serialises channel access across concurrent mock sessions.
 */
    class MockBench {
    public:
      explicit MockBench(const MockBenchConfig& cfg = {});

      LedModel& led() { return *led_; }
      PhotodetectorModel& photodetector() { return *detector_; }

      std::unique_lock<std::mutex> lock() { return std::unique_lock<std::mutex>(mtx_); }

    private:
      std::shared_ptr<LedModel> led_;
      std::unique_ptr<PhotodetectorModel> detector_;
      std::mutex mtx_;
    };

  } // namespace sim
} // namespace ivlab
