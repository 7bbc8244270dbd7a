#pragma once
/** @file  SweepGenerator.hpp
 *  @brief Source-value lists for sweep and list-sweep operations.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ivlab {
  namespace sweep {

    /// Upper bound on the forward leg, however it is specified.
    constexpr std::size_t kMaxPoints = 100000;

    enum class Distribution { Linear, Log };
    enum class Direction { Ascending, Descending };

    Distribution distributionFromString(const std::string& text);
    Direction directionFromString(const std::string& text);

    /**
 * @struct SweepSpec
 * @brief start / stop plus exactly one of `points` or `step`.
 *
 *  * `step` is only meaningful for linear sweeps.
 *  * `doubleSweep` appends the return leg (turning point not repeated).
 */
    struct SweepSpec {
      double start{ 0.0 };
      double stop{ 0.0 };
      std::optional<std::size_t> points;
      std::optional<double> step;
      Distribution distribution{ Distribution::Linear };
      Direction direction{ Direction::Ascending };
      bool doubleSweep{ false };
      double integrationTime{ 0.0 }; ///< seconds per point; does not affect values

      /// Reads `start, stop, points|step, scale|distribution, direction, double,
      /// integration_time`; throws core::ValidationError on malformed input.
      static SweepSpec fromJson(const nlohmann::json& j);
    };

    /// Throws core::ValidationError if \p spec cannot produce a point list.
    void validate(const SweepSpec& spec);

    /// Number of points the forward leg will contain.
    std::size_t pointCount(const SweepSpec& spec);

    /// Ordered source values; always built start → stop, then flipped if descending.
    std::vector<double> generate(const SweepSpec& spec);

  } // namespace sweep
} // namespace ivlab
