/* @file SweepGenerator.cpp
 * @brief linear / logarithmic point lists.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// ivlab headers
#include "core/Errors.hpp"
#include "sweep/SweepGenerator.hpp"

namespace ivlab {
  namespace sweep {

    using core::ValidationError;

    Distribution distributionFromString(const std::string& text) {
      if (text == "linear" || text == "lin")
        return Distribution::Linear;
      if (text == "log" || text == "logarithmic")
        return Distribution::Log;
      throw ValidationError("[Sweep] unknown distribution: " + text);
    }

    Direction directionFromString(const std::string& text) {
      if (text == "ascending" || text == "forward")
        return Direction::Ascending;
      if (text == "descending" || text == "reverse")
        return Direction::Descending;
      throw ValidationError("[Sweep] unknown direction: " + text);
    }

    SweepSpec SweepSpec::fromJson(const nlohmann::json& j) {
      if (!j.is_object())
        throw ValidationError("[Sweep] sweep parameters must be an object");
      try {
        SweepSpec s;
        s.start = j.at("start").get<double>();
        s.stop = j.at("stop").get<double>();
        if (j.contains("points") && !j.at("points").is_null()) {
          const auto& p = j.at("points");
          if (!p.is_number_integer() || p.get<long long>() < 1)
            throw ValidationError("[Sweep] points must be an integer >= 1");
          s.points = p.get<std::size_t>();
        }
        if (j.contains("step") && !j.at("step").is_null())
          s.step = j.at("step").get<double>();
        if (j.contains("distribution"))
          s.distribution = distributionFromString(j.at("distribution").get<std::string>());
        else if (j.contains("scale"))
          s.distribution = distributionFromString(j.at("scale").get<std::string>());
        if (j.contains("direction"))
          s.direction = directionFromString(j.at("direction").get<std::string>());
        s.doubleSweep = j.value("double", false);
        s.integrationTime = j.value("integration_time", 0.0);
        validate(s);
        return s;
      } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("[Sweep] malformed sweep parameters: ") + e.what());
      }
    }

    void validate(const SweepSpec& spec) {
      if (!std::isfinite(spec.start) || !std::isfinite(spec.stop))
        throw ValidationError("[Sweep] start and stop must be finite");
      if (spec.points && spec.step)
        throw ValidationError("[Sweep] give either points or step, not both");
      if (!spec.points && !spec.step)
        throw ValidationError("[Sweep] one of points or step is required");
      if (spec.points && *spec.points < 1)
        throw ValidationError("[Sweep] points must be >= 1");
      if (spec.points && *spec.points > kMaxPoints)
        throw ValidationError("[Sweep] points must be <= " + std::to_string(kMaxPoints));
      if (spec.step) {
        if (!std::isfinite(*spec.step) || *spec.step == 0.0)
          throw ValidationError("[Sweep] step must be finite and nonzero");
        if (spec.distribution == Distribution::Log)
          throw ValidationError("[Sweep] step is not defined for a log sweep, use points");
      }
      if (spec.distribution == Distribution::Log) {
        if (spec.start == 0.0 || spec.stop == 0.0)
          throw ValidationError("[Sweep] log sweep needs nonzero start and stop");
        if ((spec.start < 0.0) != (spec.stop < 0.0))
          throw ValidationError("[Sweep] log sweep needs start and stop of the same sign");
      }
      if (spec.integrationTime < 0.0)
        throw ValidationError("[Sweep] integration_time must be >= 0");
    }

    std::size_t pointCount(const SweepSpec& spec) {
      validate(spec);
      if (spec.points)
        return *spec.points;
      const double span = std::abs(spec.stop - spec.start);
      // tolerate 1e-9 of a step of rounding so 0..1 by 0.1 gives 11 points
      const double intervals = std::floor(span / std::abs(*spec.step) + 1e-9);
      if (!(intervals < static_cast<double>(kMaxPoints)))
        throw ValidationError("[Sweep] step " + std::to_string(*spec.step) + " gives more than " +
                              std::to_string(kMaxPoints) + " points");
      return static_cast<std::size_t>(intervals) + 1;
    }

    std::vector<double> generate(const SweepSpec& spec) {
      const std::size_t n = pointCount(spec);
      std::vector<double> values;
      values.reserve(spec.doubleSweep ? 2 * n : n);

      if (n == 1) {
        values.push_back(spec.start);
      } else if (spec.step) {
        const double inc = spec.stop >= spec.start ? std::abs(*spec.step) : -std::abs(*spec.step);
        for (std::size_t i = 0; i < n; ++i)
          values.push_back(spec.start + static_cast<double>(i) * inc);
      } else if (spec.distribution == Distribution::Linear) {
        const double span = spec.stop - spec.start;
        const double last = static_cast<double>(n - 1);
        for (std::size_t i = 0; i < n; ++i)
          values.push_back(spec.start + span * static_cast<double>(i) / last);
        values.back() = spec.stop;
      } else {
        const double sign = spec.start < 0.0 ? -1.0 : 1.0;
        const double a = std::log(std::abs(spec.start));
        const double b = std::log(std::abs(spec.stop));
        const double last = static_cast<double>(n - 1);
        for (std::size_t i = 0; i < n; ++i) {
          const double t = static_cast<double>(i) / last;
          values.push_back(sign * std::exp(a + (b - a) * t));
        }
        values.front() = spec.start;
        values.back() = spec.stop;
      }

      if (spec.direction == Direction::Descending)
        std::reverse(values.begin(), values.end());

      if (spec.doubleSweep && values.size() > 1) {
        const std::vector<double> back(values.rbegin() + 1, values.rend());
        values.insert(values.end(), back.begin(), back.end());
      }

      return values;
    }

  } // namespace sweep
} // namespace ivlab
