#include <algorithm>
#include <cctype>

#include "core/Errors.hpp"
#include "hal/SmuTypes.hpp"

namespace ivlab {
  namespace hal {

    const char* toString(BackendKind k) {
      return k == BackendKind::Mock ? "mock" : "real";
    }

    const char* toString(Quantity q) {
      return q == Quantity::Voltage ? "voltage" : "current";
    }

    BackendKind backendKindFromString(const std::string& text) {
      if (text == "mock")
        return BackendKind::Mock;
      if (text == "real")
        return BackendKind::Real;
      throw core::ValidationError("[SMU] unknown backend: " + text);
    }

    Quantity quantityFromString(const std::string& text) {
      std::string t = text;
      std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return std::tolower(c); });
      if (t == "voltage" || t == "volt" || t == "v")
        return Quantity::Voltage;
      if (t == "current" || t == "curr" || t == "i")
        return Quantity::Current;
      throw core::ValidationError("[SMU] unknown quantity: " + text);
    }

    nlohmann::json Measurement::toJson() const {
      return { { "set_value", setValue }, { "voltage", voltage }, { "current", current }, { "timestamp", timestamp } };
    }

    nlohmann::json SweepResult::toJson() const {
      nlohmann::json rows = nlohmann::json::array();
      for (const auto& m : points)
        rows.push_back(m.toJson());
      return { { "points", points.size() }, { "aborted", aborted }, { "source_mode", toString(sourceMode) },
               { "channel", channel },      { "results", std::move(rows) } };
    }

    double epochSeconds(std::chrono::system_clock::time_point tp) {
      return std::chrono::duration<double>(tp.time_since_epoch()).count();
    }

  } // namespace hal
} // namespace ivlab
