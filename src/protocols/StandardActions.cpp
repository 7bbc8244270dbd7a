/* @file StandardActions.cpp
 * @brief step handlers: JSON params in, JSON capture out.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cmath>
#include <stdexcept>

// ivlab headers
#include "core/Errors.hpp"
#include "protocols/LightCalibration.hpp"
#include "protocols/StandardActions.hpp"
#include "sweep/SweepGenerator.hpp"

namespace ivlab::protocols {

  using core::ValidationError;
  using hal::BackendKind;
  using hal::Quantity;
  using nlohmann::json;

  namespace {

    //---param helpers--------------------------------------------------------

    [[noreturn]] void badParam(const char* key, const std::string& why) {
      throw ValidationError(std::string("[Action] '") + key + "' " + why);
    }

    bool has(const json& p, const char* key) { return p.contains(key) && !p.at(key).is_null(); }

    double number(const json& p, const char* key) {
      if (!has(p, key))
        badParam(key, "is required");
      if (!p.at(key).is_number())
        badParam(key, "must be a number");
      const double v = p.at(key).get<double>();
      if (!std::isfinite(v))
        badParam(key, "must be finite");
      return v;
    }

    double numberOr(const json& p, const char* key, double fallback) {
      return has(p, key) ? number(p, key) : fallback;
    }

    int integer(const json& p, const char* key) {
      if (!has(p, key))
        badParam(key, "is required");
      if (!p.at(key).is_number_integer())
        badParam(key, "must be an integer");
      return p.at(key).get<int>();
    }

    bool flag(const json& p, const char* key, bool fallback) {
      if (!has(p, key))
        return fallback;
      const auto& v = p.at(key);
      if (v.is_boolean())
        return v.get<bool>();
      if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (s == "on" || s == "ON" || s == "true")
          return true;
        if (s == "off" || s == "OFF" || s == "false")
          return false;
      }
      badParam(key, "must be a boolean or on/off");
    }

    std::string text(const json& p, const char* key, const std::string& fallback) {
      if (!has(p, key))
        return fallback;
      if (!p.at(key).is_string())
        badParam(key, "must be a string");
      return p.at(key).get<std::string>();
    }

    std::optional<int> channelOf(const json& p) {
      if (!has(p, "channel"))
        return std::nullopt;
      return integer(p, "channel");
    }

    /// `mock: true` or `backend: "mock" | "real"`; real hardware by default.
    BackendKind backendOf(const json& p) {
      if (has(p, "backend"))
        return hal::backendKindFromString(text(p, "backend", "real"));
      return flag(p, "mock", false) ? BackendKind::Mock : BackendKind::Real;
    }

    std::optional<std::chrono::milliseconds> timeoutOf(const json& p) {
      if (!has(p, "timeout_ms"))
        return std::nullopt;
      const int ms = integer(p, "timeout_ms");
      if (ms < 0)
        badParam("timeout_ms", "must be >= 0");
      return std::chrono::milliseconds{ ms };
    }

    /// Integration time in seconds, from `integration_time` or `nplc`.
    double integrationOf(const json& p, double lineFrequencyHz, double fallback) {
      if (has(p, "integration_time"))
        return number(p, "integration_time");
      if (has(p, "nplc"))
        return number(p, "nplc") / lineFrequencyHz;
      return fallback;
    }

    hal::SweepOptions sweepOptionsOf(const json& p, double lineFrequencyHz) {
      hal::SweepOptions o;
      o.channel = channelOf(p);
      if (has(p, "source_mode"))
        o.sourceMode = hal::quantityFromString(text(p, "source_mode", "voltage"));
      if (has(p, "compliance"))
        o.compliance = number(p, "compliance");
      o.integrationTime = integrationOf(p, lineFrequencyHz, 0.0);
      o.delay = numberOr(p, "delay", 0.0);
      return o;
    }

    template <typename T> T& require(const std::shared_ptr<T>& ptr, const char* what) {
      if (!ptr)
        throw std::logic_error(std::string("[Action] no ") + what + " service configured");
      return *ptr;
    }

    /// Irradiance sweeps source LED current; the table gets an `irradiance` column.
    json runValues(const ActionServices& s, std::vector<double> values, const json& p) {
      auto opts = sweepOptionsOf(p, s.lineFrequencyHz);
      const bool irradiance = text(p, "quantity", "source") == "irradiance";
      if (!irradiance && text(p, "quantity", "source") != "source")
        badParam("quantity", "must be source or irradiance");

      std::vector<double> requested = values;
      if (irradiance) {
        auto& cal = require(s.calibration, "calibration");
        for (auto& v : values)
          v = cal.irradianceToCurrent(v);
        opts.sourceMode = Quantity::Current;
      }

      auto result = require(s.smu, "SMU").listSweep(values, opts).toJson();
      result["quantity"] = irradiance ? "irradiance" : "source";
      if (irradiance) {
        auto& rows = result["results"];
        for (std::size_t i = 0; i < rows.size(); ++i)
          rows[i]["irradiance"] = requested[i];
      }
      return result;
    }

    json tableOf(const json& data) {
      if (data.is_array())
        return data;
      if (data.is_object() && data.contains("results") && data.at("results").is_array())
        return data.at("results");
      badParam("data", "must be a sweep capture or a list of rows");
    }

    void add(ActionRegistry& registry, const std::string& name, ActionRegistry::Handler handler) {
      if (!registry.registerAction(name, std::move(handler)))
        throw std::logic_error("[StandardActions] cannot register " + name);
    }

  } // namespace

  void registerStandardActions(ActionRegistry& registry, const ActionServices& s) {
    if (!s.abortFlag)
      throw std::invalid_argument("[StandardActions] abort flag is required");

    //---wait-----------------------------------------------------------------
    add(registry, "wait", [s](const json& p) -> json {
      double seconds = 0.0;
      if (has(p, "seconds"))
        seconds = number(p, "seconds");
      else if (has(p, "ms"))
        seconds = number(p, "ms") / 1000.0;
      else
        seconds = number(p, "duration");
      if (seconds < 0.0)
        badParam("seconds", "must be >= 0");
      if (!s.abortFlag->sleepFor(std::chrono::duration<double>(seconds)))
        throw core::AbortRequested();
      return { { "waited", seconds } };
    });

    //---smu--------------------------------------------------------------------
    add(registry, "smu/connect", [s](const json& p) -> json {
      auto& smu = require(s.smu, "SMU");
      const auto kind = backendOf(p);
      const auto address = text(p, "address", kind == BackendKind::Mock ? "mock" : s.smuAddress);
      smu.connect(kind, address, has(p, "channel") ? integer(p, "channel") : 1, timeoutOf(p));
      return smu.status();
    });

    add(registry, "smu/disconnect", [s](const json&) -> json {
      require(s.smu, "SMU").disconnect();
      return { { "connected", false } };
    });

    add(registry, "smu/configure", [s](const json& p) -> json {
      hal::ChannelSettings settings;
      settings.compliance = number(p, "compliance");
      settings.complianceType = hal::quantityFromString(text(p, "compliance_type", "current"));
      settings.integrationTime = integrationOf(p, s.lineFrequencyHz, settings.integrationTime);
      require(s.smu, "SMU").configure(settings, channelOf(p));
      return { { "compliance", settings.compliance },
               { "compliance_type", hal::toString(settings.complianceType) },
               { "integration_time", settings.integrationTime } };
    });

    add(registry, "smu/source-mode", [s](const json& p) -> json {
      const auto mode = hal::quantityFromString(text(p, "mode", ""));
      require(s.smu, "SMU").setSourceMode(mode, channelOf(p));
      return { { "mode", hal::toString(mode) } };
    });

    add(registry, "smu/set", [s](const json& p) -> json {
      const double value = number(p, "value");
      require(s.smu, "SMU").setValue(value, channelOf(p));
      return { { "value", value } };
    });

    add(registry, "smu/set-irradiance", [s](const json& p) -> json {
      const double irradiance = number(p, "irradiance");
      const double current = require(s.calibration, "calibration").irradianceToCurrent(irradiance);
      auto& smu = require(s.smu, "SMU");
      smu.setSourceMode(Quantity::Current, channelOf(p));
      smu.setValue(current, channelOf(p));
      return { { "irradiance", irradiance }, { "current", current } };
    });

    add(registry, "smu/output", [s](const json& p) -> json {
      if (!has(p, "enabled") && !has(p, "state"))
        badParam("enabled", "is required");
      const bool enabled = has(p, "enabled") ? flag(p, "enabled", false) : flag(p, "state", false);
      require(s.smu, "SMU").setOutput(enabled, channelOf(p));
      return { { "output_enabled", enabled } };
    });

    add(registry, "smu/measure", [s](const json& p) -> json {
      return require(s.smu, "SMU").measure(channelOf(p)).toJson();
    });

    add(registry, "smu/sweep", [s](const json& p) -> json {
      return runValues(s, sweep::generate(sweep::SweepSpec::fromJson(p)), p);
    });

    add(registry, "smu/list-sweep", [s](const json& p) -> json {
      if (!has(p, "values") || !p.at("values").is_array())
        badParam("values", "must be a list of numbers");
      std::vector<double> values;
      for (const auto& v : p.at("values")) {
        if (!v.is_number())
          badParam("values", "must be a list of numbers");
        values.push_back(v.get<double>());
      }
      return runValues(s, std::move(values), p);
    });

    //---relays-----------------------------------------------------------------
    add(registry, "relays/connect", [s](const json& p) -> json {
      auto& relays = require(s.relays, "relay");
      const auto kind = backendOf(p);
      relays.connect(kind, text(p, "address", kind == BackendKind::Mock ? "mock" : s.relayAddress), timeoutOf(p));
      return relays.status();
    });

    add(registry, "relays/disconnect", [s](const json&) -> json {
      require(s.relays, "relay").disconnect();
      return { { "connected", false } };
    });

    add(registry, "relays/pixel", [s](const json& p) -> json {
      const int pixel = has(p, "pixel") ? integer(p, "pixel") : integer(p, "id");
      auto& relays = require(s.relays, "relay");
      relays.selectPixel(pixel);
      return relays.status();
    });

    add(registry, "relays/led", [s](const json& p) -> json {
      const int led = has(p, "led") ? integer(p, "led") : integer(p, "channel");
      auto& relays = require(s.relays, "relay");
      relays.selectLed(led);
      return relays.status();
    });

    add(registry, "relays/all-off", [s](const json&) -> json {
      auto& relays = require(s.relays, "relay");
      relays.allOff();
      return relays.status();
    });

    add(registry, "relays/status", [s](const json&) -> json { return require(s.relays, "relay").status(); });

    //---calibration--------------------------------------------------------------
    add(registry, "calibration/load", [s](const json& p) -> json {
      auto& cal = require(s.calibration, "calibration");
      if (has(p, "policy"))
        cal.setPolicy(calibration::policyFromString(text(p, "policy", "strict")));
      cal.loadFile(text(p, "path", ""));
      return cal.describe();
    });

    add(registry, "calibration/convert", [s](const json& p) -> json {
      auto& cal = require(s.calibration, "calibration");
      if (has(p, "current")) {
        const double current = number(p, "current");
        return { { "current", current }, { "irradiance", cal.currentToIrradiance(current) } };
      }
      const double irradiance = number(p, "irradiance");
      return { { "current", cal.irradianceToCurrent(irradiance) }, { "irradiance", irradiance } };
    });

    add(registry, "calibration/run", [s](const json& p) -> json {
      return runLightCalibration(require(s.smu, "SMU"), require(s.calibration, "calibration"),
                                 LightCalibrationRequest::fromJson(p), *s.abortFlag);
    });

    //---data---------------------------------------------------------------------
    add(registry, "data/save", [s](const json& p) -> json {
      if (!has(p, "data"))
        badParam("data", "is required");
      io::SaveRequest req;
      req.folder = text(p, "folder", s.dataDir);
      req.filename = text(p, "filename", req.filename);
      req.format = text(p, "format", req.format);
      req.appendTimestamp = flag(p, "append_timestamp", false);
      const auto receipt = require(s.sink, "result sink").save(req, tableOf(p.at("data")));
      if (s.log)
        s.log->log(core::LogLevel::Info, "data", "saved", { { "path", receipt.path }, { "rows", receipt.rows } });
      return { { "path", receipt.path }, { "rows", receipt.rows } };
    });
  }

} // namespace ivlab::protocols
