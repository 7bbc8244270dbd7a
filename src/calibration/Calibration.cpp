/* @file Calibration.cpp
 * @brief piecewise-linear current/irradiance tables.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

// ivlab headers
#include "calibration/Calibration.hpp"
#include "core/Errors.hpp"

namespace ivlab {
  namespace calibration {

    using core::CalibrationError;
    using core::ValidationError;

    namespace {

      bool parseNumber(const std::string& token, double& out) {
        if (token.empty())
          return false;
        errno = 0;
        char* end = nullptr;
        out = std::strtod(token.c_str(), &end);
        return errno == 0 && end == token.c_str() + token.size() && std::isfinite(out);
      }

      std::vector<std::string> splitFields(const std::string& line) {
        std::string normalised = line;
        std::replace(normalised.begin(), normalised.end(), ',', ' ');
        std::replace(normalised.begin(), normalised.end(), '\t', ' ');
        std::replace(normalised.begin(), normalised.end(), ';', ' ');
        std::istringstream ss(normalised);
        std::vector<std::string> fields;
        std::string f;
        while (ss >> f)
          fields.push_back(f);
        return fields;
      }

      double lerp(double x0, double y0, double x1, double y1, double x) {
        if (x1 == x0)
          return y0;
        return y0 + (y1 - y0) * (x - x0) / (x1 - x0);
      }

    } // namespace

    const char* toString(ExtrapolationPolicy p) {
      switch (p) {
      case ExtrapolationPolicy::Strict:
        return "strict";
      case ExtrapolationPolicy::Clamp:
        return "clamp";
      default:
        return "unknown";
      }
    }

    ExtrapolationPolicy policyFromString(const std::string& text) {
      if (text == "strict" || text == "error")
        return ExtrapolationPolicy::Strict;
      if (text == "clamp")
        return ExtrapolationPolicy::Clamp;
      throw ValidationError("[Calibration] unknown extrapolation policy: " + text);
    }

    //---CalibrationCurve---------------------------------------------------

    CalibrationCurve::CalibrationCurve(std::vector<CalibrationSample> samples)
        : samples_(std::move(samples)) {
      if (samples_.size() < 2)
        throw ValidationError("[Calibration] a curve needs at least 2 points");
      for (std::size_t i = 0; i < samples_.size(); ++i) {
        if (!std::isfinite(samples_[i].current) || !std::isfinite(samples_[i].irradiance))
          throw ValidationError("[Calibration] non-finite sample at row " + std::to_string(i));
        if (i == 0)
          continue;
        if (samples_[i].current <= samples_[i - 1].current)
          throw ValidationError("[Calibration] current must be strictly increasing (row " +
                                std::to_string(i) + ")");
        if (samples_[i].irradiance < samples_[i - 1].irradiance)
          throw ValidationError("[Calibration] irradiance must be non-decreasing (row " +
                                std::to_string(i) + ")");
      }
    }

    std::pair<double, double> CalibrationCurve::currentRange() const {
      return { samples_.front().current, samples_.back().current };
    }

    std::pair<double, double> CalibrationCurve::irradianceRange() const {
      return { samples_.front().irradiance, samples_.back().irradiance };
    }

    CalibrationCurve CalibrationCurve::parse(std::istream& in) {
      std::vector<CalibrationSample> rows;
      std::string line;
      std::size_t lineNo = 0;
      bool sawData = false;

      while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r')
          line.pop_back();
        const auto fields = splitFields(line);
        if (fields.empty() || fields.front().front() == '#')
          continue;

        double first = 0.0;
        if (!parseNumber(fields.front(), first)) {
          if (!sawData)
            continue; // header
          throw ValidationError("[Calibration] non-numeric value on line " + std::to_string(lineNo));
        }
        if (fields.size() < 2)
          throw ValidationError("[Calibration] line " + std::to_string(lineNo) +
                                " needs at least 2 columns");

        const std::string& irrField = fields.size() >= 3 ? fields[2] : fields[1];
        double irr = 0.0;
        if (!parseNumber(irrField, irr))
          throw ValidationError("[Calibration] bad irradiance on line " + std::to_string(lineNo));

        rows.push_back(CalibrationSample{ first, irr });
        sawData = true;
      }

      std::sort(rows.begin(), rows.end(),
                [](const CalibrationSample& a, const CalibrationSample& b) { return a.current < b.current; });
      return CalibrationCurve(std::move(rows));
    }

    CalibrationCurve CalibrationCurve::load(const std::string& path) {
      std::ifstream in(path);
      if (!in)
        throw core::NotFoundError("[Calibration] cannot open calibration table: " + path);
      return parse(in);
    }

    void CalibrationCurve::write(std::ostream& out) const {
      out << "LED_Current(A)\tIrradiance(W/cm2)\n";
      out << std::setprecision(10);
      for (const auto& s : samples_)
        out << s.current << '\t' << s.irradiance << '\n';
    }

    void CalibrationCurve::save(const std::string& path) const {
      std::ofstream out(path, std::ios::trunc);
      if (!out)
        throw std::runtime_error("[Calibration] cannot write calibration table: " + path);
      write(out);
      if (!out)
        throw std::runtime_error("[Calibration] write failed: " + path);
    }

    //---CalibrationManager-------------------------------------------------

    CalibrationManager::CalibrationManager(ExtrapolationPolicy policy) : policy_(policy) {}

    void CalibrationManager::install(CalibrationCurve curve) {
      std::lock_guard<std::mutex> lock(mtx_);
      curve_ = std::move(curve);
      source_ = "memory";
    }

    void CalibrationManager::loadFile(const std::string& path) {
      auto curve = CalibrationCurve::load(path);
      std::lock_guard<std::mutex> lock(mtx_);
      curve_ = std::move(curve);
      source_ = path;
    }

    void CalibrationManager::clear() {
      std::lock_guard<std::mutex> lock(mtx_);
      curve_.reset();
      source_.clear();
    }

    bool CalibrationManager::isLoaded() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return curve_.has_value();
    }

    ExtrapolationPolicy CalibrationManager::policy() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return policy_;
    }

    void CalibrationManager::setPolicy(ExtrapolationPolicy policy) {
      std::lock_guard<std::mutex> lock(mtx_);
      policy_ = policy;
    }

    std::optional<CalibrationCurve> CalibrationManager::curve() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return curve_;
    }

    const CalibrationCurve& CalibrationManager::requireCurve() const {
      if (!curve_)
        throw CalibrationError("[Calibration] no calibration loaded");
      return *curve_;
    }

    double CalibrationManager::currentToIrradiance(double current) const {
      std::lock_guard<std::mutex> lock(mtx_);
      const auto& s = requireCurve().samples();
      if (!std::isfinite(current))
        throw CalibrationError("[Calibration] current must be a finite number");

      if (current < s.front().current || current > s.back().current) {
        if (policy_ == ExtrapolationPolicy::Strict) {
          std::ostringstream msg;
          msg << "[Calibration] current " << current << " A outside calibrated range ["
              << s.front().current << ", " << s.back().current << "]";
          throw CalibrationError(msg.str());
        }
        return current < s.front().current ? s.front().irradiance : s.back().irradiance;
      }

      auto hi = std::upper_bound(s.begin(), s.end(), current,
                                 [](double v, const CalibrationSample& x) { return v < x.current; });
      if (hi == s.end())
        return s.back().irradiance;
      auto lo = hi - 1;
      return lerp(lo->current, lo->irradiance, hi->current, hi->irradiance, current);
    }

    double CalibrationManager::irradianceToCurrent(double irradiance) const {
      std::lock_guard<std::mutex> lock(mtx_);
      const auto& s = requireCurve().samples();
      if (!std::isfinite(irradiance))
        throw CalibrationError("[Calibration] irradiance must be a finite number");

      if (irradiance < s.front().irradiance || irradiance > s.back().irradiance) {
        if (policy_ == ExtrapolationPolicy::Strict) {
          std::ostringstream msg;
          msg << "[Calibration] irradiance " << irradiance << " W/cm2 outside calibrated range ["
              << s.front().irradiance << ", " << s.back().irradiance << "]";
          throw CalibrationError(msg.str());
        }
        return irradiance < s.front().irradiance ? s.front().current : s.back().current;
      }

      // first sample whose irradiance reaches the target; plateaus resolve to their lowest current
      auto hi = std::lower_bound(s.begin(), s.end(), irradiance,
                                 [](const CalibrationSample& x, double v) { return x.irradiance < v; });
      if (hi == s.begin() || hi->irradiance == irradiance)
        return hi->current;
      auto lo = hi - 1;
      return lerp(lo->irradiance, lo->current, hi->irradiance, hi->current, irradiance);
    }

    nlohmann::json CalibrationManager::describe() const {
      std::lock_guard<std::mutex> lock(mtx_);
      nlohmann::json j;
      j["loaded"] = curve_.has_value();
      j["policy"] = toString(policy_);
      if (!curve_)
        return j;
      j["source"] = source_;
      j["points"] = curve_->samples().size();
      const auto [c0, c1] = curve_->currentRange();
      const auto [w0, w1] = curve_->irradianceRange();
      j["current_range"] = { c0, c1 };
      j["irradiance_range"] = { w0, w1 };
      return j;
    }

  } // namespace calibration
} // namespace ivlab
