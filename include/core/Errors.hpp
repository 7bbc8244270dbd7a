#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by every ivlab subsystem.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

namespace ivlab {
  namespace core {

    /**
 * @class Error
 * @brief Common base so callers can catch "anything ivlab raised" in one place.
 */
    class Error : public std::runtime_error {
    public:
      explicit Error(const std::string& what) : std::runtime_error(what) {}
    };

    /// Device unreachable, transport broken, or connect timeout expired.
    class ConnectionError : public Error {
    public:
      using Error::Error;
    };

    /// Malformed sweep/list parameters, protocol step or configuration.
    class ValidationError : public Error {
    public:
      using Error::Error;
    };

    /// Operation disallowed in the current run state.
    class StateError : public Error {
    public:
      using Error::Error;
    };

    /// Protocol step names an action nobody registered.
    class ActionNotFoundError : public Error {
    public:
      using Error::Error;
    };

    /// `$name` reference with no captured value behind it.
    class VariableNotFoundError : public Error {
    public:
      using Error::Error;
    };

    /// Cooperative cancellation observed. Not a fault.
    class AbortRequested : public Error {
    public:
      AbortRequested() : Error("abort requested") {}
      using Error::Error;
    };

    /// Instrument reported compliance / overload / fault condition.
    class DeviceFault : public Error {
    public:
      using Error::Error;
    };

    /// Conversion outside the calibrated domain under the strict policy.
    class CalibrationError : public Error {
    public:
      using Error::Error;
    };

    /// Named protocol (or file) is absent from its repository.
    class NotFoundError : public Error {
    public:
      using Error::Error;
    };

  } // namespace core
} // namespace ivlab
