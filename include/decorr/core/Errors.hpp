#pragma once

#include <stdexcept>
#include <string>

namespace decorr {

// Error taxonomy for the preprocessing core.
//
// All three derive from std::runtime_error so callers that only care about
// "did it fail" can keep catching std::exception; tests and the driver use the
// concrete types to tell policy violations apart.

// Time index not ascending, or duplicated time values, where the active
// sort / drop_duplicates policy does not allow it.
class OrderingError : public std::runtime_error {
public:
  explicit OrderingError(const std::string& msg) : std::runtime_error(msg) {}
};

// Reference series does not line up with the table it decorrelates, or an
// argument value is out of range.
class ValidationError : public std::runtime_error {
public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// The table's column structure cannot support the requested method
// (e.g. an energy-difference method applied to a derivative table).
class DomainMismatchError : public std::runtime_error {
public:
  explicit DomainMismatchError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace decorr
