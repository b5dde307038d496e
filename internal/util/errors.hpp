#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace reservation::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PreconditionFailed : public std::runtime_error {
 public:
  PreconditionFailed(const std::string& msg, std::uint32_t required_hours, std::int64_t actual_hours)
      : std::runtime_error(msg), required_hours_(required_hours), actual_hours_(actual_hours) {
  }

  std::uint32_t RequiredHours() const {
    return required_hours_;
  }
  std::int64_t ActualHours() const {
    return actual_hours_;
  }

 private:
  std::uint32_t required_hours_;
  std::int64_t  actual_hours_;
};

class CapacityExhausted : public std::runtime_error {
 public:
  CapacityExhausted(const std::string& msg, std::uint32_t remaining) : std::runtime_error(msg), remaining_(remaining) {
  }

  // Seats left in the slot at commit time, clamped at zero.
  std::uint32_t Remaining() const {
    return remaining_;
  }

 private:
  std::uint32_t remaining_;
};

class TransientConflict : public std::runtime_error {
 public:
  explicit TransientConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace reservation::util
