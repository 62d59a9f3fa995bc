#pragma once

#include <stdexcept>
#include <string>

namespace bookrec::storage::common {

/*
  Booking and camera ids become file and object names, so they must be a
  single safe path component.
*/
inline void ValidatePathComponent(const std::string& value, const char* what) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
  for (char c : value) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(what) + " contains invalid character");
    }
  }
  if (value == "." || value == "..") {
    throw std::invalid_argument(std::string(what) + " must not be a relative path component");
  }
}

inline void ValidateBookingId(const std::string& booking_id) {
  ValidatePathComponent(booking_id, "booking id");
}

inline std::string JoinObjectPath(const std::string& root, const std::string& name) {
  if (root.empty()) {
    return name;
  }
  if (root.back() == '/') {
    return root + name;
  }
  return root + "/" + name;
}

} // namespace bookrec::storage::common
