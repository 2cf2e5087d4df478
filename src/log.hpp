#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

namespace interview {

inline bool debug_enabled() {
  static bool enabled = [] {
    const char* env = std::getenv("INTERVIEW_DEBUG");
    if (!env) {
      return false;
    }
    std::string value(env);
    return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
  }();
  return enabled;
}

inline void debug_log(const char* category, const std::string& message) {
  if (debug_enabled()) {
    std::cerr << "[" << category << "] " << message << std::endl;
  }
}

} // namespace interview
