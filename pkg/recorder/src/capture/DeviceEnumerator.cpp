// Repository: Segcast-recorder
// Component: Device Enumerator
// Purpose: Ordering rule for input-device lists.
// Copyright (c) 2025 Segcast

#include "segcast/capture/DeviceEnumerator.hpp"

#include <algorithm>
#include <unordered_set>

namespace segcast::capture {

std::vector<std::string> OrderInputDevices(const std::vector<std::string>& names,
                                           const std::string& default_name) {
  std::vector<std::string> out;
  std::unordered_set<std::string> emitted;
  if (!default_name.empty()) {
    out.push_back(default_name);
    emitted.insert(default_name);
  }
  for (const auto& name : names) {
    if (name.empty()) continue;
    if (emitted.insert(name).second) {
      out.push_back(name);
    }
  }
  return out;
}

std::string SelectInputDevice(const std::vector<std::string>& names,
                              const std::string& default_name, const std::string& requested) {
  if (!requested.empty() && std::find(names.begin(), names.end(), requested) != names.end()) {
    return requested;
  }
  return default_name;
}

}  // namespace segcast::capture
