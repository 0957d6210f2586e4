// Repository: Segcast-recorder
// Component: Device Enumerator
// Purpose: Ordering rule for input-device lists.
// Copyright (c) 2025 Segcast

#ifndef SEGCAST_CAPTURE_DEVICE_ENUMERATOR_HPP_
#define SEGCAST_CAPTURE_DEVICE_ENUMERATOR_HPP_

#include <string>
#include <vector>

namespace segcast::capture {

// Returns `names` with `default_name` (if non-empty) moved to the front.
// The default appears once; other duplicates and empty names are dropped;
// the remaining order is preserved.
std::vector<std::string> OrderInputDevices(const std::vector<std::string>& names,
                                           const std::string& default_name);

// Picks the device to open: `requested` if it is listed, else `default_name`.
// Returns empty when neither is usable.
std::string SelectInputDevice(const std::vector<std::string>& names,
                              const std::string& default_name, const std::string& requested);

}  // namespace segcast::capture

#endif  // SEGCAST_CAPTURE_DEVICE_ENUMERATOR_HPP_
