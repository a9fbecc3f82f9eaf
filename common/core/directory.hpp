#pragma once

#include "transport.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace bluetray {

// What to do with a paired device that reports no display name
enum class UnnamedDevicePolicy {
    Fail,         // discovery fails with DiscoveryErrorKind::NameMissing
    Skip,         // device is left out of the list
    UseAddress,   // device id becomes the label
};

std::string_view to_string(UnnamedDevicePolicy policy);
std::optional<UnnamedDevicePolicy> unnamed_policy_from_string(std::string_view s);

// Query the platform for paired devices, in platform order.
// Returns nullopt on failure with `error` filled in.
std::optional<std::vector<DeviceDescriptor>> discover_paired_devices(
    DeviceSource& source, UnnamedDevicePolicy policy, DiscoveryError& error);

// Startup variant: a discovery failure is logged and gives an empty list
std::vector<DeviceDescriptor> load_devices(DeviceSource& source, UnnamedDevicePolicy policy);

} // namespace bluetray
