#include "directory.hpp"

#include <iostream>

namespace bluetray {

std::string_view to_string(UnnamedDevicePolicy policy) {
    switch (policy) {
        case UnnamedDevicePolicy::Fail: return "fail";
        case UnnamedDevicePolicy::Skip: return "skip";
        case UnnamedDevicePolicy::UseAddress: return "address";
    }
    return "unknown";
}

std::optional<UnnamedDevicePolicy> unnamed_policy_from_string(std::string_view s) {
    if (s == "fail") return UnnamedDevicePolicy::Fail;
    if (s == "skip") return UnnamedDevicePolicy::Skip;
    if (s == "address" || s == "id") return UnnamedDevicePolicy::UseAddress;
    return std::nullopt;
}

std::optional<std::vector<DeviceDescriptor>> discover_paired_devices(
    DeviceSource& source, UnnamedDevicePolicy policy, DiscoveryError& error) {
    auto paired = source.query_paired(error);
    if (!paired) {
        return std::nullopt;
    }

    std::vector<DeviceDescriptor> result;
    result.reserve(paired->size());

    for (auto& dev : *paired) {
        if (dev.name && !dev.name->empty()) {
            result.push_back({dev.id, std::move(*dev.name)});
            continue;
        }

        switch (policy) {
            case UnnamedDevicePolicy::Fail:
                error.kind = DiscoveryErrorKind::NameMissing;
                error.reason = "device " + dev.id.str() + " has no name";
                return std::nullopt;
            case UnnamedDevicePolicy::Skip:
                std::cout << "directory: skipping unnamed device " << dev.id.str() << std::endl;
                break;
            case UnnamedDevicePolicy::UseAddress:
                result.push_back({dev.id, dev.id.str()});
                break;
        }
    }

    return result;
}

std::vector<DeviceDescriptor> load_devices(DeviceSource& source, UnnamedDevicePolicy policy) {
    DiscoveryError err;
    auto devices = discover_paired_devices(source, policy, err);
    if (!devices) {
        std::cerr << "directory: discovery failed (" << to_string(err.kind) << "): "
                  << err.reason << std::endl;
        return {};
    }

    std::cout << "directory: " << devices->size() << " paired device(s)" << std::endl;
    return std::move(*devices);
}

} // namespace bluetray
