#pragma once

#include <types/device.hpp>
#include <types/errors.hpp>
#include <types/ids.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace bluetray {

// One live connection to a device. Destroying it releases the underlying
// socket or session; close() does the same earlier and is idempotent.
class Link {
public:
    virtual ~Link() = default;

    virtual bool is_open() const = 0;
    virtual void close() = 0;
};

// Platform connect sequence (resolve device, open transport, keep session)
class Transport {
public:
    virtual ~Transport() = default;

    // Returns nullptr on failure with `error` filled in
    virtual std::unique_ptr<Link> open(const DeviceId& id, ConnectError& error) = 0;
};

// Platform query for paired devices
class DeviceSource {
public:
    virtual ~DeviceSource() = default;

    // Returns nullopt on failure with `error` filled in
    virtual std::optional<std::vector<PairedDevice>> query_paired(DiscoveryError& error) = 0;
};

} // namespace bluetray
