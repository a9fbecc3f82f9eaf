#pragma once

#include <types/errors.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace rfcomm {

// Service picked from the device's SDP records
struct ServiceRecord {
    std::string name;       // ServiceName attribute, may be empty
    uint8_t channel = 0;    // RFCOMM server channel (1-30)
};

// Open RFCOMM stream socket
struct Connection {
    int fd = -1;
    std::string address;
    ServiceRecord service;

    bool is_open() const { return fd >= 0; }
    void close();

    // Move-only
    Connection() = default;
    Connection(int fd, std::string addr, ServiceRecord svc)
        : fd(fd), address(std::move(addr)), service(std::move(svc)) {}
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
};

// Browse the device's public SDP records and return the first one that
// offers an RFCOMM channel
bool find_first_service(const std::string& mac_address, ServiceRecord& record,
                        bluetray::ConnectError& error);

// Connect to the first RFCOMM service the device offers.
// Returns a closed connection with `error` filled in on failure.
Connection connect(const std::string& mac_address, bluetray::ConnectError& error);

// Map a socket errno to a connect failure kind
bluetray::ConnectErrorKind classify_errno(int err);

} // namespace rfcomm
