#include "rfcomm.hpp"

#include <bluetooth/bluetooth.h>
#include <bluetooth/rfcomm.h>
#include <bluetooth/sdp.h>
#include <bluetooth/sdp_lib.h>

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace rfcomm {

Connection::Connection(Connection&& other) noexcept
    : fd(other.fd), address(std::move(other.address)), service(std::move(other.service)) {
    other.fd = -1;
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        fd = other.fd;
        address = std::move(other.address);
        service = std::move(other.service);
        other.fd = -1;
    }
    return *this;
}

Connection::~Connection() {
    close();
}

void Connection::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bluetray::ConnectErrorKind classify_errno(int err) {
    using bluetray::ConnectErrorKind;

    switch (err) {
        case EHOSTDOWN:
        case EHOSTUNREACH:
        case ECONNREFUSED:
        case ECONNRESET:
            return ConnectErrorKind::Unreachable;
        case ETIMEDOUT:
            return ConnectErrorKind::Timeout;
        case EACCES:
        case EPERM:
            return ConnectErrorKind::PermissionDenied;
        default:
            return ConnectErrorKind::Transport;
    }
}

// RFCOMM channel of one SDP record, or 0 if it has none
static uint8_t record_channel(sdp_record_t* rec) {
    sdp_list_t* proto_list = nullptr;
    if (sdp_get_access_protos(rec, &proto_list) != 0) {
        return 0;
    }

    int channel = sdp_get_proto_port(proto_list, RFCOMM_UUID);

    for (sdp_list_t* p = proto_list; p; p = p->next) {
        sdp_list_free(static_cast<sdp_list_t*>(p->data), nullptr);
    }
    sdp_list_free(proto_list, nullptr);

    return channel > 0 && channel <= 30 ? static_cast<uint8_t>(channel) : 0;
}

bool find_first_service(const std::string& mac_address, ServiceRecord& record,
                        bluetray::ConnectError& error) {
    bdaddr_t target;
    if (str2ba(mac_address.c_str(), &target) < 0) {
        error = {bluetray::ConnectErrorKind::UnknownDevice, "invalid address " + mac_address};
        return false;
    }

    bdaddr_t any = {{0, 0, 0, 0, 0, 0}};
    sdp_session_t* session = sdp_connect(&any, &target, SDP_RETRY_IF_BUSY);
    if (!session) {
        int err = errno;
        std::cerr << "rfcomm: SDP connect failed: " << strerror(err) << std::endl;
        error = {classify_errno(err), std::string("SDP connect failed: ") + strerror(err)};
        return false;
    }

    uuid_t browse_group;
    sdp_uuid16_create(&browse_group, PUBLIC_BROWSE_GROUP);
    sdp_list_t* search_list = sdp_list_append(nullptr, &browse_group);
    uint32_t range = 0x0000ffff;
    sdp_list_t* attrid_list = sdp_list_append(nullptr, &range);
    sdp_list_t* response_list = nullptr;

    int err = sdp_service_search_attr_req(session, search_list,
                                          SDP_ATTR_REQ_RANGE, attrid_list,
                                          &response_list);

    sdp_list_free(attrid_list, nullptr);
    sdp_list_free(search_list, nullptr);

    bool found = false;

    if (err == 0) {
        // Records come back in the order the device lists them
        for (sdp_list_t* r = response_list; r; r = r->next) {
            sdp_record_t* rec = static_cast<sdp_record_t*>(r->data);

            if (!found) {
                uint8_t channel = record_channel(rec);
                if (channel != 0) {
                    char name[256] = {};
                    if (sdp_get_service_name(rec, name, sizeof(name)) != 0) {
                        name[0] = '\0';
                    }
                    record.name = name;
                    record.channel = channel;
                    found = true;
                }
            }
            sdp_record_free(rec);
        }
        sdp_list_free(response_list, nullptr);
    } else {
        std::cerr << "rfcomm: SDP search failed for " << mac_address << std::endl;
    }

    sdp_close(session);

    if (err != 0) {
        error = {bluetray::ConnectErrorKind::Unreachable, "SDP search failed"};
        return false;
    }
    if (!found) {
        error = {bluetray::ConnectErrorKind::NoServices, "no RFCOMM service offered"};
        return false;
    }
    return true;
}

Connection connect(const std::string& mac_address, bluetray::ConnectError& error) {
    // Parse MAC address
    bdaddr_t target;
    if (str2ba(mac_address.c_str(), &target) < 0) {
        std::cerr << "rfcomm: invalid MAC address: " << mac_address << std::endl;
        error = {bluetray::ConnectErrorKind::UnknownDevice, "invalid address " + mac_address};
        return {};
    }

    ServiceRecord service;
    if (!find_first_service(mac_address, service, error)) {
        return {};
    }

    std::cout << "rfcomm: using service '" << service.name << "' on channel "
              << static_cast<int>(service.channel) << std::endl;

    // Create RFCOMM socket
    int sock = socket(AF_BLUETOOTH, SOCK_STREAM | SOCK_CLOEXEC, BTPROTO_RFCOMM);
    if (sock < 0) {
        int err = errno;
        std::cerr << "rfcomm: socket creation failed: " << strerror(err) << std::endl;
        error = {classify_errno(err), std::string("socket: ") + strerror(err)};
        return {};
    }

    // Connect to remote device
    struct sockaddr_rc remote_addr = {};
    remote_addr.rc_family = AF_BLUETOOTH;
    remote_addr.rc_bdaddr = target;
    remote_addr.rc_channel = service.channel;

    if (::connect(sock, reinterpret_cast<struct sockaddr*>(&remote_addr), sizeof(remote_addr)) < 0) {
        int err = errno;
        std::cerr << "rfcomm: connect failed: " << strerror(err) << std::endl;
        error = {classify_errno(err), std::string("connect: ") + strerror(err)};
        ::close(sock);
        return {};
    }

    std::cout << "rfcomm: connected to " << mac_address << std::endl;
    return Connection(sock, mac_address, std::move(service));
}

} // namespace rfcomm
