// tests/test_error_mapping.cpp
#include <gtest/gtest.h>

#include "bluez.hpp"
#include "gatt.hpp"
#include "rfcomm.hpp"

#include <cerrno>
#include <optional>
#include <string>

namespace bluetray {
namespace testing {

struct DBusErrorCase {
    const char* name;
    const char* message;
    ConnectErrorKind expected;
};

TEST(BluezErrorTest, ClassifiesDBusErrors) {
    const DBusErrorCase cases[] = {
        {nullptr, nullptr, ConnectErrorKind::Transport},
        {"org.bluez.Error.DoesNotExist", "Does Not Exist", ConnectErrorKind::UnknownDevice},
        {DBUS_ERROR_UNKNOWN_OBJECT, "No such object", ConnectErrorKind::UnknownDevice},
        {DBUS_ERROR_UNKNOWN_METHOD, "No such method", ConnectErrorKind::UnknownDevice},
        {"org.bluez.Error.NotAuthorized", "Not Authorized", ConnectErrorKind::PermissionDenied},
        {"org.bluez.Error.AuthenticationFailed", "Authentication Failed",
         ConnectErrorKind::PermissionDenied},
        {DBUS_ERROR_ACCESS_DENIED, "Rejected send message", ConnectErrorKind::PermissionDenied},
        {DBUS_ERROR_NO_REPLY, "Did not receive a reply", ConnectErrorKind::Timeout},
        {DBUS_ERROR_TIMEOUT, "Timed out", ConnectErrorKind::Timeout},
        {"org.bluez.Error.AuthenticationTimeout", "Authentication Timeout",
         ConnectErrorKind::Timeout},
        {"org.bluez.Error.Failed", "Host is down", ConnectErrorKind::Unreachable},
        {"org.bluez.Error.Failed", "Page Timeout", ConnectErrorKind::Timeout},
        {"org.bluez.Error.Failed", "br-connection-page-timeout", ConnectErrorKind::Timeout},
        {"org.bluez.Error.Failed", "Connection timed out", ConnectErrorKind::Timeout},
        {"org.bluez.Error.Failed", nullptr, ConnectErrorKind::Unreachable},
        {"org.bluez.Error.NotAvailable", "Operation currently not available",
         ConnectErrorKind::Unreachable},
        {"org.bluez.Error.NotReady", "Resource Not Ready", ConnectErrorKind::Unreachable},
        {"org.bluez.Error.InProgress", "In Progress", ConnectErrorKind::Transport},
        {DBUS_ERROR_SERVICE_UNKNOWN, "org.bluez was not provided", ConnectErrorKind::Transport},
    };

    for (const auto& c : cases) {
        SCOPED_TRACE(std::string(c.name ? c.name : "(null)") + ": " +
                     (c.message ? c.message : "(null)"));
        EXPECT_EQ(bluez::classify_error(c.name, c.message), c.expected);
    }
}

TEST(RfcommErrorTest, ClassifiesErrno) {
    const struct {
        int err;
        ConnectErrorKind expected;
    } cases[] = {
        {EHOSTDOWN, ConnectErrorKind::Unreachable},
        {EHOSTUNREACH, ConnectErrorKind::Unreachable},
        {ECONNREFUSED, ConnectErrorKind::Unreachable},
        {ECONNRESET, ConnectErrorKind::Unreachable},
        {ETIMEDOUT, ConnectErrorKind::Timeout},
        {EACCES, ConnectErrorKind::PermissionDenied},
        {EPERM, ConnectErrorKind::PermissionDenied},
        {EBUSY, ConnectErrorKind::Transport},
        {EAFNOSUPPORT, ConnectErrorKind::Transport},
        {0, ConnectErrorKind::Transport},
    };

    for (const auto& c : cases) {
        SCOPED_TRACE(c.err);
        EXPECT_EQ(rfcomm::classify_errno(c.err), c.expected);
    }
}

TEST(GattResolveTest, ResolvedWinsOverConnectedState) {
    EXPECT_EQ(gatt::resolve_state(true, true), gatt::ResolveState::Resolved);
    EXPECT_EQ(gatt::resolve_state(true, std::nullopt), gatt::ResolveState::Resolved);
}

TEST(GattResolveTest, DroppedLinkIsNotPending) {
    EXPECT_EQ(gatt::resolve_state(false, false), gatt::ResolveState::Dropped);
    EXPECT_EQ(gatt::resolve_state(std::nullopt, false), gatt::ResolveState::Dropped);
}

TEST(GattResolveTest, KeepsWaitingWhileConnectedOrUnknown) {
    EXPECT_EQ(gatt::resolve_state(false, true), gatt::ResolveState::Pending);
    EXPECT_EQ(gatt::resolve_state(std::nullopt, std::nullopt), gatt::ResolveState::Pending);
}

TEST(GattResolveTest, DroppedLinkReportsUnreachableAndDeadlineReportsTimeout) {
    EXPECT_EQ(gatt::resolve_error(gatt::ResolveState::Dropped).kind,
              ConnectErrorKind::Unreachable);
    EXPECT_EQ(gatt::resolve_error(gatt::ResolveState::TimedOut).kind,
              ConnectErrorKind::Timeout);
}

} // namespace testing
} // namespace bluetray
