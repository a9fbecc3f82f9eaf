#pragma once

#include "directory.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bluetray {

enum class Command {
    Tray,
    List,
    Connect,
    Help,
};

constexpr auto DEFAULT_DISCOVERY_TIMEOUT = std::chrono::seconds(15);

struct Options {
    Command command = Command::Tray;
    std::string address;    // Command::Connect
    UnnamedDevicePolicy unnamed_policy = UnnamedDevicePolicy::UseAddress;
    std::chrono::seconds discovery_timeout = DEFAULT_DISCOVERY_TIMEOUT;
};

// Parse arguments after the program name.
// Returns nullopt with `error` set on bad input.
std::optional<Options> parse_options(const std::vector<std::string_view>& args,
                                     std::string& error);

std::string usage(std::string_view prog);

} // namespace bluetray
