#include "options.hpp"

#include <charconv>

namespace bluetray {

static bool parse_seconds(std::string_view s, std::chrono::seconds& out) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || value <= 0) {
        return false;
    }
    out = std::chrono::seconds(value);
    return true;
}

std::optional<Options> parse_options(const std::vector<std::string_view>& args,
                                     std::string& error) {
    Options opts;
    bool have_command = false;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (arg.starts_with("--unnamed=")) {
            auto policy = unnamed_policy_from_string(arg.substr(10));
            if (!policy) {
                error = "invalid --unnamed value: " + std::string(arg.substr(10));
                return std::nullopt;
            }
            opts.unnamed_policy = *policy;
        } else if (arg.starts_with("--discovery-timeout=")) {
            if (!parse_seconds(arg.substr(20), opts.discovery_timeout)) {
                error = "invalid --discovery-timeout value: " + std::string(arg.substr(20));
                return std::nullopt;
            }
        } else if (arg == "help" || arg == "--help" || arg == "-h") {
            opts.command = Command::Help;
            return opts;
        } else if (arg.starts_with("-")) {
            error = "unknown option: " + std::string(arg);
            return std::nullopt;
        } else if (!have_command) {
            have_command = true;
            if (arg == "tray") {
                opts.command = Command::Tray;
            } else if (arg == "list") {
                opts.command = Command::List;
            } else if (arg == "connect") {
                opts.command = Command::Connect;
                if (i + 1 >= args.size() || args[i + 1].starts_with("-")) {
                    error = "connect requires a device address";
                    return std::nullopt;
                }
                opts.address = std::string(args[++i]);
            } else {
                error = "unknown command: " + std::string(arg);
                return std::nullopt;
            }
        } else {
            error = "unexpected argument: " + std::string(arg);
            return std::nullopt;
        }
    }

    return opts;
}

std::string usage(std::string_view prog) {
    std::string text = "Usage: ";
    text += prog;
    text += " [command] [options]\n"
            "\n"
            "Commands:\n"
            "  tray                Run the tray icon (default)\n"
            "  list                List paired devices\n"
            "  connect <address>   Connect to one device, then disconnect\n"
            "  help                Show this help\n"
            "\n"
            "Options:\n"
            "  --unnamed=fail|skip|address   Handling of devices without a name\n"
            "                                (default: address)\n"
            "  --discovery-timeout=<sec>     Startup discovery wait (default: 15)\n";
    return text;
}

} // namespace bluetray
