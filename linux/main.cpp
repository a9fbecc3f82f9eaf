#include "backend.hpp"
#include "tray.hpp"

#include <core/directory.hpp>
#include <core/dispatcher.hpp>
#include <core/menu.hpp>
#include <core/options.hpp>
#include <core/registry.hpp>
#include <core/worker.hpp>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string_view>
#include <vector>

using namespace bluetray;

static std::atomic<bool> g_running{true};

// Signal handler
static void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

// Connect to system D-Bus (for BlueZ)
static DBusConnection* connect_system_bus() {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SYSTEM, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to system D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return conn;
}

// Main event loop: session bus (tray) and worker completions
static void run_event_loop(tray::Service& tray_service, ConnectionWorker& worker,
                           SelectionDispatcher& dispatcher) {
    while (g_running) {
        pollfd fds[2] = {};
        fds[0].fd = tray::get_fd(&tray_service);
        fds[0].events = POLLIN;
        fds[1].fd = worker.get_fd();
        fds[1].events = POLLIN;

        // Poll with 100ms timeout
        int ret = poll(fds, 2, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "poll error: " << strerror(errno) << std::endl;
            break;
        }

        // Messages may already be buffered by a blocking call, so always dispatch
        tray::process_pending(&tray_service);

        if (fds[1].revents & POLLIN) {
            for (const auto& completion : worker.take_completions()) {
                dispatcher.on_completion(completion);
            }
        }

        if (dispatcher.quit_requested()) {
            g_running = false;
        }
    }
}

// ============================================================================
// Subcommand implementations
// ============================================================================

static int cmd_tray(const Options& opts) {
    // Set up signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << APP_NAME << " " << APP_VERSION << " starting..." << std::endl;

    DBusConnection* system_bus = connect_system_bus();
    if (!system_bus) return 1;

    bluez::Backend backend(system_bus);
    dbus_connection_unref(system_bus);

    ConnectionRegistry registry(backend);
    ConnectionWorker worker(registry);
    worker.start();

    // Discovery runs on the worker; startup waits a bounded time for it
    auto discovery = worker.submit_discovery(backend, opts.unnamed_policy);
    std::vector<DeviceDescriptor> devices;
    if (discovery.wait_for(opts.discovery_timeout) == std::future_status::ready) {
        devices = discovery.get();
    } else {
        std::cerr << "Device discovery did not finish within "
                  << opts.discovery_timeout.count() << "s, starting with an empty menu"
                  << std::endl;
    }

    MenuModel menu = MenuModel::build(devices);

    tray::Service tray_service;
    tray_service.menu = &menu;

    DispatcherCallbacks callbacks;
    callbacks.on_quit = []() {
        g_running = false;
    };
    callbacks.on_connections_changed = [&tray_service, &registry]() {
        tray::set_connected(&tray_service, registry.connected_ids());
    };
    SelectionDispatcher dispatcher(menu, worker, std::move(callbacks));

    tray_service.callbacks.on_tray_event = [&dispatcher](const TrayEvent& event) {
        dispatcher.on_tray_event(event);
    };
    tray_service.callbacks.on_menu_selected = [&dispatcher](MenuItemId id) {
        dispatcher.on_selection(id);
    };

    if (!tray::init(&tray_service)) {
        std::cerr << "Failed to initialize tray icon" << std::endl;
        tray::cleanup(&tray_service);
        worker.stop();
        return 1;
    }

    std::cout << "Tray ready with " << menu.device_count() << " device(s)" << std::endl;

    // Run event loop
    run_event_loop(tray_service, worker, dispatcher);

    std::cout << "Shutting down..." << std::endl;

    // Queued requests finish first, then every remaining link is released
    worker.stop();
    size_t released = registry.disconnect_all();
    if (released > 0) {
        std::cout << "Released " << released << " connection(s)" << std::endl;
    }

    tray::cleanup(&tray_service);

    std::cout << "Tray stopped" << std::endl;
    return 0;
}

static int cmd_list(const Options& opts) {
    DBusConnection* system_bus = connect_system_bus();
    if (!system_bus) return 1;

    bluez::Backend backend(system_bus);
    dbus_connection_unref(system_bus);

    DiscoveryError error;
    auto devices = discover_paired_devices(backend, opts.unnamed_policy, error);
    if (!devices) {
        std::cerr << "Discovery failed: " << error.reason
                  << " (" << to_string(error.kind) << ")" << std::endl;
        return 1;
    }

    if (devices->empty()) {
        std::cout << "No paired devices" << std::endl;
        return 0;
    }

    for (const auto& device : *devices) {
        std::cout << device.id.str() << "  " << device.name << std::endl;
    }
    return 0;
}

static int cmd_connect(const Options& opts) {
    DBusConnection* system_bus = connect_system_bus();
    if (!system_bus) return 1;

    bluez::Backend backend(system_bus);
    dbus_connection_unref(system_bus);

    ConnectionRegistry registry(backend);
    DeviceId id(opts.address);

    std::cout << "Connecting to " << id.str() << "..." << std::endl;
    ConnectResult result = registry.connect(id);
    if (!result.ok()) {
        std::cerr << "Failed to connect to " << id.str() << ": " << result.error->reason
                  << " (" << to_string(result.error->kind) << ")" << std::endl;
        return 1;
    }

    std::cout << "Connected to " << id.str() << std::endl;
    if (registry.disconnect(id)) {
        std::cout << "Disconnected " << id.str() << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::vector<std::string_view> args(argv + 1, argv + argc);

    std::string error;
    auto opts = parse_options(args, error);
    if (!opts) {
        std::cerr << error << std::endl;
        std::cerr << usage(argv[0]);
        return 1;
    }

    // The worker thread and the UI thread both use libdbus
    if (!dbus_threads_init_default()) {
        std::cerr << "Failed to initialize D-Bus threading" << std::endl;
        return 1;
    }

    switch (opts->command) {
        case Command::Tray:
            return cmd_tray(*opts);
        case Command::List:
            return cmd_list(*opts);
        case Command::Connect:
            return cmd_connect(*opts);
        case Command::Help:
            std::cout << usage(argv[0]);
            return 0;
    }
    return 1;
}
