#include "dispatcher.hpp"

#include <iostream>

namespace bluetray {

SelectionDispatcher::SelectionDispatcher(const MenuModel& menu, ConnectionWorker& worker,
                                         DispatcherCallbacks callbacks)
    : menu_(menu), worker_(worker), callbacks_(std::move(callbacks)) {}

Selection SelectionDispatcher::on_selection(MenuItemId id) {
    const MenuEntry* entry = menu_.find(id);
    if (!entry) {
        std::cout << "menu: ignoring unknown item " << id.value() << std::endl;
        return {};
    }

    switch (entry->action) {
        case MenuAction::Quit:
            if (!quit_requested_) {
                quit_requested_ = true;
                std::cout << "menu: quit" << std::endl;
                if (callbacks_.on_quit) callbacks_.on_quit();
            }
            return {SelectionKind::Quit, {}};

        case MenuAction::Device:
            std::cout << "Connecting to " << entry->label << " (" << entry->device.str()
                      << ")..." << std::endl;
            // Result arrives through on_completion
            (void)worker_.submit_connect(entry->device);
            return {SelectionKind::DeviceAction, entry->device};

        case MenuAction::DisconnectAll:
            std::cout << "Disconnecting all devices..." << std::endl;
            (void)worker_.submit_disconnect_all();
            return {SelectionKind::DisconnectAll, {}};

        case MenuAction::About:
            std::cout << APP_NAME << " " << APP_VERSION << " - " << APP_COPYRIGHT << std::endl;
            return {SelectionKind::About, {}};

        case MenuAction::None:
            break;
    }
    return {};
}

void SelectionDispatcher::on_tray_event(const TrayEvent& event) {
    std::cout << "tray: " << event.kind << " at (" << event.x << ", " << event.y << ")"
              << std::endl;
}

void SelectionDispatcher::on_completion(const Completion& completion) {
    std::string label = menu_.label_for(completion.device);

    switch (completion.kind) {
        case RequestKind::Connect:
            if (!completion.connect.ok()) {
                const ConnectError& err = *completion.connect.error;
                std::cerr << "Failed to connect to " << label << ": " << err.reason
                          << " (" << to_string(err.kind) << ")" << std::endl;
                return;
            }
            if (completion.connect.already_connected) {
                std::cout << "Already connected to " << label << std::endl;
                return;
            }
            std::cout << "Connected to " << label << std::endl;
            break;

        case RequestKind::DisconnectAll:
            std::cout << "Disconnected " << completion.released << " device(s)" << std::endl;
            break;
    }

    if (callbacks_.on_connections_changed) callbacks_.on_connections_changed();
}

} // namespace bluetray
