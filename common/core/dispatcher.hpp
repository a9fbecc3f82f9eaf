#pragma once

#include "menu.hpp"
#include "worker.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace bluetray {

// Tray icon interaction (activate, context menu, scroll); logged only
struct TrayEvent {
    std::string kind;
    int32_t x = 0;
    int32_t y = 0;
};

enum class SelectionKind {
    Ignored,
    About,
    DeviceAction,
    DisconnectAll,
    Quit,
};

struct Selection {
    SelectionKind kind = SelectionKind::Ignored;
    DeviceId device;    // DeviceAction only
};

struct DispatcherCallbacks {
    // Called once, on the first Quit selection
    std::function<void()> on_quit;
    // Called from on_completion whenever the connected set may have changed
    std::function<void()> on_connections_changed;
};

// Routes menu selections to the connection worker and reports finished
// requests. Lives on the UI thread; nothing here blocks on Bluetooth I/O.
class SelectionDispatcher {
public:
    SelectionDispatcher(const MenuModel& menu, ConnectionWorker& worker,
                        DispatcherCallbacks callbacks);

    Selection on_selection(MenuItemId id);
    void on_tray_event(const TrayEvent& event);
    void on_completion(const Completion& completion);

    bool quit_requested() const { return quit_requested_; }

private:
    const MenuModel& menu_;
    ConnectionWorker& worker_;
    DispatcherCallbacks callbacks_;
    bool quit_requested_ = false;
};

} // namespace bluetray
