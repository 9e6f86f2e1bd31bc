#pragma once

// Global application state enum used by the FSM in main.cpp
// and in app_events payloads.

enum class AppState
{
    BootWifi,
    BootTimeSync,
    Watching,
    ConfigMode,
};

const char *app_state_name(AppState state);

// Defined in main.cpp.
extern AppState g_app_state;
