//
//  ConsoleLogger.cpp
//  LuaConsole Framework - Diagnostic Console Output
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "ConsoleLogger.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace LuaConsole {

static std::atomic<bool> g_debug_output{false};
static std::mutex g_output_mutex; // Keep lines from different threads intact

void console_set_debug_output(bool enabled) {
    g_debug_output = enabled;
}

bool console_debug_output_enabled() {
    return g_debug_output.load();
}

void console_log(const char* component, const std::string& message) {
    if (!g_debug_output.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << component << ": " << message << std::endl;
}

void console_error(const char* component, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << component << ": ERROR - " << message << std::endl;
}

} // namespace LuaConsole
