//
//  ConsoleLogger.h
//  LuaConsole Framework - Diagnostic Console Output
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  Component-prefixed diagnostic output shared by all subsystems.
//  Safe to call from the foreground thread and from worker threads.
//

#ifndef CONSOLE_LOGGER_H
#define CONSOLE_LOGGER_H

#include <string>

namespace LuaConsole {

/**
 * @brief Enable or disable verbose diagnostic output.
 *
 * Errors are always written; this only gates console_log().
 *
 * @param enabled true to enable debug output, false to disable
 */
void console_set_debug_output(bool enabled);

/**
 * @brief Check whether verbose diagnostic output is enabled.
 */
bool console_debug_output_enabled();

/**
 * @brief Write "component: message" to stdout when debug output is enabled.
 */
void console_log(const char* component, const std::string& message);

/**
 * @brief Write "component: ERROR - message" to stderr.
 */
void console_error(const char* component, const std::string& message);

} // namespace LuaConsole

#endif // CONSOLE_LOGGER_H
