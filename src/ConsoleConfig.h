//
//  ConsoleConfig.h
//  LuaConsole Framework - Console Configuration
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  Configuration shared by the console, its streams and the execution
//  engine. Hosts start from create_default_config() and override fields.
//

#ifndef CONSOLE_CONFIG_H
#define CONSOLE_CONFIG_H

#include <string>

namespace LuaConsole {

/**
 * Scheduling model used to run submitted chunks
 */
enum class ExecutionMode {
    Inline,     // Run synchronously on the submitting (foreground) thread
    Queued,     // Run on a later iteration of the foreground command loop
    Threaded,   // Run on a dedicated worker thread
    External    // Run through a host-provided spawn function
};

/**
 * Console initialization configuration
 */
struct ConsoleConfig {
    // Execution configuration
    ExecutionMode execution_mode;
    int hook_instruction_count;     // Lua instructions between cancellation checks
    int shutdown_grace_ms;          // Wait for the worker before joining on exit

    // Stream configuration
    int stdin_poll_interval_ms;     // Cooperative readline polling slice

    // Editing configuration
    int tab_width;
    bool ctrl_d_exits;

    // Prompt formats ("%d" is replaced by the input counter)
    std::string ps1;
    std::string ps2;
    std::string ps_out;

    // Debug configuration
    bool enable_debug_logging;
};

/**
 * Create a default console configuration
 */
ConsoleConfig create_default_config();

/**
 * Check a configuration for values the console cannot work with
 * @param config Configuration to check
 * @param error Receives a description of the first problem found (optional)
 * @return true if the configuration is usable
 */
bool validate_config(const ConsoleConfig& config, std::string* error);

/**
 * Parse an execution mode name ("inline", "queued", "threaded", "external")
 * @return true if the name was recognised
 */
bool parse_execution_mode(const std::string& name, ExecutionMode* mode);

/**
 * Get the lowercase name of an execution mode
 */
const char* execution_mode_name(ExecutionMode mode);

/**
 * Expand a prompt format, replacing every "%d" with the counter value
 */
std::string format_prompt(const std::string& format, int counter);

} // namespace LuaConsole

#endif // CONSOLE_CONFIG_H
