//
//  ConsoleConfig.cpp
//  LuaConsole Framework - Console Configuration
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "ConsoleConfig.h"

namespace LuaConsole {

ConsoleConfig create_default_config() {
    ConsoleConfig config = {};

    // Execution defaults
    config.execution_mode = ExecutionMode::Inline;
    config.hook_instruction_count = 1000;
    config.shutdown_grace_ms = 500;

    // Stream defaults
    config.stdin_poll_interval_ms = 10;

    // Editing defaults
    config.tab_width = 4;
    config.ctrl_d_exits = false;

    // Prompt defaults
    config.ps1 = "IN [%d]: ";
    config.ps2 = "...: ";
    config.ps_out = "OUT[%d]: ";

    // Debug defaults
    config.enable_debug_logging = false;

    return config;
}

bool validate_config(const ConsoleConfig& config, std::string* error) {
    std::string problem;

    if (config.tab_width <= 0) {
        problem = "tab_width must be positive";
    } else if (config.hook_instruction_count <= 0) {
        problem = "hook_instruction_count must be positive";
    } else if (config.stdin_poll_interval_ms <= 0) {
        problem = "stdin_poll_interval_ms must be positive";
    } else if (config.shutdown_grace_ms < 0) {
        problem = "shutdown_grace_ms must not be negative";
    } else if (config.ps1.find('\n') != std::string::npos ||
               config.ps2.find('\n') != std::string::npos ||
               config.ps_out.find('\n') != std::string::npos) {
        problem = "prompt formats must be single-line";
    }

    if (problem.empty()) {
        return true;
    }
    if (error) {
        *error = problem;
    }
    return false;
}

bool parse_execution_mode(const std::string& name, ExecutionMode* mode) {
    ExecutionMode parsed;
    if (name == "inline") {
        parsed = ExecutionMode::Inline;
    } else if (name == "queued") {
        parsed = ExecutionMode::Queued;
    } else if (name == "threaded") {
        parsed = ExecutionMode::Threaded;
    } else if (name == "external") {
        parsed = ExecutionMode::External;
    } else {
        return false;
    }

    if (mode) {
        *mode = parsed;
    }
    return true;
}

const char* execution_mode_name(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Inline:   return "inline";
        case ExecutionMode::Queued:   return "queued";
        case ExecutionMode::Threaded: return "threaded";
        case ExecutionMode::External: return "external";
    }
    return "unknown";
}

std::string format_prompt(const std::string& format, int counter) {
    std::string result;
    result.reserve(format.size() + 8);

    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] == '%' && i + 1 < format.size() && format[i + 1] == 'd') {
            result += std::to_string(counter);
            ++i;
        } else {
            result += format[i];
        }
    }
    return result;
}

} // namespace LuaConsole
