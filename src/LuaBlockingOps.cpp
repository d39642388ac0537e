//
//  LuaBlockingOps.cpp
//  LuaConsole Framework - Cancellable Lua Blocking Operations
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  Blocking calls never sleep through an interrupt request: they poll the
//  owning interpreter every 10ms and raise the interruption error.
//

#include "LuaInterpreter.h"

extern "C" {
#include <lauxlib.h>
}

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <thread>

namespace LuaConsole {

static const double kMaxSleepMs = 9007199254740992.0;  // 2^53

// ============================================================================
// MARK: - Helper Functions
// ============================================================================

static bool is_cancelled(lua_State* L) {
    LuaInterpreter* interpreter = LuaInterpreter::fromState(L);
    return interpreter && interpreter->isInterruptRequested();
}

// Cancellable sleep with polling
static bool cancellable_sleep_ms(lua_State* L, uint64_t milliseconds, uint64_t poll_interval_ms = 10) {
    auto start = std::chrono::steady_clock::now();

    while (true) {
        if (is_cancelled(L)) {
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        uint64_t elapsed_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

        if (elapsed_ms >= milliseconds) {
            return true;
        }

        uint64_t sleep_ms = std::min(milliseconds - elapsed_ms, poll_interval_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
    }
}

// ============================================================================
// MARK: - Lua Bindings
// ============================================================================

/**
 * sleep(seconds) - Sleep for N seconds
 */
static int lua_console_sleep(lua_State* L) {
    double seconds = luaL_checknumber(L, 1);

    if (!std::isfinite(seconds)) {
        return luaL_argerror(L, 1, "finite number expected");
    }
    if (seconds <= 0) {
        return 0;
    }

    // Keep the conversion inside the range of uint64_t
    double milliseconds = std::min(seconds * 1000.0, kMaxSleepMs);
    if (!cancellable_sleep_ms(L, static_cast<uint64_t>(milliseconds))) {
        return LuaInterpreter::raiseInterrupt(L);
    }
    return 0;
}

/**
 * sleep_ms(milliseconds) - Sleep for N milliseconds
 */
static int lua_console_sleep_ms(lua_State* L) {
    lua_Integer milliseconds = luaL_checkinteger(L, 1);

    if (milliseconds <= 0) {
        return 0;
    }

    if (!cancellable_sleep_ms(L, static_cast<uint64_t>(milliseconds))) {
        return LuaInterpreter::raiseInterrupt(L);
    }
    return 0;
}

/**
 * yield() - Cooperative yield point
 */
static int lua_console_yield(lua_State* L) {
    LuaInterpreter::checkInterrupt(L);
    std::this_thread::yield();
    return 0;
}

static int lua_console_is_cancelled(lua_State* L) {
    lua_pushboolean(L, is_cancelled(L) ? 1 : 0);
    return 1;
}

/**
 * check_cancellation() - Raise the interruption error if requested
 */
static int lua_console_check_cancellation(lua_State* L) {
    LuaInterpreter::checkInterrupt(L);
    return 0;
}

void register_lua_blocking_ops(lua_State* L) {
    lua_register(L, "sleep", lua_console_sleep);
    lua_register(L, "sleep_ms", lua_console_sleep_ms);
    lua_register(L, "yield", lua_console_yield);
    lua_register(L, "is_cancelled", lua_console_is_cancelled);
    lua_register(L, "check_cancellation", lua_console_check_cancellation);
}

} // namespace LuaConsole
