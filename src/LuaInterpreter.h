//
//  LuaInterpreter.h
//  LuaConsole Framework - Persistent Lua Execution Context
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  Owns the lua_State that console input runs in. Chunks execute against an
//  explicit environment table that persists between submissions, and a count
//  hook checks for interruption requests while Lua code runs.
//
//  Only the worker context touches the execution state. classify() uses a
//  separate parser-only state and may be called from any thread.
//

#ifndef LUA_INTERPRETER_H
#define LUA_INTERPRETER_H

#include "ConsoleConfig.h"
#include "Stream.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

extern "C" {
#include <lua.h>
}

namespace LuaConsole {

/**
 * Whether a source text is ready to run or needs more lines
 */
enum class SourceStatus {
    Complete,
    Incomplete
};

/**
 * Outcome of one execution. executed is false when the chunk failed to
 * compile, raised an error or was interrupted.
 */
struct ExecutionResult {
    bool executed;
    std::optional<std::string> value;
};

// Values exchanged with the environment from C++
using ScriptValue = std::variant<std::monostate, bool, long long, double, std::string>;

std::string script_value_to_string(const ScriptValue& value);

class LuaInterpreter {
public:
    LuaInterpreter(Stream& stdin_stream, Stream& stdout_stream, const ConsoleConfig& config);
    ~LuaInterpreter();

    LuaInterpreter(const LuaInterpreter&) = delete;
    LuaInterpreter& operator=(const LuaInterpreter&) = delete;

    // Create both Lua states and install the console bindings
    bool initialize();
    void shutdown();
    bool isInitialized() const { return m_lua != nullptr; }
    const std::string& getLastError() const { return m_last_error; }

    // Incomplete when the only syntax error is an unexpected end of input
    SourceStatus classify(const std::string& source);

    /**
     * Run a chunk in the environment. An expression is tried first
     * ("return <source>"); its non-nil values become the result text.
     * Errors and tracebacks are written to the stdout stream.
     */
    ExecutionResult execute(uint64_t execution_id, const std::string& source);

    /**
     * Request interruption of the given execution. The request is delivered
     * only if that execution is still the one running; it takes effect at
     * the next hook check or blocking call.
     * @return true if delivered
     */
    bool interrupt(uint64_t execution_id);

    uint64_t currentExecution() const;
    bool isInterruptRequested() const { return m_interrupt_requested.load(); }

    // Explicit environment (persists across executions)
    void setLocal(const std::string& name, const ScriptValue& value);
    ScriptValue getLocal(const std::string& name);
    bool hasLocal(const std::string& name);
    std::vector<std::string> localNames();
    void clearLocals();

    // Names reachable from the dotted identifier at the end of the line
    std::vector<std::string> completions(const std::string& line);

    Stream& stdinStream() { return m_stdin; }
    Stream& stdoutStream() { return m_stdout; }
    lua_State* state() { return m_lua; }

    // Interpreter owning a state (set at initialize)
    static LuaInterpreter* fromState(lua_State* L);

    // Raise the interruption error in L (does not return)
    static int raiseInterrupt(lua_State* L);

    // Raise the interruption error if one was requested
    static void checkInterrupt(lua_State* L);

private:
    void registerBindings();
    void createEnvironment();
    void pushEnvironment();
    void pushValue(const ScriptValue& value);
    ScriptValue toValue(int index);

    static void interruptHook(lua_State* L, lua_Debug* ar);

    Stream& m_stdin;
    Stream& m_stdout;
    ConsoleConfig m_config;

    lua_State* m_lua;
    lua_State* m_parser;
    int m_env_ref;

    std::mutex m_parse_mutex;
    mutable std::mutex m_run_mutex;     // Guards m_running_id against interrupt()
    uint64_t m_running_id;
    std::atomic<bool> m_interrupt_requested;

    std::string m_last_error;
};

// Cancellable blocking helpers (sleep, sleep_ms, yield, is_cancelled,
// check_cancellation), defined in LuaBlockingOps.cpp
void register_lua_blocking_ops(lua_State* L);

} // namespace LuaConsole

#endif // LUA_INTERPRETER_H
