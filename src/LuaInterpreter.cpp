//
//  LuaInterpreter.cpp
//  LuaConsole Framework - Persistent Lua Execution Context
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "LuaInterpreter.h"
#include "ConsoleLogger.h"

extern "C" {
#include <lualib.h>
#include <lauxlib.h>
}

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

namespace LuaConsole {

// Registry keys and the interruption error object (addresses only)
static const char kInterpreterKey = 'I';
static const char kInterruptSentinel = 'X';

static const char* kChunkName = "=stdin";
static const char* kEofMark = "<eof>";

std::string script_value_to_string(const ScriptValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return "nil";
    }
    if (const bool* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const long long* i = std::get_if<long long>(&value)) {
        return std::to_string(*i);
    }
    if (const double* d = std::get_if<double>(&value)) {
        std::ostringstream out;
        out << *d;
        return out.str();
    }
    return std::get<std::string>(value);
}

// ============================================================================
// Lua bindings
// ============================================================================

// Error handler: keeps the interruption object, adds a traceback to the rest
static int console_message_handler(lua_State* L) {
    if (lua_touserdata(L, 1) == &kInterruptSentinel) {
        return 1;
    }

    const char* msg = lua_tostring(L, 1);
    if (msg == nullptr) {
        if (luaL_callmeta(L, 1, "__tostring") && lua_type(L, -1) == LUA_TSTRING) {
            return 1;
        }
        msg = lua_pushfstring(L, "(error object is a %s value)", luaL_typename(L, 1));
    }
    luaL_traceback(L, L, msg, 1);
    return 1;
}

// Converts every argument with tostring semantics, returns the strings
static int console_stringify(lua_State* L) {
    int n = lua_gettop(L);
    for (int i = 1; i <= n; ++i) {
        luaL_tolstring(L, i, nullptr);
    }
    return n;
}

// print(...) - tab separated, newline terminated, to the console stdout
static int console_print(lua_State* L) {
    int n = lua_gettop(L);
    for (int i = 1; i <= n; ++i) {
        if (i > 1) {
            lua_pushliteral(L, "\t");
        }
        luaL_tolstring(L, i, nullptr);
    }
    lua_pushliteral(L, "\n");
    lua_concat(L, lua_gettop(L) - n);

    size_t len = 0;
    const char* text = lua_tolstring(L, -1, &len);
    LuaInterpreter::fromState(L)->stdoutStream().write(std::string(text, len));
    return 0;
}

// io.write(...) - strings and numbers only
static int console_io_write(lua_State* L) {
    int n = lua_gettop(L);
    if (n == 0) {
        return 0;
    }
    for (int i = 1; i <= n; ++i) {
        luaL_checklstring(L, i, nullptr);
    }
    lua_concat(L, n);

    size_t len = 0;
    const char* text = lua_tolstring(L, -1, &len);
    LuaInterpreter::fromState(L)->stdoutStream().write(std::string(text, len));
    return 0;
}

// io.read([fmt...]) - "l", "L" and "n" from the console stdin
static int console_io_read(lua_State* L) {
    LuaInterpreter* self = LuaInterpreter::fromState(L);

    int nargs = lua_gettop(L);
    if (nargs == 0) {
        lua_pushliteral(L, "l");
        nargs = 1;
    }

    int pushed = 0;
    for (int arg = 1; arg <= nargs; ++arg) {
        const char* fmt = luaL_checkstring(L, arg);
        if (*fmt == '*') {
            fmt++;   // Lua 5.1 style "*l"
        }
        if (*fmt != 'l' && *fmt != 'L' && *fmt != 'n') {
            return luaL_argerror(L, arg, "invalid format");
        }

        LuaInterpreter::checkInterrupt(L);

        bool interrupted = false;
        bool eof = false;
        {
            ReadResult result = self->stdinStream().readline(true);
            if (result.status == ReadStatus::Interrupted || self->isInterruptRequested()) {
                interrupted = true;
            } else if (result.status != ReadStatus::Line) {
                eof = true;
            } else {
                std::string& line = result.text;
                if (*fmt == 'L') {
                    line += '\n';
                }
                if (*fmt == 'n') {
                    if (lua_stringtonumber(L, line.c_str()) == 0) {
                        lua_pushnil(L);
                    }
                } else {
                    lua_pushlstring(L, line.data(), line.size());
                }
            }
        }

        if (interrupted) {
            return LuaInterpreter::raiseInterrupt(L);
        }
        if (eof) {
            lua_pushnil(L);
            return pushed + 1;
        }
        pushed++;
        if (lua_isnil(L, -1)) {
            return pushed;
        }
    }
    return pushed;
}

// ============================================================================
// LuaInterpreter
// ============================================================================

LuaInterpreter::LuaInterpreter(Stream& stdin_stream, Stream& stdout_stream, const ConsoleConfig& config)
    : m_stdin(stdin_stream)
    , m_stdout(stdout_stream)
    , m_config(config)
    , m_lua(nullptr)
    , m_parser(nullptr)
    , m_env_ref(LUA_NOREF)
    , m_running_id(0)
    , m_interrupt_requested(false)
{
}

LuaInterpreter::~LuaInterpreter() {
    shutdown();
}

bool LuaInterpreter::initialize() {
    if (m_lua) {
        return true;
    }

    console_log("LuaInterpreter", "Initializing persistent Lua state");

    m_lua = luaL_newstate();
    if (!m_lua) {
        m_last_error = "Failed to create Lua state";
        console_error("LuaInterpreter", m_last_error);
        return false;
    }

    m_parser = luaL_newstate();
    if (!m_parser) {
        m_last_error = "Failed to create parser state";
        console_error("LuaInterpreter", m_last_error);
        lua_close(m_lua);
        m_lua = nullptr;
        return false;
    }

    luaL_openlibs(m_lua);

    lua_pushlightuserdata(m_lua, this);
    lua_rawsetp(m_lua, LUA_REGISTRYINDEX, &kInterpreterKey);

    registerBindings();
    createEnvironment();

    lua_sethook(m_lua, interruptHook, LUA_MASKCOUNT, m_config.hook_instruction_count);

    console_log("LuaInterpreter", "Lua state initialized successfully");
    return true;
}

void LuaInterpreter::shutdown() {
    if (m_lua) {
        lua_close(m_lua);
        m_lua = nullptr;
        m_env_ref = LUA_NOREF;
        console_log("LuaInterpreter", "Lua state shut down");
    }
    std::lock_guard<std::mutex> lock(m_parse_mutex);
    if (m_parser) {
        lua_close(m_parser);
        m_parser = nullptr;
    }
}

void LuaInterpreter::registerBindings() {
    lua_register(m_lua, "print", console_print);

    lua_getglobal(m_lua, "io");
    if (lua_istable(m_lua, -1)) {
        lua_pushcfunction(m_lua, console_io_write);
        lua_setfield(m_lua, -2, "write");
        lua_pushcfunction(m_lua, console_io_read);
        lua_setfield(m_lua, -2, "read");
    }
    lua_pop(m_lua, 1);

    register_lua_blocking_ops(m_lua);
}

void LuaInterpreter::createEnvironment() {
    lua_newtable(m_lua);                 // environment
    lua_newtable(m_lua);                 // its metatable
    lua_pushglobaltable(m_lua);
    lua_setfield(m_lua, -2, "__index");
    lua_setmetatable(m_lua, -2);
    m_env_ref = luaL_ref(m_lua, LUA_REGISTRYINDEX);
}

void LuaInterpreter::pushEnvironment() {
    lua_rawgeti(m_lua, LUA_REGISTRYINDEX, m_env_ref);
}

LuaInterpreter* LuaInterpreter::fromState(lua_State* L) {
    lua_rawgetp(L, LUA_REGISTRYINDEX, &kInterpreterKey);
    LuaInterpreter* self = static_cast<LuaInterpreter*>(lua_touserdata(L, -1));
    lua_pop(L, 1);
    return self;
}

int LuaInterpreter::raiseInterrupt(lua_State* L) {
    lua_pushlightuserdata(L, const_cast<char*>(&kInterruptSentinel));
    return lua_error(L);
}

void LuaInterpreter::checkInterrupt(lua_State* L) {
    LuaInterpreter* self = fromState(L);
    if (self && self->m_interrupt_requested.load()) {
        raiseInterrupt(L);
    }
}

void LuaInterpreter::interruptHook(lua_State* L, lua_Debug* ar) {
    (void)ar;
    checkInterrupt(L);
}

SourceStatus LuaInterpreter::classify(const std::string& source) {
    std::lock_guard<std::mutex> lock(m_parse_mutex);
    if (!m_parser) {
        return SourceStatus::Complete;
    }

    std::string expression = "return " + source;
    int status = luaL_loadbuffer(m_parser, expression.c_str(), expression.size(), kChunkName);
    lua_pop(m_parser, 1);
    if (status == LUA_OK) {
        return SourceStatus::Complete;
    }

    status = luaL_loadbuffer(m_parser, source.c_str(), source.size(), kChunkName);
    SourceStatus result = SourceStatus::Complete;
    if (status == LUA_ERRSYNTAX) {
        size_t len = 0;
        const char* msg = lua_tolstring(m_parser, -1, &len);
        size_t mark = std::strlen(kEofMark);
        if (msg && len >= mark && std::strcmp(msg + len - mark, kEofMark) == 0) {
            result = SourceStatus::Incomplete;
        }
    }
    lua_pop(m_parser, 1);
    return result;
}

ExecutionResult LuaInterpreter::execute(uint64_t execution_id, const std::string& source) {
    ExecutionResult result{false, std::nullopt};

    if (!m_lua) {
        m_stdout.write("Lua state not initialized\n");
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(m_run_mutex);
        m_running_id = execution_id;
        m_interrupt_requested = false;
        m_stdin.clear_interrupt();
    }

    console_log("LuaInterpreter", "Executing #" + std::to_string(execution_id));

    int base = lua_gettop(m_lua);
    lua_pushcfunction(m_lua, console_message_handler);
    int handler = base + 1;

    std::string expression = "return " + source;
    int status = luaL_loadbuffer(m_lua, expression.c_str(), expression.size(), kChunkName);
    if (status != LUA_OK) {
        lua_pop(m_lua, 1);
        status = luaL_loadbuffer(m_lua, source.c_str(), source.size(), kChunkName);
    }

    if (status == LUA_OK) {
        // Main chunks have _ENV as their only upvalue
        pushEnvironment();
        if (!lua_setupvalue(m_lua, -2, 1)) {
            lua_pop(m_lua, 1);
        }
        status = lua_pcall(m_lua, 0, LUA_MULTRET, handler);
    }

    if (status == LUA_OK) {
        int nresults = lua_gettop(m_lua) - handler;
        result.executed = true;
        if (nresults > 0 && !(nresults == 1 && lua_isnil(m_lua, -1))) {
            lua_pushcfunction(m_lua, console_stringify);
            lua_insert(m_lua, handler + 1);
            if (lua_pcall(m_lua, nresults, nresults, handler) == LUA_OK) {
                std::string joined;
                for (int i = 0; i < nresults; ++i) {
                    size_t len = 0;
                    const char* text = lua_tolstring(m_lua, handler + 1 + i, &len);
                    if (i > 0) {
                        joined += '\t';
                    }
                    joined.append(text ? text : "", text ? len : 0);
                }
                result.value = joined;
            } else {
                status = LUA_ERRRUN;
                result.executed = false;
            }
        }
    }

    if (status != LUA_OK) {
        result.executed = false;
        if (lua_touserdata(m_lua, -1) == &kInterruptSentinel || m_interrupt_requested.load()) {
            m_stdout.write("interrupted!\n");
            console_log("LuaInterpreter", "Execution #" + std::to_string(execution_id) + " interrupted");
        } else {
            size_t len = 0;
            const char* msg = lua_tolstring(m_lua, -1, &len);
            std::string text = msg ? std::string(msg, len) : std::string("(error object is not a string)");
            m_stdout.write(text + "\n");
            console_log("LuaInterpreter", "Execution failed: " + text);
        }
    }

    lua_settop(m_lua, base);

    {
        std::lock_guard<std::mutex> lock(m_run_mutex);
        m_running_id = 0;
        m_interrupt_requested = false;
        m_stdin.clear_interrupt();
    }
    return result;
}

bool LuaInterpreter::interrupt(uint64_t execution_id) {
    std::lock_guard<std::mutex> lock(m_run_mutex);
    if (execution_id == 0 || m_running_id != execution_id) {
        console_log("LuaInterpreter", "Interrupt for #" + std::to_string(execution_id) +
                    " not delivered (running #" + std::to_string(m_running_id) + ")");
        return false;
    }
    m_interrupt_requested = true;
    m_stdin.interrupt_readers();
    console_log("LuaInterpreter", "Interrupt delivered to #" + std::to_string(execution_id));
    return true;
}

uint64_t LuaInterpreter::currentExecution() const {
    std::lock_guard<std::mutex> lock(m_run_mutex);
    return m_running_id;
}

// ============================================================================
// Environment
// ============================================================================

void LuaInterpreter::pushValue(const ScriptValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) {
        lua_pushboolean(m_lua, *b ? 1 : 0);
    } else if (const long long* i = std::get_if<long long>(&value)) {
        lua_pushinteger(m_lua, static_cast<lua_Integer>(*i));
    } else if (const double* d = std::get_if<double>(&value)) {
        lua_pushnumber(m_lua, static_cast<lua_Number>(*d));
    } else if (const std::string* s = std::get_if<std::string>(&value)) {
        lua_pushlstring(m_lua, s->data(), s->size());
    } else {
        lua_pushnil(m_lua);
    }
}

ScriptValue LuaInterpreter::toValue(int index) {
    switch (lua_type(m_lua, index)) {
        case LUA_TBOOLEAN:
            return lua_toboolean(m_lua, index) != 0;
        case LUA_TNUMBER:
            if (lua_isinteger(m_lua, index)) {
                return static_cast<long long>(lua_tointeger(m_lua, index));
            }
            return static_cast<double>(lua_tonumber(m_lua, index));
        case LUA_TSTRING: {
            size_t len = 0;
            const char* text = lua_tolstring(m_lua, index, &len);
            return std::string(text, len);
        }
        case LUA_TNIL:
        case LUA_TNONE:
            return std::monostate();
        default: {
            // Tables, functions and userdata come back as their description
            std::ostringstream out;
            out << luaL_typename(m_lua, index) << ": " << lua_topointer(m_lua, index);
            return out.str();
        }
    }
}

void LuaInterpreter::setLocal(const std::string& name, const ScriptValue& value) {
    if (!m_lua) {
        return;
    }
    pushEnvironment();
    lua_pushlstring(m_lua, name.data(), name.size());
    pushValue(value);
    lua_rawset(m_lua, -3);
    lua_pop(m_lua, 1);
}

ScriptValue LuaInterpreter::getLocal(const std::string& name) {
    if (!m_lua) {
        return std::monostate();
    }
    pushEnvironment();
    lua_pushlstring(m_lua, name.data(), name.size());
    lua_rawget(m_lua, -2);
    ScriptValue value = toValue(-1);
    lua_pop(m_lua, 2);
    return value;
}

bool LuaInterpreter::hasLocal(const std::string& name) {
    if (!m_lua) {
        return false;
    }
    pushEnvironment();
    lua_pushlstring(m_lua, name.data(), name.size());
    bool present = lua_rawget(m_lua, -2) != LUA_TNIL;
    lua_pop(m_lua, 2);
    return present;
}

std::vector<std::string> LuaInterpreter::localNames() {
    std::vector<std::string> names;
    if (!m_lua) {
        return names;
    }
    pushEnvironment();
    lua_pushnil(m_lua);
    while (lua_next(m_lua, -2) != 0) {
        if (lua_type(m_lua, -2) == LUA_TSTRING) {
            names.push_back(lua_tostring(m_lua, -2));
        }
        lua_pop(m_lua, 1);
    }
    lua_pop(m_lua, 1);
    std::sort(names.begin(), names.end());
    return names;
}

void LuaInterpreter::clearLocals() {
    if (!m_lua) {
        return;
    }
    luaL_unref(m_lua, LUA_REGISTRYINDEX, m_env_ref);
    createEnvironment();
}

// ============================================================================
// Completion
// ============================================================================

static bool is_identifier(const char* name) {
    if (!name || !(std::isalpha(static_cast<unsigned char>(*name)) || *name == '_')) {
        return false;
    }
    for (const char* p = name; *p; ++p) {
        if (!(std::isalnum(static_cast<unsigned char>(*p)) || *p == '_')) {
            return false;
        }
    }
    return true;
}

// Raw field lookup that follows __index tables (never calls metamethods)
static void raw_lookup(lua_State* L, int index, const std::string& key) {
    index = lua_absindex(L, index);
    lua_pushvalue(L, index);
    for (int depth = 0; depth < 8; ++depth) {
        if (lua_istable(L, -1)) {
            lua_pushlstring(L, key.data(), key.size());
            lua_rawget(L, -2);
            if (!lua_isnil(L, -1)) {
                lua_remove(L, -2);
                return;
            }
            lua_pop(L, 1);
        }
        if (!lua_getmetatable(L, -1)) {
            break;
        }
        lua_getfield(L, -1, "__index");
        lua_remove(L, -2);      // metatable
        lua_remove(L, -2);      // previous object
        if (!lua_istable(L, -1)) {
            break;
        }
    }
    lua_pop(L, 1);
    lua_pushnil(L);
}

// Collect keys from a value and its __index tables
static void collect_keys(lua_State* L, int index, const std::string& prefix,
                         const std::string& head, std::vector<std::string>& out) {
    index = lua_absindex(L, index);
    lua_pushvalue(L, index);
    for (int depth = 0; depth < 8; ++depth) {
        if (lua_istable(L, -1)) {
            lua_pushnil(L);
            while (lua_next(L, -2) != 0) {
                if (lua_type(L, -2) == LUA_TSTRING) {
                    const char* key = lua_tostring(L, -2);
                    if (is_identifier(key) && std::strncmp(key, prefix.c_str(), prefix.size()) == 0) {
                        out.push_back(head + key);
                    }
                }
                lua_pop(L, 1);
            }
        }
        if (!lua_getmetatable(L, -1)) {
            break;
        }
        lua_getfield(L, -1, "__index");
        lua_remove(L, -2);
        lua_remove(L, -2);
        if (!lua_istable(L, -1)) {
            break;
        }
    }
    lua_pop(L, 1);
}

std::vector<std::string> LuaInterpreter::completions(const std::string& line) {
    std::vector<std::string> result;
    if (!m_lua) {
        return result;
    }

    size_t start = line.size();
    while (start > 0) {
        char c = line[start - 1];
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == ':') {
            --start;
        } else {
            break;
        }
    }
    std::string word = line.substr(start);
    size_t sep = word.find_last_of(".:");
    std::string head = sep == std::string::npos ? std::string() : word.substr(0, sep + 1);
    std::string prefix = sep == std::string::npos ? word : word.substr(sep + 1);

    int top = lua_gettop(m_lua);
    pushEnvironment();

    // Walk the path segments of head ("a.b:" -> a, b)
    bool resolved = true;
    size_t pos = 0;
    while (pos < head.size()) {
        size_t next = head.find_first_of(".:", pos);
        std::string segment = head.substr(pos, next - pos);
        if (segment.empty()) {
            resolved = false;
            break;
        }
        raw_lookup(m_lua, -1, segment);
        lua_remove(m_lua, -2);
        if (lua_isnil(m_lua, -1)) {
            resolved = false;
            break;
        }
        pos = next + 1;
    }

    if (resolved) {
        collect_keys(m_lua, -1, prefix, head, result);
    }
    lua_settop(m_lua, top);

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

} // namespace LuaConsole
