//
//  Stream.h
//  LuaConsole Framework - Line-Oriented Console Stream
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  Thread-safe text channel used as the stdin and stdout surrogate of the
//  console. Writers append text; readers consume it one line at a time.
//

#ifndef STREAM_H
#define STREAM_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace LuaConsole {

enum class ReadStatus {
    Line,           // A complete line (or the final partial line after close)
    Empty,          // Non-blocking read found no complete line
    Eof,            // Stream closed and drained
    Interrupted     // Woken up by interrupt_readers()
};

struct ReadResult {
    ReadStatus status;
    std::string text;
};

/**
 * Thrown by readline() when the timeout elapses before a line arrives
 */
class StreamTimeout : public std::runtime_error {
public:
    explicit StreamTimeout(const std::string& what) : std::runtime_error(what) {}
};

class Stream {
public:
    using TextCallback = std::function<void(const std::string&)>;
    using CloseCallback = std::function<void()>;
    using PumpFunction = std::function<bool()>;

    explicit Stream(const char* name = "Stream");

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    // Append text and wake one waiting reader
    void write(const std::string& text);

    /**
     * Read one line without its trailing '\n'. A pending interrupt is
     * reported before any buffered line; the line stays for the next read.
     * @param block false returns ReadStatus::Empty when no line is buffered
     * @param timeout Throws StreamTimeout when it elapses first
     */
    ReadResult readline(bool block = true,
                        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Drain everything buffered and hand it to the flush observers, even when empty
    std::string flush();

    // Idempotent; wakes every waiting reader
    void close();

    // Make the current or next blocking readline() return Interrupted
    void interrupt_readers();
    void clear_interrupt();

    /**
     * Cooperative suspension: while waiting, readline() calls the pump
     * outside the lock instead of sleeping. The pump returns true when it
     * made progress; otherwise the reader waits one poll interval.
     */
    void set_cooperative_pump(PumpFunction pump);
    void set_poll_interval(std::chrono::milliseconds interval);

    // Observers are invoked outside the stream lock
    void on_write(TextCallback callback);
    void on_flush(TextCallback callback);
    void on_close(CloseCallback callback);

    bool is_closed() const;
    size_t pending() const;
    const std::string& name() const { return m_name; }

private:
    bool take_line_locked(std::string& line);

    std::string m_name;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::string m_buffer;
    bool m_closed;
    bool m_interrupt_pending;

    PumpFunction m_pump;
    std::chrono::milliseconds m_poll_interval;

    std::vector<TextCallback> m_write_callbacks;
    std::vector<TextCallback> m_flush_callbacks;
    std::vector<CloseCallback> m_close_callbacks;
};

} // namespace LuaConsole

#endif // STREAM_H
