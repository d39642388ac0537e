//
//  Stream.cpp
//  LuaConsole Framework - Line-Oriented Console Stream
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "Stream.h"
#include "ConsoleLogger.h"
#include <algorithm>

namespace LuaConsole {

Stream::Stream(const char* name)
    : m_name(name)
    , m_closed(false)
    , m_interrupt_pending(false)
    , m_poll_interval(10)
{
}

void Stream::write(const std::string& text) {
    std::vector<TextCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            console_log(m_name.c_str(), "write after close ignored");
            return;
        }
        m_buffer += text;
        callbacks = m_write_callbacks;
    }
    m_cv.notify_one();

    for (auto& callback : callbacks) {
        callback(text);
    }
}

bool Stream::take_line_locked(std::string& line) {
    size_t newline = m_buffer.find('\n');
    if (newline == std::string::npos) {
        return false;
    }
    line = m_buffer.substr(0, newline);
    m_buffer.erase(0, newline + 1);
    return true;
}

ReadResult Stream::readline(bool block, std::optional<std::chrono::milliseconds> timeout) {
    using clock = std::chrono::steady_clock;
    const clock::time_point deadline = timeout ? clock::now() + *timeout : clock::time_point::max();

    std::unique_lock<std::mutex> lock(m_mutex);
    auto ready = [this]() {
        return m_interrupt_pending || m_closed || m_buffer.find('\n') != std::string::npos;
    };

    while (true) {
        if (m_interrupt_pending) {
            m_interrupt_pending = false;
            return {ReadStatus::Interrupted, std::string()};
        }

        std::string line;
        if (take_line_locked(line)) {
            return {ReadStatus::Line, line};
        }

        if (m_closed) {
            if (!m_buffer.empty()) {
                line.swap(m_buffer);
                return {ReadStatus::Line, line};
            }
            return {ReadStatus::Eof, std::string()};
        }

        if (!block) {
            return {ReadStatus::Empty, std::string()};
        }

        if (timeout && clock::now() >= deadline) {
            throw StreamTimeout(m_name + ": readline timed out after " +
                                std::to_string(timeout->count()) + " ms");
        }

        PumpFunction pump = m_pump;
        if (pump) {
            // Re-enter the host loop so the line can actually be produced
            lock.unlock();
            bool progressed = pump();
            lock.lock();
            if (!progressed && !ready()) {
                auto slice = std::min<clock::time_point>(deadline, clock::now() + m_poll_interval);
                m_cv.wait_until(lock, slice, ready);
            }
        } else if (timeout) {
            m_cv.wait_until(lock, deadline, ready);
        } else {
            m_cv.wait(lock, ready);
        }
    }
}

std::string Stream::flush() {
    std::string text;
    std::vector<TextCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        text.swap(m_buffer);
        callbacks = m_flush_callbacks;
    }

    for (auto& callback : callbacks) {
        callback(text);
    }
    return text;
}

void Stream::close() {
    std::vector<CloseCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
        callbacks = m_close_callbacks;
    }
    m_cv.notify_all();
    console_log(m_name.c_str(), "closed");

    for (auto& callback : callbacks) {
        callback();
    }
}

void Stream::interrupt_readers() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_interrupt_pending = true;
    }
    m_cv.notify_all();
}

void Stream::clear_interrupt() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_interrupt_pending = false;
}

void Stream::set_cooperative_pump(PumpFunction pump) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pump = std::move(pump);
}

void Stream::set_poll_interval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_poll_interval = interval;
}

void Stream::on_write(TextCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_write_callbacks.push_back(std::move(callback));
}

void Stream::on_flush(TextCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_flush_callbacks.push_back(std::move(callback));
}

void Stream::on_close(CloseCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_close_callbacks.push_back(std::move(callback));
}

bool Stream::is_closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

size_t Stream::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_buffer.size();
}

} // namespace LuaConsole
