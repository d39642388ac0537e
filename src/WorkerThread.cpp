//
//  WorkerThread.cpp
//  LuaConsole Framework - Dedicated Worker Thread
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "WorkerThread.h"
#include "ConsoleLogger.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <system_error>

namespace LuaConsole {

WorkerThread::WorkerThread(const std::string& name)
    : m_name(name)
    , m_queue("WorkerQueue")
    , m_running(false)
    , m_stop_requested(false)
{
}

WorkerThread::~WorkerThread() {
    stop();
}

bool WorkerThread::start() {
    if (m_running.load()) {
        return true;
    }
    if (m_thread.joinable() || m_queue.isShuttingDown()) {
        console_error(m_name.c_str(), "Cannot restart a stopped worker");
        return false;
    }

    std::mutex ready_mutex;
    std::condition_variable ready_cv;
    bool ready = false;

    m_stop_requested = false;
    try {
        m_thread = std::thread([this, &ready_mutex, &ready_cv, &ready]() {
            m_queue.bindToCurrentThread();
            m_running = true;
            {
                std::lock_guard<std::mutex> lock(ready_mutex);
                ready = true;
            }
            ready_cv.notify_one();
            threadMain();
        });
    } catch (const std::system_error& e) {
        console_error(m_name.c_str(), std::string("Failed to start thread: ") + e.what());
        return false;
    }

    std::unique_lock<std::mutex> lock(ready_mutex);
    ready_cv.wait(lock, [&ready]() { return ready; });
    m_ident = m_thread.get_id();

    console_log(m_name.c_str(), "Started");
    return true;
}

void WorkerThread::threadMain() {
    while (!m_stop_requested.load()) {
        if (m_queue.waitForCommands(std::chrono::milliseconds(50))) {
            m_queue.processCommands();
        }
    }
    m_running = false;
}

void WorkerThread::stop(int grace_ms) {
    if (!m_thread.joinable()) {
        return;
    }

    console_log(m_name.c_str(), "Stopping...");
    m_stop_requested = true;

    // Let the command in flight finish before dropping the rest
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    while (m_running.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (m_running.load()) {
        console_log(m_name.c_str(), "Grace period elapsed, waiting for current command");
    }

    m_queue.shutdown();
    if (m_thread.get_id() == std::this_thread::get_id()) {
        console_error(m_name.c_str(), "stop() called from the worker itself, detaching");
        m_thread.detach();
    } else {
        m_thread.join();
    }
    m_running = false;
    console_log(m_name.c_str(), "Stopped");
}

void WorkerThread::post(std::function<void()> task) {
    if (!m_running.load()) {
        console_error(m_name.c_str(), "post() on a worker that is not running");
        return;
    }
    m_queue.queueVoidCommand(task);
}

bool WorkerThread::isCurrentThread() const {
    return std::this_thread::get_id() == m_ident;
}

} // namespace LuaConsole
