//
//  WorkerThread.h
//  LuaConsole Framework - Dedicated Worker Thread
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  A thread that serves its own CommandQueue until stopped. Executions
//  posted to it run one at a time, in order.
//

#ifndef WORKER_THREAD_H
#define WORKER_THREAD_H

#include "CommandQueue.h"
#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace LuaConsole {

class WorkerThread {
public:
    explicit WorkerThread(const std::string& name = "WorkerThread");
    ~WorkerThread();

    WorkerThread(const WorkerThread&) = delete;
    WorkerThread& operator=(const WorkerThread&) = delete;

    // Start the thread; returns once its queue is bound
    bool start();

    /**
     * Stop serving commands and join.
     * @param grace_ms Time allowed for the current command to finish before
     *                 the queue is shut down
     */
    void stop(int grace_ms = 500);

    // Fire-and-forget submission
    void post(std::function<void()> task);

    // Run a task in the worker and wait for its value
    template<typename T>
    T runSync(std::function<T()> task) {
        return m_queue.executeCommand<T>(task);
    }

    bool isRunning() const { return m_running.load(); }
    bool isCurrentThread() const;
    std::thread::id ident() const { return m_ident; }
    const std::string& name() const { return m_name; }

private:
    void threadMain();

    std::string m_name;
    CommandQueue m_queue;
    std::thread m_thread;
    std::thread::id m_ident;
    std::atomic<bool> m_running;
    std::atomic<bool> m_stop_requested;
};

} // namespace LuaConsole

#endif // WORKER_THREAD_H
