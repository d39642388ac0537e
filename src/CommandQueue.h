//
//  CommandQueue.h
//  LuaConsole Framework - Thread-Safe Command Queue System
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  Single-consumer task queue. Any thread may post commands; only the
//  thread the queue is bound to executes them. The console binds one queue
//  to its foreground thread and each worker thread owns another.
//

#ifndef COMMAND_QUEUE_H
#define COMMAND_QUEUE_H

#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <thread>
#include <memory>
#include <chrono>
#include <stdexcept>
#include <exception>
#include <string>

namespace LuaConsole {

// Base command interface
class Command {
public:
    virtual ~Command() = default;
    virtual void execute() = 0;
};

// Command with return value
template<typename T>
class CommandWithResult : public Command {
private:
    std::function<T()> func;
    T result;

public:
    CommandWithResult(std::function<T()> f) : func(f), result() {}

    void execute() override {
        result = func();
    }

    T getTypedResult() {
        return result;
    }
};

// Command without return value
class VoidCommand : public Command {
private:
    std::function<void()> func;

public:
    VoidCommand(std::function<void()> f) : func(f) {}

    void execute() override {
        func();
    }
};

class CommandQueue {
private:
    std::queue<std::shared_ptr<Command>> commands;
    mutable std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::atomic<bool> shutdown_requested{false};

    mutable std::mutex owner_mutex;
    std::thread::id owner_thread;

public:
    explicit CommandQueue(const char* name = "CommandQueue");
    ~CommandQueue() { shutdown(); }

    // Disable copy and move
    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;
    CommandQueue(CommandQueue&&) = delete;
    CommandQueue& operator=(CommandQueue&&) = delete;

    // Make the calling thread the one that executes commands
    void bindToCurrentThread();
    bool isOwnerThread() const;

    // Execute a command with return value (blocking)
    template<typename T>
    T executeCommand(std::function<T()> func) {
        if (shutdown_requested.load()) {
            throw std::runtime_error(std::string(name) + " is shutting down");
        }

        // Already on the owner thread: waiting would deadlock
        if (isOwnerThread()) {
            return func();
        }

        auto command = std::make_shared<CommandWithResult<T>>(func);
        auto done = std::make_shared<Completion>();

        enqueue(std::make_shared<VoidCommand>([command, done]() {
            try {
                command->execute();
            } catch (...) {
                done->error = std::current_exception();
            }
            done->signal();
        }));

        waitForCompletion(*done);
        if (done->error) {
            std::rethrow_exception(done->error);
        }
        return command->getTypedResult();
    }

    // Execute a void command (blocking)
    void executeVoidCommand(std::function<void()> func);

    // Execute a void command (non-blocking); runs inline on the owner thread
    void queueVoidCommand(std::function<void()> func);

    // Always enqueue, even from the owner thread (next loop iteration)
    void deferVoidCommand(std::function<void()> func);

    // Process commands (call from the owner thread)
    void processCommands();

    // Block until a command is queued, shutdown, or the timeout elapses
    bool waitForCommands(std::chrono::milliseconds timeout);

    // Check if there are pending commands
    bool hasPendingCommands() const;

    // Get number of pending commands
    size_t getPendingCommandCount() const;

    // Shutdown the queue, dropping what is still queued
    void shutdown();

    bool isShuttingDown() const {
        return shutdown_requested.load();
    }

private:
    // Completion handshake for blocking submissions
    struct Completion {
        std::mutex mutex;
        std::condition_variable cv;
        bool completed = false;
        std::exception_ptr error;

        void signal() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                completed = true;
            }
            cv.notify_one();
        }

        bool waitFor(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex);
            return cv.wait_for(lock, timeout, [this]() { return completed; });
        }
    };

    // Throws if the queue shuts down before the command has run
    void waitForCompletion(Completion& done);

    void enqueue(std::shared_ptr<Command> command);
    std::shared_ptr<Command> popCommand();
    void runCommand(const std::shared_ptr<Command>& command);

    const char* name;
};

} // namespace LuaConsole

#endif // COMMAND_QUEUE_H
