//
//  CommandQueue.cpp
//  LuaConsole Framework - Thread-Safe Command Queue Implementation
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "CommandQueue.h"
#include "ConsoleLogger.h"

namespace LuaConsole {

CommandQueue::CommandQueue(const char* queue_name)
    : owner_thread(std::this_thread::get_id())
    , name(queue_name)
{
}

void CommandQueue::bindToCurrentThread() {
    std::lock_guard<std::mutex> lock(owner_mutex);
    owner_thread = std::this_thread::get_id();
    console_log(name, "Bound to current thread");
}

bool CommandQueue::isOwnerThread() const {
    std::lock_guard<std::mutex> lock(owner_mutex);
    return std::this_thread::get_id() == owner_thread;
}

void CommandQueue::waitForCompletion(Completion& done) {
    while (!done.waitFor(std::chrono::milliseconds(50))) {
        if (shutdown_requested.load()) {
            throw std::runtime_error(std::string(name) + " shut down before command ran");
        }
    }
}

void CommandQueue::executeVoidCommand(std::function<void()> func) {
    executeCommand<bool>([func]() {
        func();
        return true;
    });
}

void CommandQueue::queueVoidCommand(std::function<void()> func) {
    if (shutdown_requested.load()) {
        return; // Silently ignore if shutting down
    }

    if (isOwnerThread()) {
        func();
        return;
    }

    enqueue(std::make_shared<VoidCommand>(func));
}

void CommandQueue::deferVoidCommand(std::function<void()> func) {
    if (shutdown_requested.load()) {
        return;
    }
    enqueue(std::make_shared<VoidCommand>(func));
}

void CommandQueue::enqueue(std::shared_ptr<Command> command) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        commands.push(std::move(command));
    }
    queue_cv.notify_all();
}

std::shared_ptr<Command> CommandQueue::popCommand() {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if (commands.empty() || shutdown_requested.load()) {
        return nullptr;
    }
    auto command = commands.front();
    commands.pop();
    return command;
}

void CommandQueue::runCommand(const std::shared_ptr<Command>& command) {
    try {
        command->execute();
    } catch (const std::exception& e) {
        // Log error but continue processing
        console_error(name, std::string("Error executing command: ") + e.what());
    }
}

void CommandQueue::processCommands() {
    if (!isOwnerThread()) {
        console_error(name, "processCommands called from non-owner thread");
        return;
    }

    // Commands may re-enter processCommands (cooperative readline)
    while (auto command = popCommand()) {
        runCommand(command);
    }
}

bool CommandQueue::waitForCommands(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex);
    return queue_cv.wait_for(lock, timeout, [this]() {
        return !commands.empty() || shutdown_requested.load();
    }) && !commands.empty();
}

bool CommandQueue::hasPendingCommands() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return !commands.empty();
}

size_t CommandQueue::getPendingCommandCount() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return commands.size();
}

void CommandQueue::shutdown() {
    shutdown_requested = true;
    queue_cv.notify_all();

    // Clear remaining commands
    std::lock_guard<std::mutex> lock(queue_mutex);
    while (!commands.empty()) {
        commands.pop();
    }
}

} // namespace LuaConsole
