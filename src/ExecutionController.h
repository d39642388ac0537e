//
//  ExecutionController.h
//  LuaConsole Framework - Submission, Cancellation and Worker Lifecycle
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  The controller decides whether submitted source is complete, dispatches
//  it to the worker context through one of the executor variants and
//  reports completion on the foreground thread.
//
//  States: Idle -> Running -> Idle.
//

#ifndef EXECUTION_CONTROLLER_H
#define EXECUTION_CONTROLLER_H

#include "CommandQueue.h"
#include "ConsoleConfig.h"
#include "LuaInterpreter.h"
#include "Stream.h"
#include "WorkerThread.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace LuaConsole {

enum class ExecutionState {
    Idle,
    Running
};

enum class SubmitStatus {
    Incomplete,     // More lines needed; nothing was dispatched
    Dispatched,     // Execution started (may already have completed)
    Busy            // Another execution is running, or the controller has exited
};

enum class CancelOutcome {
    NothingRunning,
    InterruptDelivered,
    NotDelivered    // Finished first, or the executor cannot interrupt
};

const char* execution_state_name(ExecutionState state);

using CompletionCallback = std::function<void(const ExecutionResult&)>;

// Runs a task on a host-chosen thread (thread pool, fiber scheduler, ...)
using SpawnFunction = std::function<void(std::function<void()>)>;

/**
 * What an executor needs from its controller
 */
struct ExecutorContext {
    LuaInterpreter& interpreter;
    CommandQueue& foreground;
    Stream& stdin_stream;
    const ConsoleConfig& config;
    // Must be called on the foreground thread
    std::function<void(uint64_t, const ExecutionResult&)> complete;
};

/**
 * Scheduling backend. Each variant decides where the interpreter runs.
 */
class Executor {
public:
    explicit Executor(ExecutorContext& context) : m_context(context) {}
    virtual ~Executor() = default;

    virtual const char* name() const = 0;

    // Start running source; completion goes through context.complete
    virtual void runSource(uint64_t execution_id, const std::string& source) = 0;

    // Deliver an interrupt to the given execution if it is still running
    virtual bool cancel(uint64_t execution_id) = 0;
    virtual bool supportsInterrupt() const = 0;

    // Run a task in the worker context and wait for it
    virtual void runInContext(std::function<void()> task) = 0;

    // Run a task in the worker context without waiting
    virtual void postToContext(std::function<void()> task) = 0;

    virtual void exit() = 0;

protected:
    ExecutorContext& m_context;
};

/**
 * Runs synchronously inside submit() on the foreground thread
 */
class InlineExecutor : public Executor {
public:
    explicit InlineExecutor(ExecutorContext& context);
    ~InlineExecutor() override;

    const char* name() const override { return "inline"; }
    void runSource(uint64_t execution_id, const std::string& source) override;
    bool cancel(uint64_t execution_id) override;
    bool supportsInterrupt() const override { return false; }
    void runInContext(std::function<void()> task) override;
    void postToContext(std::function<void()> task) override;
    void exit() override;
};

/**
 * Runs on a later iteration of the foreground command loop
 */
class QueuedExecutor : public Executor {
public:
    explicit QueuedExecutor(ExecutorContext& context);
    ~QueuedExecutor() override;

    const char* name() const override { return "queued"; }
    void runSource(uint64_t execution_id, const std::string& source) override;
    bool cancel(uint64_t execution_id) override;
    bool supportsInterrupt() const override { return false; }
    void runInContext(std::function<void()> task) override;
    void postToContext(std::function<void()> task) override;
    void exit() override;

private:
    std::shared_ptr<std::atomic<bool>> m_alive;
};

/**
 * Runs on a dedicated worker thread, created on first use
 */
class ThreadedExecutor : public Executor {
public:
    explicit ThreadedExecutor(ExecutorContext& context);
    ~ThreadedExecutor() override;

    const char* name() const override { return "threaded"; }
    void runSource(uint64_t execution_id, const std::string& source) override;
    bool cancel(uint64_t execution_id) override;
    bool supportsInterrupt() const override { return true; }
    void runInContext(std::function<void()> task) override;
    void postToContext(std::function<void()> task) override;
    void exit() override;

    bool start();
    bool isStarted() const;
    WorkerThread* worker() { return m_worker.get(); }

private:
    std::unique_ptr<WorkerThread> m_worker;
    std::shared_ptr<std::atomic<bool>> m_alive;
};

/**
 * Runs through a host-provided spawn function. exit() blocks until every
 * spawned task has returned, so the spawn function must not hand tasks to
 * the foreground thread.
 */
class ExternalExecutor : public Executor {
public:
    ExternalExecutor(ExecutorContext& context, SpawnFunction spawn);
    ~ExternalExecutor() override;

    const char* name() const override { return "external"; }
    void runSource(uint64_t execution_id, const std::string& source) override;
    bool cancel(uint64_t execution_id) override;
    bool supportsInterrupt() const override { return true; }
    void runInContext(std::function<void()> task) override;
    void postToContext(std::function<void()> task) override;
    void exit() override;

    // Tasks handed to the spawn function that have not returned yet
    int inFlight() const;

private:
    // Wrap a task so exit() can wait for it; false once the executor is closed
    bool beginTask();
    void endTask();

    SpawnFunction m_spawn;
    std::mutex m_context_mutex;     // Serializes runInContext with spawned runs
    std::shared_ptr<std::atomic<bool>> m_alive;

    mutable std::mutex m_tasks_mutex;
    std::condition_variable m_tasks_cv;
    int m_in_flight;
    bool m_closed;
};

class ExecutionController {
public:
    ExecutionController(Stream& stdin_stream, Stream& stdout_stream,
                        CommandQueue& foreground, const ConsoleConfig& config);
    ~ExecutionController();

    ExecutionController(const ExecutionController&) = delete;
    ExecutionController& operator=(const ExecutionController&) = delete;

    // Create the Lua state and the executor named by the config
    bool initialize();
    const std::string& getLastError() const { return m_last_error; }

    /**
     * Classify and, when complete, dispatch source. Completion is reported
     * through the completion callback on the foreground thread; with the
     * inline executor that happens before submit() returns.
     */
    SubmitStatus submit(const std::string& source);

    /**
     * Fire-and-forget interrupt of the running execution. The identity of
     * the running execution is checked immediately before delivery.
     */
    CancelOutcome cancel();

    // Tear down the worker; idempotent
    void exit();

    // Select the threaded model and start its thread now
    bool start_worker();

    // Select a model; the threaded worker is created on first dispatch
    bool configure_executor(ExecutionMode mode, SpawnFunction spawn = nullptr);

    // Explicit environment access
    void push_local(const std::string& name, const ScriptValue& value);
    ScriptValue get_local(const std::string& name);

    // Name completions computed in the worker context; empty while running
    std::vector<std::string> get_completions(const std::string& line);

    void set_completion_callback(CompletionCallback callback);

    ExecutionState state() const { return m_state.load(); }
    bool is_running() const { return m_state.load() == ExecutionState::Running; }
    bool has_exited() const { return m_exited; }
    ExecutionMode mode() const { return m_mode; }
    uint64_t current_execution() const { return m_running_id.load(); }
    bool supports_interrupt() const;

    LuaInterpreter& interpreter() { return m_interpreter; }
    Executor* executor() { return m_executor.get(); }

private:
    void finish(uint64_t execution_id, const ExecutionResult& result);
    void installCooperativePump(bool enabled);

    ConsoleConfig m_config;
    Stream& m_stdin;
    CommandQueue& m_foreground;
    LuaInterpreter m_interpreter;
    ExecutorContext m_context;
    std::unique_ptr<Executor> m_executor;
    ExecutionMode m_mode;

    std::atomic<ExecutionState> m_state;
    std::atomic<uint64_t> m_running_id;
    uint64_t m_next_id;
    bool m_exited;

    CompletionCallback m_completion_callback;
    std::string m_last_error;
};

} // namespace LuaConsole

#endif // EXECUTION_CONTROLLER_H
