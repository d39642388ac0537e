//
//  ExecutionController.cpp
//  LuaConsole Framework - Submission, Cancellation and Worker Lifecycle
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "ExecutionController.h"
#include "ConsoleLogger.h"

namespace LuaConsole {

const char* execution_state_name(ExecutionState state) {
    switch (state) {
        case ExecutionState::Idle:    return "idle";
        case ExecutionState::Running: return "running";
    }
    return "unknown";
}

// ============================================================================
// InlineExecutor
// ============================================================================

InlineExecutor::InlineExecutor(ExecutorContext& context)
    : Executor(context)
{
}

InlineExecutor::~InlineExecutor() = default;

void InlineExecutor::runSource(uint64_t execution_id, const std::string& source) {
    ExecutionResult result = m_context.interpreter.execute(execution_id, source);
    m_context.complete(execution_id, result);
}

bool InlineExecutor::cancel(uint64_t execution_id) {
    console_log("InlineExecutor", "Cannot interrupt #" + std::to_string(execution_id) +
                " (runs on the foreground thread)");
    return false;
}

void InlineExecutor::runInContext(std::function<void()> task) {
    task();
}

void InlineExecutor::postToContext(std::function<void()> task) {
    task();
}

void InlineExecutor::exit() {
}

// ============================================================================
// QueuedExecutor
// ============================================================================

QueuedExecutor::QueuedExecutor(ExecutorContext& context)
    : Executor(context)
    , m_alive(std::make_shared<std::atomic<bool>>(true))
{
}

QueuedExecutor::~QueuedExecutor() {
    exit();
}

void QueuedExecutor::runSource(uint64_t execution_id, const std::string& source) {
    std::shared_ptr<std::atomic<bool>> alive = m_alive;
    ExecutorContext* context = &m_context;

    m_context.foreground.deferVoidCommand([alive, context, execution_id, source]() {
        if (!alive->load()) {
            return;
        }
        ExecutionResult result = context->interpreter.execute(execution_id, source);
        if (alive->load()) {
            context->complete(execution_id, result);
        }
    });
}

bool QueuedExecutor::cancel(uint64_t execution_id) {
    console_log("QueuedExecutor", "Cannot interrupt #" + std::to_string(execution_id) +
                " (runs on the foreground loop)");
    return false;
}

void QueuedExecutor::runInContext(std::function<void()> task) {
    task();
}

void QueuedExecutor::postToContext(std::function<void()> task) {
    task();
}

void QueuedExecutor::exit() {
    m_alive->store(false);
}

// ============================================================================
// ThreadedExecutor
// ============================================================================

ThreadedExecutor::ThreadedExecutor(ExecutorContext& context)
    : Executor(context)
    , m_alive(std::make_shared<std::atomic<bool>>(true))
{
}

ThreadedExecutor::~ThreadedExecutor() {
    exit();
}

bool ThreadedExecutor::start() {
    if (!m_worker) {
        m_worker.reset(new WorkerThread("LuaWorker"));
    }
    return m_worker->start();
}

bool ThreadedExecutor::isStarted() const {
    return m_worker && m_worker->isRunning();
}

void ThreadedExecutor::runSource(uint64_t execution_id, const std::string& source) {
    if (!start()) {
        throw std::runtime_error("Lua worker thread could not be started");
    }

    ExecutorContext* context = &m_context;
    std::shared_ptr<std::atomic<bool>> alive = m_alive;
    m_worker->post([context, alive, execution_id, source]() {
        ExecutionResult result = context->interpreter.execute(execution_id, source);
        context->foreground.queueVoidCommand([context, alive, execution_id, result]() {
            if (alive->load()) {
                context->complete(execution_id, result);
            }
        });
    });
}

bool ThreadedExecutor::cancel(uint64_t execution_id) {
    return m_context.interpreter.interrupt(execution_id);
}

void ThreadedExecutor::runInContext(std::function<void()> task) {
    if (!start()) {
        throw std::runtime_error("Lua worker thread could not be started");
    }
    m_worker->runSync<bool>([task]() {
        task();
        return true;
    });
}

void ThreadedExecutor::postToContext(std::function<void()> task) {
    if (!start()) {
        throw std::runtime_error("Lua worker thread could not be started");
    }
    m_worker->post(task);
}

void ThreadedExecutor::exit() {
    m_alive->store(false);
    if (m_worker) {
        m_worker->stop(m_context.config.shutdown_grace_ms);
    }
}

// ============================================================================
// ExternalExecutor
// ============================================================================

ExternalExecutor::ExternalExecutor(ExecutorContext& context, SpawnFunction spawn)
    : Executor(context)
    , m_spawn(std::move(spawn))
    , m_alive(std::make_shared<std::atomic<bool>>(true))
    , m_in_flight(0)
    , m_closed(false)
{
}

ExternalExecutor::~ExternalExecutor() {
    exit();
}

bool ExternalExecutor::beginTask() {
    std::lock_guard<std::mutex> lock(m_tasks_mutex);
    if (m_closed) {
        return false;
    }
    m_in_flight++;
    return true;
}

void ExternalExecutor::endTask() {
    {
        std::lock_guard<std::mutex> lock(m_tasks_mutex);
        m_in_flight--;
    }
    m_tasks_cv.notify_all();
}

int ExternalExecutor::inFlight() const {
    std::lock_guard<std::mutex> lock(m_tasks_mutex);
    return m_in_flight;
}

void ExternalExecutor::runSource(uint64_t execution_id, const std::string& source) {
    if (!beginTask()) {
        throw std::runtime_error("External executor has exited");
    }

    ExecutorContext* context = &m_context;
    std::shared_ptr<std::atomic<bool>> alive = m_alive;

    try {
        m_spawn([this, context, alive, execution_id, source]() {
            ExecutionResult result{false, std::nullopt};
            {
                std::lock_guard<std::mutex> lock(m_context_mutex);
                result = context->interpreter.execute(execution_id, source);
            }
            // Queued before endTask(), so the queue is still alive here
            context->foreground.queueVoidCommand([context, alive, execution_id, result]() {
                if (alive->load()) {
                    context->complete(execution_id, result);
                }
            });
            endTask();
        });
    } catch (...) {
        endTask();
        throw;
    }
}

bool ExternalExecutor::cancel(uint64_t execution_id) {
    return m_context.interpreter.interrupt(execution_id);
}

void ExternalExecutor::runInContext(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(m_context_mutex);
    task();
}

void ExternalExecutor::postToContext(std::function<void()> task) {
    if (!beginTask()) {
        throw std::runtime_error("External executor has exited");
    }

    try {
        m_spawn([this, task]() {
            {
                std::lock_guard<std::mutex> lock(m_context_mutex);
                task();
            }
            endTask();
        });
    } catch (...) {
        endTask();
        throw;
    }
}

void ExternalExecutor::exit() {
    std::unique_lock<std::mutex> lock(m_tasks_mutex);
    if (!m_closed) {
        m_closed = true;
        m_alive->store(false);
        if (m_in_flight > 0) {
            console_log("ExternalExecutor", "Waiting for " + std::to_string(m_in_flight) + " spawned task(s)");
        }
    }
    // Spawned tasks reference the interpreter and this executor
    m_tasks_cv.wait(lock, [this]() { return m_in_flight == 0; });
}

// ============================================================================
// ExecutionController
// ============================================================================

ExecutionController::ExecutionController(Stream& stdin_stream, Stream& stdout_stream,
                                         CommandQueue& foreground, const ConsoleConfig& config)
    : m_config(config)
    , m_stdin(stdin_stream)
    , m_foreground(foreground)
    , m_interpreter(stdin_stream, stdout_stream, m_config)
    , m_context{m_interpreter, foreground, stdin_stream, m_config,
                [this](uint64_t id, const ExecutionResult& result) { finish(id, result); }}
    , m_mode(config.execution_mode)
    , m_state(ExecutionState::Idle)
    , m_running_id(0)
    , m_next_id(0)
    , m_exited(false)
{
}

ExecutionController::~ExecutionController() {
    exit();
}

bool ExecutionController::initialize() {
    if (!m_interpreter.initialize()) {
        m_last_error = m_interpreter.getLastError();
        return false;
    }

    if (m_config.execution_mode == ExecutionMode::External) {
        // The spawn function only arrives through configure_executor()
        console_log("ExecutionController", "External mode selected, running inline until configured");
        return configure_executor(ExecutionMode::Inline);
    }
    return configure_executor(m_config.execution_mode);
}

bool ExecutionController::configure_executor(ExecutionMode mode, SpawnFunction spawn) {
    if (is_running()) {
        m_last_error = "Cannot change executor while an execution is running";
        console_error("ExecutionController", m_last_error);
        return false;
    }
    if (mode == ExecutionMode::External && !spawn) {
        m_last_error = "External execution mode needs a spawn function";
        console_error("ExecutionController", m_last_error);
        return false;
    }

    if (m_executor) {
        m_executor->exit();
        m_executor.reset();
    }

    switch (mode) {
        case ExecutionMode::Inline:
            m_executor.reset(new InlineExecutor(m_context));
            break;
        case ExecutionMode::Queued:
            m_executor.reset(new QueuedExecutor(m_context));
            break;
        case ExecutionMode::Threaded:
            m_executor.reset(new ThreadedExecutor(m_context));
            break;
        case ExecutionMode::External:
            m_executor.reset(new ExternalExecutor(m_context, std::move(spawn)));
            break;
    }
    m_mode = mode;

    installCooperativePump(mode == ExecutionMode::Inline || mode == ExecutionMode::Queued);
    console_log("ExecutionController", std::string("Executor: ") + m_executor->name());
    return true;
}

bool ExecutionController::start_worker() {
    if (m_mode != ExecutionMode::Threaded || !m_executor) {
        if (!configure_executor(ExecutionMode::Threaded)) {
            return false;
        }
    }
    return static_cast<ThreadedExecutor*>(m_executor.get())->start();
}

void ExecutionController::installCooperativePump(bool enabled) {
    if (!enabled) {
        m_stdin.set_cooperative_pump(nullptr);
        return;
    }

    // A reader on the foreground thread keeps the foreground loop running
    CommandQueue* foreground = &m_foreground;
    m_stdin.set_poll_interval(std::chrono::milliseconds(m_config.stdin_poll_interval_ms));
    m_stdin.set_cooperative_pump([foreground]() {
        if (!foreground->isOwnerThread()) {
            return false;
        }
        bool pending = foreground->hasPendingCommands();
        foreground->processCommands();
        return pending;
    });
}

SubmitStatus ExecutionController::submit(const std::string& source) {
    if (m_exited || !m_executor) {
        console_error("ExecutionController", "submit() after exit");
        return SubmitStatus::Busy;
    }
    if (is_running()) {
        console_log("ExecutionController", "submit() while #" +
                    std::to_string(m_running_id.load()) + " is running");
        return SubmitStatus::Busy;
    }

    if (m_interpreter.classify(source) == SourceStatus::Incomplete) {
        return SubmitStatus::Incomplete;
    }

    uint64_t id = ++m_next_id;
    m_running_id = id;
    m_state = ExecutionState::Running;

    try {
        m_executor->runSource(id, source);
    } catch (const std::exception& e) {
        m_last_error = e.what();
        console_error("ExecutionController", "Dispatch failed: " + m_last_error);
        m_running_id = 0;
        m_state = ExecutionState::Idle;
        return SubmitStatus::Busy;
    }
    return SubmitStatus::Dispatched;
}

void ExecutionController::finish(uint64_t execution_id, const ExecutionResult& result) {
    if (execution_id != m_running_id.load()) {
        console_log("ExecutionController", "Dropping stale completion #" + std::to_string(execution_id));
        return;
    }

    m_running_id = 0;
    m_state = ExecutionState::Idle;
    console_log("ExecutionController", "Execution #" + std::to_string(execution_id) +
                (result.executed ? " completed" : " failed"));

    if (m_completion_callback) {
        m_completion_callback(result);
    }
}

CancelOutcome ExecutionController::cancel() {
    uint64_t id = m_running_id.load();
    if (!is_running() || id == 0) {
        return CancelOutcome::NothingRunning;
    }
    if (!m_executor || !m_executor->supportsInterrupt()) {
        return CancelOutcome::NotDelivered;
    }
    return m_executor->cancel(id) ? CancelOutcome::InterruptDelivered : CancelOutcome::NotDelivered;
}

void ExecutionController::exit() {
    if (m_exited) {
        return;
    }
    m_exited = true;
    console_log("ExecutionController", "Exiting...");

    if (m_executor) {
        uint64_t id = m_running_id.load();
        if (id != 0 && m_executor->supportsInterrupt()) {
            m_executor->cancel(id);
        }
        m_executor->exit();
    }
    m_stdin.set_cooperative_pump(nullptr);
}

bool ExecutionController::supports_interrupt() const {
    return m_executor && m_executor->supportsInterrupt();
}

void ExecutionController::push_local(const std::string& name, const ScriptValue& value) {
    if (!m_executor) {
        return;
    }
    LuaInterpreter* interpreter = &m_interpreter;
    try {
        m_executor->postToContext([interpreter, name, value]() {
            interpreter->setLocal(name, value);
        });
    } catch (const std::exception& e) {
        console_error("ExecutionController", std::string("push_local failed: ") + e.what());
    }
}

ScriptValue ExecutionController::get_local(const std::string& name) {
    ScriptValue value;
    if (!m_executor || m_exited) {
        return value;
    }
    if (is_running() && m_mode != ExecutionMode::Inline && m_mode != ExecutionMode::Queued) {
        console_error("ExecutionController", "get_local(" + name + ") while running");
        return value;
    }
    try {
        m_executor->runInContext([this, &value, &name]() {
            value = m_interpreter.getLocal(name);
        });
    } catch (const std::exception& e) {
        console_error("ExecutionController", std::string("get_local failed: ") + e.what());
    }
    return value;
}

std::vector<std::string> ExecutionController::get_completions(const std::string& line) {
    std::vector<std::string> result;
    if (!m_executor || m_exited || is_running()) {
        return result;
    }
    try {
        m_executor->runInContext([this, &result, &line]() {
            result = m_interpreter.completions(line);
        });
    } catch (const std::exception& e) {
        console_error("ExecutionController", std::string("get_completions failed: ") + e.what());
    }
    return result;
}

void ExecutionController::set_completion_callback(CompletionCallback callback) {
    m_completion_callback = std::move(callback);
}

} // namespace LuaConsole
