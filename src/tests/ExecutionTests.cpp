//
//  ExecutionTests.cpp
//  LuaConsole Framework - Command Queue, Worker and Interpreter Tests
//
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "ConsoleTests.h"
#include "../CommandQueue.h"
#include "../ExecutionController.h"
#include "../LuaInterpreter.h"
#include "../WorkerThread.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

using namespace LuaConsole;

static ConsoleConfig test_config(ExecutionMode mode = ExecutionMode::Inline) {
    ConsoleConfig config = create_default_config();
    config.execution_mode = mode;
    return config;
}

static bool contains(const std::vector<std::string>& items, const std::string& item) {
    return std::find(items.begin(), items.end(), item) != items.end();
}

// === CommandQueueTestSuite Implementation ===

std::vector<TestResult> CommandQueueTestSuite::runAllTests() {
    std::vector<TestResult> results;

    results.push_back(runTest("Inline On Owner Thread", [this]() { testInlineOnOwnerThread(); }));
    results.push_back(runTest("Cross-Thread Execution", [this]() { testCrossThreadExecution(); }));
    results.push_back(runTest("Exception Propagation", [this]() { testExceptionPropagation(); }));
    results.push_back(runTest("Defer Runs Next Iteration", [this]() { testDeferRunsOnNextIteration(); }));
    results.push_back(runTest("Shutdown", [this]() { testShutdown(); }));

    return results;
}

void CommandQueueTestSuite::testInlineOnOwnerThread() {
    CommandQueue queue("TestQueue");
    assertTrue(queue.isOwnerThread(), "Constructing thread owns the queue");

    int value = queue.executeCommand<int>([]() { return 42; });
    assertEqual(value, 42);

    bool ran = false;
    queue.queueVoidCommand([&ran]() { ran = true; });
    assertTrue(ran, "queueVoidCommand runs inline on the owner thread");
    assertFalse(queue.hasPendingCommands());
}

void CommandQueueTestSuite::testCrossThreadExecution() {
    CommandQueue queue("TestQueue");
    std::thread::id owner = std::this_thread::get_id();
    std::thread::id ran_on;
    std::atomic<bool> done{false};
    int value = 0;

    std::thread caller([&]() {
        value = queue.executeCommand<int>([&ran_on]() {
            ran_on = std::this_thread::get_id();
            return 7;
        });
        done = true;
    });

    bool finished = waitUntil([&]() {
        queue.processCommands();
        return done.load();
    });
    caller.join();

    assertTrue(finished, "Command completed");
    assertEqual(value, 7);
    assertTrue(ran_on == owner, "Command ran on the owner thread");
}

void CommandQueueTestSuite::testExceptionPropagation() {
    CommandQueue queue("TestQueue");
    std::atomic<bool> done{false};
    std::string error;

    std::thread caller([&]() {
        try {
            queue.executeVoidCommand([]() { throw std::runtime_error("boom"); });
        } catch (const std::runtime_error& e) {
            error = e.what();
        }
        done = true;
    });

    waitUntil([&]() {
        queue.processCommands();
        return done.load();
    });
    caller.join();

    assertEqual(error, "boom", "Exception rethrown in the caller");
}

void CommandQueueTestSuite::testDeferRunsOnNextIteration() {
    CommandQueue queue("TestQueue");
    std::vector<int> order;

    queue.deferVoidCommand([&order]() { order.push_back(1); });
    queue.deferVoidCommand([&order]() { order.push_back(2); });
    assertTrue(order.empty(), "Deferred commands wait for the loop");
    assertEqual(static_cast<long long>(queue.getPendingCommandCount()), 2);
    assertTrue(queue.waitForCommands(std::chrono::milliseconds(0)));

    queue.processCommands();
    assertTrue(order == std::vector<int>({1, 2}), "FIFO order");
    assertFalse(queue.waitForCommands(std::chrono::milliseconds(10)), "Nothing pending");
}

void CommandQueueTestSuite::testShutdown() {
    CommandQueue queue("TestQueue");
    std::atomic<bool> failed{false};

    std::thread caller([&]() {
        try {
            queue.executeVoidCommand([]() {});
        } catch (const std::runtime_error&) {
            failed = true;
        }
    });

    waitUntil([&queue]() { return queue.hasPendingCommands(); });
    queue.shutdown();
    caller.join();

    assertTrue(failed.load(), "Blocked caller released by shutdown");
    assertTrue(queue.isShuttingDown());
    assertThrows<std::runtime_error>([&queue]() { queue.executeCommand<int>([]() { return 1; }); });

    bool ran = false;
    queue.queueVoidCommand([&ran]() { ran = true; });
    assertFalse(ran, "Commands ignored after shutdown");

    // A late producer thread posting after shutdown leaves the queue empty
    std::thread late([&queue]() { queue.deferVoidCommand([]() {}); });
    late.join();
    assertFalse(queue.hasPendingCommands(), "Deferred commands dropped after shutdown");
}

// === WorkerThreadTestSuite Implementation ===

std::vector<TestResult> WorkerThreadTestSuite::runAllTests() {
    std::vector<TestResult> results;

    results.push_back(runTest("Start And Run Sync", [this]() { testStartAndRunSync(); }));
    results.push_back(runTest("Post Runs In Order", [this]() { testPostRunsInOrder(); }));
    results.push_back(runTest("Stop", [this]() { testStop(); }));

    return results;
}

void WorkerThreadTestSuite::testStartAndRunSync() {
    WorkerThread worker("TestWorker");
    assertTrue(worker.start(), "Worker starts");
    assertTrue(worker.isRunning());
    assertTrue(worker.start(), "Second start is a no-op");

    bool on_worker = worker.runSync<bool>([&worker]() { return worker.isCurrentThread(); });
    assertTrue(on_worker, "runSync executes on the worker");
    assertFalse(worker.isCurrentThread());
    assertTrue(worker.ident() != std::this_thread::get_id());
}

void WorkerThreadTestSuite::testPostRunsInOrder() {
    WorkerThread worker("TestWorker");
    worker.start();

    std::vector<int> order;
    for (int i = 1; i <= 3; ++i) {
        worker.post([&order, i]() { order.push_back(i); });
    }
    worker.runSync<bool>([]() { return true; });

    assertTrue(order == std::vector<int>({1, 2, 3}), "Tasks run in submission order");
}

void WorkerThreadTestSuite::testStop() {
    WorkerThread worker("TestWorker");
    worker.start();

    std::atomic<bool> finished{false};
    worker.post([&finished]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        finished = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    worker.stop(1000);
    assertTrue(finished.load(), "Task in flight finishes within the grace period");
    assertFalse(worker.isRunning());
    assertFalse(worker.start(), "A stopped worker cannot be restarted");
    worker.stop();
}

// === InterpreterTestSuite Implementation ===

std::vector<TestResult> InterpreterTestSuite::runAllTests() {
    std::vector<TestResult> results;

    results.push_back(runTest("Classify", [this]() { testClassify(); }));
    results.push_back(runTest("Expression Value", [this]() { testExpressionValue(); }));
    results.push_back(runTest("Statement Has No Value", [this]() { testStatementHasNoValue(); }));
    results.push_back(runTest("Errors Go To Stdout", [this]() { testErrorsGoToStdout(); }));
    results.push_back(runTest("Environment Persists", [this]() { testEnvironmentPersists(); }));
    results.push_back(runTest("Locals Round Trip", [this]() { testLocalsRoundTrip(); }));
    results.push_back(runTest("Print And io.write", [this]() { testPrintAndIoWrite(); }));
    results.push_back(runTest("io.read", [this]() { testIoRead(); }));
    results.push_back(runTest("Interrupt Is Identity Checked", [this]() { testInterruptIsIdentityChecked(); }));
    results.push_back(runTest("Completions", [this]() { testCompletions(); }));
    results.push_back(runTest("Sleep Rejects Non-Finite", [this]() { testSleepRejectsNonFinite(); }));

    return results;
}

void InterpreterTestSuite::testClassify() {
    Stream in("stdin"), out("stdout");
    LuaInterpreter lua(in, out, test_config());
    assertTrue(lua.initialize(), "Interpreter initializes");

    assertTrue(lua.classify("1 + 1") == SourceStatus::Complete, "Expression");
    assertTrue(lua.classify("x = 1") == SourceStatus::Complete, "Assignment");
    assertTrue(lua.classify("") == SourceStatus::Complete, "Empty input");
    assertTrue(lua.classify("for i = 1, 2 do") == SourceStatus::Incomplete, "Open loop");
    assertTrue(lua.classify("function f()") == SourceStatus::Incomplete, "Open function");
    assertTrue(lua.classify("if x then\n  y = 1") == SourceStatus::Incomplete, "Open if");
    assertTrue(lua.classify("x = ") == SourceStatus::Incomplete, "Missing operand");
    assertTrue(lua.classify("x = = 1") == SourceStatus::Complete, "Real syntax errors run and report");
    assertTrue(lua.classify("for i = 1, 2 do\nend") == SourceStatus::Complete, "Closed loop");
}

void InterpreterTestSuite::testExpressionValue() {
    Stream in("stdin"), out("stdout");
    LuaInterpreter lua(in, out, test_config());
    lua.initialize();

    ExecutionResult sum = lua.execute(1, "1 + 1");
    assertTrue(sum.executed);
    assertTrue(sum.value.has_value(), "Expression has a value");
    assertEqual(*sum.value, "2");

    ExecutionResult multi = lua.execute(2, "'a', 2");
    assertEqual(*multi.value, "a\t2", "Multiple values are tab separated");

    ExecutionResult nil = lua.execute(3, "nil");
    assertTrue(nil.executed);
    assertFalse(nil.value.has_value(), "nil is not shown");

    ExecutionResult str = lua.execute(4, "'text'");
    assertEqual(*str.value, "text");
}

void InterpreterTestSuite::testStatementHasNoValue() {
    Stream in("stdin"), out("stdout");
    LuaInterpreter lua(in, out, test_config());
    lua.initialize();

    ExecutionResult result = lua.execute(1, "local a = 1\nb = a + 1");
    assertTrue(result.executed);
    assertFalse(result.value.has_value());
    assertEqual(out.flush(), "", "Statements print nothing");
}

void InterpreterTestSuite::testErrorsGoToStdout() {
    Stream in("stdin"), out("stdout");
    LuaInterpreter lua(in, out, test_config());
    lua.initialize();

    ExecutionResult runtime = lua.execute(1, "error('boom')");
    assertFalse(runtime.executed, "Runtime error fails the execution");
    std::string text = out.flush();
    assertContains(text, "boom");
    assertContains(text, "stack traceback");

    ExecutionResult syntax = lua.execute(2, "x = = 1");
    assertFalse(syntax.executed, "Syntax error fails the execution");
    assertContains(out.flush(), "stdin:1:");

    // The state stays usable
    assertEqual(*lua.execute(3, "2 * 3").value, "6");
}

void InterpreterTestSuite::testSleepRejectsNonFinite() {
    Stream in("stdin"), out("stdout");
    LuaInterpreter lua(in, out, test_config());
    lua.initialize();

    assertFalse(lua.execute(1, "sleep(math.huge)").executed, "Infinite duration refused");
    assertContains(out.flush(), "finite number expected");

    assertFalse(lua.execute(2, "sleep(0/0)").executed, "NaN duration refused");
    assertContains(out.flush(), "finite number expected");

    assertTrue(lua.execute(3, "sleep(-1)").executed, "Negative duration returns at once");
    assertTrue(lua.execute(4, "sleep(0.01)").executed);
}

void InterpreterTestSuite::testEnvironmentPersists() {
    Stream in("stdin"), out("stdout");
    LuaInterpreter lua(in, out, test_config());
    lua.initialize();

    lua.execute(1, "y = 10");
    lua.execute(2, "function double(v) return v * 2 end");
    assertEqual(*lua.execute(3, "double(y)").value, "20");

    assertTrue(lua.hasLocal("y"), "Assignments land in the environment");
    assertTrue(lua.hasLocal("double"));
    assertFalse(lua.hasLocal("print"), "Globals are reached through __index");
}

void InterpreterTestSuite::testLocalsRoundTrip() {
    Stream in("stdin"), out("stdout");
    LuaInterpreter lua(in, out, test_config());
    lua.initialize();

    lua.setLocal("n", ScriptValue(42LL));
    lua.setLocal("s", ScriptValue(std::string("hi")));
    lua.setLocal("flag", ScriptValue(true));
    lua.setLocal("ratio", ScriptValue(0.5));

    assertEqual(*lua.execute(1, "n + 1").value, "43");
    assertEqual(*lua.execute(2, "s .. '!'").value, "hi!");
    assertEqual(*lua.execute(3, "flag and ratio * 4").value, "2.0");

    ScriptValue n = lua.getLocal("n");
    assertTrue(std::holds_alternative<long long>(n), "Integers come back as integers");
    assertEqual(std::get<long long>(n), 42);
    assertEqual(script_value_to_string(lua.getLocal("s")), "hi");
    assertTrue(std::holds_alternative<std::monostate>(lua.getLocal("missing")));

    std::vector<std::string> names = lua.localNames();
    assertTrue(contains(names, "n") && contains(names, "s"), "Local names listed");

    lua.clearLocals();
    assertFalse(lua.hasLocal("n"), "Environment cleared");
    assertEqual(*lua.execute(4, "type(print)").value, "function", "Globals survive a clear");
}

void InterpreterTestSuite::testPrintAndIoWrite() {
    Stream in("stdin"), out("stdout");
    LuaInterpreter lua(in, out, test_config());
    lua.initialize();

    lua.execute(1, "print('a', 1, nil)");
    assertEqual(out.flush(), "a\t1\tnil\n");

    lua.execute(2, "io.write('x', 2)");
    assertEqual(out.flush(), "x2");
}

void InterpreterTestSuite::testIoRead() {
    Stream in("stdin"), out("stdout");
    LuaInterpreter lua(in, out, test_config());
    lua.initialize();

    in.write("hello\n");
    assertTrue(lua.execute(1, "line = io.read()").executed);
    assertEqual(script_value_to_string(lua.getLocal("line")), "hello");

    in.write("42\n");
    lua.execute(2, "num = io.read('n')");
    assertEqual(script_value_to_string(lua.getLocal("num")), "42");

    in.write("abc\n");
    lua.execute(3, "raw = io.read('L')");
    assertEqual(script_value_to_string(lua.getLocal("raw")), "abc\n");

    in.close();
    assertTrue(lua.execute(4, "eof = io.read()").executed, "EOF is not an error");
    assertFalse(lua.hasLocal("eof"), "io.read returns nil at EOF");
}

void InterpreterTestSuite::testInterruptIsIdentityChecked() {
    Stream in("stdin"), out("stdout");
    LuaInterpreter lua(in, out, test_config());
    lua.initialize();

    assertFalse(lua.interrupt(5), "Nothing running");

    ExecutionResult result{true, std::nullopt};
    std::thread worker([&lua, &result]() {
        result = lua.execute(7, "while true do end");
    });

    bool started = waitUntil([&lua]() { return lua.currentExecution() == 7; });
    assertTrue(started, "Execution started");
    assertFalse(lua.interrupt(6), "Stale identity is not delivered");
    assertTrue(lua.interrupt(7), "Current identity is delivered");
    worker.join();

    assertFalse(result.executed, "Interrupted execution reports failure");
    assertContains(out.flush(), "interrupted!");
    assertEqual(static_cast<long long>(lua.currentExecution()), 0);
    assertFalse(lua.isInterruptRequested(), "Flag cleared after the run");
}

void InterpreterTestSuite::testCompletions() {
    Stream in("stdin"), out("stdout");
    LuaInterpreter lua(in, out, test_config());
    lua.initialize();
    lua.setLocal("my_value", ScriptValue(1LL));

    assertTrue(contains(lua.completions("pri"), "print"), "Global function");
    assertTrue(contains(lua.completions("x = string.fo"), "string.format"), "Table member");
    std::vector<std::string> mine = lua.completions("my_");
    assertEqual(static_cast<long long>(mine.size()), 1);
    assertEqual(mine[0], "my_value");
    assertTrue(lua.completions("nothere.").empty(), "Unknown table");
}

// === ExecutionControllerTestSuite Implementation ===

namespace {

// Foreground side of a controller under test
struct ControllerFixture {
    Stream in{"stdin"};
    Stream out{"stdout"};
    CommandQueue foreground{"Foreground"};
    ConsoleConfig config;
    ExecutionController controller;
    std::vector<ExecutionResult> completions;

    explicit ControllerFixture(ExecutionMode mode = ExecutionMode::Inline)
        : config(test_config(mode))
        , controller(in, out, foreground, config)
    {
        controller.initialize();
        controller.set_completion_callback([this](const ExecutionResult& result) {
            completions.push_back(result);
        });
    }

    bool waitIdle(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            foreground.processCommands();
            if (!controller.is_running()) {
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            foreground.waitForCommands(std::chrono::milliseconds(10));
        }
    }

    bool waitStarted() {
        return TestSuite::waitUntil([this]() {
            uint64_t id = controller.current_execution();
            return id != 0 && controller.interpreter().currentExecution() == id;
        });
    }
};

} // namespace

std::vector<TestResult> ExecutionControllerTestSuite::runAllTests() {
    std::vector<TestResult> results;

    results.push_back(runTest("Inline Submit", [this]() { testInlineSubmit(); }));
    results.push_back(runTest("Incomplete Submit", [this]() { testIncompleteSubmit(); }));
    results.push_back(runTest("Queued Submit", [this]() { testQueuedSubmit(); }));
    results.push_back(runTest("Threaded Submit", [this]() { testThreadedSubmit(); }));
    results.push_back(runTest("Busy While Running", [this]() { testBusyWhileRunning(); }));
    results.push_back(runTest("Cancel Blocked Read", [this]() { testCancelBlockedRead(); }));
    results.push_back(runTest("Cancel Busy Loop", [this]() { testCancelBusyLoop(); }));
    results.push_back(runTest("Cancel When Idle", [this]() { testCancelWhenIdle(); }));
    results.push_back(runTest("External Executor", [this]() { testExternalExecutor(); }));
    results.push_back(runTest("External Exit Waits For Tasks", [this]() { testExternalExitWaitsForTasks(); }));
    results.push_back(runTest("Push And Get Local", [this]() { testPushAndGetLocal(); }));
    results.push_back(runTest("Exit Is Idempotent", [this]() { testExitIsIdempotent(); }));

    return results;
}

void ExecutionControllerTestSuite::testInlineSubmit() {
    ControllerFixture fixture;
    assertTrue(fixture.controller.mode() == ExecutionMode::Inline);

    assertTrue(fixture.controller.submit("1 + 2") == SubmitStatus::Dispatched);
    assertEqual(static_cast<long long>(fixture.completions.size()), 1, "Inline completes before submit returns");
    assertEqual(*fixture.completions[0].value, "3");
    assertTrue(fixture.controller.state() == ExecutionState::Idle);
    assertFalse(fixture.controller.supports_interrupt());
}

void ExecutionControllerTestSuite::testIncompleteSubmit() {
    ControllerFixture fixture;

    assertTrue(fixture.controller.submit("if true then") == SubmitStatus::Incomplete);
    assertFalse(fixture.controller.is_running(), "Nothing dispatched");
    assertTrue(fixture.completions.empty());
}

void ExecutionControllerTestSuite::testQueuedSubmit() {
    ControllerFixture fixture(ExecutionMode::Queued);

    assertTrue(fixture.controller.submit("3 * 3") == SubmitStatus::Dispatched);
    assertTrue(fixture.controller.is_running(), "Runs on a later loop iteration");
    assertTrue(fixture.completions.empty());

    fixture.foreground.processCommands();
    assertFalse(fixture.controller.is_running());
    assertEqual(static_cast<long long>(fixture.completions.size()), 1);
    assertEqual(*fixture.completions[0].value, "9");
}

void ExecutionControllerTestSuite::testThreadedSubmit() {
    ControllerFixture fixture(ExecutionMode::Threaded);
    assertTrue(fixture.controller.supports_interrupt());

    assertTrue(fixture.controller.submit("return 4") == SubmitStatus::Dispatched);
    assertTrue(fixture.waitIdle(), "Threaded execution completes");
    assertEqual(static_cast<long long>(fixture.completions.size()), 1);
    assertTrue(fixture.completions[0].executed);
    assertEqual(*fixture.completions[0].value, "4");
}

void ExecutionControllerTestSuite::testBusyWhileRunning() {
    ControllerFixture fixture(ExecutionMode::Threaded);

    assertTrue(fixture.controller.submit("sleep_ms(200)") == SubmitStatus::Dispatched);
    assertTrue(fixture.controller.submit("1") == SubmitStatus::Busy, "Second submission refused");
    assertTrue(fixture.controller.get_completions("pri").empty(), "No completions while running");
    assertTrue(fixture.waitIdle());
    assertEqual(static_cast<long long>(fixture.completions.size()), 1);
}

void ExecutionControllerTestSuite::testCancelBlockedRead() {
    ControllerFixture fixture(ExecutionMode::Threaded);

    assertTrue(fixture.controller.submit("x = io.read()") == SubmitStatus::Dispatched);
    assertTrue(fixture.waitStarted(), "Worker entered the chunk");

    assertTrue(fixture.controller.cancel() == CancelOutcome::InterruptDelivered);
    assertTrue(fixture.waitIdle(), "Blocked read released without deadlock");

    assertEqual(static_cast<long long>(fixture.completions.size()), 1);
    assertFalse(fixture.completions[0].executed, "Reported as not executed");
    assertContains(fixture.out.flush(), "interrupted!");
}

void ExecutionControllerTestSuite::testCancelBusyLoop() {
    ControllerFixture fixture(ExecutionMode::Threaded);

    assertTrue(fixture.controller.submit("while true do end") == SubmitStatus::Dispatched);
    assertTrue(fixture.waitStarted());

    assertTrue(fixture.controller.cancel() == CancelOutcome::InterruptDelivered);
    assertTrue(fixture.waitIdle(), "Hook stops the loop");
    assertFalse(fixture.completions[0].executed);

    // The worker keeps serving submissions
    assertTrue(fixture.controller.submit("'still alive'") == SubmitStatus::Dispatched);
    assertTrue(fixture.waitIdle());
    assertEqual(*fixture.completions[1].value, "still alive");
}

void ExecutionControllerTestSuite::testCancelWhenIdle() {
    ControllerFixture threaded(ExecutionMode::Threaded);
    assertTrue(threaded.controller.cancel() == CancelOutcome::NothingRunning);

    ControllerFixture queued(ExecutionMode::Queued);
    queued.controller.submit("1");
    assertTrue(queued.controller.cancel() == CancelOutcome::NotDelivered,
               "Cooperative executors cannot interrupt");
    queued.foreground.processCommands();
    assertTrue(queued.completions[0].executed, "Cancel had no effect");
}

namespace {

// Spawn function backed by joinable threads
struct ThreadSpawner {
    std::mutex mutex;
    std::vector<std::thread> threads;

    SpawnFunction spawner() {
        return [this](std::function<void()> task) {
            std::lock_guard<std::mutex> lock(mutex);
            threads.emplace_back(task);
        };
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return threads.size();
    }

    void joinAll() {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }
};

} // namespace

void ExecutionControllerTestSuite::testExternalExecutor() {
    ThreadSpawner spawner;
    {
        ControllerFixture fixture;

        assertFalse(fixture.controller.configure_executor(ExecutionMode::External),
                    "External mode needs a spawn function");

        bool configured = fixture.controller.configure_executor(ExecutionMode::External, spawner.spawner());
        assertTrue(configured);
        assertTrue(fixture.controller.supports_interrupt());

        assertTrue(fixture.controller.submit("10 // 3") == SubmitStatus::Dispatched);
        assertTrue(fixture.waitIdle());
        assertEqual(*fixture.completions[0].value, "3");
        assertEqual(static_cast<long long>(spawner.count()), 1);

        fixture.controller.exit();
    }
    spawner.joinAll();
}

void ExecutionControllerTestSuite::testExternalExitWaitsForTasks() {
    ThreadSpawner spawner;
    {
        ControllerFixture fixture;
        assertTrue(fixture.controller.configure_executor(ExecutionMode::External, spawner.spawner()));

        assertTrue(fixture.controller.submit("while true do end") == SubmitStatus::Dispatched);
        assertTrue(fixture.waitStarted(), "Spawned task entered the chunk");

        ExternalExecutor* executor = static_cast<ExternalExecutor*>(fixture.controller.executor());
        assertEqual(executor->inFlight(), 1);

        // Interrupts the loop, then waits for the spawned task to return
        fixture.controller.exit();
        assertEqual(executor->inFlight(), 0, "No spawned task outlives exit()");

        fixture.foreground.processCommands();
        assertTrue(fixture.completions.empty(), "Completion after exit is dropped");
        assertTrue(fixture.controller.submit("1") == SubmitStatus::Busy);
    }
    spawner.joinAll();
}

void ExecutionControllerTestSuite::testPushAndGetLocal() {
    ControllerFixture fixture(ExecutionMode::Threaded);

    fixture.controller.push_local("answer", ScriptValue(42LL));
    ScriptValue value = fixture.controller.get_local("answer");
    assertEqual(script_value_to_string(value), "42", "Value visible in the worker context");

    assertTrue(fixture.controller.submit("answer * 2") == SubmitStatus::Dispatched);
    assertTrue(fixture.waitIdle());
    assertEqual(*fixture.completions[0].value, "84");

    assertTrue(contains(fixture.controller.get_completions("ans"), "answer"));
}

void ExecutionControllerTestSuite::testExitIsIdempotent() {
    ControllerFixture fixture(ExecutionMode::Threaded);
    assertTrue(fixture.controller.start_worker(), "Worker started eagerly");

    fixture.controller.exit();
    fixture.controller.exit();
    assertTrue(fixture.controller.has_exited());
    assertTrue(fixture.controller.submit("1") == SubmitStatus::Busy, "Submissions refused after exit");
}
