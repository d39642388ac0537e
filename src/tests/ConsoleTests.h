//
//  ConsoleTests.h
//  LuaConsole Framework - Test Harness
//
//  Test suites for the transcript structures, streams, execution engine
//  and console coordinator.
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Test result structure
struct TestResult {
    std::string testName;
    bool passed;
    std::string errorMessage;
    double executionTimeMs;

    TestResult(const std::string& name, bool success, const std::string& error = "", double timeMs = 0.0)
        : testName(name), passed(success), errorMessage(error), executionTimeMs(timeMs) {}
};

// Test suite base class
class TestSuite {
public:
    virtual ~TestSuite() = default;
    virtual std::vector<TestResult> runAllTests() = 0;
    virtual std::string getSuiteName() const = 0;

    // Polls until done() holds; false on timeout
    static bool waitUntil(std::function<bool()> done,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

protected:
    TestResult runTest(const std::string& testName, std::function<void()> testFunction);
    void assertTrue(bool condition, const std::string& message = "Assertion failed");
    void assertFalse(bool condition, const std::string& message = "Assertion should be false");
    void assertEqual(long long a, long long b, const std::string& message = "Values not equal");
    void assertEqual(const std::string& a, const std::string& b, const std::string& message = "Strings not equal");
    void assertContains(const std::string& haystack, const std::string& needle,
                        const std::string& message = "Text not found");

    // Passes only if fn throws E
    template<typename E>
    void assertThrows(std::function<void()> fn, const std::string& message = "Expected exception") {
        try {
            fn();
        } catch (const E&) {
            return;
        }
        throw std::runtime_error(message);
    }

};

// === PARTITION AND LOG TESTS ===

class PartitionTestSuite : public TestSuite {
public:
    std::vector<TestResult> runAllTests() override;
    std::string getSuiteName() const override { return "Partition"; }

private:
    void testEmptyPartition();
    void testAppendAndPrefixSums();
    void testSetShiftsFollowingOffsets();
    void testInsertAndRemove();
    void testNegativeIndices();
    void testOutOfRange();
    void testFindLoc();
    void testFindLocBoundaries();
    void testRandomOperationsMatchModel();
};

class LogTestSuite : public TestSuite {
public:
    std::vector<TestResult> runAllTests() override;
    std::string getSuiteName() const override { return "Log"; }

private:
    void testLineCountsPerRecord();
    void testPositionsTrackText();
    void testInsertSetRemove();
    void testFailedOperationLeavesLogUnchanged();
    void testFindRecordForLine();
    void testPromptLine();
    void testOpenRecord();
    void testRandomOperationsStayInLockstep();
};

// === STREAM TESTS ===

class StreamTestSuite : public TestSuite {
public:
    std::vector<TestResult> runAllTests() override;
    std::string getSuiteName() const override { return "Stream"; }

private:
    void testPartialWritesFormOneLine();
    void testFlushResetsBacklog();
    void testNonBlockingRead();
    void testBlockingReadAcrossThreads();
    void testTimeout();
    void testCloseDrainsThenEof();
    void testWriteAfterCloseIgnored();
    void testInterruptReaders();
    void testInterruptBeforeBufferedLine();
    void testCooperativePump();
    void testObservers();
};

// === EXECUTION TESTS ===

class CommandQueueTestSuite : public TestSuite {
public:
    std::vector<TestResult> runAllTests() override;
    std::string getSuiteName() const override { return "CommandQueue"; }

private:
    void testInlineOnOwnerThread();
    void testCrossThreadExecution();
    void testExceptionPropagation();
    void testDeferRunsOnNextIteration();
    void testShutdown();
};

class WorkerThreadTestSuite : public TestSuite {
public:
    std::vector<TestResult> runAllTests() override;
    std::string getSuiteName() const override { return "WorkerThread"; }

private:
    void testStartAndRunSync();
    void testPostRunsInOrder();
    void testStop();
};

class InterpreterTestSuite : public TestSuite {
public:
    std::vector<TestResult> runAllTests() override;
    std::string getSuiteName() const override { return "Interpreter"; }

private:
    void testClassify();
    void testExpressionValue();
    void testStatementHasNoValue();
    void testErrorsGoToStdout();
    void testEnvironmentPersists();
    void testLocalsRoundTrip();
    void testPrintAndIoWrite();
    void testIoRead();
    void testInterruptIsIdentityChecked();
    void testCompletions();
    void testSleepRejectsNonFinite();
};

class ExecutionControllerTestSuite : public TestSuite {
public:
    std::vector<TestResult> runAllTests() override;
    std::string getSuiteName() const override { return "ExecutionController"; }

private:
    void testInlineSubmit();
    void testIncompleteSubmit();
    void testQueuedSubmit();
    void testThreadedSubmit();
    void testBusyWhileRunning();
    void testCancelBlockedRead();
    void testCancelBusyLoop();
    void testCancelWhenIdle();
    void testExternalExecutor();
    void testExternalExitWaitsForTasks();
    void testPushAndGetLocal();
    void testExitIsIdempotent();
};

// === CONSOLE TESTS ===

class ReplConsoleTestSuite : public TestSuite {
public:
    std::vector<TestResult> runAllTests() override;
    std::string getSuiteName() const override { return "ReplConsole"; }

private:
    void testInitialPrompt();
    void testExpressionTranscript();
    void testCounterIncrements();
    void testContinuationPrompt();
    void testIdleInterrupt();
    void testOutputBeforeLiveInput();
    void testOutputFromOtherThread();
    void testCtrlDMessage();
    void testCtrlDExits();
    void testIndentSelection();
    void testOutdentSelection();
    void testTabAndBackspace();
    void testDeleteForward();
    void testCursorClamping();
    void testCompletions();
    void testThreadedStdin();
    void testThreadedInterrupt();
    void testCInterface();
};

// === MAIN TEST RUNNER ===

class ConsoleTestRunner {
public:
    ConsoleTestRunner();
    ~ConsoleTestRunner();

    // Run all test suites
    bool runAllTests(bool verbose = true);

    // Run specific test suite
    bool runTestSuite(const std::string& suiteName, bool verbose = true);

    std::vector<std::string> getSuiteNames() const;
    std::vector<TestResult> getLastResults() const { return lastResults; }

private:
    void printTestResult(const TestResult& result, bool verbose) const;
    void printSummary(const std::vector<TestResult>& results) const;

    std::vector<std::unique_ptr<TestSuite>> testSuites;
    std::vector<TestResult> lastResults;
};
