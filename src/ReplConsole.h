//
//  ReplConsole.h
//  LuaConsole Framework - Interactive Console Transcript and Input Region
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  The console keeps the transcript (a Log of records over a gap buffer
//  document) and the editable input region at its tail. Keyboard routing
//  and rendering live in the host; the host calls the editing operations
//  below and reads records and prompt text back.
//
//  All methods must be called on the thread that constructed the console.
//

#ifndef REPL_CONSOLE_H
#define REPL_CONSOLE_H

#include "CommandQueue.h"
#include "CompletionProvider.h"
#include "ConsoleConfig.h"
#include "ExecutionController.h"
#include "GapBuffer.h"
#include "Stream.h"
#include "TranscriptLog.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace LuaConsole {

/**
 * Cursor over the document. anchor == position means no selection.
 */
struct TextCursor {
    int anchor;
    int position;

    bool hasSelection() const { return anchor != position; }
    int selectionStart() const { return anchor < position ? anchor : position; }
    int selectionEnd() const { return anchor < position ? position : anchor; }
};

class ReplConsole {
public:
    using RecordCallback = std::function<void(const LogRecord&, int)>;
    using InputCallback = std::function<void(const std::string&)>;
    using CloseCallback = std::function<void()>;

    explicit ReplConsole(const ConsoleConfig& config = create_default_config());
    ~ReplConsole();

    ReplConsole(const ReplConsole&) = delete;
    ReplConsole& operator=(const ReplConsole&) = delete;

    // Core lifecycle
    bool initialize();
    bool is_initialized() const { return m_initialized; }
    const std::string& get_last_error() const { return m_last_error; }

    // Tear down the worker and close both streams; idempotent
    void exit();
    bool is_closed() const { return m_closed; }

    // Execution model
    bool start_worker();
    bool configure_executor(ExecutionMode mode, SpawnFunction spawn = nullptr);

    // ------------------------------------------------------------------
    // Transcript
    // ------------------------------------------------------------------

    /**
     * Add a record. While an input record is live the new record goes in
     * front of it, so the editable region stays at the tail.
     */
    void append(RecordDomain domain, const std::string& prompt, const std::string& text);

    const Log& log() const { return m_log; }
    std::string transcript_text() const;

    // Prompt text rendered in front of a transcript line
    std::string prompt_text_for_line(int line_number) const;

    // ------------------------------------------------------------------
    // Input region
    // ------------------------------------------------------------------

    int prompt_pos() const { return m_prompt_pos; }
    int prompt_end() const { return m_prompt_end; }
    const TextCursor& cursor() const { return m_cursor; }
    int cursor_offset() const { return m_cursor.position - m_prompt_pos; }
    bool has_live_input() const { return m_input_record >= 0; }

    std::string input_buffer() const;
    void clear_input_buffer();
    void insert_input_text(const std::string& text);

    // Cursor placement is clamped into [prompt_pos, prompt_end]
    void set_cursor_position(int position, bool keep_anchor = false);
    void set_selection(int anchor, int position);

    // Add or remove one tab-width block on every selected line
    void indent_selection(bool indent = true);

    // ------------------------------------------------------------------
    // Key operations
    // ------------------------------------------------------------------

    void submit_input();          // Enter
    void interrupt();             // Ctrl-C
    bool handle_eof_request();    // Ctrl-D, only acts on an empty buffer
    void handle_tab();
    void handle_backtab();
    void backspace();
    void delete_forward();
    void move_home(bool select = false);

    // Submit a source snippet confirmed by the user
    void process_input(const std::string& source);

    // ------------------------------------------------------------------
    // Foreground loop
    // ------------------------------------------------------------------

    void process_events();
    bool wait_for_events(std::chrono::milliseconds timeout);
    CommandQueue& foreground_queue() { return m_foreground; }

    // ------------------------------------------------------------------
    // Collaborators
    // ------------------------------------------------------------------

    void set_completion_provider(std::shared_ptr<CompletionProvider> provider);
    std::vector<std::string> get_completions(const std::string& line);
    std::vector<std::string> get_completions();

    void push_local(const std::string& name, const ScriptValue& value);

    void on_record(RecordCallback callback) { m_record_callbacks.push_back(std::move(callback)); }
    void on_input_applied(InputCallback callback) { m_input_callbacks.push_back(std::move(callback)); }
    void on_close(CloseCallback callback) { m_close_callbacks.push_back(std::move(callback)); }

    // Configuration
    void set_tab(const std::string& chars);
    const std::string& tab_chars() const { return m_tab_chars; }
    void ctrl_d_exits_console(bool exits) { m_ctrl_d_exits = exits; }

    // State queries
    bool is_executing() const;
    bool in_continuation() const { return m_more; }
    int current_line() const { return m_current_line; }

    Stream& stdin_stream() { return m_stdin; }
    Stream& stdout_stream() { return m_stdout; }
    ExecutionController& controller() { return *m_controller; }

private:
    // Record management
    void append_record(const LogRecord& record);
    void insert_before_input(LogRecord record);
    void terminate_last_record();
    void open_input_record(const std::string& head, const std::string& continuation);
    void open_stdin_record();
    void close_input_record();
    std::string remove_input_record();
    void sync_input_record();
    void notify_record(int index);

    // Console flow
    void show_ps();
    void finish_command(const ExecutionResult& result);
    void drain_stdout();
    void handle_stdout_data(const std::string& data);

    // Editing helpers
    void keep_cursor_in_buffer();
    void remove_selected_input();
    std::string line_until_cursor() const;
    std::string line_after_cursor() const;

    // Document access
    int doc_size() const;
    std::string doc_text(int start, int end) const;
    void doc_insert(int pos, const std::string& text);
    void doc_delete(int start, int end);

    ConsoleConfig m_config;

    // Declared before the controller so they outlive the worker
    CommandQueue m_foreground;
    Stream m_stdin;
    Stream m_stdout;

    GapBuffer* m_document;
    Log m_log;

    int m_prompt_pos;
    int m_prompt_end;
    TextCursor m_cursor;

    int m_input_record;                 // Index of the live input record or -1
    std::string m_input_prompt_head;
    std::string m_input_continuation;

    std::string m_tab_chars;
    bool m_ctrl_d_exits;
    bool m_more;
    bool m_initialized;
    bool m_closed;
    int m_current_line;
    std::vector<std::string> m_pending_lines;
    std::string m_last_input;
    std::string m_last_error;

    std::shared_ptr<CompletionProvider> m_completion_provider;
    std::vector<RecordCallback> m_record_callbacks;
    std::vector<InputCallback> m_input_callbacks;
    std::vector<CloseCallback> m_close_callbacks;

    std::unique_ptr<ExecutionController> m_controller;
};

} // namespace LuaConsole

// C interface for hosts that embed a single console
extern "C" {
    // Global console instance management
    bool luaconsole_initialize(void);
    void luaconsole_shutdown(void);
    bool luaconsole_is_initialized(void);

    // Input handling
    void luaconsole_insert_text(const char* text);
    void luaconsole_submit(void);
    void luaconsole_interrupt(void);
    void luaconsole_tab(void);
    void luaconsole_backspace(void);

    // Foreground loop
    void luaconsole_process_events(void);

    // Queries; returned strings stay valid until the next call
    const char* luaconsole_input_buffer(void);
    const char* luaconsole_transcript(void);
    int luaconsole_record_count(void);
    bool luaconsole_is_executing(void);
}

#endif // REPL_CONSOLE_H
