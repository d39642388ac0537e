//
//  ReplConsole.cpp
//  LuaConsole Framework - Interactive Console Transcript and Input Region
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "ReplConsole.h"
#include "ConsoleLogger.h"

#include <algorithm>
#include <new>
#include <sstream>

namespace LuaConsole {

static const char* kCtrlDMessage = "Can't use CTRL-D to exit, you have to exit the application !\n";
static const char* kNoCompletion = "No completion support available";

static int count_newlines(const std::string& text) {
    return static_cast<int>(std::count(text.begin(), text.end(), '\n'));
}

static bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

ReplConsole::ReplConsole(const ConsoleConfig& config)
    : m_config(config)
    , m_foreground("ForegroundQueue")
    , m_stdin("stdin")
    , m_stdout("stdout")
    , m_document(gap_buffer_create(0))
    , m_prompt_pos(0)
    , m_prompt_end(0)
    , m_cursor{0, 0}
    , m_input_record(-1)
    , m_tab_chars(config.tab_width > 0 ? config.tab_width : 4, ' ')
    , m_ctrl_d_exits(config.ctrl_d_exits)
    , m_more(false)
    , m_initialized(false)
    , m_closed(false)
    , m_current_line(0)
{
    if (!m_document) {
        throw std::bad_alloc();
    }

    // Output written from any thread is appended on the foreground thread
    m_stdout.on_write([this](const std::string&) {
        m_foreground.queueVoidCommand([this]() { drain_stdout(); });
    });

    m_controller.reset(new ExecutionController(m_stdin, m_stdout, m_foreground, m_config));
}

ReplConsole::~ReplConsole() {
    exit();
    m_controller.reset();
    gap_buffer_free(m_document);
}

bool ReplConsole::initialize() {
    if (m_initialized) {
        return true;
    }

    console_set_debug_output(m_config.enable_debug_logging);
    console_log("ReplConsole", "Initializing...");

    std::string error;
    if (!validate_config(m_config, &error)) {
        m_last_error = "Invalid configuration: " + error;
        console_error("ReplConsole", m_last_error);
        return false;
    }

    if (!m_controller->initialize()) {
        m_last_error = m_controller->getLastError();
        console_error("ReplConsole", "Execution controller failed: " + m_last_error);
        return false;
    }
    m_controller->set_completion_callback([this](const ExecutionResult& result) {
        finish_command(result);
    });

    m_initialized = true;
    show_ps();

    console_log("ReplConsole", "Initialization complete");
    return true;
}

void ReplConsole::exit() {
    if (m_closed) {
        return;
    }
    m_closed = true;
    console_log("ReplConsole", "Exiting...");

    m_controller->exit();
    m_stdin.close();
    m_stdout.close();

    for (auto& callback : m_close_callbacks) {
        callback();
    }
}

bool ReplConsole::start_worker() {
    return m_controller->start_worker();
}

bool ReplConsole::configure_executor(ExecutionMode mode, SpawnFunction spawn) {
    return m_controller->configure_executor(mode, std::move(spawn));
}

bool ReplConsole::is_executing() const {
    return m_controller->is_running();
}

// ============================================================================
// Document access
// ============================================================================

int ReplConsole::doc_size() const {
    return gap_buffer_size(m_document);
}

std::string ReplConsole::doc_text(int start, int end) const {
    if (end <= start) {
        return std::string();
    }
    std::string text(end - start, '\0');
    int copied = gap_buffer_copy_range(m_document, start, end, &text[0]);
    text.resize(copied);
    return text;
}

void ReplConsole::doc_insert(int pos, const std::string& text) {
    if (!gap_buffer_insert_at(m_document, pos, text.data(), static_cast<int>(text.size()))) {
        throw std::bad_alloc();
    }
}

void ReplConsole::doc_delete(int start, int end) {
    if (!gap_buffer_delete_range(m_document, start, end)) {
        throw std::logic_error("ReplConsole: invalid document range " +
                               std::to_string(start) + ".." + std::to_string(end));
    }
}

std::string ReplConsole::transcript_text() const {
    return doc_text(0, doc_size());
}

std::string ReplConsole::prompt_text_for_line(int line_number) const {
    return m_log.prompt_line(line_number);
}

// ============================================================================
// Records
// ============================================================================

void ReplConsole::notify_record(int index) {
    const LogRecord& record = m_log.at(index);
    for (auto& callback : m_record_callbacks) {
        callback(record, index);
    }
}

void ReplConsole::terminate_last_record() {
    if (m_log.empty() || ends_with(m_log.back().text, "\n")) {
        return;
    }
    LogRecord last = m_log.back();
    last.text += '\n';
    m_log.set(-1, last);
    doc_insert(doc_size(), "\n");
}

void ReplConsole::append_record(const LogRecord& record) {
    terminate_last_record();
    m_log.append(record);
    doc_insert(doc_size(), record.text);

    m_prompt_pos = m_prompt_end = doc_size();
    m_cursor.anchor = m_cursor.position = m_prompt_end;
    notify_record(m_log.size() - 1);
}

void ReplConsole::insert_before_input(LogRecord record) {
    // The record ends up in the middle of the log, so it must be closed
    if (!ends_with(record.text, "\n")) {
        record.text += '\n';
    }
    int missing = count_newlines(record.text) - record.num_lines();
    if (missing > 0) {
        record.prompt.append(missing, '\n');
    }

    int at = m_log.positions().first(m_input_record);
    m_log.insert(m_input_record, record);
    doc_insert(at, record.text);

    int shift = static_cast<int>(record.text.size());
    m_prompt_pos += shift;
    m_prompt_end += shift;
    m_cursor.anchor += shift;
    m_cursor.position += shift;

    int index = m_input_record;
    m_input_record++;
    notify_record(index);
}

void ReplConsole::append(RecordDomain domain, const std::string& prompt, const std::string& text) {
    LogRecord record(domain, prompt, text);
    if (m_input_record >= 0) {
        insert_before_input(record);
    } else {
        append_record(record);
    }
}

void ReplConsole::open_input_record(const std::string& head, const std::string& continuation) {
    if (m_input_record >= 0) {
        close_input_record();
    }
    m_input_prompt_head = head;
    m_input_continuation = continuation;
    append_record(LogRecord(RecordDomain::Input, head + "\n", ""));
    m_input_record = m_log.size() - 1;
}

void ReplConsole::open_stdin_record() {
    open_input_record("", "");
}

void ReplConsole::close_input_record() {
    if (m_input_record < 0) {
        return;
    }

    LogRecord record = m_log.at(m_input_record);
    record.text += '\n';
    m_log.set(m_input_record, record);
    doc_insert(doc_size(), "\n");

    m_input_record = -1;
    m_prompt_pos = m_prompt_end = doc_size();
    m_cursor.anchor = m_cursor.position = m_prompt_end;
}

std::string ReplConsole::remove_input_record() {
    if (m_input_record < 0) {
        return std::string();
    }

    std::string typed = input_buffer();
    doc_delete(m_prompt_pos, doc_size());
    m_log.remove(m_input_record);

    m_input_record = -1;
    m_prompt_pos = m_prompt_end = doc_size();
    m_cursor.anchor = m_cursor.position = m_prompt_end;
    return typed;
}

void ReplConsole::sync_input_record() {
    if (m_input_record < 0) {
        return;
    }

    std::string text = input_buffer();
    std::string prompt = m_input_prompt_head + "\n";
    for (int i = count_newlines(text); i > 0; --i) {
        prompt += m_input_continuation + "\n";
    }
    m_log.set(m_input_record, LogRecord(RecordDomain::Input, prompt, text));
    m_prompt_end = doc_size();
}

// ============================================================================
// Console flow
// ============================================================================

void ReplConsole::show_ps() {
    drain_stdout();

    if (!m_log.empty() && m_log.back().domain != RecordDomain::Input) {
        append_record(LogRecord(RecordDomain::Control, "\n", "\n"));
    }
    open_input_record(format_prompt(m_config.ps1, m_current_line), m_config.ps2);
}

void ReplConsole::drain_stdout() {
    std::string data = m_stdout.flush();
    if (!data.empty()) {
        handle_stdout_data(data);
    }
}

void ReplConsole::handle_stdout_data(const std::string& data) {
    int num_lines = count_newlines(data) + (ends_with(data, "\n") ? 0 : 1);
    append(RecordDomain::RawOutput, std::string(num_lines, '\n'), data);
}

void ReplConsole::process_input(const std::string& source) {
    if (m_closed) {
        return;
    }

    close_input_record();
    m_pending_lines.push_back(source);

    std::string full;
    for (size_t i = 0; i < m_pending_lines.size(); ++i) {
        if (i > 0) {
            full += '\n';
        }
        full += m_pending_lines[i];
    }
    m_last_input = full;

    SubmitStatus status = m_controller->submit(full);
    switch (status) {
        case SubmitStatus::Incomplete:
            m_more = true;
            open_input_record(format_prompt(m_config.ps2, m_current_line), m_config.ps2);
            break;

        case SubmitStatus::Dispatched:
            m_more = false;
            m_pending_lines.clear();
            for (auto& callback : m_input_callbacks) {
                callback(full);
            }
            // Lines typed while the chunk runs are fed to its stdin
            if (m_controller->is_running() && m_input_record < 0 && !m_closed) {
                open_stdin_record();
            }
            break;

        case SubmitStatus::Busy:
            console_error("ReplConsole", "Input rejected, execution busy or closed");
            m_more = false;
            m_pending_lines.clear();
            if (!m_closed) {
                show_ps();
            }
            break;
    }
}

void ReplConsole::finish_command(const ExecutionResult& result) {
    drain_stdout();
    std::string carry = remove_input_record();

    if (result.value) {
        std::string prompt = format_prompt(m_config.ps_out, m_current_line) + "\n";
        prompt.append(count_newlines(*result.value), '\n');
        append_record(LogRecord(RecordDomain::Output, prompt, *result.value + "\n"));
    }
    if (result.executed && !m_last_input.empty()) {
        m_current_line++;
    }

    m_more = false;
    m_pending_lines.clear();
    if (m_closed) {
        return;
    }

    show_ps();
    if (!carry.empty()) {
        insert_input_text(carry);
    }
}

void ReplConsole::submit_input() {
    if (m_closed) {
        return;
    }

    if (m_controller->is_running()) {
        // A line for the running chunk's stdin
        std::string line = input_buffer();
        if (m_input_record >= 0) {
            close_input_record();
        } else {
            append_record(LogRecord(RecordDomain::Input, "\n", line + "\n"));
        }
        m_stdin.write(line + "\n");
        if (m_controller->is_running() && m_input_record < 0) {
            open_stdin_record();
        }
        return;
    }

    m_cursor.anchor = m_cursor.position = m_prompt_end;
    process_input(input_buffer());
}

void ReplConsole::interrupt() {
    if (m_closed) {
        return;
    }

    if (m_controller->is_running()) {
        CancelOutcome outcome = m_controller->cancel();
        if (outcome != CancelOutcome::InterruptDelivered) {
            console_log("ReplConsole", "Interrupt not delivered to running code");
        }
        return;
    }

    m_last_input.clear();
    close_input_record();
    m_stdout.write("^C\n");
    m_more = false;
    m_pending_lines.clear();
    show_ps();
}

bool ReplConsole::handle_eof_request() {
    if (m_closed || !input_buffer().empty() || m_controller->is_running()) {
        return false;
    }

    if (m_ctrl_d_exits) {
        exit();
        return true;
    }

    close_input_record();
    append_record(LogRecord(RecordDomain::Output, std::string(count_newlines(kCtrlDMessage), '\n'),
                            kCtrlDMessage));
    m_more = false;
    m_pending_lines.clear();
    show_ps();
    return true;
}

// ============================================================================
// Input region
// ============================================================================

std::string ReplConsole::input_buffer() const {
    if (m_input_record < 0) {
        return std::string();
    }
    return doc_text(m_prompt_pos, doc_size());
}

std::string ReplConsole::line_until_cursor() const {
    std::string before = input_buffer().substr(0, std::max(0, cursor_offset()));
    size_t newline = before.rfind('\n');
    return newline == std::string::npos ? before : before.substr(newline + 1);
}

std::string ReplConsole::line_after_cursor() const {
    std::string buffer = input_buffer();
    size_t offset = static_cast<size_t>(std::max(0, cursor_offset()));
    std::string after = offset < buffer.size() ? buffer.substr(offset) : std::string();
    return after.substr(0, after.find('\n'));
}

void ReplConsole::keep_cursor_in_buffer() {
    m_cursor.anchor = std::max(std::min(m_cursor.anchor, m_prompt_end), m_prompt_pos);
    m_cursor.position = std::max(std::min(m_cursor.position, m_prompt_end), m_prompt_pos);
}

void ReplConsole::set_cursor_position(int position, bool keep_anchor) {
    m_cursor.position = position;
    if (!keep_anchor) {
        m_cursor.anchor = position;
    }
    keep_cursor_in_buffer();
}

void ReplConsole::set_selection(int anchor, int position) {
    m_cursor.anchor = anchor;
    m_cursor.position = position;
    keep_cursor_in_buffer();
}

void ReplConsole::remove_selected_input() {
    if (!m_cursor.hasSelection() || m_input_record < 0) {
        return;
    }
    int start = m_cursor.selectionStart();
    doc_delete(start, m_cursor.selectionEnd());
    m_cursor.anchor = m_cursor.position = start;
    sync_input_record();
}

void ReplConsole::clear_input_buffer() {
    if (m_input_record < 0) {
        return;
    }
    m_cursor.anchor = m_prompt_pos;
    m_cursor.position = doc_size();
    remove_selected_input();
}

void ReplConsole::insert_input_text(const std::string& text) {
    if (m_closed) {
        return;
    }
    if (m_input_record < 0) {
        if (!m_controller->is_running()) {
            console_error("ReplConsole", "No input region to insert into");
            return;
        }
        open_stdin_record();
    }

    keep_cursor_in_buffer();
    remove_selected_input();

    doc_insert(m_cursor.position, text);
    m_cursor.position += static_cast<int>(text.size());
    m_cursor.anchor = m_cursor.position;
    sync_input_record();
}

void ReplConsole::indent_selection(bool indent) {
    if (m_input_record < 0) {
        return;
    }
    keep_cursor_in_buffer();

    std::string buffer = input_buffer();
    const std::string& tab = m_tab_chars;
    int tab_len = static_cast<int>(tab.size());

    int pos0 = m_cursor.selectionStart() - m_prompt_pos;
    int pos1 = m_cursor.selectionEnd() - m_prompt_pos;
    int line0 = count_newlines(buffer.substr(0, pos0));
    int line1 = count_newlines(buffer.substr(0, pos1));

    std::vector<std::string> lines;
    std::istringstream split(buffer);
    std::string piece;
    while (std::getline(split, piece, '\n')) {
        lines.push_back(piece);
    }
    if (buffer.empty() || buffer.back() == '\n') {
        lines.push_back(std::string());
    }

    // Always a full tab-width block, relative indentation is preserved
    for (int i = line0; i <= line1; ++i) {
        const std::string line = lines[i];
        if (indent) {
            lines[i] = tab + line;
        } else {
            std::string head = line.substr(0, tab_len);
            size_t first = head.find_first_not_of(" \t");
            head = first == std::string::npos ? std::string() : head.substr(first);
            lines[i] = head + (static_cast<int>(line.size()) > tab_len ? line.substr(tab_len) : std::string());
        }
        int num = static_cast<int>(lines[i].size()) - static_cast<int>(line.size());
        if (i == line0) {
            pos0 += num;
        }
        pos1 += num;
    }

    std::string joined;
    int line0_start = 0;
    int line1_start = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        if (static_cast<int>(i) == line0) {
            line0_start = static_cast<int>(joined.size());
        }
        if (static_cast<int>(i) == line1) {
            line1_start = static_cast<int>(joined.size());
        }
        joined += lines[i];
    }

    // Outdenting can pull an endpoint in front of its own line
    pos0 = std::max(pos0, line0_start);
    pos1 = std::max(pos1, line1_start);

    clear_input_buffer();
    insert_input_text(joined);
    set_selection(m_prompt_pos + pos0, m_prompt_pos + pos1);
}

void ReplConsole::handle_tab() {
    if (m_cursor.hasSelection()) {
        indent_selection(true);
        return;
    }
    keep_cursor_in_buffer();
    int tab_len = static_cast<int>(m_tab_chars.size());
    int num = tab_len - static_cast<int>(line_until_cursor().size()) % tab_len;
    insert_input_text(m_tab_chars.substr(0, num));
}

void ReplConsole::handle_backtab() {
    indent_selection(false);
}

void ReplConsole::backspace() {
    keep_cursor_in_buffer();
    if (!m_cursor.hasSelection() && cursor_offset() >= 1) {
        std::string buffer = line_until_cursor();
        int tab_len = static_cast<int>(m_tab_chars.size());
        bool tabstop = static_cast<int>(buffer.size()) % tab_len == 0;
        int num = (tabstop && ends_with(buffer, m_tab_chars)) ? tab_len : 1;
        m_cursor.anchor = m_cursor.position - num;
    }
    remove_selected_input();
}

void ReplConsole::delete_forward() {
    keep_cursor_in_buffer();
    if (!m_cursor.hasSelection() && cursor_offset() < static_cast<int>(input_buffer().size())) {
        int tab_len = static_cast<int>(m_tab_chars.size());
        bool tabstop = static_cast<int>(line_until_cursor().size()) % tab_len == 0;
        int num = (tabstop && starts_with(line_after_cursor(), m_tab_chars)) ? tab_len : 1;
        m_cursor.anchor = m_cursor.position;
        m_cursor.position += num;
        std::swap(m_cursor.anchor, m_cursor.position);
    }
    remove_selected_input();
}

void ReplConsole::move_home(bool select) {
    set_cursor_position(m_prompt_pos, select);
}

// ============================================================================
// Foreground loop and collaborators
// ============================================================================

void ReplConsole::process_events() {
    m_foreground.processCommands();
}

bool ReplConsole::wait_for_events(std::chrono::milliseconds timeout) {
    if (!m_foreground.waitForCommands(timeout)) {
        return false;
    }
    m_foreground.processCommands();
    return true;
}

void ReplConsole::set_completion_provider(std::shared_ptr<CompletionProvider> provider) {
    m_completion_provider = std::move(provider);
}

std::vector<std::string> ReplConsole::get_completions(const std::string& line) {
    if (!m_completion_provider) {
        return std::vector<std::string>(1, kNoCompletion);
    }
    return m_completion_provider->complete(line);
}

std::vector<std::string> ReplConsole::get_completions() {
    return get_completions(line_until_cursor());
}

void ReplConsole::push_local(const std::string& name, const ScriptValue& value) {
    m_controller->push_local(name, value);
}

void ReplConsole::set_tab(const std::string& chars) {
    if (chars.empty()) {
        console_error("ReplConsole", "Tab characters cannot be empty");
        return;
    }
    m_tab_chars = chars;
}

} // namespace LuaConsole

// ============================================================================
// C Interface
// ============================================================================

using LuaConsole::ReplConsole;

// Global instance
static ReplConsole* g_console_instance = nullptr;
static std::string g_console_text;

bool luaconsole_initialize(void) {
    if (!g_console_instance) {
        g_console_instance = new ReplConsole();
    }
    return g_console_instance->initialize();
}

void luaconsole_shutdown(void) {
    if (g_console_instance) {
        g_console_instance->exit();
        delete g_console_instance;
        g_console_instance = nullptr;
    }
}

bool luaconsole_is_initialized(void) {
    return g_console_instance && g_console_instance->is_initialized();
}

void luaconsole_insert_text(const char* text) {
    if (g_console_instance && text) {
        g_console_instance->insert_input_text(text);
    }
}

void luaconsole_submit(void) {
    if (g_console_instance) {
        g_console_instance->submit_input();
    }
}

void luaconsole_interrupt(void) {
    if (g_console_instance) {
        g_console_instance->interrupt();
    }
}

void luaconsole_tab(void) {
    if (g_console_instance) {
        g_console_instance->handle_tab();
    }
}

void luaconsole_backspace(void) {
    if (g_console_instance) {
        g_console_instance->backspace();
    }
}

void luaconsole_process_events(void) {
    if (g_console_instance) {
        g_console_instance->process_events();
    }
}

const char* luaconsole_input_buffer(void) {
    g_console_text = g_console_instance ? g_console_instance->input_buffer() : std::string();
    return g_console_text.c_str();
}

const char* luaconsole_transcript(void) {
    g_console_text = g_console_instance ? g_console_instance->transcript_text() : std::string();
    return g_console_text.c_str();
}

int luaconsole_record_count(void) {
    return g_console_instance ? g_console_instance->log().size() : 0;
}

bool luaconsole_is_executing(void) {
    return g_console_instance && g_console_instance->is_executing();
}
