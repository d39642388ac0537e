//
//  TranscriptLog.h
//  LuaConsole Framework - Transcript Record Log
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  Ordered transcript records kept in lockstep with two partitions:
//  rendered line counts (linenos) and text lengths (positions).
//

#ifndef TRANSCRIPT_LOG_H
#define TRANSCRIPT_LOG_H

#include "Partition.h"
#include <string>
#include <vector>

namespace LuaConsole {

/**
 * Record domains (input echo, evaluated value, stream text, separators)
 */
enum class RecordDomain {
    Input,
    Output,
    RawOutput,
    Control
};

const char* record_domain_name(RecordDomain domain);

struct LogRecord {
    RecordDomain domain;
    std::string prompt;   // One '\n'-terminated prompt line per rendered line
    std::string text;

    LogRecord(RecordDomain d, const std::string& p, const std::string& t)
        : domain(d), prompt(p), text(t) {}

    // Rendered lines occupied by the record
    int num_lines() const;

    // Last rendered line is not terminated by the record's text yet
    bool is_open() const;
};

/**
 * Rendered line lookup result
 */
struct LineLocation {
    int record_index;
    int line_in_record;
};

class Log {
public:
    Log() = default;

    int size() const { return static_cast<int>(m_records.size()); }
    bool empty() const { return m_records.empty(); }

    // Negative indices count from the end
    const LogRecord& at(int index) const;
    const LogRecord& back() const { return at(-1); }
    const LogRecord& operator[](int index) const { return at(index); }

    void append(const LogRecord& record);
    void insert(int index, const LogRecord& record);
    void set(int index, const LogRecord& record);
    void remove(int index);

    /**
     * Locate the record whose prompt spans the given 0-based rendered line.
     * Zero-line records never match. Throws std::out_of_range past the end.
     */
    LineLocation find_record_for_line(int line) const;

    // Prompt text shown in front of a rendered line
    std::string prompt_line(int line) const;

    // Total rendered lines and characters
    int line_count() const { return m_linenos.total(); }
    int char_count() const { return m_positions.total(); }

    const std::vector<LogRecord>& records() const { return m_records; }
    const Partition& linenos() const { return m_linenos; }
    const Partition& positions() const { return m_positions; }

private:
    int check_index(int index) const;
    void check_consistency() const;

    std::vector<LogRecord> m_records;
    Partition m_linenos;
    Partition m_positions;
};

} // namespace LuaConsole

#endif // TRANSCRIPT_LOG_H
