//
//  TranscriptLog.cpp
//  LuaConsole Framework - Transcript Record Log
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "TranscriptLog.h"
#include <algorithm>
#include <stdexcept>

namespace LuaConsole {

const char* record_domain_name(RecordDomain domain) {
    switch (domain) {
        case RecordDomain::Input:     return "IN";
        case RecordDomain::Output:    return "OUT";
        case RecordDomain::RawOutput: return "STDOUT";
        case RecordDomain::Control:   return "";
    }
    return "";
}

int LogRecord::num_lines() const {
    return static_cast<int>(std::count(prompt.begin(), prompt.end(), '\n'));
}

bool LogRecord::is_open() const {
    return num_lines() > static_cast<int>(std::count(text.begin(), text.end(), '\n'));
}

const LogRecord& Log::at(int index) const {
    return m_records[check_index(index)];
}

void Log::append(const LogRecord& record) {
    m_records.push_back(record);
    m_linenos.append(record.num_lines());
    m_positions.append(static_cast<int>(record.text.size()));
    check_consistency();
}

void Log::insert(int index, const LogRecord& record) {
    index = check_index(index);
    m_records.insert(m_records.begin() + index, record);
    m_linenos.insert(index, record.num_lines());
    m_positions.insert(index, static_cast<int>(record.text.size()));
    check_consistency();
}

void Log::set(int index, const LogRecord& record) {
    index = check_index(index);
    m_records[index] = record;
    m_linenos.set(index, record.num_lines());
    m_positions.set(index, static_cast<int>(record.text.size()));
    check_consistency();
}

void Log::remove(int index) {
    index = check_index(index);
    m_records.erase(m_records.begin() + index);
    m_linenos.remove(index);
    m_positions.remove(index);
    check_consistency();
}

LineLocation Log::find_record_for_line(int line) const {
    if (line < 0 || line >= m_linenos.total()) {
        throw std::out_of_range("line " + std::to_string(line) +
                                " out of range in log of " +
                                std::to_string(m_linenos.total()) + " lines");
    }

    // Last record starting at or before the line; it is never zero-sized
    int index = m_linenos.find_loc(line + 1) - 1;
    LineLocation location;
    location.record_index = index;
    location.line_in_record = line - m_linenos.first(index);
    return location;
}

std::string Log::prompt_line(int line) const {
    LineLocation location = find_record_for_line(line);
    const std::string& prompt = m_records[location.record_index].prompt;

    size_t start = 0;
    for (int i = 0; i < location.line_in_record; ++i) {
        start = prompt.find('\n', start) + 1;
    }
    size_t end = prompt.find('\n', start);
    return prompt.substr(start, end - start);
}

int Log::check_index(int index) const {
    int count = size();
    if (index < -count || index >= count) {
        throw std::out_of_range("list index " + std::to_string(index) +
                                " out of range in list of size " + std::to_string(count));
    }
    return index < 0 ? index + count : index;
}

void Log::check_consistency() const {
    if (m_linenos.length() != size() || m_positions.length() != size()) {
        throw std::logic_error("Log: records, linenos and positions out of step (" +
                               std::to_string(size()) + ", " +
                               std::to_string(m_linenos.length()) + ", " +
                               std::to_string(m_positions.length()) + ")");
    }
}

} // namespace LuaConsole
