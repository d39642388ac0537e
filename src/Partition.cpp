//
//  Partition.cpp
//  LuaConsole Framework - Offset-Indexed Chunk Sequence
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "Partition.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace LuaConsole {

Partition::Partition()
    : m_locs(1, 0)
{
}

int Partition::get(int index) const {
    index = check_index(index);
    return m_locs[index + 1] - m_locs[index];
}

void Partition::set(int index, int size) {
    index = check_index(index);
    int old_size = m_locs[index + 1] - m_locs[index];
    update_locs(index + 1, size - old_size);
}

void Partition::remove(int index) {
    index = check_index(index);
    int size = m_locs[index + 1] - m_locs[index];
    m_locs.erase(m_locs.begin() + index + 1);
    update_locs(index + 1, -size);
}

void Partition::insert(int index, int size) {
    index = check_index(index);
    // Zero-sized chunk first, then grow it
    m_locs.insert(m_locs.begin() + index, m_locs[index]);
    update_locs(index + 1, size);
}

void Partition::append(int size) {
    m_locs.push_back(m_locs.back() + size);
}

int Partition::find_loc(int pos) const {
    auto it = std::lower_bound(m_locs.begin(), m_locs.end(), pos);
    return static_cast<int>(it - m_locs.begin());
}

int Partition::first(int index) const {
    index = check_index(index);
    return m_locs[index];
}

int Partition::last(int index) const {
    index = check_index(index);
    return m_locs[index + 1] - 1;
}

int Partition::check_index(int index) const {
    int size = length();
    if (index < -size || index >= size) {
        throw std::out_of_range("list index " + std::to_string(index) +
                                " out of range in list of size " + std::to_string(size));
    }
    if (index < 0) {
        index += size;
    }
    return index;
}

void Partition::update_locs(int start_index, int delta) {
    if (delta == 0) {
        return;
    }
    for (size_t i = start_index; i < m_locs.size(); ++i) {
        m_locs[i] += delta;
    }
}

} // namespace LuaConsole
