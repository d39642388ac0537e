//
//  Partition.h
//  LuaConsole Framework - Offset-Indexed Chunk Sequence
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  A sequence of chunk sizes stored as cumulative offsets, so that the
//  chunk containing an absolute position can be found by binary search.
//

#ifndef PARTITION_H
#define PARTITION_H

#include <vector>

namespace LuaConsole {

class Partition {
public:
    Partition();

    // Number of chunks
    int length() const { return static_cast<int>(m_locs.size()) - 1; }
    bool empty() const { return length() == 0; }

    // Sum of all chunk sizes
    int total() const { return m_locs.back(); }

    /**
     * Chunk access. Negative indices count from the end.
     * Out-of-range indices throw std::out_of_range.
     */
    int get(int index) const;
    void set(int index, int size);
    void remove(int index);
    void insert(int index, int size);
    void append(int size);

    /**
     * Leftmost index i with locs[i] >= pos. This is the first chunk whose
     * start is at or past pos, so a position strictly inside chunk k yields
     * k + 1; callers wanting "chunk containing pos" use find_loc(pos + 1) - 1.
     */
    int find_loc(int pos) const;

    // Starting offset and inclusive ending offset of a chunk
    int first(int index) const;
    int last(int index) const;

    // Cumulative offsets, length() + 1 entries starting at 0
    const std::vector<int>& locs() const { return m_locs; }

private:
    int check_index(int index) const;
    void update_locs(int start_index, int delta);

    std::vector<int> m_locs;
};

} // namespace LuaConsole

#endif // PARTITION_H
