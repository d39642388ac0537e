//
//  GapBuffer.cpp
//  LuaConsole Framework - Gap Buffer Document Storage
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "GapBuffer.h"
#include <stdlib.h>
#include <string.h>

// Default initial capacity
#define DEFAULT_CAPACITY (16 * 1024)  // 16 KB
#define MIN_GAP_SIZE (4 * 1024)       // Keep at least 4 KB free after growing

// ============================================================================
// INTERNAL HELPERS
// ============================================================================

static int actual_pos(const GapBuffer* gb, int pos) {
    // Convert logical position to physical position (accounting for gap)
    if (pos < gb->gap_start) {
        return pos;
    } else {
        return pos + (gb->gap_end - gb->gap_start);
    }
}

// ============================================================================
// LIFECYCLE
// ============================================================================

GapBuffer* gap_buffer_create(int initial_capacity) {
    if (initial_capacity < MIN_GAP_SIZE) {
        initial_capacity = DEFAULT_CAPACITY;
    }

    GapBuffer* gb = (GapBuffer*)calloc(1, sizeof(GapBuffer));
    if (!gb) return NULL;

    gb->buffer = (char*)malloc(initial_capacity);
    if (!gb->buffer) {
        free(gb);
        return NULL;
    }

    gb->capacity = initial_capacity;
    gb->gap_start = 0;
    gb->gap_end = initial_capacity;

    return gb;
}

void gap_buffer_free(GapBuffer* gb) {
    if (!gb) return;
    free(gb->buffer);
    free(gb);
}

// ============================================================================
// QUERY
// ============================================================================

int gap_buffer_size(const GapBuffer* gb) {
    if (!gb) return 0;
    return gb->capacity - (gb->gap_end - gb->gap_start);
}

int gap_buffer_gap_size(const GapBuffer* gb) {
    if (!gb) return 0;
    return gb->gap_end - gb->gap_start;
}

int gap_buffer_copy_range(const GapBuffer* gb, int start, int end, char* out) {
    if (!gb || !out) return 0;

    int size = gap_buffer_size(gb);
    if (start < 0) start = 0;
    if (end > size) end = size;
    if (start >= end) return 0;

    int copied = 0;

    // Part before the gap
    if (start < gb->gap_start) {
        int stop = end < gb->gap_start ? end : gb->gap_start;
        memcpy(out, gb->buffer + start, stop - start);
        copied = stop - start;
        start = stop;
    }

    // Part after the gap
    if (start < end) {
        memcpy(out + copied, gb->buffer + actual_pos(gb, start), end - start);
        copied += end - start;
    }

    return copied;
}

// ============================================================================
// EDITING
// ============================================================================

void gap_buffer_move_gap(GapBuffer* gb, int pos) {
    if (!gb) return;

    int size = gap_buffer_size(gb);
    if (pos < 0) pos = 0;
    if (pos > size) pos = size;
    if (pos == gb->gap_start) return;

    int gap_size = gb->gap_end - gb->gap_start;

    if (pos < gb->gap_start) {
        // Move text [pos, gap_start) to the end of the gap
        int count = gb->gap_start - pos;
        memmove(gb->buffer + gb->gap_end - count, gb->buffer + pos, count);
    } else {
        // Move text after the gap down to gap_start
        int count = pos - gb->gap_start;
        memmove(gb->buffer + gb->gap_start, gb->buffer + gb->gap_end, count);
    }

    gb->gap_start = pos;
    gb->gap_end = pos + gap_size;
}

bool gap_buffer_grow(GapBuffer* gb, int min_new_capacity) {
    if (!gb) return false;
    if (min_new_capacity <= gb->capacity) return true;

    int new_capacity = gb->capacity * 2;
    if (new_capacity < min_new_capacity) new_capacity = min_new_capacity;

    char* new_buffer = (char*)malloc(new_capacity);
    if (!new_buffer) return false;

    // Copy text before gap, then text after gap to the end of the new block
    int tail = gb->capacity - gb->gap_end;
    memcpy(new_buffer, gb->buffer, gb->gap_start);
    memcpy(new_buffer + new_capacity - tail, gb->buffer + gb->gap_end, tail);

    free(gb->buffer);
    gb->buffer = new_buffer;
    gb->gap_end = new_capacity - tail;
    gb->capacity = new_capacity;
    return true;
}

bool gap_buffer_insert_at(GapBuffer* gb, int pos, const char* str, int length) {
    if (!gb || !str || length < 0) return false;
    if (pos < 0 || pos > gap_buffer_size(gb)) return false;
    if (length == 0) return true;

    if (gap_buffer_gap_size(gb) < length) {
        if (!gap_buffer_grow(gb, gap_buffer_size(gb) + length + MIN_GAP_SIZE)) {
            return false;
        }
    }

    gap_buffer_move_gap(gb, pos);
    memcpy(gb->buffer + gb->gap_start, str, length);
    gb->gap_start += length;
    return true;
}

bool gap_buffer_delete_range(GapBuffer* gb, int start, int end) {
    if (!gb) return false;
    if (start < 0 || end > gap_buffer_size(gb) || start > end) return false;
    if (start == end) return true;

    gap_buffer_move_gap(gb, start);
    gb->gap_end += end - start;
    return true;
}
