//
//  GapBuffer.h
//  LuaConsole Framework - Gap Buffer Document Storage
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  Transcript text storage. Appends and edits cluster at the tail of the
//  document (the input region), which keeps the gap close to the edit point.
//

#ifndef GAPBUFFER_H
#define GAPBUFFER_H

#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// Gap buffer structure - single contiguous memory block with a gap
typedef struct GapBuffer {
    char* buffer;           // Flat contiguous buffer
    int capacity;           // Total allocated size
    int gap_start;          // Start of gap (edit position)
    int gap_end;            // End of gap
} GapBuffer;

// ============================================================================
// LIFECYCLE
// ============================================================================

// Create new gap buffer with initial capacity
GapBuffer* gap_buffer_create(int initial_capacity);

// Free gap buffer
void gap_buffer_free(GapBuffer* gb);

// ============================================================================
// QUERY
// ============================================================================

// Get actual content size (excluding gap)
int gap_buffer_size(const GapBuffer* gb);

// Get gap size (unused space)
int gap_buffer_gap_size(const GapBuffer* gb);

// Copy content range [start, end) into out (not null-terminated)
// Returns number of characters copied
int gap_buffer_copy_range(const GapBuffer* gb, int start, int end, char* out);

// ============================================================================
// EDITING
// ============================================================================

// Move gap to position (call before insert/delete operations)
void gap_buffer_move_gap(GapBuffer* gb, int pos);

// Insert string at position
bool gap_buffer_insert_at(GapBuffer* gb, int pos, const char* str, int length);

// Delete range [start, end)
bool gap_buffer_delete_range(GapBuffer* gb, int start, int end);

// Grow buffer capacity
bool gap_buffer_grow(GapBuffer* gb, int min_new_capacity);

#ifdef __cplusplus
}
#endif

#endif /* GAPBUFFER_H */
