/* arena.h - Chunked bump allocator over a Pool
 *
 * Layout passes allocate nodes, frames and diagnostics from arenas and drop
 * them all at once. Chunks start at ARENA_INITIAL_CHUNK_SIZE and double up to
 * the maximum; a request larger than the next chunk gets a chunk of its own.
 * Nothing is freed individually and pointers stay valid until arena_destroy().
 */
#ifndef QUIRE_ARENA_H
#define QUIRE_ARENA_H

#include <stdlib.h>
#include <stdbool.h>
#include "mempool.h"

#ifdef __cplusplus
extern "C" {
#endif

#define ARENA_INITIAL_CHUNK_SIZE  (4 * 1024)
#define ARENA_MAX_CHUNK_SIZE      (64 * 1024)
#define ARENA_DEFAULT_ALIGNMENT   16

typedef struct Arena Arena;

/* Returns NULL without a pool or when the first chunk cannot be allocated */
Arena* arena_create(Pool* pool, size_t initial_chunk_size, size_t max_chunk_size);
Arena* arena_create_default(Pool* pool);
void arena_destroy(Arena* arena);

/* Every allocation is aligned to ARENA_DEFAULT_ALIGNMENT */
void* arena_alloc(Arena* arena, size_t size);
void* arena_calloc(Arena* arena, size_t size);
char* arena_strdup(Arena* arena, const char* str);
char* arena_sprintf(Arena* arena, const char* fmt, ...);

/* Statistics */
size_t arena_total_used(Arena* arena);
size_t arena_chunk_count(Arena* arena);
bool arena_owns(Arena* arena, const void* ptr);

#ifdef __cplusplus
}
#endif

#endif /* QUIRE_ARENA_H */
