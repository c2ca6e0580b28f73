/* mempool.h - Memory pools backed by rpmalloc first-class heaps
 *
 * A pool owns one heap. pool_destroy() releases everything allocated from
 * the pool, including blocks that were never freed. The allocator is
 * initialized on first use and finalized at process exit.
 */
#ifndef QUIRE_MEMPOOL_H
#define QUIRE_MEMPOOL_H

#include <stdlib.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Pool Pool;

Pool* pool_create(void);
void pool_destroy(Pool* pool);

/* Return NULL for a NULL pool or a zero size */
void* pool_alloc(Pool* pool, size_t size);
void* pool_calloc(Pool* pool, size_t size);
void pool_free(Pool* pool, void* ptr);

/* Blocks allocated and not yet freed, for leak checks */
size_t pool_live_count(Pool* pool);

void mempool_cleanup(void);

#ifdef __cplusplus
}
#endif

#endif /* QUIRE_MEMPOOL_H */
