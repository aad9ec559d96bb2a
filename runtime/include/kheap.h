#pragma once

#include <stddef.h>
#include <stdint.h>
#include <kheap/config.h>

#ifdef __cplusplus
extern "C" {
#endif

// Strategy numbers, for C callers (see kheap::FitStrategy)
#define KHEAP_FIRST_FIT 0
#define KHEAP_BEST_FIT 1
#define KHEAP_WORST_FIT 2
#define KHEAP_NEXT_FIT 3


// Bring up the kernel heap over [start, start + size), which the caller
// guarantees is reserved for it. Must be called exactly once, before any other
// function here. An unusable region or a second call is fatal.
extern void kheap_init(uintptr_t start, size_t size, int strategy);

// Tear the heap down again. Only meaningful in hosted builds (tests).
extern void kheap_deinit(void);

// Has kheap_init been called?
extern int kheap_initialized(void);


// Allocate `sz` bytes aligned to KHEAP_ALIGNMENT. Returns NULL on failure.
extern void *kmalloc(size_t sz) __attribute__((alloc_size(1), malloc));

// Allocate with an explicit alignment. Alignments above KHEAP_ALIGNMENT are
// not supported and return NULL.
extern void *kmalloc_aligned(size_t sz, size_t align) __attribute__((alloc_size(1), malloc));

// Allocate a zeroed array of nmemb elements of `size` bytes each.
extern void *kcalloc(size_t nmemb, size_t size);

// Free a block returned by one of the functions above. A no-op if ptr=NULL
extern void kfree(void *ptr);

// Usable size of a block returned by kmalloc.
extern size_t kmalloc_usable_size(void *ptr);

// Like kmalloc_aligned, but never returns NULL: failure goes to
// kheap_alloc_error(). This is what language-level allocation (operator new)
// uses, since there is nothing such a caller could do with NULL.
extern void *kmalloc_or_die(size_t sz, size_t align) __attribute__((returns_nonnull));

// The out of memory handler. There is no swap and no reclaim, so it halts.
extern void kheap_alloc_error(size_t sz, size_t align) __attribute__((noreturn));

// Print the heap to stdout.
extern void kheap_dump(void);

#ifdef __cplusplus
}
#endif
