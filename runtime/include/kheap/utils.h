/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#pragma once

#include <stdio.h>
#include <stdlib.h>

#ifdef KHEAP_SANITY_CHECK
#define KHEAP_SANITY(c, msg, ...)                                                              \
  do {                                                                                         \
    if (!(c)) { /* if the check is not true... */                                              \
      fprintf(stderr, "\x1b[31m-----------[ kheap Sanity Check Failed ]-----------\x1b[0m\n"); \
      fprintf(stderr, "%s line %d\n", __FILE__, __LINE__);                                     \
      fprintf(stderr, "Check, `%s`, failed\n", #c);                                            \
      fprintf(stderr, msg "\n", ##__VA_ARGS__);                                                \
      kheap_dump_backtrace();                                                                  \
      fprintf(stderr, "\x1b[31m                      Bailing!\x1b[0m\n");                      \
      fprintf(stderr, "\x1b[31m---------------------------------------------------\x1b[0m\n"); \
      abort();                                                                                 \
    }                                                                                          \
  } while (0)
#else
#define KHEAP_SANITY(c, msg, ...) /* do nothing if it's disabled */
#endif

#define KHEAP_ASSERT(c, msg, ...)                                                        \
  do {                                                                                   \
    if (!(c)) { /* if the check is not true... */                                        \
      fprintf(stderr, "\x1b[31m-----------[ kheap Assert Failed ]-----------\x1b[0m\n"); \
      fprintf(stderr, "%s line %d\n", __FILE__, __LINE__);                               \
      fprintf(stderr, "Check, `%s`, failed\n", #c);                                      \
      fprintf(stderr, "Reason: \x1b[33m" msg "\x1b[0m\n", ##__VA_ARGS__);                \
      kheap_dump_backtrace();                                                            \
      fprintf(stderr, "\x1b[31mExiting.\x1b[0m\n");                                      \
      abort();                                                                           \
    }                                                                                    \
  } while (0)



#define likely(x) __builtin_expect((x), 1)
#define unlikely(x) __builtin_expect((x), 0)

#define KHEAP_EXPORT __attribute__((visibility("default")))

#define KHEAP_INLINE __attribute__((always_inline))

#define atomic_get(var) __atomic_load_n(&var, __ATOMIC_SEQ_CST)
#define atomic_set(var, value) __atomic_store_n(&var, value, __ATOMIC_SEQ_CST)


#ifdef __cplusplus
extern "C" {
#endif
// Print the current call stack to stderr. Used by the assert macros above.
extern void kheap_dump_backtrace(void);
#ifdef __cplusplus
}
#endif
