/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */
#include <kheap.h>
#include <kheap/Runtime.hpp>
#include <kheap/utils.h>
#include <new>
#include <stdlib.h>
#include <string.h>


// The runtime lives in static storage: there is no heap to put it in yet.
alignas(kheap::Runtime) static unsigned char runtime_storage[sizeof(kheap::Runtime)];
static kheap::Runtime *the_runtime = nullptr;


extern "C" void kheap_init(uintptr_t start, size_t size, int strategy) {
  KHEAP_ASSERT(strategy >= KHEAP_FIRST_FIT && strategy <= KHEAP_NEXT_FIT,
      "%d is not a heap strategy", strategy);

  kheap::Configuration config;
  config.heap_start = start;
  config.heap_size = size;
  config.strategy = static_cast<kheap::FitStrategy>(strategy);

  // The Runtime constructor refuses to run twice.
  the_runtime = new (runtime_storage) kheap::Runtime(config);
}


extern "C" void kheap_deinit(void) {
  if (the_runtime == nullptr) return;
  the_runtime->~Runtime();
  the_runtime = nullptr;
}


extern "C" int kheap_initialized(void) {
  return kheap::Runtime::get_ptr() != nullptr;
}



extern "C" void *kmalloc_aligned(size_t sz, size_t align) {
  return kheap::Runtime::get().allocate(sz, align);
}

extern "C" void *kmalloc(size_t sz) {
  return kmalloc_aligned(sz, kheap::alignment);
}

extern "C" void *kcalloc(size_t nmemb, size_t size) {
  size_t bytes;
  if (__builtin_mul_overflow(nmemb, size, &bytes)) return NULL;

  void *out = kmalloc(bytes);
  if (out != NULL) memset(out, 0, bytes);
  return out;
}


extern "C" void kfree(void *ptr) {
  // no-op if NULL is passed
  if (ptr == NULL) return;
  kheap::Runtime::get().deallocate(ptr);
}


extern "C" size_t kmalloc_usable_size(void *ptr) {
  if (ptr == NULL) return 0;
  return kheap::Runtime::get().heap.with(
      [&](kheap::FreeList &fl) { return fl.usable_size(ptr); });
}



extern "C" void *kmalloc_or_die(size_t sz, size_t align) {
  void *out = kmalloc_aligned(sz, align);
  if (unlikely(out == NULL)) kheap_alloc_error(sz, align);
  return out;
}


extern "C" void kheap_alloc_error(size_t sz, size_t align) {
  log_fatal("allocation error: size=%zu align=%zu", sz, align);
  fprintf(stderr, "kheap: out of memory (size=%zu, align=%zu)\n", sz, align);

  if (auto *rt = kheap::Runtime::get_ptr()) {
    kheap::HeapStats st = rt->stats();
    fprintf(stderr, "kheap: %zu bytes free in %zu blocks, largest %zu\n", st.free_bytes,
        st.free_blocks, st.largest_free);
  }
  abort();
}


extern "C" void kheap_dump(void) {
  kheap::Runtime::get().dump(stdout);
  fflush(stdout);
}
