/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <kheap/Runtime.hpp>
#include <kheap/utils.h>

namespace kheap {
  // The current global instance of the runtime, since we can only have one at a time
  static Runtime *g_runtime = nullptr;


  // Runs before the heap member is built, so a second runtime (or a strategy
  // number that names nothing) is caught before seed tags are written.
  static const Configuration &claim_runtime(const Configuration &config) {
    KHEAP_ASSERT(atomic_get(g_runtime) == nullptr, "Cannot create more than one runtime");
    int strat = static_cast<int>(config.strategy);
    KHEAP_ASSERT(strat >= static_cast<int>(FitStrategy::FirstFit) &&
                     strat <= static_cast<int>(FitStrategy::NextFit),
        "%d is not a heap strategy", strat);
    return config;
  }


  Runtime::Runtime(kheap::Configuration config)
      : config(claim_runtime(config))
      , heap(FreeList::init(config.heap_start, config.heap_size, config.strategy)) {
    atomic_set(g_runtime, this);
    log_debug("Created a new kheap Runtime @ %p", this);
  }

  Runtime::~Runtime() {
    log_debug("Destroying kheap Runtime");
    // Unset the global instance so another runtime can be created
    atomic_set(g_runtime, (Runtime *)nullptr);
  }


  Runtime &Runtime::get() {
    Runtime *rt = atomic_get(g_runtime);
    KHEAP_ASSERT(rt != nullptr, "Runtime not initialized");
    return *rt;
  }

  Runtime *Runtime::get_ptr() { return atomic_get(g_runtime); }



  void *Runtime::allocate(size_t size, size_t align) {
    return heap.with([&](FreeList &fl) { return fl.allocate(size, align); });
  }

  void Runtime::deallocate(void *ptr) {
    heap.with([&](FreeList &fl) { fl.deallocate(ptr); });
  }

  bool Runtime::owns(const void *ptr) {
    return heap.with([&](FreeList &fl) { return fl.owns(ptr); });
  }

  HeapStats Runtime::stats(void) {
    return heap.with([&](FreeList &fl) { return fl.stats(); });
  }


  void Runtime::dump(FILE *stream) {
    fprintf(stream, "kheap Runtime Information:\n");
    heap.with([&](FreeList &fl) { fl.dump(stream); });
  }

}  // namespace kheap
