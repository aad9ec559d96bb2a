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

#include <stddef.h>
#include <stdint.h>
#include <kheap/config.h>
#include <kheap/Strategy.hpp>

static_assert(KHEAP_DEFAULT_STRATEGY >= 0 && KHEAP_DEFAULT_STRATEGY <= 3,
    "KHEAP_DEFAULT_STRATEGY must be 0 (first), 1 (best), 2 (worst) or 3 (next fit)");

namespace kheap {
  // This structure is threaded through the creation of the runtime to
  // describe the heap it should manage. The defaults are the board's memory
  // map from config.h.
  struct Configuration {
    uintptr_t heap_start = KHEAP_HEAP_START;
    size_t heap_size = KHEAP_HEAP_SIZE;

    FitStrategy strategy = static_cast<FitStrategy>(KHEAP_DEFAULT_STRATEGY);

    // The defaults, with KHEAP_STRATEGY from the environment applied if it
    // names a strategy.
    static Configuration from_env(void);
  };
}  // namespace kheap
