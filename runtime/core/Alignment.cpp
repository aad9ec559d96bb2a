/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <kheap/Alignment.hpp>
#include <kheap/utils.h>

namespace kheap {

  bool align_up(size_t x, size_t &out) {
    size_t bumped;
    if (unlikely(__builtin_add_overflow(x, alignment - 1, &bumped))) return false;
    out = bumped & ~(alignment - 1);
    return true;
  }


  bool align_up_address(uintptr_t x, uintptr_t &out) {
    uintptr_t bumped;
    if (unlikely(__builtin_add_overflow(x, (uintptr_t)(alignment - 1), &bumped))) return false;
    out = bumped & ~(uintptr_t)(alignment - 1);
    return true;
  }


  bool block_size_for(size_t requested, size_t &out) {
    // A zero byte request still costs one minimal block.
    if (requested == 0) requested = 1;

    size_t payload;
    if (!align_up(requested, payload)) return false;

    size_t framed;
    if (unlikely(__builtin_add_overflow(payload, block_overhead(), &framed))) return false;

    return align_up(framed, out);
  }


  bool alignment_supported(size_t align) {
    if (align == 0) return true;
    if ((align & (align - 1)) != 0) return false;
    return align <= alignment;
  }

}  // namespace kheap
