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
#include <kheap/Block.hpp>

namespace kheap {

  // Byte alignment of every block start, and therefore of every payload.
  static constexpr size_t alignment = KHEAP_ALIGNMENT;
  static_assert((alignment & (alignment - 1)) == 0, "alignment must be a power of two");
  static_assert(alignment >= sizeof(void *), "alignment must hold a machine word");

  // The fixed cost of one block: a header plus a footer.
  inline constexpr size_t block_overhead(void) { return header_width + footer_width; }

  // Round `x` up to the next multiple of `alignment`. Returns false (and leaves
  // `out` alone) if the result does not fit in a size_t.
  bool align_up(size_t x, size_t &out);

  // The same, for addresses. Used once at init to align the heap base.
  bool align_up_address(uintptr_t x, uintptr_t &out);

  // Total span of the block needed to serve a request for `requested` bytes:
  // align_up(align_up(max(requested, 1)) + block_overhead()). False on overflow.
  bool block_size_for(size_t requested, size_t &out);

  // Can a caller asking for `align` be served? Every payload is `alignment`
  // aligned, so any power of two up to it is fine. Zero is treated as 1.
  bool alignment_supported(size_t align);

}  // namespace kheap
