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

namespace kheap {

  // Blocks are named by their byte offset from the (aligned) heap base. An
  // offset is only meaningful to the FreeList that handed it out.
  using Offset = size_t;
  // Terminates the free list, and marks "no block" in a Selection.
  static constexpr Offset nil = SIZE_MAX;


  /**
   * Every block in the heap, free or allocated, is framed by a pair of
   * boundary tags:
   *
   *   start                                       start + size
   *   | BlockHeader | payload ............ | BlockFooter |
   *
   * Both tags hold the total span of the block (tags included). `next` is only
   * meaningful while the block sits on the free list. Once a block is handed
   * out, the caller's payload begins immediately after the header, so the
   * `next` word goes stale but is never overwritten by the caller.
   *
   * The footer is what lets deallocate() find the physically preceding block
   * in O(1): the word right below a block's header is its neighbour's size.
   */
  struct BlockHeader {
    size_t size;
    Offset next;
  };

  using BlockFooter = size_t;

  static constexpr size_t header_width = sizeof(BlockHeader);
  static constexpr size_t footer_width = sizeof(BlockFooter);

  // The payload must inherit the block's alignment.
  static_assert(header_width % KHEAP_ALIGNMENT == 0, "BlockHeader breaks payload alignment");
  // Block ends are aligned, so the footer word below them must be too.
  static_assert(KHEAP_ALIGNMENT % footer_width == 0, "BlockFooter would be misaligned");

}  // namespace kheap
