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
#include <stdio.h>
#include <kheap/Alignment.hpp>
#include <kheap/Block.hpp>
#include <kheap/Logger.hpp>
#include <kheap/Strategy.hpp>
#include <kheap/lib.hpp>
#include <kheap/utils.h>

namespace kheap {

  struct HeapStats {
    size_t free_bytes = 0;
    size_t free_blocks = 0;
    size_t largest_free = 0;
    size_t used_bytes = 0;
    size_t used_blocks = 0;
  };


  /**
   * FreeList - the kernel heap.
   *
   * Manages one fixed, contiguous region handed to it at boot. The region is
   * tiled by blocks (see Block.hpp), and the free ones are threaded into a
   * singly linked list, in ascending address order, through their own
   * headers. There is no other metadata: the heap lives entirely inside the
   * memory it manages, and a FreeList object is just the handful of words
   * needed to find it again.
   *
   * Links are byte offsets from the aligned base. All header and footer access
   * goes through header()/footer_*(), which bounds check under
   * KHEAP_SANITY_CHECK.
   *
   * This class is not thread safe, and not reentrant. Callers serialize
   * access (see Locked<T> and Runtime).
   */
  class FreeList {
   public:
    // Take over [start, start + capacity). The base is rounded up to
    // `alignment` and the rounding loss (and any ragged tail) is given up. The
    // whole remainder becomes a single free block. A region too small to hold
    // even one block is a fatal configuration error.
    static FreeList init(uintptr_t start, size_t capacity, FitStrategy strategy);

    FreeList(FreeList &&) = default;
    FreeList &operator=(FreeList &&) = default;
    // Two directories over the same memory would corrupt each other.
    FreeList(const FreeList &) = delete;
    FreeList &operator=(const FreeList &) = delete;

    // Allocate at least `size` bytes whose address is a multiple of `align`.
    // Returns nullptr if `align` is unsupported, if sizing the block
    // overflows, or if no free block is big enough.
    void *allocate(size_t size, size_t align = kheap::alignment);

    // Return a block. `ptr` must have come from allocate() on this heap and not
    // been freed since. The block is merged with any free neighbours.
    void deallocate(void *ptr);

    // Does `ptr` point into the managed region?
    bool owns(const void *ptr) const;

    // Usable bytes in a block handed out by allocate().
    size_t usable_size(const void *ptr) const;


    uintptr_t start_address(void) const { return (uintptr_t)m_base; }
    size_t capacity(void) const { return m_capacity; }
    FitStrategy strategy(void) const { return m_policy.kind(); }
    Offset head(void) const { return m_head; }
    Offset cursor(void) const { return m_policy.cursor(); }

    // Read-only views of a block's boundary tags, for the search strategies and
    // for tests.
    size_t block_size(Offset blk) const { return header(blk).size; }
    Offset next_free(Offset blk) const { return header(blk).next; }
    size_t footer_size(Offset blk) const { return footer_of(blk); }

    // Translate between payload addresses and block offsets.
    void *payload(Offset blk) const { return m_base + blk + header_width; }
    Offset block_of(const void *ptr) const;


    // Walks the free list in list order, yielding each free block's header.
    class FreeBlockIterator : public kheap::iterator<const BlockHeader> {
     public:
      FreeBlockIterator(const FreeList *list, Offset cur)
          : m_list(list)
          , m_cur(cur) {}

      void step(void) override { m_cur = m_list->next_free(m_cur); }
      const BlockHeader *get(void) const override {
        if (m_cur == nil) return nullptr;
        return &m_list->header(m_cur);
      }
      Offset offset(void) const { return m_cur; }

     private:
      const FreeList *m_list;
      Offset m_cur;
    };

    kheap::range<FreeBlockIterator> free_blocks(void) const {
      return {FreeBlockIterator(this, m_head), FreeBlockIterator(this, nil)};
    }


    // Visit every block in address order, independently of the free list's
    // links: cb(offset, size, is_free). Stops early (returning false) if a
    // header is obviously corrupt.
    template <typename Fn>
    bool walk(Fn &&cb) const {
      Offset next_free_blk = m_head;
      Offset off = 0;
      while (off < m_capacity) {
        size_t size = header(off).size;
        if (unlikely(size < block_overhead() || size > m_capacity - off)) {
          log_error("block at +%zu has a corrupt size (%zu)", off, size);
          return false;
        }

        bool is_free = off == next_free_blk;
        if (is_free) next_free_blk = header(off).next;

        cb(off, size, is_free);
        off += size;
      }
      return true;
    }

    HeapStats stats(void) const;

    // Check every structural invariant of the heap: ascending free list, no
    // adjacent free blocks, matching boundary tags, aligned block starts, and
    // blocks that tile the region exactly. Logs the first violation and
    // returns false.
    bool validate(void) const;

    void dump(FILE *stream) const;

   private:
    FreeList(uint8_t *base, size_t capacity, FitStrategy strategy);

    BlockHeader &header(Offset blk) const;
    // The footer of `blk`, located through its header's size.
    BlockFooter &footer_of(Offset blk) const;
    // The footer word sitting directly below `blk`: its physical predecessor's.
    BlockFooter &footer_below(Offset blk) const;

    // Stamp `size` into both of a block's tags.
    void write_tags(Offset blk, size_t size);
    // Point `prev` (or the head, if prev is nil) at `target`.
    void link(Offset prev, Offset target);

    uint8_t *m_base;
    size_t m_capacity;
    Offset m_head;
    Policy m_policy;
  };

}  // namespace kheap
