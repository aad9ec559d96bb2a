/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <kheap/FreeList.hpp>
#include <kheap/Logger.hpp>
#include <kheap/utils.h>

namespace kheap {

  FreeList::FreeList(uint8_t *base, size_t capacity, FitStrategy strategy)
      : m_base(base)
      , m_capacity(capacity)
      , m_head(nil)
      , m_policy(strategy) {}


  FreeList FreeList::init(uintptr_t start, size_t capacity, FitStrategy strategy) {
    uintptr_t aligned_start;
    KHEAP_ASSERT(align_up_address(start, aligned_start), "heap start %p cannot be aligned",
        (void *)start);

    size_t lost = aligned_start - start;
    KHEAP_ASSERT(lost <= capacity, "heap of %zu bytes at %p vanishes when aligned", capacity,
        (void *)start);

    // Drop the ragged tail too, so every block end (and footer) is aligned.
    size_t usable = (capacity - lost) & ~(alignment - 1);
    KHEAP_ASSERT(usable >= block_overhead(),
        "heap of %zu bytes at %p cannot hold a single block (%zu usable, need %zu)", capacity,
        (void *)start, usable, block_overhead());

    FreeList list((uint8_t *)aligned_start, usable, strategy);

    // The seed: one free block spanning everything.
    list.write_tags(0, usable);
    list.header(0).next = nil;
    list.m_head = 0;
    list.m_policy = Policy(strategy, 0);

    log_info("heap: %zu bytes at %p (%zu lost to alignment), %s", usable, (void *)aligned_start,
        capacity - usable, strategy_name(strategy));
    return list;
  }



  BlockHeader &FreeList::header(Offset blk) const {
    KHEAP_SANITY(blk % alignment == 0, "block offset %zu is misaligned", blk);
    KHEAP_SANITY(blk <= m_capacity - block_overhead(), "block offset %zu is outside the heap (%zu)",
        blk, m_capacity);
    return *(BlockHeader *)(m_base + blk);
  }


  BlockFooter &FreeList::footer_of(Offset blk) const {
    size_t size = header(blk).size;
    KHEAP_SANITY(size >= block_overhead() && size <= m_capacity - blk,
        "block at +%zu has a corrupt size (%zu)", blk, size);
    return *(BlockFooter *)(m_base + blk + size - footer_width);
  }


  BlockFooter &FreeList::footer_below(Offset blk) const {
    KHEAP_SANITY(blk >= block_overhead() && blk <= m_capacity, "no block below +%zu", blk);
    return *(BlockFooter *)(m_base + blk - footer_width);
  }


  void FreeList::write_tags(Offset blk, size_t size) {
    header(blk).size = size;
    footer_of(blk) = size;
  }


  void FreeList::link(Offset prev, Offset target) {
    if (prev == nil) {
      m_head = target;
    } else {
      header(prev).next = target;
    }
  }



  void *FreeList::allocate(size_t size, size_t align) {
    // No logging on this path. A failure is reported by the null return alone.
    if (unlikely(!alignment_supported(align))) return nullptr;

    size_t total;
    if (unlikely(!block_size_for(size, total))) return nullptr;

    Selection sel = select_block(*this, m_policy, total);
    if (!sel.found()) return nullptr;

    Offset blk = sel.block;
    BlockHeader &node = header(blk);
    Offset successor;

    if (node.size - total >= block_overhead()) {
      // Enough left over for a block of its own. Carve the low `total` bytes
      // off, and leave the rest in the list where the candidate was.
      Offset rest = blk + total;
      write_tags(rest, node.size - total);
      header(rest).next = node.next;
      link(sel.prev, rest);

      node.size = total;
      successor = rest;
    } else {
      // The remainder could not hold its own tags: hand out the whole block.
      link(sel.prev, node.next);
      successor = node.next;
    }

    // The header already holds the final size, so this rewrites the footer.
    footer_of(blk) = node.size;
    m_policy.on_allocated(blk, successor);
    return payload(blk);
  }



  void FreeList::deallocate(void *ptr) {
    Offset blk = block_of(ptr);
    BlockHeader &node = header(blk);

    KHEAP_SANITY(node.size == footer_of(blk),
        "free of %p: header says %zu bytes but footer says %zu (bad pointer or heap corruption)",
        ptr, node.size, footer_of(blk));

    // Find the address ordered insertion point.
    Offset prev = nil;
    Offset cur = m_head;
    while (cur != nil && cur < blk) {
      KHEAP_SANITY(cur + header(cur).size <= blk, "free of %p: it lies inside free block +%zu",
          ptr, cur);
      prev = cur;
      cur = header(cur).next;
    }
    KHEAP_SANITY(cur != blk, "free of %p: double free", ptr);

    node.next = cur;
    link(prev, blk);

    // Forward: absorb the successor if it starts where we end.
    if (cur != nil && blk + node.size == cur) {
      BlockHeader &succ = header(cur);
      node.size += succ.size;
      node.next = succ.next;
      footer_of(blk) = node.size;
      m_policy.on_absorbed(cur, m_head);
    }

    // Backward: the word below our header is the physical predecessor's size.
    // That block is free exactly when it is our list predecessor, since prev is
    // the highest free block below us.
    if (blk > 0 && prev != nil) {
      size_t below_size = footer_below(blk);
      if (below_size <= blk && blk - below_size == prev) {
        BlockHeader &pnode = header(prev);
        KHEAP_SANITY(prev + pnode.size == blk, "free block +%zu has a stale footer", prev);
        pnode.size += node.size;
        pnode.next = node.next;
        footer_of(prev) = pnode.size;
        m_policy.on_absorbed(blk, m_head);
      }
    }
  }



  bool FreeList::owns(const void *ptr) const {
    uintptr_t p = (uintptr_t)ptr;
    uintptr_t start = (uintptr_t)m_base;
    return p >= start && p < start + m_capacity;
  }


  Offset FreeList::block_of(const void *ptr) const {
    KHEAP_SANITY(owns(ptr), "%p is not in this heap", ptr);
    uintptr_t p = (uintptr_t)ptr;
    KHEAP_SANITY(p - (uintptr_t)m_base >= header_width, "%p is not a payload address", ptr);
    return p - (uintptr_t)m_base - header_width;
  }


  size_t FreeList::usable_size(const void *ptr) const {
    return block_size(block_of(ptr)) - block_overhead();
  }



  HeapStats FreeList::stats(void) const {
    HeapStats st;
    walk([&](Offset off, size_t size, bool is_free) {
      if (is_free) {
        st.free_bytes += size;
        st.free_blocks++;
        if (size > st.largest_free) st.largest_free = size;
      } else {
        st.used_bytes += size;
        st.used_blocks++;
      }
    });
    return st;
  }



  bool FreeList::validate(void) const {
    // The list itself: strictly ascending, every entry inside the heap.
    size_t listed = 0;
    bool cursor_listed = m_policy.cursor() == nil;
    Offset last = nil;
    for (Offset cur = m_head; cur != nil; cur = next_free(cur)) {
      if (cur % alignment != 0 || cur > m_capacity - block_overhead()) {
        log_error("free list entry +%zu is not a block start", cur);
        return false;
      }
      if (last != nil && cur <= last) {
        log_error("free list is out of order: +%zu follows +%zu", cur, last);
        return false;
      }
      if (cur == m_policy.cursor()) cursor_listed = true;
      last = cur;
      listed++;
    }

    if (!cursor_listed) {
      log_error("cursor +%zu is not on the free list", m_policy.cursor());
      return false;
    }

    // The blocks themselves, found by size alone.
    bool ok = true;
    size_t found_free = 0;
    size_t total = 0;
    bool last_free = false;
    bool walked = walk([&](Offset off, size_t size, bool is_free) {
      if (!ok) return;
      if (off % alignment != 0 || size % alignment != 0) {
        log_error("block +%zu (%zu bytes) is misaligned", off, size);
        ok = false;
      } else if (footer_of(off) != size) {
        log_error("block +%zu: header says %zu, footer says %zu", off, size, footer_of(off));
        ok = false;
      } else if (is_free && last_free) {
        log_error("free block +%zu follows another free block", off);
        ok = false;
      }
      if (is_free) found_free++;
      last_free = is_free;
      total += size;
    });

    if (!walked || !ok) return false;

    if (total != m_capacity) {
      log_error("blocks span %zu bytes, heap is %zu", total, m_capacity);
      return false;
    }

    if (found_free != listed) {
      log_error("%zu blocks on the free list, but %zu found in the heap", listed, found_free);
      return false;
    }

    return true;
  }



  void FreeList::dump(FILE *stream) const {
    fprintf(stream, "kheap @ %p, %zu bytes, %s, head=", m_base, m_capacity,
        strategy_name(m_policy.kind()));
    if (m_head == nil) {
      fprintf(stream, "none");
    } else {
      fprintf(stream, "+%zu", m_head);
    }
    if (m_policy.cursor() != nil) fprintf(stream, ", cursor=+%zu", m_policy.cursor());
    fprintf(stream, "\n");

    walk([&](Offset off, size_t size, bool is_free) {
      fprintf(stream, "  +%-10zu %10zu %s\n", off, size, is_free ? "free" : "used");
    });

    HeapStats st = stats();
    fprintf(stream, "  free: %zu bytes in %zu blocks (largest %zu), used: %zu bytes in %zu blocks\n",
        st.free_bytes, st.free_blocks, st.largest_free, st.used_bytes, st.used_blocks);
  }

}  // namespace kheap
