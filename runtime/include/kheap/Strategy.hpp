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
#include <kheap/Block.hpp>

namespace kheap {

  class FreeList;

  // How a FreeList chooses which free block serves a request.
  enum class FitStrategy {
    FirstFit = 0,  // lowest addressed block that is big enough
    BestFit = 1,   // smallest block that is big enough
    WorstFit = 2,  // largest block
    NextFit = 3,   // first fit, resuming where the last allocation left off
  };

  // "first", "best-fit", "worst_fit", "nextfit", ... Returns false if `name`
  // does not name a strategy.
  bool parse_strategy(const char *name, FitStrategy &out);
  const char *strategy_name(FitStrategy strategy);


  // The active strategy and the state it carries. Only next fit has any: the
  // cursor, which names the free block its next scan starts from (nil means
  // "start at the head").
  class Policy {
   public:
    explicit Policy(FitStrategy kind = FitStrategy::BestFit, Offset cursor = nil)
        : m_kind(kind)
        , m_cursor(cursor) {}

    FitStrategy kind(void) const { return m_kind; }
    Offset cursor(void) const { return m_cursor; }

    // A free block was handed out (fully or in part). `successor` is the free
    // block that now occupies its place in the list: the split remainder, or
    // the consumed block's old `next`.
    void on_allocated(Offset consumed, Offset successor) {
      if (m_kind == FitStrategy::NextFit || m_cursor == consumed) m_cursor = successor;
    }

    // `gone` was merged into a neighbour and is no longer a list entry.
    void on_absorbed(Offset gone, Offset head) {
      if (m_cursor == gone) m_cursor = head;
    }

   private:
    FitStrategy m_kind;
    Offset m_cursor;
  };


  // The outcome of a search: the chosen block and its list predecessor (nil
  // if the block is the head), so the caller can unlink without a second walk.
  struct Selection {
    Offset block = nil;
    Offset prev = nil;

    bool found(void) const { return block != nil; }
  };

  // Each search is a pure function of the list and the request; none of them
  // modify the list.
  Selection find_first_fit(const FreeList &list, size_t size);
  Selection find_best_fit(const FreeList &list, size_t size);
  Selection find_worst_fit(const FreeList &list, size_t size);
  Selection find_next_fit(const FreeList &list, Offset cursor, size_t size);

  // Dispatch on the policy.
  Selection select_block(const FreeList &list, const Policy &policy, size_t size);

}  // namespace kheap
