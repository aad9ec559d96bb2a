/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <kheap/Strategy.hpp>
#include <kheap/FreeList.hpp>
#include <string.h>

namespace kheap {

  bool parse_strategy(const char *name, FitStrategy &out) {
    if (name == nullptr) return false;

    // Accept common spellings.
    auto is = [name](const char *base) {
      size_t n = strlen(base);
      if (strncmp(name, base, n) != 0) return false;
      const char *rest = name + n;
      return strcmp(rest, "") == 0 || strcmp(rest, "_fit") == 0 || strcmp(rest, "-fit") == 0 ||
             strcmp(rest, "fit") == 0;
    };

    if (is("first")) {
      out = FitStrategy::FirstFit;
    } else if (is("best")) {
      out = FitStrategy::BestFit;
    } else if (is("worst")) {
      out = FitStrategy::WorstFit;
    } else if (is("next")) {
      out = FitStrategy::NextFit;
    } else {
      return false;
    }
    return true;
  }


  const char *strategy_name(FitStrategy strategy) {
    switch (strategy) {
      case FitStrategy::FirstFit:
        return "first-fit";
      case FitStrategy::BestFit:
        return "best-fit";
      case FitStrategy::WorstFit:
        return "worst-fit";
      case FitStrategy::NextFit:
        return "next-fit";
    }
    return "unknown";
  }



  Selection find_first_fit(const FreeList &list, size_t size) {
    Offset prev = nil;
    for (Offset cur = list.head(); cur != nil; cur = list.next_free(cur)) {
      if (list.block_size(cur) >= size) return {cur, prev};
      prev = cur;
    }
    return {};
  }


  Selection find_best_fit(const FreeList &list, size_t size) {
    Selection best;
    size_t best_size = 0;

    Offset prev = nil;
    for (Offset cur = list.head(); cur != nil; cur = list.next_free(cur)) {
      size_t sz = list.block_size(cur);
      // Strictly smaller, so ties go to the lowest address.
      if (sz >= size && (!best.found() || sz < best_size)) {
        best = {cur, prev};
        best_size = sz;
        // Can't do better than an exact fit.
        if (sz == size) break;
      }
      prev = cur;
    }
    return best;
  }


  Selection find_worst_fit(const FreeList &list, size_t size) {
    Selection worst;
    size_t worst_size = 0;

    Offset prev = nil;
    for (Offset cur = list.head(); cur != nil; cur = list.next_free(cur)) {
      size_t sz = list.block_size(cur);
      if (sz >= size && (!worst.found() || sz > worst_size)) {
        worst = {cur, prev};
        worst_size = sz;
      }
      prev = cur;
    }
    return worst;
  }


  // One pass from the head. The first fit at or after the cursor wins; failing
  // that, the first fit before it (the wrap-around half of the scan). If the
  // cursor is not on the list at all, this degrades to first fit.
  Selection find_next_fit(const FreeList &list, Offset cursor, size_t size) {
    if (cursor == nil) return find_first_fit(list, size);

    Selection wrapped;
    bool past_cursor = false;

    Offset prev = nil;
    for (Offset cur = list.head(); cur != nil; cur = list.next_free(cur)) {
      if (cur == cursor) past_cursor = true;

      if (list.block_size(cur) >= size) {
        if (past_cursor) return {cur, prev};
        if (!wrapped.found()) wrapped = {cur, prev};
      }
      prev = cur;
    }

    return wrapped;
  }


  Selection select_block(const FreeList &list, const Policy &policy, size_t size) {
    switch (policy.kind()) {
      case FitStrategy::FirstFit:
        return find_first_fit(list, size);
      case FitStrategy::BestFit:
        return find_best_fit(list, size);
      case FitStrategy::WorstFit:
        return find_worst_fit(list, size);
      case FitStrategy::NextFit:
        return find_next_fit(list, policy.cursor(), size);
    }
    return {};
  }

}  // namespace kheap
