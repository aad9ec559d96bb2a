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


namespace kheap {
  // building c++ iterators is frustrating, so this abstracts it.
  // Subclasses provide step() and get(); a null get() is the end.
  template <typename T>
  class iterator {
   public:
    using reference = T &;
    using pointer = T *;

    virtual ~iterator() = default;

    friend bool operator==(const iterator &a, const iterator &b) { return a.get() == b.get(); }
    friend bool operator!=(const iterator &a, const iterator &b) { return a.get() != b.get(); }

    auto operator*() const -> reference { return *get(); }
    auto operator->() const -> pointer { return get(); }

    auto operator++() -> iterator<T> & {
      step();
      return *this;
    }

    virtual void step() = 0;
    virtual T *get() const = 0;
  };


  // A begin/end pair for range-based for loops.
  template <typename It>
  class range {
   public:
    range(It begin, It end)
        : m_begin(begin)
        , m_end(end) {}

    It begin(void) const { return m_begin; }
    It end(void) const { return m_end; }

   private:
    It m_begin;
    It m_end;
  };
}  // namespace kheap
