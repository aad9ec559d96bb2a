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

#include <pthread.h>
#include <utility>

namespace kheap {

  class mutex {
   private:
    pthread_mutex_t m_mutex;

   public:
    mutex(void) { pthread_mutex_init(&m_mutex, NULL); }
    ~mutex(void) { pthread_mutex_destroy(&m_mutex); }

    mutex(const mutex &) = delete;
    mutex &operator=(const mutex &) = delete;

    bool try_lock(void) { return pthread_mutex_trylock(&m_mutex) == 0; }
    void lock(void) { pthread_mutex_lock(&m_mutex); }
    void unlock(void) { pthread_mutex_unlock(&m_mutex); }
  };


  class scoped_lock {
    kheap::mutex &lck;
    bool locked = false;

   public:
    inline scoped_lock(kheap::mutex &lck)
        : lck(lck) {
      lck.lock();
      locked = true;
    }

    inline ~scoped_lock(void) { unlock(); }

    inline void unlock(void) {
      if (locked) lck.unlock();
      locked = false;
    }
  };


  // Owns a value that may only be touched by one caller at a time. The only
  // way in is with(), which runs `cb(value)` under the lock:
  //
  //   heap.with([&](FreeList &fl) { return fl.allocate(sz); });
  //
  // The allocator core knows nothing about this; it is the single place where
  // exclusive access to the process-wide heap is handed out.
  template <typename T>
  class Locked {
   public:
    template <typename... Args>
    explicit Locked(Args &&...args)
        : m_inner(std::forward<Args>(args)...) {}

    template <typename Fn>
    auto with(Fn &&cb) -> decltype(cb(std::declval<T &>())) {
      kheap::scoped_lock l(m_lock);
      return cb(m_inner);
    }

    template <typename Fn>
    auto with(Fn &&cb) const -> decltype(cb(std::declval<const T &>())) {
      kheap::scoped_lock l(m_lock);
      return cb(m_inner);
    }

   private:
    mutable kheap::mutex m_lock;
    T m_inner;
  };

}  // namespace kheap
