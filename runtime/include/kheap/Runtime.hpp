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

#include <stdio.h>
#include <kheap/Configuration.hpp>
#include <kheap/FreeList.hpp>
#include <kheap/Lock.hpp>
#include <kheap/Logger.hpp>

namespace kheap {
  /**
   * @brief The Runtime is the kernel's one heap, and the only owner of it.
   *
   * The boot sequence creates it once, from a Configuration describing a
   * reserved region, before anything can allocate. After that, the C interface
   * in `kheap.h` (kmalloc/kfree and the operator new glue) reaches it through
   * Runtime::get(), and every call into the FreeList goes through the lock in
   * `heap`.
   *
   * Only one Runtime may exist at a time. Tests create and destroy their own.
   */
  struct Runtime final {
    kheap::Configuration config;

    // The heap, behind the one lock that serializes every caller.
    kheap::Locked<kheap::FreeList> heap;

    // Return the singleton instance of the Runtime if it has been created. Abort otherwise.
    static Runtime &get();
    static Runtime *get_ptr();

    Runtime(kheap::Configuration config = {});
    ~Runtime();

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    void *allocate(size_t size, size_t align);
    void deallocate(void *ptr);
    bool owns(const void *ptr);

    HeapStats stats(void);
    void dump(FILE *stream);
  };

}  // namespace kheap
