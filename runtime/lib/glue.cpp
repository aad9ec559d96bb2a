/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

// Route C++ allocation through the kernel heap. Link this into the kernel
// image, or a binary of its own (kheap_glue_test): it replaces the process-wide
// operators, so it must stay out of kheap_test.
//
// Plain new serves KHEAP_ALIGNMENT. Everything that links this file is built
// with the default new alignment lowered to match (-faligned-new=8), so any
// type aligned beyond it goes through the align_val_t forms below, which halt
// in kheap_alloc_error() rather than hand out misaligned memory.
//
// Hosted builds run static constructors before the kernel heap exists, so
// until kheap_init() has run (and for pointers the heap does not own) we
// forward to the host allocator.

#include <kheap.h>
#include <kheap/Runtime.hpp>
#include <new>
#include <stdlib.h>

static_assert(__STDCPP_DEFAULT_NEW_ALIGNMENT__ <= KHEAP_ALIGNMENT,
    "plain operator new would under-align objects: build with -faligned-new=KHEAP_ALIGNMENT");

static void *glue_alloc(size_t size, size_t align) {
  if (kheap::Runtime::get_ptr() == nullptr) {
    void *p = ::aligned_alloc(align, (size + align - 1) & ~(align - 1));
    if (p == nullptr) kheap_alloc_error(size, align);
    return p;
  }
  return kmalloc_or_die(size, align);
}

static void glue_free(void *ptr) {
  if (ptr == nullptr) return;
  auto *rt = kheap::Runtime::get_ptr();
  if (rt != nullptr && rt->owns(ptr)) {
    rt->deallocate(ptr);
  } else {
    ::free(ptr);
  }
}


void *operator new(size_t size) {
  return glue_alloc(size, KHEAP_ALIGNMENT);
}

void *operator new[](size_t size) {
  return glue_alloc(size, KHEAP_ALIGNMENT);
}

void *operator new(size_t size, std::align_val_t align) {
  return glue_alloc(size, static_cast<size_t>(align));
}

void *operator new[](size_t size, std::align_val_t align) {
  return glue_alloc(size, static_cast<size_t>(align));
}

void operator delete(void *ptr) noexcept {
  glue_free(ptr);
}

void operator delete[](void *ptr) noexcept {
  glue_free(ptr);
}

void operator delete(void *ptr, size_t) noexcept {
  glue_free(ptr);
}

void operator delete[](void *ptr, size_t) noexcept {
  glue_free(ptr);
}

void operator delete(void *ptr, std::align_val_t) noexcept {
  glue_free(ptr);
}

void operator delete[](void *ptr, std::align_val_t) noexcept {
  glue_free(ptr);
}
