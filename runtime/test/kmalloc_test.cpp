/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <gtest/gtest.h>
#include <kheap.h>
#include <kheap/Logger.hpp>
#include <kheap/Runtime.hpp>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>


class KmallocTest : public ::testing::Test {
 public:
  static constexpr size_t region_size = 512 * 1024;

  void SetUp() override {
    kheap::set_log_level(LOG_WARN);
    mem = aligned_alloc(4096, region_size);
    ASSERT_NE(mem, nullptr);
    kheap_init((uintptr_t)mem, region_size, KHEAP_FIRST_FIT);
  }

  void TearDown() override {
    kheap_deinit();
    free(mem);
  }

  void *mem = nullptr;
};



TEST_F(KmallocTest, Initialized) {
  EXPECT_TRUE(kheap_initialized());
  EXPECT_NE(kheap::Runtime::get_ptr(), nullptr);
  EXPECT_EQ(kheap::Runtime::get().config.strategy, kheap::FitStrategy::FirstFit);
}


TEST_F(KmallocTest, DeinitAndReinit) {
  kheap_deinit();
  EXPECT_FALSE(kheap_initialized());
  // Twice is harmless.
  kheap_deinit();

  kheap_init((uintptr_t)mem, region_size, KHEAP_NEXT_FIT);
  EXPECT_TRUE(kheap_initialized());
  EXPECT_EQ(kheap::Runtime::get().config.strategy, kheap::FitStrategy::NextFit);
}


TEST_F(KmallocTest, SecondInitIsFatal) {
  EXPECT_DEATH(kheap_init((uintptr_t)mem, region_size, KHEAP_BEST_FIT),
      "Cannot create more than one runtime");
}


TEST_F(KmallocTest, BadStrategyIsFatal) {
  kheap_deinit();
  EXPECT_DEATH(kheap_init((uintptr_t)mem, region_size, 7), "is not a heap strategy");
}


TEST_F(KmallocTest, MallocFree) {
  char *s = (char *)kmalloc(64);
  ASSERT_NE(s, nullptr);
  EXPECT_EQ((uintptr_t)s % KHEAP_ALIGNMENT, 0u);
  EXPECT_GE((uintptr_t)s, (uintptr_t)mem);
  EXPECT_LT((uintptr_t)s, (uintptr_t)mem + region_size);

  strcpy(s, "hello from the kernel heap");
  EXPECT_STREQ(s, "hello from the kernel heap");
  kfree(s);

  kheap::HeapStats st = kheap::Runtime::get().stats();
  EXPECT_EQ(st.used_blocks, 0u);
  EXPECT_EQ(st.free_blocks, 1u);
}


TEST_F(KmallocTest, FreeNullIsNoop) {
  kheap::HeapStats before = kheap::Runtime::get().stats();
  kfree(NULL);
  kheap::HeapStats after = kheap::Runtime::get().stats();
  EXPECT_EQ(before.free_bytes, after.free_bytes);
  EXPECT_EQ(before.free_blocks, after.free_blocks);
}


TEST_F(KmallocTest, UsableSize) {
  void *p = kmalloc(13);
  ASSERT_NE(p, nullptr);
  EXPECT_GE(kmalloc_usable_size(p), 13u);
  EXPECT_EQ(kmalloc_usable_size(p) % KHEAP_ALIGNMENT, 0u);
  EXPECT_EQ(kmalloc_usable_size(NULL), 0u);
  kfree(p);
}


TEST_F(KmallocTest, Aligned) {
  for (size_t align : {1, 2, 4, 8}) {
    void *p = kmalloc_aligned(24, align);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ((uintptr_t)p % align, 0u);
    kfree(p);
  }
  EXPECT_EQ(kmalloc_aligned(24, 16), nullptr);
  EXPECT_EQ(kmalloc_aligned(24, 4096), nullptr);
}


TEST_F(KmallocTest, CallocZeroes) {
  // Dirty some memory first, so the zeroing is observable.
  void *dirty = kmalloc(256);
  ASSERT_NE(dirty, nullptr);
  memset(dirty, 0xFF, 256);
  uintptr_t dirty_addr = (uintptr_t)dirty;
  kfree(dirty);

  uint32_t *arr = (uint32_t *)kcalloc(64, sizeof(uint32_t));
  ASSERT_NE(arr, nullptr);
  EXPECT_EQ((uintptr_t)arr, dirty_addr);
  for (int i = 0; i < 64; i++)
    EXPECT_EQ(arr[i], 0u) << "at " << i;
  kfree(arr);
}


TEST_F(KmallocTest, CallocOverflow) {
  EXPECT_EQ(kcalloc(SIZE_MAX / 2, 3), nullptr);
  EXPECT_EQ(kcalloc(SIZE_MAX, SIZE_MAX), nullptr);
}


TEST_F(KmallocTest, OutOfMemoryReturnsNull) {
  EXPECT_EQ(kmalloc(region_size), nullptr);
  EXPECT_EQ(kmalloc(SIZE_MAX), nullptr);

  void *p = kmalloc(region_size / 2);
  EXPECT_NE(p, nullptr);
  kfree(p);
}


TEST_F(KmallocTest, OrDieSucceeds) {
  void *p = kmalloc_or_die(128, KHEAP_ALIGNMENT);
  EXPECT_NE(p, nullptr);
  kfree(p);
}


TEST_F(KmallocTest, OrDieHalts) {
  EXPECT_DEATH(kmalloc_or_die(region_size, KHEAP_ALIGNMENT), "out of memory");
}


TEST_F(KmallocTest, Dump) {
  void *p = kmalloc(40);
  ::testing::internal::CaptureStdout();
  kheap_dump();
  std::string out = ::testing::internal::GetCapturedStdout();
  EXPECT_NE(out.find("kheap Runtime Information"), std::string::npos);
  EXPECT_NE(out.find("first-fit"), std::string::npos);
  kfree(p);
}
