/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

// A hosted stand-in for the kernel's entry point: bring the heap up over a
// reserved region, then exercise it the way early kernel code does.

#include <kheap.h>
#include <kheap/Configuration.hpp>
#include <kheap/Logger.hpp>
#include <vector>

// On the board this is KHEAP_HEAP_START; here it is just a reserved array.
alignas(KHEAP_ALIGNMENT) static unsigned char heap_region[KHEAP_HEAP_SIZE];

int main(void) {
  kheap::Configuration config = kheap::Configuration::from_env();
  kheap::printf("\n[KERNEL] Booting...\n");

  kheap_init((uintptr_t)heap_region, sizeof(heap_region), static_cast<int>(config.strategy));
  kheap::printf("[KERNEL] Heap Initialized (%s).\n", kheap::strategy_name(config.strategy));

  kheap::printf("Testing Heap Allocation...\n");
  int *boxed = new int(42);
  kheap::printf("- Box allocated at %p, value: %d\n", (void *)boxed, *boxed);

  std::vector<int> vec;
  for (int i = 0; i < 5; i++)
    vec.push_back(i);

  kheap::printf("- Vec allocated at %p: [", (void *)vec.data());
  for (size_t i = 0; i < vec.size(); i++)
    kheap::printf("%s%d", i == 0 ? "" : ", ", vec[i]);
  kheap::printf("] (Success!)\n\n");

  kheap_dump();

  delete boxed;
  return 0;
}
