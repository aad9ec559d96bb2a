/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <kheap/utils.h>
#include <execinfo.h>
#include <stdio.h>
#include <stdlib.h>

#define BT_BUF_SIZE 64

extern "C" void kheap_dump_backtrace(void) {
  void *buffer[BT_BUF_SIZE];

  int nptrs = backtrace(buffer, BT_BUF_SIZE);
  fprintf(stderr, "Backtrace (%d frames):\n", nptrs);

  char **strings = backtrace_symbols(buffer, nptrs);
  if (strings == NULL) {
    // We are already on a fatal path, fall back to the raw addresses.
    backtrace_symbols_fd(buffer, nptrs, fileno(stderr));
    return;
  }

  for (int j = 0; j < nptrs; j++)
    fprintf(stderr, "\x1b[92m%d\x1b[0m: %s\n", j, strings[j]);

  free(strings);
}
