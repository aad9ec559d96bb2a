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

enum { LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_WARN, LOG_ERROR, LOG_FATAL };


namespace kheap {
  void log(int level, const char *file, int line, const char *fmt, ...)
      __attribute__((format(printf, 4, 5)));


  void set_log_level(int level);
  int get_log_level(void);

  // Unprefixed output through the logger's sink (stdout).
  int printf(const char *format, ...) __attribute__((format(printf, 1, 2)));
};  // namespace kheap


#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

#ifdef KHEAP_ENABLE_LOGGING
#define log_trace(...) kheap::log(LOG_TRACE, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_debug(...) kheap::log(LOG_DEBUG, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_info(...) kheap::log(LOG_INFO, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_warn(...) kheap::log(LOG_WARN, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_error(...) kheap::log(LOG_ERROR, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_fatal(...) kheap::log(LOG_FATAL, __FILE_NAME__, __LINE__, __VA_ARGS__)
#else
#define log_trace(...)
#define log_debug(...)
#define log_info(...)
#define log_warn(...)
#define log_error(...)
#define log_fatal(...)
#endif
