/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */



#include <kheap/Logger.hpp>
#include <pthread.h>
#include <stdarg.h>
#include <stdlib.h>
#include <unistd.h>
#include <string.h>
#include <time.h>

static const char *level_strings[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};

static const char *level_colors[] = {
    "\x1b[94m", "\x1b[36m", "\x1b[32m", "\x1b[33m", "\x1b[31m", "\x1b[35m"};


static pthread_mutex_t log_mutex = PTHREAD_MUTEX_INITIALIZER;
static int log_level = LOG_ERROR;
static bool enable_colors = true;

// If the log level is coming from ENV, lock it so it cannot change.
static bool log_level_locked = false;

static void __attribute__((constructor(102))) kheap_logger_init(void) {
  enable_colors = isatty(STDOUT_FILENO);

  const char *env = getenv("KHEAP_LOG_LEVEL");
  if (env != NULL) {
    switch (env[0]) {
      case 'T': log_level = LOG_TRACE; break;
      case 'D': log_level = LOG_DEBUG; break;
      case 'I': log_level = LOG_INFO; break;
      case 'W': log_level = LOG_WARN; break;
      case 'E': log_level = LOG_ERROR; break;
      case 'F': log_level = LOG_FATAL; break;
      default: return;  // unknown level, leave it unlocked
    }
    log_level_locked = true;
  }
}



#define BUFFER_SIZE 1024

static int log_vemitf(const char *format, va_list args) {
  char buffer[BUFFER_SIZE];
  int printed_length = vsnprintf(buffer, BUFFER_SIZE, format, args);

  if (printed_length < 0) return -1;
  // Truncate rather than drop long lines.
  if (printed_length >= BUFFER_SIZE) printed_length = BUFFER_SIZE - 1;

  if (write(STDOUT_FILENO, buffer, printed_length) != printed_length) {
    return -1;
  }

  return printed_length;
}

static int log_emitf(const char *format, ...) {
  va_list args;
  va_start(args, format);
  int n = log_vemitf(format, args);
  va_end(args);
  return n;
}




namespace kheap {
  void log(int level, const char *file, int line, const char *fmt, ...) {
    if (level < log_level) return;

    va_list args;
    va_start(args, fmt);

    pthread_mutex_lock(&log_mutex);

    time_t t = time(NULL);
    struct tm now;
    localtime_r(&t, &now);

    char buf[16];
    buf[strftime(buf, sizeof(buf), "%H:%M:%S", &now)] = '\0';

    if (enable_colors) {
      log_emitf("%s %s%-5s\x1b[0m \x1b[90m%s:%d\x1b[0m | ", buf, level_colors[level],
          level_strings[level], file, line);
    } else {
      log_emitf("%s %-5s %s:%d | ", buf, level_strings[level], file, line);
    }

    log_vemitf(fmt, args);
    log_emitf("\n");

    pthread_mutex_unlock(&log_mutex);
    va_end(args);
  }


  void set_log_level(int level) {
    if (!log_level_locked) {
      log_level = level;
    }
  }

  int get_log_level(void) { return log_level; }


  int printf(const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    int n = log_vemitf(fmt, args);
    va_end(args);
    return n;
  }
}  // namespace kheap
