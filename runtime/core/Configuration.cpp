/*
 * This file is part of the kheap Free-List Kernel Heap
 *
 * Copyright (c) 2024, The kheap Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <kheap/Configuration.hpp>
#include <kheap/Logger.hpp>
#include <stdlib.h>

namespace kheap {

  Configuration Configuration::from_env(void) {
    Configuration config;

    const char *env = getenv("KHEAP_STRATEGY");
    if (env != NULL) {
      FitStrategy strat;
      if (parse_strategy(env, strat)) {
        config.strategy = strat;
      } else {
        log_warn("KHEAP_STRATEGY=%s is not a strategy, using %s", env,
            strategy_name(config.strategy));
      }
    }

    return config;
  }

}  // namespace kheap
