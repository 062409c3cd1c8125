/* Copyright (C) 2016 NooBaa */
#pragma once

#include <sys/types.h>

namespace chunkbench
{

// see os_linux.cpp

pid_t get_current_tid();

/**
 * read an integer setting from the environment.
 * returns default_val when the variable is unset or not a number.
 */
int get_env_int(const char* name, int default_val);

} // namespace chunkbench
