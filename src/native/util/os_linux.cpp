/* Copyright (C) 2016 NooBaa */
#ifdef __linux__

#include "common.h"

#include <limits.h>
#include <stdlib.h>
#include <sys/syscall.h>
#include <sys/types.h>

namespace chunkbench
{

pid_t
get_current_tid()
{
    return syscall(SYS_gettid);
}

int
get_env_int(const char* name, int default_val)
{
    const char* str = getenv(name);
    if (str == NULL || *str == '\0') {
        return default_val;
    }
    char* end = NULL;
    errno = 0;
    const long val = strtol(str, &end, 10);
    if (errno != 0 || *end != '\0' || val < INT_MIN || val > INT_MAX) {
        LOG("WARNING: get_env_int: ignoring " << name << "=" << str);
        return default_val;
    }
    return (int)val;
}

} // namespace chunkbench

#endif
