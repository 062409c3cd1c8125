/* Copyright (C) 2016 NooBaa */
#include <stdlib.h>

#include "../util/common.h"

using namespace chunkbench;

static const char* VAR = "CHUNKBENCH_OS_TEST_INT";

static int
env_int(const char* value, int default_val)
{
    if (value) {
        MUST_SYS(setenv(VAR, value, 1));
    } else {
        MUST_SYS(unsetenv(VAR));
    }
    return get_env_int(VAR, default_val);
}

int
main()
{
    LOG("start: tid " << get_current_tid());

    MUST1(env_int(NULL, 7) == 7);
    MUST1(env_int("", 7) == 7);
    MUST1(env_int("3", 7) == 3);
    MUST1(env_int("-12", 7) == -12);
    MUST1(env_int("2147483647", 7) == 2147483647);
    MUST1(env_int("-2147483648", 7) == -2147483647 - 1);

    // garbage and values that do not fit an int fall back to the default
    MUST1(env_int("abc", 7) == 7);
    MUST1(env_int("5x", 7) == 7);
    MUST1(env_int("2147483648", 7) == 7);
    MUST1(env_int("-2147483649", 7) == 7);
    MUST1(env_int("99999999999", 7) == 7);
    MUST1(env_int("99999999999999999999999", 7) == 7);

    MUST_SYS(unsetenv(VAR));
    LOG("os_test: done");
    return 0;
}
