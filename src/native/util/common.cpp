#include "common.h"

namespace chunkbench
{

int DEBUG_LEVEL = get_env_int("CHUNKBENCH_DEBUG", 0);

}
