/* Copyright (C) 2016 NooBaa */
#pragma once

#include "buf.h"

namespace chunkbench
{

/**
 * pseudo random bytes for tests and benchmarks.
 * the same seed always generates the same bytes.
 */
Buf generate_data_block(int size, uint64_t seed);

} // namespace chunkbench
