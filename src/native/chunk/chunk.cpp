/* Copyright (C) 2016 NooBaa */
#include "chunk.h"

namespace chunkbench
{

static void
_check_range(const char* what, size_t val, size_t lo, size_t hi)
{
    if (val < lo || val > hi) {
        throw ConfigError(XSTR()
            << what << " out of valid range "
            << val << " not in [" << lo << ".." << hi << "]");
    }
}

void
ChunkSizeParms::validate() const
{
    _check_range("Min chunk size", min_chunk_size, MIN_MIN_CHUNK_SIZE, MAX_MIN_CHUNK_SIZE);
    _check_range("Average chunk size", avg_chunk_size, MIN_AVG_CHUNK_SIZE, MAX_AVG_CHUNK_SIZE);
    _check_range("Max chunk size", max_chunk_size, MIN_MAX_CHUNK_SIZE, MAX_MAX_CHUNK_SIZE);
}

void
validate_window_size(int window_size)
{
    if (window_size < MIN_WINDOW_SIZE || window_size > MAX_WINDOW_SIZE) {
        throw ConfigError(XSTR() << "Window size out of valid range " << DVAL(window_size));
    }
    if (window_size & (window_size - 1)) {
        throw ConfigError(XSTR() << "Window size must be a power of two " << DVAL(window_size));
    }
}

} // namespace chunkbench
