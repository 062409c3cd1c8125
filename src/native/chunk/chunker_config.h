/* Copyright (C) 2016 NooBaa */
#pragma once

#include <string>

#include "chunker.h"

namespace chunkbench
{

const size_t KB = 1024;
const size_t MB = 1024 * KB;

/**
 * Chunking configuration by algorithm name.
 * Defaults are 8K/10K/64K rabin chunks with a 64 bytes window.
 */
struct ChunkerConfig
{
    // "fixed" or "rabin"
    std::string algo;
    int window_size;
    ChunkSizeParms parms;
    // only used by "fixed"
    size_t chunk_size;

    ChunkerConfig()
        : algo("rabin")
        , window_size(64)
        , parms(8 * KB, 10 * KB, 64 * KB)
        , chunk_size(10 * KB)
    {
    }

    // throws ConfigError for an unknown algo or invalid parameters
    std::unique_ptr<ChunkerFactory> create_factory() const;
};

} // namespace chunkbench
