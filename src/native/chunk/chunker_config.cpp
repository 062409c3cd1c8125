/* Copyright (C) 2016 NooBaa */
#include "chunker_config.h"
#include "fixed_chunker.h"
#include "rabin_chunker.h"

namespace chunkbench
{

std::unique_ptr<ChunkerFactory>
ChunkerConfig::create_factory() const
{
    if (algo == "fixed") {
        return std::unique_ptr<ChunkerFactory>(new FixedChunkerFactory(chunk_size));
    }
    if (algo == "rabin") {
        return std::unique_ptr<ChunkerFactory>(new RabinChunkerFactory(window_size, parms));
    }
    throw ConfigError(XSTR() << "Chunking algorithm not supported " << DVAL(algo));
}

} // namespace chunkbench
