/* Copyright (C) 2016 NooBaa */
#include "fixed_chunker.h"

namespace chunkbench
{

DBG_INIT_VAR(DEBUG_LEVEL);

static void
_check_chunk_size(size_t chunk_size)
{
    if (chunk_size == 0) {
        throw ConfigError("Chunk size must be greater than zero");
    }
}

FixedChunker::FixedChunker(const uint8_t* data, size_t len, size_t chunk_size)
    : Chunker(data, len)
    , _chunk_size(chunk_size)
    , _pos(0)
{
    _check_chunk_size(_chunk_size);
    DBG2("FixedChunker: " << DVAL(_len) << DVAL(_chunk_size));
}

bool
FixedChunker::next(Chunk& chunk)
{
    if (_pos >= _len) {
        return false;
    }
    chunk.offset = _pos;
    chunk.length = std::min(_chunk_size, _len - _pos);
    _pos += chunk.length;
    DBG3("FixedChunker: chunk " << chunk);
    return true;
}

FixedChunkerFactory::FixedChunkerFactory(size_t chunk_size)
    : _chunk_size(chunk_size)
{
    _check_chunk_size(_chunk_size);
    DBG1("FixedChunkerFactory: " << DVAL(_chunk_size));
}

std::unique_ptr<Chunker>
FixedChunkerFactory::create(const uint8_t* data, size_t len) const
{
    return std::unique_ptr<Chunker>(new FixedChunker(data, len, _chunk_size));
}

} // namespace chunkbench
