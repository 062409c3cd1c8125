/* Copyright (C) 2016 NooBaa */
#pragma once

#include "chunker.h"

namespace chunkbench
{

/**
 * Splits the source in fixed strides of chunk_size bytes,
 * the last chunk is shortened to what remains.
 * Boundaries depend only on the source length, so a shifting edit moves
 * every following boundary and nothing after it deduplicates.
 */
class FixedChunker : public Chunker
{
public:
    FixedChunker(const uint8_t* data, size_t len, size_t chunk_size);

    virtual bool next(Chunk& chunk);

private:
    const size_t _chunk_size;
    size_t _pos;
};

class FixedChunkerFactory : public ChunkerFactory
{
public:
    explicit FixedChunkerFactory(size_t chunk_size);

    virtual std::unique_ptr<Chunker> create(const uint8_t* data, size_t len) const;
    virtual size_t max_chunk_size() const { return _chunk_size; }
    virtual const char* name() const { return "fixed"; }

private:
    const size_t _chunk_size;
};

} // namespace chunkbench
