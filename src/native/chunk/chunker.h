/* Copyright (C) 2016 NooBaa */
#pragma once

#include <memory>
#include <vector>

#include "chunk.h"

namespace chunkbench
{

/**
 *
 * Chunker
 *
 * Splits a borrowed read-only source into consecutive chunks, one chunk per call.
 * The source must stay valid and unmodified for the lifetime of the chunker.
 * A chunker is single pass - once exhausted a new instance is needed to rescan.
 *
 */
class Chunker
{
public:
    Chunker(const uint8_t* data, size_t len)
        : _data(data)
        , _len(len)
    {
    }

    virtual ~Chunker() {}

    /**
     * returns false at the end of the source,
     * otherwise sets chunk to the next range, starting where the previous ended.
     */
    virtual bool next(Chunk& chunk) = 0;

    // drain the remaining chunks
    std::vector<Chunk> collect()
    {
        std::vector<Chunk> chunks;
        Chunk chunk;
        while (next(chunk)) {
            chunks.push_back(chunk);
        }
        return chunks;
    }

    const uint8_t* data() const { return _data; }
    size_t length() const { return _len; }

protected:
    const uint8_t* const _data;
    const size_t _len;
};

/**
 *
 * ChunkerFactory
 *
 * Holds validated chunking parameters and builds a chunker per source.
 * Used wherever a new chunker is needed for every buffer, like the Segmenter.
 *
 */
class ChunkerFactory
{
public:
    virtual ~ChunkerFactory() {}

    virtual std::unique_ptr<Chunker> create(const uint8_t* data, size_t len) const = 0;

    // upper bound on the length of any chunk produced
    virtual size_t max_chunk_size() const = 0;

    virtual const char* name() const = 0;
};

} // namespace chunkbench
