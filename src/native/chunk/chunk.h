/* Copyright (C) 2016 NooBaa */
#pragma once

#include <functional>

#include "../util/common.h"

namespace chunkbench
{

/**
 * A contiguous byte range [offset, offset+length) of some source.
 * Does not own the bytes - callers copy them out while the source is still valid.
 */
struct Chunk
{
    size_t offset;
    size_t length;

    Chunk()
        : offset(0), length(0) {}

    Chunk(size_t offset_, size_t length_)
        : offset(offset_), length(length_) {}

    size_t end() const { return offset + length; }

    bool operator==(const Chunk& other) const
    {
        return offset == other.offset && length == other.length;
    }

    bool operator!=(const Chunk& other) const
    {
        return !(*this == other);
    }

    friend std::ostream& operator<<(std::ostream& os, const Chunk& chunk)
    {
        return os << "(" << chunk.offset << "," << chunk.length << ")";
    }
};

// bounds accepted for the chunk size parameters
const size_t MIN_MIN_CHUNK_SIZE = 64;
const size_t MAX_MIN_CHUNK_SIZE = 1048576;
const size_t MIN_AVG_CHUNK_SIZE = 256;
const size_t MAX_AVG_CHUNK_SIZE = 4194304;
const size_t MIN_MAX_CHUNK_SIZE = 1024;
const size_t MAX_MAX_CHUNK_SIZE = 16777216;

// bounds for the sliding window of content defined chunkers
const int MIN_WINDOW_SIZE = 8;
const int MAX_WINDOW_SIZE = 64;

/**
 * min/avg/max chunk sizes shared by the chunking algorithms.
 * min < avg < max is expected but only the ranges are checked here.
 */
struct ChunkSizeParms
{
    size_t min_chunk_size;
    size_t avg_chunk_size;
    size_t max_chunk_size;

    ChunkSizeParms(size_t min_chunk, size_t avg_chunk, size_t max_chunk)
        : min_chunk_size(min_chunk)
        , avg_chunk_size(avg_chunk)
        , max_chunk_size(max_chunk)
    {
    }

    // throws ConfigError if any size is out of its range
    void validate() const;

    friend std::ostream& operator<<(std::ostream& os, const ChunkSizeParms& parms)
    {
        return os << "min=" << parms.min_chunk_size
                  << " avg=" << parms.avg_chunk_size
                  << " max=" << parms.max_chunk_size;
    }
};

// throws ConfigError if window_size is out of range or not a power of two
void validate_window_size(int window_size);

} // namespace chunkbench

namespace std
{

template <>
struct hash<chunkbench::Chunk>
{
    size_t operator()(const chunkbench::Chunk& chunk) const
    {
        const size_t h = hash<size_t>()(chunk.offset);
        return h ^ (hash<size_t>()(chunk.length) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

} // namespace std
