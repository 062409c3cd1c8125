/* Copyright (C) 2016 NooBaa */
#pragma once

#include "../util/buf.h"
#include "../util/rabin_fingerprint.h"
#include "chunker.h"

namespace chunkbench
{

/**
 *
 * RabinChunker
 *
 * Content defined chunking with a rabin rolling fingerprint over a sliding window.
 *
 * Scanning starts counting from the chunk start, and once min_chunk_size bytes
 * were consumed every position whose checksum has no bits in common with cut_mask
 * becomes a boundary. If no boundary shows up, the chunk is cut at max_chunk_size
 * or at the end of the source.
 *
 * The window and the fingerprint are kept for the whole source and are not reset
 * between chunks.
 *
 */
class RabinChunker : public Chunker
{
public:
    typedef RabinFingerprint::T Hash;

    RabinChunker(const uint8_t* data, size_t len, int window_size, const ChunkSizeParms& parms);

    virtual bool next(Chunk& chunk);

    Hash cut_mask() const { return _cut_mask; }

private:
    const RabinFingerprint _rabin;
    const ChunkSizeParms _parms;
    const int _window_mask;
    const Hash _cut_mask;
    Buf _window;
    int _window_pos;
    Hash _hash;
    size_t _pos;
};

class RabinChunkerFactory : public ChunkerFactory
{
public:
    RabinChunkerFactory(int window_size, const ChunkSizeParms& parms);

    virtual std::unique_ptr<Chunker> create(const uint8_t* data, size_t len) const;
    virtual size_t max_chunk_size() const { return _parms.max_chunk_size; }
    virtual const char* name() const { return "rabin"; }

private:
    const int _window_size;
    const ChunkSizeParms _parms;
};

} // namespace chunkbench
