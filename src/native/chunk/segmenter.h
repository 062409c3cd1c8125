/* Copyright (C) 2016 NooBaa */
#pragma once

#include <vector>

#include "../util/block_reader.h"
#include "../util/buf.h"
#include "chunker.h"

namespace chunkbench
{

/**
 * A chunk delivered by the Segmenter.
 * chunk.offset is the position in the whole stream and data is an owned copy
 * of the chunk bytes, so it stays valid after the segmenter moves on.
 */
struct Segment
{
    Chunk chunk;
    Buf data;
};

/**
 *
 * Segmenter
 *
 * Chunks a stream that is read in bounded blocks, producing the same chunks
 * as chunking the whole stream in memory at once.
 *
 * Every pass reads a block after the tail carried from the previous pass,
 * and runs a new chunker over tail + block. All the chunks of the pass except
 * the last are final. The last one may still grow with bytes that were not
 * read yet, so its bytes are carried to the next pass as the tail.
 * When the reader reaches the end of the stream the tail is the last chunk.
 *
 * This relies on chunk boundaries depending only on bytes inside the chunk,
 * counted from the chunk start.
 *
 */
class Segmenter
{
public:
    Segmenter(const ChunkerFactory& factory, BlockReader& reader, size_t block_size);

    /**
     * returns false once the stream is exhausted and all chunks were delivered.
     * an IoError from the reader is rethrown, the chunk in progress is dropped,
     * and every later call throws as well.
     */
    bool next(Segment& segment);

    uint64_t total_read() const { return _total_read; }
    uint64_t total_delivered() const { return _total_delivered; }
    int num_passes() const { return _num_passes; }

private:
    enum State {
        READ,
        SCAN,
        DONE,
        FAILED,
    };

    bool _read_pass();
    void _deliver(const uint8_t* data, const Chunk& chunk, Segment& segment);

    const ChunkerFactory& _factory;
    BlockReader& _reader;
    const size_t _block_size;
    State _state;
    // tail ++ block of the current pass
    Buf _segment;
    // bytes of the provisional last chunk carried between passes
    std::vector<uint8_t> _tail;
    std::unique_ptr<Chunker> _chunker;
    // lookahead - final only once the chunker produced another chunk after it
    Chunk _pending;
    // stream offset of _segment[0]
    uint64_t _segment_pos;
    uint64_t _total_read;
    uint64_t _total_delivered;
    int _num_passes;
};

} // namespace chunkbench
