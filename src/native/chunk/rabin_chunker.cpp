/* Copyright (C) 2016 NooBaa */
#include "rabin_chunker.h"

namespace chunkbench
{

DBG_INIT_VAR(DEBUG_LEVEL);

// validates everything before any member gets allocated
static int
_validate(int window_size, const ChunkSizeParms& parms)
{
    validate_window_size(window_size);
    parms.validate();
    if (parms.avg_chunk_size <= parms.min_chunk_size) {
        throw ConfigError(XSTR()
            << "Average chunk size should be larger than min chunk size "
            << DVAL(parms.avg_chunk_size) << DVAL(parms.min_chunk_size));
    }
    if (parms.max_chunk_size <= parms.avg_chunk_size) {
        throw ConfigError(XSTR()
            << "Max chunk size should be larger than average chunk size "
            << DVAL(parms.max_chunk_size) << DVAL(parms.avg_chunk_size));
    }
    return window_size;
}

RabinChunker::RabinChunker(
    const uint8_t* data,
    size_t len,
    int window_size,
    const ChunkSizeParms& parms)
    : Chunker(data, len)
    , _rabin(_validate(window_size, parms))
    , _parms(parms)
    , _window_mask(window_size - 1)
    , _cut_mask(parms.avg_chunk_size - parms.min_chunk_size - 1)
    , _window(window_size, 0)
    , _window_pos(0)
    , _hash(0)
    , _pos(0)
{
    DBG2("RabinChunker: " << DVAL(_len) << DVAL(window_size) << _parms
                          << " cut_mask=0x" << std::hex << _cut_mask << std::dec);
}

bool
RabinChunker::next(Chunk& chunk)
{
    if (_pos >= _len) {
        return false;
    }

    const size_t start = _pos;
    const size_t remain = _len - start;
    const size_t min_chunk = _parms.min_chunk_size;

    // too little left to reach the minimum, the remainder is the last chunk
    if (remain < min_chunk) {
        chunk.offset = start;
        chunk.length = remain;
        _pos = _len;
        DBG3("RabinChunker: tail chunk " << chunk);
        return true;
    }

    // this loop is very tight on CPU,
    // so we copy the state that gets accessed frequently to the stack.
    const size_t limit = start + std::min(_parms.max_chunk_size, remain);
    const uint8_t* const data = _data;
    uint8_t* const window = _window.data();
    const int window_mask = _window_mask;
    const Hash cut_mask = _cut_mask;
    int window_pos = _window_pos;
    Hash hash = _hash;
    size_t pos = start;
    bool boundary = false;

    while (pos < limit) {
        const uint8_t byte = data[pos];
        const uint8_t byte_out = window[window_pos];
        hash = _rabin.update(hash, byte, byte_out);
        window[window_pos] = byte;
        window_pos = (window_pos + 1) & window_mask;
        pos++;
        if (pos - start >= min_chunk && (_rabin.checksum(hash, byte_out) & cut_mask) == 0) {
            boundary = true;
            break;
        }
    }

    _window_pos = window_pos;
    _hash = hash;
    _pos = pos;
    chunk.offset = start;
    chunk.length = pos - start;
    DBG3("RabinChunker: chunk " << chunk << (boundary ? "" : " cut at limit"));
    return true;
}

RabinChunkerFactory::RabinChunkerFactory(int window_size, const ChunkSizeParms& parms)
    : _window_size(_validate(window_size, parms))
    , _parms(parms)
{
    DBG1("RabinChunkerFactory: " << DVAL(_window_size) << _parms);
}

std::unique_ptr<Chunker>
RabinChunkerFactory::create(const uint8_t* data, size_t len) const
{
    return std::unique_ptr<Chunker>(new RabinChunker(data, len, _window_size, _parms));
}

} // namespace chunkbench
