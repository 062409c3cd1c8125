/* Copyright (C) 2016 NooBaa */
#include "segmenter.h"

#include <limits.h>

namespace chunkbench
{

DBG_INIT_VAR(DEBUG_LEVEL);

Segmenter::Segmenter(const ChunkerFactory& factory, BlockReader& reader, size_t block_size)
    : _factory(factory)
    , _reader(reader)
    , _block_size(block_size)
    , _state(READ)
    , _segment_pos(0)
    , _total_read(0)
    , _total_delivered(0)
    , _num_passes(0)
{
    if (_block_size == 0) {
        throw ConfigError("Segmenter: block size must be greater than zero");
    }
    // the tail is at most one chunk, so this is enough for tail ++ block
    const size_t capacity = _factory.max_chunk_size() + _block_size;
    if (capacity > size_t(INT_MAX)) {
        throw ConfigError(XSTR() << "Segmenter: block size too large " << DVAL(_block_size));
    }
    _segment = Buf(int(capacity));
    _tail.reserve(_factory.max_chunk_size());
    DBG1("Segmenter: " << _factory.name() << " " << DVAL(_block_size) << DVAL(capacity));
}

bool
Segmenter::next(Segment& segment)
{
    while (true) {
        switch (_state) {
        case DONE:
            return false;

        case FAILED:
            throw IoError("Segmenter: stream failed, no more chunks");

        case READ:
            if (_read_pass()) {
                break;
            }
            // end of stream - whatever was carried is the last chunk
            _state = DONE;
            if (_tail.empty()) {
                return false;
            }
            _deliver(_tail.data(), Chunk(0, _tail.size()), segment);
            _tail.clear();
            DBG1("Segmenter: done " << DVAL(_total_read) << DVAL(_total_delivered) << DVAL(_num_passes));
            return true;

        case SCAN: {
            Chunk chunk;
            if (_chunker->next(chunk)) {
                // _pending has a successor in this pass so its boundary is final
                _deliver(_segment.data(), _pending, segment);
                _pending = chunk;
                return true;
            }
            if (_pending.length > _factory.max_chunk_size()) {
                throw Exception(XSTR()
                    << "Segmenter: " << _factory.name()
                    << " chunker exceeded its max chunk size " << _pending);
            }
            // the last chunk of the pass is carried to the next one
            const uint8_t* data = _segment.data();
            _tail.assign(data + _pending.offset, data + _pending.end());
            _segment_pos += _pending.offset;
            _chunker.reset();
            _state = READ;
            DBG2("Segmenter: carry tail " << DVAL(_tail.size()) << DVAL(_segment_pos));
            break;
        }
        }
    }
}

bool
Segmenter::_read_pass()
{
    const size_t tail_len = _tail.size();
    uint8_t* const data = _segment.data();
    if (tail_len) {
        memcpy(data, _tail.data(), tail_len);
    }

    size_t n = 0;
    try {
        n = _reader.read_block(data + tail_len, _block_size);
    } catch (const std::exception& err) {
        LOG("Segmenter: read failed, dropping " << tail_len << " pending bytes - " << err.what());
        _tail.clear();
        _state = FAILED;
        throw;
    }
    if (n == 0) {
        return false;
    }

    _total_read += n;
    _num_passes++;
    _chunker = _factory.create(data, tail_len + n);
    // the pass is never empty so there is always a first chunk
    MUST1(_chunker->next(_pending));
    _tail.clear();
    _state = SCAN;
    DBG1("Segmenter: pass " << _num_passes << " " << DVAL(tail_len) << DVAL(n) << DVAL(_segment_pos));
    return true;
}

void
Segmenter::_deliver(const uint8_t* data, const Chunk& chunk, Segment& segment)
{
    segment.chunk = Chunk(_segment_pos + chunk.offset, chunk.length);
    segment.data = Buf::copy(data + chunk.offset, int(chunk.length));
    _total_delivered += chunk.length;
    DBG3("Segmenter: deliver " << segment.chunk);
}

} // namespace chunkbench
