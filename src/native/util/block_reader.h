/* Copyright (C) 2016 NooBaa */
#pragma once

#include "common.h"

namespace chunkbench
{

/**
 * Source of bytes for the Segmenter.
 * read_some() may return less than asked, 0 means the end of the stream,
 * failures are thrown as IoError.
 */
class BlockReader
{
public:
    virtual ~BlockReader() {}

    virtual size_t read_some(uint8_t* buf, size_t len) = 0;

    /**
     * keep reading until the region is full or the stream ends.
     * returns the number of bytes filled.
     */
    size_t read_block(uint8_t* buf, size_t len);
};

/**
 * reads a file descriptor that is owned by the caller.
 * interrupted reads are retried.
 */
class FdReader : public BlockReader
{
public:
    explicit FdReader(int fd)
        : _fd(fd) {}

    virtual size_t read_some(uint8_t* buf, size_t len);

private:
    const int _fd;
};

/**
 * serves a memory region, at most max_read bytes per call.
 */
class MemReader : public BlockReader
{
public:
    MemReader(const uint8_t* data, size_t len, size_t max_read)
        : _data(data)
        , _len(len)
        , _max_read(max_read)
        , _pos(0)
    {
        if (!_max_read) {
            throw ConfigError("MemReader: max_read must be greater than zero");
        }
    }

    virtual size_t read_some(uint8_t* buf, size_t len);

private:
    const uint8_t* const _data;
    const size_t _len;
    const size_t _max_read;
    size_t _pos;
};

} // namespace chunkbench
