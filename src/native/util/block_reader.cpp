/* Copyright (C) 2016 NooBaa */
#include "block_reader.h"

namespace chunkbench
{

DBG_INIT_VAR(DEBUG_LEVEL);

size_t
BlockReader::read_block(uint8_t* buf, size_t len)
{
    size_t total = 0;
    while (total < len) {
        const size_t n = read_some(buf + total, len - total);
        if (n == 0) {
            break;
        }
        total += n;
    }
    DBG4("BlockReader::read_block: " << DVAL(len) << DVAL(total));
    return total;
}

size_t
FdReader::read_some(uint8_t* buf, size_t len)
{
    while (true) {
        const ssize_t n = ::read(_fd, buf, len);
        if (n >= 0) {
            return size_t(n);
        }
        if (errno == EINTR) {
            DBG2("FdReader::read_some: interrupted, retrying " << DVAL(_fd));
            continue;
        }
        const int err = errno;
        throw IoError(XSTR() << "read failed " << DVAL(_fd) << strerror(err) << " (" << err << ")");
    }
}

size_t
MemReader::read_some(uint8_t* buf, size_t len)
{
    const size_t n = std::min(std::min(len, _max_read), _len - _pos);
    if (n > 0) {
        memcpy(buf, _data + _pos, n);
        _pos += n;
    }
    return n;
}

} // namespace chunkbench
