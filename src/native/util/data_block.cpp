/* Copyright (C) 2016 NooBaa */
#include "data_block.h"

#include <random>

namespace chunkbench
{

Buf
generate_data_block(int size, uint64_t seed)
{
    Buf buf(size);
    std::mt19937_64 rng(seed);
    int pos = 0;
    while (pos < size) {
        uint64_t word = rng();
        const int n = std::min(size - pos, 8);
        for (int i = 0; i < n; ++i) {
            buf[pos++] = uint8_t(word);
            word >>= 8;
        }
    }
    return buf;
}

} // namespace chunkbench
