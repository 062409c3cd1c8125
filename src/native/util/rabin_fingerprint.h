/* Copyright (C) 2016 NooBaa */
#pragma once

#include "common.h"

namespace chunkbench
{

/**
 *
 * RABIN FINGERPRINT
 *
 * rolling polynomial hash over a sliding window of bytes,
 * computed modulo 2^40 with a prime multiplier.
 * constants are the ones used by pcompress (https://github.com/moinakg/pcompress).
 *
 */
class RabinFingerprint
{
public:
    typedef uint64_t T;

    static const T PRIME = 153191;
    static const T MASK = 0xffffffffffULL;
    // irreducible polynomial for the rabin modulus
    static const T FP_POLY = 0xbfe6b8a5bf378d83ULL;

    explicit RabinFingerprint(int window_len)
    {
        // the out_map keeps the value of each byte once it falls off the sliding window
        // which is essentially: byte * PRIME^window (mod 2^40)
        T poly_pow = 1;
        for (int j = 0; j < window_len; ++j) {
            poly_pow = (poly_pow * PRIME) & MASK;
        }
        for (int i = 0; i < 256; ++i) {
            out_map[i] = (T(i) * poly_pow) & MASK;
        }

        // the ir table folds the irreducible polynomial window_len times.
        // the fold does not depend on the byte value so every entry ends up equal,
        // which keeps the checksum a function of the window bytes only.
        for (int i = 0; i < 256; ++i) {
            T a = 1;
            for (int j = 0; j < window_len; ++j) {
                if (a & FP_POLY) {
                    a = (a + a * PRIME) & MASK;
                } else {
                    a = (a * PRIME) & MASK;
                }
            }
            ir[i] = a;
        }
    }

    inline T update(T hash, uint8_t byte_in, uint8_t byte_out) const
    {
        // unsigned wrap around is fine since the result is masked back to 40 bits
        return (((hash * PRIME) & MASK) + byte_in - out_map[byte_out]) & MASK;
    }

    inline T checksum(T hash, uint8_t byte_out) const
    {
        return hash ^ ir[byte_out];
    }

    T out_map[256];
    T ir[256];
};

} // namespace chunkbench
