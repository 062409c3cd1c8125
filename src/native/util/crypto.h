/* Copyright (C) 2016 NooBaa */
#pragma once

#include <openssl/evp.h>

#include "buf.h"
#include "common.h"

namespace chunkbench
{

class Crypto
{
public:
    /**
     * digest of a memory region using an openssl digest name (e.g. "sha256").
     * throws ConfigError on an unknown digest name.
     */
    static inline Buf
    digest(const void* data, int len, const char* digest_name)
    {
        const EVP_MD* md = EVP_get_digestbyname(digest_name);
        if (!md) {
            throw ConfigError(XSTR() << "Unknown digest " << DVAL(digest_name));
        }
        Buf digest(EVP_MD_size(md));
        unsigned int digest_len = 0;
        EVP_MD_CTX* ctx_md = EVP_MD_CTX_new();
        MUST1(ctx_md);
        MUST1(EVP_DigestInit_ex(ctx_md, md, NULL));
        MUST1(EVP_DigestUpdate(ctx_md, data, len));
        MUST1(EVP_DigestFinal_ex(ctx_md, digest.data(), &digest_len));
        EVP_MD_CTX_free(ctx_md);
        digest.slice(0, digest_len);
        return digest;
    }

    static inline Buf
    digest(const Buf& buf, const char* digest_name)
    {
        return digest(buf.data(), buf.length(), digest_name);
    }
};

} // namespace chunkbench
