/* Copyright (C) 2016 NooBaa */
#include <set>
#include <string>

#include "../chunk/fixed_chunker.h"
#include "../chunk/rabin_chunker.h"
#include "../util/crypto.h"
#include "../util/data_block.h"
#include "test_util.h"

using namespace chunkbench;

static const ChunkSizeParms SMALL_PARMS(64, 256, 1024);
static const ChunkSizeParms DEFAULT_PARMS(8 * 1024, 10 * 1024, 64 * 1024);

static std::vector<Chunk>
rabin_chunks(const Buf& data, int window_size, const ChunkSizeParms& parms)
{
    RabinChunker chunker(data.data(), data.length(), window_size, parms);
    return chunker.collect();
}

static void
check_sizes(const char* what, const std::vector<Chunk>& chunks, const ChunkSizeParms& parms)
{
    for (size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& chunk = chunks[i];
        if (chunk.length > parms.max_chunk_size) {
            PANIC(what << ": chunk above max " << chunk << " " << parms);
        }
        // only the last chunk may be short
        if (i + 1 < chunks.size() && chunk.length < parms.min_chunk_size) {
            PANIC(what << ": chunk below min " << chunk << " " << parms);
        }
    }
}

static void
test_basic()
{
    const Buf data = generate_data_block(64 * 1024, 1);
    const std::vector<Chunk> chunks = rabin_chunks(data, 64, SMALL_PARMS);
    MUST1(chunks.size() > 1);
    check_partition("basic", chunks, data.length());
    check_sizes("basic", chunks, SMALL_PARMS);

    RabinChunker chunker(data.data(), data.length(), 64, SMALL_PARMS);
    MUST1(chunker.cut_mask() == 256 - 64 - 1);
    LOG("basic: " << chunks.size() << " chunks for " << data.length() << " bytes");
}

static void
test_deterministic()
{
    const Buf data = generate_data_block(256 * 1024, 2);
    const std::vector<Chunk> first = rabin_chunks(data, 32, SMALL_PARMS);
    const std::vector<Chunk> second = rabin_chunks(data, 32, SMALL_PARMS);
    MUST1(first == second);

    // same content at another address gives the same chunks
    const Buf copy = Buf::copy(data.data(), data.length());
    MUST1(rabin_chunks(copy, 32, SMALL_PARMS) == first);
}

static void
test_short_source()
{
    const Buf data = generate_data_block(50, 3);
    const std::vector<Chunk> chunks = rabin_chunks(data, 64, SMALL_PARMS);
    MUST1(chunks.size() == 1);
    MUST1(chunks[0] == Chunk(0, 50));

    RabinChunker empty(NULL, 0, 64, SMALL_PARMS);
    Chunk chunk;
    MUST1(!empty.next(chunk));
    MUST1(!empty.next(chunk));
}

static void
test_constant_data()
{
    // a zero window always matches the cut mask so zeros cut at min
    const Buf zeros(10 * 1024 + 100, 0);
    std::vector<Chunk> chunks = rabin_chunks(zeros, 16, SMALL_PARMS);
    check_partition("zeros", chunks, zeros.length());
    MUST1(chunks.size() == 162);
    for (size_t i = 0; i + 1 < chunks.size(); ++i) {
        MUST1(chunks[i].length == 64);
    }
    MUST1(chunks.back().length == 36);

    // a window of 0xff never matches so every chunk is forced at max
    const Buf ones(10 * 1024 + 100, 0xff);
    chunks = rabin_chunks(ones, 16, SMALL_PARMS);
    check_partition("ones", chunks, ones.length());
    MUST1(chunks.size() == 11);
    for (size_t i = 0; i + 1 < chunks.size(); ++i) {
        MUST1(chunks[i].length == 1024);
    }
    MUST1(chunks.back().length == 100);
}

static void
test_sizes_across_parms()
{
    const ChunkSizeParms parms_list[] = {
        SMALL_PARMS,
        ChunkSizeParms(128, 512, 2048),
        ChunkSizeParms(1024, 4096, 8192),
        DEFAULT_PARMS,
    };
    const int window_sizes[] = { 8, 16, 32, 64 };
    const int lengths[] = { 1, 63, 64, 65, 1000, 1024, 100 * 1024, 1024 * 1024 + 17 };
    uint64_t seed = 100;
    for (const ChunkSizeParms& parms : parms_list) {
        for (int window_size : window_sizes) {
            for (int len : lengths) {
                const Buf data = generate_data_block(len, seed++);
                const std::vector<Chunk> chunks = rabin_chunks(data, window_size, parms);
                check_partition("sizes", chunks, data.length());
                check_sizes("sizes", chunks, parms);
            }
        }
        LOG("sizes: ok for " << parms);
    }
}

static void
test_invalid_config()
{
    const uint8_t data[10] = { 0 };
    expect_throw<ConfigError>("window 50", [&] { RabinChunker c(data, sizeof(data), 50, SMALL_PARMS); },
        "Window size must be a power of two");
    expect_throw<ConfigError>("window 2048", [&] { RabinChunker c(data, sizeof(data), 2048, SMALL_PARMS); },
        "Window size out of valid range");
    expect_throw<ConfigError>("window 0", [&] { RabinChunker c(data, sizeof(data), 0, SMALL_PARMS); },
        "Window size out of valid range");
    expect_throw<ConfigError>("min too small", [&] {
        RabinChunker c(data, sizeof(data), 64, ChunkSizeParms(32, 256, 1024));
    }, "Min chunk size out of valid range");
    expect_throw<ConfigError>("avg not above min", [&] {
        RabinChunker c(data, sizeof(data), 64, ChunkSizeParms(512, 512, 1024));
    }, "Average chunk size should be larger than min chunk size");
    expect_throw<ConfigError>("max below min", [&] {
        RabinChunker c(data, sizeof(data), 64, ChunkSizeParms(1048576, 2097152, 1024));
    }, "Max chunk size should be larger than average chunk size");
    expect_throw<ConfigError>("max not above avg", [&] {
        RabinChunker c(data, sizeof(data), 64, ChunkSizeParms(512, 1024, 1024));
    }, "Max chunk size should be larger than average chunk size");
    expect_throw<ConfigError>("factory max below min", [] {
        RabinChunkerFactory f(64, ChunkSizeParms(1048576, 2097152, 1024));
    }, "Max chunk size should be larger than average chunk size");
    expect_throw<ConfigError>("factory window", [] { RabinChunkerFactory f(12, SMALL_PARMS); },
        "Window size must be a power of two");
}

static std::set<std::string>
chunk_digests(const Buf& data, const std::vector<Chunk>& chunks)
{
    std::set<std::string> digests;
    for (const Chunk& chunk : chunks) {
        digests.insert(Crypto::digest(data.data() + chunk.offset, int(chunk.length), "sha256").hex());
    }
    return digests;
}

static size_t
count_shared(const std::set<std::string>& a, const std::set<std::string>& b)
{
    size_t shared = 0;
    for (const std::string& digest : a) {
        if (b.count(digest)) {
            shared++;
        }
    }
    return shared;
}

static void
test_insert_keeps_boundaries()
{
    const int len = 2 * 1024 * 1024;
    const int prefix = 100;
    const Buf data = generate_data_block(len, 4);
    const Buf junk = generate_data_block(prefix, 5);
    Buf shifted(len + prefix);
    memcpy(shifted.data(), junk.data(), prefix);
    memcpy(shifted.data() + prefix, data.data(), len);

    const std::vector<Chunk> rabin_a = rabin_chunks(data, 64, DEFAULT_PARMS);
    const std::vector<Chunk> rabin_b = rabin_chunks(shifted, 64, DEFAULT_PARMS);
    const size_t rabin_shared = count_shared(chunk_digests(data, rabin_a), chunk_digests(shifted, rabin_b));

    FixedChunker fixed_a(data.data(), data.length(), 10 * 1024);
    FixedChunker fixed_b(shifted.data(), shifted.length(), 10 * 1024);
    const size_t fixed_shared = count_shared(
        chunk_digests(data, fixed_a.collect()), chunk_digests(shifted, fixed_b.collect()));

    LOG("insert: rabin shared " << rabin_shared << " of " << rabin_a.size()
                                << " fixed shared " << fixed_shared);
    MUST1(rabin_shared * 2 > rabin_a.size());
    MUST1(fixed_shared == 0);
}

int
main()
{
    test_basic();
    test_deterministic();
    test_short_source();
    test_constant_data();
    test_sizes_across_parms();
    test_invalid_config();
    test_insert_keeps_boundaries();
    LOG("rabin_chunker_test: done");
    return 0;
}
