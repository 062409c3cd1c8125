/**
 * Usage: chunk_speed [fixed|rabin] [total_mb] [block_kb] [digest_name]
 *
 * Chunks a generated data block in one pass and through the segmenter,
 * checks that both agree and prints the throughput.
 */

#include <chrono>
#include <stdlib.h>
#include <vector>

#include "../native/chunk/chunker_config.h"
#include "../native/chunk/segmenter.h"
#include "../native/util/crypto.h"
#include "../native/util/data_block.h"

using namespace chunkbench;

DBG_INIT_VAR(DEBUG_LEVEL);

static const uint64_t SEED = 0xDEADBEEFCAFEF00DULL;

static double
mb_per_sec(uint64_t bytes, std::chrono::steady_clock::duration took)
{
    const double secs = std::chrono::duration<double>(took).count();
    return secs > 0 ? double(bytes) / MB / secs : 0;
}

int
main(int ac, char** av)
{
    ChunkerConfig config;
    config.algo = ac > 1 ? av[1] : "rabin";
    const int total_mb = ac > 2 ? atoi(av[2]) : 40;
    const int block_kb = ac > 3 ? atoi(av[3]) : 20 * 1024;
    const char* digest_name = ac > 4 ? av[4] : NULL;

    if (total_mb <= 0 || total_mb > 1024 || block_kb <= 0) {
        std::cerr << "Usage: " << av[0] << " [fixed|rabin] [total_mb] [block_kb] [digest_name]" << std::endl;
        return 1;
    }

    try {
        std::unique_ptr<ChunkerFactory> factory = config.create_factory();
        const Buf data = generate_data_block(total_mb * int(MB), SEED);

        auto start = std::chrono::steady_clock::now();
        std::unique_ptr<Chunker> chunker = factory->create(data.data(), data.length());
        const std::vector<Chunk> chunks = chunker->collect();
        auto took = std::chrono::steady_clock::now() - start;
        LOG(factory->name() << " one pass: " << chunks.size() << " chunks "
                            << mb_per_sec(data.length(), took) << " MB/s");

        start = std::chrono::steady_clock::now();
        MemReader reader(data.data(), data.length(), size_t(block_kb) * KB);
        Segmenter segmenter(*factory, reader, size_t(block_kb) * KB);
        Segment segment;
        size_t index = 0;
        size_t mismatches = 0;
        while (segmenter.next(segment)) {
            if (index >= chunks.size() || chunks[index] != segment.chunk) {
                mismatches++;
            }
            if (digest_name) {
                Buf digest = Crypto::digest(segment.data, digest_name);
                DBG1(segment.chunk << " " << digest_name << " " << digest.hex());
            }
            if (DBG_VISIBLE(5)) {
                Buf::hexdump(segment.data.data(), std::min(segment.data.length(), 64), "segment");
            }
            index++;
        }
        took = std::chrono::steady_clock::now() - start;
        LOG(factory->name() << " segmented: " << index << " chunks in "
                            << segmenter.num_passes() << " passes "
                            << mb_per_sec(segmenter.total_read(), took) << " MB/s"
                            << (digest_name ? " with " : "") << (digest_name ? digest_name : ""));

        if (mismatches || index != chunks.size()) {
            std::cerr << "Segmented chunks differ from one pass chunks "
                      << DVAL(mismatches) << DVAL(index) << DVAL(chunks.size()) << std::endl;
            return 2;
        }
    } catch (const Exception& err) {
        std::cerr << err << std::endl;
        return 1;
    }
    return 0;
}
