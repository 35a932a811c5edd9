#include <gtest/gtest.h>

#include "raid/ParityBuffers.h"

using PRAID::ParityBuffers;
using PRAID::praidOff_t;

TEST(ParityBuffersTest, ChunkSizeHeuristic) {
    const int kMiB = 1 << 20;
    // Divides the block, kept.
    ASSERT_EQ(kMiB, ParityBuffers::ComputeChunkSize(kMiB, praidOff_t(64) << 20));
    // Larger than the block, clamped.
    ASSERT_EQ(1000, ParityBuffers::ComputeChunkSize(kMiB, 1000));
    ASSERT_EQ(200000, ParityBuffers::ComputeChunkSize(kMiB, 200000));
    // blockSize / 256 capped at 1 MiB.
    ASSERT_EQ(kMiB, ParityBuffers::ComputeChunkSize(1000, praidOff_t(1) << 29));
    // Lower bound 1024.
    ASSERT_EQ(1024, ParityBuffers::ComputeChunkSize(4096, 256000));
    // Heuristic value does not tile the block, largest divisor below it.
    ASSERT_EQ(1000, ParityBuffers::ComputeChunkSize(1024, 3000));
    ASSERT_EQ(1, ParityBuffers::ComputeChunkSize(kMiB, 1));
}

TEST(ParityBuffersTest, ChunkSizeDividesBlock) {
    const praidOff_t blocks[] = {
        1, 7, 1000, 1024, 2500, 3000, 4097, 65536, 100003, 1 << 20,
        (1 << 20) + 1, 3 << 20, praidOff_t(64) << 20, 1000000007
    };
    const int chunks[] = { 1, 1000, 1024, 4096, 1 << 20 };
    for (size_t i = 0; i < sizeof(blocks) / sizeof(blocks[0]); i++) {
        for (size_t k = 0; k < sizeof(chunks) / sizeof(chunks[0]); k++) {
            const int c = ParityBuffers::ComputeChunkSize(chunks[k], blocks[i]);
            ASSERT_LT(0, c);
            ASSERT_LE(c, blocks[i]);
            ASSERT_EQ(0, blocks[i] % c) << "block: " << blocks[i] <<
                " chunk: " << chunks[k];
            const int a = ParityBuffers::ComputeChunkSize(
                chunks[k], blocks[i], 8);
            ASSERT_LT(0, a);
            ASSERT_LE(a, blocks[i]);
            ASSERT_EQ(0, blocks[i] % a);
            if (blocks[i] % 8 == 0) {
                ASSERT_EQ(0, a % 8) << "block: " << blocks[i] <<
                    " chunk: " << chunks[k];
            }
        }
    }
}

TEST(ParityBuffersTest, ChunkSizeHonorsAlignment) {
    // 2008 = 8 * 251
    ASSERT_EQ(1004, ParityBuffers::ComputeChunkSize(1024, 2008, 1));
    ASSERT_EQ(8, ParityBuffers::ComputeChunkSize(1024, 2008, 8));
    ASSERT_EQ(1500, ParityBuffers::ComputeChunkSize(1500, 3000, 1));
    ASSERT_EQ(1000, ParityBuffers::ComputeChunkSize(1500, 3000, 8));
    ASSERT_EQ(1 << 20,
        ParityBuffers::ComputeChunkSize(1 << 20, praidOff_t(64) << 20, 8));
    // Block size not a multiple of the alignment, alignment is ignored.
    ASSERT_EQ(1500, ParityBuffers::ComputeChunkSize(1 << 20, 1500, 8));
    ASSERT_EQ(750, ParityBuffers::ComputeChunkSize(1024, 1500, 8));
}

TEST(ParityBuffersTest, ConfigureWithAlignment) {
    ParityBuffers buffers(2, 1024);
    ASSERT_TRUE(buffers.Configure(2008));
    ASSERT_EQ(1004, buffers.GetChunkSize());
    ASSERT_TRUE(buffers.Configure(2008, 8));
    ASSERT_EQ(8, buffers.GetChunkSize());
    ASSERT_FALSE(buffers.Configure(2008, 8));
    ASSERT_EQ(2, buffers.GetAllocationCount());
}

TEST(ParityBuffersTest, ConfigureIsIdempotent) {
    ParityBuffers buffers(3, 1 << 20);
    ASSERT_EQ(3, buffers.GetParityLength());
    ASSERT_EQ(0, buffers.GetAllocationCount());

    ASSERT_TRUE(buffers.Configure(praidOff_t(64) << 20));
    ASSERT_EQ(1 << 20, buffers.GetChunkSize());
    ASSERT_EQ(1, buffers.GetAllocationCount());
    char* const first = buffers.GetBuffer(0);
    ASSERT_TRUE(first != 0);

    ASSERT_FALSE(buffers.Configure(praidOff_t(64) << 20));
    ASSERT_FALSE(buffers.Configure(praidOff_t(32) << 20));
    ASSERT_EQ(1, buffers.GetAllocationCount());
    ASSERT_EQ(first, buffers.GetBuffer(0));

    ASSERT_TRUE(buffers.Configure(1000));
    ASSERT_EQ(1000, buffers.GetChunkSize());
    ASSERT_EQ(2, buffers.GetAllocationCount());
    ASSERT_FALSE(buffers.Configure(1000));
    ASSERT_EQ(2, buffers.GetAllocationCount());
    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(buffers.GetBuffer(i) != 0);
    }
}
