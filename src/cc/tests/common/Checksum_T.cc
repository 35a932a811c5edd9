#include <gtest/gtest.h>

#include "common/checksum.h"
#include "common/praidtypes.h"
#include "tests/testutils.h"

#include <errno.h>

#include <algorithm>
#include <string>

using std::string;
using PRAID::ComputeBlockChecksum;
using PRAID::kPraidNullChecksum;
using PRAID::Test::PraidTestUtils;

TEST(ChecksumTest, KnownValues) {
    ASSERT_EQ(kPraidNullChecksum, ComputeBlockChecksum("", 0));
    // Adler-32 of "Wikipedia".
    ASSERT_EQ(0x11E60398u, ComputeBlockChecksum("Wikipedia", 9));
}

TEST(ChecksumTest, Incremental) {
    const string data = PraidTestUtils::MakeData(3 * 65536 + 17, 5);
    const uint32_t whole = ComputeBlockChecksum(data.data(), data.size());

    const size_t split = 1000;
    uint32_t part = ComputeBlockChecksum(data.data(), split);
    part = ComputeBlockChecksum(part, data.data() + split, data.size() - split);
    ASSERT_EQ(whole, part);

    uint32_t chunked = kPraidNullChecksum;
    for (size_t pos = 0; pos < data.size(); pos += 4096) {
        chunked = ComputeBlockChecksum(chunked, data.data() + pos,
            std::min(data.size() - pos, size_t(4096)));
    }
    ASSERT_EQ(whole, chunked);
}

TEST(ErrorCodeTest, ProjectCodes) {
    ASSERT_EQ(string(""), PRAID::ErrorCodeToString(0));
    ASSERT_EQ(string("parity file size mismatch"),
        PRAID::ErrorCodeToString(-PRAID::EPARITYSIZE));
    ASSERT_EQ(string("parity file rename failed"),
        PRAID::ErrorCodeToString(-PRAID::ERENAMEFAILED));
    ASSERT_FALSE(PRAID::ErrorCodeToString(-ENOENT).empty());
}
