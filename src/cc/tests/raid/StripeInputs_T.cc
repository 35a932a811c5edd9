#include <gtest/gtest.h>

#include "raid/RaidStreams.h"
#include "raid/StripeInputs.h"
#include "tests/MemFileSystem.h"
#include "tests/testutils.h"

#include <errno.h>

#include <string>
#include <vector>

using std::string;
using std::vector;
using PRAID::InputStream;
using PRAID::RaidUtils;
using PRAID::StripeInputs;
using PRAID::Test::MemFileSystem;
using PRAID::Test::PraidTestUtils;

class StripeInputsTest : public ::testing::Test
{
protected:
    StripeInputsTest()
        : mFs(1000),
          mData(PraidTestUtils::MakeData(2500, 7))
    {
        mFs.PutFile("/src/file", mData);
    }
    string ReadAll(InputStream& in, size_t len)
    {
        string buf(len + 100, 'x');
        const ssize_t n = RaidUtils::ReadTillEnd(in, &buf[0], buf.size());
        EXPECT_LE(0, n);
        buf.resize(n < 0 ? 0 : (size_t)n);
        return buf;
    }

    MemFileSystem mFs;
    const string  mData;
};

TEST_F(StripeInputsTest, RealAndZeroStreams) {
    StripeInputs inputs;
    ASSERT_EQ(0, inputs.Open(mFs, "/src/file", 0, 2, 2500, 1000, 1024));
    ASSERT_EQ(2u, inputs.Get().size());
    ASSERT_EQ(0, inputs.GetZeroStreamCount());
    // Real streams start at the block offset and run to the end of file.
    ASSERT_EQ(mData, ReadAll(*inputs.Get()[0], 2500));
    ASSERT_EQ(mData.substr(1000), ReadAll(*inputs.Get()[1], 1500));
    ASSERT_EQ(0, inputs.Close());

    ASSERT_EQ(0, inputs.Open(mFs, "/src/file", 2000, 2, 2500, 1000, 1024));
    ASSERT_EQ(2u, inputs.Get().size());
    ASSERT_EQ(1, inputs.GetZeroStreamCount());
    ASSERT_EQ(mData.substr(2000), ReadAll(*inputs.Get()[0], 500));
    ASSERT_EQ(string(1000, 0), ReadAll(*inputs.Get()[1], 1000));
    inputs.Clear();
    ASSERT_TRUE(inputs.Get().empty());
    ASSERT_EQ(0, mFs.GetOpenFdCount());
    ASSERT_EQ(0, mFs.GetBadCloseCount());
    ASSERT_EQ(3, mFs.GetOpenCount("/src/file"));
    ASSERT_EQ(3, mFs.GetCloseCount("/src/file"));
}

TEST_F(StripeInputsTest, AllZeroBeyondEndOfFile) {
    StripeInputs inputs;
    ASSERT_EQ(0, inputs.Open(mFs, "/src/file", 6000, 3, 2500, 1000, 1024));
    ASSERT_EQ(3, inputs.GetZeroStreamCount());
    ASSERT_EQ(0, mFs.GetOpenCount("/src/file"));
}

TEST_F(StripeInputsTest, OpenFailureReleasesOpenedStreams) {
    mFs.SetOpenFailure("/src/file", 2, EACCES);
    StripeInputs inputs;
    ASSERT_EQ(-EACCES, inputs.Open(mFs, "/src/file", 0, 3, 2500, 1000, 1024));
    ASSERT_TRUE(inputs.Get().empty());
    ASSERT_EQ(0, inputs.GetZeroStreamCount());
    ASSERT_EQ(0, mFs.GetOpenFdCount());
    ASSERT_EQ(1, mFs.GetCloseCount("/src/file"));

    StripeInputs missing;
    ASSERT_EQ(-ENOENT, missing.Open(mFs, "/src/none", 0, 2, 2500, 1000, 1024));
    ASSERT_TRUE(missing.Get().empty());
}

TEST_F(StripeInputsTest, DestructorClosesOnce) {
    {
        StripeInputs inputs;
        ASSERT_EQ(0, inputs.Open(mFs, "/src/file", 0, 2, 2500, 1000, 1024));
        ASSERT_EQ(0, inputs.Close());
        ASSERT_EQ(0, inputs.Close());
        ASSERT_EQ(0, mFs.GetOpenFdCount());
    }
    ASSERT_EQ(0, mFs.GetBadCloseCount());
    ASSERT_EQ(2, mFs.GetCloseCount("/src/file"));
}
