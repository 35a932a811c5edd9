#include <gtest/gtest.h>

#include "raid/ParallelStreamReader.h"
#include "tests/raid/TestStreams.h"
#include "tests/testutils.h"

#include <errno.h>
#include <unistd.h>

#include <string>
#include <vector>

using std::string;
using std::vector;
using PRAID::InputStream;
using PRAID::ParallelStreamReader;
using PRAID::praidOff_t;
using PRAID::Test::PraidTestUtils;
using PRAID::Test::StringInputStream;

class ParallelStreamReaderTest : public ::testing::Test
{
protected:
    virtual void TearDown()
    {
        for (size_t i = 0; i < mStreams.size(); i++) {
            delete mStreams[i];
        }
        mStreams.clear();
    }
    StringInputStream& Add(const string& data, size_t maxRead = 0)
    {
        StringInputStream* const s = new StringInputStream(data, maxRead);
        mStreams.push_back(s);
        mInputs.push_back(s);
        return *s;
    }
    // Expected chunk content: stream data limited to maxBytes, zero padded.
    static string Expected(const string& data, praidOff_t offset, int len,
        praidOff_t maxBytes)
    {
        string ret(len, 0);
        const praidOff_t end = std::min((praidOff_t)data.size(), maxBytes);
        if (offset < end) {
            const size_t n = (size_t)std::min((praidOff_t)len, end - offset);
            ret.replace(0, n, data, (size_t)offset, n);
        }
        return ret;
    }
    // Waits up to 10 seconds for every stream to reach inCount reads, then
    // gives the readers time to overshoot.
    bool WaitForReads(int inCount)
    {
        for (int i = 0; i < 1000; i++) {
            size_t k = 0;
            while (k < mStreams.size() &&
                    inCount <= mStreams[k]->GetReadCount()) {
                k++;
            }
            if (k == mStreams.size()) {
                usleep(100 * 1000);
                return true;
            }
            usleep(10 * 1000);
        }
        return false;
    }
    void ExpectReadCount(int inCount)
    {
        for (size_t i = 0; i < mStreams.size(); i++) {
            EXPECT_EQ(inCount, mStreams[i]->GetReadCount()) << "stream: " << i;
        }
    }
    void ExpectAllClosedOnce()
    {
        for (size_t i = 0; i < mStreams.size(); i++) {
            EXPECT_EQ(1, mStreams[i]->GetCloseCount()) << "stream: " << i;
        }
    }

    vector<StringInputStream*> mStreams;
    vector<InputStream*>       mInputs;
    vector<string>             mData;
};

TEST_F(ParallelStreamReaderTest, ChunksInOrderWithZeroPadding) {
    const int        chunk    = 1024;
    const praidOff_t maxBytes = 4096;
    mData.push_back(PraidTestUtils::MakeData(4096, 1));
    mData.push_back(PraidTestUtils::MakeData(2500, 2));
    mData.push_back(PraidTestUtils::MakeData(6000, 3));
    mData.push_back(string());
    mData.push_back(PraidTestUtils::MakeData(1024, 5));
    for (size_t i = 0; i < mData.size(); i++) {
        Add(mData[i], 100 + i * 37);
    }
    ParallelStreamReader reader(mInputs, chunk, 2, 1, maxBytes);
    ASSERT_EQ(0, reader.Start());
    for (int c = 0; c < 4; c++) {
        const ParallelStreamReader::ReadResult* result = 0;
        ASSERT_EQ(0, reader.GetReadResult(result));
        ASSERT_TRUE(result != 0);
        ASSERT_EQ(0, result->mStatus);
        ASSERT_EQ(c * chunk, result->mOffset);
        ASSERT_EQ(chunk, result->mLength);
        ASSERT_EQ(mData.size(), result->mBuffers.size());
        for (size_t i = 0; i < mData.size(); i++) {
            ASSERT_EQ(Expected(mData[i], c * chunk, chunk, maxBytes),
                string(result->mBuffers[i], chunk)) <<
                "chunk: " << c << " stream: " << i;
        }
    }
    const ParallelStreamReader::ReadResult* result = 0;
    ASSERT_EQ(-EIO, reader.GetReadResult(result));
    ASSERT_TRUE(result == 0);
    reader.Shutdown();
    ExpectAllClosedOnce();
}

TEST_F(ParallelStreamReaderTest, MoreStreamsThanReaders) {
    const int        chunk    = 512;
    const praidOff_t maxBytes = 512 * 6;
    for (int i = 0; i < 10; i++) {
        mData.push_back(PraidTestUtils::MakeData(maxBytes - i * 100, 20 + i));
    }
    for (size_t i = 0; i < mData.size(); i++) {
        Add(mData[i], 300);
    }
    ParallelStreamReader reader(mInputs, chunk, 3, 3, maxBytes);
    ASSERT_EQ(0, reader.Start());
    for (int c = 0; c < 6; c++) {
        const ParallelStreamReader::ReadResult* result = 0;
        ASSERT_EQ(0, reader.GetReadResult(result));
        ASSERT_EQ(c * chunk, result->mOffset);
        for (size_t i = 0; i < mData.size(); i++) {
            ASSERT_EQ(Expected(mData[i], c * chunk, chunk, maxBytes),
                string(result->mBuffers[i], chunk));
        }
    }
    const ParallelStreamReader::ReadResult* result = 0;
    ASSERT_EQ(-EIO, reader.GetReadResult(result));
    reader.Shutdown();
    ExpectAllClosedOnce();
}

TEST_F(ParallelStreamReaderTest, ReadFailureIsCarriedAndStopsReading) {
    const int chunk = 1000;
    mData.push_back(PraidTestUtils::MakeData(5000, 1));
    mData.push_back(PraidTestUtils::MakeData(5000, 2));
    mData.push_back(PraidTestUtils::MakeData(5000, 3));
    for (size_t i = 0; i < mData.size(); i++) {
        Add(mData[i]);
    }
    mStreams[1]->SetFailure(2000, EIO);
    ParallelStreamReader reader(mInputs, chunk, 4, 1, 5000);
    ASSERT_EQ(0, reader.Start());
    const ParallelStreamReader::ReadResult* result = 0;
    for (int c = 0; c < 2; c++) {
        ASSERT_EQ(0, reader.GetReadResult(result));
        ASSERT_EQ(0, result->mStatus);
        ASSERT_EQ(c * chunk, result->mOffset);
    }
    ASSERT_EQ(0, reader.GetReadResult(result));
    ASSERT_EQ(2 * chunk, result->mOffset);
    ASSERT_EQ(-EIO, result->mStatus);
    ASSERT_EQ(1, result->mFailedIndex);
    ASSERT_EQ(-EIO, reader.GetReadResult(result));
    reader.Shutdown();
    reader.Shutdown();
    ExpectAllClosedOnce();
    // No reads past the failed chunk.
    for (size_t i = 0; i < mStreams.size(); i++) {
        ASSERT_GE(3, mStreams[i]->GetReadCount()) << "stream: " << i;
    }
}

TEST_F(ParallelStreamReaderTest, InterruptIsSticky) {
    mData.push_back(PraidTestUtils::MakeData(4000, 1));
    mData.push_back(PraidTestUtils::MakeData(4000, 2));
    Add(mData[0]);
    Add(mData[1]);
    ParallelStreamReader reader(mInputs, 1000, 2, 1, 4000);
    ASSERT_EQ(0, reader.Start());
    reader.Interrupt();
    const ParallelStreamReader::ReadResult* result = 0;
    ASSERT_EQ(-EINTR, reader.GetReadResult(result));
    ASSERT_EQ(-EINTR, reader.GetReadResult(result));
    ASSERT_TRUE(result == 0);
    reader.Shutdown();
    ExpectAllClosedOnce();
}

TEST_F(ParallelStreamReaderTest, ShutdownAfterPartialConsumption) {
    mData.push_back(PraidTestUtils::MakeData(8000, 1));
    mData.push_back(PraidTestUtils::MakeData(8000, 2));
    Add(mData[0], 333);
    Add(mData[1], 444);
    {
        ParallelStreamReader reader(mInputs, 1000, 1, 1, 8000);
        const ParallelStreamReader::ReadResult* result = 0;
        ASSERT_EQ(-EIO, reader.GetReadResult(result));
        ASSERT_EQ(0, reader.Start());
        ASSERT_EQ(0, reader.GetReadResult(result));
        ASSERT_EQ(mData[0].substr(0, 1000), string(result->mBuffers[0], 1000));
        reader.Shutdown();
        ASSERT_EQ(-EIO, reader.GetReadResult(result));
        reader.Shutdown();
    }
    ExpectAllClosedOnce();
}

TEST_F(ParallelStreamReaderTest, DestructorShutsDown) {
    mData.push_back(PraidTestUtils::MakeData(3000, 1));
    Add(mData[0]);
    {
        ParallelStreamReader reader(mInputs, 1000, 4, 2, 3000);
        ASSERT_EQ(0, reader.Start());
    }
    ExpectAllClosedOnce();
}

TEST_F(ParallelStreamReaderTest, ReadAheadBoundedByQueueCapacity) {
    const int capacities[] = { 1, 3 };
    for (size_t c = 0; c < sizeof(capacities) / sizeof(capacities[0]); c++) {
        const int capacity = capacities[c];
        TearDown();
        mInputs.clear();
        mData.clear();
        mData.push_back(PraidTestUtils::MakeData(10000, 1));
        mData.push_back(PraidTestUtils::MakeData(10000, 2));
        Add(mData[0]);
        Add(mData[1]);
        ParallelStreamReader reader(mInputs, 1000, 2, capacity, 10000);
        ASSERT_EQ(0, reader.Start());
        // Without consumption reading stops once the queue is full.
        ASSERT_TRUE(WaitForReads(capacity)) << "capacity: " << capacity;
        ExpectReadCount(capacity);
        const ParallelStreamReader::ReadResult* result = 0;
        ASSERT_EQ(0, reader.GetReadResult(result));
        ASSERT_EQ(0, result->mOffset);
        // The next chunk is read while the consumer holds this one.
        ASSERT_TRUE(WaitForReads(capacity + 1)) << "capacity: " << capacity;
        ExpectReadCount(capacity + 1);
        ASSERT_EQ(mData[1].substr(0, 1000), string(result->mBuffers[1], 1000));
        reader.Shutdown();
        ExpectAllClosedOnce();
    }
}
