#include <gtest/gtest.h>

#include "common/checksum.h"
#include "raid/RaidStreams.h"
#include "tests/MemFileSystem.h"
#include "tests/raid/TestStreams.h"
#include "tests/testutils.h"

#include <boost/scoped_ptr.hpp>

#include <errno.h>

#include <string>
#include <vector>

using std::string;
using std::vector;
using PRAID::ChecksumOutputStream;
using PRAID::ComputeBlockChecksum;
using PRAID::FsInputStream;
using PRAID::FsOutputStream;
using PRAID::InputStream;
using PRAID::NullOutputStream;
using PRAID::OutputStream;
using PRAID::RaidUtils;
using PRAID::ZeroInputStream;
using PRAID::Test::MemFileSystem;
using PRAID::Test::PraidTestUtils;
using PRAID::Test::StringInputStream;
using PRAID::Test::StringOutputStream;

TEST(RaidStreamsTest, ZeroInputStream) {
    ZeroInputStream in(2500);
    string buf(1000, 'x');
    ASSERT_EQ(1000, in.Read(&buf[0], buf.size()));
    ASSERT_EQ(string(1000, 0), buf);
    ASSERT_EQ(1000, in.Read(&buf[0], buf.size()));
    buf.assign(1000, 'x');
    ASSERT_EQ(500, in.Read(&buf[0], buf.size()));
    ASSERT_EQ(string(500, 0), buf.substr(0, 500));
    ASSERT_EQ(string(500, 'x'), buf.substr(500));
    ASSERT_EQ(0, in.Read(&buf[0], buf.size()));
    ASSERT_EQ(0, in.Close());
    ASSERT_EQ(0, in.Close());
    ASSERT_EQ(-EBADF, in.Read(&buf[0], buf.size()));
}

TEST(RaidStreamsTest, NullAndChecksumOutputStreams) {
    NullOutputStream null;
    ASSERT_EQ(0, null.Write("abc", 3));
    ASSERT_EQ(-EFAULT, null.Write(0, 3));
    ASSERT_EQ(0, null.Write(0, 0));
    ASSERT_EQ(3, null.GetWrittenCount());

    StringOutputStream target;
    const string data = PraidTestUtils::MakeData(5000, 3);
    {
        ChecksumOutputStream ck(target);
        ASSERT_EQ(0, ck.Write(data.data(), 1234));
        ASSERT_EQ(0, ck.Write(data.data() + 1234, data.size() - 1234));
        ASSERT_EQ(0, ck.Close());
        ASSERT_EQ(0, target.GetCloseCount());
        ASSERT_EQ(ComputeBlockChecksum(data.data(), data.size()),
            ck.GetChecksum());
        ASSERT_EQ((PRAID::praidOff_t)data.size(), ck.GetWrittenCount());
    }
    ASSERT_EQ(data, target.GetData());

    StringOutputStream failing;
    failing.SetWriteFailure(1);
    ChecksumOutputStream ck(failing);
    ASSERT_EQ(-EIO, ck.Write("abc", 3));
    ASSERT_EQ(0, ck.GetWrittenCount());
    ASSERT_EQ(PRAID::kPraidNullChecksum, ck.GetChecksum());
}

TEST(RaidStreamsTest, ReadTillEndZeroFills) {
    StringInputStream in("abcdefg", 2);
    char buf[10];
    memset(buf, 'x', sizeof(buf));
    ASSERT_EQ(5, RaidUtils::ReadTillEnd(in, buf, 5));
    ASSERT_EQ(string("abcde"), string(buf, 5));
    ASSERT_EQ(2, RaidUtils::ReadTillEnd(in, buf, sizeof(buf)));
    ASSERT_EQ(string("fg"), string(buf, 2));
    ASSERT_EQ(string(8, 0), string(buf + 2, 8));

    StringInputStream failing("abcdefg", 3);
    failing.SetFailure(4, EIO);
    ASSERT_EQ(-EIO, RaidUtils::ReadTillEnd(failing, buf, sizeof(buf)));
}

TEST(RaidStreamsTest, CopyBytes) {
    const string data = PraidTestUtils::MakeData(10000, 4);
    char buf[777];
    {
        StringInputStream in(data, 500);
        StringOutputStream out;
        ASSERT_EQ(0, RaidUtils::CopyBytes(in, out, buf, sizeof(buf), 9000));
        ASSERT_EQ(data.substr(0, 9000), out.GetData());
    }
    {
        StringInputStream in(data);
        StringOutputStream out;
        ASSERT_EQ(-EIO, RaidUtils::CopyBytes(in, out, buf, sizeof(buf), 10001));
        ASSERT_EQ(data, out.GetData());
    }
    {
        StringInputStream in(data);
        StringOutputStream out;
        out.SetWriteFailure(2);
        ASSERT_EQ(-EIO, RaidUtils::CopyBytes(in, out, buf, sizeof(buf), 5000));
    }
    {
        StringInputStream in(data);
        in.SetFailure(1000, ENXIO);
        StringOutputStream out;
        ASSERT_EQ(-ENXIO, RaidUtils::CopyBytes(in, out, buf, sizeof(buf), 5000));
    }
}

namespace
{
class FailingCloseStream : public StringOutputStream
{
public:
    FailingCloseStream(int status)
        : StringOutputStream(),
          mStatus(status)
        {}
    virtual int Close()
    {
        StringOutputStream::Close();
        return mStatus;
    }
private:
    const int mStatus;
};
}

TEST(RaidStreamsTest, CloseStreamsReturnsFirstError) {
    StringOutputStream a;
    FailingCloseStream b(-ENOSPC);
    FailingCloseStream c(-EIO);
    vector<OutputStream*> streams;
    streams.push_back(&a);
    streams.push_back(0);
    streams.push_back(&b);
    streams.push_back(&c);
    ASSERT_EQ(-ENOSPC, RaidUtils::CloseStreams(streams));
    ASSERT_EQ(1, a.GetCloseCount());
    ASSERT_EQ(1, b.GetCloseCount());
    ASSERT_EQ(1, c.GetCloseCount());
}

TEST(RaidStreamsTest, FileSystemStreamsCloseOnce) {
    MemFileSystem fs;
    OutputStream* outPtr = 0;
    ASSERT_EQ(-ENOENT, FsOutputStream::Create(
        fs, "/d/f", false, 1024, 3, 1024, outPtr));
    ASSERT_TRUE(outPtr == 0);
    ASSERT_EQ(0, fs.Mkdirs("/d"));
    ASSERT_EQ(0, FsOutputStream::Create(
        fs, "/d/f", false, 1024, 3, 1024, outPtr));
    {
        boost::scoped_ptr<OutputStream> out(outPtr);
        ASSERT_EQ(0, out->Write("0123456789", 10));
        ASSERT_EQ(0, out->Close());
        ASSERT_EQ(0, out->Close());
        ASSERT_EQ(-EBADF, out->Write("x", 1));
    }
    ASSERT_EQ(-EEXIST, FsOutputStream::Create(
        fs, "/d/f", false, 1024, 3, 1024, outPtr));

    InputStream* inPtr = 0;
    ASSERT_EQ(-ENOENT, FsInputStream::Open(fs, "/d/none", 0, 1024, inPtr));
    ASSERT_TRUE(inPtr == 0);
    ASSERT_EQ(0, FsInputStream::Open(fs, "/d/f", 4, 1024, inPtr));
    {
        boost::scoped_ptr<InputStream> in(inPtr);
        char buf[16];
        ASSERT_EQ(6, RaidUtils::ReadTillEnd(*in, buf, sizeof(buf)));
        ASSERT_EQ(string("456789"), string(buf, 6));
        ASSERT_EQ(1, fs.GetOpenFdCount());
    }
    ASSERT_EQ(0, fs.GetOpenFdCount());
    ASSERT_EQ(0, fs.GetBadCloseCount());
    ASSERT_EQ(2, fs.GetCloseCount("/d/f"));
}
