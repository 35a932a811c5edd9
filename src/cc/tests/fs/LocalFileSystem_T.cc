#include <gtest/gtest.h>

#include "common/Properties.h"
#include "fs/FileSystem.h"
#include "tests/testutils.h"

#include <boost/scoped_ptr.hpp>

#include <errno.h>
#include <string>

using std::string;
using PRAID::FileSystem;
using PRAID::Properties;
using PRAID::Test::PraidTestUtils;

class LocalFileSystemTest : public ::testing::Test
{
protected:
    virtual void SetUp()
    {
        mDir = PraidTestUtils::CreateTempDirectory();
        Properties props;
        props.setValue("praid.localfs.blockSize", 4096);
        mFs.reset(FileSystem::CreateLocal(&props));
    }
    virtual void TearDown()
    {
        PraidTestUtils::RemoveForcefully(mDir);
    }
    int WriteFile(const string& name, const string& data, bool overwrite)
    {
        const int fd = mFs->Create(name, overwrite, 1 << 10, 3, 4096);
        if (fd < 0) {
            return fd;
        }
        const ssize_t n = mFs->Write(fd, data.data(), data.size());
        const int status = mFs->Close(fd);
        return (n < 0 ? (int)n : status);
    }

    string                        mDir;
    boost::scoped_ptr<FileSystem> mFs;
};

TEST_F(LocalFileSystemTest, CreateReadStat) {
    const string name = mDir + "/a";
    const string data = PraidTestUtils::MakeData(10000, 1);
    ASSERT_EQ(0, WriteFile(name, data, false));
    ASSERT_EQ(-EEXIST, WriteFile(name, data, false));
    ASSERT_EQ(1, mFs->Exists(name));
    ASSERT_EQ(0, mFs->Exists(name + ".none"));

    FileSystem::StatBuf st;
    ASSERT_EQ(0, mFs->Stat(name, st));
    ASSERT_EQ(10000, st.mLength);
    ASSERT_EQ(4096, st.mBlockSize);
    ASSERT_EQ(1, st.mReplication);
    ASSERT_FALSE(st.mDirFlag);

    const int fd = mFs->Open(name, 5000, 1 << 10);
    ASSERT_LE(0, fd);
    string buf(6000, 0);
    ASSERT_EQ(5000, mFs->Read(fd, &buf[0], buf.size()));
    ASSERT_EQ(data.substr(5000), buf.substr(0, 5000));
    ASSERT_EQ(0, mFs->Read(fd, &buf[0], buf.size()));
    ASSERT_EQ(0, mFs->Close(fd));

    ASSERT_EQ(-ENOENT, mFs->Open(name + ".none", 0, 0));
    ASSERT_EQ(-ENOENT, mFs->Stat(name + ".none", st));
}

TEST_F(LocalFileSystemTest, MkdirsRenameRemove) {
    const string dir = mDir + "/x//y/z/";
    ASSERT_EQ(0, mFs->Mkdirs(dir));
    ASSERT_EQ(0, mFs->Mkdirs(dir));
    ASSERT_TRUE(PraidTestUtils::IsDirectory(mDir + "/x/y/z"));

    const string src = mDir + "/x/y/z/f";
    ASSERT_EQ(0, WriteFile(src, "abc", true));
    ASSERT_EQ(-ENOTDIR, mFs->Mkdirs(src + "/sub"));
    ASSERT_EQ(0, mFs->SetReplication(src, 1));
    ASSERT_EQ(-EINVAL, mFs->SetReplication(src, 0));
    ASSERT_EQ(0, mFs->Rename(src, mDir + "/x/g"));
    ASSERT_EQ(0, mFs->Exists(src));
    ASSERT_TRUE(PraidTestUtils::IsFile(mDir + "/x/g"));

    ASSERT_GT(0, mFs->Remove(mDir + "/x", false));
    ASSERT_EQ(0, mFs->Remove(mDir + "/x", true));
    ASSERT_FALSE(PraidTestUtils::FileExists(mDir + "/x"));
    ASSERT_EQ(-ENOENT, mFs->Remove(mDir + "/x", false));
}

TEST_F(LocalFileSystemTest, DefaultBlockSize) {
    boost::scoped_ptr<FileSystem> fs(FileSystem::CreateLocal());
    FileSystem::StatBuf st;
    ASSERT_EQ(0, fs->Stat(mDir, st));
    ASSERT_TRUE(st.mDirFlag);
    ASSERT_EQ(PRAID::kPraidDefaultBlockSize, st.mBlockSize);
    ASSERT_EQ(string("file://"), fs->GetUri());
}
