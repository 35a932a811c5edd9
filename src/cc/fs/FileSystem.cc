//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2012/09/11
// Author: Mike Ovsiannikov
//
// Copyright 2012 Quantcast Corp.
//
// This file is part of PRAID.
//
// Licensed under the Apache License, Version 2.0
// (the "License"); you may not use this file except in compliance with
// the License. You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or
// implied. See the License for the specific language governing
// permissions and limitations under the License.
//
// \brief "Local" file system implementation.
//
//----------------------------------------------------------------------------

#include "FileSystem.h"

#include "common/MsgLogger.h"
#include "common/Properties.h"
#include "qcdio/QCUtils.h"

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>
#include <dirent.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

namespace PRAID {

using std::string;

class LocalFileSystem : public FileSystem
{
public:
    LocalFileSystem(
        praidOff_t inBlockSize)
        : FileSystem(),
          mUri("file://"),
          mBlockSize(inBlockSize)
        {}
    virtual ~LocalFileSystem()
        {}
    virtual int Open(
        const string& inFileName,
        praidOff_t    inOffset,
        int           /* inBufferSize */)
    {
        const int theFd = open(inFileName.c_str(), O_RDONLY | O_CLOEXEC);
        if (theFd < 0) {
            return RetErrno(errno);
        }
        if (0 < inOffset && lseek(theFd, inOffset, SEEK_SET) != inOffset) {
            const int theErr = RetErrno(errno);
            close(theFd);
            return theErr;
        }
        return theFd;
    }
    virtual int Create(
        const string& inFileName,
        bool          inOverwriteFlag,
        int           /* inBufferSize */,
        int16_t       /* inReplication */,
        praidOff_t    /* inBlockSize */)
    {
        return Errno(open(inFileName.c_str(),
            O_WRONLY | O_CREAT | O_CLOEXEC |
                (inOverwriteFlag ? O_TRUNC : O_EXCL),
            0644
        ));
    }
    virtual ssize_t Read(
        int    inFd,
        void*  inBufPtr,
        size_t inBufSize)
    {
        ssize_t theRet;
        while ((theRet = read(inFd, inBufPtr, inBufSize)) < 0 &&
                errno == EINTR)
            {}
        if (theRet >= 0) {
            return theRet;
        }
        return RetErrno(errno);
    }
    virtual ssize_t Write(
        int          inFd,
        const void*  inBufPtr,
        size_t       inBufSize)
    {
        const char*       thePtr = static_cast<const char*>(inBufPtr);
        const char* const theEnd = thePtr + inBufSize;
        while (thePtr < theEnd) {
            const ssize_t theRet = write(inFd, thePtr, theEnd - thePtr);
            if (theRet < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return RetErrno(errno);
            }
            thePtr += theRet;
        }
        return (ssize_t)inBufSize;
    }
    virtual int Close(
        int inFd)
    {
        return Errno(close(inFd));
    }
    virtual int Exists(
        const string& inPathName)
    {
        struct stat theStat;
        if (stat(inPathName.c_str(), &theStat) == 0) {
            return 1;
        }
        const int theErr = errno;
        return ((theErr == ENOENT || theErr == ENOTDIR) ?
            0 : RetErrno(theErr));
    }
    virtual int Remove(
        const string& inPathName,
        bool          inRecursiveFlag)
    {
        if (inRecursiveFlag) {
            struct stat theStat;
            if (lstat(inPathName.c_str(), &theStat)) {
                return RetErrno(errno);
            }
            if (S_ISDIR(theStat.st_mode)) {
                string thePath(inPathName);
                return RemoveDirSelf(thePath);
            }
        }
        return Errno(remove(inPathName.c_str()));
    }
    virtual int Mkdirs(
        const string& inPathName)
    {
        string theDirName;
        theDirName.reserve(inPathName.size());
        const char* thePtr   = inPathName.c_str();
        struct stat theStat;
        const int   kNoEntry = RetErrno(ENOENT);
        while (*thePtr) {
            if (*thePtr == '/') {
                while (thePtr[1] == '/') {
                    ++thePtr;
                }
            }
            const char* const theCurPtr = thePtr;
            if (*thePtr == '/') {
                ++thePtr;
            }
            while (*thePtr && *thePtr != '/') {
                ++thePtr;
            }
            if (theCurPtr == thePtr) {
                break;
            }
            const size_t theSize = thePtr - theCurPtr;
            theDirName.append(theCurPtr, theSize);
            if ((theSize == 1 && *theCurPtr == '.') || (theSize == 2 &&
                    theCurPtr[0] == '.' && theCurPtr[1] == '.')) {
                continue;
            }
            if (theSize == 1 && *theCurPtr == '/') {
                continue;
            }
            int theErr = Errno(stat(theDirName.c_str(), &theStat));
            if (theErr == 0) {
                if (! S_ISDIR(theStat.st_mode)) {
                    return RetErrno(ENOTDIR);
                }
            } else {
                if (theErr != kNoEntry) {
                    return theErr;
                }
                if ((theErr = Errno(mkdir(theDirName.c_str(), 0777))) != 0 &&
                        theErr != RetErrno(EEXIST)) {
                    return theErr;
                }
            }
        }
        return 0;
    }
    virtual int Rename(
        const string& inSrcName,
        const string& inDstName)
    {
        return Errno(rename(inSrcName.c_str(), inDstName.c_str()));
    }
    virtual int SetReplication(
        const string& inPathName,
        int16_t       inReplication)
    {
        // Local files have exactly one copy, record nothing.
        if (inReplication <= 0) {
            return -EINVAL;
        }
        StatBuf theStat;
        return Stat(inPathName, theStat);
    }
    virtual int Stat(
        const string& inPathName,
        StatBuf&      outStat)
    {
        outStat.Reset();
        struct stat theStat;
        if (stat(inPathName.c_str(), &theStat)) {
            return RetErrno(errno);
        }
        outStat.mDirFlag     = S_ISDIR(theStat.st_mode);
        outStat.mLength      = outStat.mDirFlag ? 0 : theStat.st_size;
        outStat.mBlockSize   = mBlockSize;
        outStat.mReplication = 1;
        return 0;
    }
    virtual string StrError(
        int inError) const
    {
        return ErrorCodeToString(inError < 0 ? inError : -inError);
    }
    virtual const string& GetUri() const
        { return mUri; }
private:
    const string     mUri;
    const praidOff_t mBlockSize;

    static int Errno(
        int inVal)
    {
        if (inVal >= 0) {
            return inVal;
        }
        return RetErrno(errno);
    }
    static int RetErrno(
        int inErrno)
    {
        return (inErrno == 0 ? -1 : (inErrno < 0 ? inErrno : -inErrno));
    }
    int RemoveDirSelf(
        string& inPath)
    {
        const size_t thePrevSize = inPath.size();
        DIR* const theDirPtr     = opendir(inPath.c_str());
        if (! theDirPtr) {
            return RetErrno(errno);
        }
        int                  theRet = 0;
        const struct dirent* thePtr;
        while ((thePtr = readdir(theDirPtr))) {
            if (strcmp(thePtr->d_name, ".") == 0 ||
                    strcmp(thePtr->d_name, "..") == 0) {
                continue;
            }
            inPath.erase(thePrevSize);
            inPath += "/";
            inPath += thePtr->d_name;
            struct stat theStat;
            if (lstat(inPath.c_str(), &theStat)) {
                theRet = RetErrno(errno);
            } else if (S_ISDIR(theStat.st_mode)) {
                theRet = RemoveDirSelf(inPath);
            } else {
                theRet = Errno(unlink(inPath.c_str()));
            }
            if (theRet != 0) {
                break;
            }
        }
        closedir(theDirPtr);
        inPath.erase(thePrevSize);
        return (theRet == 0 ? Errno(rmdir(inPath.c_str())) : theRet);
    }
private:
    LocalFileSystem(
        const LocalFileSystem& inFileSystem);
    LocalFileSystem& operator=(
        const LocalFileSystem& inFileSystem);
};

    /* static */ FileSystem*
FileSystem::CreateLocal(
    const Properties* inPropertiesPtr,
    const char*       inPrefixPtr)
{
    praidOff_t theBlockSize = kPraidDefaultBlockSize;
    if (inPropertiesPtr) {
        const string thePrefix = inPrefixPtr ? inPrefixPtr : "";
        theBlockSize = inPropertiesPtr->getValue(
            thePrefix + "blockSize", theBlockSize);
        if (theBlockSize <= 0) {
            PRAID_LOG_STREAM_WARN <<
                "invalid " << thePrefix << "blockSize: " << theBlockSize <<
                " using default: " << kPraidDefaultBlockSize <<
            PRAID_LOG_EOM;
            theBlockSize = kPraidDefaultBlockSize;
        }
    }
    return new LocalFileSystem(theBlockSize);
}

}
