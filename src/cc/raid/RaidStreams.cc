//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2026/10/18
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
//----------------------------------------------------------------------------

#include "RaidStreams.h"

#include "fs/FileSystem.h"
#include "common/checksum.h"
#include "common/MsgLogger.h"

#include <errno.h>
#include <string.h>

#include <algorithm>

namespace PRAID
{
using std::min;

    /* static */ int
FsInputStream::Open(
    FileSystem&    inFs,
    const string&  inFileName,
    praidOff_t     inOffset,
    int            inBufferSize,
    InputStream*&  outStreamPtr)
{
    outStreamPtr = 0;
    const int theFd = inFs.Open(inFileName, inOffset, inBufferSize);
    if (theFd < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "open: " << inFileName <<
            " offset: " << inOffset <<
            " " << inFs.StrError(theFd) <<
        PRAID_LOG_EOM;
        return theFd;
    }
    outStreamPtr = new FsInputStream(inFs, inFileName, theFd);
    return 0;
}

FsInputStream::FsInputStream(
    FileSystem&   inFs,
    const string& inFileName,
    int           inFd)
    : InputStream(),
      mFs(inFs),
      mName(inFileName),
      mFd(inFd)
{
}

FsInputStream::~FsInputStream()
{
    FsInputStream::Close();
}

    ssize_t
FsInputStream::Read(
    char*  inBufPtr,
    size_t inLength)
{
    if (mFd < 0) {
        return -EBADF;
    }
    return mFs.Read(mFd, inBufPtr, inLength);
}

    int
FsInputStream::Close()
{
    if (mFd < 0) {
        return 0;
    }
    const int theFd = mFd;
    mFd = -1;
    const int theStatus = mFs.Close(theFd);
    if (theStatus < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "close: " << mName << " " << mFs.StrError(theStatus) <<
        PRAID_LOG_EOM;
    }
    return theStatus;
}

    ssize_t
ZeroInputStream::Read(
    char*  inBufPtr,
    size_t inLength)
{
    if (mClosedFlag) {
        return -EBADF;
    }
    if (mRemaining <= 0) {
        return 0;
    }
    const size_t theLen = (size_t)min((praidOff_t)inLength, mRemaining);
    memset(inBufPtr, 0, theLen);
    mRemaining -= theLen;
    return (ssize_t)theLen;
}

    /* static */ int
FsOutputStream::Create(
    FileSystem&    inFs,
    const string&  inFileName,
    bool           inOverwriteFlag,
    int            inBufferSize,
    int16_t        inReplication,
    praidOff_t     inBlockSize,
    OutputStream*& outStreamPtr)
{
    outStreamPtr = 0;
    const int theFd = inFs.Create(inFileName, inOverwriteFlag, inBufferSize,
        inReplication, inBlockSize);
    if (theFd < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "create: " << inFileName <<
            " replication: " << inReplication <<
            " block size: " << inBlockSize <<
            " " << inFs.StrError(theFd) <<
        PRAID_LOG_EOM;
        return theFd;
    }
    outStreamPtr = new FsOutputStream(inFs, inFileName, theFd);
    return 0;
}

FsOutputStream::FsOutputStream(
    FileSystem&   inFs,
    const string& inFileName,
    int           inFd)
    : OutputStream(),
      mFs(inFs),
      mName(inFileName),
      mFd(inFd),
      mWrittenCount(0)
{
}

FsOutputStream::~FsOutputStream()
{
    FsOutputStream::Close();
}

    int
FsOutputStream::Write(
    const char* inBufPtr,
    size_t      inLength)
{
    if (mFd < 0) {
        return -EBADF;
    }
    const char*       thePtr = inBufPtr;
    const char* const theEnd = inBufPtr + inLength;
    while (thePtr < theEnd) {
        const ssize_t theNWr = mFs.Write(mFd, thePtr, theEnd - thePtr);
        if (theNWr < 0) {
            PRAID_LOG_STREAM_ERROR <<
                "write: " << mName <<
                " pos: " << mWrittenCount + (thePtr - inBufPtr) <<
                " " << mFs.StrError((int)theNWr) <<
            PRAID_LOG_EOM;
            return (int)theNWr;
        }
        if (theNWr == 0) {
            return -EIO;
        }
        thePtr += theNWr;
    }
    mWrittenCount += inLength;
    return 0;
}

    int
FsOutputStream::Close()
{
    if (mFd < 0) {
        return 0;
    }
    const int theFd = mFd;
    mFd = -1;
    const int theStatus = mFs.Close(theFd);
    if (theStatus < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "close: " << mName << " " << mFs.StrError(theStatus) <<
        PRAID_LOG_EOM;
    }
    return theStatus;
}

    int
NullOutputStream::Write(
    const char* inBufPtr,
    size_t      inLength)
{
    if (! inBufPtr && 0 < inLength) {
        return -EFAULT;
    }
    mWrittenCount += inLength;
    return 0;
}

ChecksumOutputStream::ChecksumOutputStream(
    OutputStream& inStream)
    : OutputStream(),
      mStream(inStream),
      mChecksum(kPraidNullChecksum),
      mWrittenCount(0)
{
}

    int
ChecksumOutputStream::Write(
    const char* inBufPtr,
    size_t      inLength)
{
    const int theStatus = mStream.Write(inBufPtr, inLength);
    if (theStatus < 0) {
        return theStatus;
    }
    mChecksum = ComputeBlockChecksum(mChecksum, inBufPtr, inLength);
    mWrittenCount += inLength;
    return theStatus;
}

    /* static */ int
RaidUtils::CopyBytes(
    InputStream&  inStream,
    OutputStream& inOutStream,
    char*         inBufPtr,
    size_t        inBufSize,
    praidOff_t    inCount)
{
    praidOff_t theRem = inCount;
    while (0 < theRem) {
        const size_t  theLen = (size_t)min((praidOff_t)inBufSize, theRem);
        const ssize_t theNRd = inStream.Read(inBufPtr, theLen);
        if (theNRd < 0) {
            PRAID_LOG_STREAM_ERROR <<
                "copy: read: " << inStream.GetName() <<
                " remaining: " << theRem <<
                " " << ErrorCodeToString((int)theNRd) <<
            PRAID_LOG_EOM;
            return (int)theNRd;
        }
        if (theNRd == 0) {
            PRAID_LOG_STREAM_ERROR <<
                "copy: premature end of file: " << inStream.GetName() <<
                " copied: " << (inCount - theRem) <<
                " expected: " << inCount <<
            PRAID_LOG_EOM;
            return -EIO;
        }
        const int theStatus = inOutStream.Write(inBufPtr, (size_t)theNRd);
        if (theStatus < 0) {
            return theStatus;
        }
        theRem -= theNRd;
    }
    return 0;
}

    /* static */ ssize_t
RaidUtils::ReadTillEnd(
    InputStream& inStream,
    char*        inBufPtr,
    size_t       inLength)
{
    size_t theRead = 0;
    while (theRead < inLength) {
        const ssize_t theNRd =
            inStream.Read(inBufPtr + theRead, inLength - theRead);
        if (theNRd < 0) {
            return theNRd;
        }
        if (theNRd == 0) {
            memset(inBufPtr + theRead, 0, inLength - theRead);
            break;
        }
        theRead += (size_t)theNRd;
    }
    return (ssize_t)theRead;
}

} // namespace PRAID
