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
// Input and output stream abstractions used by the parity pipelines, and
// stream helpers.
//
//----------------------------------------------------------------------------

#ifndef PRAID_RAID_RAID_STREAMS_H
#define PRAID_RAID_RAID_STREAMS_H

#include "common/praidtypes.h"

#include <sys/types.h>
#include <stdint.h>

#include <string>
#include <vector>

namespace PRAID
{
using std::string;
using std::vector;

class FileSystem;

class InputStream
{
public:
    virtual ~InputStream()
        {}
    // Returns the number of bytes read, 0 at the end of file, or negative
    // errno.
    virtual ssize_t Read(
        char*  inBufPtr,
        size_t inLength) = 0;
    // Closes the stream. Subsequent calls have no effect and return 0.
    virtual int Close() = 0;
    virtual const string& GetName() const = 0;
protected:
    InputStream()
        {}
private:
    InputStream(
        const InputStream& inStream);
    InputStream& operator=(
        const InputStream& inStream);
};

class OutputStream
{
public:
    virtual ~OutputStream()
        {}
    // Writes all inLength bytes. Returns 0 or negative errno.
    virtual int Write(
        const char* inBufPtr,
        size_t      inLength) = 0;
    // Closes the stream. Subsequent calls have no effect and return 0.
    virtual int Close() = 0;
    virtual const string& GetName() const = 0;
protected:
    OutputStream()
        {}
private:
    OutputStream(
        const OutputStream& inStream);
    OutputStream& operator=(
        const OutputStream& inStream);
};

// File system input stream. Owns the file descriptor.
class FsInputStream : public InputStream
{
public:
    // Opens inFileName positioned at inOffset. Returns 0 and sets
    // outStreamPtr, or negative errno.
    static int Open(
        FileSystem&    inFs,
        const string&  inFileName,
        praidOff_t     inOffset,
        int            inBufferSize,
        InputStream*&  outStreamPtr);
    FsInputStream(
        FileSystem&   inFs,
        const string& inFileName,
        int           inFd);
    virtual ~FsInputStream();
    virtual ssize_t Read(
        char*  inBufPtr,
        size_t inLength);
    virtual int Close();
    virtual const string& GetName() const
        { return mName; }
private:
    FileSystem&  mFs;
    const string mName;
    int          mFd;
};

// Yields exactly the configured number of zero bytes, then end of file.
class ZeroInputStream : public InputStream
{
public:
    ZeroInputStream(
        praidOff_t    inLength,
        const string& inName = string("zero"))
        : InputStream(),
          mName(inName),
          mRemaining(inLength),
          mClosedFlag(false)
        {}
    virtual ~ZeroInputStream()
        {}
    virtual ssize_t Read(
        char*  inBufPtr,
        size_t inLength);
    virtual int Close()
    {
        mClosedFlag = true;
        return 0;
    }
    virtual const string& GetName() const
        { return mName; }
private:
    const string mName;
    praidOff_t   mRemaining;
    bool         mClosedFlag;
};

// File system output stream. Owns the file descriptor.
class FsOutputStream : public OutputStream
{
public:
    static int Create(
        FileSystem&    inFs,
        const string&  inFileName,
        bool           inOverwriteFlag,
        int            inBufferSize,
        int16_t        inReplication,
        praidOff_t     inBlockSize,
        OutputStream*& outStreamPtr);
    FsOutputStream(
        FileSystem&   inFs,
        const string& inFileName,
        int           inFd);
    virtual ~FsOutputStream();
    virtual int Write(
        const char* inBufPtr,
        size_t      inLength);
    virtual int Close();
    virtual const string& GetName() const
        { return mName; }
    praidOff_t GetWrittenCount() const
        { return mWrittenCount; }
private:
    FileSystem&  mFs;
    const string mName;
    int          mFd;
    praidOff_t   mWrittenCount;
};

// Discard sink, used in place of the parity positions that are not wanted.
// Write only validates its arguments.
class NullOutputStream : public OutputStream
{
public:
    NullOutputStream()
        : OutputStream(),
          mName("null"),
          mWrittenCount(0)
        {}
    virtual ~NullOutputStream()
        {}
    virtual int Write(
        const char* inBufPtr,
        size_t      inLength);
    virtual int Close()
        { return 0; }
    virtual const string& GetName() const
        { return mName; }
    praidOff_t GetWrittenCount() const
        { return mWrittenCount; }
private:
    const string mName;
    praidOff_t   mWrittenCount;
};

// Forwards writes to another stream and computes the adler32 of the data
// written. Does not own the target, Close() does not close it.
class ChecksumOutputStream : public OutputStream
{
public:
    ChecksumOutputStream(
        OutputStream& inStream);
    virtual ~ChecksumOutputStream()
        {}
    virtual int Write(
        const char* inBufPtr,
        size_t      inLength);
    virtual int Close()
        { return 0; }
    virtual const string& GetName() const
        { return mStream.GetName(); }
    uint32_t GetChecksum() const
        { return mChecksum; }
    praidOff_t GetWrittenCount() const
        { return mWrittenCount; }
private:
    OutputStream& mStream;
    uint32_t      mChecksum;
    praidOff_t    mWrittenCount;
};

class RaidUtils
{
public:
    // Closes every stream, null entries are skipped. Returns the first
    // error, or 0.
    template<typename T>
    static int CloseStreams(
        const vector<T*>& inStreams)
    {
        int theRet = 0;
        for (typename vector<T*>::const_iterator theIt = inStreams.begin();
                theIt != inStreams.end();
                ++theIt) {
            if (! *theIt) {
                continue;
            }
            const int theStatus = (*theIt)->Close();
            if (theStatus < 0 && theRet == 0) {
                theRet = theStatus;
            }
        }
        return theRet;
    }
    // Copies exactly inCount bytes. Returns 0, -EIO if the input ends
    // prematurely, or the negative errno of the failed read or write.
    static int CopyBytes(
        InputStream&  inStream,
        OutputStream& inOutStream,
        char*         inBufPtr,
        size_t        inBufSize,
        praidOff_t    inCount);
    // Reads until inLength bytes are read or the end of file is reached.
    // The remainder of the buffer is zero filled at the end of file.
    // Returns the number of bytes read, or negative errno.
    static ssize_t ReadTillEnd(
        InputStream& inStream,
        char*        inBufPtr,
        size_t       inLength);
};

} // namespace PRAID

#endif /* PRAID_RAID_RAID_STREAMS_H */
