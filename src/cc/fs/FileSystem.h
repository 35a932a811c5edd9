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
// \brief Block storage file system interface, and local file system.
//
//----------------------------------------------------------------------------

#ifndef FS_FILE_SYSTEM_H
#define FS_FILE_SYSTEM_H

#include "common/praidtypes.h"

#include <sys/types.h>
#include <stdint.h>

#include <string>

namespace PRAID {
class Properties;

using std::string;

// All methods return 0, or a non negative value (file descriptor, byte
// count) on success, and negative errno on failure.
// File descriptors are only meaningful to the file system instance that
// returned them. Implementations must allow concurrent Read() calls on
// distinct descriptors from different threads.
class FileSystem
{
public:
    class StatBuf
    {
    public:
        StatBuf()
            : mLength(-1),
              mBlockSize(-1),
              mReplication(-1),
              mDirFlag(false)
            {}
        void Reset()
            { *this = StatBuf(); }
        praidOff_t mLength;
        praidOff_t mBlockSize;
        int16_t    mReplication;
        bool       mDirFlag;
    };
    // Caller owns the returned object.
    static FileSystem* CreateLocal(
        const Properties* inPropertiesPtr = 0,
        const char*       inPrefixPtr     = "praid.localfs.");

    virtual ~FileSystem()
        {}
    // Opens for reading, positioned at inOffset.
    virtual int Open(
        const string& inFileName,
        praidOff_t    inOffset,
        int           inBufferSize) = 0;
    // Opens for writing. Fails with -EEXIST if the file exists and
    // inOverwriteFlag is false.
    virtual int Create(
        const string& inFileName,
        bool          inOverwriteFlag,
        int           inBufferSize,
        int16_t       inReplication,
        praidOff_t    inBlockSize) = 0;
    virtual ssize_t Read(
        int    inFd,
        void*  inBufPtr,
        size_t inBufSize) = 0;
    virtual ssize_t Write(
        int          inFd,
        const void*  inBufPtr,
        size_t       inBufSize) = 0;
    virtual int Close(
        int inFd) = 0;
    // Returns 1 if the path exists, 0 if it does not.
    virtual int Exists(
        const string& inPathName) = 0;
    virtual int Remove(
        const string& inPathName,
        bool          inRecursiveFlag) = 0;
    virtual int Mkdirs(
        const string& inPathName) = 0;
    virtual int Rename(
        const string& inSrcName,
        const string& inDstName) = 0;
    virtual int SetReplication(
        const string& inPathName,
        int16_t       inReplication) = 0;
    virtual int Stat(
        const string& inPathName,
        StatBuf&      outStat) = 0;
    virtual string StrError(
        int inError) const = 0;
    virtual const string& GetUri() const = 0;
protected:
    FileSystem()
        {}
private:
    FileSystem(
        const FileSystem& inFileSystem);
    FileSystem& operator=(
        const FileSystem& inFileSystem);
};

}

#endif /* FS_FILE_SYSTEM_H */
