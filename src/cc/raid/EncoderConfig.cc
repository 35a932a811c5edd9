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

#include "EncoderConfig.h"

#include "common/praidtypes.h"
#include "common/MsgLogger.h"
#include "common/Properties.h"

#include <stdlib.h>

namespace PRAID
{

EncoderConfig::EncoderConfig()
    : mParallelism(kPraidDefaultParallelism),
      mBufSize(kPraidDefaultBufSize),
      mLargeParityBlocks(kPraidDefaultLargeParityBlocks),
      mReadAhead(kPraidDefaultReadAhead),
      mIoFileBufferSize(kPraidDefaultIoFileBufferSize),
      mLocalTmpDir(GetDefaultLocalTmpDir())
{
}

    /* static */ string
EncoderConfig::GetDefaultLocalTmpDir()
{
    const char* const theDirPtr = getenv("TMPDIR");
    return ((theDirPtr && *theDirPtr) ? string(theDirPtr) : string("/tmp"));
}

static void
SetPositive(
    const Properties& inProps,
    const string&     inName,
    int&              ioValue)
{
    const string* const theStrPtr = inProps.getValue(inName);
    if (! theStrPtr) {
        return;
    }
    const int theValue = inProps.getValue(inName, -1);
    if (theValue <= 0) {
        PRAID_LOG_STREAM_WARN <<
            "invalid " << inName << ": " << *theStrPtr <<
            " using: " << ioValue <<
        PRAID_LOG_EOM;
        return;
    }
    ioValue = theValue;
}

    void
EncoderConfig::SetParameters(
    const Properties& inProps,
    const char*       inPrefixPtr)
{
    const string thePrefix = inPrefixPtr ? inPrefixPtr : "";
    SetPositive(inProps, thePrefix + "encoder.parallelism", mParallelism);
    SetPositive(inProps, thePrefix + "encoder.bufsize", mBufSize);
    SetPositive(inProps, thePrefix + "encoder.largeparity.blocks",
        mLargeParityBlocks);
    SetPositive(inProps, thePrefix + "encoder.readahead", mReadAhead);
    SetPositive(inProps, thePrefix + "io.file.buffer.size", mIoFileBufferSize);
    mLocalTmpDir = inProps.getValue(
        thePrefix + "encoder.local.tmp.dir", mLocalTmpDir);
    if (mLocalTmpDir.empty()) {
        mLocalTmpDir = GetDefaultLocalTmpDir();
    }
    PRAID_LOG_STREAM_DEBUG <<
        "encoder config:"
        " parallelism: "    << mParallelism <<
        " bufsize: "        << mBufSize <<
        " large parity: "   << mLargeParityBlocks <<
        " readahead: "      << mReadAhead <<
        " io buffer: "      << mIoFileBufferSize <<
        " local tmp: "      << mLocalTmpDir <<
    PRAID_LOG_EOM;
}

} // namespace PRAID
