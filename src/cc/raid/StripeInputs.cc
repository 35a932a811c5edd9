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

#include "StripeInputs.h"
#include "RaidStreams.h"

#include "common/MsgLogger.h"

namespace PRAID
{

StripeInputs::StripeInputs()
    : mStreams(),
      mZeroStreamCount(0)
{
}

StripeInputs::~StripeInputs()
{
    StripeInputs::Clear();
}

    int
StripeInputs::Open(
    FileSystem&   inFs,
    const string& inFileName,
    praidOff_t    inStripeStart,
    int           inStripeLength,
    praidOff_t    inSrcSize,
    praidOff_t    inBlockSize,
    int           inBufferSize)
{
    Clear();
    mStreams.reserve(inStripeLength);
    for (int i = 0; i < inStripeLength; i++) {
        const praidOff_t theOffset = inStripeStart + i * inBlockSize;
        InputStream* theStreamPtr = 0;
        if (theOffset < inSrcSize) {
            const int theStatus = FsInputStream::Open(
                inFs, inFileName, theOffset, inBufferSize, theStreamPtr);
            if (theStatus < 0) {
                PRAID_LOG_STREAM_ERROR <<
                    "stripe inputs: " << inFileName <<
                    " position: " << i <<
                    " offset: " << theOffset <<
                    " open failure: " << ErrorCodeToString(theStatus) <<
                PRAID_LOG_EOM;
                Clear();
                return theStatus;
            }
            PRAID_LOG_STREAM_DEBUG <<
                "stripe inputs: " << inFileName <<
                " position: " << i <<
                " offset: " << theOffset <<
            PRAID_LOG_EOM;
        } else {
            PRAID_LOG_STREAM_DEBUG <<
                "stripe inputs: " << inFileName <<
                " position: " << i <<
                " offset: " << theOffset <<
                " beyond size: " << inSrcSize <<
                " using zero stream" <<
            PRAID_LOG_EOM;
            theStreamPtr = new ZeroInputStream(inBlockSize);
            mZeroStreamCount++;
        }
        mStreams.push_back(theStreamPtr);
    }
    return 0;
}

    int
StripeInputs::Close()
{
    return RaidUtils::CloseStreams(mStreams);
}

    void
StripeInputs::Clear()
{
    const int theStatus = Close();
    if (theStatus < 0) {
        PRAID_LOG_STREAM_DEBUG <<
            "stripe inputs: clear: close status: " << theStatus <<
        PRAID_LOG_EOM;
    }
    for (vector<InputStream*>::iterator theIt = mStreams.begin();
            theIt != mStreams.end();
            ++theIt) {
        delete *theIt;
    }
    mStreams.clear();
    mZeroStreamCount = 0;
}

} // namespace PRAID
