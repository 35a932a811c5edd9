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

#include "ParityBuffers.h"

#include "common/MsgLogger.h"
#include "qcdio/QCUtils.h"

#include <algorithm>

namespace PRAID
{
using std::max;
using std::min;

ParityBuffers::ParityBuffers(
    int inParityLength,
    int inInitialChunkSize)
    : mChunkSize(0 < inInitialChunkSize ?
        inInitialChunkSize : kPraidDefaultBufSize),
      mAllocatedFlag(false),
      mAllocationCount(0),
      mBuffers(max(0, inParityLength), (char*)0)
{
    QCRTASSERT(0 < inParityLength);
}

ParityBuffers::~ParityBuffers()
{
    Free();
}

    /* static */ int
ParityBuffers::ComputeChunkSize(
    int        inCurChunkSize,
    praidOff_t inBlockSize,
    int        inAlignment)
{
    QCRTASSERT(0 < inBlockSize);
    // Alignment that the block size does not honor cannot be satisfied.
    const praidOff_t theAlign =
        (0 < inAlignment && inBlockSize % inAlignment == 0) ?
        inAlignment : 1;
    praidOff_t theSize = 0 < inCurChunkSize ? inCurChunkSize : 1;
    if (inBlockSize < theSize) {
        theSize = inBlockSize;
    } else if (inBlockSize % theSize != 0 || theSize % theAlign != 0) {
        theSize = max((praidOff_t)kPraidMinBufSize,
            min(inBlockSize / 256, (praidOff_t)kPraidDefaultBufSize));
    }
    if (inBlockSize < theSize) {
        theSize = inBlockSize;
    }
    if (inBlockSize % theSize != 0 || theSize % theAlign != 0) {
        // Largest aligned divisor of the block size not above the chosen
        // size, or the alignment itself.
        praidOff_t theBest = theAlign;
        for (praidOff_t i = 1; i * i <= inBlockSize; i++) {
            if (inBlockSize % i != 0) {
                continue;
            }
            if (i <= theSize && theBest < i && i % theAlign == 0) {
                theBest = i;
            }
            const praidOff_t theOther = inBlockSize / i;
            if (theOther <= theSize && theBest < theOther &&
                    theOther % theAlign == 0) {
                theBest = theOther;
            }
        }
        theSize = theBest;
    }
    return (int)theSize;
}

    bool
ParityBuffers::Configure(
    praidOff_t inBlockSize,
    int        inAlignment)
{
    const int theSize = ComputeChunkSize(mChunkSize, inBlockSize, inAlignment);
    if (mAllocatedFlag && theSize == mChunkSize) {
        return false;
    }
    if (theSize != mChunkSize) {
        PRAID_LOG_STREAM_DEBUG <<
            "block size: " << inBlockSize <<
            " alignment: " << inAlignment <<
            " chunk size: " << mChunkSize << " => " << theSize <<
        PRAID_LOG_EOM;
    }
    Free();
    mChunkSize = theSize;
    Allocate();
    return true;
}

    void
ParityBuffers::Allocate()
{
    for (vector<char*>::iterator theIt = mBuffers.begin();
            theIt != mBuffers.end();
            ++theIt) {
        *theIt = new char[mChunkSize];
    }
    mAllocatedFlag = true;
    mAllocationCount++;
}

    void
ParityBuffers::Free()
{
    for (vector<char*>::iterator theIt = mBuffers.begin();
            theIt != mBuffers.end();
            ++theIt) {
        delete [] *theIt;
        *theIt = 0;
    }
    mAllocatedFlag = false;
}

} // namespace PRAID
