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
// Parity scratch buffers, and the chunk size selection for a block size.
//
//----------------------------------------------------------------------------

#ifndef PRAID_RAID_PARITY_BUFFERS_H
#define PRAID_RAID_PARITY_BUFFERS_H

#include "common/praidtypes.h"

#include <stdint.h>
#include <vector>

namespace PRAID
{
using std::vector;

class ParityBuffers
{
public:
    ParityBuffers(
        int inParityLength,
        int inInitialChunkSize = kPraidDefaultBufSize);
    ~ParityBuffers();
    // Selects the chunk size for inBlockSize and reallocates the buffers
    // if the chunk size changed. Returns true if buffers were reallocated.
    // After the call GetChunkSize() divides inBlockSize, and is a multiple
    // of inAlignment if inAlignment divides inBlockSize.
    bool Configure(
        praidOff_t inBlockSize,
        int        inAlignment = 1);
    // Chunk size heuristic, applied to the current chunk size.
    static int ComputeChunkSize(
        int        inCurChunkSize,
        praidOff_t inBlockSize,
        int        inAlignment = 1);
    int GetChunkSize() const
        { return mChunkSize; }
    int GetParityLength() const
        { return (int)mBuffers.size(); }
    char* GetBuffer(
        int inIndex) const
        { return mBuffers[inIndex]; }
    int64_t GetAllocationCount() const
        { return mAllocationCount; }
private:
    int           mChunkSize;
    bool          mAllocatedFlag;
    int64_t       mAllocationCount;
    vector<char*> mBuffers;

    void Allocate();
    void Free();
private:
    ParityBuffers(
        const ParityBuffers& inBuffers);
    ParityBuffers& operator=(
        const ParityBuffers& inBuffers);
};

} // namespace PRAID

#endif /* PRAID_RAID_PARITY_BUFFERS_H */
