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
// Stripe parallel chunk reader. Reads aligned chunks from a set of input
// streams with a pool of reader threads, and hands out one chunk of every
// stream at a time, in offset order.
//
//----------------------------------------------------------------------------

#ifndef PRAID_RAID_PARALLEL_STREAM_READER_H
#define PRAID_RAID_PARALLEL_STREAM_READER_H

#include "common/praidtypes.h"

#include <vector>

namespace PRAID
{
using std::vector;

class InputStream;

class ParallelStreamReader
{
public:
    // One chunk of every stream. If mStatus is not 0, it holds the first
    // read failure, mFailedIndex is the index of the failed stream, and the
    // buffer content is undefined.
    class ReadResult
    {
    public:
        ReadResult()
            : mBuffers(),
              mOffset(0),
              mLength(0),
              mStatus(0),
              mFailedIndex(-1)
            {}
        vector<char*> mBuffers;
        praidOff_t    mOffset;
        int           mLength;
        int           mStatus;
        int           mFailedIndex;
    };

    // The streams are not owned, but are closed by Shutdown(). Every stream
    // is read for at most inMaxBytesPerStream bytes, the last chunk is zero
    // padded at the end of stream.
    ParallelStreamReader(
        const vector<InputStream*>& inStreams,
        int                         inChunkSize,
        int                         inParallelism,
        int                         inQueueCapacity,
        praidOff_t                  inMaxBytesPerStream);
    ~ParallelStreamReader();
    // Returns 0, or negative errno if threads cannot be started.
    int Start();
    // Blocks until the next chunk is available. The result is valid until
    // the next call, or Shutdown(). Returns 0 and sets outResultPtr,
    // -EINTR if interrupted, or -EIO if there are no more chunks or the
    // reader was shut down.
    int GetReadResult(
        const ReadResult*& outResultPtr);
    void Interrupt();
    // Stops and joins all threads, and closes all streams. Idempotent.
    void Shutdown();
private:
    class Impl;
    Impl& mImpl;
private:
    ParallelStreamReader(
        const ParallelStreamReader& inReader);
    ParallelStreamReader& operator=(
        const ParallelStreamReader& inReader);
};

} // namespace PRAID

#endif /* PRAID_RAID_PARALLEL_STREAM_READER_H */
