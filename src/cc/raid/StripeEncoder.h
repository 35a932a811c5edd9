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
// Stripe encoder: reads aligned chunks of a stripe's data blocks, computes
// parity chunks, and writes them to the parity sinks.
//
//----------------------------------------------------------------------------

#ifndef PRAID_RAID_STRIPE_ENCODER_H
#define PRAID_RAID_STRIPE_ENCODER_H

#include "ParityBuffers.h"
#include "EncoderConfig.h"

#include "ec/Codec.h"
#include "qcdio/QCMutex.h"

#include <vector>

namespace PRAID
{
using std::vector;

class InputStream;
class OutputStream;
class ParallelStreamReader;
class ProgressReporter;

class StripeEncoder
{
public:
    StripeEncoder(
        const CodecPtr&      inCodecPtr,
        const EncoderConfig& inConfig);
    ~StripeEncoder();
    // Encodes one stripe, inBlockSize bytes of every input. The number of
    // inputs must be the codec stripe length, and the number of outputs
    // the codec parity length. Returns 0, the first read failure, the first
    // write failure, -EENCODEFAILED, or -EINTR.
    // The inputs are closed on return.
    int EncodeStripe(
        const vector<InputStream*>&  inInputs,
        const vector<OutputStream*>& inOutputs,
        praidOff_t                   inBlockSize,
        ProgressReporter&            inReporter);
    // Makes the call in progress, or the next one, fail with -EINTR while
    // waiting for data.
    void Interrupt();
    void ClearInterrupt();
    const ParityBuffers& GetBuffers() const
        { return mBuffers; }
private:
    const CodecPtr        mCodecPtr;
    const EncoderConfig   mConfig;
    ParityBuffers         mBuffers;
    // Data chunk pointers followed by the parity buffer pointers.
    vector<void*>         mBufferPtrs;
    QCMutex               mMutex;
    ParallelStreamReader* mActiveReaderPtr;
    bool                  mInterruptFlag;

    void SetActiveReader(
        ParallelStreamReader* inReaderPtr);
private:
    StripeEncoder(
        const StripeEncoder& inEncoder);
    StripeEncoder& operator=(
        const StripeEncoder& inEncoder);
};

} // namespace PRAID

#endif /* PRAID_RAID_STRIPE_ENCODER_H */
