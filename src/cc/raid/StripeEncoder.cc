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

#include "StripeEncoder.h"
#include "ParallelStreamReader.h"
#include "ProgressReporter.h"
#include "RaidStreams.h"

#include "common/MsgLogger.h"
#include "qcdio/QCUtils.h"
#include "qcdio/qcstutils.h"

#include <errno.h>

namespace PRAID
{

StripeEncoder::StripeEncoder(
    const CodecPtr&      inCodecPtr,
    const EncoderConfig& inConfig)
    : mCodecPtr(inCodecPtr),
      mConfig(inConfig),
      mBuffers(inCodecPtr->GetParityLength(), inConfig.mBufSize),
      mBufferPtrs(
        inCodecPtr->GetStripeLength() + inCodecPtr->GetParityLength(),
        (void*)0),
      mMutex(),
      mActiveReaderPtr(0),
      mInterruptFlag(false)
{
}

StripeEncoder::~StripeEncoder()
{
}

    void
StripeEncoder::Interrupt()
{
    QCStMutexLocker theLocker(mMutex);
    mInterruptFlag = true;
    if (mActiveReaderPtr) {
        mActiveReaderPtr->Interrupt();
    }
}

    void
StripeEncoder::ClearInterrupt()
{
    QCStMutexLocker theLocker(mMutex);
    mInterruptFlag = false;
}

    void
StripeEncoder::SetActiveReader(
    ParallelStreamReader* inReaderPtr)
{
    QCStMutexLocker theLocker(mMutex);
    mActiveReaderPtr = inReaderPtr;
    if (mActiveReaderPtr && mInterruptFlag) {
        mActiveReaderPtr->Interrupt();
    }
}

    int
StripeEncoder::EncodeStripe(
    const vector<InputStream*>&  inInputs,
    const vector<OutputStream*>& inOutputs,
    praidOff_t                   inBlockSize,
    ProgressReporter&            inReporter)
{
    const Codec& theCodec = *mCodecPtr;
    if ((int)inInputs.size() != theCodec.GetStripeLength() ||
            (int)inOutputs.size() != theCodec.GetParityLength() ||
            inBlockSize <= 0) {
        PRAID_LOG_STREAM_ERROR <<
            "encode stripe: codec: " << theCodec.GetId() <<
            " invalid arguments:"
            " inputs: "     << inInputs.size() <<
            " outputs: "    << inOutputs.size() <<
            " block size: " << inBlockSize <<
        PRAID_LOG_EOM;
        const int theStatus = RaidUtils::CloseStreams(inInputs);
        if (theStatus < 0) {
            PRAID_LOG_STREAM_DEBUG <<
                "encode stripe: close status: " << theStatus <<
            PRAID_LOG_EOM;
        }
        return -EINVAL;
    }
    const int theStripeLength = theCodec.GetStripeLength();
    if (mBuffers.Configure(inBlockSize, theCodec.GetLengthAlignment())) {
        for (int k = 0; k < mBuffers.GetParityLength(); k++) {
            mBufferPtrs[theStripeLength + k] = mBuffers.GetBuffer(k);
        }
    }
    const int        theChunkSize  = mBuffers.GetChunkSize();
    const praidOff_t theChunkCount = inBlockSize / theChunkSize;
    ParallelStreamReader theReader(
        inInputs,
        theChunkSize,
        mConfig.mParallelism,
        mConfig.mReadAhead,
        inBlockSize
    );
    int theStatus = theReader.Start();
    if (theStatus == 0) {
        SetActiveReader(&theReader);
    }
    for (praidOff_t i = 0; theStatus == 0 && i < theChunkCount; i++) {
        const ParallelStreamReader::ReadResult* theResultPtr = 0;
        theStatus = theReader.GetReadResult(theResultPtr);
        if (theStatus != 0) {
            PRAID_LOG_STREAM_ERROR <<
                "encode stripe: chunk: " << i <<
                " of: " << theChunkCount <<
                " " << ErrorCodeToString(theStatus) <<
            PRAID_LOG_EOM;
            break;
        }
        if (theResultPtr->mStatus != 0) {
            theStatus = theResultPtr->mStatus;
            PRAID_LOG_STREAM_ERROR <<
                "encode stripe: offset: " << theResultPtr->mOffset <<
                " input: " << theResultPtr->mFailedIndex <<
                " " << inInputs[theResultPtr->mFailedIndex]->GetName() <<
                " " << ErrorCodeToString(theStatus) <<
            PRAID_LOG_EOM;
            break;
        }
        inReporter.Progress();
        for (int k = 0; k < theStripeLength; k++) {
            mBufferPtrs[k] = theResultPtr->mBuffers[k];
        }
        theStatus = theCodec.EncodeBulk(&mBufferPtrs[0], theChunkSize);
        if (theStatus != 0) {
            break;
        }
        for (size_t k = 0; k < inOutputs.size(); k++) {
            theStatus = inOutputs[k]->Write(
                mBuffers.GetBuffer((int)k), (size_t)theChunkSize);
            if (theStatus != 0) {
                PRAID_LOG_STREAM_ERROR <<
                    "encode stripe: write: " << inOutputs[k]->GetName() <<
                    " parity: " << k <<
                    " " << ErrorCodeToString(theStatus) <<
                PRAID_LOG_EOM;
                break;
            }
        }
        inReporter.Progress();
    }
    SetActiveReader(0);
    theReader.Shutdown();
    return theStatus;
}

} // namespace PRAID
