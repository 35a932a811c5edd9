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

#include "Codec.h"

#include "common/praidtypes.h"
#include "common/MsgLogger.h"

namespace PRAID
{

    /* static */ CodecPtr
Codec::Create(
    const string& inId,
    int           inMethodType,
    int           inStripeLength,
    int           inParityLength,
    const string& inStagingDir,
    string*       outErrMsgPtr)
{
    string theErrMsg;
    ECMethod::Encoder* const theEncoderPtr = ECMethod::CreateEncoder(
        inMethodType, inStripeLength, inParityLength, &theErrMsg);
    if (! theEncoderPtr) {
        const char* const theNamePtr = ECMethod::GetName(inMethodType);
        PRAID_LOG_STREAM_ERROR <<
            "codec: " << inId <<
            " method: " << (theNamePtr ? theNamePtr : "unknown") <<
            " (" << inMethodType << ")" <<
            " stripe: " << inStripeLength <<
            " parity: " << inParityLength <<
            " " << theErrMsg <<
        PRAID_LOG_EOM;
        if (outErrMsgPtr) {
            *outErrMsgPtr = theErrMsg;
        }
        return CodecPtr();
    }
    return Create(inId, theEncoderPtr, inStripeLength, inParityLength,
        inStagingDir, outErrMsgPtr);
}

    /* static */ CodecPtr
Codec::Create(
    const string&      inId,
    ECMethod::Encoder* inEncoderPtr,
    int                inStripeLength,
    int                inParityLength,
    const string&      inStagingDir,
    string*            outErrMsgPtr)
{
    const char* theErrPtr = 0;
    if (! inEncoderPtr) {
        theErrPtr = "no encoder";
    } else if (inStripeLength <= 0) {
        theErrPtr = "invalid stripe length";
    } else if (inParityLength <= 0) {
        theErrPtr = "invalid parity length";
    } else if (inStagingDir.empty()) {
        theErrPtr = "empty staging directory";
    }
    if (theErrPtr) {
        if (inEncoderPtr) {
            inEncoderPtr->Release();
        }
        if (outErrMsgPtr) {
            *outErrMsgPtr = theErrPtr;
        }
        PRAID_LOG_STREAM_ERROR <<
            "codec: " << inId << " " << theErrPtr <<
        PRAID_LOG_EOM;
        return CodecPtr();
    }
    return CodecPtr(new Codec(
        inId, inEncoderPtr, inStripeLength, inParityLength, inStagingDir));
}

Codec::Codec(
    const string&      inId,
    ECMethod::Encoder* inEncoderPtr,
    int                inStripeLength,
    int                inParityLength,
    const string&      inStagingDir)
    : mId(inId),
      mStripeLength(inStripeLength),
      mParityLength(inParityLength),
      mStagingDir(inStagingDir),
      mEncoderPtr(inEncoderPtr)
{
}

Codec::~Codec()
{
    mEncoderPtr->Release();
}

    int
Codec::EncodeBulk(
    void** inBuffersPtr,
    int    inLength) const
{
    const int theStatus = mEncoderPtr->Encode(
        mStripeLength, mParityLength, inLength, inBuffersPtr);
    if (theStatus != 0) {
        PRAID_LOG_STREAM_ERROR <<
            "codec: " << mId <<
            " encode length: " << inLength <<
            " failed: " << theStatus <<
        PRAID_LOG_EOM;
        return -EENCODEFAILED;
    }
    return 0;
}

} /* namespace PRAID */
