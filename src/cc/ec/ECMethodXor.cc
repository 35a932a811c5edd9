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
//
// Single parity XOR encoder.
//
//----------------------------------------------------------------------------

#include "ECMethod.h"

#include <errno.h>
#include <stdint.h>
#include <string.h>

namespace PRAID
{

const int kXorMaxDataStripeCount = 1 << 10;

class XorEncoder : public ECMethod::Encoder
{
public:
    // Stateless, one instance is shared by all codecs.
    static XorEncoder& Get()
    {
        static XorEncoder sEncoder;
        return sEncoder;
    }
    virtual int Encode(
        int    inStripeCount,
        int    inRecoveryStripeCount,
        int    inLength,
        void** inBuffersPtr)
    {
        if (inStripeCount <= 0 || inRecoveryStripeCount != 1 ||
                inLength < 0) {
            return -EINVAL;
        }
        char* const theParityPtr =
            static_cast<char*>(inBuffersPtr[inStripeCount]);
        memcpy(theParityPtr, inBuffersPtr[0], (size_t)inLength);
        for (int i = 1; i < inStripeCount; i++) {
            XorInto(theParityPtr,
                static_cast<const char*>(inBuffersPtr[i]), inLength);
        }
        return 0;
    }
    virtual void Release()
        {}
private:
    XorEncoder()
        : ECMethod::Encoder()
        {}
    virtual ~XorEncoder()
        {}

    static void XorInto(
        char*       inDstPtr,
        const char* inSrcPtr,
        int         inLength)
    {
        int i = 0;
        for (; i + (int)sizeof(uint64_t) <= inLength;
                i += (int)sizeof(uint64_t)) {
            uint64_t theDst;
            uint64_t theSrc;
            memcpy(&theDst, inDstPtr + i, sizeof(theDst));
            memcpy(&theSrc, inSrcPtr + i, sizeof(theSrc));
            theDst ^= theSrc;
            memcpy(inDstPtr + i, &theDst, sizeof(theDst));
        }
        for (; i < inLength; i++) {
            inDstPtr[i] ^= inSrcPtr[i];
        }
    }
};

    ECMethod::Encoder*
CreateXorEncoder(
    int     inStripeCount,
    int     inRecoveryStripeCount,
    string* outErrMsgPtr)
{
    const char* theErrPtr = 0;
    if (inStripeCount <= 0 || kXorMaxDataStripeCount < inStripeCount) {
        theErrPtr = "xor: invalid data stripe count";
    } else if (inRecoveryStripeCount != 1) {
        theErrPtr = "xor: invalid recovery stripe count";
    }
    if (theErrPtr) {
        if (outErrMsgPtr) {
            *outErrMsgPtr = theErrPtr;
        }
        return 0;
    }
    return &XorEncoder::Get();
}

} /* namespace PRAID */
