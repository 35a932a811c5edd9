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
//----------------------------------------------------------------------------

#include "ECMethod.h"

#include "common/praidtypes.h"

namespace PRAID
{

typedef ECMethod::Encoder* (*EncoderFactory)(
    int     inStripeCount,
    int     inRecoveryStripeCount,
    string* outErrMsgPtr);

struct ECMethodEntry
{
    int            mType;
    const char*    mNamePtr;
    EncoderFactory mFactoryPtr;
};

static const ECMethodEntry kECMethods[] = {
    { PRAID_EC_METHOD_XOR,         "xor", &CreateXorEncoder },
#ifdef PRAID_OMIT_JERASURE
    { PRAID_EC_METHOD_RS_JERASURE, "rs",  0 },
#else
    { PRAID_EC_METHOD_RS_JERASURE, "rs",  &CreateJerasureEncoder },
#endif
};

    static const ECMethodEntry*
FindMethod(
    int inMethodType)
{
    for (size_t i = 0; i < sizeof(kECMethods) / sizeof(kECMethods[0]); i++) {
        if (kECMethods[i].mType == inMethodType) {
            return kECMethods + i;
        }
    }
    return 0;
}

    /* static */ ECMethod::Encoder*
ECMethod::CreateEncoder(
    int     inMethodType,
    int     inStripeCount,
    int     inRecoveryStripeCount,
    string* outErrMsgPtr)
{
    const ECMethodEntry* const theEntryPtr = FindMethod(inMethodType);
    if (! theEntryPtr) {
        if (outErrMsgPtr) {
            *outErrMsgPtr = "invalid erasure coding method type";
        }
        return 0;
    }
    if (! theEntryPtr->mFactoryPtr) {
        if (outErrMsgPtr) {
            *outErrMsgPtr = theEntryPtr->mNamePtr;
            *outErrMsgPtr += ": method is not available in this build";
        }
        return 0;
    }
    Encoder* const theRetPtr = (*theEntryPtr->mFactoryPtr)(
        inStripeCount, inRecoveryStripeCount, outErrMsgPtr);
    if (! theRetPtr && outErrMsgPtr && outErrMsgPtr->empty()) {
        *outErrMsgPtr = "invalid erasure encoder parameters";
    }
    return theRetPtr;
}

    /* static */ const char*
ECMethod::GetName(
    int inMethodType)
{
    const ECMethodEntry* const theEntryPtr = FindMethod(inMethodType);
    return (theEntryPtr ? theEntryPtr->mNamePtr : 0);
}

} /* namespace PRAID */
