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
// Reed-Solomon Vandermonde encoder, jerasure library.
//
//----------------------------------------------------------------------------

#ifndef PRAID_OMIT_JERASURE

#include "ECMethod.h"

#include "qcdio/QCMutex.h"
#include "qcdio/QCUtils.h"
#include "qcdio/qcstutils.h"

#include "jerasure.h"
#include "jerasure/reed_sol.h"

#include <boost/lexical_cast.hpp>

#include <errno.h>
#include <stdint.h>
#include <stdlib.h>

namespace PRAID
{

const int kJerasureMaxDataStripeCount     = 511;
const int kJerasureMaxRecoveryStripeCount = 127;

class JerasureEncoder : public ECMethod::Encoder
{
public:
    JerasureEncoder(
        int* inMatrixPtr,
        int  inW)
        : ECMethod::Encoder(),
          mMatrixPtr(inMatrixPtr),
          mW(inW)
        {}
    virtual int Encode(
        int    inStripeCount,
        int    inRecoveryStripeCount,
        int    inLength,
        void** inBuffersPtr)
    {
        if (inLength % GetLengthAlignment() != 0) {
            return -EINVAL;
        }
        jerasure_matrix_encode(
            inStripeCount,
            inRecoveryStripeCount,
            mW,
            mMatrixPtr,
            reinterpret_cast<char**>(inBuffersPtr),
            reinterpret_cast<char**>(inBuffersPtr + inStripeCount),
            inLength
        );
        return 0;
    }
    // Region length must be a multiple of the machine word size.
    virtual int GetLengthAlignment() const
        { return (int)sizeof(long); }
    virtual void Release()
        { delete this; }
private:
    int* const mMatrixPtr;
    int  const mW;

    virtual ~JerasureEncoder()
        { free(mMatrixPtr); }
};

    static QCMutex&
GetInitMutex()
{
    static QCMutex sMutex;
    return sMutex;
}

// Force construction prior entering main().
static const QCMutex* const sInitMutexPtr = &GetInitMutex();

// Galois field tables are global in jerasure, and never freed. Initialized
// on the first encoder creation.
    static bool
InitGaloisFields(
    string* outErrMsgPtr)
{
    static bool sInitDoneFlag = false;

    QCStMutexLocker theLocker(GetInitMutex());
    if (sInitDoneFlag) {
        return true;
    }
    for (int theW = 8; theW <= 32; theW *= 2) {
        const int theRet = galois_init_default_field(theW);
        if (theRet == 0) {
            continue;
        }
        if (outErrMsgPtr) {
            *outErrMsgPtr = "rs: galois init default ";
            *outErrMsgPtr += boost::lexical_cast<string>(theW);
            *outErrMsgPtr += " error: ";
            *outErrMsgPtr += QCUtils::SysError(theRet);
        }
        return false;
    }
    sInitDoneFlag = true;
    return true;
}

    ECMethod::Encoder*
CreateJerasureEncoder(
    int     inStripeCount,
    int     inRecoveryStripeCount,
    string* outErrMsgPtr)
{
    const char* theErrPtr = 0;
    if (inStripeCount <= 0 || kJerasureMaxDataStripeCount < inStripeCount) {
        theErrPtr = "rs: invalid data stripe count";
    } else if (inRecoveryStripeCount <= 0 ||
            kJerasureMaxRecoveryStripeCount < inRecoveryStripeCount) {
        theErrPtr = "rs: invalid recovery stripe count";
    }
    if (theErrPtr) {
        if (outErrMsgPtr) {
            *outErrMsgPtr = theErrPtr;
        }
        return 0;
    }
    if (! InitGaloisFields(outErrMsgPtr)) {
        return 0;
    }
    int theW = inStripeCount + inRecoveryStripeCount;
    if (theW <= (int32_t(1) << 8)) {
        theW = 8;
    } else if (theW <= (int32_t(1) << 16)) {
        theW = 16;
    } else {
        theW = 32;
    }
    int* const theMatrixPtr = reed_sol_vandermonde_coding_matrix(
        inStripeCount, inRecoveryStripeCount, theW);
    if (! theMatrixPtr) {
        if (outErrMsgPtr) {
            *outErrMsgPtr = "rs: failed to create encoding matrix";
        }
        return 0;
    }
    return new JerasureEncoder(theMatrixPtr, theW);
}

} /* namespace PRAID */

#endif /* PRAID_OMIT_JERASURE */
