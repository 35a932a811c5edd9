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
// Parity encoder interface, and the lookup of the encoder implementation by
// erasure code method type.
//
//----------------------------------------------------------------------------

#ifndef PRAID_EC_ECMETHOD_H
#define PRAID_EC_ECMETHOD_H

#include <string>

namespace PRAID
{
using std::string;

class ECMethod
{
public:
    class Encoder
    {
    public:
        // inBuffersPtr holds inStripeCount data buffers followed by
        // inRecoveryStripeCount parity buffers, each inLength bytes.
        // Returns 0 on success.
        virtual int Encode(
            int    inStripeCount,
            int    inRecoveryStripeCount,
            int    inLength,
            void** inBuffersPtr) = 0;
        // Encode() length must be a multiple of the returned value.
        virtual int GetLengthAlignment() const
            { return 1; }
        virtual void Release() = 0;
    protected:
        Encoder()
            {}
        Encoder(
            const Encoder& /* inEncoder */)
            {}
        virtual ~Encoder()
            {}
        Encoder& operator=(
            const Encoder& /* inEncoder */)
            { return *this; }
    };

    // Returns null and sets the error message if the method is unknown, is
    // not available in this build, or does not support the geometry. The
    // returned encoder must be released with Encoder::Release().
    static Encoder* CreateEncoder(
        int     inMethodType,
        int     inStripeCount,
        int     inRecoveryStripeCount,
        string* outErrMsgPtr);
    // Returns null if the method type is unknown.
    static const char* GetName(
        int inMethodType);
private:
    ECMethod();
    ECMethod(
        const ECMethod& inMethod);
    ECMethod& operator=(
        const ECMethod& inMethod);
};

ECMethod::Encoder* CreateXorEncoder(
    int     inStripeCount,
    int     inRecoveryStripeCount,
    string* outErrMsgPtr);
#ifndef PRAID_OMIT_JERASURE
ECMethod::Encoder* CreateJerasureEncoder(
    int     inStripeCount,
    int     inRecoveryStripeCount,
    string* outErrMsgPtr);
#endif

} /* namespace PRAID */

#endif /* PRAID_EC_ECMETHOD_H */
