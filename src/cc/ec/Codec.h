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
// Codec descriptor: id, stripe and parity length, staging directory, and the
// bulk encode function. Immutable after construction, shared read only.
//
//----------------------------------------------------------------------------

#ifndef PRAID_EC_CODEC_H
#define PRAID_EC_CODEC_H

#include "ECMethod.h"

#include <boost/shared_ptr.hpp>

#include <string>

namespace PRAID
{
using std::string;

class Codec;
typedef boost::shared_ptr<const Codec> CodecPtr;

class Codec
{
public:
    // Returns null and sets the error message if the method is not
    // available, or does not support the geometry.
    static CodecPtr Create(
        const string& inId,
        int           inMethodType,
        int           inStripeLength,
        int           inParityLength,
        const string& inStagingDir,
        string*       outErrMsgPtr = 0);
    // Takes ownership of the encoder, released with Encoder::Release().
    static CodecPtr Create(
        const string&      inId,
        ECMethod::Encoder* inEncoderPtr,
        int                inStripeLength,
        int                inParityLength,
        const string&      inStagingDir,
        string*            outErrMsgPtr = 0);
    ~Codec();
    const string& GetId() const
        { return mId; }
    int GetStripeLength() const
        { return mStripeLength; }
    int GetParityLength() const
        { return mParityLength; }
    const string& GetStagingDir() const
        { return mStagingDir; }
    // Encode length must be a multiple of the returned value.
    int GetLengthAlignment() const
        { return mEncoderPtr->GetLengthAlignment(); }
    // inBuffersPtr holds inStripeLength data buffer pointers followed by
    // inParityLength parity buffer pointers, inLength bytes each. Computes
    // parity of the data buffers into the parity buffers, the data buffers
    // are not modified. Returns 0 or -EENCODEFAILED.
    int EncodeBulk(
        void** inBuffersPtr,
        int    inLength) const;
private:
    const string             mId;
    const int                mStripeLength;
    const int                mParityLength;
    const string             mStagingDir;
    ECMethod::Encoder* const mEncoderPtr;

    Codec(
        const string&      inId,
        ECMethod::Encoder* inEncoderPtr,
        int                inStripeLength,
        int                inParityLength,
        const string&      inStagingDir);
private:
    Codec(
        const Codec& inCodec);
    Codec& operator=(
        const Codec& inCodec);
};

} /* namespace PRAID */

#endif /* PRAID_EC_CODEC_H */
