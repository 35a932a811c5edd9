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
// Per stripe source inputs: one stream per data block position, zero streams
// past the end of the source file.
//
//----------------------------------------------------------------------------

#ifndef PRAID_RAID_STRIPE_INPUTS_H
#define PRAID_RAID_STRIPE_INPUTS_H

#include "common/praidtypes.h"

#include <string>
#include <vector>

namespace PRAID
{
using std::string;
using std::vector;

class FileSystem;
class InputStream;

class StripeInputs
{
public:
    StripeInputs();
    ~StripeInputs();
    // Opens exactly inStripeLength streams, for block positions starting at
    // inStripeStart. On failure all streams opened so far are closed and
    // released, and negative errno is returned.
    int Open(
        FileSystem&   inFs,
        const string& inFileName,
        praidOff_t    inStripeStart,
        int           inStripeLength,
        praidOff_t    inSrcSize,
        praidOff_t    inBlockSize,
        int           inBufferSize);
    // Closes all streams, returns the first close error. The streams remain
    // valid until Clear() or destruction.
    int Close();
    void Clear();
    const vector<InputStream*>& Get() const
        { return mStreams; }
    int GetZeroStreamCount() const
        { return mZeroStreamCount; }
private:
    vector<InputStream*> mStreams;
    int                  mZeroStreamCount;
private:
    StripeInputs(
        const StripeInputs& inInputs);
    StripeInputs& operator=(
        const StripeInputs& inInputs);
};

} // namespace PRAID

#endif /* PRAID_RAID_STRIPE_INPUTS_H */
