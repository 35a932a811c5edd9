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
// Encoder configuration.
//
//----------------------------------------------------------------------------

#ifndef PRAID_RAID_ENCODER_CONFIG_H
#define PRAID_RAID_ENCODER_CONFIG_H

#include <string>

namespace PRAID
{
using std::string;

class Properties;

class EncoderConfig
{
public:
    EncoderConfig();
    // Reads the parameters with the given prefix, for example
    // "praid.encoder.parallelism". Invalid values are ignored with a warning,
    // the previous value is retained.
    void SetParameters(
        const Properties& inProps,
        const char*       inPrefixPtr = "praid.");
    static string GetDefaultLocalTmpDir();

    int    mParallelism;
    int    mBufSize;
    int    mLargeParityBlocks;
    int    mReadAhead;
    int    mIoFileBufferSize;
    string mLocalTmpDir;
};

} // namespace PRAID

#endif /* PRAID_RAID_ENCODER_CONFIG_H */
