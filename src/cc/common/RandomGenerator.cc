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

#include "RandomGenerator.h"
#include "MsgLogger.h"

#include <openssl/rand.h>
#include <openssl/err.h>
#include <sys/time.h>
#include <unistd.h>

namespace PRAID
{

RandomGenerator::RandomGenerator()
    : mRandom(MakeSeed())
{
}

RandomGenerator::RandomGenerator(
    uint64_t inSeed)
    : mRandom(inSeed)
{
}

/* static */ uint64_t
RandomGenerator::MakeSeed()
{
    uint64_t theSeed = 0;
    if (RAND_bytes(
            reinterpret_cast<unsigned char*>(&theSeed),
            sizeof(theSeed)) == 1) {
        return theSeed;
    }
    char theBuf[256];
    ERR_error_string_n(ERR_get_error(), theBuf, sizeof(theBuf));
    PRAID_LOG_STREAM_WARN << "RAND_bytes failure: " << theBuf <<
        " using time and pid as seed" <<
    PRAID_LOG_EOM;
    struct timeval theTime;
    gettimeofday(&theTime, 0);
    theSeed = ((uint64_t)theTime.tv_sec << 20) ^ (uint64_t)theTime.tv_usec ^
        ((uint64_t)getpid() << 40);
    return theSeed;
}

} // namespace PRAID
