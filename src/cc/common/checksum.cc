//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2006/09/12
// Author: Sriram Rao
//
// Copyright 2008-2012 Quantcast Corp.
// Copyright 2006-2008 Kosmix Corp.
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
// An adaptation of the 32-bit Adler checksum algorithm
//
//----------------------------------------------------------------------------

#include "checksum.h"

#include <algorithm>
#include <zlib.h>

namespace PRAID {

using std::min;

static inline uint32_t
PraidChecksum(uint32_t chksum, const void* buf, size_t len)
{
    // zlib takes uInt length, feed large buffers in pieces.
    const char* ptr = reinterpret_cast<const char*>(buf);
    uint32_t    ret = chksum;
    while (0 < len) {
        const size_t n = min(len, size_t(1) << 30);
        ret = adler32(ret, reinterpret_cast<const Bytef*>(ptr), (uInt)n);
        ptr += n;
        len -= n;
    }
    return ret;
}

uint32_t
ComputeBlockChecksum(const char* buf, size_t len)
{
    return PraidChecksum(kPraidNullChecksum, buf, len);
}

uint32_t
ComputeBlockChecksum(uint32_t ckhsum, const char* buf, size_t len)
{
    return PraidChecksum(ckhsum, buf, len);
}

} // namespace PRAID
