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
// 32-bit Adler checksum of parity data.
//
//----------------------------------------------------------------------------

#ifndef COMMON_CHECKSUM_H
#define COMMON_CHECKSUM_H

#include <stdint.h>
#include <stddef.h>

namespace PRAID
{

/// "Rolling" 32-bit Adler checksum, the checksum of the empty sequence is
/// kPraidNullChecksum.
const uint32_t kPraidNullChecksum = 1;

uint32_t ComputeBlockChecksum(const char* data, size_t len);
uint32_t ComputeBlockChecksum(uint32_t ckhsum, const char* buf, size_t len);

}

#endif // COMMON_CHECKSUM_H
