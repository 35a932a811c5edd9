//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2006/10/20
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
// \brief Common declarations: status codes, defaults, erasure code method
// ids.
//
//----------------------------------------------------------------------------

#ifndef COMMON_PRAIDTYPES_H
#define COMMON_PRAIDTYPES_H

#include <stdint.h>
#include <stddef.h>
#include <string>

namespace PRAID {

using std::string;

typedef int64_t praidOff_t;   //!< file offset and length

// Status codes. All functions return 0 or a positive count on success, and
// a negative errno or a negative project code below on failure.

// The staged parity file length does not match the computed geometry.
const int EPARITYSIZE = 1100;

// Publishing rename of the staged parity file failed.
const int ERENAMEFAILED = 1101;

// Staging directory or staging file cannot be created.
const int ESTAGINGDIR = 1102;

// The bulk encode function reported failure.
const int EENCODEFAILED = 1103;

const praidOff_t kPraidDefaultBlockSize = praidOff_t(64) << 20;

const int   kPraidDefaultParallelism          = 4;
const int   kPraidDefaultBufSize              = 1 << 20;
const int   kPraidMinBufSize                  = 1 << 10;
const int   kPraidDefaultLargeParityBlocks    = 20;
const int   kPraidDefaultReadAhead            = 1;
const int   kPraidDefaultIoFileBufferSize     = 64 << 10;
const short kPraidStagingReplication          = 2;

enum ECMethodType
{
    PRAID_EC_METHOD_UNKNOWN     = 0,
    PRAID_EC_METHOD_XOR         = 1,
    PRAID_EC_METHOD_RS_JERASURE = 2
};

string ErrorCodeToString(int status);

}

#endif // COMMON_PRAIDTYPES_H
