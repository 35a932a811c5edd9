//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2013/06/21
// Author: Mike Ovsiannikov
//
// Copyright 2013 Quantcast Corp.
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

#include "praidtypes.h"
#include "qcdio/QCUtils.h"

namespace PRAID
{

    string
ErrorCodeToString(int status)
{
    switch (-status) {
        case EPARITYSIZE:   return "parity file size mismatch";
        case ERENAMEFAILED: return "parity file rename failed";
        case ESTAGINGDIR:   return "staging directory failure";
        case EENCODEFAILED: return "parity encode failed";
        case 0:             return "";
        default:            break;
    }
    return QCUtils::SysError(-status);
}

} // namespace PRAID
