//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2008/11/01
// Author: Mike Ovsiannikov
//
// Copyright 2008-2010 Quantcast Corp.
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

#include "QCUtils.h"

#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <string.h>

    static int
FormatSysError(
    const char* inMsgPtr,
    int         inSysError,
    char*       inMsgBufPtr,
    size_t      inMsgBufSize)
{
    if (inMsgBufSize <= 0) {
        return 0;
    }
    char theErrBuf[256];
    theErrBuf[0] = 0;
#if defined(_GNU_SOURCE)
    const char* const theErrPtr =
        strerror_r(inSysError, theErrBuf, sizeof(theErrBuf));
#else
    const char* const theErrPtr =
        strerror_r(inSysError, theErrBuf, sizeof(theErrBuf)) == 0 ?
            theErrBuf : "";
#endif
    const int theLen = snprintf(inMsgBufPtr, inMsgBufSize, "%s%s%s %d",
        inMsgPtr ? inMsgPtr : "",
        (inMsgPtr && *inMsgPtr) ? " " : "",
        theErrPtr ? theErrPtr : "",
        inSysError
    );
    if (theLen < 0) {
        inMsgBufPtr[0] = 0;
        return 0;
    }
    return ((size_t)theLen < inMsgBufSize ? theLen : (int)inMsgBufSize - 1);
}

/* static */ void
QCUtils::FatalError(
    const char* inMsgPtr,
    int         inSysError)
{
    char theMsgBuf[1<<9];
    int  theLen = FormatSysError(
        inMsgPtr, inSysError, theMsgBuf, sizeof(theMsgBuf) - 1);
    theMsgBuf[theLen++] = '\n';
    if (write(2, theMsgBuf, theLen) < 0) {
        // Nothing can be done, abort anyway.
    }
    abort();
}

/* static */ std::string
QCUtils::SysError(
    int         inSysError,
    const char* inMsgPtr /* = 0 */)
{
    char theMsgBuf[1<<9];
    FormatSysError(inMsgPtr, inSysError, theMsgBuf, sizeof(theMsgBuf));
    return std::string(theMsgBuf);
}

/* static */ void
QCUtils::AssertionFailure(
    const char* inMsgPtr,
    const char* inFileNamePtr,
    int         inLineNum)
{
    char      theMsgBuf[1<<9];
    const int theLen = snprintf(theMsgBuf, sizeof(theMsgBuf),
        "assertion failure: %s %s:%d\n",
        inMsgPtr ? inMsgPtr : "",
        inFileNamePtr ? inFileNamePtr : "???",
        inLineNum
    );
    if (0 < theLen && write(2, theMsgBuf,
            (size_t)theLen < sizeof(theMsgBuf) ?
                theLen : sizeof(theMsgBuf) - 1) < 0) {
        // Nothing can be done, abort anyway.
    }
    abort();
}
