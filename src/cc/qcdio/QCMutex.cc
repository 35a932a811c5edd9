//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2008/10/30
// Author: Mike Ovsiannikov
//
// Copyright 2008-2011 Quantcast Corp.
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

#include "QCMutex.h"
#include "QCUtils.h"

QCMutex::QCMutex()
    : mLockCnt(0),
      mOwner(),
      mMutex()
{
    pthread_mutexattr_t theAttr;
    int                 theErr;
    if ((theErr = pthread_mutexattr_init(&theAttr)) != 0) {
        RaiseError("QCMutex: pthread_mutexattr_init", theErr);
    }
    if ((theErr = pthread_mutexattr_settype(
            &theAttr, PTHREAD_MUTEX_RECURSIVE)) != 0) {
        RaiseError("QCMutex: pthread_mutexattr_settype", theErr);
    }
    if ((theErr = pthread_mutex_init(&mMutex, &theAttr)) != 0) {
        RaiseError("QCMutex: pthread_mutex_init", theErr);
    }
    if ((theErr = pthread_mutexattr_destroy(&theAttr)) != 0) {
        RaiseError("QCMutex: pthread_mutexattr_destroy", theErr);
    }
}

QCMutex::~QCMutex()
{
    const int theErr = pthread_mutex_destroy(&mMutex);
    if (theErr != 0) {
        RaiseError("QCMutex::~QCMutex: pthread_mutex_destroy", theErr);
    }
}

/* static */ void
QCMutex::RaiseError(
    const char* inMsgPtr,
    int         inSysError)
{
    QCUtils::FatalError(inMsgPtr, inSysError);
}

QCCondVar::QCCondVar()
    : mCond()
{
    const int theErr = pthread_cond_init(&mCond, 0);
    if (theErr) {
        RaiseError("QCCondVar::QCCondVar: pthread_cond_init", theErr);
    }
}

QCCondVar::~QCCondVar()
{
    const int theErr = pthread_cond_destroy(&mCond);
    if (theErr) {
        RaiseError("QCCondVar::~QCCondVar: pthread_cond_destroy", theErr);
    }
}

/* static */ void
QCCondVar::RaiseError(
    const char* inMsgPtr,
    int         inSysError)
{
    QCUtils::FatalError(inMsgPtr, inSysError);
}
