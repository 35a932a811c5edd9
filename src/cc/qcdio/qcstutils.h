//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2008/11/01
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
// Scope lock helpers.
//
//----------------------------------------------------------------------------

#ifndef QCSTUTILS_H
#define QCSTUTILS_H

#include "QCMutex.h"

class QCStMutexLocker
{
public:
    QCStMutexLocker(
        QCMutex& inMutex)
        : mMutexPtr(&inMutex)
        { mMutexPtr->Lock(); }
    ~QCStMutexLocker()
        { Unlock(); }
    void Unlock()
    {
        if (mMutexPtr) {
            mMutexPtr->Unlock();
            mMutexPtr = 0;
        }
    }
private:
    QCMutex* mMutexPtr;

    QCStMutexLocker(const QCStMutexLocker& inLocker);
    QCStMutexLocker& operator=(const QCStMutexLocker& inLocker);
};

// Releases the lock for the scope lifetime, for example for the duration of
// a blocking io call.
class QCStMutexUnlocker
{
public:
    QCStMutexUnlocker(
        QCMutex& inMutex)
        : mMutexPtr(&inMutex)
        { mMutexPtr->Unlock(); }
    ~QCStMutexUnlocker()
        { Lock(); }
    void Lock()
    {
        if (mMutexPtr) {
            mMutexPtr->Lock();
            mMutexPtr = 0;
        }
    }
private:
    QCMutex* mMutexPtr;

    QCStMutexUnlocker(const QCStMutexUnlocker& inUnlocker);
    QCStMutexUnlocker& operator=(const QCStMutexUnlocker& inUnlocker);
};

#endif /* QCSTUTILS_H */
