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
// Pthread recursive mutex and conditional variable wrappers. Any pthread
// error is treated as fatal.
//
//----------------------------------------------------------------------------

#ifndef QCMUTEX_H
#define QCMUTEX_H

#include <pthread.h>

class QCMutex
{
public:
    QCMutex();
    ~QCMutex();
    void Lock()
    {
        const int theErr = pthread_mutex_lock(&mMutex);
        if (theErr) {
            RaiseError("QCMutex::Lock", theErr);
        }
        Locked();
    }
    void Unlock()
    {
        Unlocked();
        const int theErr = pthread_mutex_unlock(&mMutex);
        if (theErr) {
            RaiseError("QCMutex::Unlock", theErr);
        }
    }
    bool IsOwned() const
        { return (0 < mLockCnt && ::pthread_equal(mOwner, ::pthread_self())); }

private:
    int             mLockCnt;
    pthread_t       mOwner;
    pthread_mutex_t mMutex;

    static void RaiseError(
        const char* inMsgPtr,
        int         inSysError = 0);
    void Locked()
    {
        if (mLockCnt++ == 0) {
            mOwner = ::pthread_self();
        }
    }
    bool Unlocked()
    {
        if (mLockCnt <= 0) {
            RaiseError("QCMutex::Unlocked: not locked");
        }
        if (--mLockCnt == 0) {
            mOwner = pthread_t();
            return true;
        }
        return false;
    }

    friend class QCCondVar;

    // No copies.
    QCMutex(const QCMutex& inMutex);
    QCMutex& operator=(const QCMutex& inMutex);
};

class QCCondVar
{
public:
    QCCondVar();
    ~QCCondVar();
    // The mutex must be locked exactly once by the caller.
    void Wait(
        QCMutex& inMutex)
    {
        if (! inMutex.Unlocked()) {
            RaiseError("QCCondVar::Wait: recursively locked mutex");
        }
        const int theErr = pthread_cond_wait(&mCond, &inMutex.mMutex);
        if (theErr) {
            RaiseError("QCCondVar::Wait", theErr);
        }
        inMutex.Locked();
    }
    void Notify()
    {
        const int theErr = pthread_cond_signal(&mCond);
        if (theErr) {
            RaiseError("QCCondVar::Notify", theErr);
        }
    }
    void NotifyAll()
    {
        const int theErr = pthread_cond_broadcast(&mCond);
        if (theErr) {
            RaiseError("QCCondVar::NotifyAll", theErr);
        }
    }

private:
    pthread_cond_t mCond;

    static void RaiseError(
        const char* inMsgPtr,
        int         inSysError = 0);

    // No copies.
    QCCondVar(const QCCondVar& inCondVar);
    QCCondVar& operator=(const QCCondVar& inCondVar);
};

#endif /* QCMUTEX_H */
