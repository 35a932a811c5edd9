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

#include "ParallelStreamReader.h"
#include "RaidStreams.h"

#include "common/MsgLogger.h"
#include "qcdio/QCMutex.h"
#include "qcdio/QCThread.h"
#include "qcdio/QCUtils.h"
#include "qcdio/qcdebug.h"
#include "qcdio/qcstutils.h"

#include <errno.h>
#include <string.h>

#include <algorithm>
#include <deque>

namespace PRAID
{
using std::deque;
using std::max;
using std::min;

class ParallelStreamReader::Impl
{
public:
    Impl(
        const vector<InputStream*>& inStreams,
        int                         inChunkSize,
        int                         inParallelism,
        int                         inQueueCapacity,
        praidOff_t                  inMaxBytesPerStream)
        : mStreams(inStreams),
          mChunkSize(max(1, inChunkSize)),
          mReaderCount(min(max(1, inParallelism), max(1, (int)inStreams.size()))),
          mQueueCapacity(max(1, inQueueCapacity)),
          mMaxBytesPerStream(max(praidOff_t(0), inMaxBytesPerStream)),
          mResultCount(mQueueCapacity + 2),
          mMutex(),
          mTaskCond(),
          mCoordinatorCond(),
          mReadyCond(),
          mResultsPtr(0),
          mThreadsPtr(0),
          mThreadCount(0),
          mFree(),
          mReady(),
          mTasks(),
          mCurrentPtr(0),
          mConsumerPtr(0),
          mPendingCount(0),
          mStartedFlag(false),
          mStopFlag(false),
          mDoneFlag(false),
          mInterruptFlag(false),
          mShutdownFlag(false)
        {}
    ~Impl()
    {
        Shutdown();
        delete [] mThreadsPtr;
        if (mResultsPtr) {
            for (int i = 0; i < mResultCount; i++) {
                vector<char*>& theBufs = mResultsPtr[i].mBuffers;
                for (size_t k = 0; k < theBufs.size(); k++) {
                    delete [] theBufs[k];
                }
            }
            delete [] mResultsPtr;
        }
    }
    int Start()
    {
        QCStMutexLocker theLocker(mMutex);
        if (mStartedFlag || mShutdownFlag) {
            return -EINVAL;
        }
        mStartedFlag = true;
        mResultsPtr  = new ReadResult[mResultCount];
        for (int i = 0; i < mResultCount; i++) {
            ReadResult& theResult = mResultsPtr[i];
            theResult.mBuffers.resize(mStreams.size(), (char*)0);
            for (size_t k = 0; k < mStreams.size(); k++) {
                theResult.mBuffers[k] = new char[mChunkSize];
            }
            mFree.push_back(&theResult);
        }
        PRAID_LOG_STREAM_DEBUG <<
            "parallel reader: streams: " << mStreams.size() <<
            " readers: "                 << mReaderCount <<
            " chunk: "                   << mChunkSize <<
            " queue: "                   << mQueueCapacity <<
            " max bytes: "               << mMaxBytesPerStream <<
        PRAID_LOG_EOM;
        mThreadsPtr = new WorkerThread[mReaderCount + 1];
        const int kStackSize = 256 << 10;
        for (mThreadCount = 0;
                mThreadCount < mReaderCount + 1;
                mThreadCount++) {
            const int theRet = mThreadsPtr[mThreadCount].Start(
                *this,
                mThreadCount - 1, // -1 is coordinator.
                kStackSize,
                mThreadCount == 0 ? "PRCoordinator" : "PRReader"
            );
            if (theRet != 0) {
                PRAID_LOG_STREAM_ERROR <<
                    "parallel reader: failed to start thread: " <<
                    mThreadCount << " " << QCThread::GetErrorMsg(theRet) <<
                PRAID_LOG_EOM;
                theLocker.Unlock();
                Shutdown();
                return (theRet > 0 ? -theRet : -EAGAIN);
            }
        }
        return 0;
    }
    int GetReadResult(
        const ReadResult*& outResultPtr)
    {
        outResultPtr = 0;
        QCStMutexLocker theLocker(mMutex);
        if (mConsumerPtr) {
            mFree.push_back(mConsumerPtr);
            mConsumerPtr = 0;
            mCoordinatorCond.Notify();
        }
        if (mShutdownFlag || ! mStartedFlag) {
            return -EIO;
        }
        while (mReady.empty() && ! mDoneFlag && ! mInterruptFlag) {
            mReadyCond.Wait(mMutex);
        }
        if (mInterruptFlag) {
            return -EINTR;
        }
        if (mReady.empty()) {
            return -EIO;
        }
        mConsumerPtr = mReady.front();
        mReady.pop_front();
        // Room in the queue, the coordinator can read the next chunk while
        // the caller processes this one.
        mCoordinatorCond.Notify();
        outResultPtr = mConsumerPtr;
        return 0;
    }
    void Interrupt()
    {
        QCStMutexLocker theLocker(mMutex);
        mInterruptFlag = true;
        mReadyCond.NotifyAll();
    }
    void Shutdown()
    {
        QCStMutexLocker theLocker(mMutex);
        if (mShutdownFlag) {
            return;
        }
        mShutdownFlag = true;
        mStopFlag     = true;
        mTaskCond.NotifyAll();
        mCoordinatorCond.NotifyAll();
        mReadyCond.NotifyAll();
        for (int i = 0; i < mThreadCount; i++) {
            QCThread& theThread = mThreadsPtr[i];
            QCStMutexUnlocker theUnlock(mMutex);
            theThread.Join();
        }
        mThreadCount = 0;
        mTasks.clear();
        mReady.clear();
        mCurrentPtr  = 0;
        mConsumerPtr = 0;
        theLocker.Unlock();
        const int theStatus = RaidUtils::CloseStreams(mStreams);
        PRAID_LOG_STREAM_DEBUG <<
            "parallel reader: shutdown, streams closed: " <<
                mStreams.size() <<
            " status: " << theStatus <<
        PRAID_LOG_EOM;
    }
private:
    class WorkerThread : public QCThread
    {
    public:
        WorkerThread()
            : QCThread(),
              mImplPtr(0),
              mIndex(-1)
            {}
        virtual ~WorkerThread()
            {}
        virtual void Run()
        {
            QCASSERT(mImplPtr);
            if (mIndex < 0) {
                mImplPtr->RunCoordinator();
            } else {
                mImplPtr->RunReader();
            }
        }
        int Start(
            Impl&       inImpl,
            int         inIndex,
            int         inStackSize,
            const char* inNamePtr)
        {
            mImplPtr = &inImpl;
            mIndex   = inIndex;
            return TryToStart(this, inStackSize, inNamePtr);
        }
    private:
        Impl* mImplPtr;
        int   mIndex;
    };
    typedef deque<ReadResult*> Results;
    typedef deque<int>         Tasks;

    const vector<InputStream*> mStreams;
    const int                  mChunkSize;
    const int                  mReaderCount;
    const int                  mQueueCapacity;
    const praidOff_t           mMaxBytesPerStream;
    const int                  mResultCount;
    QCMutex                    mMutex;
    QCCondVar                  mTaskCond;
    QCCondVar                  mCoordinatorCond;
    QCCondVar                  mReadyCond;
    ReadResult*                mResultsPtr;
    WorkerThread*              mThreadsPtr;
    int                        mThreadCount;
    Results                    mFree;
    Results                    mReady;
    Tasks                      mTasks;
    ReadResult*                mCurrentPtr;
    ReadResult*                mConsumerPtr;
    int                        mPendingCount;
    bool                       mStartedFlag;
    bool                       mStopFlag;
    bool                       mDoneFlag;
    bool                       mInterruptFlag;
    bool                       mShutdownFlag;

    void RunCoordinator()
    {
        QCStMutexLocker theLocker(mMutex);
        const praidOff_t theChunkCount =
            (mMaxBytesPerStream + mChunkSize - 1) / mChunkSize;
        for (praidOff_t i = 0; i < theChunkCount && ! mStopFlag; i++) {
            while (! mStopFlag && (mFree.empty() ||
                    mQueueCapacity <= (int)mReady.size())) {
                mCoordinatorCond.Wait(mMutex);
            }
            if (mStopFlag) {
                break;
            }
            ReadResult& theResult = *(mFree.front());
            mFree.pop_front();
            theResult.mOffset      = i * mChunkSize;
            theResult.mLength      = (int)min(praidOff_t(mChunkSize),
                mMaxBytesPerStream - theResult.mOffset);
            theResult.mStatus      = 0;
            theResult.mFailedIndex = -1;
            mCurrentPtr   = &theResult;
            mPendingCount = (int)mStreams.size();
            for (int k = 0; k < (int)mStreams.size(); k++) {
                mTasks.push_back(k);
            }
            mTaskCond.NotifyAll();
            // Barrier: the chunk is published only when every stream
            // slice is done.
            while (0 < mPendingCount && ! mStopFlag) {
                mCoordinatorCond.Wait(mMutex);
            }
            mCurrentPtr = 0;
            if (mStopFlag) {
                break;
            }
            mReady.push_back(&theResult);
            mReadyCond.Notify();
            if (theResult.mStatus != 0) {
                break;
            }
        }
        mDoneFlag = true;
        mReadyCond.NotifyAll();
    }
    void RunReader()
    {
        QCStMutexLocker theLocker(mMutex);
        for (; ;) {
            while (mTasks.empty() && ! mStopFlag) {
                mTaskCond.Wait(mMutex);
            }
            if (mStopFlag) {
                break;
            }
            const int theIdx = mTasks.front();
            mTasks.pop_front();
            QCASSERT(mCurrentPtr);
            ReadResult& theResult = *mCurrentPtr;
            if (theResult.mStatus == 0) {
                InputStream& theStream = *(mStreams[theIdx]);
                char* const  theBufPtr = theResult.mBuffers[theIdx];
                const int    theLength = theResult.mLength;
                ssize_t      theNRd;
                {
                    QCStMutexUnlocker theUnlock(mMutex);
                    theNRd = RaidUtils::ReadTillEnd(
                        theStream, theBufPtr, (size_t)theLength);
                    if (0 <= theNRd && theLength < mChunkSize) {
                        memset(theBufPtr + theLength, 0,
                            mChunkSize - theLength);
                    }
                }
                if (theNRd < 0 && theResult.mStatus == 0) {
                    theResult.mStatus      = (int)theNRd;
                    theResult.mFailedIndex = theIdx;
                    PRAID_LOG_STREAM_ERROR <<
                        "parallel reader: " << theStream.GetName() <<
                        " index: "  << theIdx <<
                        " offset: " << theResult.mOffset <<
                        " read failure: " <<
                            ErrorCodeToString(theResult.mStatus) <<
                    PRAID_LOG_EOM;
                }
            }
            if (--mPendingCount <= 0) {
                mCoordinatorCond.Notify();
            }
        }
    }
private:
    Impl(
        const Impl& inImpl);
    Impl& operator=(
        const Impl& inImpl);
};

ParallelStreamReader::ParallelStreamReader(
    const vector<InputStream*>& inStreams,
    int                         inChunkSize,
    int                         inParallelism,
    int                         inQueueCapacity,
    praidOff_t                  inMaxBytesPerStream)
    : mImpl(*(new Impl(inStreams, inChunkSize, inParallelism,
        inQueueCapacity, inMaxBytesPerStream)))
{
}

ParallelStreamReader::~ParallelStreamReader()
{
    delete &mImpl;
}

    int
ParallelStreamReader::Start()
{
    return mImpl.Start();
}

    int
ParallelStreamReader::GetReadResult(
    const ReadResult*& outResultPtr)
{
    return mImpl.GetReadResult(outResultPtr);
}

    void
ParallelStreamReader::Interrupt()
{
    mImpl.Interrupt();
}

    void
ParallelStreamReader::Shutdown()
{
    mImpl.Shutdown();
}

} // namespace PRAID
