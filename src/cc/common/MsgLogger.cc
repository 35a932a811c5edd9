//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2005/03/01
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
//----------------------------------------------------------------------------

#include "MsgLogger.h"
#include "Properties.h"
#include "qcdio/qcstutils.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <strings.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

namespace PRAID
{

MsgLogger* MsgLogger::logger = 0;
const MsgLogger::LogLevel kMsgLoggerDefaultLogLevel =
#ifdef NDEBUG
    MsgLogger::kLogLevelINFO
#else
    MsgLogger::kLogLevelDEBUG
#endif
;

static const struct { const char* mNamePtr; MsgLogger::LogLevel mLevel; }
kMsgLoggerLogLevels[] = {
    { "FATAL",  MsgLogger::kLogLevelFATAL  },
    { "ERROR",  MsgLogger::kLogLevelERROR  },
    { "WARN",   MsgLogger::kLogLevelWARN   },
    { "NOTICE", MsgLogger::kLogLevelNOTICE },
    { "INFO",   MsgLogger::kLogLevelINFO   },
    { "DEBUG",  MsgLogger::kLogLevelDEBUG  }
};
static const size_t kMsgLoggerLogLevelsCount =
    sizeof(kMsgLoggerLogLevels) / sizeof(kMsgLoggerLogLevels[0]);

MsgLogger::MsgLogger(
    const char*         inFileNamePtr,
    MsgLogger::LogLevel inLogLevel)
    : mMutex(),
      mLogLevel(inLogLevel),
      mFd(fileno(stderr)),
      mFileName()
{
    if (inFileNamePtr && *inFileNamePtr) {
        SetFile(inFileNamePtr);
    }
}

MsgLogger::~MsgLogger()
{
    if (this == logger) {
        logger = 0;
    }
    CloseFile();
}

/* static */ bool
MsgLogger::ParseLogLevel(
    const char* inLevelNamePtr,
    LogLevel&   outLogLevel)
{
    if (! inLevelNamePtr || ! *inLevelNamePtr) {
        return false;
    }
    for (size_t i = 0; i < kMsgLoggerLogLevelsCount; i++) {
        if (strcasecmp(kMsgLoggerLogLevels[i].mNamePtr, inLevelNamePtr) == 0) {
            outLogLevel = kMsgLoggerLogLevels[i].mLevel;
            return true;
        }
    }
    return false;
}

/* static */ const char*
MsgLogger::GetLogLevelName(
    LogLevel inLogLevel)
{
    const char* theRetPtr = kMsgLoggerLogLevels[0].mNamePtr;
    for (size_t i = 0; i < kMsgLoggerLogLevelsCount; i++) {
        if (kMsgLoggerLogLevels[i].mLevel <= inLogLevel) {
            theRetPtr = kMsgLoggerLogLevels[i].mNamePtr;
        }
    }
    return theRetPtr;
}

void
MsgLogger::CloseFile()
{
    if (0 <= mFd && mFd != fileno(stderr)) {
        close(mFd);
    }
    mFd = fileno(stderr);
    mFileName.clear();
}

int
MsgLogger::SetFile(
    const char* inFileNamePtr)
{
    QCStMutexLocker theLocker(mMutex);
    if (! inFileNamePtr || ! *inFileNamePtr) {
        CloseFile();
        return 0;
    }
    if (mFileName == inFileNamePtr) {
        return 0;
    }
    const int theFd = open(inFileNamePtr,
        O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (theFd < 0) {
        const int theErr = errno;
        fprintf(stderr, "failed to open log file %s: %s\n",
            inFileNamePtr, strerror(theErr));
        return (theErr > 0 ? -theErr : -EIO);
    }
    CloseFile();
    mFd       = theFd;
    mFileName = inFileNamePtr;
    return 0;
}

void
MsgLogger::SetParameters(
    const Properties& inProps,
    const char*       inPropPrefixPtr)
{
    const string thePrefix = inPropPrefixPtr ? inPropPrefixPtr : "praid.log.";
    const char* const theLevelPtr = inProps.getValue(
        thePrefix + "logLevel", (const char*)0);
    if (theLevelPtr) {
        LogLevel theLevel = mLogLevel;
        if (ParseLogLevel(theLevelPtr, theLevel)) {
            SetLogLevel(theLevel);
        } else {
            PRAID_LOG_STREAM_ERROR <<
                "invalid log level: " << theLevelPtr <<
            PRAID_LOG_EOM;
        }
    }
    const char* const theFileNamePtr = inProps.getValue(
        thePrefix + "fileName", (const char*)0);
    if (theFileNamePtr) {
        SetFile(theFileNamePtr);
    }
}

void
MsgLogger::Put(
    LogLevel      inLogLevel,
    const string& inMsg)
{
    struct timeval theTime;
    gettimeofday(&theTime, 0);
    struct tm theTm;
    const time_t theSec = theTime.tv_sec;
    localtime_r(&theSec, &theTm);
    char theTimeBuf[64];
    const size_t theLen = strftime(
        theTimeBuf, sizeof(theTimeBuf), "%m-%d-%Y %H:%M:%S", &theTm);
    if (theLen <= 0 || sizeof(theTimeBuf) <= theLen) {
        theTimeBuf[0] = 0;
    }
    char thePrefix[128];
    const int thePrefLen = snprintf(thePrefix, sizeof(thePrefix),
        "%s.%03d %s - ",
        theTimeBuf,
        (int)(theTime.tv_usec / 1000),
        GetLogLevelName(inLogLevel)
    );
    string theLine;
    theLine.reserve(inMsg.size() + 64);
    if (0 < thePrefLen) {
        theLine.append(thePrefix,
            (size_t)thePrefLen < sizeof(thePrefix) ?
                (size_t)thePrefLen : sizeof(thePrefix) - 1);
    }
    theLine += inMsg;
    if (theLine.empty() || theLine[theLine.size() - 1] != '\n') {
        theLine += '\n';
    }
    QCStMutexLocker theLocker(mMutex);
    const char*       thePtr = theLine.data();
    const char* const theEnd = thePtr + theLine.size();
    while (thePtr < theEnd) {
        const ssize_t theNWr = write(mFd, thePtr, theEnd - thePtr);
        if (theNWr < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        thePtr += theNWr;
    }
}

void
MsgLogger::Init(
    const char* filename)
{
    Init(filename, kMsgLoggerDefaultLogLevel);
}

void
MsgLogger::Init(
    const char*         filename,
    MsgLogger::LogLevel logLevel)
{
    if (logger) {
        logger->SetLogLevel(logLevel);
        logger->SetFile(filename);
    } else {
        static MsgLogger sLogger(filename, logLevel);
        logger = &sLogger;
    }
}

void
MsgLogger::Init(
    const Properties& props,
    const char*       propPrefix)
{
    if (! logger) {
        Init(0, kMsgLoggerDefaultLogLevel);
    }
    logger->SetParameters(props, propPrefix);
}

void
MsgLogger::Stop()
{
    if (logger) {
        logger->SetFile(0);
    }
}

} // namespace PRAID
