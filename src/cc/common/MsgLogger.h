//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2007/10/17
//
// Copyright 2008-2012 Quantcast Corp.
// Copyright 2007-2008 Kosmix Corp.
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
// \brief A message logging facility.
//
//----------------------------------------------------------------------------

#ifndef COMMON_MSG_LOGGER_H
#define COMMON_MSG_LOGGER_H

#include "qcdio/QCMutex.h"

#include <string.h>
#include <sstream>
#include <string>

namespace PRAID
{
using std::ostream;
using std::ostringstream;
using std::string;

class Properties;

// Have a singleton logger for an application
class MsgLogger
{
public:
    enum LogLevel
    {
        kLogLevelFATAL  = 0,
        kLogLevelERROR  = 300,
        kLogLevelWARN   = 400,
        kLogLevelNOTICE = 500,
        kLogLevelINFO   = 600,
        kLogLevelDEBUG  = 700
    };
    class StStream
    {
    public:
        StStream(
            MsgLogger& inLogger,
            LogLevel   inLogLevel)
            : mLogger(inLogger),
              mLogLevel(inLogLevel),
              mStream()
            {}
        ~StStream()
            { mLogger.Put(mLogLevel, mStream.str()); }
        operator ostream& ()
            { return mStream; }
        ostream& GetStream()
            { return mStream; }
    private:
        MsgLogger&         mLogger;
        const LogLevel     mLogLevel;
        ostringstream      mStream;
    private:
        StStream(
            const StStream& inStream);
        StStream& operator=(
            const StStream& inStream);
    };

    static void Stop();
    static MsgLogger* GetLogger() { return logger; }
    static void Init(const char* filename);
    static void Init(const char* filename, LogLevel logLevel);
    static void Init(const Properties& props, const char* propPrefix = 0);
    static void SetLevel(LogLevel logLevel) {
        if (logger) {
            logger->SetLogLevel(logLevel);
        }
    }
    static bool IsLoggerInited() { return (logger != 0); }
    static const char* SourceFileName(const char* name) {
        if (! name) {
            return "";
        }
        const char* const ret = strrchr(name, '/');
        if (! ret || ! ret[1]) {
            return name;
        }
        return ret + 1;
    }
    static bool ParseLogLevel(
        const char* inLevelNamePtr,
        LogLevel&   outLogLevel);
    static const char* GetLogLevelName(
        LogLevel inLogLevel);

    void SetLogLevel(
        LogLevel inLogLevel)
        { mLogLevel = inLogLevel; }
    LogLevel GetLogLevel() const
        { return mLogLevel; }
    bool IsLogLevelEnabled(
        LogLevel inLogLevel) const
        { return (mLogLevel >= inLogLevel); }
    // Recognized parameters: "logLevel" and "fileName". The default prefix
    // is "praid.log.".
    void SetParameters(
        const Properties& inProps,
        const char*       inPropPrefixPtr);
    void Put(
        LogLevel      inLogLevel,
        const string& inMsg);
    int SetFile(
        const char* inFileNamePtr);
private:
    static MsgLogger* logger;

    QCMutex           mMutex;
    volatile LogLevel mLogLevel;
    int               mFd;
    string            mFileName;

    MsgLogger(
        const char* inFileNamePtr,
        LogLevel    inLogLevel);
    ~MsgLogger();
    void CloseFile();
    MsgLogger(const MsgLogger& other);
    MsgLogger& operator=(const MsgLogger& other);
};

// The following if prevents arguments evaluation (and possible side effect).
// Insertion has to be always terminated with PRAID_LOG_EOM, otherwise you'll
// get possibly unintelligible compile time error.
#ifndef PRAID_LOG_STREAM_START
#   define PRAID_LOG_STREAM_START(logLevel, streamVarName) \
    if (PRAID::MsgLogger::GetLogger() && \
            PRAID::MsgLogger::GetLogger()->IsLogLevelEnabled(logLevel)) {\
        PRAID::MsgLogger::StStream streamVarName( \
            *PRAID::MsgLogger::GetLogger(), logLevel); \
        streamVarName.GetStream() << "(" << \
            PRAID::MsgLogger::SourceFileName(__FILE__) << ":" << \
            __LINE__ << ") "
#endif
#ifndef PRAID_LOG_STREAM_END
#   define PRAID_LOG_STREAM_END \
    } (void)0
#endif

#ifndef PRAID_LOG_STREAM
#   define PRAID_LOG_STREAM(logLevel) \
        PRAID_LOG_STREAM_START(logLevel, _msgStream_015351104260035312)
#endif
#ifndef PRAID_LOG_EOM
#   define PRAID_LOG_EOM \
        std::flush; \
        PRAID_LOG_STREAM_END
#endif

#ifndef PRAID_LOG_STREAM_DEBUG
#   define PRAID_LOG_STREAM_DEBUG \
        PRAID_LOG_STREAM(PRAID::MsgLogger::kLogLevelDEBUG)
#endif
#ifndef PRAID_LOG_STREAM_INFO
#   define PRAID_LOG_STREAM_INFO \
        PRAID_LOG_STREAM(PRAID::MsgLogger::kLogLevelINFO)
#endif
#ifndef PRAID_LOG_STREAM_NOTICE
#   define PRAID_LOG_STREAM_NOTICE \
        PRAID_LOG_STREAM(PRAID::MsgLogger::kLogLevelNOTICE)
#endif
#ifndef PRAID_LOG_STREAM_WARN
#   define PRAID_LOG_STREAM_WARN \
        PRAID_LOG_STREAM(PRAID::MsgLogger::kLogLevelWARN)
#endif
#ifndef PRAID_LOG_STREAM_ERROR
#   define PRAID_LOG_STREAM_ERROR \
        PRAID_LOG_STREAM(PRAID::MsgLogger::kLogLevelERROR)
#endif
#ifndef PRAID_LOG_STREAM_FATAL
#   define PRAID_LOG_STREAM_FATAL \
        PRAID_LOG_STREAM(PRAID::MsgLogger::kLogLevelFATAL)
#endif

} // namespace PRAID

#endif // COMMON_MSG_LOGGER_H
