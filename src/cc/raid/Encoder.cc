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

#include "Encoder.h"
#include "ProgressReporter.h"
#include "RaidStreams.h"
#include "StripeInputs.h"

#include "common/MsgLogger.h"
#include "fs/FileSystem.h"

#include <boost/lexical_cast.hpp>

#include <errno.h>
#include <iomanip>
#include <vector>

namespace PRAID
{
using std::vector;
using std::hex;
using std::dec;

// Removes the staging file on destruction, unless disarmed after the
// successful rename.
class Encoder::StagingGuard
{
public:
    StagingGuard(
        FileSystem&   inFs,
        const string& inName)
        : mFs(inFs),
          mName(inName),
          mArmedFlag(false)
        {}
    ~StagingGuard()
    {
        if (! mArmedFlag) {
            return;
        }
        const int theStatus = mFs.Remove(mName, false);
        if (theStatus < 0) {
            PRAID_LOG_STREAM_ERROR <<
                "staging: " << mName <<
                " remove failure: " << ErrorCodeToString(theStatus) <<
            PRAID_LOG_EOM;
        } else {
            PRAID_LOG_STREAM_DEBUG <<
                "staging: " << mName << " removed" <<
            PRAID_LOG_EOM;
        }
    }
    void Arm()
        { mArmedFlag = true; }
    void Disarm()
        { mArmedFlag = false; }
private:
    FileSystem&  mFs;
    const string mName;
    bool         mArmedFlag;
private:
    StagingGuard(
        const StagingGuard& inGuard);
    StagingGuard& operator=(
        const StagingGuard& inGuard);
};

// Local scratch files for parity positions 1 and above. The files are
// created once per encode, truncated for every stripe, and removed on
// destruction.
class Encoder::ScratchFiles
{
public:
    ScratchFiles(
        FileSystem& inFs)
        : mFs(inFs),
          mNames(),
          mStreams()
        {}
    ~ScratchFiles()
    {
        CloseAll();
        for (vector<string>::const_iterator theIt = mNames.begin();
                theIt != mNames.end();
                ++theIt) {
            const int theStatus = mFs.Remove(*theIt, false);
            if (theStatus < 0 && theStatus != -ENOENT) {
                PRAID_LOG_STREAM_ERROR <<
                    "scratch: " << *theIt <<
                    " remove failure: " << ErrorCodeToString(theStatus) <<
                PRAID_LOG_EOM;
            } else {
                PRAID_LOG_STREAM_DEBUG <<
                    "scratch: " << *theIt << " removed" <<
                PRAID_LOG_EOM;
            }
        }
    }
    void SetNames(
        const string& inBaseName,
        int           inCount)
    {
        mNames.clear();
        for (int i = 0; i < inCount; i++) {
            mNames.push_back(inBaseName + "." +
                boost::lexical_cast<string>(i + 1));
        }
    }
    // Creates, or truncates, all scratch files.
    int Create(
        int        inBufferSize,
        praidOff_t inBlockSize)
    {
        CloseAll();
        for (vector<string>::const_iterator theIt = mNames.begin();
                theIt != mNames.end();
                ++theIt) {
            OutputStream* theStreamPtr = 0;
            const int theStatus = FsOutputStream::Create(
                mFs, *theIt, true, inBufferSize, 1, inBlockSize,
                theStreamPtr);
            if (theStatus < 0) {
                PRAID_LOG_STREAM_ERROR <<
                    "scratch: " << *theIt <<
                    " create failure: " << ErrorCodeToString(theStatus) <<
                PRAID_LOG_EOM;
                CloseAll();
                return theStatus;
            }
            PRAID_LOG_STREAM_DEBUG <<
                "scratch: " << *theIt << " created" <<
            PRAID_LOG_EOM;
            mStreams.push_back(theStreamPtr);
        }
        return 0;
    }
    int Close()
        { return RaidUtils::CloseStreams(mStreams); }
    const vector<OutputStream*>& GetStreams() const
        { return mStreams; }
    const vector<string>& GetNames() const
        { return mNames; }
private:
    FileSystem&           mFs;
    vector<string>        mNames;
    vector<OutputStream*> mStreams;

    void CloseAll()
    {
        const int theStatus = Close();
        if (theStatus < 0) {
            PRAID_LOG_STREAM_DEBUG <<
                "scratch: close status: " << theStatus <<
            PRAID_LOG_EOM;
        }
        for (vector<OutputStream*>::iterator theIt = mStreams.begin();
                theIt != mStreams.end();
                ++theIt) {
            delete *theIt;
        }
        mStreams.clear();
    }
private:
    ScratchFiles(
        const ScratchFiles& inFiles);
    ScratchFiles& operator=(
        const ScratchFiles& inFiles);
};

    /* static */ Encoder::Geometry
Encoder::Geometry::Compute(
    praidOff_t inSrcSize,
    praidOff_t inBlockSize,
    int        inStripeLength,
    int        inParityLength)
{
    Geometry theRet;
    if (inSrcSize <= 0 || inBlockSize <= 0 || inStripeLength <= 0) {
        return theRet;
    }
    theRet.mDataBlocks   = (inSrcSize + inBlockSize - 1) / inBlockSize;
    theRet.mStripes      =
        (theRet.mDataBlocks + inStripeLength - 1) / inStripeLength;
    theRet.mParityBlocks = theRet.mStripes * inParityLength;
    theRet.mParitySize   = theRet.mParityBlocks * inBlockSize;
    return theRet;
}

Encoder::Encoder(
    const CodecPtr&      inCodecPtr,
    const EncoderConfig& inConfig)
    : mCodecPtr(inCodecPtr),
      mConfig(inConfig),
      mRandom(),
      mOwnedFsPtr(FileSystem::CreateLocal()),
      mScratchFs(*mOwnedFsPtr),
      mStripeEncoder(inCodecPtr, inConfig),
      mCopyBuf(new char[inConfig.mBufSize])
{
}

Encoder::Encoder(
    const CodecPtr&      inCodecPtr,
    const EncoderConfig& inConfig,
    uint64_t             inSeed,
    FileSystem*          inScratchFsPtr)
    : mCodecPtr(inCodecPtr),
      mConfig(inConfig),
      mRandom(inSeed),
      mOwnedFsPtr(inScratchFsPtr ? 0 : FileSystem::CreateLocal()),
      mScratchFs(inScratchFsPtr ? *inScratchFsPtr : *mOwnedFsPtr),
      mStripeEncoder(inCodecPtr, inConfig),
      mCopyBuf(new char[inConfig.mBufSize])
{
}

Encoder::~Encoder()
{
}

    void
Encoder::Interrupt()
{
    mStripeEncoder.Interrupt();
}

    /* static */ string
Encoder::MakeScratchBaseName(
    const string& inParityFile)
{
    const size_t thePos = inParityFile.rfind('/');
    return (thePos == string::npos ?
        inParityFile : inParityFile.substr(thePos + 1));
}

    static string
GetParentDir(
    const string& inPathName)
{
    const size_t thePos = inPathName.rfind('/');
    if (thePos == string::npos) {
        return string();
    }
    return (thePos == 0 ? string("/") : inPathName.substr(0, thePos));
}

    int
Encoder::EncodeFile(
    FileSystem&       inSrcFs,
    const string&     inSrcFile,
    FileSystem&       inParityFs,
    const string&     inParityFile,
    int16_t           inParityRepl,
    ProgressReporter& inReporter)
{
    mStripeEncoder.ClearInterrupt();

    const Codec& theCodec = *mCodecPtr;
    FileSystem::StatBuf theSrcStat;
    int theStatus = inSrcFs.Stat(inSrcFile, theSrcStat);
    if (theStatus < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "encode: " << inSrcFile <<
            " stat failure: " << ErrorCodeToString(theStatus) <<
        PRAID_LOG_EOM;
        return theStatus;
    }
    if (theSrcStat.mDirFlag) {
        PRAID_LOG_STREAM_ERROR <<
            "encode: " << inSrcFile << " is a directory" <<
        PRAID_LOG_EOM;
        return -EISDIR;
    }
    const praidOff_t theBlockSize = theSrcStat.mBlockSize;
    if (theBlockSize <= 0 || inParityRepl <= 0) {
        PRAID_LOG_STREAM_ERROR <<
            "encode: " << inSrcFile <<
            " invalid block size: " << theBlockSize <<
            " or replication: "     << inParityRepl <<
        PRAID_LOG_EOM;
        return -EINVAL;
    }
    const Geometry theGeometry = Geometry::Compute(
        theSrcStat.mLength,
        theBlockSize,
        theCodec.GetStripeLength(),
        theCodec.GetParityLength()
    );
    const string& theStagingDir = theCodec.GetStagingDir();
    theStatus = inParityFs.Mkdirs(theStagingDir);
    if (theStatus < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "encode: staging directory: " << theStagingDir <<
            " create failure: " << ErrorCodeToString(theStatus) <<
        PRAID_LOG_EOM;
        return -ESTAGINGDIR;
    }
    string theTmpName = theStagingDir;
    if (theTmpName.empty() || theTmpName[theTmpName.size() - 1] != '/') {
        theTmpName += '/';
    }
    theTmpName += MakeScratchBaseName(inParityFile);
    theTmpName += boost::lexical_cast<string>(mRandom.Next());
    const int16_t theStagingRepl =
        (inParityRepl == 1 &&
            theGeometry.mParityBlocks >= mConfig.mLargeParityBlocks) ?
        kPraidStagingReplication : inParityRepl;

    PRAID_LOG_STREAM_INFO <<
        "encode: " << inSrcFile <<
        " size: "          << theSrcStat.mLength <<
        " block size: "    << theBlockSize <<
        " codec: "         << theCodec.GetId() <<
        " stripes: "       << theGeometry.mStripes <<
        " parity blocks: " << theGeometry.mParityBlocks <<
        " staging: "       << theTmpName <<
        " replication: "   << theStagingRepl <<
    PRAID_LOG_EOM;

    StagingGuard theStagingGuard(inParityFs, theTmpName);
    OutputStream* theStreamPtr = 0;
    theStatus = FsOutputStream::Create(
        inParityFs,
        theTmpName,
        true,
        mConfig.mIoFileBufferSize,
        theStagingRepl,
        theBlockSize,
        theStreamPtr
    );
    if (theStatus < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "encode: staging file: " << theTmpName <<
            " create failure: " << ErrorCodeToString(theStatus) <<
        PRAID_LOG_EOM;
        return -ESTAGINGDIR;
    }
    theStagingGuard.Arm();
    // The stream has to be destroyed before the guard removes the file.
    boost::scoped_ptr<OutputStream> theStagingPtr(theStreamPtr);
    ChecksumOutputStream theChecksumStream(*theStagingPtr);
    theStatus = EncodeStripes(
        inSrcFs,
        inSrcFile,
        theSrcStat.mLength,
        theBlockSize,
        theGeometry,
        inParityFile,
        theChecksumStream,
        inReporter
    );
    const int theCloseStatus = theStagingPtr->Close();
    if (theStatus != 0) {
        return theStatus;
    }
    if (theCloseStatus < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "encode: staging file: " << theTmpName <<
            " close failure: " << ErrorCodeToString(theCloseStatus) <<
        PRAID_LOG_EOM;
        return theCloseStatus;
    }
    FileSystem::StatBuf theStagingStat;
    theStatus = inParityFs.Stat(theTmpName, theStagingStat);
    if (theStatus < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "encode: staging file: " << theTmpName <<
            " stat failure: " << ErrorCodeToString(theStatus) <<
        PRAID_LOG_EOM;
        return theStatus;
    }
    if (theStagingStat.mLength != theGeometry.mParitySize) {
        PRAID_LOG_STREAM_ERROR <<
            "encode: staging file: " << theTmpName <<
            " size: "     << theStagingStat.mLength <<
            " expected: " << theGeometry.mParitySize <<
        PRAID_LOG_EOM;
        return -EPARITYSIZE;
    }
    theStatus = inParityFs.Exists(inParityFile);
    if (0 < theStatus) {
        theStatus = inParityFs.Remove(inParityFile, false);
        if (theStatus < 0) {
            PRAID_LOG_STREAM_ERROR <<
                "encode: " << inParityFile <<
                " remove failure: " << ErrorCodeToString(theStatus) <<
            PRAID_LOG_EOM;
            return theStatus;
        }
        PRAID_LOG_STREAM_INFO <<
            "encode: removed existing parity file: " << inParityFile <<
        PRAID_LOG_EOM;
    } else if (theStatus < 0) {
        return theStatus;
    }
    const string theParentDir = GetParentDir(inParityFile);
    if (! theParentDir.empty()) {
        theStatus = inParityFs.Mkdirs(theParentDir);
        if (theStatus < 0) {
            PRAID_LOG_STREAM_ERROR <<
                "encode: " << theParentDir <<
                " create failure: " << ErrorCodeToString(theStatus) <<
            PRAID_LOG_EOM;
            return theStatus;
        }
    }
    if (theStagingRepl != inParityRepl) {
        theStatus = inParityFs.SetReplication(theTmpName, inParityRepl);
        if (theStatus < 0) {
            PRAID_LOG_STREAM_ERROR <<
                "encode: staging file: " << theTmpName <<
                " set replication: " << inParityRepl <<
                " failure: " << ErrorCodeToString(theStatus) <<
            PRAID_LOG_EOM;
            return theStatus;
        }
    }
    theStatus = inParityFs.Rename(theTmpName, inParityFile);
    if (theStatus < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "encode: rename: " << theTmpName <<
            " to: " << inParityFile <<
            " failure: " << ErrorCodeToString(theStatus) <<
        PRAID_LOG_EOM;
        return -ERENAMEFAILED;
    }
    theStagingGuard.Disarm();
    PRAID_LOG_STREAM_INFO <<
        "encode: " << inSrcFile <<
        " parity: "   << inParityFile <<
        " size: "     << theChecksumStream.GetWrittenCount() <<
        " adler32: 0x" << hex << theChecksumStream.GetChecksum() << dec <<
    PRAID_LOG_EOM;
    return 0;
}

    int
Encoder::EncodeStripes(
    FileSystem&       inSrcFs,
    const string&     inSrcFile,
    praidOff_t        inSrcSize,
    praidOff_t        inBlockSize,
    const Geometry&   inGeometry,
    const string&     inParityFile,
    OutputStream&     inStagingStream,
    ProgressReporter& inReporter)
{
    const Codec& theCodec       = *mCodecPtr;
    const int    theStripeLen   = theCodec.GetStripeLength();
    const int    theParityLen   = theCodec.GetParityLength();
    ScratchFiles theScratchFiles(mScratchFs);
    if (1 < theParityLen) {
        string theBaseName = mConfig.mLocalTmpDir;
        if (theBaseName.empty() ||
                theBaseName[theBaseName.size() - 1] != '/') {
            theBaseName += '/';
        }
        theBaseName += MakeScratchBaseName(inParityFile);
        theBaseName += ".";
        theBaseName += boost::lexical_cast<string>(mRandom.Next());
        theScratchFiles.SetNames(theBaseName, theParityLen - 1);
    }
    vector<OutputStream*> theOutputs(theParityLen, (OutputStream*)0);
    theOutputs[0] = &inStagingStream;
    StripeInputs          theInputs;
    for (praidOff_t theStripe = 0;
            theStripe < inGeometry.mStripes;
            theStripe++) {
        const praidOff_t theStripeStart =
            theStripe * inBlockSize * theStripeLen;
        PRAID_LOG_STREAM_DEBUG <<
            "encode: " << inSrcFile <<
            " stripe: " << theStripe <<
            " of: "     << inGeometry.mStripes <<
            " start: "  << theStripeStart <<
        PRAID_LOG_EOM;
        int theStatus = theInputs.Open(
            inSrcFs,
            inSrcFile,
            theStripeStart,
            theStripeLen,
            inSrcSize,
            inBlockSize,
            mConfig.mIoFileBufferSize
        );
        if (theStatus < 0) {
            return theStatus;
        }
        if (1 < theParityLen) {
            theStatus = theScratchFiles.Create(
                mConfig.mIoFileBufferSize, inBlockSize);
            if (theStatus < 0) {
                return theStatus;
            }
            const vector<OutputStream*>& theStreams =
                theScratchFiles.GetStreams();
            for (int i = 1; i < theParityLen; i++) {
                theOutputs[i] = theStreams[i - 1];
            }
        }
        theStatus = mStripeEncoder.EncodeStripe(
            theInputs.Get(), theOutputs, inBlockSize, inReporter);
        theInputs.Clear();
        const int theCloseStatus = theScratchFiles.Close();
        if (theStatus != 0) {
            return theStatus;
        }
        if (theCloseStatus < 0) {
            PRAID_LOG_STREAM_ERROR <<
                "encode: scratch file close failure: " <<
                    ErrorCodeToString(theCloseStatus) <<
            PRAID_LOG_EOM;
            return theCloseStatus;
        }
        const vector<string>& theNames = theScratchFiles.GetNames();
        for (vector<string>::const_iterator theIt = theNames.begin();
                theIt != theNames.end();
                ++theIt) {
            InputStream* theStreamPtr = 0;
            theStatus = FsInputStream::Open(mScratchFs, *theIt, 0,
                mConfig.mIoFileBufferSize, theStreamPtr);
            if (theStatus < 0) {
                PRAID_LOG_STREAM_ERROR <<
                    "encode: scratch file: " << *theIt <<
                    " open failure: " << ErrorCodeToString(theStatus) <<
                PRAID_LOG_EOM;
                return theStatus;
            }
            boost::scoped_ptr<InputStream> theInPtr(theStreamPtr);
            theStatus = RaidUtils::CopyBytes(
                *theInPtr,
                inStagingStream,
                mCopyBuf.get(),
                (size_t)mConfig.mBufSize,
                inBlockSize
            );
            const int theInCloseStatus = theInPtr->Close();
            if (theStatus == 0) {
                theStatus = theInCloseStatus;
            }
            if (theStatus < 0) {
                PRAID_LOG_STREAM_ERROR <<
                    "encode: scratch file: " << *theIt <<
                    " copy failure: " << ErrorCodeToString(theStatus) <<
                PRAID_LOG_EOM;
                return theStatus;
            }
            inReporter.Progress();
        }
    }
    return 0;
}

    int
Encoder::RecoverParityBlockToStream(
    FileSystem&       inFs,
    const string&     inSrcFile,
    praidOff_t        inSrcSize,
    praidOff_t        inBlockSize,
    const string&     inParityFile,
    praidOff_t        inCorruptOffset,
    OutputStream&     inOutStream,
    ProgressReporter& inReporter,
    uint32_t*         outChecksumPtr)
{
    mStripeEncoder.ClearInterrupt();

    if (inBlockSize <= 0 || inCorruptOffset < 0 || inSrcSize < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "recover: " << inParityFile <<
            " invalid block size: " << inBlockSize <<
            " offset: "             << inCorruptOffset <<
            " source size: "        << inSrcSize <<
        PRAID_LOG_EOM;
        return -EINVAL;
    }
    const Codec&     theCodec      = *mCodecPtr;
    const int        theStripeLen  = theCodec.GetStripeLength();
    const int        theParityLen  = theCodec.GetParityLength();
    const praidOff_t theBlockIdx   = inCorruptOffset / inBlockSize;
    const int        theTargetIdx  = (int)(theBlockIdx % theParityLen);
    const praidOff_t theStripeIdx  = theBlockIdx / theParityLen;
    const praidOff_t theStripeStart =
        theStripeIdx * inBlockSize * theStripeLen;

    PRAID_LOG_STREAM_INFO <<
        "recover: " << inParityFile <<
        " offset: "       << inCorruptOffset <<
        " block: "        << theBlockIdx <<
        " stripe: "       << theStripeIdx <<
        " parity index: " << theTargetIdx <<
        " source: "       << inSrcFile <<
        " start: "        << theStripeStart <<
    PRAID_LOG_EOM;

    NullOutputStream      theNullStream;
    ChecksumOutputStream  theChecksumStream(inOutStream);
    vector<OutputStream*> theOutputs(theParityLen, &theNullStream);
    theOutputs[theTargetIdx] = &theChecksumStream;

    StripeInputs theInputs;
    int theStatus = theInputs.Open(
        inFs,
        inSrcFile,
        theStripeStart,
        theStripeLen,
        inSrcSize,
        inBlockSize,
        mConfig.mIoFileBufferSize
    );
    if (theStatus < 0) {
        return theStatus;
    }
    theStatus = mStripeEncoder.EncodeStripe(
        theInputs.Get(), theOutputs, inBlockSize, inReporter);
    theInputs.Clear();
    if (theStatus != 0) {
        PRAID_LOG_STREAM_ERROR <<
            "recover: " << inParityFile <<
            " block: " << theBlockIdx <<
            " failure: " << ErrorCodeToString(theStatus) <<
        PRAID_LOG_EOM;
        return theStatus;
    }
    if (outChecksumPtr) {
        *outChecksumPtr = theChecksumStream.GetChecksum();
    }
    PRAID_LOG_STREAM_INFO <<
        "recover: " << inParityFile <<
        " block: "     << theBlockIdx <<
        " size: "      << theChecksumStream.GetWrittenCount() <<
        " adler32: 0x" << hex << theChecksumStream.GetChecksum() << dec <<
    PRAID_LOG_EOM;
    return 0;
}

    int
Encoder::RecoverParityBlockToFile(
    FileSystem&       inFs,
    const string&     inSrcFile,
    praidOff_t        inSrcSize,
    praidOff_t        inBlockSize,
    const string&     inParityFile,
    praidOff_t        inCorruptOffset,
    const string&     inLocalBlockFile,
    ProgressReporter& inReporter,
    uint32_t*         outChecksumPtr)
{
    OutputStream* theStreamPtr = 0;
    int theStatus = FsOutputStream::Create(
        mScratchFs,
        inLocalBlockFile,
        true,
        mConfig.mIoFileBufferSize,
        1,
        inBlockSize,
        theStreamPtr
    );
    if (theStatus < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "recover: " << inLocalBlockFile <<
            " create failure: " << ErrorCodeToString(theStatus) <<
        PRAID_LOG_EOM;
        return theStatus;
    }
    boost::scoped_ptr<OutputStream> theOutPtr(theStreamPtr);
    theStatus = RecoverParityBlockToStream(
        inFs,
        inSrcFile,
        inSrcSize,
        inBlockSize,
        inParityFile,
        inCorruptOffset,
        *theOutPtr,
        inReporter,
        outChecksumPtr
    );
    const int theCloseStatus = theOutPtr->Close();
    if (theStatus == 0 && theCloseStatus < 0) {
        PRAID_LOG_STREAM_ERROR <<
            "recover: " << inLocalBlockFile <<
            " close failure: " << ErrorCodeToString(theCloseStatus) <<
        PRAID_LOG_EOM;
        theStatus = theCloseStatus;
    }
    return theStatus;
}

} // namespace PRAID
