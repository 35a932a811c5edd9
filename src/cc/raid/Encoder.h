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
// Parity file encoder and parity block recovery.
//
// A source file of N blocks is split into stripes of stripe length blocks,
// the last stripe is zero padded. Every stripe produces parity length parity
// blocks, appended to the parity file in stripe order. The parity file is
// built in the codec staging directory and published with rename, so that
// the destination either does not change or is complete.
//
//----------------------------------------------------------------------------

#ifndef PRAID_RAID_ENCODER_H
#define PRAID_RAID_ENCODER_H

#include "EncoderConfig.h"
#include "StripeEncoder.h"

#include "common/praidtypes.h"
#include "common/RandomGenerator.h"
#include "ec/Codec.h"

#include <boost/scoped_array.hpp>
#include <boost/scoped_ptr.hpp>

#include <stdint.h>
#include <string>

namespace PRAID
{
using std::string;

class FileSystem;
class OutputStream;
class ProgressReporter;

class Encoder
{
public:
    class Geometry
    {
    public:
        Geometry()
            : mDataBlocks(0),
              mStripes(0),
              mParityBlocks(0),
              mParitySize(0)
            {}
        static Geometry Compute(
            praidOff_t inSrcSize,
            praidOff_t inBlockSize,
            int        inStripeLength,
            int        inParityLength);

        praidOff_t mDataBlocks;
        praidOff_t mStripes;
        praidOff_t mParityBlocks;
        praidOff_t mParitySize;
    };

    Encoder(
        const CodecPtr&      inCodecPtr,
        const EncoderConfig& inConfig = EncoderConfig());
    // The scratch file system, if not null, is used for local scratch and
    // recovered block files in place of the local file system, and is not
    // owned.
    Encoder(
        const CodecPtr&      inCodecPtr,
        const EncoderConfig& inConfig,
        uint64_t             inSeed,
        FileSystem*          inScratchFsPtr = 0);
    ~Encoder();
    // Computes the parity file of inSrcFile and publishes it as
    // inParityFile with replication inParityRepl. Returns 0, or negative
    // errno, -EPARITYSIZE, -ESTAGINGDIR, -ERENAMEFAILED, -EENCODEFAILED,
    // -EINTR.
    int EncodeFile(
        FileSystem&       inSrcFs,
        const string&     inSrcFile,
        FileSystem&       inParityFs,
        const string&     inParityFile,
        int16_t           inParityRepl,
        ProgressReporter& inReporter);
    // Recomputes the parity block containing inCorruptOffset of the parity
    // file from the source data, and writes it to inOutStream. The output
    // stream is not closed. The block adler32 checksum is returned in
    // *outChecksumPtr if not null.
    int RecoverParityBlockToStream(
        FileSystem&       inFs,
        const string&     inSrcFile,
        praidOff_t        inSrcSize,
        praidOff_t        inBlockSize,
        const string&     inParityFile,
        praidOff_t        inCorruptOffset,
        OutputStream&     inOutStream,
        ProgressReporter& inReporter,
        uint32_t*         outChecksumPtr = 0);
    // Same as above, but creates or truncates inLocalBlockFile on the local
    // scratch file system. The file is closed on return.
    int RecoverParityBlockToFile(
        FileSystem&       inFs,
        const string&     inSrcFile,
        praidOff_t        inSrcSize,
        praidOff_t        inBlockSize,
        const string&     inParityFile,
        praidOff_t        inCorruptOffset,
        const string&     inLocalBlockFile,
        ProgressReporter& inReporter,
        uint32_t*         outChecksumPtr = 0);
    // Makes the call in progress fail with -EINTR. Every call clears the
    // interrupt on entry.
    void Interrupt();
    const CodecPtr& GetCodec() const
        { return mCodecPtr; }
    const EncoderConfig& GetConfig() const
        { return mConfig; }
    const ParityBuffers& GetBuffers() const
        { return mStripeEncoder.GetBuffers(); }
private:
    class StagingGuard;
    class ScratchFiles;

    const CodecPtr                  mCodecPtr;
    const EncoderConfig             mConfig;
    RandomGenerator                 mRandom;
    boost::scoped_ptr<FileSystem>   mOwnedFsPtr;
    FileSystem&                     mScratchFs;
    StripeEncoder                   mStripeEncoder;
    boost::scoped_array<char>       mCopyBuf;

    int EncodeStripes(
        FileSystem&       inSrcFs,
        const string&     inSrcFile,
        praidOff_t        inSrcSize,
        praidOff_t        inBlockSize,
        const Geometry&   inGeometry,
        const string&     inParityFile,
        OutputStream&     inStagingStream,
        ProgressReporter& inReporter);
    static string MakeScratchBaseName(
        const string& inParityFile);
private:
    Encoder(
        const Encoder& inEncoder);
    Encoder& operator=(
        const Encoder& inEncoder);
};

} // namespace PRAID

#endif /* PRAID_RAID_ENCODER_H */
