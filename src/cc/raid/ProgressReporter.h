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

#ifndef PRAID_RAID_PROGRESS_REPORTER_H
#define PRAID_RAID_PROGRESS_REPORTER_H

namespace PRAID
{

// Liveness callback, invoked only from the thread that called the encode or
// recovery method.
class ProgressReporter
{
public:
    virtual void Progress() = 0;
protected:
    ProgressReporter()
        {}
    virtual ~ProgressReporter()
        {}
};

class NullProgressReporter : public ProgressReporter
{
public:
    NullProgressReporter()
        : ProgressReporter()
        {}
    virtual ~NullProgressReporter()
        {}
    virtual void Progress()
        {}
};

} // namespace PRAID

#endif /* PRAID_RAID_PROGRESS_REPORTER_H */
