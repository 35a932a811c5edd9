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
// \brief Unit test main: logger and per process test home directory setup.
//
//----------------------------------------------------------------------------

#include "tests/testutils.h"

#include "common/MsgLogger.h"

#include <iostream>
#include <sstream>

#include <gtest/gtest.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

using std::cout;
using std::endl;
using std::ostringstream;
using PRAID::MsgLogger;
using PRAID::Test::PraidTestUtils;

GTEST_API_ int
main(int argc, char **argv)
{
    // Each test can run in its own process, the home has to be unique.
    const char* const theTmpDir = getenv("TMPDIR");
    ostringstream theHome;
    theHome << ((theTmpDir && *theTmpDir) ? theTmpDir : "/tmp") <<
        "/praidtest." << getpid();
    PraidTestUtils::sTestHome = theHome.str();
    if (PraidTestUtils::FileExists(PraidTestUtils::sTestHome)) {
        PraidTestUtils::RemoveForcefully(PraidTestUtils::sTestHome);
    }
    mkdir(PraidTestUtils::sTestHome.c_str(), S_IRWXU);

    signal(SIGPIPE, SIG_IGN);
    const char* const theLevelPtr = getenv("PRAID_TEST_LOG_LEVEL");
    MsgLogger::LogLevel theLevel = MsgLogger::kLogLevelWARN;
    if (theLevelPtr && ! MsgLogger::ParseLogLevel(theLevelPtr, theLevel)) {
        theLevel = MsgLogger::kLogLevelWARN;
    }
    MsgLogger::Init(0, theLevel);

    cout << "Running custom main() from tests/testmain" << endl;
    testing::InitGoogleTest(&argc, argv);
    const int ret = RUN_ALL_TESTS();

    PraidTestUtils::RemoveForcefully(PraidTestUtils::sTestHome);
    MsgLogger::Stop();
    return ret;
}
