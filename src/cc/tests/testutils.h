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
// \brief Test helpers shared by the unit tests.
//
//----------------------------------------------------------------------------

#ifndef TESTS_TESTUTILS_H
#define TESTS_TESTUTILS_H

#include <sys/stat.h>
#include <string>

int main(int, char**);

namespace PRAID {
namespace Test {

using std::string;

class PraidTestUtils
{
public:
    /**
     * Returns the per process test home directory. Created by the test main
     * before the tests run, and removed after.
     */
    static const string& GetTestHome()
        { return sTestHome; }

    /**
     * Creates a temporary file in the test home directory.
     *
     * @param path Output parameter set to the path of the new temporary file.
     * @return The file descriptor, the caller must close it.
     */
    static int CreateTempFile(string* path);

    /**
     * Writes a string to a new temporary file.
     *
     * @return The path of the temporary file.
     */
    static string WriteTempFile(const string& data);

    /**
     * Reads the whole file into data. Returns false if the file cannot be
     * read.
     */
    static bool ReadFile(const string& path, string& data);

    static bool FileExists(const string& path, struct stat* s = 0);
    static bool IsFile(const string& path);
    static bool IsDirectory(const string& path);

    /**
     * Create a new temporary directory in the test home directory.
     *
     * @return The full path of the directory
     */
    static string CreateTempDirectory();

    /**
     * Remove a file or directory forcefully, e.g. calling rm -rf on it.
     */
    static void RemoveForcefully(const string& path);

    /**
     * Returns a deterministic pseudo random byte string.
     */
    static string MakeData(size_t size, unsigned int seed);

private:
    static string sTestHome;

    friend int ::main(int, char**);
};

} // namespace Test
} // namespace PRAID

#endif // TESTS_TESTUTILS_H
