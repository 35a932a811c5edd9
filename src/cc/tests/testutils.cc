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

#include "tests/testutils.h"

#include <fstream>
#include <sstream>

#include <dirent.h>
#include <errno.h>
#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <unistd.h>

namespace PRAID {
namespace Test {

using std::ifstream;
using std::ostringstream;

string PraidTestUtils::sTestHome = "/tmp/praidtest";

int
PraidTestUtils::CreateTempFile(string* path)
{
     string filename = sTestHome + "/tmp_file.XXXXXX";
     int fd = mkstemp(&filename[0]);
     EXPECT_NE(-1, fd) << "Could not mkstemp: " << strerror(errno);

     path->assign(filename);
     return fd;
}

string
PraidTestUtils::WriteTempFile(const string& data)
{
    string filename;
    int fd = PraidTestUtils::CreateTempFile(&filename);
    if (fd < 0) {
        return filename;
    }

    size_t bytes = 0;
    while (bytes < data.size()) {
        ssize_t ret = write(fd, data.data() + bytes, data.size() - bytes);
        EXPECT_NE(-1, ret);
        if (ret < 0) {
            break;
        }
        bytes += ret;
    }

    close(fd);
    return filename;
}

bool
PraidTestUtils::ReadFile(const string& path, string& data)
{
    ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    if (! in) {
        return false;
    }
    ostringstream os;
    os << in.rdbuf();
    data = os.str();
    return true;
}

bool
PraidTestUtils::FileExists(const string& path, struct stat* s)
{
    struct stat st;
    return (stat(path.c_str(), s ? s : &st) == 0);
}

bool
PraidTestUtils::IsFile(const string& path)
{
    struct stat s;
    return FileExists(path, &s) && S_ISREG(s.st_mode);
}

bool
PraidTestUtils::IsDirectory(const string& path)
{
    struct stat s;
    return FileExists(path, &s) && S_ISDIR(s.st_mode);
}

string
PraidTestUtils::CreateTempDirectory()
{
    string fullpath = sTestHome + "/temp_dir.XXXXXX";
    EXPECT_TRUE(mkdtemp(&fullpath[0]) != 0) << strerror(errno);
    return fullpath;
}

void
PraidTestUtils::RemoveForcefully(const string& path)
{
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return;
    }

    if (S_ISDIR(st.st_mode)) {
        DIR* dir = opendir(path.c_str());
        struct dirent *de;

        if (dir == NULL) {
            perror(path.c_str());
            return;
        }

        while ((de = readdir(dir))) {
            if (strcmp(de->d_name, ".") == 0 ||
                    strcmp(de->d_name, "..") == 0) {
                continue;
            }

            string newpath = path + "/" + de->d_name;
            RemoveForcefully(newpath);
        }

        closedir(dir);
    }

    if (remove(path.c_str()) == -1) {
        perror(path.c_str());
    }
}

string
PraidTestUtils::MakeData(size_t size, unsigned int seed)
{
    string ret;
    ret.resize(size);
    unsigned int state = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; i++) {
        state = state * 1103515245u + 12345u;
        ret[i] = (char)(state >> 16);
    }
    return ret;
}

} // namespace Test
} // namespace PRAID
