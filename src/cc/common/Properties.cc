//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// \brief Properties implementation.
//
// Created 2004/05/05
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

#include "Properties.h"

#include <iostream>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <errno.h>

namespace PRAID
{

using std::string;
using std::istream;
using std::ifstream;
using std::istringstream;
using std::cerr;
using std::endl;

inline static string
removeLTSpaces(const string& str, string::size_type start,
    string::size_type end)
{
    char const* const delims = " \t\r\n";

    if (start >= str.length()) {
        return string();
    }
    string::size_type const first = str.find_first_not_of(delims, start);
    if (end <= first || first == string::npos) {
        return string();
    }
    string::size_type const last = str.find_last_not_of(
        delims, end == string::npos ? string::npos : end - 1);
    return str.substr(first,
        (last == string::npos ? str.size() : last + 1) - first);
}

inline static bool
IsEnvNameChar(char c)
{
    return (('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') ||
        ('0' <= c && c <= '9') || c == '_');
}

/* static */ string
Properties::ExpandEnvVars(const string& value)
{
    string ret;
    ret.reserve(value.size());
    string::size_type pos = 0;
    while (pos < value.size()) {
        const string::size_type dpos = value.find('$', pos);
        if (dpos == string::npos) {
            ret.append(value, pos, string::npos);
            break;
        }
        ret.append(value, pos, dpos - pos);
        string::size_type nstart = dpos + 1;
        string::size_type nend;
        string::size_type next;
        if (nstart < value.size() && value[nstart] == '{') {
            nstart++;
            nend = value.find('}', nstart);
            if (nend == string::npos) {
                ret.append(value, dpos, string::npos);
                break;
            }
            next = nend + 1;
        } else {
            nend = nstart;
            while (nend < value.size() && IsEnvNameChar(value[nend])) {
                nend++;
            }
            next = nend;
        }
        if (nend <= nstart) {
            ret += '$';
            pos = dpos + 1;
            continue;
        }
        const char* const env = getenv(
            value.substr(nstart, nend - nstart).c_str());
        if (env) {
            ret += env;
        }
        pos = next;
    }
    return ret;
}

Properties::Properties()
    : propmap()
{
}

Properties::Properties(const Properties &p)
    : propmap(p.propmap)
{
}

Properties::~Properties()
{
}

int
Properties::loadProperties(
    const char* fileName,
    char        delimiter,
    ostream*    verbose /* = 0 */)
{
    ifstream input(fileName);
    if(! input.is_open()) {
        const int err = errno;
        cerr <<  "Properties::loadProperties() failed to open the file:" <<
            fileName << endl;
        return (err > 0 ? -err : -ENOENT);
    }
    loadProperties(input, delimiter, verbose);
    input.close();
    return 0;
}

int
Properties::loadProperties(
    istream& ist,
    char     delimiter,
    ostream* verbose /* = 0 */)
{
    string line;
    if (ist) {
        line.reserve(512);
    }
    while (getline(ist, line)) { //read one line at a time
        const string::size_type start = line.find_first_not_of(" \t");
        if (start == string::npos || line[start] == '#') {
            continue; // ignore comments
        }
        // find the delimiter
        string::size_type const pos = line.find(delimiter);
        if (pos == string::npos) {
            continue; // ignore if no delimiter is found
        }
        const string key = removeLTSpaces(line, 0, pos);
        if (key.empty()) {
            continue;
        }
        string& val = propmap[key];
        val = ExpandEnvVars(removeLTSpaces(line, pos + 1, string::npos));
        if (verbose) {
            (*verbose) << "Loading key " << key  <<
                " with value " << val << endl;
        }
    }
    return 0;
}

int
Properties::loadProperties(
    const char* buf,
    size_t      len,
    char        delimiter,
    ostream*    verbose /* = 0 */)
{
    istringstream is(string(buf, len));
    return loadProperties(is, delimiter, verbose);
}

} // namespace PRAID
