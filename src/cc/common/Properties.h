//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// \brief Properties file similar to java.util.Properties
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

#ifndef COMMON_PROPERTIES_H
#define COMMON_PROPERTIES_H

#include <iosfwd>
#include <string>
#include <map>

#include <boost/lexical_cast.hpp>

namespace PRAID
{

using std::map;
using std::string;
using std::istream;
using std::ostream;

// Key: value properties, configuration files.
// Values of the form $NAME or ${NAME} are replaced with the environment
// variable value at load time; undefined variables expand to empty string.
class Properties
{
public:
    typedef map<string, string> PropMap;
    typedef PropMap::const_iterator iterator;

    iterator begin() const { return propmap.begin(); }
    iterator end() const { return propmap.end(); }
    // load the properties from a file
    int loadProperties(const char* fileName, char delimiter,
        ostream* verbose = 0);
    // load the properties from an in-core buffer
    int loadProperties(istream& ist, char delimiter, ostream* verbose = 0);
    int loadProperties(const char* buf, size_t len, char delimiter,
        ostream* verbose = 0);
    // Returns def if the key is missing or the value does not parse.
    template<typename TValue>
    TValue getValue(const string& key, const TValue& def) const
    {
        PropMap::const_iterator const it = propmap.find(key);
        if (it == propmap.end()) {
            return def;
        }
        TValue ret;
        return (boost::conversion::try_lexical_convert(it->second, ret) ?
            ret : def);
    }
    string getValue(const string& key, const string& def) const
    {
        PropMap::const_iterator const it = propmap.find(key);
        return (it == propmap.end() ? def : it->second);
    }
    const char* getValue(const string& key, const char* def) const
    {
        PropMap::const_iterator const it = propmap.find(key);
        return (it == propmap.end() ? def : it->second.c_str());
    }
    const string* getValue(const string& key) const
    {
        PropMap::const_iterator const it = propmap.find(key);
        return (it != propmap.end() ? &(it->second) : 0);
    }
    void setValue(const string& key, const string& value)
        { propmap[key] = value; }
    template<typename TValue>
    void setValue(const string& key, const TValue& value)
        { propmap[key] = boost::lexical_cast<string>(value); }
    bool remove(const string& key)
        { return (propmap.erase(key) > 0); }
    void clear() { propmap.clear(); }
    bool empty() const { return propmap.empty(); }
    size_t size() const { return propmap.size(); }
    static string ExpandEnvVars(const string& value);
    Properties();
    Properties(const Properties& p);
    ~Properties();
private:
    PropMap propmap;
};

}

#endif // COMMON_PROPERTIES_H
