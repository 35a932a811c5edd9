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
// Per instance pseudo random number source, used to generate unique
// temporary file names. Not thread safe.
//
//----------------------------------------------------------------------------

#ifndef COMMON_RANDOM_GENERATOR_H
#define COMMON_RANDOM_GENERATOR_H

#include <stdint.h>

#include <boost/random/mersenne_twister.hpp>

namespace PRAID
{

class RandomGenerator
{
public:
    typedef boost::random::mt19937_64 Random;

    // Seeded from the openssl random source.
    RandomGenerator();
    explicit RandomGenerator(
        uint64_t inSeed);
    uint64_t Next()
        { return (uint64_t)mRandom(); }
    void Seed(
        uint64_t inSeed)
        { mRandom.seed(inSeed); }
private:
    Random mRandom;

    static uint64_t MakeSeed();
private:
    RandomGenerator(
        const RandomGenerator& inGenerator);
    RandomGenerator& operator=(
        const RandomGenerator& inGenerator);
};

} // namespace PRAID

#endif /* COMMON_RANDOM_GENERATOR_H */
