/* test_challengeSpace.cpp - testing the mapping from bytes to challenges
 * 
 * Copyright (C) 2021, LWE-PVSS
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 * 
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 * 
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS
 * OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL
 * THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR
 * OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE,
 * ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
 * OTHER DEALINGS IN THE SOFTWARE.
 **/
#include <iostream>
#include <set>
#include <vector>
#include "sigmaErrors.hpp"
#include "challengeSpace.hpp"
#include "tests.hpp" // define strings SIGMA_TESTS::passed and SIGMA_TESTS::failed

using namespace SIGMA;
using CRV25519::Scalar;

static bool testSize() {
    if (ChallengeSpace::size() != ALGEBRA::groupOrder())
        return false;
    if (ChallengeSpace::injectiveByteLength() != 31)
        return false;
    // 64 bytes is more than log2(P)+128 bits
    if (8*ChallengeSpace::bytesForUniformChallenge() < ALGEBRA::numBits(ChallengeSpace::size())+128)
        return false;
    auto c = ChallengeSpace::randomChallenge();
    return ChallengeSpace::contains(c) && c != ChallengeSpace::randomChallenge();
}

static bool testFromBytes() {
    unsigned char small[2] = {0x34, 0x12};
    if (ChallengeSpace::challengeFromBytes(small, 2) != Scalar().setInteger(0x1234))
        return false;

    // strings of length 31 that differ in one byte map to different challenges
    std::vector<unsigned char> buf(31, 0xff);
    std::set<std::vector<unsigned char> > seen;
    Scalar c0 = ChallengeSpace::challengeFromBytes(buf.data(), buf.size());
    for (size_t i=0; i<buf.size(); i++) {
        auto b2 = buf;
        b2[i] ^= 0x5a;
        Scalar ci = ChallengeSpace::challengeFromBytes(b2.data(), b2.size());
        if (ci == c0 || !ChallengeSpace::contains(ci))
            return false;
        seen.insert(std::vector<unsigned char>(ci.bytes, ci.bytes+sizeof(ci.bytes)));
    }
    if (seen.size() != buf.size())
        return false;

    // the encoding of P itself maps to zero
    unsigned char pBytes[32];
    ALGEBRA::bigIntBytes(pBytes, ChallengeSpace::size(), sizeof(pBytes));
    if (!ChallengeSpace::challengeFromBytes(pBytes, sizeof(pBytes)).isZero())
        return false;

    // 64-byte strings are reduced like libsodium does
    unsigned char wide[64];
    for (size_t i=0; i<sizeof(wide); i++) wide[i] = (unsigned char)(7*i+1);
    if (ChallengeSpace::challengeFromBytes(wide, sizeof(wide)) != Scalar().setFromWideBytes(wide))
        return false;
    return true;
}

static bool testEmpty() {
    unsigned char b = 0;
    try {
        ChallengeSpace::challengeFromBytes(&b, 0);
    } catch (const EncodingError&) {
        return true;
    }
    return false;
}

int main(int, char**) {
    if (!testSize() || !testFromBytes() || !testEmpty())
        std::cout << SIGMA_TESTS::failed << std::endl;
    else
        std::cout << SIGMA_TESTS::passed << std::endl;        
}
