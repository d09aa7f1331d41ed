/* challengeSpace.cpp - mapping byte strings to challenges
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
#include "algebra.hpp"
#include "sigmaErrors.hpp"
#include "challengeSpace.hpp"

namespace SIGMA {

// Read the bytes as a little-endian integer and reduce it modulo P
Challenge ChallengeSpace::challengeFromBytes(const unsigned char* bytes, size_t len) {
    if (len==0 || bytes==nullptr)
        throw EncodingError("cannot map an empty byte string to a challenge");
    BigInt n;
    ALGEBRA::bigIntFromBytes(n, bytes, len);
    Challenge c;
    ALGEBRA::conv(c, n);
    return c;
}

} // end of namespace SIGMA
