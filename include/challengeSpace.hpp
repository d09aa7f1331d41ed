#ifndef _CHALLENGE_SPACE_HPP_
#define _CHALLENGE_SPACE_HPP_
/* challengeSpace.hpp - the set of challenges of our Sigma protocols
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
#include <cstddef>

#include "scalar25519.hpp"
#include "algebra.hpp"

namespace SIGMA {
using CRV25519::Scalar, ALGEBRA::BigInt;

typedef Scalar Challenge;

// Challenges live in Z_P, the exponent ring of the group. We need to
// sample them uniformly (for the interactive verifier and for the
// simulated branches of OR proofs), and to map byte strings to them
// (for Fiat-Shamir). The byte mapping reads the bytes as a little-endian
// integer and reduces it modulo P, so it is injective on all strings of
// length at most floor(log_256(P)) = 31, and is almost-uniform on strings
// of length bytesForUniformChallenge().
class ChallengeSpace {
public:
    static const BigInt& size() { return ALGEBRA::groupOrder(); }

    // the number of bytes on which challengeFromBytes is injective
    static size_t injectiveByteLength() {
        return (ALGEBRA::numBits(size())-1)/8;
    }
    // the number of random bytes that Fiat-Shamir should hash into
    static constexpr size_t bytesForUniformChallenge() { return 64; }

    static Challenge randomChallenge() { return CRV25519::randomScalar(); }

    // Throws EncodingError on an empty byte string
    static Challenge challengeFromBytes(const unsigned char* bytes, size_t len);

    static bool contains(const Scalar& s) { return s.isCanonical(); }
};

} // end of namespace SIGMA
#endif // ifndef _CHALLENGE_SPACE_HPP_
