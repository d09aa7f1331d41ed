#ifndef _MERLIN_ACCUMULATOR_HPP_
#define _MERLIN_ACCUMULATOR_HPP_
/* merlinAccumulator.hpp - a Merlin-transcript wrapper for hashing statements
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
#include <string>
#include <cstdint>
extern "C" {
    #include <merlin.h>
}
#include "scalar25519.hpp"
#include "point25519.hpp"
#include "messages.hpp"

/* A Merlin transcript frames every item that it absorbs with its label
 * and its length, so feeding it a sequence of labeled items in a fixed
 * order is an injective encoding of that sequence. We use it as the
 * uniqueness-preserving byte accumulator for everything that gets hashed:
 * statements, announcements and the extra data of signatures of
 * knowledge. Challenges are then squeezed out of the same transcript.
 */
namespace SIGMA {
using CRV25519::Scalar, CRV25519::Point;

class MerlinAccumulator {
public:
    merlin_transcript mctx;

    explicit MerlinAccumulator(const std::string& domain) {
        merlin_transcript_init(&mctx,
            (const unsigned char*)domain.data(), domain.size());
    }
    explicit MerlinAccumulator(const merlin_transcript& m): mctx(m) {}

    void processBytes(const std::string& label, const unsigned char* data, size_t len) {
        merlin_transcript_commit_bytes(&mctx,
            (const unsigned char*)label.data(), label.size(), data, len);
    }
    void processString(const std::string& label, const std::string& str) {
        processBytes(label, (const unsigned char*)str.data(), str.size());
    }
    void processInteger(const std::string& label, uint64_t n) {
        unsigned char buf[8];
        for (size_t i=0; i<sizeof(buf); i++) {
            buf[i] = (unsigned char)(n & 0xff);
            n >>= 8;
        }
        processBytes(label, buf, sizeof(buf));
    }
    void processScalar(const std::string& label, const Scalar& s) {
        processBytes(label, s.bytes, sizeof(s.bytes));
    }
    void processPoint(const std::string& label, const Point& p) {
        processBytes(label, p.bytes, sizeof(p.bytes));
    }
    // A message is absorbed with its shape, so messages of different
    // shapes never collide
    void processMessage(const std::string& label, const Message& m);

    void challengeBytes(const std::string& label, unsigned char* buf, size_t len) {
        merlin_transcript_challenge_bytes(&mctx,
            (const unsigned char*)label.data(), label.size(), buf, len);
    }
    // A uniform scalar, reduced from 64 bytes of output
    Scalar newChallenge(const std::string& label) {
        unsigned char buf[crypto_core_ed25519_NONREDUCEDSCALARBYTES];
        challengeBytes(label, buf, sizeof(buf));
        return Scalar().setFromWideBytes(buf);
    }
};

} // end of namespace SIGMA
#endif // ifndef _MERLIN_ACCUMULATOR_HPP_
