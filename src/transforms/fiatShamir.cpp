/* fiatShamir.cpp - deriving challenges from a Merlin transcript
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
#include <iostream>

#include "sigmaErrors.hpp"
#include "challengeSpace.hpp"
#include "fiatShamir.hpp"

//#define DEBUGGING

namespace SIGMA {

std::string FiatShamirProof::encode() const {
    return encodeScalar(challenge) + compressedTranscript;
}

FiatShamirProof FiatShamirProof::decode(const std::string& bytes) {
    constexpr size_t cSize = crypto_core_ed25519_SCALARBYTES;
    if (bytes.size() < cSize)
        throw EncodingError("a proof must have at least "+std::to_string(cSize)+" bytes");
    FiatShamirProof proof;
    proof.challenge = decodeScalar(bytes.substr(0, cSize));
    proof.compressedTranscript = bytes.substr(cSize);
    return proof;
}

Challenge FiatShamirProofSystem::computeChallenge(const Announcement& a,
                                                  const std::string& data) const {
    MerlinAccumulator acc(domain);
    protocol->updateAccumulator(acc);
    acc.processString("message", data);
    acc.processMessage("announcement", a);

    unsigned char buf[ChallengeSpace::bytesForUniformChallenge()];
    acc.challengeBytes("challenge", buf, sizeof(buf));
    return protocol->createChallengeFromBytes(buf, sizeof(buf));
}

FiatShamirProof FiatShamirProofSystem::createProof(const VariableAssignment& witness,
                                                   const std::string& data) const {
    AnnouncementSecret secret = protocol->generateAnnouncementSecret(witness);
    SigmaTranscript t;
    t.announcement = protocol->generateAnnouncement(witness, secret);
    t.challenge = computeChallenge(t.announcement, data);
    t.response = protocol->generateResponse(witness, secret, t.challenge);

    FiatShamirProof proof;
    proof.challenge = t.challenge;
    proof.compressedTranscript = protocol->compressTranscript(t);
#ifdef DEBUGGING
    std::cout << "createProof: " << proof.compressedTranscript.size()
              << " bytes of compressed transcript\n";
#endif
    return proof;
}

bool FiatShamirProofSystem::checkProof(const FiatShamirProof& proof,
                                       const std::string& data) const {
    SigmaTranscript t;
    try {
        t = protocol->decompressTranscript(proof.compressedTranscript, proof.challenge);
    } catch (const DecompressionError&) {
        return false; // not an accepting transcript
    }
    if (computeChallenge(t.announcement, data) != proof.challenge)
        return false;
    return protocol->checkTranscript(t);
}

} // end of namespace SIGMA
