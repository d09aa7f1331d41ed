#ifndef _FIAT_SHAMIR_HPP_
#define _FIAT_SHAMIR_HPP_
/* fiatShamir.hpp - non-interactive proofs from Sigma protocols
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
#include <memory>

#include "variables.hpp"
#include "messages.hpp"
#include "sigmaProtocol.hpp"
#include "merlinAccumulator.hpp"

/* The Fiat-Shamir transform replaces the verifier's random challenge by
 * a hash of everything that the verifier would have seen before choosing
 * it. We keep a Merlin transcript that absorbs, in order:
 *
 *   1. the domain label (when the transcript is initialized)
 *   2. the encoding of the statement, protocol->updateAccumulator
 *   3. the additional data, under the label "message"
 *   4. the announcement, under the label "announcement"
 *
 * and squeeze bytesForUniformChallenge() bytes out of it under the label
 * "challenge", which are mapped to a challenge with the protocol's
 * createChallengeFromBytes. Prover and verifier run exactly the same
 * code, so they always use the same encoding of the statement.
 *
 * The proof is the challenge together with the compressed transcript,
 * the announcement is recomputed from them by the verifier. A proof with
 * non-empty additional data is a signature of knowledge on that data.
 */
namespace SIGMA {

inline constexpr char defaultProofDomain[] = "sigma-fiat-shamir-proof";
inline constexpr char defaultSignatureDomain[] = "sigma-signature-of-knowledge";

struct FiatShamirProof {
    Challenge challenge;
    std::string compressedTranscript;

    bool operator==(const FiatShamirProof& other) const {
        return challenge==other.challenge
            && compressedTranscript==other.compressedTranscript;
    }
    bool operator!=(const FiatShamirProof& other) const { return !(*this==other); }

    // 32 bytes of challenge followed by the compressed transcript
    std::string encode() const;
    static FiatShamirProof decode(const std::string& bytes); // throws EncodingError
};

class FiatShamirProofSystem {
    std::shared_ptr<const SigmaProtocol> protocol;
    std::string domain;
public:
    explicit FiatShamirProofSystem(const std::shared_ptr<const SigmaProtocol>& p,
                                   const std::string& dom=defaultProofDomain):
        protocol(p), domain(dom) {}

    const SigmaProtocol& getProtocol() const { return *protocol; }
    const std::string& getDomain() const { return domain; }

    Challenge computeChallenge(const Announcement& a,
                               const std::string& data=std::string()) const;

    FiatShamirProof createProof(const VariableAssignment& witness,
                                const std::string& data=std::string()) const;

    // A proof that does not decompress is rejected. Bytes that do not
    // parse as a proof throw EncodingError.
    bool checkProof(const FiatShamirProof& proof,
                    const std::string& data=std::string()) const;
    bool checkProof(const std::string& encodedProof,
                    const std::string& data=std::string()) const {
        return checkProof(FiatShamirProof::decode(encodedProof), data);
    }
};

// A signature of knowledge: a Fiat-Shamir proof bound to a message
class FiatShamirSignatureScheme {
    FiatShamirProofSystem fs;
public:
    explicit FiatShamirSignatureScheme(const std::shared_ptr<const SigmaProtocol>& p,
                                       const std::string& dom=defaultSignatureDomain):
        fs(p, dom) {}

    std::string sign(const VariableAssignment& witness, const std::string& message) const {
        return fs.createProof(witness, message).encode();
    }
    bool verify(const std::string& message, const std::string& signature) const {
        return fs.checkProof(signature, message);
    }
};

} // end of namespace SIGMA
#endif // ifndef _FIAT_SHAMIR_HPP_
