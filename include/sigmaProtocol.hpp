#ifndef _SIGMA_PROTOCOL_HPP_
#define _SIGMA_PROTOCOL_HPP_
/* sigmaProtocol.hpp - the three-message public-coin proof interface
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

#include "scalar25519.hpp"
#include "algebra.hpp"
#include "challengeSpace.hpp"
#include "variables.hpp"
#include "messages.hpp"
#include "fragments.hpp"

/* A Sigma protocol is a three-message protocol: the prover sends an
 * announcement a, the verifier replies with a random challenge c, the
 * prover sends a response z, and the verifier accepts or rejects based
 * on (a,c,z) and the public statement. A SigmaProtocol object has the
 * public statement bound into it, so all the methods below are relative
 * to that statement.
 *
 * The prover-side state between the announcement and the response is an
 * AnnouncementSecret. generateResponse consumes it, so trying to answer
 * two challenges with the same secret throws ProtocolViolation.
 *
 * Any implementation must be complete (honest transcripts are accepting
 * for every challenge) and special honest-verifier zero-knowledge
 * (generateSimulatedTranscript(c) is distributed like an honest
 * transcript with challenge c).
 */
namespace SIGMA {
using CRV25519::Scalar, CRV25519::Point, ALGEBRA::BigInt;

class MerlinAccumulator;

enum class Role { PROVER, VERIFIER };

class SigmaProtocol {
public:
    virtual ~SigmaProtocol() = default;

    virtual AnnouncementSecret generateAnnouncementSecret(const VariableAssignment& witness) const = 0;
    // Throws ProtocolViolation if the secret was already used
    virtual Announcement generateAnnouncement(const VariableAssignment& witness,
                                              const AnnouncementSecret& secret) const = 0;
    Challenge generateChallenge() const { return ChallengeSpace::randomChallenge(); }

    // Consumes the secret, then calls computeResponse
    Response generateResponse(const VariableAssignment& witness,
                              AnnouncementSecret& secret, const Challenge& c) const;

    virtual bool checkTranscript(const Announcement& a, const Challenge& c,
                                 const Response& z) const = 0;
    bool checkTranscript(const SigmaTranscript& t) const {
        return checkTranscript(t.announcement, t.challenge, t.response);
    }
    virtual SigmaTranscript generateSimulatedTranscript(const Challenge& c) const = 0;

    // The default compression is no compression: the encoding of the
    // announcement followed by that of the response. Decompression
    // throws DecompressionError if the result is not accepting, and
    // EncodingError if the bytes do not parse.
    virtual std::string compressTranscript(const SigmaTranscript& t) const;
    virtual SigmaTranscript decompressTranscript(const std::string& compressed,
                                                 const Challenge& c) const;

    virtual MessageShape announcementShape() const = 0;
    virtual MessageShape responseShape() const = 0;

    // Restoring messages from their wire encoding, relative to the
    // statement of this protocol. All throw EncodingError.
    Announcement readAnnouncement(std::istream& is) const { return readMessage(is, announcementShape()); }
    Response readResponse(std::istream& is) const { return readMessage(is, responseShape()); }
    Challenge readChallenge(std::istream& is) const { return readScalar(is); }
    SigmaTranscript readTranscript(std::istream& is) const;
    void writeTranscript(std::ostream& os, const SigmaTranscript& t) const;
    std::string encodeTranscript(const SigmaTranscript& t) const;
    SigmaTranscript decodeTranscript(const std::string& bytes) const;

    virtual Challenge createChallengeFromBytes(const unsigned char* bytes, size_t len) const {
        return ChallengeSpace::challengeFromBytes(bytes, len);
    }
    virtual BigInt getChallengeSpaceSize() const { return ChallengeSpace::size(); }

    // Absorb a domain-separated encoding of the public statement
    virtual void updateAccumulator(MerlinAccumulator& acc) const = 0;

    Role getFirstMessageRole() const { return Role::PROVER; }

protected:
    virtual Response computeResponse(const VariableAssignment& witness,
                        AnnouncementSecret& secret, const Challenge& c) const = 0;
};

// A Sigma protocol for a statement given as a fragment tree. Everything
// is delegated to the evaluator in fragments.hpp, with an empty external
// assignment at the root. Transcripts compress to just the response.
class FragmentProtocol: public SigmaProtocol {
    FragmentPtr root;
public:
    // Throws InvalidStatement if the tree is null or not closed
    explicit FragmentProtocol(const FragmentPtr& f);

    const Fragment& fragment() const { return *root; }

    AnnouncementSecret generateAnnouncementSecret(const VariableAssignment& witness) const override;
    Announcement generateAnnouncement(const VariableAssignment& witness,
                                      const AnnouncementSecret& secret) const override;
    bool checkTranscript(const Announcement& a, const Challenge& c,
                         const Response& z) const override;
    using SigmaProtocol::checkTranscript;
    SigmaTranscript generateSimulatedTranscript(const Challenge& c) const override;

    std::string compressTranscript(const SigmaTranscript& t) const override;
    SigmaTranscript decompressTranscript(const std::string& compressed,
                                         const Challenge& c) const override;

    MessageShape announcementShape() const override { return SIGMA::announcementShape(*root); }
    MessageShape responseShape() const override { return SIGMA::responseShape(*root); }

    void updateAccumulator(MerlinAccumulator& acc) const override;

    bool isSatisfiedBy(const VariableAssignment& witness) const {
        return SIGMA::isSatisfiedBy(*root, witness);
    }

protected:
    Response computeResponse(const VariableAssignment& witness,
                    AnnouncementSecret& secret, const Challenge& c) const override;
};

} // end of namespace SIGMA
#endif // ifndef _SIGMA_PROTOCOL_HPP_
