#ifndef _DAMGARD_HPP_
#define _DAMGARD_HPP_
/* damgard.hpp - Damgard's technique, committing to the announcement
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

#include "scalar25519.hpp"
#include "point25519.hpp"
#include "pedersen.hpp"
#include "messages.hpp"
#include "sigmaProtocol.hpp"

/* Damgard's technique wraps a Sigma protocol so that the prover first
 * commits to its announcement and only opens the commitment in the
 * response. The wrapped protocol proves the same statement, and the
 * extractor can get the witness in a straight line (without rewinding)
 * given the trapdoor of the commitment.
 *
 * With the inner protocol (a, c, z) and a Pedersen commitment:
 *
 *   announcement:  C = commit(H(a), r), where H(a) = hashToScalar(encode(a))
 *   response:      {scalars: [r], children: [a, z]}
 *
 * The verifier checks the opening first, then the inner transcript. The
 * opening r and the inner announcement are kept in the AnnouncementSecret
 * of the wrapped protocol (scalars[0] and messages[0], with the inner
 * secret as children[0]). Transcripts compress to r followed by the
 * compressed inner transcript, since C is recomputable from them.
 */
namespace SIGMA {
using CRV25519::Scalar, CRV25519::Point;

class DamgardTechnique: public SigmaProtocol {
    std::shared_ptr<const SigmaProtocol> inner;
    PedersenCommitment com;
public:
    explicit DamgardTechnique(const std::shared_ptr<const SigmaProtocol>& p,
                              const PedersenCommitment& c=PedersenCommitment("damgard"));

    const SigmaProtocol& innerProtocol() const { return *inner; }
    const PedersenCommitment& commitmentScheme() const { return com; }

    Scalar hashAnnouncement(const Announcement& innerA) const {
        return CRV25519::hashToScalar(encodeMessage(innerA));
    }

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

    MessageShape announcementShape() const override { return MessageShape(1,0); }
    MessageShape responseShape() const override;

    Challenge createChallengeFromBytes(const unsigned char* bytes, size_t len) const override {
        return inner->createChallengeFromBytes(bytes, len);
    }
    BigInt getChallengeSpaceSize() const override { return inner->getChallengeSpaceSize(); }

    void updateAccumulator(MerlinAccumulator& acc) const override;

protected:
    Response computeResponse(const VariableAssignment& witness,
                    AnnouncementSecret& secret, const Challenge& c) const override;
};

} // end of namespace SIGMA
#endif // ifndef _DAMGARD_HPP_
