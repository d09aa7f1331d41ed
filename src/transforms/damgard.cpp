/* damgard.cpp - Damgard's technique over Pedersen commitments
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

#include "sigmaErrors.hpp"
#include "damgard.hpp"
#include "merlinAccumulator.hpp"

namespace SIGMA {

DamgardTechnique::DamgardTechnique(const std::shared_ptr<const SigmaProtocol>& p,
                                   const PedersenCommitment& c): inner(p), com(c) {
    if (!inner)
        throw InvalidStatement("Damgard's technique needs an inner protocol");
}

// children[0] = the inner secret, messages[0] = the inner announcement,
// scalars[0] = the opening of the commitment to it
AnnouncementSecret DamgardTechnique::generateAnnouncementSecret(
                                const VariableAssignment& witness) const {
    AnnouncementSecret s;
    s.children.push_back(inner->generateAnnouncementSecret(witness));
    s.messages.push_back(inner->generateAnnouncement(witness, s.children[0]));
    s.scalars.push_back(CRV25519::randomScalar());
    return s;
}

Announcement DamgardTechnique::generateAnnouncement(const VariableAssignment&,
                                        const AnnouncementSecret& secret) const {
    if (secret.isSpent())
        throw ProtocolViolation("announcement from a spent announcement secret");
    Announcement a;
    a.points.push_back(com.commit(hashAnnouncement(secret.messages.at(0)),
                                  secret.scalars.at(0)));
    return a;
}

Response DamgardTechnique::computeResponse(const VariableAssignment& witness,
                        AnnouncementSecret& secret, const Challenge& c) const {
    Response z;
    z.scalars.push_back(secret.scalars.at(0));
    z.children.push_back(secret.messages.at(0));
    z.children.push_back(inner->generateResponse(witness, secret.children.at(0), c));
    return z;
}

bool DamgardTechnique::checkTranscript(const Announcement& a, const Challenge& c,
                                       const Response& z) const {
    if (a.points.size() != 1 || !a.scalars.empty() || !a.children.empty()
        || z.scalars.size() != 1 || !z.points.empty() || z.children.size() != 2)
        return false;
    const Announcement& innerA = z.children[0];
    if (innerA.shape() != inner->announcementShape())
        return false;
    // the opening is checked before anything else
    if (!com.verify(a.points[0], hashAnnouncement(innerA), z.scalars[0]))
        return false;
    return inner->checkTranscript(innerA, c, z.children[1]);
}

SigmaTranscript DamgardTechnique::generateSimulatedTranscript(const Challenge& c) const {
    SigmaTranscript innerT = inner->generateSimulatedTranscript(c);
    auto commitment = com.commit(hashAnnouncement(innerT.announcement));

    SigmaTranscript t;
    t.challenge = c;
    t.announcement.points.push_back(commitment.first);
    t.response.scalars.push_back(commitment.second);
    t.response.children.push_back(innerT.announcement);
    t.response.children.push_back(innerT.response);
    return t;
}

MessageShape DamgardTechnique::responseShape() const {
    MessageShape sh(0,1);
    sh.children.push_back(inner->announcementShape());
    sh.children.push_back(inner->responseShape());
    return sh;
}

// The opening followed by the compressed inner transcript, from which
// the commitment is recomputed
std::string DamgardTechnique::compressTranscript(const SigmaTranscript& t) const {
    if (t.response.scalars.size() != 1 || t.response.children.size() != 2)
        throw EncodingError("not a transcript of Damgard's technique");
    SigmaTranscript innerT(t.response.children[0], t.challenge, t.response.children[1]);
    return encodeScalar(t.response.scalars[0]) + inner->compressTranscript(innerT);
}

SigmaTranscript DamgardTechnique::decompressTranscript(const std::string& compressed,
                                                       const Challenge& c) const {
    constexpr size_t rSize = crypto_core_ed25519_SCALARBYTES;
    if (compressed.size() < rSize)
        throw EncodingError("compressed transcript is too short");
    Scalar r = decodeScalar(compressed.substr(0, rSize));
    SigmaTranscript innerT = inner->decompressTranscript(compressed.substr(rSize), c);

    SigmaTranscript t;
    t.challenge = c;
    t.announcement.points.push_back(com.commit(hashAnnouncement(innerT.announcement), r));
    t.response.scalars.push_back(r);
    t.response.children.push_back(innerT.announcement);
    t.response.children.push_back(innerT.response);
    return t;
}

void DamgardTechnique::updateAccumulator(MerlinAccumulator& acc) const {
    acc.processString("protocol", "damgard");
    acc.processString("commitment-tag", com.getTag());
    acc.processPoint("commitment-G", com.getG());
    inner->updateAccumulator(acc);
}

} // end of namespace SIGMA
