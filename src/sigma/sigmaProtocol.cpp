/* sigmaProtocol.cpp - Sigma protocols, and the one built from fragments
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
#include <sstream>
#include <string>

#include "sigmaErrors.hpp"
#include "sigmaProtocol.hpp"
#include "merlinAccumulator.hpp"

namespace SIGMA {

Response SigmaProtocol::generateResponse(const VariableAssignment& witness,
                            AnnouncementSecret& secret, const Challenge& c) const {
    secret.consume(); // throws if the secret was used before
    return computeResponse(witness, secret, c);
}

void SigmaProtocol::writeTranscript(std::ostream& os, const SigmaTranscript& t) const {
    writeMessage(os, t.announcement);
    os << t.challenge;
    writeMessage(os, t.response);
}

SigmaTranscript SigmaProtocol::readTranscript(std::istream& is) const {
    SigmaTranscript t;
    t.announcement = readAnnouncement(is);
    t.challenge = readChallenge(is);
    t.response = readResponse(is);
    return t;
}

std::string SigmaProtocol::encodeTranscript(const SigmaTranscript& t) const {
    std::stringstream ss;
    writeTranscript(ss, t);
    return ss.str();
}

SigmaTranscript SigmaProtocol::decodeTranscript(const std::string& bytes) const {
    size_t expected = announcementShape().byteSize() + crypto_core_ed25519_SCALARBYTES
                    + responseShape().byteSize();
    if (bytes.size() != expected)
        throw EncodingError("expected a transcript of "+std::to_string(expected)
                    +" bytes, got "+std::to_string(bytes.size()));
    std::stringstream ss(bytes);
    return readTranscript(ss);
}

std::string SigmaProtocol::compressTranscript(const SigmaTranscript& t) const {
    return encodeMessage(t.announcement) + encodeMessage(t.response);
}

SigmaTranscript SigmaProtocol::decompressTranscript(const std::string& compressed,
                                                    const Challenge& c) const {
    MessageShape aShape = announcementShape();
    size_t aSize = aShape.byteSize();
    if (compressed.size() < aSize)
        throw EncodingError("compressed transcript is too short");
    SigmaTranscript t;
    t.announcement = decodeMessage(compressed.substr(0, aSize), aShape);
    t.challenge = c;
    t.response = decodeMessage(compressed.substr(aSize), responseShape());
    if (!checkTranscript(t))
        throw DecompressionError("the transcript is not accepting");
    return t;
}

FragmentProtocol::FragmentProtocol(const FragmentPtr& f): root(f) {
    if (!root)
        throw InvalidStatement("null statement");
    if (!root->isClosed()) {
        std::string vars;
        for (auto& x : root->freeVariables())
            vars += " "+x;
        throw InvalidStatement("variables not declared anywhere:"+vars);
    }
}

AnnouncementSecret FragmentProtocol::generateAnnouncementSecret(
                                const VariableAssignment& witness) const {
    return SIGMA::generateAnnouncementSecret(*root, witness);
}

Announcement FragmentProtocol::generateAnnouncement(const VariableAssignment& witness,
                                        const AnnouncementSecret& secret) const {
    if (secret.isSpent())
        throw ProtocolViolation("announcement from a spent announcement secret");
    return SIGMA::generateAnnouncement(*root, witness, secret, VariableAssignment());
}

Response FragmentProtocol::computeResponse(const VariableAssignment& witness,
                        AnnouncementSecret& secret, const Challenge& c) const {
    return SIGMA::generateResponse(*root, witness, secret, c);
}

bool FragmentProtocol::checkTranscript(const Announcement& a, const Challenge& c,
                                       const Response& z) const {
    return SIGMA::checkTranscript(*root, a, c, z, VariableAssignment());
}

SigmaTranscript FragmentProtocol::generateSimulatedTranscript(const Challenge& c) const {
    return SIGMA::generateSimulatedTranscript(*root, c, VariableAssignment());
}

// The announcement is determined by the challenge and response
std::string FragmentProtocol::compressTranscript(const SigmaTranscript& t) const {
    return encodeMessage(t.response);
}

SigmaTranscript FragmentProtocol::decompressTranscript(const std::string& compressed,
                                                       const Challenge& c) const {
    SigmaTranscript t;
    t.challenge = c;
    t.response = decodeMessage(compressed, responseShape());
    t.announcement = recomputeAnnouncement(*root, c, t.response, VariableAssignment());
    if (!checkTranscript(t)) // e.g., OR challenges that do not add up
        throw DecompressionError("the transcript is not accepting");
    return t;
}

void FragmentProtocol::updateAccumulator(MerlinAccumulator& acc) const {
    acc.processString("protocol", "fragments");
    SIGMA::updateAccumulator(*root, acc);
}

} // end of namespace SIGMA
