/* test_sigmaProtocol.cpp - testing Sigma protocols, encoding and compression
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
#include <sstream>
#include <memory>
#include "sigmaErrors.hpp"
#include "expressions.hpp"
#include "fragments.hpp"
#include "sigmaProtocol.hpp"
#include "tests.hpp" // define strings SIGMA_TESTS::passed and SIGMA_TESTS::failed

using namespace SIGMA;
using CRV25519::Scalar, CRV25519::Point;

// (x*G = X AND x*G2 + y*H = C) OR u*H = U, we know x and y
static std::shared_ptr<FragmentProtocol> makeProtocol(const VariableAssignment& w) {
    Point G = CRV25519::hashToCurve("G"), G2 = CRV25519::hashToCurve("G2");
    Point H = CRV25519::hashToCurve("H");
    auto left = andOf({
        leaf(LinearRelation(equals(G*var("x"), G*w["x"])), {}),
        leaf(LinearRelation(equals(G2*var("x") + H*var("y"), G2*w["x"] + H*w["y"])), {"y"})
    }, {"x"});
    auto right = leaf(LinearRelation(equals(H*var("u"), CRV25519::randomPoint())));
    return std::make_shared<FragmentProtocol>(orOf({left, right}));
}

static SigmaTranscript run(const SigmaProtocol& p, const VariableAssignment& w) {
    SigmaTranscript t;
    AnnouncementSecret s = p.generateAnnouncementSecret(w);
    t.announcement = p.generateAnnouncement(w, s);
    t.challenge = p.generateChallenge();
    t.response = p.generateResponse(w, s, t.challenge);
    return t;
}

static bool testBasics() {
    VariableAssignment w{{"x", CRV25519::randomScalar()}, {"y", CRV25519::randomScalar()}};
    auto p = makeProtocol(w);
    if (!p->isSatisfiedBy(w) || p->getFirstMessageRole() != Role::PROVER)
        return false;
    if (p->getChallengeSpaceSize() != ALGEBRA::groupOrder())
        return false;
    for (int i=0; i<10; i++) {
        if (!p->checkTranscript(run(*p, w)))
            return false;
        if (!p->checkTranscript(p->generateSimulatedTranscript(p->generateChallenge())))
            return false;
    }
    unsigned char bytes[3] = {1, 2, 3};
    if (p->createChallengeFromBytes(bytes, 3) != Scalar().setInteger(0x030201))
        return false;

    // open statements cannot become protocols
    try {
        FragmentProtocol bad(leaf(LinearRelation(equals(CRV25519::hashToCurve("G")*var("x"),
                                                 Point::base())), {}));
        return false;
    } catch (const InvalidStatement&) {}
    return true;
}

static bool testSecretConsumption() {
    VariableAssignment w{{"x", CRV25519::randomScalar()}, {"y", CRV25519::randomScalar()}};
    auto p = makeProtocol(w);
    AnnouncementSecret s = p->generateAnnouncementSecret(w);
    Announcement a = p->generateAnnouncement(w, s);
    Challenge c1 = p->generateChallenge();
    Response z = p->generateResponse(w, s, c1);
    if (!s.isSpent() || !p->checkTranscript(a, c1, z))
        return false;
    try { // answering a second challenge would leak the witness
        p->generateResponse(w, s, p->generateChallenge());
        return false;
    } catch (const ProtocolViolation&) {}
    try {
        p->generateAnnouncement(w, s);
        return false;
    } catch (const ProtocolViolation&) {}
    return true;
}

static bool testEncoding() {
    VariableAssignment w{{"x", CRV25519::randomScalar()}, {"y", CRV25519::randomScalar()}};
    auto p = makeProtocol(w);
    auto t = run(*p, w);

    std::string bytes = p->encodeTranscript(t);
    size_t expected = p->announcementShape().byteSize() + 32 + p->responseShape().byteSize();
    // 3 points, 2 branch challenges and 3 responses, plus the challenge
    if (bytes.size() != expected || expected != 32*(3+5+1))
        return false;
    if (p->decodeTranscript(bytes) != t)
        return false;

    std::stringstream ss;
    p->writeTranscript(ss, t);
    if (p->readTranscript(ss) != t)
        return false;

    // truncated, too long, non-canonical scalar, not a point
    try {
        p->decodeTranscript(bytes.substr(0, bytes.size()-1));
        return false;
    } catch (const EncodingError&) {}
    try {
        p->decodeTranscript(bytes + "x");
        return false;
    } catch (const EncodingError&) {}
    try {
        std::string bad = bytes;
        for (size_t i=bad.size()-32; i<bad.size(); i++) bad[i] = (char)0xff;
        p->decodeTranscript(bad);
        return false;
    } catch (const EncodingError&) {}
    try {
        std::string bad = bytes;
        for (size_t i=0; i<32; i++) bad[i] = (char)0xff;
        p->decodeTranscript(bad);
        return false;
    } catch (const EncodingError&) {}
    try {
        std::stringstream ss2(bytes.substr(0, 40));
        p->readAnnouncement(ss2);
        return false;
    } catch (const EncodingError&) {}
    return true;
}

static bool testCompression() {
    VariableAssignment w{{"x", CRV25519::randomScalar()}, {"y", CRV25519::randomScalar()}};
    auto p = makeProtocol(w);
    for (int i=0; i<5; i++) {
        auto t = run(*p, w);
        std::string comp = p->compressTranscript(t);
        if (comp.size() != p->responseShape().byteSize())
            return false;
        if (p->decompressTranscript(comp, t.challenge) != t)
            return false;

        auto sim = p->generateSimulatedTranscript(p->generateChallenge());
        if (p->decompressTranscript(p->compressTranscript(sim), sim.challenge) != sim)
            return false;

        // a different challenge does not decompress
        try {
            p->decompressTranscript(comp, t.challenge + Scalar().setInteger(1));
            return false;
        } catch (const DecompressionError&) {}
        try {
            p->decompressTranscript(comp.substr(1), t.challenge);
            return false;
        } catch (const EncodingError&) {}
    }
    return true;
}

// The default (no) compression of the base class
class Uncompressed: public FragmentProtocol {
public:
    using FragmentProtocol::FragmentProtocol;
    std::string compressTranscript(const SigmaTranscript& t) const override {
        return SigmaProtocol::compressTranscript(t);
    }
    SigmaTranscript decompressTranscript(const std::string& comp, const Challenge& c) const override {
        return SigmaProtocol::decompressTranscript(comp, c);
    }
};

static bool testDefaultCompression() {
    Scalar x = CRV25519::randomScalar();
    Uncompressed p(leaf(LinearRelation(equals(Point::base()*var("x"), Point::base()*x))));
    VariableAssignment w{{"x", x}};
    auto t = run(p, w);
    std::string comp = p.compressTranscript(t);
    if (comp.size() != 64 || p.decompressTranscript(comp, t.challenge) != t)
        return false;
    try {
        p.decompressTranscript(comp, p.generateChallenge());
        return false;
    } catch (const DecompressionError&) {}
    return true;
}

int main(int, char**) {
    if (!testBasics() || !testSecretConsumption() || !testEncoding()
        || !testCompression() || !testDefaultCompression())
        std::cout << SIGMA_TESTS::failed << std::endl;
    else
        std::cout << SIGMA_TESTS::passed << std::endl;        
}
