/* test_fiatShamir.cpp - testing non-interactive proofs
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
#include <memory>
#include "sigmaErrors.hpp"
#include "expressions.hpp"
#include "fragments.hpp"
#include "sigmaProtocol.hpp"
#include "fiatShamir.hpp"
#include "tests.hpp" // define strings SIGMA_TESTS::passed and SIGMA_TESTS::failed

using namespace SIGMA;
using CRV25519::Scalar, CRV25519::Point;

static Point g, h; // set in main

// x*g = X OR y*h = Y
static std::shared_ptr<const SigmaProtocol> orProtocol(const Point& X, const Point& Y) {
    return std::make_shared<FragmentProtocol>(orOf({
        leaf(LinearRelation(equals(g*var("x"), X))),
        leaf(LinearRelation(equals(h*var("y"), Y)))}));
}

static bool testDeterminism() {
    Scalar x = CRV25519::randomScalar();
    auto p = orProtocol(g*x, CRV25519::randomPoint());
    FiatShamirProofSystem fs(p);

    VariableAssignment w{{"x", x}};
    AnnouncementSecret s = p->generateAnnouncementSecret(w);
    Announcement a = p->generateAnnouncement(w, s);
    Challenge c = fs.computeChallenge(a);
    if (fs.computeChallenge(a) != c || FiatShamirProofSystem(p).computeChallenge(a) != c)
        return false;

    // changing the announcement, the data, the domain or the statement
    Announcement a2 = a;
    a2.children[1].points[0] = CRV25519::randomPoint();
    if (fs.computeChallenge(a2) == c || fs.computeChallenge(a, "data") == c)
        return false;
    if (FiatShamirProofSystem(p, "another-domain").computeChallenge(a) == c)
        return false;
    auto p2 = orProtocol(g*x, CRV25519::randomPoint());
    if (FiatShamirProofSystem(p2).computeChallenge(a) == c)
        return false;
    return true;
}

static bool testProofs() {
    Scalar y = CRV25519::randomScalar();
    auto p = orProtocol(CRV25519::randomPoint(), h*y);
    FiatShamirProofSystem fs(p);
    VariableAssignment w{{"y", y}};

    for (int i=0; i<10; i++) {
        FiatShamirProof proof = fs.createProof(w, "context");
        if (!fs.checkProof(proof, "context") || fs.checkProof(proof, "other context"))
            return false;

        std::string bytes = proof.encode();
        if (bytes.size() != 32 + p->responseShape().byteSize())
            return false;
        if (FiatShamirProof::decode(bytes) != proof || !fs.checkProof(bytes, "context"))
            return false;

        // a different challenge or a tampered response
        FiatShamirProof bad = proof;
        bad.challenge += Scalar().setInteger(1);
        if (fs.checkProof(bad, "context"))
            return false;
        bad = proof;
        bad.compressedTranscript[40] ^= 1;
        try {
            if (fs.checkProof(bad, "context"))
                return false;
        } catch (const EncodingError&) {} // may no longer be canonical
    }
    // a proof for a different statement
    auto p2 = orProtocol(CRV25519::randomPoint(), h*y);
    if (FiatShamirProofSystem(p2).checkProof(fs.createProof(w)))
        return false;

    // a prover that does not know a witness
    VariableAssignment wrong{{"y", y + Scalar().setInteger(1)}};
    if (fs.checkProof(fs.createProof(wrong)))
        return false;
    return true;
}

static bool testEncodingErrors() {
    auto p = orProtocol(CRV25519::randomPoint(), CRV25519::randomPoint());
    FiatShamirProofSystem fs(p);
    try {
        fs.checkProof(std::string(20, 'a'));
        return false;
    } catch (const EncodingError&) {}
    try { // a good challenge followed by garbage
        fs.checkProof(std::string(32, '\0') + "garbage");
        return false;
    } catch (const EncodingError&) {}
    try {
        FiatShamirProof::decode(std::string(64, (char)0xff));
        return false;
    } catch (const EncodingError&) {}
    return true;
}

static bool testSignatures() {
    Scalar x = CRV25519::randomScalar();
    auto p = std::make_shared<FragmentProtocol>(
                leaf(LinearRelation(equals(g*var("x"), g*x))));
    FiatShamirSignatureScheme sig(p);
    VariableAssignment w{{"x", x}};

    std::string s1 = sig.sign(w, "hello");
    if (!sig.verify("hello", s1) || sig.verify("hello!", s1))
        return false;
    // signatures are not proofs, the domains differ
    if (FiatShamirProofSystem(p).checkProof(s1, "hello"))
        return false;
    return sig.sign(w, "hello") != s1; // randomized
}

int main(int, char**) {
    g = CRV25519::hashToCurve("fs-g");
    h = CRV25519::hashToCurve("fs-h");

    if (!testDeterminism() || !testProofs() || !testEncodingErrors() || !testSignatures())
        std::cout << SIGMA_TESTS::failed << std::endl;
    else
        std::cout << SIGMA_TESTS::passed << std::endl;        
}
