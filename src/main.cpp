/* main.cpp - a "main" file, just a debugging tool
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
// This file is just a convenience, a handy tool that lets us run
// small porgrams without having to use the awkward ctest syntax.
#include <iostream>
#include <chrono>
#include <string>
#include <memory>
using namespace std;

#include <NTL/version.h>
#include "expressions.hpp"
#include "fragments.hpp"
#include "sigmaProtocol.hpp"
#include "protocolInstance.hpp"
#include "fiatShamir.hpp"
#include "damgard.hpp"

using namespace SIGMA;
using CRV25519::Scalar, CRV25519::Point;

int main(int argc, char** argv) {
    // std::cout << "- Found NTL version "<<NTL_VERSION <<std::endl;
    // std::cout << "- Found Sodium version "<<SODIUM_VERSION_STRING<<std::endl;

    int nReps = 100;
    if (argc > 1) {
        nReps = std::stoi(argv[1]);
    }
    if (nReps < 1 || nReps > 100000)
        nReps = 100;
    std::cout << "nReps="<<nReps << std::endl;

    // Statement: x*G1 = H1 and x*G2 = H2, OR y*G3 = H3 (we know x only)
    Point G1 = CRV25519::hashToCurve("G1");
    Point G2 = CRV25519::hashToCurve("G2");
    Point G3 = CRV25519::hashToCurve("G3");
    Scalar x = CRV25519::randomScalar();
    Point H1 = G1*x, H2 = G2*x, H3 = CRV25519::randomPoint();

    auto eqX = andOf({leaf(LinearRelation(equals(G1*var("x"), H1)), {}),
                      leaf(LinearRelation(equals(G2*var("x"), H2)), {})}, {"x"});
    auto eqY = leaf(LinearRelation(equals(G3*var("y"), H3)));
    auto stmt = std::make_shared<FragmentProtocol>(orOf({eqX, eqY}));
    VariableAssignment witness{{"x", x}};
    prettyPrint(std::cout, stmt->fragment());

    // interactive runs
    size_t counter = Point::counter;
    int accepted = 0;
    auto start = chrono::steady_clock::now();
    for (int i=0; i<nReps; i++) {
        SigmaProverInstance prover(stmt, witness);
        SigmaVerifierInstance verifier(stmt);
        if (runProtocol(prover, verifier))
            accepted++;
    }
    auto end = chrono::steady_clock::now();
    auto ticks = chrono::duration_cast<chrono::milliseconds>(end - start).count();
    std::cout << nReps << " interactive runs in "<<ticks<<" milliseconds, avg="
        << (ticks/double(nReps)) << ", accepted " << accepted << std::endl;
    std::cout << "  " << (Point::counter-counter)/nReps << " exponentiations per run\n";

    // non-interactive proofs
    FiatShamirProofSystem fs(stmt);
    std::string proof;
    start = chrono::steady_clock::now();
    for (int i=0; i<nReps; i++) {
        proof = fs.createProof(witness).encode();
    }
    end = chrono::steady_clock::now();
    ticks = chrono::duration_cast<chrono::milliseconds>(end - start).count();
    std::cout << nReps << " proofs in "<<ticks<<" milliseconds, avg="
        << (ticks/double(nReps)) << std::endl;

    accepted = 0;
    start = chrono::steady_clock::now();
    for (int i=0; i<nReps; i++) {
        if (fs.checkProof(proof))
            accepted++;
    }
    end = chrono::steady_clock::now();
    ticks = chrono::duration_cast<chrono::milliseconds>(end - start).count();
    std::cout << nReps << " verifications in "<<ticks<<" milliseconds, avg="
        << (ticks/double(nReps)) << ", accepted " << accepted << std::endl;

    size_t fullSize = stmt->announcementShape().byteSize()
                    + crypto_core_ed25519_SCALARBYTES + stmt->responseShape().byteSize();
    std::cout << "proof size: " << proof.size() << " bytes (uncompressed transcript "
        << fullSize << " bytes)\n";

    // the same statement with Damgard's technique
    auto dmg = std::make_shared<DamgardTechnique>(stmt);
    FiatShamirProofSystem fsDmg(dmg);
    start = chrono::steady_clock::now();
    std::string dmgProof = fsDmg.createProof(witness).encode();
    bool ok = fsDmg.checkProof(dmgProof);
    end = chrono::steady_clock::now();
    ticks = chrono::duration_cast<chrono::milliseconds>(end - start).count();
    std::cout << "Damgard proof+verify in "<<ticks<<" milliseconds, "
        << dmgProof.size() << " bytes, " << (ok? "accepted" : "rejected") << std::endl;

    return 0;
}
