/* test_fragments.cpp - testing the evaluator of statement trees
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
#include <vector>
#include <stdexcept>
#include "sigmaErrors.hpp"
#include "expressions.hpp"
#include "fragments.hpp"
#include "tests.hpp" // define strings SIGMA_TESTS::passed and SIGMA_TESTS::failed

using namespace SIGMA;
using CRV25519::Scalar, CRV25519::Point;

// The public parameters and witnesses of all the tests below, set in main
// (after libsodium is initialized)
static Point G, H, G2;
static Scalar x, y;
static VariableAssignment witness;

static SigmaTranscript honestTranscript(const Fragment& f, const VariableAssignment& w,
                                        const Challenge& c, size_t* realBranch=nullptr) {
    AnnouncementSecret s = generateAnnouncementSecret(f, w);
    if (realBranch != nullptr)
        *realBranch = s.realBranch;
    SigmaTranscript t;
    t.announcement = generateAnnouncement(f, w, s, VariableAssignment());
    t.challenge = c;
    t.response = generateResponse(f, w, s, c);
    return t;
}

static bool accepts(const Fragment& f, const SigmaTranscript& t) {
    return checkTranscript(f, t.announcement, t.challenge, t.response, VariableAssignment());
}

// x*G = X
static FragmentPtr dlogX() {
    return leaf(LinearRelation(equals(G*var("x"), G*x)));
}
// y*H = Y, for a y that we do not know
static FragmentPtr dlogUnknown(const std::string& name) {
    return leaf(LinearRelation(equals(H*var(name), CRV25519::randomPoint())));
}
// x*G + y*H = C and x + 2y = s, sharing x and y
static FragmentPtr linked() {
    auto com = leaf(LinearRelation(equals(G*var("x") + H*var("y"), G*x + H*y)), {});
    auto lin = leaf(LinearRelation(equals(var("x") + constant(2)*var("y"),
                                          ExponentExpr(x + Scalar().setInteger(2)*y))), {});
    return andOf({com, lin}, {"x", "y"});
}

static bool testCompleteness() {
    std::vector<FragmentPtr> stmts = {
        dlogX(),
        linked(),
        andOf({dlogX(), leaf(LinearRelation(equals(G2*var("y"), G2*y)))}),
        orOf({dlogUnknown("u"), linked()}),
        andOf({orOf({dlogX(), dlogUnknown("u"), dlogUnknown("v")}), leaf(LinearRelation(equals(G2*var("y"), G2*y)))}),
        orOf({orOf({dlogUnknown("u"), dlogX()}), dlogUnknown("v")})
    };
    std::vector<Challenge> challenges = {Scalar(), Scalar().setInteger(1), Scalar().setInteger(-1)};
    for (int i=0; i<20; i++)
        challenges.push_back(ChallengeSpace::randomChallenge());

    for (auto& f : stmts) {
        if (!isSatisfiedBy(*f, witness))
            return false;
        for (auto& c : challenges) {
            auto t = honestTranscript(*f, witness, c);
            if (t.announcement.shape() != announcementShape(*f)
                || t.response.shape() != responseShape(*f))
                return false;
            if (!accepts(*f, t)) {
                std::cout << "honest transcript rejected for\n";
                prettyPrint(std::cout, *f);
                return false;
            }
        }
    }
    return true;
}

static bool testOrChallenges() {
    auto f = orOf({dlogUnknown("u"), dlogX(), dlogUnknown("v")});
    Challenge c = ChallengeSpace::randomChallenge();
    size_t real = 99;
    auto t = honestTranscript(*f, witness, c, &real);
    if (real != 1 || !accepts(*f, t))
        return false;

    // the branch challenges add up to c
    const auto& cs = t.response.scalars;
    if (cs.size() != 3 || cs[0] + cs[1] + cs[2] != c)
        return false;

    // changing any one of them breaks the transcript
    Scalar one = Scalar().setInteger(1);
    for (size_t i=0; i<cs.size(); i++) {
        auto t2 = t;
        t2.response.scalars[i] += one;
        if (accepts(*f, t2))
            return false;
        // even if another one compensates for the change
        t2.response.scalars[(i+1)%3] -= one;
        if (t2.response.scalars[0]+t2.response.scalars[1]+t2.response.scalars[2] != c
            || accepts(*f, t2))
            return false;
    }
    // a different overall challenge
    auto t3 = t;
    t3.challenge += one;
    return !accepts(*f, t3);
}

// Checks the structure of simulated transcripts only: they are accepting
// and the announcement is the unique one for (c,z), as for honest ones.
// Comparing the two distributions is out of reach over Z_P.
static bool testSimulation() {
    std::vector<FragmentPtr> stmts = {dlogX(), linked(),
        orOf({dlogUnknown("u"), dlogUnknown("v")}),
        andOf({orOf({dlogUnknown("u"), dlogX()}),
               leaf(LinearRelation(equals(G2*var("y"), G2*y)))})};
    for (auto& f : stmts) {
        for (int i=0; i<5; i++) {
            Challenge c = ChallengeSpace::randomChallenge();
            // simulated transcripts are accepting, also for false statements
            auto sim = generateSimulatedTranscript(*f, c, VariableAssignment());
            if (sim.challenge != c || !accepts(*f, sim))
                return false;
            if (recomputeAnnouncement(*f, c, sim.response, VariableAssignment()) != sim.announcement)
                return false;

            // the honest announcement is the unique one for (c,z)
            if (!isSatisfiedBy(*f, witness))
                continue;
            auto t = honestTranscript(*f, witness, c);
            if (recomputeAnnouncement(*f, c, t.response, VariableAssignment()) != t.announcement)
                return false;
        }
    }
    return true;
}

static bool testWrongWitness() {
    VariableAssignment wrong{{"x", x + Scalar().setInteger(1)}, {"y", y}};
    for (auto& f : {dlogX(), linked()}) {
        if (isSatisfiedBy(*f, wrong))
            return false;
        for (int i=0; i<10; i++) {
            if (accepts(*f, honestTranscript(*f, wrong, ChallengeSpace::randomChallenge())))
                return false;
        }
    }
    // no OR branch is satisfied, the first one with values is used
    auto f = orOf({dlogUnknown("u"), dlogX()});
    size_t real = 99;
    auto t = honestTranscript(*f, wrong, ChallengeSpace::randomChallenge(), &real);
    if (real != 1 || accepts(*f, t))
        return false;
    // no OR branch has values
    try {
        honestTranscript(*orOf({dlogUnknown("u"), dlogUnknown("v")}), witness, Scalar());
        return false;
    } catch (const std::runtime_error&) {}

    // debugFragment names the failing relation
    debugFragment(*linked(), witness); // should not throw
    try {
        debugFragment(*linked(), wrong);
        return false;
    } catch (const std::runtime_error&) {}
    return true;
}

static bool testMalformedMessages() {
    auto f = linked();
    auto t = honestTranscript(*f, witness, ChallengeSpace::randomChallenge());
    auto t2 = t;
    t2.response.scalars.pop_back();
    if (accepts(*f, t2))
        return false;
    t2 = t;
    t2.announcement.children.push_back(Message());
    if (accepts(*f, t2))
        return false;
    t2 = t;
    t2.announcement.children[0].points[0] = Point::identity();
    if (accepts(*f, t2))
        return false;
    try {
        recomputeAnnouncement(*f, t.challenge, t2.announcement, VariableAssignment());
        return false;
    } catch (const EncodingError&) {}
    return true;
}

template<typename F> static bool throwsInvalid(F f) {
    try {
        f();
    } catch (const InvalidStatement&) {
        return true;
    }
    return false;
}

static bool testInvalidTrees() {
    auto relX = LinearRelation(equals(G*var("x"), G*x));
    auto relXY = LinearRelation(equals(G*var("x") + H*var("y"), G*x + H*y));

    if (!throwsInvalid([&]{ orOf({dlogX()}); })) // a single branch
        return false;
    if (!throwsInvalid([&]{ orOf({leaf(relX, {}), dlogUnknown("u")}); })) // free x
        return false;
    if (!throwsInvalid([&]{ andOf({}); }))
        return false;
    if (!throwsInvalid([&]{ andOf({dlogX()}, {"x"}); })) // x declared twice
        return false;
    if (!throwsInvalid([&]{ andOf({dlogX(), dlogX()}); })) // x declared by two siblings
        return false;
    if (!throwsInvalid([&]{ leaf(relX, {"x", "y"}); })) // y is not used
        return false;
    if (!throwsInvalid([&]{ andOf({leaf(relX, {})}, {"y"}); }))
        return false;

    auto open = andOf({leaf(relXY, {"y"})});
    if (open->isClosed() || open->freeVariables() != std::set<std::string>{"x"})
        return false;
    auto closed = andOf({leaf(relXY, {"y"})}, {"x"});
    return closed->isClosed() && closed->variables().size() == 2;
}

int main(int, char**) {
    G = CRV25519::hashToCurve("test-G");
    H = CRV25519::hashToCurve("test-H");
    G2 = CRV25519::hashToCurve("test-G2");
    x = CRV25519::randomScalar();
    y = CRV25519::randomScalar();
    witness = VariableAssignment{{"x", x}, {"y", y}};

    if (!testCompleteness() || !testOrChallenges() || !testSimulation()
        || !testWrongWitness() || !testMalformedMessages() || !testInvalidTrees())
        std::cout << SIGMA_TESTS::failed << std::endl;
    else
        std::cout << SIGMA_TESTS::passed << std::endl;        
}
